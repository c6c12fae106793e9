#pragma once

#include "oatpp/web/server/interceptor/RequestInterceptor.hpp"
#include "oatpp/web/protocol/http/Http.hpp"
#include "oatpp/web/protocol/http/outgoing/ResponseFactory.hpp"
#include "wilab/core/logger.hpp"
#include <openssl/crypto.h>
#include <memory>
#include <string>
#include <vector>

/**
 * Bearer token check for every route except health, the interface listing and swagger
 */
class AuthInterceptor : public oatpp::web::server::interceptor::RequestInterceptor {
private:
  std::string m_token;
  std::vector<std::string> m_publicPaths;
  std::shared_ptr<wilab::core::Logger> m_logger;

  bool isPublicPath(const std::string& path) {
    for (const auto& publicPath : m_publicPaths) {
      if (path.find(publicPath) == 0) {
        return true;
      }
    }
    return false;
  }

  // Constant-time comparison, lengths are not secret
  bool tokenMatches(const std::string& presented) {
    if (presented.size() != m_token.size()) {
      return false;
    }
    return CRYPTO_memcmp(presented.data(), m_token.data(), m_token.size()) == 0;
  }

  std::shared_ptr<OutgoingResponse> unauthorized(const char* body) {
    auto response = oatpp::web::protocol::http::outgoing::ResponseFactory::createResponse(
      oatpp::web::protocol::http::Status::CODE_401,
      body
    );
    response->putHeader("Content-Type", "application/json");
    response->putHeader("WWW-Authenticate", "Bearer");
    return response;
  }

public:
  explicit AuthInterceptor(const std::string& token)
    : m_token(token)
    , m_logger(wilab::core::get_logger("AuthInterceptor")) {
    m_publicPaths = {
      "/api/v1/health",
      "/api/v1/interfaces",
      "/swagger",
      "/api-docs",
      "/favicon.ico"
    };
  }

  std::shared_ptr<OutgoingResponse> intercept(const std::shared_ptr<IncomingRequest>& request) override {
    auto path = request->getStartingLine().path.toString();

    if (request->getStartingLine().method == "OPTIONS") {
      return nullptr;
    }

    if (isPublicPath(path->c_str())) {
      return nullptr;
    }

    auto header = request->getHeader("Authorization");
    const std::string prefix = "Bearer ";
    if (!header || header->size() <= prefix.size() || header->compare(0, prefix.size(), prefix) != 0) {
      m_logger->warning("Missing bearer token", wilab::core::LogContext().add("path", path->c_str()));
      return unauthorized(R"({"status":"error","error":"Unauthorized","detail":"Authentication required"})");
    }

    if (!tokenMatches(header->substr(prefix.size()))) {
      m_logger->warning("Invalid bearer token", wilab::core::LogContext().add("path", path->c_str()));
      return unauthorized(R"({"status":"error","error":"Unauthorized","detail":"Invalid token"})");
    }

    return nullptr;
  }
};
