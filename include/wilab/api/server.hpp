#pragma once

#include "oatpp/web/server/HttpConnectionHandler.hpp"
#include "oatpp/network/tcp/server/ConnectionProvider.hpp"
#include "wilab/core/logger.hpp"
#include "wilab/services/lifecycle_manager.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/**
 * HTTP front end of the lifecycle manager.
 * Worker threads accept connections until stop() is called.
 */
class ApiServer {
private:
  std::shared_ptr<wilab::services::LifecycleManager> m_manager;
  std::string m_authToken;
  std::shared_ptr<oatpp::network::tcp::server::ConnectionProvider> m_connectionProvider;
  std::shared_ptr<oatpp::web::server::HttpConnectionHandler> m_connectionHandler;
  std::vector<std::thread> m_workerThreads;
  std::atomic<bool> m_running;
  std::shared_ptr<wilab::core::Logger> m_logger;
  static constexpr size_t NUM_WORKER_THREADS = 4;

public:
  ApiServer(std::shared_ptr<wilab::services::LifecycleManager> manager, const std::string& authToken);
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  void start(const std::string& host = "0.0.0.0", uint16_t port = 8080);
  void stop();

  bool isRunning() const {
    return m_running;
  }
};
