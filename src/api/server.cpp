#include "wilab/api/server.hpp"
#include "wilab/api/auth_interceptor.hpp"
#include "wilab/api/controllers/network_controller.hpp"
#include "wilab/api/controllers/system_controller.hpp"

#include "oatpp/web/server/HttpRouter.hpp"
#include "oatpp/parser/json/mapping/ObjectMapper.hpp"
#include "oatpp-swagger/Controller.hpp"
#include "oatpp-swagger/Resources.hpp"

#include <chrono>

ApiServer::ApiServer(std::shared_ptr<wilab::services::LifecycleManager> manager, const std::string& authToken)
  : m_manager(std::move(manager))
  , m_authToken(authToken)
  , m_running(false)
  , m_logger(wilab::core::get_logger("ApiServer")) {}

ApiServer::~ApiServer() {
  stop();
}

void ApiServer::start(const std::string& host, uint16_t port) {
  if (m_running.exchange(true)) {
    return;
  }

  auto objectMapper = oatpp::parser::json::mapping::ObjectMapper::createShared();
  auto router = oatpp::web::server::HttpRouter::createShared();
  auto authInterceptor = std::make_shared<AuthInterceptor>(m_authToken);

  auto systemController = SystemController::createShared(objectMapper, m_manager);
  router->addController(systemController);

  auto networkController = NetworkController::createShared(objectMapper, m_manager);
  router->addController(networkController);

  auto docInfo = oatpp::swagger::DocumentInfo::createShared();
  docInfo->header = oatpp::swagger::DocumentHeader::createShared();
  docInfo->header->title = "Wi-Lab API";
  docInfo->header->description = "Access point lifecycle, client and forwarding control";
#ifdef WILAB_VERSION
  docInfo->header->version = WILAB_VERSION;
#else
  docInfo->header->version = "1.0.0";
#endif

#ifdef OATPP_SWAGGER_RES_PATH
  auto swaggerResources = oatpp::swagger::Resources::streamResources(OATPP_SWAGGER_RES_PATH);
#else
  auto swaggerResources = oatpp::swagger::Resources::streamResources(nullptr);
#endif

  auto apiEndpoints = systemController->getEndpoints();
  apiEndpoints.append(networkController->getEndpoints());

  auto swaggerController = oatpp::swagger::Controller::createShared(
    apiEndpoints,
    docInfo,
    swaggerResources
  );
  router->addController(swaggerController);

  m_connectionProvider = oatpp::network::tcp::server::ConnectionProvider::createShared(
    {host, port, oatpp::network::Address::IP_4}
  );

  m_connectionHandler = oatpp::web::server::HttpConnectionHandler::createShared(router);
  m_connectionHandler->addRequestInterceptor(authInterceptor);

  m_logger->info("HTTP server starting",
                 wilab::core::LogContext()
                   .add("host", host)
                   .add("port", port)
                   .add("swagger", "/swagger/ui"));

  for (size_t i = 0; i < NUM_WORKER_THREADS; ++i) {
    m_workerThreads.emplace_back([this]() {
      while (m_running) {
        auto connection = m_connectionProvider->get();
        if (connection) {
          m_connectionHandler->handleConnection(connection, nullptr);
        } else {
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
      }
    });
  }

  m_logger->info("HTTP server started", wilab::core::LogContext().add("workers", NUM_WORKER_THREADS));
}

void ApiServer::stop() {
  if (m_running.exchange(false)) {
    if (m_connectionProvider) {
      m_connectionProvider->stop();
    }

    for (auto& thread : m_workerThreads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    m_workerThreads.clear();

    m_logger->info("HTTP server stopped");
  }
}
