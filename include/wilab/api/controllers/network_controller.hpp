#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "wilab/api/dto.hpp"
#include "wilab/api/dto_mapper.hpp"
#include "wilab/api/status_mapping.hpp"
#include "wilab/core/logger.hpp"
#include "wilab/services/lifecycle_manager.hpp"
#include <memory>

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Network Controller
 * Per-interface lifecycle endpoints: start, stop, status, clients, internet access and TX power
 */
class NetworkController : public oatpp::web::server::api::ApiController {
private:
  std::shared_ptr<wilab::services::LifecycleManager> m_manager;
  std::shared_ptr<wilab::core::Logger> m_logger;

  static Status statusFor(wilab::core::ErrorCode code) {
    switch (httpStatusFor(code)) {
      case 400: return Status::CODE_400;
      case 404: return Status::CODE_404;
      case 409: return Status::CODE_409;
      case 502: return Status::CODE_502;
      default: return Status::CODE_500;
    }
  }

  std::shared_ptr<OutgoingResponse> errorResponse(const wilab::core::WilabError& error) {
    m_logger->warning("Request failed",
                      wilab::core::LogContext()
                        .add("error", wilab::core::error_code_name(error.code()))
                        .add("detail", error.detail()));
    return createDtoResponse(statusFor(error.code()), toErrorDto(error));
  }

  // Runs an operation and turns typed failures into error responses
  template<class Operation>
  std::shared_ptr<OutgoingResponse> handle(Operation&& operation) {
    try {
      return operation();
    } catch (const wilab::core::WilabError& e) {
      return errorResponse(e);
    } catch (const std::exception& e) {
      m_logger->error("Unexpected request failure", wilab::core::LogContext().add("error", e.what()));
      auto dto = ErrorDto::createShared();
      dto->status = "error";
      dto->error = "InternalError";
      dto->detail = e.what();
      return createDtoResponse(Status::CODE_500, dto);
    }
  }

public:
  NetworkController(const std::shared_ptr<ObjectMapper>& objectMapper,
                    std::shared_ptr<wilab::services::LifecycleManager> manager)
    : oatpp::web::server::api::ApiController(objectMapper)
    , m_manager(manager)
    , m_logger(wilab::core::get_logger("NetworkController")) {}

  static std::shared_ptr<NetworkController> createShared(
    const std::shared_ptr<ObjectMapper>& objectMapper,
    std::shared_ptr<wilab::services::LifecycleManager> manager
  ) {
    return std::make_shared<NetworkController>(objectMapper, manager);
  }

  // POST /api/v1/interface/{net_id}/network
  ENDPOINT_INFO(startNetwork) {
    info->summary = "Start a network";
    info->description = "Brings up the access point, DHCP and forwarding rules for one interface";
    info->addConsumes<Object<NetworkRequestDto>>("application/json");
    info->addResponse<Object<NetworkStatusDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
    info->addTag("Network");
  }
  ENDPOINT("POST", "/api/v1/interface/{net_id}/network", startNetwork,
           PATH(String, netId, "net_id"),
           BODY_DTO(Object<NetworkRequestDto>, body)) {
    return handle([&]() {
      auto snapshot = m_manager->start_network(netId->c_str(), toRadioSettings(body));
      return createDtoResponse(Status::CODE_200, toNetworkStatusDto(snapshot));
    });
  }

  // DELETE /api/v1/interface/{net_id}/network
  ENDPOINT_INFO(stopNetwork) {
    info->summary = "Stop a network";
    info->description = "Tears down the network; succeeds when it is already inactive";
    info->addResponse<Object<SuccessDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
    info->addTag("Network");
  }
  ENDPOINT("DELETE", "/api/v1/interface/{net_id}/network", stopNetwork,
           PATH(String, netId, "net_id")) {
    return handle([&]() {
      m_manager->stop_network(netId->c_str());
      auto dto = SuccessDto::createShared();
      dto->status = "success";
      dto->message = "Network " + *netId + " stopped";
      return createDtoResponse(Status::CODE_200, dto);
    });
  }

  // GET /api/v1/interface/{net_id}/network
  ENDPOINT_INFO(getNetwork) {
    info->summary = "Get network status";
    info->addResponse<Object<NetworkStatusDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
    info->addTag("Network");
  }
  ENDPOINT("GET", "/api/v1/interface/{net_id}/network", getNetwork,
           PATH(String, netId, "net_id")) {
    return handle([&]() {
      auto snapshot = m_manager->get_status(netId->c_str());
      return createDtoResponse(Status::CODE_200, toNetworkStatusDto(snapshot));
    });
  }

  // GET /api/v1/interface/{net_id}/clients
  ENDPOINT_INFO(getClients) {
    info->summary = "List connected clients";
    info->description = "Associated stations that hold a live DHCP lease";
    info->addResponse<Object<ClientListDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
    info->addTag("Network");
  }
  ENDPOINT("GET", "/api/v1/interface/{net_id}/clients", getClients,
           PATH(String, netId, "net_id")) {
    return handle([&]() {
      auto snapshot = m_manager->get_status(netId->c_str());
      auto dto = ClientListDto::createShared();
      dto->netId = snapshot.net_id;
      dto->clients = toClientDtos(snapshot.clients);
      dto->count = static_cast<v_int32>(snapshot.clients.size());
      return createDtoResponse(Status::CODE_200, dto);
    });
  }

  // POST /api/v1/interface/{net_id}/internet/enable
  ENDPOINT_INFO(enableInternet) {
    info->summary = "Enable internet access";
    info->addResponse<Object<NetworkStatusDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
    info->addTag("Internet");
  }
  ENDPOINT("POST", "/api/v1/interface/{net_id}/internet/enable", enableInternet,
           PATH(String, netId, "net_id")) {
    return handle([&]() {
      auto snapshot = m_manager->set_internet_enabled(netId->c_str(), true);
      return createDtoResponse(Status::CODE_200, toNetworkStatusDto(snapshot));
    });
  }

  // POST /api/v1/interface/{net_id}/internet/disable
  ENDPOINT_INFO(disableInternet) {
    info->summary = "Disable internet access";
    info->addResponse<Object<NetworkStatusDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
    info->addTag("Internet");
  }
  ENDPOINT("POST", "/api/v1/interface/{net_id}/internet/disable", disableInternet,
           PATH(String, netId, "net_id")) {
    return handle([&]() {
      auto snapshot = m_manager->set_internet_enabled(netId->c_str(), false);
      return createDtoResponse(Status::CODE_200, toNetworkStatusDto(snapshot));
    });
  }

  // GET /api/v1/interface/{net_id}/txpower
  ENDPOINT_INFO(getTxPower) {
    info->summary = "Get TX power";
    info->description = "Current level, channel maximum and the dBm value of each level";
    info->addResponse<Object<TxPowerDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addTag("TX Power");
  }
  ENDPOINT("GET", "/api/v1/interface/{net_id}/txpower", getTxPower,
           PATH(String, netId, "net_id")) {
    return handle([&]() {
      auto report = m_manager->get_tx_power(netId->c_str());
      return createDtoResponse(Status::CODE_200, toTxPowerDto(report));
    });
  }

  // POST /api/v1/interface/{net_id}/txpower
  ENDPOINT_INFO(setTxPower) {
    info->summary = "Set TX power level";
    info->addConsumes<Object<TxPowerRequestDto>>("application/json");
    info->addResponse<Object<TxPowerDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addTag("TX Power");
  }
  ENDPOINT("POST", "/api/v1/interface/{net_id}/txpower", setTxPower,
           PATH(String, netId, "net_id"),
           BODY_DTO(Object<TxPowerRequestDto>, body)) {
    return handle([&]() {
      if (!body || !body->level) {
        throw wilab::core::WilabError(wilab::core::ErrorCode::ValidationFailed, "level is required");
      }
      auto report = m_manager->set_tx_power(netId->c_str(), *body->level);
      return createDtoResponse(Status::CODE_200, toTxPowerDto(report));
    });
  }
};

#include OATPP_CODEGEN_END(ApiController)
