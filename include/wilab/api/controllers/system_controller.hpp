#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "wilab/api/dto.hpp"
#include "wilab/api/dto_mapper.hpp"
#include "wilab/services/lifecycle_manager.hpp"
#include <memory>

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * System Controller
 * Public endpoints: configured interfaces and service health
 */
class SystemController : public oatpp::web::server::api::ApiController {
private:
  std::shared_ptr<wilab::services::LifecycleManager> m_manager;

public:
  SystemController(const std::shared_ptr<ObjectMapper>& objectMapper,
                   std::shared_ptr<wilab::services::LifecycleManager> manager)
    : oatpp::web::server::api::ApiController(objectMapper)
    , m_manager(manager) {}

  static std::shared_ptr<SystemController> createShared(
    const std::shared_ptr<ObjectMapper>& objectMapper,
    std::shared_ptr<wilab::services::LifecycleManager> manager
  ) {
    return std::make_shared<SystemController>(objectMapper, manager);
  }

  // GET /api/v1/interfaces
  ENDPOINT_INFO(listInterfaces) {
    info->summary = "List managed interfaces";
    info->description = "Every configured network with its subnet and current state";
    info->addResponse<Object<NetworkListDto>>(Status::CODE_200, "application/json");
    info->addTag("System");
  }
  ENDPOINT("GET", "/api/v1/interfaces", listInterfaces) {
    auto dto = NetworkListDto::createShared();
    dto->networks = oatpp::Vector<oatpp::Object<NetworkStatusDto>>::createShared();
    for (const auto& snapshot : m_manager->list_networks()) {
      dto->networks->push_back(toNetworkStatusDto(snapshot));
    }
    dto->total = static_cast<v_int32>(dto->networks->size());
    return createDtoResponse(Status::CODE_200, dto);
  }

  // GET /api/v1/health
  ENDPOINT_INFO(getHealth) {
    info->summary = "Service health";
    info->description = "standby with no active network, ok when daemons and NAT are in place, degraded otherwise";
    info->addResponse<Object<HealthDto>>(Status::CODE_200, "application/json");
    info->addTag("System");
  }
  ENDPOINT("GET", "/api/v1/health", getHealth) {
    return createDtoResponse(Status::CODE_200, toHealthDto(m_manager->health()));
  }
};

#include OATPP_CODEGEN_END(ApiController)
