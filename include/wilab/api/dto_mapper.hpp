#pragma once

#include "wilab/api/dto.hpp"
#include "wilab/core/errors.hpp"
#include "wilab/services/lifecycle_manager.hpp"
#include <algorithm>
#include <chrono>

// Conversions between manager types and API DTOs

inline oatpp::Object<SubnetDto> toSubnetDto(const wilab::network::SubnetInfo& subnet) {
  auto dto = SubnetDto::createShared();
  dto->cidr = subnet.cidr;
  dto->gateway = subnet.gateway;
  dto->netmask = subnet.netmask;
  dto->dhcpStart = subnet.dhcp_start;
  dto->dhcpEnd = subnet.dhcp_end;
  return dto;
}

inline oatpp::Vector<oatpp::Object<ClientDto>> toClientDtos(const std::vector<wilab::network::ClientInfo>& clients) {
  auto list = oatpp::Vector<oatpp::Object<ClientDto>>::createShared();
  for (const auto& client : clients) {
    auto dto = ClientDto::createShared();
    dto->mac = client.mac;
    dto->ip = client.ip;
    dto->hostname = client.hostname;
    list->push_back(dto);
  }
  return list;
}

inline oatpp::Object<NetworkStatusDto> toNetworkStatusDto(const wilab::services::NetworkSnapshot& snapshot) {
  using wilab::services::Clock;

  auto dto = NetworkStatusDto::createShared();
  dto->netId = snapshot.net_id;
  dto->interface = snapshot.interface;
  dto->state = wilab::services::to_string(snapshot.state);
  dto->active = snapshot.active();
  dto->subnet = toSubnetDto(snapshot.subnet);

  if (snapshot.details) {
    const auto& details = *snapshot.details;
    dto->ssid = details.settings.ssid;
    dto->channel = details.settings.channel;
    dto->band = wilab::network::to_string(details.settings.band);
    dto->encryption = wilab::network::to_string(details.settings.encryption);
    dto->hidden = details.settings.hidden;
    dto->txPowerLevel = details.settings.tx_power_level;
    dto->internetEnabled = details.internet_enabled;
    if (details.settings.timeout) {
      dto->timeout = *details.settings.timeout;
    }
    dto->createdAt = static_cast<v_int64>(Clock::to_time_t(details.created_at));
    dto->expiresAt = static_cast<v_int64>(Clock::to_time_t(details.expires_at));

    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(details.expires_at - Clock::now()).count();
    dto->remainingSeconds = static_cast<v_int64>(std::max<long long>(0, remaining));

    dto->warnings = oatpp::Vector<oatpp::String>::createShared();
    for (const auto& warning : details.warnings) {
      dto->warnings->push_back(warning);
    }
  }

  dto->clients = toClientDtos(snapshot.clients);
  dto->clientCount = static_cast<v_int32>(snapshot.clients.size());
  return dto;
}

inline oatpp::Object<TxPowerDto> toTxPowerDto(const wilab::network::TxPowerReport& report) {
  auto dto = TxPowerDto::createShared();
  dto->interface = report.interface;
  dto->channel = report.channel;
  dto->frequencyMhz = report.frequency_mhz;
  dto->maxDbm = report.max_dbm;
  dto->levelsDbm = oatpp::Vector<oatpp::Float64>::createShared();
  for (double level : report.levels_dbm) {
    dto->levelsDbm->push_back(level);
  }
  dto->currentLevel = report.current_level;
  dto->currentDbm = report.current_dbm;
  if (report.reported_dbm) {
    dto->reportedDbm = *report.reported_dbm;
  }
  if (report.warning) {
    dto->warning = *report.warning;
  }
  return dto;
}

inline oatpp::Object<HealthDto> toHealthDto(const wilab::services::HealthReport& report) {
  auto dto = HealthDto::createShared();
  dto->status = report.status;
  dto->activeNetworks = static_cast<v_int32>(report.active_networks);
  dto->daemonsRunning = report.daemons_running;
  dto->natExpected = report.nat_expected;
  dto->upstreamInterface = report.forwarding.upstream_interface;
  dto->upstreamUp = report.forwarding.upstream_up;
  dto->upstreamHasIp = report.forwarding.upstream_has_ip;
  dto->natConfigured = report.forwarding.nat_configured;
  if (!report.forwarding.error.empty()) {
    dto->error = report.forwarding.error;
  }
  return dto;
}

inline oatpp::Object<ErrorDto> toErrorDto(const wilab::core::WilabError& error) {
  auto dto = ErrorDto::createShared();
  dto->status = "error";
  dto->error = wilab::core::error_code_name(error.code());
  dto->detail = error.detail();

  if (!error.steps().empty()) {
    dto->steps = oatpp::Vector<oatpp::Object<TeardownStepDto>>::createShared();
    for (const auto& step : error.steps()) {
      auto stepDto = TeardownStepDto::createShared();
      stepDto->name = step.name;
      stepDto->ok = step.ok;
      if (!step.error.empty()) {
        stepDto->error = step.error;
      }
      dto->steps->push_back(stepDto);
    }
  }
  return dto;
}

/**
 * Builds manager parameters from a Start body.
 * Unknown band or encryption names are reported as ValidationFailed.
 */
inline wilab::network::RadioSettings toRadioSettings(const oatpp::Object<NetworkRequestDto>& dto) {
  using wilab::core::ErrorCode;
  using wilab::core::WilabError;

  wilab::network::RadioSettings settings;
  if (!dto) {
    throw WilabError(ErrorCode::ValidationFailed, "request body is required");
  }

  if (dto->ssid) {
    settings.ssid = *dto->ssid;
  }
  if (dto->channel) {
    settings.channel = *dto->channel;
  }
  if (dto->band) {
    auto band = wilab::network::parse_band(*dto->band);
    if (!band) {
      throw WilabError(ErrorCode::ValidationFailed, "Unknown band: " + *dto->band);
    }
    settings.band = *band;
  }
  if (dto->encryption) {
    auto encryption = wilab::network::parse_encryption(*dto->encryption);
    if (!encryption) {
      throw WilabError(ErrorCode::ValidationFailed, "Unknown encryption: " + *dto->encryption);
    }
    settings.encryption = *encryption;
  }
  if (dto->password) {
    settings.password = *dto->password;
  }
  if (dto->hidden) {
    settings.hidden = *dto->hidden;
  }
  if (dto->txPowerLevel) {
    settings.tx_power_level = *dto->txPowerLevel;
  }
  if (dto->timeout) {
    settings.timeout = *dto->timeout;
  }
  if (dto->internetEnabled) {
    settings.internet_enabled = *dto->internetEnabled;
  }
  return settings;
}
