#pragma once

#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/Types.hpp"

#include OATPP_CODEGEN_BEGIN(DTO)

class SuccessDto : public oatpp::DTO {
  DTO_INIT(SuccessDto, DTO)

  DTO_FIELD(String, status);
  DTO_FIELD(String, message);
};

class TeardownStepDto : public oatpp::DTO {
  DTO_INIT(TeardownStepDto, DTO)

  DTO_FIELD(String, name);
  DTO_FIELD(Boolean, ok);
  DTO_FIELD(String, error);
};

class ErrorDto : public oatpp::DTO {
  DTO_INIT(ErrorDto, DTO)

  DTO_FIELD_INFO(status) {
    info->required = true;
  }
  DTO_FIELD(String, status);

  // Failure condition name, e.g. "AlreadyActive"
  DTO_FIELD_INFO(error) {
    info->required = true;
  }
  DTO_FIELD(String, error);

  DTO_FIELD(String, detail);

  // Only present for PartialTeardown
  DTO_FIELD(Vector<Object<TeardownStepDto>>, steps);
};

// Network DTOs
class NetworkRequestDto : public oatpp::DTO {
  DTO_INIT(NetworkRequestDto, DTO)

  DTO_FIELD_INFO(ssid) {
    info->required = true;
  }
  DTO_FIELD(String, ssid);

  DTO_FIELD(Int32, channel);
  DTO_FIELD(String, band);        // "2.4ghz", "5ghz" or "dual"
  DTO_FIELD(String, encryption);  // "open", "wpa", "wpa2", "wpa3" or "wpa2-wpa3"
  DTO_FIELD(String, password);
  DTO_FIELD(Boolean, hidden);
  DTO_FIELD(Int32, txPowerLevel, "tx_power_level");
  DTO_FIELD(Int32, timeout);
  DTO_FIELD(Boolean, internetEnabled, "internet_enabled");
};

class SubnetDto : public oatpp::DTO {
  DTO_INIT(SubnetDto, DTO)

  DTO_FIELD(String, cidr);
  DTO_FIELD(String, gateway);
  DTO_FIELD(String, netmask);
  DTO_FIELD(String, dhcpStart, "dhcp_start");
  DTO_FIELD(String, dhcpEnd, "dhcp_end");
};

class ClientDto : public oatpp::DTO {
  DTO_INIT(ClientDto, DTO)

  DTO_FIELD(String, mac);
  DTO_FIELD(String, ip);
  DTO_FIELD(String, hostname);
};

class NetworkStatusDto : public oatpp::DTO {
  DTO_INIT(NetworkStatusDto, DTO)

  DTO_FIELD(String, netId, "net_id");
  DTO_FIELD(String, interface);
  DTO_FIELD(String, state);
  DTO_FIELD(Boolean, active);
  DTO_FIELD(Object<SubnetDto>, subnet);

  // Present while the network is active
  DTO_FIELD(String, ssid);
  DTO_FIELD(Int32, channel);
  DTO_FIELD(String, band);
  DTO_FIELD(String, encryption);
  DTO_FIELD(Boolean, hidden);
  DTO_FIELD(Int32, txPowerLevel, "tx_power_level");
  DTO_FIELD(Boolean, internetEnabled, "internet_enabled");
  DTO_FIELD(Int32, timeout);
  DTO_FIELD(Int64, createdAt, "created_at");
  DTO_FIELD(Int64, expiresAt, "expires_at");
  DTO_FIELD(Int64, remainingSeconds, "remaining_seconds");
  DTO_FIELD(Vector<String>, warnings);

  DTO_FIELD(Vector<Object<ClientDto>>, clients);
  DTO_FIELD(Int32, clientCount, "client_count");
};

class NetworkListDto : public oatpp::DTO {
  DTO_INIT(NetworkListDto, DTO)

  DTO_FIELD(Vector<Object<NetworkStatusDto>>, networks);
  DTO_FIELD(Int32, total);
};

class ClientListDto : public oatpp::DTO {
  DTO_INIT(ClientListDto, DTO)

  DTO_FIELD(String, netId, "net_id");
  DTO_FIELD(Vector<Object<ClientDto>>, clients);
  DTO_FIELD(Int32, count);
};

// TX power DTOs
class TxPowerRequestDto : public oatpp::DTO {
  DTO_INIT(TxPowerRequestDto, DTO)

  DTO_FIELD_INFO(level) {
    info->required = true;
    info->description = "1 (25%) to 4 (100%) of the channel maximum";
  }
  DTO_FIELD(Int32, level);
};

class TxPowerDto : public oatpp::DTO {
  DTO_INIT(TxPowerDto, DTO)

  DTO_FIELD(String, interface);
  DTO_FIELD(Int32, channel);
  DTO_FIELD(Int32, frequencyMhz, "frequency_mhz");
  DTO_FIELD(Float64, maxDbm, "max_dbm");
  DTO_FIELD(Vector<Float64>, levelsDbm, "levels_dbm");
  DTO_FIELD(Int32, currentLevel, "current_level");
  DTO_FIELD(Float64, currentDbm, "current_dbm");
  DTO_FIELD(Float64, reportedDbm, "reported_dbm");
  DTO_FIELD(String, warning);
};

// Health DTO
class HealthDto : public oatpp::DTO {
  DTO_INIT(HealthDto, DTO)

  DTO_FIELD(String, status);  // "standby", "ok" or "degraded"
  DTO_FIELD(Int32, activeNetworks, "active_networks");
  DTO_FIELD(Boolean, daemonsRunning, "daemons_running");
  DTO_FIELD(Boolean, natExpected, "nat_expected");
  DTO_FIELD(String, upstreamInterface, "upstream_interface");
  DTO_FIELD(Boolean, upstreamUp, "upstream_up");
  DTO_FIELD(Boolean, upstreamHasIp, "upstream_has_ip");
  DTO_FIELD(Boolean, natConfigured, "nat_configured");
  DTO_FIELD(String, error);
};

#include OATPP_CODEGEN_END(DTO)
