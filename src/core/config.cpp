#include "wilab/core/config.hpp"
#include "wilab/network/address_allocator.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

namespace wilab
{
    namespace core
    {

        void NetworkEntry::from_json(const nlohmann::json &j)
        {
            if (!j.contains("net_id") || !j["net_id"].is_string())
                throw std::invalid_argument("net_id is required");
            if (!j.contains("interface") || !j["interface"].is_string())
                throw std::invalid_argument("interface is required");

            net_id = j["net_id"];
            interface = j["interface"];
        }

        nlohmann::json NetworkEntry::to_json() const
        {
            return nlohmann::json{
                {"net_id", net_id},
                {"interface", interface}};
        }

        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        void DaemonConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("ready_attempts"))
                ready_attempts = j["ready_attempts"];
            if (j.contains("ready_interval_ms"))
                ready_interval_ms = j["ready_interval_ms"];
            if (j.contains("stop_grace_ms"))
                stop_grace_ms = j["stop_grace_ms"];
            if (j.contains("command_timeout_ms"))
                command_timeout_ms = j["command_timeout_ms"];
            if (j.contains("txpower_settle_ms"))
                txpower_settle_ms = j["txpower_settle_ms"];
        }

        nlohmann::json DaemonConfig::to_json() const
        {
            return nlohmann::json{
                {"ready_attempts", ready_attempts},
                {"ready_interval_ms", ready_interval_ms},
                {"stop_grace_ms", stop_grace_ms},
                {"command_timeout_ms", command_timeout_ms},
                {"txpower_settle_ms", txpower_settle_ms}};
        }

        std::unique_ptr<WilabConfig> WilabConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<WilabConfig> WilabConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration root must be an object");
            }
            if (!j.contains("auth_token") || !j["auth_token"].is_string())
            {
                throw std::invalid_argument("auth_token is required");
            }
            if (!j.contains("dhcp_base_network") || !j["dhcp_base_network"].is_string())
            {
                throw std::invalid_argument("dhcp_base_network is required");
            }
            if (!j.contains("networks") || !j["networks"].is_array())
            {
                throw std::invalid_argument("networks is required");
            }

            auto config = std::make_unique<WilabConfig>();

            try
            {
                config->auth_token = j["auth_token"];
                config->dhcp_base_network = j["dhcp_base_network"];

                if (j.contains("api_host"))
                    config->api_host = j["api_host"];
                if (j.contains("api_port"))
                    config->api_port = j["api_port"];
                if (j.contains("default_timeout"))
                    config->default_timeout = j["default_timeout"];
                if (j.contains("min_timeout"))
                    config->min_timeout = j["min_timeout"];
                if (j.contains("max_timeout"))
                    config->max_timeout = j["max_timeout"];
                if (j.contains("upstream_interface"))
                    config->upstream_interface = j["upstream_interface"];
                if (j.contains("dns_server"))
                    config->dns_server = j["dns_server"];
                if (j.contains("internet_enabled_by_default"))
                    config->internet_enabled_by_default = j["internet_enabled_by_default"];
                if (j.contains("country_code"))
                    config->country_code = j["country_code"];
                if (j.contains("expiry_check_interval"))
                    config->expiry_check_interval = j["expiry_check_interval"];
                if (j.contains("runtime_dir"))
                    config->runtime_dir = j["runtime_dir"];

                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
                if (j.contains("daemon"))
                    config->daemon.from_json(j["daemon"]);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Invalid field type: " + std::string(e.what()));
            }

            const auto &networks = j["networks"];
            for (size_t i = 0; i < networks.size(); ++i)
            {
                NetworkEntry entry;
                try
                {
                    entry.from_json(networks[i]);
                }
                catch (const std::invalid_argument &e)
                {
                    throw std::invalid_argument("networks[" + std::to_string(i) + "]." + e.what());
                }
                config->networks.push_back(std::move(entry));
            }

            config->validate();
            return config;
        }

        nlohmann::json WilabConfig::to_json() const
        {
            nlohmann::json nets = nlohmann::json::array();
            for (const auto &entry : networks)
            {
                nets.push_back(entry.to_json());
            }

            return nlohmann::json{
                {"auth_token", auth_token},
                {"api_host", api_host},
                {"api_port", api_port},
                {"default_timeout", default_timeout},
                {"min_timeout", min_timeout},
                {"max_timeout", max_timeout},
                {"dhcp_base_network", dhcp_base_network},
                {"upstream_interface", upstream_interface},
                {"dns_server", dns_server},
                {"internet_enabled_by_default", internet_enabled_by_default},
                {"country_code", country_code},
                {"expiry_check_interval", expiry_check_interval},
                {"runtime_dir", runtime_dir},
                {"networks", nets},
                {"logging", logging.to_json()},
                {"daemon", daemon.to_json()}};
        }

        void WilabConfig::validate() const
        {
            if (auth_token.length() < 8)
            {
                throw std::invalid_argument("auth_token must be at least 8 characters");
            }

            if (api_port < 1 || api_port > 65535)
            {
                throw std::invalid_argument("api_port must be between 1 and 65535");
            }

            if (min_timeout <= 0)
            {
                throw std::invalid_argument("min_timeout must be positive");
            }
            if (min_timeout > default_timeout || default_timeout > max_timeout)
            {
                throw std::invalid_argument("timeouts must satisfy min_timeout <= default_timeout <= max_timeout");
            }

            if (upstream_interface.empty())
            {
                throw std::invalid_argument("upstream_interface must be 'auto' or a device name");
            }

            if (country_code.size() != 2)
            {
                throw std::invalid_argument("country_code must be a two-letter code");
            }

            if (expiry_check_interval <= 0)
            {
                throw std::invalid_argument("expiry_check_interval must be positive");
            }

            if (runtime_dir.empty())
            {
                throw std::invalid_argument("runtime_dir cannot be empty");
            }

            if (daemon.ready_attempts <= 0 || daemon.ready_interval_ms < 0 || daemon.stop_grace_ms < 0 ||
                daemon.command_timeout_ms <= 0 || daemon.txpower_settle_ms < 0)
            {
                throw std::invalid_argument("daemon timings must be positive");
            }

            if (networks.empty())
            {
                throw std::invalid_argument("networks must contain at least one entry");
            }

            std::set<std::string> ids;
            std::set<std::string> interfaces;
            for (size_t i = 0; i < networks.size(); ++i)
            {
                const auto &entry = networks[i];
                const std::string path = "networks[" + std::to_string(i) + "]";

                if (!network::is_valid_net_id(entry.net_id))
                {
                    throw std::invalid_argument(path + ".net_id must match ^[a-z0-9-]{1,16}$");
                }
                if (entry.interface.empty())
                {
                    throw std::invalid_argument(path + ".interface cannot be empty");
                }
                if (!ids.insert(entry.net_id).second)
                {
                    throw std::invalid_argument(path + ".net_id duplicates '" + entry.net_id + "'");
                }
                if (!interfaces.insert(entry.interface).second)
                {
                    throw std::invalid_argument(path + ".interface duplicates '" + entry.interface + "'");
                }
            }

            // Parses the base /24 and checks that every slot fits below the third-octet limit
            try
            {
                network::AddressAllocator allocator(dhcp_base_network);
                if (networks.size() > allocator.capacity())
                {
                    throw std::invalid_argument("Too many networks (" + std::to_string(networks.size()) +
                                                ") for dhcp_base_network " + dhcp_base_network);
                }
            }
            catch (const std::invalid_argument &e)
            {
                throw std::invalid_argument(std::string("dhcp_base_network: ") + e.what());
            }
        }

        const NetworkEntry *WilabConfig::find_network(const std::string &net_id) const
        {
            for (const auto &entry : networks)
            {
                if (entry.net_id == net_id)
                {
                    return &entry;
                }
            }
            return nullptr;
        }

    } // namespace core
} // namespace wilab
