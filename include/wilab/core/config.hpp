#ifndef WILAB_CORE_CONFIG_HPP
#define WILAB_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace wilab
{
    namespace core
    {

        /**
         * One managed radio: a logical identifier bound to a physical interface
         */
        struct NetworkEntry
        {
            std::string net_id;
            std::string interface;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Daemon supervision and command timing
         */
        struct DaemonConfig
        {
            int ready_attempts = 10;
            int ready_interval_ms = 500;
            int stop_grace_ms = 2000;
            int command_timeout_ms = 15000;
            int txpower_settle_ms = 3000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete service configuration
         */
        class WilabConfig
        {
        public:
            std::string auth_token;
            std::string api_host = "0.0.0.0";
            int api_port = 8080;

            // Network lifetime bounds, in seconds
            int default_timeout = 3600;
            int min_timeout = 60;
            int max_timeout = 86400;

            std::string dhcp_base_network;
            std::string upstream_interface = "auto";
            std::string dns_server = "8.8.8.8";
            bool internet_enabled_by_default = true;
            std::string country_code = "IT";
            int expiry_check_interval = 5;
            std::string runtime_dir = "/tmp/wilab";

            std::vector<NetworkEntry> networks;

            LoggingConfig logging;
            DaemonConfig daemon;

        public:
            WilabConfig() = default;

            static std::unique_ptr<WilabConfig> from_file(const std::string &config_path);
            static std::unique_ptr<WilabConfig> from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;

            /**
             * Checks every field and the subnet plan.
             * Throws std::invalid_argument naming the offending field.
             */
            void validate() const;

            const NetworkEntry *find_network(const std::string &net_id) const;
        };

    } // namespace core
} // namespace wilab

#endif // WILAB_CORE_CONFIG_HPP
