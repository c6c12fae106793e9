#ifndef WILAB_INFRASTRUCTURE_HOSTAPD_CONTROLLER_HPP
#define WILAB_INFRASTRUCTURE_HOSTAPD_CONTROLLER_HPP

#include "wilab/infrastructure/access_point_controller.hpp"
#include "wilab/infrastructure/command_runner.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace wilab
{
    namespace core
    {
        class WilabConfig;
        class Logger;
    }
}

namespace wilab
{
    namespace infrastructure
    {

        /**
         * hostapd-backed access point, one foreground daemon per interface
         */
        class HostapdController : public AccessPointController
        {
        public:
            HostapdController(std::shared_ptr<CommandRunner> runner,
                              std::shared_ptr<ProcessLauncher> launcher,
                              const core::WilabConfig &config);

            std::unique_ptr<ProcessHandle> start(const std::string &net_id,
                                                 const std::string &interface,
                                                 const network::RadioSettings &settings) override;
            void stop(const std::string &net_id, const std::string &interface, ProcessHandle *process) override;

            std::vector<std::string> list_stations(const std::string &interface) override;

            network::TxPowerReport set_tx_power(const std::string &interface, int channel, int level,
                                                bool verify) override;
            network::TxPowerReport tx_power_info(const std::string &interface, int channel, int level) override;

            static std::string render_config(const std::string &interface,
                                             const network::RadioSettings &settings,
                                             const std::string &country_code);

            std::filesystem::path config_path(const std::string &net_id) const;
            std::filesystem::path log_path(const std::string &net_id) const;

        private:
            /**
             * Checks the device exists, is wireless and its phy lists AP mode.
             * Throws ValidationFailed without touching the interface.
             */
            void check_interface(const std::string &interface);
            void prepare_interface(const std::string &interface);
            void restore_interface(const std::string &interface);
            bool wait_until_ready(const std::string &interface, ProcessHandle &process);

            network::TxPowerReport describe_power(const std::string &interface, int channel, int level);
            std::optional<double> read_reported_txpower(const std::string &interface);

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<core::Logger> logger_;

            std::filesystem::path runtime_dir_;
            std::string country_code_;
            int ready_attempts_;
            std::chrono::milliseconds ready_interval_;
            std::chrono::milliseconds stop_grace_;
            std::chrono::milliseconds txpower_settle_;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_HOSTAPD_CONTROLLER_HPP
