#ifndef WILAB_INFRASTRUCTURE_DNSMASQ_CONTROLLER_HPP
#define WILAB_INFRASTRUCTURE_DNSMASQ_CONTROLLER_HPP

#include "wilab/infrastructure/command_runner.hpp"
#include "wilab/infrastructure/dhcp_controller.hpp"

#include <chrono>
#include <filesystem>

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
         * DHCP controller running one `dnsmasq --no-daemon` per network
         */
        class DnsmasqController : public DhcpController
        {
        public:
            DnsmasqController(std::shared_ptr<CommandRunner> runner,
                              std::shared_ptr<ProcessLauncher> launcher,
                              const core::WilabConfig &config);

            std::unique_ptr<ProcessHandle> start(const std::string &net_id,
                                                 const std::string &interface,
                                                 const network::SubnetInfo &subnet) override;
            void stop(const std::string &net_id,
                      const std::string &interface,
                      const network::SubnetInfo &subnet,
                      ProcessHandle *process) override;

            std::vector<network::DhcpLease> read_leases(const std::string &net_id) override;

            static std::string render_config(const std::string &interface,
                                             const network::SubnetInfo &subnet,
                                             const std::string &dns_server,
                                             const std::filesystem::path &lease_file);

            std::filesystem::path config_path(const std::string &net_id) const;
            std::filesystem::path lease_path(const std::string &net_id) const;
            std::filesystem::path log_path(const std::string &net_id) const;

        private:
            void assign_gateway(const std::string &interface, const network::SubnetInfo &subnet);

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<core::Logger> logger_;

            std::filesystem::path runtime_dir_;
            std::string dns_server_;
            std::chrono::milliseconds startup_wait_;
            std::chrono::milliseconds stop_grace_;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_DNSMASQ_CONTROLLER_HPP
