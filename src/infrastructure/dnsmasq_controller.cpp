/**
 * DHCP Controller Implementation
 * Serves one subnet per WiFi interface with a dedicated dnsmasq instance
 */

#include "wilab/infrastructure/dnsmasq_controller.hpp"
#include "wilab/core/config.hpp"
#include "wilab/core/errors.hpp"
#include "wilab/core/logger.hpp"

#include <fstream>
#include <sstream>
#include <thread>

namespace wilab
{
    namespace infrastructure
    {

        DnsmasqController::DnsmasqController(std::shared_ptr<CommandRunner> runner,
                                             std::shared_ptr<ProcessLauncher> launcher,
                                             const core::WilabConfig &config)
            : runner_(std::move(runner)),
              launcher_(std::move(launcher)),
              logger_(core::get_logger("DnsmasqController")),
              runtime_dir_(std::filesystem::path(config.runtime_dir) / "dnsmasq"),
              dns_server_(config.dns_server),
              startup_wait_(config.daemon.ready_interval_ms),
              stop_grace_(config.daemon.stop_grace_ms)
        {
        }

        std::string DnsmasqController::render_config(const std::string &interface,
                                                     const network::SubnetInfo &subnet,
                                                     const std::string &dns_server,
                                                     const std::filesystem::path &lease_file)
        {
            std::ostringstream conf;
            conf << "# Wi-Lab DHCP configuration for " << interface << "\n";
            conf << "# Auto-generated - do not edit manually\n\n";

            conf << "interface=" << interface << "\n";
            conf << "bind-interfaces\n";
            conf << "listen-address=" << subnet.gateway << "\n";
            conf << "dhcp-range=" << subnet.dhcp_start << "," << subnet.dhcp_end << "," << subnet.netmask << ",12h\n";
            conf << "dhcp-option=option:router," << subnet.gateway << "\n";
            conf << "dhcp-option=option:dns-server," << dns_server << "\n";
            conf << "dhcp-leasefile=" << lease_file.string() << "\n";

            // DHCP only, no DNS service on the AP
            conf << "port=0\n";
            conf << "no-resolv\n";
            conf << "no-poll\n";
            conf << "log-dhcp\n";
            return conf.str();
        }

        std::filesystem::path DnsmasqController::config_path(const std::string &net_id) const
        {
            return runtime_dir_ / (net_id + ".conf");
        }

        std::filesystem::path DnsmasqController::lease_path(const std::string &net_id) const
        {
            return runtime_dir_ / (net_id + ".leases");
        }

        std::filesystem::path DnsmasqController::log_path(const std::string &net_id) const
        {
            return runtime_dir_ / (net_id + ".log");
        }

        std::unique_ptr<ProcessHandle> DnsmasqController::start(const std::string &net_id,
                                                                const std::string &interface,
                                                                const network::SubnetInfo &subnet)
        {
            logger_->info("Starting DHCP server",
                          core::LogContext()
                              .add("net_id", net_id)
                              .add("interface", interface)
                              .add("dhcp_range", subnet.dhcp_start + "-" + subnet.dhcp_end));

            const auto conf_file = config_path(net_id);
            std::unique_ptr<ProcessHandle> process;

            auto rollback = [&](const char *reason) {
                logger_->error("DHCP server start failed",
                               core::LogContext().add("net_id", net_id).add("error", reason));

                if (process)
                {
                    process->terminate(stop_grace_);
                }
                std::error_code ec;
                std::filesystem::remove(conf_file, ec);
                try
                {
                    runner_->run({"ip", "addr", "del", subnet.gateway + "/24", "dev", interface}, false);
                }
                catch (const core::CommandError &cleanup_error)
                {
                    logger_->warning("Could not remove gateway address",
                                     core::LogContext().add("interface", interface).add("error", cleanup_error.what()));
                }
            };

            try
            {
                std::filesystem::create_directories(runtime_dir_);

                assign_gateway(interface, subnet);

                std::ofstream conf_stream(conf_file);
                if (!conf_stream)
                {
                    throw core::WilabError(core::ErrorCode::DaemonStartFailed, "cannot write " + conf_file.string());
                }
                conf_stream << render_config(interface, subnet, dns_server_, lease_path(net_id));
                conf_stream.close();

                process = launcher_->launch({"dnsmasq", "--no-daemon", "--conf-file=" + conf_file.string()},
                                            log_path(net_id));

                // dnsmasq exits immediately on a bad config or a busy address
                std::this_thread::sleep_for(startup_wait_);
                if (!process->is_running())
                {
                    std::string output = process->output_tail();
                    throw core::WilabError(core::ErrorCode::DaemonStartFailed,
                                           "dnsmasq exited on startup" + (output.empty() ? "" : ": " + output));
                }
            }
            catch (const core::WilabError &e)
            {
                rollback(e.what());
                if (e.code() == core::ErrorCode::DaemonStartFailed)
                {
                    throw;
                }
                throw core::WilabError(core::ErrorCode::DaemonStartFailed, e.detail());
            }
            catch (const std::exception &e)
            {
                rollback(e.what());
                throw core::WilabError(core::ErrorCode::DaemonStartFailed, e.what());
            }

            logger_->info("DHCP server running",
                          core::LogContext().add("net_id", net_id).add("pid", process->pid()));
            return process;
        }

        void DnsmasqController::stop(const std::string &net_id,
                                     const std::string &interface,
                                     const network::SubnetInfo &subnet,
                                     ProcessHandle *process)
        {
            logger_->info("Stopping DHCP server", core::LogContext().add("net_id", net_id));

            if (process)
            {
                process->terminate(stop_grace_);
            }

            std::error_code ec;
            std::filesystem::remove(config_path(net_id), ec);
            std::filesystem::remove(lease_path(net_id), ec);

            auto result = runner_->run({"ip", "addr", "del", subnet.gateway + "/24", "dev", interface}, false);
            if (!result.ok())
            {
                logger_->debug("Gateway address already absent",
                               core::LogContext().add("interface", interface).add("gateway", subnet.gateway));
            }
        }

        void DnsmasqController::assign_gateway(const std::string &interface, const network::SubnetInfo &subnet)
        {
            runner_->run({"ip", "link", "set", interface, "up"});

            auto addresses = runner_->run({"ip", "-4", "addr", "show", "dev", interface});
            if (addresses.stdout_output.find("inet " + subnet.gateway + "/") != std::string::npos)
            {
                logger_->debug("Gateway already assigned", core::LogContext().add("interface", interface));
                return;
            }

            runner_->run({"ip", "addr", "add", subnet.gateway + "/24", "dev", interface});
        }

        std::vector<network::DhcpLease> DnsmasqController::read_leases(const std::string &net_id)
        {
            std::ifstream lease_stream(lease_path(net_id));
            if (!lease_stream)
            {
                return {};
            }

            std::stringstream content;
            content << lease_stream.rdbuf();
            return network::parse_leases(content.str());
        }

    } // namespace infrastructure
} // namespace wilab
