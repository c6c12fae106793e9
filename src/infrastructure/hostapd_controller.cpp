/**
 * hostapd Access Point Controller
 * Renders hostapd.conf, supervises the daemon and manages radio TX power via iw
 */

#include "wilab/infrastructure/hostapd_controller.hpp"
#include "wilab/core/config.hpp"
#include "wilab/core/errors.hpp"
#include "wilab/core/logger.hpp"
#include "wilab/network/lease.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <thread>

namespace wilab
{
    namespace infrastructure
    {

        namespace
        {
            constexpr double TX_POWER_TOLERANCE_DBM = 0.5;

            // "Supported interface modes" entries look like `\t\t * AP`
            bool lists_ap_mode(const std::string &phy_info)
            {
                std::istringstream lines(phy_info);
                std::string line;
                while (std::getline(lines, line))
                {
                    std::istringstream words(line);
                    std::string bullet;
                    std::string mode;
                    std::string rest;
                    if (words >> bullet >> mode && bullet == "*" && mode == "AP" && !(words >> rest))
                    {
                        return true;
                    }
                }
                return false;
            }
        }

        HostapdController::HostapdController(std::shared_ptr<CommandRunner> runner,
                                             std::shared_ptr<ProcessLauncher> launcher,
                                             const core::WilabConfig &config)
            : runner_(std::move(runner)),
              launcher_(std::move(launcher)),
              logger_(core::get_logger("HostapdController")),
              runtime_dir_(std::filesystem::path(config.runtime_dir) / "hostapd"),
              country_code_(config.country_code),
              ready_attempts_(config.daemon.ready_attempts),
              ready_interval_(config.daemon.ready_interval_ms),
              stop_grace_(config.daemon.stop_grace_ms),
              txpower_settle_(config.daemon.txpower_settle_ms)
        {
        }

        std::string HostapdController::render_config(const std::string &interface,
                                                     const network::RadioSettings &settings,
                                                     const std::string &country_code)
        {
            using network::Band;
            using network::Encryption;

            std::ostringstream conf;
            conf << "# Wi-Lab hostapd config for " << interface << "\n";
            conf << "interface=" << interface << "\n";
            conf << "driver=nl80211\n";
            conf << "ssid=" << settings.ssid << "\n";
            conf << "channel=" << settings.channel << "\n";

            const bool five_ghz = settings.band == Band::Ghz5 ||
                                  (settings.band == Band::Dual && network::is_5ghz_channel(settings.channel));
            conf << "hw_mode=" << (five_ghz ? "a" : "g") << "\n";

            if (settings.hidden)
            {
                conf << "ignore_broadcast_ssid=1\n";
            }

            if (settings.encryption != Encryption::Open)
            {
                conf << "wpa=2\n";
                conf << "wpa_passphrase=" << settings.password.value_or("") << "\n";
                conf << "wpa_key_mgmt=" << network::key_management(settings.encryption) << "\n";
                conf << "rsn_pairwise=CCMP\n";

                int mfp = network::management_frame_protection(settings.encryption);
                if (mfp > 0)
                {
                    conf << "ieee80211w=" << mfp << "\n";
                }
            }

            conf << "country_code=" << country_code << "\n";
            conf << "ieee80211n=1\n";
            conf << "wmm_enabled=1\n";
            return conf.str();
        }

        std::filesystem::path HostapdController::config_path(const std::string &net_id) const
        {
            return runtime_dir_ / (net_id + ".conf");
        }

        std::filesystem::path HostapdController::log_path(const std::string &net_id) const
        {
            return runtime_dir_ / (net_id + ".log");
        }

        std::unique_ptr<ProcessHandle> HostapdController::start(const std::string &net_id,
                                                                const std::string &interface,
                                                                const network::RadioSettings &settings)
        {
            logger_->info("Starting access point",
                          core::LogContext()
                              .add("net_id", net_id)
                              .add("interface", interface)
                              .add("ssid", settings.ssid)
                              .add("channel", settings.channel));

            settings.validate();
            check_interface(interface);

            const auto conf_file = config_path(net_id);
            std::unique_ptr<ProcessHandle> process;

            auto rollback = [&](const char *reason) {
                logger_->error("Access point start failed",
                               core::LogContext().add("net_id", net_id).add("error", reason));

                if (process)
                {
                    process->terminate(stop_grace_);
                }
                std::error_code ec;
                std::filesystem::remove(conf_file, ec);
                try
                {
                    restore_interface(interface);
                }
                catch (const std::exception &restore_error)
                {
                    logger_->warning("Could not restore interface after failed start",
                                     core::LogContext().add("interface", interface).add("error", restore_error.what()));
                }
            };

            try
            {
                std::filesystem::create_directories(runtime_dir_);

                std::ofstream conf_stream(conf_file);
                if (!conf_stream)
                {
                    throw core::WilabError(core::ErrorCode::DaemonStartFailed,
                                           "cannot write " + conf_file.string());
                }
                conf_stream << render_config(interface, settings, country_code_);
                conf_stream.close();

                prepare_interface(interface);

                process = launcher_->launch({"hostapd", conf_file.string()}, log_path(net_id));

                if (!wait_until_ready(interface, *process))
                {
                    std::string output = process->output_tail();
                    throw core::WilabError(core::ErrorCode::DaemonStartFailed,
                                           "hostapd did not bring " + interface + " into AP mode" +
                                               (output.empty() ? "" : ": " + output));
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

            logger_->info("Access point ready",
                          core::LogContext().add("net_id", net_id).add("interface", interface).add("pid", process->pid()));
            return process;
        }

        void HostapdController::stop(const std::string &net_id, const std::string &interface, ProcessHandle *process)
        {
            logger_->info("Stopping access point", core::LogContext().add("net_id", net_id).add("interface", interface));

            if (process)
            {
                process->terminate(stop_grace_);
            }

            std::error_code ec;
            std::filesystem::remove(config_path(net_id), ec);

            restore_interface(interface);
        }

        void HostapdController::check_interface(const std::string &interface)
        {
            using core::ErrorCode;
            using core::WilabError;

            auto link = runner_->run({"ip", "link", "show", interface}, false);
            if (!link.ok())
            {
                throw WilabError(ErrorCode::ValidationFailed, "Interface " + interface + " does not exist");
            }

            auto info = runner_->run({"iw", interface, "info"}, false);
            auto phy = info.ok() ? network::parse_wiphy(info.stdout_output) : std::nullopt;
            if (!phy)
            {
                throw WilabError(ErrorCode::ValidationFailed, "Interface " + interface + " is not wireless-capable");
            }

            auto phy_info = runner_->run({"iw", "phy" + *phy, "info"}, false);
            if (!phy_info.ok())
            {
                throw WilabError(ErrorCode::ValidationFailed,
                                 "Cannot validate AP mode for " + interface + ": " + phy_info.stderr_output);
            }
            if (!lists_ap_mode(phy_info.stdout_output))
            {
                throw WilabError(ErrorCode::ValidationFailed, "Interface " + interface + " does not support AP mode");
            }

            logger_->debug("Interface validated for AP mode",
                           core::LogContext().add("interface", interface).add("phy", "phy" + *phy));
        }

        void HostapdController::prepare_interface(const std::string &interface)
        {
            logger_->debug("Preparing interface", core::LogContext().add("interface", interface));
            runner_->run({"ip", "link", "set", interface, "down"});
            runner_->run({"iw", "dev", interface, "set", "type", "managed"});
            runner_->run({"ip", "addr", "flush", "dev", interface});
        }

        void HostapdController::restore_interface(const std::string &interface)
        {
            runner_->run({"ip", "link", "set", interface, "down"}, false);
            runner_->run({"iw", "dev", interface, "set", "type", "managed"});
            runner_->run({"ip", "addr", "flush", "dev", interface}, false);
            runner_->run({"ip", "link", "set", interface, "up"});
        }

        bool HostapdController::wait_until_ready(const std::string &interface, ProcessHandle &process)
        {
            for (int attempt = 1; attempt <= ready_attempts_; ++attempt)
            {
                std::this_thread::sleep_for(ready_interval_);

                if (!process.is_running())
                {
                    logger_->error("hostapd exited during startup", core::LogContext().add("interface", interface));
                    return false;
                }

                auto info = runner_->run({"iw", "dev", interface, "info"}, false);
                if (info.ok() && info.stdout_output.find("type AP") != std::string::npos)
                {
                    return true;
                }

                logger_->debug("Waiting for AP mode",
                               core::LogContext().add("interface", interface).add("attempt", attempt));
            }
            return false;
        }

        std::vector<std::string> HostapdController::list_stations(const std::string &interface)
        {
            auto dump = runner_->run({"iw", "dev", interface, "station", "dump"});
            return network::parse_station_dump(dump.stdout_output);
        }

        std::optional<double> HostapdController::read_reported_txpower(const std::string &interface)
        {
            try
            {
                auto info = runner_->run({"iw", "dev", interface, "info"});
                return network::parse_reported_txpower(info.stdout_output);
            }
            catch (const core::CommandError &e)
            {
                logger_->warning("Failed to read current txpower",
                                 core::LogContext().add("interface", interface).add("error", e.what()));
                return std::nullopt;
            }
        }

        network::TxPowerReport HostapdController::describe_power(const std::string &interface, int channel, int level)
        {
            if (!network::is_valid_tx_power_level(level))
            {
                throw core::WilabError(core::ErrorCode::ValidationFailed, "tx_power_level must be 1-4");
            }

            auto info = runner_->run({"iw", interface, "info"});
            auto phy = network::parse_wiphy(info.stdout_output);
            if (!phy)
            {
                throw core::WilabError(core::ErrorCode::CommandFailed, "cannot determine wiphy for " + interface);
            }

            auto phy_info = runner_->run({"iw", "phy" + *phy, "info"});
            auto caps = network::parse_channel_capabilities(phy_info.stdout_output, channel);
            if (!caps)
            {
                throw core::WilabError(core::ErrorCode::ValidationFailed,
                                       "Channel " + std::to_string(channel) + " not supported on interface " + interface);
            }

            network::TxPowerReport report;
            report.interface = interface;
            report.channel = channel;
            report.frequency_mhz = caps->frequency_mhz;
            report.max_dbm = caps->max_dbm;
            report.levels_dbm = network::compute_level_dbm(caps->max_dbm);
            report.current_level = level;
            report.current_dbm = report.levels_dbm[level - 1];
            return report;
        }

        network::TxPowerReport HostapdController::set_tx_power(const std::string &interface, int channel, int level,
                                                               bool verify)
        {
            auto report = describe_power(interface, channel, level);

            runner_->run({"iw", "dev", interface, "set", "txpower", "fixed",
                          std::to_string(network::dbm_to_mbm(report.current_dbm))});

            logger_->info("TX power set",
                          core::LogContext()
                              .add("interface", interface)
                              .add("level", level)
                              .add("dbm", report.current_dbm));

            if (verify)
            {
                std::this_thread::sleep_for(txpower_settle_);
                report.reported_dbm = read_reported_txpower(interface);
                if (report.reported_dbm &&
                    std::fabs(*report.reported_dbm - report.current_dbm) > TX_POWER_TOLERANCE_DBM)
                {
                    report.warning = network::TX_POWER_UNSUPPORTED_WARNING;
                    logger_->warning("TX power change not applied",
                                     core::LogContext()
                                         .add("interface", interface)
                                         .add("expected_dbm", report.current_dbm)
                                         .add("reported_dbm", *report.reported_dbm));
                }
            }
            return report;
        }

        network::TxPowerReport HostapdController::tx_power_info(const std::string &interface, int channel, int level)
        {
            auto report = describe_power(interface, channel, level);

            report.reported_dbm = read_reported_txpower(interface);
            if (report.reported_dbm && std::fabs(*report.reported_dbm - report.current_dbm) > TX_POWER_TOLERANCE_DBM)
            {
                report.warning = network::TX_POWER_UNSUPPORTED_WARNING;
            }
            return report;
        }

    } // namespace infrastructure
} // namespace wilab
