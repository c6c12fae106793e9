/**
 * Wi-Lab Access Point Controller
 * Main entry point for the wilab service
 */

#include <iostream>
#include <csignal>
#include <unistd.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

#include "wilab/core/config.hpp"
#include "wilab/core/logger.hpp"
#include "wilab/infrastructure/command_runner.hpp"
#include "wilab/infrastructure/dnsmasq_controller.hpp"
#include "wilab/infrastructure/hostapd_controller.hpp"
#include "wilab/infrastructure/iptables_forwarding.hpp"
#include "wilab/infrastructure/process.hpp"
#include "wilab/services/lifecycle_manager.hpp"
#include "wilab/api/server.hpp"

// Command line argument parsing
#include <getopt.h>

#ifndef WILAB_VERSION
#define WILAB_VERSION "1.0.0"
#endif

namespace wilab {

/**
 * Set from the signal handler, polled by the main loop
 */
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

/**
 * Check if running with required privileges
 */
bool check_root_privileges() {
    if (geteuid() != 0) {
        std::cerr << "ERROR: wilab must be run as root to manage access points and firewall rules." << std::endl;
        std::cerr << "Please run with: sudo ./wilab" << std::endl;
        return false;
    }
    return true;
}

void print_usage(const char* program_name) {
    std::cout << "Wi-Lab Access Point Controller\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: wilab_config.json)\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "                          # Run with default config\n";
    std::cout << "  " << program_name << " -c /etc/wilab.json       # Use custom configuration\n";
    std::cout << "  " << program_name << " -vv                      # Debug logging\n";
    std::cout << std::endl;
}

void print_version() {
    std::cout << "wilab v" << WILAB_VERSION << std::endl;
    std::cout << "Built for Linux (hostapd, dnsmasq, iptables)" << std::endl;
}

struct Arguments {
    std::string config_file = "wilab_config.json";
    int verbosity = 0;
    std::string log_file;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",   required_argument, 0, 'c'},
        {"verbose",  no_argument,       0, 'v'},
        {"log-file", required_argument, 0, 'l'},
        {"help",     no_argument,       0, 'h'},
        {"version",  no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 4) { // --version
                    args.version = true;
                }
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

/**
 * Warns about tagged rules left behind by a previous run
 */
void check_leftover_rules(infrastructure::ForwardingController& forwarding) {
    auto logger = core::get_logger("main");
    try {
        auto leftovers = forwarding.list_tagged_rules();
        if (!leftovers.empty()) {
            logger->warning("Found firewall rules from a previous run",
                            core::LogContext().add("count", leftovers.size()));
            for (const auto& rule : leftovers) {
                logger->warning("Leftover rule", core::LogContext().add("rule", rule));
            }
        }
    } catch (const core::WilabError& e) {
        logger->warning("Could not inspect firewall rules", core::LogContext().add("error", e.what()));
    }
}

} // namespace wilab

int main(int argc, char* argv[]) {
    using namespace wilab;

    try {
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Console logging at WARNING until the configuration is known
        core::setup_logging(core::LogLevel::WARNING, "", true);
        auto logger = core::get_logger("main");

        if (!check_root_privileges()) {
            return 1;
        }

        std::unique_ptr<core::WilabConfig> config;
        try {
            config = core::WilabConfig::from_file(args.config_file);
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                          core::LogContext().add("config_file", args.config_file)
                                            .add("error", e.what()));
            return 1;
        }

        // Command line overrides the configured level and file
        core::LogLevel log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }
        std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
        core::setup_logging(log_level, log_file, log_file.empty());

        setup_signal_handlers();

        logger->info("Starting wilab",
                     core::LogContext().add("config_file", args.config_file)
                                       .add("networks", config->networks.size()));

        auto runner = std::make_shared<infrastructure::SystemCommandRunner>(
            std::chrono::milliseconds(config->daemon.command_timeout_ms));
        auto launcher = std::make_shared<infrastructure::SystemProcessLauncher>();

        auto access_point = std::make_shared<infrastructure::HostapdController>(runner, launcher, *config);
        auto dhcp = std::make_shared<infrastructure::DnsmasqController>(runner, launcher, *config);
        auto forwarding = std::make_shared<infrastructure::IptablesForwarding>(runner, config->upstream_interface);

        check_leftover_rules(*forwarding);

        auto manager = std::make_shared<services::LifecycleManager>(*config, access_point, dhcp, forwarding);
        manager->start_expiry_loop();

        auto api_server = std::make_unique<ApiServer>(manager, config->auth_token);
        api_server->start(config->api_host, static_cast<uint16_t>(config->api_port));

        logger->info("wilab started successfully");

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger->info("Shutdown requested, stopping networks");
        api_server->stop();
        manager->shutdown_all();

        logger->info("wilab stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
