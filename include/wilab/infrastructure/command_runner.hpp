#ifndef WILAB_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define WILAB_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace wilab
{
    namespace core
    {
        class Logger;
    }
}

namespace wilab
{
    namespace infrastructure
    {

        /**
         * Captured outcome of one external command
         */
        struct CommandResult
        {
            int exit_code = 0;
            std::string stdout_output;
            std::string stderr_output;

            bool ok() const { return exit_code == 0; }
        };

        /**
         * Runs short-lived external commands (ip, iw, iptables, sysctl).
         * With check set, a non-zero exit raises core::CommandError.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv, bool check = true) = 0;
        };

        /**
         * fork/exec implementation bounded by a per-command timeout
         */
        class SystemCommandRunner : public CommandRunner
        {
        public:
            explicit SystemCommandRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));

            CommandResult run(const std::vector<std::string> &argv, bool check = true) override;

        private:
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_COMMAND_RUNNER_HPP
