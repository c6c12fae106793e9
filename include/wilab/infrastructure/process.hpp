#ifndef WILAB_INFRASTRUCTURE_PROCESS_HPP
#define WILAB_INFRASTRUCTURE_PROCESS_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

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
         * Scoped handle to a supervised daemon.
         * The owner is the only party allowed to signal or reap the process.
         */
        class ProcessHandle
        {
        public:
            virtual ~ProcessHandle() = default;

            virtual pid_t pid() const = 0;
            virtual bool is_running() = 0;

            /**
             * SIGTERM, wait up to grace, then SIGKILL. Always reaps.
             */
            virtual void terminate(std::chrono::milliseconds grace) = 0;

            /** Last lines the daemon wrote to its log, for failure reports */
            virtual std::string output_tail() const = 0;
        };

        /**
         * Direct child process spawned by SystemProcessLauncher.
         * Destroying a live handle terminates the child.
         */
        class ChildProcess : public ProcessHandle
        {
        public:
            ChildProcess(pid_t pid, std::filesystem::path log_path);
            ~ChildProcess() override;

            ChildProcess(const ChildProcess &) = delete;
            ChildProcess &operator=(const ChildProcess &) = delete;

            pid_t pid() const override { return pid_; }
            bool is_running() override;
            void terminate(std::chrono::milliseconds grace) override;
            std::string output_tail() const override;

        private:
            pid_t pid_;
            bool reaped_ = false;
            std::filesystem::path log_path_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Spawns long-running daemons in the foreground as direct children
         */
        class ProcessLauncher
        {
        public:
            virtual ~ProcessLauncher() = default;

            virtual std::unique_ptr<ProcessHandle> launch(const std::vector<std::string> &argv,
                                                          const std::filesystem::path &log_path) = 0;
        };

        class SystemProcessLauncher : public ProcessLauncher
        {
        public:
            SystemProcessLauncher();

            std::unique_ptr<ProcessHandle> launch(const std::vector<std::string> &argv,
                                                  const std::filesystem::path &log_path) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_PROCESS_HPP
