/**
 * Daemon process supervision
 * Spawns hostapd/dnsmasq as direct children and tears them down with a bounded grace period
 */

#include "wilab/infrastructure/process.hpp"
#include "wilab/core/errors.hpp"
#include "wilab/core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace wilab
{
    namespace infrastructure
    {

        namespace
        {
            constexpr std::streamoff OUTPUT_TAIL_BYTES = 2048;
            constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(50);
        }

        ChildProcess::ChildProcess(pid_t pid, std::filesystem::path log_path)
            : pid_(pid), log_path_(std::move(log_path)), logger_(core::get_logger("ChildProcess"))
        {
        }

        ChildProcess::~ChildProcess()
        {
            if (!reaped_)
            {
                terminate(std::chrono::milliseconds(500));
            }
        }

        bool ChildProcess::is_running()
        {
            if (reaped_)
            {
                return false;
            }

            int status = 0;
            pid_t result = waitpid(pid_, &status, WNOHANG);
            if (result == pid_ || (result < 0 && errno == ECHILD))
            {
                reaped_ = true;
                return false;
            }
            return true;
        }

        void ChildProcess::terminate(std::chrono::milliseconds grace)
        {
            if (!is_running())
            {
                return;
            }

            logger_->debug("Stopping process", core::LogContext().add("pid", pid_));
            kill(pid_, SIGTERM);

            const auto deadline = std::chrono::steady_clock::now() + grace;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (!is_running())
                {
                    logger_->debug("Process exited", core::LogContext().add("pid", pid_));
                    return;
                }
                std::this_thread::sleep_for(REAP_POLL_INTERVAL);
            }

            logger_->warning("Process ignored SIGTERM, killing",
                             core::LogContext().add("pid", pid_).add("grace_ms", grace.count()));
            kill(pid_, SIGKILL);

            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR)
            {
            }
            reaped_ = true;
        }

        std::string ChildProcess::output_tail() const
        {
            std::ifstream log(log_path_, std::ios::binary);
            if (!log)
            {
                return "";
            }

            log.seekg(0, std::ios::end);
            std::streamoff size = log.tellg();
            std::streamoff start = size > OUTPUT_TAIL_BYTES ? size - OUTPUT_TAIL_BYTES : 0;
            log.seekg(start);

            std::string tail(static_cast<size_t>(size - start), '\0');
            log.read(&tail[0], static_cast<std::streamsize>(tail.size()));
            return tail;
        }

        SystemProcessLauncher::SystemProcessLauncher()
            : logger_(core::get_logger("ProcessLauncher"))
        {
        }

        std::unique_ptr<ProcessHandle> SystemProcessLauncher::launch(const std::vector<std::string> &argv,
                                                                     const std::filesystem::path &log_path)
        {
            if (argv.empty())
            {
                throw core::WilabError(core::ErrorCode::DaemonStartFailed, "empty command");
            }

            int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (log_fd < 0)
            {
                throw core::WilabError(core::ErrorCode::DaemonStartFailed,
                                       "cannot open " + log_path.string() + ": " + std::strerror(errno));
            }

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                int null_fd = open("/dev/null", O_RDONLY);
                if (null_fd >= 0)
                {
                    dup2(null_fd, STDIN_FILENO);
                }
                dup2(log_fd, STDOUT_FILENO);
                dup2(log_fd, STDERR_FILENO);

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                dprintf(STDERR_FILENO, "exec %s failed: %s\n", args[0], std::strerror(errno));
                _exit(127);
            }

            int fork_errno = errno;
            close(log_fd);

            if (pid < 0)
            {
                throw core::WilabError(core::ErrorCode::DaemonStartFailed,
                                       "fork failed for " + argv[0] + ": " + std::strerror(fork_errno));
            }

            logger_->info("Process started",
                          core::LogContext()
                              .add("cmd", core::join_argv(argv))
                              .add("pid", pid)
                              .add("log", log_path.string()));

            return std::make_unique<ChildProcess>(pid, log_path);
        }

    } // namespace infrastructure
} // namespace wilab
