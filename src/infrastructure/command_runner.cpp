/**
 * External command execution
 * Spawns a child with captured stdout/stderr and enforces a wall-clock timeout
 */

#include "wilab/infrastructure/command_runner.hpp"
#include "wilab/core/errors.hpp"
#include "wilab/core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
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
            constexpr int EXIT_TIMED_OUT = 124;
            constexpr int EXIT_NOT_FOUND = 127;
            constexpr std::chrono::milliseconds WAIT_POLL_INTERVAL(10);

            void close_fd(int &fd)
            {
                if (fd >= 0)
                {
                    close(fd);
                    fd = -1;
                }
            }
        }

        SystemCommandRunner::SystemCommandRunner(std::chrono::milliseconds timeout)
            : timeout_(timeout), logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult SystemCommandRunner::run(const std::vector<std::string> &argv, bool check)
        {
            if (argv.empty())
            {
                throw core::CommandError(argv, -1, "empty command");
            }

            logger_->debug("Running command", core::LogContext().add("cmd", core::join_argv(argv)));

            int out_pipe[2];
            int err_pipe[2];
            if (pipe2(out_pipe, O_CLOEXEC) != 0)
            {
                throw core::CommandError(argv, -1, std::string("pipe failed: ") + std::strerror(errno));
            }
            if (pipe2(err_pipe, O_CLOEXEC) != 0)
            {
                int err = errno;
                close(out_pipe[0]);
                close(out_pipe[1]);
                throw core::CommandError(argv, -1, std::string("pipe failed: ") + std::strerror(err));
            }

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                dup2(out_pipe[1], STDOUT_FILENO);
                dup2(err_pipe[1], STDERR_FILENO);

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                _exit(EXIT_NOT_FOUND);
            }

            close(out_pipe[1]);
            close(err_pipe[1]);

            if (pid < 0)
            {
                int err = errno;
                close(out_pipe[0]);
                close(err_pipe[0]);
                throw core::CommandError(argv, -1, std::string("fork failed: ") + std::strerror(err));
            }

            CommandResult result;
            int fds[2] = {out_pipe[0], err_pipe[0]};
            std::string *sinks[2] = {&result.stdout_output, &result.stderr_output};
            bool timed_out = false;

            const auto deadline = std::chrono::steady_clock::now() + timeout_;
            while (fds[0] >= 0 || fds[1] >= 0)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                {
                    timed_out = true;
                    break;
                }

                pollfd pfds[2];
                nfds_t count = 0;
                int index_of[2];
                for (int i = 0; i < 2; ++i)
                {
                    if (fds[i] >= 0)
                    {
                        pfds[count] = {fds[i], POLLIN, 0};
                        index_of[count] = i;
                        ++count;
                    }
                }

                int ready = poll(pfds, count, static_cast<int>(remaining.count()));
                if (ready < 0)
                {
                    if (errno == EINTR)
                        continue;
                    break;
                }

                for (nfds_t p = 0; p < count; ++p)
                {
                    if (!(pfds[p].revents & (POLLIN | POLLHUP | POLLERR)))
                        continue;

                    int i = index_of[p];
                    char buffer[4096];
                    ssize_t n = read(fds[i], buffer, sizeof(buffer));
                    if (n > 0)
                    {
                        sinks[i]->append(buffer, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR)
                    {
                        close_fd(fds[i]);
                    }
                }
            }

            close_fd(fds[0]);
            close_fd(fds[1]);

            // The child may close its output and keep running, so reaping shares the deadline
            int status = 0;
            bool reaped = false;
            int wait_error = 0;
            while (!timed_out && !reaped && wait_error == 0)
            {
                pid_t done = waitpid(pid, &status, WNOHANG);
                if (done == pid)
                {
                    reaped = true;
                }
                else if (done < 0 && errno != EINTR)
                {
                    wait_error = errno;
                }
                else if (std::chrono::steady_clock::now() >= deadline)
                {
                    timed_out = true;
                }
                else if (done == 0)
                {
                    std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
                }
            }

            if (!reaped && wait_error == 0)
            {
                kill(pid, SIGKILL);
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                {
                }
            }

            if (wait_error != 0)
            {
                result.exit_code = -1;
                result.stderr_output = std::string("waitpid failed: ") + std::strerror(wait_error);
            }
            else if (timed_out)
            {
                result.exit_code = EXIT_TIMED_OUT;
                result.stderr_output = "timed out after " + std::to_string(timeout_.count()) + " ms";
            }
            else if (WIFEXITED(status))
            {
                result.exit_code = WEXITSTATUS(status);
            }
            else
            {
                result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
            }

            if (!result.ok())
            {
                logger_->debug("Command failed",
                               core::LogContext()
                                   .add("cmd", core::join_argv(argv))
                                   .add("exit_code", result.exit_code));
                if (check || timed_out)
                {
                    throw core::CommandError(argv, result.exit_code, result.stderr_output);
                }
            }

            return result;
        }

    } // namespace infrastructure
} // namespace wilab
