#ifndef WILAB_TESTS_MOCKS_FAKE_PROCESS_HPP
#define WILAB_TESTS_MOCKS_FAKE_PROCESS_HPP

#include "wilab/infrastructure/process.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wilab
{
    namespace tests
    {

        /**
         * Observable state of a fake daemon, shared with the test after the handle is handed out
         */
        struct FakeProcessState
        {
            bool running = true;
            int terminate_calls = 0;
            std::string output = "";
        };

        class FakeProcess : public infrastructure::ProcessHandle
        {
        public:
            FakeProcess(pid_t pid, std::shared_ptr<FakeProcessState> state) : pid_(pid), state_(std::move(state)) {}

            pid_t pid() const override { return pid_; }
            bool is_running() override { return state_->running; }

            void terminate(std::chrono::milliseconds) override
            {
                ++state_->terminate_calls;
                state_->running = false;
            }

            std::string output_tail() const override { return state_->output; }

        private:
            pid_t pid_;
            std::shared_ptr<FakeProcessState> state_;
        };

        /**
         * Records launches and hands out FakeProcess handles
         */
        class FakeProcessLauncher : public infrastructure::ProcessLauncher
        {
        public:
            std::unique_ptr<infrastructure::ProcessHandle> launch(const std::vector<std::string> &argv,
                                                                  const std::filesystem::path &log_path) override
            {
                launches.push_back(argv);
                log_paths.push_back(log_path);

                auto state = std::make_shared<FakeProcessState>();
                state->running = start_running;
                state->output = output;
                states.push_back(state);

                return std::make_unique<FakeProcess>(1000 + static_cast<pid_t>(launches.size()), state);
            }

            bool start_running = true;
            std::string output;

            std::vector<std::vector<std::string>> launches;
            std::vector<std::filesystem::path> log_paths;
            std::vector<std::shared_ptr<FakeProcessState>> states;
        };

    } // namespace tests
} // namespace wilab

#endif // WILAB_TESTS_MOCKS_FAKE_PROCESS_HPP
