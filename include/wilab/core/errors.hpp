#ifndef WILAB_CORE_ERRORS_HPP
#define WILAB_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace wilab
{
    namespace core
    {

        /**
         * Stable failure conditions reported by the lifecycle operations
         */
        enum class ErrorCode
        {
            ValidationFailed,
            UnknownNetwork,
            AlreadyActive,
            Busy,
            NotActive,
            DaemonStartFailed,
            RuleApplyFailed,
            PartialTeardown,
            CommandFailed
        };

        const char *error_code_name(ErrorCode code);

        /**
         * Outcome of one teardown step
         */
        struct TeardownStep
        {
            std::string name;
            bool ok = true;
            std::string error;
        };

        /**
         * Typed failure carrying a condition code and a human readable detail.
         * PartialTeardown failures also carry the per-step record.
         */
        class WilabError : public std::runtime_error
        {
        public:
            WilabError(ErrorCode code, const std::string &detail);
            WilabError(const std::string &detail, std::vector<TeardownStep> steps);

            ErrorCode code() const { return code_; }
            const std::string &detail() const { return detail_; }
            const std::vector<TeardownStep> &steps() const { return steps_; }

        private:
            ErrorCode code_;
            std::string detail_;
            std::vector<TeardownStep> steps_;
        };

        /**
         * External command exited non-zero, timed out or could not be spawned
         */
        class CommandError : public WilabError
        {
        public:
            CommandError(std::vector<std::string> argv, int exit_code, const std::string &stderr_output);

            const std::vector<std::string> &argv() const { return argv_; }
            int exit_code() const { return exit_code_; }
            const std::string &stderr_output() const { return stderr_output_; }

        private:
            std::vector<std::string> argv_;
            int exit_code_;
            std::string stderr_output_;
        };

        std::string join_argv(const std::vector<std::string> &argv);

    } // namespace core
} // namespace wilab

#endif // WILAB_CORE_ERRORS_HPP
