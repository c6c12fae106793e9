#include "wilab/core/errors.hpp"

#include <sstream>

namespace wilab
{
    namespace core
    {

        const char *error_code_name(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::ValidationFailed:
                return "ValidationFailed";
            case ErrorCode::UnknownNetwork:
                return "UnknownNetwork";
            case ErrorCode::AlreadyActive:
                return "AlreadyActive";
            case ErrorCode::Busy:
                return "Busy";
            case ErrorCode::NotActive:
                return "NotActive";
            case ErrorCode::DaemonStartFailed:
                return "DaemonStartFailed";
            case ErrorCode::RuleApplyFailed:
                return "RuleApplyFailed";
            case ErrorCode::PartialTeardown:
                return "PartialTeardown";
            case ErrorCode::CommandFailed:
                return "CommandFailed";
            }
            return "Unknown";
        }

        WilabError::WilabError(ErrorCode code, const std::string &detail)
            : std::runtime_error(std::string(error_code_name(code)) + ": " + detail),
              code_(code), detail_(detail)
        {
        }

        WilabError::WilabError(const std::string &detail, std::vector<TeardownStep> steps)
            : std::runtime_error(std::string(error_code_name(ErrorCode::PartialTeardown)) + ": " + detail),
              code_(ErrorCode::PartialTeardown), detail_(detail), steps_(std::move(steps))
        {
        }

        std::string join_argv(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                cmd << argv[i];
            }
            return cmd.str();
        }

        CommandError::CommandError(std::vector<std::string> argv, int exit_code, const std::string &stderr_output)
            : WilabError(ErrorCode::CommandFailed,
                         "'" + join_argv(argv) + "' exited with " + std::to_string(exit_code) +
                             (stderr_output.empty() ? "" : ": " + stderr_output)),
              argv_(std::move(argv)), exit_code_(exit_code), stderr_output_(stderr_output)
        {
        }

    } // namespace core
} // namespace wilab
