#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

#include "wilab/core/errors.hpp"
#include "wilab/infrastructure/command_runner.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

namespace wilab::infrastructure::tests {

class SystemCommandRunnerTest : public Test {
protected:
    SystemCommandRunner mRunner {std::chrono::milliseconds(5000)};
    SystemCommandRunner mShortRunner {std::chrono::milliseconds(300)};
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(SystemCommandRunnerTest, CapturesBothStreams)
{
    auto result = mRunner.run({"sh", "-c", "echo out; echo err >&2"});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST_F(SystemCommandRunnerTest, ReportsExitCode)
{
    auto result = mRunner.run({"sh", "-c", "echo busy >&2; exit 3"}, false);
    EXPECT_EQ(result.exit_code, 3);

    try {
        mRunner.run({"sh", "-c", "echo busy >&2; exit 3"});
        FAIL() << "checked run should throw";
    } catch (const core::CommandError& e) {
        EXPECT_EQ(e.exit_code(), 3);
        EXPECT_EQ(e.stderr_output(), "busy\n");
    }
}

TEST_F(SystemCommandRunnerTest, MissingProgram)
{
    auto result = mRunner.run({"wilab-no-such-program"}, false);

    EXPECT_EQ(result.exit_code, 127);
}

TEST_F(SystemCommandRunnerTest, KillsChildOnTimeout)
{
    const auto begin = std::chrono::steady_clock::now();

    try {
        mShortRunner.run({"sleep", "10"}, false);
        FAIL() << "timeout should throw even without check";
    } catch (const core::CommandError& e) {
        EXPECT_EQ(e.exit_code(), 124);
    }

    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST_F(SystemCommandRunnerTest, KillsChildThatClosedItsOutput)
{
    const auto begin = std::chrono::steady_clock::now();

    try {
        mShortRunner.run({"sh", "-c", "exec >/dev/null 2>&1; sleep 10"}, false);
        FAIL() << "timeout should throw even without check";
    } catch (const core::CommandError& e) {
        EXPECT_EQ(e.exit_code(), 124);
    }

    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

} // namespace wilab::infrastructure::tests
