#include "runbox/core/command_executor.hpp"

#include "fake_provider.hpp"
#include "runbox/core/errors.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using runbox::core::CommandExecutor;
using runbox::core::ExecutionRequest;
using runbox::core::ProviderStatusError;
using runbox::core::RemoteCommandFailure;
using runbox::core::SandboxHandle;
using runbox::core::SandboxStatus;
using runbox::testing::FakeProvider;
using ::testing::ElementsAre;

class CommandExecutorTest : public ::testing::Test {
protected:
    FakeProvider provider;
    CommandExecutor executor{provider};
    SandboxHandle handle{"dbx_fake", SandboxStatus::RUNNING, "agent-shell"};
};

TEST_F(CommandExecutorTest, ReturnsProviderResultVerbatim) {
    provider.exec_handler = [](const std::string&) {
        return runbox::provider::ExecutionResult{"line one\nline two\n", 137};
    };

    auto result = executor.Execute(handle, "sleep 100");

    EXPECT_EQ(result.stdout_output, "line one\nline two\n");
    EXPECT_EQ(result.exit_code, 137);
}

TEST_F(CommandExecutorTest, UsesHandleShellSession) {
    executor.Execute(handle, "echo hi");
    EXPECT_THAT(provider.shells, ElementsAre("agent-shell"));
}

TEST_F(CommandExecutorTest, RequestCanOverrideSessionAndDirectory) {
    ExecutionRequest request;
    request.command = "make";
    request.working_directory = "/workspace/project";
    request.session = "build";

    executor.Execute(handle, request);

    EXPECT_THAT(provider.Commands(), ElementsAre("cd '/workspace/project' && make"));
    EXPECT_THAT(provider.shells, ElementsAre("build"));
}

TEST_F(CommandExecutorTest, ProviderErrorsPropagate) {
    provider.fail_exec_times = 1;
    EXPECT_THROW(executor.Execute(handle, "ls"), ProviderStatusError);
}

TEST_F(CommandExecutorTest, CheckedCommandEscalatesNonzeroExit) {
    provider.exec_handler = [](const std::string&) {
        return runbox::provider::ExecutionResult{"denied\n", 2};
    };

    try {
        executor.ExecuteChecked(handle, "chown root /x");
        FAIL() << "expected RemoteCommandFailure";
    } catch (const RemoteCommandFailure& e) {
        EXPECT_EQ(e.ExitCode(), 2);
        EXPECT_EQ(e.Command(), "chown root /x");
    }
}

}  // namespace
