#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/codex_errors.hpp"
#include "process/fake_process_runner.hpp"
#ifndef _WIN32
#include "process/posix_process_runner.hpp"
#endif

namespace {

using usbide::core::errors::ErrorCategory;
using usbide::core::errors::get_error;
using usbide::core::errors::get_value;
using usbide::core::errors::is_error;
using usbide::process::FakeProcessRunner;
using usbide::process::FakeScript;
using usbide::process::ProcessEvent;
using usbide::process::ProcessHandle;
using usbide::process::SpawnRequest;
using usbide::protocol::HostPlatform;
using usbide::protocol::InvocationStrategy;
using usbide::protocol::StreamOrigin;
using usbide::protocol::ToolCandidate;

struct Collected {
    std::vector<usbide::protocol::RawLine> lines;
    int exit_code = -1;
    bool cancelled = false;
    bool exited = false;
};

Collected collect(ProcessHandle& handle) {
    Collected out;
    // Bounded so a stuck child fails the test instead of hanging it
    for (int i = 0; i < 200 && !out.exited; ++i) {
        auto event = handle.next_event(std::chrono::milliseconds(100));
        if (!event.has_value()) {
            continue;
        }
        if (event->kind == ProcessEvent::Kind::Exit) {
            out.exited = true;
            out.exit_code = event->exit_code;
            out.cancelled = event->cancelled;
        } else {
            out.lines.push_back(event->line);
        }
    }
    return out;
}

SpawnRequest shell_request(const std::string& script) {
    SpawnRequest request;
    request.candidate.executable = "/bin/sh";
    request.candidate.strategy = InvocationStrategy::DirectExec;
    request.argv = {"-c", script};
    request.environment = {{"PATH", "/usr/bin:/bin"}, {"GREETING", "hello"}};
    request.working_directory = std::filesystem::current_path();
    request.cancel_token = std::make_shared<std::atomic_bool>(false);
    return request;
}

TEST(SpawnArgvTest, DirectExecRunsEntrypointWithRuntime) {
    ToolCandidate candidate;
    candidate.executable = "/usb/tools/node/bin/node";
    candidate.entrypoint = std::filesystem::path("/usb/.usbide/codex/bin/codex.js");

    const auto argv = usbide::process::spawn_argv(candidate, {"exec", "--json", "hi"},
                                                  HostPlatform::Posix);
    const std::vector<std::string> expected = {"/usb/tools/node/bin/node",
                                               "/usb/.usbide/codex/bin/codex.js", "exec",
                                               "--json", "hi"};
    EXPECT_EQ(argv, expected);
}

TEST(SpawnArgvTest, CmdWrapperRunsThroughInterpreter) {
    ToolCandidate candidate;
    candidate.executable = "C:\\npm\\codex.cmd";
    candidate.interpreter = std::string("C:\\Windows\\system32\\cmd.exe");
    candidate.strategy = InvocationStrategy::WindowsCmdWrapper;

    const auto argv = usbide::process::spawn_argv(candidate, {"login"}, HostPlatform::Windows);
    const std::vector<std::string> expected = {"C:\\Windows\\system32\\cmd.exe", "/d", "/s",
                                               "/c", "C:\\npm\\codex.cmd", "login"};
    EXPECT_EQ(argv, expected);
}

TEST(SpawnArgvTest, PowerShellWrapperBypassesPolicyForThisProcessOnly) {
    ToolCandidate candidate;
    candidate.executable = "C:\\npm\\codex.ps1";
    candidate.strategy = InvocationStrategy::WindowsPowerShellWrapper;

    const auto argv = usbide::process::spawn_argv(candidate, {"login", "status"},
                                                  HostPlatform::Windows);
    const std::vector<std::string> expected = {"powershell", "-NoProfile", "-ExecutionPolicy",
                                               "Bypass", "-File", "C:\\npm\\codex.ps1",
                                               "login", "status"};
    EXPECT_EQ(argv, expected);
}

TEST(SpawnArgvTest, StripsLongPathPrefixesOnWindows) {
    EXPECT_EQ(usbide::process::path_for_command_line("\\\\?\\D:\\usb\\node.exe",
                                                     HostPlatform::Windows),
              "D:\\usb\\node.exe");
    EXPECT_EQ(usbide::process::path_for_command_line("\\\\?\\UNC\\server\\share\\node.exe",
                                                     HostPlatform::Windows),
              "\\\\server\\share\\node.exe");
    EXPECT_EQ(usbide::process::path_for_command_line("/usr/bin/node", HostPlatform::Posix),
              "/usr/bin/node");
}

TEST(ProcessRunnerTest, EmptyArgvSpawnsNothing) {
    FakeProcessRunner runner;
    SpawnRequest request;
    request.candidate.executable = "/bin/true";

    auto result = runner.run(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Argv);
    EXPECT_EQ(get_error(result).code, "empty_argv");
    EXPECT_TRUE(runner.requests().empty());
}

TEST(FakeProcessRunnerTest, ReplaysScriptsInOrder) {
    FakeProcessRunner runner;
    FakeScript first;
    first.lines = {{StreamOrigin::Stdout, "one"}, {StreamOrigin::Stderr, "two"}};
    first.exit_code = 3;
    runner.enqueue(first);

    SpawnRequest request;
    request.argv = {"exec", "--json", "hi"};

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    const auto collected = collect(*get_value(result));
    ASSERT_TRUE(collected.exited);
    EXPECT_EQ(collected.exit_code, 3);
    ASSERT_EQ(collected.lines.size(), 2u);
    EXPECT_EQ(collected.lines[0].text, "one");
    EXPECT_EQ(collected.lines[0].sequence, 0u);
    EXPECT_EQ(collected.lines[1].origin, StreamOrigin::Stderr);
    EXPECT_EQ(collected.lines[1].sequence, 1u);

    // Nothing queued: clean exit without output
    auto second = runner.run(request);
    ASSERT_FALSE(is_error(second));
    const auto empty = collect(*get_value(second));
    EXPECT_EQ(empty.exit_code, 0);
    EXPECT_TRUE(empty.lines.empty());
    EXPECT_EQ(runner.requests().size(), 2u);
}

TEST(FakeProcessRunnerTest, ReturnsScriptedSpawnError) {
    FakeProcessRunner runner;
    FakeScript script;
    script.spawn_error = usbide::core::errors::CodexError{
        ErrorCategory::Spawn, "Cannot start node", "spawn_failed"};
    runner.enqueue(script);

    SpawnRequest request;
    request.argv = {"login"};
    auto result = runner.run(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "spawn_failed");
    EXPECT_EQ(runner.pending_scripts(), 0u);
}

#ifndef _WIN32

using usbide::process::PosixProcessRunner;

TEST(PosixProcessRunnerTest, StreamsStdoutStderrAndExitCode) {
    PosixProcessRunner runner;
    auto result = runner.run(
        shell_request("echo first; echo \"$GREETING\" 1>&2; printf 'tail'; exit 7"));
    ASSERT_FALSE(is_error(result));

    const auto collected = collect(*get_value(result));
    ASSERT_TRUE(collected.exited);
    EXPECT_EQ(collected.exit_code, 7);
    EXPECT_FALSE(collected.cancelled);

    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    for (const auto& line : collected.lines) {
        (line.origin == StreamOrigin::Stdout ? stdout_lines : stderr_lines).push_back(line.text);
    }
    const std::vector<std::string> expected_stdout = {"first", "tail"};
    EXPECT_EQ(stdout_lines, expected_stdout);
    EXPECT_EQ(stderr_lines, std::vector<std::string>{"hello"});
}

TEST(PosixProcessRunnerTest, SequenceNumbersIncrease) {
    PosixProcessRunner runner;
    auto result = runner.run(shell_request("echo a; echo b; echo c"));
    ASSERT_FALSE(is_error(result));

    const auto collected = collect(*get_value(result));
    ASSERT_EQ(collected.lines.size(), 3u);
    for (std::size_t i = 1; i < collected.lines.size(); ++i) {
        EXPECT_LT(collected.lines[i - 1].sequence, collected.lines[i].sequence);
    }
}

TEST(PosixProcessRunnerTest, StripsCarriageReturns) {
    PosixProcessRunner runner;
    auto result = runner.run(shell_request("printf 'windows\\r\\n'"));
    ASSERT_FALSE(is_error(result));

    const auto collected = collect(*get_value(result));
    ASSERT_EQ(collected.lines.size(), 1u);
    EXPECT_EQ(collected.lines[0].text, "windows");
}

TEST(PosixProcessRunnerTest, MissingExecutableIsSpawnError) {
    PosixProcessRunner runner;
    SpawnRequest request = shell_request("true");
    request.candidate.executable =
        std::filesystem::current_path() / "__definitely_missing_codex__";

    auto result = runner.run(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Spawn);
    EXPECT_EQ(get_error(result).code, "spawn_failed");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(PosixProcessRunnerTest, CancelStopsRunningChild) {
    PosixProcessRunner runner;
    SpawnRequest request = shell_request("echo started; sleep 30");

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    auto& handle = *get_value(result);

    auto first = handle.next_event(std::chrono::milliseconds(5000));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->line.text, "started");

    const auto started = std::chrono::steady_clock::now();
    handle.cancel();
    EXPECT_TRUE(request.cancel_token->load());

    const auto collected = collect(handle);
    ASSERT_TRUE(collected.exited);
    EXPECT_TRUE(collected.cancelled);
    EXPECT_EQ(collected.exit_code, 128 + 9);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_TRUE(handle.finished());
}

TEST(PosixProcessRunnerTest, CancelAfterLeaderExitClosesStream) {
    PosixProcessRunner runner;
    // The shell exits at once; the background sleep keeps both pipes open
    SpawnRequest request = shell_request("sleep 6 & echo started");

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    auto& handle = *get_value(result);

    auto first = handle.next_event(std::chrono::milliseconds(5000));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->line.text, "started");
    EXPECT_FALSE(handle.next_event(std::chrono::milliseconds(300)).has_value());

    const auto cancelled_at = std::chrono::steady_clock::now();
    handle.cancel();

    const auto collected = collect(handle);
    ASSERT_TRUE(collected.exited);
    EXPECT_TRUE(collected.cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - cancelled_at, std::chrono::seconds(3));
    EXPECT_TRUE(handle.finished());
}

TEST(PosixProcessRunnerTest, PassesOnlyTheGivenEnvironment) {
    PosixProcessRunner runner;
    SpawnRequest request = shell_request("echo \"${HOME:-unset}\"");

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    const auto collected = collect(*get_value(result));
    ASSERT_EQ(collected.lines.size(), 1u);
    EXPECT_EQ(collected.lines[0].text, "unset");
}

#endif

}  // namespace
