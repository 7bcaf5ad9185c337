#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/codex_errors.hpp"
#include "process/fake_process_runner.hpp"
#include "session/codex_session.hpp"

namespace {

using usbide::core::config::Settings;
using usbide::core::errors::ErrorCategory;
using usbide::core::errors::get_error;
using usbide::core::errors::get_value;
using usbide::core::errors::is_error;
using usbide::diagnostics::DiagnosticKind;
using usbide::incident::Incident;
using usbide::incident::IncidentSink;
using usbide::incident::Severity;
using usbide::process::FakeProcessRunner;
using usbide::process::FakeScript;
using usbide::protocol::AmbientEnvironment;
using usbide::protocol::DisplayKind;
using usbide::protocol::HostPlatform;
using usbide::protocol::Operation;
using usbide::protocol::StreamOrigin;
using usbide::session::CodexSession;
using usbide::session::SessionObserver;
using usbide::workspace::WorkspaceLayout;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_codex_session_" + usbide::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void create_portable_node(const WorkspaceLayout& layout) {
    write_file(layout.node_dir() / "bin" / "node", "");
    write_file(layout.node_dir() / "lib" / "node_modules" / "npm" / "bin" / "npm-cli.js", "");
}

void create_portable_codex(const WorkspaceLayout& layout) {
    create_portable_node(layout);
    write_file(layout.codex_package_json(), R"({"bin": {"codex": "bin/codex.js"}})");
    write_file(layout.codex_package_json().parent_path() / "bin" / "codex.js", "");
}

class MemorySink : public IncidentSink {
public:
    void append(const Incident& incident) noexcept override { incidents.push_back(incident); }

    std::vector<Incident> incidents;
};

FakeScript logged_in() {
    FakeScript script;
    script.lines = {{StreamOrigin::Stderr, "Logged in using ChatGPT"}};
    return script;
}

const AmbientEnvironment kAmbient = {{"PATH", "/nonexistent_usbide_bin"},
                                     {"OPENAI_API_KEY", "sk-should-not-leak"}};

TEST(CodexSessionTest, ExecProducesTranscript) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    runner.enqueue(logged_in());
    FakeScript answer;
    answer.lines = {
        {StreamOrigin::Stdout, R"({"type":"thread.started","thread_id":"t1"})"},
        {StreamOrigin::Stdout,
         R"({"type":"item.completed","item":{"type":"command_execution","command":"ls"}})"},
        {StreamOrigin::Stdout,
         R"({"type":"item.completed","item":{"type":"agent_message","text":"Two files."}})"},
        {StreamOrigin::Stderr, "Reading prompt from stdin..."},
        {StreamOrigin::Stdout, R"({"type":"turn.completed"})"},
    };
    runner.enqueue(answer);

    std::vector<DisplayKind> live;
    SessionObserver observer;
    observer.on_event = [&](const usbide::protocol::DisplayEvent& event) {
        live.push_back(usbide::protocol::kind_of(event));
    };

    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);
    auto result = session.exec("list the files", observer);
    ASSERT_FALSE(is_error(result));

    const auto& outcome = get_value(result);
    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.operation, Operation::Exec);
    EXPECT_EQ(outcome.exit_code, 0);
    ASSERT_EQ(outcome.transcript.size(), 3u);
    EXPECT_EQ(usbide::protocol::text_of(outcome.transcript[0]), "list the files");
    EXPECT_EQ(usbide::protocol::text_of(outcome.transcript[1]), "command: ls");
    EXPECT_EQ(usbide::protocol::text_of(outcome.transcript[2]), "Two files.");
    const std::vector<DisplayKind> expected_live = {DisplayKind::User, DisplayKind::Action,
                                                    DisplayKind::Assistant};
    EXPECT_EQ(live, expected_live);
    EXPECT_EQ(outcome.output_lines,
              std::vector<std::string>{"Reading prompt from stdin..."});
    EXPECT_FALSE(session.busy());

    const auto requests = runner.requests();
    ASSERT_EQ(requests.size(), 2u);
    const std::vector<std::string> status_argv = {"login", "status"};
    EXPECT_EQ(requests[0].argv, status_argv);
    EXPECT_EQ(requests[1].argv.front(), "exec");
    EXPECT_EQ(requests[1].argv.back(), "list the files");
    EXPECT_EQ(requests[1].working_directory, layout.root());
    EXPECT_EQ(requests[1].environment.at("CODEX_HOME"), layout.codex_home().string());
    EXPECT_EQ(requests[1].environment.count("OPENAI_API_KEY"), 0u);
    EXPECT_EQ(requests[1].candidate.executable, layout.node_dir() / "bin" / "node");
}

TEST(CodexSessionTest, ExecStopsWhenNotLoggedIn) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    FakeScript not_logged_in;
    not_logged_in.lines = {{StreamOrigin::Stderr, "Not logged in"}};
    not_logged_in.exit_code = 1;
    runner.enqueue(not_logged_in);

    MemorySink sink;
    CodexSession session(layout, kAmbient, Settings{}, runner, &sink, HostPlatform::Posix);
    auto result = session.exec("hello");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Auth);
    EXPECT_EQ(get_error(result).code, "not_authenticated");
    EXPECT_NE(get_error(result).hint.find("USBIDE_CODEX_DEVICE_AUTH"), std::string::npos);

    EXPECT_EQ(runner.requests().size(), 1u);
    ASSERT_FALSE(sink.incidents.empty());
    EXPECT_EQ(sink.incidents.back().context, "exec");
    EXPECT_EQ(sink.incidents.back().severity, Severity::Error);
}

TEST(CodexSessionTest, EmptyPromptSpawnsNothing) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);
    auto result = session.exec("   ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_prompt");
    EXPECT_TRUE(runner.requests().empty());
}

TEST(CodexSessionTest, ClassifiesTransportErrorFromStream) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    runner.enqueue(logged_in());
    FakeScript unauthorized;
    unauthorized.lines = {
        {StreamOrigin::Stdout, R"({"type":"error","message":"unexpected status 401 Unauthorized"})"}};
    unauthorized.exit_code = 1;
    runner.enqueue(unauthorized);

    MemorySink sink;
    CodexSession session(layout, kAmbient, Settings{}, runner, &sink, HostPlatform::Posix);
    auto result = session.exec("hello");
    ASSERT_FALSE(is_error(result));

    const auto& outcome = get_value(result);
    EXPECT_FALSE(outcome.success());
    EXPECT_EQ(outcome.diagnostic.kind, DiagnosticKind::Unauthenticated);
    EXPECT_EQ(outcome.diagnostic.status, 401);
    ASSERT_EQ(sink.incidents.size(), 1u);
    EXPECT_EQ(sink.incidents[0].context, "exec");
}

TEST(CodexSessionTest, RecoveredStreamErrorWithCleanExitSucceeds) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    runner.enqueue(logged_in());
    FakeScript retried;
    retried.lines = {
        {StreamOrigin::Stdout,
         R"({"type":"error","message":"stream error: unexpected status 503 Service Unavailable; retrying 1/5"})"},
        {StreamOrigin::Stderr, "status: indexed 250 files"},
        {StreamOrigin::Stdout, R"({"type":"response.output_text.delta","delta":"Done."})"},
        {StreamOrigin::Stdout, R"({"type":"turn.completed"})"},
    };
    runner.enqueue(retried);

    MemorySink sink;
    CodexSession session(layout, kAmbient, Settings{}, runner, &sink, HostPlatform::Posix);
    auto result = session.exec("hello");
    ASSERT_FALSE(is_error(result));

    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.diagnostic.kind, DiagnosticKind::Success);
    EXPECT_TRUE(sink.incidents.empty());
    ASSERT_FALSE(outcome.transcript.empty());
    EXPECT_EQ(usbide::protocol::text_of(outcome.transcript.back()), "Done.");
}

TEST(CodexSessionTest, StatusTranslatesKnownLines) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    runner.enqueue(logged_in());
    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);

    auto result = session.status();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success());
    EXPECT_EQ(get_value(result).output_lines,
              std::vector<std::string>{"Logged in with ChatGPT."});
    EXPECT_TRUE(get_value(result).transcript.empty());
}

TEST(CodexSessionTest, LoginPassesDeviceAuthFlag) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    Settings settings;
    settings.device_auth = true;
    FakeProcessRunner runner;
    CodexSession session(layout, kAmbient, settings, runner, nullptr, HostPlatform::Posix);

    auto result = session.login();
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(runner.requests().size(), 1u);
    const std::vector<std::string> expected = {"login", "--device-auth"};
    EXPECT_EQ(runner.requests()[0].argv, expected);
}

TEST(CodexSessionTest, MissingCodexWithoutAutoInstallIsNotFound) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());

    Settings settings;
    settings.auto_install = false;
    FakeProcessRunner runner;
    MemorySink sink;
    CodexSession session(layout, kAmbient, settings, runner, &sink, HostPlatform::Posix);

    auto result = session.exec("hello");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Resolution);
    EXPECT_EQ(get_error(result).code, "not_found");
    EXPECT_TRUE(runner.requests().empty());
    EXPECT_EQ(sink.incidents.size(), 1u);
}

TEST(CodexSessionTest, InstallRunsNpmIntoWorkspacePrefix) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_node(layout);

    FakeProcessRunner runner;
    FakeScript npm;
    npm.lines = {{StreamOrigin::Stdout, "added 1 package in 2s"}};
    runner.enqueue(npm);

    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);
    auto result = session.install();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success());
    EXPECT_TRUE(std::filesystem::is_directory(layout.codex_prefix()));

    const auto requests = runner.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_TRUE(requests[0].candidate.entrypoint.has_value());
    EXPECT_EQ(requests[0].candidate.entrypoint->filename().string(), "npm-cli.js");
    const std::vector<std::string> expected = {"install",   "--prefix",
                                               layout.codex_prefix().string(),
                                               "--no-audit", "--no-fund", "@openai/codex"};
    EXPECT_EQ(requests[0].argv, expected);
}

TEST(CodexSessionTest, AutoInstallThenExec) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_node(layout);

    FakeProcessRunner runner;
    FakeScript npm;
    npm.lines = {{StreamOrigin::Stdout, "installing"}};
    runner.enqueue(npm);
    runner.enqueue(logged_in());
    FakeScript answer;
    answer.lines = {{StreamOrigin::Stdout,
                     R"({"type":"item.completed","item":{"type":"agent_message","text":"Hi"}})"}};
    runner.enqueue(answer);

    // The package appears while npm "runs"
    bool created = false;
    SessionObserver observer;
    observer.on_line = [&](const std::string& line) {
        if (!created && line == "installing") {
            create_portable_codex(layout);
            created = true;
        }
    };

    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);
    auto result = session.exec("say hi", observer);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success());
    EXPECT_TRUE(created);

    const auto requests = runner.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].argv.front(), "install");
    EXPECT_EQ(requests[2].argv.back(), "say hi");
    EXPECT_EQ(requests[2].candidate.entrypoint->filename().string(), "codex.js");
}

TEST(CodexSessionTest, AutoInstallIsAttemptedOnce) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_node(layout);

    FakeProcessRunner runner;
    FakeScript failing_npm;
    failing_npm.lines = {{StreamOrigin::Stderr, "npm ERR! network"}};
    failing_npm.exit_code = 1;
    runner.enqueue(failing_npm);

    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);
    auto first = session.exec("hello");
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).code, "install_failed");
    EXPECT_EQ(runner.requests().size(), 1u);

    auto second = session.exec("hello");
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "not_found");
    EXPECT_NE(get_error(second).hint.find("already attempted"), std::string::npos);
    EXPECT_EQ(runner.requests().size(), 1u);
}

TEST(CodexSessionTest, CancelStopsRunningExec) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    runner.enqueue(logged_in());
    FakeScript long_running;
    long_running.lines = {
        {StreamOrigin::Stdout, R"({"type":"response.output_text.delta","delta":"Thinking"})"}};
    long_running.wait_for_cancel = true;
    runner.enqueue(long_running);

    MemorySink sink;
    CodexSession session(layout, kAmbient, Settings{}, runner, &sink, HostPlatform::Posix);

    usbide::core::errors::Result<usbide::session::InvocationOutcome> result =
        usbide::core::errors::CodexError{ErrorCategory::Internal, "not run"};
    std::thread worker([&]() { result = session.exec("think hard"); });

    for (int i = 0; i < 500 && runner.requests().size() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(runner.requests().size(), 2u);
    EXPECT_TRUE(session.busy());

    // A second invocation is rejected while one runs
    auto concurrent = session.status();
    ASSERT_TRUE(is_error(concurrent));
    EXPECT_EQ(get_error(concurrent).code, "invocation_in_progress");

    session.cancel();
    worker.join();

    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_EQ(outcome.diagnostic.kind, DiagnosticKind::Cancelled);
    // Buffered text is still delivered
    ASSERT_EQ(outcome.transcript.size(), 2u);
    EXPECT_EQ(usbide::protocol::text_of(outcome.transcript[1]), "Thinking");
    ASSERT_EQ(sink.incidents.size(), 1u);
    EXPECT_EQ(sink.incidents[0].severity, Severity::Info);
    EXPECT_FALSE(session.busy());
}

TEST(CodexSessionTest, CancelWhenIdleIsHarmless) {
    TempWorkspace workspace;
    const WorkspaceLayout layout(workspace.root());
    create_portable_codex(layout);

    FakeProcessRunner runner;
    CodexSession session(layout, kAmbient, Settings{}, runner, nullptr, HostPlatform::Posix);
    session.cancel();

    auto result = session.status();
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).cancelled);
}

}  // namespace
