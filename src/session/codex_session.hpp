#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "command/command_builder.hpp"
#include "core/config/settings.hpp"
#include "core/errors/codex_errors.hpp"
#include "diagnostics/diagnostics_classifier.hpp"
#include "env/environment_builder.hpp"
#include "incident/incident_logger.hpp"
#include "process/process_runner.hpp"
#include "protocol/command_spec.hpp"
#include "protocol/event_contract.hpp"
#include "resolve/tool_resolver.hpp"
#include "workspace/workspace_layout.hpp"

namespace usbide::session {

struct InvocationOutcome {
    protocol::Operation operation = protocol::Operation::Exec;
    int exit_code = -1;
    bool cancelled = false;
    std::vector<protocol::DisplayEvent> transcript;  // exec only
    std::vector<std::string> output_lines;           // plain lines, translated where known
    std::size_t skipped_lines = 0;
    diagnostics::Diagnostic diagnostic;

    bool success() const { return diagnostic.success(); }
};

// Live delivery while an invocation runs; both callbacks are optional.
struct SessionObserver {
    std::function<void(const protocol::DisplayEvent&)> on_event;
    std::function<void(const std::string&)> on_line;
};

// Runs codex operations for one workspace: resolve, build argv and
// environment, spawn, parse, classify. One invocation at a time.
class CodexSession {
public:
    CodexSession(workspace::WorkspaceLayout layout, protocol::AmbientEnvironment ambient,
                 core::config::Settings settings, process::ProcessRunner& runner,
                 incident::IncidentSink* incidents = nullptr,
                 protocol::HostPlatform platform = protocol::current_platform());

    core::errors::Result<InvocationOutcome> login(const SessionObserver& observer = {});
    core::errors::Result<InvocationOutcome> status(const SessionObserver& observer = {});

    // `login status` first; exec only runs when that succeeds.
    core::errors::Result<InvocationOutcome> exec(const std::string& prompt,
                                                 const SessionObserver& observer = {});

    // npm install into the workspace prefix, then re-resolve.
    core::errors::Result<InvocationOutcome> install(const SessionObserver& observer = {});

    // Safe from any thread; no-op when idle.
    void cancel();
    bool busy() const { return busy_.load(); }

    const core::config::Settings& settings() const { return settings_; }
    const resolve::ToolResolver& resolver() const { return resolver_; }

private:
    core::errors::Result<protocol::ToolCandidate> resolve_codex(const SessionObserver& observer);
    core::errors::Result<InvocationOutcome> run_install(const SessionObserver& observer);

    core::errors::Result<InvocationOutcome> invoke(protocol::Operation operation,
                                                   const protocol::ToolCandidate& candidate,
                                                   const std::vector<std::string>& argv,
                                                   const SessionObserver& observer,
                                                   const std::string* prompt = nullptr);

    std::shared_ptr<std::atomic_bool> begin_invocation();
    std::shared_ptr<std::atomic_bool> active_token() const;
    void end_invocation();

    core::errors::CodexError report(const std::string& context,
                                    core::errors::CodexError error) const;
    void report(const std::string& context, const InvocationOutcome& outcome) const;

    workspace::WorkspaceLayout layout_;
    protocol::AmbientEnvironment ambient_;
    core::config::Settings settings_;
    process::ProcessRunner& runner_;
    incident::IncidentSink* incidents_;

    resolve::ToolResolver resolver_;
    env::EnvironmentBuilder env_builder_;
    command::CommandBuilder command_builder_;

    bool install_attempted_ = false;
    std::atomic_bool busy_{false};
    mutable std::mutex token_mutex_;
    std::shared_ptr<std::atomic_bool> active_token_;
};

}  // namespace usbide::session
