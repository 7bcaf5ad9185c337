#include "session/codex_session.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "parse/protocol_stream_parser.hpp"

namespace usbide::session {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using protocol::CommandParams;
using protocol::CommandSpec;
using protocol::DisplayEvent;
using protocol::Operation;
using protocol::StreamOrigin;
using protocol::ToolCandidate;

namespace {

constexpr std::chrono::milliseconds kEventPollInterval(100);
constexpr std::size_t kIncidentDetailLines = 20;

// Holds the single-invocation slot for the lifetime of one call.
class BusyGuard {
public:
    explicit BusyGuard(std::atomic_bool& busy) : busy_(busy), acquired_(!busy.exchange(true)) {}
    ~BusyGuard() {
        if (acquired_) {
            busy_.store(false);
        }
    }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic_bool& busy_;
    bool acquired_;
};

CodexError busy_error() {
    return CodexError{ErrorCategory::Internal, "Another Codex invocation is still running.",
                      "invocation_in_progress",
                      "Wait for it to finish or cancel it, then try again."};
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string join_tail(const std::vector<std::string>& lines, const std::size_t count) {
    const std::size_t start = lines.size() > count ? lines.size() - count : 0;
    std::string joined;
    for (std::size_t i = start; i < lines.size(); ++i) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace

CodexSession::CodexSession(workspace::WorkspaceLayout layout,
                           protocol::AmbientEnvironment ambient,
                           core::config::Settings settings, process::ProcessRunner& runner,
                           incident::IncidentSink* incidents,
                           const protocol::HostPlatform platform)
    : layout_(std::move(layout)),
      ambient_(std::move(ambient)),
      settings_(std::move(settings)),
      runner_(runner),
      incidents_(incidents),
      resolver_(platform),
      env_builder_(platform) {}

core::errors::Result<InvocationOutcome> CodexSession::login(const SessionObserver& observer) {
    BusyGuard guard(busy_);
    if (!guard.acquired()) {
        return busy_error();
    }
    begin_invocation();

    auto candidate = resolve_codex(observer);
    if (core::errors::is_error(candidate)) {
        end_invocation();
        return core::errors::get_error(candidate);
    }

    CommandParams params;
    params.device_auth = settings_.device_auth;
    auto spec = command_builder_.build(Operation::Login, params);
    if (core::errors::is_error(spec)) {
        end_invocation();
        return report("login", core::errors::get_error(spec));
    }

    LOG_INFO(std::string("CodexSession: login") +
             (settings_.device_auth ? " (device auth)" : ""));
    auto outcome = invoke(Operation::Login, core::errors::get_value(candidate),
                          core::errors::get_value(spec).argv, observer);
    end_invocation();
    return outcome;
}

core::errors::Result<InvocationOutcome> CodexSession::status(const SessionObserver& observer) {
    BusyGuard guard(busy_);
    if (!guard.acquired()) {
        return busy_error();
    }
    begin_invocation();

    auto candidate = resolver_.resolve(layout_, ambient_);
    if (core::errors::is_error(candidate)) {
        end_invocation();
        return report("status", core::errors::get_error(candidate));
    }

    auto spec = command_builder_.build(Operation::Status, CommandParams{});
    if (core::errors::is_error(spec)) {
        end_invocation();
        return report("status", core::errors::get_error(spec));
    }

    auto outcome = invoke(Operation::Status, core::errors::get_value(candidate),
                          core::errors::get_value(spec).argv, observer);
    end_invocation();
    if (!core::errors::is_error(outcome)) {
        auto& result = core::errors::get_value(outcome);
        if (result.diagnostic.kind == diagnostics::DiagnosticKind::ProcessFailure) {
            result.diagnostic.guidance =
                diagnostics::guidance_for(CodexError{ErrorCategory::Auth, "", ""});
        }
    }
    return outcome;
}

core::errors::Result<InvocationOutcome> CodexSession::exec(const std::string& prompt,
                                                           const SessionObserver& observer) {
    BusyGuard guard(busy_);
    if (!guard.acquired()) {
        return busy_error();
    }

    CommandParams params;
    params.prompt = prompt;
    params.sandbox = settings_.sandbox;
    params.approval = settings_.approval;
    auto spec = command_builder_.build(Operation::Exec, params);
    if (core::errors::is_error(spec)) {
        return report("exec", core::errors::get_error(spec));
    }

    begin_invocation();
    auto candidate = resolve_codex(observer);
    if (core::errors::is_error(candidate)) {
        end_invocation();
        return core::errors::get_error(candidate);
    }
    const ToolCandidate& tool = core::errors::get_value(candidate);

    auto status_spec = command_builder_.build(Operation::Status, CommandParams{});
    if (core::errors::is_error(status_spec)) {
        end_invocation();
        return report("exec", core::errors::get_error(status_spec));
    }
    auto auth = invoke(Operation::Status, tool, core::errors::get_value(status_spec).argv,
                       observer);
    if (core::errors::is_error(auth)) {
        end_invocation();
        return core::errors::get_error(auth);
    }
    InvocationOutcome& auth_outcome = core::errors::get_value(auth);
    if (auth_outcome.cancelled) {
        end_invocation();
        auth_outcome.operation = Operation::Exec;
        return auth_outcome;
    }
    if (auth_outcome.exit_code != 0) {
        end_invocation();
        std::string hint = "Run `usbide_codex login`, then try again.";
        if (!settings_.device_auth) {
            hint += " If no browser opens, set USBIDE_CODEX_DEVICE_AUTH=1.";
        }
        return report("exec", CodexError{ErrorCategory::Auth,
                                         "Codex login status check failed (exit code " +
                                             std::to_string(auth_outcome.exit_code) + ").",
                                         "not_authenticated", hint});
    }

    LOG_INFO("CodexSession: exec via " + protocol::to_string(tool.origin));
    auto outcome = invoke(Operation::Exec, tool, core::errors::get_value(spec).argv, observer,
                          &prompt);
    end_invocation();
    return outcome;
}

core::errors::Result<InvocationOutcome> CodexSession::install(const SessionObserver& observer) {
    BusyGuard guard(busy_);
    if (!guard.acquired()) {
        return busy_error();
    }
    begin_invocation();
    auto outcome = run_install(observer);
    end_invocation();
    return outcome;
}

void CodexSession::cancel() {
    const auto token = active_token();
    if (token) {
        LOG_INFO("CodexSession: cancellation requested");
        token->store(true);
    }
}

core::errors::Result<ToolCandidate> CodexSession::resolve_codex(const SessionObserver& observer) {
    auto resolved = resolver_.resolve(layout_, ambient_);
    if (!core::errors::is_error(resolved)) {
        return resolved;
    }

    CodexError error = core::errors::get_error(resolved);
    if (error.code != "not_found" || !settings_.auto_install) {
        return report("resolve", std::move(error));
    }
    if (install_attempted_) {
        error.hint = "Automatic install was already attempted in this session; run "
                     "`usbide_codex install` to install again.";
        return report("resolve", std::move(error));
    }

    LOG_INFO("CodexSession: codex not found, installing " + settings_.npm_package);
    auto installed = run_install(observer);
    if (core::errors::is_error(installed)) {
        return core::errors::get_error(installed);
    }
    const InvocationOutcome& outcome = core::errors::get_value(installed);
    if (!outcome.success()) {
        return CodexError{ErrorCategory::Resolution,
                          "Automatic Codex install failed: " + outcome.diagnostic.summary,
                          "install_failed", outcome.diagnostic.guidance};
    }

    auto reloaded = resolver_.resolve(layout_, ambient_);
    if (core::errors::is_error(reloaded)) {
        return report("resolve", core::errors::get_error(reloaded));
    }
    return reloaded;
}

core::errors::Result<InvocationOutcome> CodexSession::run_install(
    const SessionObserver& observer) {
    auto installer = resolver_.resolve_installer(layout_, ambient_);
    if (core::errors::is_error(installer)) {
        return report("install", core::errors::get_error(installer));
    }

    std::error_code ec;
    std::filesystem::create_directories(layout_.codex_prefix(), ec);
    if (ec) {
        return report("install",
                      CodexError{ErrorCategory::Internal,
                                 "Unable to create install directory: " +
                                     layout_.codex_prefix().string(),
                                 "install_dir_failed",
                                 "Check that the workspace is writable."});
    }

    CommandParams params;
    params.install_prefix = layout_.codex_prefix();
    params.package = settings_.npm_package;
    auto spec = command_builder_.build(Operation::Install, params);
    if (core::errors::is_error(spec)) {
        return report("install", core::errors::get_error(spec));
    }

    install_attempted_ = true;
    LOG_INFO("CodexSession: installing " + settings_.npm_package + " into " +
             layout_.codex_prefix().string());
    auto outcome = invoke(Operation::Install, core::errors::get_value(installer),
                          core::errors::get_value(spec).argv, observer);
    if (core::errors::is_error(outcome) || !core::errors::get_value(outcome).success()) {
        return outcome;
    }

    auto reloaded = resolver_.reload(layout_, ambient_);
    if (core::errors::is_error(reloaded)) {
        LOG_WARN("CodexSession: install finished but codex is still not resolvable");
    }
    return outcome;
}

core::errors::Result<InvocationOutcome> CodexSession::invoke(
    const Operation operation, const ToolCandidate& candidate,
    const std::vector<std::string>& argv, const SessionObserver& observer,
    const std::string* prompt) {
    process::SpawnRequest request;
    request.candidate = candidate;
    request.environment = env_builder_.build(layout_, ambient_, settings_.overrides, candidate);
    request.argv = argv;
    request.working_directory = layout_.root();
    request.cancel_token = active_token();

    auto spawned = runner_.run(request);
    if (core::errors::is_error(spawned)) {
        return report(protocol::to_string(operation), core::errors::get_error(spawned));
    }
    std::unique_ptr<process::ProcessHandle> handle =
        std::move(core::errors::get_value(spawned));

    InvocationOutcome outcome;
    outcome.operation = operation;

    std::optional<parse::ProtocolStreamParser> parser;
    const auto deliver = [&](std::vector<DisplayEvent> events) {
        for (auto& event : events) {
            if (observer.on_event) {
                observer.on_event(event);
            }
            outcome.transcript.push_back(std::move(event));
        }
    };
    const auto print = [&](const std::string& text) {
        const std::string shown = diagnostics::translate_cli_line(text).value_or(text);
        if (observer.on_line) {
            observer.on_line(shown);
        }
        outcome.output_lines.push_back(shown);
    };

    if (operation == Operation::Exec) {
        parser.emplace();
        deliver(parser->open_turn(prompt != nullptr ? *prompt : std::string()));
    }

    std::optional<protocol::ErrorMessage> stderr_error;
    while (true) {
        auto event = handle->next_event(kEventPollInterval);
        if (!event.has_value()) {
            if (handle->finished()) {
                break;
            }
            continue;
        }
        if (event->kind == process::ProcessEvent::Kind::Exit) {
            outcome.exit_code = event->exit_code;
            outcome.cancelled = event->cancelled;
            break;
        }

        const protocol::RawLine& line = event->line;
        if (line.origin == StreamOrigin::Stderr && !line.text.empty()) {
            const std::string lower = lowercase(line.text);
            if (lower.find("status") != std::string::npos) {
                if (auto code = diagnostics::extract_status_code(line.text); code.has_value()) {
                    stderr_error = protocol::ErrorMessage{code, line.text};
                }
            }
        }

        if (!parser.has_value()) {
            if (!line.text.empty()) {
                print(line.text);
            }
            continue;
        }
        const std::size_t skipped_before = parser->stats().skipped;
        deliver(parser->feed(line));
        if (parser->stats().skipped != skipped_before) {
            print(line.text);
        }
    }

    if (!outcome.cancelled && handle->cancel_requested()) {
        outcome.cancelled = true;
    }

    std::optional<protocol::ErrorMessage> last_error = stderr_error;
    if (parser.has_value()) {
        deliver(parser->flush());
        outcome.skipped_lines = parser->stats().skipped;
        if (parser->last_error().has_value()) {
            last_error = parser->last_error();
        }
    }

    outcome.diagnostic = diagnostics::classify(outcome.exit_code, last_error, outcome.cancelled);
    LOG_INFO("CodexSession: " + protocol::to_string(operation) + " finished with exit code " +
             std::to_string(outcome.exit_code) + " (" +
             diagnostics::to_string(outcome.diagnostic.kind) + ")");
    if (!outcome.success()) {
        report(protocol::to_string(operation), outcome);
    }
    return outcome;
}

std::shared_ptr<std::atomic_bool> CodexSession::begin_invocation() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    active_token_ = std::make_shared<std::atomic_bool>(false);
    return active_token_;
}

std::shared_ptr<std::atomic_bool> CodexSession::active_token() const {
    std::lock_guard<std::mutex> lock(token_mutex_);
    return active_token_;
}

void CodexSession::end_invocation() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    active_token_.reset();
}

CodexError CodexSession::report(const std::string& context, CodexError error) const {
    LOG_ERROR("CodexSession: " + context + " failed [" + error.code + "]: " + error.message);
    if (error.hint.empty()) {
        error.hint = diagnostics::guidance_for(error);
    }
    if (incidents_ != nullptr) {
        incidents_->append(incident::Incident{incident::Severity::Error, context, error.message,
                                              core::errors::to_string(error.category) + "/" +
                                                  error.code});
    }
    return error;
}

void CodexSession::report(const std::string& context, const InvocationOutcome& outcome) const {
    if (incidents_ == nullptr) {
        return;
    }
    const incident::Severity severity = outcome.cancelled ? incident::Severity::Info
                                                          : incident::Severity::Error;
    std::optional<std::string> details;
    if (!outcome.output_lines.empty()) {
        details = join_tail(outcome.output_lines, kIncidentDetailLines);
    }
    incidents_->append(incident::Incident{severity, context, outcome.diagnostic.summary,
                                          std::move(details)});
}

}  // namespace usbide::session
