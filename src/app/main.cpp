#include <atomic>
#include <chrono>
#include <signal.h>
#include <iostream>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/codex_errors.hpp"
#include "core/logging/logger.hpp"
#include "env/environment_builder.hpp"
#include "incident/incident_logger.hpp"
#include "process/posix_process_runner.hpp"
#include "session/codex_session.hpp"
#include "workspace/workspace_guard.hpp"

namespace {

std::atomic_bool g_interrupted{false};

extern "C" void on_interrupt(int) { g_interrupted.store(true); }

int exit_code_for(const usbide::core::errors::CodexError& err) {
    using usbide::core::errors::ErrorCategory;
    switch (err.category) {
        case ErrorCategory::Input:
            return 2;
        case ErrorCategory::Resolution:
        case ErrorCategory::Environment:
        case ErrorCategory::Argv:
            return 3;
        case ErrorCategory::Auth:
            return 4;
        case ErrorCategory::Spawn:
            return 5;
        default:
            return 1;
    }
}

std::string label_for(const usbide::protocol::DisplayKind kind) {
    using usbide::protocol::DisplayKind;
    switch (kind) {
        case DisplayKind::User: return "User";
        case DisplayKind::Assistant: return "Assistant";
        case DisplayKind::Action: return "Action";
        case DisplayKind::Error: return "Error";
        case DisplayKind::Notice: return "Notice";
        default: return "Output";
    }
}

void print_error(const usbide::core::errors::CodexError& err) {
    std::cerr << "Error: " << err.message << "\n";
    if (!err.hint.empty()) {
        std::cerr << err.hint << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process
    usbide::core::logging::Logger::get().set_session_id(
        usbide::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = usbide::app::cli::parse_and_validate(argc, argv);
    if (usbide::core::errors::is_error(parsed)) {
        const auto& err = usbide::core::errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cout << err.hint << std::endl;
            return 0;
        }
        print_error(err);
        return 2;
    }
    const auto& req = usbide::core::errors::get_value(parsed);

    // 3. Settings: environment first, then flags
    auto ambient = usbide::env::capture_ambient_environment();
    if (usbide::core::errors::is_error(ambient)) {
        const auto& err = usbide::core::errors::get_error(ambient);
        LOG_ERROR("Environment error [" + err.code + "]: " + err.message);
        print_error(err);
        return 3;
    }
    const auto& ambient_env = usbide::core::errors::get_value(ambient);

    auto settings = usbide::core::config::load_settings(ambient_env);
    if (req.verbose) {
        settings.log_level = usbide::core::logging::LogLevel::DEBUG;
    }
    usbide::core::logging::Logger::get().set_min_level(settings.log_level);
    settings.device_auth = settings.device_auth || req.device_auth;
    if (req.sandbox) settings.sandbox = req.sandbox;
    if (req.approval) settings.approval = req.approval;
    if (req.package) settings.npm_package = req.package.value();

    // 4. Workspace directories
    const usbide::workspace::WorkspaceLayout layout(req.root);
    usbide::workspace::WorkspaceGuard guard;
    auto created = guard.ensure_layout(layout);
    if (usbide::core::errors::is_error(created)) {
        const auto& err = usbide::core::errors::get_error(created);
        LOG_ERROR("Workspace error [" + err.code + "]: " + err.message);
        print_error(err);
        return 1;
    }
    LOG_DEBUG("Workspace ready: " + layout.root().string());

    usbide::process::PosixProcessRunner runner;
    usbide::incident::FileIncidentLogger incidents(layout.incident_log());
    usbide::session::CodexSession session(layout, ambient_env, settings, runner, &incidents);

    // 5. Ctrl+C cancels the running invocation instead of killing us
    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    static_cast<void>(sigaction(SIGINT, &action, nullptr));

    std::atomic_bool done{false};
    std::thread interrupt_watcher([&session, &done]() {
        while (!done.load()) {
            if (g_interrupted.exchange(false)) {
                session.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    usbide::session::SessionObserver observer;
    observer.on_event = [](const usbide::protocol::DisplayEvent& event) {
        std::cout << label_for(usbide::protocol::kind_of(event)) << "\n"
                  << usbide::protocol::text_of(event) << "\n" << std::endl;
    };
    observer.on_line = [](const std::string& line) { std::cout << line << std::endl; };

    // 6. Run the requested operation
    usbide::core::errors::Result<usbide::session::InvocationOutcome> result =
        usbide::core::errors::CodexError{usbide::core::errors::ErrorCategory::Internal,
                                         "No operation ran.", "no_operation"};
    switch (req.operation) {
        case usbide::protocol::Operation::Login:
            result = session.login(observer);
            break;
        case usbide::protocol::Operation::Status:
            result = session.status(observer);
            break;
        case usbide::protocol::Operation::Exec:
            result = session.exec(req.prompt, observer);
            break;
        case usbide::protocol::Operation::Install:
            result = session.install(observer);
            break;
    }

    done.store(true);
    interrupt_watcher.join();

    if (usbide::core::errors::is_error(result)) {
        const auto& err = usbide::core::errors::get_error(result);
        print_error(err);
        return exit_code_for(err);
    }

    const auto& outcome = usbide::core::errors::get_value(result);
    if (outcome.success()) {
        LOG_DEBUG("Done: " + usbide::protocol::to_string(outcome.operation));
        return 0;
    }

    std::cerr << outcome.diagnostic.summary << "\n";
    if (!outcome.diagnostic.guidance.empty()) {
        std::cerr << outcome.diagnostic.guidance << "\n";
    }
    if (outcome.diagnostic.kind == usbide::diagnostics::DiagnosticKind::Unauthenticated ||
        (outcome.operation == usbide::protocol::Operation::Status && !outcome.cancelled)) {
        return 4;
    }
    return 1;
}
