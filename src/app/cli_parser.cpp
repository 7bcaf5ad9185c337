#include "cli_parser.hpp"
#include <system_error>
#include <vector>
#include "core/config/settings.hpp"
#include "workspace/workspace_guard.hpp"

namespace usbide::app::cli {

    using namespace usbide::core::errors;
    using usbide::protocol::Operation;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> root;
        std::optional<std::string> sandbox;
        std::optional<std::string> approval;
        std::optional<std::string> package;
        std::vector<std::string> prompt_words;
        bool verbose = false;
        bool device_auth = false;
    };

    std::string usage() {
        return "Usage: usbide_codex [--root DIR] [--verbose] <command>\n"
               "  login [--device-auth]\n"
               "  status\n"
               "  exec [--sandbox MODE] [--approval POLICY] PROMPT...\n"
               "  install [--package NAME]";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        RawCliOptions raw;

        // 2. Global options, up to the command word
        size_t i = 0;
        for (; i < args.size(); ++i) {
            if (args[i] == "--root") {
                if (i + 1 < args.size()) raw.root = args[++i];
                else return CodexError{ErrorCategory::Input, "Missing value for --root", "missing_value", usage()};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                return CodexError{ErrorCategory::Input, "Help requested.", "help_requested", usage()};
            } else if (!args[i].empty() && args[i][0] == '-') {
                return CodexError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            } else {
                break;
            }
        }

        if (i >= args.size()) {
            return CodexError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliRequest req;
        const std::string command = args[i++];
        if (command == "login") {
            req.operation = Operation::Login;
        } else if (command == "status") {
            req.operation = Operation::Status;
        } else if (command == "exec") {
            req.operation = Operation::Exec;
        } else if (command == "install") {
            req.operation = Operation::Install;
        } else {
            return CodexError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        // 3. Command options; exec takes the rest as the prompt
        bool options_done = false;
        for (; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (options_done) {
                raw.prompt_words.push_back(arg);
                continue;
            }
            if (req.operation == Operation::Login && arg == "--device-auth") {
                raw.device_auth = true;
            } else if (req.operation == Operation::Exec && arg == "--sandbox") {
                if (i + 1 < args.size()) raw.sandbox = args[++i];
                else return CodexError{ErrorCategory::Input, "Missing value for --sandbox", "missing_value"};
            } else if (req.operation == Operation::Exec && arg == "--approval") {
                if (i + 1 < args.size()) raw.approval = args[++i];
                else return CodexError{ErrorCategory::Input, "Missing value for --approval", "missing_value"};
            } else if (req.operation == Operation::Install && arg == "--package") {
                if (i + 1 < args.size()) raw.package = args[++i];
                else return CodexError{ErrorCategory::Input, "Missing value for --package", "missing_value"};
            } else if (req.operation == Operation::Exec && arg == "--") {
                options_done = true;
            } else if (req.operation == Operation::Exec && (arg.empty() || arg[0] != '-')) {
                raw.prompt_words.push_back(arg);
                options_done = true;
            } else {
                return CodexError{ErrorCategory::Input, "Unknown argument for " + command + ": " + arg, "unknown_argument", usage()};
            }
        }

        // 4. Validator Phase
        req.verbose = raw.verbose;
        req.device_auth = raw.device_auth;

        if (req.operation == Operation::Exec) {
            for (const auto& word : raw.prompt_words) {
                if (!req.prompt.empty()) req.prompt += ' ';
                req.prompt += word;
            }
            if (req.prompt.find_first_not_of(" \t\r\n") == std::string::npos) {
                return CodexError{ErrorCategory::Input, "exec needs a prompt.", "missing_prompt", "Usage: usbide_codex exec \"describe the change\""};
            }
        }

        if (raw.sandbox) {
            req.sandbox = usbide::core::config::parse_sandbox_mode(raw.sandbox.value());
            if (!req.sandbox) {
                return CodexError{ErrorCategory::Input, "Invalid value for --sandbox: " + raw.sandbox.value(), "invalid_value", "Use read-only, workspace-write or danger-full-access."};
            }
        }
        if (raw.approval) {
            req.approval = usbide::core::config::parse_approval_policy(raw.approval.value());
            if (!req.approval) {
                return CodexError{ErrorCategory::Input, "Invalid value for --approval: " + raw.approval.value(), "invalid_value", "Use untrusted, on-failure, on-request or never."};
            }
        }
        if (raw.package) {
            if (raw.package->find_first_not_of(" \t") == std::string::npos) {
                return CodexError{ErrorCategory::Input, "Empty value for --package", "invalid_value"};
            }
            req.package = raw.package.value();
        }

        // Path validation
        std::error_code path_ec;
        const std::filesystem::path root = raw.root ? std::filesystem::path(raw.root.value())
                                                    : std::filesystem::current_path(path_ec);
        if (path_ec) {
            return CodexError{ErrorCategory::Input, "Unable to determine the current directory", "invalid_path", "Pass the workspace with --root."};
        }
        usbide::workspace::WorkspaceGuard guard;
        auto validated = guard.validate_root(root);
        if (is_error(validated)) {
            return get_error(validated);
        }
        req.root = get_value(validated);

        return req;
    }

} // namespace usbide::app::cli
