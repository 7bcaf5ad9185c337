#include "command/command_builder.hpp"

#include <string>
#include <utility>
#include <vector>

namespace usbide::command {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using protocol::CommandParams;
using protocol::CommandSpec;
using protocol::Operation;

namespace {

bool is_blank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

bool starts_with_dash(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n\f\v");
    return first != std::string::npos && value[first] == '-';
}

}  // namespace

core::errors::Result<CommandSpec> CommandBuilder::build(
    const Operation operation, const CommandParams& params) const {
    switch (operation) {
        case Operation::Login: {
            CommandSpec spec{Operation::Login, {"login"}};
            if (params.device_auth) {
                spec.argv.emplace_back(kDeviceAuthFlag);
            }
            return spec;
        }
        case Operation::Status:
            return CommandSpec{Operation::Status, {"login", "status"}};
        case Operation::Exec:
            return build_exec(params);
        case Operation::Install:
            return build_install(params);
    }
    return CodexError{ErrorCategory::Internal, "Unknown operation.", "unknown_operation"};
}

core::errors::Result<CommandSpec> CommandBuilder::build_exec(
    const CommandParams& params) const {
    if (is_blank(params.prompt)) {
        return CodexError{ErrorCategory::Argv, "Prompt must not be empty.", "empty_prompt",
                          "Type a request for the assistant before sending."};
    }

    CommandSpec spec{Operation::Exec, {"exec", kJsonFlag}};
    if (params.sandbox.has_value()) {
        spec.argv.emplace_back("--sandbox");
        spec.argv.push_back(protocol::to_string(*params.sandbox));
    }
    if (params.approval.has_value()) {
        spec.argv.emplace_back("--ask-for-approval");
        spec.argv.push_back(protocol::to_string(*params.approval));
    }
    for (const auto& arg : params.extra_args) {
        if (!is_blank(arg)) {
            spec.argv.push_back(arg);
        }
    }
    // A prompt such as "--help" must not be taken for a flag
    if (starts_with_dash(params.prompt)) {
        spec.argv.emplace_back("--");
    }
    spec.argv.push_back(params.prompt);
    return spec;
}

core::errors::Result<CommandSpec> CommandBuilder::build_install(
    const CommandParams& params) const {
    if (is_blank(params.package)) {
        return CodexError{ErrorCategory::Argv, "Package name must not be empty.",
                          "empty_package",
                          "Unset USBIDE_CODEX_NPM_PACKAGE or give it a package name."};
    }
    if (params.install_prefix.empty()) {
        return CodexError{ErrorCategory::Argv, "Install prefix must not be empty.",
                          "empty_prefix"};
    }

    return CommandSpec{Operation::Install,
                       {"install", "--prefix", params.install_prefix.string(),
                        "--no-audit", "--no-fund", params.package}};
}

}  // namespace usbide::command
