#pragma once

#include <optional>
#include <string>
#include "core/logging/logger.hpp"
#include "protocol/command_spec.hpp"
#include "protocol/environment_spec.hpp"

namespace usbide::core::config {

inline constexpr const char* kDefaultNpmPackage = "@openai/codex";

// Caller-facing switches. Read once from the ambient environment, then
// adjusted by command-line flags.
struct Settings {
    protocol::EnvironmentOverrides overrides;
    bool device_auth = false;
    bool auto_install = true;
    std::string npm_package = kDefaultNpmPackage;
    std::optional<protocol::SandboxMode> sandbox;
    std::optional<protocol::ApprovalPolicy> approval;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

Settings load_settings(const protocol::AmbientEnvironment& ambient);

bool is_truthy(const std::string& value);
bool is_falsy(const std::string& value);

std::optional<protocol::SandboxMode> parse_sandbox_mode(const std::string& value);
std::optional<protocol::ApprovalPolicy> parse_approval_policy(const std::string& value);

}  // namespace usbide::core::config
