#include "core/config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace usbide::core::config {

using protocol::AmbientEnvironment;
using protocol::ApprovalPolicy;
using protocol::SandboxMode;

namespace {

std::string trim(std::string value) {
    const auto not_space = [](const unsigned char c) { return std::isspace(c) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string normalize(std::string value) {
    value = trim(std::move(value));
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::optional<std::string> lookup(const AmbientEnvironment& ambient,
                                  const std::string& key) {
    const auto it = ambient.find(key);
    if (it == ambient.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

bool is_truthy(const std::string& value) {
    const std::string v = normalize(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

bool is_falsy(const std::string& value) {
    const std::string v = normalize(value);
    return v == "0" || v == "false" || v == "no" || v == "off";
}

std::optional<SandboxMode> parse_sandbox_mode(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "read-only" || v == "readonly" || v == "ro") {
        return SandboxMode::ReadOnly;
    }
    if (v == "workspace-write" || v == "workspace" || v == "write" || v == "agent") {
        return SandboxMode::WorkspaceWrite;
    }
    if (v == "danger-full-access" || v == "danger" || v == "full" ||
        v == "full-access") {
        return SandboxMode::DangerFullAccess;
    }
    return std::nullopt;
}

std::optional<ApprovalPolicy> parse_approval_policy(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "untrusted") {
        return ApprovalPolicy::Untrusted;
    }
    if (v == "on-failure" || v == "onfailure") {
        return ApprovalPolicy::OnFailure;
    }
    if (v == "on-request" || v == "onrequest") {
        return ApprovalPolicy::OnRequest;
    }
    if (v == "never" || v == "none" || v == "off") {
        return ApprovalPolicy::Never;
    }
    return std::nullopt;
}

Settings load_settings(const AmbientEnvironment& ambient) {
    Settings settings;

    if (const auto v = lookup(ambient, "USBIDE_CODEX_ALLOW_API_KEY")) {
        settings.overrides.allow_api_key = is_truthy(*v);
    }
    if (const auto v = lookup(ambient, "USBIDE_CODEX_ALLOW_CUSTOM_BASE")) {
        settings.overrides.allow_custom_base = is_truthy(*v);
    }
    if (const auto v = lookup(ambient, "USBIDE_CODEX_DEVICE_AUTH")) {
        settings.device_auth = is_truthy(*v);
    }
    // Auto-install stays on unless explicitly disabled
    if (const auto v = lookup(ambient, "USBIDE_CODEX_AUTO_INSTALL")) {
        settings.auto_install = !is_falsy(*v);
    }
    if (const auto v = lookup(ambient, "USBIDE_CODEX_NPM_PACKAGE")) {
        // npm package specs are case-sensitive; only surrounding blanks go
        if (std::string package = trim(*v); !package.empty()) {
            settings.npm_package = std::move(package);
        }
    }
    if (const auto v = lookup(ambient, "USBIDE_CODEX_SANDBOX")) {
        settings.sandbox = parse_sandbox_mode(*v);
    }
    if (const auto v = lookup(ambient, "USBIDE_CODEX_APPROVAL")) {
        settings.approval = parse_approval_policy(*v);
    }
    if (const auto v = lookup(ambient, "USBIDE_LOG_LEVEL")) {
        if (const auto level = logging::parse_log_level(normalize(*v))) {
            settings.log_level = *level;
        }
    }
    return settings;
}

}  // namespace usbide::core::config
