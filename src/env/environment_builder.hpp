#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/errors/codex_errors.hpp"
#include "protocol/environment_spec.hpp"
#include "protocol/tool_candidate.hpp"
#include "workspace/workspace_layout.hpp"

namespace usbide::env {

// Authentication variables dropped unless the matching override is set
const std::vector<std::string>& api_key_variables();
const std::vector<std::string>& custom_base_variables();

// Reads the current process environment once.
core::errors::Result<protocol::AmbientEnvironment> capture_ambient_environment();

// Pure: the same inputs always give the same EnvironmentSpec.
class EnvironmentBuilder {
public:
    explicit EnvironmentBuilder(
        protocol::HostPlatform platform = protocol::current_platform());

    protocol::EnvironmentSpec build(
        const workspace::WorkspaceLayout& layout,
        const protocol::AmbientEnvironment& ambient,
        const protocol::EnvironmentOverrides& overrides,
        const std::optional<protocol::ToolCandidate>& candidate = std::nullopt) const;

private:
    void remove_variable(protocol::EnvironmentSpec& env, const std::string& name) const;
    void normalize_path_key(protocol::EnvironmentSpec& env) const;
    void prepend_path(protocol::EnvironmentSpec& env, const std::string& dir) const;

    protocol::HostPlatform platform_;
};

}  // namespace usbide::env
