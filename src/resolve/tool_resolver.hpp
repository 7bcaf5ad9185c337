#pragma once

#include <filesystem>
#include <optional>
#include "core/errors/codex_errors.hpp"
#include "protocol/environment_spec.hpp"
#include "protocol/tool_candidate.hpp"
#include "workspace/workspace_layout.hpp"

namespace usbide::resolve {

// Decides what to launch for the assistant: the portable node + codex.js
// pair under the workspace, or a `codex` found on the host PATH.
// A successful resolution is cached until reload() is called.
class ToolResolver {
public:
    explicit ToolResolver(
        protocol::HostPlatform platform = protocol::current_platform());

    core::errors::Result<protocol::ToolCandidate> resolve(
        const workspace::WorkspaceLayout& layout,
        const protocol::AmbientEnvironment& ambient);

    // Drops the cached candidate and resolves again (after an install).
    core::errors::Result<protocol::ToolCandidate> reload(
        const workspace::WorkspaceLayout& layout,
        const protocol::AmbientEnvironment& ambient);

    void invalidate();
    const std::optional<protocol::ToolCandidate>& cached() const { return cached_; }

    // node + npm-cli.js, used to run the Install operation
    core::errors::Result<protocol::ToolCandidate> resolve_installer(
        const workspace::WorkspaceLayout& layout,
        const protocol::AmbientEnvironment& ambient) const;

    std::optional<std::filesystem::path> find_runtime(
        const workspace::WorkspaceLayout& layout,
        const protocol::AmbientEnvironment& ambient) const;

    std::optional<std::filesystem::path> find_entrypoint(
        const workspace::WorkspaceLayout& layout) const;

private:
    core::errors::Result<protocol::ToolCandidate> resolve_uncached(
        const workspace::WorkspaceLayout& layout,
        const protocol::AmbientEnvironment& ambient) const;

    std::optional<protocol::ToolCandidate> resolve_from_path(
        const protocol::AmbientEnvironment& ambient) const;

    protocol::HostPlatform platform_;
    std::optional<protocol::ToolCandidate> cached_;
};

}  // namespace usbide::resolve
