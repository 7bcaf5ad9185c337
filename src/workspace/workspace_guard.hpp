#pragma once

#include <filesystem>
#include <vector>
#include "core/errors/codex_errors.hpp"
#include "workspace/workspace_layout.hpp"

namespace usbide::workspace {

// Keeps every write of the integration layer inside the workspace root.
class WorkspaceGuard {
public:
    core::errors::Result<std::filesystem::path> validate_root(
        const std::filesystem::path& workspace_root) const;

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Creates the cache/tmp/home directories; returns the ones that were missing.
    core::errors::Result<std::vector<std::filesystem::path>> ensure_layout(
        const WorkspaceLayout& layout) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace usbide::workspace
