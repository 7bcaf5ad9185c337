#include "workspace/workspace_guard.hpp"

#include <system_error>
#include "core/logging/logger.hpp"

namespace usbide::workspace {

using core::errors::CodexError;
using core::errors::ErrorCategory;

bool WorkspaceGuard::is_within_root(const std::filesystem::path& root,
                                    const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> WorkspaceGuard::validate_root(
    const std::filesystem::path& workspace_root) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return CodexError{ErrorCategory::Input,
                          "Workspace root does not exist: " + workspace_root.string(),
                          "invalid_workspace_root",
                          "Pass an existing directory with --root."};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return CodexError{ErrorCategory::Input,
                          "Workspace root is not a directory: " +
                              workspace_root.string(),
                          "invalid_workspace_root",
                          "Pass an existing directory with --root."};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return CodexError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root.string(),
                          "invalid_workspace_root"};
    }
    return canonical_root;
}

core::errors::Result<std::filesystem::path> WorkspaceGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    auto root_result = validate_root(workspace_root);
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const std::filesystem::path canonical_root = core::errors::get_value(root_result);

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    std::error_code ec;
    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return CodexError{ErrorCategory::Input,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return CodexError{ErrorCategory::Internal,
                          "Path escapes workspace root: " + canonical_candidate.string(),
                          "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<std::vector<std::filesystem::path>> WorkspaceGuard::ensure_layout(
    const WorkspaceLayout& layout) const {
    std::vector<std::filesystem::path> created;
    for (const auto& dir : layout.managed_directories()) {
        auto validated = validate_path_in_workspace(layout.root(), dir);
        if (core::errors::is_error(validated)) {
            return core::errors::get_error(validated);
        }

        std::error_code ec;
        if (std::filesystem::is_directory(dir, ec) && !ec) {
            continue;
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return CodexError{ErrorCategory::Internal,
                              "Unable to create workspace directory: " + dir.string(),
                              "workspace_dir_create_failed",
                              "Check that the removable media is writable."};
        }
        LOG_DEBUG("WorkspaceGuard: created " + dir.string());
        created.push_back(dir);
    }
    return created;
}

}  // namespace usbide::workspace
