#pragma once

#include <filesystem>
#include <utility>
#include <vector>

namespace usbide::workspace {

// Every path the integration layer touches, derived from the workspace root.
class WorkspaceLayout {
public:
    explicit WorkspaceLayout(std::filesystem::path root) : root_(std::move(root)) {}

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path codex_home() const { return root_ / "codex_home"; }
    std::filesystem::path tmp_dir() const { return root_ / "tmp"; }
    std::filesystem::path npm_cache() const { return root_ / "cache" / "npm"; }
    std::filesystem::path pip_cache() const { return root_ / "cache" / "pip"; }
    std::filesystem::path pycache() const { return root_ / "cache" / "pycache"; }
    std::filesystem::path state_dir() const { return root_ / ".usbide"; }
    std::filesystem::path incident_log() const { return state_dir() / "incidents.jsonl"; }

    // Portable node runtime shipped on the media
    std::filesystem::path node_dir() const { return root_ / "tools" / "node"; }

    // npm --prefix target for the managed codex install
    std::filesystem::path codex_prefix() const { return state_dir() / "codex"; }
    std::filesystem::path codex_bin_dir() const {
        return codex_prefix() / "node_modules" / ".bin";
    }
    std::filesystem::path codex_package_json() const {
        return codex_prefix() / "node_modules" / "@openai" / "codex" / "package.json";
    }

    // Directories created once at startup
    std::vector<std::filesystem::path> managed_directories() const {
        return {npm_cache(), pip_cache(), pycache(), tmp_dir(), codex_home(),
                state_dir()};
    }

private:
    std::filesystem::path root_;
};

}  // namespace usbide::workspace
