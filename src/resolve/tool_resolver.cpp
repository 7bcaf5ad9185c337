#include "resolve/tool_resolver.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "resolve/path_search.hpp"

namespace usbide::resolve {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::AmbientEnvironment;
using protocol::HostPlatform;
using protocol::InvocationStrategy;
using protocol::ToolCandidate;
using protocol::ToolOrigin;
using workspace::WorkspaceLayout;

namespace {

bool is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec &&
           !std::filesystem::is_directory(path, ec);
}

// package.json "bin" is either a string or a name -> script object
std::optional<std::string> bin_field_entry(const json& package) {
    if (!package.is_object() || !package.contains("bin")) {
        return std::nullopt;
    }
    const json& bin = package.at("bin");
    if (bin.is_string()) {
        return bin.get<std::string>();
    }
    if (!bin.is_object()) {
        return std::nullopt;
    }
    if (bin.contains("codex") && bin.at("codex").is_string()) {
        return bin.at("codex").get<std::string>();
    }
    for (const auto& item : bin.items()) {
        if (item.value().is_string()) {
            return item.value().get<std::string>();
        }
    }
    return std::nullopt;
}

CodexError not_found_error(const WorkspaceLayout& layout) {
    return CodexError{
        ErrorCategory::Resolution,
        "Codex CLI not found: no portable install under " +
            layout.codex_prefix().string() + " and no `codex` on PATH.",
        "not_found",
        "Run `usbide_codex install` (needs node under " + layout.node_dir().string() +
            ") or put `codex` on PATH, then retry."};
}

}  // namespace

ToolResolver::ToolResolver(const HostPlatform platform) : platform_(platform) {}

core::errors::Result<ToolCandidate> ToolResolver::resolve(
    const WorkspaceLayout& layout, const AmbientEnvironment& ambient) {
    if (cached_.has_value()) {
        return *cached_;
    }
    auto resolved = resolve_uncached(layout, ambient);
    if (!core::errors::is_error(resolved)) {
        cached_ = core::errors::get_value(resolved);
    }
    return resolved;
}

core::errors::Result<ToolCandidate> ToolResolver::reload(
    const WorkspaceLayout& layout, const AmbientEnvironment& ambient) {
    LOG_DEBUG("ToolResolver: reloading");
    invalidate();
    return resolve(layout, ambient);
}

void ToolResolver::invalidate() { cached_.reset(); }

std::optional<std::filesystem::path> ToolResolver::find_runtime(
    const WorkspaceLayout& layout, const AmbientEnvironment& ambient) const {
    std::vector<std::filesystem::path> candidates;
    if (platform_ == HostPlatform::Windows) {
        candidates.push_back(layout.node_dir() / "node.exe");
    } else {
        candidates.push_back(layout.node_dir() / "bin" / "node");
        candidates.push_back(layout.node_dir() / "node");
    }
    for (const auto& candidate : candidates) {
        if (is_file(candidate)) {
            return candidate;
        }
    }
    return find_in_path("node", env_lookup(ambient, "PATH", platform_), platform_,
                        env_lookup(ambient, "PATHEXT", platform_).value_or(kDefaultPathExt));
}

std::optional<std::filesystem::path> ToolResolver::find_entrypoint(
    const WorkspaceLayout& layout) const {
    const auto package_json = layout.codex_package_json();
    if (!is_file(package_json)) {
        return std::nullopt;
    }

    std::ifstream in(package_json);
    if (!in.is_open()) {
        return std::nullopt;
    }
    const json package = json::parse(in, nullptr, false);
    if (package.is_discarded()) {
        LOG_WARN("ToolResolver: unreadable " + package_json.string());
        return std::nullopt;
    }

    const auto rel = bin_field_entry(package);
    if (!rel.has_value()) {
        return std::nullopt;
    }
    const auto entry = package_json.parent_path() / *rel;
    if (!is_file(entry)) {
        return std::nullopt;
    }
    return entry.lexically_normal();
}

std::optional<ToolCandidate> ToolResolver::resolve_from_path(
    const AmbientEnvironment& ambient) const {
    const auto search_path = env_lookup(ambient, "PATH", platform_);
    const std::string pathext =
        env_lookup(ambient, "PATHEXT", platform_).value_or(kDefaultPathExt);
    const auto found = find_in_path("codex", search_path, platform_, pathext);
    if (!found.has_value()) {
        return std::nullopt;
    }

    ToolCandidate candidate;
    candidate.origin = ToolOrigin::PathFallback;
    candidate.executable = *found;
    candidate.strategy = InvocationStrategy::DirectExec;

    // POSIX spawns scripts and binaries alike; only Windows needs a shim.
    if (platform_ != HostPlatform::Windows) {
        return candidate;
    }

    const std::string ext = lowercase_extension(*found);
    if (ext == "cmd" || ext == "bat") {
        candidate.strategy = InvocationStrategy::WindowsCmdWrapper;
        candidate.interpreter =
            env_lookup(ambient, "COMSPEC", platform_).value_or("cmd.exe");
        return candidate;
    }
    if (ext == "ps1") {
        candidate.strategy = InvocationStrategy::WindowsPowerShellWrapper;
        const auto powershell = find_in_path("powershell", search_path, platform_, pathext);
        candidate.interpreter =
            powershell.has_value() ? powershell->string() : std::string("powershell");
        return candidate;
    }
    if (ext.empty()) {
        const auto shebang = read_shebang(*found);
        if (shebang.has_value() && shebang->find("node") != std::string::npos) {
            const auto node = find_in_path("node", search_path, platform_, pathext);
            if (node.has_value()) {
                candidate.executable = *node;
                candidate.entrypoint = *found;
            }
        }
    }
    return candidate;
}

core::errors::Result<ToolCandidate> ToolResolver::resolve_uncached(
    const WorkspaceLayout& layout, const AmbientEnvironment& ambient) const {
    const auto runtime = find_runtime(layout, ambient);
    const auto entrypoint = find_entrypoint(layout);
    if (runtime.has_value() && entrypoint.has_value()) {
        ToolCandidate candidate;
        candidate.origin = ToolOrigin::Portable;
        candidate.executable = *runtime;
        candidate.entrypoint = *entrypoint;
        candidate.strategy = InvocationStrategy::DirectExec;
        LOG_INFO("ToolResolver: portable codex via " + runtime->string());
        return candidate;
    }

    if (auto from_path = resolve_from_path(ambient)) {
        LOG_INFO("ToolResolver: PATH fallback " + from_path->executable.string() +
                 " (" + protocol::to_string(from_path->strategy) + ")");
        return *from_path;
    }

    LOG_WARN("ToolResolver: codex not found");
    return not_found_error(layout);
}

core::errors::Result<ToolCandidate> ToolResolver::resolve_installer(
    const WorkspaceLayout& layout, const AmbientEnvironment& ambient) const {
    const auto runtime = find_runtime(layout, ambient);
    if (!runtime.has_value()) {
        return CodexError{ErrorCategory::Resolution,
                          "Portable node runtime not found.",
                          "node_missing",
                          "Place node under " + layout.node_dir().string() +
                              " (e.g. node.exe) or add node to PATH."};
    }

    const auto node_dir = runtime->parent_path();
    const std::vector<std::filesystem::path> npm_candidates = {
        node_dir / "node_modules" / "npm" / "bin" / "npm-cli.js",
        node_dir.parent_path() / "lib" / "node_modules" / "npm" / "bin" / "npm-cli.js"};
    for (const auto& npm : npm_candidates) {
        if (!is_file(npm)) {
            continue;
        }
        ToolCandidate candidate;
        candidate.origin = ToolOrigin::Portable;
        candidate.executable = *runtime;
        candidate.entrypoint = npm.lexically_normal();
        candidate.strategy = InvocationStrategy::DirectExec;
        return candidate;
    }

    return CodexError{ErrorCategory::Resolution, "npm-cli.js not found next to node.",
                      "npm_missing",
                      "Use a node distribution that bundles npm under " +
                          layout.node_dir().string() + "."};
}

}  // namespace usbide::resolve
