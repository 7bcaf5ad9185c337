#include "env/environment_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "resolve/path_search.hpp"

#ifndef _WIN32
extern char** environ;
#endif

namespace usbide::env {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using protocol::AmbientEnvironment;
using protocol::EnvironmentOverrides;
using protocol::EnvironmentSpec;
using protocol::HostPlatform;
using protocol::ToolCandidate;
using protocol::ToolOrigin;
using workspace::WorkspaceLayout;

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

char** process_environment() {
#ifdef _WIN32
    return _environ;
#else
    return environ;
#endif
}

}  // namespace

const std::vector<std::string>& api_key_variables() {
    static const std::vector<std::string> names = {"OPENAI_API_KEY", "CODEX_API_KEY"};
    return names;
}

const std::vector<std::string>& custom_base_variables() {
    static const std::vector<std::string> names = {"OPENAI_BASE_URL", "OPENAI_API_BASE",
                                                   "OPENAI_API_HOST"};
    return names;
}

core::errors::Result<AmbientEnvironment> capture_ambient_environment() {
    char** const entries = process_environment();
    if (entries == nullptr) {
        return CodexError{ErrorCategory::Environment,
                          "Process environment is unavailable.",
                          "environment_unavailable",
                          "Restart the IDE from a regular terminal session."};
    }

    AmbientEnvironment ambient;
    for (char** entry = entries; *entry != nullptr; ++entry) {
        const std::string pair(*entry);
        const auto eq = pair.find('=');
        // Skip malformed and Windows drive-cwd ("=C:=C:\") entries
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        ambient.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    return ambient;
}

EnvironmentBuilder::EnvironmentBuilder(const HostPlatform platform)
    : platform_(platform) {}

void EnvironmentBuilder::remove_variable(EnvironmentSpec& env,
                                         const std::string& name) const {
    if (platform_ != HostPlatform::Windows) {
        env.erase(name);
        return;
    }
    for (auto it = env.begin(); it != env.end();) {
        if (iequals(it->first, name)) {
            it = env.erase(it);
        } else {
            ++it;
        }
    }
}

void EnvironmentBuilder::normalize_path_key(EnvironmentSpec& env) const {
    if (platform_ != HostPlatform::Windows || env.count("PATH") != 0) {
        return;
    }
    for (auto it = env.begin(); it != env.end(); ++it) {
        if (iequals(it->first, "PATH")) {
            std::string value = it->second;
            env.erase(it);
            env["PATH"] = std::move(value);
            return;
        }
    }
}

void EnvironmentBuilder::prepend_path(EnvironmentSpec& env, const std::string& dir) const {
    normalize_path_key(env);
    const std::string current = env.count("PATH") != 0 ? env["PATH"] : std::string();
    for (const auto& existing : resolve::split_search_path(current, platform_)) {
        if (existing.string() == dir) {
            return;
        }
    }
    if (current.empty()) {
        env["PATH"] = dir;
        return;
    }
    env["PATH"] = dir + resolve::path_list_separator(platform_) + current;
}

EnvironmentSpec EnvironmentBuilder::build(
    const WorkspaceLayout& layout, const AmbientEnvironment& ambient,
    const EnvironmentOverrides& overrides,
    const std::optional<ToolCandidate>& candidate) const {
    // 1. Start from the ambient environment
    EnvironmentSpec env(ambient.begin(), ambient.end());

    // 2. Drop credentials and endpoint redirections
    if (!overrides.allow_api_key) {
        for (const auto& name : api_key_variables()) {
            remove_variable(env, name);
        }
    }
    if (!overrides.allow_custom_base) {
        for (const auto& name : custom_base_variables()) {
            remove_variable(env, name);
        }
    }

    // 3. Workspace-scoped locations always win over ambient values
    const std::string tmp = layout.tmp_dir().string();
    const std::pair<std::string, std::string> scoped[] = {
        {"CODEX_HOME", layout.codex_home().string()},
        {"TEMP", tmp},
        {"TMP", tmp},
        {"TMPDIR", tmp},
        {"NPM_CONFIG_CACHE", layout.npm_cache().string()},
        {"NPM_CONFIG_UPDATE_NOTIFIER", "false"},
        {"PIP_CACHE_DIR", layout.pip_cache().string()},
        {"PYTHONPYCACHEPREFIX", layout.pycache().string()},
        {"PYTHONNOUSERSITE", "1"},
    };
    for (const auto& [name, value] : scoped) {
        remove_variable(env, name);
        env[name] = value;
    }

    // 4. UTF-8 hint, only where the caller did not choose otherwise
    env.emplace("PYTHONUTF8", "1");
    env.emplace("PYTHONIOENCODING", "utf-8");

    // 5. Portable tools first on PATH
    if (candidate.has_value() && candidate->origin == ToolOrigin::Portable) {
        prepend_path(env, candidate->executable.parent_path().string());
        prepend_path(env, layout.codex_bin_dir().string());
    } else {
        normalize_path_key(env);
    }
    return env;
}

}  // namespace usbide::env
