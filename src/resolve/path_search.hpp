#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol/environment_spec.hpp"
#include "protocol/tool_candidate.hpp"

namespace usbide::resolve {

inline constexpr const char* kDefaultPathExt = ".COM;.EXE;.BAT;.CMD;.PS1";

char path_list_separator(protocol::HostPlatform platform);

// Environment lookup; Windows keys compare case-insensitively.
std::optional<std::string> env_lookup(const std::map<std::string, std::string>& env,
                                      const std::string& key,
                                      protocol::HostPlatform platform);

std::vector<std::filesystem::path> split_search_path(const std::string& value,
                                                     protocol::HostPlatform platform);

// Locates `command` the way the host shell would. On Windows a bare name is
// tried with every PATHEXT extension.
std::optional<std::filesystem::path> find_in_path(
    const std::string& command, const std::optional<std::string>& search_path,
    protocol::HostPlatform platform,
    const std::string& pathext = kDefaultPathExt);

std::string lowercase_extension(const std::filesystem::path& path);

// First line of a script when it starts with "#!", otherwise nothing.
std::optional<std::string> read_shebang(const std::filesystem::path& path);

}  // namespace usbide::resolve
