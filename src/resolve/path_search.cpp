#include "resolve/path_search.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace usbide::resolve {

using protocol::HostPlatform;

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec &&
           !std::filesystem::is_directory(path, ec);
}

}  // namespace

char path_list_separator(const HostPlatform platform) {
    return platform == HostPlatform::Windows ? ';' : ':';
}

std::optional<std::string> env_lookup(const std::map<std::string, std::string>& env,
                                      const std::string& key,
                                      const HostPlatform platform) {
    const auto it = env.find(key);
    if (it != env.end()) {
        return it->second;
    }
    if (platform != HostPlatform::Windows) {
        return std::nullopt;
    }
    for (const auto& [name, value] : env) {
        if (iequals(name, key)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::filesystem::path> split_search_path(const std::string& value,
                                                     const HostPlatform platform) {
    std::vector<std::filesystem::path> dirs;
    const char sep = path_list_separator(platform);
    std::size_t start = 0;
    while (start <= value.size()) {
        const auto end = value.find(sep, start);
        const std::string entry =
            value.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!entry.empty()) {
            dirs.emplace_back(entry);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return dirs;
}

std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

std::optional<std::filesystem::path> find_in_path(
    const std::string& command, const std::optional<std::string>& search_path,
    const HostPlatform platform, const std::string& pathext) {
    const std::string cmd = trim(command);
    if (cmd.empty()) {
        return std::nullopt;
    }

    const std::filesystem::path direct(cmd);
    const bool has_separator =
        cmd.find('/') != std::string::npos ||
        (platform == HostPlatform::Windows && cmd.find('\\') != std::string::npos);
    if (direct.is_absolute() || has_separator) {
        if (is_file(direct)) {
            return direct;
        }
        return std::nullopt;
    }

    if (!search_path.has_value()) {
        return std::nullopt;
    }

    std::vector<std::string> extensions;
    if (platform == HostPlatform::Windows && !direct.has_extension()) {
        for (const auto& ext : split_search_path(pathext, HostPlatform::Windows)) {
            extensions.push_back(ext.string());
        }
    }
    if (extensions.empty()) {
        extensions.emplace_back();
    }

    for (const auto& dir : split_search_path(*search_path, platform)) {
        for (const auto& ext : extensions) {
            const auto candidate = dir / (cmd + ext);
            if (is_file(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> read_shebang(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    if (line.rfind("#!", 0) != 0) {
        return std::nullopt;
    }
    return trim(line.substr(2));
}

}  // namespace usbide::resolve
