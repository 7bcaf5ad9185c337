#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace usbide::protocol {

    enum class HostPlatform {
        Posix,
        Windows
    };

    constexpr HostPlatform current_platform() {
#ifdef _WIN32
        return HostPlatform::Windows;
#else
        return HostPlatform::Posix;
#endif
    }

    enum class ToolOrigin {
        Portable,      // Runtime and assistant live under the workspace
        PathFallback   // Assistant found on the host search path
    };

    // How argv gets wrapped before spawning
    enum class InvocationStrategy {
        DirectExec,
        WindowsCmdWrapper,
        WindowsPowerShellWrapper
    };

    // Result of resolution. Immutable until the resolver is reloaded.
    struct ToolCandidate {
        ToolOrigin origin = ToolOrigin::PathFallback;
        std::filesystem::path executable;
        // Script run by `executable` for runtime + script pairs (node + codex.js)
        std::optional<std::filesystem::path> entrypoint;
        // Host interpreter for the wrapper strategies (cmd.exe, powershell)
        std::optional<std::string> interpreter;
        InvocationStrategy strategy = InvocationStrategy::DirectExec;
    };

    inline std::string to_string(const ToolOrigin origin) {
        switch (origin) {
            case ToolOrigin::Portable:
                return "portable";
            case ToolOrigin::PathFallback:
                return "path_fallback";
            default:
                return "unknown";
        }
    }

    inline std::string to_string(const InvocationStrategy strategy) {
        switch (strategy) {
            case InvocationStrategy::DirectExec:
                return "direct_exec";
            case InvocationStrategy::WindowsCmdWrapper:
                return "windows_cmd_wrapper";
            case InvocationStrategy::WindowsPowerShellWrapper:
                return "windows_powershell_wrapper";
            default:
                return "unknown";
        }
    }

} // namespace usbide::protocol
