#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/codex_errors.hpp"
#include "process/event_channel.hpp"
#include "protocol/environment_spec.hpp"
#include "protocol/tool_candidate.hpp"

namespace usbide::process {

struct SpawnRequest {
    protocol::ToolCandidate candidate;
    protocol::EnvironmentSpec environment;
    std::vector<std::string> argv;  // CommandSpec argv, without the executable
    std::filesystem::path working_directory;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Final argv for the OS: the candidate's strategy applied to `argv`.
std::vector<std::string> spawn_argv(
    const protocol::ToolCandidate& candidate, const std::vector<std::string>& argv,
    protocol::HostPlatform platform = protocol::current_platform());

// Strips \\?\ and \\?\UNC\ prefixes that cmd.exe and node reject.
std::string path_for_command_line(const std::filesystem::path& path,
                                  protocol::HostPlatform platform);

// Line stream plus exit notification of one running child.
class ProcessHandle {
public:
    ProcessHandle(std::shared_ptr<EventChannel> channel,
                  std::shared_ptr<std::atomic_bool> cancel_token,
                  std::thread worker = std::thread());
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // Next line or the final Exit event; nothing on timeout or once drained.
    std::optional<ProcessEvent> next_event(std::chrono::milliseconds timeout);

    void cancel();
    bool cancel_requested() const;
    bool finished() const;

private:
    std::shared_ptr<EventChannel> channel_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    std::thread worker_;
    bool exit_seen_ = false;
};

// Spawns the assistant. Real and fake implementations are picked by the caller.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Rejects an empty argv before anything is spawned.
    core::errors::Result<std::unique_ptr<ProcessHandle>> run(const SpawnRequest& request);

private:
    virtual core::errors::Result<std::unique_ptr<ProcessHandle>> spawn(
        const SpawnRequest& request) = 0;
};

}  // namespace usbide::process
