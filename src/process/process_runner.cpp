#include "process/process_runner.hpp"

#include <utility>

namespace usbide::process {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using protocol::HostPlatform;
using protocol::InvocationStrategy;
using protocol::ToolCandidate;

std::string path_for_command_line(const std::filesystem::path& path,
                                  const HostPlatform platform) {
    const std::string raw = path.string();
    if (platform != HostPlatform::Windows) {
        return raw;
    }
    const std::string unc_prefix = "\\\\?\\UNC\\";
    const std::string long_prefix = "\\\\?\\";
    if (raw.rfind(unc_prefix, 0) == 0) {
        return "\\\\" + raw.substr(unc_prefix.size());
    }
    if (raw.rfind(long_prefix, 0) == 0) {
        return raw.substr(long_prefix.size());
    }
    return raw;
}

std::vector<std::string> spawn_argv(const ToolCandidate& candidate,
                                    const std::vector<std::string>& argv,
                                    const HostPlatform platform) {
    std::vector<std::string> full;
    full.reserve(argv.size() + 7);
    const std::string executable = path_for_command_line(candidate.executable, platform);

    switch (candidate.strategy) {
        case InvocationStrategy::WindowsCmdWrapper:
            // /d skips AutoRun, /s keeps quoting, /c runs then exits
            full.push_back(candidate.interpreter.value_or("cmd.exe"));
            full.insert(full.end(), {"/d", "/s", "/c"});
            full.push_back(executable);
            break;
        case InvocationStrategy::WindowsPowerShellWrapper:
            // Bypass applies to this process only; no policy is persisted
            full.push_back(candidate.interpreter.value_or("powershell"));
            full.insert(full.end(),
                        {"-NoProfile", "-ExecutionPolicy", "Bypass", "-File"});
            full.push_back(executable);
            break;
        case InvocationStrategy::DirectExec:
        default:
            full.push_back(executable);
            if (candidate.entrypoint.has_value()) {
                full.push_back(path_for_command_line(*candidate.entrypoint, platform));
            }
            break;
    }

    full.insert(full.end(), argv.begin(), argv.end());
    return full;
}

ProcessHandle::ProcessHandle(std::shared_ptr<EventChannel> channel,
                             std::shared_ptr<std::atomic_bool> cancel_token,
                             std::thread worker)
    : channel_(std::move(channel)),
      cancel_token_(cancel_token ? std::move(cancel_token)
                                 : std::make_shared<std::atomic_bool>(false)),
      worker_(std::move(worker)) {}

ProcessHandle::~ProcessHandle() {
    if (worker_.joinable()) {
        // Abandoned before the child ended: stop it rather than wait forever
        if (!exit_seen_ && !channel_->drained()) {
            cancel_token_->store(true);
        }
        worker_.join();
    }
}

std::optional<ProcessEvent> ProcessHandle::next_event(
    const std::chrono::milliseconds timeout) {
    auto event = channel_->pop(timeout);
    if (event.has_value() && event->kind == ProcessEvent::Kind::Exit) {
        exit_seen_ = true;
    }
    return event;
}

void ProcessHandle::cancel() { cancel_token_->store(true); }

bool ProcessHandle::cancel_requested() const { return cancel_token_->load(); }

bool ProcessHandle::finished() const { return channel_->drained(); }

core::errors::Result<std::unique_ptr<ProcessHandle>> ProcessRunner::run(
    const SpawnRequest& request) {
    if (request.argv.empty()) {
        return CodexError{ErrorCategory::Argv, "argv must not be empty.", "empty_argv"};
    }
    return spawn(request);
}

}  // namespace usbide::process
