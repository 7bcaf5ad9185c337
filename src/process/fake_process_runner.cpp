#include "process/fake_process_runner.hpp"

#include <chrono>
#include <thread>

namespace usbide::process {

namespace {

constexpr int kKilledExitCode = 128 + 9;

void push_exit(EventChannel& channel, const int exit_code, const bool cancelled) {
    ProcessEvent exit_event;
    exit_event.kind = ProcessEvent::Kind::Exit;
    exit_event.exit_code = exit_code;
    exit_event.cancelled = cancelled;
    channel.push(std::move(exit_event));
    channel.close();
}

}  // namespace

void FakeProcessRunner::enqueue(FakeScript script) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_.push_back(std::move(script));
}

std::vector<SpawnRequest> FakeProcessRunner::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t FakeProcessRunner::pending_scripts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scripts_.size();
}

core::errors::Result<std::unique_ptr<ProcessHandle>> FakeProcessRunner::spawn(
    const SpawnRequest& request) {
    FakeScript script;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (!scripts_.empty()) {
            script = std::move(scripts_.front());
            scripts_.pop_front();
        }
    }

    if (script.spawn_error.has_value()) {
        return *script.spawn_error;
    }

    auto channel = std::make_shared<EventChannel>();
    auto cancel_token = request.cancel_token
                            ? request.cancel_token
                            : std::make_shared<std::atomic_bool>(false);

    std::uint64_t sequence = 0;
    for (const auto& [origin, text] : script.lines) {
        ProcessEvent event;
        event.kind = ProcessEvent::Kind::Line;
        event.line = protocol::RawLine{origin, sequence++, text};
        channel->push(std::move(event));
    }

    if (!script.wait_for_cancel) {
        push_exit(*channel, script.exit_code, false);
        return std::make_unique<ProcessHandle>(channel, cancel_token);
    }

    std::thread worker([channel, cancel_token]() {
        while (!cancel_token->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        push_exit(*channel, kKilledExitCode, true);
    });
    return std::make_unique<ProcessHandle>(channel, cancel_token, std::move(worker));
}

}  // namespace usbide::process
