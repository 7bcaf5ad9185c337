#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "process/process_runner.hpp"

namespace usbide::process {

// What one scripted invocation prints and how it ends.
struct FakeScript {
    std::vector<std::pair<protocol::StreamOrigin, std::string>> lines;
    int exit_code = 0;
    // Keeps the process "running" after its lines until cancelled.
    bool wait_for_cancel = false;
    std::optional<core::errors::CodexError> spawn_error;
};

// Deterministic runner for tests. Scripts are consumed in FIFO order; with
// none queued an invocation exits 0 without output.
class FakeProcessRunner : public ProcessRunner {
public:
    void enqueue(FakeScript script);

    std::vector<SpawnRequest> requests() const;
    std::size_t pending_scripts() const;

private:
    core::errors::Result<std::unique_ptr<ProcessHandle>> spawn(
        const SpawnRequest& request) override;

    mutable std::mutex mutex_;
    std::deque<FakeScript> scripts_;
    std::vector<SpawnRequest> requests_;
};

}  // namespace usbide::process
