#pragma once

#include "process/process_runner.hpp"

namespace usbide::process {

// fork/execve runner. The child gets its own process group so that
// cancellation also reaches whatever node spawns underneath it.
class PosixProcessRunner : public ProcessRunner {
private:
    core::errors::Result<std::unique_ptr<ProcessHandle>> spawn(
        const SpawnRequest& request) override;
};

}  // namespace usbide::process
