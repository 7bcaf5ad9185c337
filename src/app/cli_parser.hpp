#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/codex_errors.hpp"
#include "protocol/command_spec.hpp"

namespace usbide::app::cli {

    // Validated command line. Options left unset fall back to Settings.
    struct CliRequest {
        usbide::protocol::Operation operation = usbide::protocol::Operation::Status;
        std::filesystem::path root;  // canonical workspace root
        bool verbose = false;
        bool device_auth = false;
        std::optional<usbide::protocol::SandboxMode> sandbox;
        std::optional<usbide::protocol::ApprovalPolicy> approval;
        std::string prompt;
        std::optional<std::string> package;
    };

    std::string usage();

    usbide::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}
