#pragma once

#include "core/errors/codex_errors.hpp"
#include "protocol/command_spec.hpp"

namespace usbide::command {

inline constexpr const char* kJsonFlag = "--json";
inline constexpr const char* kDeviceAuthFlag = "--device-auth";

// Builds the argv that follows the executable for one operation.
// Flags always come right after the subcommand, free-form text last.
class CommandBuilder {
public:
    core::errors::Result<protocol::CommandSpec> build(
        protocol::Operation operation, const protocol::CommandParams& params) const;

private:
    core::errors::Result<protocol::CommandSpec> build_exec(
        const protocol::CommandParams& params) const;
    core::errors::Result<protocol::CommandSpec> build_install(
        const protocol::CommandParams& params) const;
};

}  // namespace usbide::command
