#pragma once

#include <optional>
#include <string>
#include "core/errors/codex_errors.hpp"
#include "protocol/event_contract.hpp"

namespace usbide::diagnostics {

enum class DiagnosticKind {
    Success,
    Unauthenticated,    // 401
    Forbidden,          // 403
    ProxyAuthRequired,  // 407
    RateLimited,        // 429
    ServerError,        // 5xx
    TransportFailure,   // any other transport status
    ProcessFailure,     // non-zero exit, no status
    Cancelled
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Success;
    std::optional<int> status;
    std::string summary;
    std::string guidance;  // empty on success

    bool success() const { return kind == DiagnosticKind::Success; }
};

// Maps how an invocation ended to one user-facing diagnosis. Pure; never retries.
Diagnostic classify(int exit_code,
                    const std::optional<protocol::ErrorMessage>& last_error,
                    bool cancelled = false);

// "unexpected status 401" / "last status: 429" first, otherwise the first
// standalone three-digit number between 100 and 599.
std::optional<int> extract_status_code(const std::string& message);

std::optional<std::string> hint_for_status(int status);

// Actionable sentence for failures that happen before or instead of a run.
std::string guidance_for(const core::errors::CodexError& error);

// Short readable form of known codex CLI usage and status lines.
std::optional<std::string> translate_cli_line(const std::string& line);

std::string to_string(DiagnosticKind kind);

}  // namespace usbide::diagnostics
