#include "diagnostics/diagnostics_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace usbide::diagnostics {

using core::errors::CodexError;
using core::errors::ErrorCategory;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool contains(const std::string& value, const std::string& needle) {
    return value.find(needle) != std::string::npos;
}

bool mentions_bad_argument(const std::string& lower) {
    return contains(lower, "unexpected argument") || contains(lower, "unknown argument") ||
           contains(lower, "unrecognized");
}

Diagnostic for_status(const int status) {
    Diagnostic diagnostic;
    diagnostic.status = status;
    diagnostic.guidance = hint_for_status(status).value_or(
        "The request failed with HTTP " + std::to_string(status) +
        ". Check the network connection and try again.");

    if (status == 401) {
        diagnostic.kind = DiagnosticKind::Unauthenticated;
        diagnostic.summary = "Codex is not authenticated (HTTP 401).";
    } else if (status == 403) {
        diagnostic.kind = DiagnosticKind::Forbidden;
        diagnostic.summary = "Codex access was refused (HTTP 403).";
    } else if (status == 407) {
        diagnostic.kind = DiagnosticKind::ProxyAuthRequired;
        diagnostic.summary = "The proxy requires authentication (HTTP 407).";
    } else if (status == 429) {
        diagnostic.kind = DiagnosticKind::RateLimited;
        diagnostic.summary = "Codex is rate limited (HTTP 429).";
    } else if (status >= 500 && status <= 599) {
        diagnostic.kind = DiagnosticKind::ServerError;
        diagnostic.summary = "The Codex service failed (HTTP " + std::to_string(status) + ").";
    } else {
        diagnostic.kind = DiagnosticKind::TransportFailure;
        diagnostic.summary = "Codex request failed (HTTP " + std::to_string(status) + ").";
    }
    return diagnostic;
}

}  // namespace

std::optional<int> extract_status_code(const std::string& message) {
    static const std::regex kLabelled(R"((?:unexpected status|last status[: ]+)\s*(\d{3}))",
                                      std::regex::icase);
    static const std::regex kStandalone(R"(\b(\d{3})\b)");

    std::smatch match;
    if (std::regex_search(message, match, kLabelled)) {
        return std::stoi(match[1].str());
    }

    for (auto it = std::sregex_iterator(message.begin(), message.end(), kStandalone);
         it != std::sregex_iterator(); ++it) {
        const int value = std::stoi((*it)[1].str());
        if (value >= 100 && value <= 599) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> hint_for_status(const int status) {
    switch (status) {
        case 401:
            return "Authentication is invalid or expired. Run `usbide_codex login` "
                   "(or `codex logout` then log in again with ChatGPT).";
        case 403:
            return "Access is forbidden. Check that you logged in with ChatGPT and not "
                   "an API key, and check your account rights and network.";
        case 407:
            return "The proxy requires authentication. Configure HTTP_PROXY/HTTPS_PROXY "
                   "with your proxy credentials.";
        case 429:
            return "Too many requests. Wait a moment and try again more slowly.";
        default:
            break;
    }
    if (status >= 500 && status <= 599) {
        return std::string("The service reported a server error. Try again later; "
                           "the incident is probably on the provider side.");
    }
    return std::nullopt;
}

Diagnostic classify(const int exit_code,
                    const std::optional<protocol::ErrorMessage>& last_error,
                    const bool cancelled) {
    if (cancelled) {
        Diagnostic diagnostic;
        diagnostic.kind = DiagnosticKind::Cancelled;
        diagnostic.summary = "The invocation was cancelled.";
        diagnostic.guidance = "Run the command again when ready.";
        return diagnostic;
    }

    Diagnostic diagnostic;
    if (exit_code == 0) {
        diagnostic.kind = DiagnosticKind::Success;
        diagnostic.summary = "Completed.";
        return diagnostic;
    }

    // A transport status only refines a failed run.
    std::optional<int> status;
    if (last_error.has_value()) {
        status = last_error->transport_status.has_value()
                     ? last_error->transport_status
                     : extract_status_code(last_error->message);
    }
    if (status.has_value()) {
        return for_status(*status);
    }

    diagnostic.kind = DiagnosticKind::ProcessFailure;
    diagnostic.summary = "Codex exited with code " + std::to_string(exit_code) + ".";
    if (last_error.has_value() && !trim(last_error->message).empty()) {
        diagnostic.summary += " " + trim(last_error->message);
    }
    diagnostic.guidance =
        "Check the output above and the incident log in .usbide/incidents.jsonl, "
        "then try again.";
    return diagnostic;
}

std::string guidance_for(const CodexError& error) {
    if (!error.hint.empty()) {
        return error.hint;
    }
    switch (error.category) {
        case ErrorCategory::Resolution:
            return "Install Codex with `usbide_codex install`, or put `codex` on PATH.";
        case ErrorCategory::Environment:
            return "The process environment could not be read. Restart the IDE and try again.";
        case ErrorCategory::Argv:
            return "Check the command arguments; a prompt or package name is required.";
        case ErrorCategory::Spawn:
            return "The Codex process could not be started. Reinstall it with "
                   "`usbide_codex install`.";
        case ErrorCategory::Auth:
            return "Log in with `usbide_codex login` (add --device-auth without a browser).";
        case ErrorCategory::Input:
            return "Run `usbide_codex --help` for usage.";
        case ErrorCategory::ProcessExit:
            return "Check the output above and try again.";
        case ErrorCategory::Protocol:
            return "The Codex output format was not recognised; update Codex.";
        case ErrorCategory::Internal:
        default:
            return "Try again; if it keeps failing, see .usbide/incidents.jsonl.";
    }
}

std::optional<std::string> translate_cli_line(const std::string& line) {
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const std::string lower = to_lower(trimmed);

    if (contains(lower, "--ask-for-approval") && mentions_bad_argument(lower)) {
        return std::string("Error: this Codex version does not accept --ask-for-approval.");
    }
    if (starts_with(lower, "tip:") && contains(lower, "--ask-for-approval")) {
        return std::string(
            "Tip: to pass --ask-for-approval as a value, use -- --ask-for-approval.");
    }
    if (starts_with(lower, "usage: codex exec")) {
        return std::string("Usage: codex exec --json --sandbox <SANDBOX_MODE> [PROMPT].");
    }
    if (starts_with(lower, "for more information") || contains(lower, "try '--help'")) {
        return std::string("For more information, use --help.");
    }
    if (starts_with(lower, "error:")) {
        if (mentions_bad_argument(lower)) {
            return std::string("Error: unknown or invalid option. See --help.");
        }
        return std::string("Error: invalid Codex command. See --help.");
    }
    if (starts_with(lower, "logged in using")) {
        return std::string("Logged in with ChatGPT.");
    }
    if (starts_with(lower, "up to date in")) {
        return std::string("Up to date.");
    }
    return std::nullopt;
}

std::string to_string(const DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::Success: return "success";
        case DiagnosticKind::Unauthenticated: return "unauthenticated";
        case DiagnosticKind::Forbidden: return "forbidden";
        case DiagnosticKind::ProxyAuthRequired: return "proxy_auth_required";
        case DiagnosticKind::RateLimited: return "rate_limited";
        case DiagnosticKind::ServerError: return "server_error";
        case DiagnosticKind::TransportFailure: return "transport_failure";
        case DiagnosticKind::ProcessFailure: return "process_failure";
        case DiagnosticKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

}  // namespace usbide::diagnostics
