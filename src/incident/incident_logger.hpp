#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/codex_errors.hpp"

namespace usbide::incident {

enum class Severity {
    Info,
    Warning,
    Error
};

struct Incident {
    Severity severity = Severity::Error;
    std::string context;  // e.g. "exec", "install"
    std::string message;
    std::optional<std::string> details;
};

// Where failures are reported. Appending never fails the caller.
class IncidentSink {
public:
    virtual ~IncidentSink() = default;
    virtual void append(const Incident& incident) noexcept = 0;
};

// One JSON object per line in <root>/.usbide/incidents.jsonl.
class FileIncidentLogger : public IncidentSink {
public:
    explicit FileIncidentLogger(std::filesystem::path log_path);

    void append(const Incident& incident) noexcept override;

    // The fallible write behind append(); returns the file written.
    core::errors::Result<std::filesystem::path> write(const Incident& incident) const;

    const std::filesystem::path& log_path() const { return log_path_; }

private:
    std::filesystem::path log_path_;
};

// Masks API keys, bearer tokens and denylisted NAME=value pairs.
std::string redact_secrets(const std::string& text);

// ISO-8601 UTC, e.g. 2024-05-01T12:00:00Z
std::string format_timestamp(std::time_t time);

std::string to_string(Severity severity);

}  // namespace usbide::incident
