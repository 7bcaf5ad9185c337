#include "incident/incident_logger.hpp"

#include <fstream>
#include <regex>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "env/environment_builder.hpp"

namespace usbide::incident {

using core::errors::CodexError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

const std::regex& denylisted_assignment() {
    static const std::regex pattern = [] {
        std::string names;
        for (const auto* list : {&env::api_key_variables(), &env::custom_base_variables()}) {
            for (const auto& name : *list) {
                names += (names.empty() ? "" : "|") + name;
            }
        }
        return std::regex("\\b(" + names + ")=[^\\s\"']+");
    }();
    return pattern;
}

}  // namespace

std::string to_string(const Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "unknown";
    }
}

std::string redact_secrets(const std::string& text) {
    static const std::regex kApiKey(R"(sk-[A-Za-z0-9_\-]{8,})");
    static const std::regex kBearer(R"((Bearer\s+)[A-Za-z0-9._~+/=\-]+)", std::regex::icase);

    std::string redacted = std::regex_replace(text, denylisted_assignment(), "$1=***");
    redacted = std::regex_replace(redacted, kBearer, "$1***");
    redacted = std::regex_replace(redacted, kApiKey, "sk-***");
    return redacted;
}

std::string format_timestamp(const std::time_t time) {
    std::tm utc{};
#ifdef _WIN32
    if (gmtime_s(&utc, &time) != 0) {
#else
    if (gmtime_r(&time, &utc) == nullptr) {
#endif
        return "1970-01-01T00:00:00Z";
    }
    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

FileIncidentLogger::FileIncidentLogger(std::filesystem::path log_path)
    : log_path_(std::move(log_path)) {}

core::errors::Result<std::filesystem::path> FileIncidentLogger::write(
    const Incident& incident) const {
    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return CodexError{ErrorCategory::Internal,
                              "Unable to create incident directory: " + parent.string(),
                              "incident_dir_create_failed"};
        }
    }

    json entry;
    entry["timestamp"] = format_timestamp(std::time(nullptr));
    entry["severity"] = to_string(incident.severity);
    entry["context"] = incident.context;
    entry["message"] = redact_secrets(incident.message);
    if (incident.details.has_value() && !incident.details->empty()) {
        entry["details"] = redact_secrets(*incident.details);
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return CodexError{ErrorCategory::Internal,
                          "Unable to open incident log: " + log_path_.string(),
                          "incident_open_failed"};
    }

    out << entry.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return CodexError{ErrorCategory::Internal,
                          "Unable to write incident log: " + log_path_.string(),
                          "incident_write_failed"};
    }
    return log_path_;
}

void FileIncidentLogger::append(const Incident& incident) noexcept {
    const auto result = write(incident);
    if (core::errors::is_error(result)) {
        LOG_WARN("FileIncidentLogger: " + core::errors::get_error(result).message);
    }
}

}  // namespace usbide::incident
