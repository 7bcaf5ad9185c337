#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/codex_errors.hpp"
#include "incident/incident_logger.hpp"

namespace {

using usbide::core::errors::get_error;
using usbide::core::errors::is_error;
using usbide::incident::FileIncidentLogger;
using usbide::incident::Incident;
using usbide::incident::Severity;
using usbide::incident::redact_secrets;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_incident_logger_" + usbide::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<nlohmann::json> read_records(const std::filesystem::path& path) {
    std::vector<nlohmann::json> records;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        records.push_back(nlohmann::json::parse(line));
    }
    return records;
}

TEST(IncidentLoggerTest, AppendsOneJsonRecordPerIncident) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / ".usbide" / "incidents.jsonl";
    FileIncidentLogger logger(log_path);

    logger.append(Incident{Severity::Error, "exec", "Codex exited with code 1.",
                           std::string("stderr tail")});
    logger.append(Incident{Severity::Info, "login", "The invocation was cancelled.",
                           std::nullopt});

    const auto records = read_records(log_path);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["severity"].get<std::string>(), "error");
    EXPECT_EQ(records[0]["context"].get<std::string>(), "exec");
    EXPECT_EQ(records[0]["message"].get<std::string>(), "Codex exited with code 1.");
    EXPECT_EQ(records[0]["details"].get<std::string>(), "stderr tail");
    EXPECT_TRUE(records[0]["timestamp"].is_string());
    EXPECT_EQ(records[1]["severity"].get<std::string>(), "info");
    EXPECT_FALSE(records[1].contains("details"));
}

TEST(IncidentLoggerTest, RedactsSecretsBeforeWriting) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "incidents.jsonl";
    FileIncidentLogger logger(log_path);

    auto result = logger.write(Incident{Severity::Error, "exec",
                                        "env OPENAI_API_KEY=sk-live-abcdefghijkl set",
                                        std::string("Authorization: Bearer eyJhbGciOi.x.y")});
    ASSERT_FALSE(is_error(result));

    const auto records = read_records(log_path);
    ASSERT_EQ(records.size(), 1u);
    const std::string message = records[0]["message"];
    const std::string details = records[0]["details"];
    EXPECT_EQ(message.find("abcdefghijkl"), std::string::npos);
    EXPECT_NE(message.find("OPENAI_API_KEY=***"), std::string::npos);
    EXPECT_EQ(details, "Authorization: Bearer ***");
}

TEST(IncidentLoggerTest, RedactionRules) {
    EXPECT_EQ(redact_secrets("key sk-proj-0123456789abcdef here"), "key sk-*** here");
    EXPECT_EQ(redact_secrets("OPENAI_BASE_URL=https://proxy.local/v1"), "OPENAI_BASE_URL=***");
    EXPECT_EQ(redact_secrets("bearer abc.def"), "bearer ***");
    EXPECT_EQ(redact_secrets("nothing secret, sk-short"), "nothing secret, sk-short");
}

TEST(IncidentLoggerTest, WriteFailureIsReportedButAppendDoesNotThrow) {
    TempWorkspace workspace;
    // A directory where the log file should be
    const auto log_path = workspace.root() / "incidents.jsonl";
    std::filesystem::create_directories(log_path);
    FileIncidentLogger logger(log_path);

    auto result = logger.write(Incident{Severity::Error, "exec", "boom", std::nullopt});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "incident_open_failed");

    EXPECT_NO_THROW(logger.append(Incident{Severity::Error, "exec", "boom", std::nullopt}));
}

TEST(IncidentLoggerTest, FormatsTimestampsInUtc) {
    EXPECT_EQ(usbide::incident::format_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(usbide::incident::format_timestamp(1714564800), "2024-05-01T12:00:00Z");
}

}  // namespace
