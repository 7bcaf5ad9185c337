#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/event_contract.hpp"

namespace usbide::parse {

// A line that produced no record. Kept for the incident log, never fatal.
struct SkippedLine {
    std::uint64_t sequence = 0;
    protocol::StreamOrigin origin = protocol::StreamOrigin::Stdout;
    std::string text;
    std::string reason;
};

struct ParserStats {
    std::size_t lines = 0;
    std::size_t records = 0;
    std::size_t skipped = 0;
    std::size_t emitted = 0;
    std::size_t suppressed = 0;
};

// Turns the `codex exec --json` line stream into display events.
//
// Deltas accumulate into one open assistant message that is emitted when a
// turn-complete record arrives (or on flush). Repeated messages are dropped:
// an action equal to the last action, an assistant message equal to the last
// one of the current turn, a user message equal to the previous user message.
// One instance per invocation; not thread-safe.
class ProtocolStreamParser {
public:
    static constexpr std::size_t kMalformedStreakThreshold = 5;
    static constexpr std::size_t kMaxRetainedSkipped = 32;

    // Emits the caller's prompt as the user message that opens the turn.
    std::vector<protocol::DisplayEvent> open_turn(const std::string& prompt);

    std::vector<protocol::DisplayEvent> feed(const protocol::RawLine& line);

    // Emits whatever assistant text is still buffered.
    std::vector<protocol::DisplayEvent> flush();

    const std::optional<protocol::ErrorMessage>& last_error() const { return last_error_; }
    const std::deque<SkippedLine>& skipped() const { return skipped_; }
    const ParserStats& stats() const { return stats_; }
    bool has_open_assistant() const { return buffer_.has_value(); }

private:
    using Events = std::vector<protocol::DisplayEvent>;

    void handle_record(const nlohmann::json& record, std::uint64_t sequence, Events& out);
    void handle_item(const nlohmann::json& item, std::uint64_t sequence, Events& out);
    void handle_message_payload(const nlohmann::json& payload, std::uint64_t sequence,
                                Events& out);
    void handle_tool_calls(const nlohmann::json& container, std::uint64_t sequence,
                           Events& out);

    void append_delta(const std::string& delta, std::uint64_t sequence);
    void close_buffer(Events& out);
    void emit_error(protocol::ErrorMessage error, std::uint64_t sequence, Events& out);
    void emit(protocol::ProtocolMessage message, std::uint64_t sequence, Events& out);

    void skip(const protocol::RawLine& line, std::string reason, Events& out);

    struct OpenBuffer {
        std::uint64_t sequence = 0;
        std::string text;
    };

    std::optional<OpenBuffer> buffer_;
    std::optional<protocol::DedupKey> last_user_;
    std::optional<protocol::DedupKey> last_assistant_;
    std::optional<protocol::DedupKey> last_action_;
    std::optional<protocol::ErrorMessage> last_error_;
    std::deque<SkippedLine> skipped_;
    std::size_t malformed_streak_ = 0;
    std::uint64_t last_sequence_ = 0;
    ParserStats stats_;
};

}  // namespace usbide::parse
