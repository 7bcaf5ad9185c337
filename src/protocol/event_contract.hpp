#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace usbide::protocol {

    enum class StreamOrigin {
        Stdout,
        Stderr
    };

    // One line of child output, tagged with its stream and arrival order
    struct RawLine {
        StreamOrigin origin = StreamOrigin::Stdout;
        std::uint64_t sequence = 0;
        std::string text;
    };

    // The protocol messages an exec invocation can produce
    struct UserMessage { std::string text; };
    struct AssistantMessage {
        std::string text;
        bool open = false;  // still accumulating deltas
    };
    struct ActionMessage {
        std::string label;    // tool or command kind, e.g. "shell"
        std::string payload;  // arguments as compact text
    };
    struct ErrorMessage {
        std::optional<int> transport_status;
        std::string message;
    };
    // Raised by the parser itself (e.g. a run of undecodable lines)
    struct NoticeMessage { std::string text; };

    // std::variant means a ProtocolMessage is exactly ONE of these types.
    using ProtocolMessage = std::variant<
        UserMessage,
        AssistantMessage,
        ActionMessage,
        ErrorMessage,
        NoticeMessage
    >;

    enum class DisplayKind {
        User,
        Assistant,
        Action,
        Error,
        Notice
    };

    // Finalized transcript entry, append-only within an invocation
    struct DisplayEvent {
        std::uint64_t sequence = 0;
        ProtocolMessage message;
    };

    // Identity used to suppress repeated messages
    struct DedupKey {
        DisplayKind kind;
        std::string content;

        bool operator==(const DedupKey& other) const {
            return kind == other.kind && content == other.content;
        }
        bool operator!=(const DedupKey& other) const { return !(*this == other); }
    };

    inline DisplayKind kind_of(const ProtocolMessage& message) {
        switch (message.index()) {
            case 0: return DisplayKind::User;
            case 1: return DisplayKind::Assistant;
            case 2: return DisplayKind::Action;
            case 3: return DisplayKind::Error;
            default: return DisplayKind::Notice;
        }
    }

    inline DisplayKind kind_of(const DisplayEvent& event) {
        return kind_of(event.message);
    }

    // Human-readable body of a message, as the transcript shows it
    inline std::string text_of(const ProtocolMessage& message) {
        if (const auto* user = std::get_if<UserMessage>(&message)) {
            return user->text;
        }
        if (const auto* assistant = std::get_if<AssistantMessage>(&message)) {
            return assistant->text;
        }
        if (const auto* action = std::get_if<ActionMessage>(&message)) {
            if (action->payload.empty()) {
                return action->label;
            }
            if (action->label.empty()) {
                return action->payload;
            }
            return action->label + ": " + action->payload;
        }
        if (const auto* error = std::get_if<ErrorMessage>(&message)) {
            return error->message;
        }
        return std::get<NoticeMessage>(message).text;
    }

    inline std::string text_of(const DisplayEvent& event) {
        return text_of(event.message);
    }

    inline std::string to_string(const DisplayKind kind) {
        switch (kind) {
            case DisplayKind::User: return "user";
            case DisplayKind::Assistant: return "assistant";
            case DisplayKind::Action: return "action";
            case DisplayKind::Error: return "error";
            case DisplayKind::Notice: return "notice";
            default: return "unknown";
        }
    }

} // namespace usbide::protocol
