#include "parse/protocol_stream_parser.hpp"

#include <cctype>
#include <initializer_list>
#include <utility>
#include "core/logging/logger.hpp"
#include "diagnostics/diagnostics_classifier.hpp"

namespace usbide::parse {

using nlohmann::json;
using protocol::ActionMessage;
using protocol::AssistantMessage;
using protocol::DedupKey;
using protocol::DisplayEvent;
using protocol::DisplayKind;
using protocol::ErrorMessage;
using protocol::NoticeMessage;
using protocol::ProtocolMessage;
using protocol::RawLine;
using protocol::StreamOrigin;
using protocol::UserMessage;

namespace {

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// Dedup identity: trimmed, runs of whitespace folded to one space
std::string normalize(const std::string& value) {
    std::string folded;
    folded.reserve(value.size());
    bool in_space = false;
    for (const char c : trim(value)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space) {
            folded += ' ';
            in_space = false;
        }
        folded += c;
    }
    return folded;
}

const json* field(const json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> string_field(const json& object, const char* key) {
    const json* value = field(object, key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::string first_string(const json& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto value = string_field(object, key); value.has_value()) {
            return *value;
        }
    }
    return "";
}

std::optional<int> status_field(const json& object) {
    const json* status = field(object, "status");
    if (status != nullptr && status->is_number_integer()) {
        return status->get<int>();
    }
    return std::nullopt;
}

// Scalars print bare, containers as compact JSON.
std::string compact(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool is_one_of(const std::string& value, std::initializer_list<const char*> options) {
    for (const char* option : options) {
        if (value == option) {
            return true;
        }
    }
    return false;
}

// Text blocks of a message "content": a string or an array of typed parts.
std::vector<std::string> texts_from_content(const json* content) {
    std::vector<std::string> texts;
    if (content == nullptr) {
        return texts;
    }
    if (content->is_string()) {
        texts.push_back(content->get<std::string>());
        return texts;
    }
    if (!content->is_array()) {
        return texts;
    }
    for (const auto& part : *content) {
        if (part.is_string()) {
            texts.push_back(part.get<std::string>());
            continue;
        }
        const auto type = string_field(part, "type");
        if (!type.has_value() ||
            !is_one_of(*type, {"output_text", "output_markdown", "text", "input_text"})) {
            continue;
        }
        const std::string text = first_string(part, {"text", "content"});
        if (!text.empty()) {
            texts.push_back(text);
        }
    }
    return texts;
}

std::optional<ActionMessage> format_action(const json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }

    std::string type = string_field(payload, "type").value_or("");
    for (auto& c : type) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    const json* name = field(payload, "name");
    if (name == nullptr) name = field(payload, "tool");
    if (name == nullptr) name = field(payload, "tool_name");
    const json* args = field(payload, "arguments");
    if (args == nullptr) args = field(payload, "args");
    if (args == nullptr) args = field(payload, "input");
    if (args == nullptr) args = field(payload, "parameters");

    if (!is_one_of(type, {"tool_call", "function_call", "action", "tool"})) {
        if (name == nullptr || args == nullptr) {
            return std::nullopt;
        }
    }
    if (name == nullptr) {
        name = field(payload, "id");
    }

    if (name == nullptr && args == nullptr) {
        const std::string description = trim(first_string(payload, {"message", "description"}));
        if (description.empty()) {
            return std::nullopt;
        }
        return ActionMessage{"", description};
    }

    ActionMessage action;
    if (name != nullptr) {
        action.label = compact(*name);
    }
    if (args != nullptr) {
        action.payload = compact(*args);
    }
    if (action.label.empty() && action.payload.empty()) {
        return std::nullopt;
    }
    return action;
}

// codex exec items that describe work the agent did rather than text.
std::optional<ActionMessage> action_from_item(const std::string& type, const json& item) {
    if (type == "command_execution") {
        const json* command = field(item, "command");
        if (command == nullptr) {
            return ActionMessage{"command", ""};
        }
        if (command->is_array()) {
            std::string joined;
            for (const auto& part : *command) {
                if (!joined.empty()) joined += ' ';
                joined += compact(part);
            }
            return ActionMessage{"command", joined};
        }
        return ActionMessage{"command", compact(*command)};
    }
    if (type == "file_change") {
        std::string changed;
        const json* changes = field(item, "changes");
        if (changes != nullptr && changes->is_array()) {
            for (const auto& change : *changes) {
                const std::string path = first_string(change, {"path"});
                if (path.empty()) {
                    continue;
                }
                const std::string kind = first_string(change, {"kind"});
                if (!changed.empty()) changed += ", ";
                changed += kind.empty() ? path : kind + " " + path;
            }
        }
        return ActionMessage{"file_change", changed};
    }
    if (type == "mcp_tool_call") {
        const std::string server = first_string(item, {"server"});
        const std::string tool = first_string(item, {"tool", "name"});
        return ActionMessage{"mcp", server.empty() ? tool : server + "." + tool};
    }
    if (type == "web_search") {
        return ActionMessage{"web_search", first_string(item, {"query"})};
    }
    return std::nullopt;
}

}  // namespace

std::vector<DisplayEvent> ProtocolStreamParser::open_turn(const std::string& prompt) {
    Events out;
    close_buffer(out);
    emit(UserMessage{prompt}, last_sequence_, out);
    return out;
}

std::vector<DisplayEvent> ProtocolStreamParser::feed(const RawLine& line) {
    Events out;
    ++stats_.lines;
    last_sequence_ = line.sequence;

    const std::string trimmed = trim(line.text);
    if (trimmed.empty()) {
        return out;
    }

    // stderr carries CLI diagnostics, never records
    if (line.origin == StreamOrigin::Stderr) {
        skip(line, "stderr", out);
        return out;
    }

    const json record = json::parse(trimmed, nullptr, false);
    if (record.is_discarded()) {
        skip(line, "invalid JSON", out);
        return out;
    }
    if (!record.is_object()) {
        skip(line, "not a JSON object", out);
        return out;
    }

    malformed_streak_ = 0;
    ++stats_.records;
    handle_record(record, line.sequence, out);
    return out;
}

std::vector<DisplayEvent> ProtocolStreamParser::flush() {
    Events out;
    if (buffer_.has_value()) {
        LOG_DEBUG("ProtocolStreamParser: flushing unterminated assistant message");
    }
    close_buffer(out);
    return out;
}

void ProtocolStreamParser::handle_record(const json& record, const std::uint64_t sequence,
                                         Events& out) {
    const std::string type = string_field(record, "type").value_or("");

    if (is_one_of(type, {"response.output_text.delta", "response.output_text"})) {
        append_delta(first_string(record, {"delta", "text"}), sequence);
        return;
    }

    if (is_one_of(type, {"response.output_text.done", "response.output_item.done",
                         "response.completed", "turn.completed"})) {
        if (buffer_.has_value()) {
            close_buffer(out);
        } else if (auto text = string_field(record, "text"); text.has_value()) {
            emit(AssistantMessage{*text, false}, sequence, out);
        }
        return;
    }

    if (type == "error") {
        emit_error(ErrorMessage{status_field(record), first_string(record, {"message"})},
                   sequence, out);
        return;
    }

    if (type == "turn.failed") {
        const json* error = field(record, "error");
        ErrorMessage failure;
        if (error != nullptr && error->is_object()) {
            failure.message = first_string(*error, {"message", "text"});
            failure.transport_status = status_field(*error);
        } else if (error != nullptr && error->is_string()) {
            failure.message = error->get<std::string>();
        }
        emit_error(std::move(failure), sequence, out);
        return;
    }

    static const json kNull;
    const json* payload = field(record, "payload");

    if (type == "event_msg" && payload != nullptr && payload->is_object()) {
        const std::string payload_type = string_field(*payload, "type").value_or("");
        const std::string text = first_string(*payload, {"message", "text"});
        if (is_one_of(payload_type, {"agent_message", "assistant_message"})) {
            close_buffer(out);
            emit(AssistantMessage{text, false}, sequence, out);
        } else if (is_one_of(payload_type, {"user_message", "user"})) {
            emit(UserMessage{text}, sequence, out);
        } else if (auto action = format_action(*payload); action.has_value()) {
            emit(std::move(*action), sequence, out);
        }
    }

    if (type == "response_item" && payload != nullptr) {
        handle_message_payload(*payload, sequence, out);
        if (auto action = format_action(*payload); action.has_value()) {
            emit(std::move(*action), sequence, out);
        }
    }

    if (is_one_of(type, {"tool_call", "function_call", "action", "tool"})) {
        if (auto action = format_action(record); action.has_value()) {
            emit(std::move(*action), sequence, out);
        }
    }

    const json* item = field(record, "item");
    if (item != nullptr && item->is_object()) {
        handle_item(*item, sequence, out);
    }

    handle_tool_calls(record, sequence, out);
    handle_tool_calls(payload != nullptr ? *payload : kNull, sequence, out);
    handle_tool_calls(item != nullptr ? *item : kNull, sequence, out);
}

void ProtocolStreamParser::handle_item(const json& item, const std::uint64_t sequence,
                                       Events& out) {
    const std::string type = string_field(item, "type").value_or("");

    if (type == "message") {
        handle_message_payload(item, sequence, out);
        return;
    }

    if (is_one_of(type, {"agent_message", "assistant_message"})) {
        close_buffer(out);
        for (auto& text : texts_from_content(field(item, "content"))) {
            emit(AssistantMessage{std::move(text), false}, sequence, out);
        }
        emit(AssistantMessage{first_string(item, {"text"}), false}, sequence, out);
        emit(AssistantMessage{first_string(item, {"message"}), false}, sequence, out);
        return;
    }

    if (is_one_of(type, {"user_message", "user"})) {
        for (auto& text : texts_from_content(field(item, "content"))) {
            emit(UserMessage{std::move(text)}, sequence, out);
        }
        emit(UserMessage{first_string(item, {"text"})}, sequence, out);
        emit(UserMessage{first_string(item, {"message"})}, sequence, out);
        return;
    }

    if (auto action = action_from_item(type, item); action.has_value()) {
        emit(std::move(*action), sequence, out);
        return;
    }
    if (auto action = format_action(item); action.has_value()) {
        emit(std::move(*action), sequence, out);
    }
}

void ProtocolStreamParser::handle_message_payload(const json& payload,
                                                  const std::uint64_t sequence,
                                                  Events& out) {
    if (string_field(payload, "type").value_or("") != "message") {
        return;
    }
    const std::string role = string_field(payload, "role").value_or("");
    if (role != "assistant" && role != "user") {
        return;
    }

    std::vector<std::string> texts = texts_from_content(field(payload, "content"));
    if (texts.empty()) {
        texts.push_back(first_string(payload, {"message"}));
    }

    if (role == "assistant") {
        close_buffer(out);
        for (auto& text : texts) {
            emit(AssistantMessage{std::move(text), false}, sequence, out);
        }
        return;
    }
    for (auto& text : texts) {
        emit(UserMessage{std::move(text)}, sequence, out);
    }
}

void ProtocolStreamParser::handle_tool_calls(const json& container,
                                             const std::uint64_t sequence, Events& out) {
    if (!container.is_object()) {
        return;
    }
    if (const json* call = field(container, "tool_call"); call != nullptr && call->is_object()) {
        if (auto action = format_action(*call); action.has_value()) {
            emit(std::move(*action), sequence, out);
        }
    }
    const json* calls = field(container, "tool_calls");
    if (calls == nullptr) {
        calls = field(container, "tools");
    }
    if (calls == nullptr || !calls->is_array()) {
        return;
    }
    for (const auto& call : *calls) {
        if (auto action = format_action(call); action.has_value()) {
            emit(std::move(*action), sequence, out);
        }
    }
}

void ProtocolStreamParser::append_delta(const std::string& delta, const std::uint64_t sequence) {
    if (delta.empty()) {
        return;
    }
    if (!buffer_.has_value()) {
        buffer_ = OpenBuffer{sequence, ""};
    }
    buffer_->text += delta;
}

void ProtocolStreamParser::close_buffer(Events& out) {
    if (!buffer_.has_value()) {
        return;
    }
    OpenBuffer closed = std::move(*buffer_);
    buffer_.reset();
    emit(AssistantMessage{std::move(closed.text), false}, closed.sequence, out);
}

void ProtocolStreamParser::emit_error(ErrorMessage error, const std::uint64_t sequence,
                                      Events& out) {
    if (!error.transport_status.has_value()) {
        error.transport_status = diagnostics::extract_status_code(error.message);
    }
    if (trim(error.message).empty()) {
        error.message = "Codex reported an error.";
    }
    last_error_ = error;
    emit(std::move(error), sequence, out);
}

void ProtocolStreamParser::emit(ProtocolMessage message, const std::uint64_t sequence,
                                Events& out) {
    const DedupKey key{protocol::kind_of(message), normalize(protocol::text_of(message))};
    if (key.content.empty()) {
        return;
    }
    // Buffered assistant text stays ahead of every later record
    if (key.kind != DisplayKind::Assistant) {
        close_buffer(out);
    }

    std::optional<DedupKey>* last = nullptr;
    switch (key.kind) {
        case DisplayKind::User:
            last = &last_user_;
            break;
        case DisplayKind::Assistant:
            last = &last_assistant_;
            break;
        case DisplayKind::Action:
            last = &last_action_;
            break;
        default:
            break;
    }

    if (last != nullptr) {
        if (last->has_value() && **last == key) {
            ++stats_.suppressed;
            return;
        }
        *last = key;
    }

    // A user message opens a new turn
    if (key.kind == DisplayKind::User) {
        last_assistant_.reset();
        last_action_.reset();
    }

    ++stats_.emitted;
    out.push_back(DisplayEvent{sequence, std::move(message)});
}

void ProtocolStreamParser::skip(const RawLine& line, std::string reason, Events& out) {
    ++stats_.skipped;
    skipped_.push_back(SkippedLine{line.sequence, line.origin, line.text, std::move(reason)});
    while (skipped_.size() > kMaxRetainedSkipped) {
        skipped_.pop_front();
    }

    if (line.origin != StreamOrigin::Stdout) {
        return;
    }
    ++malformed_streak_;
    if (malformed_streak_ == kMalformedStreakThreshold) {
        LOG_WARN("ProtocolStreamParser: " + std::to_string(kMalformedStreakThreshold) +
                 " consecutive undecodable lines");
        emit(NoticeMessage{"Received " + std::to_string(kMalformedStreakThreshold) +
                           " consecutive lines that are not Codex JSON records; this "
                           "Codex version may not be compatible."},
             line.sequence, out);
    }
}

}  // namespace usbide::parse
