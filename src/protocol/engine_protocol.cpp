#include "protocol/engine_protocol.hpp"

namespace inkbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

json messages_to_json(const std::vector<json>& messages) {
    json array = json::array();
    for (const auto& message : messages) {
        array.push_back(message);
    }
    return array;
}

std::string string_field(const json& object, const char* key, const std::string& fallback) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::string strip_line_ending(std::string line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

BridgeError violation(const std::string& message, const std::string& code) {
    return BridgeError{ErrorKind::ProtocolViolation, message, code};
}

}  // namespace

std::string encode_chat_request(const ChatRequest& request) {
    json payload;
    payload["type"] = "chat";
    payload["provider"] = request.provider;
    payload["parameters"] = request.parameters;
    payload["systemPrompt"] = request.system_prompt;
    payload["messages"] = messages_to_json(request.messages);
    return payload.dump();
}

std::string encode_completion_request(const CompletionRequest& request) {
    json payload;
    payload["type"] = "complete";
    payload["provider"] = request.provider;
    payload["parameters"] = request.parameters;
    payload["systemPrompt"] = request.system_prompt;
    payload["messages"] = messages_to_json(request.messages);
    return payload.dump();
}

std::string encode_compact_request(const json& provider, const json& parameters,
                                   const std::vector<json>& messages) {
    json payload;
    payload["type"] = "compact";
    payload["provider"] = provider;
    payload["parameters"] = parameters;
    payload["messages"] = messages_to_json(messages);
    return payload.dump();
}

std::string encode_fetch_models_request(const std::string& provider_type,
                                        const std::string& base_url,
                                        const std::string& api_key) {
    json payload;
    payload["type"] = "fetch_models";
    payload["providerType"] = provider_type;
    payload["baseURL"] = base_url;
    payload["apiKey"] = api_key;
    return payload.dump();
}

std::string encode_tool_results(const std::vector<ToolResultEntry>& results) {
    json entries = json::array();
    for (const auto& entry : results) {
        json item;
        item["id"] = entry.id;
        item["result"] = entry.result;
        if (entry.error.has_value()) {
            item["error"] = entry.error.value();
        }
        entries.push_back(std::move(item));
    }

    json payload;
    payload["type"] = "tool_result";
    payload["results"] = std::move(entries);
    return payload.dump();
}

core::errors::Result<EngineMessage> parse_engine_message(const std::string& raw_line) {
    const std::string line = strip_line_ending(raw_line);

    json response;
    try {
        response = json::parse(line);
    } catch (const json::parse_error& e) {
        return violation("Failed to parse engine response: " + std::string(e.what()) +
                             ". line=" + line,
                         "malformed_response");
    }
    if (!response.is_object()) {
        return violation("Engine response is not an object: " + line, "malformed_response");
    }

    const std::string type = string_field(response, "type", "");
    if (type == "done") {
        return DoneMessage{string_field(response, "content", "")};
    }
    if (type == "error") {
        return ErrorMessage{string_field(response, "message", "Unknown error")};
    }
    if (type == "tool_call") {
        const auto calls = response.find("calls");
        if (calls == response.end() || !calls->is_array()) {
            return violation("Invalid tool_call format: " + line, "invalid_tool_call");
        }
        ToolCallMessage message;
        for (const auto& call : *calls) {
            if (!call.is_object()) {
                return violation("Invalid tool_call entry: " + line, "invalid_tool_call");
            }
            RequestedToolCall requested;
            requested.id = string_field(call, "id", "");
            requested.name = string_field(call, "name", "");
            const auto args = call.find("args");
            requested.args = args == call.end() ? json(nullptr) : *args;
            message.calls.push_back(std::move(requested));
        }
        return message;
    }
    if (type == "models") {
        const auto models = response.find("models");
        if (models == response.end() || !models->is_array()) {
            return violation("Invalid models format: " + line, "invalid_models");
        }
        ModelsMessage message;
        for (const auto& model : *models) {
            if (model.is_string()) {
                message.models.push_back(model.get<std::string>());
            }
        }
        return message;
    }
    if (type == "compact_summary") {
        return CompactSummaryMessage{string_field(response, "content", "")};
    }

    return violation("Unknown response type: " + line, "unknown_response_type");
}

json tool_call_to_json(const ToolCall& call) {
    json payload;
    payload["id"] = call.id;
    payload["name"] = call.name;
    payload["args"] = call.args;
    payload["status"] = to_string(call.status);
    payload["result"] = call.result.has_value() ? json(call.result.value()) : json(nullptr);
    payload["error"] = call.error.has_value() ? json(call.error.value()) : json(nullptr);
    payload["duration"] =
        call.duration_ms.has_value() ? json(call.duration_ms.value()) : json(nullptr);
    return payload;
}

json chat_response_to_json(const ChatResponse& response) {
    json calls = json::array();
    for (const auto& call : response.tool_calls) {
        calls.push_back(tool_call_to_json(call));
    }
    json payload;
    payload["content"] = response.content;
    payload["toolCalls"] = std::move(calls);
    return payload;
}

}  // namespace inkbridge::protocol
