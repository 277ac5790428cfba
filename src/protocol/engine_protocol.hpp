#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace inkbridge::protocol {

    // Engine -> bridge messages, one JSON object per line.
    struct DoneMessage { std::string content; };
    struct ErrorMessage { std::string message; };
    struct RequestedToolCall {
        std::string id;
        std::string name;
        nlohmann::json args;
    };
    struct ToolCallMessage { std::vector<RequestedToolCall> calls; };
    struct ModelsMessage { std::vector<std::string> models; };
    struct CompactSummaryMessage { std::string content; };

    using EngineMessage = std::variant<
        DoneMessage,
        ErrorMessage,
        ToolCallMessage,
        ModelsMessage,
        CompactSummaryMessage
    >;

    // Bridge -> engine lines (without the trailing newline).
    std::string encode_chat_request(const ChatRequest& request);
    std::string encode_completion_request(const CompletionRequest& request);
    std::string encode_compact_request(const nlohmann::json& provider,
                                       const nlohmann::json& parameters,
                                       const std::vector<nlohmann::json>& messages);
    std::string encode_fetch_models_request(const std::string& provider_type,
                                            const std::string& base_url,
                                            const std::string& api_key);
    std::string encode_tool_results(const std::vector<ToolResultEntry>& results);

    // Fails with ProtocolViolation on malformed JSON, a missing/unknown "type",
    // or a tool_call whose "calls" is not an array. The raw line is embedded.
    core::errors::Result<EngineMessage> parse_engine_message(const std::string& line);

    nlohmann::json tool_call_to_json(const ToolCall& call);
    nlohmann::json chat_response_to_json(const ChatResponse& response);

} // namespace inkbridge::protocol
