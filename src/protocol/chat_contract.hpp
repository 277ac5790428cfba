#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace inkbridge::protocol {

enum class SessionMode {
    Discussion,
    Continue
};

// Whether the target endpoint accepts a second request carrying tool results.
// When it does not, the bridge stops after the first tool round and answers
// with the formatted tool runs.
struct ProviderCapabilities {
    bool supports_tool_result_round = true;
};

struct ChatRequest {
    nlohmann::json provider;
    nlohmann::json parameters;
    std::string system_prompt;
    std::vector<nlohmann::json> messages;
    std::filesystem::path project_dir;
    SessionMode mode = SessionMode::Discussion;
    std::optional<std::string> chapter_id;
    bool allow_write = false;
    ProviderCapabilities capabilities;
};

struct CompletionRequest {
    nlohmann::json provider;
    nlohmann::json parameters;
    std::string system_prompt;
    std::vector<nlohmann::json> messages;
};

struct ChatResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
};

// Endpoints known to reject a follow-up request after tool calls.
inline const std::vector<std::string>& single_tool_round_endpoints() {
    static const std::vector<std::string> endpoints = {"/geminicli/v1"};
    return endpoints;
}

// Providers declare this with a boolean "supportsToolResultRound" in the
// request file. The endpoint table only covers providers that omit it.
inline ProviderCapabilities capabilities_for_provider(const nlohmann::json& provider) {
    ProviderCapabilities capabilities;
    if (!provider.is_object()) {
        return capabilities;
    }
    const auto flag = provider.find("supportsToolResultRound");
    if (flag != provider.end()) {
        if (flag->is_boolean()) {
            capabilities.supports_tool_result_round = flag->get<bool>();
            return capabilities;
        }
        LOG_WARN("provider: ignoring non-boolean supportsToolResultRound");
    }
    const auto base_url = provider.find("baseURL");
    if (base_url == provider.end() || !base_url->is_string()) {
        return capabilities;
    }
    const auto url = base_url->get<std::string>();
    for (const auto& endpoint : single_tool_round_endpoints()) {
        if (url.find(endpoint) != std::string::npos) {
            LOG_DEBUG("provider: baseURL matches " + endpoint +
                      "; no tool_result round (set supportsToolResultRound to override)");
            capabilities.supports_tool_result_round = false;
            break;
        }
    }
    return capabilities;
}

inline std::string to_string(const SessionMode mode) {
    switch (mode) {
        case SessionMode::Discussion:
            return "Discussion";
        case SessionMode::Continue:
            return "Continue";
        default:
            return "unknown";
    }
}

}  // namespace inkbridge::protocol
