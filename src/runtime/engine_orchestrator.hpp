#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "engine/engine_session.hpp"
#include "project/knowledge_search.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/engine_protocol.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_dispatcher.hpp"

namespace inkbridge::runtime {

inline constexpr const char* kChatTimeoutMessage =
    "AI request timed out (retry or switch model/provider)";
inline constexpr const char* kCompleteTimeoutMessage =
    "Completion request timed out (retry or switch model/provider)";

// Runs engine exchanges. Each call spawns a fresh engine child and returns
// only after that child has been reaped.
class EngineOrchestrator {
public:
    explicit EngineOrchestrator(core::config::BridgeConfig config,
                                const project::KnowledgeSearch* knowledge_search = nullptr);

    // Multi-round chat: tool calls requested by the engine are executed in
    // order against request.project_dir and their results sent back, until
    // the engine answers "done" or "error". `observer` callbacks run on the
    // calling thread.
    core::errors::Result<protocol::ChatResponse> run_chat(
        const protocol::ChatRequest& request,
        const protocol::ToolCallObserver* observer = nullptr,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    core::errors::Result<std::string> run_complete(
        const protocol::CompletionRequest& request,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    // Asks the engine to condense a conversation into a summary.
    core::errors::Result<std::string> run_compact(
        const nlohmann::json& provider,
        const nlohmann::json& parameters,
        const std::vector<nlohmann::json>& messages,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    core::errors::Result<std::vector<std::string>> fetch_models(
        const std::string& provider_type,
        const std::string& base_url,
        const std::string& api_key,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    const core::config::BridgeConfig& config() const { return config_; }

private:
    core::errors::Result<std::unique_ptr<engine::EngineSession>> open_session(
        std::shared_ptr<std::atomic_bool> cancel_token) const;

    using MessageCheck = bool (*)(const protocol::EngineMessage&);

    // Sends one request line and waits for one answer, which must satisfy
    // `accepts` (named by `expected` in the error). "error" answers become
    // EngineReported. The child is reaped before returning.
    core::errors::Result<protocol::EngineMessage> exchange_once(
        const std::string& request_line,
        const std::string& timeout_message,
        MessageCheck accepts,
        const std::string& expected,
        std::shared_ptr<std::atomic_bool> cancel_token) const;

    core::config::BridgeConfig config_;
    tools::ToolDispatcher dispatcher_;
};

// Renders executed tool calls as the final answer when the provider cannot
// take a tool_result round.
std::string format_tool_runs(const std::vector<protocol::ToolCall>& calls);

}  // namespace inkbridge::runtime
