#include "runtime/engine_orchestrator.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace inkbridge::runtime {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using protocol::ToolCall;
using protocol::ToolCallStatus;

namespace {

BridgeError unexpected_message(const std::string& expected, const std::string& line) {
    return BridgeError{ErrorKind::ProtocolViolation,
                       "Unexpected response type (expected " + expected + "): " + line,
                       "unexpected_response_type"};
}

BridgeError engine_reported(const protocol::ErrorMessage& message) {
    return BridgeError{ErrorKind::EngineReported, message.message, "engine_error"};
}

std::uint64_t elapsed_ms(const std::chrono::steady_clock::time_point started) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

std::string trim_end(std::string value) {
    while (!value.empty() &&
           (value.back() == '\n' || value.back() == ' ' || value.back() == '\t' ||
            value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

}  // namespace

std::string format_tool_runs(const std::vector<ToolCall>& calls) {
    std::string out;
    for (const auto& call : calls) {
        out += "[tool] " + call.name + "\n";
        out += "id: " + call.id + "\n";
        out += "args: " + call.args.dump() + "\n";
        if (call.result.has_value()) {
            out += "result: " + call.result.value() + "\n\n";
        } else if (call.error.has_value()) {
            out += "error: " + call.error.value() + "\n\n";
        }
    }
    return trim_end(std::move(out));
}

EngineOrchestrator::EngineOrchestrator(core::config::BridgeConfig config,
                                       const project::KnowledgeSearch* knowledge_search)
    : config_(std::move(config)), dispatcher_(knowledge_search) {}

core::errors::Result<std::unique_ptr<engine::EngineSession>> EngineOrchestrator::open_session(
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    auto engine_path = core::config::resolve_engine_path(config_);
    if (core::errors::is_error(engine_path)) {
        return core::errors::get_error(engine_path);
    }
    const auto command = core::config::engine_command_for(core::errors::get_value(engine_path));
    return engine::EngineSession::start(command, std::move(cancel_token),
                                        config_.poll_interval);
}

core::errors::Result<protocol::ChatResponse> EngineOrchestrator::run_chat(
    const protocol::ChatRequest& request,
    const protocol::ToolCallObserver* observer,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    if (!cancel_token) {
        cancel_token = std::make_shared<std::atomic_bool>(false);
    }
    if (cancel_token->load()) {
        return BridgeError{ErrorKind::Cancelled, engine::kCancelledMessage, "cancelled"};
    }

    auto opened = open_session(cancel_token);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    auto& session = *core::errors::get_value(opened);

    LOG_INFO("chat: state Idle -> RequestSent (mode " + protocol::to_string(request.mode) +
             ", " + std::to_string(request.messages.size()) + " messages)");
    auto sent = session.send(protocol::encode_chat_request(request));
    if (core::errors::is_error(sent)) {
        session.terminate();
        return core::errors::get_error(sent);
    }

    tools::ToolContext context;
    context.project_root = request.project_dir;
    context.mode = request.mode;
    context.allow_write = request.allow_write;
    context.active_chapter = request.chapter_id;

    protocol::ChatResponse response;
    std::size_t round = 0;
    while (true) {
        auto line = session.next_line(config_.chat_timeout, kChatTimeoutMessage);
        if (core::errors::is_error(line)) {
            return core::errors::get_error(line);
        }
        const std::string& raw = core::errors::get_value(line);

        auto parsed = protocol::parse_engine_message(raw);
        if (core::errors::is_error(parsed)) {
            LOG_ERROR("chat: " + core::errors::get_error(parsed).message);
            session.terminate();
            return core::errors::get_error(parsed);
        }
        const auto& message = core::errors::get_value(parsed);

        if (const auto* done = std::get_if<protocol::DoneMessage>(&message)) {
            LOG_INFO("chat: state AwaitingLine -> Done after " + std::to_string(round) +
                     " tool rounds");
            session.finish();
            response.content = done->content;
            return response;
        }
        if (const auto* failure = std::get_if<protocol::ErrorMessage>(&message)) {
            LOG_WARN("chat: engine reported error: " + failure->message);
            session.finish();
            return engine_reported(*failure);
        }
        const auto* tool_round = std::get_if<protocol::ToolCallMessage>(&message);
        if (tool_round == nullptr) {
            session.terminate();
            return unexpected_message("done, error or tool_call", raw);
        }

        ++round;
        LOG_INFO("chat: state AwaitingLine -> ExecutingTools (round " + std::to_string(round) +
                 ", " + std::to_string(tool_round->calls.size()) + " calls)");
        std::vector<protocol::ToolResultEntry> results;
        for (const auto& requested : tool_round->calls) {
            if (session.cancel_requested()) {
                LOG_INFO("chat: cancelled during tool round " + std::to_string(round));
                return session.cancelled_error();
            }

            if (observer != nullptr && observer->on_start) {
                observer->on_start(
                    protocol::ToolCallStartEvent{requested.id, requested.name, requested.args});
            }

            const auto started = std::chrono::steady_clock::now();
            auto executed = dispatcher_.execute(context, requested.name, requested.args);

            ToolCall call;
            call.id = requested.id;
            call.name = requested.name;
            call.args = requested.args;
            call.duration_ms = elapsed_ms(started);
            if (core::errors::is_error(executed)) {
                call.status = ToolCallStatus::Error;
                call.error = core::errors::get_error(executed).message;
            } else {
                call.status = ToolCallStatus::Success;
                call.result = core::errors::get_value(executed);
            }
            LOG_INFO("tool " + call.name + " id=" + call.id + " " +
                     protocol::to_string(call.status) + " in " +
                     std::to_string(call.duration_ms.value()) + "ms" +
                     (call.error.has_value() ? ": " + call.error.value() : ""));

            if (observer != nullptr && observer->on_end) {
                observer->on_end(protocol::ToolCallEndEvent{call.id, call.result, call.error});
            }

            results.push_back(protocol::ToolResultEntry{
                call.id, call.result.value_or(""), call.error});
            response.tool_calls.push_back(std::move(call));
        }

        if (!request.capabilities.supports_tool_result_round) {
            LOG_INFO("chat: provider takes no tool_result round; returning tool output");
            session.terminate();
            response.content = format_tool_runs(response.tool_calls);
            return response;
        }

        auto delivered = session.send(protocol::encode_tool_results(results));
        if (core::errors::is_error(delivered)) {
            session.terminate();
            return core::errors::get_error(delivered);
        }
        LOG_DEBUG("chat: state ExecutingTools -> ToolResultSent");
    }
}

core::errors::Result<protocol::EngineMessage> EngineOrchestrator::exchange_once(
    const std::string& request_line,
    const std::string& timeout_message,
    const MessageCheck accepts,
    const std::string& expected,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    if (cancel_token && cancel_token->load()) {
        return BridgeError{ErrorKind::Cancelled, engine::kCancelledMessage, "cancelled"};
    }

    auto opened = open_session(std::move(cancel_token));
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    auto& session = *core::errors::get_value(opened);

    auto sent = session.send(request_line);
    if (core::errors::is_error(sent)) {
        session.terminate();
        return core::errors::get_error(sent);
    }

    auto line = session.next_line(config_.complete_timeout, timeout_message);
    if (core::errors::is_error(line)) {
        return core::errors::get_error(line);
    }
    const std::string& raw = core::errors::get_value(line);

    auto parsed = protocol::parse_engine_message(raw);
    if (core::errors::is_error(parsed)) {
        session.terminate();
        return core::errors::get_error(parsed);
    }
    const auto& message = core::errors::get_value(parsed);

    if (const auto* failure = std::get_if<protocol::ErrorMessage>(&message)) {
        LOG_WARN("engine reported error: " + failure->message);
        session.finish();
        return engine_reported(*failure);
    }
    if (!accepts(message)) {
        session.terminate();
        return unexpected_message(expected, raw);
    }
    session.finish();
    return message;
}

core::errors::Result<std::string> EngineOrchestrator::run_complete(
    const protocol::CompletionRequest& request,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    auto answer = exchange_once(
        protocol::encode_completion_request(request), kCompleteTimeoutMessage,
        [](const protocol::EngineMessage& message) {
            return std::holds_alternative<protocol::DoneMessage>(message);
        },
        "done", std::move(cancel_token));
    if (core::errors::is_error(answer)) {
        return core::errors::get_error(answer);
    }
    return std::get<protocol::DoneMessage>(core::errors::get_value(answer)).content;
}

core::errors::Result<std::string> EngineOrchestrator::run_compact(
    const nlohmann::json& provider,
    const nlohmann::json& parameters,
    const std::vector<nlohmann::json>& messages,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    auto answer = exchange_once(
        protocol::encode_compact_request(provider, parameters, messages),
        "Compact request timed out (retry or switch model/provider)",
        [](const protocol::EngineMessage& message) {
            return std::holds_alternative<protocol::CompactSummaryMessage>(message);
        },
        "compact_summary", std::move(cancel_token));
    if (core::errors::is_error(answer)) {
        return core::errors::get_error(answer);
    }
    return std::get<protocol::CompactSummaryMessage>(core::errors::get_value(answer)).content;
}

core::errors::Result<std::vector<std::string>> EngineOrchestrator::fetch_models(
    const std::string& provider_type,
    const std::string& base_url,
    const std::string& api_key,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    auto answer = exchange_once(
        protocol::encode_fetch_models_request(provider_type, base_url, api_key),
        "Model list request timed out (check the provider address)",
        [](const protocol::EngineMessage& message) {
            return std::holds_alternative<protocol::ModelsMessage>(message);
        },
        "models", std::move(cancel_token));
    if (core::errors::is_error(answer)) {
        return core::errors::get_error(answer);
    }
    return std::get<protocol::ModelsMessage>(core::errors::get_value(answer)).models;
}

}  // namespace inkbridge::runtime
