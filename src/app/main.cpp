#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/bridge_config.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "project/knowledge_search.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/engine_protocol.hpp"
#include "runtime/engine_orchestrator.hpp"
#include "session/request_manager.hpp"

namespace {

std::atomic_bool g_interrupted{false};

extern "C" void on_sigint(int) {
    g_interrupted.store(true);
}

int exit_code_for(const inkbridge::core::errors::BridgeError& err) {
    switch (err.kind) {
        case inkbridge::core::errors::ErrorKind::Cancelled:
            return 130;
        case inkbridge::core::errors::ErrorKind::InvalidRequest:
            return 2;
        default:
            return 1;
    }
}

int report_failure(const std::string& stage, const inkbridge::core::errors::BridgeError& err) {
    LOG_ERROR(stage + " [" + inkbridge::core::errors::to_string(err.kind) + "/" + err.code +
              "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

// Forwards Ctrl-C to the live request of `slot` until `done` is set.
class InterruptWatcher {
public:
    InterruptWatcher(inkbridge::session::RequestManager& manager,
                     inkbridge::session::RequestSlot slot)
        : thread_([this, &manager, slot] {
              while (!done_.load()) {
                  if (g_interrupted.exchange(false)) {
                      LOG_WARN("Interrupted; cancelling request");
                      manager.cancel(slot);
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(20));
              }
          }) {}

    ~InterruptWatcher() {
        done_.store(true);
        thread_.join();
    }

private:
    std::atomic_bool done_{false};
    std::thread thread_;
};

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = inkbridge::core::errors;
    using inkbridge::app::cli::CommandKind;
    using inkbridge::session::RequestSlot;
    using inkbridge::session::RequestState;

    auto& logger = inkbridge::core::logging::Logger::get();
    logger.configure_from_env();
    logger.set_request_id(inkbridge::core::config::generate_request_id());

    auto parsed = inkbridge::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        return report_failure("Input error", errors::get_error(parsed));
    }
    const auto& cli = errors::get_value(parsed);
    if (cli.verbose) {
        logger.set_min_level(inkbridge::core::logging::LogLevel::DEBUG);
    }

    inkbridge::app::cli::RequestPayload payload;
    if (cli.kind != CommandKind::Models) {
        auto loaded = inkbridge::app::cli::load_request_payload(cli.request_file);
        if (errors::is_error(loaded)) {
            return report_failure("Input error", errors::get_error(loaded));
        }
        payload = errors::get_value(loaded);
    }

    const inkbridge::project::KeywordKnowledgeSearch knowledge_search;
    const inkbridge::runtime::EngineOrchestrator orchestrator(
        inkbridge::core::config::load_bridge_config_from_env(), &knowledge_search);

    inkbridge::session::RequestManager requests;
    const RequestSlot slot =
        cli.kind == CommandKind::Chat ? RequestSlot::Chat : RequestSlot::Completion;
    auto begun = requests.begin(slot);
    if (errors::is_error(begun)) {
        return report_failure("Failed to start request", errors::get_error(begun));
    }
    const auto handle = errors::get_value(begun);
    logger.set_request_id(handle.request_id);

    std::signal(SIGINT, on_sigint);
    nlohmann::json output;
    std::optional<errors::BridgeError> failure;
    {
        InterruptWatcher watcher(requests, slot);
        switch (cli.kind) {
            case CommandKind::Chat: {
                inkbridge::protocol::ChatRequest request;
                request.provider = payload.provider;
                request.parameters = payload.parameters;
                request.system_prompt = payload.system_prompt;
                request.messages = payload.messages;
                request.project_dir = cli.project_dir;
                request.mode = cli.mode;
                request.chapter_id = cli.chapter_id;
                request.allow_write = cli.allow_write;
                request.capabilities =
                    inkbridge::protocol::capabilities_for_provider(payload.provider);

                inkbridge::protocol::ToolCallObserver observer;
                observer.on_start = [](const inkbridge::protocol::ToolCallStartEvent& event) {
                    LOG_DEBUG("tool call started: " + event.name + " id=" + event.id);
                };
                auto result = orchestrator.run_chat(request, &observer, handle.cancel_token);
                if (errors::is_error(result)) {
                    failure = errors::get_error(result);
                } else {
                    output = inkbridge::protocol::chat_response_to_json(errors::get_value(result));
                }
                break;
            }
            case CommandKind::Complete:
            case CommandKind::Compact: {
                errors::Result<std::string> result = std::string();
                if (cli.kind == CommandKind::Complete) {
                    inkbridge::protocol::CompletionRequest request;
                    request.provider = payload.provider;
                    request.parameters = payload.parameters;
                    request.system_prompt = payload.system_prompt;
                    request.messages = payload.messages;
                    result = orchestrator.run_complete(request, handle.cancel_token);
                } else {
                    result = orchestrator.run_compact(payload.provider, payload.parameters,
                                                      payload.messages, handle.cancel_token);
                }
                if (errors::is_error(result)) {
                    failure = errors::get_error(result);
                } else {
                    output["content"] = errors::get_value(result);
                }
                break;
            }
            case CommandKind::Models: {
                auto result = orchestrator.fetch_models(cli.provider_type, cli.base_url,
                                                        cli.api_key, handle.cancel_token);
                if (errors::is_error(result)) {
                    failure = errors::get_error(result);
                } else {
                    output["models"] = errors::get_value(result);
                }
                break;
            }
        }
    }

    RequestState final_state = RequestState::Completed;
    if (failure.has_value()) {
        final_state = failure->kind == errors::ErrorKind::Cancelled ? RequestState::Cancelled
                                                                    : RequestState::Failed;
    }
    auto finished = requests.finish(handle, final_state);
    if (errors::is_error(finished)) {
        LOG_WARN("Failed to record final state: " + errors::get_error(finished).message);
    }

    if (failure.has_value()) {
        return report_failure("Request failed", failure.value());
    }
    std::cout << output.dump(2) << std::endl;
    LOG_INFO("Request " + handle.request_id + " " +
             inkbridge::session::RequestManager::to_string(final_state));
    return 0;
}
