#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::session {

// Independent lanes that each hold at most one live request.
enum class RequestSlot {
    Chat,
    Completion
};

enum class RequestState {
    Running,
    Completed,
    Failed,
    Cancelled
};

// Returned by begin(); the caller passes cancel_token to the orchestrator.
struct RequestHandle {
    std::string request_id;
    RequestSlot slot = RequestSlot::Chat;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class RequestManager {
public:
    // Signals the slot's previous live request, if any, before replacing it.
    core::errors::Result<RequestHandle> begin(RequestSlot slot);

    // Sets the live request's cancel token. Idempotent; false when the slot is idle.
    bool cancel(RequestSlot slot);

    // Records the terminal state and frees the slot if this request still owns it.
    core::errors::Result<RequestState> finish(const RequestHandle& handle,
                                              RequestState final_state);

    core::errors::Result<RequestState> get_state(const std::string& request_id) const;

    bool has_live_request(RequestSlot slot) const;
    std::size_t request_count() const;

    static std::string to_string(RequestState state);
    static std::string to_string(RequestSlot slot);

private:
    struct RequestRecord {
        RequestSlot slot = RequestSlot::Chat;
        RequestState state = RequestState::Running;
        std::shared_ptr<std::atomic_bool> cancel_token;
    };

    static bool is_terminal(RequestState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
    std::map<RequestSlot, std::string> live_;
};

}  // namespace inkbridge::session
