#include "session/request_manager.hpp"

#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace inkbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorKind;

bool RequestManager::is_terminal(const RequestState state) {
    return state == RequestState::Completed || state == RequestState::Failed ||
           state == RequestState::Cancelled;
}

std::string RequestManager::to_string(const RequestState state) {
    switch (state) {
        case RequestState::Running:
            return "running";
        case RequestState::Completed:
            return "completed";
        case RequestState::Failed:
            return "failed";
        case RequestState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

std::string RequestManager::to_string(const RequestSlot slot) {
    switch (slot) {
        case RequestSlot::Chat:
            return "chat";
        case RequestSlot::Completion:
            return "completion";
        default:
            return "unknown";
    }
}

core::errors::Result<RequestHandle> RequestManager::begin(const RequestSlot slot) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto live = live_.find(slot);
    if (live != live_.end()) {
        const auto previous = requests_.find(live->second);
        if (previous != requests_.end() && previous->second.cancel_token) {
            previous->second.cancel_token->store(true);
            LOG_INFO("RequestManager: superseding " + live->second + " in slot " +
                     to_string(slot));
        }
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string request_id = core::config::generate_request_id();
        if (requests_.find(request_id) != requests_.end()) {
            continue;
        }

        RequestRecord record;
        record.slot = slot;
        record.state = RequestState::Running;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        RequestHandle handle{request_id, slot, record.cancel_token};
        requests_.emplace(request_id, std::move(record));
        live_[slot] = request_id;
        LOG_INFO("RequestManager: request " + request_id + " started in slot " +
                 to_string(slot));
        return handle;
    }

    return BridgeError{ErrorKind::InvalidRequest, "Unable to allocate unique request ID.",
                       "request_id_generation_failed"};
}

bool RequestManager::cancel(const RequestSlot slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto live = live_.find(slot);
    if (live == live_.end()) {
        return false;
    }
    const auto it = requests_.find(live->second);
    if (it == requests_.end() || is_terminal(it->second.state)) {
        return false;
    }
    if (!it->second.cancel_token->exchange(true)) {
        LOG_INFO("RequestManager: cancel requested for " + live->second);
    }
    return true;
}

core::errors::Result<RequestState> RequestManager::finish(const RequestHandle& handle,
                                                          const RequestState final_state) {
    if (!is_terminal(final_state)) {
        return BridgeError{ErrorKind::InvalidRequest,
                           "Requests can only finish in a terminal state.",
                           "invalid_state_transition"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(handle.request_id);
    if (it == requests_.end()) {
        return BridgeError{ErrorKind::InvalidRequest,
                           "Request ID not found: " + handle.request_id,
                           "request_not_found"};
    }
    if (is_terminal(it->second.state)) {
        return BridgeError{ErrorKind::InvalidRequest,
                           "Request is already terminal: " + to_string(it->second.state),
                           "invalid_state_transition"};
    }

    it->second.state = final_state;
    const auto live = live_.find(it->second.slot);
    if (live != live_.end() && live->second == handle.request_id) {
        live_.erase(live);
    }
    LOG_INFO("RequestManager: request " + handle.request_id + " transition running -> " +
             to_string(final_state));
    return final_state;
}

core::errors::Result<RequestState> RequestManager::get_state(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return BridgeError{ErrorKind::InvalidRequest, "Request ID not found: " + request_id,
                           "request_not_found"};
    }
    return it->second.state;
}

bool RequestManager::has_live_request(const RequestSlot slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.find(slot) != live_.end();
}

std::size_t RequestManager::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

}  // namespace inkbridge::session
