#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "engine/engine_process.hpp"
#include "engine/line_channel.hpp"

namespace inkbridge::engine {

inline constexpr std::chrono::milliseconds kExitGracePeriod{2000};
inline constexpr const char* kCancelledMessage = "Generation stopped";

// One engine exchange: the child process, the thread reading its stdout and
// the channel between them. All methods are called from the protocol loop.
class EngineSession {
public:
    static core::errors::Result<std::unique_ptr<EngineSession>> start(
        const core::config::EngineCommand& command,
        std::shared_ptr<std::atomic_bool> cancel_token,
        std::chrono::milliseconds poll_interval);

    ~EngineSession();
    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;

    pid_t pid() const { return process_->pid(); }

    core::errors::Status send(const std::string& line);

    // Waits for the next non-blank stdout line. Fails with Cancelled once the
    // token is set, TimedOut when `idle_timeout` has passed since the last
    // line received (blank lines and time spent between calls included), and
    // EngineCrashed when stdout ends first. Every failure leaves the child
    // killed and reaped.
    core::errors::Result<std::string> next_line(std::chrono::milliseconds idle_timeout,
                                                const std::string& timeout_message);

    bool cancel_requested() const;

    // After a terminal message: closes stdin and reaps the child, killing it
    // if it has not exited within kExitGracePeriod.
    void finish();

    // Kill and reap now. Failures are logged, never returned.
    void terminate();

    core::errors::BridgeError cancelled_error();

private:
    EngineSession(std::unique_ptr<EngineProcess> process,
                  std::shared_ptr<std::atomic_bool> cancel_token,
                  std::chrono::milliseconds poll_interval);

    void stop_reader();
    core::errors::BridgeError crashed(const std::string& reason);

    std::unique_ptr<EngineProcess> process_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    std::shared_ptr<std::atomic_bool> reader_stop_;
    std::shared_ptr<LineChannel> channel_;
    std::chrono::milliseconds poll_interval_;
    std::chrono::steady_clock::time_point last_line_at_;
    std::thread reader_;
};

}  // namespace inkbridge::engine
