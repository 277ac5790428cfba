#include "engine/engine_session.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace inkbridge::engine {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

void strip_line_ending(std::string& line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
}

// Owns the read end of the child's stdout until Eof/Error or a stop request.
void read_lines(const int fd,
                const std::shared_ptr<LineChannel> channel,
                const std::shared_ptr<std::atomic_bool> cancel_token,
                const std::shared_ptr<std::atomic_bool> stop,
                const int poll_ms) {
    std::string pending;
    char buffer[4096];
    while (true) {
        if (stop->load() || (cancel_token && cancel_token->load()) || channel->closed()) {
            return;
        }

        pollfd descriptor{};
        descriptor.fd = fd;
        descriptor.events = POLLIN;
        const int ready = poll(&descriptor, 1, poll_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            channel->push(ReaderEvent{ReaderEventKind::Error,
                                      std::string("Failed to poll stdout: ") +
                                          std::strerror(errno)});
            return;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t received = read(fd, buffer, sizeof(buffer));
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            channel->push(ReaderEvent{ReaderEventKind::Error,
                                      std::string("Failed to read from stdout: ") +
                                          std::strerror(errno)});
            return;
        }
        if (received == 0) {
            if (!pending.empty()) {
                strip_line_ending(pending);
                channel->push(ReaderEvent{ReaderEventKind::Line, std::move(pending)});
            }
            channel->push(ReaderEvent{ReaderEventKind::Eof, "EOF"});
            return;
        }

        pending.append(buffer, static_cast<std::size_t>(received));
        std::size_t newline = pending.find('\n');
        while (newline != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            strip_line_ending(line);
            channel->push(ReaderEvent{ReaderEventKind::Line, std::move(line)});
            newline = pending.find('\n');
        }
    }
}

}  // namespace

EngineSession::EngineSession(std::unique_ptr<EngineProcess> process,
                             std::shared_ptr<std::atomic_bool> cancel_token,
                             const std::chrono::milliseconds poll_interval)
    : process_(std::move(process)),
      cancel_token_(std::move(cancel_token)),
      reader_stop_(std::make_shared<std::atomic_bool>(false)),
      channel_(std::make_shared<LineChannel>()),
      poll_interval_(poll_interval),
      last_line_at_(std::chrono::steady_clock::now()) {}

core::errors::Result<std::unique_ptr<EngineSession>> EngineSession::start(
    const core::config::EngineCommand& command,
    std::shared_ptr<std::atomic_bool> cancel_token,
    const std::chrono::milliseconds poll_interval) {
    auto spawned = EngineProcess::spawn(command);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }

    std::unique_ptr<EngineSession> session(new EngineSession(
        std::move(std::get<std::unique_ptr<EngineProcess>>(spawned)),
        std::move(cancel_token), poll_interval));
    session->reader_ = std::thread(read_lines, session->process_->stdout_fd(),
                                   session->channel_, session->cancel_token_,
                                   session->reader_stop_,
                                   static_cast<int>(poll_interval.count()));
    return session;
}

EngineSession::~EngineSession() {
    stop_reader();
}

void EngineSession::stop_reader() {
    reader_stop_->store(true);
    channel_->close();
    if (reader_.joinable()) {
        reader_.join();
    }
}

bool EngineSession::cancel_requested() const {
    return cancel_token_ && cancel_token_->load();
}

core::errors::Status EngineSession::send(const std::string& line) {
    auto written = process_->write_line(line);
    if (core::errors::is_error(written)) {
        LOG_WARN("engine: " + core::errors::get_error(written).message);
    }
    return written;
}

core::errors::BridgeError EngineSession::cancelled_error() {
    terminate();
    return BridgeError{ErrorKind::Cancelled, kCancelledMessage, "cancelled"};
}

core::errors::BridgeError EngineSession::crashed(const std::string& reason) {
    process_->close_stdin();
    std::string status = "exit status: unknown";
    auto exited = process_->wait_for(kExitGracePeriod);
    if (exited.has_value()) {
        status = exited.value();
    } else {
        terminate();
        auto waited = process_->wait();
        if (!core::errors::is_error(waited)) {
            status = core::errors::get_value(waited);
        }
    }
    stop_reader();
    LOG_ERROR("engine: exited unexpectedly (" + status + ", " + reason + ")");
    return BridgeError{ErrorKind::EngineCrashed,
                       "engine exited unexpectedly: " + status + ". " + reason,
                       "engine_crashed"};
}

core::errors::Result<std::string> EngineSession::next_line(
    const std::chrono::milliseconds idle_timeout,
    const std::string& timeout_message) {
    while (true) {
        if (cancel_requested()) {
            LOG_INFO("engine: cancellation requested");
            return cancelled_error();
        }
        if (std::chrono::steady_clock::now() > last_line_at_ + idle_timeout) {
            LOG_WARN("engine: no output for " + std::to_string(idle_timeout.count()) + "ms");
            terminate();
            return BridgeError{ErrorKind::TimedOut, timeout_message, "engine_timeout"};
        }

        auto event = channel_->wait_pop(poll_interval_);
        if (!event.has_value()) {
            continue;
        }
        switch (event->kind) {
            case ReaderEventKind::Line:
                last_line_at_ = std::chrono::steady_clock::now();
                if (is_blank(event->payload)) {
                    continue;
                }
                return std::move(event->payload);
            case ReaderEventKind::Eof:
            case ReaderEventKind::Error:
                // A cancel that raced the child's exit still reports as a cancel.
                if (cancel_requested()) {
                    return cancelled_error();
                }
                return crashed(event->payload);
        }
    }
}

void EngineSession::finish() {
    process_->close_stdin();
    if (!process_->wait_for(kExitGracePeriod).has_value()) {
        LOG_WARN("engine: pid " + std::to_string(process_->pid()) +
                 " still running after its final message; killing");
        terminate();
    }
    stop_reader();
}

void EngineSession::terminate() {
    process_->close_stdin();
    auto killed = process_->kill();
    if (core::errors::is_error(killed)) {
        LOG_WARN("engine: " + core::errors::get_error(killed).message);
    }
    auto waited = process_->wait();
    if (core::errors::is_error(waited)) {
        LOG_WARN("engine: " + core::errors::get_error(waited).message);
    }
    stop_reader();
}

}  // namespace inkbridge::engine
