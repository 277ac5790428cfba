#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::engine {

// A spawned engine child: stdin and stdout piped, stderr inherited. The child
// leads its own process group so kill() also reaches anything it started.
// The destructor kills and reaps a child that is still running.
class EngineProcess {
public:
    static core::errors::Result<std::unique_ptr<EngineProcess>> spawn(
        const core::config::EngineCommand& command);

    ~EngineProcess();
    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    bool reaped() const { return exit_status_.has_value(); }

    // Writes `line` plus '\n' in full.
    core::errors::Status write_line(const std::string& line);
    void close_stdin();

    // SIGKILL to the process group. A child that is already gone is not an error.
    core::errors::Status kill();

    // Blocks until the child exits; "exit status: N" or "signal: N".
    core::errors::Result<std::string> wait();

    // nullopt when the child is still running after `timeout`.
    std::optional<std::string> wait_for(std::chrono::milliseconds timeout);

private:
    EngineProcess(pid_t pid, int stdin_fd, int stdout_fd);

    std::optional<std::string> try_reap();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::optional<std::string> exit_status_;
};

std::string describe_wait_status(int status);

}  // namespace inkbridge::engine
