#include "engine/engine_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"

namespace inkbridge::engine {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

// A dead engine must surface as EPIPE on write, not terminate the bridge.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

BridgeError spawn_error(const std::string& message) {
    return BridgeError{ErrorKind::EngineSpawnFailed, message, "engine_spawn_failed"};
}

}  // namespace

std::string describe_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return "exit status: " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal: " + std::to_string(WTERMSIG(status));
    }
    return "unknown status " + std::to_string(status);
}

EngineProcess::EngineProcess(const pid_t pid, const int stdin_fd, const int stdout_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

core::errors::Result<std::unique_ptr<EngineProcess>> EngineProcess::spawn(
    const core::config::EngineCommand& command) {
    ignore_sigpipe_once();

    std::vector<std::string> arguments;
    arguments.push_back(command.program.string());
    arguments.insert(arguments.end(), command.args.begin(), command.args.end());
    std::vector<char*> argv;
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);
    const std::string working_directory =
        command.working_directory.has_value() ? command.working_directory->string() : "";

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_error_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_error_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_error_pipe);
        return spawn_error("Failed to create engine pipes: " + reason);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_error_pipe);
        return spawn_error("Failed to fork engine process: " + reason);
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        int child_errno = 0;
        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            child_errno = errno;
        } else if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
                   dup2(stdout_pipe[1], STDOUT_FILENO) < 0) {
            child_errno = errno;
        } else {
            execvp(argv[0], argv.data());
            child_errno = errno;
        }
        static_cast<void>(write(exec_error_pipe[1], &child_errno, sizeof(child_errno)));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(exec_error_pipe[1]);

    // The error pipe closes on a successful exec; data means exec failed.
    int child_errno = 0;
    ssize_t received = -1;
    do {
        received = read(exec_error_pipe[0], &child_errno, sizeof(child_errno));
    } while (received < 0 && errno == EINTR);
    close_fd(exec_error_pipe[0]);

    if (received == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        return spawn_error("Failed to spawn engine '" + command.program.string() +
                           "': " + std::strerror(child_errno));
    }

    LOG_INFO("engine: spawned pid " + std::to_string(pid) + " (" +
             command.program.filename().string() + ")");
    return std::unique_ptr<EngineProcess>(
        new EngineProcess(pid, stdin_pipe[1], stdout_pipe[0]));
}

EngineProcess::~EngineProcess() {
    close_stdin();
    if (!reaped()) {
        auto killed = kill();
        if (core::errors::is_error(killed)) {
            LOG_WARN("engine: " + core::errors::get_error(killed).message);
        }
        auto waited = wait();
        if (core::errors::is_error(waited)) {
            LOG_WARN("engine: " + core::errors::get_error(waited).message);
        }
    }
    close_fd(stdout_fd_);
}

core::errors::Status EngineProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        return BridgeError{ErrorKind::IoError, "Engine stdin is already closed",
                           "engine_stdin_closed"};
    }

    const std::string payload = line + "\n";
    std::size_t offset = 0;
    while (offset < payload.size()) {
        const ssize_t written =
            write(stdin_fd_, payload.data() + offset, payload.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return BridgeError{ErrorKind::IoError,
                               std::string("Failed to write to engine stdin: ") +
                                   std::strerror(errno),
                               "engine_write_failed"};
        }
        offset += static_cast<std::size_t>(written);
    }
    return core::errors::ok();
}

void EngineProcess::close_stdin() {
    close_fd(stdin_fd_);
}

core::errors::Status EngineProcess::kill() {
    if (reaped()) {
        return core::errors::ok();
    }
    if (::kill(-pid_, SIGKILL) == 0) {
        return core::errors::ok();
    }
    // setpgid may have lost the race with exec; fall back to the pid itself.
    if (errno == ESRCH && ::kill(pid_, SIGKILL) == 0) {
        return core::errors::ok();
    }
    if (errno == ESRCH) {
        return core::errors::ok();
    }
    return BridgeError{ErrorKind::IoError,
                       "Failed to kill engine pid " + std::to_string(pid_) + ": " +
                           std::strerror(errno),
                       "engine_kill_failed"};
}

std::optional<std::string> EngineProcess::try_reap() {
    if (exit_status_.has_value()) {
        return exit_status_;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exit_status_ = describe_wait_status(status);
    } else if (waited < 0 && errno == ECHILD) {
        exit_status_ = "exit status: unknown";
    }
    return exit_status_;
}

core::errors::Result<std::string> EngineProcess::wait() {
    if (exit_status_.has_value()) {
        return exit_status_.value();
    }
    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        if (errno == ECHILD) {
            exit_status_ = "exit status: unknown";
            return exit_status_.value();
        }
        return BridgeError{ErrorKind::IoError,
                           std::string("Failed to wait for engine: ") + std::strerror(errno),
                           "engine_wait_failed"};
    }
    exit_status_ = describe_wait_status(status);
    LOG_DEBUG("engine: pid " + std::to_string(pid_) + " exited, " + exit_status_.value());
    return exit_status_.value();
}

std::optional<std::string> EngineProcess::wait_for(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto status = try_reap();
        if (status.has_value()) {
            return status;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace inkbridge::engine
