#pragma once
#include <string>
#include <variant>

namespace inkbridge::core::errors {

    // 1. Define typed error kinds
    enum class ErrorKind {
        InvalidPath,        // Absolute path or ".." component
        PathEscape,         // Resolved path leaves the project root
        IsADirectory,       // Mutation or read aimed at a directory
        BinaryFileRejected, // Text-only tools refuse binary content
        ToolNotAllowed,     // Session mode / confirmation gate
        UnknownTool,
        MissingArgument,    // Engine sent a tool call without a required field
        InvalidRequest,     // Bad CLI flags or request file
        ProtocolViolation,  // Malformed or unexpected engine line
        EngineSpawnFailed,
        EngineCrashed,      // Engine exited before a terminal message
        EngineReported,     // Engine answered {"type":"error"}
        Cancelled,
        TimedOut,
        IoError
    };

    // The standardized error payload
    struct BridgeError {
            ErrorKind kind;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // Operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidPath: return "invalid_path";
            case ErrorKind::PathEscape: return "path_escape";
            case ErrorKind::IsADirectory: return "is_a_directory";
            case ErrorKind::BinaryFileRejected: return "binary_file_rejected";
            case ErrorKind::ToolNotAllowed: return "tool_not_allowed";
            case ErrorKind::UnknownTool: return "unknown_tool";
            case ErrorKind::MissingArgument: return "missing_argument";
            case ErrorKind::InvalidRequest: return "invalid_request";
            case ErrorKind::ProtocolViolation: return "protocol_violation";
            case ErrorKind::EngineSpawnFailed: return "engine_spawn_failed";
            case ErrorKind::EngineCrashed: return "engine_crashed";
            case ErrorKind::EngineReported: return "engine_reported";
            case ErrorKind::Cancelled: return "cancelled";
            case ErrorKind::TimedOut: return "timed_out";
            case ErrorKind::IoError: return "io_error";
            default: return "unknown";
        }
    }

} // namespace inkbridge::core::errors
