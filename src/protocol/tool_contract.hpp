#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace inkbridge::protocol {

    enum class ToolCallStatus {
        Calling,
        Success,
        Error
    };

    // One engine-requested tool invocation. Created as Calling, finalized once
    // after execution with either a result or an error.
    struct ToolCall {
        std::string id;             // engine-assigned, opaque
        std::string name;           // e.g. "read", "append"
        nlohmann::json args;        // opaque argument object
        ToolCallStatus status = ToolCallStatus::Calling;
        std::optional<std::string> result;
        std::optional<std::string> error;
        std::optional<std::uint64_t> duration_ms;
    };

    // Entry of the tool_result line sent back to the engine.
    struct ToolResultEntry {
        std::string id;
        std::string result;
        std::optional<std::string> error;
    };

    struct ToolCallStartEvent {
        std::string id;
        std::string name;
        nlohmann::json args;
    };

    struct ToolCallEndEvent {
        std::string id;
        std::optional<std::string> result;
        std::optional<std::string> error;
    };

    // Optional hooks invoked synchronously from the protocol loop, never from
    // the reader thread.
    struct ToolCallObserver {
        std::function<void(const ToolCallStartEvent&)> on_start;
        std::function<void(const ToolCallEndEvent&)> on_end;
    };

    inline std::string to_string(const ToolCallStatus status) {
        switch (status) {
            case ToolCallStatus::Calling:
                return "calling";
            case ToolCallStatus::Success:
                return "success";
            case ToolCallStatus::Error:
                return "error";
            default:
                return "unknown";
        }
    }

} // namespace inkbridge::protocol
