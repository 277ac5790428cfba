#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::core::config {

inline constexpr std::chrono::milliseconds kDefaultChatTimeout{10 * 60 * 1000};
inline constexpr std::chrono::milliseconds kDefaultCompleteTimeout{30 * 1000};
inline constexpr std::chrono::milliseconds kDefaultPollInterval{50};

struct BridgeConfig {
    std::optional<std::filesystem::path> engine_path_override;
    std::chrono::milliseconds chat_timeout = kDefaultChatTimeout;
    std::chrono::milliseconds complete_timeout = kDefaultCompleteTimeout;
    std::chrono::milliseconds poll_interval = kDefaultPollInterval;
};

// How to launch the resolved engine: the binary itself, or `bun run <script>`.
struct EngineCommand {
    std::filesystem::path program;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
};

BridgeConfig load_bridge_config_from_env();

// Parses a positive millisecond count; blank, non-numeric and zero yield nullopt.
std::optional<std::chrono::milliseconds> parse_timeout_ms(const std::string& raw);

core::errors::Result<std::filesystem::path> resolve_engine_path(
    const BridgeConfig& config);

EngineCommand engine_command_for(const std::filesystem::path& engine_path);

}  // namespace inkbridge::core::config
