#include "core/config/bridge_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <system_error>

namespace inkbridge::core::config {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

constexpr const char* kEngineName = "ai-engine";

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                          return std::isspace(c) != 0;
                      }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

std::optional<std::string> read_env(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::filesystem::path> current_exe_dir() {
    std::error_code ec;
    const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return exe.parent_path();
}

std::optional<std::filesystem::path> find_engine_in_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    const auto direct = dir / kEngineName;
    if (std::filesystem::is_regular_file(direct, ec) && !ec) {
        return direct;
    }

    // Packagers may append a target triple to the sidecar name.
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return std::nullopt;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind(kEngineName, 0) == 0 && entry.is_regular_file(ec) && !ec) {
            return entry.path();
        }
    }
    return std::nullopt;
}

bool is_script_path(const std::filesystem::path& path) {
    const auto ext = path.extension().string();
    return ext == ".ts" || ext == ".js";
}

}  // namespace

std::optional<std::chrono::milliseconds> parse_timeout_ms(const std::string& raw) {
    const std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    std::uint64_t ms = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, ms);
    if (ec != std::errc() || ptr != end || ms == 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
}

BridgeConfig load_bridge_config_from_env() {
    BridgeConfig config;
    if (auto raw = read_env("INKBRIDGE_ENGINE_PATH")) {
        config.engine_path_override = std::filesystem::path(*raw);
    }
    if (auto raw = read_env("INKBRIDGE_CHAT_TIMEOUT_MS")) {
        if (auto ms = parse_timeout_ms(*raw)) {
            config.chat_timeout = *ms;
        }
    }
    if (auto raw = read_env("INKBRIDGE_COMPLETE_TIMEOUT_MS")) {
        if (auto ms = parse_timeout_ms(*raw)) {
            config.complete_timeout = *ms;
        }
    }
    return config;
}

core::errors::Result<std::filesystem::path> resolve_engine_path(
    const BridgeConfig& config) {
    std::string override_error;
    if (config.engine_path_override.has_value()) {
        std::filesystem::path candidate = config.engine_path_override.value();
        if (candidate.is_relative()) {
            candidate = std::filesystem::current_path() / candidate;
        }
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec) {
            return candidate;
        }
        override_error = "Engine override not found: " + candidate.string() + "\n\n";
    }

    if (auto exe_dir = current_exe_dir()) {
        const std::filesystem::path candidates[] = {
            *exe_dir,
            *exe_dir / "../bin",
            *exe_dir / "../libexec",
            *exe_dir / "../Resources",
            *exe_dir / "../Resources/bin",
        };
        for (const auto& dir : candidates) {
            if (auto found = find_engine_in_dir(dir)) {
                return *found;
            }
        }
    }

    return BridgeError{ErrorKind::EngineSpawnFailed,
                       override_error + "ai-engine not found next to the executable.",
                       "engine_not_found",
                       "Install the ai-engine sidecar or set INKBRIDGE_ENGINE_PATH."};
}

EngineCommand engine_command_for(const std::filesystem::path& engine_path) {
    EngineCommand command;
    if (is_script_path(engine_path)) {
        command.program = "bun";
        command.args = {"run", engine_path.string()};
        command.working_directory = engine_path.parent_path();
        return command;
    }
    command.program = engine_path;
    return command;
}

}  // namespace inkbridge::core::config
