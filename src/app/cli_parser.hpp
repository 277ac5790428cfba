#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/chat_contract.hpp"

namespace inkbridge::app::cli {

    enum class CommandKind {
        Chat,
        Complete,
        Compact,
        Models
    };

    // Validated command line. Which fields are set depends on `kind`.
    struct CliCommand {
        CommandKind kind = CommandKind::Chat;
        std::filesystem::path request_file;
        std::filesystem::path project_dir;
        protocol::SessionMode mode = protocol::SessionMode::Discussion;
        std::optional<std::string> chapter_id;
        bool allow_write = false;
        std::string provider_type;
        std::string base_url;
        std::string api_key;
        bool verbose = false;
    };

    // {provider, parameters, systemPrompt, messages} read from --request.
    struct RequestPayload {
        nlohmann::json provider;
        nlohmann::json parameters;
        std::string system_prompt;
        std::vector<nlohmann::json> messages;
    };

    inkbridge::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    inkbridge::core::errors::Result<RequestPayload> load_request_payload(
        const std::filesystem::path& request_file);

    std::string usage();
}
