#include "cli_parser.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace inkbridge::app::cli {

    using namespace inkbridge::core::errors;
    using nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> project;
        std::optional<std::string> request;
        std::optional<std::string> mode;
        std::optional<std::string> chapter;
        std::optional<std::string> provider_type;
        std::optional<std::string> base_url;
        std::optional<std::string> api_key;
        bool allow_write = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: inkbridge chat --project DIR --request FILE [--mode discussion|continue] "
               "[--chapter ID] [--allow-write] [--verbose]\n"
               "       inkbridge complete --request FILE [--verbose]\n"
               "       inkbridge compact --request FILE [--verbose]\n"
               "       inkbridge models --provider-type TYPE --base-url URL [--api-key KEY] "
               "[--verbose]\n"
               "Request file: {provider, parameters, systemPrompt, messages}. Set "
               "provider.supportsToolResultRound to false for endpoints that cannot take "
               "tool results back.";
    }

    namespace {

        BridgeError input_error(const std::string& message, const std::string& code,
                                const std::string& hint = "") {
            return BridgeError{ErrorKind::InvalidRequest, message, code, hint};
        }

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(p, ec) || ec) {
                return input_error(flag + " does not name a readable file: " + raw, "invalid_path");
            }
            return p;
        }

    } // namespace

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No command provided.", "missing_command", usage());
        }

        const std::string command = argv[1];
        CliCommand cli;
        if (command == "chat") cli.kind = CommandKind::Chat;
        else if (command == "complete") cli.kind = CommandKind::Complete;
        else if (command == "compact") cli.kind = CommandKind::Compact;
        else if (command == "models") cli.kind = CommandKind::Models;
        else {
            return input_error("Unknown command: " + command, "unknown_command", usage());
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        RawCliOptions raw;
        const auto take_value = [&args](std::size_t& i, std::optional<std::string>& out) {
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };
        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool has_value = true;
            if (flag == "--project") has_value = take_value(i, raw.project);
            else if (flag == "--request") has_value = take_value(i, raw.request);
            else if (flag == "--mode") has_value = take_value(i, raw.mode);
            else if (flag == "--chapter") has_value = take_value(i, raw.chapter);
            else if (flag == "--provider-type") has_value = take_value(i, raw.provider_type);
            else if (flag == "--base-url") has_value = take_value(i, raw.base_url);
            else if (flag == "--api-key") has_value = take_value(i, raw.api_key);
            else if (flag == "--allow-write") raw.allow_write = true;
            else if (flag == "--verbose") raw.verbose = true;
            else {
                return input_error("Unknown argument: " + flag, "unknown_argument");
            }
            if (!has_value) {
                return input_error("Missing value for " + flag, "missing_value");
            }
        }

        // 3. Validator Phase: Enforce per-command requirements
        cli.verbose = raw.verbose;

        const bool is_chat = cli.kind == CommandKind::Chat;
        if (!is_chat && (raw.project || raw.mode || raw.chapter || raw.allow_write)) {
            return input_error("--project, --mode, --chapter and --allow-write apply to chat only",
                               "unexpected_flag");
        }
        if (cli.kind != CommandKind::Models && (raw.provider_type || raw.base_url || raw.api_key)) {
            return input_error("--provider-type, --base-url and --api-key apply to models only",
                               "unexpected_flag");
        }

        if (cli.kind == CommandKind::Models) {
            if (!raw.provider_type || !raw.base_url) {
                return input_error("models requires --provider-type and --base-url",
                                   "missing_required_flag");
            }
            cli.provider_type = raw.provider_type.value();
            cli.base_url = raw.base_url.value();
            cli.api_key = raw.api_key.value_or("");
            return cli;
        }

        if (!raw.request) {
            return input_error("Must provide --request", "missing_required_flag");
        }
        auto request_file = existing_file(raw.request.value(), "--request");
        if (is_error(request_file)) {
            return get_error(request_file);
        }
        cli.request_file = get_value(request_file);

        if (!is_chat) {
            return cli;
        }

        if (!raw.project) {
            return input_error("chat requires --project", "missing_required_flag");
        }
        std::filesystem::path p(raw.project.value());
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return input_error("Project directory does not exist or is not a directory",
                               "invalid_path");
        }
        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return input_error("Failed to canonicalize project directory", "invalid_path");
        }
        cli.project_dir = std::move(canonical_path);

        if (raw.mode) {
            if (raw.mode.value() == "discussion") cli.mode = protocol::SessionMode::Discussion;
            else if (raw.mode.value() == "continue") cli.mode = protocol::SessionMode::Continue;
            else {
                return input_error("Invalid value for --mode: " + raw.mode.value(), "invalid_mode",
                                   "Use 'discussion' or 'continue'.");
            }
        }
        if (raw.chapter) {
            if (raw.chapter->empty()) {
                return input_error("--chapter cannot be empty", "invalid_chapter");
            }
            cli.chapter_id = raw.chapter.value();
        }
        cli.allow_write = raw.allow_write;
        return cli;
    }

    Result<RequestPayload> load_request_payload(const std::filesystem::path& request_file) {
        std::ifstream in(request_file, std::ios::binary);
        if (!in.is_open()) {
            return input_error("Failed to open request file: " + request_file.string(),
                               "request_file_unreadable");
        }
        const std::string text((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());

        json document;
        try {
            document = json::parse(text);
        } catch (const json::parse_error& e) {
            return input_error(std::string("Request file is not valid JSON: ") + e.what(),
                               "invalid_request_file");
        }
        if (!document.is_object()) {
            return input_error("Request file must hold a JSON object", "invalid_request_file");
        }

        RequestPayload payload;
        payload.provider = document.value("provider", json::object());
        payload.parameters = document.value("parameters", json::object());

        const auto prompt = document.find("systemPrompt");
        if (prompt != document.end() && !prompt->is_null()) {
            if (!prompt->is_string()) {
                return input_error("systemPrompt must be a string", "invalid_request_file");
            }
            payload.system_prompt = prompt->get<std::string>();
        }

        const auto messages = document.find("messages");
        if (messages == document.end() || !messages->is_array()) {
            return input_error("Request file needs a 'messages' array", "invalid_request_file");
        }
        for (const auto& message : *messages) {
            payload.messages.push_back(message);
        }
        return payload;
    }

} // namespace inkbridge::app::cli
