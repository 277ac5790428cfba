#include "tools/tool_dispatcher.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>
#include "core/logging/logger.hpp"
#include "project/chapter_index.hpp"
#include "project/summary_store.hpp"

namespace inkbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

BridgeError missing_argument(const std::string& name) {
    return BridgeError{ErrorKind::MissingArgument,
                       "Missing required argument '" + name + "'",
                       "missing_argument"};
}

const json* find_arg(const json& args, const std::string& name) {
    if (!args.is_object()) {
        return nullptr;
    }
    const auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

core::errors::Result<std::string> required_string(const json& args, const std::string& name) {
    const json* value = find_arg(args, name);
    if (value == nullptr || !value->is_string()) {
        return missing_argument(name);
    }
    return value->get<std::string>();
}

std::optional<std::string> optional_string(const json& args, const std::string& name) {
    const json* value = find_arg(args, name);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

// Numbers only; finite floats are truncated, anything else reads as absent.
std::optional<std::int64_t> optional_i64(const json& args, const std::string& name) {
    const json* value = find_arg(args, name);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        const auto raw = value->get<std::uint64_t>();
        if (raw <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(raw);
        }
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->get<std::int64_t>();
    }
    if (value->is_number_float()) {
        const double raw = value->get<double>();
        if (std::isfinite(raw) &&
            raw >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
            raw < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(raw);
        }
    }
    return std::nullopt;
}

std::optional<std::uint32_t> optional_u32(const json& args, const std::string& name) {
    const auto value = optional_i64(args, name);
    if (!value.has_value() || value.value() < 0 ||
        value.value() > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value.value());
}

json read_result_to_json(const ReadResult& result) {
    json payload;
    payload["content"] = result.content;
    payload["total_lines"] = result.total_lines;
    payload["truncated"] = result.truncated;
    return payload;
}

json list_result_to_json(const ListResult& result) {
    json entries = json::array();
    for (const auto& entry : result.entries) {
        json item;
        item["name"] = entry.name;
        item["is_dir"] = entry.is_dir;
        item["size"] = entry.size;
        item["modified"] = entry.modified;
        entries.push_back(std::move(item));
    }
    json payload;
    payload["entries"] = std::move(entries);
    return payload;
}

json search_result_to_json(const SearchResult& result) {
    json matches = json::array();
    for (const auto& match : result.matches) {
        json item;
        item["file"] = match.file;
        item["line"] = match.line;
        item["content"] = match.content;
        matches.push_back(std::move(item));
    }
    json payload;
    payload["matches"] = std::move(matches);
    return payload;
}

}  // namespace

ToolDispatcher::ToolDispatcher(const project::KnowledgeSearch* knowledge_search,
                               policy::ToolPermissions permissions)
    : knowledge_search_(knowledge_search), permissions_(std::move(permissions)) {}

core::errors::Result<std::string> ToolDispatcher::execute(const ToolContext& context,
                                                          const std::string& tool_name,
                                                          const json& args) const {
    auto allowed = permissions_.check(context.mode, context.allow_write, tool_name);
    if (core::errors::is_error(allowed)) {
        LOG_INFO("tool_dispatcher: blocked " + tool_name + " in " +
                 protocol::to_string(context.mode) + " mode");
        return core::errors::get_error(allowed);
    }

    if (tool_name == "read") {
        return run_read(context, args);
    }
    if (tool_name == "write") {
        return run_write(context, args);
    }
    if (tool_name == "append") {
        return run_append(context, args);
    }
    if (tool_name == "list") {
        return run_list(context, args);
    }
    if (tool_name == "search") {
        return run_search(context, args);
    }
    if (tool_name == "get_chapter_info") {
        return run_chapter_info(context);
    }
    if (tool_name == "save_summary") {
        return run_save_summary(context, args);
    }
    if (tool_name == "rag_search") {
        return run_rag_search(context, args);
    }
    return BridgeError{ErrorKind::UnknownTool, "Unknown tool: " + tool_name, "unknown_tool"};
}

core::errors::Result<std::string> ToolDispatcher::run_read(const ToolContext& context,
                                                           const json& args) const {
    auto path = required_string(args, "path");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    ReadRequest request;
    request.path = core::errors::get_value(path);
    request.offset = optional_i64(args, "offset");
    request.limit = optional_u32(args, "limit");

    auto result = host_.read(context.project_root, request);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return read_result_to_json(core::errors::get_value(result)).dump();
}

core::errors::Result<std::string> ToolDispatcher::run_write(const ToolContext& context,
                                                            const json& args) const {
    auto path = required_string(args, "path");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    auto content = required_string(args, "content");
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }

    auto written = host_.write(context.project_root, core::errors::get_value(path),
                               core::errors::get_value(content));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return std::string("File written successfully");
}

core::errors::Result<std::string> ToolDispatcher::run_append(const ToolContext& context,
                                                             const json& args) const {
    auto path = required_string(args, "path");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    auto content = required_string(args, "content");
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }

    auto appended = host_.append(context.project_root, core::errors::get_value(path),
                                 core::errors::get_value(content));
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }

    // Keep chapters/index.json in step with the chapter file just extended.
    const project::ChapterIndexStore index(context.project_root);
    auto synced = index.refresh_from_file(core::errors::get_value(path));
    if (core::errors::is_error(synced)) {
        return core::errors::get_error(synced);
    }
    return std::string("Content appended successfully");
}

core::errors::Result<std::string> ToolDispatcher::run_list(const ToolContext& context,
                                                           const json& args) const {
    auto result = host_.list(context.project_root, optional_string(args, "path"));
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return list_result_to_json(core::errors::get_value(result)).dump();
}

core::errors::Result<std::string> ToolDispatcher::run_search(const ToolContext& context,
                                                             const json& args) const {
    auto query = required_string(args, "query");
    if (core::errors::is_error(query)) {
        return core::errors::get_error(query);
    }
    SearchRequest request;
    request.query = core::errors::get_value(query);
    request.path = optional_string(args, "path");

    auto result = host_.search(context.project_root, request);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return search_result_to_json(core::errors::get_value(result)).dump();
}

core::errors::Result<std::string> ToolDispatcher::run_chapter_info(
    const ToolContext& context) const {
    if (!context.active_chapter.has_value()) {
        return BridgeError{ErrorKind::InvalidRequest, "No chapter selected",
                           "no_active_chapter"};
    }
    auto chapter_id = project::normalize_chapter_id(context.active_chapter.value());
    if (core::errors::is_error(chapter_id)) {
        return core::errors::get_error(chapter_id);
    }

    const project::ChapterIndexStore index(context.project_root);
    auto info = index.lookup(core::errors::get_value(chapter_id));
    if (core::errors::is_error(info)) {
        return core::errors::get_error(info);
    }
    const auto& chapter = core::errors::get_value(info);

    json payload;
    payload["chapterId"] = chapter.chapter_id;
    payload["title"] = chapter.title;
    payload["path"] = chapter.path;
    payload["wordCount"] = chapter.word_count;
    payload["updatedAt"] = chapter.updated_at;
    return payload.dump();
}

core::errors::Result<std::string> ToolDispatcher::run_save_summary(
    const ToolContext& context, const json& args) const {
    auto raw_id = optional_string(args, "chapterId");
    if (!raw_id.has_value()) {
        raw_id = optional_string(args, "chapter_id");
    }
    if (!raw_id.has_value()) {
        return missing_argument("chapterId");
    }
    auto chapter_id = project::normalize_chapter_id(raw_id.value());
    if (core::errors::is_error(chapter_id)) {
        return core::errors::get_error(chapter_id);
    }
    auto summary = required_string(args, "summary");
    if (core::errors::is_error(summary)) {
        return core::errors::get_error(summary);
    }

    const project::SummaryStore store(context.project_root);
    auto entry = store.append(core::errors::get_value(chapter_id),
                              core::errors::get_value(summary));
    if (core::errors::is_error(entry)) {
        return core::errors::get_error(entry);
    }
    const auto& saved = core::errors::get_value(entry);

    json payload;
    payload["chapterId"] = saved.chapter_id;
    payload["summary"] = saved.summary;
    payload["createdAt"] = saved.created_at;
    return payload.dump();
}

core::errors::Result<std::string> ToolDispatcher::run_rag_search(const ToolContext& context,
                                                                 const json& args) const {
    auto query = required_string(args, "query");
    if (core::errors::is_error(query)) {
        return core::errors::get_error(query);
    }
    auto top_k = optional_u32(args, "topK");
    if (!top_k.has_value()) {
        top_k = optional_u32(args, "top_k");
    }
    if (knowledge_search_ == nullptr) {
        return BridgeError{ErrorKind::IoError, "Knowledge search is not available",
                           "knowledge_search_unavailable"};
    }

    auto hits = knowledge_search_->search(context.project_root,
                                          core::errors::get_value(query),
                                          top_k.value_or(project::kDefaultTopK));
    if (core::errors::is_error(hits)) {
        return core::errors::get_error(hits);
    }

    json payload = json::array();
    for (const auto& hit : core::errors::get_value(hits)) {
        json item;
        item["path"] = hit.path;
        item["score"] = hit.score;
        item["text"] = hit.text;
        payload.push_back(std::move(item));
    }
    return payload.dump();
}

}  // namespace inkbridge::tools
