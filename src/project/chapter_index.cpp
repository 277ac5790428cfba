#include "project/chapter_index.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"
#include "policy/path_validator.hpp"
#include "storage/write_protection.hpp"

namespace inkbridge::project {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

constexpr const char* kChapterPrefix = "chapter_";
constexpr const char* kChaptersDir = "chapters/";
constexpr const char* kChapterSuffix = ".txt";

bool all_digits(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (const char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

BridgeError index_error(const std::string& message, const std::string& code) {
    return BridgeError{ErrorKind::IoError, message, code};
}

json meta_to_json(const ChapterMeta& meta) {
    json payload;
    payload["id"] = meta.id;
    payload["title"] = meta.title;
    payload["order"] = meta.order;
    payload["created"] = meta.created;
    payload["updated"] = meta.updated;
    payload["wordCount"] = meta.word_count;
    return payload;
}

ChapterMeta meta_from_json(const json& payload) {
    ChapterMeta meta;
    meta.id = payload.at("id").get<std::string>();
    meta.title = payload.at("title").get<std::string>();
    meta.order = payload.at("order").get<std::uint32_t>();
    meta.created = payload.at("created").get<std::uint64_t>();
    meta.updated = payload.at("updated").get<std::uint64_t>();
    meta.word_count = payload.at("wordCount").get<std::uint32_t>();
    return meta;
}

core::errors::Result<std::string> read_text(const std::filesystem::path& path,
                                            const std::string& display) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return index_error("Failed to read " + display, "read_failed");
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) {
        return index_error("Failed to read " + display, "read_failed");
    }
    return content;
}

}  // namespace

ChapterIndexStore::ChapterIndexStore(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

bool ChapterIndexStore::exists() const {
    const policy::PathValidator validator;
    auto index_path = validator.validate(project_root_, kChapterIndexPath);
    if (core::errors::is_error(index_path)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(core::errors::get_value(index_path), ec);
}

core::errors::Result<ChapterIndex> ChapterIndexStore::load() const {
    const policy::PathValidator validator;
    auto index_path = validator.validate(project_root_, kChapterIndexPath);
    if (core::errors::is_error(index_path)) {
        return core::errors::get_error(index_path);
    }

    auto text = read_text(core::errors::get_value(index_path), kChapterIndexPath);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }

    try {
        const json payload = json::parse(core::errors::get_value(text));
        ChapterIndex index;
        for (const auto& entry : payload.at("chapters")) {
            index.chapters.push_back(meta_from_json(entry));
        }
        index.next_id = payload.at("nextId").get<std::uint32_t>();
        return index;
    } catch (const json::exception& e) {
        return index_error(std::string("Failed to parse chapters/index.json: ") + e.what(),
                           "invalid_chapter_index");
    }
}

core::errors::Status ChapterIndexStore::save(const ChapterIndex& index) const {
    const policy::PathValidator validator;
    auto root = validator.canonical_root(project_root_);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    auto index_path = validator.validate(project_root_, kChapterIndexPath);
    if (core::errors::is_error(index_path)) {
        return core::errors::get_error(index_path);
    }

    json payload;
    payload["chapters"] = json::array();
    for (const auto& meta : index.chapters) {
        payload["chapters"].push_back(meta_to_json(meta));
    }
    payload["nextId"] = index.next_id;

    auto written = storage::write_with_backup(core::errors::get_value(root),
                                              core::errors::get_value(index_path),
                                              payload.dump(2) + "\n");
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return core::errors::ok();
}

core::errors::Result<ChapterInfo> ChapterIndexStore::lookup(
    const std::string& chapter_id) const {
    auto index = load();
    if (core::errors::is_error(index)) {
        return core::errors::get_error(index);
    }
    for (const auto& meta : core::errors::get_value(index).chapters) {
        if (meta.id != chapter_id) {
            continue;
        }
        ChapterInfo info;
        info.chapter_id = meta.id;
        info.title = meta.title;
        info.path = std::string(kChaptersDir) + meta.id + kChapterSuffix;
        info.word_count = meta.word_count;
        info.updated_at = meta.updated;
        return info;
    }
    return BridgeError{ErrorKind::InvalidRequest, "Chapter not found", "chapter_not_found"};
}

core::errors::Result<bool> ChapterIndexStore::update_word_count_and_timestamp(
    const std::string& chapter_id,
    const std::uint32_t word_count,
    const std::uint64_t now) const {
    auto loaded = load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto& index = core::errors::get_value(loaded);

    bool found = false;
    for (auto& meta : index.chapters) {
        if (meta.id == chapter_id) {
            meta.word_count = word_count;
            meta.updated = now;
            found = true;
            break;
        }
    }
    if (!found) {
        return false;
    }

    auto saved = save(index);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return true;
}

core::errors::Status ChapterIndexStore::refresh_from_file(
    const std::string& relative_path) const {
    const auto chapter_id = chapter_id_from_path(relative_path);
    if (!chapter_id.has_value() || !exists()) {
        return core::errors::ok();
    }

    const policy::PathValidator validator;
    auto chapter_path = validator.validate(project_root_, relative_path);
    if (core::errors::is_error(chapter_path)) {
        return core::errors::get_error(chapter_path);
    }
    auto content = read_text(core::errors::get_value(chapter_path), "chapter content");
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }

    auto updated = update_word_count_and_timestamp(
        chapter_id.value(), count_words(core::errors::get_value(content)),
        now_unix_seconds());
    if (core::errors::is_error(updated)) {
        return core::errors::get_error(updated);
    }
    if (core::errors::get_value(updated)) {
        LOG_DEBUG("chapter_index: refreshed " + chapter_id.value());
    }
    return core::errors::ok();
}

core::errors::Status ensure_project_exists(const std::filesystem::path& project_root) {
    if (project_root.empty()) {
        return BridgeError{ErrorKind::InvalidRequest, "Project path is empty",
                           "invalid_project_root"};
    }
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(project_root, ec);
    if (ec || !std::filesystem::exists(status)) {
        return BridgeError{ErrorKind::InvalidRequest, "Project path does not exist",
                           "invalid_project_root"};
    }
    if (!std::filesystem::is_directory(status)) {
        return BridgeError{ErrorKind::InvalidRequest, "Project path is not a directory",
                           "invalid_project_root"};
    }

    const policy::PathValidator validator;
    for (const char* required : {".creatorai/config.json", kChapterIndexPath}) {
        auto path = validator.validate(project_root, required);
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        if (!std::filesystem::exists(core::errors::get_value(path), ec)) {
            return BridgeError{ErrorKind::InvalidRequest,
                               std::string("Not a valid project: missing ") + required,
                               "invalid_project"};
        }
    }
    return core::errors::ok();
}

core::errors::Result<std::string> normalize_chapter_id(const std::string& value) {
    const std::string id = trim(value);
    if (id.empty()) {
        return BridgeError{ErrorKind::InvalidRequest, "chapterId is empty",
                           "invalid_chapter_id"};
    }

    const std::string prefix(kChapterPrefix);
    if (id.rfind(prefix, 0) == 0) {
        if (!all_digits(id.substr(prefix.size()))) {
            return BridgeError{ErrorKind::InvalidRequest,
                               "Invalid chapterId (expected 'chapter_XXX')",
                               "invalid_chapter_id"};
        }
        return id;
    }

    if (all_digits(id)) {
        std::uint32_t number = 0;
        const auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), number);
        if (ec != std::errc() || ptr != id.data() + id.size()) {
            return BridgeError{ErrorKind::InvalidRequest,
                               "Invalid chapterId (expected digits)",
                               "invalid_chapter_id"};
        }
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "chapter_%03u", number);
        return std::string(buffer);
    }

    return BridgeError{ErrorKind::InvalidRequest, "Invalid chapterId",
                       "invalid_chapter_id"};
}

std::optional<std::string> chapter_id_from_path(const std::string& raw_path) {
    const std::string relative_path =
        std::filesystem::path(raw_path).lexically_normal().generic_string();
    const std::string dir(kChaptersDir);
    const std::string suffix(kChapterSuffix);
    if (relative_path.rfind(dir, 0) != 0 || relative_path.size() < dir.size() + suffix.size() ||
        relative_path.compare(relative_path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }

    const std::string stem = relative_path.substr(
        dir.size(), relative_path.size() - dir.size() - suffix.size());
    const std::string prefix(kChapterPrefix);
    if (stem.rfind(prefix, 0) != 0 || !all_digits(stem.substr(prefix.size()))) {
        return std::nullopt;
    }
    return stem;
}

std::uint32_t count_words(const std::string& content) {
    const auto count = core::text::count_non_whitespace(content);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(count);
}

std::uint64_t now_unix_seconds() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
}

}  // namespace inkbridge::project
