#include "project/summary_store.hpp"

#include <fstream>
#include <iterator>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "policy/path_validator.hpp"
#include "project/chapter_index.hpp"
#include "storage/write_protection.hpp"

namespace inkbridge::project {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

bool is_blank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

json entry_to_json(const SummaryEntry& entry) {
    json payload;
    payload["chapterId"] = entry.chapter_id;
    payload["summary"] = entry.summary;
    payload["createdAt"] = entry.created_at;
    return payload;
}

}  // namespace

SummaryStore::SummaryStore(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

core::errors::Result<std::vector<SummaryEntry>> SummaryStore::load() const {
    auto project = ensure_project_exists(project_root_);
    if (core::errors::is_error(project)) {
        return core::errors::get_error(project);
    }

    const policy::PathValidator validator;
    auto path = validator.validate(project_root_, kSummariesPath);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    std::error_code ec;
    if (!std::filesystem::exists(core::errors::get_value(path), ec)) {
        return std::vector<SummaryEntry>{};
    }

    std::ifstream in(core::errors::get_value(path), std::ios::binary);
    if (!in.is_open()) {
        return BridgeError{ErrorKind::IoError, "Failed to read summaries.json",
                           "read_failed"};
    }
    const std::string text((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());

    try {
        std::vector<SummaryEntry> entries;
        for (const auto& item : json::parse(text)) {
            SummaryEntry entry;
            entry.chapter_id = item.at("chapterId").get<std::string>();
            entry.summary = item.at("summary").get<std::string>();
            entry.created_at = item.at("createdAt").get<std::uint64_t>();
            entries.push_back(std::move(entry));
        }
        return entries;
    } catch (const json::exception& e) {
        return BridgeError{ErrorKind::IoError,
                           std::string("Failed to parse summaries.json: ") + e.what(),
                           "invalid_summaries"};
    }
}

core::errors::Result<SummaryEntry> SummaryStore::append(const std::string& chapter_id,
                                                        const std::string& summary) const {
    auto project = ensure_project_exists(project_root_);
    if (core::errors::is_error(project)) {
        return core::errors::get_error(project);
    }
    if (is_blank(chapter_id)) {
        return BridgeError{ErrorKind::MissingArgument, "chapterId is empty",
                           "empty_chapter_id"};
    }
    if (is_blank(summary)) {
        return BridgeError{ErrorKind::MissingArgument, "summary is empty", "empty_summary"};
    }

    auto loaded = load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto entries = core::errors::get_value(loaded);

    SummaryEntry entry{chapter_id, summary, now_unix_seconds()};
    entries.push_back(entry);

    json payload = json::array();
    for (const auto& item : entries) {
        payload.push_back(entry_to_json(item));
    }

    const policy::PathValidator validator;
    auto root = validator.canonical_root(project_root_);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    auto path = validator.validate(project_root_, kSummariesPath);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    auto written = storage::write_with_backup(core::errors::get_value(root),
                                              core::errors::get_value(path),
                                              payload.dump(2) + "\n");
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    LOG_DEBUG("summary_store: saved summary for " + chapter_id);
    return entry;
}

}  // namespace inkbridge::project
