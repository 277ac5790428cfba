#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::project {

inline constexpr const char* kChapterIndexPath = "chapters/index.json";

struct ChapterMeta {
    std::string id;             // "chapter_001"
    std::string title;
    std::uint32_t order = 0;
    std::uint64_t created = 0;  // unix seconds
    std::uint64_t updated = 0;  // unix seconds
    std::uint32_t word_count = 0;
};

struct ChapterIndex {
    std::vector<ChapterMeta> chapters;
    std::uint32_t next_id = 1;
};

// What get_chapter_info reports for the active chapter.
struct ChapterInfo {
    std::string chapter_id;
    std::string title;
    std::string path;           // "chapters/<id>.txt"
    std::uint32_t word_count = 0;
    std::uint64_t updated_at = 0;
};

// chapters/index.json of one project. Paths go through policy::PathValidator.
class ChapterIndexStore {
public:
    explicit ChapterIndexStore(std::filesystem::path project_root);

    bool exists() const;
    core::errors::Result<ChapterIndex> load() const;
    core::errors::Status save(const ChapterIndex& index) const;

    core::errors::Result<ChapterInfo> lookup(const std::string& chapter_id) const;

    // False when the index has no entry for chapter_id; nothing is written then.
    core::errors::Result<bool> update_word_count_and_timestamp(
        const std::string& chapter_id,
        std::uint32_t word_count,
        std::uint64_t now) const;

    // Re-counts a chapter file after it changed. Paths outside the
    // chapters/chapter_<digits>.txt convention, a missing index, or a chapter
    // absent from the index are no-ops.
    core::errors::Status refresh_from_file(const std::string& relative_path) const;

private:
    std::filesystem::path project_root_;
};

// A project root holds .creatorai/config.json and chapters/index.json.
core::errors::Status ensure_project_exists(const std::filesystem::path& project_root);

// "chapter_007" stays as is; "7", "07", "007" become "chapter_007".
core::errors::Result<std::string> normalize_chapter_id(const std::string& value);

std::optional<std::string> chapter_id_from_path(const std::string& relative_path);

// Non-whitespace characters; the writing app counts CJK text this way.
std::uint32_t count_words(const std::string& content);

std::uint64_t now_unix_seconds();

}  // namespace inkbridge::project
