#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::tools {

inline constexpr std::uint32_t kDefaultReadLimit = 2000;
inline constexpr std::size_t kMaxLineChars = 2000;
inline constexpr std::size_t kMaxReadBytes = 50 * 1024;
inline constexpr std::size_t kMaxListEntries = 100;
inline constexpr std::size_t kMaxSearchMatches = 50;

struct ReadRequest {
    std::string path;
    // Negative: tail, that many lines from the end. INT64_MIN reads from the start.
    std::optional<std::int64_t> offset;
    // Clamped to kDefaultReadLimit.
    std::optional<std::uint32_t> limit;
};

struct ReadResult {
    std::string content;        // "%05d| <line>\n" per emitted line
    std::uint32_t total_lines = 0;
    bool truncated = false;
};

struct ListEntry {
    std::string name;
    bool is_dir = false;
    std::uint64_t size = 0;
    std::uint64_t modified = 0;  // unix seconds
};

struct ListResult {
    std::vector<ListEntry> entries;
};

struct SearchRequest {
    std::string query;
    std::optional<std::string> path;
};

struct SearchMatch {
    std::string file;           // project-relative, '/'-separated
    std::uint32_t line = 0;     // 1-based
    std::string content;
};

struct SearchResult {
    std::vector<SearchMatch> matches;
};

// File operations confined to a project root. Every path is validated by
// policy::PathValidator; mutations go through storage::write_protection.
class ToolHost {
public:
    core::errors::Result<ReadResult> read(
        const std::filesystem::path& project_root,
        const ReadRequest& request) const;

    core::errors::Status write(
        const std::filesystem::path& project_root,
        const std::string& path,
        const std::string& content) const;

    core::errors::Status append(
        const std::filesystem::path& project_root,
        const std::string& path,
        const std::string& content) const;

    core::errors::Result<ListResult> list(
        const std::filesystem::path& project_root,
        const std::optional<std::string>& path) const;

    core::errors::Result<SearchResult> search(
        const std::filesystem::path& project_root,
        const SearchRequest& request) const;
};

// Directory names skipped by list and search in addition to hidden entries.
bool is_ignored_dir_name(const std::string& name);

}  // namespace inkbridge::tools
