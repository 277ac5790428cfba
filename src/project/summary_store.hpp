#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::project {

inline constexpr const char* kSummariesPath = "summaries.json";

struct SummaryEntry {
    std::string chapter_id;
    std::string summary;
    std::uint64_t created_at = 0;  // unix seconds
};

// summaries.json: a JSON array of {chapterId, summary, createdAt}.
class SummaryStore {
public:
    explicit SummaryStore(std::filesystem::path project_root);

    core::errors::Result<std::vector<SummaryEntry>> load() const;

    // Requires a valid project; empty chapter ids and summaries are rejected.
    core::errors::Result<SummaryEntry> append(const std::string& chapter_id,
                                              const std::string& summary) const;

private:
    std::filesystem::path project_root_;
};

}  // namespace inkbridge::project
