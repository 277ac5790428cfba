#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::project {

inline constexpr const char* kKnowledgeDir = "knowledge";
inline constexpr std::size_t kDefaultTopK = 5;
inline constexpr std::size_t kChunkSize = 800;
inline constexpr std::size_t kChunkOverlap = 120;

struct KnowledgeHit {
    std::string path;   // project-relative
    float score = 0.0F;
    std::string text;
};

// Backs the rag_search tool.
class KnowledgeSearch {
public:
    virtual ~KnowledgeSearch() = default;

    // Returns at most max(top_k, 1) hits, best first.
    virtual core::errors::Result<std::vector<KnowledgeHit>> search(
        const std::filesystem::path& project_root,
        const std::string& query,
        std::size_t top_k) const = 0;
};

// Scores knowledge/**/*.{txt,md,markdown} chunks by the share of query terms
// they contain.
class KeywordKnowledgeSearch : public KnowledgeSearch {
public:
    core::errors::Result<std::vector<KnowledgeHit>> search(
        const std::filesystem::path& project_root,
        const std::string& query,
        std::size_t top_k) const override;
};

// Splits on code points; consecutive chunks share `overlap` characters.
// Whitespace-only chunks are dropped.
std::vector<std::string> chunk_text(const std::string& text,
                                    std::size_t chunk_size,
                                    std::size_t overlap);

}  // namespace inkbridge::project
