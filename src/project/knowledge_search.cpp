#include "project/knowledge_search.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include "core/text/utf8.hpp"
#include "policy/path_validator.hpp"
#include "project/chapter_index.hpp"

namespace inkbridge::project {

namespace {

bool is_supported_doc(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".txt" || ext == ".md" || ext == ".markdown";
}

bool is_blank(const std::string& value) {
    for (const char32_t c : core::text::decode_utf8(value)) {
        if (!core::text::is_unicode_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::vector<std::string> query_terms(const std::string& query) {
    std::vector<std::string> terms;
    std::istringstream in(ascii_lower(query));
    std::string term;
    while (in >> term) {
        if (std::find(terms.begin(), terms.end(), term) == terms.end()) {
            terms.push_back(term);
        }
    }
    return terms;
}

void collect_docs(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return;
    }
    for (const auto& entry : it) {
        const auto status = entry.symlink_status(ec);
        if (ec || std::filesystem::is_symlink(status)) {
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            collect_docs(entry.path(), out);
        } else if (std::filesystem::is_regular_file(status) && is_supported_doc(entry.path())) {
            out.push_back(entry.path());
        }
    }
}

}  // namespace

std::vector<std::string> chunk_text(const std::string& text,
                                    const std::size_t chunk_size,
                                    const std::size_t overlap) {
    if (is_blank(text)) {
        return {};
    }
    if (chunk_size == 0 || chunk_size <= overlap) {
        return {text};
    }

    const std::u32string chars = core::text::decode_utf8(text);
    std::vector<std::string> chunks;
    std::size_t start = 0;
    while (start < chars.size()) {
        const std::size_t end = std::min(chars.size(), start + chunk_size);
        const std::string slice =
            core::text::encode_utf8(std::u32string_view(chars).substr(start, end - start));
        if (!is_blank(slice)) {
            chunks.push_back(slice);
        }
        if (end == chars.size()) {
            break;
        }
        start = end - overlap;
    }
    return chunks;
}

core::errors::Result<std::vector<KnowledgeHit>> KeywordKnowledgeSearch::search(
    const std::filesystem::path& project_root,
    const std::string& query,
    const std::size_t top_k) const {
    auto project = ensure_project_exists(project_root);
    if (core::errors::is_error(project)) {
        return core::errors::get_error(project);
    }

    const policy::PathValidator validator;
    auto root = validator.canonical_root(project_root);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    auto knowledge = validator.validate(project_root, kKnowledgeDir);
    if (core::errors::is_error(knowledge)) {
        return core::errors::get_error(knowledge);
    }

    const auto terms = query_terms(query);
    if (terms.empty()) {
        return std::vector<KnowledgeHit>{};
    }

    std::vector<std::filesystem::path> docs;
    collect_docs(core::errors::get_value(knowledge), docs);
    std::sort(docs.begin(), docs.end());

    std::vector<KnowledgeHit> hits;
    for (const auto& doc : docs) {
        if (core::text::file_looks_binary(doc.string())) {
            continue;
        }
        std::ifstream in(doc, std::ios::binary);
        if (!in.is_open()) {
            continue;
        }
        const std::string content((std::istreambuf_iterator<char>(in)),
                                  std::istreambuf_iterator<char>());
        const std::string relative =
            policy::PathValidator::relative_to_root(core::errors::get_value(root), doc);

        for (const auto& chunk : chunk_text(content, kChunkSize, kChunkOverlap)) {
            const std::string haystack = ascii_lower(chunk);
            std::size_t matched = 0;
            for (const auto& term : terms) {
                if (haystack.find(term) != std::string::npos) {
                    ++matched;
                }
            }
            if (matched == 0) {
                continue;
            }
            hits.push_back(KnowledgeHit{
                relative,
                static_cast<float>(matched) / static_cast<float>(terms.size()),
                chunk});
        }
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const KnowledgeHit& a, const KnowledgeHit& b) {
                         return a.score > b.score;
                     });
    hits.resize(std::min(hits.size(), std::max<std::size_t>(top_k, 1)));
    return hits;
}

}  // namespace inkbridge::project
