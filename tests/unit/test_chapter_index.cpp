#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "project/chapter_index.hpp"
#include "project/knowledge_search.hpp"
#include "project/summary_store.hpp"

namespace {

using inkbridge::core::errors::ErrorKind;
using inkbridge::core::errors::get_error;
using inkbridge::core::errors::get_value;
using inkbridge::core::errors::is_error;
using inkbridge::project::ChapterIndex;
using inkbridge::project::ChapterIndexStore;
using inkbridge::project::ChapterMeta;
using inkbridge::project::KeywordKnowledgeSearch;
using inkbridge::project::SummaryStore;
using inkbridge::project::chapter_id_from_path;
using inkbridge::project::chunk_text;
using inkbridge::project::count_words;
using inkbridge::project::ensure_project_exists;
using inkbridge::project::normalize_chapter_id;

class TempProject {
public:
    TempProject() {
        root_ = std::filesystem::current_path() /
                (".tmp_project_" + inkbridge::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
    }

    ~TempProject() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content) const {
        std::filesystem::create_directories((root_ / relative).parent_path());
        std::ofstream out(root_ / relative, std::ios::binary);
        out << content;
    }

    // Marks the directory as a project with a two-chapter index.
    void scaffold() const {
        write(".creatorai/config.json", "{}");
        ChapterIndex index;
        index.chapters.push_back(ChapterMeta{"chapter_001", "Arrival", 1, 10, 10, 0});
        index.chapters.push_back(ChapterMeta{"chapter_002", "Storm", 2, 20, 20, 0});
        index.next_id = 3;
        std::filesystem::create_directories(root_ / "chapters");
        ASSERT_FALSE(is_error(ChapterIndexStore(root_).save(index)));
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(ChapterIdTest, NormalizesDigitsAndKeepsPrefixedIds) {
    EXPECT_EQ(get_value(normalize_chapter_id("7")), "chapter_007");
    EXPECT_EQ(get_value(normalize_chapter_id(" 012 ")), "chapter_012");
    EXPECT_EQ(get_value(normalize_chapter_id("1234")), "chapter_1234");
    EXPECT_EQ(get_value(normalize_chapter_id("chapter_042")), "chapter_042");
}

TEST(ChapterIdTest, RejectsEmptyAndMalformedIds) {
    auto empty = normalize_chapter_id("   ");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).message, "chapterId is empty");

    EXPECT_TRUE(is_error(normalize_chapter_id("chapter_x1")));
    EXPECT_TRUE(is_error(normalize_chapter_id("prologue")));
    EXPECT_TRUE(is_error(normalize_chapter_id("-3")));
}

TEST(ChapterIdTest, ExtractsIdsFromChapterPaths) {
    EXPECT_EQ(chapter_id_from_path("chapters/chapter_003.txt"), "chapter_003");
    EXPECT_EQ(chapter_id_from_path("./chapters/chapter_003.txt"), "chapter_003");
    EXPECT_FALSE(chapter_id_from_path("chapters/notes.txt").has_value());
    EXPECT_FALSE(chapter_id_from_path("chapters/drafts/chapter_003.txt").has_value());
    EXPECT_FALSE(chapter_id_from_path("chapter_003.txt").has_value());
    EXPECT_FALSE(chapter_id_from_path("chapters/chapter_003.md").has_value());
}

TEST(ChapterIdTest, CountsNonWhitespaceCharacters) {
    EXPECT_EQ(count_words(""), 0U);
    EXPECT_EQ(count_words("a b\tc\n"), 3U);
    EXPECT_EQ(count_words("\xe4\xbd\xa0\xe5\xa5\xbd\xe3\x80\x80\xe4\xb8\x96"), 3U);
}

TEST(ChapterIndexStoreTest, ProjectNeedsConfigAndIndex) {
    TempProject project;
    auto bare = ensure_project_exists(project.root());
    ASSERT_TRUE(is_error(bare));
    EXPECT_EQ(get_error(bare).message, "Not a valid project: missing .creatorai/config.json");

    project.write(".creatorai/config.json", "{}");
    auto no_index = ensure_project_exists(project.root());
    ASSERT_TRUE(is_error(no_index));
    EXPECT_EQ(get_error(no_index).message, "Not a valid project: missing chapters/index.json");

    project.scaffold();
    EXPECT_FALSE(is_error(ensure_project_exists(project.root())));
    EXPECT_TRUE(is_error(ensure_project_exists(project.root() / "missing")));
}

TEST(ChapterIndexStoreTest, LookupReportsChapterDetails) {
    TempProject project;
    project.scaffold();
    const ChapterIndexStore store(project.root());

    auto info = store.lookup("chapter_002");
    ASSERT_FALSE(is_error(info));
    EXPECT_EQ(get_value(info).title, "Storm");
    EXPECT_EQ(get_value(info).path, "chapters/chapter_002.txt");
    EXPECT_EQ(get_value(info).updated_at, 20U);

    auto missing = store.lookup("chapter_009");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "chapter_not_found");
}

TEST(ChapterIndexStoreTest, UpdateTouchesOnlyTheNamedChapter) {
    TempProject project;
    project.scaffold();
    const ChapterIndexStore store(project.root());

    auto updated = store.update_word_count_and_timestamp("chapter_002", 42, 999);
    ASSERT_FALSE(is_error(updated));
    EXPECT_TRUE(get_value(updated));

    auto absent = store.update_word_count_and_timestamp("chapter_005", 1, 1);
    ASSERT_FALSE(is_error(absent));
    EXPECT_FALSE(get_value(absent));

    auto loaded = store.load();
    ASSERT_FALSE(is_error(loaded));
    const auto& chapters = get_value(loaded).chapters;
    ASSERT_EQ(chapters.size(), 2U);
    EXPECT_EQ(chapters[0].word_count, 0U);
    EXPECT_EQ(chapters[0].updated, 10U);
    EXPECT_EQ(chapters[1].word_count, 42U);
    EXPECT_EQ(chapters[1].updated, 999U);
    EXPECT_EQ(get_value(loaded).next_id, 3U);
}

TEST(ChapterIndexStoreTest, RewritingTheIndexKeepsABackup) {
    TempProject project;
    project.scaffold();
    const ChapterIndexStore store(project.root());

    auto updated = store.update_word_count_and_timestamp("chapter_001", 5, 500);
    ASSERT_FALSE(is_error(updated));
    ASSERT_TRUE(get_value(updated));

    std::vector<std::filesystem::path> backups;
    for (const auto& entry : std::filesystem::directory_iterator(project.root() / ".backup")) {
        backups.push_back(entry.path() / "chapters" / "index.json");
    }
    ASSERT_EQ(backups.size(), 1U);
    ASSERT_TRUE(std::filesystem::exists(backups[0]));

    std::ifstream in(backups[0], std::ios::binary);
    const auto previous = nlohmann::json::parse(
        std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()));
    EXPECT_EQ(previous.at("chapters")[0].at("wordCount"), 0);
    EXPECT_EQ(previous.at("chapters")[0].at("updated"), 10);

    auto loaded = store.load();
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).chapters[0].word_count, 5U);
}

TEST(ChapterIndexStoreTest, RefreshIgnoresNonChapterPaths) {
    TempProject project;
    project.scaffold();
    project.write("notes/chapter_001.txt", "lots of words here");
    const ChapterIndexStore store(project.root());

    EXPECT_FALSE(is_error(store.refresh_from_file("notes/chapter_001.txt")));
    auto loaded = store.load();
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).chapters[0].word_count, 0U);

    project.write("chapters/chapter_001.txt", "two words");
    EXPECT_FALSE(is_error(store.refresh_from_file("chapters/chapter_001.txt")));
    loaded = store.load();
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).chapters[0].word_count, 8U);
}

TEST(ChapterIndexStoreTest, CorruptIndexIsAnError) {
    TempProject project;
    project.write("chapters/index.json", "{not json");
    auto loaded = ChapterIndexStore(project.root()).load();
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_chapter_index");
}

TEST(SummaryStoreTest, AppendsEntriesInOrder) {
    TempProject project;
    project.scaffold();
    const SummaryStore store(project.root());

    ASSERT_FALSE(is_error(store.append("chapter_001", "First.")));
    ASSERT_FALSE(is_error(store.append("chapter_002", "Second.")));

    auto entries = store.load();
    ASSERT_FALSE(is_error(entries));
    ASSERT_EQ(get_value(entries).size(), 2U);
    EXPECT_EQ(get_value(entries)[0].summary, "First.");
    EXPECT_EQ(get_value(entries)[1].chapter_id, "chapter_002");
    EXPECT_GT(get_value(entries)[1].created_at, 0U);
}

TEST(SummaryStoreTest, RejectsBlankInputAndInvalidProjects) {
    TempProject project;
    const SummaryStore store(project.root());
    auto invalid = store.append("chapter_001", "text");
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid).code, "invalid_project");

    project.scaffold();
    auto blank = store.append("chapter_001", "  \n");
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).kind, ErrorKind::MissingArgument);
    EXPECT_EQ(get_error(blank).message, "summary is empty");
}

TEST(KnowledgeSearchTest, ChunksOverlapByCodePoints) {
    const auto chunks = chunk_text("abcdefghij", 4, 1);
    ASSERT_EQ(chunks.size(), 3U);
    EXPECT_EQ(chunks[0], "abcd");
    EXPECT_EQ(chunks[1], "defg");
    EXPECT_EQ(chunks[2], "ghij");

    EXPECT_TRUE(chunk_text(" \n\t", 4, 1).empty());
    EXPECT_EQ(chunk_text("short", 10, 2).size(), 1U);
}

TEST(KnowledgeSearchTest, RanksDocumentsByMatchedTerms) {
    TempProject project;
    project.scaffold();
    project.write("knowledge/castle.md", "The Castle of Glass stands on the northern cliffs.");
    project.write("knowledge/river.txt", "The river runs past the old mill.");
    project.write("knowledge/image.png", "castle glass");
    const KeywordKnowledgeSearch search;

    auto hits = search.search(project.root(), "castle GLASS", 5);
    ASSERT_FALSE(is_error(hits));
    ASSERT_EQ(get_value(hits).size(), 1U);
    EXPECT_EQ(get_value(hits)[0].path, "knowledge/castle.md");
    EXPECT_FLOAT_EQ(get_value(hits)[0].score, 1.0F);

    auto partial = search.search(project.root(), "castle river", 5);
    ASSERT_FALSE(is_error(partial));
    ASSERT_EQ(get_value(partial).size(), 2U);
    EXPECT_FLOAT_EQ(get_value(partial)[0].score, 0.5F);

    auto capped = search.search(project.root(), "the", 0);
    ASSERT_FALSE(is_error(capped));
    EXPECT_EQ(get_value(capped).size(), 1U);

    auto empty = search.search(project.root(), "   ", 5);
    ASSERT_FALSE(is_error(empty));
    EXPECT_TRUE(get_value(empty).empty());
}

}  // namespace
