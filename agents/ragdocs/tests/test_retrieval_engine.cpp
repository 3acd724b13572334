#include <gtest/gtest.h>
#include "errors.hpp"
#include "fake_embedder.hpp"
#include "retrieval_engine.hpp"
#include "sqlite_store.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>

namespace fs = std::filesystem;

namespace {

// Delegates to a real store but can be told to fail writes.
class FlakyStore : public IndexStore {
public:
    explicit FlakyStore(IndexStore& inner) : inner_(inner) {}

    void ensure_schema() override {
        if (before_schema) {
            auto hook = std::move(before_schema);
            before_schema = nullptr;
            hook();
        }
        inner_.ensure_schema();
    }
    void delete_by_path(const std::set<std::string>& paths) override {
        if (fail_delete) throw StorageError("injected delete failure");
        inner_.delete_by_path(paths);
    }
    void insert(const std::vector<Chunk>& chunks) override {
        if (fail_insert) throw StorageError("injected insert failure");
        inner_.insert(chunks);
    }
    std::vector<StoreHit> search(const std::vector<float>& vector, const FilterExpr& filter,
                                 std::size_t limit, std::size_t group_size) override {
        return inner_.search(vector, filter, limit, group_size);
    }

    // Runs once, after the diff and before any file is read.
    std::function<void()> before_schema;
    std::atomic<bool> fail_insert{false};
    std::atomic<bool> fail_delete{false};

private:
    IndexStore& inner_;
};

const char* kGuide =
    "## Setup\nInstall the server with the setup script.\n"
    "## Security\nEnable authentication and encryption for security.\n";

}

class RetrievalEngineTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path docs_a;
    fs::path docs_b;
    StoreConfig store_cfg;
    std::unique_ptr<ChangeTracker> tracker;
    std::unique_ptr<SqliteIndexStore> sqlite;
    std::unique_ptr<FlakyStore> store;
    DocumentSegmenter segmenter;
    HashingEmbedder embedder{64};
    std::unique_ptr<RetrievalEngine> engine;

    void SetUp() override {
        root = fs::temp_directory_path() /
              ("ragdocs_engine_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root);
        docs_a = root / "docs_a";
        docs_b = root / "docs_b";
        fs::create_directories(docs_a);
        fs::create_directories(docs_b);

        store_cfg.db_path = (root / "index.db").string();
        store_cfg.dimension = 64;
        tracker = std::make_unique<ChangeTracker>(root / "cache.json");
        sqlite = std::make_unique<SqliteIndexStore>(store_cfg);
        store = std::make_unique<FlakyStore>(*sqlite);
        engine = std::make_unique<RetrievalEngine>(*tracker, segmenter, embedder, *store);
    }

    void TearDown() override {
        engine.reset();
        store.reset();
        sqlite.reset();
        tracker.reset();
        fs::remove_all(root);
    }

    static void writeTextFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    static std::string path_of(const fs::path& p) { return p.lexically_normal().string(); }

    static bool contains_path(const GroupedResults& results, const std::string& path) {
        for (const auto& [tech, group] : results)
            for (const auto& r : group)
                if (r.file_path == path) return true;
        return false;
    }
};

TEST_F(RetrievalEngineTest, IndexesNewFileAndFindsBothSections) {
    writeTextFile(docs_a / "guide.md", kGuide);
    auto report = engine->sync("A", docs_a);
    EXPECT_EQ(report.technology, "A");
    EXPECT_EQ(report.new_files, 1u);
    EXPECT_EQ(report.modified_files, 0u);
    EXPECT_EQ(report.deleted_files, 0u);
    EXPECT_EQ(report.chunks, 2u);
    EXPECT_EQ(sqlite->row_count(), 2u);

    auto results = engine->search("server setup security");
    ASSERT_EQ(results.count("A"), 1u);
    const auto& group = results.at("A");
    ASSERT_EQ(group.size(), 2u);
    std::set<std::string> titles{group[0].section_title, group[1].section_title};
    EXPECT_EQ(titles, (std::set<std::string>{"Setup", "Security"}));
    EXPECT_GE(group[0].score, group[1].score);
    for (const auto& r : group) {
        EXPECT_EQ(r.file_path, path_of(docs_a / "guide.md"));
        EXPECT_EQ(r.section_level, 2);
    }
}

TEST_F(RetrievalEngineTest, ExactContentQueryScoresOne) {
    writeTextFile(docs_a / "guide.md", kGuide);
    engine->sync("A", docs_a);

    auto results = engine->search("## Setup\nInstall the server with the setup script.");
    ASSERT_FALSE(results["A"].empty());
    EXPECT_EQ(results["A"][0].section_title, "Setup");
    EXPECT_EQ(results["A"][0].category, "deployment");
    EXPECT_FLOAT_EQ(results["A"][0].score, 1.0f);
}

TEST_F(RetrievalEngineTest, UnchangedTreeIsNoOp) {
    writeTextFile(docs_a / "guide.md", kGuide);
    engine->sync("A", docs_a);
    int calls = embedder.calls.load();

    auto report = engine->sync("A", docs_a);
    EXPECT_EQ(report.new_files + report.modified_files + report.deleted_files, 0u);
    EXPECT_EQ(report.chunks, 0u);
    EXPECT_EQ(embedder.calls.load(), calls);
    EXPECT_EQ(sqlite->row_count(), 2u);
}

TEST_F(RetrievalEngineTest, ModifiedFileReplacesItsChunks) {
    writeTextFile(docs_a / "guide.md", kGuide);
    engine->sync("A", docs_a);

    writeTextFile(docs_a / "guide.md", "## Tuning\nLatency and throughput guidance.\n");
    auto report = engine->sync("A", docs_a);
    EXPECT_EQ(report.new_files, 0u);
    EXPECT_EQ(report.modified_files, 1u);
    EXPECT_EQ(report.deleted_files, 0u);
    EXPECT_EQ(sqlite->row_count(), 1u);

    auto results = engine->search("Install the server with the setup script.", {}, {}, 10);
    ASSERT_EQ(results["A"].size(), 1u);
    EXPECT_EQ(results["A"][0].section_title, "Tuning");
    EXPECT_EQ(results["A"][0].category, "performance");
}

TEST_F(RetrievalEngineTest, DeletedFileDisappearsFromResults) {
    writeTextFile(docs_a / "guide.md", kGuide);
    writeTextFile(docs_a / "other.md", "## Other\nUnrelated notes.\n");
    engine->sync("A", docs_a);

    fs::remove(docs_a / "guide.md");
    auto report = engine->sync("A", docs_a);
    EXPECT_EQ(report.deleted_files, 1u);
    EXPECT_EQ(report.new_files + report.modified_files, 0u);

    auto results = engine->search("setup security", {}, {}, 10);
    EXPECT_FALSE(contains_path(results, path_of(docs_a / "guide.md")));
    EXPECT_TRUE(contains_path(results, path_of(docs_a / "other.md")));
}

TEST_F(RetrievalEngineTest, FiltersByTechnologyAndCategory) {
    writeTextFile(docs_a / "guide.md", kGuide);
    writeTextFile(docs_a / "more.md", "## Hardening\nSecurity checklist: rotate keys, security audits.\n");
    writeTextFile(docs_b / "guide.md", kGuide);
    engine->sync("A", docs_a);
    engine->sync("B", docs_b);

    auto results = engine->search("security authentication", {"A"}, {"security"}, 5);
    ASSERT_EQ(results.size(), 1u);
    const auto& group = results.at("A");
    ASSERT_EQ(group.size(), 2u);
    for (const auto& r : group) {
        EXPECT_EQ(r.technology, "A");
        EXPECT_EQ(r.category, "security");
    }
    EXPECT_GE(group[0].score, group[1].score);
}

TEST_F(RetrievalEngineTest, EveryTechnologyGetsItsOwnTopK) {
    writeTextFile(docs_a / "guide.md", kGuide);
    writeTextFile(docs_b / "guide.md", kGuide);
    engine->sync("A", docs_a);
    engine->sync("B", docs_b);

    auto results = engine->search("setup", {}, {}, 1);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results.at("A").size(), 1u);
    EXPECT_EQ(results.at("B").size(), 1u);
}

TEST_F(RetrievalEngineTest, CrowdedTechnologyDoesNotHideOthers) {
    std::string crowded;
    for (int i = 0; i < 8; ++i) crowded += "## Guide " + std::to_string(i) + "\nsetup install guide\n";
    writeTextFile(docs_a / "crowded.md", crowded);
    writeTextFile(docs_b / "lone.md", "## Lone\nsetup notes for a different product with many other words\n");
    engine->sync("A", docs_a);
    engine->sync("B", docs_b);

    auto results = engine->search("setup install guide", {}, {}, 2);
    ASSERT_EQ(results.count("A"), 1u);
    ASSERT_EQ(results.count("B"), 1u);
    EXPECT_EQ(results.at("A").size(), 2u);
    ASSERT_EQ(results.at("B").size(), 1u);
    EXPECT_EQ(results.at("B")[0].file_path, path_of(docs_b / "lone.md"));
    EXPECT_GT(results.at("A")[0].score, results.at("B")[0].score);
}

TEST_F(RetrievalEngineTest, TopKCapsEachGroup) {
    std::string doc;
    for (int i = 0; i < 6; ++i) doc += "## Part " + std::to_string(i) + "\nshared words here\n";
    writeTextFile(docs_a / "parts.md", doc);
    engine->sync("A", docs_a);

    auto results = engine->search("shared words", {}, {}, 2);
    EXPECT_EQ(results.at("A").size(), 2u);
    EXPECT_TRUE(engine->search("shared words", {}, {}, 0).empty());
}

TEST_F(RetrievalEngineTest, SearchOnEmptyIndexIsEmpty) {
    EXPECT_TRUE(engine->search("anything").empty());
    EXPECT_TRUE(engine->search("anything", {"A"}, {"security"}).empty());
}

TEST_F(RetrievalEngineTest, FailedInsertIsRetriedOnNextSync) {
    writeTextFile(docs_a / "guide.md", kGuide);
    store->fail_insert = true;
    EXPECT_THROW(engine->sync("A", docs_a), StorageError);
    EXPECT_EQ(sqlite->row_count(), 0u);
    EXPECT_EQ(engine->available_technologies().count("A"), 0u);

    store->fail_insert = false;
    auto report = engine->sync("A", docs_a);
    EXPECT_EQ(report.new_files + report.modified_files, 1u);
    EXPECT_EQ(sqlite->row_count(), 2u);
    EXPECT_EQ(engine->available_technologies().count("A"), 1u);
}

TEST_F(RetrievalEngineTest, FailedDeleteIsRetriedOnNextSync) {
    writeTextFile(docs_a / "guide.md", kGuide);
    engine->sync("A", docs_a);

    fs::remove(docs_a / "guide.md");
    store->fail_delete = true;
    EXPECT_THROW(engine->sync("A", docs_a), StorageError);
    EXPECT_EQ(sqlite->row_count(), 2u);

    store->fail_delete = false;
    auto report = engine->sync("A", docs_a);
    EXPECT_EQ(report.deleted_files, 1u);
    EXPECT_EQ(sqlite->row_count(), 0u);
}

TEST_F(RetrievalEngineTest, FilesChangedDuringSyncAreRetried) {
    writeTextFile(docs_a / "guide.md", kGuide);
    writeTextFile(docs_a / "notes.md", "## Notes\nUnrelated notes.\n");
    store->before_schema = [this] {
        writeTextFile(docs_a / "guide.md", "## Tuning\nLatency and throughput guidance.\n");
        fs::remove(docs_a / "notes.md");
    };

    auto first = engine->sync("A", docs_a);
    EXPECT_EQ(first.new_files, 2u);
    ASSERT_EQ(first.skipped.size(), 1u);
    EXPECT_EQ(first.skipped[0].path, path_of(docs_a / "notes.md"));
    EXPECT_EQ(first.chunks, 1u);
    EXPECT_TRUE(tracker->find(path_of(docs_a / "guide.md"))->hash.empty());

    auto second = engine->sync("A", docs_a);
    EXPECT_EQ(second.new_files, 0u);
    EXPECT_EQ(second.modified_files, 1u);
    EXPECT_EQ(second.deleted_files, 1u);
    EXPECT_TRUE(second.skipped.empty());
    EXPECT_EQ(sqlite->row_count(), 1u);
    EXPECT_FALSE(tracker->find(path_of(docs_a / "notes.md")).has_value());

    auto results = engine->search("latency throughput", {}, {}, 10);
    ASSERT_EQ(results["A"].size(), 1u);
    EXPECT_EQ(results["A"][0].section_title, "Tuning");
    EXPECT_TRUE(engine->sync("A", docs_a).skipped.empty());
    EXPECT_EQ(sqlite->row_count(), 1u);
}

TEST_F(RetrievalEngineTest, ConcurrentSyncsDoNotDuplicateChunks) {
    writeTextFile(docs_a / "guide.md", kGuide);
    writeTextFile(docs_a / "other.md", "## Other\nUnrelated notes.\n");

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) workers.emplace_back([this] { engine->sync("A", docs_a); });
    for (auto& t : workers) t.join();

    EXPECT_EQ(sqlite->row_count(), 3u);
}

TEST_F(RetrievalEngineTest, SyncAllReportsFailuresPerTechnology) {
    writeTextFile(docs_a / "guide.md", kGuide);
    auto reports = engine->sync_all({{"A", docs_a.string()}, {"missing", (root / "nope").string()}});
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].technology, "A");
    EXPECT_TRUE(reports[0].error.empty());
    EXPECT_EQ(reports[0].new_files, 1u);
    EXPECT_EQ(reports[1].technology, "missing");
    EXPECT_FALSE(reports[1].error.empty());
    EXPECT_EQ(engine->available_technologies(), (std::set<std::string>{"A"}));

    // errors flush immediately; gtest_main points the file sink at this directory
    std::ifstream log(fs::temp_directory_path() / "ragdocs_test_logs" / "ragdocs.log");
    std::string contents((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("Sync of missing from " + (root / "nope").string() + " failed"), std::string::npos);
}

TEST_F(RetrievalEngineTest, ListsCategories) {
    auto names = engine->categories();
    ASSERT_EQ(names.size(), default_category_table().size());
    EXPECT_EQ(names.front(), "deployment");
    EXPECT_NE(std::find(names.begin(), names.end(), "security"), names.end());
}
