#pragma once
#include "hnsw.hpp"
#include "index_store.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Embedded IndexStore: chunk rows live in SQLite, the ANN graph is rebuilt in memory
// from those rows whenever the collection is opened.
class SqliteIndexStore : public IndexStore {
public:
    explicit SqliteIndexStore(StoreConfig cfg);
    ~SqliteIndexStore() override;

    SqliteIndexStore(const SqliteIndexStore&) = delete;
    SqliteIndexStore& operator=(const SqliteIndexStore&) = delete;

    void ensure_schema() override;
    void delete_by_path(const std::set<std::string>& paths) override;
    void insert(const std::vector<Chunk>& chunks) override;
    std::vector<StoreHit> search(const std::vector<float>& vector, const FilterExpr& filter,
                                 std::size_t limit, std::size_t group_size) override;

    std::size_t row_count();

private:
    struct RowTags {
        std::string technology;
        std::string category;
    };

    bool collection_exists();
    void open_collection();
    void load_graph();
    void exec(const std::string& sql);
    void prepare(const std::string& sql, struct sqlite3_stmt** stmt);
    void prepare_statements();
    void close_statements();
    void rollback_quietly();

    StoreConfig cfg_;
    std::mutex mtx_;
    bool ready_{false};
    std::unique_ptr<HnswIndex> graph_;
    std::unordered_map<std::int64_t, RowTags> tags_;

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* ids_by_path_stmt_ {nullptr};
    struct sqlite3_stmt* delete_by_path_stmt_ {nullptr};
    struct sqlite3_stmt* by_id_stmt_ {nullptr};
    struct sqlite3_stmt* all_stmt_ {nullptr};
};
