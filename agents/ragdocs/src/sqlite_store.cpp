#include "../include/sqlite_store.hpp"
#include "../include/errors.hpp"
#include "../include/log_registry.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <set>

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? reinterpret_cast<const char*>(t) : std::string();
}

static bool valid_identifier(const std::string& name) {
    if (name.empty() || std::isdigit((unsigned char)name[0])) return false;
    for (char c : name) {
        if (!std::isalnum((unsigned char)c) && c != '_') return false;
    }
    return true;
}

SqliteIndexStore::SqliteIndexStore(StoreConfig cfg) : cfg_(std::move(cfg)) {
    if (!valid_identifier(cfg_.collection)) {
        throw SchemaError("invalid collection name: " + cfg_.collection);
    }
    std::filesystem::path p(cfg_.db_path);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    if (sqlite3_open(cfg_.db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw ConnectionError("Failed to open SQLite DB " + cfg_.db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, cfg_.timeout_ms);
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("CREATE TABLE IF NOT EXISTS collections (\n"
             "  name TEXT PRIMARY KEY,\n"
             "  dimension INTEGER NOT NULL,\n"
             "  metric TEXT NOT NULL,\n"
             "  index_type TEXT NOT NULL,\n"
             "  m INTEGER NOT NULL,\n"
             "  ef_construction INTEGER NOT NULL\n"
             ");");
        if (collection_exists()) open_collection();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteIndexStore::~SqliteIndexStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteIndexStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StorageError("SQLite error: " + msg);
    }
}

void SqliteIndexStore::prepare(const std::string& sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr) != SQLITE_OK) {
        throw StorageError("prepare failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteIndexStore::prepare_statements() {
    close_statements();
    const std::string& t = cfg_.collection;
    prepare("INSERT INTO " + t + " \n"
            "(content, technology, file_path, file_hash, section_title, section_level, category, embeddings) \n"
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);", &insert_stmt_);
    prepare("SELECT id FROM " + t + " WHERE file_path = ?;", &ids_by_path_stmt_);
    prepare("DELETE FROM " + t + " WHERE file_path = ?;", &delete_by_path_stmt_);
    prepare("SELECT content, technology, file_path, section_title, section_level, category FROM " + t +
            " WHERE id = ?;", &by_id_stmt_);
    prepare("SELECT id, technology, category, embeddings FROM " + t + ";", &all_stmt_);
}

void SqliteIndexStore::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &ids_by_path_stmt_, &delete_by_path_stmt_, &by_id_stmt_, &all_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

void SqliteIndexStore::rollback_quietly() {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

bool SqliteIndexStore::collection_exists() {
    sqlite3_stmt* st = nullptr;
    prepare("SELECT dimension FROM collections WHERE name = ?;", &st);
    bind_text(st, 1, cfg_.collection);
    int rc = sqlite3_step(st);
    bool found = rc == SQLITE_ROW;
    std::size_t dim = found ? (std::size_t)sqlite3_column_int64(st, 0) : 0;
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw StorageError("collection lookup failed");
    if (found && dim != cfg_.dimension) {
        throw SchemaError("collection " + cfg_.collection + " has dimension " + std::to_string(dim) +
                          ", configured " + std::to_string(cfg_.dimension));
    }
    return found;
}

void SqliteIndexStore::open_collection() {
    prepare_statements();
    load_graph();
    ready_ = true;
}

void SqliteIndexStore::load_graph() {
    HnswParams params;
    params.m = cfg_.hnsw.m;
    params.ef_construction = cfg_.hnsw.ef_construction;
    auto graph = std::make_unique<HnswIndex>(cfg_.dimension, params);
    std::unordered_map<std::int64_t, RowTags> tags;

    sqlite3_reset(all_stmt_);
    int rc;
    while ((rc = sqlite3_step(all_stmt_)) == SQLITE_ROW) {
        std::int64_t id = sqlite3_column_int64(all_stmt_, 0);
        const void* blob = sqlite3_column_blob(all_stmt_, 3);
        int bytes = sqlite3_column_bytes(all_stmt_, 3);
        if (bytes != (int)(cfg_.dimension * sizeof(float))) {
            LogRegistry::store()->warn("Row {} of {} has a malformed vector, skipping", id, cfg_.collection);
            continue;
        }
        std::vector<float> vec(cfg_.dimension);
        std::memcpy(vec.data(), blob, bytes);
        graph->add(id, vec);
        tags[id] = RowTags{column_text(all_stmt_, 1), column_text(all_stmt_, 2)};
    }
    sqlite3_reset(all_stmt_);
    if (rc != SQLITE_DONE) throw StorageError("loading " + cfg_.collection + " failed: " + sqlite3_errmsg(db_));

    graph_ = std::move(graph);
    tags_ = std::move(tags);
    LogRegistry::store()->debug("Built HNSW graph for {} with {} vectors", cfg_.collection, graph_->size());
}

void SqliteIndexStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (ready_) return;
    auto log = LogRegistry::store();
    try {
        if (!collection_exists()) {
            log->info("Creating collection {} (dim {}, HNSW M={} efConstruction={})", cfg_.collection,
                      cfg_.dimension, cfg_.hnsw.m, cfg_.hnsw.ef_construction);
            const std::string& t = cfg_.collection;
            exec("BEGIN;");
            try {
                exec("CREATE TABLE IF NOT EXISTS " + t + " (\n"
                     "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
                     "  content TEXT NOT NULL,\n"
                     "  technology TEXT NOT NULL,\n"
                     "  file_path TEXT NOT NULL,\n"
                     "  file_hash TEXT NOT NULL,\n"
                     "  section_title TEXT NOT NULL,\n"
                     "  section_level INTEGER NOT NULL,\n"
                     "  category TEXT NOT NULL,\n"
                     "  embeddings BLOB NOT NULL\n"
                     ");");
                exec("CREATE INDEX IF NOT EXISTS idx_" + t + "_file_path ON " + t + "(file_path);");
                exec("INSERT INTO collections (name, dimension, metric, index_type, m, ef_construction) VALUES ('" +
                     t + "', " + std::to_string(cfg_.dimension) + ", 'L2', 'HNSW', " + std::to_string(cfg_.hnsw.m) +
                     ", " + std::to_string(cfg_.hnsw.ef_construction) + ");");
                exec("COMMIT;");
            } catch (...) {
                rollback_quietly();
                throw;
            }
        }
        open_collection();
    } catch (const SchemaError&) {
        throw;
    } catch (const std::exception& e) {
        log->error("Failed to ensure collection {}: {}", cfg_.collection, e.what());
        throw SchemaError("ensure collection " + cfg_.collection + ": " + e.what());
    }
}

void SqliteIndexStore::delete_by_path(const std::set<std::string>& paths) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ready_ || paths.empty()) return;

    std::vector<std::int64_t> removed;
    exec("BEGIN;");
    try {
        for (const auto& path : paths) {
            sqlite3_reset(ids_by_path_stmt_);
            bind_text(ids_by_path_stmt_, 1, path);
            int rc;
            while ((rc = sqlite3_step(ids_by_path_stmt_)) == SQLITE_ROW) {
                removed.push_back(sqlite3_column_int64(ids_by_path_stmt_, 0));
            }
            sqlite3_reset(ids_by_path_stmt_);
            if (rc != SQLITE_DONE) throw StorageError("select by path failed: " + std::string(sqlite3_errmsg(db_)));

            sqlite3_reset(delete_by_path_stmt_);
            bind_text(delete_by_path_stmt_, 1, path);
            if (sqlite3_step(delete_by_path_stmt_) != SQLITE_DONE) {
                sqlite3_reset(delete_by_path_stmt_);
                throw StorageError("delete_by_path failed: " + std::string(sqlite3_errmsg(db_)));
            }
            sqlite3_reset(delete_by_path_stmt_);
        }
        exec("COMMIT;");
    } catch (const StorageError& e) {
        rollback_quietly();
        LogRegistry::store()->error("Delete from {} failed: {}", cfg_.collection, e.what());
        throw;
    }

    for (auto id : removed) {
        graph_->remove(id);
        tags_.erase(id);
    }
    LogRegistry::store()->debug("Deleted {} chunks for {} paths", removed.size(), paths.size());

    // Tombstones slow the walk down; rebuild once they outnumber live vectors.
    if (graph_->tombstones() > graph_->size()) load_graph();
}

void SqliteIndexStore::insert(const std::vector<Chunk>& chunks) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (chunks.empty()) return;
    if (!ready_) throw StorageError("collection " + cfg_.collection + " does not exist");
    for (const auto& c : chunks) validate_chunk(c, cfg_.dimension);

    std::vector<std::int64_t> ids;
    ids.reserve(chunks.size());
    exec("BEGIN;");
    try {
        for (const auto& c : chunks) {
            sqlite3_reset(insert_stmt_);
            sqlite3_clear_bindings(insert_stmt_);
            bind_text(insert_stmt_, 1, c.content);
            bind_text(insert_stmt_, 2, c.technology);
            bind_text(insert_stmt_, 3, c.file_path);
            bind_text(insert_stmt_, 4, c.file_hash);
            bind_text(insert_stmt_, 5, c.section_title);
            sqlite3_bind_int(insert_stmt_, 6, c.section_level);
            bind_text(insert_stmt_, 7, c.category);
            bind_blob(insert_stmt_, 8, c.embedding);
            if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
                sqlite3_reset(insert_stmt_);
                throw StorageError("insert chunk failed: " + std::string(sqlite3_errmsg(db_)));
            }
            ids.push_back(sqlite3_last_insert_rowid(db_));
        }
        sqlite3_reset(insert_stmt_);
        exec("COMMIT;");
    } catch (const StorageError& e) {
        rollback_quietly();
        LogRegistry::store()->error("Insert into {} failed: {}", cfg_.collection, e.what());
        throw;
    }

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        graph_->add(ids[i], chunks[i].embedding);
        tags_[ids[i]] = RowTags{chunks[i].technology, chunks[i].category};
    }
    LogRegistry::store()->debug("Inserted {} chunks into {}", chunks.size(), cfg_.collection);
}

std::vector<StoreHit> SqliteIndexStore::search(const std::vector<float>& vector, const FilterExpr& filter,
                                               std::size_t limit, std::size_t group_size) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ready_ || limit == 0) return {};
    if (vector.size() != cfg_.dimension) {
        throw StorageError("query has dimension " + std::to_string(vector.size()) + ", collection expects " +
                           std::to_string(cfg_.dimension));
    }

    HnswIndex::Filter accept;
    if (!filter.empty()) {
        accept = [this, &filter](std::int64_t id) {
            auto found = tags_.find(id);
            return found != tags_.end() && filter.matches(found->second.technology, found->second.category);
        };
    }
    std::vector<HnswHit> found;
    if (group_size == 0) {
        std::size_t ef = std::max<std::size_t>((std::size_t)cfg_.hnsw.ef_search, limit);
        found = graph_->search(vector, limit, ef, accept);
    } else {
        // One filtered walk per technology so a crowded technology cannot starve the others.
        std::set<std::string> technologies;
        for (const auto& [id, tag] : tags_) {
            if (filter.matches(tag.technology, tag.category)) technologies.insert(tag.technology);
        }
        std::size_t ef = std::max<std::size_t>((std::size_t)cfg_.hnsw.ef_search, group_size);
        for (const auto& technology : technologies) {
            auto in_group = [this, &filter, &technology](std::int64_t id) {
                auto tag = tags_.find(id);
                return tag != tags_.end() && tag->second.technology == technology &&
                       filter.matches(tag->second.technology, tag->second.category);
            };
            auto part = graph_->search(vector, group_size, ef, in_group);
            found.insert(found.end(), part.begin(), part.end());
        }
        std::stable_sort(found.begin(), found.end(),
                         [](const HnswHit& a, const HnswHit& b) { return a.distance < b.distance; });
        if (found.size() > limit) found.resize(limit);
    }

    std::vector<StoreHit> out;
    out.reserve(found.size());
    for (const auto& h : found) {
        sqlite3_reset(by_id_stmt_);
        sqlite3_bind_int64(by_id_stmt_, 1, h.label);
        int rc = sqlite3_step(by_id_stmt_);
        if (rc == SQLITE_ROW) {
            StoreHit hit;
            hit.id = h.label;
            hit.content = column_text(by_id_stmt_, 0);
            hit.technology = column_text(by_id_stmt_, 1);
            hit.file_path = column_text(by_id_stmt_, 2);
            hit.section_title = column_text(by_id_stmt_, 3);
            hit.section_level = sqlite3_column_int(by_id_stmt_, 4);
            hit.category = column_text(by_id_stmt_, 5);
            hit.distance = h.distance;
            out.push_back(std::move(hit));
        }
        sqlite3_reset(by_id_stmt_);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            throw StorageError("fetch of chunk " + std::to_string(h.label) + " failed: " + sqlite3_errmsg(db_));
        }
    }
    return out;
}

std::size_t SqliteIndexStore::row_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ready_) return 0;
    sqlite3_stmt* st = nullptr;
    prepare("SELECT COUNT(*) FROM " + cfg_.collection + ";", &st);
    std::size_t n = 0;
    if (sqlite3_step(st) == SQLITE_ROW) n = (std::size_t)sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);
    return n;
}
