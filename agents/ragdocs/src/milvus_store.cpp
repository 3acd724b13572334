#include "../include/milvus_store.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log_registry.hpp"
#include "../include/markdown.hpp"
#include <algorithm>

using json = nlohmann::json;

// Milvus rejects a search limit above this.
static constexpr std::size_t kMaxSearchLimit = 16384;

static json varchar_field(const char* name, std::size_t max_length) {
    return json{{"fieldName", name}, {"dataType", "VarChar"}, {"elementTypeParams", {{"max_length", max_length}}}};
}

json milvus_collection_schema(const StoreConfig& cfg) {
    json fields = json::array({
        json{{"fieldName", "id"}, {"dataType", "Int64"}, {"isPrimary", true}},
        varchar_field("content", kMaxContentLength),
        varchar_field("technology", kMaxTechnologyLength),
        varchar_field("file_path", kMaxPathLength),
        varchar_field("file_hash", kMaxHashLength),
        varchar_field("section_title", kMaxTitleLength),
        json{{"fieldName", "section_level"}, {"dataType", "Int16"}},
        varchar_field("category", kMaxCategoryLength),
        json{{"fieldName", "embeddings"}, {"dataType", "FloatVector"},
             {"elementTypeParams", {{"dim", cfg.dimension}}}}
    });
    return json{
        {"collectionName", cfg.collection},
        {"schema", {{"autoId", true}, {"enableDynamicField", false}, {"fields", fields}}},
        {"indexParams", json::array({json{
            {"fieldName", "embeddings"},
            {"indexName", "embeddings_hnsw"},
            {"metricType", "L2"},
            {"params", {{"index_type", "HNSW"}, {"M", cfg.hnsw.m}, {"efConstruction", cfg.hnsw.ef_construction}}}
        }})}
    };
}

json milvus_insert_body(const std::string& collection, const std::vector<Chunk>& chunks) {
    json rows = json::array();
    for (const auto& c : chunks) {
        rows.push_back(json{
            {"content", c.content},
            {"technology", c.technology},
            {"file_path", c.file_path},
            {"file_hash", c.file_hash},
            {"section_title", c.section_title},
            {"section_level", c.section_level},
            {"category", c.category},
            {"embeddings", c.embedding}
        });
    }
    return json{{"collectionName", collection}, {"data", rows}};
}

json milvus_search_body(const StoreConfig& cfg, const std::vector<float>& vector, const FilterExpr& filter,
                        std::size_t limit, std::size_t group_size) {
    limit = std::min(limit, kMaxSearchLimit);
    // ef follows the result size but never drops below it
    std::size_t ef = std::max(limit, std::min((std::size_t)cfg.hnsw.ef_search, limit * 2));
    // grouped searches count groups, not hits
    std::size_t requested = group_size > 0 ? std::max<std::size_t>(1, (limit + group_size - 1) / group_size) : limit;
    json body = {
        {"collectionName", cfg.collection},
        {"data", json::array({vector})},
        {"annsField", "embeddings"},
        {"limit", requested},
        {"outputFields", {"content", "technology", "file_path", "section_title", "section_level", "category"}},
        {"searchParams", {{"metricType", "L2"}, {"params", {{"ef", ef}}}}},
        {"consistencyLevel", "Eventually"}
    };
    if (!filter.empty()) body["filter"] = filter.str();
    if (group_size > 0) {
        body["groupingField"] = "technology";
        body["groupSize"] = group_size;
        body["strictGroupSize"] = false;
    }
    return body;
}

std::vector<StoreHit> parse_milvus_hits(const json& response) {
    std::vector<StoreHit> out;
    if (!response.contains("data") || !response["data"].is_array()) return out;
    try {
        for (const auto& row : response["data"]) {
            StoreHit hit;
            // int64 primary keys may come back as strings
            if (row.contains("id") && row["id"].is_string()) hit.id = std::stoll(row["id"].get<std::string>());
            else hit.id = row.value("id", (std::int64_t)0);
            hit.content = row.value("content", std::string());
            hit.technology = row.value("technology", std::string());
            hit.file_path = row.value("file_path", std::string());
            hit.section_title = row.value("section_title", std::string());
            hit.section_level = row.value("section_level", 0);
            hit.category = row.value("category", std::string());
            hit.distance = row.at("distance").get<float>();
            out.push_back(std::move(hit));
        }
    } catch (const json::exception& e) {
        throw StorageError(std::string("malformed search response: ") + e.what());
    } catch (const std::logic_error& e) {
        throw StorageError(std::string("malformed id in search response: ") + e.what());
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const StoreHit& a, const StoreHit& b) { return a.distance < b.distance; });
    return out;
}

MilvusIndexStore::MilvusIndexStore(StoreConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.uri.empty() && cfg_.uri.back() == '/') cfg_.uri.pop_back();
    try {
        call("collections/list", json::object());
    } catch (const StorageError& e) {
        throw ConnectionError("Milvus at " + cfg_.uri + " is not usable: " + e.what());
    }
    LogRegistry::store()->info("Connected to Milvus at {}", cfg_.uri);
}

json MilvusIndexStore::call(const std::string& endpoint, const json& body) const {
    std::vector<std::string> headers;
    if (!cfg_.token.empty()) headers.push_back("Authorization: Bearer " + cfg_.token);
    auto r = http_post_json(cfg_.uri + "/v2/vectordb/" + endpoint, body.dump(), cfg_.timeout_ms, headers);
    if (r.status < 200 || r.status >= 300) {
        throw StorageError(endpoint + " failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) throw StorageError(endpoint + " returned a malformed body");
    int code = data.value("code", 0);
    if (code != 0) {
        throw StorageError(endpoint + " failed: code " + std::to_string(code) + ": " +
                           data.value("message", std::string("unknown")));
    }
    return data;
}

void MilvusIndexStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(schema_mtx_);
    if (schema_ready_) return;
    auto log = LogRegistry::store();
    try {
        json name = {{"collectionName", cfg_.collection}};
        auto has = call("collections/has", name);
        if (!has["data"].value("has", false)) {
            log->info("Creating collection {} (dim {}, HNSW M={} efConstruction={})", cfg_.collection,
                      cfg_.dimension, cfg_.hnsw.m, cfg_.hnsw.ef_construction);
            call("collections/create", milvus_collection_schema(cfg_));
        } else {
            log->debug("Using existing collection {}", cfg_.collection);
        }
        call("collections/load", name);
    } catch (const ConnectionError& e) {
        log->error("Milvus unreachable while ensuring {}: {}", cfg_.collection, e.what());
        throw;
    } catch (const std::exception& e) {
        log->error("Failed to ensure collection {}: {}", cfg_.collection, e.what());
        throw SchemaError("ensure collection " + cfg_.collection + ": " + e.what());
    }
    schema_ready_ = true;
}

void MilvusIndexStore::delete_by_path(const std::set<std::string>& paths) {
    if (paths.empty()) return;
    try {
        call("entities/delete", json{{"collectionName", cfg_.collection}, {"filter", path_filter(paths)}});
    } catch (const std::runtime_error& e) {
        LogRegistry::store()->error("Delete from {} failed: {}", cfg_.collection, e.what());
        throw;
    }
    LogRegistry::store()->debug("Deleted chunks for {} paths", paths.size());
}

void MilvusIndexStore::insert(const std::vector<Chunk>& chunks) {
    if (chunks.empty()) return;
    for (const auto& c : chunks) validate_chunk(c, cfg_.dimension);
    json name = {{"collectionName", cfg_.collection}};
    try {
        call("entities/insert", milvus_insert_body(cfg_.collection, chunks));
        call("collections/flush", name);
    } catch (const std::runtime_error& e) {
        LogRegistry::store()->error("Insert into {} failed: {}", cfg_.collection, e.what());
        throw;
    }
    LogRegistry::store()->debug("Inserted {} chunks into {}", chunks.size(), cfg_.collection);
}

std::vector<StoreHit> MilvusIndexStore::search(const std::vector<float>& vector, const FilterExpr& filter,
                                               std::size_t limit, std::size_t group_size) {
    if (limit == 0) return {};
    try {
        return parse_milvus_hits(
            call("entities/search", milvus_search_body(cfg_, vector, filter, limit, group_size)));
    } catch (const std::runtime_error& e) {
        LogRegistry::store()->error("Search in {} failed: {}", cfg_.collection, e.what());
        throw;
    }
}
