#pragma once
#include "index_store.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

// Request bodies and response parsing for the Milvus REST v2 API. Pure functions, no I/O.
nlohmann::json milvus_collection_schema(const StoreConfig& cfg);
nlohmann::json milvus_insert_body(const std::string& collection, const std::vector<Chunk>& chunks);
// With a non-zero group_size the search is grouped on `technology`: `limit` then bounds the
// total hits and the request asks for limit / group_size groups.
nlohmann::json milvus_search_body(const StoreConfig& cfg, const std::vector<float>& vector,
                                  const FilterExpr& filter, std::size_t limit, std::size_t group_size = 0);
std::vector<StoreHit> parse_milvus_hits(const nlohmann::json& response);

// IndexStore over a remote Milvus server. The constructor checks that the server answers
// and throws ConnectionError otherwise.
class MilvusIndexStore : public IndexStore {
public:
    explicit MilvusIndexStore(StoreConfig cfg);

    void ensure_schema() override;
    void delete_by_path(const std::set<std::string>& paths) override;
    void insert(const std::vector<Chunk>& chunks) override;
    std::vector<StoreHit> search(const std::vector<float>& vector, const FilterExpr& filter,
                                 std::size_t limit, std::size_t group_size) override;

private:
    // POSTs to /v2/vectordb/<endpoint>; a non-zero `code` in the reply throws StorageError.
    nlohmann::json call(const std::string& endpoint, const nlohmann::json& body) const;

    StoreConfig cfg_;
    std::mutex schema_mtx_;
    bool schema_ready_{false};
};
