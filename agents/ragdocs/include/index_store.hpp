#pragma once
#include "types.hpp"
#include <cstddef>
#include <set>
#include <string>
#include <vector>

// Conjunction of `technology in [...]` and `category in [...]`; an empty set omits its clause.
struct FilterExpr {
    std::vector<std::string> technologies;
    std::vector<std::string> categories;

    bool empty() const { return technologies.empty() && categories.empty(); }
    bool matches(const std::string& technology, const std::string& category) const;
    // Store syntax, e.g. `technology in ["a", "b"] && category in ["security"]`; "" when empty.
    std::string str() const;
};

// Predicate text for a path delete: `file_path in ["...", ...]`.
std::string path_filter(const std::set<std::string>& paths);

// 1 - d^2/4 clamped to [0, 1]; d is the raw distance reported by the store.
float relevance_score(float distance);

struct HnswConfig {
    int m{8};
    int ef_construction{64};
    int ef_search{64};
};

struct StoreConfig {
    std::string backend{"sqlite"};
    std::string collection{"docs_tech"};
    std::string db_path{"./data/ragdocs.db"};
    std::string uri{"http://localhost:19530"};
    std::string token;
    int timeout_ms{30000};
    std::size_t dimension{384};
    HnswConfig hnsw;
};

// Field bounds of the collection schema.
constexpr std::size_t kMaxTechnologyLength = 64;
constexpr std::size_t kMaxCategoryLength = 64;
constexpr std::size_t kMaxPathLength = 512;
constexpr std::size_t kMaxHashLength = 64;

// Throws StorageError when a chunk does not fit the schema bounds or the vector dimension.
void validate_chunk(const Chunk& chunk, std::size_t dimension);

class IndexStore {
public:
    virtual ~IndexStore() = default;

    // Creates the collection and its ANN index when absent. Throws SchemaError.
    virtual void ensure_schema() = 0;
    // Removes every chunk whose file_path is in `paths`. Throws StorageError.
    virtual void delete_by_path(const std::set<std::string>& paths) = 0;
    // One batched write followed by a flush. Throws StorageError.
    virtual void insert(const std::vector<Chunk>& chunks) = 0;
    // Hits ordered by ascending distance, at most `limit`. A non-zero `group_size` keeps up to
    // that many hits for every technology, however close another technology's hits are.
    // Throws StorageError.
    virtual std::vector<StoreHit> search(const std::vector<float>& vector, const FilterExpr& filter,
                                         std::size_t limit, std::size_t group_size) = 0;
};
