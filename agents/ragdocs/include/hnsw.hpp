#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <unordered_map>
#include <vector>

struct HnswParams {
    int m{8};                 // links per node on upper layers; layer 0 keeps 2*m
    int ef_construction{64};  // candidate list size while inserting
    unsigned seed{100};
};

struct HnswHit {
    std::int64_t label{0};
    float distance{0.0f};     // squared L2
};

// In-memory HNSW graph over squared Euclidean distance. Removal only tombstones a node:
// it stays routable but is never returned.
class HnswIndex {
public:
    using Filter = std::function<bool(std::int64_t label)>;

    explicit HnswIndex(std::size_t dim, HnswParams params = {});

    void add(std::int64_t label, const std::vector<float>& vec);
    bool remove(std::int64_t label);

    // Best-first, at most k hits. Only labels accepted by `filter` (when set) are returned.
    std::vector<HnswHit> search(const std::vector<float>& query, std::size_t k, std::size_t ef,
                                const Filter& filter = {}) const;

    std::size_t size() const { return nodes_.size() - deleted_; }
    std::size_t tombstones() const { return deleted_; }
    std::size_t dimension() const { return dim_; }
    void clear();

private:
    struct Node {
        std::int64_t label;
        int level;
        std::vector<float> vec;
        std::vector<std::vector<std::uint32_t>> links;  // one list per layer
        bool deleted{false};
    };
    using Candidate = std::pair<float, std::uint32_t>;

    float distance(const float* a, const float* b) const;
    int random_level();
    std::uint32_t greedy_descend(const float* q, int from_layer, int to_layer) const;
    std::vector<Candidate> search_layer(std::uint32_t entry, const float* q, std::size_t ef, int layer,
                                        const Filter* filter) const;
    void link(std::uint32_t from, std::uint32_t to, int layer);

    std::size_t dim_;
    HnswParams params_;
    double level_mult_;
    std::mt19937 rng_;
    std::vector<Node> nodes_;
    std::unordered_map<std::int64_t, std::uint32_t> by_label_;
    std::int64_t entry_{-1};
    int max_level_{-1};
    std::size_t deleted_{0};
};
