#include "../include/hnsw.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <stdexcept>

static constexpr int kMaxLevel = 16;

HnswIndex::HnswIndex(std::size_t dim, HnswParams params)
    : dim_(dim), params_(params), level_mult_(1.0 / std::log(std::max(2, params.m))), rng_(params.seed) {
    if (dim_ == 0) throw std::invalid_argument("hnsw dimension must be positive");
}

float HnswIndex::distance(const float* a, const float* b) const {
    float total = 0.0f;
    for (std::size_t i = 0; i < dim_; ++i) {
        float d = a[i] - b[i];
        total += d * d;
    }
    return total;
}

int HnswIndex::random_level() {
    std::uniform_real_distribution<double> dist(std::numeric_limits<double>::min(), 1.0);
    int level = (int)std::floor(-std::log(dist(rng_)) * level_mult_);
    return std::min(level, kMaxLevel);
}

std::uint32_t HnswIndex::greedy_descend(const float* q, int from_layer, int to_layer) const {
    std::uint32_t cur = (std::uint32_t)entry_;
    float best = distance(q, nodes_[cur].vec.data());
    for (int l = from_layer; l > to_layer; --l) {
        bool changed = true;
        while (changed) {
            changed = false;
            for (std::uint32_t n : nodes_[cur].links[l]) {
                float d = distance(q, nodes_[n].vec.data());
                if (d < best) { best = d; cur = n; changed = true; }
            }
        }
    }
    return cur;
}

std::vector<HnswIndex::Candidate> HnswIndex::search_layer(std::uint32_t entry, const float* q, std::size_t ef,
                                                          int layer, const Filter* filter) const {
    // With a filter, only accepted live nodes enter the result heap; the walk still goes
    // through every node so selective filters keep their recall.
    auto accepted = [&](std::uint32_t id) {
        if (!filter) return true;
        const Node& n = nodes_[id];
        return !n.deleted && (!*filter || (*filter)(n.label));
    };

    std::vector<bool> visited(nodes_.size(), false);
    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> candidates;
    std::priority_queue<Candidate> top;

    float d = distance(q, nodes_[entry].vec.data());
    float lower_bound = std::numeric_limits<float>::max();
    candidates.push({d, entry});
    if (accepted(entry)) {
        top.push({d, entry});
        lower_bound = d;
    }
    visited[entry] = true;

    while (!candidates.empty()) {
        Candidate cur = candidates.top();
        if (cur.first > lower_bound && top.size() >= ef) break;
        candidates.pop();

        for (std::uint32_t n : nodes_[cur.second].links[layer]) {
            if (visited[n]) continue;
            visited[n] = true;
            float dn = distance(q, nodes_[n].vec.data());
            if (top.size() < ef || dn < lower_bound) {
                candidates.push({dn, n});
                if (accepted(n)) {
                    top.push({dn, n});
                    if (top.size() > ef) top.pop();
                    lower_bound = top.top().first;
                }
            }
        }
    }

    std::vector<Candidate> out;
    out.reserve(top.size());
    while (!top.empty()) {
        out.push_back(top.top());
        top.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

void HnswIndex::link(std::uint32_t from, std::uint32_t to, int layer) {
    auto& links = nodes_[from].links[layer];
    links.push_back(to);
    std::size_t max_links = layer == 0 ? (std::size_t)params_.m * 2 : (std::size_t)params_.m;
    if (links.size() <= max_links) return;

    // Over capacity: keep the closest neighbours.
    const float* base = nodes_[from].vec.data();
    std::vector<Candidate> scored;
    scored.reserve(links.size());
    for (std::uint32_t n : links) scored.push_back({distance(base, nodes_[n].vec.data()), n});
    std::sort(scored.begin(), scored.end());
    links.clear();
    for (std::size_t i = 0; i < max_links; ++i) links.push_back(scored[i].second);
}

void HnswIndex::add(std::int64_t label, const std::vector<float>& vec) {
    if (vec.size() != dim_) {
        throw std::invalid_argument("hnsw vector has dimension " + std::to_string(vec.size()) +
                                    ", expected " + std::to_string(dim_));
    }
    if (by_label_.count(label)) remove(label);

    int level = random_level();
    std::uint32_t id = (std::uint32_t)nodes_.size();
    nodes_.push_back(Node{label, level, vec, std::vector<std::vector<std::uint32_t>>(level + 1), false});
    by_label_[label] = id;

    if (entry_ < 0) {
        entry_ = id;
        max_level_ = level;
        return;
    }

    const float* q = nodes_[id].vec.data();
    std::uint32_t cur = greedy_descend(q, max_level_, level);
    for (int l = std::min(level, max_level_); l >= 0; --l) {
        auto found = search_layer(cur, q, (std::size_t)params_.ef_construction, l, nullptr);
        std::size_t keep = std::min(found.size(), (std::size_t)params_.m);
        for (std::size_t i = 0; i < keep; ++i) {
            link(id, found[i].second, l);
            link(found[i].second, id, l);
        }
        if (!found.empty()) cur = found.front().second;
    }

    if (level > max_level_) {
        entry_ = id;
        max_level_ = level;
    }
}

bool HnswIndex::remove(std::int64_t label) {
    auto found = by_label_.find(label);
    if (found == by_label_.end()) return false;
    nodes_[found->second].deleted = true;
    by_label_.erase(found);
    ++deleted_;
    return true;
}

std::vector<HnswHit> HnswIndex::search(const std::vector<float>& query, std::size_t k, std::size_t ef,
                                       const Filter& filter) const {
    if (entry_ < 0 || k == 0 || size() == 0) return {};
    if (query.size() != dim_) {
        throw std::invalid_argument("hnsw query has dimension " + std::to_string(query.size()) +
                                    ", expected " + std::to_string(dim_));
    }
    std::uint32_t cur = greedy_descend(query.data(), max_level_, 0);
    auto found = search_layer(cur, query.data(), std::max(ef, k), 0, &filter);

    std::vector<HnswHit> out;
    for (const auto& c : found) {
        if (out.size() == k) break;
        out.push_back({nodes_[c.second].label, c.first});
    }
    return out;
}

void HnswIndex::clear() {
    nodes_.clear();
    by_label_.clear();
    entry_ = -1;
    max_level_ = -1;
    deleted_ = 0;
}
