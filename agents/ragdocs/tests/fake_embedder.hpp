#pragma once
#include "embedder.hpp"
#include <atomic>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

// Bag-of-words vectors: every lower-cased token is hashed (FNV-1a) into a bucket, then the
// vector is L2-normalised. Identical text gives identical vectors.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(std::size_t dim = 64) : dim_(dim) {}

    std::vector<float> encode(const std::string& text) override {
        ++calls;
        std::vector<float> v(dim_, 0.0f);
        std::string token;
        auto flush = [&] {
            if (token.empty()) return;
            std::uint64_t h = 1469598103934665603ull;
            for (char c : token) {
                h ^= (unsigned char)c;
                h *= 1099511628211ull;
            }
            v[h % dim_] += 1.0f;
            token.clear();
        };
        for (char c : text) {
            if (std::isalnum((unsigned char)c)) token += (char)std::tolower((unsigned char)c);
            else flush();
        }
        flush();
        l2_normalize(v);
        return v;
    }

    std::size_t dimension() const override { return dim_; }

    std::atomic<int> calls{0};

private:
    std::size_t dim_;
};
