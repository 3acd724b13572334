#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log_registry.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <future>

using json = nlohmann::json;

std::vector<std::vector<float>> Embedder::encode_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(encode(t));
    return out;
}

void l2_normalize(std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += (double)x * (double)x;
    if (sum == 0.0) return;
    float inv = (float)(1.0 / std::sqrt(sum));
    for (auto& x : v) x *= inv;
}

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
    cfg_.workers = std::max(1, cfg_.workers);
    cfg_.batch_size = std::max(1, cfg_.batch_size);
}

std::vector<std::vector<float>> OllamaEmbedder::request(const std::vector<std::string>& inputs) const {
    json body = {
        {"model", cfg_.embed_model},
        {"input", inputs}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/embed", body.dump(), cfg_.timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw StorageError("embedding failed: status " + std::to_string(r.status) + ": " + r.body);
    }
    auto data = json::parse(r.body, nullptr, false);
    if (data.is_discarded() || !data.contains("embeddings") || !data["embeddings"].is_array()) {
        throw StorageError("embedding failed: unexpected response from " + cfg_.ollama_url);
    }

    std::vector<std::vector<float>> out;
    for (auto& row : data["embeddings"]) {
        std::vector<float> vec;
        vec.reserve(row.size());
        for (auto& v : row) {
            if (!v.is_number()) throw StorageError("embedding failed: non-numeric component from " + cfg_.ollama_url);
            vec.push_back(v.get<float>());
        }
        if (vec.size() != cfg_.dimension) {
            throw StorageError("embedding model " + cfg_.embed_model + " returned dimension " +
                               std::to_string(vec.size()) + ", expected " + std::to_string(cfg_.dimension));
        }
        if (cfg_.normalize) l2_normalize(vec);
        out.push_back(std::move(vec));
    }
    if (out.size() != inputs.size()) {
        throw StorageError("embedding failed: " + std::to_string(out.size()) + " vectors for " +
                           std::to_string(inputs.size()) + " inputs");
    }
    return out;
}

std::vector<float> OllamaEmbedder::encode(const std::string& text) {
    return request({text}).front();
}

std::vector<std::vector<float>> OllamaEmbedder::encode_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out(texts.size());
    if (texts.empty()) return out;

    std::vector<std::pair<std::size_t, std::size_t>> slices;
    for (std::size_t i = 0; i < texts.size(); i += (std::size_t)cfg_.batch_size) {
        slices.emplace_back(i, std::min(texts.size(), i + (std::size_t)cfg_.batch_size));
    }
    LogRegistry::embed()->debug("Encoding {} texts in {} batches on {} workers", texts.size(), slices.size(),
                                cfg_.workers);

    // Batches are pulled in waves of `workers`; each wave writes disjoint ranges of `out`.
    for (std::size_t w = 0; w < slices.size(); w += (std::size_t)cfg_.workers) {
        std::vector<std::future<void>> wave;
        for (std::size_t s = w; s < std::min(slices.size(), w + (std::size_t)cfg_.workers); ++s) {
            std::size_t begin = slices[s].first, end = slices[s].second;
            wave.push_back(std::async(std::launch::async, [this, &texts, &out, begin, end] {
                std::vector<std::string> inputs(texts.begin() + begin, texts.begin() + end);
                auto vecs = request(inputs);
                for (std::size_t k = 0; k < vecs.size(); ++k) out[begin + k] = std::move(vecs[k]);
            }));
        }
        for (auto& f : wave) f.get();
    }
    return out;
}
