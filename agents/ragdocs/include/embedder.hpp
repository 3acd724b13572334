#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Maps text to a fixed-dimension vector. Implementations must be deterministic for identical input.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> encode(const std::string& text) = 0;
    // Output order matches input order. Default implementation encodes one at a time.
    virtual std::vector<std::vector<float>> encode_batch(const std::vector<std::string>& texts);
    virtual std::size_t dimension() const = 0;
};

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    std::size_t dimension{384};
    int timeout_ms{120000};
    int workers{1};
    int batch_size{32};
    bool normalize{true};
};

void l2_normalize(std::vector<float>& v);

class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedConfig cfg);

    std::vector<float> encode(const std::string& text) override;
    std::vector<std::vector<float>> encode_batch(const std::vector<std::string>& texts) override;
    std::size_t dimension() const override { return cfg_.dimension; }

private:
    std::vector<std::vector<float>> request(const std::vector<std::string>& inputs) const;

    EmbedConfig cfg_;
};
