#include "../include/index_store.hpp"
#include "../include/errors.hpp"
#include "../include/markdown.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

static std::string in_clause(const std::string& field, const std::vector<std::string>& values) {
    std::string out = field + " in [";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += json(values[i]).dump();
    }
    return out + "]";
}

bool FilterExpr::matches(const std::string& technology, const std::string& category) const {
    if (!technologies.empty() &&
        std::find(technologies.begin(), technologies.end(), technology) == technologies.end()) {
        return false;
    }
    if (!categories.empty() &&
        std::find(categories.begin(), categories.end(), category) == categories.end()) {
        return false;
    }
    return true;
}

std::string FilterExpr::str() const {
    std::string out;
    if (!technologies.empty()) out = in_clause("technology", technologies);
    if (!categories.empty()) {
        if (!out.empty()) out += " && ";
        out += in_clause("category", categories);
    }
    return out;
}

std::string path_filter(const std::set<std::string>& paths) {
    return in_clause("file_path", std::vector<std::string>(paths.begin(), paths.end()));
}

float relevance_score(float distance) {
    float score = 1.0f - (distance * distance) / 4.0f;
    return std::clamp(score, 0.0f, 1.0f);
}

static void check_length(const char* field, const std::string& value, std::size_t max_len, const Chunk& chunk) {
    if (value.size() > max_len) {
        throw StorageError(std::string(field) + " exceeds " + std::to_string(max_len) + " bytes for " + chunk.file_path);
    }
}

void validate_chunk(const Chunk& chunk, std::size_t dimension) {
    check_length("content", chunk.content, kMaxContentLength, chunk);
    check_length("technology", chunk.technology, kMaxTechnologyLength, chunk);
    check_length("file_path", chunk.file_path, kMaxPathLength, chunk);
    check_length("file_hash", chunk.file_hash, kMaxHashLength, chunk);
    check_length("section_title", chunk.section_title, kMaxTitleLength, chunk);
    check_length("category", chunk.category, kMaxCategoryLength, chunk);
    if (chunk.section_level < 0 || chunk.section_level > 6) {
        throw StorageError("section_level out of range for " + chunk.file_path);
    }
    if (chunk.embedding.size() != dimension) {
        throw StorageError("embedding has dimension " + std::to_string(chunk.embedding.size()) + ", collection expects " +
                           std::to_string(dimension));
    }
}
