#pragma once
#include "embedder.hpp"
#include "index_store.hpp"
#include "log_registry.hpp"
#include "markdown.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

struct AppConfig {
    std::string cache_path{".rag_cache.json"};
    LogConfig log;
    EmbedConfig embed;
    StoreConfig store;
    std::vector<SourceDir> sources;
    CategoryTable categories;
};

// Defaults overridden by RAGDOCS_* / OLLAMA_URL / MILVUS_* environment variables.
AppConfig config_from_env();

// Overlays values present in a YAML file. Throws std::runtime_error on unreadable or malformed files.
void apply_config_file(AppConfig& cfg, const std::filesystem::path& file);
