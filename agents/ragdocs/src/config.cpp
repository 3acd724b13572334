#include "../include/config.hpp"
#include "../include/util.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

static int env_int(const char* key, int def) {
    std::string v = getenv_or(key, "");
    if (v.empty()) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("environment variable ") + key + " is not a number: " + v);
    }
}

AppConfig config_from_env() {
    AppConfig cfg;
    cfg.cache_path = getenv_or("RAGDOCS_CACHE", cfg.cache_path);
    cfg.log.dir = getenv_or("RAGDOCS_LOG_DIR", cfg.log.dir.string());
    cfg.log.console_level = getenv_or("RAGDOCS_LOG_LEVEL", cfg.log.console_level);

    cfg.embed.ollama_url = getenv_or("OLLAMA_URL", cfg.embed.ollama_url);
    cfg.embed.embed_model = getenv_or("RAGDOCS_EMBED_MODEL", cfg.embed.embed_model);
    cfg.embed.dimension = (std::size_t)env_int("RAGDOCS_EMBED_DIM", (int)cfg.embed.dimension);
    cfg.embed.workers = env_int("RAGDOCS_EMBED_WORKERS", cfg.embed.workers);

    cfg.store.backend = getenv_or("RAGDOCS_STORE", cfg.store.backend);
    cfg.store.collection = getenv_or("RAGDOCS_COLLECTION", cfg.store.collection);
    cfg.store.db_path = getenv_or("RAGDOCS_DB_PATH", cfg.store.db_path);
    cfg.store.uri = getenv_or("MILVUS_URI", cfg.store.uri);
    cfg.store.token = getenv_or("MILVUS_TOKEN", cfg.store.token);
    cfg.store.dimension = cfg.embed.dimension;

    cfg.sources = {
        {"milvus", "data/milvus_docs"},
        {"qdrant", "data/qdrant_docs"},
        {"weaviate", "data/weaviate_docs"},
    };
    cfg.categories = default_category_table();
    return cfg;
}

template <typename T>
static void read_key(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) out = node[key].as<T>();
}

static void require_positive(const char* key, int value) {
    if (value < 1) throw std::runtime_error(std::string(key) + " must be at least 1, got " + std::to_string(value));
}

void apply_config_file(AppConfig& cfg, const std::filesystem::path& file) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("cannot load config " + file.string() + ": " + e.what());
    }
    if (root.IsNull()) return;
    if (!root.IsMap()) throw std::runtime_error("config " + file.string() + " must be a mapping");

    try {
        read_key(root, "cache_path", cfg.cache_path);
        if (root["log_dir"]) cfg.log.dir = root["log_dir"].as<std::string>();
        read_key(root, "log_level", cfg.log.console_level);
        read_key(root, "file_log_level", cfg.log.file_level);

        if (auto e = root["embed"]) {
            read_key(e, "url", cfg.embed.ollama_url);
            read_key(e, "model", cfg.embed.embed_model);
            read_key(e, "dimension", cfg.embed.dimension);
            read_key(e, "timeout_ms", cfg.embed.timeout_ms);
            read_key(e, "workers", cfg.embed.workers);
            read_key(e, "batch_size", cfg.embed.batch_size);
            read_key(e, "normalize", cfg.embed.normalize);
        }

        if (auto s = root["store"]) {
            read_key(s, "backend", cfg.store.backend);
            read_key(s, "collection", cfg.store.collection);
            read_key(s, "db_path", cfg.store.db_path);
            read_key(s, "uri", cfg.store.uri);
            read_key(s, "token", cfg.store.token);
            read_key(s, "timeout_ms", cfg.store.timeout_ms);
            if (auto h = s["hnsw"]) {
                read_key(h, "m", cfg.store.hnsw.m);
                read_key(h, "ef_construction", cfg.store.hnsw.ef_construction);
                read_key(h, "ef_search", cfg.store.hnsw.ef_search);
                require_positive("store.hnsw.m", cfg.store.hnsw.m);
                require_positive("store.hnsw.ef_construction", cfg.store.hnsw.ef_construction);
                require_positive("store.hnsw.ef_search", cfg.store.hnsw.ef_search);
            }
        }
        cfg.store.dimension = cfg.embed.dimension;

        if (auto src = root["sources"]) {
            if (!src.IsMap()) throw std::runtime_error("sources must map technology to directory");
            cfg.sources.clear();
            for (auto it = src.begin(); it != src.end(); ++it) {
                cfg.sources.push_back({it->first.as<std::string>(), it->second.as<std::string>()});
            }
        }

        if (auto cats = root["categories"]) {
            if (!cats.IsMap()) throw std::runtime_error("categories must map a name to a keyword list");
            cfg.categories.clear();
            for (auto it = cats.begin(); it != cats.end(); ++it) {
                cfg.categories.push_back({it->first.as<std::string>(), it->second.as<std::vector<std::string>>()});
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("invalid config " + file.string() + ": " + e.what());
    }
}
