#include "../include/change_tracker.hpp"
#include "../include/config.hpp"
#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/log_registry.hpp"
#include "../include/milvus_store.hpp"
#include "../include/retrieval_engine.hpp"
#include "../include/sqlite_store.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <iostream>
#include <memory>

using json = nlohmann::json;

static void usage() {
    std::cerr << "ragdocs_cli usage:\n"
              << "  sync --tech <name> --dir <path>\n"
              << "  sync-all\n"
              << "  search --query \"...\" [--tech a,b] [--category c,d] [--top-k N] [--json]\n"
              << "  categories\n"
              << "global options: [--config <yaml>] [--store sqlite|milvus] [--db <file>] [--cache <file>]\n";
}

static std::unique_ptr<IndexStore> make_store(const StoreConfig& cfg) {
    if (cfg.backend == "sqlite") return std::make_unique<SqliteIndexStore>(cfg);
    if (cfg.backend == "milvus") return std::make_unique<MilvusIndexStore>(cfg);
    throw std::runtime_error("unknown store backend: " + cfg.backend);
}

static void print_report(const SyncReport& r) {
    if (!r.error.empty()) {
        std::cout << "[FAIL] " << r.technology << ": " << r.error << "\n";
        return;
    }
    std::cout << "[OK] " << r.technology << ": new " << r.new_files << ", modified " << r.modified_files
              << ", deleted " << r.deleted_files << ", chunks " << r.chunks << ", skipped " << r.skipped.size() << "\n";
    for (const auto& s : r.skipped) std::cout << "  skipped " << s.path << ": " << s.reason << "\n";
}

static json results_to_json(const GroupedResults& results) {
    json out = json::object();
    for (const auto& [tech, list] : results) {
        json arr = json::array();
        for (const auto& r : list) {
            arr.push_back({
                {"content", r.content},
                {"technology", r.technology},
                {"file_path", r.file_path},
                {"section_title", r.section_title},
                {"section_level", r.section_level},
                {"category", r.category},
                {"score", r.score}
            });
        }
        out[tech] = arr;
    }
    return out;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    std::string cmd = argv[1];

    std::string config_file = getenv_or("RAGDOCS_CONFIG", "");
    std::string store_backend, db_path, cache_path;
    std::string tech, dir, query, categories;
    std::size_t top_k = 3;
    bool as_json = false;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc) config_file = argv[++i];
            else if (a == "--store" && i + 1 < argc) store_backend = argv[++i];
            else if (a == "--db" && i + 1 < argc) db_path = argv[++i];
            else if (a == "--cache" && i + 1 < argc) cache_path = argv[++i];
            else if (a == "--tech" && i + 1 < argc) tech = argv[++i];
            else if (a == "--dir" && i + 1 < argc) dir = argv[++i];
            else if (a == "--query" && i + 1 < argc) query = argv[++i];
            else if (a == "--category" && i + 1 < argc) categories = argv[++i];
            else if (a == "--top-k" && i + 1 < argc) top_k = (std::size_t)std::stoul(argv[++i]);
            else if (a == "--json") as_json = true;
            else { usage(); return 2; }
        }
    } catch (const std::exception&) {
        usage();
        return 2;
    }

    AppConfig cfg;
    try {
        cfg = config_from_env();
        if (!config_file.empty()) apply_config_file(cfg, config_file);
        if (!store_backend.empty()) cfg.store.backend = store_backend;
        if (!db_path.empty()) cfg.store.db_path = db_path;
        if (!cache_path.empty()) cfg.cache_path = cache_path;
        LogRegistry::init(cfg.log);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    auto log = LogRegistry::cli();

    try {
        DocumentSegmenter segmenter(cfg.categories);
        if (cmd == "categories") {
            for (const auto& rule : segmenter.categories()) std::cout << rule.name << "\n";
            return 0;
        }

        if (cmd == "sync" && (tech.empty() || dir.empty())) { usage(); return 2; }
        if (cmd == "search" && query.empty()) { usage(); return 2; }
        if (cmd != "sync" && cmd != "sync-all" && cmd != "search") { usage(); return 2; }

        ChangeTracker tracker(cfg.cache_path);
        OllamaEmbedder embedder(cfg.embed);
        auto store = make_store(cfg.store);
        RetrievalEngine engine(tracker, segmenter, embedder, *store);

        if (cmd == "sync") {
            print_report(engine.sync(tech, dir));
            return 0;
        }
        if (cmd == "sync-all") {
            int rc = 0;
            for (const auto& r : engine.sync_all(cfg.sources)) {
                print_report(r);
                if (!r.error.empty()) rc = 1;
            }
            return rc;
        }

        auto results = engine.search(query, split_csv(tech), split_csv(categories), top_k);
        if (as_json) {
            std::cout << results_to_json(results).dump(2) << "\n";
            return 0;
        }
        for (const auto& [technology, list] : results) {
            std::cout << "\n==== " << technology << " ====\n";
            int i = 1;
            for (const auto& r : list) {
                std::cout << "[" << i++ << "] " << r.section_title << " (" << r.category << ", score "
                          << std::fixed << std::setprecision(2) << r.score << ")\n    " << r.file_path << "\n";
            }
        }
        if (results.empty()) std::cout << "No results.\n";
        return 0;
    } catch (const ConnectionError& e) {
        log->error("Cannot reach backend: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        log->error("{} failed: {}", cmd, e.what());
        return 1;
    }
}
