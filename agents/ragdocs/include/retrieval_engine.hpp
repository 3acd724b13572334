#pragma once
#include "change_tracker.hpp"
#include "embedder.hpp"
#include "index_store.hpp"
#include "markdown.hpp"
#include "types.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct SyncReport {
    std::string technology;
    std::size_t new_files{0};
    std::size_t modified_files{0};
    std::size_t deleted_files{0};
    std::size_t chunks{0};
    std::vector<SkippedFile> skipped;
    std::string error;  // set only by sync_all when this technology failed
};

// Keeps the index in step with documentation trees and answers filtered searches.
// sync() calls for the same technology are serialized; everything else may run concurrently.
class RetrievalEngine {
public:
    RetrievalEngine(ChangeTracker& tracker, const DocumentSegmenter& segmenter, Embedder& embedder,
                    IndexStore& store);

    // Re-indexes new and modified files under root and drops chunks of deleted ones.
    SyncReport sync(const std::string& technology, const std::filesystem::path& root);

    // One sync per source; a failing technology is reported and the rest still run.
    std::vector<SyncReport> sync_all(const std::vector<SourceDir>& sources);

    // Results grouped by technology, each group best-first and capped at top_k.
    GroupedResults search(const std::string& query, const std::vector<std::string>& technologies = {},
                          const std::vector<std::string>& categories = {}, std::size_t top_k = 3);

    std::set<std::string> available_technologies() const;
    std::vector<std::string> categories() const;

private:
    std::mutex& technology_mutex(const std::string& technology);
    void rollback(const DiffResult& diff);

    ChangeTracker& tracker_;
    const DocumentSegmenter& segmenter_;
    Embedder& embedder_;
    IndexStore& store_;

    mutable std::mutex state_mtx_;
    std::map<std::string, std::unique_ptr<std::mutex>> sync_locks_;
    std::set<std::string> available_;
};
