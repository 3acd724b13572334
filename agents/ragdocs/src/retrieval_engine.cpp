#include "../include/retrieval_engine.hpp"
#include "../include/errors.hpp"
#include "../include/log_registry.hpp"
#include "../include/util.hpp"
#include <algorithm>

RetrievalEngine::RetrievalEngine(ChangeTracker& tracker, const DocumentSegmenter& segmenter, Embedder& embedder,
                                 IndexStore& store)
    : tracker_(tracker), segmenter_(segmenter), embedder_(embedder), store_(store) {}

std::mutex& RetrievalEngine::technology_mutex(const std::string& technology) {
    std::lock_guard<std::mutex> lock(state_mtx_);
    auto& m = sync_locks_[technology];
    if (!m) m = std::make_unique<std::mutex>();
    return *m;
}

void RetrievalEngine::rollback(const DiffResult& diff) {
    std::vector<std::string> changed = diff.new_files;
    changed.insert(changed.end(), diff.modified_files.begin(), diff.modified_files.end());
    try {
        tracker_.invalidate(changed);
        tracker_.restore(diff.removed);
    } catch (const StorageError& e) {
        LogRegistry::engine()->error("Could not roll back fingerprints, next sync may miss changes: {}", e.what());
    }
}

SyncReport RetrievalEngine::sync(const std::string& technology, const std::filesystem::path& root) {
    auto log = LogRegistry::engine();
    std::lock_guard<std::mutex> serial(technology_mutex(technology));
    log->info("Updating documentation for {} from {}", technology, root.string());

    DiffResult diff = tracker_.diff(root, technology);
    SyncReport report;
    report.technology = technology;
    report.new_files = diff.new_files.size();
    report.modified_files = diff.modified_files.size();
    report.deleted_files = diff.deleted_files.size();
    report.skipped = diff.skipped;

    if (diff.empty()) {
        log->info("No changes detected for {}", technology);
        std::lock_guard<std::mutex> lock(state_mtx_);
        available_.insert(technology);
        return report;
    }

    try {
        store_.ensure_schema();

        std::set<std::string> stale(diff.modified_files.begin(), diff.modified_files.end());
        stale.insert(diff.deleted_files.begin(), diff.deleted_files.end());
        store_.delete_by_path(stale);

        std::vector<std::string> to_index = diff.new_files;
        to_index.insert(to_index.end(), diff.modified_files.begin(), diff.modified_files.end());

        std::vector<Chunk> chunks;
        std::vector<std::string> retry;
        for (const auto& path : to_index) {
            auto fp = tracker_.find(path);
            if (!fp) continue;
            std::string text;
            try {
                text = read_text_file(path);
            } catch (const StorageError& e) {
                log->warn("Skipping {}: {}", path, e.what());
                report.skipped.push_back({path, e.what()});
                retry.push_back(path);
                continue;
            }
            // Edited after the diff: index what we read, re-check on the next sync.
            if (sha256_hex(text) != fp->hash) retry.push_back(path);

            ProcessedDocument doc = segmenter_.process(text);
            for (auto& s : doc.sections) {
                Chunk c;
                c.content = std::move(s.content);
                c.technology = technology;
                c.file_path = path;
                c.file_hash = fp->hash;
                c.section_title = std::move(s.title);
                c.section_level = s.level;
                c.category = std::move(s.category);
                chunks.push_back(std::move(c));
            }
            log->debug("Processed {}: {} sections", path, doc.sections.size());
        }

        if (!chunks.empty()) {
            std::vector<std::string> texts;
            texts.reserve(chunks.size());
            for (const auto& c : chunks) texts.push_back(c.content);
            auto vectors = embedder_.encode_batch(texts);
            if (vectors.size() != chunks.size()) {
                throw StorageError("embedder returned " + std::to_string(vectors.size()) + " vectors for " +
                                   std::to_string(chunks.size()) + " chunks");
            }
            for (std::size_t i = 0; i < chunks.size(); ++i) chunks[i].embedding = std::move(vectors[i]);
            store_.insert(chunks);
        }
        report.chunks = chunks.size();

        if (!retry.empty()) tracker_.invalidate(retry);
    } catch (const std::exception& e) {
        log->error("Failed to update documentation for {}: {}", technology, e.what());
        rollback(diff);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        available_.insert(technology);
    }
    log->info("Updated {} documentation: {} new, {} modified, {} deleted, {} chunks, {} skipped", technology,
              report.new_files, report.modified_files, report.deleted_files, report.chunks, report.skipped.size());
    return report;
}

std::vector<SyncReport> RetrievalEngine::sync_all(const std::vector<SourceDir>& sources) {
    std::vector<SyncReport> reports;
    for (const auto& src : sources) {
        try {
            reports.push_back(sync(src.technology, src.dir));
        } catch (const std::exception& e) {
            LogRegistry::engine()->error("Sync of {} from {} failed: {}", src.technology, src.dir, e.what());
            SyncReport failed;
            failed.technology = src.technology;
            failed.error = e.what();
            reports.push_back(std::move(failed));
        }
    }
    return reports;
}

GroupedResults RetrievalEngine::search(const std::string& query, const std::vector<std::string>& technologies,
                                       const std::vector<std::string>& categories, std::size_t top_k) {
    GroupedResults out;
    if (top_k == 0) return out;

    FilterExpr filter{technologies, categories};
    std::size_t groups = technologies.size();
    if (groups == 0) {
        auto known = tracker_.technologies();
        auto synced = available_technologies();
        known.insert(synced.begin(), synced.end());
        groups = std::max<std::size_t>(1, known.size());
    }

    try {
        auto vector = embedder_.encode(query);
        // One store round trip; the store keeps up to top_k hits for every technology.
        auto hits = store_.search(vector, filter, top_k * groups, top_k);
        for (auto& hit : hits) {
            auto& group = out[hit.technology];
            if (group.size() >= top_k) continue;
            SearchResult r;
            r.content = std::move(hit.content);
            r.technology = hit.technology;
            r.file_path = std::move(hit.file_path);
            r.section_title = std::move(hit.section_title);
            r.section_level = hit.section_level;
            r.category = std::move(hit.category);
            r.score = relevance_score(hit.distance);
            group.push_back(std::move(r));
        }
    } catch (const std::exception& e) {
        LogRegistry::engine()->error("Search failed: {}", e.what());
        throw;
    }
    LogRegistry::engine()->debug("Search '{}' [{}] returned {} technologies", query, filter.str(), out.size());
    return out;
}

std::set<std::string> RetrievalEngine::available_technologies() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return available_;
}

std::vector<std::string> RetrievalEngine::categories() const {
    std::vector<std::string> out;
    for (const auto& rule : segmenter_.categories()) out.push_back(rule.name);
    return out;
}
