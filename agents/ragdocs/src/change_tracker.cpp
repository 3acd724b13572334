#include "../include/change_tracker.hpp"
#include "../include/errors.hpp"
#include "../include/log_registry.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <set>

using json = nlohmann::json;
namespace fs = std::filesystem;

static FileFingerprint fingerprint_from_json(const std::string& key, const json& j) {
    if (!j.is_object()) throw ParseError("entry is not an object");
    try {
        FileFingerprint fp;
        fp.path = j.value("file_path", key);
        fp.hash = j.at("hash").get<std::string>();
        fp.mtime = j.at("last_modified").get<double>();
        fp.technology = j.at("technology").get<std::string>();
        fp.last_indexed = j.value("last_indexed", 0.0);
        if (fp.path != key) throw ParseError("file_path does not match key");
        return fp;
    } catch (const json::exception& e) {
        throw ParseError(e.what());
    }
}

static json fingerprint_to_json(const FileFingerprint& fp) {
    return json{
        {"file_path", fp.path},
        {"hash", fp.hash},
        {"last_modified", fp.mtime},
        {"technology", fp.technology},
        {"last_indexed", fp.last_indexed}
    };
}

FingerprintMap load_fingerprint_cache(const fs::path& file) {
    auto log = LogRegistry::tracker();
    FingerprintMap out;
    std::ifstream in(file);
    if (!in) {
        log->debug("No fingerprint cache at {}, starting empty", file.string());
        return out;
    }
    json data = json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        log->warn("Fingerprint cache {} is malformed, starting empty", file.string());
        return out;
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        try {
            out[it.key()] = fingerprint_from_json(it.key(), it.value());
        } catch (const ParseError& e) {
            log->warn("Dropping corrupt cache entry {}: {}", it.key(), e.what());
        }
    }
    log->debug("Loaded {} fingerprints from {}", out.size(), file.string());
    return out;
}

void save_fingerprint_cache(const fs::path& file, const FingerprintMap& entries) {
    json data = json::object();
    for (const auto& [path, fp] : entries) data[path] = fingerprint_to_json(fp);

    std::error_code ec;
    if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
    fs::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw StorageError("cannot write fingerprint cache " + tmp.string());
        out << data.dump(2);
        out.flush();
        if (!out) throw StorageError("cannot write fingerprint cache " + tmp.string());
    }
    fs::rename(tmp, file, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageError("cannot replace fingerprint cache " + file.string());
    }
}

ChangeTracker::ChangeTracker(fs::path cache_file, std::string extension)
    : cache_file_(std::move(cache_file)), extension_(std::move(extension)),
      entries_(load_fingerprint_cache(cache_file_)) {}

namespace {
struct Observation {
    std::string path;
    std::string hash;
    double mtime{0.0};
};
}

DiffResult ChangeTracker::diff(const fs::path& root, const std::string& technology) {
    auto log = LogRegistry::tracker();
    DiffResult res;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw StorageError("documentation root is not a directory: " + root.string());
    }

    // Walk and hash outside the lock; only the classification touches shared state.
    std::vector<Observation> seen;
    std::set<std::string> observed;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw StorageError("cannot walk " + root.string() + ": " + ec.message());
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) throw StorageError("walk of " + root.string() + " failed: " + ec.message());
        const auto& entry = *it;
        std::error_code fec;
        if (!entry.is_regular_file(fec) || entry.path().extension() != extension_) continue;

        std::string path = entry.path().lexically_normal().string();
        observed.insert(path);
        try {
            Observation o;
            o.path = path;
            o.hash = sha256_file(entry.path());
            o.mtime = file_mtime(entry.path());
            seen.push_back(std::move(o));
        } catch (const StorageError& e) {
            log->warn("Skipping unreadable file {}: {}", path, e.what());
            res.skipped.push_back({path, e.what()});
        }
    }
    if (ec) throw StorageError("walk of " + root.string() + " failed: " + ec.message());

    std::lock_guard<std::mutex> lock(mtx_);
    FingerprintMap before = entries_;
    double now = unix_now();

    for (auto& o : seen) {
        auto found = entries_.find(o.path);
        if (found == entries_.end()) {
            res.new_files.push_back(o.path);
            entries_[o.path] = FileFingerprint{o.path, o.hash, o.mtime, technology, now};
            continue;
        }
        auto& fp = found->second;
        if (fp.hash != o.hash || fp.mtime < o.mtime || fp.technology != technology) {
            res.modified_files.push_back(o.path);
            fp.hash = o.hash;
            fp.mtime = o.mtime;
            fp.technology = technology;
            fp.last_indexed = now;
        }
    }

    for (auto e = entries_.begin(); e != entries_.end();) {
        if (e->second.technology == technology && !observed.count(e->first)) {
            res.deleted_files.push_back(e->first);
            res.removed.push_back(e->second);
            e = entries_.erase(e);
        } else {
            ++e;
        }
    }

    std::sort(res.new_files.begin(), res.new_files.end());
    std::sort(res.modified_files.begin(), res.modified_files.end());

    try {
        save_fingerprint_cache(cache_file_, entries_);
    } catch (const StorageError& e) {
        entries_ = std::move(before);
        log->error("Failed to persist fingerprint cache: {}", e.what());
        throw;
    }

    log->debug("Diff {} at {}: {} new, {} modified, {} deleted, {} skipped", technology, root.string(),
               res.new_files.size(), res.modified_files.size(), res.deleted_files.size(), res.skipped.size());
    return res;
}

void ChangeTracker::invalidate(const std::vector<std::string>& paths) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& p : paths) {
        auto found = entries_.find(p);
        if (found != entries_.end()) found->second.hash.clear();
    }
    save_fingerprint_cache(cache_file_, entries_);
}

void ChangeTracker::restore(const std::vector<FileFingerprint>& fingerprints) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& fp : fingerprints) entries_.emplace(fp.path, fp);
    save_fingerprint_cache(cache_file_, entries_);
}

std::optional<FileFingerprint> ChangeTracker::find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto found = entries_.find(path);
    if (found == entries_.end()) return std::nullopt;
    return found->second;
}

std::vector<FileFingerprint> ChangeTracker::fingerprints(const std::string& technology) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<FileFingerprint> out;
    for (const auto& [path, fp] : entries_) {
        if (fp.technology == technology) out.push_back(fp);
    }
    return out;
}

std::set<std::string> ChangeTracker::technologies() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::set<std::string> out;
    for (const auto& [path, fp] : entries_) out.insert(fp.technology);
    return out;
}

std::size_t ChangeTracker::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}
