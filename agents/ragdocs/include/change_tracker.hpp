#pragma once
#include "types.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct DiffResult {
    std::vector<std::string> new_files;
    std::vector<std::string> modified_files;
    std::vector<std::string> deleted_files;
    std::vector<FileFingerprint> removed;   // fingerprints dropped for deleted_files
    std::vector<SkippedFile> skipped;       // candidates that could not be hashed

    bool empty() const { return new_files.empty() && modified_files.empty() && deleted_files.empty(); }
};

using FingerprintMap = std::map<std::string, FileFingerprint>;

// Absent, unreadable or malformed cache yields an empty (or partial) map, never an error.
FingerprintMap load_fingerprint_cache(const std::filesystem::path& file);
// Writes atomically through a temp file. Throws StorageError.
void save_fingerprint_cache(const std::filesystem::path& file, const FingerprintMap& entries);

class ChangeTracker {
public:
    explicit ChangeTracker(std::filesystem::path cache_file, std::string extension = ".md");

    // Walks root for files with the tracked extension and classifies them against the
    // fingerprints of `technology`. The cache is persisted before returning.
    DiffResult diff(const std::filesystem::path& root, const std::string& technology);

    // Clears the stored hash of each path so the next diff reports it as modified.
    void invalidate(const std::vector<std::string>& paths);
    // Puts back fingerprints removed by a diff whose store update failed.
    void restore(const std::vector<FileFingerprint>& fingerprints);

    std::optional<FileFingerprint> find(const std::string& path) const;
    std::vector<FileFingerprint> fingerprints(const std::string& technology) const;
    std::set<std::string> technologies() const;
    std::size_t size() const;

private:
    std::filesystem::path cache_file_;
    std::string extension_;
    mutable std::mutex mtx_;
    FingerprintMap entries_;
};
