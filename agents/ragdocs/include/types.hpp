#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// One per tracked file, keyed by path.
struct FileFingerprint {
    std::string path;
    std::string hash;
    double mtime{0.0};
    std::string technology;
    double last_indexed{0.0};
};

struct Chunk {
    std::string content;
    std::string technology;
    std::string file_path;
    std::string file_hash;
    std::string section_title;
    int section_level{0};
    std::string category;
    std::vector<float> embedding;
};

// A stored chunk as returned by IndexStore::search, with the store's raw distance.
struct StoreHit {
    std::int64_t id{0};
    std::string content;
    std::string technology;
    std::string file_path;
    std::string section_title;
    int section_level{0};
    std::string category;
    float distance{0.0f};
};

struct SearchResult {
    std::string content;
    std::string technology;
    std::string file_path;
    std::string section_title;
    int section_level{0};
    std::string category;
    float score{0.0f};
};

// technology -> results ordered by descending score
using GroupedResults = std::map<std::string, std::vector<SearchResult>>;

// A documentation tree indexed under one technology name.
struct SourceDir {
    std::string technology;
    std::string dir;
};

struct SkippedFile {
    std::string path;
    std::string reason;
};
