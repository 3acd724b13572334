#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

constexpr std::size_t kMaxTitleLength = 512;
constexpr std::size_t kMaxContentLength = 65535;

// Ordered: on equal keyword counts the earlier category wins.
struct CategoryRule {
    std::string name;
    std::vector<std::string> keywords;
};
using CategoryTable = std::vector<CategoryRule>;

CategoryTable default_category_table();

struct Frontmatter {
    std::map<std::string, std::string> fields;
    std::string body;
};

struct Section {
    std::string title;
    int level{0};              // 1-6 for headers, 0 for untitled content
    std::string content;
    std::string category;      // filled by DocumentSegmenter::process
    std::size_t offset{0};     // span of the section in the segmented text
    std::size_t length{0};
};

struct ProcessedDocument {
    std::map<std::string, std::string> metadata;
    std::vector<Section> sections;
};

// Cuts at the last whitespace before max_len (bytes) and appends "...". Text within
// the limit is returned unchanged, so the function is idempotent.
std::string truncate_text(const std::string& text, std::size_t max_len);

// Never fails: a missing closing delimiter or bad YAML leaves `body` equal to the input.
Frontmatter extract_frontmatter(const std::string& text);

// Fenced blocks become "[CODE_BLOCK_<lang>: Code example]"; each run of indented lines
// becomes a single "[CODE_BLOCK: Indented code example]" line.
std::string normalize_code_blocks(const std::string& text);

// Spans of the returned sections cover the text contiguously from offset 0.
std::vector<Section> extract_sections(const std::string& text);

class DocumentSegmenter {
public:
    explicit DocumentSegmenter(CategoryTable categories = default_category_table());

    ProcessedDocument process(const std::string& raw) const;
    std::string classify(const std::string& content, const std::string& title) const;

    const CategoryTable& categories() const { return categories_; }

private:
    CategoryTable categories_;
};
