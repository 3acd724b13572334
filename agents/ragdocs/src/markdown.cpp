#include "../include/markdown.hpp"
#include "../include/errors.hpp"
#include "../include/log_registry.hpp"
#include "../include/util.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>

static const char* kUntitled = "Main Content";
static const char* kEllipsis = "...";

CategoryTable default_category_table() {
    return {
        {"deployment", {"deployment", "install", "setup", "configuration"}},
        {"performance", {"performance", "speed", "latency", "throughput"}},
        {"features", {"feature", "functionality", "capability"}},
        {"scalability", {"scale", "scalability", "distributed", "cluster"}},
        {"security", {"security", "authentication", "encryption"}},
        {"integration", {"integration", "connector", "plugin"}},
    };
}

std::string truncate_text(const std::string& text, std::size_t max_len) {
    if (text.size() <= max_len) return text;
    if (max_len <= 3) return text.substr(0, max_len);

    std::size_t cut = max_len - 3;
    while (cut > 0 && ((unsigned char)text[cut] & 0xC0) == 0x80) --cut;

    // text[cut] exists because text is longer than max_len
    std::size_t ws = std::string::npos;
    for (std::size_t i = cut + 1; i-- > 0;) {
        if (std::isspace((unsigned char)text[i])) { ws = i; break; }
    }
    if (ws != std::string::npos && ws > 0) cut = ws;

    std::string out = text.substr(0, cut);
    while (!out.empty() && std::isspace((unsigned char)out.back())) out.pop_back();
    return out + kEllipsis;
}

static std::string strip_cr(const std::string& line) {
    if (!line.empty() && line.back() == '\r') return line.substr(0, line.size() - 1);
    return line;
}

static std::map<std::string, std::string> yaml_fields(const std::string& yaml_text) {
    std::map<std::string, std::string> out;
    YAML::Node node;
    try {
        node = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }
    if (!node.IsMap()) return out;
    for (auto it = node.begin(); it != node.end(); ++it) {
        try {
            auto key = it->first.as<std::string>();
            out[key] = it->second.IsScalar() ? it->second.as<std::string>() : YAML::Dump(it->second);
        } catch (const YAML::Exception& e) {
            throw ParseError(e.what());
        }
    }
    return out;
}

Frontmatter extract_frontmatter(const std::string& text) {
    Frontmatter fm;
    fm.body = text;

    std::size_t first_end = text.find('\n');
    if (first_end == std::string::npos || strip_cr(text.substr(0, first_end)) != "---") return fm;

    std::size_t pos = first_end + 1;
    while (pos <= text.size()) {
        std::size_t eol = text.find('\n', pos);
        std::size_t line_end = eol == std::string::npos ? text.size() : eol;
        if (strip_cr(text.substr(pos, line_end - pos)) == "---") {
            std::string yaml_text = text.substr(first_end + 1, pos - first_end - 1);
            std::size_t rest = eol == std::string::npos ? text.size() : eol + 1;
            try {
                fm.fields = yaml_fields(yaml_text);
            } catch (const ParseError& e) {
                LogRegistry::segmenter()->warn("Discarding malformed frontmatter: {}", e.what());
                fm.fields.clear();
                return fm;
            }
            fm.body = trim(text.substr(rest));
            return fm;
        }
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return fm;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (true) {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, eol - pos));
        pos = eol + 1;
    }
    return lines;
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

static bool is_fence(const std::string& line) {
    return line.compare(0, 3, "```") == 0;
}

static std::string fence_language(const std::string& line) {
    std::string lang;
    for (std::size_t i = 3; i < line.size(); ++i) {
        unsigned char c = (unsigned char)line[i];
        if (std::isalnum(c) || c == '_') lang += (char)c;
        else break;
    }
    return lang.empty() ? "code" : lang;
}

std::string normalize_code_blocks(const std::string& text) {
    auto lines = split_lines(text);

    std::vector<std::string> fenced;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!is_fence(lines[i])) {
            fenced.push_back(lines[i]);
            continue;
        }
        std::size_t close = i + 1;
        while (close < lines.size() && !is_fence(lines[close])) ++close;
        if (close == lines.size()) {
            // unterminated fence is left as plain text
            fenced.push_back(lines[i]);
            continue;
        }
        fenced.push_back("[CODE_BLOCK_" + fence_language(lines[i]) + ": Code example]");
        i = close;
    }

    std::vector<std::string> out;
    bool in_indented = false;
    for (const auto& line : fenced) {
        bool indented = line.compare(0, 4, "    ") == 0 || (!line.empty() && line[0] == '\t');
        if (indented) {
            if (!in_indented) out.push_back("[CODE_BLOCK: Indented code example]");
            in_indented = true;
        } else {
            in_indented = false;
            out.push_back(line);
        }
    }
    return join_lines(out);
}

namespace {
struct Header {
    std::size_t offset;
    int level;
    std::string title;
};
}

static bool parse_header(const std::string& line, int& level, std::string& title) {
    std::size_t n = 0;
    while (n < line.size() && line[n] == '#') ++n;
    if (n == 0 || n > 6 || n >= line.size()) return false;
    if (line[n] != ' ' && line[n] != '\t') return false;
    title = trim(line.substr(n));
    if (title.empty()) return false;
    level = (int)n;
    return true;
}

std::vector<Section> extract_sections(const std::string& text) {
    std::vector<Header> headers;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t eol = text.find('\n', pos);
        std::size_t line_end = eol == std::string::npos ? text.size() : eol;
        int level = 0;
        std::string title;
        if (parse_header(strip_cr(text.substr(pos, line_end - pos)), level, title)) {
            headers.push_back({pos, level, std::move(title)});
        }
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }

    std::vector<Section> out;
    if (headers.empty()) {
        std::string content = trim(text);
        if (!content.empty()) out.push_back({kUntitled, 0, std::move(content), {}, 0, text.size()});
        return out;
    }

    std::size_t first = headers.front().offset;
    std::string preamble = trim(text.substr(0, first));
    if (!preamble.empty()) {
        out.push_back({kUntitled, 0, std::move(preamble), {}, 0, first});
    } else {
        headers.front().offset = 0;  // leading blank lines join the first section
    }

    for (std::size_t i = 0; i < headers.size(); ++i) {
        std::size_t start = headers[i].offset;
        std::size_t end = i + 1 < headers.size() ? headers[i + 1].offset : text.size();
        out.push_back({headers[i].title, headers[i].level, trim(text.substr(start, end - start)), {},
                       start, end - start});
    }
    return out;
}

DocumentSegmenter::DocumentSegmenter(CategoryTable categories) : categories_(std::move(categories)) {}

ProcessedDocument DocumentSegmenter::process(const std::string& raw) const {
    ProcessedDocument doc;
    Frontmatter fm = extract_frontmatter(raw);
    doc.metadata = std::move(fm.fields);

    std::string body = normalize_code_blocks(fm.body);
    doc.sections = extract_sections(body);
    for (auto& s : doc.sections) {
        s.title = truncate_text(s.title, kMaxTitleLength);
        s.content = truncate_text(s.content, kMaxContentLength);
        s.category = classify(s.content, s.title);
    }
    return doc;
}

static std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    std::size_t n = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

std::string DocumentSegmenter::classify(const std::string& content, const std::string& title) const {
    std::string text = to_lower(title + " " + content);
    std::string best = "general";
    std::size_t best_count = 0;
    for (const auto& rule : categories_) {
        std::size_t count = 0;
        for (const auto& kw : rule.keywords) count += count_occurrences(text, to_lower(kw));
        if (count > best_count) {
            best_count = count;
            best = rule.name;
        }
    }
    return best;
}
