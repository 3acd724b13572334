#pragma once
#include <stdexcept>
#include <string>

// Cache or vector-store I/O failure. Fatal to the call.
struct StorageError : std::runtime_error {
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Remote endpoint unreachable or database could not be opened.
struct ConnectionError : std::runtime_error {
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

// Collection or index creation failure, or an existing schema that does not fit.
struct SchemaError : std::runtime_error {
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed frontmatter or cache entry. Always recovered where it is raised.
struct ParseError : std::runtime_error {
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};
