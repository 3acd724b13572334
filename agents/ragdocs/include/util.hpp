#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);

// Hex SHA-256 of the file bytes, read in fixed-size blocks. Throws StorageError if unreadable.
std::string sha256_file(const std::filesystem::path& p);

std::string sha256_hex(const std::string& bytes);

// Modification time in seconds since the epoch, with sub-second precision.
double file_mtime(const std::filesystem::path& p);

// Throws StorageError if the file cannot be opened.
std::string read_text_file(const std::filesystem::path& p);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_csv(const std::string& s);
double unix_now();
