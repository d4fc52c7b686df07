#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace clump_match::core {

namespace fs = std::filesystem;

// ISO 8601 UTC time with milliseconds, e.g. 2024-03-01T12:00:00.123Z
std::string utc_timestamp();
// Unique-enough identifier for one CLI run
std::string new_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Strict numeric parsing: the whole (trimmed) token must be consumed.
// Empty tokens parse as NaN.
bool parse_double(const std::string& token, double& out);

// Strict decimal integer that fits in an int. Empty tokens are rejected.
bool parse_int(const std::string& token, int& out);

} // namespace clump_match::core
