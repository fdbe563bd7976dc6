#pragma once
#include <string>
#include <vector>

namespace cedarmcp {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace cedarmcp
