#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace switchyard {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool starts_with(const std::string& s, const std::string& prefix);

// Time-ordered UUID-style identifier for inferences
std::string generate_inference_id();

// Addition clamped at UINT32_MAX
uint32_t saturating_add(uint32_t a, uint32_t b);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file; throws std::runtime_error if it cannot be opened
std::string read_file(const std::string& path);

} // namespace switchyard
