#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace finly {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

bool starts_with(const std::string& s, const std::string& prefix);

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& s);

// Decode %XX escapes. A malformed escape is kept literally.
std::string url_decode(const std::string& s);

// Strip leading and trailing slashes from an API path
std::string normalize_path(const std::string& path);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via a sibling .tmp file and rename over the target.
// Creates the parent directory if missing. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace finly
