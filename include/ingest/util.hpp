#pragma once

#include <string>
#include <vector>

namespace ingest {

std::string trim(std::string value);

std::string to_upper_copy(std::string value);

std::string to_lower_copy(std::string value);

// Lowercase hex SHA-256 of `message`.
std::string sha256_hex(const std::string& message);

std::string join(const std::vector<std::string>& parts, char separator);

} // namespace ingest
