#pragma once

#include <string>
#include <string_view>

namespace joule_gate::core {

// Lowercase hex SHA-256. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(std::string_view data);

// Digest binding a budget sample's timestamp to its bucket value.
std::string sample_digest(double timestamp, double bucket_joules);

}  // namespace joule_gate::core
