#pragma once

#include <string>
#include "core/errors/relay_errors.hpp"

namespace relay::core::crypto {

// Lowercase hex SHA-256 of `data`. Throws std::runtime_error only when
// OpenSSL itself fails to initialise a digest context.
std::string sha256_hex(const std::string& data);

// Standard base64 with '=' padding.
std::string base64_encode(const std::string& data);

core::errors::Result<std::string> base64_decode(const std::string& encoded);

}  // namespace relay::core::crypto
