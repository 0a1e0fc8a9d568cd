#pragma once

#include <cstddef>
#include <string>

namespace mbt {

// Hex string of nbytes random bytes from the OpenSSL CSPRNG.
std::string random_hex(size_t nbytes);

std::string to_hex(const unsigned char* data, size_t len);

// Case-insensitive comparison of two hex digests.
bool hex_equal(const std::string& a, const std::string& b);

// Non-empty, at most 64 chars of [A-Za-z0-9_-]; safe as a path component.
bool is_valid_id(const std::string& id);

} // namespace mbt
