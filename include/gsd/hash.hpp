#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Content Hashing (OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string hex_digest;  // lowercase hex
    std::string error;
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256_file(const std::string& file_path);

// SHA-1, used only for npm registry tarball shasums
HashResult compute_sha1(const std::vector<uint8_t>& data);

// Manifest hash form: "sha256:<hex>"
constexpr const char* kContentHashPrefix = "sha256:";

std::string format_content_hash(const std::string& hex_digest);

// Hash of the bytes as stored in a manifest entry. Empty on failure.
std::string content_hash(const std::vector<uint8_t>& data);

} // namespace gsd
