#pragma once

#include "gsd/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Tarball Extraction (zlib)
// ============================================================================

std::optional<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& compressed);

// Extract a ustar archive below dest_dir. Every entry is normalized under
// dest_dir; an entry escaping it fails with PATH_TRAVERSAL. Links and
// special entries are skipped. Returns the extracted file paths (relative).
Result<std::vector<std::string>> extract_tar(const std::vector<uint8_t>& tar_data,
                                             const std::string& dest_dir);

// gzip_decompress + extract_tar
Result<std::vector<std::string>> extract_tarball(const std::vector<uint8_t>& tgz,
                                                 const std::string& dest_dir);

} // namespace gsd
