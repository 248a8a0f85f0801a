#include "gsd/archive.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <cstddef>
#include <cstring>
#include <utility>

namespace gsd {

namespace {

constexpr size_t kBlockSize = 512;

// Octal numeric header field, tolerant of NUL/space padding
std::optional<uint64_t> parse_octal(const uint8_t* field, size_t len) {
    uint64_t value = 0;
    size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == '\0')) ++i;
    bool any = false;
    for (; i < len && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = value * 8 + static_cast<uint64_t>(field[i] - '0');
        any = true;
    }
    for (; i < len; ++i) {
        if (field[i] != ' ' && field[i] != '\0') return std::nullopt;
    }
    return any ? std::optional<uint64_t>(value) : std::optional<uint64_t>(0);
}

std::string header_string(const uint8_t* field, size_t len) {
    size_t n = 0;
    while (n < len && field[n] != '\0') ++n;
    return std::string(reinterpret_cast<const char*>(field), n);
}

} // namespace

std::optional<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& compressed) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    // 16 + MAX_WBITS tells zlib to handle gzip format
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> decompressed;
    const size_t CHUNK = 16384;
    uint8_t out[CHUNK];

    int ret;
    do {
        stream.avail_out = CHUNK;
        stream.next_out = out;

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            inflateEnd(&stream);
            return std::nullopt;
        }

        size_t have = CHUNK - stream.avail_out;
        decompressed.insert(decompressed.end(), out, out + have);
    } while (stream.avail_out == 0);

    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }

    return decompressed;
}

Result<std::vector<std::string>> extract_tar(const std::vector<uint8_t>& tar_data,
                                             const std::string& dest_dir) {
    using ExtractResult = Result<std::vector<std::string>>;

    if (!create_directories(dest_dir)) {
        return ExtractResult::err(Error(ErrorCode::WRITE_FAILED, "cannot create " + dest_dir));
    }

    std::vector<std::string> extracted;
    size_t offset = 0;

    while (offset + kBlockSize <= tar_data.size()) {
        const uint8_t* header = tar_data.data() + offset;
        offset += kBlockSize;

        // End of archive (zero block)
        bool all_zero = true;
        for (size_t i = 0; i < kBlockSize; ++i) {
            if (header[i] != 0) {
                all_zero = false;
                break;
            }
        }
        if (all_zero) break;

        std::string name = header_string(header, 100);
        if (std::memcmp(header + 257, "ustar", 5) == 0) {
            std::string prefix = header_string(header + 345, 155);
            if (!prefix.empty()) name = prefix + "/" + name;
        }

        auto size = parse_octal(header + 124, 12);
        if (!size) {
            return ExtractResult::err(Error(ErrorCode::IO_ERROR, "corrupt tar header for " + name));
        }
        uint8_t typeflag = header[156];

        size_t padded_size = static_cast<size_t>(((*size + kBlockSize - 1) / kBlockSize) * kBlockSize);
        if (offset + padded_size > tar_data.size()) {
            return ExtractResult::err(Error(ErrorCode::IO_ERROR, "truncated tar entry " + name));
        }

        if (name.empty()) break;

        auto target = normalize_under_root(dest_dir, name);
        if (!target.ok) {
            return ExtractResult::err(
                Error(ErrorCode::PATH_TRAVERSAL, "tar entry escapes destination: " + name));
        }

        // Type: '0' or '\0' = regular file, '5' = directory
        if (typeflag == '5') {
            create_directories(target.path);
        } else if (typeflag == '0' || typeflag == '\0') {
            create_directories(get_parent_directory(target.path));
            std::vector<uint8_t> content(tar_data.begin() + static_cast<std::ptrdiff_t>(offset),
                                         tar_data.begin() + static_cast<std::ptrdiff_t>(offset + *size));
            auto written = atomic_write_file(target.path, content);
            if (!written.ok) {
                return ExtractResult::err(
                    Error(ErrorCode::WRITE_FAILED, "failed to extract " + name + ": " + written.error));
            }
            extracted.push_back(relative_to_root(dest_dir, target.path));
        } else {
            spdlog::debug("skipping tar entry {} (type {})", name, static_cast<char>(typeflag));
        }

        offset += padded_size;
    }

    return ExtractResult::ok(std::move(extracted));
}

Result<std::vector<std::string>> extract_tarball(const std::vector<uint8_t>& tgz,
                                                 const std::string& dest_dir) {
    auto tar = gzip_decompress(tgz);
    if (!tar) {
        return Result<std::vector<std::string>>::err(
            Error(ErrorCode::IO_ERROR, "failed to decompress tarball"));
    }
    return extract_tar(*tar, dest_dir);
}

} // namespace gsd
