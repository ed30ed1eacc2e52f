#pragma once

#include "dsync/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace dsync::local {

/// Read size used while hashing; any value gives the same digest.
constexpr std::size_t kFingerprintChunkSize = 4096;

/**
 * @brief Content fingerprint of a file (lowercase hex MD5, 32 chars)
 *
 * The file is streamed in kFingerprintChunkSize pieces, so memory use does
 * not grow with file size. An ErrorKind::Io error means the file must be
 * treated as absent for this cycle.
 */
Result<std::string> fingerprint_file(const std::filesystem::path& path);

/// Same digest for an in-memory buffer.
std::string fingerprint_bytes(const std::string& data);

} // namespace dsync::local
