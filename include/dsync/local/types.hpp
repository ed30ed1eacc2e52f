#pragma once

/**
 * @file types.hpp
 * @brief Local observation types for the sync agent
 *
 * A FileState is what the scanner saw for one file; a Snapshot is every
 * readable file of the watched directory at one scan instant. The engine's
 * cache is simply the last Snapshot it reconciled with the remote side.
 *
 * Only the fingerprint decides whether a file changed. Size and modification
 * time travel along for logging.
 */

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dsync::local {

/**
 * @brief One locally observed file
 *
 * EXAMPLE:
 * name        = "report.pdf"
 * path        = "/home/user/sync/report.pdf"
 * fingerprint = "5eb63bbbe01eeed093cb22bb8f5acdc3"
 */
struct FileState {
    std::string name;               // Base name, unique key within a snapshot
    std::filesystem::path path;     // Absolute path used to open the file for upload
    std::string fingerprint;        // Hex MD5 of the full content
    std::uint64_t size = 0;         // Bytes, informational
    std::time_t modified_time = 0;  // Unix epoch, informational

    /**
     * Two states describe the same content when their fingerprints match,
     * regardless of timestamps.
     */
    bool same_content(const FileState& other) const {
        return fingerprint == other.fingerprint;
    }
};

/**
 * @brief name -> FileState, ordered by name so plans and logs are stable
 */
using Snapshot = std::map<std::string, FileState>;

/**
 * @brief Output of one directory scan
 *
 * directory_listed is false when the directory itself could not be
 * enumerated. The snapshot is then empty, which downstream looks exactly
 * like an empty directory.
 */
struct ScanResult {
    Snapshot snapshot;
    bool directory_listed = true;
    std::vector<std::string> skipped;  // Names omitted this cycle (unreadable)
};

} // namespace dsync::local
