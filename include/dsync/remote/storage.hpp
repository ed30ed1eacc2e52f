#pragma once

#include "dsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace dsync::remote {

/**
 * @brief One file as reported by the remote folder listing
 */
struct RemoteFileInfo {
    std::string name;
    std::uint64_t size = 0;
    std::string modified;  // Provider timestamp, ISO 8601
};

using RemoteListing = std::map<std::string, RemoteFileInfo>;

/**
 * @brief Capability interface the sync engine drives
 *
 * Remote names are derived from the local file's base name. Every operation
 * is idempotent: uploads overwrite, removing an absent file succeeds.
 */
class RemoteStorage {
public:
    virtual ~RemoteStorage() = default;

    /// Store the file under its base name, replacing any existing object.
    virtual Result<void> upload(const std::filesystem::path& local_path) = 0;

    /// Replace the remote copy of a file that is already known remotely.
    virtual Result<void> overwrite(const std::filesystem::path& local_path) = 0;

    /// Delete the remote object; succeeds when it is already gone.
    virtual Result<void> remove(const std::string& name) = 0;

    /// Files currently in the remote folder. Observability only.
    virtual Result<RemoteListing> list_remote() = 0;
};

} // namespace dsync::remote
