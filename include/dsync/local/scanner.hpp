#pragma once

#include "dsync/core/result.hpp"
#include "dsync/local/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace dsync::local {

/**
 * @brief Source of local snapshots consumed by the sync engine
 */
class Scanner {
public:
    virtual ~Scanner() = default;

    /**
     * @brief Observe the watched directory once
     *
     * Never throws for filesystem problems; they are logged and reflected in
     * the returned ScanResult.
     */
    virtual ScanResult scan() = 0;
};

/**
 * @brief Scans the direct children of one directory
 *
 * Only regular files are reported (symlinks resolve the way stat does).
 * Subdirectories are never entered.
 */
class LocalScanner : public Scanner {
public:
    using FingerprintFunction = std::function<Result<std::string>(const std::filesystem::path&)>;

    /// Uses fingerprint_file() for content hashes.
    explicit LocalScanner(std::filesystem::path root);

    LocalScanner(std::filesystem::path root, FingerprintFunction fingerprint);

    ScanResult scan() override;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::optional<FileState> build_state(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path root_;
    FingerprintFunction fingerprint_;
};

} // namespace dsync::local
