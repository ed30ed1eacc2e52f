#pragma once

#include "dsync/core/result.hpp"
#include "dsync/local/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dsync::sync {

using local::FileState;
using local::Snapshot;

enum class ActionKind {
    Upload,     // Name unknown to the cache
    Overwrite,  // Cached, fingerprint differs
    Delete      // Cached, gone from the scan
};

inline const char* to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Upload: return "upload";
        case ActionKind::Overwrite: return "overwrite";
        case ActionKind::Delete: return "delete";
    }
    return "unknown";
}

/**
 * @brief One remote operation decided by the diff
 */
struct SyncAction {
    ActionKind kind = ActionKind::Upload;
    std::string name;
    std::optional<FileState> current;   ///< Scanned state (absent for deletes)
    std::optional<FileState> previous;  ///< Cached state (absent for uploads)

    const std::filesystem::path& local_path() const { return current->path; }
};

/**
 * @brief Ordered actions for one pass, plus the files left alone
 */
struct SyncPlan {
    std::vector<SyncAction> actions;
    std::size_t unchanged = 0;

    bool empty() const noexcept { return actions.empty(); }
};

/**
 * @brief Result of executing one action against the remote side
 */
struct ActionOutcome {
    SyncAction action;
    std::optional<Error> error;  ///< Populated when the remote call failed

    bool succeeded() const noexcept { return !error.has_value(); }
};

/**
 * @brief Everything that happened during one comparison pass
 */
struct SyncReport {
    bool initial = false;
    bool directory_listed = true;
    bool deletes_suppressed = false;           ///< Scan failed and the guard policy held the cache
    std::size_t scanned = 0;
    std::size_t unchanged = 0;
    std::optional<std::size_t> remote_files;   ///< Size of the remote listing, when it succeeded
    std::optional<Error> listing_error;
    std::vector<ActionOutcome> outcomes;
    std::chrono::milliseconds duration{0};

    std::size_t succeeded() const {
        std::size_t n = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.succeeded()) {
                ++n;
            }
        }
        return n;
    }

    std::size_t failed() const { return outcomes.size() - succeeded(); }

    std::size_t count(ActionKind kind) const {
        std::size_t n = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.action.kind == kind) {
                ++n;
            }
        }
        return n;
    }
};

/**
 * @brief Switches for the two known hazards of cache replacement
 *
 * Defaults keep the plain behaviour: the cache always becomes the latest
 * scan, and an unreadable directory reads as an empty one.
 */
struct SyncPolicy {
    /// Keep failed uploads/overwrites/deletes pending so the next cycle retries them.
    bool retry_failed_transfers = false;

    /// When the directory cannot be listed, issue no actions and keep the cache.
    bool skip_deletes_on_scan_failure = false;
};

} // namespace dsync::sync
