#pragma once

#include "dsync/sync/types.hpp"

namespace dsync::sync {

/**
 * @brief Classify every name of cache and current scan
 *
 * Walks both ordered snapshots in step, so actions come out sorted by name:
 * - only in current            -> Upload
 * - in both, fingerprints differ -> Overwrite
 * - in both, same fingerprint  -> counted as unchanged
 * - only in cache              -> Delete
 *
 * A renamed file therefore shows up as one Delete and one Upload.
 */
SyncPlan plan_actions(const Snapshot& cache, const Snapshot& current);

} // namespace dsync::sync
