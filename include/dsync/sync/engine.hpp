#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/local/scanner.hpp"
#include "dsync/remote/storage.hpp"
#include "dsync/sync/types.hpp"

#include <cstddef>
#include <vector>

namespace dsync::sync {

/**
 * @brief Keeps the remote folder in line with the local one
 *
 * The engine owns the cache: the last snapshot it reconciled with the remote
 * side. Each pass scans, diffs the scan against the cache, runs the actions
 * one at a time and then swaps the cache for the scan. Remote failures are
 * recorded in the returned report and emitted as events; they never escape a
 * pass. Anything else thrown by the scanner or the storage client does.
 *
 * Not thread-safe; meant to be driven by a single run loop.
 */
class SyncEngine {
public:
    SyncEngine(local::Scanner& scanner,
               remote::RemoteStorage& storage,
               events::EventBus& bus,
               SyncPolicy policy = {});

    /**
     * @brief Startup pass: upload every readable file
     *
     * Diffs against an empty cache, so every scanned file becomes an Upload.
     */
    SyncReport initial_sync();

    /**
     * @brief Steady-state pass: upload new, overwrite changed, delete missing
     */
    SyncReport sync_once();

    const Snapshot& cache() const noexcept { return cache_; }

    const SyncPolicy& policy() const noexcept { return policy_; }

    std::size_t cycles_completed() const noexcept { return cycles_completed_; }

private:
    SyncReport run_pass(bool initial);

    ActionOutcome execute(const SyncAction& action, bool initial);

    void observe_remote(SyncReport& report);

    Snapshot next_cache(const Snapshot& scanned, const std::vector<ActionOutcome>& outcomes) const;

    void publish(const SyncReport& report);

    local::Scanner& scanner_;
    remote::RemoteStorage& storage_;
    events::EventBus& event_bus_;
    SyncPolicy policy_;

    Snapshot cache_;
    std::size_t cycles_completed_ = 0;
};

} // namespace dsync::sync
