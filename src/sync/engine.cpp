#include "dsync/sync/engine.hpp"
#include "dsync/events/events.hpp"
#include "dsync/sync/diff.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace dsync::sync {

SyncEngine::SyncEngine(local::Scanner& scanner,
                       remote::RemoteStorage& storage,
                       events::EventBus& bus,
                       SyncPolicy policy)
    : scanner_(scanner),
      storage_(storage),
      event_bus_(bus),
      policy_(policy) {}

SyncReport SyncEngine::initial_sync() {
    return run_pass(true);
}

SyncReport SyncEngine::sync_once() {
    return run_pass(false);
}

SyncReport SyncEngine::run_pass(bool initial) {
    const auto started_at = std::chrono::steady_clock::now();
    event_bus_.emit(events::SyncCycleStartedEvent{initial});

    SyncReport report;
    report.initial = initial;

    auto scan = scanner_.scan();
    report.directory_listed = scan.directory_listed;
    report.scanned = scan.snapshot.size();

    observe_remote(report);

    if (!scan.directory_listed && policy_.skip_deletes_on_scan_failure) {
        // Keep the cache as it was; an unreadable directory is not an empty one.
        report.deletes_suppressed = true;
        report.unchanged = cache_.size();
    } else {
        const Snapshot empty;
        const auto plan = plan_actions(initial ? empty : cache_, scan.snapshot);
        report.unchanged = plan.unchanged;

        report.outcomes.reserve(plan.actions.size());
        for (const auto& action : plan.actions) {
            report.outcomes.push_back(execute(action, initial));
        }

        cache_ = next_cache(scan.snapshot, report.outcomes);
    }

    ++cycles_completed_;
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    publish(report);
    return report;
}

ActionOutcome SyncEngine::execute(const SyncAction& action, bool initial) {
    ActionOutcome outcome;
    outcome.action = action;

    Result<void> result = Ok();
    switch (action.kind) {
        case ActionKind::Upload:
            result = storage_.upload(action.local_path());
            break;
        case ActionKind::Overwrite:
            result = storage_.overwrite(action.local_path());
            break;
        case ActionKind::Delete:
            result = storage_.remove(action.name);
            break;
    }

    if (result.is_error()) {
        outcome.error = result.error();
        event_bus_.emit(events::SyncActionFailedEvent{action.kind, action.name, result.error(), initial});
        return outcome;
    }

    switch (action.kind) {
        case ActionKind::Upload:
            event_bus_.emit(events::FileUploadedEvent{action.name,
                                                      action.current->fingerprint,
                                                      action.current->size,
                                                      initial});
            break;
        case ActionKind::Overwrite:
            event_bus_.emit(events::FileOverwrittenEvent{action.name,
                                                         action.previous->fingerprint,
                                                         action.current->fingerprint,
                                                         action.current->size});
            break;
        case ActionKind::Delete:
            event_bus_.emit(events::RemoteFileDeletedEvent{action.name});
            break;
    }
    return outcome;
}

void SyncEngine::observe_remote(SyncReport& report) {
    auto listing = storage_.list_remote();
    if (listing.is_error()) {
        report.listing_error = listing.error();
        event_bus_.emit(events::RemoteListingFailedEvent{listing.error()});
        return;
    }
    report.remote_files = listing.value().size();
    spdlog::debug("Remote folder holds {} files", listing.value().size());
}

Snapshot SyncEngine::next_cache(const Snapshot& scanned,
                                const std::vector<ActionOutcome>& outcomes) const {
    Snapshot next = scanned;
    if (!policy_.retry_failed_transfers) {
        return next;
    }

    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            continue;
        }
        const auto& action = outcome.action;
        if (action.previous) {
            // Failed overwrite or delete: remember what the remote still holds
            next[action.name] = *action.previous;
        } else {
            // Failed upload: stay unknown so the next diff uploads again
            next.erase(action.name);
        }
    }
    return next;
}

void SyncEngine::publish(const SyncReport& report) {
    events::SyncCycleCompletedEvent summary;
    summary.initial = report.initial;
    summary.scanned = report.scanned;
    summary.unchanged = report.unchanged;
    summary.directory_listed = report.directory_listed;
    summary.deletes_suppressed = report.deletes_suppressed;
    summary.failed = report.failed();
    summary.duration = report.duration;
    for (const auto& outcome : report.outcomes) {
        if (!outcome.succeeded()) {
            continue;
        }
        switch (outcome.action.kind) {
            case ActionKind::Upload: ++summary.uploaded; break;
            case ActionKind::Overwrite: ++summary.overwritten; break;
            case ActionKind::Delete: ++summary.deleted; break;
        }
    }
    event_bus_.emit(summary);
}

} // namespace dsync::sync
