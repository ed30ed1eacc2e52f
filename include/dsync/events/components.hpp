/**
 * @file components.hpp
 * @brief Subscribers that turn sync events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // The engine emits, these react.
 */

#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace dsync::events {

/**
 * @brief Logger component - writes every sync outcome through spdlog
 *
 * Successful transfers are info, failures error. This is the only place
 * per-file results become visible to the user.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<AgentStartedEvent>([this](const AgentStartedEvent& e) {
            on_agent_started(e);
        });

        bus_.subscribe<AgentStoppingEvent>([this](const AgentStoppingEvent& e) {
            on_agent_stopping(e);
        });

        bus_.subscribe<SyncCycleStartedEvent>([this](const SyncCycleStartedEvent& e) {
            on_cycle_started(e);
        });

        bus_.subscribe<FileUploadedEvent>([this](const FileUploadedEvent& e) {
            on_file_uploaded(e);
        });

        bus_.subscribe<FileOverwrittenEvent>([this](const FileOverwrittenEvent& e) {
            on_file_overwritten(e);
        });

        bus_.subscribe<RemoteFileDeletedEvent>([this](const RemoteFileDeletedEvent& e) {
            on_remote_file_deleted(e);
        });

        bus_.subscribe<SyncActionFailedEvent>([this](const SyncActionFailedEvent& e) {
            on_action_failed(e);
        });

        bus_.subscribe<RemoteListingFailedEvent>([this](const RemoteListingFailedEvent& e) {
            on_listing_failed(e);
        });

        bus_.subscribe<SyncCycleCompletedEvent>([this](const SyncCycleCompletedEvent& e) {
            on_cycle_completed(e);
        });
    }

private:
    void on_agent_started(const AgentStartedEvent& e) {
        spdlog::info("Sync agent started");
        spdlog::info("Watched folder: {}", e.local_root.string());
        spdlog::info("Remote folder: {} (every {}s)", e.cloud_folder, e.period.count());
    }

    void on_agent_stopping(const AgentStoppingEvent& e) {
        spdlog::info("Sync agent stopping: {}", e.reason);
    }

    void on_cycle_started(const SyncCycleStartedEvent& e) {
        if (e.initial) {
            spdlog::info("Initial synchronization started");
        } else {
            spdlog::debug("Synchronization cycle started");
        }
    }

    void on_file_uploaded(const FileUploadedEvent& e) {
        if (e.initial) {
            spdlog::info("File uploaded: {}", e.name);
        } else {
            spdlog::info("New file uploaded: {}", e.name);
        }
        spdlog::debug("[Uploaded] name={} size={} md5={}", e.name, e.size, e.fingerprint);
    }

    void on_file_overwritten(const FileOverwrittenEvent& e) {
        spdlog::info("File updated: {}", e.name);
        spdlog::debug("[Overwritten] name={} size={} old_md5={} new_md5={}",
                      e.name, e.size, e.old_fingerprint, e.new_fingerprint);
    }

    void on_remote_file_deleted(const RemoteFileDeletedEvent& e) {
        spdlog::info("File deleted from cloud: {}", e.name);
    }

    void on_action_failed(const SyncActionFailedEvent& e) {
        spdlog::error("Failed to {} file {}: {} ({})",
                      sync::to_string(e.kind), e.name, e.error.message, dsync::to_string(e.error.kind));
    }

    void on_listing_failed(const RemoteListingFailedEvent& e) {
        spdlog::warn("Failed to list remote folder: {}", e.error.message);
    }

    void on_cycle_completed(const SyncCycleCompletedEvent& e) {
        if (!e.directory_listed) {
            spdlog::warn("Watched folder could not be listed this cycle{}",
                         e.deletes_suppressed ? "; remote deletions held back" : "");
        }
        if (e.initial) {
            spdlog::info("Initial synchronization finished: {} files, {} uploaded, {} failed in {}ms",
                         e.scanned, e.uploaded, e.failed, e.duration.count());
            return;
        }
        const auto level = (e.uploaded + e.overwritten + e.deleted + e.failed) > 0
            ? spdlog::level::info
            : spdlog::level::debug;
        spdlog::log(level,
                    "Synchronization finished: {} uploaded, {} updated, {} deleted, {} failed, {} unchanged in {}ms",
                    e.uploaded, e.overwritten, e.deleted, e.failed, e.unchanged, e.duration.count());
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - running totals since startup
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> cycles{0};
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> files_overwritten{0};
        std::atomic<uint64_t> files_deleted{0};
        std::atomic<uint64_t> bytes_transferred{0};
        std::atomic<uint64_t> failed_actions{0};
        std::atomic<uint64_t> listing_failures{0};
        std::atomic<uint64_t> scan_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileUploadedEvent>([this](const FileUploadedEvent& e) {
            stats_.files_uploaded++;
            stats_.bytes_transferred += e.size;
        });

        bus_.subscribe<FileOverwrittenEvent>([this](const FileOverwrittenEvent& e) {
            stats_.files_overwritten++;
            stats_.bytes_transferred += e.size;
        });

        bus_.subscribe<RemoteFileDeletedEvent>([this](const RemoteFileDeletedEvent&) {
            stats_.files_deleted++;
        });

        bus_.subscribe<SyncActionFailedEvent>([this](const SyncActionFailedEvent&) {
            stats_.failed_actions++;
        });

        bus_.subscribe<RemoteListingFailedEvent>([this](const RemoteListingFailedEvent&) {
            stats_.listing_failures++;
        });

        bus_.subscribe<SyncCycleCompletedEvent>([this](const SyncCycleCompletedEvent& e) {
            stats_.cycles++;
            if (!e.directory_listed) {
                stats_.scan_failures++;
            }
        });

        bus_.subscribe<AgentStoppingEvent>([this](const AgentStoppingEvent&) {
            print_stats();
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Cycles:           {}", stats_.cycles.load());
        spdlog::info("  Files uploaded:   {}", stats_.files_uploaded.load());
        spdlog::info("  Files updated:    {}", stats_.files_overwritten.load());
        spdlog::info("  Files deleted:    {}", stats_.files_deleted.load());
        spdlog::info("  Bytes sent:       {}", stats_.bytes_transferred.load());
        spdlog::info("  Failed actions:   {}", stats_.failed_actions.load());
        spdlog::info("  Listing failures: {}", stats_.listing_failures.load());
        spdlog::info("  Scan failures:    {}", stats_.scan_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace dsync::events
