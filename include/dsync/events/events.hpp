/**
 * @file events.hpp
 * @brief Event types emitted by the sync agent
 *
 * NAMING CONVENTION:
 * Events are past-tense and describe something that already happened:
 * FileUploadedEvent, RemoteFileDeletedEvent.
 */

#pragma once

#include "dsync/core/result.hpp"
#include "dsync/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dsync::events {

// ════════════════════════════════════════════════════════
// Agent Lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the remote folder is reachable and the loop starts
 *
 * WHO EMITS: main() after setup
 * WHO SUBSCRIBES: Logger (startup banner in the log)
 */
struct AgentStartedEvent {
    std::filesystem::path local_root;
    std::string cloud_folder;
    std::chrono::seconds period{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the run loop is leaving
 *
 * WHO EMITS: SyncRunner (signal or stop request)
 * WHO SUBSCRIBES: Logger, Metrics (final statistics)
 */
struct AgentStoppingEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-file Outcomes
// ════════════════════════════════════════════════════════

struct FileUploadedEvent {
    std::string name;
    std::string fingerprint;
    std::uint64_t size = 0;
    bool initial = false;  ///< Uploaded by the startup pass
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileOverwrittenEvent {
    std::string name;
    std::string old_fingerprint;
    std::string new_fingerprint;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RemoteFileDeletedEvent {
    std::string name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A remote operation failed; the cycle carried on
 */
struct SyncActionFailedEvent {
    sync::ActionKind kind = sync::ActionKind::Upload;
    std::string name;
    Error error;
    bool initial = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Cycle Events
// ════════════════════════════════════════════════════════

struct SyncCycleStartedEvent {
    bool initial = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RemoteListingFailedEvent {
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Summary of a finished comparison pass
 *
 * WHO SUBSCRIBES: Logger (one line per cycle), Metrics (cycle counters)
 */
struct SyncCycleCompletedEvent {
    bool initial = false;
    std::size_t scanned = 0;
    std::size_t uploaded = 0;
    std::size_t overwritten = 0;
    std::size_t deleted = 0;
    std::size_t failed = 0;
    std::size_t unchanged = 0;
    bool directory_listed = true;
    bool deletes_suppressed = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace dsync::events
