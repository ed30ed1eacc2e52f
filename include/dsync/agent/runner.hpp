#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/sync/engine.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <string>

namespace dsync::agent {

namespace asio = boost::asio;

/**
 * @brief Drives the sync engine on a fixed period until told to stop
 *
 * run() does the initial sync, then arms a steady_timer and runs sync_once()
 * on every expiry. SIGINT and SIGTERM end the loop cleanly, even while the
 * timer is pending. Everything runs on the caller's thread inside
 * io_context::run().
 *
 * An exception escaping a pass is logged as critical and rethrown out of
 * run(); the loop is not restarted.
 *
 * Usage:
 * ```cpp
 * asio::io_context io;
 * SyncRunner runner(io, engine, bus, std::chrono::seconds(60));
 * runner.run();   // returns after Ctrl+C
 * ```
 */
class SyncRunner {
public:
    using Duration = std::chrono::steady_clock::duration;

    SyncRunner(asio::io_context& io_context,
               sync::SyncEngine& engine,
               events::EventBus& bus,
               Duration period);

    SyncRunner(const SyncRunner&) = delete;
    SyncRunner& operator=(const SyncRunner&) = delete;

    /**
     * @brief Block until a signal or request_stop()
     *
     * Emits AgentStoppingEvent on a clean exit.
     */
    void run();

    /**
     * @brief Ask the loop to finish; safe from any thread and from event handlers
     */
    void request_stop(std::string reason = "stop requested");

    bool stopping() const noexcept { return stopping_; }

private:
    void schedule_next();
    void on_timer(const boost::system::error_code& ec);
    void on_signal(const boost::system::error_code& ec, int signal_number);
    void stop(const std::string& reason);

    asio::io_context& io_context_;
    sync::SyncEngine& engine_;
    events::EventBus& event_bus_;
    Duration period_;

    asio::steady_timer timer_;
    asio::signal_set signals_;

    std::atomic<bool> stopping_{false};
    std::string stop_reason_;
};

} // namespace dsync::agent
