#include "dsync/agent/runner.hpp"

#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace dsync::agent {

namespace {

const char* signal_name(int signal_number) {
    switch (signal_number) {
        case SIGINT: return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default: return "signal";
    }
}

} // namespace

SyncRunner::SyncRunner(asio::io_context& io_context,
                       sync::SyncEngine& engine,
                       events::EventBus& bus,
                       Duration period)
    : io_context_(io_context),
      engine_(engine),
      event_bus_(bus),
      period_(period),
      timer_(io_context),
      signals_(io_context, SIGINT, SIGTERM) {}

void SyncRunner::run() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        on_signal(ec, signal_number);
    });

    try {
        engine_.initial_sync();
        if (!stopping_) {
            schedule_next();
        }
        io_context_.restart();
        io_context_.run();
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error, sync loop terminated: {}", e.what());
        stopping_ = true;
        boost::system::error_code ec;
        signals_.cancel(ec);
        if (ec) {
            spdlog::debug("Signal set cancel failed: {}", ec.message());
        }
        timer_.cancel();
        throw;
    }

    spdlog::info("Synchronization stopped ({})", stop_reason_);
    event_bus_.emit(events::AgentStoppingEvent{stop_reason_});
}

void SyncRunner::request_stop(std::string reason) {
    asio::post(io_context_, [this, reason = std::move(reason)]() { stop(reason); });
}

void SyncRunner::schedule_next() {
    timer_.expires_after(period_);
    timer_.async_wait([this](const boost::system::error_code& ec) { on_timer(ec); });
}

void SyncRunner::on_timer(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || stopping_) {
        return;
    }
    if (ec) {
        spdlog::error("Sync timer failed: {}", ec.message());
        stop("timer failure");
        return;
    }

    engine_.sync_once();

    if (!stopping_) {
        schedule_next();
    }
}

void SyncRunner::on_signal(const boost::system::error_code& ec, int signal_number) {
    if (ec == asio::error::operation_aborted) {
        return;
    }
    if (ec) {
        spdlog::error("Signal wait failed: {}", ec.message());
        return;
    }
    spdlog::info("Received {}, shutting down", signal_name(signal_number));
    stop(std::string("interrupted by ") + signal_name(signal_number));
}

void SyncRunner::stop(const std::string& reason) {
    if (stopping_.exchange(true)) {
        return;
    }
    stop_reason_ = reason;

    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec) {
        spdlog::debug("Signal set cancel failed: {}", ec.message());
    }
    timer_.cancel();
}

} // namespace dsync::agent
