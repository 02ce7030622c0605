#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../network/transport.hpp"
#include "../types.hpp"
#include "aggregate_stats.hpp"
#include "feed.hpp"
#include "ingest_pipeline.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace exomon {
namespace monitor {

/**
 * Session Driver
 *
 * Owns the transport and the receive thread. Single use:
 *
 *   Disconnected -> connect() -> Connected -> start() -> Receiving
 *     -> (peer close | read error | request_stop()) -> finish()
 *     -> Terminating -> Disconnected
 *
 * The receive thread is the only writer of the AggregateStats behind the
 * pipeline. finish() joins it before reading the summary.
 *
 * Logging: the logger is single-producer. The session logs from the
 * calling thread in connect()/finish() and from the receive thread only
 * while it runs; request_stop() does not log.
 */
class Session {
public:
    Session(std::unique_ptr<network::ITransport> transport, IngestPipeline& pipeline, AggregateStats& stats,
            IFeedSink& feed, logging::AsyncLogger& logger,
            size_t chunk_bytes = config::session::RECV_CHUNK_BYTES);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Open the transport. Throws ConnectError and stays Disconnected.
     */
    void connect();

    /**
     * Launch the receive thread. Requires Connected.
     */
    void start();

    /**
     * Ask the receive thread to stop. Safe from any thread or a signal-driven
     * poll loop; a blocked read is interrupted.
     */
    void request_stop();

    /**
     * Join the receive thread, print the statistics block, release the
     * transport. Returns the same summary on repeated calls.
     */
    SessionSummary finish();

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    bool is_receiving() const { return state() == SessionState::Receiving; }
    bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

    // Why the receive loop ended. Valid after finish().
    const std::string& end_reason() const { return end_reason_; }
    bool ended_with_error() const { return ended_with_error_; }

    const network::ITransport& transport() const { return *transport_; }

private:
    std::unique_ptr<network::ITransport> transport_;
    IngestPipeline& pipeline_;
    AggregateStats& stats_;
    IFeedSink& feed_;
    logging::AsyncLogger& logger_;
    size_t chunk_bytes_;

    std::atomic<SessionState> state_;
    std::atomic<bool> stop_requested_;
    std::thread receive_thread_;

    std::string end_reason_;
    bool ended_with_error_;
    std::optional<SessionSummary> summary_;

    void receive_loop();
    void transition(SessionState to);
};

} // namespace monitor
} // namespace exomon
