#include "../../include/monitor/session.hpp"
#include "../../include/errors.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace exomon::monitor {

Session::Session(std::unique_ptr<network::ITransport> transport, IngestPipeline& pipeline, AggregateStats& stats,
                 IFeedSink& feed, logging::AsyncLogger& logger, size_t chunk_bytes)
    : transport_(std::move(transport)), pipeline_(pipeline), stats_(stats), feed_(feed), logger_(logger),
      chunk_bytes_(chunk_bytes ? chunk_bytes : config::session::RECV_CHUNK_BYTES),
      state_(SessionState::Disconnected), stop_requested_(false), ended_with_error_(false) {
    if (!transport_) {
        throw std::invalid_argument("Session requires a transport");
    }
}

Session::~Session() {
    request_stop();
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }
    transport_->close();
}

void Session::connect() {
    if (state() != SessionState::Disconnected || summary_) {
        throw std::logic_error("Session::connect() on a used session");
    }

    LOGF_DEBUG(logger_, Transport, "Connecting to %s", transport_->endpoint().c_str());
    try {
        transport_->open();
    } catch (const ConnectError& e) {
        LOGF_ERROR(logger_, Transport, "Connect to %s failed: %s", transport_->endpoint().c_str(), e.what());
        throw;
    }
    transition(SessionState::Connected);
}

void Session::start() {
    if (state() != SessionState::Connected) {
        throw std::logic_error("Session::start() requires a connected session");
    }
    transition(SessionState::Receiving);
    receive_thread_ = std::thread([this]() { receive_loop(); });
}

void Session::request_stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel))
        return;
    transport_->interrupt();
}

SessionSummary Session::finish() {
    if (summary_) {
        return *summary_;
    }

    request_stop();
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }

    // Never started, or the loop already moved on
    if (state() != SessionState::Terminating) {
        transition(SessionState::Terminating);
    }

    summary_ = stats_.summarize();
    feed_.emit(render_summary(*summary_));

    LOGF_INFO(logger_, Session, "Received %lu bytes in %lu frames",
              static_cast<unsigned long>(summary_->pipeline.bytes_received),
              static_cast<unsigned long>(summary_->pipeline.frames));

    transport_->close();
    transition(SessionState::Disconnected);
    return *summary_;
}

void Session::receive_loop() {
    std::vector<char> buffer(chunk_bytes_);

    try {
        while (!stop_requested()) {
            size_t n = transport_->read(buffer.data(), buffer.size());
            if (n == 0) {
                end_reason_ = stop_requested() ? "stop requested" : "server closed the connection";
                break;
            }
            pipeline_.ingest(buffer.data(), n);
        }
        if (end_reason_.empty()) {
            end_reason_ = "stop requested";
        }
    } catch (const TransportReadError& e) {
        if (stop_requested()) {
            // Socket torn down under a pending read
            end_reason_ = "stop requested";
        } else {
            end_reason_ = e.what();
            ended_with_error_ = true;
            RenderRequest r;
            r.add(Tone::Error, std::string("Error receiving message: ") + e.what());
            feed_.emit(r);
        }
    } catch (const std::exception& e) {
        end_reason_ = e.what();
        ended_with_error_ = true;
        LOGF_ERROR(logger_, Session, "Receive loop aborted: %s", e.what());
    }

    LOGF_DEBUG(logger_, Session, "Receive loop ended: %s", end_reason_.c_str());
    transition(SessionState::Terminating);
}

void Session::transition(SessionState to) {
    SessionState from = state_.exchange(to, std::memory_order_acq_rel);
    LOGF_DEBUG(logger_, Session, "%s -> %s", session_state_to_string(from), session_state_to_string(to));
}

} // namespace exomon::monitor
