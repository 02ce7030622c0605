#pragma once

#include "../errors.hpp"
#include "../network/frame_decoder.hpp"
#include "../protocol/message_parser.hpp"
#include "aggregate_stats.hpp"
#include "feed.hpp"
#include "message_router.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace exomon {
namespace monitor {

/**
 * Ingestion pipeline: raw bytes -> frames -> envelopes -> handlers.
 *
 * A frame that fails to decode is reported with a preview and dropped;
 * counters are untouched and the next frame is processed normally.
 *
 * Usage:
 *   AggregateStats stats;
 *   ConsoleFeed feed(std::cout);
 *   IngestPipeline pipeline(stats, feed);
 *   pipeline.ingest(buf, n);   // from the receive loop
 */
class IngestPipeline {
public:
    IngestPipeline(AggregateStats& stats, IFeedSink& feed, size_t max_frame_bytes = 0,
                   bool show_unknown = true)
        : stats_(stats), feed_(feed), decoder_(max_frame_bytes), router_(stats, feed, show_unknown) {
        decoder_.set_overflow_callback([this](std::string_view preview) {
            stats_.record_oversized_frame();
            stats_.record_decode_failure();
            report_decode_failure("frame exceeds " + std::to_string(decoder_.max_frame_bytes()) + " bytes",
                                  preview);
        });
    }

    // Non-copyable (decoder callback captures this)
    IngestPipeline(const IngestPipeline&) = delete;
    IngestPipeline& operator=(const IngestPipeline&) = delete;

    /**
     * Process one received chunk
     * @return number of frames dispatched to a handler
     */
    size_t ingest(const char* data, size_t len) {
        stats_.record_bytes(len);
        size_t dispatched = 0;
        decoder_.feed(data, len, [&](std::string_view frame) {
            stats_.record_frame();
            if (process_frame(frame))
                ++dispatched;
        });
        return dispatched;
    }

    size_t ingest(std::string_view chunk) { return ingest(chunk.data(), chunk.size()); }

    const network::FrameDecoder& decoder() const { return decoder_; }
    MessageRouter& router() { return router_; }

private:
    AggregateStats& stats_;
    IFeedSink& feed_;
    network::FrameDecoder decoder_;
    protocol::MessageParser parser_;
    MessageRouter router_;

    bool process_frame(std::string_view frame) {
        protocol::Envelope env;
        try {
            env = parser_.parse(frame);
        } catch (const DecodeError& e) {
            stats_.record_decode_failure();
            report_decode_failure(e.what(), frame);
            return false;
        }
        router_.dispatch(env);
        return true;
    }

    void report_decode_failure(const std::string& reason, std::string_view frame) {
        RenderRequest r;
        r.add(Tone::Error, "Failed to parse JSON message: " + reason);
        r.add(Tone::Dim, "   Raw message: " + protocol::MessageParser::preview(frame));
        feed_.emit(r);
    }
};

} // namespace monitor
} // namespace exomon
