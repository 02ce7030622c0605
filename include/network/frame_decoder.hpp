#pragma once

#include "../config/defaults.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace exomon {
namespace network {

/**
 * Newline-delimited frame decoder
 *
 * feed() appends a chunk and hands every complete frame to the callback, in
 * order. The trailing partial frame stays buffered for the next chunk, so
 * after feed() returns the buffer never holds a delimiter.
 *
 * Blank and whitespace-only lines are dropped. A '\r' before the delimiter
 * is stripped.
 *
 * With max_frame_bytes > 0, a frame longer than the bound is discarded up to
 * its delimiter and reported through the overflow callback.
 */
class FrameDecoder {
public:
    static constexpr char DELIMITER = config::framing::DELIMITER;
    static constexpr size_t PREVIEW_BYTES = config::feed::PREVIEW_CHARS;

    // Preview of the discarded frame's first bytes
    using OverflowCallback = std::function<void(std::string_view preview)>;

    explicit FrameDecoder(size_t max_frame_bytes = config::framing::MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    void set_overflow_callback(OverflowCallback cb) { overflow_cb_ = std::move(cb); }

    /**
     * Append a chunk and yield every complete frame.
     *
     * The string_view passed to on_frame is only valid for the duration of
     * the call. on_frame must not call back into this decoder.
     *
     * @return number of frames yielded
     */
    template <typename Callback>
    size_t feed(const char* data, size_t len, Callback&& on_frame) {
        size_t yielded = 0;

        if (discarding_) {
            // Skip the rest of an oversized frame
            const void* nl = len ? std::memchr(data, DELIMITER, len) : nullptr;
            if (!nl) {
                bytes_discarded_ += len;
                return 0;
            }
            size_t skip = static_cast<const char*>(nl) - data + 1;
            bytes_discarded_ += skip;
            data += skip;
            len -= skip;
            discarding_ = false;
        }

        // Bytes already buffered are known to hold no delimiter
        size_t scan_from = buffer_.size();
        buffer_.append(data, len);

        size_t start = 0;
        while (true) {
            size_t nl = buffer_.find(DELIMITER, scan_from);
            if (nl == std::string::npos)
                break;

            std::string_view frame(buffer_.data() + start, nl - start);
            if (!frame.empty() && frame.back() == '\r')
                frame.remove_suffix(1);

            if (is_blank(frame)) {
                ++blank_lines_;
            } else if (max_frame_bytes_ > 0 && frame.size() > max_frame_bytes_) {
                report_overflow(frame);
                bytes_discarded_ += frame.size();
            } else {
                ++frames_decoded_;
                ++yielded;
                on_frame(frame);
            }

            start = nl + 1;
            scan_from = start;
        }

        buffer_.erase(0, start);

        if (max_frame_bytes_ > 0 && buffer_.size() > max_frame_bytes_) {
            report_overflow(buffer_);
            bytes_discarded_ += buffer_.size();
            buffer_.clear();
            discarding_ = true;
        }

        return yielded;
    }

    template <typename Callback>
    size_t feed(std::string_view chunk, Callback&& on_frame) {
        return feed(chunk.data(), chunk.size(), std::forward<Callback>(on_frame));
    }

    /// Drop any partial frame (e.g. on reconnect)
    void reset() {
        buffer_.clear();
        discarding_ = false;
    }

    size_t buffered() const { return buffer_.size(); }
    bool discarding() const { return discarding_; }
    size_t max_frame_bytes() const { return max_frame_bytes_; }

    // Statistics
    uint64_t frames_decoded() const { return frames_decoded_; }
    uint64_t blank_lines() const { return blank_lines_; }
    uint64_t oversized_frames() const { return oversized_frames_; }
    uint64_t bytes_discarded() const { return bytes_discarded_; }

private:
    std::string buffer_;
    size_t max_frame_bytes_;
    bool discarding_ = false;
    OverflowCallback overflow_cb_;

    uint64_t frames_decoded_ = 0;
    uint64_t blank_lines_ = 0;
    uint64_t oversized_frames_ = 0;
    uint64_t bytes_discarded_ = 0;

    static bool is_blank(std::string_view frame) {
        for (char c : frame) {
            if (c != ' ' && c != '\t' && c != '\r' && c != '\v' && c != '\f')
                return false;
        }
        return true;
    }

    void report_overflow(std::string_view frame) {
        ++oversized_frames_;
        if (overflow_cb_) {
            overflow_cb_(frame.substr(0, PREVIEW_BYTES));
        }
    }
};

} // namespace network
} // namespace exomon
