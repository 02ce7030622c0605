#pragma once

#include "../config/defaults.hpp"
#include "message.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace exomon {
namespace protocol {

/**
 * Decodes one frame's text into an Envelope.
 *
 * Missing members take the defaults of the MCP client: type "unknown",
 * source "unknown", data {}. Payload values are accepted in native JSON form
 * or stringified ("true", "55.2"), since the ExoManager server encodes every
 * data value as a string.
 *
 * parse() throws DecodeError for invalid JSON, a non-object top level, or a
 * data member that does not fit its type's payload.
 */
class MessageParser {
public:
    Envelope parse(std::string_view frame) const;

    /**
     * Display form of a server timestamp: local HH:MM:SS for a valid
     * ISO-8601 instant, otherwise the raw text unchanged.
     */
    static std::string normalize_timestamp(std::string_view raw);

    /**
     * First max_chars bytes of text followed by "...", cut on a UTF-8
     * boundary.
     */
    static std::string preview(std::string_view text, size_t max_chars = config::feed::PREVIEW_CHARS);
};

} // namespace protocol
} // namespace exomon
