#include "protocol/framing.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_excerpt.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace framing {

static const std::string HEADER_SEPARATOR = "\r\n\r\n";
static const std::string CONTENT_LENGTH = "content-length:";

static bool is_space(char character) {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

static char lower(char character) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
}

static std::string trim(const std::string &text) {
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

// Case-insensitive search for an already lower-case needle.
static std::size_t find_lower(const std::string &haystack, const std::string &needle) {
    if (needle.size() > haystack.size()) {
        return std::string::npos;
    }
    for (std::size_t start = 0; start + needle.size() <= haystack.size(); ++start) {
        bool matched = true;
        for (std::size_t offset = 0; offset < needle.size(); ++offset) {
            if (lower(haystack[start + offset]) != needle[offset]) {
                matched = false;
                break;
            }
        }
        if (matched) {
            return start;
        }
    }
    return std::string::npos;
}

// Reads the value of "Content-Length:\s*(\d+)" from a header block.
// Returns false when the header is missing or its value is not a usable number.
static bool parse_content_length(const std::string &header_block, std::size_t &length) {
    std::size_t position = find_lower(header_block, CONTENT_LENGTH);
    if (position == std::string::npos) {
        return false;
    }
    position += CONTENT_LENGTH.size();
    while (position < header_block.size() && is_space(header_block[position])) {
        ++position;
    }
    std::size_t digits_end = position;
    while (digits_end < header_block.size() &&
           std::isdigit(static_cast<unsigned char>(header_block[digits_end])) != 0) {
        ++digits_end;
    }
    if (digits_end == position) {
        return false;
    }
    try {
        length = static_cast<std::size_t>(std::stoull(header_block.substr(position, digits_end - position)));
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

const char *framing_name(Framing value) {
    switch (value) {
    case Framing::ndjson:
        return "ndjson";
    case Framing::lsp:
        return "lsp";
    case Framing::unknown:
        break;
    }
    return "unknown";
}

Framing parse_framing(const std::string &text) {
    std::string normalized = trim(text);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), lower);
    if (normalized == "ndjson") {
        return Framing::ndjson;
    }
    if (normalized == "lsp") {
        return Framing::lsp;
    }
    return Framing::unknown;
}

std::string encode_message(const json &message, Framing value) {
    std::string body = message.dump(-1, ' ', false, json::error_handler_t::replace);
    if (value == Framing::lsp) {
        return "Content-Length: " + std::to_string(body.size()) + HEADER_SEPARATOR + body;
    }
    return body + "\n";
}

DecodeResult decode_payload(const std::string &payload) {
    DecodeResult result;
    try {
        result.message = json::parse(payload);
        result.success = true;
    } catch (const json::parse_error &error) {
        result.success = false;
        result.error_message = error.what();
    }
    return result;
}

std::vector<json> FrameDecoder::feed(const std::string &bytes) {
    std::vector<json> messages;
    if (bytes.empty()) {
        return messages;
    }
    buffer_ += bytes;

    if (detected_framing_ == Framing::unknown) {
        detect();
        if (detected_framing_ == Framing::unknown) {
            return messages;
        }
    }

    if (detected_framing_ == Framing::lsp) {
        drain_lsp(messages);
    } else {
        drain_ndjson(messages);
    }
    return messages;
}

std::vector<json> FrameDecoder::finish() {
    std::vector<json> messages;
    if (detected_framing_ == Framing::lsp) {
        drain_lsp(messages);
        if (!buffer_.empty()) {
            debug_log::log("Dropping partial LSP frame at end of stream (" +
                           std::to_string(buffer_.size()) + " bytes)");
        }
        buffer_.clear();
        return messages;
    }

    // NDJSON or still undetermined: whatever is left is the last line.
    drain_ndjson(messages);
    std::string tail = trim(buffer_);
    buffer_.clear();
    if (!tail.empty()) {
        debug_log::log("Flushing NDJSON tail at end of stream");
        accept_payload(tail, messages);
    }
    return messages;
}

// The framing is decided on the first meaningful bytes. While everything buffered is
// whitespace, or a prefix of a "Content-Length:" header split across chunks, the
// decision waits for more input.
void FrameDecoder::detect() {
    std::size_t first = 0;
    while (first < buffer_.size() && is_space(buffer_[first])) {
        ++first;
    }
    if (first == buffer_.size()) {
        return;
    }

    std::size_t available = buffer_.size() - first;
    std::size_t compared = std::min(available, CONTENT_LENGTH.size());
    bool header_prefix = true;
    for (std::size_t offset = 0; offset < compared; ++offset) {
        if (lower(buffer_[first + offset]) != CONTENT_LENGTH[offset]) {
            header_prefix = false;
            break;
        }
    }

    if (header_prefix && available < CONTENT_LENGTH.size()) {
        return;
    }

    if (header_prefix || buffer_.find(HEADER_SEPARATOR) != std::string::npos) {
        detected_framing_ = Framing::lsp;
    } else {
        detected_framing_ = Framing::ndjson;
    }
    debug_log::log(std::string("Framing detected: ") + framing_name(detected_framing_));
}

void FrameDecoder::drain_ndjson(std::vector<json> &messages) {
    std::size_t newline_position;
    while ((newline_position = buffer_.find('\n')) != std::string::npos) {
        std::string line = trim(buffer_.substr(0, newline_position));
        buffer_.erase(0, newline_position + 1);
        if (line.empty()) {
            continue;
        }
        debug_log::log("[rx ndjson] " + text_excerpt::excerpt(line));
        accept_payload(line, messages);
    }
}

void FrameDecoder::drain_lsp(std::vector<json> &messages) {
    while (true) {
        std::size_t header_end = buffer_.find(HEADER_SEPARATOR);
        if (header_end == std::string::npos) {
            return;
        }

        std::size_t body_length = 0;
        if (!parse_content_length(buffer_.substr(0, header_end), body_length)) {
            debug_log::warn("LSP header without Content-Length; dropping header chunk");
            buffer_.erase(0, header_end + HEADER_SEPARATOR.size());
            continue;
        }

        std::size_t body_start = header_end + HEADER_SEPARATOR.size();
        if (buffer_.size() - body_start < body_length) {
            return;
        }

        std::string body = buffer_.substr(body_start, body_length);
        buffer_.erase(0, body_start + body_length);
        debug_log::log("[rx lsp] len=" + std::to_string(body_length) + " " + text_excerpt::excerpt(body));
        accept_payload(body, messages);
    }
}

void FrameDecoder::accept_payload(const std::string &payload, std::vector<json> &messages) {
    DecodeResult result = decode_payload(payload);
    if (!result.success) {
        ++discarded_count_;
        debug_log::warn("Invalid " + std::string(framing_name(detected_framing_)) +
                        " payload (ignored): " + result.error_message +
                        " | " + text_excerpt::excerpt(payload));
        return;
    }
    messages.push_back(std::move(result.message));
}

} // namespace framing
