#ifndef MCPVISOR_FRAMING_HPP
#define MCPVISOR_FRAMING_HPP

// Message framing for JSON-RPC over byte streams.
// Two framings are supported:
//  - NDJSON: one JSON value per line.
//  - LSP: "Content-Length: <n>\r\n\r\n<n bytes of JSON>".
// The decoder detects the framing from the first inbound bytes and keeps it for the
// lifetime of the channel; writers should answer with the same framing.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace framing {

using json = nlohmann::json;

enum class Framing {
    unknown,
    ndjson,
    lsp,
};

// "ndjson", "lsp" or "unknown".
const char *framing_name(Framing value);

// Parse "ndjson" or "lsp" (case-insensitive). Anything else yields Framing::unknown.
Framing parse_framing(const std::string &text);

// Serialize one message. Framing::unknown encodes as NDJSON.
// Strings holding invalid UTF-8 are written with U+FFFD replacements.
std::string encode_message(const json &message, Framing value);

// Outcome of parsing a single frame payload.
struct DecodeResult {
    bool success = false;
    json message;
    std::string error_message;
};

// Parse the payload of one frame (a trimmed NDJSON line or an LSP body).
DecodeResult decode_payload(const std::string &payload);

// Incremental decoder for one inbound channel.
// Malformed payloads are logged and discarded; they never stop the stream.
class FrameDecoder {
public:
    // Appends bytes and returns every message completed by them, in stream order.
    std::vector<json> feed(const std::string &bytes);

    // End of stream. Returns a trailing unterminated NDJSON line if it holds a message.
    // A partial LSP frame is dropped.
    std::vector<json> finish();

    // The detected framing, or Framing::unknown before the first meaningful bytes.
    Framing framing() const { return detected_framing_; }

    // Number of payloads discarded because they were not valid JSON.
    std::size_t discarded_count() const { return discarded_count_; }

    // Bytes held waiting for the rest of a frame.
    std::size_t buffered_bytes() const { return buffer_.size(); }

private:
    void detect();
    void drain_ndjson(std::vector<json> &messages);
    void drain_lsp(std::vector<json> &messages);
    void accept_payload(const std::string &payload, std::vector<json> &messages);

    Framing detected_framing_ = Framing::unknown;
    std::string buffer_;
    std::size_t discarded_count_ = 0;
};

} // namespace framing

#endif // MCPVISOR_FRAMING_HPP
