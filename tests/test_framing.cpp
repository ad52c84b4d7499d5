// Tests for NDJSON / LSP framing: encoding, detection and reassembly of split streams.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "protocol/framing.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_excerpt.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using test_support::report;

namespace test_framing {

static std::vector<json> sample_messages() {
    return {
        json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}},
        json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
             {"params", {{"name", "echo"}, {"arguments", {{"message", "héllo\nworld"}}}}}},
        json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
    };
}

static std::string encode_all(const std::vector<json> &messages, framing::Framing value) {
    std::string stream;
    for (const auto &message : messages) {
        stream += framing::encode_message(message, value);
    }
    return stream;
}

// Test: NDJSON stream delivered in one chunk decodes every message.
static bool test_ndjson_single_chunk() {
    framing::FrameDecoder decoder;
    std::vector<json> decoded = decoder.feed(encode_all(sample_messages(), framing::Framing::ndjson));
    bool success = decoded == sample_messages() && decoder.framing() == framing::Framing::ndjson;
    return report(success, "NDJSON single chunk decodes all messages",
                  "decoded " + std::to_string(decoded.size()));
}

// Test: every two-way split of an NDJSON stream gives the single-chunk result.
static bool test_ndjson_arbitrary_splits() {
    std::string stream = encode_all(sample_messages(), framing::Framing::ndjson);
    for (std::size_t split = 0; split <= stream.size(); ++split) {
        framing::FrameDecoder decoder;
        std::vector<json> decoded = decoder.feed(stream.substr(0, split));
        std::vector<json> rest = decoder.feed(stream.substr(split));
        decoded.insert(decoded.end(), rest.begin(), rest.end());
        if (decoded != sample_messages()) {
            return report(false, "NDJSON split at any offset reassembles", "split=" + std::to_string(split));
        }
    }
    return report(true, "NDJSON split at any offset reassembles");
}

// Test: byte-at-a-time delivery.
static bool test_ndjson_byte_by_byte() {
    std::string stream = encode_all(sample_messages(), framing::Framing::ndjson);
    framing::FrameDecoder decoder;
    std::vector<json> decoded;
    for (char character : stream) {
        std::vector<json> part = decoder.feed(std::string(1, character));
        decoded.insert(decoded.end(), part.begin(), part.end());
    }
    return report(decoded == sample_messages(), "NDJSON byte-by-byte reassembles");
}

// Test: blank lines, CRLF endings and surrounding whitespace are tolerated.
static bool test_ndjson_blank_lines_and_crlf() {
    framing::FrameDecoder decoder;
    std::vector<json> decoded = decoder.feed("\n\n  {\"a\":1}  \r\n\n{\"b\":2}\r\n");
    bool success = decoded.size() == 2 && decoded[0] == json{{"a", 1}} && decoded[1] == json{{"b", 2}} &&
                   decoder.framing() == framing::Framing::ndjson;
    return report(success, "NDJSON skips blank lines and trims CRLF");
}

// Test: a malformed line is discarded and the stream continues.
static bool test_ndjson_malformed_line_discarded() {
    framing::FrameDecoder decoder;
    std::vector<json> decoded = decoder.feed("{\"a\":1}\n{not json\n{\"b\":2}\n");
    bool success = decoded.size() == 2 && decoded[1] == json{{"b", 2}} && decoder.discarded_count() == 1;
    return report(success, "NDJSON malformed line is discarded, later lines decode");
}

// Test: an unterminated last line is delivered by finish().
static bool test_ndjson_tail_flushed() {
    framing::FrameDecoder decoder;
    std::vector<json> first = decoder.feed("{\"a\":1}\n{\"b\":2}");
    std::vector<json> tail = decoder.finish();
    bool success = first.size() == 1 && tail.size() == 1 && tail[0] == json{{"b", 2}} &&
                   decoder.buffered_bytes() == 0;
    return report(success, "NDJSON tail is flushed at end of stream");
}

// Test: the LSP header counts bytes, not characters.
static bool test_lsp_encode_byte_length() {
    json message = {{"text", "héllo"}};
    std::string body = message.dump();
    std::string encoded = framing::encode_message(message, framing::Framing::lsp);
    std::string expected = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    bool success = encoded == expected && body.size() == 17;
    return report(success, "LSP encoding uses the UTF-8 byte length", encoded);
}

// Test: an LSP frame split at any offset (header or body) yields the message exactly once.
static bool test_lsp_arbitrary_splits() {
    json message = sample_messages()[1];
    std::string frame = framing::encode_message(message, framing::Framing::lsp);
    for (std::size_t split = 0; split <= frame.size(); ++split) {
        framing::FrameDecoder decoder;
        std::vector<json> decoded = decoder.feed(frame.substr(0, split));
        std::vector<json> rest = decoder.feed(frame.substr(split));
        decoded.insert(decoded.end(), rest.begin(), rest.end());
        std::vector<json> tail = decoder.finish();
        decoded.insert(decoded.end(), tail.begin(), tail.end());
        if (decoded.size() != 1 || decoded[0] != message || decoder.framing() != framing::Framing::lsp) {
            return report(false, "LSP split at any offset yields the message once",
                          "split=" + std::to_string(split) + " count=" + std::to_string(decoded.size()));
        }
    }
    return report(true, "LSP split at any offset yields the message once");
}

// Test: pipelined frames in one chunk.
static bool test_lsp_pipelined_frames() {
    framing::FrameDecoder decoder;
    std::vector<json> decoded = decoder.feed(encode_all(sample_messages(), framing::Framing::lsp));
    return report(decoded == sample_messages(), "LSP pipelined frames decode in order");
}

// Test: the header name is matched case-insensitively, with optional spaces.
static bool test_lsp_header_case_insensitive() {
    framing::FrameDecoder decoder;
    std::string body = "{\"ok\":true}";
    std::vector<json> decoded =
        decoder.feed("content-length:" + std::to_string(body.size()) + "\r\n\r\n" + body);
    bool success = decoded.size() == 1 && decoded[0] == json{{"ok", true}};
    return report(success, "LSP Content-Length header is case-insensitive");
}

// Test: a header block without Content-Length is dropped and scanning continues.
static bool test_lsp_header_without_length_dropped() {
    framing::FrameDecoder decoder;
    std::string stream = "X-Trace: 1\r\n\r\n" + framing::encode_message(json{{"id", 9}}, framing::Framing::lsp);
    std::vector<json> decoded = decoder.feed(stream);
    bool success = decoder.framing() == framing::Framing::lsp && decoded.size() == 1 &&
                   decoded[0] == json{{"id", 9}};
    return report(success, "LSP header chunk without Content-Length is skipped");
}

// Test: a partial LSP frame at end of stream is dropped quietly.
static bool test_lsp_partial_frame_dropped() {
    framing::FrameDecoder decoder;
    std::vector<json> decoded = decoder.feed("Content-Length: 50\r\n\r\n{\"id\":");
    std::vector<json> tail = decoder.finish();
    bool success = decoded.empty() && tail.empty() && decoder.discarded_count() == 0;
    return report(success, "LSP partial frame at end of stream is dropped");
}

// Test: an invalid LSP body is discarded; the next frame still decodes.
static bool test_lsp_invalid_body_discarded() {
    framing::FrameDecoder decoder;
    std::string stream = "Content-Length: 5\r\n\r\n{oops" +
                         framing::encode_message(json{{"id", 3}}, framing::Framing::lsp);
    std::vector<json> decoded = decoder.feed(stream);
    bool success = decoded.size() == 1 && decoded[0] == json{{"id", 3}} && decoder.discarded_count() == 1;
    return report(success, "LSP invalid body is discarded");
}

// Test: the framing is fixed by the first bytes.
static bool test_detection_is_sticky() {
    framing::FrameDecoder decoder;
    decoder.feed("{\"a\":1}\n");
    // Looks like an LSP header, but the channel is already NDJSON: treated as a bad line.
    std::vector<json> decoded = decoder.feed("Content-Length: 2\r\n\r\n{}\n");
    bool success = decoder.framing() == framing::Framing::ndjson && decoded.size() == 1 &&
                   decoded[0] == json::object();
    return report(success, "Framing stays fixed after detection");
}

// Test: whitespace alone does not decide the framing.
static bool test_detection_waits_for_content() {
    framing::FrameDecoder decoder;
    decoder.feed("  \n");
    bool undecided = decoder.framing() == framing::Framing::unknown;
    decoder.feed("Content-Len");
    bool still_undecided = decoder.framing() == framing::Framing::unknown;
    decoder.feed("gth: 2\r\n\r\n{}");
    bool success = undecided && still_undecided && decoder.framing() == framing::Framing::lsp;
    return report(success, "Detection waits past whitespace and partial headers");
}

// Test: framing names parse both ways.
static bool test_framing_names() {
    bool success = framing::parse_framing("NDJSON") == framing::Framing::ndjson &&
                   framing::parse_framing(" lsp ") == framing::Framing::lsp &&
                   framing::parse_framing("xml") == framing::Framing::unknown &&
                   std::string(framing::framing_name(framing::Framing::lsp)) == "lsp";
    return report(success, "Framing names parse and print");
}

// Test: invalid UTF-8 in a string is replaced rather than throwing.
static bool test_encode_invalid_utf8() {
    json message = {{"text", std::string("bad\xff")}};
    std::string encoded = framing::encode_message(message, framing::Framing::ndjson);
    bool success = encoded.find("\xEF\xBF\xBD") != std::string::npos && encoded.back() == '\n';
    return report(success, "Invalid UTF-8 is encoded with replacement characters");
}

// Test: decode_payload reports failures instead of throwing.
static bool test_decode_payload_result() {
    framing::DecodeResult good = framing::decode_payload("[1,2]");
    framing::DecodeResult bad = framing::decode_payload("[1,");
    bool success = good.success && good.message == json::array({1, 2}) && !bad.success &&
                   !bad.error_message.empty();
    return report(success, "decode_payload returns a result for good and bad input");
}

// Test: log excerpts escape control characters and truncate on character boundaries.
static bool test_text_excerpt() {
    std::string escaped = text_excerpt::excerpt("a\r\nb\tc");
    std::string replaced = text_excerpt::excerpt(std::string("x\xC3"));
    std::string truncated = text_excerpt::excerpt("\xC3\xA9\xC3\xA9\xC3\xA9", 5);
    bool success = escaped == "a\\r\\nb\\tc" && replaced == "x\xEF\xBF\xBD" && truncated == "\xC3\xA9\xC3\xA9...";
    return report(success, "Excerpts escape controls and truncate on character boundaries", escaped);
}

// Test: log level names parse case-insensitively, falling back to info.
static bool test_log_levels() {
    bool success = debug_log::parse_level("DEBUG") == debug_log::Level::debug &&
                   debug_log::parse_level("warn") == debug_log::Level::warn &&
                   debug_log::parse_level("verbose") == debug_log::Level::info &&
                   std::string(debug_log::level_name(debug_log::Level::error)) == "error";
    return report(success, "Log levels parse and print");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_ndjson_single_chunk();
    all_passed &= test_ndjson_arbitrary_splits();
    all_passed &= test_ndjson_byte_by_byte();
    all_passed &= test_ndjson_blank_lines_and_crlf();
    all_passed &= test_ndjson_malformed_line_discarded();
    all_passed &= test_ndjson_tail_flushed();
    all_passed &= test_lsp_encode_byte_length();
    all_passed &= test_lsp_arbitrary_splits();
    all_passed &= test_lsp_pipelined_frames();
    all_passed &= test_lsp_header_case_insensitive();
    all_passed &= test_lsp_header_without_length_dropped();
    all_passed &= test_lsp_partial_frame_dropped();
    all_passed &= test_lsp_invalid_body_discarded();
    all_passed &= test_detection_is_sticky();
    all_passed &= test_detection_waits_for_content();
    all_passed &= test_framing_names();
    all_passed &= test_encode_invalid_utf8();
    all_passed &= test_decode_payload_result();
    all_passed &= test_text_excerpt();
    all_passed &= test_log_levels();
    return all_passed;
}

} // namespace test_framing
