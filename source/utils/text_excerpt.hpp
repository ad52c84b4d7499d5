#ifndef MCPVISOR_TEXT_EXCERPT_HPP
#define MCPVISOR_TEXT_EXCERPT_HPP

// Bounded, printable excerpts of wire payloads for log lines.

#include <cstddef>
#include <string>

namespace text_excerpt {

// Maximum excerpt length used by the transport logs.
constexpr std::size_t kDefaultExcerptBytes = 200;

// Replaces invalid UTF-8 sequences with U+FFFD and control characters (CR, LF, TAB, ...)
// with their escaped spelling, then truncates to at most max_bytes without splitting a
// multibyte character. A truncated excerpt ends with "...".
std::string excerpt(const std::string &text, std::size_t max_bytes = kDefaultExcerptBytes);

} // namespace text_excerpt

#endif // MCPVISOR_TEXT_EXCERPT_HPP
