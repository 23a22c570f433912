#ifndef FILECHAT_TEXT_UTILS_H
#define FILECHAT_TEXT_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>

// UTF-8 helpers and the display width heuristic. All strings are UTF-8.

// Replacement character emitted for malformed input
constexpr const char* kUtf8Replacement = "\xEF\xBF\xBD";

/**
 * @brief Decodes one code point starting at pos.
 * @return Number of bytes consumed, or 0 if the sequence at pos is malformed
 *         (truncated, overlong, surrogate or out of range).
 */
size_t utf8_decode(const std::string& s, size_t pos, uint32_t& code_point);

// Copy of s with every malformed sequence replaced by U+FFFD
std::string utf8_sanitize(const std::string& s);

size_t utf8_length(const std::string& s);

// Removes the last code point. No-op on an empty string.
void utf8_pop_back(std::string& s);

// Last `count` code points of s
std::string utf8_tail(const std::string& s, size_t count);

// Longest prefix of s not exceeding max_bytes that does not split a sequence
std::string utf8_truncate_bytes(const std::string& s, size_t max_bytes);

/**
 * @brief Estimated on-screen width: code points above U+007F count as two
 * columns, everything else as one. Malformed bytes count as one column each.
 */
size_t display_width(const std::string& s);

// True for ASCII and Unicode whitespace (U+00A0, U+3000, ...)
bool is_space_code_point(uint32_t cp);

// Strips leading and trailing whitespace as defined by is_space_code_point
std::string trim_copy(const std::string& s);

#endif // FILECHAT_TEXT_UTILS_H
