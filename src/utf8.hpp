#pragma once
/*
 * Utf8
 *
 * Purpose: decode/encode helpers; buffer columns count code points, storage is UTF-8.
 * Note: invalid bytes decode to U+FFFD and advance one byte, so length() and
 *       decode() always agree on the number of characters.
 */
#include <cstddef>
#include <string>
#include <string_view>

namespace utf8 {

char32_t decode_next(std::string_view s, size_t& i);
void append(std::string& out, char32_t c);
std::string encode(char32_t c);
std::string encode(std::u32string_view s);
std::u32string decode(std::string_view s);
size_t length(std::string_view s);
/* byte offset of the idx-th character; clamps to s.size() */
size_t byte_offset(std::string_view s, size_t idx);
/* characters in s[0, byte) */
size_t char_index(std::string_view s, size_t byte);

}  // namespace utf8
