#ifndef PLAINCFG_UTIL_HPP
#define PLAINCFG_UTIL_HPP

#include "plaincfg/Value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace plaincfg {

// RFC 4648 Base32, uppercase alphabet, '=' padded.
std::string base32_encode(const Bytes& data);

// Strict decode: uppercase alphabet only, length a multiple of 8, valid
// padding. Throws EncodingError.
Bytes base32_decode(std::string_view text);

// RFC 4648 Base64, standard alphabet, '=' padded.
std::string base64_encode(const Bytes& data);

// Strict decode, throws EncodingError on foreign characters or bad padding.
Bytes base64_decode(std::string_view text);

// UTF-8 helpers. Code points outside U+0000..U+10FFFF, surrogates, and
// overlong forms are invalid.
bool is_valid_utf8(std::string_view s);

// Decode to code points. Throws EncodingError on invalid input.
std::u32string utf8_decode(std::string_view s);

// Append the UTF-8 form of `cp` to `out`.
void append_utf8(std::string& out, char32_t cp);

// Byte offsets of each code point start, plus s.size() as the last element.
// Invalid sequences count one byte per code point.
std::vector<std::size_t> utf8_offsets(std::string_view s);

// Number of code points (invalid bytes count as one each).
std::size_t utf8_length(std::string_view s);

// Split a UTF-8 string into its characters.
std::vector<std::string> utf8_chars(std::string_view s);

// C0 controls, DEL and C1 controls.
bool is_control(char32_t cp);

// Control characters other than tab, CR and LF.
bool is_control_but_tab_cr_lf(char32_t cp);

// Trim ASCII whitespace from both ends.
std::string_view trim(std::string_view s);

// Remove trailing '\n' and '\r' characters only.
std::string_view strip_line_terminator(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

} // namespace plaincfg

#endif // PLAINCFG_UTIL_HPP
