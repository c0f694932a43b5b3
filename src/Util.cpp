#include "plaincfg/Util.hpp"
#include "plaincfg/Errors.hpp"

#include <algorithm>
#include <array>

namespace plaincfg {

namespace {

constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base32_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Length of the UTF-8 sequence at s[i], or 0 if invalid.
std::size_t utf8_sequence_length(std::string_view s, std::size_t i, char32_t* out) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        if (out) *out = b0;
        return 1;
    }

    std::size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else return 0;

    if (i + len > s.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    if (out) *out = cp;
    return len;
}

} // anonymous namespace

// ============================================================================
// Base32
// ============================================================================

std::string base32_encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() + 4) / 5 * 8);

    std::size_t i = 0;
    while (i < data.size()) {
        std::array<std::uint8_t, 5> block{};
        const std::size_t n = std::min<std::size_t>(5, data.size() - i);
        for (std::size_t k = 0; k < n; ++k) block[k] = data[i + k];
        i += n;

        std::uint64_t bits = 0;
        for (auto b : block) bits = (bits << 8) | b;

        // Characters carrying data for 1..5 input bytes
        static constexpr std::size_t kChars[] = {0, 2, 4, 5, 7, 8};
        for (std::size_t k = 0; k < 8; ++k) {
            if (k < kChars[n]) {
                out += kBase32Alphabet[(bits >> (35 - 5 * k)) & 0x1F];
            } else {
                out += '=';
            }
        }
    }
    return out;
}

Bytes base32_decode(std::string_view text) {
    if (text.size() % 8 != 0) {
        throw EncodingError("Base32 input length must be a multiple of 8");
    }

    Bytes out;
    out.reserve(text.size() / 8 * 5);

    for (std::size_t i = 0; i < text.size(); i += 8) {
        const std::string_view block = text.substr(i, 8);
        const std::size_t data_chars = block.find('=') == std::string_view::npos
            ? 8 : block.find('=');

        for (std::size_t k = data_chars; k < 8; ++k) {
            if (block[k] != '=') throw EncodingError("Base32 padding is not at the end");
        }
        if (data_chars < 8 && i + 8 != text.size()) {
            throw EncodingError("Base32 padding before end of input");
        }

        std::size_t nbytes = 0;
        switch (data_chars) {
            case 8: nbytes = 5; break;
            case 7: nbytes = 4; break;
            case 5: nbytes = 3; break;
            case 4: nbytes = 2; break;
            case 2: nbytes = 1; break;
            default: throw EncodingError("Incorrect Base32 padding");
        }

        std::uint64_t bits = 0;
        for (std::size_t k = 0; k < 8; ++k) {
            int v = 0;
            if (k < data_chars) {
                v = base32_index(block[k]);
                if (v < 0) {
                    throw EncodingError(std::string("Non-base32 character '") + block[k] + "'");
                }
            }
            bits = (bits << 5) | static_cast<std::uint64_t>(v);
        }
        for (std::size_t k = 0; k < nbytes; ++k) {
            out.push_back(static_cast<std::uint8_t>((bits >> (32 - 8 * k)) & 0xFF));
        }
    }
    return out;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += kBase64Alphabet[n & 0x3F];
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t n = data[i] << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Bytes base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        throw EncodingError("Base64 input length must be a multiple of 4");
    }

    Bytes out;
    out.reserve(text.size() / 4 * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        std::size_t pad = 0;
        if (text[i + 3] == '=') pad = (text[i + 2] == '=') ? 2 : 1;
        if (pad && !last) throw EncodingError("Base64 padding before end of input");

        std::uint32_t n = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            int v = 0;
            if (k < 4 - pad) {
                v = base64_index(text[i + k]);
                if (v < 0) {
                    throw EncodingError(std::string("Non-base64 character '") + text[i + k] + "'");
                }
            }
            n = (n << 6) | static_cast<std::uint32_t>(v);
        }

        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }
    return out;
}

// ============================================================================
// UTF-8
// ============================================================================

bool is_valid_utf8(std::string_view s) {
    for (std::size_t i = 0; i < s.size();) {
        const std::size_t len = utf8_sequence_length(s, i, nullptr);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::u32string utf8_decode(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size();) {
        char32_t cp = 0;
        const std::size_t len = utf8_sequence_length(s, i, &cp);
        if (len == 0) {
            throw EncodingError("Invalid UTF-8 sequence at byte " + std::to_string(i));
        }
        out += cp;
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::vector<std::size_t> utf8_offsets(std::string_view s) {
    std::vector<std::size_t> offsets;
    offsets.reserve(s.size() + 1);
    for (std::size_t i = 0; i < s.size();) {
        offsets.push_back(i);
        const std::size_t len = utf8_sequence_length(s, i, nullptr);
        i += len ? len : 1;
    }
    offsets.push_back(s.size());
    return offsets;
}

std::size_t utf8_length(std::string_view s) {
    return utf8_offsets(s).size() - 1;
}

std::vector<std::string> utf8_chars(std::string_view s) {
    const auto offsets = utf8_offsets(s);
    std::vector<std::string> chars;
    chars.reserve(offsets.size() - 1);
    for (std::size_t k = 0; k + 1 < offsets.size(); ++k) {
        chars.emplace_back(s.substr(offsets[k], offsets[k + 1] - offsets[k]));
    }
    return chars;
}

bool is_control(char32_t cp) {
    return cp <= 0x1F || (cp >= 0x7F && cp <= 0x9F);
}

bool is_control_but_tab_cr_lf(char32_t cp) {
    return is_control(cp) && cp != U'\t' && cp != U'\r' && cp != U'\n';
}

// ============================================================================
// String helpers
// ============================================================================

std::string_view trim(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && is_ascii_space(s[start])) ++start;
    std::size_t end = s.size();
    while (end > start && is_ascii_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::string_view strip_line_terminator(std::string_view s) {
    std::size_t end = s.size();
    while (end > 0 && (s[end - 1] == '\n' || s[end - 1] == '\r')) --end;
    return s.substr(0, end);
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace plaincfg
