/**
 * @file Renderer.cpp
 * @brief Key line rendering and long value wrapping
 */

#include "plaincfg/Renderer.hpp"
#include "plaincfg/Options.hpp"
#include "plaincfg/Util.hpp"

#include <algorithm>

namespace plaincfg {

namespace {

// Preferred places to cut a wrapped payload
bool is_break_char(char c) {
    switch (c) {
        case ' ': case ']': case ')': case '}': case ',':
        case ';': case '-': case '+': case '\n': case '\t':
            return true;
        default:
            return false;
    }
}

std::string single_line(std::string_view key, std::string_view modifier,
                        std::string_view payload) {
    std::string line(key);
    if (!modifier.empty()) {
        line += '/';
        line.append(modifier);
    }
    line += '=';
    line.append(payload);
    line += '\n';
    return line;
}

} // anonymous namespace

const std::vector<std::string>& default_continuation_chars() {
    static const std::vector<std::string> chars =
        utf8_chars(u8"\\|⤸;↓↘→⟶⇒⇨⇩▼▽◢◣⤵║│┃┆┇┊┋∣⎟⎢⎥");
    return chars;
}

std::string pick_continuation_char(std::string_view payload,
                                   const std::vector<std::string>& continuation_chars) {
    for (const auto& c : continuation_chars) {
        // One code point that cannot end or split a line
        if (!is_valid_utf8(c) || utf8_length(c) != 1 || c == "=" || c == "\r" || c == "\n") {
            continue;
        }
        if (payload.find(c) == std::string_view::npos) {
            return c;
        }
    }
    return {};
}

std::vector<std::string> render_line(std::string_view key,
                                     std::string_view modifier,
                                     std::string_view payload,
                                     std::size_t max_width,
                                     const std::vector<std::string>& continuation_chars,
                                     const DiagnosticSink& diagnostics) {
    const std::vector<std::size_t> offsets = utf8_offsets(payload);
    const std::size_t payload_len = offsets.size() - 1;

    if (max_width == 0 ||
        utf8_length(key) + utf8_length(modifier) + payload_len + 2 < max_width) {
        return {single_line(key, modifier, payload)};
    }

    const std::string cont = pick_continuation_char(payload, continuation_chars);
    if (cont.empty()) {
        Diagnostic d;
        d.severity = Severity::Error;
        d.message = "cannot split value of key '" + std::string(key) +
                    "': every continuation character occurs in it";
        report(diagnostics, std::move(d));
        return {single_line(key, modifier, payload)};
    }

    const std::string full_modifier = "/C" + cont + std::string(modifier);
    std::size_t prefix = utf8_length(key) + utf8_length(full_modifier) + 2;

    std::vector<std::string> lines;
    std::string current(key);
    current += full_modifier;
    current += '=';

    std::size_t start = 0;
    while (start < payload_len && prefix + (payload_len - start) > max_width) {
        std::size_t cut = std::max<std::size_t>(max_width > prefix ? max_width - prefix : 0, 2);

        // Prefer cutting before a separator in the last quarter of the segment
        const std::size_t low = cut * 3 / 4;
        if (cut > low && low > 2) {
            for (std::size_t j = cut; j > low; --j) {
                const std::size_t idx = start + j;
                if (idx < payload_len && is_break_char(payload[offsets[idx]])) {
                    cut = j;
                    break;
                }
            }
        }
        cut = std::min(cut, payload_len - start);

        current.append(payload.substr(offsets[start], offsets[start + cut] - offsets[start]));
        current += cont;
        current += '\n';
        lines.push_back(std::move(current));
        current.clear();

        start += cut;
        prefix = 0;
    }

    current.append(payload.substr(offsets[start]));
    current += '\n';
    lines.push_back(std::move(current));
    return lines;
}

} // namespace plaincfg
