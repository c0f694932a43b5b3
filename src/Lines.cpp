/**
 * @file Lines.cpp
 * @brief In-memory and stream line sources/sinks
 */

#include "plaincfg/Lines.hpp"

#include <istream>
#include <ostream>

namespace plaincfg {

VectorLineSource VectorLineSource::from_text(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return VectorLineSource(std::move(lines));
}

bool VectorLineSource::next(std::string& line) {
    if (pos_ >= lines_.size()) return false;
    line = lines_[pos_++];
    return true;
}

bool StreamLineSource::next(std::string& line) {
    if (!std::getline(in_, line)) return false;
    // getline drops the '\n'; put it back unless the stream ended first
    if (!in_.eof()) line += '\n';
    return true;
}

void StreamLineSink::write(std::string_view text) {
    out_ << text;
}

} // namespace plaincfg
