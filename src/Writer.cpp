/**
 * @file Writer.cpp
 * @brief Structure-preserving writer
 */

#include "plaincfg/Writer.hpp"
#include "plaincfg/Codec.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/Renderer.hpp"
#include "plaincfg/Util.hpp"

namespace plaincfg {

namespace {

void append_lines(std::vector<std::string>& out, std::vector<std::string> lines) {
    for (auto& l : lines) out.push_back(std::move(l));
}

void append_verbatim(std::vector<std::string>& out, const std::string& raw) {
    // A final line read without terminator must not run into the next one
    if (!raw.empty() && raw.back() != '\n') {
        out.push_back(raw + "\n");
    } else {
        out.push_back(raw);
    }
}

std::vector<std::string> render_key(const std::string& key, const Value& value,
                                    const WriteOptions& options) {
    const Encoded enc = encode_value(value, options);
    return render_line(key, enc.modifier, enc.payload, options.max_width,
                       options.continuation_chars, options.diagnostics);
}

} // anonymous namespace

void validate_key(std::string_view key) {
    if (key.find('=') != std::string_view::npos) {
        throw InvalidKeyError(std::string(key), "contains '='");
    }
    if (key.find('/') != std::string_view::npos) {
        throw InvalidKeyError(std::string(key), "contains '/'");
    }
    if (key.find_first_of("\r\n") != std::string_view::npos) {
        throw InvalidKeyError(std::string(key), "contains a line break");
    }
    const std::string_view trimmed = trim(key);
    if (!trimmed.empty() && trimmed.front() == '#') {
        throw InvalidKeyError(std::string(key), "would be read back as a comment");
    }
}

std::vector<std::string> render_config(const Mapping& data,
                                       const Structure& structure,
                                       const WriteOptions& options) {
    for (const auto& kv : data) {
        validate_key(kv.first);
    }

    Mapping pending = data;
    std::vector<std::string> out;

    for (const auto& entry : structure) {
        switch (entry.kind()) {
            case StructureEntry::Kind::Key: {
                auto it = pending.find(entry.key());
                if (it != pending.end()) {
                    append_lines(out, render_key(it->first, it->second, options));
                    pending.erase(it);
                } else if (options.rewrite_old) {
                    append_verbatim(out, entry.raw());
                }
                break;
            }
            case StructureEntry::Kind::Comment:
                append_verbatim(out, entry.raw());
                break;
            case StructureEntry::Kind::Invalid:
                break;
        }
    }

    for (const auto& kv : pending) {
        append_lines(out, render_key(kv.first, kv.second, options));
    }
    return out;
}

void write_config(const Mapping& data, const Structure& structure, LineSink& sink,
                  const WriteOptions& options) {
    for (const auto& line : render_config(data, structure, options)) {
        sink.write(line);
    }
}

std::string write_config_string(const Mapping& data, const Structure& structure,
                                const WriteOptions& options) {
    StringLineSink sink;
    write_config(data, structure, sink, options);
    return sink.str();
}

} // namespace plaincfg
