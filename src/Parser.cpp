/**
 * @file Parser.cpp
 * @brief Line parser implementation
 */

#include "plaincfg/Parser.hpp"
#include "plaincfg/Codec.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/Util.hpp"

namespace plaincfg {

ReadResult LineParser::parse(LineSource& source) {
    ReadResult out;
    line_number_ = 0;

    std::string raw;
    while (source.next(raw)) {
        ++line_number_;
        parse_line(source, std::move(raw), out);
        raw.clear();
    }
    return out;
}

void LineParser::warn(Severity severity, const std::string& message, std::string_view line) const {
    Diagnostic d;
    d.severity = severity;
    d.message = message;
    d.source = options_.source_name;
    d.line_number = line_number_;
    d.raw_line = std::string(line);
    report(options_.diagnostics, std::move(d));
}

void LineParser::parse_line(LineSource& source, std::string raw, ReadResult& out) {
    using Kind = StructureEntry::Kind;

    const std::string line(strip_line_terminator(raw));
    const std::string_view trimmed = trim(line);

    // Comments and blank lines never reach the mapping
    if (trimmed.empty() || trimmed.front() == '#') {
        out.structure.push_back(StructureEntry(Kind::Comment, {}, {}, std::move(raw)));
        return;
    }

    const std::size_t eq = line.find('=');
    if (eq == std::string::npos) {
        warn(Severity::Warning, "ignored line without '='", line);
        out.structure.push_back(StructureEntry(Kind::Invalid, {}, {}, std::move(raw)));
        return;
    }

    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    std::string modifier;
    const std::size_t slash = key.find('/');
    if (slash != std::string::npos) {
        modifier = key.substr(slash + 1);
        key.resize(slash);
    }

    std::string_view chain = modifier;
    const std::size_t first_line = line_number_;

    // Continuation is undone before any other operation
    if (starts_with(chain, "C")) {
        chain.remove_prefix(1);
        if (chain.empty()) {
            warn(Severity::Warning, "continuation modifier without a character", line);
            out.structure.push_back(StructureEntry(Kind::Invalid, {}, {}, std::move(raw)));
            return;
        }
        const std::size_t len = utf8_offsets(chain)[1];
        const std::string cont(chain.substr(0, len));
        chain.remove_prefix(len);

        while (ends_with(value, cont)) {
            std::string next;
            if (!source.next(next)) {
                throw UnexpectedEndOfInput(options_.source_name, first_line);
            }
            ++line_number_;
            raw += next;
            value.resize(value.size() - cont.size());
            value.append(strip_line_terminator(next));
        }
    }

    try {
        if (!is_valid_utf8(key)) {
            throw EncodingError("Key is not valid UTF-8");
        }
        Value decoded = decode_value(chain, std::move(value), options_);
        out.data[key] = std::move(decoded);
        out.structure.push_back(StructureEntry(Kind::Key, std::move(key), {}, std::move(raw)));
        return;
    } catch (const UnknownModifierError& e) {
        warn(Severity::Error, std::string("error parsing line modifiers: ") + e.what(), line);
    } catch (const UnsafeOperationError&) {
        warn(Severity::Error, "cannot read '" + key + "': opaque values are refused in safe mode", line);
    } catch (const DecodeError& e) {
        warn(Severity::Error, "error parsing '" + key + "': " + e.what(), line);
    }
    out.structure.push_back(StructureEntry(Kind::Invalid, {}, {}, std::move(raw)));
}

ReadResult read_config(LineSource& source, const ReadOptions& options) {
    return LineParser(options).parse(source);
}

ReadResult read_config_string(std::string_view text, const ReadOptions& options) {
    VectorLineSource source = VectorLineSource::from_text(text);
    return read_config(source, options);
}

} // namespace plaincfg
