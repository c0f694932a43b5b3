/**
 * @file Codec.cpp
 * @brief Implementation of modifier encoding and decoding
 */

#include "plaincfg/Codec.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/Literal.hpp"
#include "plaincfg/Util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace plaincfg {

namespace {

const ObjectSerializer& serializer_of(const CodecOptions& options) {
    return options.serializer ? *options.serializer : *default_serializer();
}

Encoded encode_string(const std::string& s) {
    if (!is_valid_utf8(s)) {
        throw EncodingError("Cannot write a string that is not valid UTF-8");
    }
    const std::u32string cps = utf8_decode(s);

    if (std::any_of(cps.begin(), cps.end(), is_control_but_tab_cr_lf)) {
        return {"64s", base64_encode(to_bytes(s))};
    }
    if (std::any_of(cps.begin(), cps.end(), is_control)) {
        return {"r", to_literal(Value(s))};
    }
    return {"", s};
}

/// Text content of a String or Bytes value
std::string text_of(const Value& v, const char* op) {
    if (v.is_string()) return v.as_string();
    if (v.is_bytes()) return bytes_to_string(v.as_bytes());
    throw TypeMismatchError(op, type_name(v));
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::int64_t parse_integer(const std::string& raw) {
    std::string_view text = trim(raw);
    std::string buf;
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            throw FormatError("Invalid literal for integer: '" + raw + "'");
        }
    }
    buf.assign(text.begin(), text.end());

    std::int64_t result = 0;
    const auto res = std::from_chars(buf.data(), buf.data() + buf.size(), result);
    if (res.ec == std::errc::result_out_of_range) {
        throw FormatError("Integer out of range: '" + raw + "'");
    }
    if (buf.empty() || res.ec != std::errc() || res.ptr != buf.data() + buf.size()) {
        throw FormatError("Invalid literal for integer: '" + raw + "'");
    }
    return result;
}

double parse_double(const std::string& raw) {
    std::string_view text = trim(raw);
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    const std::string word = lower(text);
    if (word == "inf" || word == "infinity") return negative ? -HUGE_VAL : HUGE_VAL;
    if (word == "nan") return std::nan("");

    // Exactly one optional sign
    if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text.front())) || text.front() == '.')) {
        throw FormatError("Could not convert string to float: '" + raw + "'");
    }

    double result = 0.0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), result);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        throw FormatError("Could not convert string to float: '" + raw + "'");
    }
    return negative ? -result : result;
}

Value apply_deserialize(const Value& current, const CodecOptions& options) {
    if (options.safe) {
        throw UnsafeOperationError();
    }
    Bytes data;
    if (current.is_bytes()) {
        data = current.as_bytes();
    } else if (current.is_string()) {
        data = to_bytes(current.as_string());
    } else {
        throw TypeMismatchError("p", type_name(current));
    }

    try {
        return serializer_of(options).deserialize(data);
    } catch (const DecodeError&) {
        throw;
    } catch (const std::exception& e) {
        throw FormatError(std::string("Opaque deserialization failed: ") + e.what());
    }
}

} // anonymous namespace

Encoded encode_value(const Value& value, const CodecOptions& options) {
    switch (value.kind()) {
        case Value::Kind::String:
            return encode_string(value.as_string());
        case Value::Kind::Boolean:
        case Value::Kind::Null:
            return {"r", to_literal(value)};
        case Value::Kind::Integer:
            return {"i", std::to_string(value.as_int())};
        case Value::Kind::Float:
            return {"f", format_float(value.as_float())};
        case Value::Kind::Bytes:
            return {"32", base32_encode(value.as_bytes())};
        case Value::Kind::Tuple:
        case Value::Kind::List:
        case Value::Kind::Set:
        case Value::Kind::Dict:
            if (is_literal_safe(value)) {
                return {"r", to_literal(value)};
            }
            break;
        case Value::Kind::Opaque:
            break;
    }

    if (options.safe) {
        throw UnsafeValueError(type_name(value));
    }
    return {"64p", base64_encode(serializer_of(options).serialize(value))};
}

Value decode_value(std::string_view modifier, std::string payload, const CodecOptions& options) {
    Value current(std::move(payload));

    std::size_t i = 0;
    while (i < modifier.size()) {
        const std::string_view rest = modifier.substr(i);

        if (starts_with(rest, "32")) {
            current = Value(base32_decode(text_of(current, "32")));
            i += 2;
            continue;
        }
        if (starts_with(rest, "64")) {
            current = Value(base64_decode(text_of(current, "64")));
            i += 2;
            continue;
        }

        switch (rest.front()) {
            case 'p':
                current = apply_deserialize(current, options);
                break;
            case 's':
                if (current.is_bytes()) {
                    std::string s = bytes_to_string(current.as_bytes());
                    if (!is_valid_utf8(s)) {
                        throw EncodingError("Bytes are not valid UTF-8");
                    }
                    current = Value(std::move(s));
                } else if (current.is_integer()) {
                    current = Value(std::to_string(current.as_int()));
                } else {
                    throw TypeMismatchError("s", type_name(current));
                }
                break;
            case 'b':
                if (!current.is_string()) {
                    throw TypeMismatchError("b", type_name(current));
                }
                current = Value(to_bytes(current.as_string()));
                break;
            case 'i':
                current = Value(parse_integer(text_of(current, "i")));
                break;
            case 'f':
                current = Value(parse_double(text_of(current, "f")));
                break;
            case 'r':
                current = parse_literal(text_of(current, "r"));
                break;
            default:
                throw UnknownModifierError(std::string(rest));
        }
        ++i;
    }
    if (current.is_string() && !is_valid_utf8(current.as_string())) {
        throw EncodingError("Value is not valid UTF-8");
    }
    return current;
}

} // namespace plaincfg
