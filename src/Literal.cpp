/**
 * @file Literal.cpp
 * @brief Literal formatting and the restricted literal parser
 */

#include "plaincfg/Literal.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/Util.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace plaincfg {

// ============================================================================
// Formatting
// ============================================================================

namespace {

void append_hex_escape(std::string& out, unsigned value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\x%02x", value & 0xFFu);
    out += buf;
}

char pick_quote(std::string_view s) {
    const bool has_single = s.find('\'') != std::string_view::npos;
    const bool has_double = s.find('"') != std::string_view::npos;
    return (has_single && !has_double) ? '"' : '\'';
}

std::string string_literal(const std::string& s) {
    const char quote = pick_quote(s);
    std::string out;
    out.reserve(s.size() + 2);
    out += quote;
    for (char32_t cp : utf8_decode(s)) {
        if (cp == static_cast<char32_t>(quote) || cp == U'\\') {
            out += '\\';
            out += static_cast<char>(cp);
        } else if (cp == U'\t') {
            out += "\\t";
        } else if (cp == U'\n') {
            out += "\\n";
        } else if (cp == U'\r') {
            out += "\\r";
        } else if (is_control(cp)) {
            append_hex_escape(out, static_cast<unsigned>(cp));
        } else {
            append_utf8(out, cp);
        }
    }
    out += quote;
    return out;
}

std::string bytes_literal(const Bytes& b) {
    const std::string raw = bytes_to_string(b);
    const char quote = pick_quote(raw);
    std::string out = "b";
    out += quote;
    for (std::uint8_t c : b) {
        if (c == static_cast<std::uint8_t>(quote) || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c == '\t') {
            out += "\\t";
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c < 0x20 || c >= 0x7F) {
            append_hex_escape(out, c);
        } else {
            out += static_cast<char>(c);
        }
    }
    out += quote;
    return out;
}

std::string join_literals(const std::vector<Value>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += to_literal(items[i]);
    }
    return out;
}

} // anonymous namespace

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string s(buf, res.ptr);
    if (s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string to_literal(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            return "None";
        case Value::Kind::Boolean:
            return value.as_bool() ? "True" : "False";
        case Value::Kind::Integer:
            return std::to_string(value.as_int());
        case Value::Kind::Float:
            return format_float(value.as_float());
        case Value::Kind::String:
            return string_literal(value.as_string());
        case Value::Kind::Bytes:
            return bytes_literal(value.as_bytes());
        case Value::Kind::Tuple: {
            const auto& items = value.as_tuple().items;
            return "(" + join_literals(items) + (items.size() == 1 ? ",)" : ")");
        }
        case Value::Kind::List:
            return "[" + join_literals(value.as_list().items) + "]";
        case Value::Kind::Set: {
            const auto& items = value.as_set().items;
            if (items.empty()) return "set()";
            return "{" + join_literals(items) + "}";
        }
        case Value::Kind::Dict: {
            const auto& d = value.as_dict();
            std::string out = "{";
            for (std::size_t i = 0; i < d.size(); ++i) {
                if (i) out += ", ";
                out += to_literal(d.key(i));
                out += ": ";
                out += to_literal(d.value(i));
            }
            return out + "}";
        }
        case Value::Kind::Opaque:
            break;
    }
    throw UnsafeValueError(type_name(value));
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

constexpr int kMaxDepth = 200;

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

class LiteralParser {
public:
    explicit LiteralParser(std::string_view text) : s_(text) {}

    Value parse() {
        Value v = parse_value();
        skip_ws();
        if (pos_ != s_.size()) {
            fail("unexpected text after literal");
        }
        return v;
    }

private:
    std::string_view s_;
    std::size_t pos_ = 0;
    int depth_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw FormatError("Malformed literal at offset " + std::to_string(pos_) + ": " + what);
    }

    bool eof() const { return pos_ >= s_.size(); }
    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < s_.size() ? s_[pos_ + ahead] : '\0';
    }

    void skip_ws() {
        while (!eof()) {
            const char c = s_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
                ++pos_;
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        skip_ws();
        if (peek() != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    bool is_string_start() const {
        const char c = peek();
        if (c == '\'' || c == '"') return true;
        return (c == 'b' || c == 'B') && (peek(1) == '\'' || peek(1) == '"');
    }

    Value parse_value() {
        skip_ws();
        if (eof()) fail("unexpected end of text");

        const char c = peek();
        if (c == '(' || c == '[' || c == '{') {
            if (++depth_ > kMaxDepth) fail("nesting too deep");
            Value v = c == '(' ? parse_paren() : c == '[' ? parse_list() : parse_brace();
            --depth_;
            return v;
        }
        if (is_string_start()) return parse_strings();
        if (c == '+' || c == '-') {
            ++pos_;
            skip_ws();
            return parse_number(c == '-');
        }
        if (is_digit(c) || (c == '.' && is_digit(peek(1)))) return parse_number(false);
        if (is_ident_start(c)) return parse_name();

        fail(std::string("unexpected character '") + c + "'");
    }

    Value parse_name() {
        const std::size_t start = pos_;
        while (!eof() && is_ident_char(s_[pos_])) ++pos_;
        const std::string_view name = s_.substr(start, pos_ - start);

        if (name == "None") return Value();
        if (name == "True") return Value(true);
        if (name == "False") return Value(false);
        if (name == "inf") return Value(HUGE_VAL);
        if (name == "nan") return Value(std::nan(""));
        if (name == "set") {
            expect('(');
            expect(')');
            return Value(Set{});
        }
        pos_ = start;
        fail("name '" + std::string(name) + "' is not a literal");
    }

    Value parse_number(bool negative) {
        if (is_ident_start(peek())) {
            const std::size_t start = pos_;
            while (!eof() && is_ident_char(s_[pos_])) ++pos_;
            const std::string_view name = s_.substr(start, pos_ - start);
            if (name == "inf") return Value(negative ? -HUGE_VAL : HUGE_VAL);
            if (name == "nan") return Value(std::nan(""));
            pos_ = start;
            fail("sign must be followed by a number");
        }

        const std::size_t start = pos_;
        bool is_float = false;
        while (is_digit(peek())) ++pos_;
        if (peek() == '.') {
            is_float = true;
            ++pos_;
            while (is_digit(peek())) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            is_float = true;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!is_digit(peek())) fail("malformed exponent");
            while (is_digit(peek())) ++pos_;
        }
        if (pos_ == start) fail("expected a number");
        if (is_ident_char(peek())) fail("invalid number suffix");

        const std::string_view digits = s_.substr(start, pos_ - start);
        if (is_float) {
            double d = 0.0;
            const auto res = std::from_chars(digits.data(), digits.data() + digits.size(), d);
            if (res.ec != std::errc() || res.ptr != digits.data() + digits.size()) {
                fail("invalid float '" + std::string(digits) + "'");
            }
            return Value(negative ? -d : d);
        }

        if (digits.size() > 1 && digits[0] == '0') {
            fail("leading zeros in integer literals are not permitted");
        }
        const std::string text = (negative ? "-" : "") + std::string(digits);
        std::int64_t i = 0;
        const auto res = std::from_chars(text.data(), text.data() + text.size(), i);
        if (res.ec == std::errc::result_out_of_range) {
            fail("integer '" + text + "' out of range");
        }
        if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
            fail("invalid integer '" + text + "'");
        }
        return Value(i);
    }

    // Adjacent string literals concatenate; str and bytes cannot be mixed.
    Value parse_strings() {
        const bool bytes = peek() == 'b' || peek() == 'B';
        std::string content;
        while (true) {
            const bool this_bytes = peek() == 'b' || peek() == 'B';
            if (this_bytes != bytes) fail("cannot mix bytes and string literals");
            if (this_bytes) ++pos_;
            content += parse_string_token(bytes);
            skip_ws();
            if (!is_string_start()) break;
        }

        if (bytes) return Value(to_bytes(content));
        if (!is_valid_utf8(content)) {
            throw EncodingError("String literal is not valid UTF-8");
        }
        return Value(std::move(content));
    }

    std::string parse_string_token(bool bytes) {
        const char quote = s_[pos_++];
        std::string out;
        while (true) {
            if (eof()) fail("unterminated string literal");
            const char c = s_[pos_++];
            if (c == quote) break;
            if (c == '\n' || c == '\r') fail("line break in string literal");
            if (c == '\\') {
                parse_escape(out, bytes);
                continue;
            }
            if (bytes && static_cast<unsigned char>(c) >= 0x80) {
                fail("bytes literal may only contain ASCII characters");
            }
            out += c;
        }
        return out;
    }

    void append_code(std::string& out, char32_t cp, bool bytes) {
        if (bytes) {
            out += static_cast<char>(cp & 0xFF);
        } else {
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                fail("escape does not name a valid code point");
            }
            append_utf8(out, cp);
        }
    }

    char32_t parse_hex(std::size_t count) {
        char32_t cp = 0;
        for (std::size_t k = 0; k < count; ++k) {
            const int h = hex_value(peek());
            if (h < 0) fail("truncated hex escape");
            cp = (cp << 4) | static_cast<char32_t>(h);
            ++pos_;
        }
        return cp;
    }

    void parse_escape(std::string& out, bool bytes) {
        if (eof()) fail("unterminated string literal");
        const char e = s_[pos_++];
        switch (e) {
            case '\n': return;
            case '\\': out += '\\'; return;
            case '\'': out += '\''; return;
            case '"': out += '"'; return;
            case 'a': out += '\a'; return;
            case 'b': out += '\b'; return;
            case 'f': out += '\f'; return;
            case 'n': out += '\n'; return;
            case 'r': out += '\r'; return;
            case 't': out += '\t'; return;
            case 'v': out += '\v'; return;
            case 'x': append_code(out, parse_hex(2), bytes); return;
            default: break;
        }

        if (e >= '0' && e <= '7') {
            char32_t cp = static_cast<char32_t>(e - '0');
            for (int k = 0; k < 2 && peek() >= '0' && peek() <= '7'; ++k) {
                cp = cp * 8 + static_cast<char32_t>(peek() - '0');
                ++pos_;
            }
            append_code(out, cp, bytes);
            return;
        }
        if (!bytes && e == 'u') {
            append_code(out, parse_hex(4), bytes);
            return;
        }
        if (!bytes && e == 'U') {
            append_code(out, parse_hex(8), bytes);
            return;
        }
        if (!bytes && e == 'N') {
            fail("named unicode escapes are not supported");
        }
        // Unrecognised escapes are kept as written
        out += '\\';
        out += e;
    }

    Value parse_paren() {
        ++pos_;
        skip_ws();
        if (peek() == ')') {
            ++pos_;
            return Value(Tuple{});
        }

        Value first = parse_value();
        skip_ws();
        if (peek() == ')') {
            ++pos_;
            return first;
        }
        if (peek() != ',') fail("expected ',' or ')'");
        ++pos_;

        Tuple t;
        t.items.push_back(std::move(first));
        parse_sequence_rest(t.items, ')');
        return Value(std::move(t));
    }

    Value parse_list() {
        ++pos_;
        List l;
        skip_ws();
        if (peek() == ']') {
            ++pos_;
            return Value(std::move(l));
        }
        l.items.push_back(parse_value());
        skip_ws();
        if (peek() == ']') {
            ++pos_;
            return Value(std::move(l));
        }
        if (peek() != ',') fail("expected ',' or ']'");
        ++pos_;
        parse_sequence_rest(l.items, ']');
        return Value(std::move(l));
    }

    // After "item ,": more items separated by commas, optional trailing comma.
    void parse_sequence_rest(std::vector<Value>& items, char close) {
        while (true) {
            skip_ws();
            if (peek() == close) {
                ++pos_;
                return;
            }
            items.push_back(parse_value());
            skip_ws();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == close) {
                ++pos_;
                return;
            }
            fail(std::string("expected ',' or '") + close + "'");
        }
    }

    Value parse_brace() {
        ++pos_;
        skip_ws();
        if (peek() == '}') {
            ++pos_;
            return Value(Dict{});
        }

        Value first = parse_value();
        skip_ws();
        if (peek() == ':') {
            ++pos_;
            return parse_dict_rest(std::move(first));
        }

        Set s;
        require_hashable(first);
        s.insert(std::move(first));
        while (true) {
            skip_ws();
            if (peek() == '}') {
                ++pos_;
                break;
            }
            if (peek() != ',') fail("expected ',' or '}'");
            ++pos_;
            skip_ws();
            if (peek() == '}') {
                ++pos_;
                break;
            }
            Value v = parse_value();
            require_hashable(v);
            s.insert(std::move(v));
        }
        return Value(std::move(s));
    }

    Value parse_dict_rest(Value first_key) {
        Dict d;
        require_hashable(first_key);
        d.insert(std::move(first_key), parse_value());
        while (true) {
            skip_ws();
            if (peek() == '}') {
                ++pos_;
                break;
            }
            if (peek() != ',') fail("expected ',' or '}'");
            ++pos_;
            skip_ws();
            if (peek() == '}') {
                ++pos_;
                break;
            }
            Value key = parse_value();
            require_hashable(key);
            expect(':');
            d.insert(std::move(key), parse_value());
        }
        return Value(std::move(d));
    }

    void require_hashable(const Value& v) const {
        if (!is_hashable(v)) fail("unhashable " + type_name(v) + " used as set element or dict key");
    }
};

} // anonymous namespace

Value parse_literal(std::string_view text) {
    return LiteralParser(text).parse();
}

Value parse_literal_or_string(const std::string& raw) {
    try {
        return parse_literal(raw);
    } catch (const DecodeError&) {
        return Value(raw);
    }
}

} // namespace plaincfg
