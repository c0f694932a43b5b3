/**
 * @file Value.cpp
 * @brief Implementation of the typed value model
 */

#include "plaincfg/Value.hpp"
#include "plaincfg/Errors.hpp"

#include <algorithm>

namespace plaincfg {

// ============================================================================
// Containers
// ============================================================================

void Set::insert(Value v) {
    if (!contains(v)) {
        items.push_back(std::move(v));
    }
}

bool Set::contains(const Value& v) const {
    return std::find(items.begin(), items.end(), v) != items.end();
}

Dict::Dict(std::initializer_list<std::pair<Value, Value>> init) {
    for (const auto& kv : init) {
        insert(kv.first, kv.second);
    }
}

void Dict::insert(Value key, Value value) {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            values_[i] = std::move(value);
            return;
        }
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
}

std::size_t Dict::size() const noexcept {
    return keys_.size();
}

bool Dict::empty() const noexcept {
    return keys_.empty();
}

const Value& Dict::key(std::size_t i) const {
    return keys_.at(i);
}

const Value& Dict::value(std::size_t i) const {
    return values_.at(i);
}

const Value* Dict::find(const Value& key) const {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) return &values_[i];
    }
    return nullptr;
}

// ============================================================================
// Accessors
// ============================================================================

namespace {

template <typename T>
const T& get_as(const Value::Storage& data, const Value& self, const char* what) {
    if (const T* p = std::get_if<T>(&data)) {
        return *p;
    }
    throw TypeMismatchError(what, type_name(self));
}

} // anonymous namespace

bool Value::as_bool() const { return get_as<bool>(data_, *this, "as_bool"); }
std::int64_t Value::as_int() const { return get_as<std::int64_t>(data_, *this, "as_int"); }
double Value::as_float() const { return get_as<double>(data_, *this, "as_float"); }
const std::string& Value::as_string() const { return get_as<std::string>(data_, *this, "as_string"); }
const Bytes& Value::as_bytes() const { return get_as<Bytes>(data_, *this, "as_bytes"); }
const Tuple& Value::as_tuple() const { return get_as<Tuple>(data_, *this, "as_tuple"); }
const List& Value::as_list() const { return get_as<List>(data_, *this, "as_list"); }
const Set& Value::as_set() const { return get_as<Set>(data_, *this, "as_set"); }
const Dict& Value::as_dict() const { return get_as<Dict>(data_, *this, "as_dict"); }
const Opaque& Value::as_opaque() const { return get_as<Opaque>(data_, *this, "as_opaque"); }

// ============================================================================
// Equality
// ============================================================================

bool operator==(const Tuple& a, const Tuple& b) {
    return a.items == b.items;
}

bool operator==(const List& a, const List& b) {
    return a.items == b.items;
}

bool operator==(const Set& a, const Set& b) {
    auto covers = [](const Set& x, const Set& y) {
        return std::all_of(x.items.begin(), x.items.end(),
                           [&](const Value& v) { return y.contains(v); });
    };
    return covers(a, b) && covers(b, a);
}

bool operator==(const Dict& a, const Dict& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const Value* other = b.find(a.key(i));
        if (!other || *other != a.value(i)) return false;
    }
    return true;
}

bool operator==(const Opaque& a, const Opaque& b) {
    return a.type_name == b.type_name && a.state == b.state;
}

bool operator==(const Value& a, const Value& b) {
    return a.storage() == b.storage();
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

// ============================================================================
// Classification
// ============================================================================

std::string type_name(const Value& val) {
    switch (val.kind()) {
        case Value::Kind::Null: return "null";
        case Value::Kind::Boolean: return "boolean";
        case Value::Kind::Integer: return "integer";
        case Value::Kind::Float: return "float";
        case Value::Kind::String: return "string";
        case Value::Kind::Bytes: return "bytes";
        case Value::Kind::Tuple: return "tuple";
        case Value::Kind::List: return "list";
        case Value::Kind::Set: return "set";
        case Value::Kind::Dict: return "dict";
        case Value::Kind::Opaque: return val.as_opaque().type_name;
    }
    return "unknown";
}

bool is_hashable(const Value& val) {
    switch (val.kind()) {
        case Value::Kind::Tuple: {
            const auto& items = val.as_tuple().items;
            return std::all_of(items.begin(), items.end(),
                               [](const Value& v) { return is_hashable(v); });
        }
        case Value::Kind::List:
        case Value::Kind::Set:
        case Value::Kind::Dict:
        case Value::Kind::Opaque:
            return false;
        default:
            return true;
    }
}

bool is_literal_safe(const Value& val) {
    auto all_safe = [](const std::vector<Value>& items) {
        return std::all_of(items.begin(), items.end(),
                           [](const Value& v) { return is_literal_safe(v); });
    };

    switch (val.kind()) {
        case Value::Kind::Tuple:
            return all_safe(val.as_tuple().items);
        case Value::Kind::List:
            return all_safe(val.as_list().items);
        case Value::Kind::Set: {
            const auto& items = val.as_set().items;
            return std::all_of(items.begin(), items.end(), [](const Value& v) {
                return is_hashable(v) && is_literal_safe(v);
            });
        }
        case Value::Kind::Dict: {
            const auto& d = val.as_dict();
            for (std::size_t i = 0; i < d.size(); ++i) {
                if (!is_hashable(d.key(i)) || !is_literal_safe(d.key(i))) return false;
                if (!is_literal_safe(d.value(i))) return false;
            }
            return true;
        }
        case Value::Kind::Opaque:
            return false;
        default:
            return true;
    }
}

Bytes to_bytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

std::string bytes_to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

} // namespace plaincfg
