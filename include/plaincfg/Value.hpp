/**
 * @file Value.hpp
 * @brief Typed value model for plain configuration data
 *
 * A closed variant over:
 * - Null
 * - Boolean
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Bytes (raw octets)
 * - Tuple / List / Set / Dict (literal containers)
 * - Opaque (application object: type name plus JSON state)
 *
 * Only the first ten can be written as literal text. Opaque values, and
 * containers holding them, need the object serializer (see Serializer.hpp).
 */

#ifndef PLAINCFG_VALUE_HPP
#define PLAINCFG_VALUE_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace plaincfg {

class Value;

/// Raw octets
using Bytes = std::vector<std::uint8_t>;

/// Ordered, immutable-by-convention sequence
struct Tuple {
    std::vector<Value> items;
};

/// Ordered sequence
struct List {
    std::vector<Value> items;
};

/**
 * @brief Unordered collection of hashable values
 *
 * Order of `items` is the order elements were inserted; it is not
 * significant for equality.
 */
struct Set {
    std::vector<Value> items;

    /// Insert unless an equal element is already present
    void insert(Value v);
    bool contains(const Value& v) const;
};

/**
 * @brief Mapping of hashable keys to values, insertion ordered
 *
 * Keys and values are kept in parallel vectors; order is not significant
 * for equality.
 */
class Dict {
public:
    Dict() = default;
    Dict(std::initializer_list<std::pair<Value, Value>> init);

    /// Insert, or replace the value of an equal key
    void insert(Value key, Value value);

    /// Pointer to the value for `key`, or nullptr
    const Value* find(const Value& key) const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    const Value& key(std::size_t i) const;
    const Value& value(std::size_t i) const;

private:
    std::vector<Value> keys_;
    std::vector<Value> values_;
};

/**
 * @brief Application object outside the literal closure
 *
 * `type_name` identifies the object kind for the application; `state` is
 * whatever the application needs to rebuild it.
 */
struct Opaque {
    std::string type_name;
    nlohmann::json state;
};

/**
 * @brief Typed configuration value
 */
class Value {
public:
    /// Alternatives, in the order of Kind
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string,
                                 Bytes, Tuple, List, Set, Dict, Opaque>;

    enum class Kind {
        Null,
        Boolean,
        Integer,
        Float,
        String,
        Bytes,
        Tuple,
        List,
        Set,
        Dict,
        Opaque
    };

    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<std::int64_t>(i)) {}
    Value(long i) : data_(static_cast<std::int64_t>(i)) {}
    Value(long long i) : data_(static_cast<std::int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Bytes b) : data_(std::move(b)) {}
    Value(Tuple t) : data_(std::move(t)) {}
    Value(List l) : data_(std::move(l)) {}
    Value(Set s) : data_(std::move(s)) {}
    Value(Dict d) : data_(std::move(d)) {}
    Value(Opaque o) : data_(std::move(o)) {}

    Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_boolean() const noexcept { return kind() == Kind::Boolean; }
    bool is_integer() const noexcept { return kind() == Kind::Integer; }
    bool is_float() const noexcept { return kind() == Kind::Float; }
    bool is_string() const noexcept { return kind() == Kind::String; }
    bool is_bytes() const noexcept { return kind() == Kind::Bytes; }
    bool is_tuple() const noexcept { return kind() == Kind::Tuple; }
    bool is_list() const noexcept { return kind() == Kind::List; }
    bool is_set() const noexcept { return kind() == Kind::Set; }
    bool is_dict() const noexcept { return kind() == Kind::Dict; }
    bool is_opaque() const noexcept { return kind() == Kind::Opaque; }

    /// Text payloads: String or Bytes
    bool is_text() const noexcept { return is_string() || is_bytes(); }

    /**
     * @name Typed accessors
     * @throws TypeMismatchError if the value holds another alternative
     */
    ///@{
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_float() const;
    const std::string& as_string() const;
    const Bytes& as_bytes() const;
    const Tuple& as_tuple() const;
    const List& as_list() const;
    const Set& as_set() const;
    const Dict& as_dict() const;
    const Opaque& as_opaque() const;
    ///@}

    const Storage& storage() const noexcept { return data_; }

private:
    Storage data_;
};

/**
 * @brief Structural equality
 *
 * Sets and dicts compare regardless of element order. Values of different
 * kinds are never equal.
 */
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

bool operator==(const Tuple& a, const Tuple& b);
bool operator==(const List& a, const List& b);
bool operator==(const Set& a, const Set& b);
bool operator==(const Dict& a, const Dict& b);
bool operator==(const Opaque& a, const Opaque& b);

/**
 * @brief Get human-readable type name for a Value
 * @return "null", "boolean", "integer", "float", "string", "bytes",
 *         "tuple", "list", "set", "dict", or the opaque object's type name
 */
std::string type_name(const Value& val);

/**
 * @brief Whether the value may be a set element or dict key
 *
 * Scalars are hashable; tuples are hashable when all their items are.
 */
bool is_hashable(const Value& val);

/**
 * @brief Whether the value can be written with the restricted literal syntax
 *
 * True for scalars and for tuple/list/set/dict whose contents are, in turn,
 * literal-safe (set elements and dict keys must also be hashable).
 * Opaque values are never literal-safe.
 */
bool is_literal_safe(const Value& val);

/// Bytes holding the octets of `s`
Bytes to_bytes(std::string_view s);

/// String holding the octets of `b`
std::string bytes_to_string(const Bytes& b);

/**
 * @brief Config mapping: key -> value in insertion order
 */
using Mapping = nlohmann::ordered_map<std::string, Value>;

} // namespace plaincfg

#endif // PLAINCFG_VALUE_HPP
