/**
 * @file Serializer.hpp
 * @brief Pluggable binary serialization for opaque values ('p' modifier)
 *
 * WARNING: deserializing data from an untrusted file is unsafe with most
 * object serialization schemes. The codec only calls a serializer when the
 * caller has turned safe mode off.
 */

#ifndef PLAINCFG_SERIALIZER_HPP
#define PLAINCFG_SERIALIZER_HPP

#include "plaincfg/Value.hpp"

#include <memory>

namespace plaincfg {

/**
 * @brief Converts arbitrary values to and from an opaque byte form
 */
class ObjectSerializer {
public:
    virtual ~ObjectSerializer() = default;

    /**
     * @brief Serialize any value, opaque objects included
     * @throws UnsafeValueError if the value cannot be serialized
     */
    virtual Bytes serialize(const Value& value) const = 0;

    /**
     * @brief Rebuild a value from serialize() output
     * @throws FormatError on malformed input
     */
    virtual Value deserialize(const Bytes& data) const = 0;
};

/**
 * @brief Serializer storing values as CBOR via nlohmann::json
 *
 * Values are first mapped to a tagged JSON document so that every kind
 * survives the trip:
 * - null, booleans, integers, floats, strings: native JSON
 * - bytes: CBOR byte string
 * - list: array
 * - tuple: {"$tuple": [...]}
 * - set: {"$set": [...]}
 * - dict: {"$dict": [[key, value], ...]}
 * - opaque: {"$object": type_name, "state": state}
 */
class CborObjectSerializer : public ObjectSerializer {
public:
    Bytes serialize(const Value& value) const override;
    Value deserialize(const Bytes& data) const override;

    /// Tagged JSON form used by serialize()
    static nlohmann::json to_tagged_json(const Value& value);

    /// Inverse of to_tagged_json(), throws FormatError
    static Value from_tagged_json(const nlohmann::json& j);
};

/**
 * @brief Shared default serializer instance
 */
std::shared_ptr<const ObjectSerializer> default_serializer();

} // namespace plaincfg

#endif // PLAINCFG_SERIALIZER_HPP
