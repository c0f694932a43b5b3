/**
 * @file Serializer.cpp
 * @brief CBOR object serializer
 */

#include "plaincfg/Serializer.hpp"
#include "plaincfg/Errors.hpp"

#include <limits>

namespace plaincfg {

using nlohmann::json;

namespace {

json items_to_json(const std::vector<Value>& items) {
    json arr = json::array();
    for (const auto& v : items) {
        arr.push_back(CborObjectSerializer::to_tagged_json(v));
    }
    return arr;
}

std::vector<Value> items_from_json(const json& arr) {
    if (!arr.is_array()) {
        throw FormatError("Serialized container is not an array");
    }
    std::vector<Value> items;
    items.reserve(arr.size());
    for (const auto& elem : arr) {
        items.push_back(CborObjectSerializer::from_tagged_json(elem));
    }
    return items;
}

} // anonymous namespace

json CborObjectSerializer::to_tagged_json(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            return json(nullptr);
        case Value::Kind::Boolean:
            return json(value.as_bool());
        case Value::Kind::Integer:
            return json(value.as_int());
        case Value::Kind::Float:
            return json(value.as_float());
        case Value::Kind::String:
            return json(value.as_string());
        case Value::Kind::Bytes:
            return json::binary(value.as_bytes());
        case Value::Kind::Tuple:
            return json{{"$tuple", items_to_json(value.as_tuple().items)}};
        case Value::Kind::List:
            return items_to_json(value.as_list().items);
        case Value::Kind::Set:
            return json{{"$set", items_to_json(value.as_set().items)}};
        case Value::Kind::Dict: {
            const auto& d = value.as_dict();
            json pairs = json::array();
            for (std::size_t i = 0; i < d.size(); ++i) {
                pairs.push_back(json::array({to_tagged_json(d.key(i)), to_tagged_json(d.value(i))}));
            }
            return json{{"$dict", pairs}};
        }
        case Value::Kind::Opaque: {
            const auto& o = value.as_opaque();
            return json{{"$object", o.type_name}, {"state", o.state}};
        }
    }
    throw UnsafeValueError(type_name(value));
}

Value CborObjectSerializer::from_tagged_json(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(j.get<bool>());
        case json::value_t::number_integer:
            return Value(j.get<std::int64_t>());
        case json::value_t::number_unsigned: {
            const auto u = j.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw FormatError("Serialized integer out of range");
            }
            return Value(static_cast<std::int64_t>(u));
        }
        case json::value_t::number_float:
            return Value(j.get<double>());
        case json::value_t::string:
            return Value(j.get<std::string>());
        case json::value_t::binary:
            return Value(Bytes(j.get_binary().begin(), j.get_binary().end()));
        case json::value_t::array:
            return Value(List{items_from_json(j)});
        case json::value_t::object:
            break;
        default:
            throw FormatError("Unsupported serialized value");
    }

    if (j.contains("$tuple")) {
        return Value(Tuple{items_from_json(j.at("$tuple"))});
    }
    if (j.contains("$set")) {
        Set s;
        for (auto& v : items_from_json(j.at("$set"))) s.insert(std::move(v));
        return Value(std::move(s));
    }
    if (j.contains("$dict")) {
        const auto& pairs = j.at("$dict");
        if (!pairs.is_array()) throw FormatError("Serialized dict is not an array");
        Dict d;
        for (const auto& p : pairs) {
            if (!p.is_array() || p.size() != 2) {
                throw FormatError("Serialized dict entry is not a pair");
            }
            d.insert(from_tagged_json(p[0]), from_tagged_json(p[1]));
        }
        return Value(std::move(d));
    }
    if (j.contains("$object") && j.at("$object").is_string()) {
        Opaque o;
        o.type_name = j.at("$object").get<std::string>();
        if (j.contains("state")) o.state = j.at("state");
        return Value(std::move(o));
    }
    throw FormatError("Unrecognised serialized object");
}

Bytes CborObjectSerializer::serialize(const Value& value) const {
    return json::to_cbor(to_tagged_json(value));
}

Value CborObjectSerializer::deserialize(const Bytes& data) const {
    json j;
    try {
        j = json::from_cbor(data);
    } catch (const json::exception& e) {
        throw FormatError(std::string("Invalid CBOR data: ") + e.what());
    }
    return from_tagged_json(j);
}

std::shared_ptr<const ObjectSerializer> default_serializer() {
    static const auto instance = std::make_shared<const CborObjectSerializer>();
    return instance;
}

} // namespace plaincfg
