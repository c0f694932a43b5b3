/**
 * @file Convert.cpp
 * @brief JSON and TOML export
 */

#include "plaincfg/Convert.hpp"
#include "plaincfg/Literal.hpp"
#include "plaincfg/Util.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace plaincfg {

using nlohmann::ordered_json;

namespace {

ordered_json array_of(const std::vector<Value>& items) {
    ordered_json arr = ordered_json::array();
    for (const auto& item : items) arr.push_back(to_json(item));
    return arr;
}

// ---- JSON -> TOML (value-based construction) --------------------------------

void insert_scalar(toml::table& tbl, const std::string& key, const ordered_json& v) {
    if (v.is_string()) {
        tbl.insert(key, v.get<std::string>());
    } else if (v.is_boolean()) {
        tbl.insert(key, v.get<bool>());
    } else if (v.is_number_integer()) {
        tbl.insert(key, v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        tbl.insert(key, v.get<double>());
    } else if (v.is_null()) {
        // No TOML null
        tbl.insert(key, std::string{});
    } else {
        tbl.insert(key, v.dump());
    }
}

toml::table make_table(const ordered_json& o);

toml::array make_array(const ordered_json& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_array(elem));
        } else if (elem.is_string()) {
            out.push_back(elem.get<std::string>());
        } else if (elem.is_boolean()) {
            out.push_back(elem.get<bool>());
        } else if (elem.is_number_integer()) {
            out.push_back(elem.get<std::int64_t>());
        } else if (elem.is_number_float()) {
            out.push_back(elem.get<double>());
        } else if (elem.is_null()) {
            out.push_back(std::string{});
        } else {
            out.push_back(elem.dump());
        }
    }
    return out;
}

toml::table make_table(const ordered_json& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const auto& k = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert(k, make_table(v));
        } else if (v.is_array()) {
            tbl.insert(k, make_array(v));
        } else {
            insert_scalar(tbl, k, v);
        }
    }
    return tbl;
}

} // anonymous namespace

ordered_json to_json(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            return nullptr;
        case Value::Kind::Boolean:
            return value.as_bool();
        case Value::Kind::Integer:
            return value.as_int();
        case Value::Kind::Float:
            return value.as_float();
        case Value::Kind::String:
            return value.as_string();
        case Value::Kind::Bytes:
            return base64_encode(value.as_bytes());
        case Value::Kind::Tuple:
            return array_of(value.as_tuple().items);
        case Value::Kind::List:
            return array_of(value.as_list().items);
        case Value::Kind::Set:
            return array_of(value.as_set().items);
        case Value::Kind::Dict: {
            const Dict& d = value.as_dict();
            ordered_json obj = ordered_json::object();
            for (std::size_t i = 0; i < d.size(); ++i) {
                const Value& k = d.key(i);
                const std::string name = k.is_string() ? k.as_string() : to_literal(k);
                obj[name] = to_json(d.value(i));
            }
            return obj;
        }
        case Value::Kind::Opaque: {
            const Opaque& o = value.as_opaque();
            ordered_json obj = ordered_json::object();
            obj["$object"] = o.type_name;
            obj["state"] = ordered_json::parse(o.state.dump());
            return obj;
        }
    }
    return nullptr;
}

ordered_json to_json(const Mapping& data) {
    ordered_json obj = ordered_json::object();
    for (const auto& kv : data) {
        obj[kv.first] = to_json(kv.second);
    }
    return obj;
}

toml::table to_toml(const Mapping& data) {
    return make_table(to_json(data));
}

std::string to_json_string(const Mapping& data, int indent) {
    return to_json(data).dump(indent);
}

std::string to_toml_string(const Mapping& data) {
    std::ostringstream oss;
    oss << to_toml(data);
    return oss.str();
}

} // namespace plaincfg
