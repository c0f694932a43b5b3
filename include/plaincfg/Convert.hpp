/**
 * @file Convert.hpp
 * @brief Export of plain configurations to JSON and TOML
 *
 * Conversion is one way and lossy: bytes become Base64 strings, tuples and
 * sets become arrays, and TOML has no null (written as "").
 */

#ifndef PLAINCFG_CONVERT_HPP
#define PLAINCFG_CONVERT_HPP

#include "plaincfg/Value.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <string>

namespace plaincfg {

/**
 * @brief JSON view of a value
 *
 * Dicts whose keys are all strings become objects; other dicts use the
 * literal text of each key as the member name. Opaque values become
 * `{"$object": type_name, "state": state}`.
 */
nlohmann::ordered_json to_json(const Value& value);

/**
 * @brief JSON object of a whole mapping, in mapping order
 */
nlohmann::ordered_json to_json(const Mapping& data);

/**
 * @brief TOML table of a whole mapping
 */
toml::table to_toml(const Mapping& data);

/// to_json(data) serialized with the given indent
std::string to_json_string(const Mapping& data, int indent = 2);

/// to_toml(data) serialized
std::string to_toml_string(const Mapping& data);

} // namespace plaincfg

#endif // PLAINCFG_CONVERT_HPP
