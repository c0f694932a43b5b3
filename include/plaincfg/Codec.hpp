/**
 * @file Codec.hpp
 * @brief Value <-> (modifier, payload) conversion
 *
 * Encoding picks a modifier from the value's kind:
 * - string without control characters: ""    (payload is the string)
 * - string with other control characters: "64s" (Base64 of UTF-8)
 * - string with only tab/CR/LF controls:  "r"   (literal text)
 * - boolean, null:                        "r"
 * - integer:                              "i"
 * - float:                                "f"
 * - bytes:                                "32"  (Base32)
 * - literal-safe tuple/list/set/dict:     "r"
 * - anything else, unsafe mode only:      "64p" (Base64 of serializer output)
 *
 * Decoding applies modifier operations left to right:
 * `p` deserialize, `s` to string, `b` to bytes, `i` integer, `f` float,
 * `r` literal, `32` Base32, `64` Base64.
 */

#ifndef PLAINCFG_CODEC_HPP
#define PLAINCFG_CODEC_HPP

#include "plaincfg/Options.hpp"
#include "plaincfg/Value.hpp"

#include <string>
#include <string_view>

namespace plaincfg {

/**
 * @brief Encoded form of one value
 */
struct Encoded {
    std::string modifier;
    std::string payload;
};

/**
 * @brief Encode a value for a key line
 *
 * @throws UnsafeValueError if the value is not literal-safe and
 *         options.safe is true
 * @throws EncodingError if a string is not valid UTF-8
 */
Encoded encode_value(const Value& value, const CodecOptions& options = {});

/**
 * @brief Apply a modifier chain to a payload
 *
 * The modifier must not carry a continuation prefix; the parser removes
 * it before the payload is complete.
 *
 * @throws UnknownModifierError, UnsafeOperationError, FormatError,
 *         EncodingError, TypeMismatchError (all DecodeError)
 */
Value decode_value(std::string_view modifier, std::string payload,
                   const CodecOptions& options = {});

} // namespace plaincfg

#endif // PLAINCFG_CODEC_HPP
