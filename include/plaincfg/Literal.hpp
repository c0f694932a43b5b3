/**
 * @file Literal.hpp
 * @brief Restricted literal syntax for the 'r' modifier
 *
 * Grammar (whitespace allowed between tokens):
 * ```
 * literal := "None" | "True" | "False"
 *          | sign? number | sign? ("inf" | "nan")
 *          | string+ | bytes+
 *          | "(" ")" | "(" literal "," ")" | "(" literal ("," literal)+ ","? ")"
 *          | "(" literal ")"
 *          | "[" (literal ("," literal)* ","?)? "]"
 *          | "{" "}" | "set()" | "{" literal ("," literal)* ","? "}"
 *          | "{" literal ":" literal ("," literal ":" literal)* ","? "}"
 * string  := quote chars quote              ; ' or ", backslash escapes
 * bytes   := ("b" | "B") string             ; ASCII only
 * ```
 * Nothing is evaluated: names, calls and operators other than a leading
 * sign are rejected.
 */

#ifndef PLAINCFG_LITERAL_HPP
#define PLAINCFG_LITERAL_HPP

#include "plaincfg/Value.hpp"

#include <string>
#include <string_view>

namespace plaincfg {

/**
 * @brief Literal text for a value
 *
 * Spelling follows the common literal conventions: `None`, `True`,
 * `False`, `'text'`, `b'\x00'`, `(1,)`, `[1, 2]`, `{1, 2}`, `set()`,
 * `{'k': 1}`.
 *
 * @throws UnsafeValueError for opaque values
 */
std::string to_literal(const Value& value);

/**
 * @brief Shortest text that reads back as the same double
 *
 * Integral values get a ".0" suffix; non-finite values are "inf", "-inf"
 * and "nan".
 */
std::string format_float(double d);

/**
 * @brief Parse literal text
 * @throws FormatError on anything outside the grammar, unhashable set
 *         elements or dict keys, or excessive nesting
 */
Value parse_literal(std::string_view text);

/**
 * @brief Parse as a literal, falling back to the raw text as a string
 *
 * Used for values typed on the command line: `42` is an integer, `[1, 2]`
 * a list, `hello` the string "hello".
 */
Value parse_literal_or_string(const std::string& raw);

} // namespace plaincfg

#endif // PLAINCFG_LITERAL_HPP
