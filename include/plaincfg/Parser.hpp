/**
 * @file Parser.hpp
 * @brief Reading a line sequence into a mapping plus its structure
 *
 * Line handling:
 * - blank lines and lines whose first non-blank character is '#' are
 *   comments
 * - lines without '=' are invalid
 * - `key[/modifier]=value` is decoded with decode_value(); a leading
 *   `C<c>` in the modifier joins following lines while the value ends
 *   with `c`
 * - lines that fail to decode are invalid; reading carries on
 */

#ifndef PLAINCFG_PARSER_HPP
#define PLAINCFG_PARSER_HPP

#include "plaincfg/Lines.hpp"
#include "plaincfg/Options.hpp"
#include "plaincfg/Structure.hpp"
#include "plaincfg/Value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace plaincfg {

/**
 * @brief Result of reading a configuration
 */
struct ReadResult {
    /// Decoded values, in file order
    Mapping data;

    /// One entry per record, in file order
    Structure structure;
};

/**
 * @brief Single-pass parser over a LineSource
 */
class LineParser {
public:
    explicit LineParser(ReadOptions options = {}) : options_(std::move(options)) {}

    /**
     * @brief Read every line of `source`
     * @throws UnexpectedEndOfInput if the source ends inside a continuation
     */
    ReadResult parse(LineSource& source);

private:
    void parse_line(LineSource& source, std::string raw, ReadResult& out);

    void warn(Severity severity, const std::string& message, std::string_view line) const;

    ReadOptions options_;
    std::size_t line_number_ = 0;
};

/**
 * @brief Read a configuration from a line source
 */
ReadResult read_config(LineSource& source, const ReadOptions& options = {});

/**
 * @brief Read a configuration held in a string
 */
ReadResult read_config_string(std::string_view text, const ReadOptions& options = {});

} // namespace plaincfg

#endif // PLAINCFG_PARSER_HPP
