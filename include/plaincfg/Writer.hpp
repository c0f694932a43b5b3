/**
 * @file Writer.hpp
 * @brief Writing a mapping while keeping a previous file's layout
 *
 * Records of the prior structure are replayed in order:
 * - a key still in the mapping is written with its new value, in place
 * - a key no longer in the mapping is kept verbatim if rewrite_old is set,
 *   dropped otherwise (this is how keys are deleted)
 * - comments and blank lines are kept verbatim
 * - invalid lines are dropped
 * Keys that were not in the prior structure follow, in mapping order.
 */

#ifndef PLAINCFG_WRITER_HPP
#define PLAINCFG_WRITER_HPP

#include "plaincfg/Lines.hpp"
#include "plaincfg/Options.hpp"
#include "plaincfg/Structure.hpp"
#include "plaincfg/Value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace plaincfg {

/**
 * @brief Check that a key can be written as a key line
 * @throws InvalidKeyError
 */
void validate_key(std::string_view key);

/**
 * @brief Render a mapping against a prior structure
 *
 * Every key is validated and every value encoded before returning, so a
 * failure leaves nothing half written.
 *
 * @param data Current values
 * @param structure Structure from a previous read, or empty for a new file
 * @param options Width, continuation characters, rewrite_old, safe mode
 * @return Output lines, each terminated by "\n"
 * @throws InvalidKeyError, UnsafeValueError, EncodingError
 */
std::vector<std::string> render_config(const Mapping& data,
                                       const Structure& structure = {},
                                       const WriteOptions& options = {});

/**
 * @brief Render and send the result to `sink`
 *
 * Nothing reaches the sink if rendering fails.
 */
void write_config(const Mapping& data, const Structure& structure, LineSink& sink,
                  const WriteOptions& options = {});

/**
 * @brief Render to a single string
 */
std::string write_config_string(const Mapping& data, const Structure& structure = {},
                                const WriteOptions& options = {});

} // namespace plaincfg

#endif // PLAINCFG_WRITER_HPP
