/**
 * @file Renderer.hpp
 * @brief Turning one encoded key/value into physical lines
 *
 * Short values produce `key[/modifier]=payload`. When the line would reach
 * `max_width` code points, the payload is wrapped: the modifier gets a
 * `C<c>` prefix naming a continuation character `c` that does not occur in
 * the payload, and every line except the last ends with `c`:
 *
 * ```
 * motd/C\=Welcome to the build farm. Please read the wiki before\
 *  scheduling long jobs on the shared runners.
 * ```
 */

#ifndef PLAINCFG_RENDERER_HPP
#define PLAINCFG_RENDERER_HPP

#include "plaincfg/Diagnostics.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace plaincfg {

/**
 * @brief Render a key line, wrapping long payloads
 *
 * @param key Key (already validated)
 * @param modifier Modifier chain from encode_value()
 * @param payload Encoded payload
 * @param max_width Wrap width in code points; 0 disables wrapping
 * @param continuation_chars Candidate markers, first unused one wins
 * @param diagnostics Receives an error when no candidate is usable; the
 *        line is then written unsplit
 * @return Lines, each terminated by "\n"
 */
std::vector<std::string> render_line(std::string_view key,
                                     std::string_view modifier,
                                     std::string_view payload,
                                     std::size_t max_width,
                                     const std::vector<std::string>& continuation_chars,
                                     const DiagnosticSink& diagnostics = {});

/**
 * @brief First candidate that does not occur in `payload`
 * @return The character, or an empty string if all occur
 */
std::string pick_continuation_char(std::string_view payload,
                                   const std::vector<std::string>& continuation_chars);

} // namespace plaincfg

#endif // PLAINCFG_RENDERER_HPP
