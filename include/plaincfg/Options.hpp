/**
 * @file Options.hpp
 * @brief Options for the codec, the reader and the writer
 */

#ifndef PLAINCFG_OPTIONS_HPP
#define PLAINCFG_OPTIONS_HPP

#include "plaincfg/Diagnostics.hpp"
#include "plaincfg/Serializer.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace plaincfg {

/**
 * @brief Default width before long values are wrapped
 */
constexpr std::size_t kDefaultMaxWidth = 72;

/**
 * @brief Default continuation marker candidates, in preference order
 *
 * Symbols unlikely to occur in configuration values. Each element is one
 * UTF-8 encoded character.
 */
const std::vector<std::string>& default_continuation_chars();

/**
 * @brief Options shared by encoding and decoding
 */
struct CodecOptions {
    /// When true, opaque serialization ('p') is refused both ways
    bool safe = true;

    /// Serializer for opaque values; null selects default_serializer()
    std::shared_ptr<const ObjectSerializer> serializer;
};

/**
 * @brief Options for reading a line sequence
 */
struct ReadOptions : CodecOptions {
    DiagnosticSink diagnostics;

    /// Name used in diagnostics (usually the file path)
    std::string source_name;
};

/**
 * @brief Options for writing a mapping
 */
struct WriteOptions : CodecOptions {
    /// Wrap values whose line would reach this width; 0 disables wrapping
    std::size_t max_width = kDefaultMaxWidth;

    /// Continuation marker candidates, one UTF-8 character each
    std::vector<std::string> continuation_chars = default_continuation_chars();

    /// Keep lines of keys that are no longer in the mapping
    bool rewrite_old = false;

    DiagnosticSink diagnostics;
};

} // namespace plaincfg

#endif // PLAINCFG_OPTIONS_HPP
