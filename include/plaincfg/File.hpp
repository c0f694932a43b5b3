/**
 * @file File.hpp
 * @brief Reading and writing configuration files
 */

#ifndef PLAINCFG_FILE_HPP
#define PLAINCFG_FILE_HPP

#include "plaincfg/Options.hpp"
#include "plaincfg/Parser.hpp"
#include "plaincfg/Structure.hpp"
#include "plaincfg/Value.hpp"

#include <filesystem>
#include <string>

namespace plaincfg {

/**
 * @brief Permissions given to written files (owner read/write only)
 */
constexpr std::filesystem::perms default_file_mode =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

/**
 * @brief Read a configuration file
 *
 * `options.source_name` defaults to the path when left empty.
 *
 * @throws FileNotFoundError if the file cannot be opened
 * @throws UnexpectedEndOfInput if the file ends inside a continued value
 */
ReadResult read_config_file(const std::string& path, ReadOptions options = {});

/**
 * @brief Write a configuration file, keeping the layout of `structure`
 *
 * The content is fully rendered before the file is opened. The file is
 * then restricted to default_file_mode; failing to do so is reported as a
 * warning.
 *
 * @throws InvalidKeyError, UnsafeValueError, EncodingError from rendering
 * @throws FileWriteError if the file cannot be opened or written
 */
void write_config_file(const std::string& path, const Mapping& data,
                       const Structure& structure = {},
                       const WriteOptions& options = {});

} // namespace plaincfg

#endif // PLAINCFG_FILE_HPP
