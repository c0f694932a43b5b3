/**
 * @file Errors.hpp
 * @brief Exception types for plaincfg encode/decode/read/write errors
 *
 * Taxonomy:
 * - ConfigError: Base class
 * - UnsafeValueError: Value needs opaque serialization but safe mode is on
 * - InvalidKeyError: Key cannot be written as a key line
 * - DecodeError: Base of the per-line decode failures
 *   - FormatError, EncodingError, TypeMismatchError,
 *     UnknownModifierError, UnsafeOperationError
 * - UnexpectedEndOfInput: Source ended inside a continued value
 * - FileNotFoundError / FileWriteError: File layer failures
 */

#ifndef PLAINCFG_ERRORS_HPP
#define PLAINCFG_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace plaincfg {

/**
 * @brief Base class for all plaincfg exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A value has no safe textual encoding and unsafe mode is off
 */
class UnsafeValueError : public ConfigError {
public:
    /**
     * @brief Construct with the offending value's type name
     * @param type_name Type name as reported by type_name()
     */
    explicit UnsafeValueError(std::string type_name)
        : ConfigError("Cannot write value of type '" + type_name +
                      "': opaque serialization is disabled (safe mode)")
        , type_name_(std::move(type_name))
    {}

    const std::string& type_name() const noexcept {
        return type_name_;
    }

private:
    std::string type_name_;
};

/**
 * @brief Key cannot be represented on a key line
 *
 * Raised for keys containing '=', '/' or a line break, and for keys that
 * would read back as a comment or blank line.
 */
class InvalidKeyError : public ConfigError {
public:
    /**
     * @brief Construct with the key and the reason it was rejected
     */
    InvalidKeyError(std::string key, const std::string& reason)
        : ConfigError("Invalid key '" + key + "': " + reason)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Base class for failures while applying a modifier chain
 *
 * Always recovered per line by the parser.
 */
class DecodeError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief Payload text does not match the expected syntax (i, f, r)
 */
class FormatError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/**
 * @brief Invalid Base32/Base64 data or invalid UTF-8
 */
class EncodingError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/**
 * @brief Operation applied to a value of the wrong type
 */
class TypeMismatchError : public DecodeError {
public:
    /**
     * @brief Construct with the operation and the type it received
     * @param operation Modifier operation or accessor name
     * @param actual Type name of the value it was applied to
     */
    TypeMismatchError(std::string operation, std::string actual)
        : DecodeError("Operation '" + operation + "' cannot be applied to a value of type '" +
                      actual + "'")
        , operation_(std::move(operation))
        , actual_(std::move(actual))
    {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string operation_;
    std::string actual_;
};

/**
 * @brief Modifier string contains an unrecognised operation
 */
class UnknownModifierError : public DecodeError {
public:
    /**
     * @param modifier The unconsumed remainder of the modifier string
     */
    explicit UnknownModifierError(std::string modifier)
        : DecodeError("Unknown modifier operation at '" + modifier + "'")
        , modifier_(std::move(modifier))
    {}

    const std::string& modifier() const noexcept {
        return modifier_;
    }

private:
    std::string modifier_;
};

/**
 * @brief Opaque deserialization ('p') requested while safe mode is on
 */
class UnsafeOperationError : public DecodeError {
public:
    UnsafeOperationError()
        : DecodeError("Refusing to deserialize an opaque object: safe mode is on")
    {}
};

/**
 * @brief The line source ended while a continued value was being joined
 */
class UnexpectedEndOfInput : public ConfigError {
public:
    /**
     * @param source Name of the source (file path, or empty)
     * @param line_number 1-based number of the line that started the record
     */
    UnexpectedEndOfInput(const std::string& source, std::size_t line_number)
        : ConfigError("Unexpected end of input in " +
                      (source.empty() ? std::string("<input>") : "'" + source + "'") +
                      ": continuation started at line " + std::to_string(line_number) +
                      " is never terminated")
        , line_number_(line_number)
    {}

    std::size_t line_number() const noexcept {
        return line_number_;
    }

private:
    std::size_t line_number_;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file could not be opened for writing
 */
class FileWriteError : public ConfigError {
public:
    explicit FileWriteError(std::string path)
        : ConfigError("Failed to open for write: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace plaincfg

#endif // PLAINCFG_ERRORS_HPP
