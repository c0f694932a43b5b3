/**
 * @file Structure.hpp
 * @brief Layout tokens captured on read and replayed on write
 */

#ifndef PLAINCFG_STRUCTURE_HPP
#define PLAINCFG_STRUCTURE_HPP

#include <string>
#include <utility>
#include <vector>

namespace plaincfg {

/**
 * @brief One original record of a configuration file
 *
 * Produced by LineParser only; pass it back to the writer unchanged.
 */
class StructureEntry {
public:
    enum class Kind {
        Key,      ///< Decoded key line
        Comment,  ///< Comment or blank line, replayed verbatim
        Invalid   ///< Unusable line, never replayed
    };

    Kind kind() const noexcept { return kind_; }

    bool is_key() const noexcept { return kind_ == Kind::Key; }
    bool is_comment() const noexcept { return kind_ == Kind::Comment; }
    bool is_invalid() const noexcept { return kind_ == Kind::Invalid; }

    /// Key name; empty unless is_key()
    const std::string& key() const noexcept { return key_; }

    /// Unconsumed modifier, always empty for a decoded key line
    const std::string& modifier() const noexcept { return modifier_; }

    /// Physical line(s) as read, terminators included
    const std::string& raw() const noexcept { return raw_; }

private:
    friend class LineParser;

    StructureEntry(Kind kind, std::string key, std::string modifier, std::string raw)
        : kind_(kind)
        , key_(std::move(key))
        , modifier_(std::move(modifier))
        , raw_(std::move(raw))
    {}

    Kind kind_;
    std::string key_;
    std::string modifier_;
    std::string raw_;
};

using Structure = std::vector<StructureEntry>;

} // namespace plaincfg

#endif // PLAINCFG_STRUCTURE_HPP
