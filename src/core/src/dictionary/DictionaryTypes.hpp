#pragma once

/**
 * @file DictionaryTypes.hpp
 * @brief Profile dictionary entries and value patterns
 */

#include "../modal/ModalTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gcode_annotator {
namespace dictionary {

/**
 * Value side of a dictionary key: one value, a closed interval, or any value
 */
struct ValuePattern {
    enum class Kind : uint8_t {
        EXACT = 0,
        RANGE,
        WILDCARD
    };

    Kind kind = Kind::WILDCARD;
    double low = 0.0;
    double high = 0.0;

    static ValuePattern exact(double value) { return {Kind::EXACT, value, value}; }
    static ValuePattern range(double low, double high) { return {Kind::RANGE, low, high}; }
    static ValuePattern wildcard() { return {}; }

    /// "*" or "" -> wildcard, "80-89" / "80..89" -> range, "90" -> exact
    static std::optional<ValuePattern> parse(const std::string& text);

    bool matches(const std::optional<double>& value) const;

    /// Lower is more specific: exact 0, range 1, wildcard 2
    int specificity() const { return static_cast<int>(kind); }

    std::string toString() const;
};

/**
 * One dictionary record. `letter` is the normalized key ("G", ",R", "%", "#").
 * `modalGroup` names the context the description depends on and overrides
 * the letter's default (X/Y/Z positioning, I/J/K motion).
 * `sub` entries take precedence for the words that follow this one on the
 * same line.
 */
struct DictionaryEntry {
    std::string letter;
    ValuePattern pattern;
    std::string description;
    std::optional<modal::ModalGroup> modalGroup;
    std::vector<DictionaryEntry> sub;
};

/// Ordered entries of one profile; declaration order breaks ties
using ProfileDictionary = std::vector<DictionaryEntry>;

/// Upper-case a key and keep its comma prefix: ",r" -> ",R"
std::string normalizeKey(const std::string& key);

} // namespace dictionary
} // namespace gcode_annotator
