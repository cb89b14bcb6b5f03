#pragma once

/**
 * @file TokenGrammar.hpp
 * @brief Lexical classes of G-code words and their highlight categories
 */

#include <optional>
#include <string>
#include <string_view>

namespace gcode_annotator {
namespace grammar {

/**
 * Address letters and special word kinds
 */
enum class LetterClass {
    // Core addresses
    G, M, T, F, S,
    X, Y, Z,
    I, J, K,
    R, Q, N, C, P,

    // Auxiliary addresses
    A, B, D, E, H, L, O, U, V, W,

    // Special words
    MACRO,          // #100
    PROGRAM_MARKER, // %
    BLOCK_DELETE,   // leading /
    CHECKSUM,       // *57

    UNKNOWN
};

/**
 * Categories used by the presentation layer to colour token spans
 */
enum class HighlightCategory {
    PREPARATORY,    // G
    MISCELLANEOUS,  // M
    FEED,           // F
    SPINDLE,        // S
    TOOL,           // T
    AXIS_X,
    AXIS_Y,
    AXIS_Z,
    AXIS_OTHER,     // A B U V W
    ARC_OFFSET,     // I J K
    PARAMETER,      // R Q N and the remaining addresses
    CHAMFER,        // C
    DWELL,          // P
    MACRO,
    MARKER,         // % / *
    COMMENT,
    ERROR
};

/// Map an ASCII letter (either case) to its address class
std::optional<LetterClass> letterFromChar(char c);

/// Address letter for a class, '\0' for special kinds
char letterChar(LetterClass letter);

/// Dictionary key for a class: "G", "%", "#", "/", "*" or "" for UNKNOWN
std::string letterKey(LetterClass letter);

/// Parse a dictionary key ("g", "X", "%", ",R" without the comma) back to a class
std::optional<LetterClass> letterFromKey(std::string_view key);

HighlightCategory highlightCategory(LetterClass letter);

/// X/Y/Z/I/J/K, the words that can imply the active motion mode
bool isCoordinateLetter(LetterClass letter);

/**
 * Numeric literal check: optional sign, digits, at most one decimal point,
 * at least one digit.
 */
bool isNumericLiteral(std::string_view text);

/// Shortest decimal text for a value: 90 -> "90", 12.5 -> "12.5"
std::string formatValue(double value);

} // namespace grammar
} // namespace gcode_annotator
