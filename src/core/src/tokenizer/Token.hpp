#pragma once

/**
 * @file Token.hpp
 * @brief Token and Line definitions produced by the line tokenizer
 */

#include "../grammar/TokenGrammar.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gcode_annotator {
namespace tokenizer {

struct Token {
    grammar::LetterClass letter = grammar::LetterClass::UNKNOWN;
    std::string rawText;                 // exact source substring
    std::optional<double> numericValue;
    size_t position = 0;                 // column offset in the source line
    bool commaPrefixed = false;          // ,R1 / ,C0.5 corner words

    bool isUnknown() const { return letter == grammar::LetterClass::UNKNOWN; }

    /// Numeric part as written ("-12.5" for X-12.5, "100" for #100)
    std::string valueText() const;

    /// Normalized code: upper-case letter followed by the value text ("G200", ",R1")
    std::string code() const;
};

struct Comment {
    size_t position = 0;
    std::string rawText;                 // including delimiters
    std::string text;                    // inner text, trimmed
    bool terminated = true;
};

enum class LineWarning {
    UNTERMINATED_COMMENT,
    MALFORMED_FRAGMENT
};

/**
 * One tokenized source line. Immutable once produced by the tokenizer.
 */
struct Line {
    int lineNumber = 1;                  // 1-based
    std::string source;
    std::vector<Token> tokens;
    std::vector<Comment> comments;
    std::vector<LineWarning> warnings;

    /// Inner text of all comments joined with single spaces
    std::string commentText() const;

    bool hasWarning(LineWarning warning) const;

    /// Token and comment raw text interleaved with the interstitial whitespace
    std::string reconstruct() const;
};

inline std::string lineWarningToString(LineWarning warning) {
    switch (warning) {
        case LineWarning::UNTERMINATED_COMMENT: return "Unterminated comment";
        case LineWarning::MALFORMED_FRAGMENT: return "Malformed fragment";
    }
    return "Unknown warning";
}

} // namespace tokenizer
} // namespace gcode_annotator
