#pragma once

/**
 * @file LineTokenizer.hpp
 * @brief Splits one line of G-code into words, comments and warnings
 *
 * Never fails: malformed fragments become UNKNOWN tokens that keep their
 * raw text, and an unterminated '(' comment runs to end of line with a
 * warning attached.
 */

#include "Token.hpp"
#include <string>

namespace gcode_annotator {
namespace tokenizer {

class LineTokenizer {
public:
    explicit LineTokenizer(std::string source, int lineNumber = 1);

    Line tokenize();

private:
    std::string m_source;
    Line m_line;

    size_t m_start = 0;
    size_t m_current = 0;
    bool m_seenWord = false;

    bool isAtEnd() const;
    char advance();
    char peek() const;

    void scanWord();
    void scanAddress(bool commaPrefixed);
    void scanDigitsWord(grammar::LetterClass letter);
    void scanParenComment();
    void scanLineComment();
    void scanMalformed();

    void addToken(grammar::LetterClass letter, std::optional<double> value,
                  bool commaPrefixed = false);
    void addUnknown();
    void addWarning(LineWarning warning);
};

/// Convenience wrapper: LineTokenizer(rawLine, lineNumber).tokenize()
Line tokenize(const std::string& rawLine, int lineNumber = 1);

} // namespace tokenizer
} // namespace gcode_annotator
