/**
 * @file LineTokenizer.cpp
 * @brief Line tokenizer implementation
 */

#include "LineTokenizer.hpp"
#include <cctype>
#include <stdexcept>

namespace gcode_annotator {
namespace tokenizer {

using grammar::LetterClass;

namespace {

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Characters that start a new word or comment and so end a malformed run
bool startsWord(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == ';' || c == '(' ||
           c == '%' || c == '#' || c == ',' || c == '*';
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

LineTokenizer::LineTokenizer(std::string source, int lineNumber)
    : m_source(std::move(source)) {
    m_line.lineNumber = lineNumber;
    m_line.source = m_source;
}

Line LineTokenizer::tokenize() {
    while (!isAtEnd()) {
        m_start = m_current;
        scanWord();
    }
    return m_line;
}

bool LineTokenizer::isAtEnd() const {
    return m_current >= m_source.length();
}

char LineTokenizer::advance() {
    return m_source[m_current++];
}

char LineTokenizer::peek() const {
    if (isAtEnd()) return '\0';
    return m_source[m_current];
}

void LineTokenizer::scanWord() {
    char c = advance();

    if (isBlank(c)) {
        return;
    }

    switch (c) {
        case ';':
            scanLineComment();
            break;

        case '(':
            scanParenComment();
            break;

        case '%':
            addToken(LetterClass::PROGRAM_MARKER, std::nullopt);
            break;

        case '/':
            // Block delete is only meaningful before the first word
            if (m_seenWord) {
                scanMalformed();
            } else {
                addToken(LetterClass::BLOCK_DELETE, std::nullopt);
            }
            break;

        case '#':
            scanDigitsWord(LetterClass::MACRO);
            break;

        case '*':
            scanDigitsWord(LetterClass::CHECKSUM);
            break;

        case ',':
            if (grammar::letterFromChar(peek())) {
                advance();
                scanAddress(true);
            } else {
                scanMalformed();
            }
            break;

        default:
            if (grammar::letterFromChar(c)) {
                scanAddress(false);
            } else {
                scanMalformed();
            }
            break;
    }
}

void LineTokenizer::scanAddress(bool commaPrefixed) {
    LetterClass letter = *grammar::letterFromChar(m_source[m_current - 1]);
    size_t valueStart = m_current;

    if (peek() == '+' || peek() == '-') {
        advance();
    }
    while (isDigit(peek()) || peek() == '.') {
        advance();
    }

    std::string valueText = m_source.substr(valueStart, m_current - valueStart);
    if (!grammar::isNumericLiteral(valueText)) {
        addUnknown();
        return;
    }

    try {
        addToken(letter, std::stod(valueText), commaPrefixed);
    } catch (const std::out_of_range&) {
        addUnknown();
    } catch (const std::invalid_argument&) {
        addUnknown();
    }
}

void LineTokenizer::scanDigitsWord(LetterClass letter) {
    size_t valueStart = m_current;
    while (isDigit(peek())) {
        advance();
    }

    if (m_current == valueStart) {
        scanMalformed();
        return;
    }

    try {
        addToken(letter, std::stod(m_source.substr(valueStart, m_current - valueStart)));
    } catch (const std::out_of_range&) {
        addUnknown();
    }
}

void LineTokenizer::scanParenComment() {
    Comment comment;
    comment.position = m_start;

    size_t close = m_source.find(')', m_current);
    if (close == std::string::npos) {
        m_current = m_source.length();
        comment.terminated = false;
        comment.text = trim(m_source.substr(m_start + 1));
        addWarning(LineWarning::UNTERMINATED_COMMENT);
    } else {
        m_current = close + 1;
        comment.text = trim(m_source.substr(m_start + 1, close - m_start - 1));
    }

    comment.rawText = m_source.substr(m_start, m_current - m_start);
    m_line.comments.push_back(std::move(comment));
}

void LineTokenizer::scanLineComment() {
    Comment comment;
    comment.position = m_start;
    comment.rawText = m_source.substr(m_start);
    comment.text = trim(m_source.substr(m_start + 1));
    m_current = m_source.length();
    m_line.comments.push_back(std::move(comment));
}

void LineTokenizer::scanMalformed() {
    while (!isAtEnd() && !isBlank(peek()) && !startsWord(peek())) {
        advance();
    }
    addUnknown();
}

void LineTokenizer::addToken(LetterClass letter, std::optional<double> value, bool commaPrefixed) {
    Token token;
    token.letter = letter;
    token.rawText = m_source.substr(m_start, m_current - m_start);
    token.numericValue = value;
    token.position = m_start;
    token.commaPrefixed = commaPrefixed;
    m_line.tokens.push_back(std::move(token));
    m_seenWord = true;
}

void LineTokenizer::addUnknown() {
    Token token;
    token.rawText = m_source.substr(m_start, m_current - m_start);
    token.position = m_start;
    m_line.tokens.push_back(std::move(token));
    m_seenWord = true;
    addWarning(LineWarning::MALFORMED_FRAGMENT);
}

void LineTokenizer::addWarning(LineWarning warning) {
    if (!m_line.hasWarning(warning)) {
        m_line.warnings.push_back(warning);
    }
}

Line tokenize(const std::string& rawLine, int lineNumber) {
    return LineTokenizer(rawLine, lineNumber).tokenize();
}

} // namespace tokenizer
} // namespace gcode_annotator
