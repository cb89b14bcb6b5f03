/**
 * @file Token.cpp
 * @brief Token and Line helpers
 */

#include "Token.hpp"
#include <algorithm>
#include <cctype>

namespace gcode_annotator {
namespace tokenizer {

using grammar::LetterClass;

std::string Token::valueText() const {
    switch (letter) {
        case LetterClass::UNKNOWN:
            return rawText;
        case LetterClass::PROGRAM_MARKER:
        case LetterClass::BLOCK_DELETE:
            return "";
        case LetterClass::MACRO:
        case LetterClass::CHECKSUM:
            return rawText.substr(1);
        default:
            return rawText.substr(commaPrefixed ? 2 : 1);
    }
}

std::string Token::code() const {
    if (isUnknown()) {
        return rawText;
    }
    std::string result = commaPrefixed ? "," : "";
    result += grammar::letterKey(letter);
    result += valueText();
    return result;
}

std::string Line::commentText() const {
    std::string result;
    for (const auto& comment : comments) {
        if (comment.text.empty()) continue;
        if (!result.empty()) result += ' ';
        result += comment.text;
    }
    return result;
}

bool Line::hasWarning(LineWarning warning) const {
    return std::find(warnings.begin(), warnings.end(), warning) != warnings.end();
}

std::string Line::reconstruct() const {
    struct Piece {
        size_t position;
        const std::string* text;
    };

    std::vector<Piece> pieces;
    pieces.reserve(tokens.size() + comments.size());
    for (const auto& token : tokens) pieces.push_back({token.position, &token.rawText});
    for (const auto& comment : comments) pieces.push_back({comment.position, &comment.rawText});
    std::sort(pieces.begin(), pieces.end(),
              [](const Piece& a, const Piece& b) { return a.position < b.position; });

    std::string result;
    result.reserve(source.size());
    size_t cursor = 0;
    for (const auto& piece : pieces) {
        if (piece.position > cursor && piece.position <= source.size()) {
            result.append(source, cursor, piece.position - cursor);
        }
        result += *piece.text;
        cursor = piece.position + piece.text->size();
    }
    if (cursor < source.size()) {
        result.append(source, cursor, std::string::npos);
    }
    return result;
}

} // namespace tokenizer
} // namespace gcode_annotator
