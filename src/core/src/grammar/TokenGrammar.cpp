/**
 * @file TokenGrammar.cpp
 * @brief Letter class tables
 */

#include "TokenGrammar.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>

namespace gcode_annotator {
namespace grammar {

namespace {

struct LetterEntry {
    char ch;
    LetterClass letter;
};

constexpr LetterEntry kLetters[] = {
    {'G', LetterClass::G}, {'M', LetterClass::M}, {'T', LetterClass::T},
    {'F', LetterClass::F}, {'S', LetterClass::S},
    {'X', LetterClass::X}, {'Y', LetterClass::Y}, {'Z', LetterClass::Z},
    {'I', LetterClass::I}, {'J', LetterClass::J}, {'K', LetterClass::K},
    {'R', LetterClass::R}, {'Q', LetterClass::Q}, {'N', LetterClass::N},
    {'C', LetterClass::C}, {'P', LetterClass::P},
    {'A', LetterClass::A}, {'B', LetterClass::B}, {'D', LetterClass::D},
    {'E', LetterClass::E}, {'H', LetterClass::H}, {'L', LetterClass::L},
    {'O', LetterClass::O}, {'U', LetterClass::U}, {'V', LetterClass::V},
    {'W', LetterClass::W},
};

} // namespace

std::optional<LetterClass> letterFromChar(char c) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (const auto& entry : kLetters) {
        if (entry.ch == upper) {
            return entry.letter;
        }
    }
    return std::nullopt;
}

char letterChar(LetterClass letter) {
    for (const auto& entry : kLetters) {
        if (entry.letter == letter) {
            return entry.ch;
        }
    }
    return '\0';
}

std::string letterKey(LetterClass letter) {
    switch (letter) {
        case LetterClass::MACRO: return "#";
        case LetterClass::PROGRAM_MARKER: return "%";
        case LetterClass::BLOCK_DELETE: return "/";
        case LetterClass::CHECKSUM: return "*";
        case LetterClass::UNKNOWN: return "";
        default: return std::string(1, letterChar(letter));
    }
}

std::optional<LetterClass> letterFromKey(std::string_view key) {
    if (key.size() != 1) {
        return std::nullopt;
    }
    switch (key[0]) {
        case '#': return LetterClass::MACRO;
        case '%': return LetterClass::PROGRAM_MARKER;
        case '/': return LetterClass::BLOCK_DELETE;
        case '*': return LetterClass::CHECKSUM;
        default: return letterFromChar(key[0]);
    }
}

HighlightCategory highlightCategory(LetterClass letter) {
    switch (letter) {
        case LetterClass::G: return HighlightCategory::PREPARATORY;
        case LetterClass::M: return HighlightCategory::MISCELLANEOUS;
        case LetterClass::F: return HighlightCategory::FEED;
        case LetterClass::S: return HighlightCategory::SPINDLE;
        case LetterClass::T: return HighlightCategory::TOOL;
        case LetterClass::X: return HighlightCategory::AXIS_X;
        case LetterClass::Y: return HighlightCategory::AXIS_Y;
        case LetterClass::Z: return HighlightCategory::AXIS_Z;
        case LetterClass::A:
        case LetterClass::B:
        case LetterClass::U:
        case LetterClass::V:
        case LetterClass::W: return HighlightCategory::AXIS_OTHER;
        case LetterClass::I:
        case LetterClass::J:
        case LetterClass::K: return HighlightCategory::ARC_OFFSET;
        case LetterClass::C: return HighlightCategory::CHAMFER;
        case LetterClass::P: return HighlightCategory::DWELL;
        case LetterClass::MACRO: return HighlightCategory::MACRO;
        case LetterClass::PROGRAM_MARKER:
        case LetterClass::BLOCK_DELETE:
        case LetterClass::CHECKSUM: return HighlightCategory::MARKER;
        case LetterClass::UNKNOWN: return HighlightCategory::ERROR;
        default: return HighlightCategory::PARAMETER;
    }
}

bool isCoordinateLetter(LetterClass letter) {
    switch (letter) {
        case LetterClass::X:
        case LetterClass::Y:
        case LetterClass::Z:
        case LetterClass::I:
        case LetterClass::J:
        case LetterClass::K:
            return true;
        default:
            return false;
    }
}

bool isNumericLiteral(std::string_view text) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }

    int digits = 0;
    int points = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++digits;
        } else if (c == '.') {
            if (++points > 1) return false;
        } else {
            return false;
        }
    }
    return digits > 0;
}

std::string formatValue(double value) {
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    // Large magnitudes print hundreds of digits; size the buffer from the first pass
    int length = std::snprintf(nullptr, 0, "%.6f", value);
    if (length <= 0) {
        return std::to_string(value);
    }
    std::string text(static_cast<size_t>(length) + 1, '\0');
    std::snprintf(&text[0], text.size(), "%.6f", value);
    text.resize(static_cast<size_t>(length));

    if (text.find('.') != std::string::npos) {
        while (text.back() == '0') text.pop_back();
        if (text.back() == '.') text.pop_back();
    }
    return text;
}

} // namespace grammar
} // namespace gcode_annotator
