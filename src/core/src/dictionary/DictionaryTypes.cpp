/**
 * @file DictionaryTypes.cpp
 * @brief Value pattern parsing and matching
 */

#include "DictionaryTypes.hpp"
#include "../grammar/TokenGrammar.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace gcode_annotator {
namespace dictionary {

namespace {

constexpr double kValueTolerance = 1e-6;

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::optional<double> parseNumber(const std::string& text) {
    std::string value = trim(text);
    if (!grammar::isNumericLiteral(value)) {
        return std::nullopt;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<ValuePattern> ValuePattern::parse(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value == "*") {
        return wildcard();
    }

    if (auto number = parseNumber(value)) {
        return exact(*number);
    }

    // Range separator: ".." or a '-' that follows a digit
    size_t split = value.find("..");
    size_t skip = 2;
    if (split == std::string::npos) {
        skip = 1;
        for (size_t i = 1; i < value.size(); ++i) {
            if (value[i] == '-' && (std::isdigit(static_cast<unsigned char>(value[i - 1])) ||
                                    value[i - 1] == '.' || value[i - 1] == ' ')) {
                split = i;
                break;
            }
        }
    }
    if (split == std::string::npos) {
        return std::nullopt;
    }

    auto low = parseNumber(value.substr(0, split));
    auto high = parseNumber(value.substr(split + skip));
    if (!low || !high) {
        return std::nullopt;
    }
    return range(std::min(*low, *high), std::max(*low, *high));
}

bool ValuePattern::matches(const std::optional<double>& value) const {
    switch (kind) {
        case Kind::WILDCARD:
            return true;
        case Kind::EXACT:
            return value && std::fabs(*value - low) < kValueTolerance;
        case Kind::RANGE:
            return value && *value >= low - kValueTolerance && *value <= high + kValueTolerance;
    }
    return false;
}

std::string ValuePattern::toString() const {
    switch (kind) {
        case Kind::EXACT: return grammar::formatValue(low);
        case Kind::RANGE: return grammar::formatValue(low) + ".." + grammar::formatValue(high);
        case Kind::WILDCARD: return "*";
    }
    return "*";
}

std::string normalizeKey(const std::string& key) {
    std::string result = key;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace dictionary
} // namespace gcode_annotator
