/**
 * @file ModalStateTracker.cpp
 * @brief Modal rule table and line application
 */

#include "ModalStateTracker.hpp"
#include <algorithm>
#include <cmath>

namespace gcode_annotator {
namespace modal {

using grammar::LetterClass;

namespace {

constexpr double kValueTolerance = 1e-6;

bool sameValue(double a, double b) {
    return std::fabs(a - b) < kValueTolerance;
}

} // namespace

ModalStateTracker::ModalStateTracker() {
    auto addCodes = [this](LetterClass letter, std::initializer_list<double> values, ModalGroup group) {
        for (double v : values) {
            m_rules.push_back({letter, v, group});
        }
    };

    addCodes(LetterClass::G, {0, 1, 2, 3, 73, 74, 76, 80, 81, 82, 83, 84, 85, 86, 87, 88, 89},
             ModalGroup::MOTION);
    addCodes(LetterClass::G, {17, 18, 19}, ModalGroup::PLANE);
    addCodes(LetterClass::G, {90, 91}, ModalGroup::POSITIONING);
    addCodes(LetterClass::G, {20, 21}, ModalGroup::UNITS);
    addCodes(LetterClass::G, {93, 94, 95}, ModalGroup::FEED_MODE);
    addCodes(LetterClass::G, {54, 55, 56, 57, 58, 59}, ModalGroup::COORDINATE_SYSTEM);
    addCodes(LetterClass::M, {3, 4, 5}, ModalGroup::SPINDLE);
    addCodes(LetterClass::M, {7, 8, 9}, ModalGroup::COOLANT);

    m_rules.push_back({LetterClass::T, std::nullopt, ModalGroup::TOOL});
    m_rules.push_back({LetterClass::S, std::nullopt, ModalGroup::SPINDLE_SPEED});
    m_rules.push_back({LetterClass::F, std::nullopt, ModalGroup::FEED_RATE});

    m_axisConsumingCodes = {4, 10, 28, 30, 52, 53, 92};
}

std::optional<ModalGroup> ModalStateTracker::groupFor(const tokenizer::Token& token) const {
    if (!token.numericValue || token.commaPrefixed) {
        return std::nullopt;
    }

    for (const auto& rule : m_rules) {
        if (rule.letter != token.letter) continue;
        if (!rule.value || sameValue(*rule.value, *token.numericValue)) {
            return rule.group;
        }
    }
    return std::nullopt;
}

bool ModalStateTracker::consumesAxisWords(const tokenizer::Token& token) const {
    if (token.letter != LetterClass::G || !token.numericValue) {
        return false;
    }
    return std::any_of(m_axisConsumingCodes.begin(), m_axisConsumingCodes.end(),
                       [&](double code) { return sameValue(code, *token.numericValue); });
}

ModalUpdate ModalStateTracker::apply(const tokenizer::Line& line, const ModalContext& context) const {
    ModalUpdate update;
    update.context = context;
    update.carry.assign(line.tokens.size(), false);
    update.sets.assign(line.tokens.size(), std::nullopt);

    bool hasMotionWord = false;
    bool hasCoordinate = false;
    bool axisWordsConsumed = false;

    for (size_t i = 0; i < line.tokens.size(); ++i) {
        const auto& token = line.tokens[i];

        if (grammar::isCoordinateLetter(token.letter) && !token.commaPrefixed) {
            hasCoordinate = true;
        }
        if (consumesAxisWords(token)) {
            axisWordsConsumed = true;
        }

        auto group = groupFor(token);
        if (!group) continue;

        ModalValue value;
        value.value = *token.numericValue;
        value.code = grammar::letterKey(token.letter) + grammar::formatValue(value.value);
        update.context.set(*group, std::move(value));
        update.sets[i] = group;

        if (*group == ModalGroup::MOTION) {
            hasMotionWord = true;
        }
    }

    if (hasCoordinate && !hasMotionWord && !axisWordsConsumed) {
        update.implied.push_back(ModalGroup::MOTION);
    }

    return update;
}

} // namespace modal
} // namespace gcode_annotator
