#pragma once

/**
 * @file ModalStateTracker.hpp
 * @brief Applies a tokenized line to the modal context
 */

#include "ModalTypes.hpp"
#include "../tokenizer/Token.hpp"
#include <optional>
#include <vector>

namespace gcode_annotator {
namespace modal {

/**
 * Result of applying one line
 */
struct ModalUpdate {
    ModalContext context;                           // context after the line
    std::vector<bool> carry;                        // per token, parallel to line.tokens
    std::vector<std::optional<ModalGroup>> sets;    // group each token set, if any
    std::vector<ModalGroup> implied;                // groups inherited to explain the line
};

/**
 * Modal State Tracker
 *
 * Stateless rule table. Lines must be applied in document order starting
 * from a fresh context; the same document always yields the same contexts.
 */
class ModalStateTracker {
public:
    ModalStateTracker();

    ModalUpdate apply(const tokenizer::Line& line, const ModalContext& context) const;

    /// Modal group a token sets, if it is a modal-setting combination
    std::optional<ModalGroup> groupFor(const tokenizer::Token& token) const;

    /// G4/G10/G28/G30/G52/G53/G92 consume the axis words of their block
    bool consumesAxisWords(const tokenizer::Token& token) const;

private:
    struct ModalRule {
        grammar::LetterClass letter;
        std::optional<double> value;    // nullopt matches any value
        ModalGroup group;
    };

    std::vector<ModalRule> m_rules;
    std::vector<double> m_axisConsumingCodes;
};

} // namespace modal
} // namespace gcode_annotator
