/**
 * @file AnnotationResolver.cpp
 * @brief Annotation Resolver implementation
 */

#include "AnnotationResolver.hpp"

namespace gcode_annotator {
namespace resolver {

using dictionary::DictionaryEntry;
using dictionary::ProfileDictionary;
using dictionary::ValuePattern;
using grammar::LetterClass;
using modal::ModalContext;
using modal::ModalGroup;

namespace {

constexpr ModalGroup kAllGroups[] = {
    ModalGroup::MOTION, ModalGroup::PLANE, ModalGroup::POSITIONING, ModalGroup::UNITS,
    ModalGroup::FEED_MODE, ModalGroup::COORDINATE_SYSTEM, ModalGroup::SPINDLE,
    ModalGroup::COOLANT, ModalGroup::TOOL, ModalGroup::SPINDLE_SPEED, ModalGroup::FEED_RATE,
};

bool replaceAll(std::string& text, const std::string& from, const std::string& to) {
    bool replaced = false;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
        replaced = true;
    }
    return replaced;
}

std::string tokenKey(const tokenizer::Token& token) {
    return (token.commaPrefixed ? "," : "") + grammar::letterKey(token.letter);
}

/// "G90" for G090 / G90.0, matching how the modal tracker records codes
std::string canonicalCode(const tokenizer::Token& token) {
    if (!token.numericValue) {
        return token.code();
    }
    return grammar::letterKey(token.letter) + grammar::formatValue(*token.numericValue);
}

} // namespace

AnnotationResult AnnotationResolver::annotate(const tokenizer::Token& token,
                                              const ModalContext& context,
                                              const ProfileDictionary& dictionary,
                                              const ProfileDictionary* scope) const {
    return resolve(token, context, dictionary, scope).result;
}

Resolution AnnotationResolver::resolve(const tokenizer::Token& token,
                                       const ModalContext& context,
                                       const ProfileDictionary& dictionary,
                                       const ProfileDictionary* scope) const {
    Resolution resolution;
    resolution.result.token = token;

    if (token.isUnknown()) {
        resolution.result.description = unknownDescription(token);
        resolution.result.isUnknown = true;
        return resolution;
    }

    const DictionaryEntry* entry = nullptr;
    if (scope) {
        entry = findEntry(token, *scope);
        resolution.fromScope = entry != nullptr;
    }
    if (!entry) {
        entry = findEntry(token, dictionary);
    }

    if (entry) {
        resolution.entry = entry;
        resolution.result.description = render(*entry, token, context);
        return resolution;
    }

    if (auto builtin = builtinDescription(token)) {
        resolution.result.description = *builtin;
        return resolution;
    }

    resolution.result.description = unknownDescription(token);
    resolution.result.isUnknown = true;
    return resolution;
}

AnnotationResult AnnotationResolver::describeCarry(ModalGroup group,
                                                   const ModalContext& context,
                                                   const ProfileDictionary& dictionary,
                                                   const tokenizer::Token& anchor) const {
    AnnotationResult result;
    result.isModalCarry = true;
    result.token.position = anchor.position;

    const auto& value = context.get(group);
    if (!value) {
        result.description = modal::describeModalValue(group, value);
        return result;
    }

    // Synthetic word standing for the inherited code; it has no source text
    auto letter = grammar::letterFromKey(value->code.substr(0, 1));
    result.token.letter = letter ? *letter : LetterClass::UNKNOWN;
    result.token.numericValue = value->value;

    if (letter) {
        tokenizer::Token probe = result.token;
        probe.rawText = value->code;
        const DictionaryEntry* entry = findEntry(probe, dictionary);
        if (entry && entry->pattern.kind == ValuePattern::Kind::EXACT) {
            result.description = render(*entry, probe, context) + " (modal)";
            return result;
        }
    }

    result.description = modal::describeModalValue(group, value) + " (modal)";
    return result;
}

const DictionaryEntry* AnnotationResolver::findEntry(const tokenizer::Token& token,
                                                     const ProfileDictionary& dictionary) const {
    if (token.isUnknown()) {
        return nullptr;
    }

    const std::string key = tokenKey(token);
    const DictionaryEntry* best = nullptr;
    int bestSpecificity = 3;

    for (const auto& entry : dictionary) {
        if (entry.letter != key) continue;
        if (!entry.pattern.matches(token.numericValue)) continue;

        int specificity = entry.pattern.specificity();
        // Strictly better only, so the first declared entry wins a tie
        if (specificity < bestSpecificity) {
            best = &entry;
            bestSpecificity = specificity;
            if (specificity == 0) break;
        }
    }
    return best;
}

std::optional<ModalGroup> AnnotationResolver::requiredContext(LetterClass letter) const {
    switch (letter) {
        case LetterClass::X:
        case LetterClass::Y:
        case LetterClass::Z:
            return ModalGroup::POSITIONING;
        case LetterClass::I:
        case LetterClass::J:
        case LetterClass::K:
            return ModalGroup::MOTION;
        default:
            return std::nullopt;
    }
}

std::string AnnotationResolver::unknownDescription(const tokenizer::Token& token) {
    return "Unknown code: " + token.code();
}

std::string AnnotationResolver::render(const DictionaryEntry& entry,
                                       const tokenizer::Token& token,
                                       const ModalContext& context) const {
    std::string text = entry.description;
    const std::string value = token.valueText();

    bool hasValue = replaceAll(text, "{value}", value);
    bool hasCode = replaceAll(text, "{code}", token.code());

    bool referenced[modal::kModalGroupCount] = {};
    for (ModalGroup group : kAllGroups) {
        const std::string placeholder = "{" + modal::modalGroupToString(group) + "}";
        if (replaceAll(text, placeholder, modal::describeModalValue(group, context.get(group)))) {
            referenced[static_cast<size_t>(group)] = true;
        }
    }

    if (entry.pattern.kind != ValuePattern::Kind::EXACT && !hasValue && !hasCode && !value.empty()) {
        text += " = " + value;
    }

    std::optional<ModalGroup> required = entry.modalGroup ? entry.modalGroup
                                                          : requiredContext(token.letter);
    if (token.commaPrefixed) {
        required = entry.modalGroup;
    }
    if (required && !referenced[static_cast<size_t>(*required)]) {
        const auto& current = context.get(*required);
        // A word that sets the group itself needs no qualifier
        bool setsItself = current && current->code == canonicalCode(token);
        if (!setsItself) {
            text += " (" + modal::describeModalValue(*required, current) + ")";
        }
    }

    return text;
}

std::optional<std::string> AnnotationResolver::builtinDescription(const tokenizer::Token& token) const {
    switch (token.letter) {
        case LetterClass::MACRO:
            return "Macro variable " + token.rawText;
        case LetterClass::CHECKSUM:
            return "Checksum = " + token.valueText();
        case LetterClass::BLOCK_DELETE:
            return std::string("Block skip");
        default:
            return std::nullopt;
    }
}

} // namespace resolver
} // namespace gcode_annotator
