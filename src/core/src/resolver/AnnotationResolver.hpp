#pragma once

/**
 * @file AnnotationResolver.hpp
 * @brief Maps tokens to profile-specific descriptions
 */

#include "../dictionary/DictionaryTypes.hpp"
#include "../modal/ModalTypes.hpp"
#include "../tokenizer/Token.hpp"
#include <optional>
#include <string>

namespace gcode_annotator {
namespace resolver {

struct AnnotationResult {
    tokenizer::Token token;
    std::string description;
    bool isModalCarry = false;   // explanation comes from inherited modal state
    bool isUnknown = false;      // lookup miss or malformed token

    bool operator==(const AnnotationResult& other) const {
        return token.rawText == other.token.rawText &&
               token.position == other.token.position &&
               token.letter == other.token.letter &&
               description == other.description &&
               isModalCarry == other.isModalCarry &&
               isUnknown == other.isUnknown;
    }
};

/**
 * Resolution details used by the engine to track sub-entry scopes
 */
struct Resolution {
    AnnotationResult result;
    const dictionary::DictionaryEntry* entry = nullptr;
    bool fromScope = false;
};

/**
 * Annotation Resolver
 *
 * Lookup order for a token:
 *   1. exact letter+value
 *   2. letter+range
 *   3. letter wildcard
 *   4. "Unknown code: <letter><value>"
 * Entries tied at one level resolve to the first declared. When a scope
 * (the `sub` entries of the previous word on the line) is given it is
 * searched before the dictionary.
 *
 * Pure: the result depends only on the arguments.
 */
class AnnotationResolver {
public:
    AnnotationResolver() = default;

    AnnotationResult annotate(const tokenizer::Token& token,
                              const modal::ModalContext& context,
                              const dictionary::ProfileDictionary& dictionary,
                              const dictionary::ProfileDictionary* scope = nullptr) const;

    Resolution resolve(const tokenizer::Token& token,
                       const modal::ModalContext& context,
                       const dictionary::ProfileDictionary& dictionary,
                       const dictionary::ProfileDictionary* scope = nullptr) const;

    /**
     * Carry annotation for a modal group the line relies on without
     * setting it. `anchor` is the word that triggered the inheritance.
     */
    AnnotationResult describeCarry(modal::ModalGroup group,
                                   const modal::ModalContext& context,
                                   const dictionary::ProfileDictionary& dictionary,
                                   const tokenizer::Token& anchor) const;

    /// Most specific matching entry, nullptr on a miss
    const dictionary::DictionaryEntry* findEntry(const tokenizer::Token& token,
                                                 const dictionary::ProfileDictionary& dictionary) const;

    /// Group whose value completes a description of this letter, if any
    std::optional<modal::ModalGroup> requiredContext(grammar::LetterClass letter) const;

    static std::string unknownDescription(const tokenizer::Token& token);

private:
    std::string render(const dictionary::DictionaryEntry& entry,
                       const tokenizer::Token& token,
                       const modal::ModalContext& context) const;

    std::optional<std::string> builtinDescription(const tokenizer::Token& token) const;
};

} // namespace resolver
} // namespace gcode_annotator
