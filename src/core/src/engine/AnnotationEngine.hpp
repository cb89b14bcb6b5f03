#pragma once

/**
 * @file AnnotationEngine.hpp
 * @brief Document-level annotation pass used by the presentation layer
 */

#include "../dictionary/DictionaryTypes.hpp"
#include "../grammar/TokenGrammar.hpp"
#include "../modal/ModalStateTracker.hpp"
#include "../resolver/AnnotationResolver.hpp"
#include "../tokenizer/Token.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gcode_annotator {
namespace engine {

/**
 * Annotations of one source line
 */
struct LineAnnotation {
    int lineNumber = 1;
    std::vector<resolver::AnnotationResult> results;
    std::string commentText;
    std::vector<tokenizer::LineWarning> warnings;

    bool isBlank() const { return results.empty() && commentText.empty(); }

    bool operator==(const LineAnnotation& other) const {
        return lineNumber == other.lineNumber && results == other.results &&
               commentText == other.commentText && warnings == other.warnings;
    }
};

/// One entry per source line, in order
using DocumentAnnotation = std::vector<LineAnnotation>;

/**
 * Highlight overlay span
 */
struct TokenSpan {
    size_t position = 0;
    size_t length = 0;
    grammar::HighlightCategory category = grammar::HighlightCategory::ERROR;
};

/// Receives each completed batch of lines during a pass
using BatchCallback = std::function<void(const std::vector<LineAnnotation>& batch,
                                         size_t linesDone, size_t totalLines)>;

struct AnnotationOptions {
    const std::atomic<bool>* cancel = nullptr;   // checked before every line
    size_t batchSize = 256;
    BatchCallback onBatch;
    modal::ModalContext initialContext;
};

/**
 * Annotation Engine
 *
 * Each pass takes one snapshot of the active dictionary and threads a fresh
 * ModalContext through the lines top to bottom. setActiveDictionary() swaps
 * the snapshot atomically, so a pass never sees entries from two
 * dictionaries.
 */
class AnnotationEngine {
public:
    AnnotationEngine();
    explicit AnnotationEngine(dictionary::ProfileDictionary entries);

    AnnotationEngine(const AnnotationEngine&) = delete;
    AnnotationEngine& operator=(const AnnotationEngine&) = delete;

    /// Replace the dictionary used by subsequent passes
    void setActiveDictionary(dictionary::ProfileDictionary entries);

    std::shared_ptr<const dictionary::ProfileDictionary> activeDictionary() const;

    /// Annotate a whole document; never fails
    DocumentAnnotation annotateDocument(const std::string& text) const;

    /**
     * Cancellable pass
     * @return nullopt if cancelled; partial results are discarded
     */
    std::optional<DocumentAnnotation> annotateDocument(const std::string& text,
                                                       const AnnotationOptions& options) const;

    /**
     * Annotate one tokenized line and advance `context` past it
     */
    LineAnnotation annotateLine(const tokenizer::Line& line,
                                modal::ModalContext& context,
                                const dictionary::ProfileDictionary& dictionary) const;

    /// Per-line highlight spans (tokens and comments) in column order
    std::vector<std::vector<TokenSpan>> tokenSpans(const std::string& text) const;

    /// Split on '\n'; N newlines always give N + 1 lines
    static std::vector<std::string> splitLines(const std::string& text);

    /**
     * Annotation pane text: descriptions joined by ", " followed by
     * "Comment - <text>"; blank lines render empty.
     */
    static std::string formatLine(const LineAnnotation& line);

private:
    modal::ModalStateTracker m_tracker;
    resolver::AnnotationResolver m_resolver;

    std::shared_ptr<const dictionary::ProfileDictionary> m_dictionary;
    mutable std::mutex m_mutex;
};

} // namespace engine
} // namespace gcode_annotator
