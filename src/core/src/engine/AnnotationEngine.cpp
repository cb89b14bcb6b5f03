/**
 * @file AnnotationEngine.cpp
 * @brief Annotation Engine implementation
 */

#include "AnnotationEngine.hpp"
#include "../logging/Logger.hpp"
#include "../tokenizer/LineTokenizer.hpp"
#include <algorithm>
#include <chrono>

namespace gcode_annotator {
namespace engine {

using dictionary::ProfileDictionary;
using modal::ModalContext;

AnnotationEngine::AnnotationEngine()
    : m_dictionary(std::make_shared<const ProfileDictionary>()) {}

AnnotationEngine::AnnotationEngine(ProfileDictionary entries)
    : m_dictionary(std::make_shared<const ProfileDictionary>(std::move(entries))) {}

void AnnotationEngine::setActiveDictionary(ProfileDictionary entries) {
    // Build outside the lock; only the pointer swap is guarded
    auto next = std::make_shared<const ProfileDictionary>(std::move(entries));
    size_t count = next->size();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_dictionary = std::move(next);
    }
    LOG_DEBUG("Active dictionary replaced ({} entries)", count);
}

std::shared_ptr<const ProfileDictionary> AnnotationEngine::activeDictionary() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dictionary;
}

DocumentAnnotation AnnotationEngine::annotateDocument(const std::string& text) const {
    AnnotationOptions options;
    return *annotateDocument(text, options);
}

std::optional<DocumentAnnotation> AnnotationEngine::annotateDocument(const std::string& text,
                                                                     const AnnotationOptions& options) const {
    auto start = std::chrono::steady_clock::now();

    const auto dictionary = activeDictionary();
    const auto lines = splitLines(text);
    const size_t total = lines.size();
    const size_t batchSize = std::max<size_t>(options.batchSize, 1);

    ModalContext context = options.initialContext;
    DocumentAnnotation document;
    document.reserve(total);
    size_t batchStart = 0;

    for (size_t i = 0; i < total; ++i) {
        if (options.cancel && options.cancel->load()) {
            LOG_WARN("Annotation pass cancelled at line {} of {}", i + 1, total);
            return std::nullopt;
        }

        auto line = tokenizer::tokenize(lines[i], static_cast<int>(i + 1));
        document.push_back(annotateLine(line, context, *dictionary));

        if (options.onBatch && (document.size() - batchStart == batchSize || i + 1 == total)) {
            std::vector<LineAnnotation> batch(document.begin() + static_cast<std::ptrdiff_t>(batchStart),
                                              document.end());
            options.onBatch(batch, i + 1, total);
            batchStart = document.size();
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_DEBUG("Annotated {} lines with {} dictionary entries in {} us",
              total, dictionary->size(), elapsed.count());
    return document;
}

LineAnnotation AnnotationEngine::annotateLine(const tokenizer::Line& line,
                                              ModalContext& context,
                                              const ProfileDictionary& dictionary) const {
    auto update = m_tracker.apply(line, context);
    context = update.context;

    LineAnnotation annotation;
    annotation.lineNumber = line.lineNumber;
    annotation.commentText = line.commentText();
    annotation.warnings = line.warnings;
    annotation.results.reserve(line.tokens.size() + update.implied.size());

    const ProfileDictionary* scope = nullptr;
    bool carryEmitted = update.implied.empty();

    for (size_t i = 0; i < line.tokens.size(); ++i) {
        const auto& token = line.tokens[i];

        // Inherited motion mode is explained right before the first coordinate word
        if (!carryEmitted && grammar::isCoordinateLetter(token.letter) && !token.commaPrefixed) {
            for (auto group : update.implied) {
                annotation.results.push_back(m_resolver.describeCarry(group, context, dictionary, token));
            }
            carryEmitted = true;
        }

        auto resolution = m_resolver.resolve(token, context, dictionary, scope);
        resolution.result.isModalCarry = update.carry[i];

        if (resolution.entry && !resolution.fromScope) {
            scope = resolution.entry->sub.empty() ? nullptr : &resolution.entry->sub;
        }

        annotation.results.push_back(std::move(resolution.result));
    }

    return annotation;
}

std::vector<std::vector<TokenSpan>> AnnotationEngine::tokenSpans(const std::string& text) const {
    const auto lines = splitLines(text);
    std::vector<std::vector<TokenSpan>> spans;
    spans.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = tokenizer::tokenize(lines[i], static_cast<int>(i + 1));

        std::vector<TokenSpan> lineSpans;
        for (const auto& token : line.tokens) {
            lineSpans.push_back({token.position, token.rawText.size(),
                                 grammar::highlightCategory(token.letter)});
        }
        for (const auto& comment : line.comments) {
            lineSpans.push_back({comment.position, comment.rawText.size(),
                                 grammar::HighlightCategory::COMMENT});
        }
        std::sort(lineSpans.begin(), lineSpans.end(),
                  [](const TokenSpan& a, const TokenSpan& b) { return a.position < b.position; });
        spans.push_back(std::move(lineSpans));
    }
    return spans;
}

std::vector<std::string> AnnotationEngine::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t begin = 0;
    while (true) {
        size_t end = text.find('\n', begin);
        if (end == std::string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
    return lines;
}

std::string AnnotationEngine::formatLine(const LineAnnotation& line) {
    std::string text;
    for (const auto& result : line.results) {
        if (!text.empty()) text += ", ";
        text += result.description;
    }
    if (!line.commentText.empty()) {
        if (!text.empty()) text += ", ";
        text += "Comment - " + line.commentText;
    }
    return text;
}

} // namespace engine
} // namespace gcode_annotator
