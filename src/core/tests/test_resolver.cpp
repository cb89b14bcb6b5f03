/**
 * @file test_resolver.cpp
 * @brief Annotation resolver tests
 */

#include <gtest/gtest.h>
#include "resolver/AnnotationResolver.hpp"
#include "tokenizer/LineTokenizer.hpp"
#include "logging/Logger.hpp"

using namespace gcode_annotator;
using namespace gcode_annotator::resolver;
using dictionary::DictionaryEntry;
using dictionary::ProfileDictionary;
using dictionary::ValuePattern;
using modal::ModalContext;
using modal::ModalGroup;
using modal::ModalValue;

namespace {

DictionaryEntry entry(const std::string& letter, ValuePattern pattern, const std::string& description,
                      std::optional<ModalGroup> group = std::nullopt,
                      std::vector<DictionaryEntry> sub = {}) {
    DictionaryEntry e;
    e.letter = letter;
    e.pattern = pattern;
    e.description = description;
    e.modalGroup = group;
    e.sub = std::move(sub);
    return e;
}

tokenizer::Token word(const std::string& text) {
    auto line = tokenizer::tokenize(text);
    return line.tokens.at(0);
}

ModalContext contextWith(ModalGroup group, const std::string& code, double value) {
    ModalContext context;
    context.set(group, ModalValue{code, value});
    return context;
}

} // namespace

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_resolver.log", "debug");

        dict = {
            entry("G", ValuePattern::exact(0), "Rapid move"),
            entry("G", ValuePattern::exact(1), "Linear move"),
            entry("G", ValuePattern::range(81, 89), "Canned cycle {code}"),
            entry("G", ValuePattern::exact(90), "Absolute positioning", ModalGroup::POSITIONING),
            entry("F", ValuePattern::wildcard(), "Feed rate"),
            entry("F", ValuePattern::exact(100), "Feed rate one hundred"),
            entry("X", ValuePattern::wildcard(), "X position"),
            entry("I", ValuePattern::wildcard(), "Arc centre X offset"),
            entry(",R", ValuePattern::wildcard(), "Corner rounding radius"),
            entry("%", ValuePattern::wildcard(), "Program start/end"),
        };
    }

    AnnotationResolver resolver;
    ProfileDictionary dict;
    ModalContext empty;
};

// ============================================================================
// Lookup order
// ============================================================================

TEST_F(ResolverTest, ExactBeatsWildcardRegardlessOfOrder) {
    auto result = resolver.annotate(word("F100"), empty, dict);
    EXPECT_EQ(result.description, "Feed rate one hundred");
    EXPECT_FALSE(result.isUnknown);
    EXPECT_FALSE(result.isModalCarry);
}

TEST_F(ResolverTest, WildcardAppendsValue) {
    EXPECT_EQ(resolver.annotate(word("F250"), empty, dict).description, "Feed rate = 250");
}

TEST_F(ResolverTest, RangeWithCodePlaceholder) {
    auto result = resolver.annotate(word("G82"), empty, dict);
    EXPECT_EQ(result.description, "Canned cycle G82");
}

TEST_F(ResolverTest, RangeBeatsWildcard) {
    dict.push_back(entry("G", ValuePattern::wildcard(), "Preparatory code"));

    EXPECT_EQ(resolver.annotate(word("G85"), empty, dict).description, "Canned cycle G85");
    EXPECT_EQ(resolver.annotate(word("G200"), empty, dict).description, "Preparatory code = 200");
}

TEST_F(ResolverTest, ExactBeatsEarlierRange) {
    ProfileDictionary ordered = {
        entry("M", ValuePattern::range(0, 99), "Machine function"),
        entry("M", ValuePattern::exact(30), "Program end and rewind"),
    };
    EXPECT_EQ(resolver.annotate(word("M30"), empty, ordered).description, "Program end and rewind");
    EXPECT_EQ(resolver.annotate(word("M31"), empty, ordered).description, "Machine function = 31");
}

TEST_F(ResolverTest, FirstDeclaredEntryWinsTie) {
    ProfileDictionary ordered = {
        entry("M", ValuePattern::exact(6), "Tool change"),
        entry("M", ValuePattern::exact(6), "Automatic tool change"),
    };
    EXPECT_EQ(resolver.annotate(word("M6"), empty, ordered).description, "Tool change");
    EXPECT_EQ(resolver.findEntry(word("M06"), ordered), &ordered[0]);
}

TEST_F(ResolverTest, LowercaseAndPaddedWordsMatch) {
    EXPECT_EQ(resolver.annotate(word("g01"), empty, dict).description, "Linear move");
    EXPECT_EQ(resolver.annotate(word("G1.0"), empty, dict).description, "Linear move");
}

// ============================================================================
// Unknown codes
// ============================================================================

TEST_F(ResolverTest, MissingCodeIsUnknown) {
    auto result = resolver.annotate(word("G200"), empty, dict);
    EXPECT_TRUE(result.isUnknown);
    EXPECT_EQ(result.description, "Unknown code: G200");
}

TEST_F(ResolverTest, MalformedTokenIsUnknown) {
    auto result = resolver.annotate(word("X1.2.3"), empty, dict);
    EXPECT_TRUE(result.isUnknown);
    EXPECT_EQ(result.description, "Unknown code: X1.2.3");
}

TEST_F(ResolverTest, EmptyDictionaryMarksEverythingUnknown) {
    ProfileDictionary none;
    auto result = resolver.annotate(word("G1"), empty, none);
    EXPECT_TRUE(result.isUnknown);
    EXPECT_EQ(result.description, "Unknown code: G1");
}

// ============================================================================
// Modal context
// ============================================================================

TEST_F(ResolverTest, CoordinateQualifiedByPositioning) {
    auto absolute = contextWith(ModalGroup::POSITIONING, "G90", 90);
    auto incremental = contextWith(ModalGroup::POSITIONING, "G91", 91);

    EXPECT_EQ(resolver.annotate(word("X10"), absolute, dict).description,
              "X position = 10 (absolute positioning)");
    EXPECT_EQ(resolver.annotate(word("X10"), incremental, dict).description,
              "X position = 10 (incremental positioning)");
    EXPECT_EQ(resolver.annotate(word("X10"), empty, dict).description,
              "X position = 10 (undefined positioning mode)");
}

TEST_F(ResolverTest, ArcOffsetQualifiedByMotion) {
    auto arc = contextWith(ModalGroup::MOTION, "G2", 2);
    EXPECT_EQ(resolver.annotate(word("I-5"), arc, dict).description,
              "Arc centre X offset = -5 (clockwise arc)");
}

TEST_F(ResolverTest, WordSettingItsOwnGroupHasNoQualifier) {
    auto absolute = contextWith(ModalGroup::POSITIONING, "G90", 90);
    EXPECT_EQ(resolver.annotate(word("G90"), absolute, dict).description, "Absolute positioning");
}

TEST_F(ResolverTest, PlaceholdersReplaceValueAndGroups) {
    ProfileDictionary templated = {
        entry("X", ValuePattern::wildcard(), "Move X to {value} ({positioning}, {units})"),
    };
    ModalContext context = contextWith(ModalGroup::POSITIONING, "G91", 91);
    context.set(ModalGroup::UNITS, ModalValue{"G21", 21});

    EXPECT_EQ(resolver.annotate(word("X2.5"), context, templated).description,
              "Move X to 2.5 (incremental positioning, millimetre units)");
}

TEST_F(ResolverTest, EntryGroupOverridesLetterDefault) {
    ProfileDictionary custom = {
        entry("S", ValuePattern::wildcard(), "Spindle speed", ModalGroup::SPINDLE),
    };
    auto context = contextWith(ModalGroup::SPINDLE, "M3", 3);
    EXPECT_EQ(resolver.annotate(word("S1200"), context, custom).description,
              "Spindle speed = 1200 (spindle clockwise)");
}

// ============================================================================
// Special words
// ============================================================================

TEST_F(ResolverTest, CornerWordUsesCommaKey) {
    auto line = tokenizer::tokenize("G1 X5 ,R2");
    EXPECT_EQ(resolver.annotate(line.tokens[2], empty, dict).description, "Corner rounding radius = 2");
}

TEST_F(ResolverTest, ProgramMarkerEntry) {
    EXPECT_EQ(resolver.annotate(word("%"), empty, dict).description, "Program start/end");
    EXPECT_TRUE(resolver.annotate(word("%"), empty, ProfileDictionary()).isUnknown);
}

TEST_F(ResolverTest, BuiltinDescriptions) {
    EXPECT_EQ(resolver.annotate(word("#100"), empty, dict).description, "Macro variable #100");
    EXPECT_EQ(resolver.annotate(word("*57"), empty, dict).description, "Checksum = 57");
    EXPECT_EQ(resolver.annotate(word("/"), empty, dict).description, "Block skip");
}

// ============================================================================
// Scopes
// ============================================================================

TEST_F(ResolverTest, ScopeSearchedBeforeDictionary) {
    ProfileDictionary scoped = {
        entry("Q", ValuePattern::wildcard(), "Peck depth"),
        entry("G", ValuePattern::exact(76), "Threading cycle", std::nullopt,
              {entry("Q", ValuePattern::wildcard(), "Minimum cut depth")}),
    };

    auto q = word("Q0.2");
    auto inScope = resolver.resolve(q, empty, scoped, &scoped[1].sub);
    EXPECT_TRUE(inScope.fromScope);
    EXPECT_EQ(inScope.result.description, "Minimum cut depth = 0.2");

    auto outOfScope = resolver.resolve(q, empty, scoped);
    EXPECT_FALSE(outOfScope.fromScope);
    EXPECT_EQ(outOfScope.result.description, "Peck depth = 0.2");
    EXPECT_EQ(outOfScope.entry, &scoped[0]);
}

TEST_F(ResolverTest, ScopeMissFallsBackToDictionary) {
    ProfileDictionary scope = {entry("Q", ValuePattern::wildcard(), "Minimum cut depth")};
    auto resolution = resolver.resolve(word("G1"), empty, dict, &scope);
    EXPECT_FALSE(resolution.fromScope);
    EXPECT_EQ(resolution.result.description, "Linear move");
}

// ============================================================================
// Purity and carry
// ============================================================================

TEST_F(ResolverTest, AnnotateIsPure) {
    auto context = contextWith(ModalGroup::POSITIONING, "G90", 90);
    auto token = word("X7");
    EXPECT_EQ(resolver.annotate(token, context, dict), resolver.annotate(token, context, dict));
}

TEST_F(ResolverTest, CarryUsesDictionaryEntry) {
    auto context = contextWith(ModalGroup::MOTION, "G1", 1);
    auto anchor = word("X10");

    auto result = resolver.describeCarry(ModalGroup::MOTION, context, dict, anchor);
    EXPECT_TRUE(result.isModalCarry);
    EXPECT_FALSE(result.isUnknown);
    EXPECT_EQ(result.description, "Linear move (modal)");
    EXPECT_EQ(result.token.position, anchor.position);
    EXPECT_TRUE(result.token.rawText.empty());
}

TEST_F(ResolverTest, CarryWithoutEntryUsesGroupText) {
    auto context = contextWith(ModalGroup::MOTION, "G3", 3);
    auto result = resolver.describeCarry(ModalGroup::MOTION, context, dict, word("X1"));
    EXPECT_EQ(result.description, "counter-clockwise arc (modal)");
}

TEST_F(ResolverTest, CarryOfUnsetGroupIsUndefined) {
    auto result = resolver.describeCarry(ModalGroup::MOTION, empty, dict, word("X1"));
    EXPECT_TRUE(result.isModalCarry);
    EXPECT_EQ(result.description, "undefined motion mode");
}
