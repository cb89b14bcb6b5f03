/**
 * @file test_modal_tracker.cpp
 * @brief Modal state tracker tests
 */

#include <gtest/gtest.h>
#include "modal/ModalStateTracker.hpp"
#include "tokenizer/LineTokenizer.hpp"
#include "logging/Logger.hpp"

using namespace gcode_annotator::modal;
using gcode_annotator::tokenizer::tokenize;

class ModalTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        gcode_annotator::Logger::init("test_modal_tracker.log", "debug");
    }

    ModalUpdate apply(const std::string& text, const ModalContext& context = ModalContext()) {
        return tracker.apply(tokenize(text), context);
    }

    ModalStateTracker tracker;
};

// Group assignment
TEST_F(ModalTrackerTest, PositioningWordSetsGroup) {
    auto update = apply("G90");

    ASSERT_TRUE(update.context.isSet(ModalGroup::POSITIONING));
    EXPECT_EQ(update.context.get(ModalGroup::POSITIONING)->code, "G90");
    ASSERT_EQ(update.carry.size(), 1u);
    EXPECT_FALSE(update.carry[0]);
    ASSERT_TRUE(update.sets[0].has_value());
    EXPECT_EQ(*update.sets[0], ModalGroup::POSITIONING);
}

TEST_F(ModalTrackerTest, LeadingZerosNormalizedInCode) {
    auto update = apply("G00 G091");

    EXPECT_EQ(update.context.get(ModalGroup::MOTION)->code, "G0");
    EXPECT_EQ(update.context.get(ModalGroup::POSITIONING)->code, "G91");
}

TEST_F(ModalTrackerTest, ValueWordsSetTheirGroups) {
    auto update = apply("T3 S12000 M3 F250.5 G21 G17 G54 M8 G94");

    EXPECT_EQ(update.context.get(ModalGroup::TOOL)->code, "T3");
    EXPECT_DOUBLE_EQ(update.context.get(ModalGroup::SPINDLE_SPEED)->value, 12000.0);
    EXPECT_EQ(update.context.get(ModalGroup::SPINDLE)->code, "M3");
    EXPECT_EQ(update.context.get(ModalGroup::FEED_RATE)->code, "F250.5");
    EXPECT_EQ(update.context.get(ModalGroup::UNITS)->code, "G21");
    EXPECT_EQ(update.context.get(ModalGroup::PLANE)->code, "G17");
    EXPECT_EQ(update.context.get(ModalGroup::COORDINATE_SYSTEM)->code, "G54");
    EXPECT_EQ(update.context.get(ModalGroup::COOLANT)->code, "M8");
    EXPECT_EQ(update.context.get(ModalGroup::FEED_MODE)->code, "G94");
}

TEST_F(ModalTrackerTest, NonModalWordsLeaveContextAlone) {
    auto update = apply("N10 G4 P500 M30");

    EXPECT_EQ(update.context, ModalContext());
    for (const auto& set : update.sets) {
        EXPECT_FALSE(set.has_value());
    }
}

TEST_F(ModalTrackerTest, CommaPrefixedWordsNeverSetGroups) {
    auto update = apply("G1 X5 ,R2");
    EXPECT_FALSE(update.sets[2].has_value());
}

TEST_F(ModalTrackerTest, CannedCycleIsMotionMode) {
    auto update = apply("G81 Z-5 R1");
    EXPECT_EQ(update.context.get(ModalGroup::MOTION)->code, "G81");
    EXPECT_TRUE(update.implied.empty());
}

TEST_F(ModalTrackerTest, PeckAndBoringCyclesAreMotionMode) {
    auto boring = apply("G76 X10 Z-5");
    EXPECT_EQ(boring.context.get(ModalGroup::MOTION)->code, "G76");
    EXPECT_TRUE(boring.implied.empty());

    EXPECT_EQ(apply("G73 X1 Z-2").context.get(ModalGroup::MOTION)->code, "G73");
    EXPECT_EQ(apply("G74 Z-10").context.get(ModalGroup::MOTION)->code, "G74");

    // Following bare coordinates inherit the cycle
    auto next = apply("X20", boring.context);
    ASSERT_EQ(next.implied.size(), 1u);
    EXPECT_EQ(next.context.get(ModalGroup::MOTION)->code, "G76");
}

TEST_F(ModalTrackerTest, HugeValueKeepsAllDigitsInCode) {
    auto update = apply("T1" + std::string(63, '0'));
    const auto& tool = update.context.get(ModalGroup::TOOL);
    ASSERT_TRUE(tool.has_value());
    EXPECT_GE(tool->code.size(), 64u);
    EXPECT_NE(tool->code, "T1");
    EXPECT_NE(describeModalValue(ModalGroup::TOOL, tool), "tool 1");
}

// Implied motion
TEST_F(ModalTrackerTest, BareCoordinateImpliesMotion) {
    auto update = apply("X10");
    ASSERT_EQ(update.implied.size(), 1u);
    EXPECT_EQ(update.implied[0], ModalGroup::MOTION);
    EXPECT_FALSE(update.carry[0]);
}

TEST_F(ModalTrackerTest, ExplicitMotionNotImplied) {
    EXPECT_TRUE(apply("G1 X10").implied.empty());
}

TEST_F(ModalTrackerTest, AxisConsumingCodeNotImplied) {
    EXPECT_TRUE(apply("G28 X0 Y0").implied.empty());
    EXPECT_TRUE(apply("G92 X0").implied.empty());
}

TEST_F(ModalTrackerTest, ArcOffsetsImplyMotion) {
    EXPECT_EQ(apply("I5 J0").implied.size(), 1u);
}

// Persistence
TEST_F(ModalTrackerTest, ContextPersistsAcrossLines) {
    ModalContext context;
    context = apply("G91", context).context;
    context = apply("X5", context).context;
    context = apply("F100", context).context;

    EXPECT_EQ(context.get(ModalGroup::POSITIONING)->code, "G91");
    EXPECT_EQ(context.get(ModalGroup::FEED_RATE)->code, "F100");
    EXPECT_FALSE(context.isSet(ModalGroup::MOTION));
}

TEST_F(ModalTrackerTest, LaterWordOverridesGroup) {
    ModalContext context = apply("G90").context;
    context = apply("G91", context).context;
    EXPECT_EQ(context.get(ModalGroup::POSITIONING)->code, "G91");

    // Last word on the same line wins
    context = apply("G90 G91 G90", context).context;
    EXPECT_EQ(context.get(ModalGroup::POSITIONING)->code, "G90");
}

TEST_F(ModalTrackerTest, InputContextUnchanged) {
    ModalContext context = apply("G90").context;
    ModalContext before = context;
    apply("G91 T2", context);
    EXPECT_EQ(context, before);
}

TEST_F(ModalTrackerTest, ApplyIsDeterministic) {
    const std::vector<std::string> lines = {"G21 G90", "T1 M6", "S8000 M3", "G0 X0 Y0", "X10", "G91 G1 F200"};

    ModalContext first;
    ModalContext second;
    for (const auto& line : lines) first = apply(line, first).context;
    for (const auto& line : lines) second = apply(line, second).context;

    EXPECT_EQ(first, second);
}

// Descriptions
TEST(ModalTypes, DescribeValues) {
    EXPECT_EQ(describeModalValue(ModalGroup::POSITIONING, std::nullopt), "undefined positioning mode");
    EXPECT_EQ(describeModalValue(ModalGroup::MOTION, std::nullopt), "undefined motion mode");
    EXPECT_EQ(describeModalValue(ModalGroup::POSITIONING, ModalValue{"G90", 90}), "absolute positioning");
    EXPECT_EQ(describeModalValue(ModalGroup::MOTION, ModalValue{"G2", 2}), "clockwise arc");
    EXPECT_EQ(describeModalValue(ModalGroup::MOTION, ModalValue{"G83", 83}), "canned cycle G83");
    EXPECT_EQ(describeModalValue(ModalGroup::MOTION, ModalValue{"G76", 76}), "canned cycle G76");
    EXPECT_EQ(describeModalValue(ModalGroup::MOTION, ModalValue{"G80", 80}), "canned cycle cancelled");
    EXPECT_EQ(describeModalValue(ModalGroup::TOOL, ModalValue{"T3", 3}), "tool 3");
    EXPECT_EQ(describeModalValue(ModalGroup::FEED_RATE, ModalValue{"F12.5", 12.5}), "feed rate 12.5");
    EXPECT_EQ(describeModalValue(ModalGroup::COORDINATE_SYSTEM, ModalValue{"G55", 55}), "work offset G55");
}

TEST(ModalTypes, GroupNamesRoundTrip) {
    for (size_t i = 0; i < kModalGroupCount; ++i) {
        auto group = static_cast<ModalGroup>(i);
        auto parsed = modalGroupFromString(modalGroupToString(group));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, group);
    }
    EXPECT_FALSE(modalGroupFromString("spindle_direction").has_value());
}

TEST(ModalTypes, ResetClearsEveryGroup) {
    ModalContext context;
    context.set(ModalGroup::TOOL, ModalValue{"T1", 1});
    context.reset();
    EXPECT_EQ(context, ModalContext());
}
