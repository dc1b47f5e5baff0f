// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace kte {
namespace {

// ============================================================================
// Timestamp
// ============================================================================

TEST(TimestampTest, DefaultIsZero) {
    Timestamp ts;
    EXPECT_TRUE(ts.IsZero());
    EXPECT_EQ(0, ts.ToMicros());
}

TEST(TimestampTest, NowIsNotZero) {
    EXPECT_FALSE(Timestamp::Now().IsZero());
}

TEST(TimestampTest, MicrosRoundTrip) {
    Timestamp ts = Timestamp::FromMicros(1700000000123456LL);
    EXPECT_EQ(1700000000123456LL, ts.ToMicros());
}

TEST(TimestampTest, ArithmeticAndComparison) {
    Timestamp t1 = Timestamp::FromMicros(1000);
    Timestamp t2 = t1 + std::chrono::microseconds(500);

    EXPECT_LT(t1, t2);
    EXPECT_GT(t2, t1);
    EXPECT_NE(t1, t2);
    EXPECT_EQ(500, (t2 - t1).count());
}

TEST(TimestampTest, ToStringFormatsSecondsAndMicros) {
    Timestamp ts = Timestamp::FromMicros(12000042);
    EXPECT_EQ("Timestamp(12.000042s)", ts.ToString());
}

// ============================================================================
// Device enums
// ============================================================================

TEST(DeviceProfileTest, EnumsRoundTripThroughStrings) {
    for (auto type : {DeviceType::DESKTOP, DeviceType::MOBILE, DeviceType::TABLET}) {
        EXPECT_EQ(type, ParseDeviceType(ToString(type)));
    }
    for (auto screen : {ScreenClass::SMALL, ScreenClass::MEDIUM, ScreenClass::LARGE}) {
        EXPECT_EQ(screen, ParseScreenClass(ToString(screen)));
    }
    for (auto network : {NetworkQuality::HIGH, NetworkQuality::MEDIUM, NetworkQuality::LOW}) {
        EXPECT_EQ(network, ParseNetworkQuality(ToString(network)));
    }
}

TEST(DeviceProfileTest, UnknownNamesThrow) {
    EXPECT_THROW(ParseDeviceType("watch"), std::invalid_argument);
    EXPECT_THROW(ParseScreenClass("huge"), std::invalid_argument);
    EXPECT_THROW(ParseNetworkQuality("none"), std::invalid_argument);
}

TEST(DeviceProfileTest, DefaultsToDesktop) {
    DeviceProfile profile;
    EXPECT_FALSE(profile.IsMobile());
    EXPECT_EQ(ScreenClass::LARGE, profile.screen);
    EXPECT_EQ(NetworkQuality::HIGH, profile.network);
}

// ============================================================================
// StateKey
// ============================================================================

TEST(StateKeyTest, EqualityAndOrdering) {
    StateKey a{"s1", "algebra"};
    StateKey b{"s1", "calculus"};
    StateKey c{"s1", "algebra"};

    EXPECT_EQ(a, c);
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
    EXPECT_EQ("s1/algebra", a.ToString());
}

TEST(StateKeyTest, HashDistinguishesSwappedFields) {
    std::unordered_set<StateKey> keys;
    keys.insert(StateKey{"a", "b"});
    keys.insert(StateKey{"b", "a"});
    keys.insert(StateKey{"a", "b"});
    EXPECT_EQ(2u, keys.size());
}

// ============================================================================
// ConceptParameters
// ============================================================================

TEST(ConceptParametersTest, DefaultsAreValid) {
    ConceptParameters params;
    EXPECT_TRUE(params.IsValid());
}

TEST(ConceptParametersTest, RatesOutsideUnitIntervalAreRejected) {
    ConceptParameters params;
    params.learn_rate = 1.5;
    params.guess_rate = -0.1;

    auto errors = params.GetValidationErrors();
    EXPECT_EQ(2u, errors.size());
    EXPECT_FALSE(params.IsValid());
}

TEST(ConceptParametersTest, SlipPlusGuessMustStayBelowOne) {
    ConceptParameters params;
    params.slip_rate = 0.6;
    params.guess_rate = 0.4;

    auto errors = params.GetValidationErrors();
    ASSERT_EQ(1u, errors.size());
    EXPECT_NE(std::string::npos, errors[0].find("slip_rate + guess_rate"));
}

TEST(ConceptParametersTest, NonFiniteValuesAreRejected) {
    ConceptParameters params;
    params.initial_mastery = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(params.IsValid());
}

// ============================================================================
// KnowledgeState
// ============================================================================

TEST(KnowledgeStateTest, InitialStateUsesPrior) {
    auto state = KnowledgeState::Initial("s1", "optics", 0.4);

    EXPECT_EQ("s1", state.student_id);
    EXPECT_EQ("optics", state.concept_id);
    EXPECT_DOUBLE_EQ(0.4, state.mastery_probability);
    EXPECT_EQ(0u, state.practice_count);
    EXPECT_EQ(0u, state.consecutive_incorrect);
    EXPECT_FALSE(state.in_recovery);
    EXPECT_TRUE(state.last_practiced.IsZero());
}

TEST(KnowledgeStateTest, InitialClampsPrior) {
    EXPECT_DOUBLE_EQ(1.0, KnowledgeState::Initial("s", "c", 1.7).mastery_probability);
    EXPECT_DOUBLE_EQ(0.0, KnowledgeState::Initial("s", "c", -0.2).mastery_probability);
}

// ============================================================================
// Errors
// ============================================================================

TEST(ErrorsTest, FromMessagesJoinsMessages) {
    auto error = ConfigurationError::FromMessages("Invalid config", {"a is bad", "b is bad"});
    EXPECT_STREQ("Invalid config: a is bad; b is bad", error.what());
}

TEST(ErrorsTest, HierarchyDerivesFromEngineError) {
    EXPECT_THROW(throw ValidationError("x"), EngineError);
    EXPECT_THROW(throw DependencyTimeout("x"), EngineError);
    EXPECT_THROW(throw DegenerateCalibrationInput("x"), EngineError);
    EXPECT_THROW(throw ConfigurationError("x"), std::runtime_error);
}

} // namespace
} // namespace kte
