// File: tests/tracing/mastery_updater_test.cpp
#include "tracing/mastery_updater.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace kte {
namespace {

class MasteryUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.concept_id = "kinematics";
        params_.learn_rate = 0.3;
        params_.slip_rate = 0.1;
        params_.guess_rate = 0.2;
        params_.initial_mastery = 0.25;
    }

    KnowledgeState State(double mastery) const {
        return KnowledgeState::Initial("s1", "kinematics", mastery);
    }

    MasteryUpdater updater_;
    ConceptParameters params_;
};

// ============================================================================
// Canonical update
// ============================================================================

TEST_F(MasteryUpdaterTest, CorrectAnswerFromPriorGivesWorkedExample) {
    auto result = updater_.Update(State(0.25), params_, true, {});

    EXPECT_NEAR(0.6, result.posterior_mastery, 1e-9);
    EXPECT_NEAR(0.72, result.new_mastery, 1e-9);
    EXPECT_NEAR(0.72, result.next_state.mastery_probability, 1e-9);
    EXPECT_NEAR(0.375, result.predicted_correct, 1e-9);
    EXPECT_EQ(1u, result.next_state.practice_count);
}

TEST_F(MasteryUpdaterTest, IncorrectAnswerLowersPosterior) {
    auto result = updater_.Update(State(0.5), params_, false, {});

    // 0.5 * 0.1 / (0.05 + 0.5 * 0.8)
    EXPECT_NEAR(0.05 / 0.45, result.posterior_mastery, 1e-9);
    EXPECT_LT(result.posterior_mastery, 0.5);
    EXPECT_EQ(1u, result.next_state.consecutive_incorrect);
}

TEST_F(MasteryUpdaterTest, OutputsStayWithinUnitInterval) {
    for (double mastery : {0.0, 1e-9, 0.1, 0.5, 0.9, 1.0 - 1e-9, 1.0}) {
        for (bool correct : {true, false}) {
            for (double stress : {0.0, 0.5, 1.0}) {
                MasteryUpdater::Context context;
                context.stress = stress;
                auto result = updater_.Update(State(mastery), params_, correct, context);

                EXPECT_TRUE(std::isfinite(result.new_mastery));
                EXPECT_GE(result.new_mastery, 0.0);
                EXPECT_LE(result.new_mastery, 1.0);
                EXPECT_GE(result.predicted_correct, 0.0);
                EXPECT_LE(result.predicted_correct, 1.0);
            }
        }
    }
}

TEST_F(MasteryUpdaterTest, CorrectNeverEndsBelowIncorrect) {
    for (double mastery = 0.0; mastery <= 1.0; mastery += 0.05) {
        auto correct = updater_.Update(State(mastery), params_, true, {});
        auto incorrect = updater_.Update(State(mastery), params_, false, {});
        EXPECT_GE(correct.new_mastery, incorrect.new_mastery) << "mastery " << mastery;
    }
}

TEST_F(MasteryUpdaterTest, BoundaryMasteryDoesNotDivideByZero) {
    params_.slip_rate = 0.0;
    params_.guess_rate = 0.0;

    auto at_zero = updater_.Update(State(0.0), params_, true, {});
    auto at_one = updater_.Update(State(1.0), params_, false, {});

    EXPECT_TRUE(std::isfinite(at_zero.new_mastery));
    EXPECT_TRUE(std::isfinite(at_one.new_mastery));
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(MasteryUpdaterTest, SlipPlusGuessAtLeastOneIsConfigurationError) {
    params_.slip_rate = 0.5;
    params_.guess_rate = 0.5;
    EXPECT_THROW(updater_.Update(State(0.3), params_, true, {}), ConfigurationError);
}

TEST_F(MasteryUpdaterTest, MasteryOutsideUnitIntervalIsValidationError) {
    KnowledgeState state = State(0.3);
    state.mastery_probability = 1.2;
    EXPECT_THROW(updater_.Update(state, params_, true, {}), ValidationError);
}

TEST_F(MasteryUpdaterTest, NonFiniteStressIsValidationError) {
    MasteryUpdater::Context context;
    context.stress = std::nan("");
    EXPECT_THROW(updater_.Update(State(0.3), params_, true, context), ValidationError);
}

TEST(MasteryUpdaterConfigTest, InvalidConfigThrows) {
    MasteryUpdater::Config config;
    config.recovery_streak = 0;
    EXPECT_THROW(MasteryUpdater{config}, ConfigurationError);

    MasteryUpdater::Config epsilon;
    epsilon.epsilon = 0.0;
    EXPECT_FALSE(epsilon.GetValidationErrors().empty());
}

// ============================================================================
// Stress coupling
// ============================================================================

TEST_F(MasteryUpdaterTest, StressRaisesSlipAndGuess) {
    auto [slip, guess] = updater_.EffectiveRates(0.1, 0.2, 1.0);
    EXPECT_NEAR(0.15, slip, 1e-12);
    EXPECT_NEAR(0.25, guess, 1e-12);

    auto [calm_slip, calm_guess] = updater_.EffectiveRates(0.1, 0.2, 0.0);
    EXPECT_DOUBLE_EQ(0.1, calm_slip);
    EXPECT_DOUBLE_EQ(0.2, calm_guess);
}

TEST_F(MasteryUpdaterTest, StressKeepsRatesIdentifiable) {
    auto [slip, guess] = updater_.EffectiveRates(0.5, 0.45, 1.0);
    EXPECT_LE(slip + guess, 0.99 + 1e-12);
    EXPECT_GE(slip, 0.5);
    EXPECT_GE(guess, 0.45);
}

TEST_F(MasteryUpdaterTest, StressedCorrectAnswerCountsForLess) {
    MasteryUpdater::Context stressed;
    stressed.stress = 1.0;

    auto calm = updater_.Update(State(0.4), params_, true, {});
    auto tense = updater_.Update(State(0.4), params_, true, stressed);
    EXPECT_LT(tense.posterior_mastery, calm.posterior_mastery);
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(MasteryUpdaterTest, ThirdConsecutiveMissBelowFloorEntersRecovery) {
    params_.learn_rate = 0.1;
    KnowledgeState state = State(0.2);

    auto first = updater_.Update(state, params_, false, {});
    EXPECT_FALSE(first.recovery);
    auto second = updater_.Update(first.next_state, params_, false, {});
    EXPECT_FALSE(second.recovery);
    auto third = updater_.Update(second.next_state, params_, false, {});

    EXPECT_LT(third.new_mastery, 0.3);
    EXPECT_TRUE(third.recovery);
    EXPECT_TRUE(third.entered_recovery);
    EXPECT_EQ(3u, third.next_state.consecutive_incorrect);

    auto fourth = updater_.Update(third.next_state, params_, false, {});
    EXPECT_TRUE(fourth.recovery);
    EXPECT_FALSE(fourth.entered_recovery);
}

TEST_F(MasteryUpdaterTest, CorrectAnswerAboveFloorLeavesRecovery) {
    params_.learn_rate = 0.1;
    KnowledgeState state = State(0.115);
    state.in_recovery = true;
    state.consecutive_incorrect = 3;

    auto result = updater_.Update(state, params_, true, {});
    EXPECT_GE(result.new_mastery, 0.3);
    EXPECT_FALSE(result.recovery);
    EXPECT_EQ(0u, result.next_state.consecutive_incorrect);
}

TEST_F(MasteryUpdaterTest, MissesAboveFloorDoNotEnterRecovery) {
    KnowledgeState state = State(0.9);
    for (int i = 0; i < 3; ++i) {
        auto result = updater_.Update(state, params_, false, {});
        state = result.next_state;
    }
    EXPECT_EQ(3u, state.consecutive_incorrect);
    EXPECT_FALSE(state.in_recovery);
}

// ============================================================================
// Forgetting
// ============================================================================

TEST_F(MasteryUpdaterTest, ForgettingDecaysTowardPriorAfterGrace) {
    params_.forgetting_rate = 0.1;
    Timestamp now = Timestamp::Now();

    KnowledgeState state = State(0.9);
    state.last_practiced = now + std::chrono::hours(-24 * 10);

    MasteryUpdater::Context context;
    context.now = now;
    auto result = updater_.Update(state, params_, true, context);

    // 0.25 + 0.65 * e^(-0.1 * 9)
    EXPECT_NEAR(0.25 + 0.65 * std::exp(-0.9), result.decayed_mastery, 1e-6);
    EXPECT_EQ(now, result.next_state.last_practiced);
}

TEST_F(MasteryUpdaterTest, NoForgettingWithinGracePeriod) {
    params_.forgetting_rate = 0.5;
    Timestamp now = Timestamp::Now();

    KnowledgeState state = State(0.9);
    state.last_practiced = now + std::chrono::hours(-12);

    MasteryUpdater::Context context;
    context.now = now;
    auto result = updater_.Update(state, params_, true, context);
    EXPECT_DOUBLE_EQ(0.9, result.decayed_mastery);
}

TEST(ForgettingCurveTest, NeverDropsBelowPrior) {
    ForgettingCurve curve(0.0);
    double decayed = curve.Apply(0.8, 0.3, 5.0, std::chrono::hours(24 * 365));
    EXPECT_GE(decayed, 0.3);
    EXPECT_NEAR(0.3, decayed, 1e-6);

    EXPECT_DOUBLE_EQ(0.2, curve.Apply(0.2, 0.3, 5.0, std::chrono::hours(48)));
}

} // namespace
} // namespace kte
