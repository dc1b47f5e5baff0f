// File: tests/engine/tracing_engine_test.cpp
#include "engine/tracing_engine.hpp"
#include "core/errors.hpp"
#include "storage/memory_store.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <memory>

namespace kte {
namespace {

// Forwards to a MemoryStore unless a call kind is switched to time out
class FlakyStore : public ParameterStore,
                   public KnowledgeStateStore,
                   public EventLog {
public:
    explicit FlakyStore(MemoryStore& inner) : inner_(inner) {}

    std::atomic<bool> parameters_time_out{false};
    std::atomic<bool> state_reads_time_out{false};
    std::atomic<bool> state_writes_time_out{false};
    std::atomic<bool> appends_time_out{false};

    StoreResult<ConceptParameters> GetParameters(const std::string& concept_id,
                                                 std::chrono::milliseconds timeout) override {
        if (parameters_time_out) {
            return StoreResult<ConceptParameters>::Status(StoreStatus::TIMEOUT);
        }
        return inner_.GetParameters(concept_id, timeout);
    }

    StoreStatus PutParameters(const ConceptParameters& params,
                              std::chrono::milliseconds timeout) override {
        return inner_.PutParameters(params, timeout);
    }

    std::vector<std::string> ListConcepts() const override { return inner_.ListConcepts(); }

    StoreResult<KnowledgeState> GetState(const StateKey& key,
                                         std::chrono::milliseconds timeout) override {
        if (state_reads_time_out) {
            return StoreResult<KnowledgeState>::Status(StoreStatus::TIMEOUT);
        }
        return inner_.GetState(key, timeout);
    }

    StoreStatus PutState(const KnowledgeState& state, std::chrono::milliseconds timeout) override {
        if (state_writes_time_out) {
            return StoreStatus::TIMEOUT;
        }
        return inner_.PutState(state, timeout);
    }

    StoreResult<std::vector<KnowledgeState>> GetStudentStates(
        const std::string& student_id, std::chrono::milliseconds timeout) override {
        return inner_.GetStudentStates(student_id, timeout);
    }

    size_t StateCount() const override { return inner_.StateCount(); }

    StoreResult<uint64_t> Append(const InteractionEvent& event,
                                 std::chrono::milliseconds timeout) override {
        if (appends_time_out) {
            return StoreResult<uint64_t>::Status(StoreStatus::TIMEOUT);
        }
        return inner_.Append(event, timeout);
    }

    std::vector<InteractionEvent> Snapshot() const override { return inner_.Snapshot(); }
    size_t EventCount() const override { return inner_.EventCount(); }

private:
    MemoryStore& inner_;
};

class TracingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = EngineConfig::Default();
        config_.transfer_graph["algebra"]["calculus"] = 0.6;
        Rebuild();
    }

    void Rebuild() {
        engine_ = std::make_unique<TracingEngine>(config_, store_, store_, store_, &store_);
    }

    // Stress pinned to zero so the canonical update is reproduced exactly
    static InteractionContext Calm() {
        InteractionContext context;
        context.stress = 0.0;
        return context;
    }

    static InteractionRequest Request(const std::string& student,
                                      std::vector<std::string> concepts,
                                      bool correct) {
        InteractionRequest request;
        request.student_id = student;
        request.question_id = "q1";
        request.concept_ids = std::move(concepts);
        request.correct = correct;
        request.response_time_ms = 45000;
        request.context = Calm();
        return request;
    }

    static QuestionMetadata Question(const std::string& concept_id, int64_t base_ms) {
        QuestionMetadata question;
        question.question_id = "q_next";
        question.concept_id = concept_id;
        question.difficulty = 1.0;
        question.base_time_ms = base_ms;
        return question;
    }

    EngineConfig config_;
    MemoryStore store_;
    std::unique_ptr<TracingEngine> engine_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(TracingEngineTest, InvalidConfigurationIsRejected) {
    config_.storage.backend = "redis";
    EXPECT_THROW(Rebuild(), ConfigurationError);
}

// ============================================================================
// Mastery updates
// ============================================================================

TEST_F(TracingEngineTest, FirstCorrectAnswerUsesDefaultParameters) {
    auto outcome = engine_->UpdateMastery("s1", "kinematics", true, Calm());

    EXPECT_NEAR(0.25, outcome.previous_mastery, 1e-9);
    EXPECT_NEAR(0.72, outcome.new_mastery, 1e-9);
    EXPECT_NEAR(0.375, outcome.predicted_correct, 1e-9);
    EXPECT_EQ(1u, outcome.practice_count);
    EXPECT_FALSE(outcome.degraded);

    auto stored = engine_->GetMastery("s1", "kinematics");
    ASSERT_TRUE(stored.Ok());
    EXPECT_NEAR(0.72, stored.value->mastery_probability, 1e-9);
    EXPECT_EQ(1u, stored.value->practice_count);
}

TEST_F(TracingEngineTest, StoredParametersOverrideDefaults) {
    ConceptParameters params = config_.DefaultParameters("kinematics");
    params.learn_rate = 0.5;
    ASSERT_EQ(StoreStatus::OK, store_.PutParameters(params, std::chrono::milliseconds(100)));

    auto outcome = engine_->UpdateMastery("s1", "kinematics", true, Calm());

    // posterior 0.6, then 0.6 + 0.4 * 0.5
    EXPECT_NEAR(0.8, outcome.new_mastery, 1e-9);
}

TEST_F(TracingEngineTest, RepeatedAnswersAccumulatePractice) {
    engine_->UpdateMastery("s1", "kinematics", true, Calm());
    engine_->UpdateMastery("s1", "kinematics", false, Calm());
    auto third = engine_->UpdateMastery("s1", "kinematics", true, Calm());

    EXPECT_EQ(3u, third.practice_count);
    EXPECT_EQ(3u, engine_->GetStats().mastery_updates);
}

TEST_F(TracingEngineTest, UnknownStateIsNotFound) {
    auto read = engine_->GetMastery("nobody", "kinematics");
    EXPECT_EQ(StoreStatus::NOT_FOUND, read.status);
    EXPECT_THROW(Require(read, "state"), EngineError);
}

TEST_F(TracingEngineTest, EmptyIdentifiersAreRejected) {
    EXPECT_THROW(engine_->UpdateMastery("", "kinematics", true, Calm()), ValidationError);
    EXPECT_THROW(engine_->UpdateMastery("s1", "", true, Calm()), ValidationError);
}

TEST_F(TracingEngineTest, StressOutsideUnitIntervalIsRejected) {
    InteractionContext context;
    context.stress = 1.5;
    EXPECT_THROW(engine_->UpdateMastery("s1", "kinematics", true, context), ValidationError);
    EXPECT_EQ(0u, store_.StateCount());
}

// ============================================================================
// Transfer
// ============================================================================

TEST_F(TracingEngineTest, CorrectAnswerTransfersToNeighbour) {
    auto outcome = engine_->UpdateMastery("s1", "algebra", true, Calm());

    ASSERT_EQ(1u, outcome.transfers.size());
    const TransferUpdate& update = outcome.transfers[0];
    EXPECT_EQ("calculus", update.concept_id);
    EXPECT_DOUBLE_EQ(0.6, update.weight);
    EXPECT_NEAR(0.25, update.previous_mastery, 1e-9);
    // 0.25 + 0.6 * (0.72 - 0.25) * 0.5
    EXPECT_NEAR(0.391, update.new_mastery, 1e-9);

    auto calculus = engine_->GetMastery("s1", "calculus");
    ASSERT_TRUE(calculus.Ok());
    EXPECT_NEAR(0.391, calculus.value->mastery_probability, 1e-9);
    EXPECT_EQ(0u, calculus.value->practice_count);
    EXPECT_EQ(1u, engine_->GetStats().transfer_updates);
}

TEST_F(TracingEngineTest, TransferIsOneHopOnCycles) {
    config_.transfer_graph["calculus"]["algebra"] = 0.6;
    config_.transfer_graph["calculus"]["mechanics"] = 0.6;
    Rebuild();

    auto outcome = engine_->UpdateMastery("s1", "algebra", true, Calm());

    ASSERT_EQ(1u, outcome.transfers.size());
    EXPECT_EQ(StoreStatus::NOT_FOUND, engine_->GetMastery("s1", "mechanics").status);
    EXPECT_NEAR(0.72, engine_->GetMastery("s1", "algebra").value->mastery_probability, 1e-9);
}

TEST_F(TracingEngineTest, NewConceptIsSeededFromPracticedSource) {
    KnowledgeState algebra = KnowledgeState::Initial("s1", "algebra", 0.8);
    algebra.practice_count = 3;
    ASSERT_EQ(StoreStatus::OK, store_.PutState(algebra, std::chrono::milliseconds(100)));

    auto outcome = engine_->UpdateMastery("s1", "calculus", true, Calm());

    // 0.25 + 0.8 * 0.3 capped at 0.4
    EXPECT_NEAR(0.4, outcome.previous_mastery, 1e-9);
}

TEST_F(TracingEngineTest, TransferTargetIsSeededLikeADirectAnswer) {
    config_.transfer_graph["geometry"]["calculus"] = 0.6;
    Rebuild();

    KnowledgeState geometry = KnowledgeState::Initial("s1", "geometry", 0.8);
    geometry.practice_count = 3;
    ASSERT_EQ(StoreStatus::OK, store_.PutState(geometry, std::chrono::milliseconds(100)));
    geometry.student_id = "s2";
    ASSERT_EQ(StoreStatus::OK, store_.PutState(geometry, std::chrono::milliseconds(100)));

    auto outcome = engine_->UpdateMastery("s1", "algebra", true, Calm());

    // Seeded from geometry only: min(0.4, 0.25 + 0.8 * 0.3), then
    // 0.4 + 0.6 * (0.72 - 0.25) * 0.5
    ASSERT_EQ(1u, outcome.transfers.size());
    EXPECT_NEAR(0.4, outcome.transfers[0].previous_mastery, 1e-9);
    EXPECT_NEAR(0.541, outcome.transfers[0].new_mastery, 1e-9);

    auto direct = engine_->UpdateMastery("s2", "calculus", true, Calm());
    EXPECT_NEAR(outcome.transfers[0].previous_mastery, direct.previous_mastery, 1e-9);
}

// ============================================================================
// Interactions
// ============================================================================

TEST_F(TracingEngineTest, ProcessInteractionUpdatesEveryConcept) {
    auto request = Request("s1", {"kinematics", "optics"}, true);
    request.context.exam_code = "NEET";
    request.context.subject = "physics";
    request.context.group = "urban";

    auto result = engine_->ProcessInteraction(request);

    ASSERT_EQ(2u, result.outcomes.size());
    for (const auto& outcome : result.outcomes) {
        EXPECT_NEAR(0.72, outcome.new_mastery, 1e-9);
    }
    EXPECT_DOUBLE_EQ(4.0, result.score);
    EXPECT_EQ(1u, result.event_id);
    EXPECT_FALSE(result.degraded);

    auto events = store_.Snapshot();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("NEET", events[0].exam_code);
    EXPECT_EQ("physics", events[0].subject);
    EXPECT_EQ("urban", events[0].group);
    EXPECT_EQ(45000, events[0].response_time_ms);
    EXPECT_NEAR(0.375, events[0].predicted_correct, 1e-9);
    EXPECT_NEAR(0.25, events[0].mastery_before, 1e-9);
    EXPECT_NEAR(0.72, events[0].mastery_after, 1e-9);

    auto report = engine_->GetFairnessReport("NEET", "physics");
    ASSERT_EQ(1u, report.groups.size());
    EXPECT_EQ("urban", report.groups[0].group);
    EXPECT_NEAR(0.72, report.groups[0].average, 1e-9);
}

TEST_F(TracingEngineTest, SuppliedStressDrivesLoggedLoad) {
    auto calm = engine_->ProcessInteraction(Request("s1", {"kinematics"}, true));

    auto tense_request = Request("s2", {"kinematics"}, true);
    tense_request.context.stress = 1.0;
    auto tense = engine_->ProcessInteraction(tense_request);

    EXPECT_DOUBLE_EQ(1.0, tense.assessment.stress);
    EXPECT_GT(tense.assessment.extraneous_load, calm.assessment.extraneous_load);
    EXPECT_GT(tense.assessment.total_load, calm.assessment.total_load);

    auto events = store_.Snapshot();
    ASSERT_EQ(2u, events.size());
    EXPECT_DOUBLE_EQ(1.0, events[1].stress);
    EXPECT_DOUBLE_EQ(tense.assessment.extraneous_load, events[1].extraneous_load);
    EXPECT_DOUBLE_EQ(tense.assessment.total_load, events[1].total_load);
}

TEST_F(TracingEngineTest, UnknownExamFallsBackToDefault) {
    auto request = Request("s1", {"kinematics"}, false);
    request.context.exam_code = "GRE";

    auto result = engine_->ProcessInteraction(request);

    EXPECT_DOUBLE_EQ(-1.0, result.score);
    ASSERT_EQ(1u, store_.EventCount());
    EXPECT_EQ("JEE_Mains", store_.Snapshot()[0].exam_code);
}

TEST_F(TracingEngineTest, DefaultsFillContext) {
    engine_->ProcessInteraction(Request("s1", {"kinematics"}, true));

    auto event = store_.Snapshot().at(0);
    EXPECT_EQ(config_.engine.default_exam, event.exam_code);
    EXPECT_EQ(config_.engine.default_subject, event.subject);
    EXPECT_EQ(config_.engine.default_group, event.group);
}

TEST_F(TracingEngineTest, DuplicateConceptsAreRejectedBeforeAnyWrite) {
    auto request = Request("s1", {"kinematics", "optics", "kinematics"}, true);

    EXPECT_THROW(engine_->ProcessInteraction(request), ValidationError);
    EXPECT_EQ(0u, store_.StateCount());
    EXPECT_EQ(0u, store_.EventCount());
}

TEST_F(TracingEngineTest, MalformedRequestsAreRejected) {
    EXPECT_THROW(engine_->ProcessInteraction(Request("s1", {}, true)), ValidationError);
    EXPECT_THROW(engine_->ProcessInteraction(Request("", {"optics"}, true)), ValidationError);

    auto negative = Request("s1", {"optics"}, true);
    negative.response_time_ms = -5;
    EXPECT_THROW(engine_->ProcessInteraction(negative), ValidationError);
}

TEST_F(TracingEngineTest, ProcessInteractionAllocatesNextQuestion) {
    auto request = Request("s1", {"kinematics"}, true);
    request.context.exam_code = "NEET";
    request.next_question = Question("kinematics", 1000000);

    auto result = engine_->ProcessInteraction(request);

    ASSERT_TRUE(result.next_time.has_value());
    EXPECT_EQ(90000, result.next_time->FinalTimeMs());
    EXPECT_TRUE(result.next_time->allocation.capped);
    EXPECT_NEAR(0.72, result.next_time->mastery, 1e-9);
}

// ============================================================================
// Time allocation
// ============================================================================

TEST_F(TracingEngineTest, AllocationNeverExceedsExamCap) {
    auto question = Question("kinematics", 1000000);

    EXPECT_EQ(90000, engine_->AllocateTime("s1", question, "NEET", Calm()).FinalTimeMs());
    EXPECT_EQ(180000, engine_->AllocateTime("s1", question, "JEE_Mains", Calm()).FinalTimeMs());
    EXPECT_EQ(240000, engine_->AllocateTime("s1", question, "JEE_Advanced", Calm()).FinalTimeMs());
    EXPECT_EQ(180000, engine_->AllocateTime("s1", question, "GRE", Calm()).FinalTimeMs());
    EXPECT_EQ(4u, engine_->GetStats().time_allocations);
}

TEST_F(TracingEngineTest, UnseenConceptAllocatesWithPrior) {
    auto allocation = engine_->AllocateTime("s1", Question("kinematics", 60000), "JEE_Mains", Calm());

    EXPECT_DOUBLE_EQ(0.25, allocation.mastery);
    EXPECT_GT(allocation.FinalTimeMs(), 0);
    EXPECT_LE(allocation.FinalTimeMs(), 180000);
    EXPECT_FALSE(allocation.degraded);
}

TEST_F(TracingEngineTest, HigherMasteryGetsLessTime) {
    auto before = engine_->AllocateTime("s1", Question("kinematics", 60000), "JEE_Mains", Calm());
    engine_->UpdateMastery("s1", "kinematics", true, Calm());
    auto after = engine_->AllocateTime("s1", Question("kinematics", 60000), "JEE_Mains", Calm());

    EXPECT_LT(after.FinalTimeMs(), before.FinalTimeMs());
}

TEST_F(TracingEngineTest, MobileConstraintsGetMoreTime) {
    InteractionContext desktop = Calm();
    InteractionContext mobile = Calm();
    mobile.signals.device.type = DeviceType::MOBILE;
    mobile.signals.device.screen = ScreenClass::SMALL;
    mobile.signals.device.network = NetworkQuality::LOW;

    auto question = Question("kinematics", 60000);
    auto on_desktop = engine_->AllocateTime("s1", question, "JEE_Mains", desktop);
    auto on_mobile = engine_->AllocateTime("s1", question, "JEE_Mains", mobile);

    EXPECT_GT(on_mobile.FinalTimeMs(), on_desktop.FinalTimeMs());
}

TEST_F(TracingEngineTest, AllocationRejectsBadQuestion) {
    auto question = Question("kinematics", 60000);
    question.question_id.clear();
    EXPECT_THROW(engine_->AllocateTime("s1", question, "NEET", Calm()), ValidationError);
}

// ============================================================================
// Calibration and fairness
// ============================================================================

class TracingEngineCalibrationTest : public TracingEngineTest {
protected:
    // ±4 logits that are right only 70% of the time
    static void Overconfident(std::vector<double>& logits, std::vector<int>& labels) {
        for (int i = 0; i < 100; ++i) {
            bool positive = i < 50;
            logits.push_back(positive ? 4.0 : -4.0);
            bool right = (i % 50) < 35;
            labels.push_back(positive == right ? 1 : 0);
        }
    }
};

TEST_F(TracingEngineCalibrationTest, FitAndApplyPerExamSubject) {
    std::vector<double> logits;
    std::vector<int> labels;
    Overconfident(logits, labels);

    auto entry = engine_->FitCalibration("NEET", "biology", logits, labels);
    EXPECT_NEAR(4.0 / std::log(7.0 / 3.0), entry.temperature, 0.05);
    EXPECT_EQ(100u, entry.sample_count);

    double raw = 1.0 / (1.0 + std::exp(-4.0));
    EXPECT_NEAR(0.7, engine_->ApplyCalibration("NEET", "biology", raw), 0.01);
    EXPECT_DOUBLE_EQ(raw, engine_->ApplyCalibration("NEET", "physics", raw));
    EXPECT_EQ(1u, engine_->GetStats().calibration_fits);
}

TEST_F(TracingEngineCalibrationTest, DegenerateFitStoresNothing) {
    EXPECT_THROW(engine_->FitCalibration("NEET", "biology", {1.0, 2.0}, {1, 1}),
                 DegenerateCalibrationInput);
    EXPECT_DOUBLE_EQ(0.9, engine_->ApplyCalibration("NEET", "biology", 0.9));
}

TEST_F(TracingEngineCalibrationTest, FitFromLoggedInteractions) {
    for (int i = 0; i < 10; ++i) {
        auto request = Request("s" + std::to_string(i), {"genetics"}, i % 3 != 0);
        request.context.exam_code = "NEET";
        request.context.subject = "biology";
        engine_->ProcessInteraction(request);
    }
    engine_->ProcessInteraction(Request("other", {"optics"}, true));

    auto entry = engine_->FitCalibrationFromLog("NEET", "biology");
    EXPECT_EQ(10u, entry.sample_count);
    EXPECT_GT(entry.temperature, 0.0);

    EXPECT_THROW(engine_->FitCalibrationFromLog("JEE_Advanced", "chemistry"), ValidationError);
}

TEST_F(TracingEngineTest, FairnessReportFlagsDisparity) {
    for (int i = 0; i < 5; ++i) {
        engine_->RecordFairnessSample("JEE_Mains", "physics", "urban", 0.8);
        engine_->RecordFairnessSample("JEE_Mains", "physics", "rural", 0.6);
    }

    auto report = engine_->GetFairnessReport("JEE_Mains", "physics");
    EXPECT_NEAR(0.2, report.disparity, 1e-9);
    EXPECT_TRUE(report.flagged);
    EXPECT_FALSE(report.recommendations.empty());

    // Another subject is unaffected
    auto chemistry = engine_->GetFairnessReport("JEE_Mains", "chemistry");
    EXPECT_FALSE(chemistry.flagged);
    EXPECT_TRUE(chemistry.groups.empty());
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(TracingEngineCalibrationTest, SnapshotsSurviveRestart) {
    std::vector<double> logits;
    std::vector<int> labels;
    Overconfident(logits, labels);
    engine_->FitCalibration("NEET", "biology", logits, labels);
    engine_->RecordFairnessSample("NEET", "biology", "urban", 0.9);
    engine_->RecordFairnessSample("NEET", "biology", "rural", 0.5);

    ASSERT_TRUE(engine_->PersistSnapshots());

    double raw = 0.95;
    double expected = engine_->ApplyCalibration("NEET", "biology", raw);

    Rebuild();
    EXPECT_DOUBLE_EQ(raw, engine_->ApplyCalibration("NEET", "biology", raw));
    ASSERT_TRUE(engine_->RestoreSnapshots());

    EXPECT_DOUBLE_EQ(expected, engine_->ApplyCalibration("NEET", "biology", raw));
    auto report = engine_->GetFairnessReport("NEET", "biology");
    EXPECT_EQ(2u, report.groups.size());
    EXPECT_NEAR(0.4, report.disparity, 1e-9);
}

TEST_F(TracingEngineTest, SnapshotsNeedSnapshotStore) {
    TracingEngine engine(config_, store_, store_, store_);
    EXPECT_FALSE(engine.PersistSnapshots());
    EXPECT_FALSE(engine.RestoreSnapshots());
}

// ============================================================================
// Store timeouts
// ============================================================================

class TracingEngineTimeoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = EngineConfig::Default();
        config_.transfer_graph["algebra"]["calculus"] = 0.6;
        flaky_ = std::make_unique<FlakyStore>(inner_);
        engine_ = std::make_unique<TracingEngine>(config_, *flaky_, *flaky_, *flaky_);
    }

    static InteractionContext Calm() {
        InteractionContext context;
        context.stress = 0.0;
        return context;
    }

    EngineConfig config_;
    MemoryStore inner_;
    std::unique_ptr<FlakyStore> flaky_;
    std::unique_ptr<TracingEngine> engine_;
};

TEST_F(TracingEngineTimeoutTest, ParameterTimeoutFallsBackToDefaults) {
    flaky_->parameters_time_out = true;

    auto outcome = engine_->UpdateMastery("s1", "kinematics", true, Calm());

    EXPECT_NEAR(0.72, outcome.new_mastery, 1e-9);
    EXPECT_TRUE(outcome.degraded);
    EXPECT_FALSE(outcome.degradations.empty());

    auto stats = engine_->GetStats();
    EXPECT_EQ(1u, stats.parameter_timeouts);
    EXPECT_EQ(1u, stats.default_fallbacks);
    EXPECT_EQ(0u, stats.last_known_fallbacks);
}

TEST_F(TracingEngineTimeoutTest, ParameterTimeoutUsesLastKnownValue) {
    ConceptParameters params = config_.DefaultParameters("kinematics");
    params.learn_rate = 0.5;
    ASSERT_EQ(StoreStatus::OK, flaky_->PutParameters(params, std::chrono::milliseconds(100)));

    engine_->UpdateMastery("s1", "kinematics", true, Calm());
    flaky_->parameters_time_out = true;
    auto outcome = engine_->UpdateMastery("s2", "kinematics", true, Calm());

    EXPECT_NEAR(0.8, outcome.new_mastery, 1e-9);
    EXPECT_TRUE(outcome.degraded);
    EXPECT_EQ(1u, engine_->GetStats().last_known_fallbacks);
}

TEST_F(TracingEngineTimeoutTest, StateReadTimeoutUpdatesFromPriorWithoutWriting) {
    flaky_->state_reads_time_out = true;

    auto outcome = engine_->UpdateMastery("s1", "algebra", true, Calm());

    EXPECT_NEAR(0.72, outcome.new_mastery, 1e-9);
    EXPECT_TRUE(outcome.degraded);
    EXPECT_TRUE(outcome.transfers.empty());
    EXPECT_EQ(0u, inner_.StateCount());

    auto stats = engine_->GetStats();
    EXPECT_EQ(1u, stats.state_read_timeouts);
    EXPECT_EQ(0u, stats.transfer_updates);
}

TEST_F(TracingEngineTimeoutTest, StateWriteTimeoutSkipsTransfer) {
    flaky_->state_writes_time_out = true;

    auto outcome = engine_->UpdateMastery("s1", "algebra", true, Calm());

    EXPECT_TRUE(outcome.degraded);
    EXPECT_TRUE(outcome.transfers.empty());
    EXPECT_EQ(1u, engine_->GetStats().state_write_timeouts);
}

TEST_F(TracingEngineTimeoutTest, EventTimeoutStillReturnsOutcomes) {
    flaky_->appends_time_out = true;

    InteractionRequest request;
    request.student_id = "s1";
    request.question_id = "q1";
    request.concept_ids = {"kinematics"};
    request.correct = true;
    request.response_time_ms = 30000;
    request.context = Calm();

    auto result = engine_->ProcessInteraction(request);

    EXPECT_EQ(0u, result.event_id);
    EXPECT_TRUE(result.degraded);
    ASSERT_EQ(1u, result.outcomes.size());
    EXPECT_NEAR(0.72, result.outcomes[0].new_mastery, 1e-9);
    EXPECT_EQ(1u, engine_->GetStats().event_timeouts);
    EXPECT_EQ(0u, inner_.EventCount());
}

TEST_F(TracingEngineTimeoutTest, AllocationDegradesOnStateTimeout) {
    flaky_->state_reads_time_out = true;

    QuestionMetadata question;
    question.question_id = "q1";
    question.concept_id = "kinematics";
    auto allocation = engine_->AllocateTime("s1", question, "NEET", Calm());

    EXPECT_TRUE(allocation.degraded);
    EXPECT_DOUBLE_EQ(config_.tracing.default_prior, allocation.mastery);
    EXPECT_LE(allocation.FinalTimeMs(), 90000);
}

} // namespace
} // namespace kte
