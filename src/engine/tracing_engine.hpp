// File: src/engine/tracing_engine.hpp
#pragma once

#include "calibration/calibration_table.hpp"
#include "cognitive/cognitive_estimator.hpp"
#include "config/engine_config.hpp"
#include "engine/keyed_lock_table.hpp"
#include "fairness/fairness_monitor.hpp"
#include "pacing/exam_config.hpp"
#include "pacing/time_allocator.hpp"
#include "storage/event_log.hpp"
#include "storage/knowledge_state_store.hpp"
#include "storage/last_known_cache.hpp"
#include "storage/parameter_store.hpp"
#include "storage/snapshot_store.hpp"
#include "tracing/mastery_updater.hpp"
#include "tracing/transfer_graph.hpp"
#include "tracing/transfer_learner.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace kte {

/// Request-scoped context of one interaction
struct InteractionContext {
    std::string exam_code;  // empty: configured default exam
    std::string subject;    // empty: configured default subject
    std::string group;      // empty: configured default group

    /// Behavioural signals for the stress and load estimate
    BehavioralSignals signals;

    /// Stress measured elsewhere; overrides the estimate when set
    std::optional<double> stress;

    /// Observation time; zero means now
    Timestamp now;
};

/// Adjustment of one related concept after a transfer
struct TransferUpdate {
    std::string concept_id;
    double weight{0.0};
    double previous_mastery{0.0};
    double new_mastery{0.0};
};

/// Result of one mastery update
struct MasteryOutcome {
    std::string student_id;
    std::string concept_id;
    double previous_mastery{0.0};
    double new_mastery{0.0};
    double predicted_correct{0.0};
    double effective_slip{0.0};
    double effective_guess{0.0};
    double stress{0.0};
    uint64_t practice_count{0};
    bool recovery{false};
    bool entered_recovery{false};
    std::vector<TransferUpdate> transfers;

    /// A store timed out and a fallback was used
    bool degraded{false};
    std::vector<std::string> degradations;
};

/// Result of a time allocation
struct TimeAllocation {
    TimeAllocator::Allocation allocation;
    CognitiveAssessment assessment;
    double mastery{0.0};
    bool degraded{false};

    int64_t FinalTimeMs() const { return allocation.final_time_ms; }
};

/// One answered question touching one or more concepts
struct InteractionRequest {
    std::string student_id;
    std::string question_id;
    std::vector<std::string> concept_ids;
    bool correct{false};
    int64_t response_time_ms{0};
    InteractionContext context;

    /// Question to allocate time for once the update is done
    std::optional<QuestionMetadata> next_question;
};

/// Result of the full interaction pipeline
struct InteractionResult {
    uint64_t event_id{0};  // 0 when the event could not be appended
    CognitiveAssessment assessment;
    std::vector<MasteryOutcome> outcomes;
    std::optional<TimeAllocation> next_time;
    double score{0.0};
    bool degraded{false};
};

/// Counters of engine activity
struct EngineStats {
    uint64_t mastery_updates{0};
    uint64_t transfer_updates{0};
    uint64_t time_allocations{0};
    uint64_t interactions{0};
    uint64_t events_appended{0};
    uint64_t calibration_fits{0};
    uint64_t fairness_samples{0};
    uint64_t recoveries_entered{0};

    uint64_t parameter_timeouts{0};
    uint64_t state_read_timeouts{0};
    uint64_t state_write_timeouts{0};
    uint64_t event_timeouts{0};
    uint64_t store_failures{0};
    uint64_t last_known_fallbacks{0};
    uint64_t default_fallbacks{0};
};

/// TracingEngine: Adaptive knowledge-tracing facade
///
/// Wires the estimator, updater, transfer learner, time allocator,
/// calibration table and fairness monitor to the stores.
///
/// Thread-safety: all public methods may be called concurrently. Each
/// (student, concept) read-modify-write runs under that key's stripe of the
/// lock table, so concurrent answers for the same key never lose an update.
/// Store calls carry the configured timeout; on timeout the engine falls back
/// (last-known or default parameters, default prior) and marks the result
/// degraded instead of failing the request.
class TracingEngine {
public:
    /// @param config Validated configuration (copied)
    /// @param parameters Concept parameter source
    /// @param states Knowledge state storage
    /// @param events Interaction event sink
    /// @param snapshots Optional persistence of calibration and fairness state
    /// @throws ConfigurationError if the configuration is invalid
    TracingEngine(const EngineConfig& config,
                  ParameterStore& parameters,
                  KnowledgeStateStore& states,
                  EventLog& events,
                  SnapshotStore* snapshots = nullptr);

    TracingEngine(const TracingEngine&) = delete;
    TracingEngine& operator=(const TracingEngine&) = delete;

    // ========================================================================
    // Live path
    // ========================================================================

    /// Apply one observation to (student, concept) and transfer to neighbours
    /// @throws ValidationError on bad identifiers, signals or stress
    /// @throws ConfigurationError on inconsistent concept parameters
    MasteryOutcome UpdateMastery(const std::string& student_id,
                                 const std::string& concept_id,
                                 bool correct,
                                 const InteractionContext& context);

    /// Time budget for the student's next question
    /// Unknown exam codes use the default exam's cap.
    /// @throws ValidationError on bad question metadata or signals
    TimeAllocation AllocateTime(const std::string& student_id,
                                const QuestionMetadata& question,
                                const std::string& exam_code,
                                const InteractionContext& context);

    /// Estimate, update every concept, transfer, record fairness, log the
    /// event and optionally allocate time for the next question
    /// Parameters of every concept are validated before any state changes.
    InteractionResult ProcessInteraction(const InteractionRequest& request);

    /// Current state of a key, as stored
    StoreResult<KnowledgeState> GetMastery(const std::string& student_id,
                                           const std::string& concept_id);

    // ========================================================================
    // Calibration
    // ========================================================================

    /// @throws ValidationError, DegenerateCalibrationInput (nothing stored)
    CalibrationEntry FitCalibration(const std::string& exam_code,
                                    const std::string& subject,
                                    const std::vector<double>& logits,
                                    const std::vector<int>& labels);

    /// Fit from a snapshot of the event log
    CalibrationEntry FitCalibrationFromLog(const std::string& exam_code,
                                           const std::string& subject);

    /// Calibrated probability; unchanged input when the key has no temperature
    double ApplyCalibration(const std::string& exam_code,
                            const std::string& subject,
                            double raw_probability) const;

    // ========================================================================
    // Fairness
    // ========================================================================

    void RecordFairnessSample(const std::string& exam_code,
                              const std::string& subject,
                              const std::string& group,
                              double outcome);

    FairnessReport GetFairnessReport(const std::string& exam_code,
                                     const std::string& subject) const;

    // ========================================================================
    // Persistence and observability
    // ========================================================================

    /// Save calibration and fairness state to the snapshot store
    /// @return false without a snapshot store or when a save fails
    bool PersistSnapshots();

    /// Load calibration and fairness state from the snapshot store
    bool RestoreSnapshots();

    EngineStats GetStats() const;

    const EngineConfig& GetConfig() const { return config_; }
    const ExamRegistry& GetExamRegistry() const { return exams_; }
    const TransferGraph& GetTransferGraph() const { return graph_; }
    const CalibrationTable& GetCalibrationTable() const { return calibration_; }

private:
    struct Counters {
        std::atomic<uint64_t> mastery_updates{0};
        std::atomic<uint64_t> transfer_updates{0};
        std::atomic<uint64_t> time_allocations{0};
        std::atomic<uint64_t> interactions{0};
        std::atomic<uint64_t> events_appended{0};
        std::atomic<uint64_t> calibration_fits{0};
        std::atomic<uint64_t> fairness_samples{0};
        std::atomic<uint64_t> recoveries_entered{0};
        std::atomic<uint64_t> parameter_timeouts{0};
        std::atomic<uint64_t> state_read_timeouts{0};
        std::atomic<uint64_t> state_write_timeouts{0};
        std::atomic<uint64_t> event_timeouts{0};
        std::atomic<uint64_t> store_failures{0};
        std::atomic<uint64_t> last_known_fallbacks{0};
        std::atomic<uint64_t> default_fallbacks{0};
    };

    EngineConfig config_;
    std::chrono::milliseconds timeout_;          // live path
    std::chrono::milliseconds offline_timeout_;  // snapshots and reports

    ParameterStore& parameters_;
    KnowledgeStateStore& states_;
    EventLog& events_;
    SnapshotStore* snapshots_;

    MasteryUpdater updater_;
    TransferGraph graph_;
    TransferLearner transfer_;
    CognitiveEstimator estimator_;
    TimeAllocator allocator_;
    ExamRegistry exams_;
    CalibrationTable calibration_;
    FairnessMonitor fairness_;

    KeyedLockTable locks_;
    LastKnownCache<std::string, ConceptParameters> parameter_cache_;

    Counters counters_;

    /// Parameters from the store, the last-known cache or the defaults
    ConceptParameters ResolveParameters(const std::string& concept_id,
                                        std::vector<std::string>* degradations);

    /// Prior of a state created lazily, seeded from related concepts other
    /// than excluded_source
    double InitialMastery(const std::string& student_id,
                          const std::string& concept_id,
                          const ConceptParameters& params,
                          const std::string& excluded_source = std::string());

    /// Read-modify-write of one key under its stripe
    MasteryOutcome UpdateConcept(const std::string& student_id,
                                 const ConceptParameters& params,
                                 bool correct,
                                 double stress,
                                 Timestamp now,
                                 std::vector<std::string> degradations);

    /// One-hop transfer from `source`, each target under its own stripe
    void Transfer(const std::string& student_id,
                  const std::string& source,
                  double previous_mastery,
                  double new_mastery,
                  MasteryOutcome& outcome);

    /// Estimate, with stress replaced by the caller's measurement when given
    CognitiveAssessment Assess(const BehavioralSignals& signals,
                               const std::optional<double>& stress) const;
    const ExamConfiguration& ResolveExam(const std::string& exam_code) const;
    std::string SubjectOr(const std::string& subject) const;
    std::string GroupOr(const std::string& group) const;
    void Warn(const std::string& message) const;
};

} // namespace kte
