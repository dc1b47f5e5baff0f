// File: src/engine/tracing_engine.cpp
#include "engine/tracing_engine.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <iostream>
#include <set>
#include <sstream>

namespace kte {

namespace {

const EngineConfig& Validated(const EngineConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid engine configuration", errors);
    }
    return config;
}

void RequireId(const std::string& value, const char* what) {
    if (value.empty()) {
        throw ValidationError(std::string(what) + " must be non-empty");
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TracingEngine::TracingEngine(const EngineConfig& config,
                             ParameterStore& parameters,
                             KnowledgeStateStore& states,
                             EventLog& events,
                             SnapshotStore* snapshots)
    : config_(Validated(config)),
      timeout_(config.engine.store_timeout_ms),
      offline_timeout_(config.storage.busy_timeout_ms),
      parameters_(parameters),
      states_(states),
      events_(events),
      snapshots_(snapshots),
      updater_(config.tracing.updater),
      graph_(TransferGraph::FromMap(config.transfer_graph)),
      transfer_(config.transfer),
      estimator_(config.cognitive),
      allocator_(config.pacing),
      exams_(config.exams, config.engine.default_exam),
      calibration_(config.calibration),
      fairness_(config.fairness),
      locks_(config.engine.lock_stripes),
      parameter_cache_(config.engine.parameter_cache_size)
{
    if (config_.engine.verbose) {
        std::cerr << "[TracingEngine] Initialized with " << graph_.GetEdgeCount()
                  << " transfer edges, " << exams_.GetExamCodes().size() << " exams, "
                  << locks_.GetStripeCount() << " lock stripes" << std::endl;
    }
}

// ============================================================================
// Live path
// ============================================================================

MasteryOutcome TracingEngine::UpdateMastery(const std::string& student_id,
                                            const std::string& concept_id,
                                            bool correct,
                                            const InteractionContext& context) {
    RequireId(student_id, "student_id");
    RequireId(concept_id, "concept_id");

    CognitiveAssessment assessment = Assess(context.signals, context.stress);

    std::vector<std::string> degradations;
    ConceptParameters params = ResolveParameters(concept_id, &degradations);
    auto errors = params.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages(
            "Invalid parameters for concept '" + concept_id + "'", errors);
    }

    Timestamp now = context.now.IsZero() ? Timestamp::Now() : context.now;
    return UpdateConcept(student_id, params, correct, assessment.stress, now, std::move(degradations));
}

TimeAllocation TracingEngine::AllocateTime(const std::string& student_id,
                                           const QuestionMetadata& question,
                                           const std::string& exam_code,
                                           const InteractionContext& context) {
    RequireId(student_id, "student_id");
    RequireId(question.question_id, "question_id");

    const ExamConfiguration& exam = ResolveExam(exam_code.empty() ? context.exam_code : exam_code);

    TimeAllocation result;
    result.mastery = config_.tracing.default_prior;
    bool recovery = false;

    if (!question.concept_id.empty()) {
        auto read = states_.GetState(StateKey{student_id, question.concept_id}, timeout_);
        if (read.Ok()) {
            result.mastery = read.value->mastery_probability;
            recovery = read.value->in_recovery;
        } else if (read.status == StoreStatus::NOT_FOUND) {
            result.mastery = ResolveParameters(question.concept_id, nullptr).initial_mastery;
        } else {
            (read.TimedOut() ? counters_.state_read_timeouts : counters_.store_failures)
                .fetch_add(1, std::memory_order_relaxed);
            counters_.default_fallbacks.fetch_add(1, std::memory_order_relaxed);
            Warn("state read for " + student_id + "/" + question.concept_id + " " +
                 ToString(read.status) + "; allocating with the default prior");
            result.degraded = true;
        }
    }

    BehavioralSignals signals = context.signals;
    signals.problem.solution_steps = question.solution_steps;
    signals.problem.concept_mastery = result.mastery;

    if (!question.prerequisite_ids.empty()) {
        double sum = 0.0;
        size_t found = 0;
        for (const auto& prerequisite : question.prerequisite_ids) {
            auto read = states_.GetState(StateKey{student_id, prerequisite}, timeout_);
            if (read.Ok()) {
                sum += read.value->mastery_probability;
                ++found;
            } else if (read.TimedOut()) {
                counters_.state_read_timeouts.fetch_add(1, std::memory_order_relaxed);
                result.degraded = true;
            }
        }
        if (found > 0) {
            signals.problem.prerequisite_mastery = sum / static_cast<double>(found);
        }
    }

    result.assessment = Assess(signals, context.stress);

    TimeAllocator::Request request;
    request.student_id = student_id;
    request.question_id = question.question_id;
    request.base_time_ms = question.base_time_ms;
    request.stress = result.assessment.stress;
    request.fatigue = result.assessment.fatigue;
    request.mastery = result.mastery;
    request.difficulty = question.difficulty;
    request.session_elapsed_ms = context.signals.session.session_duration_ms;
    request.device = context.signals.device;
    request.overload_risk = result.assessment.overload_risk;
    request.recovery = recovery;

    result.allocation = allocator_.Allocate(request, exam);
    counters_.time_allocations.fetch_add(1, std::memory_order_relaxed);

    if (config_.engine.verbose) {
        std::cerr << "[TracingEngine] " << student_id << " " << question.question_id
                  << " allocated " << result.allocation.final_time_ms << " ms ("
                  << exam.exam_code << (result.allocation.capped ? ", capped" : "") << ")"
                  << std::endl;
    }
    return result;
}

InteractionResult TracingEngine::ProcessInteraction(const InteractionRequest& request) {
    RequireId(request.student_id, "student_id");
    if (request.concept_ids.empty()) {
        throw ValidationError("an interaction must touch at least one concept");
    }
    std::set<std::string> seen;
    for (const auto& concept_id : request.concept_ids) {
        RequireId(concept_id, "concept_id");
        if (!seen.insert(concept_id).second) {
            throw ValidationError("concept '" + concept_id + "' listed twice in one interaction");
        }
    }
    if (request.response_time_ms < 0) {
        throw ValidationError("response_time_ms must be >= 0");
    }

    const InteractionContext& context = request.context;
    const ExamConfiguration& exam = ResolveExam(context.exam_code);
    const std::string subject = SubjectOr(context.subject);
    const std::string group = GroupOr(context.group);

    BehavioralSignals signals = context.signals;
    if (signals.response_time_ms <= 0.0) {
        signals.response_time_ms = static_cast<double>(request.response_time_ms);
    }

    InteractionResult result;
    result.assessment = Assess(signals, context.stress);

    // Every concept's parameters are checked before any state changes
    std::vector<ConceptParameters> params;
    std::vector<std::vector<std::string>> degradations(request.concept_ids.size());
    for (size_t i = 0; i < request.concept_ids.size(); ++i) {
        params.push_back(ResolveParameters(request.concept_ids[i], &degradations[i]));
        auto errors = params.back().GetValidationErrors();
        if (!errors.empty()) {
            throw ConfigurationError::FromMessages(
                "Invalid parameters for concept '" + request.concept_ids[i] + "'", errors);
        }
    }

    Timestamp now = context.now.IsZero() ? Timestamp::Now() : context.now;

    double predicted = 0.0;
    double before = 0.0;
    double after = 0.0;
    for (size_t i = 0; i < params.size(); ++i) {
        result.outcomes.push_back(UpdateConcept(request.student_id, params[i], request.correct,
                                                result.assessment.stress, now,
                                                std::move(degradations[i])));
        const MasteryOutcome& outcome = result.outcomes.back();
        predicted += outcome.predicted_correct;
        before += outcome.previous_mastery;
        after += outcome.new_mastery;
        result.degraded = result.degraded || outcome.degraded;
    }
    double n = static_cast<double>(result.outcomes.size());

    result.score = exam.scoring.Score(request.correct);

    fairness_.Record(exam.exam_code, subject, group, Clamp01(after / n));
    counters_.fairness_samples.fetch_add(1, std::memory_order_relaxed);

    InteractionEvent event;
    event.student_id = request.student_id;
    event.concept_ids = request.concept_ids;
    event.correct = request.correct;
    event.response_time_ms = request.response_time_ms;
    event.exam_code = exam.exam_code;
    event.subject = subject;
    event.group = group;
    event.device = context.signals.device;
    event.stress = result.assessment.stress;
    event.intrinsic_load = result.assessment.intrinsic_load;
    event.extraneous_load = result.assessment.extraneous_load;
    event.total_load = result.assessment.total_load;
    event.predicted_correct = predicted / n;
    event.mastery_before = before / n;
    event.mastery_after = after / n;
    event.score = result.score;
    event.recorded_at = now;

    auto appended = events_.Append(event, timeout_);
    if (appended.Ok()) {
        result.event_id = *appended.value;
        counters_.events_appended.fetch_add(1, std::memory_order_relaxed);
    } else {
        (appended.TimedOut() ? counters_.event_timeouts : counters_.store_failures)
            .fetch_add(1, std::memory_order_relaxed);
        Warn("event append for " + request.student_id + " " + ToString(appended.status) +
             "; interaction not logged");
        result.degraded = true;
    }

    if (request.next_question) {
        result.next_time = AllocateTime(request.student_id, *request.next_question,
                                        exam.exam_code, context);
        result.degraded = result.degraded || result.next_time->degraded;
    }

    counters_.interactions.fetch_add(1, std::memory_order_relaxed);
    return result;
}

StoreResult<KnowledgeState> TracingEngine::GetMastery(const std::string& student_id,
                                                      const std::string& concept_id) {
    auto read = states_.GetState(StateKey{student_id, concept_id}, timeout_);
    if (read.TimedOut()) {
        counters_.state_read_timeouts.fetch_add(1, std::memory_order_relaxed);
    }
    return read;
}

// ============================================================================
// Calibration
// ============================================================================

CalibrationEntry TracingEngine::FitCalibration(const std::string& exam_code,
                                               const std::string& subject,
                                               const std::vector<double>& logits,
                                               const std::vector<int>& labels) {
    CalibrationEntry entry = calibration_.Fit(exam_code, subject, logits, labels);
    counters_.calibration_fits.fetch_add(1, std::memory_order_relaxed);

    if (config_.engine.verbose) {
        std::cerr << "[TracingEngine] Calibrated " << exam_code << "/" << subject
                  << ": T=" << entry.temperature << " over " << entry.sample_count
                  << " samples, ECE " << entry.ece_before << " -> " << entry.ece_after << std::endl;
    }
    return entry;
}

CalibrationEntry TracingEngine::FitCalibrationFromLog(const std::string& exam_code,
                                                      const std::string& subject) {
    CalibrationEntry entry = calibration_.FitFromEvents(exam_code, subject, events_.Snapshot());
    counters_.calibration_fits.fetch_add(1, std::memory_order_relaxed);
    return entry;
}

double TracingEngine::ApplyCalibration(const std::string& exam_code,
                                       const std::string& subject,
                                       double raw_probability) const {
    return calibration_.Apply(exam_code, subject, raw_probability);
}

// ============================================================================
// Fairness
// ============================================================================

void TracingEngine::RecordFairnessSample(const std::string& exam_code,
                                         const std::string& subject,
                                         const std::string& group,
                                         double outcome) {
    fairness_.Record(exam_code, subject, group, outcome);
    counters_.fairness_samples.fetch_add(1, std::memory_order_relaxed);
}

FairnessReport TracingEngine::GetFairnessReport(const std::string& exam_code,
                                                const std::string& subject) const {
    FairnessReport report = fairness_.Report(exam_code, subject);
    if (report.flagged) {
        std::ostringstream oss;
        oss << "disparity " << report.disparity << " for " << report.exam_code << "/"
            << report.subject << " exceeds " << config_.fairness.disparity_threshold;
        Warn(oss.str());
    }
    return report;
}

// ============================================================================
// Persistence and observability
// ============================================================================

bool TracingEngine::PersistSnapshots() {
    if (!snapshots_) {
        return false;
    }

    StoreStatus calibration = snapshots_->SaveCalibration(calibration_.Snapshot(), offline_timeout_);
    StoreStatus fairness = snapshots_->SaveFairness(fairness_.Snapshot(), offline_timeout_);

    if (calibration != StoreStatus::OK) {
        Warn(std::string("saving calibration entries: ") + ToString(calibration));
    }
    if (fairness != StoreStatus::OK) {
        Warn(std::string("saving fairness statistics: ") + ToString(fairness));
    }
    return calibration == StoreStatus::OK && fairness == StoreStatus::OK;
}

bool TracingEngine::RestoreSnapshots() {
    if (!snapshots_) {
        return false;
    }

    auto calibration = snapshots_->LoadCalibration(offline_timeout_);
    auto fairness = snapshots_->LoadFairness(offline_timeout_);
    if (!calibration.Ok() || !fairness.Ok()) {
        Warn(std::string("loading snapshots: calibration ") + ToString(calibration.status) +
             ", fairness " + ToString(fairness.status));
        return false;
    }

    try {
        for (const auto& entry : *calibration.value) {
            calibration_.Restore(entry);
        }
        fairness_.Restore(*fairness.value);
    } catch (const ValidationError& e) {
        Warn(std::string("stored snapshot rejected: ") + e.what());
        return false;
    }
    return true;
}

EngineStats TracingEngine::GetStats() const {
    auto load = [](const std::atomic<uint64_t>& counter) {
        return counter.load(std::memory_order_relaxed);
    };

    EngineStats stats;
    stats.mastery_updates = load(counters_.mastery_updates);
    stats.transfer_updates = load(counters_.transfer_updates);
    stats.time_allocations = load(counters_.time_allocations);
    stats.interactions = load(counters_.interactions);
    stats.events_appended = load(counters_.events_appended);
    stats.calibration_fits = load(counters_.calibration_fits);
    stats.fairness_samples = load(counters_.fairness_samples);
    stats.recoveries_entered = load(counters_.recoveries_entered);
    stats.parameter_timeouts = load(counters_.parameter_timeouts);
    stats.state_read_timeouts = load(counters_.state_read_timeouts);
    stats.state_write_timeouts = load(counters_.state_write_timeouts);
    stats.event_timeouts = load(counters_.event_timeouts);
    stats.store_failures = load(counters_.store_failures);
    stats.last_known_fallbacks = load(counters_.last_known_fallbacks);
    stats.default_fallbacks = load(counters_.default_fallbacks);
    return stats;
}

// ============================================================================
// Helpers
// ============================================================================

ConceptParameters TracingEngine::ResolveParameters(const std::string& concept_id,
                                                   std::vector<std::string>* degradations) {
    auto read = parameters_.GetParameters(concept_id, timeout_);
    switch (read.status) {
        case StoreStatus::OK:
            if (read.value) {
                parameter_cache_.Remember(concept_id, *read.value);
                return *read.value;
            }
            break;
        case StoreStatus::NOT_FOUND:
            return config_.DefaultParameters(concept_id);
        case StoreStatus::TIMEOUT:
            counters_.parameter_timeouts.fetch_add(1, std::memory_order_relaxed);
            break;
        case StoreStatus::FAILED:
            counters_.store_failures.fetch_add(1, std::memory_order_relaxed);
            break;
    }

    std::string note;
    ConceptParameters params;
    if (auto cached = parameter_cache_.Recall(concept_id)) {
        counters_.last_known_fallbacks.fetch_add(1, std::memory_order_relaxed);
        note = "parameters of " + concept_id + ": " + ToString(read.status) + ", using last-known";
        params = *cached;
    } else {
        counters_.default_fallbacks.fetch_add(1, std::memory_order_relaxed);
        note = "parameters of " + concept_id + ": " + ToString(read.status) + ", using defaults";
        params = config_.DefaultParameters(concept_id);
    }
    Warn(note);
    if (degradations) {
        degradations->push_back(note);
    }
    return params;
}

double TracingEngine::InitialMastery(const std::string& student_id,
                                     const std::string& concept_id,
                                     const ConceptParameters& params,
                                     const std::string& excluded_source) {
    if (!transfer_.GetConfig().seed_from_related) {
        return params.initial_mastery;
    }

    // Reads only; the informing keys' stripes are not taken
    std::vector<std::pair<double, double>> informing;
    for (const auto& edge : graph_.GetIncoming(concept_id)) {
        if (edge.source == excluded_source) {
            continue;
        }
        auto read = states_.GetState(StateKey{student_id, edge.source}, timeout_);
        if (read.Ok() && read.value->practice_count > 0) {
            informing.emplace_back(edge.weight, read.value->mastery_probability);
        } else if (read.TimedOut()) {
            counters_.state_read_timeouts.fetch_add(1, std::memory_order_relaxed);
        }
    }
    return transfer_.SeedPrior(params.initial_mastery, informing);
}

MasteryOutcome TracingEngine::UpdateConcept(const std::string& student_id,
                                            const ConceptParameters& params,
                                            bool correct,
                                            double stress,
                                            Timestamp now,
                                            std::vector<std::string> degradations) {
    const std::string& concept_id = params.concept_id;
    StateKey key{student_id, concept_id};

    MasteryUpdater::Context context;
    context.stress = stress;
    context.now = now;

    MasteryUpdater::Result result;
    bool persisted = false;
    {
        auto lock = locks_.Lock(key);

        KnowledgeState state;
        bool writable = true;
        auto read = states_.GetState(key, timeout_);
        if (read.Ok()) {
            state = *read.value;
        } else if (read.status == StoreStatus::NOT_FOUND) {
            state = KnowledgeState::Initial(student_id, concept_id,
                                            InitialMastery(student_id, concept_id, params));
        } else {
            (read.TimedOut() ? counters_.state_read_timeouts : counters_.store_failures)
                .fetch_add(1, std::memory_order_relaxed);
            counters_.default_fallbacks.fetch_add(1, std::memory_order_relaxed);
            std::string note = "state of " + key.ToString() + ": " + ToString(read.status) +
                               ", updated from the default prior without writing";
            Warn(note);
            degradations.push_back(note);
            state = KnowledgeState::Initial(student_id, concept_id, params.initial_mastery);
            writable = false;
        }

        result = updater_.Update(state, params, correct, context);

        if (writable) {
            StoreStatus status = states_.PutState(result.next_state, timeout_);
            if (status == StoreStatus::OK) {
                persisted = true;
            } else {
                (status == StoreStatus::TIMEOUT ? counters_.state_write_timeouts : counters_.store_failures)
                    .fetch_add(1, std::memory_order_relaxed);
                std::string note = "state write of " + key.ToString() + ": " + ToString(status);
                Warn(note);
                degradations.push_back(note);
            }
        }
    }

    MasteryOutcome outcome;
    outcome.student_id = student_id;
    outcome.concept_id = concept_id;
    outcome.previous_mastery = result.previous_mastery;
    outcome.new_mastery = result.new_mastery;
    outcome.predicted_correct = result.predicted_correct;
    outcome.effective_slip = result.effective_slip;
    outcome.effective_guess = result.effective_guess;
    outcome.stress = stress;
    outcome.practice_count = result.next_state.practice_count;
    outcome.recovery = result.recovery;
    outcome.entered_recovery = result.entered_recovery;

    counters_.mastery_updates.fetch_add(1, std::memory_order_relaxed);
    if (result.entered_recovery) {
        counters_.recoveries_entered.fetch_add(1, std::memory_order_relaxed);
        if (config_.engine.verbose) {
            std::cerr << "[TracingEngine] " << key.ToString() << " entered recovery at mastery "
                      << result.new_mastery << std::endl;
        }
    }

    // Only a stored change is propagated
    if (persisted) {
        Transfer(student_id, concept_id, result.decayed_mastery, result.new_mastery, outcome);
    }

    outcome.degradations.insert(outcome.degradations.begin(), degradations.begin(), degradations.end());
    outcome.degraded = !outcome.degradations.empty();
    return outcome;
}

void TracingEngine::Transfer(const std::string& student_id,
                             const std::string& source,
                             double previous_mastery,
                             double new_mastery,
                             MasteryOutcome& outcome) {
    for (const auto& target : transfer_.Plan(graph_, source, previous_mastery, new_mastery)) {
        ConceptParameters params = ResolveParameters(target.concept_id, &outcome.degradations);
        StateKey key{student_id, target.concept_id};

        auto lock = locks_.Lock(key);

        KnowledgeState state;
        auto read = states_.GetState(key, timeout_);
        if (read.Ok()) {
            state = *read.value;
        } else if (read.status == StoreStatus::NOT_FOUND) {
            // The source's own change arrives through the transfer below
            state = KnowledgeState::Initial(student_id, target.concept_id,
                                            InitialMastery(student_id, target.concept_id, params, source));
        } else {
            (read.TimedOut() ? counters_.state_read_timeouts : counters_.store_failures)
                .fetch_add(1, std::memory_order_relaxed);
            std::string note = "transfer to " + key.ToString() + " skipped: " + ToString(read.status);
            Warn(note);
            outcome.degradations.push_back(note);
            continue;
        }

        TransferUpdate update;
        update.concept_id = target.concept_id;
        update.weight = target.weight;
        update.previous_mastery = state.mastery_probability;
        state.mastery_probability = transfer_.Apply(state.mastery_probability, target);
        update.new_mastery = state.mastery_probability;

        StoreStatus status = states_.PutState(state, timeout_);
        if (status != StoreStatus::OK) {
            (status == StoreStatus::TIMEOUT ? counters_.state_write_timeouts : counters_.store_failures)
                .fetch_add(1, std::memory_order_relaxed);
            std::string note = "transfer write of " + key.ToString() + ": " + ToString(status);
            Warn(note);
            outcome.degradations.push_back(note);
            continue;
        }

        outcome.transfers.push_back(update);
        counters_.transfer_updates.fetch_add(1, std::memory_order_relaxed);
    }
}

CognitiveAssessment TracingEngine::Assess(const BehavioralSignals& signals,
                                          const std::optional<double>& stress) const {
    if (stress) {
        return estimator_.Estimate(signals, *stress);
    }
    return estimator_.Estimate(signals);
}

const ExamConfiguration& TracingEngine::ResolveExam(const std::string& exam_code) const {
    if (exam_code.empty()) {
        return exams_.Resolve(config_.engine.default_exam);
    }
    if (!exams_.Contains(exam_code)) {
        Warn("unknown exam code '" + exam_code + "', using " + config_.engine.default_exam);
    }
    return exams_.Resolve(exam_code);
}

std::string TracingEngine::SubjectOr(const std::string& subject) const {
    return subject.empty() ? config_.engine.default_subject : subject;
}

std::string TracingEngine::GroupOr(const std::string& group) const {
    return group.empty() ? config_.engine.default_group : group;
}

void TracingEngine::Warn(const std::string& message) const {
    std::cerr << "[TracingEngine] Warning: " << message << std::endl;
}

} // namespace kte
