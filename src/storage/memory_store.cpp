// File: src/storage/memory_store.cpp
#include "storage/memory_store.hpp"
#include <algorithm>
#include <mutex>

namespace kte {

namespace {

using ReadLock = std::shared_lock<std::shared_timed_mutex>;
using WriteLock = std::unique_lock<std::shared_timed_mutex>;

void ValidateState(const KnowledgeState& state) {
    if (state.student_id.empty() || state.concept_id.empty()) {
        throw ValidationError("knowledge state needs a student and a concept id");
    }
    if (!(state.mastery_probability >= 0.0 && state.mastery_probability <= 1.0)) {
        throw ValidationError("mastery of " + state.Key().ToString() + " must be in [0, 1]");
    }
}

} // namespace

MemoryStore::MemoryStore()
    : MemoryStore(Config())
{
}

MemoryStore::MemoryStore(const Config& config)
    : config_(config)
{
    states_.reserve(config_.initial_capacity);
}

// ============================================================================
// ParameterStore
// ============================================================================

StoreResult<ConceptParameters> MemoryStore::GetParameters(const std::string& concept_id,
                                                          std::chrono::milliseconds timeout) {
    ReadLock lock(parameters_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreResult<ConceptParameters>::Status(StoreStatus::TIMEOUT);
    }

    auto it = parameters_.find(concept_id);
    if (it == parameters_.end()) {
        return StoreResult<ConceptParameters>::Status(StoreStatus::NOT_FOUND);
    }
    return StoreResult<ConceptParameters>::Found(it->second);
}

StoreStatus MemoryStore::PutParameters(const ConceptParameters& params,
                                       std::chrono::milliseconds timeout) {
    auto errors = params.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages(
            "Invalid parameters for concept '" + params.concept_id + "'", errors);
    }

    WriteLock lock(parameters_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    parameters_[params.concept_id] = params;
    return StoreStatus::OK;
}

std::vector<std::string> MemoryStore::ListConcepts() const {
    ReadLock lock(parameters_mutex_);
    std::vector<std::string> concepts;
    concepts.reserve(parameters_.size());
    for (const auto& entry : parameters_) {
        concepts.push_back(entry.first);
    }
    std::sort(concepts.begin(), concepts.end());
    return concepts;
}

// ============================================================================
// KnowledgeStateStore
// ============================================================================

StoreResult<KnowledgeState> MemoryStore::GetState(const StateKey& key,
                                                  std::chrono::milliseconds timeout) {
    ReadLock lock(states_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreResult<KnowledgeState>::Status(StoreStatus::TIMEOUT);
    }

    auto it = states_.find(key);
    if (it == states_.end()) {
        return StoreResult<KnowledgeState>::Status(StoreStatus::NOT_FOUND);
    }
    return StoreResult<KnowledgeState>::Found(it->second);
}

StoreStatus MemoryStore::PutState(const KnowledgeState& state,
                                  std::chrono::milliseconds timeout) {
    ValidateState(state);

    WriteLock lock(states_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    states_[state.Key()] = state;
    return StoreStatus::OK;
}

StoreResult<std::vector<KnowledgeState>> MemoryStore::GetStudentStates(
    const std::string& student_id,
    std::chrono::milliseconds timeout) {
    ReadLock lock(states_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreResult<std::vector<KnowledgeState>>::Status(StoreStatus::TIMEOUT);
    }

    std::vector<KnowledgeState> result;
    for (const auto& [key, state] : states_) {
        if (key.student_id == student_id) {
            result.push_back(state);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const KnowledgeState& a, const KnowledgeState& b) {
                  return a.concept_id < b.concept_id;
              });
    return StoreResult<std::vector<KnowledgeState>>::Found(std::move(result));
}

size_t MemoryStore::StateCount() const {
    ReadLock lock(states_mutex_);
    return states_.size();
}

// ============================================================================
// EventLog
// ============================================================================

StoreResult<uint64_t> MemoryStore::Append(const InteractionEvent& event,
                                          std::chrono::milliseconds timeout) {
    WriteLock lock(events_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreResult<uint64_t>::Status(StoreStatus::TIMEOUT);
    }

    InteractionEvent stored = event;
    stored.event_id = next_event_id_++;
    events_.push_back(std::move(stored));
    return StoreResult<uint64_t>::Found(events_.back().event_id);
}

std::vector<InteractionEvent> MemoryStore::Snapshot() const {
    ReadLock lock(events_mutex_);
    return events_;
}

size_t MemoryStore::EventCount() const {
    ReadLock lock(events_mutex_);
    return events_.size();
}

// ============================================================================
// SnapshotStore
// ============================================================================

StoreStatus MemoryStore::SaveCalibration(const std::vector<CalibrationEntry>& entries,
                                         std::chrono::milliseconds timeout) {
    WriteLock lock(snapshots_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    for (const auto& entry : entries) {
        calibration_[{entry.exam_code, entry.subject}] = entry;
    }
    return StoreStatus::OK;
}

StoreResult<std::vector<CalibrationEntry>> MemoryStore::LoadCalibration(
    std::chrono::milliseconds timeout) {
    ReadLock lock(snapshots_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreResult<std::vector<CalibrationEntry>>::Status(StoreStatus::TIMEOUT);
    }

    std::vector<CalibrationEntry> result;
    for (const auto& entry : calibration_) {
        result.push_back(entry.second);
    }
    return StoreResult<std::vector<CalibrationEntry>>::Found(std::move(result));
}

StoreStatus MemoryStore::SaveFairness(const std::vector<FairnessSnapshot>& snapshots,
                                      std::chrono::milliseconds timeout) {
    WriteLock lock(snapshots_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    for (const auto& snapshot : snapshots) {
        fairness_[{snapshot.exam_code, snapshot.subject, snapshot.group}] = snapshot;
    }
    return StoreStatus::OK;
}

StoreResult<std::vector<FairnessSnapshot>> MemoryStore::LoadFairness(
    std::chrono::milliseconds timeout) {
    ReadLock lock(snapshots_mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreResult<std::vector<FairnessSnapshot>>::Status(StoreStatus::TIMEOUT);
    }

    std::vector<FairnessSnapshot> result;
    for (const auto& entry : fairness_) {
        result.push_back(entry.second);
    }
    return StoreResult<std::vector<FairnessSnapshot>>::Found(std::move(result));
}

void MemoryStore::Clear() {
    {
        WriteLock lock(parameters_mutex_);
        parameters_.clear();
    }
    {
        WriteLock lock(states_mutex_);
        states_.clear();
    }
    {
        WriteLock lock(events_mutex_);
        events_.clear();
        next_event_id_ = 1;
    }
    {
        WriteLock lock(snapshots_mutex_);
        calibration_.clear();
        fairness_.clear();
    }
}

} // namespace kte
