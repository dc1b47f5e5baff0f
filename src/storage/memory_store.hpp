// File: src/storage/memory_store.hpp
#pragma once

#include "storage/event_log.hpp"
#include "storage/knowledge_state_store.hpp"
#include "storage/parameter_store.hpp"
#include "storage/snapshot_store.hpp"
#include <map>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>

namespace kte {

/// In-memory implementation of every store interface
///
/// Each table has its own shared_timed_mutex: readers share it, writers are
/// exclusive, and every call gives up with TIMEOUT once the caller's timeout
/// elapses without the lock.
///
/// Contents are lost on destruction; use SqliteStore for durability.
class MemoryStore : public ParameterStore,
                    public KnowledgeStateStore,
                    public EventLog,
                    public SnapshotStore {
public:
    struct Config {
        Config() = default;

        /// Pre-allocated buckets of the state table
        size_t initial_capacity{1024};
    };

    MemoryStore();
    explicit MemoryStore(const Config& config);
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // ========================================================================
    // ParameterStore
    // ========================================================================

    StoreResult<ConceptParameters> GetParameters(
        const std::string& concept_id,
        std::chrono::milliseconds timeout) override;
    StoreStatus PutParameters(
        const ConceptParameters& params,
        std::chrono::milliseconds timeout) override;
    std::vector<std::string> ListConcepts() const override;

    // ========================================================================
    // KnowledgeStateStore
    // ========================================================================

    StoreResult<KnowledgeState> GetState(
        const StateKey& key,
        std::chrono::milliseconds timeout) override;
    StoreStatus PutState(
        const KnowledgeState& state,
        std::chrono::milliseconds timeout) override;
    StoreResult<std::vector<KnowledgeState>> GetStudentStates(
        const std::string& student_id,
        std::chrono::milliseconds timeout) override;
    size_t StateCount() const override;

    // ========================================================================
    // EventLog
    // ========================================================================

    StoreResult<uint64_t> Append(
        const InteractionEvent& event,
        std::chrono::milliseconds timeout) override;
    std::vector<InteractionEvent> Snapshot() const override;
    size_t EventCount() const override;

    // ========================================================================
    // SnapshotStore
    // ========================================================================

    StoreStatus SaveCalibration(
        const std::vector<CalibrationEntry>& entries,
        std::chrono::milliseconds timeout) override;
    StoreResult<std::vector<CalibrationEntry>> LoadCalibration(
        std::chrono::milliseconds timeout) override;
    StoreStatus SaveFairness(
        const std::vector<FairnessSnapshot>& snapshots,
        std::chrono::milliseconds timeout) override;
    StoreResult<std::vector<FairnessSnapshot>> LoadFairness(
        std::chrono::milliseconds timeout) override;

    /// Drop every table
    void Clear();

private:
    Config config_;

    std::unordered_map<std::string, ConceptParameters> parameters_;
    mutable std::shared_timed_mutex parameters_mutex_;

    std::unordered_map<StateKey, KnowledgeState> states_;
    mutable std::shared_timed_mutex states_mutex_;

    std::vector<InteractionEvent> events_;
    uint64_t next_event_id_{1};
    mutable std::shared_timed_mutex events_mutex_;

    std::map<std::pair<std::string, std::string>, CalibrationEntry> calibration_;
    std::map<std::tuple<std::string, std::string, std::string>, FairnessSnapshot> fairness_;
    mutable std::shared_timed_mutex snapshots_mutex_;
};

} // namespace kte
