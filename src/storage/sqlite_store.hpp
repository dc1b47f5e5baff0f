// File: src/storage/sqlite_store.hpp
#pragma once

#include "storage/event_log.hpp"
#include "storage/knowledge_state_store.hpp"
#include "storage/parameter_store.hpp"
#include "storage/snapshot_store.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace kte {

/// Durable implementation of every store interface using SQLite
///
/// Features:
/// - Write-Ahead Logging with a second, read-only connection for the
///   offline scans (Snapshot, row counts)
/// - Prepared statements for every query
/// - Transactions for multi-row writes (event append, snapshot saves)
/// - CHECK constraints on probabilities, counts and temperatures
/// - Triggers that reject UPDATE and DELETE on the event log
///
/// The live connection is guarded by a timed mutex. A call that cannot take
/// the mutex, or that SQLite reports as busy, within its timeout returns
/// TIMEOUT. Offline scans never take that mutex when the reader connection
/// is open; an in-memory or non-WAL database has no reader, and its scans
/// release the live mutex between pages.
class SqliteStore : public ParameterStore,
                    public KnowledgeStateStore,
                    public EventLog,
                    public SnapshotStore {
public:
    struct Config {
        Config() = default;

        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path{"kte.db"};

        bool enable_wal{true};

        /// Cache size in KB
        size_t cache_size_kb{10240};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Busy timeout of calls that carry no timeout of their own
        int busy_timeout_ms{5000};
    };

    /// @throws EngineError if the database cannot be opened or initialised
    explicit SqliteStore(const Config& config);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

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

    /// Number of SQL statements that failed since construction
    uint64_t GetErrorCount() const { return errors_.load(std::memory_order_relaxed); }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    sqlite3* db_{nullptr};

    // The live connection is shared; calls are serialised
    mutable std::timed_mutex mutex_;

    // Read-only connection for offline scans; null without WAL
    sqlite3* reader_{nullptr};
    mutable std::mutex reader_mutex_;

    mutable std::atomic<uint64_t> errors_{0};

    void InitializeDatabase();
    void CreateTables();
    void OpenReader();
    bool ExecuteSQL(const std::string& sql) const;

    /// Prepare a statement on the live connection, logging failures
    sqlite3_stmt* Prepare(const char* sql) const { return Prepare(db_, sql); }
    sqlite3_stmt* Prepare(sqlite3* connection, const char* sql) const;

    /// Map a SQLite result code to a store status
    StoreStatus StatusFromCode(int rc, const char* operation) const;

    /// Convert the caller's timeout into the connection's busy timeout
    void ApplyBusyTimeout(std::chrono::milliseconds timeout) const;

    bool BeginTransaction();
    bool CommitTransaction();
    void RollbackTransaction();

    size_t CountRows(const char* sql) const;

    /// Read events with ids above after_id (at most limit, -1 for all) and
    /// advance after_id past them. Returns the number of rows scanned.
    size_t ReadEventPage(sqlite3* connection,
                         uint64_t& after_id,
                         int limit,
                         std::vector<InteractionEvent>& events) const;
};

} // namespace kte
