// File: src/storage/sqlite_store.cpp
#include "storage/sqlite_store.hpp"
#include <iostream>
#include <map>

namespace kte {

namespace {

using TimedLock = std::unique_lock<std::timed_mutex>;

// Rows per page when a scan shares the live connection
const int kSnapshotPageSize = 512;

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

KnowledgeState ReadState(sqlite3_stmt* stmt) {
    KnowledgeState state;
    state.student_id = ColumnText(stmt, 0);
    state.concept_id = ColumnText(stmt, 1);
    state.mastery_probability = sqlite3_column_double(stmt, 2);
    state.practice_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    state.last_practiced = Timestamp::FromMicros(sqlite3_column_int64(stmt, 4));
    state.consecutive_incorrect = static_cast<uint32_t>(sqlite3_column_int64(stmt, 5));
    state.in_recovery = sqlite3_column_int(stmt, 6) != 0;
    return state;
}

// Rows written before the CHECK constraints existed may be out of range
bool IsStoredStateValid(const KnowledgeState& state) {
    return state.mastery_probability >= 0.0 && state.mastery_probability <= 1.0;
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteStore::SqliteStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw EngineError("Failed to open database '" + config_.db_path + "': " + error);
    }

    try {
        InitializeDatabase();
    } catch (const EngineError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    OpenReader();
}

SqliteStore::~SqliteStore() {
    if (reader_) {
        sqlite3_close_v2(reader_);
        reader_ = nullptr;
    }
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            std::cerr << "[SqliteStore] Error closing database: " << sqlite3_errstr(rc) << std::endl;
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteStore::InitializeDatabase() {
    std::lock_guard<std::timed_mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    CreateTables();
}

void SqliteStore::OpenReader() {
    if (!config_.enable_wal || config_.db_path.empty() || config_.db_path == ":memory:") {
        return;
    }

    int rc = sqlite3_open_v2(config_.db_path.c_str(), &reader_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "[SqliteStore] Reader connection unavailable, scans share the live connection: "
                  << (reader_ ? sqlite3_errmsg(reader_) : sqlite3_errstr(rc)) << std::endl;
        sqlite3_close(reader_);
        reader_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(reader_, config_.busy_timeout_ms);
}

void SqliteStore::CreateTables() {
    const char* statements[] = {
        R"(
        CREATE TABLE IF NOT EXISTS concept_parameters (
            concept_id TEXT PRIMARY KEY,
            learn_rate REAL NOT NULL CHECK (learn_rate BETWEEN 0 AND 1),
            slip_rate REAL NOT NULL CHECK (slip_rate BETWEEN 0 AND 1),
            guess_rate REAL NOT NULL CHECK (guess_rate BETWEEN 0 AND 1),
            forgetting_rate REAL NOT NULL CHECK (forgetting_rate BETWEEN 0 AND 1),
            initial_mastery REAL NOT NULL CHECK (initial_mastery BETWEEN 0 AND 1)
        );)",
        R"(
        CREATE TABLE IF NOT EXISTS knowledge_states (
            student_id TEXT NOT NULL,
            concept_id TEXT NOT NULL,
            mastery REAL NOT NULL CHECK (mastery BETWEEN 0 AND 1),
            practice_count INTEGER NOT NULL CHECK (practice_count >= 0),
            last_practiced INTEGER NOT NULL,
            consecutive_incorrect INTEGER NOT NULL CHECK (consecutive_incorrect >= 0),
            in_recovery INTEGER NOT NULL CHECK (in_recovery IN (0, 1)),
            PRIMARY KEY (student_id, concept_id)
        );)",
        R"(
        CREATE TABLE IF NOT EXISTS interaction_events (
            event_id INTEGER PRIMARY KEY AUTOINCREMENT,
            student_id TEXT NOT NULL,
            correct INTEGER NOT NULL CHECK (correct IN (0, 1)),
            response_time_ms INTEGER NOT NULL CHECK (response_time_ms >= 0),
            exam_code TEXT NOT NULL,
            subject TEXT NOT NULL,
            grp TEXT NOT NULL,
            device_type TEXT NOT NULL,
            screen TEXT NOT NULL,
            network TEXT NOT NULL,
            stress REAL NOT NULL CHECK (stress BETWEEN 0 AND 1),
            intrinsic_load REAL NOT NULL CHECK (intrinsic_load BETWEEN 0 AND 1),
            extraneous_load REAL NOT NULL CHECK (extraneous_load BETWEEN 0 AND 1),
            total_load REAL NOT NULL CHECK (total_load BETWEEN 0 AND 1),
            predicted_correct REAL NOT NULL CHECK (predicted_correct BETWEEN 0 AND 1),
            mastery_before REAL NOT NULL CHECK (mastery_before BETWEEN 0 AND 1),
            mastery_after REAL NOT NULL CHECK (mastery_after BETWEEN 0 AND 1),
            score REAL NOT NULL,
            recorded_at INTEGER NOT NULL
        );)",
        R"(
        CREATE TABLE IF NOT EXISTS event_concepts (
            event_id INTEGER NOT NULL,
            position INTEGER NOT NULL,
            concept_id TEXT NOT NULL,
            PRIMARY KEY (event_id, position)
        );)",
        R"(
        CREATE TABLE IF NOT EXISTS calibration_entries (
            exam_code TEXT NOT NULL,
            subject TEXT NOT NULL,
            temperature REAL NOT NULL CHECK (temperature > 0),
            sample_count INTEGER NOT NULL CHECK (sample_count >= 0),
            nll_before REAL NOT NULL,
            nll_after REAL NOT NULL,
            ece_before REAL NOT NULL,
            ece_after REAL NOT NULL,
            fitted_at INTEGER NOT NULL,
            PRIMARY KEY (exam_code, subject)
        );)",
        R"(
        CREATE TABLE IF NOT EXISTS fairness_stats (
            exam_code TEXT NOT NULL,
            subject TEXT NOT NULL,
            grp TEXT NOT NULL,
            average REAL NOT NULL CHECK (average BETWEEN 0 AND 1),
            sample_count INTEGER NOT NULL CHECK (sample_count >= 0),
            PRIMARY KEY (exam_code, subject, grp)
        );)",
        R"(
        CREATE TRIGGER IF NOT EXISTS interaction_events_no_update
        BEFORE UPDATE ON interaction_events
        BEGIN SELECT RAISE(ABORT, 'interaction events are append-only'); END;)",
        R"(
        CREATE TRIGGER IF NOT EXISTS interaction_events_no_delete
        BEFORE DELETE ON interaction_events
        BEGIN SELECT RAISE(ABORT, 'interaction events are append-only'); END;)",
        R"(
        CREATE TRIGGER IF NOT EXISTS event_concepts_no_update
        BEFORE UPDATE ON event_concepts
        BEGIN SELECT RAISE(ABORT, 'interaction events are append-only'); END;)",
        R"(
        CREATE TRIGGER IF NOT EXISTS event_concepts_no_delete
        BEFORE DELETE ON event_concepts
        BEGIN SELECT RAISE(ABORT, 'interaction events are append-only'); END;)",
        "CREATE INDEX IF NOT EXISTS idx_states_student ON knowledge_states(student_id);",
        "CREATE INDEX IF NOT EXISTS idx_events_key ON interaction_events(exam_code, subject);",
    };

    for (const char* sql : statements) {
        if (!ExecuteSQL(sql)) {
            throw EngineError("Failed to initialise schema of '" + config_.db_path + "'");
        }
    }
}

bool SqliteStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[SqliteStore] " << (error_msg ? error_msg : sqlite3_errstr(rc)) << std::endl;
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }
    return true;
}

sqlite3_stmt* SqliteStore::Prepare(sqlite3* connection, const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(connection, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[SqliteStore] Prepare failed: " << sqlite3_errmsg(connection) << std::endl;
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return stmt;
}

StoreStatus SqliteStore::StatusFromCode(int rc, const char* operation) const {
    switch (rc) {
        case SQLITE_OK:
        case SQLITE_DONE:
        case SQLITE_ROW:
            return StoreStatus::OK;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return StoreStatus::TIMEOUT;
        default:
            errors_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[SqliteStore] " << operation << " failed: " << sqlite3_errmsg(db_) << std::endl;
            return StoreStatus::FAILED;
    }
}

void SqliteStore::ApplyBusyTimeout(std::chrono::milliseconds timeout) const {
    sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
}

bool SqliteStore::BeginTransaction() {
    return ExecuteSQL("BEGIN IMMEDIATE TRANSACTION;");
}

bool SqliteStore::CommitTransaction() {
    return ExecuteSQL("COMMIT;");
}

void SqliteStore::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

size_t SqliteStore::CountRows(const char* sql) const {
    std::unique_lock<std::mutex> reader_lock(reader_mutex_, std::defer_lock);
    std::unique_lock<std::timed_mutex> live_lock(mutex_, std::defer_lock);
    sqlite3* connection = reader_;
    if (connection) {
        reader_lock.lock();
    } else {
        live_lock.lock();
        ApplyBusyTimeout(std::chrono::milliseconds(config_.busy_timeout_ms));
        connection = db_;
    }

    sqlite3_stmt* stmt = Prepare(connection, sql);
    if (!stmt) {
        return 0;
    }
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

// ============================================================================
// ParameterStore
// ============================================================================

StoreResult<ConceptParameters> SqliteStore::GetParameters(const std::string& concept_id,
                                                          std::chrono::milliseconds timeout) {
    using Result = StoreResult<ConceptParameters>;

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return Result::Status(StoreStatus::TIMEOUT);
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "SELECT learn_rate, slip_rate, guess_rate, forgetting_rate, initial_mastery "
        "FROM concept_parameters WHERE concept_id = ?;");
    if (!stmt) {
        return Result::Status(StoreStatus::FAILED);
    }
    BindText(stmt, 1, concept_id);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return Result::Status(rc == SQLITE_DONE ? StoreStatus::NOT_FOUND
                                                : StatusFromCode(rc, "GetParameters"));
    }

    ConceptParameters params;
    params.concept_id = concept_id;
    params.learn_rate = sqlite3_column_double(stmt, 0);
    params.slip_rate = sqlite3_column_double(stmt, 1);
    params.guess_rate = sqlite3_column_double(stmt, 2);
    params.forgetting_rate = sqlite3_column_double(stmt, 3);
    params.initial_mastery = sqlite3_column_double(stmt, 4);
    sqlite3_finalize(stmt);
    return Result::Found(params);
}

StoreStatus SqliteStore::PutParameters(const ConceptParameters& params,
                                       std::chrono::milliseconds timeout) {
    auto errors = params.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages(
            "Invalid parameters for concept '" + params.concept_id + "'", errors);
    }

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "INSERT OR REPLACE INTO concept_parameters "
        "(concept_id, learn_rate, slip_rate, guess_rate, forgetting_rate, initial_mastery) "
        "VALUES (?, ?, ?, ?, ?, ?);");
    if (!stmt) {
        return StoreStatus::FAILED;
    }
    BindText(stmt, 1, params.concept_id);
    sqlite3_bind_double(stmt, 2, params.learn_rate);
    sqlite3_bind_double(stmt, 3, params.slip_rate);
    sqlite3_bind_double(stmt, 4, params.guess_rate);
    sqlite3_bind_double(stmt, 5, params.forgetting_rate);
    sqlite3_bind_double(stmt, 6, params.initial_mastery);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return StatusFromCode(rc, "PutParameters");
}

std::vector<std::string> SqliteStore::ListConcepts() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    ApplyBusyTimeout(std::chrono::milliseconds(config_.busy_timeout_ms));

    std::vector<std::string> concepts;
    sqlite3_stmt* stmt = Prepare("SELECT concept_id FROM concept_parameters ORDER BY concept_id;");
    if (!stmt) {
        return concepts;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        concepts.push_back(ColumnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return concepts;
}

// ============================================================================
// KnowledgeStateStore
// ============================================================================

StoreResult<KnowledgeState> SqliteStore::GetState(const StateKey& key,
                                                  std::chrono::milliseconds timeout) {
    using Result = StoreResult<KnowledgeState>;

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return Result::Status(StoreStatus::TIMEOUT);
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "SELECT student_id, concept_id, mastery, practice_count, last_practiced, "
        "consecutive_incorrect, in_recovery "
        "FROM knowledge_states WHERE student_id = ? AND concept_id = ?;");
    if (!stmt) {
        return Result::Status(StoreStatus::FAILED);
    }
    BindText(stmt, 1, key.student_id);
    BindText(stmt, 2, key.concept_id);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return Result::Status(rc == SQLITE_DONE ? StoreStatus::NOT_FOUND
                                                : StatusFromCode(rc, "GetState"));
    }

    KnowledgeState state = ReadState(stmt);
    sqlite3_finalize(stmt);
    if (!IsStoredStateValid(state)) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[SqliteStore] Stored state " << key.ToString()
                  << " has mastery outside [0, 1]" << std::endl;
        return Result::Status(StoreStatus::FAILED);
    }
    return Result::Found(state);
}

StoreStatus SqliteStore::PutState(const KnowledgeState& state,
                                  std::chrono::milliseconds timeout) {
    if (state.student_id.empty() || state.concept_id.empty()) {
        throw ValidationError("knowledge state needs a student and a concept id");
    }
    if (!(state.mastery_probability >= 0.0 && state.mastery_probability <= 1.0)) {
        throw ValidationError("mastery of " + state.Key().ToString() + " must be in [0, 1]");
    }

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "INSERT OR REPLACE INTO knowledge_states "
        "(student_id, concept_id, mastery, practice_count, last_practiced, "
        "consecutive_incorrect, in_recovery) VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!stmt) {
        return StoreStatus::FAILED;
    }
    BindText(stmt, 1, state.student_id);
    BindText(stmt, 2, state.concept_id);
    sqlite3_bind_double(stmt, 3, state.mastery_probability);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(state.practice_count));
    sqlite3_bind_int64(stmt, 5, state.last_practiced.ToMicros());
    sqlite3_bind_int64(stmt, 6, state.consecutive_incorrect);
    sqlite3_bind_int(stmt, 7, state.in_recovery ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return StatusFromCode(rc, "PutState");
}

StoreResult<std::vector<KnowledgeState>> SqliteStore::GetStudentStates(
    const std::string& student_id,
    std::chrono::milliseconds timeout) {
    using Result = StoreResult<std::vector<KnowledgeState>>;

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return Result::Status(StoreStatus::TIMEOUT);
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "SELECT student_id, concept_id, mastery, practice_count, last_practiced, "
        "consecutive_incorrect, in_recovery "
        "FROM knowledge_states WHERE student_id = ? ORDER BY concept_id;");
    if (!stmt) {
        return Result::Status(StoreStatus::FAILED);
    }
    BindText(stmt, 1, student_id);

    std::vector<KnowledgeState> states;
    int rc;
    bool corrupt = false;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        states.push_back(ReadState(stmt));
        corrupt = corrupt || !IsStoredStateValid(states.back());
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result::Status(StatusFromCode(rc, "GetStudentStates"));
    }
    if (corrupt) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[SqliteStore] Stored states of " << student_id
                  << " have mastery outside [0, 1]" << std::endl;
        return Result::Status(StoreStatus::FAILED);
    }
    return Result::Found(std::move(states));
}

size_t SqliteStore::StateCount() const {
    return CountRows("SELECT COUNT(*) FROM knowledge_states;");
}

// ============================================================================
// EventLog
// ============================================================================

StoreResult<uint64_t> SqliteStore::Append(const InteractionEvent& event,
                                          std::chrono::milliseconds timeout) {
    using Result = StoreResult<uint64_t>;

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return Result::Status(StoreStatus::TIMEOUT);
    }
    ApplyBusyTimeout(timeout);

    if (!BeginTransaction()) {
        return Result::Status(StatusFromCode(sqlite3_errcode(db_), "Append"));
    }

    sqlite3_stmt* stmt = Prepare(
        "INSERT INTO interaction_events "
        "(student_id, correct, response_time_ms, exam_code, subject, grp, device_type, screen, "
        "network, stress, intrinsic_load, extraneous_load, total_load, predicted_correct, "
        "mastery_before, mastery_after, score, recorded_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt) {
        RollbackTransaction();
        return Result::Status(StoreStatus::FAILED);
    }

    BindText(stmt, 1, event.student_id);
    sqlite3_bind_int(stmt, 2, event.correct ? 1 : 0);
    sqlite3_bind_int64(stmt, 3, event.response_time_ms);
    BindText(stmt, 4, event.exam_code);
    BindText(stmt, 5, event.subject);
    BindText(stmt, 6, event.group);
    BindText(stmt, 7, ToString(event.device.type));
    BindText(stmt, 8, ToString(event.device.screen));
    BindText(stmt, 9, ToString(event.device.network));
    sqlite3_bind_double(stmt, 10, event.stress);
    sqlite3_bind_double(stmt, 11, event.intrinsic_load);
    sqlite3_bind_double(stmt, 12, event.extraneous_load);
    sqlite3_bind_double(stmt, 13, event.total_load);
    sqlite3_bind_double(stmt, 14, event.predicted_correct);
    sqlite3_bind_double(stmt, 15, event.mastery_before);
    sqlite3_bind_double(stmt, 16, event.mastery_after);
    sqlite3_bind_double(stmt, 17, event.score);
    sqlite3_bind_int64(stmt, 18, event.recorded_at.ToMicros());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        StoreStatus status = StatusFromCode(rc, "Append");
        RollbackTransaction();
        return Result::Status(status);
    }

    uint64_t event_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db_));

    for (size_t position = 0; position < event.concept_ids.size(); ++position) {
        stmt = Prepare("INSERT INTO event_concepts (event_id, position, concept_id) VALUES (?, ?, ?);");
        if (!stmt) {
            RollbackTransaction();
            return Result::Status(StoreStatus::FAILED);
        }
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(event_id));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(position));
        BindText(stmt, 3, event.concept_ids[position]);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            StoreStatus status = StatusFromCode(rc, "Append");
            RollbackTransaction();
            return Result::Status(status);
        }
    }

    if (!CommitTransaction()) {
        RollbackTransaction();
        return Result::Status(StoreStatus::FAILED);
    }
    return Result::Found(event_id);
}

std::vector<InteractionEvent> SqliteStore::Snapshot() const {
    std::vector<InteractionEvent> events;
    uint64_t after_id = 0;

    if (reader_) {
        std::lock_guard<std::mutex> lock(reader_mutex_);
        ReadEventPage(reader_, after_id, -1, events);
        return events;
    }

    // Live connection: the mutex is released between pages
    while (true) {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        ApplyBusyTimeout(std::chrono::milliseconds(config_.busy_timeout_ms));
        if (ReadEventPage(db_, after_id, kSnapshotPageSize, events) <
            static_cast<size_t>(kSnapshotPageSize)) {
            break;
        }
    }
    return events;
}

size_t SqliteStore::ReadEventPage(sqlite3* connection,
                                  uint64_t& after_id,
                                  int limit,
                                  std::vector<InteractionEvent>& events) const {
    sqlite3_stmt* stmt = Prepare(connection,
        "SELECT event_id, student_id, correct, response_time_ms, exam_code, subject, grp, "
        "device_type, screen, network, stress, intrinsic_load, extraneous_load, total_load, "
        "predicted_correct, mastery_before, mastery_after, score, recorded_at "
        "FROM interaction_events WHERE event_id > ? ORDER BY event_id LIMIT ?;");
    if (!stmt) {
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(after_id));
    sqlite3_bind_int(stmt, 2, limit);

    const uint64_t first_id = after_id + 1;
    const size_t page_start = events.size();
    std::map<uint64_t, size_t> index;
    size_t scanned = 0;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ++scanned;
        InteractionEvent event;
        event.event_id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        after_id = event.event_id;
        event.student_id = ColumnText(stmt, 1);
        event.correct = sqlite3_column_int(stmt, 2) != 0;
        event.response_time_ms = sqlite3_column_int64(stmt, 3);
        event.exam_code = ColumnText(stmt, 4);
        event.subject = ColumnText(stmt, 5);
        event.group = ColumnText(stmt, 6);
        try {
            event.device.type = ParseDeviceType(ColumnText(stmt, 7));
            event.device.screen = ParseScreenClass(ColumnText(stmt, 8));
            event.device.network = ParseNetworkQuality(ColumnText(stmt, 9));
        } catch (const std::invalid_argument& e) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[SqliteStore] Skipping event " << event.event_id
                      << " with corrupt device profile: " << e.what() << std::endl;
            continue;
        }
        event.stress = sqlite3_column_double(stmt, 10);
        event.intrinsic_load = sqlite3_column_double(stmt, 11);
        event.extraneous_load = sqlite3_column_double(stmt, 12);
        event.total_load = sqlite3_column_double(stmt, 13);
        event.predicted_correct = sqlite3_column_double(stmt, 14);
        event.mastery_before = sqlite3_column_double(stmt, 15);
        event.mastery_after = sqlite3_column_double(stmt, 16);
        event.score = sqlite3_column_double(stmt, 17);
        event.recorded_at = Timestamp::FromMicros(sqlite3_column_int64(stmt, 18));

        index[event.event_id] = events.size();
        events.push_back(std::move(event));
    }
    sqlite3_finalize(stmt);

    if (scanned == 0 || events.size() == page_start) {
        return scanned;
    }

    stmt = Prepare(connection,
        "SELECT event_id, concept_id FROM event_concepts "
        "WHERE event_id BETWEEN ? AND ? ORDER BY event_id, position;");
    if (!stmt) {
        return scanned;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(first_id));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(after_id));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto it = index.find(static_cast<uint64_t>(sqlite3_column_int64(stmt, 0)));
        if (it != index.end()) {
            events[it->second].concept_ids.push_back(ColumnText(stmt, 1));
        }
    }
    sqlite3_finalize(stmt);

    return scanned;
}

size_t SqliteStore::EventCount() const {
    return CountRows("SELECT COUNT(*) FROM interaction_events;");
}

// ============================================================================
// SnapshotStore
// ============================================================================

StoreStatus SqliteStore::SaveCalibration(const std::vector<CalibrationEntry>& entries,
                                         std::chrono::milliseconds timeout) {
    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    ApplyBusyTimeout(timeout);

    if (!BeginTransaction()) {
        return StatusFromCode(sqlite3_errcode(db_), "SaveCalibration");
    }

    for (const auto& entry : entries) {
        sqlite3_stmt* stmt = Prepare(
            "INSERT OR REPLACE INTO calibration_entries "
            "(exam_code, subject, temperature, sample_count, nll_before, nll_after, "
            "ece_before, ece_after, fitted_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
        if (!stmt) {
            RollbackTransaction();
            return StoreStatus::FAILED;
        }
        BindText(stmt, 1, entry.exam_code);
        BindText(stmt, 2, entry.subject);
        sqlite3_bind_double(stmt, 3, entry.temperature);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(entry.sample_count));
        sqlite3_bind_double(stmt, 5, entry.nll_before);
        sqlite3_bind_double(stmt, 6, entry.nll_after);
        sqlite3_bind_double(stmt, 7, entry.ece_before);
        sqlite3_bind_double(stmt, 8, entry.ece_after);
        sqlite3_bind_int64(stmt, 9, entry.fitted_at.ToMicros());

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            StoreStatus status = StatusFromCode(rc, "SaveCalibration");
            RollbackTransaction();
            return status;
        }
    }

    if (!CommitTransaction()) {
        RollbackTransaction();
        return StoreStatus::FAILED;
    }
    return StoreStatus::OK;
}

StoreResult<std::vector<CalibrationEntry>> SqliteStore::LoadCalibration(
    std::chrono::milliseconds timeout) {
    using Result = StoreResult<std::vector<CalibrationEntry>>;

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return Result::Status(StoreStatus::TIMEOUT);
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "SELECT exam_code, subject, temperature, sample_count, nll_before, nll_after, "
        "ece_before, ece_after, fitted_at FROM calibration_entries ORDER BY exam_code, subject;");
    if (!stmt) {
        return Result::Status(StoreStatus::FAILED);
    }

    std::vector<CalibrationEntry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        CalibrationEntry entry;
        entry.exam_code = ColumnText(stmt, 0);
        entry.subject = ColumnText(stmt, 1);
        entry.temperature = sqlite3_column_double(stmt, 2);
        entry.sample_count = static_cast<size_t>(sqlite3_column_int64(stmt, 3));
        entry.nll_before = sqlite3_column_double(stmt, 4);
        entry.nll_after = sqlite3_column_double(stmt, 5);
        entry.ece_before = sqlite3_column_double(stmt, 6);
        entry.ece_after = sqlite3_column_double(stmt, 7);
        entry.fitted_at = Timestamp::FromMicros(sqlite3_column_int64(stmt, 8));
        entries.push_back(entry);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result::Status(StatusFromCode(rc, "LoadCalibration"));
    }
    return Result::Found(std::move(entries));
}

StoreStatus SqliteStore::SaveFairness(const std::vector<FairnessSnapshot>& snapshots,
                                      std::chrono::milliseconds timeout) {
    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return StoreStatus::TIMEOUT;
    }
    ApplyBusyTimeout(timeout);

    if (!BeginTransaction()) {
        return StatusFromCode(sqlite3_errcode(db_), "SaveFairness");
    }

    for (const auto& snapshot : snapshots) {
        sqlite3_stmt* stmt = Prepare(
            "INSERT OR REPLACE INTO fairness_stats "
            "(exam_code, subject, grp, average, sample_count) VALUES (?, ?, ?, ?, ?);");
        if (!stmt) {
            RollbackTransaction();
            return StoreStatus::FAILED;
        }
        BindText(stmt, 1, snapshot.exam_code);
        BindText(stmt, 2, snapshot.subject);
        BindText(stmt, 3, snapshot.group);
        sqlite3_bind_double(stmt, 4, snapshot.average);
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(snapshot.sample_count));

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            StoreStatus status = StatusFromCode(rc, "SaveFairness");
            RollbackTransaction();
            return status;
        }
    }

    if (!CommitTransaction()) {
        RollbackTransaction();
        return StoreStatus::FAILED;
    }
    return StoreStatus::OK;
}

StoreResult<std::vector<FairnessSnapshot>> SqliteStore::LoadFairness(
    std::chrono::milliseconds timeout) {
    using Result = StoreResult<std::vector<FairnessSnapshot>>;

    TimedLock lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return Result::Status(StoreStatus::TIMEOUT);
    }
    ApplyBusyTimeout(timeout);

    sqlite3_stmt* stmt = Prepare(
        "SELECT exam_code, subject, grp, average, sample_count FROM fairness_stats "
        "ORDER BY exam_code, subject, grp;");
    if (!stmt) {
        return Result::Status(StoreStatus::FAILED);
    }

    std::vector<FairnessSnapshot> snapshots;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        FairnessSnapshot snapshot;
        snapshot.exam_code = ColumnText(stmt, 0);
        snapshot.subject = ColumnText(stmt, 1);
        snapshot.group = ColumnText(stmt, 2);
        snapshot.average = sqlite3_column_double(stmt, 3);
        snapshot.sample_count = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
        snapshots.push_back(snapshot);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result::Status(StatusFromCode(rc, "LoadFairness"));
    }
    return Result::Found(std::move(snapshots));
}

} // namespace kte
