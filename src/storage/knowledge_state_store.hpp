// File: src/storage/knowledge_state_store.hpp
#pragma once

#include "core/types.hpp"
#include "storage/store_status.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace kte {

/// Per-(student, concept) knowledge state storage
///
/// The engine serialises read-modify-write cycles per key; the store itself
/// only guarantees that single calls are atomic.
///
/// Thread Safety: all methods must be thread-safe.
class KnowledgeStateStore {
public:
    virtual ~KnowledgeStateStore() = default;

    virtual StoreResult<KnowledgeState> GetState(
        const StateKey& key,
        std::chrono::milliseconds timeout) = 0;

    /// Insert or replace one state
    /// @throws ValidationError if mastery is outside [0, 1]
    virtual StoreStatus PutState(
        const KnowledgeState& state,
        std::chrono::milliseconds timeout) = 0;

    /// All states of one student, ordered by concept id
    virtual StoreResult<std::vector<KnowledgeState>> GetStudentStates(
        const std::string& student_id,
        std::chrono::milliseconds timeout) = 0;

    virtual size_t StateCount() const = 0;
};

} // namespace kte
