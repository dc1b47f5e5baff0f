// File: src/storage/parameter_store.hpp
#pragma once

#include "core/types.hpp"
#include "storage/store_status.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace kte {

/// Read-mostly source of per-concept BKT parameters
///
/// Parameters change only through offline re-estimation. A Put replaces the
/// previous row; there is no partial update.
///
/// Thread Safety: all methods must be thread-safe.
class ParameterStore {
public:
    virtual ~ParameterStore() = default;

    /// @return OK with the parameters, NOT_FOUND, TIMEOUT or FAILED
    virtual StoreResult<ConceptParameters> GetParameters(
        const std::string& concept_id,
        std::chrono::milliseconds timeout) = 0;

    /// Insert or replace the parameters of one concept
    /// @throws ConfigurationError if the parameters are invalid (nothing written)
    virtual StoreStatus PutParameters(
        const ConceptParameters& params,
        std::chrono::milliseconds timeout) = 0;

    /// Every concept with stored parameters
    virtual std::vector<std::string> ListConcepts() const = 0;
};

} // namespace kte
