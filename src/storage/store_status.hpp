// File: src/storage/store_status.hpp
#pragma once

#include "core/errors.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kte {

/// Outcome of a store call
enum class StoreStatus : uint8_t {
    OK = 0,
    NOT_FOUND = 1,
    TIMEOUT = 2,   // the store did not answer within the caller's timeout
    FAILED = 3,    // backend error (I/O, SQL, corrupt row)
};

inline const char* ToString(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK: return "ok";
        case StoreStatus::NOT_FOUND: return "not_found";
        case StoreStatus::TIMEOUT: return "timeout";
        case StoreStatus::FAILED: return "failed";
    }
    return "unknown";
}

/// Status plus value of a store read
template<typename T>
struct StoreResult {
    StoreStatus status{StoreStatus::NOT_FOUND};
    std::optional<T> value;

    bool Ok() const { return status == StoreStatus::OK && value.has_value(); }
    bool TimedOut() const { return status == StoreStatus::TIMEOUT; }

    static StoreResult Found(T v) {
        StoreResult result;
        result.status = StoreStatus::OK;
        result.value = std::move(v);
        return result;
    }

    static StoreResult Status(StoreStatus status) {
        StoreResult result;
        result.status = status;
        return result;
    }
};

/// Unwrap a read, turning every non-OK status into an exception
/// @throws DependencyTimeout on TIMEOUT, EngineError otherwise
template<typename T>
T Require(StoreResult<T> result, const std::string& what) {
    switch (result.status) {
        case StoreStatus::OK:
            if (result.value) {
                return std::move(*result.value);
            }
            break;
        case StoreStatus::TIMEOUT:
            throw DependencyTimeout("Timed out reading " + what);
        case StoreStatus::NOT_FOUND:
            throw EngineError(what + " not found");
        case StoreStatus::FAILED:
            break;
    }
    throw EngineError("Store failure reading " + what);
}

} // namespace kte
