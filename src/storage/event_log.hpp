// File: src/storage/event_log.hpp
#pragma once

#include "core/types.hpp"
#include "storage/store_status.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

namespace kte {

/// Append-only log of interaction events
///
/// Events are never modified once appended. Offline jobs (calibration
/// fitting, audits) read a point-in-time snapshot.
class EventLog {
public:
    virtual ~EventLog() = default;

    /// Append one event
    /// @return OK with the assigned event id (ids increase monotonically)
    virtual StoreResult<uint64_t> Append(
        const InteractionEvent& event,
        std::chrono::milliseconds timeout) = 0;

    /// Copy of every event appended so far, in append order
    virtual std::vector<InteractionEvent> Snapshot() const = 0;

    virtual size_t EventCount() const = 0;
};

} // namespace kte
