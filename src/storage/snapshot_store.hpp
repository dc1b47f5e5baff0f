// File: src/storage/snapshot_store.hpp
#pragma once

#include "calibration/calibration_table.hpp"
#include "fairness/fairness_monitor.hpp"
#include "storage/store_status.hpp"
#include <chrono>
#include <vector>

namespace kte {

/// Persistence of calibration entries and fairness aggregates
///
/// Saves replace the stored entries with the same key; keys absent from the
/// saved list are kept.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual StoreStatus SaveCalibration(
        const std::vector<CalibrationEntry>& entries,
        std::chrono::milliseconds timeout) = 0;

    virtual StoreResult<std::vector<CalibrationEntry>> LoadCalibration(
        std::chrono::milliseconds timeout) = 0;

    virtual StoreStatus SaveFairness(
        const std::vector<FairnessSnapshot>& snapshots,
        std::chrono::milliseconds timeout) = 0;

    virtual StoreResult<std::vector<FairnessSnapshot>> LoadFairness(
        std::chrono::milliseconds timeout) = 0;
};

} // namespace kte
