// File: src/calibration/calibration_table.hpp
#pragma once

#include "calibration/temperature_calibrator.hpp"
#include "core/types.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace kte {

/// Fitted temperature for one (exam, subject) pair
struct CalibrationEntry {
    std::string exam_code;
    std::string subject;
    double temperature{1.0};
    size_t sample_count{0};
    double nll_before{0.0};
    double nll_after{0.0};
    double ece_before{0.0};
    double ece_after{0.0};
    Timestamp fitted_at;
};

/// CalibrationTable: Per-(exam, subject) temperatures
///
/// Keys are independent: fitting one never changes another. A key without an
/// entry behaves as T = 1 and Apply returns its input unchanged.
///
/// Thread-safety: fitting runs without the lock; the result is published
/// under a short exclusive lock. Reads take a shared lock.
class CalibrationTable {
public:
    CalibrationTable();
    explicit CalibrationTable(const TemperatureCalibrator::Config& config);

    /// Fit and store the temperature of one key
    /// @throws ValidationError, DegenerateCalibrationInput (nothing is stored)
    CalibrationEntry Fit(const std::string& exam_code,
                         const std::string& subject,
                         const std::vector<double>& logits,
                         const std::vector<int>& labels);

    /// Fit from logged (predicted_correct, correct) pairs matching the key
    /// @throws ValidationError if no event matches
    CalibrationEntry FitFromEvents(const std::string& exam_code,
                                   const std::string& subject,
                                   const std::vector<InteractionEvent>& events);

    /// sigmoid(logit(raw_probability) / T); raw_probability when unset
    /// @throws ValidationError if raw_probability is outside [0, 1]
    double Apply(const std::string& exam_code,
                 const std::string& subject,
                 double raw_probability) const;

    /// sigmoid(raw_logit / T)
    double ApplyLogit(const std::string& exam_code,
                      const std::string& subject,
                      double raw_logit) const;

    std::optional<CalibrationEntry> Get(const std::string& exam_code,
                                        const std::string& subject) const;

    /// Temperature of the key, 1.0 when unset
    double GetTemperature(const std::string& exam_code, const std::string& subject) const;

    /// Install a previously persisted entry
    /// @throws ValidationError if the temperature is not positive and finite
    void Restore(const CalibrationEntry& entry);

    std::vector<CalibrationEntry> Snapshot() const;

    bool Remove(const std::string& exam_code, const std::string& subject);
    size_t Size() const;

    const TemperatureCalibrator& GetCalibrator() const { return calibrator_; }

private:
    using Key = std::pair<std::string, std::string>;

    TemperatureCalibrator calibrator_;
    std::map<Key, CalibrationEntry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace kte
