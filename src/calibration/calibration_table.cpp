// File: src/calibration/calibration_table.cpp
#include "calibration/calibration_table.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <mutex>

namespace kte {

CalibrationTable::CalibrationTable()
    : calibrator_()
{
}

CalibrationTable::CalibrationTable(const TemperatureCalibrator::Config& config)
    : calibrator_(config)
{
}

// ============================================================================
// Fitting
// ============================================================================

CalibrationEntry CalibrationTable::Fit(const std::string& exam_code,
                                       const std::string& subject,
                                       const std::vector<double>& logits,
                                       const std::vector<int>& labels) {
    auto fit = calibrator_.FitTemperature(logits, labels);

    CalibrationEntry entry;
    entry.exam_code = exam_code;
    entry.subject = subject;
    entry.temperature = fit.temperature;
    entry.sample_count = fit.sample_count;
    entry.nll_before = fit.nll_before;
    entry.nll_after = fit.nll_after;
    entry.ece_before = fit.ece_before;
    entry.ece_after = fit.ece_after;
    entry.fitted_at = Timestamp::Now();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[{exam_code, subject}] = entry;
    return entry;
}

CalibrationEntry CalibrationTable::FitFromEvents(const std::string& exam_code,
                                                 const std::string& subject,
                                                 const std::vector<InteractionEvent>& events) {
    std::vector<double> logits;
    std::vector<int> labels;
    for (const auto& event : events) {
        if (event.exam_code != exam_code || event.subject != subject) {
            continue;
        }
        logits.push_back(TemperatureCalibrator::Logit(event.predicted_correct));
        labels.push_back(event.correct ? 1 : 0);
    }
    if (logits.empty()) {
        throw ValidationError("No logged interactions for " + exam_code + "/" + subject);
    }
    return Fit(exam_code, subject, logits, labels);
}

// ============================================================================
// Application
// ============================================================================

double CalibrationTable::Apply(const std::string& exam_code,
                               const std::string& subject,
                               double raw_probability) const {
    if (!std::isfinite(raw_probability) || raw_probability < 0.0 || raw_probability > 1.0) {
        throw ValidationError("raw probability must be in [0, 1]");
    }

    double temperature = GetTemperature(exam_code, subject);
    if (temperature == 1.0) {
        return raw_probability;
    }
    return TemperatureCalibrator::Sigmoid(TemperatureCalibrator::Logit(raw_probability) / temperature);
}

double CalibrationTable::ApplyLogit(const std::string& exam_code,
                                    const std::string& subject,
                                    double raw_logit) const {
    if (!std::isfinite(raw_logit)) {
        throw ValidationError("raw logit must be finite");
    }
    return TemperatureCalibrator::Sigmoid(raw_logit / GetTemperature(exam_code, subject));
}

// ============================================================================
// Lookup and persistence
// ============================================================================

std::optional<CalibrationEntry> CalibrationTable::Get(const std::string& exam_code,
                                                      const std::string& subject) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find({exam_code, subject});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double CalibrationTable::GetTemperature(const std::string& exam_code,
                                        const std::string& subject) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find({exam_code, subject});
    return it == entries_.end() ? 1.0 : it->second.temperature;
}

void CalibrationTable::Restore(const CalibrationEntry& entry) {
    if (!std::isfinite(entry.temperature) || entry.temperature <= 0.0) {
        throw ValidationError("temperature of " + entry.exam_code + "/" + entry.subject +
                              " must be positive");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[{entry.exam_code, entry.subject}] = entry;
}

std::vector<CalibrationEntry> CalibrationTable::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<CalibrationEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

bool CalibrationTable::Remove(const std::string& exam_code, const std::string& subject) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase({exam_code, subject}) > 0;
}

size_t CalibrationTable::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace kte
