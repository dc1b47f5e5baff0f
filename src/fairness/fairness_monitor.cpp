// File: src/fairness/fairness_monitor.cpp
#include "fairness/fairness_monitor.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>

namespace kte {

std::vector<std::string> FairnessMonitor::Config::GetValidationErrors() const {
    std::vector<std::string> errors;
    if (!(disparity_threshold >= 0.0 && disparity_threshold <= 1.0)) {
        errors.push_back("disparity_threshold must be in [0, 1]");
    }
    if (!std::isfinite(severe_disparity_threshold) ||
        severe_disparity_threshold < disparity_threshold) {
        errors.push_back("severe_disparity_threshold must be >= disparity_threshold");
    }
    if (min_samples == 0) {
        errors.push_back("min_samples must be greater than 0");
    }
    return errors;
}

FairnessMonitor::FairnessMonitor()
    : FairnessMonitor(Config())
{
}

FairnessMonitor::FairnessMonitor(const Config& config)
    : config_(config)
{
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid fairness configuration", errors);
    }
}

FairnessMonitor::Key FairnessMonitor::MakeKey(const std::string& exam_code,
                                              const std::string& subject) const {
    return Key{exam_code.empty() ? config_.default_exam : exam_code,
               subject.empty() ? config_.default_subject : subject};
}

// ============================================================================
// Recording
// ============================================================================

void FairnessMonitor::Record(const std::string& exam_code,
                             const std::string& subject,
                             const std::string& group,
                             double outcome) {
    if (group.empty()) {
        throw ValidationError("fairness group must be non-empty");
    }
    if (!std::isfinite(outcome) || outcome < 0.0 || outcome > 1.0) {
        throw ValidationError("fairness outcome must be in [0, 1]");
    }

    Key key = MakeKey(exam_code, subject);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    RunningMean& running = stats_[key][group];
    running.count += 1;
    running.mean += (outcome - running.mean) / static_cast<double>(running.count);
}

// ============================================================================
// Reporting
// ============================================================================

FairnessReport FairnessMonitor::Report(const std::string& exam_code,
                                       const std::string& subject) const {
    Key key = MakeKey(exam_code, subject);

    FairnessReport report;
    report.exam_code = std::get<0>(key);
    report.subject = std::get<1>(key);

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = stats_.find(key);
        if (it != stats_.end()) {
            for (const auto& [group, running] : it->second) {
                GroupAverage average;
                average.group = group;
                average.average = running.mean;
                average.sample_count = running.count;
                average.included = running.count >= config_.min_samples;
                report.groups.push_back(average);
            }
        }
    }

    double lowest = std::numeric_limits<double>::max();
    double highest = std::numeric_limits<double>::lowest();
    size_t included = 0;
    for (const auto& group : report.groups) {
        if (!group.included) {
            continue;
        }
        lowest = std::min(lowest, group.average);
        highest = std::max(highest, group.average);
        ++included;
    }

    // Fewer than two comparable groups means nothing to compare
    report.disparity = included >= 2 ? highest - lowest : 0.0;
    report.flagged = report.disparity > config_.disparity_threshold;
    report.recommendations = Recommendations(report.disparity);
    return report;
}

std::vector<std::string> FairnessMonitor::Recommendations(double disparity) const {
    if (disparity > config_.severe_disparity_threshold) {
        return {"Investigate feature bias and retrain the per-exam model",
                "Review time allocation skew by group"};
    }
    if (disparity > config_.disparity_threshold) {
        return {"Monitor drift and audit selection thresholds"};
    }
    return {"Bias levels acceptable"};
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<FairnessSnapshot> FairnessMonitor::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<FairnessSnapshot> result;
    for (const auto& [key, groups] : stats_) {
        for (const auto& [group, running] : groups) {
            FairnessSnapshot snapshot;
            snapshot.exam_code = std::get<0>(key);
            snapshot.subject = std::get<1>(key);
            snapshot.group = group;
            snapshot.average = running.mean;
            snapshot.sample_count = running.count;
            result.push_back(snapshot);
        }
    }
    return result;
}

void FairnessMonitor::Restore(const std::vector<FairnessSnapshot>& snapshots) {
    for (const auto& snapshot : snapshots) {
        if (snapshot.group.empty()) {
            throw ValidationError("fairness snapshot has an empty group");
        }
        if (!std::isfinite(snapshot.average) || snapshot.average < 0.0 || snapshot.average > 1.0) {
            throw ValidationError("fairness snapshot average must be in [0, 1]");
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& snapshot : snapshots) {
        RunningMean& running = stats_[MakeKey(snapshot.exam_code, snapshot.subject)][snapshot.group];
        running.mean = snapshot.average;
        running.count = snapshot.sample_count;
    }
}

size_t FairnessMonitor::GetKeyCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stats_.size();
}

void FairnessMonitor::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    stats_.clear();
}

} // namespace kte
