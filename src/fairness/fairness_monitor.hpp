// File: src/fairness/fairness_monitor.hpp
#pragma once

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

namespace kte {

/// Persisted running average of one (exam, subject, group)
struct FairnessSnapshot {
    std::string exam_code;
    std::string subject;
    std::string group;
    double average{0.0};
    size_t sample_count{0};
};

/// Average of one group within a report
struct GroupAverage {
    std::string group;
    double average{0.0};
    size_t sample_count{0};
    bool included{false};  // counted toward the disparity
};

/// Parity audit of one (exam, subject) pair
struct FairnessReport {
    std::string exam_code;
    std::string subject;
    std::vector<GroupAverage> groups;
    double disparity{0.0};
    bool flagged{false};
    std::vector<std::string> recommendations;
};

/// FairnessMonitor: Running outcome averages segmented by exam and subject
///
/// Groups are compared only within their own (exam, subject) pair, so a
/// disparity in one subject is never masked by another. Groups with fewer
/// than min_samples observations are reported but not compared.
///
/// Thread-safe (shared_mutex; writers are exclusive).
class FairnessMonitor {
public:
    struct Config {
        Config() = default;
        double disparity_threshold{0.08};
        double severe_disparity_threshold{0.15};
        size_t min_samples{1};
        std::string default_exam{"JEE_Mains"};
        std::string default_subject{"generic"};

        std::vector<std::string> GetValidationErrors() const;
    };

    /// @throws ConfigurationError if the configuration is invalid
    FairnessMonitor();
    explicit FairnessMonitor(const Config& config);

    /// Fold one outcome into the group's running mean
    /// Empty exam or subject falls back to the configured defaults.
    /// @throws ValidationError if group is empty or outcome is outside [0, 1]
    void Record(const std::string& exam_code,
                const std::string& subject,
                const std::string& group,
                double outcome);

    /// Group averages, disparity and flag of one key
    FairnessReport Report(const std::string& exam_code, const std::string& subject) const;

    /// Suggested actions for a disparity
    std::vector<std::string> Recommendations(double disparity) const;

    std::vector<FairnessSnapshot> Snapshot() const;

    /// Replace the running statistics of every key in the snapshot
    /// @throws ValidationError on malformed entries
    void Restore(const std::vector<FairnessSnapshot>& snapshots);

    size_t GetKeyCount() const;
    void Clear();

    const Config& GetConfig() const { return config_; }

private:
    struct RunningMean {
        double mean{0.0};
        size_t count{0};
    };

    using Key = std::tuple<std::string, std::string>;

    Config config_;
    std::map<Key, std::map<std::string, RunningMean>> stats_;
    mutable std::shared_mutex mutex_;

    Key MakeKey(const std::string& exam_code, const std::string& subject) const;
};

} // namespace kte
