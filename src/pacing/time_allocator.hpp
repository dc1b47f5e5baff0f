// File: src/pacing/time_allocator.hpp
#pragma once

#include "core/types.hpp"
#include "pacing/exam_config.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace kte {

/// TimeAllocator: Time budget for the next question
///
/// The budget is base_time × clamp(Π factors, min_factor, max_factor), then
/// hard-capped at the exam's per-question maximum. The cap is applied last,
/// so no combination of adjustments can exceed it.
///
/// Holding everything else fixed, the result is non-decreasing in stress and
/// difficulty and non-increasing in mastery.
class TimeAllocator {
public:
    /// Configuration for the policy
    struct Config {
        Config() = default;

        double min_factor{0.5};
        double max_factor{2.0};

        /// factor = 1 + stress_weight × stress
        double stress_weight{0.5};

        /// factor = 1 + fatigue_weight × fatigue
        double fatigue_weight{0.3};

        /// factor = 1 - mastery_weight × mastery
        double mastery_weight{0.3};

        /// Difficulty below this counts as this
        double min_difficulty{0.5};

        /// Session factor grows by this much per hour, up to max_session_bonus
        double session_rate_per_hour{0.1};
        double max_session_bonus{0.2};

        // Mobile context
        double small_screen_factor{1.2};
        double medium_network_factor{1.15};
        double low_network_factor{1.3};

        /// Extra time while the learner is overloaded or in recovery
        double overload_factor{1.1};
        double recovery_factor{1.1};

        std::vector<std::string> GetValidationErrors() const;
    };

    /// Inputs of one allocation
    struct Request {
        std::string student_id;
        std::string question_id;
        int64_t base_time_ms{60000};
        double stress{0.0};      // [0,1]
        double fatigue{0.0};     // [0,1]
        double mastery{0.0};     // [0,1]
        double difficulty{0.5};  // >= 0
        int64_t session_elapsed_ms{0};
        DeviceProfile device;
        bool overload_risk{false};
        bool recovery{false};
    };

    /// Allocated time with an explanation of every adjustment
    struct Allocation {
        std::string student_id;
        std::string question_id;
        std::string exam_code;
        int64_t final_time_ms{0};
        double raw_factor{1.0};
        double factor{1.0};  // after [min_factor, max_factor]
        int64_t time_cap_ms{0};
        bool capped{false};
        std::map<std::string, double> breakdown;
    };

    /// @throws ConfigurationError if the configuration is invalid
    TimeAllocator();
    explicit TimeAllocator(const Config& config);

    /// Allocate time for one question of the given exam
    /// @throws ValidationError on out-of-range request fields
    Allocation Allocate(const Request& request, const ExamConfiguration& exam) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    double MobileFactor(const DeviceProfile& device) const;
    static void ValidateRequest(const Request& request);
};

} // namespace kte
