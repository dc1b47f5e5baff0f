// File: src/cognitive/cognitive_estimator.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kte {

/// Session-scoped behaviour accumulated by the caller and passed in explicitly
struct SessionHistory {
    /// Response times (ms) of the previous questions of this session, oldest first
    std::vector<double> recent_response_times_ms;

    /// Consecutive incorrect answers immediately before this one
    uint32_t error_streak{0};

    /// Time since the session started
    int64_t session_duration_ms{0};
};

/// Complexity descriptors of the problem being answered
struct ProblemDescriptor {
    uint32_t solution_steps{1};

    /// Mean mastery of the concepts the problem requires, in [0,1]
    double concept_mastery{0.5};

    /// Mean mastery of its prerequisites, if it has any
    std::optional<double> prerequisite_mastery;
};

/// Behavioural signals of one interaction
struct BehavioralSignals {
    double response_time_ms{0.0};
    double expected_time_ms{0.0};      // 0 when unknown
    double hesitation_ms{0.0};         // time before the first input
    double keystroke_variance{0.0};    // normalised deviation, [0,1]
    double time_pressure_ratio{1.0};   // time available / time needed
    double interface_complexity{0.0};  // [0,1]
    double distraction_level{0.0};     // [0,1]
    double presentation_quality{1.0};  // [0,1], 1 is ideal
    DeviceProfile device;
    SessionHistory session;
    ProblemDescriptor problem;
};

/// Graduated response to measured stress
enum class StressIntervention : uint8_t {
    NONE = 0,
    MILD = 1,
    MODERATE = 2,
    HIGH = 3,
};

const char* ToString(StressIntervention level);

/// Output of the estimator
struct CognitiveAssessment {
    double stress{0.0};           // [0,1]
    double fatigue{0.0};          // [0,1]
    double intrinsic_load{0.0};   // [0,1]
    double extraneous_load{0.0};  // [0,1]
    double total_load{0.0};       // [0,1]
    bool overload_risk{false};    // total_load > overload_threshold
    double working_memory_capacity{7.0};
    StressIntervention intervention{StressIntervention::NONE};
    std::vector<std::string> indicators;
    std::vector<std::string> recommendations;
};

/// CognitiveEstimator: Stress and cognitive load from behavioural signals
///
/// Deterministic function of its inputs with no hidden state; anything that
/// accumulates over a session arrives through SessionHistory.
///
/// Load follows the intrinsic/extraneous split of cognitive load theory. Mobile
/// devices scale every extraneous channel and add touch-interface friction, so
/// the same signals always produce strictly more extraneous load on mobile
/// than on desktop.
class CognitiveEstimator {
public:
    /// Configuration for the estimator
    struct Config {
        Config() = default;

        // --- Stress thresholds and contributions ---
        size_t window_size{12};
        double rt_var_mild{1.5};
        double rt_var_moderate{2.5};
        double rt_var_high{4.0};
        double slow_ratio_mild{1.5};
        double slow_ratio_high{2.0};
        uint32_t error_streak_mild{3};
        uint32_t error_streak_high{5};
        double hesitation_mild_ms{2000.0};
        double hesitation_high_ms{5000.0};
        double keystroke_threshold{0.6};
        double fatigue_threshold{0.75};

        /// Session length at which fatigue saturates
        double fatigue_saturation_minutes{120.0};

        // --- Intrinsic load weights (sum to 1) ---
        double steps_weight{0.40};
        double novelty_weight{0.30};
        double prerequisite_weight{0.30};
        uint32_t max_solution_steps{31};

        // --- Extraneous load weights ---
        double time_pressure_weight{0.35};
        double interface_weight{0.25};
        double distraction_weight{0.25};
        double presentation_weight{0.15};
        double stress_weight{0.30};
        double network_weight{0.10};

        // --- Device awareness ---
        double mobile_time_pressure_multiplier{1.10};
        double mobile_interface_multiplier{1.15};
        double mobile_distraction_multiplier{1.20};
        double mobile_presentation_multiplier{1.10};
        double mobile_base_friction{0.05};
        double tablet_base_friction{0.025};
        double small_screen_friction{0.05};

        // --- Total load ---
        double intrinsic_share{0.5};
        double overload_threshold{0.7};

        /// Messages for invalid settings; empty when usable
        std::vector<std::string> GetValidationErrors() const;
    };

    /// @throws ConfigurationError if the configuration is invalid
    CognitiveEstimator();
    explicit CognitiveEstimator(const Config& config);

    /// Full assessment of one interaction
    /// @throws ValidationError on negative times or non-finite inputs
    CognitiveAssessment Estimate(const BehavioralSignals& signals) const;

    /// Full assessment around a stress level measured by the caller; the
    /// extraneous and total load and the overload flag follow that stress
    /// @throws ValidationError as above, or if stress is outside [0, 1]
    CognitiveAssessment Estimate(const BehavioralSignals& signals, double measured_stress) const;

    /// Stress scalar only, with the indicators that fired
    double EstimateStress(const BehavioralSignals& signals,
                          std::vector<std::string>* indicators = nullptr) const;

    /// Fatigue from session duration
    double EstimateFatigue(const SessionHistory& session) const;

    double IntrinsicLoad(const ProblemDescriptor& problem) const;
    double ExtraneousLoad(const BehavioralSignals& signals, double stress) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    /// Largest raw extraneous value reachable; normalises to [0,1]
    double max_extraneous_raw_{1.0};

    double ResponseTimeVarianceRatio(const BehavioralSignals& signals) const;
    CognitiveAssessment Assemble(const BehavioralSignals& signals,
                                 double stress,
                                 std::vector<std::string> indicators) const;
    double WorkingMemoryCapacity(double stress, double fatigue) const;
    std::vector<std::string> Recommend(const CognitiveAssessment& assessment,
                                       const DeviceProfile& device) const;
    static void ValidateSignals(const BehavioralSignals& signals);
};

} // namespace kte
