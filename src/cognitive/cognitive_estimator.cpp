// File: src/cognitive/cognitive_estimator.cpp
#include "cognitive/cognitive_estimator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace kte {

namespace {

constexpr double kBaseCapacity = 7.0;
constexpr double kStressCapacityReduction = 0.4;
constexpr double kFatigueCapacityReduction = 0.3;
constexpr double kMinCapacity = 2.0;
constexpr double kMinBaselineVariance = 1e-6;
constexpr size_t kMinVarianceSamples = 3;

double Variance(const std::vector<double>& values, size_t begin, size_t end) {
    size_t n = end - begin;
    if (n == 0) {
        return 0.0;
    }
    double mean = std::accumulate(values.begin() + begin, values.begin() + end, 0.0) / n;
    double sum_sq = 0.0;
    for (size_t i = begin; i < end; ++i) {
        double d = values[i] - mean;
        sum_sq += d * d;
    }
    return sum_sq / n;
}

double NetworkPenalty(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::LOW: return 1.0;
        case NetworkQuality::MEDIUM: return 0.5;
        default: return 0.0;
    }
}

} // namespace

const char* ToString(StressIntervention level) {
    switch (level) {
        case StressIntervention::NONE: return "none";
        case StressIntervention::MILD: return "mild";
        case StressIntervention::MODERATE: return "moderate";
        case StressIntervention::HIGH: return "high";
        default: return "unknown";
    }
}

// ============================================================================
// Configuration
// ============================================================================

std::vector<std::string> CognitiveEstimator::Config::GetValidationErrors() const {
    std::vector<std::string> errors;

    auto non_negative = [](double value) { return std::isfinite(value) && value >= 0.0; };
    auto at_least_one = [](double value) { return std::isfinite(value) && value >= 1.0; };
    auto unit = [](double value) { return std::isfinite(value) && value >= 0.0 && value <= 1.0; };

    if (!non_negative(steps_weight) || !non_negative(novelty_weight) ||
        !non_negative(prerequisite_weight) ||
        std::abs(steps_weight + novelty_weight + prerequisite_weight - 1.0) > 1e-6) {
        errors.push_back("intrinsic load weights must be non-negative and sum to 1");
    }
    if (!non_negative(time_pressure_weight) || !non_negative(interface_weight) ||
        !non_negative(distraction_weight) || !non_negative(presentation_weight) ||
        !non_negative(stress_weight) || !non_negative(network_weight)) {
        errors.push_back("extraneous load weights must be non-negative");
    }
    if (!at_least_one(mobile_time_pressure_multiplier) || !at_least_one(mobile_interface_multiplier) ||
        !at_least_one(mobile_distraction_multiplier) || !at_least_one(mobile_presentation_multiplier)) {
        errors.push_back("mobile multipliers must be >= 1");
    }
    if (!std::isfinite(mobile_base_friction) || mobile_base_friction <= 0.0) {
        errors.push_back("mobile_base_friction must be greater than 0");
    }
    if (!non_negative(tablet_base_friction) || !non_negative(small_screen_friction)) {
        errors.push_back("tablet and small-screen friction must be non-negative");
    }
    if (!unit(intrinsic_share)) {
        errors.push_back("intrinsic_share must be between 0.0 and 1.0");
    }
    if (!unit(overload_threshold)) {
        errors.push_back("overload_threshold must be between 0.0 and 1.0");
    }
    if (!std::isfinite(fatigue_saturation_minutes) || fatigue_saturation_minutes <= 0.0) {
        errors.push_back("fatigue_saturation_minutes must be greater than 0");
    }
    if (window_size < 2) {
        errors.push_back("window_size must be at least 2");
    }
    if (max_solution_steps == 0) {
        errors.push_back("max_solution_steps must be greater than 0");
    }
    return errors;
}

// ============================================================================
// Construction
// ============================================================================

CognitiveEstimator::CognitiveEstimator()
    : CognitiveEstimator(Config())
{
}

CognitiveEstimator::CognitiveEstimator(const Config& config)
    : config_(config)
{
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid cognitive estimator configuration", errors);
    }

    max_extraneous_raw_ =
        config_.time_pressure_weight * config_.mobile_time_pressure_multiplier +
        config_.interface_weight * config_.mobile_interface_multiplier +
        config_.distraction_weight * config_.mobile_distraction_multiplier +
        config_.presentation_weight * config_.mobile_presentation_multiplier +
        config_.stress_weight +
        config_.network_weight +
        std::max(config_.mobile_base_friction, config_.tablet_base_friction) +
        config_.small_screen_friction;
}

// ============================================================================
// Assessment
// ============================================================================

CognitiveAssessment CognitiveEstimator::Estimate(const BehavioralSignals& signals) const {
    ValidateSignals(signals);

    std::vector<std::string> indicators;
    double stress = EstimateStress(signals, &indicators);
    return Assemble(signals, stress, std::move(indicators));
}

CognitiveAssessment CognitiveEstimator::Estimate(const BehavioralSignals& signals,
                                                 double measured_stress) const {
    ValidateSignals(signals);
    if (!std::isfinite(measured_stress) || measured_stress < 0.0 || measured_stress > 1.0) {
        throw ValidationError("stress must be in [0, 1]");
    }
    return Assemble(signals, measured_stress, {});
}

CognitiveAssessment CognitiveEstimator::Assemble(const BehavioralSignals& signals,
                                                 double stress,
                                                 std::vector<std::string> indicators) const {
    CognitiveAssessment assessment;
    assessment.stress = stress;
    assessment.indicators = std::move(indicators);
    assessment.fatigue = EstimateFatigue(signals.session);
    assessment.intrinsic_load = IntrinsicLoad(signals.problem);
    assessment.extraneous_load = ExtraneousLoad(signals, assessment.stress);
    assessment.total_load = Clamp01(
        config_.intrinsic_share * assessment.intrinsic_load +
        (1.0 - config_.intrinsic_share) * assessment.extraneous_load);
    assessment.overload_risk = assessment.total_load > config_.overload_threshold;
    assessment.working_memory_capacity = WorkingMemoryCapacity(assessment.stress, assessment.fatigue);

    if (assessment.stress >= 0.7) {
        assessment.intervention = StressIntervention::HIGH;
    } else if (assessment.stress >= 0.4) {
        assessment.intervention = StressIntervention::MODERATE;
    } else if (assessment.stress >= 0.2) {
        assessment.intervention = StressIntervention::MILD;
    }

    assessment.recommendations = Recommend(assessment, signals.device);
    return assessment;
}

double CognitiveEstimator::EstimateStress(const BehavioralSignals& signals,
                                          std::vector<std::string>* indicators) const {
    double score = 0.0;
    auto fire = [&](const char* name, double contribution) {
        score += contribution;
        if (indicators) {
            indicators->emplace_back(name);
        }
    };

    // Response-time variance across the session window
    double var_ratio = ResponseTimeVarianceRatio(signals);
    if (var_ratio >= config_.rt_var_high) {
        fire("rt_variance_high", 0.4);
    } else if (var_ratio >= config_.rt_var_moderate) {
        fire("rt_variance_medium", 0.3);
    } else if (var_ratio >= config_.rt_var_mild) {
        fire("rt_variance_mild", 0.15);
    }

    // Slow relative to the expected solving time
    if (signals.expected_time_ms > 0.0) {
        double ratio = signals.response_time_ms / signals.expected_time_ms;
        if (ratio >= config_.slow_ratio_high) {
            fire("slow_response_high", 0.15);
        } else if (ratio >= config_.slow_ratio_mild) {
            fire("slow_response_mild", 0.1);
        }
    }

    // Consecutive errors
    if (signals.session.error_streak >= config_.error_streak_high) {
        fire("error_streak_high", 0.3);
    } else if (signals.session.error_streak >= config_.error_streak_mild) {
        fire("error_streak_mild", 0.15);
    }

    // Hesitation before the first input
    if (signals.hesitation_ms >= config_.hesitation_high_ms) {
        fire("hesitation_high", 0.2);
    } else if (signals.hesitation_ms >= config_.hesitation_mild_ms) {
        fire("hesitation_mild", 0.1);
    }

    if (signals.keystroke_variance >= config_.keystroke_threshold) {
        fire("keystroke_deviation", 0.1);
    }

    if (EstimateFatigue(signals.session) >= config_.fatigue_threshold) {
        fire("fatigue", 0.1);
    }

    if (signals.device.network == NetworkQuality::LOW) {
        fire("network_low", 0.05);
    }

    return std::min(1.0, score);
}

double CognitiveEstimator::EstimateFatigue(const SessionHistory& session) const {
    double minutes = std::max<int64_t>(0, session.session_duration_ms) / 60000.0;
    return Clamp01(minutes / config_.fatigue_saturation_minutes);
}

double CognitiveEstimator::IntrinsicLoad(const ProblemDescriptor& problem) const {
    double steps = std::max<uint32_t>(1, problem.solution_steps);
    double step_load = std::min(1.0,
        std::log2(steps + 1.0) / std::log2(config_.max_solution_steps + 1.0));

    double novelty_load = 1.0 - Clamp01(problem.concept_mastery);

    double prerequisite_load = 0.0;
    if (problem.prerequisite_mastery) {
        prerequisite_load = std::max(0.0, 0.8 - Clamp01(*problem.prerequisite_mastery)) / 0.8;
    }

    return Clamp01(config_.steps_weight * step_load +
                   config_.novelty_weight * novelty_load +
                   config_.prerequisite_weight * prerequisite_load);
}

double CognitiveEstimator::ExtraneousLoad(const BehavioralSignals& signals, double stress) const {
    const bool mobile = signals.device.IsMobile();

    double pressure = Clamp01(1.0 - signals.time_pressure_ratio);
    double interface = Clamp01(signals.interface_complexity);
    double distraction = Clamp01(signals.distraction_level);
    double presentation = 1.0 - Clamp01(signals.presentation_quality);

    double raw =
        config_.time_pressure_weight * pressure *
            (mobile ? config_.mobile_time_pressure_multiplier : 1.0) +
        config_.interface_weight * interface *
            (mobile ? config_.mobile_interface_multiplier : 1.0) +
        config_.distraction_weight * distraction *
            (mobile ? config_.mobile_distraction_multiplier : 1.0) +
        config_.presentation_weight * presentation *
            (mobile ? config_.mobile_presentation_multiplier : 1.0) +
        config_.stress_weight * Clamp01(stress) +
        config_.network_weight * NetworkPenalty(signals.device.network);

    if (mobile) {
        raw += config_.mobile_base_friction;
    } else if (signals.device.type == DeviceType::TABLET) {
        raw += config_.tablet_base_friction;
    }
    if (signals.device.screen == ScreenClass::SMALL) {
        raw += config_.small_screen_friction;
    }

    return Clamp01(raw / max_extraneous_raw_);
}

// ============================================================================
// Helpers
// ============================================================================

double CognitiveEstimator::ResponseTimeVarianceRatio(const BehavioralSignals& signals) const {
    std::vector<double> window = signals.session.recent_response_times_ms;
    window.push_back(signals.response_time_ms);
    if (window.size() > config_.window_size) {
        window.erase(window.begin(), window.end() - config_.window_size);
    }

    // Too few previous samples for a meaningful baseline
    if (window.size() < kMinVarianceSamples + 1) {
        return 1.0;
    }

    double baseline = std::max(Variance(window, 0, window.size() - 1), kMinBaselineVariance);
    double current = Variance(window, 0, window.size());
    return current / baseline;
}

double CognitiveEstimator::WorkingMemoryCapacity(double stress, double fatigue) const {
    double capacity = kBaseCapacity *
        (1.0 - stress * kStressCapacityReduction - fatigue * kFatigueCapacityReduction);
    return std::max(kMinCapacity, capacity);
}

std::vector<std::string> CognitiveEstimator::Recommend(const CognitiveAssessment& assessment,
                                                       const DeviceProfile& device) const {
    std::vector<std::string> recs;
    if (assessment.overload_risk) {
        recs.push_back("Cognitive overload detected: reduce difficulty or suggest a short break");
    }
    if (assessment.extraneous_load > 0.5) {
        if (device.IsMobile()) {
            recs.push_back("Reduce time pressure and notifications; enable do-not-disturb during the test");
            recs.push_back("Simplify the UI for touch; enlarge targets and reduce clutter");
        } else {
            recs.push_back("Reduce time pressure and distractions");
            recs.push_back("Simplify the interface; remove non-essential elements");
        }
    }
    if (assessment.intrinsic_load > 0.7) {
        recs.push_back("Split the problem into smaller steps");
        recs.push_back("Provide a prerequisite review");
    }
    if (assessment.working_memory_capacity < 4.0) {
        recs.push_back("Address stress and fatigue; suggest relaxation or a short break");
    }
    return recs;
}

void CognitiveEstimator::ValidateSignals(const BehavioralSignals& signals) {
    auto finite_non_negative = [](double v) { return std::isfinite(v) && v >= 0.0; };

    if (!finite_non_negative(signals.response_time_ms) ||
        !finite_non_negative(signals.expected_time_ms) ||
        !finite_non_negative(signals.hesitation_ms)) {
        throw ValidationError("response, expected and hesitation times must be finite and >= 0");
    }
    if (!finite_non_negative(signals.time_pressure_ratio)) {
        throw ValidationError("time_pressure_ratio must be finite and >= 0");
    }
    if (!std::isfinite(signals.keystroke_variance) || !std::isfinite(signals.interface_complexity) ||
        !std::isfinite(signals.distraction_level) || !std::isfinite(signals.presentation_quality) ||
        !std::isfinite(signals.problem.concept_mastery)) {
        throw ValidationError("behavioural signals must be finite");
    }
    for (double rt : signals.session.recent_response_times_ms) {
        if (!finite_non_negative(rt)) {
            throw ValidationError("session response times must be finite and >= 0");
        }
    }
}

} // namespace kte
