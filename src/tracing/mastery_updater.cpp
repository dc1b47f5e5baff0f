// File: src/tracing/mastery_updater.cpp
#include "tracing/mastery_updater.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace kte {

// ============================================================================
// Construction
// ============================================================================

std::vector<std::string> MasteryUpdater::Config::GetValidationErrors() const {
    std::vector<std::string> errors;
    if (!(epsilon > 0.0 && epsilon < 0.5)) {
        errors.push_back("epsilon must be in (0, 0.5)");
    }
    if (!(recovery_floor >= 0.0 && recovery_floor <= 1.0)) {
        errors.push_back("recovery_floor must be in [0, 1]");
    }
    if (recovery_streak == 0) {
        errors.push_back("recovery_streak must be greater than 0");
    }
    if (!std::isfinite(stress_slip_scale) || stress_slip_scale < 0.0 ||
        !std::isfinite(stress_guess_scale) || stress_guess_scale < 0.0) {
        errors.push_back("stress scales must be non-negative");
    }
    if (!(identifiability_margin > 0.0 && identifiability_margin < 1.0)) {
        errors.push_back("identifiability_margin must be in (0, 1)");
    }
    if (!std::isfinite(forgetting_grace_hours) || forgetting_grace_hours < 0.0) {
        errors.push_back("forgetting_grace_hours must be non-negative");
    }
    return errors;
}

MasteryUpdater::MasteryUpdater()
    : MasteryUpdater(Config())
{
}

MasteryUpdater::MasteryUpdater(const Config& config)
    : config_(config), forgetting_(config.forgetting_grace_hours)
{
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid mastery updater configuration", errors);
    }
}

// ============================================================================
// Update
// ============================================================================

MasteryUpdater::Result MasteryUpdater::Update(
    const KnowledgeState& state,
    const ConceptParameters& params,
    bool correct,
    const Context& context
) const {
    double p = state.mastery_probability;
    if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
        std::ostringstream oss;
        oss << "mastery_probability for " << state.Key().ToString()
            << " must be in [0, 1], got " << p;
        throw ValidationError(oss.str());
    }
    if (!std::isfinite(context.stress)) {
        throw ValidationError("stress must be a finite number");
    }

    auto errors = params.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages(
            "Invalid parameters for concept '" + params.concept_id + "'", errors);
    }

    Result result;
    result.previous_mastery = p;

    // Forgetting since the last practice
    if (!state.last_practiced.IsZero() && context.now > state.last_practiced) {
        p = forgetting_.Apply(p, params.initial_mastery, params.forgetting_rate,
                              context.now - state.last_practiced);
    }
    result.decayed_mastery = p;

    p = std::clamp(p, config_.epsilon, 1.0 - config_.epsilon);

    auto [slip, guess] = EffectiveRates(params.slip_rate, params.guess_rate,
                                        Clamp01(context.stress));
    result.effective_slip = slip;
    result.effective_guess = guess;
    result.predicted_correct = PredictCorrect(p, slip, guess);

    result.posterior_mastery = Posterior(p, slip, guess, correct);
    result.new_mastery = Transition(result.posterior_mastery, params.learn_rate);

    // Next state
    KnowledgeState next = state;
    next.mastery_probability = result.new_mastery;
    next.practice_count = state.practice_count + 1;
    if (!context.now.IsZero()) {
        next.last_practiced = context.now;
    }

    if (correct) {
        next.consecutive_incorrect = 0;
        if (state.in_recovery && result.new_mastery >= config_.recovery_floor) {
            next.in_recovery = false;
        }
    } else {
        next.consecutive_incorrect = state.consecutive_incorrect + 1;
        if (next.consecutive_incorrect >= config_.recovery_streak &&
            result.new_mastery < config_.recovery_floor) {
            next.in_recovery = true;
        }
    }

    result.recovery = next.in_recovery;
    result.entered_recovery = next.in_recovery && !state.in_recovery;
    result.next_state = next;
    return result;
}

// ============================================================================
// Building Blocks
// ============================================================================

double MasteryUpdater::PredictCorrect(double mastery, double slip, double guess) {
    double m = Clamp01(mastery);
    return m * (1.0 - slip) + (1.0 - m) * guess;
}

double MasteryUpdater::Posterior(double mastery, double slip, double guess, bool correct) const {
    double m = std::clamp(mastery, config_.epsilon, 1.0 - config_.epsilon);

    double numerator;
    double denominator;
    if (correct) {
        numerator = m * (1.0 - slip);
        denominator = numerator + (1.0 - m) * guess;
    } else {
        numerator = m * slip;
        denominator = numerator + (1.0 - m) * (1.0 - guess);
    }

    // Only reachable with slip or guess at the [0,1] boundary
    if (denominator <= 0.0) {
        return m;
    }
    return Clamp01(numerator / denominator);
}

double MasteryUpdater::Transition(double posterior, double learn_rate) {
    double post = Clamp01(posterior);
    return Clamp01(post + (1.0 - post) * Clamp01(learn_rate));
}

std::pair<double, double> MasteryUpdater::EffectiveRates(
    double slip, double guess, double stress) const {
    double s = Clamp01(stress);
    double slip_increase = slip * config_.stress_slip_scale * s;
    double guess_increase = guess * config_.stress_guess_scale * s;

    // Stress may not push slip + guess past the identifiability bound
    double ceiling = std::max(slip + guess, 1.0 - config_.identifiability_margin);
    double headroom = std::max(0.0, ceiling - (slip + guess));
    double total_increase = slip_increase + guess_increase;
    if (total_increase > headroom && total_increase > 0.0) {
        double scale = headroom / total_increase;
        slip_increase *= scale;
        guess_increase *= scale;
    }

    return {std::min(1.0, slip + slip_increase), std::min(1.0, guess + guess_increase)};
}

} // namespace kte
