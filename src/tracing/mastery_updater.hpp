// File: src/tracing/mastery_updater.hpp
#pragma once

#include "core/types.hpp"
#include "tracing/forgetting_curve.hpp"
#include <utility>
#include <vector>

namespace kte {

/// MasteryUpdater: Canonical Bayesian Knowledge Tracing update
///
/// Computes the posterior P(L | observation) followed by the learning
/// transition P(L') = P(L | obs) + (1 - P(L | obs)) × learn_rate.
/// Measured stress raises the effective slip and guess rates, elapsed time
/// since the last practice applies forgetting, and a run of incorrect answers
/// below the recovery floor raises the recovery flag.
///
/// Update() is a pure function of its arguments: it returns the next state
/// and leaves persistence to the caller. Thread-safe (no mutable state).
class MasteryUpdater {
public:
    /// Configuration for the update
    struct Config {
        Config() = default;

        /// Mastery is clamped to [epsilon, 1 - epsilon] before dividing
        double epsilon{1e-6};

        /// Recovery is flagged below this mastery...
        double recovery_floor{0.3};

        /// ...after this many consecutive incorrect observations
        uint32_t recovery_streak{3};

        /// Relative slip increase at stress = 1
        double stress_slip_scale{0.5};

        /// Relative guess increase at stress = 1
        double stress_guess_scale{0.25};

        /// Effective slip + guess stays below 1 - margin under stress
        double identifiability_margin{0.01};

        /// Hours after the last practice before forgetting applies
        double forgetting_grace_hours{24.0};

        std::vector<std::string> GetValidationErrors() const;
    };

    /// Per-observation context
    struct Context {
        /// Stress scalar from the cognitive estimator, in [0,1]
        double stress{0.0};

        /// Observation time (drives forgetting and last_practiced)
        Timestamp now;
    };

    /// Result of one update, with the intermediate terms
    struct Result {
        double previous_mastery{0.0};
        double decayed_mastery{0.0};    // after forgetting
        double posterior_mastery{0.0};  // P(L | obs)
        double new_mastery{0.0};        // after the learning transition
        double predicted_correct{0.0};  // P(correct) before the observation
        double effective_slip{0.0};
        double effective_guess{0.0};
        bool recovery{false};
        bool entered_recovery{false};
        KnowledgeState next_state;
    };

    /// @throws ConfigurationError if the configuration is invalid
    MasteryUpdater();
    explicit MasteryUpdater(const Config& config);

    /// Apply one observation to a knowledge state
    /// @throws ValidationError if the state's mastery is outside [0,1] or stress is not finite
    /// @throws ConfigurationError if the parameters are invalid (including slip + guess >= 1)
    Result Update(const KnowledgeState& state,
                  const ConceptParameters& params,
                  bool correct,
                  const Context& context) const;

    /// P(correct) = p(1 - S) + (1 - p)G
    static double PredictCorrect(double mastery, double slip, double guess);

    /// Posterior mastery given the observation (no transition)
    double Posterior(double mastery, double slip, double guess, bool correct) const;

    /// Learning transition: p + (1 - p) × learn_rate
    static double Transition(double posterior, double learn_rate);

    /// Stress-adjusted (slip, guess), bounded and kept identifiable
    std::pair<double, double> EffectiveRates(double slip, double guess, double stress) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    ForgettingCurve forgetting_;
};

} // namespace kte
