// File: src/tracing/forgetting_curve.hpp
#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace kte {

/**
 * @brief Exponential forgetting between practice sessions
 *
 * Models decay of mastery toward the concept prior:
 *   p(t) = prior + (p_0 - prior) × e^(-λt)
 *
 * Where:
 *   p_0   = mastery at the last practice
 *   prior = concept prior (mastery never decays below it)
 *   λ     = forgetting_rate, per day
 *   t     = days since the last practice, minus a grace period
 *
 * The decay is applied only when a new observation arrives, so stored
 * mastery values are never rewritten in the background.
 */
class ForgettingCurve {
public:
    /**
     * @param grace_hours Elapsed time below which no forgetting is applied
     */
    explicit ForgettingCurve(double grace_hours = 24.0)
        : grace_hours_(std::max(0.0, grace_hours)) {}

    /**
     * @brief Decay a mastery value over the elapsed time
     *
     * @param mastery Mastery at the last practice, in [0,1]
     * @param prior Concept prior
     * @param forgetting_rate λ per day, >= 0
     * @param elapsed Time since the last practice
     * @return Decayed mastery, never below min(mastery, prior)
     */
    double Apply(double mastery, double prior, double forgetting_rate,
                 Timestamp::Duration elapsed) const {
        if (forgetting_rate <= 0.0 || mastery <= prior) {
            return mastery;
        }

        double hours = std::chrono::duration_cast<
            std::chrono::duration<double, std::ratio<3600>>>(elapsed).count();
        if (hours <= grace_hours_) {
            return mastery;
        }

        double days = (hours - grace_hours_) / 24.0;
        double decayed = prior + (mastery - prior) * std::exp(-forgetting_rate * days);
        return std::clamp(decayed, prior, mastery);
    }

    double GetGraceHours() const { return grace_hours_; }

private:
    double grace_hours_;
};

} // namespace kte
