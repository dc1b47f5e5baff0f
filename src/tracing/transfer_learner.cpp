// File: src/tracing/transfer_learner.cpp
#include "tracing/transfer_learner.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace kte {

std::vector<std::string> TransferLearner::Config::GetValidationErrors() const {
    std::vector<std::string> errors;
    if (!std::isfinite(transfer_factor) || transfer_factor < 0.0 || transfer_factor >= 1.0) {
        std::ostringstream oss;
        oss << "transfer_factor must be in [0, 1), got " << transfer_factor;
        errors.push_back(oss.str());
    }
    if (!std::isfinite(min_delta) || min_delta < 0.0) {
        errors.push_back("min_delta must be non-negative");
    }
    if (!std::isfinite(seed_factor) || seed_factor < 0.0 ||
        !std::isfinite(seed_cap) || seed_cap < 0.0 || seed_cap > 1.0) {
        errors.push_back("seed_factor must be >= 0 and seed_cap in [0, 1]");
    }
    return errors;
}

TransferLearner::TransferLearner()
    : TransferLearner(Config())
{
}

TransferLearner::TransferLearner(const Config& config)
    : config_(config)
{
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid transfer configuration", errors);
    }
}

std::vector<TransferLearner::Target> TransferLearner::Plan(
    const TransferGraph& graph,
    const std::string& source,
    double previous_mastery,
    double new_mastery
) const {
    std::vector<Target> targets;

    double delta = new_mastery - previous_mastery;
    if (std::abs(delta) < config_.min_delta || config_.transfer_factor == 0.0) {
        return targets;
    }

    for (const auto& edge : graph.GetOutgoing(source)) {
        if (edge.weight <= 0.0) {
            continue;
        }
        targets.push_back(Target{edge.target, edge.weight, delta});
    }
    return targets;
}

double TransferLearner::Apply(double target_mastery, const Target& target) const {
    double adjusted = target_mastery + target.weight * target.source_delta * config_.transfer_factor;
    return Clamp01(adjusted);
}

double TransferLearner::SeedPrior(
    double concept_prior,
    const std::vector<std::pair<double, double>>& informing
) const {
    if (!config_.seed_from_related || informing.empty()) {
        return concept_prior;
    }

    double weight_sum = 0.0;
    double weighted_mastery = 0.0;
    for (const auto& [weight, mastery] : informing) {
        weight_sum += weight;
        weighted_mastery += weight * Clamp01(mastery);
    }
    if (weight_sum <= 0.0) {
        return concept_prior;
    }

    double boost = (weighted_mastery / weight_sum) * config_.seed_factor;

    // Seeding only raises a prior up to the cap; it never lowers one
    double seeded = std::min(config_.seed_cap, concept_prior + boost);
    return std::max(concept_prior, seeded);
}

} // namespace kte
