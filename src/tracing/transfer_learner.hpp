// File: src/tracing/transfer_learner.hpp
#pragma once

#include "tracing/transfer_graph.hpp"
#include <string>
#include <utility>
#include <vector>

namespace kte {

/// TransferLearner: Partial credit between related concepts
///
/// After concept A moves from p_A to p'_A, each concept B informed by A
/// receives a damped share of the change:
///   p'_B = p_B + w_AB × (p'_A - p_A) × transfer_factor
///
/// Propagation is exactly one hop from the originating update. The targets'
/// own changes are never propagated further in the same request, so cycles in
/// the graph cannot cause repeated updates.
class TransferLearner {
public:
    /// Configuration for transfer
    struct Config {
        Config() = default;

        /// Damping applied to every hop, in [0, 1)
        double transfer_factor{0.5};

        /// Source deltas smaller than this (absolute) are not propagated
        double min_delta{1e-4};

        /// Seed priors of new states from the concepts informing them
        bool seed_from_related{true};

        /// Share of the informing concepts' mastery added to the prior
        double seed_factor{0.3};

        /// Upper bound on a seeded prior
        double seed_cap{0.4};

        std::vector<std::string> GetValidationErrors() const;
    };

    /// One planned adjustment of a related concept
    struct Target {
        std::string concept_id;
        double weight{0.0};
        double source_delta{0.0};
    };

    /// @throws ConfigurationError if transfer_factor is outside [0, 1)
    TransferLearner();
    explicit TransferLearner(const Config& config);

    /// Related concepts to adjust after `source` moved by (new - previous)
    /// Empty when the change is below min_delta.
    std::vector<Target> Plan(const TransferGraph& graph,
                             const std::string& source,
                             double previous_mastery,
                             double new_mastery) const;

    /// Adjusted mastery of one related concept, clamped to [0,1]
    double Apply(double target_mastery, const Target& target) const;

    /// Prior for a new state of a concept, given (weight, mastery) of the
    /// concepts informing it that the student has already practiced
    double SeedPrior(double concept_prior,
                     const std::vector<std::pair<double, double>>& informing) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace kte
