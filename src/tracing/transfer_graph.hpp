// File: src/tracing/transfer_graph.hpp
#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kte {

/// TransferEdge: How much mastery of `source` informs `target`
struct TransferEdge {
    std::string source;
    std::string target;
    double weight{0.0};  // [0,1]
};

/// TransferGraph: Static directed graph of concept relationships
///
/// Storage keeps an outgoing index (source -> targets) for propagation and a
/// reverse index (target -> sources) for seeding priors of new states.
/// The graph is configuration: it is built at startup and not learned online.
///
/// Thread-safe with reader-writer locking (std::shared_mutex)
class TransferGraph {
public:
    TransferGraph() = default;
    TransferGraph(const TransferGraph& other);
    TransferGraph& operator=(const TransferGraph& other);

    /// Build from a nested map: source -> (target -> weight)
    /// @throws ConfigurationError on invalid weights or self-loops
    static TransferGraph FromMap(const std::map<std::string, std::map<std::string, double>>& edges);

    // ========================================================================
    // Add/Remove Operations
    // ========================================================================

    /// Add or replace an edge
    /// @throws ConfigurationError if weight is outside [0,1] or source == target
    void SetEdge(const std::string& source, const std::string& target, double weight);

    /// Remove an edge (returns false if it doesn't exist)
    bool RemoveEdge(const std::string& source, const std::string& target);

    /// Remove all edges
    void Clear();

    // ========================================================================
    // Lookup Operations
    // ========================================================================

    /// Weight of a specific edge
    std::optional<double> GetWeight(const std::string& source, const std::string& target) const;

    /// Concepts informed by `source`
    std::vector<TransferEdge> GetOutgoing(const std::string& source) const;

    /// Concepts informing `target`
    std::vector<TransferEdge> GetIncoming(const std::string& target) const;

    /// All edges, ordered by (source, target)
    std::vector<TransferEdge> GetAllEdges() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    size_t GetEdgeCount() const;
    size_t GetConceptCount() const;

    /// Nested-map form, as used by the configuration file
    std::map<std::string, std::map<std::string, double>> ToMap() const;

private:
    mutable std::shared_mutex mutex_;

    // source -> (target -> weight)
    std::unordered_map<std::string, std::map<std::string, double>> outgoing_;

    // target -> (source -> weight)
    std::unordered_map<std::string, std::map<std::string, double>> incoming_;
};

} // namespace kte
