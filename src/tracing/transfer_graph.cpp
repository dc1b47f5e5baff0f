// File: src/tracing/transfer_graph.cpp
#include "tracing/transfer_graph.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>
#include <sstream>

namespace kte {

// ============================================================================
// Construction
// ============================================================================

TransferGraph::TransferGraph(const TransferGraph& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    outgoing_ = other.outgoing_;
    incoming_ = other.incoming_;
}

TransferGraph& TransferGraph::operator=(const TransferGraph& other) {
    if (this == &other) {
        return *this;
    }
    std::unique_lock<std::shared_mutex> lock_this(mutex_, std::defer_lock);
    std::shared_lock<std::shared_mutex> lock_other(other.mutex_, std::defer_lock);
    std::lock(lock_this, lock_other);
    outgoing_ = other.outgoing_;
    incoming_ = other.incoming_;
    return *this;
}

TransferGraph TransferGraph::FromMap(
    const std::map<std::string, std::map<std::string, double>>& edges) {
    TransferGraph graph;
    for (const auto& [source, targets] : edges) {
        for (const auto& [target, weight] : targets) {
            graph.SetEdge(source, target, weight);
        }
    }
    return graph;
}

// ============================================================================
// Add/Remove Operations
// ============================================================================

void TransferGraph::SetEdge(const std::string& source, const std::string& target, double weight) {
    if (source.empty() || target.empty()) {
        throw ConfigurationError("Transfer edge endpoints must be non-empty");
    }
    if (source == target) {
        throw ConfigurationError("Transfer edge '" + source + "' -> itself is not allowed");
    }
    if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
        std::ostringstream oss;
        oss << "Transfer weight " << source << " -> " << target
            << " must be in [0, 1], got " << weight;
        throw ConfigurationError(oss.str());
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    outgoing_[source][target] = weight;
    incoming_[target][source] = weight;
}

bool TransferGraph::RemoveEdge(const std::string& source, const std::string& target) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto out_it = outgoing_.find(source);
    if (out_it == outgoing_.end() || out_it->second.erase(target) == 0) {
        return false;
    }
    if (out_it->second.empty()) {
        outgoing_.erase(out_it);
    }

    auto in_it = incoming_.find(target);
    if (in_it != incoming_.end()) {
        in_it->second.erase(source);
        if (in_it->second.empty()) {
            incoming_.erase(in_it);
        }
    }
    return true;
}

void TransferGraph::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    outgoing_.clear();
    incoming_.clear();
}

// ============================================================================
// Lookup Operations
// ============================================================================

std::optional<double> TransferGraph::GetWeight(const std::string& source,
                                               const std::string& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto out_it = outgoing_.find(source);
    if (out_it == outgoing_.end()) {
        return std::nullopt;
    }
    auto edge_it = out_it->second.find(target);
    if (edge_it == out_it->second.end()) {
        return std::nullopt;
    }
    return edge_it->second;
}

std::vector<TransferEdge> TransferGraph::GetOutgoing(const std::string& source) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<TransferEdge> result;
    auto it = outgoing_.find(source);
    if (it == outgoing_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto& [target, weight] : it->second) {
        result.push_back(TransferEdge{source, target, weight});
    }
    return result;
}

std::vector<TransferEdge> TransferGraph::GetIncoming(const std::string& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<TransferEdge> result;
    auto it = incoming_.find(target);
    if (it == incoming_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto& [source, weight] : it->second) {
        result.push_back(TransferEdge{source, target, weight});
    }
    return result;
}

std::vector<TransferEdge> TransferGraph::GetAllEdges() const {
    std::vector<TransferEdge> result;
    for (const auto& [source, targets] : ToMap()) {
        for (const auto& [target, weight] : targets) {
            result.push_back(TransferEdge{source, target, weight});
        }
    }
    return result;
}

// ============================================================================
// Statistics
// ============================================================================

size_t TransferGraph::GetEdgeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : outgoing_) {
        count += entry.second.size();
    }
    return count;
}

size_t TransferGraph::GetConceptCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::set<std::string> concepts;
    for (const auto& entry : outgoing_) {
        concepts.insert(entry.first);
    }
    for (const auto& entry : incoming_) {
        concepts.insert(entry.first);
    }
    return concepts.size();
}

std::map<std::string, std::map<std::string, double>> TransferGraph::ToMap() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::map<std::string, std::map<std::string, double>>(outgoing_.begin(), outgoing_.end());
}

} // namespace kte
