// File: tests/tracing/transfer_learner_test.cpp
#include "tracing/transfer_learner.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace kte {
namespace {

// ============================================================================
// TransferGraph
// ============================================================================

TEST(TransferGraphTest, SetAndLookupEdges) {
    TransferGraph graph;
    graph.SetEdge("algebra", "calculus", 0.6);
    graph.SetEdge("algebra", "trigonometry", 0.4);

    EXPECT_EQ(2u, graph.GetEdgeCount());
    EXPECT_EQ(3u, graph.GetConceptCount());
    ASSERT_TRUE(graph.GetWeight("algebra", "calculus").has_value());
    EXPECT_DOUBLE_EQ(0.6, *graph.GetWeight("algebra", "calculus"));
    EXPECT_FALSE(graph.GetWeight("calculus", "algebra").has_value());

    auto outgoing = graph.GetOutgoing("algebra");
    ASSERT_EQ(2u, outgoing.size());
    EXPECT_EQ("calculus", outgoing[0].target);

    auto incoming = graph.GetIncoming("calculus");
    ASSERT_EQ(1u, incoming.size());
    EXPECT_EQ("algebra", incoming[0].source);
}

TEST(TransferGraphTest, SetEdgeReplacesWeight) {
    TransferGraph graph;
    graph.SetEdge("a", "b", 0.2);
    graph.SetEdge("a", "b", 0.7);

    EXPECT_EQ(1u, graph.GetEdgeCount());
    EXPECT_DOUBLE_EQ(0.7, *graph.GetWeight("a", "b"));
    EXPECT_DOUBLE_EQ(0.7, graph.GetIncoming("b")[0].weight);
}

TEST(TransferGraphTest, RejectsInvalidEdges) {
    TransferGraph graph;
    EXPECT_THROW(graph.SetEdge("a", "a", 0.5), ConfigurationError);
    EXPECT_THROW(graph.SetEdge("a", "b", 1.5), ConfigurationError);
    EXPECT_THROW(graph.SetEdge("a", "b", -0.1), ConfigurationError);
    EXPECT_THROW(graph.SetEdge("", "b", 0.5), ConfigurationError);
    EXPECT_EQ(0u, graph.GetEdgeCount());
}

TEST(TransferGraphTest, RemoveEdgeUpdatesBothIndices) {
    TransferGraph graph;
    graph.SetEdge("a", "b", 0.5);

    EXPECT_TRUE(graph.RemoveEdge("a", "b"));
    EXPECT_FALSE(graph.RemoveEdge("a", "b"));
    EXPECT_TRUE(graph.GetOutgoing("a").empty());
    EXPECT_TRUE(graph.GetIncoming("b").empty());
}

TEST(TransferGraphTest, MapRoundTrip) {
    std::map<std::string, std::map<std::string, double>> edges{
        {"a", {{"b", 0.5}, {"c", 0.25}}},
        {"b", {{"a", 0.75}}},
    };

    TransferGraph graph = TransferGraph::FromMap(edges);
    EXPECT_EQ(3u, graph.GetEdgeCount());
    EXPECT_EQ(edges, graph.ToMap());

    TransferGraph copy = graph;
    EXPECT_EQ(edges, copy.ToMap());
}

TEST(TransferGraphTest, ConcurrentReadsAreSafe) {
    TransferGraph graph;
    for (int i = 0; i < 50; ++i) {
        graph.SetEdge("hub", "leaf" + std::to_string(i), 0.5);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&graph]() {
            for (int i = 0; i < 200; ++i) {
                EXPECT_EQ(50u, graph.GetOutgoing("hub").size());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

// ============================================================================
// TransferLearner
// ============================================================================

TEST(TransferLearnerTest, PlanFollowsOutgoingEdges) {
    TransferGraph graph;
    graph.SetEdge("algebra", "calculus", 0.6);

    TransferLearner learner;
    auto targets = learner.Plan(graph, "algebra", 0.4, 0.7);

    ASSERT_EQ(1u, targets.size());
    EXPECT_EQ("calculus", targets[0].concept_id);
    EXPECT_DOUBLE_EQ(0.6, targets[0].weight);
    EXPECT_NEAR(0.3, targets[0].source_delta, 1e-12);

    // 0.5 + 0.6 * 0.3 * 0.5
    EXPECT_NEAR(0.59, learner.Apply(0.5, targets[0]), 1e-12);
}

TEST(TransferLearnerTest, NegativeDeltaTransfersDownward) {
    TransferGraph graph;
    graph.SetEdge("a", "b", 1.0);

    TransferLearner learner;
    auto targets = learner.Plan(graph, "a", 0.8, 0.4);
    ASSERT_EQ(1u, targets.size());
    EXPECT_NEAR(0.3, learner.Apply(0.5, targets[0]), 1e-12);
}

TEST(TransferLearnerTest, ApplyClampsToUnitInterval) {
    TransferLearner::Config config;
    config.transfer_factor = 0.9;
    TransferLearner learner(config);

    TransferLearner::Target up{"b", 1.0, 0.9};
    TransferLearner::Target down{"b", 1.0, -0.9};
    EXPECT_DOUBLE_EQ(1.0, learner.Apply(0.95, up));
    EXPECT_DOUBLE_EQ(0.0, learner.Apply(0.05, down));
}

TEST(TransferLearnerTest, TinyDeltaIsNotPropagated) {
    TransferGraph graph;
    graph.SetEdge("a", "b", 1.0);

    TransferLearner learner;
    EXPECT_TRUE(learner.Plan(graph, "a", 0.5, 0.50001).empty());
}

TEST(TransferLearnerTest, CycleProducesExactlyOneHop) {
    TransferGraph graph;
    graph.SetEdge("a", "b", 0.8);
    graph.SetEdge("b", "a", 0.8);
    graph.SetEdge("b", "c", 0.8);

    TransferLearner learner;
    auto targets = learner.Plan(graph, "a", 0.3, 0.6);

    // Only a's direct neighbour; b's own change is not planned further
    ASSERT_EQ(1u, targets.size());
    EXPECT_EQ("b", targets[0].concept_id);
}

TEST(TransferLearnerTest, FactorOutsideRangeIsRejected) {
    TransferLearner::Config config;
    config.transfer_factor = 1.0;
    EXPECT_THROW(TransferLearner{config}, ConfigurationError);

    config.transfer_factor = -0.1;
    EXPECT_THROW(TransferLearner{config}, ConfigurationError);
}

// ============================================================================
// Seeding
// ============================================================================

TEST(TransferLearnerTest, SeedPriorRaisesUpToCap) {
    TransferLearner learner;

    // 0.25 + 0.8 * 0.3 = 0.49, capped at 0.4
    EXPECT_DOUBLE_EQ(0.4, learner.SeedPrior(0.25, {{1.0, 0.8}}));

    // 0.1 + 0.5 * 0.3 = 0.25
    EXPECT_NEAR(0.25, learner.SeedPrior(0.1, {{0.5, 0.5}}), 1e-12);
}

TEST(TransferLearnerTest, SeedPriorNeverLowersPrior) {
    TransferLearner learner;
    EXPECT_DOUBLE_EQ(0.6, learner.SeedPrior(0.6, {{1.0, 0.9}}));
    EXPECT_DOUBLE_EQ(0.25, learner.SeedPrior(0.25, {}));
}

TEST(TransferLearnerTest, SeedingCanBeDisabled) {
    TransferLearner::Config config;
    config.seed_from_related = false;
    TransferLearner learner(config);
    EXPECT_DOUBLE_EQ(0.25, learner.SeedPrior(0.25, {{1.0, 1.0}}));
}

} // namespace
} // namespace kte
