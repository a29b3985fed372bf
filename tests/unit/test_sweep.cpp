/**
 * @file test_sweep.cpp
 * @brief Unit tests for cut cost models, SolutionPool and PartitionSweep.
 */

#include "optimizer/sweep.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>

using namespace cut_shoot;

static PartitionResult evaluated(const WorkloadGraph& graph, std::vector<PartitionId> assignment, uint32_t count) {
    auto result = evaluate_assignment(graph, assignment, count);
    EXPECT_TRUE(result.has_value());
    return *result;
}

// ─── Cost models ─────────────────────────────

TEST(CutCostModelTest, Exponential) {
    auto graph = WorkloadGenerator::path(4);
    auto two_cuts = evaluated(graph, {0, 1, 1, 2}, 3);
    ExponentialCutCost model;
    EXPECT_DOUBLE_EQ(model.cost(two_cuts), 16.0);
    EXPECT_DOUBLE_EQ((ExponentialCutCost{.scale = 2.0, .base = 3.0}).cost(two_cuts), 18.0);
}

TEST(CutCostModelTest, KroneckerSkipsEmptyPartitions) {
    auto graph = WorkloadGenerator::path(4);
    // Partition 1 stays empty; f = 1 and f = 3 for the others.
    auto result = evaluated(graph, {0, 0, 2, 2}, 3);
    KroneckerReconstructionCost model;
    EXPECT_DOUBLE_EQ(model.cost(result), 4.0 * (2.0 + 8.0));
}

TEST(CutCostModelTest, FactoryByName) {
    auto exp = make_cut_cost_model("exponential", 3.0);
    ASSERT_TRUE(exp.has_value());
    EXPECT_TRUE(std::holds_alternative<ExponentialCutCost>(*exp));
    EXPECT_DOUBLE_EQ(std::get<ExponentialCutCost>(*exp).base, 3.0);

    auto kron = make_cut_cost_model("kronecker", 4.0);
    ASSERT_TRUE(kron.has_value());
    EXPECT_TRUE(std::holds_alternative<KroneckerReconstructionCost>(*kron));

    EXPECT_FALSE(make_cut_cost_model("linear", 4.0).has_value());
    EXPECT_FALSE(make_cut_cost_model("exponential", 0.0).has_value());
}

// ─── SolutionPool ────────────────────────────

TEST(SolutionPoolTest, EmptyPoolHasNoBest) {
    SolutionPool pool;
    EXPECT_TRUE(pool.empty());
    auto best = pool.best(CutCostModel{ExponentialCutCost{}});
    ASSERT_FALSE(best.has_value());
    EXPECT_EQ(best.error().code, ErrorCode::InvalidInput);
}

TEST(SolutionPoolTest, RanksByCostThenCutsThenPartitions) {
    auto graph = WorkloadGenerator::path(4);
    SolutionPool pool;
    pool.add(3, evaluated(graph, {0, 1, 1, 2}, 3));   // 2 cuts
    pool.add(2, evaluated(graph, {0, 0, 1, 1}, 2));   // 1 cut
    pool.add(4, evaluated(graph, {0, 0, 1, 1}, 4));   // 1 cut, more partitions

    auto order = pool.ranked(ExponentialCutCost{});
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0].max_partitions, 2u);
    EXPECT_EQ(order[1].max_partitions, 4u);
    EXPECT_EQ(order[2].max_partitions, 3u);
    EXPECT_DOUBLE_EQ(order[0].cost, 4.0);
    EXPECT_EQ(order[0].result->cut_count, 1u);
}

TEST(SolutionPoolTest, FailuresAreKeptApart) {
    SolutionPool pool;
    pool.record_failure(1, infeasible("too small", "partition_count"));
    EXPECT_TRUE(pool.empty());
    ASSERT_EQ(pool.failures().size(), 1u);
    EXPECT_EQ(pool.failures()[0].max_partitions, 1u);
}

// ─── PartitionSweep ──────────────────────────

TEST(PartitionSweepTest, SolvesEveryFeasibleCount) {
    auto graph = WorkloadGenerator::path(10);
    ThreadPool threads(2);
    PartitionSweep sweep(threads, SolveOptions{});
    auto pool = sweep.run(graph, 4, {4, 2, 3, 3});
    ASSERT_TRUE(pool.has_value()) << pool.error().message;

    // Two partitions of four cannot hold ten vertices.
    EXPECT_EQ(pool->size(), 2u);
    ASSERT_EQ(pool->failures().size(), 1u);
    EXPECT_EQ(pool->failures()[0].max_partitions, 2u);
    EXPECT_EQ(pool->failures()[0].error.likely_cause, "partition_count");

    auto best = pool->best(CutCostModel{ExponentialCutCost{}});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->result->cut_count, 2u);
    EXPECT_EQ(best->max_partitions, 3u);
}

TEST(PartitionSweepTest, AllCandidatesFail) {
    auto graph = WorkloadGenerator::path(10);
    ThreadPool threads(2);
    PartitionSweep sweep(threads, SolveOptions{});
    auto pool = sweep.run(graph, 4, {1, 2});
    ASSERT_FALSE(pool.has_value());
    EXPECT_EQ(pool.error().code, ErrorCode::Infeasible);
}

TEST(PartitionSweepTest, RejectsBadCandidates) {
    auto graph = WorkloadGenerator::path(4);
    ThreadPool threads(1);
    PartitionSweep sweep(threads, SolveOptions{});
    EXPECT_EQ(sweep.run(graph, 4, {}).error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(sweep.run(graph, 4, {0, 2}).error().code, ErrorCode::InvalidInput);
}
