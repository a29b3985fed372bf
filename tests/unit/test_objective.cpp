/**
 * @file test_objective.cpp
 * @brief Unit tests for ObjectiveComposer.
 */

#include "optimizer/objective.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace cut_shoot;

TEST(ObjectiveComposerTest, DisabledTermDropsContributions) {
    ObjectiveComposer composer(TermWeights{.cuts = 1.0, .latency = 0.0, .qos = 1.0, .postprocessing = 0.0});
    EXPECT_FALSE(composer.enabled(ObjectiveTerm::Latency));

    composer.add(ObjectiveTerm::Latency, 0, 1.0);
    composer.add(ObjectiveTerm::Cuts, 0, 1.0);
    composer.add_constant(ObjectiveTerm::Postprocessing, 5.0);

    EXPECT_EQ(composer.term_size(ObjectiveTerm::Latency), 0u);
    EXPECT_EQ(composer.term_size(ObjectiveTerm::Cuts), 1u);

    MilpModel model("disabled");
    model.add_binary("b");
    composer.apply(model);
    EXPECT_DOUBLE_EQ(model.objective_offset(), 0.0);
}

TEST(ObjectiveComposerTest, ApplyScalesByWeight) {
    MilpModel model("weights");
    auto x = model.add_integer("x", 0.0, 10.0);
    auto y = model.add_integer("y", 0.0, 10.0);

    ObjectiveComposer composer(TermWeights{.cuts = 2.0, .latency = 0.5, .qos = 1.0, .postprocessing = 3.0});
    composer.add(ObjectiveTerm::Cuts, x, 1.0);
    composer.add(ObjectiveTerm::Latency, {{x, 2.0}, {y, 4.0}});
    composer.add_constant(ObjectiveTerm::Postprocessing, 1.5);
    composer.apply(model);

    EXPECT_DOUBLE_EQ(model.objective_coefficient(x), 2.0 * 1.0 + 0.5 * 2.0);
    EXPECT_DOUBLE_EQ(model.objective_coefficient(y), 0.5 * 4.0);
    EXPECT_DOUBLE_EQ(model.objective_offset(), 4.5);
}

TEST(ObjectiveComposerTest, EvaluateMatchesSolver) {
    MilpModel model("evaluate");
    auto x = model.add_integer("x", 1.0, 10.0);
    auto y = model.add_integer("y", 2.0, 10.0);

    ObjectiveComposer composer(TermWeights{.cuts = 1.0, .latency = 2.0, .qos = 0.0, .postprocessing = 1.0});
    composer.add(ObjectiveTerm::Cuts, x, 1.0);
    composer.add(ObjectiveTerm::Latency, y, 1.0);
    composer.add_constant(ObjectiveTerm::Postprocessing, 0.75);
    composer.apply(model);

    auto solution = model.solve({});
    ASSERT_TRUE(solution.has_value()) << solution.error().message;
    EXPECT_NEAR(composer.evaluate(ObjectiveTerm::Cuts, *solution), 1.0, 1e-9);
    EXPECT_NEAR(composer.evaluate(ObjectiveTerm::Latency, *solution), 2.0, 1e-9);
    EXPECT_NEAR(composer.evaluate(*solution), solution->objective, 1e-6);
    EXPECT_NEAR(solution->objective, 1.0 + 4.0 + 0.75, 1e-6);
}

TEST(ObjectiveComposerTest, ValidateRejectsBadWeights) {
    EXPECT_TRUE(ObjectiveComposer{}.validate().has_value());
    EXPECT_FALSE(ObjectiveComposer(TermWeights{.cuts = -1.0}).validate().has_value());
    EXPECT_FALSE(ObjectiveComposer(TermWeights{.qos = std::numeric_limits<double>::infinity()})
                     .validate().has_value());
}

TEST(ObjectiveComposerTest, TermNames) {
    EXPECT_EQ(to_string(ObjectiveTerm::Cuts), "cuts");
    EXPECT_EQ(to_string(ObjectiveTerm::Postprocessing), "postprocessing");
}
