/**
 * @file test_types.cpp
 * @brief Unit tests for core vocabulary types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace cut_shoot;

TEST(ObjectiveModeTest, NamesRoundTrip) {
    for (auto mode : {ObjectiveMode::SingleSelect, ObjectiveMode::JointUniform,
                      ObjectiveMode::JointQos, ObjectiveMode::JointNonUniform}) {
        auto parsed = parse_objective_mode(to_string(mode));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, mode);
    }
}

TEST(ObjectiveModeTest, UnknownName) {
    EXPECT_FALSE(parse_objective_mode("round_robin").has_value());
    EXPECT_FALSE(parse_objective_mode("").has_value());
}

TEST(SolveStatusTest, Names) {
    EXPECT_EQ(to_string(SolveStatus::Optimal), "optimal");
    EXPECT_EQ(to_string(SolveStatus::TimeLimit), "time_limit");
}

TEST(PartitionDemandTest, Comparison) {
    PartitionDemand a{1024, 4};
    PartitionDemand b{1024, 4};
    PartitionDemand c{1024, 5};
    EXPECT_EQ(a, b);
    EXPECT_LT(a, c);
}
