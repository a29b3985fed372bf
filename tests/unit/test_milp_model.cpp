/**
 * @file test_milp_model.cpp
 * @brief Unit tests for MilpModel and its CBC back end.
 */

#include "milp/milp_model.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace cut_shoot;

// ─── Building ────────────────────────────────

TEST(MilpModelTest, ColumnRegistry) {
    MilpModel model("registry");
    auto b = model.add_binary("b");
    auto i = model.add_integer("i", 0.0, 10.0);
    auto x = model.add_continuous("x", -1.0, kInfinity);

    EXPECT_EQ(b, 0);
    EXPECT_EQ(i, 1);
    EXPECT_EQ(x, 2);
    EXPECT_EQ(model.column_count(), 3u);
    EXPECT_EQ(model.integer_count(), 2u);
    EXPECT_EQ(model.column_name(i), "i");
    EXPECT_DOUBLE_EQ(model.upper_bound(b), 1.0);
}

TEST(MilpModelTest, RejectsInvertedBounds) {
    MilpModel model("bounds");
    EXPECT_THROW(model.add_integer("bad", 3.0, 1.0), std::invalid_argument);
}

TEST(MilpModelTest, RowMergesRepeatedColumns) {
    MilpModel model("merge");
    auto x = model.add_integer("x", 0.0, 5.0);
    auto y = model.add_integer("y", 0.0, 5.0);
    model.add_le("r", {{x, 1.0}, {y, 2.0}, {x, 1.0}, {y, -2.0}}, 4.0);
    EXPECT_EQ(model.row_count(), 1u);
    // y cancels out, x merges into one entry
    EXPECT_EQ(model.nonzero_count(), 1u);
}

TEST(MilpModelTest, RowRejectsUnknownColumn) {
    MilpModel model("unknown");
    model.add_binary("b");
    EXPECT_THROW(model.add_le("r", {{7, 1.0}}, 1.0), std::out_of_range);
}

TEST(MilpModelTest, UpperBoundZeroPullsLowerBound) {
    MilpModel model("exclusion");
    auto s = model.add_integer("s", 1.0, 10.0);
    model.set_upper_bound(s, 0.0);
    auto solution = model.solve({});
    ASSERT_TRUE(solution.has_value()) << solution.error().message;
    EXPECT_EQ(solution->rounded(s), 0);
}

// ─── Solving ─────────────────────────────────

TEST(MilpModelTest, SmallKnapsack) {
    // max 5a + 4b + 3c  s.t. 2a + 3b + c <= 5  →  min of the negation
    MilpModel model("knapsack");
    auto a = model.add_binary("a");
    auto b = model.add_binary("b");
    auto c = model.add_binary("c");
    model.add_le("weight", {{a, 2.0}, {b, 3.0}, {c, 1.0}}, 5.0);
    model.add_objective(a, -5.0);
    model.add_objective(b, -4.0);
    model.add_objective(c, -3.0);

    auto solution = model.solve({});
    ASSERT_TRUE(solution.has_value()) << solution.error().message;
    EXPECT_EQ(solution->status, SolveStatus::Optimal);
    EXPECT_NEAR(solution->objective, -9.0, 1e-6);
    EXPECT_TRUE(solution->is_one(a));
    EXPECT_TRUE(solution->is_one(b));
    EXPECT_FALSE(solution->is_one(c));
}

TEST(MilpModelTest, ObjectiveOffsetIsReported) {
    MilpModel model("offset");
    auto x = model.add_integer("x", 2.0, 8.0);
    model.add_objective(x, 1.0);
    model.add_objective_offset(3.5);

    auto solution = model.solve({});
    ASSERT_TRUE(solution.has_value());
    EXPECT_NEAR(solution->objective, 5.5, 1e-6);
    EXPECT_DOUBLE_EQ(model.objective_offset(), 3.5);
}

TEST(MilpModelTest, AndLinearization) {
    for (int xv = 0; xv <= 1; ++xv) {
        for (int yv = 0; yv <= 1; ++yv) {
            MilpModel model("and");
            auto x = model.add_binary("x");
            auto y = model.add_binary("y");
            auto z = model.add_binary("z");
            model.add_and_linearization("z", z, x, y);
            model.add_eq("fix_x", {{x, 1.0}}, xv);
            model.add_eq("fix_y", {{y, 1.0}}, yv);
            // Push z both ways; only the AND value is feasible.
            model.add_objective(z, (xv + yv) % 2 == 0 ? 1.0 : -1.0);

            auto solution = model.solve({});
            ASSERT_TRUE(solution.has_value());
            EXPECT_EQ(solution->rounded(z), xv * yv) << "x=" << xv << " y=" << yv;
        }
    }
}

TEST(MilpModelTest, InfeasibleModel) {
    MilpModel model("infeasible");
    auto x = model.add_binary("x");
    auto y = model.add_binary("y");
    model.add_ge("both", {{x, 1.0}, {y, 1.0}}, 3.0);

    auto solution = model.solve({});
    ASSERT_FALSE(solution.has_value());
    EXPECT_EQ(solution.error().code, ErrorCode::Infeasible);
}

TEST(MilpModelTest, IntegerValuesAreRounded) {
    MilpModel model("rounding");
    auto n = model.add_integer("n", 0.0, 100.0);
    model.add_ge("lower", {{n, 3.0}}, 10.0);
    model.add_objective(n, 1.0);

    auto solution = model.solve({});
    ASSERT_TRUE(solution.has_value());
    EXPECT_EQ(solution->rounded(n), 4);
    EXPECT_DOUBLE_EQ(solution->value(n), 4.0);
}

// ─── Outcome classification ──────────────────

TEST(ClassifyOutcomeTest, ProvenOptimalWithIncumbent) {
    auto status = classify_outcome({.proven_optimal = true, .has_incumbent = true}, "m");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, SolveStatus::Optimal);
}

TEST(ClassifyOutcomeTest, LimitWithIncumbentIsTimeLimit) {
    auto status = classify_outcome({.limit_reached = true, .has_incumbent = true, .status = 1}, "m");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, SolveStatus::TimeLimit);
}

TEST(ClassifyOutcomeTest, LimitWithoutIncumbentIsSolverLimit) {
    auto status = classify_outcome({.limit_reached = true, .status = 1}, "m");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::SolverLimitReached);
}

TEST(ClassifyOutcomeTest, InfeasibleWinsOverLimit) {
    auto status = classify_outcome({.proven_infeasible = true, .limit_reached = true}, "m");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::Infeasible);
}

TEST(ClassifyOutcomeTest, UnboundedAndAbandonedAreFailures) {
    auto unbounded = classify_outcome({.unbounded = true}, "m");
    ASSERT_FALSE(unbounded.has_value());
    EXPECT_EQ(unbounded.error().code, ErrorCode::SolverFailure);
    EXPECT_NE(unbounded.error().message.find("unbounded"), std::string::npos);

    auto abandoned = classify_outcome({.abandoned = true, .has_incumbent = true}, "m");
    ASSERT_FALSE(abandoned.has_value());
    EXPECT_EQ(abandoned.error().code, ErrorCode::SolverFailure);
}

TEST(ClassifyOutcomeTest, OptimalFlagWithoutIncumbentIsNotOptimal) {
    auto status = classify_outcome({.proven_optimal = true, .status = 0}, "m");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::SolverFailure);
}

TEST(ClassifyOutcomeTest, UnrecognizedStatusCarriesCodes) {
    auto status = classify_outcome({.status = 5, .secondary_status = 7}, "model_x");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::SolverFailure);
    const auto& message = status.error().message;
    EXPECT_NE(message.find("status 5"), std::string::npos) << message;
    EXPECT_NE(message.find("secondary 7"), std::string::npos) << message;
    EXPECT_NE(message.find("model_x"), std::string::npos) << message;
}
