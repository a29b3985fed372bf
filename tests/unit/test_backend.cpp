/**
 * @file test_backend.cpp
 * @brief Unit tests for backend descriptors and predicates.
 */

#include "allocation/backend.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace cut_shoot;

TEST(BackendTest, OptionalMetricsDefaults) {
    Backend bare{"qpu", 10.0, 1.0, 5};
    EXPECT_FALSE(bare.price_per_shot().has_value());
    EXPECT_DOUBLE_EQ(bare.effective_price(), 0.0);
    EXPECT_DOUBLE_EQ(bare.effective_reliability(), 1.0);
    EXPECT_FALSE(bare.region().has_value());
}

TEST(BackendTest, WithMetricsReturnsNewDescriptor) {
    Backend original{"qpu", 10.0, 1.0, 5, 0.01, 0.9, "eu-west"};
    auto refreshed = original.with_metrics(12.0, 0.5);

    EXPECT_DOUBLE_EQ(original.execution_time(), 10.0);
    EXPECT_DOUBLE_EQ(refreshed.execution_time(), 12.0);
    EXPECT_DOUBLE_EQ(refreshed.queue_time(), 0.5);
    EXPECT_EQ(refreshed.id(), "qpu");
    EXPECT_EQ(refreshed.region(), original.region());
}

TEST(BackendTest, Validate) {
    EXPECT_TRUE((Backend{"ok", 1.0, 0.0, 0}).validate().has_value());
    EXPECT_FALSE((Backend{"", 1.0, 0.0, 4}).validate().has_value());
    EXPECT_FALSE((Backend{"neg_exec", -1.0, 0.0, 4}).validate().has_value());
    EXPECT_FALSE((Backend{"neg_queue", 1.0, -0.5, 4}).validate().has_value());
    EXPECT_FALSE((Backend{"neg_cap", 1.0, 0.0, -1}).validate().has_value());
    EXPECT_FALSE((Backend{"bad_rel", 1.0, 0.0, 4, std::nullopt, 1.5}).validate().has_value());
    EXPECT_FALSE((Backend{"bad_price", 1.0, 0.0, 4, -0.1}).validate().has_value());
}

TEST(BackendTest, ValidateBackendsRejectsDuplicatesAndEmpty) {
    EXPECT_FALSE(validate_backends({}).has_value());
    std::vector<Backend> dup{{"a", 1.0, 0.0, 4}, {"a", 2.0, 0.0, 4}};
    auto result = validate_backends(dup);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("Duplicate"), std::string::npos);
}

// ─── Predicates ──────────────────────────────

TEST(PredicateTest, AllowedRegions) {
    PredicateRule rule{.kind = PredicateKind::AllowedRegions, .values = {"eu-west", "eu-central"}};
    EXPECT_TRUE(satisfies(Backend("a", 1.0, 0.0, 4, std::nullopt, std::nullopt, "eu-west"), rule));
    EXPECT_FALSE(satisfies(Backend("b", 1.0, 0.0, 4, std::nullopt, std::nullopt, "us-east"), rule));
    // No region declared cannot satisfy a region allow-list.
    EXPECT_FALSE(satisfies(Backend("c", 1.0, 0.0, 4), rule));
}

TEST(PredicateTest, ExcludeIds) {
    PredicateRule rule{.kind = PredicateKind::ExcludeIds, .values = {"qpu_b"}};
    EXPECT_TRUE(satisfies(Backend("qpu_a", 1.0, 0.0, 4), rule));
    EXPECT_FALSE(satisfies(Backend("qpu_b", 1.0, 0.0, 4), rule));
}

TEST(PredicateTest, ThresholdsUseEffectiveMetrics) {
    PredicateRule min_rel{.kind = PredicateKind::MinReliability, .threshold = 0.95};
    PredicateRule max_price{.kind = PredicateKind::MaxPrice, .threshold = 0.005};

    Backend unknown{"unknown", 1.0, 0.0, 4};
    EXPECT_TRUE(satisfies(unknown, min_rel));
    EXPECT_TRUE(satisfies(unknown, max_price));

    Backend noisy{"noisy", 1.0, 0.0, 4, 0.01, 0.9};
    EXPECT_FALSE(satisfies(noisy, min_rel));
    EXPECT_FALSE(satisfies(noisy, max_price));
}

TEST(PredicateTest, AdmittedRequiresEveryRule) {
    std::vector<PredicateRule> rules{
        {.kind = PredicateKind::AllowedRegions, .values = {"eu-west"}},
        {.kind = PredicateKind::MinReliability, .threshold = 0.9},
    };
    EXPECT_TRUE(admitted(Backend("a", 1.0, 0.0, 4, std::nullopt, 0.95, "eu-west"), rules));
    EXPECT_FALSE(admitted(Backend("b", 1.0, 0.0, 4, std::nullopt, 0.85, "eu-west"), rules));
    EXPECT_TRUE(admitted(Backend("c", 1.0, 0.0, 4), {}));
}

TEST(PredicateTest, ValidatePredicates) {
    EXPECT_TRUE(validate_predicates({}).has_value());
    EXPECT_FALSE(validate_predicates({{.kind = PredicateKind::ExcludeIds}}).has_value());
    EXPECT_FALSE(validate_predicates({{.kind = PredicateKind::MinReliability, .threshold = 1.2}}).has_value());
    EXPECT_FALSE(validate_predicates({{.kind = PredicateKind::MaxPrice, .threshold = -1.0}}).has_value());
}

TEST(BackendTest, RejectsNanMetrics) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(Backend("q", 10.0, 1.0, 5, std::nullopt, nan).validate().has_value());
    EXPECT_FALSE(Backend("q", 10.0, 1.0, 5, nan).validate().has_value());
    EXPECT_FALSE(Backend("q", nan, 1.0, 5).validate().has_value());
    EXPECT_FALSE(validate_backends({Backend("q", 10.0, 1.0, 5, 0.01, nan)}).has_value());
}

TEST(PredicateTest, RejectsNanThresholds) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    auto reliability = validate_predicates({{.kind = PredicateKind::MinReliability, .threshold = nan}});
    ASSERT_FALSE(reliability.has_value());
    EXPECT_EQ(reliability.error().code, ErrorCode::InvalidInput);
    EXPECT_FALSE(validate_predicates({{.kind = PredicateKind::MaxPrice, .threshold = nan}}).has_value());
}
