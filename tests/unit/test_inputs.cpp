/**
 * @file test_inputs.cpp
 * @brief Unit tests for workload and backend TOML inputs.
 */

#include "io/inputs.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cut_shoot;

TEST(WorkloadInputTest, ParsesWeightsAndEdges) {
    auto graph = parse_workload(R"(
        weights = [1, 2, 2, 1]
        edges = [[0, 1], [1, 2], [2, 3]]
    )");
    ASSERT_TRUE(graph.has_value()) << graph.error().message;
    EXPECT_EQ(graph->vertex_count(), 4u);
    EXPECT_EQ(graph->edge_count(), 3u);
    EXPECT_EQ(graph->weight(1), 2);
}

TEST(WorkloadInputTest, EdgesAreOptional) {
    auto graph = parse_workload("weights = [3]\n");
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->edge_count(), 0u);
}

TEST(WorkloadInputTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_workload("edges = [[0, 1]]\n").has_value());
    EXPECT_FALSE(parse_workload("weights = [1, \"two\"]\n").has_value());
    EXPECT_FALSE(parse_workload("weights = [1, 1]\nedges = [[0, 1, 2]]\n").has_value());
    EXPECT_FALSE(parse_workload("weights = [1, 1]\nedges = [[0, 5]]\n").has_value());
    EXPECT_FALSE(parse_workload("weights = [1, 1]\nedges = [[0, 1], [1, 0]]\n").has_value());
    EXPECT_FALSE(parse_workload("weights = [").has_value());
}

TEST(BackendInputTest, ParsesRequiredAndOptionalFields) {
    auto backends = parse_backends(R"(
        [[backend]]
        id = "qpu_a"
        execution_time = 10.0
        queue_time = 1.0
        capacity = 5
        price_per_shot = 0.01
        reliability = 0.97
        region = "eu-west"

        [[backend]]
        id = "qpu_b"
        execution_time = 20
        queue_time = 4
        capacity = 7
    )");
    ASSERT_TRUE(backends.has_value()) << backends.error().message;
    ASSERT_EQ(backends->size(), 2u);

    const auto& a = (*backends)[0];
    EXPECT_EQ(a.id(), "qpu_a");
    EXPECT_EQ(a.capacity(), 5);
    EXPECT_EQ(a.region(), std::optional<std::string>{"eu-west"});
    EXPECT_DOUBLE_EQ(*a.reliability(), 0.97);

    const auto& b = (*backends)[1];
    EXPECT_DOUBLE_EQ(b.execution_time(), 20.0);
    EXPECT_FALSE(b.price_per_shot().has_value());
    EXPECT_FALSE(b.region().has_value());
}

TEST(BackendInputTest, RejectsMissingFields) {
    auto backends = parse_backends(R"(
        [[backend]]
        id = "qpu_a"
        execution_time = 10.0
    )");
    ASSERT_FALSE(backends.has_value());
    EXPECT_EQ(backends.error().code, ErrorCode::InvalidInput);
}

TEST(BackendInputTest, RejectsDuplicateIds) {
    auto backends = parse_backends(R"(
        [[backend]]
        id = "dup"
        execution_time = 1.0
        queue_time = 0.0
        capacity = 4

        [[backend]]
        id = "dup"
        execution_time = 2.0
        queue_time = 0.0
        capacity = 4
    )");
    EXPECT_FALSE(backends.has_value());
}

TEST(BackendInputTest, RejectsEmptyFile) {
    EXPECT_FALSE(parse_backends("").has_value());
}

TEST(InputFilesTest, LoadFromDisk) {
    auto dir = std::filesystem::temp_directory_path() / "cs_test_inputs";
    std::filesystem::create_directories(dir);
    {
        std::ofstream(dir / "graph.toml") << "weights = [1, 1]\nedges = [[0, 1]]\n";
        std::ofstream(dir / "backends.toml")
            << "[[backend]]\nid = \"q\"\nexecution_time = 1.0\nqueue_time = 0.5\ncapacity = 2\n";
    }

    auto graph = load_workload(dir / "graph.toml");
    auto backends = load_backends(dir / "backends.toml");
    ASSERT_TRUE(graph.has_value()) << graph.error().message;
    ASSERT_TRUE(backends.has_value()) << backends.error().message;
    EXPECT_EQ(graph->edge_count(), 1u);
    EXPECT_EQ(backends->front().id(), "q");

    EXPECT_FALSE(load_workload(dir / "missing.toml").has_value());
    std::filesystem::remove_all(dir);
}
