/**
 * @file partition.hpp
 * @brief Partition results and the capacity-bounded partition MILP.
 *
 * The partition model is shared by the staged partitioner and the joint
 * cut-and-shoot optimizer: both call add_partition_model() on their own
 * MilpModel and read the assignment back with read_partition().
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "milp/milp_model.hpp"
#include "workload/dag.hpp"

#include <cstdint>
#include <vector>

namespace cut_shoot {

/**
 * @brief Qubit accounting of one partition.
 *
 *   a  weight of owned vertices
 *   p  cut edges entering the partition (extra initializations)
 *   o  cut edges leaving the partition (extra measurements)
 *   f  a + p - o
 *   d  a + p, bounded by the capacity
 */
struct PartitionAggregates {
    int64_t a{0};
    int64_t p{0};
    int64_t o{0};
    int64_t f{0};
    int64_t d{0};

    bool operator==(const PartitionAggregates&) const = default;
};

/**
 * @brief An edge with exactly one endpoint inside `partition`.
 */
struct CutEdge {
    EdgeIndex edge{0};
    PartitionId partition{0};

    auto operator<=>(const CutEdge&) const = default;
};

struct PartitionResult {
    std::vector<PartitionId> assignment;              ///< vertex -> partition
    std::vector<CutEdge> cut_edges;                   ///< two records per cut
    std::vector<PartitionAggregates> aggregates;      ///< per partition
    std::vector<std::vector<VertexId>> vertices;      ///< per partition, ascending
    std::vector<std::vector<VertexId>> cut_in;        ///< targets of entering cuts
    std::vector<std::vector<VertexId>> cut_out;       ///< sources of leaving cuts
    uint32_t num_partitions{0};
    size_t cut_count{0};
    SolveStatus status{SolveStatus::Optimal};
    double objective{0.0};

    /// Partitions that own at least one vertex.
    [[nodiscard]] uint32_t used_partitions() const noexcept;

    /// One scheduling unit per used partition, sized by its d aggregate.
    [[nodiscard]] std::vector<PartitionDemand> demands(ShotCount shots_per_partition) const;
};

/**
 * @brief Compute cut edges and aggregates of a fixed assignment.
 *
 * InvalidInput when the assignment does not cover every vertex or names a
 * partition outside 0..num_partitions-1. Capacity is not checked here.
 */
Result<PartitionResult> evaluate_assignment(const WorkloadGraph& graph,
                                            const std::vector<PartitionId>& assignment,
                                            uint32_t num_partitions);

/**
 * @brief Column registry of the partition model, dense per vertex/edge/partition.
 */
struct PartitionVariables {
    uint32_t num_partitions{0};
    std::vector<std::vector<ColumnId>> y;    ///< [vertex][partition]
    std::vector<std::vector<ColumnId>> x;    ///< [edge][partition]
    std::vector<std::vector<ColumnId>> zp;   ///< x * y[target]
    std::vector<std::vector<ColumnId>> zo;   ///< x * y[source]
    std::vector<ColumnId> a, p, o, f, d;     ///< [partition]

    /// Σ x / 2
    [[nodiscard]] LinearExpr cut_count_expr() const;
};

/**
 * @brief Add assignment, cut consistency, aggregate, capacity and
 *        symmetry-breaking constraints to `model`. No objective is set.
 */
PartitionVariables add_partition_model(MilpModel& model,
                                       const WorkloadGraph& graph,
                                       int64_t capacity,
                                       uint32_t num_partitions);

/**
 * @brief Read the assignment from a solution and recompute its aggregates.
 */
Result<PartitionResult> read_partition(const WorkloadGraph& graph,
                                       const PartitionVariables& vars,
                                       const MilpSolution& solution);

}  // namespace cut_shoot
