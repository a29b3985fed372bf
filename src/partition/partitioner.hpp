/**
 * @file partitioner.hpp
 * @brief Graph partitioner: capacity-bounded partitioning with minimum cuts.
 *
 * Splits a workload DAG into at most `max_partitions` partitions whose qubit
 * demand d = a + p fits the per-partition capacity, minimizing the number of
 * cut edges. The problem is a MILP solved by CBC.
 */

#pragma once

#include "core/logger.hpp"
#include "milp/milp_model.hpp"
#include "optimizer/objective.hpp"
#include "partition/partition.hpp"

#include <memory>

namespace cut_shoot {

struct PartitionOptions {
    int64_t capacity{0};
    uint32_t max_partitions{1};
};

/**
 * @brief A built partition model, ready to solve.
 */
class PartitionProblem {
public:
    /**
     * @brief Validate inputs and build the model.
     *
     * InvalidInput for a malformed graph or options; Infeasible when a
     * single vertex exceeds the capacity ("capacity") or the total weight
     * cannot fit in max_partitions partitions ("partition_count").
     */
    static Result<PartitionProblem> build(const WorkloadGraph& graph,
                                          const PartitionOptions& options,
                                          Logger& logger = null_logger());

    Result<PartitionResult> solve(const SolveOptions& solver, Logger& logger = null_logger()) const;

    [[nodiscard]] const MilpModel& model() const noexcept { return *model_; }
    [[nodiscard]] const PartitionVariables& variables() const noexcept { return vars_; }

private:
    PartitionProblem(const WorkloadGraph& graph, PartitionOptions options);

    const WorkloadGraph* graph_;
    PartitionOptions options_;
    std::unique_ptr<MilpModel> model_;
    PartitionVariables vars_;
    ObjectiveComposer objective_;
};

class GraphPartitioner {
public:
    explicit GraphPartitioner(SolveOptions solver = {}, Logger& logger = null_logger());

    Result<PartitionResult> partition(const WorkloadGraph& graph,
                                      const PartitionOptions& options) const;

private:
    SolveOptions solver_;
    Logger& logger_;
};

}  // namespace cut_shoot
