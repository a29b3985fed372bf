/**
 * @file joint_optimizer.hpp
 * @brief Single MILP that partitions the workload and allocates shots together.
 *
 * Partition sizes feed backend eligibility directly: partition c may run on
 * backend q only when d[c] fits q's capacity. The objective trades the
 * normalized cut count against the normalized makespan:
 *
 *   alpha · K / K_max + beta · T / T_max  (+ QoS penalty)
 *
 * with K_max = |E| / 2 and T_max = max_q(queue_q + C · execution_q).
 * With beta = 0 the makespan column, the use[q] indicators and their rows
 * are left out of the model.
 */

#pragma once

#include "allocation/allocator.hpp"
#include "core/logger.hpp"
#include "optimizer/objective.hpp"
#include "partition/partition.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace cut_shoot {

struct JointOptions {
    uint32_t max_partitions{1};
    ShotCount shots_per_partition{1024};
    int64_t max_partition_qubits{0};     ///< 0 = bounded by the largest eligible backend
    double alpha{0.5};
    double beta{0.5};
    QosWeights qos;
    std::vector<PredicateRule> predicates;
    SolveOptions solver;
};

struct JointResult {
    PartitionResult partition;
    AllocationResult allocation;          ///< one entry per used partition
    double normalized_cuts{0.0};
    double normalized_makespan{0.0};
    double objective{0.0};
    SolveStatus status{SolveStatus::Optimal};
};

/**
 * @brief Built joint model, kept separate from solving so its shape can be
 *        inspected.
 */
class JointProblem {
public:
    /**
     * @brief Validate inputs, resolve the effective partition capacity and
     *        build the model.
     *
     * Infeasible with cause "predicate" when every backend is excluded, or
     * when a vertex only fits an excluded backend; "capacity" otherwise.
     */
    static Result<JointProblem> build(WorkloadGraph graph,
                                      std::vector<Backend> backends,
                                      JointOptions options,
                                      Logger& logger = null_logger());

    Result<JointResult> solve(Logger& logger = null_logger()) const;

    [[nodiscard]] const MilpModel& model() const noexcept { return *model_; }
    [[nodiscard]] const ObjectiveComposer& objective() const noexcept { return objective_; }
    [[nodiscard]] int64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool has_makespan() const noexcept { return makespan_.has_value(); }

private:
    JointProblem(WorkloadGraph graph, std::vector<Backend> backends, JointOptions options);

    Result<void> resolve_capacity();
    void add_shots();
    void add_latency();
    void add_qos();

    WorkloadGraph graph_;
    std::vector<Backend> backends_;
    JointOptions options_;
    int64_t capacity_{0};
    double k_max_{0.0};
    double t_max_{0.0};

    std::unique_ptr<MilpModel> model_;
    ObjectiveComposer objective_;

    std::vector<bool> allowed_;                      ///< [q]
    PartitionVariables vars_;
    std::vector<ColumnId> used_;                     ///< [c]
    std::vector<std::vector<ColumnId>> shots_;       ///< [c][q]
    std::vector<std::vector<ColumnId>> enable_;      ///< [c][q]
    std::vector<ColumnId> use_;                      ///< [q], latency only
    std::optional<ColumnId> makespan_;
};

class JointOptimizer {
public:
    explicit JointOptimizer(Logger& logger = null_logger());

    Result<JointResult> optimize(const WorkloadGraph& graph,
                                 const std::vector<Backend>& backends,
                                 const JointOptions& options) const;

private:
    Logger& logger_;
};

}  // namespace cut_shoot
