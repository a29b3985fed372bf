/**
 * @file partitioner.cpp
 * @brief GraphPartitioner: pre-checks, model build and solve.
 */

#include "partition/partitioner.hpp"

#include <sstream>

namespace cut_shoot {

// ─────────────────────────────────────────────
// PartitionProblem
// ─────────────────────────────────────────────

PartitionProblem::PartitionProblem(const WorkloadGraph& graph, PartitionOptions options)
    : graph_(&graph),
      options_(options),
      model_(std::make_unique<MilpModel>("partition")),
      objective_(TermWeights{.cuts = 1.0, .latency = 0.0, .qos = 0.0, .postprocessing = 0.0}) {}

Result<PartitionProblem> PartitionProblem::build(const WorkloadGraph& graph,
                                                 const PartitionOptions& options,
                                                 Logger& logger) {
    if (auto valid = graph.validate(); !valid) {
        return valid.error();
    }
    if (options.max_partitions < 1) {
        return invalid_input("max_partitions must be >= 1");
    }
    if (options.capacity < 0) {
        return invalid_input("Partition capacity must be >= 0");
    }

    if (graph.max_weight() > options.capacity) {
        return infeasible("A vertex of weight " + std::to_string(graph.max_weight())
                          + " exceeds the partition capacity " + std::to_string(options.capacity),
                          "capacity");
    }
    // ceil(total / partitions) > capacity, without forming capacity · partitions.
    const int64_t total = graph.total_weight();
    const auto partitions = static_cast<int64_t>(options.max_partitions);
    const int64_t smallest_share = total / partitions + (total % partitions != 0 ? 1 : 0);
    if (smallest_share > options.capacity) {
        return infeasible("Total weight " + std::to_string(graph.total_weight())
                          + " cannot fit in " + std::to_string(options.max_partitions)
                          + " partitions of capacity " + std::to_string(options.capacity),
                          "partition_count");
    }

    PartitionProblem problem(graph, options);
    problem.vars_ = add_partition_model(*problem.model_, graph, options.capacity, options.max_partitions);
    problem.objective_.add(ObjectiveTerm::Cuts, problem.vars_.cut_count_expr());
    problem.objective_.apply(*problem.model_);

    std::ostringstream oss;
    oss << "Built partition model for " << graph.vertex_count() << " vertices, "
        << graph.edge_count() << " edges, capacity " << options.capacity
        << ", " << options.max_partitions << " partitions";
    logger.debug("partitioner", oss.str());
    return problem;
}

Result<PartitionResult> PartitionProblem::solve(const SolveOptions& solver, Logger& logger) const {
    auto solution = model_->solve(solver, logger);
    if (!solution) {
        auto error = solution.error();
        if (error.code == ErrorCode::Infeasible) {
            error.likely_cause = "capacity";
        }
        logger.warn("partitioner", "Partitioning failed: " + error.message);
        return error;
    }

    auto result = read_partition(*graph_, vars_, *solution);
    if (!result) return result.error();
    result->objective = solution->objective;

    std::ostringstream oss;
    oss << "Partitioned into " << result->used_partitions() << " of " << options_.max_partitions
        << " partitions with " << result->cut_count << " cuts (" << to_string(result->status) << ")";
    logger.info("partitioner", oss.str());
    return result;
}

// ─────────────────────────────────────────────
// GraphPartitioner
// ─────────────────────────────────────────────

GraphPartitioner::GraphPartitioner(SolveOptions solver, Logger& logger)
    : solver_(solver), logger_(logger) {}

Result<PartitionResult> GraphPartitioner::partition(const WorkloadGraph& graph,
                                                    const PartitionOptions& options) const {
    auto problem = PartitionProblem::build(graph, options, logger_);
    if (!problem) {
        logger_.warn("partitioner", problem.error().message);
        return problem.error();
    }
    return problem->solve(solver_, logger_);
}

}  // namespace cut_shoot
