/**
 * @file run.cpp
 * @brief OptimizationRun stage machine.
 */

#include "optimizer/run.hpp"

#include <sstream>

namespace cut_shoot {

// ─────────────────────────────────────────────
// Config translation
// ─────────────────────────────────────────────

SolveOptions solve_options(const SolverConfig& solver) {
    return SolveOptions{
        .time_limit_seconds = solver.time_limit_seconds,
        .random_seed = solver.random_seed,
        .log_output = solver.log_solver_output
    };
}

AllocationOptions allocation_options(const Config& config, size_t cut_count) {
    const auto& alloc = config.allocation;
    AllocationOptions options;
    options.mode = alloc.objective_mode;
    options.qos = alloc.qos;
    options.predicates = alloc.predicates;
    options.uniform_split = alloc.uniform_split;
    options.postprocessing_time = alloc.postprocessing_time
                                  + alloc.postprocessing_time_per_cut * static_cast<double>(cut_count);
    options.weights = TermWeights{
        .cuts = 0.0,
        .latency = config.objective.latency_weight,
        .qos = 1.0,
        .postprocessing = config.objective.postprocessing_weight
    };
    options.solver = solve_options(config.solver);
    return options;
}

JointOptions joint_options(const Config& config) {
    JointOptions options;
    options.max_partitions = config.partition.num_subcircuits;
    options.shots_per_partition = config.allocation.shots_per_subcircuit;
    options.max_partition_qubits = config.partition.max_qubits_per_subcircuit;
    options.alpha = config.objective.alpha;
    options.beta = config.objective.beta;
    options.qos = config.allocation.qos;
    options.predicates = config.allocation.predicates;
    options.solver = solve_options(config.solver);
    return options;
}

// ─────────────────────────────────────────────
// OptimizationRun
// ─────────────────────────────────────────────

OptimizationRun::OptimizationRun(WorkloadGraph graph,
                                 std::vector<Backend> backends,
                                 Config config,
                                 Pipeline pipeline,
                                 Logger& logger)
    : graph_(std::move(graph)),
      backends_(std::move(backends)),
      config_(std::move(config)),
      pipeline_(pipeline),
      logger_(logger) {}

Result<void> OptimizationRun::expect(RunStage expected, std::string_view action) const {
    if (stage_ != expected) {
        return invalid_input("Cannot " + std::string(action) + " a run in stage "
                             + std::string(to_string(stage_)) + " (expected "
                             + std::string(to_string(expected)) + ")");
    }
    return {};
}

Result<void> OptimizationRun::fix_partition(std::vector<PartitionId> assignment) {
    if (auto ok = expect(RunStage::Configured, "fix the partition of"); !ok) return ok;
    if (pipeline_ != Pipeline::Staged) {
        return invalid_input("A fixed partition is only supported by the staged pipeline");
    }
    fixed_assignment_ = std::move(assignment);
    return {};
}

Result<void> OptimizationRun::build() {
    if (auto ok = expect(RunStage::Configured, "build"); !ok) return ok;
    started_ = WallClock::now();

    if (auto valid = validate_config(config_); !valid) return valid;
    if (auto valid = graph_.validate(); !valid) return valid;
    if (auto valid = validate_backends(backends_); !valid) return valid;
    if (config_.allocation.shots_per_subcircuit < 1) {
        return invalid_input("allocation.shots_per_subcircuit must be >= 1");
    }
    if (auto valid = validate_predicates(config_.allocation.predicates); !valid) return valid;

    if (pipeline_ == Pipeline::Staged) {
        const auto capacity = config_.partition.max_qubits_per_subcircuit;
        if (fixed_assignment_) {
            auto evaluated = evaluate_assignment(graph_, *fixed_assignment_, config_.partition.num_subcircuits);
            if (!evaluated) return evaluated.error();
            for (size_t c = 0; c < evaluated->aggregates.size(); ++c) {
                if (evaluated->aggregates[c].d > capacity) {
                    return infeasible("Fixed partition " + std::to_string(c) + " needs "
                                      + std::to_string(evaluated->aggregates[c].d)
                                      + " qubits, capacity is " + std::to_string(capacity),
                                      "capacity");
                }
            }
            partition_ = std::move(*evaluated);
        } else {
            auto problem = PartitionProblem::build(
                graph_, PartitionOptions{.capacity = capacity, .max_partitions = config_.partition.num_subcircuits},
                logger_);
            if (!problem) return problem.error();
            partition_problem_.emplace(std::move(*problem));
        }
    }

    stage_ = RunStage::Built;
    logger_.debug("run", "Run built (" + std::string(to_string(pipeline_)) + " pipeline)");
    return {};
}

Result<void> OptimizationRun::solve() {
    if (auto ok = expect(RunStage::Built, "solve"); !ok) return ok;
    auto solve_started = WallClock::now();

    auto solved = pipeline_ == Pipeline::Staged ? solve_staged() : solve_joint();
    if (!solved) {
        logger_.warn("run", "Run failed: " + solved.error().message);
        return solved;
    }

    solve_time_ = WallClock::now() - solve_started;
    stage_ = RunStage::Solved;
    return {};
}

Result<void> OptimizationRun::solve_staged() {
    if (partition_problem_) {
        auto partition = partition_problem_->solve(solve_options(config_.solver), logger_);
        if (!partition) return partition.error();
        partition_ = std::move(*partition);
    }

    auto demands = partition_->demands(config_.allocation.shots_per_subcircuit);
    ShotAllocator allocator(logger_);
    auto allocation = allocator.allocate(backends_, demands, allocation_options(config_, partition_->cut_count));
    if (!allocation) return allocation.error();
    allocation_ = std::move(*allocation);
    return {};
}

Result<void> OptimizationRun::solve_joint() {
    JointOptimizer optimizer(logger_);
    auto joint = optimizer.optimize(graph_, backends_, joint_options(config_));
    if (!joint) return joint.error();
    joint_ = std::move(*joint);
    return {};
}

Result<OptimizationReport> OptimizationRun::report() {
    if (auto ok = expect(RunStage::Solved, "report"); !ok) return ok.error();

    OptimizationReport report;
    report.pipeline = pipeline_;
    if (pipeline_ == Pipeline::Staged) {
        report.mode = config_.allocation.objective_mode;
        report.partition = *partition_;
        report.allocation = *allocation_;
        report.status = combine(partition_->status, allocation_->status);
        report.objective = config_.objective.cut_weight * static_cast<double>(partition_->cut_count)
                           + allocation_->objective;
    } else {
        report.mode = ObjectiveMode::JointNonUniform;
        report.partition = joint_->partition;
        report.allocation = joint_->allocation;
        report.status = joint_->status;
        report.objective = joint_->objective;
    }
    report.wall_time = WallClock::now() - started_;

    std::ostringstream oss;
    oss << "Run " << to_string(report.status) << ": " << report.partition.cut_count << " cuts, "
        << report.partition.used_partitions() << " partitions, makespan " << report.makespan()
        << ", objective " << report.objective << ", solve " << solve_time_.count() << "s";
    logger_.info("run", oss.str());

    stage_ = RunStage::Reported;
    return report;
}

Result<OptimizationReport> OptimizationRun::execute() {
    if (auto built = build(); !built) return built.error();
    if (auto solved = solve(); !solved) return solved.error();
    return report();
}

}  // namespace cut_shoot
