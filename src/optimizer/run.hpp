/**
 * @file run.hpp
 * @brief OptimizationRun: one end-to-end optimization with explicit stages.
 *
 * Stages advance Configured -> Built -> Solved -> Reported. Calling a stage
 * out of order returns InvalidInput and leaves the run untouched; a failing
 * stage also leaves the stage unchanged.
 */

#pragma once

#include "allocation/allocator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "optimizer/joint_optimizer.hpp"
#include "optimizer/report.hpp"
#include "partition/partitioner.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace cut_shoot {

enum class RunStage : uint8_t {
    Configured,
    Built,
    Solved,
    Reported
};

[[nodiscard]] constexpr std::string_view to_string(RunStage stage) noexcept {
    switch (stage) {
        case RunStage::Configured: return "configured";
        case RunStage::Built:      return "built";
        case RunStage::Solved:     return "solved";
        case RunStage::Reported:   return "reported";
    }
    return "unknown";
}

// ── Config translation ───────────────────────
[[nodiscard]] SolveOptions solve_options(const SolverConfig& solver);
[[nodiscard]] AllocationOptions allocation_options(const Config& config, size_t cut_count);
[[nodiscard]] JointOptions joint_options(const Config& config);

class OptimizationRun {
public:
    OptimizationRun(WorkloadGraph graph,
                    std::vector<Backend> backends,
                    Config config,
                    Pipeline pipeline = Pipeline::Staged,
                    Logger& logger = null_logger());

    // Built models point into the run's own graph.
    OptimizationRun(const OptimizationRun&) = delete;
    OptimizationRun& operator=(const OptimizationRun&) = delete;

    /**
     * @brief Skip the partition solve and schedule this assignment instead.
     *
     * Staged pipeline only, before build(). The assignment is evaluated
     * and checked against the capacity during build().
     */
    Result<void> fix_partition(std::vector<PartitionId> assignment);

    Result<void> build();
    Result<void> solve();
    Result<OptimizationReport> report();

    /// build(), solve() and report() in sequence.
    Result<OptimizationReport> execute();

    [[nodiscard]] RunStage stage() const noexcept { return stage_; }
    [[nodiscard]] Pipeline pipeline() const noexcept { return pipeline_; }

private:
    Result<void> expect(RunStage expected, std::string_view action) const;
    Result<void> solve_staged();
    Result<void> solve_joint();

    WorkloadGraph graph_;
    std::vector<Backend> backends_;
    Config config_;
    Pipeline pipeline_;
    Logger& logger_;
    RunStage stage_{RunStage::Configured};

    std::optional<std::vector<PartitionId>> fixed_assignment_;
    std::optional<PartitionProblem> partition_problem_;
    std::optional<PartitionResult> partition_;
    std::optional<AllocationResult> allocation_;
    std::optional<JointResult> joint_;
    WallClock::time_point started_{};
    Seconds solve_time_{0.0};
};

}  // namespace cut_shoot
