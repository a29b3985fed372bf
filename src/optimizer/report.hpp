/**
 * @file report.hpp
 * @brief Final result of an optimization run and its JSON rendering.
 */

#pragma once

#include "allocation/allocator.hpp"
#include "partition/partition.hpp"

#include <string>
#include <string_view>

namespace cut_shoot {

enum class Pipeline : uint8_t {
    Staged,   ///< Partition first, then allocate
    Joint     ///< One combined MILP
};

[[nodiscard]] constexpr std::string_view to_string(Pipeline pipeline) noexcept {
    switch (pipeline) {
        case Pipeline::Staged: return "staged";
        case Pipeline::Joint:  return "joint";
    }
    return "unknown";
}

struct OptimizationReport {
    Pipeline pipeline{Pipeline::Staged};
    ObjectiveMode mode{ObjectiveMode::JointNonUniform};
    PartitionResult partition;
    AllocationResult allocation;       ///< entry i belongs to used partition i
    SolveStatus status{SolveStatus::Optimal};
    double objective{0.0};
    Seconds wall_time{0.0};

    [[nodiscard]] double makespan() const noexcept { return allocation.makespan; }

    /// Pretty-printed JSON document.
    [[nodiscard]] std::string to_json() const;
};

/// TimeLimit when either stage stopped at its limit.
[[nodiscard]] constexpr SolveStatus combine(SolveStatus a, SolveStatus b) noexcept {
    return (a == SolveStatus::TimeLimit || b == SolveStatus::TimeLimit) ? SolveStatus::TimeLimit
                                                                        : SolveStatus::Optimal;
}

}  // namespace cut_shoot
