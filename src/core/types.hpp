/**
 * @file types.hpp
 * @brief Fundamental vocabulary types shared across the optimizer.
 *
 * Index types are plain integers so that every per-run registry of decision
 * variables can be a dense array addressed by vertex, partition or backend.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cut_shoot {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using VertexId = uint32_t;
using EdgeIndex = uint32_t;
using PartitionId = uint32_t;
using BackendIndex = uint32_t;
using BackendId = std::string;
using ShotCount = int64_t;
using WallClock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<double>;

// ─────────────────────────────────────────────
// Objective Modes
// ─────────────────────────────────────────────

/**
 * @brief Backend selection / shot allocation objective.
 */
enum class ObjectiveMode : uint8_t {
    SingleSelect,     ///< One backend per partition, minimize queue + execution
    JointUniform,     ///< Any non-empty subset, shots split evenly
    JointQos,         ///< JointUniform plus price / reliability penalty
    JointNonUniform   ///< JointQos with the shot split itself optimized
};

[[nodiscard]] constexpr std::string_view to_string(ObjectiveMode mode) noexcept {
    switch (mode) {
        case ObjectiveMode::SingleSelect:    return "single_select";
        case ObjectiveMode::JointUniform:    return "joint_uniform";
        case ObjectiveMode::JointQos:        return "joint_qos";
        case ObjectiveMode::JointNonUniform: return "joint_nonuniform";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ObjectiveMode> parse_objective_mode(std::string_view s) noexcept {
    if (s == "single_select")    return ObjectiveMode::SingleSelect;
    if (s == "joint_uniform")    return ObjectiveMode::JointUniform;
    if (s == "joint_qos")        return ObjectiveMode::JointQos;
    if (s == "joint_nonuniform") return ObjectiveMode::JointNonUniform;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Solve Status
// ─────────────────────────────────────────────

/**
 * @brief Terminal status of a successful solve.
 *
 * Failed solves never produce a status; they produce an Error instead.
 */
enum class SolveStatus : uint8_t {
    Optimal,    ///< Proven optimal
    TimeLimit   ///< Best incumbent at the time limit, not proven optimal
};

[[nodiscard]] constexpr std::string_view to_string(SolveStatus status) noexcept {
    switch (status) {
        case SolveStatus::Optimal:   return "optimal";
        case SolveStatus::TimeLimit: return "time_limit";
    }
    return "unknown";
}

/**
 * @brief Shot budget and qubit requirement of one scheduling unit.
 */
struct PartitionDemand {
    ShotCount shots{0};
    int64_t qubits{0};

    auto operator<=>(const PartitionDemand&) const = default;
};

}  // namespace cut_shoot
