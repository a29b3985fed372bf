/**
 * @file config.hpp
 * @brief Optimizer configuration with TOML deserialization.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cut_shoot {

struct PartitionConfig {
    int64_t max_qubits_per_subcircuit = 4;
    uint32_t num_subcircuits = 2;
};

struct QosWeights {
    double price_weight = 0.0;
    double reliability_weight = 0.0;

    [[nodiscard]] bool enabled() const noexcept {
        return price_weight > 0.0 || reliability_weight > 0.0;
    }
};

/**
 * @brief Hard backend-exclusion rule kinds.
 */
enum class PredicateKind : uint8_t {
    AllowedRegions,   ///< Backend region must be one of `values`
    ExcludeIds,       ///< Backend id must not be one of `values`
    MinReliability,   ///< Backend reliability must be >= `threshold`
    MaxPrice          ///< Backend price per shot must be <= `threshold`
};

[[nodiscard]] constexpr std::string_view to_string(PredicateKind kind) noexcept {
    switch (kind) {
        case PredicateKind::AllowedRegions: return "allowed_regions";
        case PredicateKind::ExcludeIds:     return "exclude_ids";
        case PredicateKind::MinReliability: return "min_reliability";
        case PredicateKind::MaxPrice:       return "max_price";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<PredicateKind> parse_predicate_kind(std::string_view s) noexcept {
    if (s == "allowed_regions") return PredicateKind::AllowedRegions;
    if (s == "exclude_ids")     return PredicateKind::ExcludeIds;
    if (s == "min_reliability") return PredicateKind::MinReliability;
    if (s == "max_price")       return PredicateKind::MaxPrice;
    return std::nullopt;
}

struct PredicateRule {
    PredicateKind kind = PredicateKind::AllowedRegions;
    std::vector<std::string> values;
    double threshold = 0.0;
};

struct AllocationConfig {
    ObjectiveMode objective_mode = ObjectiveMode::JointNonUniform;
    bool uniform_split = true;                 ///< Only consulted by joint_qos
    ShotCount shots_per_subcircuit = 1024;
    double postprocessing_time = 0.0;          ///< Fixed reconstruction estimate
    double postprocessing_time_per_cut = 0.0;  ///< Added per cut
    QosWeights qos;
    std::vector<PredicateRule> predicates;
};

struct ObjectiveConfig {
    double cut_weight = 1.0;
    double latency_weight = 1.0;
    double postprocessing_weight = 1.0;
    double alpha = 0.5;                        ///< Joint model: cut share
    double beta = 0.5;                         ///< Joint model: makespan share
};

struct SolverConfig {
    double time_limit_seconds = 0.0;           ///< 0 = unlimited
    int random_seed = 42;
    bool log_solver_output = false;
};

struct SweepConfig {
    std::vector<uint32_t> candidate_counts;    ///< Empty = 1..num_subcircuits
    uint32_t threads = 0;                      ///< 0 = hardware_concurrency
    std::string cost_model = "exponential";    ///< "exponential", "kronecker"
    double cost_base = 4.0;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;             ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level optimizer configuration.
 */
struct Config {
    PartitionConfig partition;
    AllocationConfig allocation;
    ObjectiveConfig objective;
    SolverConfig solver;
    SweepConfig sweep;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown enumeration strings and
 * out-of-range values are reported as InvalidInput.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Check cross-field constraints (non-negative weights, alpha + beta = 1, ...).
 */
Result<void> validate_config(const Config& config);

Config default_config();

}  // namespace cut_shoot
