/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <limits>
#include <toml++/toml.hpp>

namespace cut_shoot {

namespace {

Result<uint32_t> to_count(int64_t value, std::string_view key, int64_t min) {
    constexpr int64_t max = std::numeric_limits<uint32_t>::max();
    if (value < min || value > max) {
        return invalid_input(std::string{key} + " must lie in [" + std::to_string(min) + ", "
                             + std::to_string(max) + "], got " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

bool non_negative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

Result<Config> config_from_table(const toml::table& tbl) {
    Config config;

    // [partition]
    if (auto partition = tbl["partition"]; partition.is_table()) {
        config.partition.max_qubits_per_subcircuit =
            partition["max_qubits_per_subcircuit"].value_or(int64_t{4});
        auto count = to_count(partition["num_subcircuits"].value_or(int64_t{2}),
                              "partition.num_subcircuits", 1);
        if (!count) return count.error();
        config.partition.num_subcircuits = *count;
    }

    // [allocation]
    if (auto allocation = tbl["allocation"]; allocation.is_table()) {
        auto mode_name = allocation["objective_mode"].value_or(std::string{"joint_nonuniform"});
        auto mode = parse_objective_mode(mode_name);
        if (!mode) {
            return invalid_input("Unknown allocation.objective_mode: " + mode_name);
        }
        config.allocation.objective_mode = *mode;
        config.allocation.uniform_split = allocation["uniform_split"].value_or(true);
        config.allocation.shots_per_subcircuit =
            allocation["shots_per_subcircuit"].value_or(int64_t{1024});
        config.allocation.postprocessing_time =
            allocation["postprocessing_time"].value_or(0.0);
        config.allocation.postprocessing_time_per_cut =
            allocation["postprocessing_time_per_cut"].value_or(0.0);

        // [allocation.qos]
        if (auto qos = allocation["qos"]; qos.is_table()) {
            config.allocation.qos.price_weight = qos["price_weight"].value_or(0.0);
            config.allocation.qos.reliability_weight = qos["reliability_weight"].value_or(0.0);
        }

        // [[allocation.predicate]]
        if (auto* rules = allocation["predicate"].as_array()) {
            for (const auto& node : *rules) {
                const auto* rule_tbl = node.as_table();
                if (!rule_tbl) {
                    return invalid_input("allocation.predicate entries must be tables");
                }
                auto kind_name = (*rule_tbl)["kind"].value_or(std::string{});
                auto kind = parse_predicate_kind(kind_name);
                if (!kind) {
                    return invalid_input("Unknown predicate kind: " + kind_name);
                }
                PredicateRule rule;
                rule.kind = *kind;
                rule.threshold = (*rule_tbl)["threshold"].value_or(0.0);
                if (const auto* values = (*rule_tbl)["values"].as_array()) {
                    for (const auto& v : *values) {
                        const auto* s = v.as_string();
                        if (!s) {
                            return invalid_input("Predicate " + kind_name + " values must be strings");
                        }
                        rule.values.push_back(s->get());
                    }
                }
                config.allocation.predicates.push_back(std::move(rule));
            }
        }
    }

    // [objective]
    if (auto objective = tbl["objective"]; objective.is_table()) {
        config.objective.cut_weight = objective["cut_weight"].value_or(1.0);
        config.objective.latency_weight = objective["latency_weight"].value_or(1.0);
        config.objective.postprocessing_weight = objective["postprocessing_weight"].value_or(1.0);
        config.objective.alpha = objective["alpha"].value_or(0.5);
        config.objective.beta = objective["beta"].value_or(0.5);
    }

    // [solver]
    if (auto solver = tbl["solver"]; solver.is_table()) {
        config.solver.time_limit_seconds = solver["time_limit_seconds"].value_or(0.0);
        config.solver.random_seed = static_cast<int>(solver["random_seed"].value_or(int64_t{42}));
        config.solver.log_solver_output = solver["log_solver_output"].value_or(false);
    }

    // [sweep]
    if (auto sweep = tbl["sweep"]; sweep.is_table()) {
        if (const auto* counts = sweep["candidate_counts"].as_array()) {
            for (const auto& v : *counts) {
                auto value = v.value<int64_t>();
                if (!value) {
                    return invalid_input("sweep.candidate_counts must hold integers");
                }
                auto count = to_count(*value, "sweep.candidate_counts", 1);
                if (!count) return count.error();
                config.sweep.candidate_counts.push_back(*count);
            }
        }
        auto threads = to_count(sweep["threads"].value_or(int64_t{0}), "sweep.threads", 0);
        if (!threads) return threads.error();
        config.sweep.threads = *threads;
        config.sweep.cost_model = sweep["cost_model"].value_or(std::string{"exponential"});
        config.sweep.cost_base = sweep["cost_base"].value_or(4.0);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
        auto size_mb = to_count(telemetry["max_file_size_mb"].value_or(int64_t{50}),
                                "telemetry.max_file_size_mb", 0);
        if (!size_mb) return size_mb.error();
        config.telemetry.max_file_size_mb = *size_mb;
        auto rotate = to_count(telemetry["rotate_count"].value_or(int64_t{5}), "telemetry.rotate_count", 0);
        if (!rotate) return rotate.error();
        config.telemetry.rotate_count = *rotate;
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return invalid_input("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return config_from_table(tbl);
    } catch (const toml::parse_error& err) {
        return invalid_input(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return config_from_table(tbl);
    } catch (const toml::parse_error& err) {
        return invalid_input(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<void> validate_config(const Config& config) {
    if (config.partition.max_qubits_per_subcircuit < 0) {
        return invalid_input("partition.max_qubits_per_subcircuit must be >= 0");
    }
    if (config.partition.num_subcircuits < 1) {
        return invalid_input("partition.num_subcircuits must be >= 1");
    }
    if (config.allocation.shots_per_subcircuit <= 0) {
        return invalid_input("allocation.shots_per_subcircuit must be > 0");
    }
    if (!non_negative(config.allocation.postprocessing_time) ||
        !non_negative(config.allocation.postprocessing_time_per_cut)) {
        return invalid_input("post-processing estimates must be >= 0");
    }
    if (!non_negative(config.allocation.qos.price_weight) ||
        !non_negative(config.allocation.qos.reliability_weight)) {
        return invalid_input("QoS weights must be finite and >= 0");
    }
    for (const auto& rule : config.allocation.predicates) {
        bool list_rule = rule.kind == PredicateKind::AllowedRegions ||
                         rule.kind == PredicateKind::ExcludeIds;
        if (list_rule && rule.values.empty()) {
            return invalid_input(std::string{"Predicate "} + std::string{to_string(rule.kind)}
                                 + " requires a non-empty values list");
        }
    }
    const auto& obj = config.objective;
    if (!non_negative(obj.cut_weight) || !non_negative(obj.latency_weight) ||
        !non_negative(obj.postprocessing_weight)) {
        return invalid_input("objective term weights must be finite and >= 0");
    }
    if (!non_negative(obj.alpha) || !non_negative(obj.beta)) {
        return invalid_input("objective.alpha and objective.beta must be >= 0");
    }
    if (std::abs(obj.alpha + obj.beta - 1.0) > 1e-9) {
        return invalid_input("objective.alpha + objective.beta must equal 1");
    }
    if (!non_negative(config.solver.time_limit_seconds)) {
        return invalid_input("solver.time_limit_seconds must be >= 0");
    }
    if (config.sweep.cost_model != "exponential" && config.sweep.cost_model != "kronecker") {
        return invalid_input("Unknown sweep.cost_model: " + config.sweep.cost_model);
    }
    if (!(config.sweep.cost_base >= 1.0 && std::isfinite(config.sweep.cost_base))) {
        return invalid_input("sweep.cost_base must be >= 1");
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return invalid_input("Unknown telemetry.log_level: " + config.telemetry.log_level);
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace cut_shoot
