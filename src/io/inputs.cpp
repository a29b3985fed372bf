/**
 * @file inputs.cpp
 * @brief TOML input loading using toml++.
 */

#include "io/inputs.hpp"

#include <optional>
#include <string>
#include <toml++/toml.hpp>

namespace cut_shoot {

namespace {

Result<WorkloadGraph> workload_from_table(const toml::table& tbl) {
    const auto* weights = tbl["weights"].as_array();
    if (!weights) {
        return invalid_input("Workload file needs a 'weights' array");
    }

    std::vector<int64_t> vertex_weights;
    vertex_weights.reserve(weights->size());
    for (const auto& node : *weights) {
        auto w = node.value<int64_t>();
        if (!w) {
            return invalid_input("Workload weights must be integers");
        }
        vertex_weights.push_back(*w);
    }

    std::vector<std::pair<int64_t, int64_t>> edges;
    if (const auto* edge_list = tbl["edges"].as_array()) {
        for (const auto& node : *edge_list) {
            const auto* pair = node.as_array();
            if (!pair || pair->size() != 2) {
                return invalid_input("Workload edges must be [source, target] pairs");
            }
            auto s = (*pair)[0].value<int64_t>();
            auto t = (*pair)[1].value<int64_t>();
            if (!s || !t) {
                return invalid_input("Workload edge endpoints must be integers");
            }
            edges.emplace_back(*s, *t);
        }
    }

    return WorkloadGraph::from_lists(vertex_weights, edges);
}

Result<std::vector<Backend>> backends_from_table(const toml::table& tbl) {
    const auto* entries = tbl["backend"].as_array();
    if (!entries) {
        return invalid_input("Backend file needs a [[backend]] array");
    }

    std::vector<Backend> backends;
    for (const auto& node : *entries) {
        const auto* entry = node.as_table();
        if (!entry) {
            return invalid_input("[[backend]] entries must be tables");
        }
        auto id = (*entry)["id"].value<std::string>();
        auto execution = (*entry)["execution_time"].value<double>();
        auto queue = (*entry)["queue_time"].value<double>();
        auto capacity = (*entry)["capacity"].value<int64_t>();
        if (!id || !execution || !queue || !capacity) {
            return invalid_input("Backend entries need id, execution_time, queue_time and capacity");
        }

        backends.emplace_back(*id, *execution, *queue, *capacity,
                              (*entry)["price_per_shot"].value<double>(),
                              (*entry)["reliability"].value<double>(),
                              (*entry)["region"].value<std::string>());
    }

    if (auto valid = validate_backends(backends); !valid) {
        return valid.error();
    }
    return backends;
}

}  // anonymous namespace

Result<WorkloadGraph> load_workload(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return invalid_input("Workload file not found: " + path.string());
    }
    try {
        return workload_from_table(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        return invalid_input(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<WorkloadGraph> parse_workload(std::string_view toml_text) {
    try {
        return workload_from_table(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        return invalid_input(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<std::vector<Backend>> load_backends(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return invalid_input("Backend file not found: " + path.string());
    }
    try {
        return backends_from_table(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        return invalid_input(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<std::vector<Backend>> parse_backends(std::string_view toml_text) {
    try {
        return backends_from_table(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        return invalid_input(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

}  // namespace cut_shoot
