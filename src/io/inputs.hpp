/**
 * @file inputs.hpp
 * @brief Workload graph and backend descriptions read from TOML files.
 *
 * Graph file:
 *
 *   weights = [2, 1, 1]
 *   edges = [[0, 1], [1, 2]]
 *
 * Backend file:
 *
 *   [[backend]]
 *   id = "qpu_a"
 *   execution_time = 10.0
 *   queue_time = 1.0
 *   capacity = 5
 *   price_per_shot = 0.01    # optional
 *   reliability = 0.97       # optional
 *   region = "eu-west"       # optional
 */

#pragma once

#include "allocation/backend.hpp"
#include "core/result.hpp"
#include "workload/dag.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace cut_shoot {

Result<WorkloadGraph> load_workload(const std::filesystem::path& path);
Result<WorkloadGraph> parse_workload(std::string_view toml_text);

Result<std::vector<Backend>> load_backends(const std::filesystem::path& path);
Result<std::vector<Backend>> parse_backends(std::string_view toml_text);

}  // namespace cut_shoot
