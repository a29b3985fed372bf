/**
 * @file main.cpp
 * @brief cut_shoot command-line entry point.
 *
 * Wires the modules into one optimization:
 *   Config → Logger → Inputs → (Sweep) → OptimizationRun → Report → RunRecorder
 */

#include "allocation/backend.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "io/inputs.hpp"
#include "optimizer/report.hpp"
#include "optimizer/run.hpp"
#include "optimizer/sweep.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/run_recorder.hpp"
#include "workload/dag.hpp"
#include "workload/generator.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace cut_shoot;

namespace {

void print_banner(std::ostream& out) {
    out << R"(
  ╔═══════════════════════════════════════════╗
  ║            cut_shoot v1.0.0               ║
  ║   Circuit Cutting & Shot Allocation       ║
  ║   over Heterogeneous Backends             ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> graph_path;
    std::optional<std::filesystem::path> backends_path;
    std::optional<std::filesystem::path> output_path;
    std::optional<std::string> mode;
    bool joint = false;
    bool sweep = false;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--graph" && i + 1 < argc) {
            args.graph_path = argv[++i];
        } else if (arg == "--backends" && i + 1 < argc) {
            args.backends_path = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--joint") {
            args.joint = true;
        } else if (arg == "--sweep") {
            args.sweep = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: cut_shoot [OPTIONS]\n"
                      << "  --config <path>     Configuration file (TOML)\n"
                      << "  --graph <path>      Workload graph file (TOML)\n"
                      << "  --backends <path>   Backend descriptions (TOML)\n"
                      << "  --mode <name>       single_select | joint_uniform | joint_qos | joint_nonuniform\n"
                      << "  --joint             Solve partitioning and allocation in one model\n"
                      << "  --sweep             Sweep partition counts and keep the cheapest\n"
                      << "  --output <path>     Write the JSON report here instead of stdout\n"
                      << "  --demo              Optimize a built-in GHZ workload on five backends\n"
                      << "  --help, -h          Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

/// Exit status per error family.
int exit_code(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidInput:       return 1;
        case ErrorCode::Infeasible:         return 2;
        case ErrorCode::SolverLimitReached: return 3;
        case ErrorCode::SolverFailure:      return 4;
    }
    return 4;
}

std::vector<Backend> demo_backends() {
    return {
        Backend{"qpu_a", 10.0, 1.0, 5, 0.010, 0.97, "eu-west"},
        Backend{"qpu_b", 20.0, 4.0, 7, 0.004, 0.92, "us-east"},
        Backend{"qpu_c", 15.0, 3.0, 5, 0.006, 0.95, "eu-west"},
        Backend{"qpu_d", 30.0, 1.0, 9, 0.002, 0.90, "us-east"},
        Backend{"qpu_e", 10.0, 3.0, 4, 0.008, 0.99, "eu-central"},
    };
}

/**
 * @brief Sweep partition counts and pin the cheapest partition into the config.
 *
 * Returns the assignment to fix on the run.
 */
Result<std::vector<PartitionId>> select_by_sweep(const WorkloadGraph& graph, Config& config, Logger& logger) {
    auto candidates = config.sweep.candidate_counts;
    if (candidates.empty()) {
        for (uint32_t c = 1; c <= config.partition.num_subcircuits; ++c) candidates.push_back(c);
    }

    auto cost_model = make_cut_cost_model(config.sweep.cost_model, config.sweep.cost_base);
    if (!cost_model) return cost_model.error();

    ThreadPool pool(config.sweep.threads);
    PartitionSweep sweep(pool, solve_options(config.solver), logger);
    auto solutions = sweep.run(graph, config.partition.max_qubits_per_subcircuit, candidates);
    if (!solutions) return solutions.error();

    auto best = solutions->best(*cost_model);
    if (!best) return best.error();

    logger.info("sweep", "Selected " + std::to_string(best->max_partitions) + " partitions ("
                         + std::to_string(best->result->cut_count) + " cuts, cost "
                         + std::to_string(best->cost) + ")");
    config.partition.num_subcircuits = best->max_partitions;
    return best->result->assignment;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Without --output the report owns stdout; everything else goes to stderr.
    std::ostream& console = args.output_path ? std::cout : std::cerr;
    print_banner(console);

    // Load configuration
    Config config = default_config();
    if (args.config_path) {
        auto config_result = load_config(*args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return exit_code(config_result.error());
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (args.mode) {
        auto mode = parse_objective_mode(*args.mode);
        if (!mode) {
            std::cerr << "Unknown objective mode: " << *args.mode << std::endl;
            return 1;
        }
        config.allocation.objective_mode = *mode;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "cut_shoot",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StreamSink>(console);
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    RunRecorder recorder(logger);
    logger.info("main", "cut_shoot starting...");
    logger.info("main", "Objective mode: " + std::string(to_string(config.allocation.objective_mode)));

    // ── Inputs ───────────────────────────────
    WorkloadGraph graph;
    std::vector<Backend> backends;
    if (args.demo_mode) {
        graph = WorkloadGenerator::ghz(4);
        backends = demo_backends();
        // The CNOT ladder needs three partitions of four qubits.
        config.partition.num_subcircuits = std::max(config.partition.num_subcircuits, 3u);
        logger.info("main", "Demo workload: GHZ on 4 qubits, " + std::to_string(graph.vertex_count())
                            + " gates, 5 backends");
    } else {
        if (!args.graph_path || !args.backends_path) {
            std::cerr << "--graph and --backends are required (or use --demo)" << std::endl;
            return 1;
        }
        auto loaded_graph = load_workload(*args.graph_path);
        if (!loaded_graph) {
            logger.error("main", loaded_graph.error().message);
            return exit_code(loaded_graph.error());
        }
        auto loaded_backends = load_backends(*args.backends_path);
        if (!loaded_backends) {
            logger.error("main", loaded_backends.error().message);
            return exit_code(loaded_backends.error());
        }
        graph = std::move(*loaded_graph);
        backends = std::move(*loaded_backends);
    }
    logger.info("main", "Workload: " + std::to_string(graph.vertex_count()) + " vertices, "
                        + std::to_string(graph.edge_count()) + " edges, depth "
                        + std::to_string(graph.depth()));

    // ── Optional sweep ───────────────────────
    const auto pipeline = args.joint ? Pipeline::Joint : Pipeline::Staged;
    std::optional<std::vector<PartitionId>> fixed;
    if (args.sweep && pipeline == Pipeline::Staged) {
        auto selected = select_by_sweep(graph, config, logger);
        if (!selected) {
            logger.error("main", selected.error().message);
            recorder.record_failure(pipeline, selected.error());
            logger.flush();
            return exit_code(selected.error());
        }
        fixed = std::move(*selected);
    } else if (args.sweep) {
        logger.warn("main", "--sweep is ignored by the joint pipeline");
    }

    // ── Optimize ─────────────────────────────
    OptimizationRun run(std::move(graph), std::move(backends), config, pipeline, logger);
    if (fixed) {
        if (auto ok = run.fix_partition(std::move(*fixed)); !ok) {
            logger.error("main", ok.error().message);
            return exit_code(ok.error());
        }
    }

    auto report = run.execute();
    if (!report) {
        const auto& error = report.error();
        logger.error("main", std::string(to_string(error.code)) + ": " + error.message
                             + (error.likely_cause.empty() ? "" : " (likely cause: " + error.likely_cause + ")"));
        recorder.record_failure(pipeline, error);
        logger.flush();
        return exit_code(error);
    }
    recorder.record(*report);

    auto json = report->to_json();
    if (args.output_path) {
        std::ofstream out(*args.output_path);
        if (!out) {
            logger.error("main", "Cannot write report to " + args.output_path->string());
            return 1;
        }
        out << json;
        logger.info("main", "Report written to " + args.output_path->string());
    } else {
        std::cout << json;
    }

    logger.flush();
    return 0;
}
