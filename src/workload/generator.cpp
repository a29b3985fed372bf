/**
 * @file generator.cpp
 * @brief Workload generator implementations.
 *
 * - Paths (sequential pipelines, the canonical partitioning test case)
 * - Fan-out/fan-in (parallel branches)
 * - Gate-level circuits (GHZ ladder, random circuits)
 */

#include "workload/generator.hpp"

#include <format>
#include <optional>

namespace cut_shoot {

// ─────────────────────────────────────────────
// Path: v0 → v1 → ... → v(n-1)
// ─────────────────────────────────────────────

WorkloadGraph WorkloadGenerator::path(size_t num_vertices, int64_t weight) {
    WorkloadGraph graph;
    for (size_t i = 0; i < num_vertices; ++i) {
        auto id = graph.add_vertex(weight, std::format("path_{}", i));
        if (i > 0) {
            graph.add_edge(id - 1, id);
        }
    }
    return graph;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          src
//       /   |   \   (backslash)
//     b0   b1   b2 ... b(width-1)
//       \   |   /
//          sink
// ─────────────────────────────────────────────

WorkloadGraph WorkloadGenerator::fan_out_fan_in(size_t width, int64_t weight) {
    WorkloadGraph graph;
    auto src = graph.add_vertex(weight, "fan_src");

    std::vector<VertexId> branches;
    for (size_t i = 0; i < width; ++i) {
        auto b = graph.add_vertex(weight, std::format("fan_branch_{}", i));
        graph.add_edge(src, b);
        branches.push_back(b);
    }

    auto sink = graph.add_vertex(weight, "fan_sink");
    for (auto b : branches) {
        graph.add_edge(b, sink);
    }
    return graph;
}

// ─────────────────────────────────────────────
// Gate-level circuits
// ─────────────────────────────────────────────

WorkloadGraph WorkloadGenerator::from_gates(uint32_t num_wires, const std::vector<GateSpec>& gates) {
    WorkloadGraph graph;
    std::vector<std::optional<VertexId>> last_on_wire(num_wires);

    for (size_t i = 0; i < gates.size(); ++i) {
        const auto& gate = gates[i];
        auto id = graph.add_vertex(static_cast<int64_t>(gate.wires.size()),
                                   std::format("{}_{}", gate.name, i));
        for (auto wire : gate.wires) {
            if (wire >= num_wires) continue;
            if (last_on_wire[wire]) {
                graph.add_edge(*last_on_wire[wire], id);
            }
            last_on_wire[wire] = id;
        }
    }
    return graph;
}

WorkloadGraph WorkloadGenerator::ghz(uint32_t num_wires) {
    std::vector<GateSpec> gates;
    gates.push_back({"h", {0}});
    for (uint32_t q = 0; q + 1 < num_wires; ++q) {
        gates.push_back({"cx", {q, q + 1}});
    }
    return from_gates(num_wires, gates);
}

WorkloadGraph WorkloadGenerator::random_circuit(uint32_t num_wires,
                                                size_t num_gates,
                                                double two_wire_probability,
                                                std::mt19937& rng) {
    std::uniform_int_distribution<uint32_t> wire_dist(0, num_wires > 0 ? num_wires - 1 : 0);
    std::bernoulli_distribution two_wire(num_wires > 1 ? two_wire_probability : 0.0);

    std::vector<GateSpec> gates;
    gates.reserve(num_gates);
    for (size_t i = 0; i < num_gates; ++i) {
        auto a = wire_dist(rng);
        if (two_wire(rng)) {
            auto b = wire_dist(rng);
            while (b == a) b = wire_dist(rng);
            gates.push_back({"cx", {a, b}});
        } else {
            gates.push_back({"u", {a}});
        }
    }
    return from_gates(num_wires, gates);
}

}  // namespace cut_shoot
