/**
 * @file generator.hpp
 * @brief Synthetic workload graphs for testing, demos and benchmarking.
 */

#pragma once

#include "workload/dag.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace cut_shoot {

/**
 * @brief A gate acting on a list of wires (qubits).
 */
struct GateSpec {
    std::string name;
    std::vector<uint32_t> wires;
};

/**
 * @brief Factory for workload graphs with various topologies.
 */
class WorkloadGenerator {
public:
    /// Path: v0 → v1 → ... → v(n-1), every vertex with the same weight.
    static WorkloadGraph path(size_t num_vertices, int64_t weight = 1);

    /// Fan-out / fan-in: src → {b0..b(width-1)} → sink.
    static WorkloadGraph fan_out_fan_in(size_t width, int64_t weight = 1);

    /**
     * @brief Gate-level circuit DAG.
     *
     * One vertex per gate weighted by its wire count; an edge joins each gate
     * to the previous gate on every wire it shares, which is how a circuit
     * DAG exposes its data dependencies.
     */
    static WorkloadGraph from_gates(uint32_t num_wires, const std::vector<GateSpec>& gates);

    /// GHZ preparation: H on wire 0 then a CNOT ladder.
    static WorkloadGraph ghz(uint32_t num_wires);

    /// Random circuit of `num_gates` one- and two-wire gates.
    static WorkloadGraph random_circuit(uint32_t num_wires,
                                        size_t num_gates,
                                        double two_wire_probability,
                                        std::mt19937& rng);
};

}  // namespace cut_shoot
