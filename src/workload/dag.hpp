/**
 * @file dag.hpp
 * @brief Workload graph: the circuit DAG handed to the partitioner.
 *
 * Vertices are atomic work units (gates) addressed by dense index 0..n-1,
 * each weighted by the resource units (qubits) it touches. Edges are data
 * dependencies, kept in insertion order so that edge indices are stable
 * decision-variable keys. Provides validation, topological ordering, cycle
 * detection and weight metrics.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cut_shoot {

/**
 * @brief A dependency edge between two vertices.
 */
struct Edge {
    VertexId source{0};
    VertexId target{0};

    auto operator<=>(const Edge&) const = default;
};

/**
 * @brief Directed acyclic graph of weighted work units.
 */
class WorkloadGraph {
public:
    WorkloadGraph() = default;

    /// Build from parallel weight / edge lists, as produced by graph extraction.
    static Result<WorkloadGraph> from_lists(const std::vector<int64_t>& weights,
                                            const std::vector<std::pair<int64_t, int64_t>>& edges);

    // ── Construction ──────────────────────────
    VertexId add_vertex(int64_t weight, std::string label = {});

    /// Adds source -> target. Duplicate edges are ignored; returns false then.
    bool add_edge(VertexId source, VertexId target);

    // ── Queries ───────────────────────────────
    [[nodiscard]] size_t vertex_count() const noexcept { return weights_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
    [[nodiscard]] int64_t weight(VertexId v) const { return weights_.at(v); }
    [[nodiscard]] const std::string& label(VertexId v) const { return labels_.at(v); }
    [[nodiscard]] const std::vector<int64_t>& weights() const noexcept { return weights_; }
    [[nodiscard]] const std::vector<Edge>& edges() const noexcept { return edges_; }
    [[nodiscard]] const Edge& edge(EdgeIndex e) const { return edges_.at(e); }
    [[nodiscard]] const std::vector<VertexId>& successors(VertexId v) const { return successors_.at(v); }
    [[nodiscard]] const std::vector<VertexId>& predecessors(VertexId v) const { return predecessors_.at(v); }

    [[nodiscard]] std::vector<VertexId> topological_order() const;
    [[nodiscard]] bool has_cycle() const;

    /**
     * @brief Full validation: non-empty, weights >= 0, endpoints in range,
     *        no self loops, acyclic. Returns InvalidInput on failure.
     */
    [[nodiscard]] Result<void> validate() const;

    // ── Metrics ───────────────────────────────
    [[nodiscard]] int64_t max_weight() const noexcept;
    [[nodiscard]] int64_t total_weight() const noexcept;
    [[nodiscard]] size_t depth() const;

private:
    std::vector<int64_t> weights_;
    std::vector<std::string> labels_;
    std::vector<Edge> edges_;
    std::vector<std::vector<VertexId>> successors_;     // forward edges
    std::vector<std::vector<VertexId>> predecessors_;   // backward edges
    std::vector<Edge> invalid_edges_;                   // out-of-range, reported by validate()
};

}  // namespace cut_shoot
