/**
 * @file dag.cpp
 * @brief WorkloadGraph implementation.
 *
 * Kahn's algorithm for topological ordering, iterative DFS for cycle
 * detection; both O(V+E) over dense adjacency lists.
 */

#include "workload/dag.hpp"

#include <algorithm>
#include <queue>
#include <stack>

namespace cut_shoot {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<WorkloadGraph> WorkloadGraph::from_lists(
    const std::vector<int64_t>& weights,
    const std::vector<std::pair<int64_t, int64_t>>& edges) {

    WorkloadGraph graph;
    for (auto w : weights) {
        graph.add_vertex(w);
    }
    const auto n = static_cast<int64_t>(weights.size());
    for (const auto& [s, t] : edges) {
        if (s < 0 || t < 0 || s >= n || t >= n) {
            return invalid_input("Edge (" + std::to_string(s) + ", " + std::to_string(t)
                                 + ") references a vertex outside 0.." + std::to_string(n - 1));
        }
        graph.add_edge(static_cast<VertexId>(s), static_cast<VertexId>(t));
    }
    if (auto valid = graph.validate(); !valid) {
        return valid.error();
    }
    return graph;
}

VertexId WorkloadGraph::add_vertex(int64_t weight, std::string label) {
    auto id = static_cast<VertexId>(weights_.size());
    weights_.push_back(weight);
    labels_.push_back(label.empty() ? "v" + std::to_string(id) : std::move(label));
    successors_.emplace_back();
    predecessors_.emplace_back();
    return id;
}

bool WorkloadGraph::add_edge(VertexId source, VertexId target) {
    if (source >= weights_.size() || target >= weights_.size()) {
        invalid_edges_.push_back({source, target});
        return false;
    }
    auto& succ = successors_[source];
    if (std::find(succ.begin(), succ.end(), target) != succ.end()) {
        return false;
    }
    succ.push_back(target);
    predecessors_[target].push_back(source);
    edges_.push_back({source, target});
    return true;
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<VertexId> WorkloadGraph::topological_order() const {
    std::vector<size_t> in_degree(weights_.size(), 0);
    for (const auto& e : edges_) {
        ++in_degree[e.target];
    }

    std::queue<VertexId> zero_in;
    for (VertexId v = 0; v < in_degree.size(); ++v) {
        if (in_degree[v] == 0) zero_in.push(v);
    }

    std::vector<VertexId> order;
    order.reserve(weights_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        for (auto next : successors_[current]) {
            if (--in_degree[next] == 0) {
                zero_in.push(next);
            }
        }
    }

    return order;
}

bool WorkloadGraph::has_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::vector<Color> color(weights_.size(), Color::White);

    for (VertexId start = 0; start < weights_.size(); ++start) {
        if (color[start] != Color::White) continue;

        struct Frame {
            VertexId node;
            size_t neighbor_idx;
        };

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();
            const auto& succ = successors_[node];

            if (idx >= succ.size()) {
                color[node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            auto neighbor = succ[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                return true;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push({neighbor, 0});
            }
        }
    }

    return false;
}

Result<void> WorkloadGraph::validate() const {
    if (weights_.empty()) {
        return invalid_input("Workload graph has no vertices");
    }
    for (VertexId v = 0; v < weights_.size(); ++v) {
        if (weights_[v] < 0) {
            return invalid_input("Vertex " + std::to_string(v) + " has negative weight "
                                 + std::to_string(weights_[v]));
        }
    }
    if (!invalid_edges_.empty()) {
        const auto& e = invalid_edges_.front();
        return invalid_input("Edge (" + std::to_string(e.source) + ", " + std::to_string(e.target)
                             + ") references an unknown vertex");
    }
    for (const auto& e : edges_) {
        if (e.source == e.target) {
            return invalid_input("Self loop on vertex " + std::to_string(e.source));
        }
    }
    if (has_cycle()) {
        return invalid_input("Workload graph contains a cycle");
    }
    return {};
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

int64_t WorkloadGraph::max_weight() const noexcept {
    int64_t best = 0;
    for (auto w : weights_) best = std::max(best, w);
    return best;
}

int64_t WorkloadGraph::total_weight() const noexcept {
    int64_t total = 0;
    for (auto w : weights_) total += w;
    return total;
}

size_t WorkloadGraph::depth() const {
    auto topo = topological_order();
    if (topo.size() != weights_.size()) return 0;

    // level[v] = longest path (in vertices) ending at v
    std::vector<size_t> level(weights_.size(), 1);
    size_t deepest = 0;
    for (auto u : topo) {
        deepest = std::max(deepest, level[u]);
        for (auto v : successors_[u]) {
            level[v] = std::max(level[v], level[u] + 1);
        }
    }
    return deepest;
}

}  // namespace cut_shoot
