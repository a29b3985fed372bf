/**
 * @file partition.cpp
 * @brief Partition model construction and assignment evaluation.
 */

#include "partition/partition.hpp"

#include <string>

namespace cut_shoot {

namespace {

std::string suffix(size_t i, size_t c) {
    return "_" + std::to_string(i) + "_" + std::to_string(c);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// PartitionResult
// ─────────────────────────────────────────────

uint32_t PartitionResult::used_partitions() const noexcept {
    uint32_t used = 0;
    for (const auto& members : vertices) {
        if (!members.empty()) ++used;
    }
    return used;
}

std::vector<PartitionDemand> PartitionResult::demands(ShotCount shots_per_partition) const {
    std::vector<PartitionDemand> out;
    for (size_t c = 0; c < vertices.size(); ++c) {
        if (vertices[c].empty()) continue;
        out.push_back({shots_per_partition, aggregates[c].d});
    }
    return out;
}

// ─────────────────────────────────────────────
// Assignment evaluation
// ─────────────────────────────────────────────

Result<PartitionResult> evaluate_assignment(const WorkloadGraph& graph,
                                            const std::vector<PartitionId>& assignment,
                                            uint32_t num_partitions) {
    if (num_partitions < 1) {
        return invalid_input("Partition count must be >= 1");
    }
    if (assignment.size() != graph.vertex_count()) {
        return invalid_input("Assignment covers " + std::to_string(assignment.size())
                             + " vertices, graph has " + std::to_string(graph.vertex_count()));
    }

    PartitionResult result;
    result.assignment = assignment;
    result.num_partitions = num_partitions;
    result.aggregates.resize(num_partitions);
    result.vertices.resize(num_partitions);
    result.cut_in.resize(num_partitions);
    result.cut_out.resize(num_partitions);

    for (VertexId v = 0; v < assignment.size(); ++v) {
        auto c = assignment[v];
        if (c >= num_partitions) {
            return invalid_input("Vertex " + std::to_string(v) + " assigned to partition "
                                 + std::to_string(c) + " of " + std::to_string(num_partitions));
        }
        result.vertices[c].push_back(v);
        result.aggregates[c].a += graph.weight(v);
    }

    const auto& edges = graph.edges();
    for (EdgeIndex e = 0; e < edges.size(); ++e) {
        auto cs = assignment[edges[e].source];
        auto ct = assignment[edges[e].target];
        if (cs == ct) continue;

        // Recorded once for each side, source partition first.
        result.cut_edges.push_back({e, cs});
        result.cut_edges.push_back({e, ct});
        ++result.aggregates[cs].o;
        ++result.aggregates[ct].p;
        result.cut_out[cs].push_back(edges[e].source);
        result.cut_in[ct].push_back(edges[e].target);
    }
    result.cut_count = result.cut_edges.size() / 2;

    for (auto& agg : result.aggregates) {
        agg.f = agg.a + agg.p - agg.o;
        agg.d = agg.a + agg.p;
    }
    result.objective = static_cast<double>(result.cut_count);
    return result;
}

// ─────────────────────────────────────────────
// Partition model
// ─────────────────────────────────────────────

LinearExpr PartitionVariables::cut_count_expr() const {
    LinearExpr expr;
    for (const auto& per_edge : x) {
        for (auto col : per_edge) expr.push_back({col, 0.5});
    }
    return expr;
}

PartitionVariables add_partition_model(MilpModel& model,
                                       const WorkloadGraph& graph,
                                       int64_t capacity,
                                       uint32_t num_partitions) {
    const size_t n = graph.vertex_count();
    const size_t m = graph.edge_count();
    const uint32_t C = num_partitions;
    const auto total = static_cast<double>(graph.total_weight());
    const auto edge_bound = static_cast<double>(m);

    PartitionVariables vars;
    vars.num_partitions = C;
    vars.y.assign(n, std::vector<ColumnId>(C));
    vars.x.assign(m, std::vector<ColumnId>(C));
    vars.zp.assign(m, std::vector<ColumnId>(C));
    vars.zo.assign(m, std::vector<ColumnId>(C));

    for (size_t v = 0; v < n; ++v) {
        for (uint32_t c = 0; c < C; ++c) {
            vars.y[v][c] = model.add_binary("y" + suffix(v, c));
        }
    }
    for (size_t e = 0; e < m; ++e) {
        for (uint32_t c = 0; c < C; ++c) {
            vars.x[e][c] = model.add_binary("x" + suffix(e, c));
            vars.zp[e][c] = model.add_binary("zp" + suffix(e, c));
            vars.zo[e][c] = model.add_binary("zo" + suffix(e, c));
        }
    }
    for (uint32_t c = 0; c < C; ++c) {
        auto tag = "_" + std::to_string(c);
        vars.a.push_back(model.add_integer("a" + tag, 0.0, total));
        vars.p.push_back(model.add_integer("p" + tag, 0.0, edge_bound));
        vars.o.push_back(model.add_integer("o" + tag, 0.0, edge_bound));
        vars.f.push_back(model.add_integer("f" + tag, -edge_bound, total + edge_bound));
        vars.d.push_back(model.add_integer("d" + tag, 0.0, total + edge_bound));
    }

    // Each vertex in exactly one partition
    for (size_t v = 0; v < n; ++v) {
        LinearExpr row;
        for (uint32_t c = 0; c < C; ++c) row.push_back({vars.y[v][c], 1.0});
        model.add_eq("assign_" + std::to_string(v), row, 1.0);
    }

    // x[e,c] = y[s,c] XOR y[t,c]
    const auto& edges = graph.edges();
    for (size_t e = 0; e < m; ++e) {
        for (uint32_t c = 0; c < C; ++c) {
            auto x = vars.x[e][c];
            auto ys = vars.y[edges[e].source][c];
            auto yt = vars.y[edges[e].target][c];
            auto tag = suffix(e, c);
            model.add_le("cut_or" + tag, {{x, 1.0}, {ys, -1.0}, {yt, -1.0}}, 0.0);
            model.add_ge("cut_st" + tag, {{x, 1.0}, {ys, -1.0}, {yt, 1.0}}, 0.0);
            model.add_ge("cut_ts" + tag, {{x, 1.0}, {yt, -1.0}, {ys, 1.0}}, 0.0);
            model.add_le("cut_nand" + tag, {{x, 1.0}, {ys, 1.0}, {yt, 1.0}}, 2.0);

            model.add_and_linearization("zp" + tag, vars.zp[e][c], x, yt);
            model.add_and_linearization("zo" + tag, vars.zo[e][c], x, ys);
        }
    }

    // Aggregates
    for (uint32_t c = 0; c < C; ++c) {
        auto tag = "_" + std::to_string(c);

        LinearExpr a_row{{vars.a[c], -1.0}};
        for (size_t v = 0; v < n; ++v) {
            auto w = static_cast<double>(graph.weight(static_cast<VertexId>(v)));
            if (w != 0.0) a_row.push_back({vars.y[v][c], w});
        }
        model.add_eq("agg_a" + tag, a_row, 0.0);

        LinearExpr p_row{{vars.p[c], -1.0}};
        LinearExpr o_row{{vars.o[c], -1.0}};
        for (size_t e = 0; e < m; ++e) {
            p_row.push_back({vars.zp[e][c], 1.0});
            o_row.push_back({vars.zo[e][c], 1.0});
        }
        model.add_eq("agg_p" + tag, p_row, 0.0);
        model.add_eq("agg_o" + tag, o_row, 0.0);

        model.add_eq("agg_f" + tag,
                     {{vars.f[c], 1.0}, {vars.a[c], -1.0}, {vars.p[c], -1.0}, {vars.o[c], 1.0}}, 0.0);
        model.add_eq("agg_d" + tag, {{vars.d[c], 1.0}, {vars.a[c], -1.0}, {vars.p[c], -1.0}}, 0.0);
        model.add_le("capacity" + tag, {{vars.d[c], 1.0}}, static_cast<double>(capacity));
    }

    // Symmetry breaking: vertex k may open partition c only after some
    // earlier vertex sits in c-1. Vertex k never lands above partition k.
    for (size_t k = 0; k < n; ++k) {
        for (uint32_t c = 1; c < C; ++c) {
            if (c > k) {
                model.set_upper_bound(vars.y[k][c], 0.0);
                continue;
            }
            LinearExpr row{{vars.y[k][c], 1.0}};
            for (size_t v = 0; v < k; ++v) row.push_back({vars.y[v][c - 1], -1.0});
            model.add_le("symmetry" + suffix(k, c), row, 0.0);
        }
    }

    return vars;
}

Result<PartitionResult> read_partition(const WorkloadGraph& graph,
                                       const PartitionVariables& vars,
                                       const MilpSolution& solution) {
    std::vector<PartitionId> assignment(graph.vertex_count(), 0);
    for (size_t v = 0; v < vars.y.size(); ++v) {
        bool placed = false;
        for (uint32_t c = 0; c < vars.num_partitions; ++c) {
            if (solution.is_one(vars.y[v][c])) {
                assignment[v] = c;
                placed = true;
                break;
            }
        }
        if (!placed) {
            return solver_failure("Solution leaves vertex " + std::to_string(v) + " unassigned");
        }
    }

    auto result = evaluate_assignment(graph, assignment, vars.num_partitions);
    if (!result) return result.error();
    result->status = solution.status;
    return result;
}

}  // namespace cut_shoot
