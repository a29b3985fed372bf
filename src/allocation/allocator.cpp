/**
 * @file allocator.cpp
 * @brief ShotAllocator: selection, split and makespan epigraph.
 *
 * Model outline, per partition c and backend q:
 *
 *   single_select     Σ_q sel = 1,  share = sel
 *   uniform split     Σ_k w = 1,  Σ_q sel = Σ_k k·w,  h = sel AND w,
 *                     share = Σ_k h / k
 *   non-uniform       sel <= shots <= budget·sel,  Σ_q shots = budget,
 *                     share = shots / budget
 *
 *   use[q] >= sel[c,q]
 *   M >= queue_q·use[q] + Σ_c exec_q·share(c,q)
 *
 * Backends are shared between partitions, so M is the makespan of the
 * accumulated load and not a per-partition maximum.
 */

#include "allocation/allocator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cut_shoot {

namespace {

std::string suffix(size_t a, size_t b) {
    return "_" + std::to_string(a) + "_" + std::to_string(b);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Options & results
// ─────────────────────────────────────────────

bool AllocationOptions::uses_uniform_split() const noexcept {
    switch (mode) {
        case ObjectiveMode::SingleSelect:    return false;
        case ObjectiveMode::JointUniform:    return true;
        case ObjectiveMode::JointQos:        return uniform_split;
        case ObjectiveMode::JointNonUniform: return false;
    }
    return false;
}

bool AllocationOptions::uses_qos() const noexcept {
    return (mode == ObjectiveMode::JointQos || mode == ObjectiveMode::JointNonUniform)
           && qos.enabled() && weights.qos > 0.0;
}

ShotCount AllocationResult::shots(PartitionId partition, const BackendId& backend) const {
    for (const auto& s : partitions.at(partition)) {
        if (s.backend_id == backend) return s.shots;
    }
    return 0;
}

ShotCount AllocationResult::total_shots(PartitionId partition) const {
    ShotCount total = 0;
    for (const auto& s : partitions.at(partition)) total += s.shots;
    return total;
}

std::vector<BackendIndex> AllocationResult::used_backends() const {
    std::vector<BackendIndex> used;
    for (const auto& per_partition : partitions) {
        for (const auto& s : per_partition) used.push_back(s.backend);
    }
    std::sort(used.begin(), used.end());
    used.erase(std::unique(used.begin(), used.end()), used.end());
    return used;
}

std::vector<double> qos_penalties(const std::vector<Backend>& backends, const QosWeights& weights) {
    double max_price = 0.0;
    for (const auto& b : backends) max_price = std::max(max_price, b.effective_price());

    std::vector<double> penalties;
    penalties.reserve(backends.size());
    for (const auto& b : backends) {
        double price_term = max_price > 0.0 ? b.effective_price() / max_price : 0.0;
        penalties.push_back(weights.price_weight * price_term
                            + weights.reliability_weight * (1.0 - b.effective_reliability()));
    }
    return penalties;
}

std::vector<ShotCount> uniform_shares(ShotCount budget, size_t count) {
    if (count == 0) return {};
    auto k = static_cast<ShotCount>(count);
    std::vector<ShotCount> shares(count, budget / k);
    for (ShotCount i = 0; i < budget % k; ++i) {
        ++shares[static_cast<size_t>(i)];
    }
    return shares;
}

// ─────────────────────────────────────────────
// AllocationProblem: build
// ─────────────────────────────────────────────

AllocationProblem::AllocationProblem(std::vector<Backend> backends,
                                     std::vector<PartitionDemand> demands,
                                     AllocationOptions options)
    : backends_(std::move(backends)),
      demands_(std::move(demands)),
      options_(std::move(options)),
      uniform_(options_.uses_uniform_split()),
      model_(std::make_unique<MilpModel>("allocation")),
      objective_(options_.weights) {}

Result<AllocationProblem> AllocationProblem::build(std::vector<Backend> backends,
                                                   std::vector<PartitionDemand> demands,
                                                   AllocationOptions options,
                                                   Logger& logger) {
    if (auto valid = validate_backends(backends); !valid) {
        return valid.error();
    }
    if (demands.empty()) {
        return invalid_input("At least one partition demand is required");
    }
    for (size_t c = 0; c < demands.size(); ++c) {
        if (demands[c].shots < 1) {
            return invalid_input("Partition " + std::to_string(c) + " has a zero shot budget");
        }
        if (demands[c].qubits < 0) {
            return invalid_input("Partition " + std::to_string(c) + " has a negative qubit demand");
        }
    }
    if (!std::isfinite(options.qos.price_weight) || options.qos.price_weight < 0.0
        || !std::isfinite(options.qos.reliability_weight) || options.qos.reliability_weight < 0.0) {
        return invalid_input("QoS weights must be finite and non-negative");
    }
    if (!std::isfinite(options.postprocessing_time) || options.postprocessing_time < 0.0) {
        return invalid_input("Post-processing time must be finite and non-negative");
    }
    if (auto valid = validate_predicates(options.predicates); !valid) {
        return valid.error();
    }

    AllocationProblem problem(std::move(backends), std::move(demands), std::move(options));
    if (auto valid = problem.objective_.validate(); !valid) {
        return valid.error();
    }
    if (auto eligible = problem.check_eligibility(); !eligible) {
        logger.warn("allocator", eligible.error().message);
        return eligible.error();
    }

    problem.add_selection();
    if (problem.objective_.enabled(ObjectiveTerm::Latency)) {
        problem.add_latency();
    }
    if (problem.options_.uses_qos()) {
        problem.add_qos();
    }
    if (problem.options_.mode != ObjectiveMode::SingleSelect) {
        problem.objective_.add_constant(ObjectiveTerm::Postprocessing, problem.options_.postprocessing_time);
    }
    problem.objective_.apply(*problem.model_);

    std::ostringstream oss;
    oss << "Built " << to_string(problem.options_.mode) << " allocation for "
        << problem.demands_.size() << " partitions over " << problem.backends_.size()
        << " backends (" << (problem.uniform_ ? "uniform" : "optimized") << " split)";
    logger.debug("allocator", oss.str());
    return problem;
}

Result<void> AllocationProblem::check_eligibility() {
    const size_t C = demands_.size();
    const size_t Q = backends_.size();
    eligible_.assign(C, std::vector<bool>(Q, false));

    for (size_t c = 0; c < C; ++c) {
        bool any_fits = false;
        bool any_eligible = false;
        for (size_t q = 0; q < Q; ++q) {
            bool fits = backends_[q].capacity() >= demands_[c].qubits;
            any_fits = any_fits || fits;
            eligible_[c][q] = fits && admitted(backends_[q], options_.predicates);
            any_eligible = any_eligible || eligible_[c][q];
        }
        if (any_eligible) continue;

        auto needed = std::to_string(demands_[c].qubits);
        if (any_fits) {
            return infeasible("Every backend with capacity for partition " + std::to_string(c)
                              + " (" + needed + " qubits) is excluded by a predicate", "predicate");
        }
        return infeasible("No backend has capacity for partition " + std::to_string(c)
                          + " (" + needed + " qubits)", "capacity");
    }
    return {};
}

void AllocationProblem::add_selection() {
    const size_t C = demands_.size();
    const size_t Q = backends_.size();
    auto& model = *model_;

    sel_.assign(C, std::vector<ColumnId>(Q));
    for (size_t c = 0; c < C; ++c) {
        for (size_t q = 0; q < Q; ++q) {
            sel_[c][q] = model.add_binary("sel" + suffix(c, q));
            if (!eligible_[c][q]) model.set_upper_bound(sel_[c][q], 0.0);
        }
    }

    if (options_.mode == ObjectiveMode::SingleSelect) {
        for (size_t c = 0; c < C; ++c) {
            LinearExpr row;
            for (size_t q = 0; q < Q; ++q) row.push_back({sel_[c][q], 1.0});
            model.add_eq("single_" + std::to_string(c), row, 1.0);
        }
        return;
    }

    if (uniform_) {
        w_.resize(C);
        h_.assign(C, std::vector<std::vector<ColumnId>>(Q));
        for (size_t c = 0; c < C; ++c) {
            auto eligible_count = static_cast<ShotCount>(
                std::count(eligible_[c].begin(), eligible_[c].end(), true));
            auto K = static_cast<size_t>(std::min(eligible_count, demands_[c].shots));

            LinearExpr pick_one;
            LinearExpr count_link;
            for (size_t k = 1; k <= K; ++k) {
                auto w = model.add_binary("w" + suffix(c, k));
                w_[c].push_back(w);
                pick_one.push_back({w, 1.0});
                count_link.push_back({w, -static_cast<double>(k)});
            }
            for (size_t q = 0; q < Q; ++q) count_link.push_back({sel_[c][q], 1.0});
            model.add_eq("split_count_" + std::to_string(c), pick_one, 1.0);
            model.add_eq("split_link_" + std::to_string(c), count_link, 0.0);

            for (size_t q = 0; q < Q; ++q) {
                for (size_t k = 1; k <= K; ++k) {
                    auto h = model.add_binary("h" + suffix(c, q) + "_" + std::to_string(k));
                    model.add_and_linearization("h" + suffix(c, q) + "_" + std::to_string(k),
                                                h, sel_[c][q], w_[c][k - 1]);
                    if (!eligible_[c][q]) model.set_upper_bound(h, 0.0);
                    h_[c][q].push_back(h);
                }
            }
        }
        return;
    }

    shots_.assign(C, std::vector<ColumnId>(Q));
    for (size_t c = 0; c < C; ++c) {
        auto budget = static_cast<double>(demands_[c].shots);
        LinearExpr total;
        for (size_t q = 0; q < Q; ++q) {
            auto s = model.add_integer("shots" + suffix(c, q), 0.0, budget);
            if (!eligible_[c][q]) model.set_upper_bound(s, 0.0);
            shots_[c][q] = s;
            total.push_back({s, 1.0});
            model.add_ge("shots_min" + suffix(c, q), {{s, 1.0}, {sel_[c][q], -1.0}}, 0.0);
            model.add_le("shots_max" + suffix(c, q), {{s, 1.0}, {sel_[c][q], -budget}}, 0.0);
        }
        model.add_eq("budget_" + std::to_string(c), total, budget);
    }
}

LinearExpr AllocationProblem::share_expr(size_t c, size_t q) const {
    if (options_.mode == ObjectiveMode::SingleSelect) {
        return {{sel_[c][q], 1.0}};
    }
    if (uniform_) {
        LinearExpr expr;
        for (size_t k = 1; k <= h_[c][q].size(); ++k) {
            expr.push_back({h_[c][q][k - 1], 1.0 / static_cast<double>(k)});
        }
        return expr;
    }
    return {{shots_[c][q], 1.0 / static_cast<double>(demands_[c].shots)}};
}

void AllocationProblem::add_latency() {
    const size_t C = demands_.size();
    const size_t Q = backends_.size();
    auto& model = *model_;

    makespan_ = model.add_continuous("makespan", 0.0, kInfinity);
    use_.resize(Q);
    for (size_t q = 0; q < Q; ++q) {
        use_[q] = model.add_binary("use_" + std::to_string(q));
        bool reachable = false;
        for (size_t c = 0; c < C; ++c) {
            reachable = reachable || eligible_[c][q];
            model.add_ge("use" + suffix(c, q), {{use_[q], 1.0}, {sel_[c][q], -1.0}}, 0.0);
        }
        if (!reachable) model.set_upper_bound(use_[q], 0.0);

        const auto& b = backends_[q];
        LinearExpr row{{*makespan_, 1.0}, {use_[q], -b.queue_time()}};
        for (size_t c = 0; c < C; ++c) {
            for (const auto& t : share_expr(c, q)) {
                row.push_back({t.column, -b.execution_time() * t.coefficient});
            }
        }
        model.add_ge("epigraph_" + std::to_string(q), row, 0.0);
    }
    objective_.add(ObjectiveTerm::Latency, *makespan_, 1.0);
}

void AllocationProblem::add_qos() {
    const size_t C = demands_.size();
    auto penalties = qos_penalties(backends_, options_.qos);
    for (size_t c = 0; c < C; ++c) {
        for (size_t q = 0; q < backends_.size(); ++q) {
            if (!eligible_[c][q] || penalties[q] == 0.0) continue;
            for (const auto& t : share_expr(c, q)) {
                objective_.add(ObjectiveTerm::Qos, t.column,
                               penalties[q] * t.coefficient / static_cast<double>(C));
            }
        }
    }
}

// ─────────────────────────────────────────────
// AllocationProblem: solve
// ─────────────────────────────────────────────

Result<AllocationResult> AllocationProblem::solve(Logger& logger) const {
    auto solution = model_->solve(options_.solver, logger);
    if (!solution) {
        auto error = solution.error();
        if (error.code == ErrorCode::Infeasible && error.likely_cause == "unknown") {
            error.likely_cause = "capacity";
        }
        logger.warn("allocator", "Allocation failed: " + error.message);
        return error;
    }

    const size_t C = demands_.size();
    const size_t Q = backends_.size();

    AllocationResult result;
    result.mode = options_.mode;
    result.uniform_split = uniform_;
    result.status = solution->status;
    result.objective = solution->objective;
    result.partitions.resize(C);
    result.backend_load.assign(Q, 0.0);

    std::vector<double> penalties = qos_penalties(backends_, options_.qos);
    std::vector<bool> used(Q, false);
    double qos_total = 0.0;

    for (size_t c = 0; c < C; ++c) {
        const auto budget = demands_[c].shots;
        std::vector<size_t> selected;
        for (size_t q = 0; q < Q; ++q) {
            if (solution->is_one(sel_[c][q])) selected.push_back(q);
        }
        if (selected.empty()) {
            return solver_failure("Solution selects no backend for partition " + std::to_string(c));
        }

        std::vector<ShotCount> counts;
        if (options_.mode == ObjectiveMode::SingleSelect) {
            selected.resize(1);
            counts = {budget};
        } else if (uniform_) {
            counts = uniform_shares(budget, selected.size());
        } else {
            for (auto q : selected) counts.push_back(solution->rounded(shots_[c][q]));
        }

        for (size_t i = 0; i < selected.size(); ++i) {
            auto q = selected[i];
            if (counts[i] <= 0) continue;
            result.partitions[c].push_back({static_cast<BackendIndex>(q), backends_[q].id(), counts[i]});

            double share = uniform_ ? 1.0 / static_cast<double>(selected.size())
                                    : static_cast<double>(counts[i]) / static_cast<double>(budget);
            result.backend_load[q] += backends_[q].execution_time() * share;
            qos_total += penalties[q] * share;
            used[q] = true;
        }
        if (result.total_shots(static_cast<PartitionId>(c)) != budget) {
            return solver_failure("Shots for partition " + std::to_string(c) + " do not sum to its budget");
        }
    }

    for (size_t q = 0; q < Q; ++q) {
        if (!used[q]) continue;
        result.backend_load[q] += backends_[q].queue_time();
        result.makespan = std::max(result.makespan, result.backend_load[q]);
    }
    if (options_.uses_qos()) {
        result.qos_penalty = qos_total / static_cast<double>(C);
    }
    if (options_.mode != ObjectiveMode::SingleSelect) {
        result.postprocessing_time = options_.postprocessing_time;
    }

    std::ostringstream oss;
    oss << to_string(options_.mode) << " allocation " << to_string(result.status)
        << ": makespan " << result.makespan << ", " << result.used_backends().size()
        << " backends, objective " << result.objective;
    logger.info("allocator", oss.str());
    if (logger.enabled(LogLevel::Debug)) {
        for (size_t c = 0; c < C; ++c) {
            std::ostringstream detail;
            detail << "partition " << c << ":";
            for (const auto& s : result.partitions[c]) detail << " " << s.backend_id << "=" << s.shots;
            logger.debug("allocator", detail.str());
        }
    }
    return result;
}

// ─────────────────────────────────────────────
// ShotAllocator
// ─────────────────────────────────────────────

ShotAllocator::ShotAllocator(Logger& logger) : logger_(logger) {}

Result<AllocationResult> ShotAllocator::allocate(const std::vector<Backend>& backends,
                                                 const std::vector<PartitionDemand>& demands,
                                                 const AllocationOptions& options) const {
    auto problem = AllocationProblem::build(backends, demands, options, logger_);
    if (!problem) return problem.error();
    return problem->solve(logger_);
}

}  // namespace cut_shoot
