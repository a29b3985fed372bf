/**
 * @file joint_optimizer.cpp
 * @brief JointProblem and JointOptimizer: partition model extended with shots and makespan.
 *
 * On top of the partition model, per partition c and backend q:
 *
 *   y[v,c] <= u[c] <= Σ_v y[v,c],  d[c] <= BigM · u[c]
 *   Σ_q shots[c,q] = budget · u[c]
 *   d[c] <= cap_q + BigM · (1 - enable[c,q]),  shots[c,q] <= budget · enable[c,q]
 * and, when the latency term is weighted:
 *
 *   Σ_c shots[c,q] <= C · budget · use[q]
 *   T >= queue_q · use[q] + Σ_c exec_q · shots[c,q] / budget
 */

#include "optimizer/joint_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cut_shoot {

namespace {

std::string suffix(size_t a, size_t b) {
    return "_" + std::to_string(a) + "_" + std::to_string(b);
}

Result<void> validate_options(const JointOptions& options) {
    if (options.max_partitions < 1) {
        return invalid_input("max_partitions must be >= 1");
    }
    if (options.shots_per_partition < 1) {
        return invalid_input("Shot budget per partition must be >= 1");
    }
    if (options.max_partition_qubits < 0) {
        return invalid_input("max_partition_qubits must be >= 0");
    }
    if (!std::isfinite(options.alpha) || !std::isfinite(options.beta)
        || options.alpha < 0.0 || options.beta < 0.0) {
        return invalid_input("alpha and beta must be finite and non-negative");
    }
    if (std::abs(options.alpha + options.beta - 1.0) > 1e-9) {
        return invalid_input("alpha + beta must equal 1");
    }
    if (!(options.qos.price_weight >= 0.0 && std::isfinite(options.qos.price_weight))
        || !(options.qos.reliability_weight >= 0.0 && std::isfinite(options.qos.reliability_weight))) {
        return invalid_input("QoS weights must be finite and non-negative");
    }
    return validate_predicates(options.predicates);
}

}  // anonymous namespace

JointProblem::JointProblem(WorkloadGraph graph, std::vector<Backend> backends, JointOptions options)
    : graph_(std::move(graph)),
      backends_(std::move(backends)),
      options_(std::move(options)),
      model_(std::make_unique<MilpModel>("joint")),
      objective_(TermWeights{.cuts = options_.alpha, .latency = options_.beta,
                             .qos = 1.0, .postprocessing = 0.0}) {}

Result<JointProblem> JointProblem::build(WorkloadGraph graph,
                                         std::vector<Backend> backends,
                                         JointOptions options,
                                         Logger& logger) {
    if (auto valid = graph.validate(); !valid) return valid.error();
    if (auto valid = validate_backends(backends); !valid) return valid.error();
    if (auto valid = validate_options(options); !valid) return valid.error();

    JointProblem problem(std::move(graph), std::move(backends), std::move(options));
    if (auto resolved = problem.resolve_capacity(); !resolved) {
        logger.warn("joint", resolved.error().message);
        return resolved.error();
    }

    const auto C = problem.options_.max_partitions;
    problem.k_max_ = static_cast<double>(problem.graph_.edge_count()) / 2.0;
    for (const auto& b : problem.backends_) {
        problem.t_max_ = std::max(problem.t_max_, b.queue_time() + static_cast<double>(C) * b.execution_time());
    }

    problem.vars_ = add_partition_model(*problem.model_, problem.graph_, problem.capacity_, C);
    problem.add_shots();
    if (problem.objective_.enabled(ObjectiveTerm::Latency)) {
        problem.add_latency();
    }
    if (problem.options_.qos.enabled()) {
        problem.add_qos();
    }
    if (problem.k_max_ > 0.0) {
        for (const auto& t : problem.vars_.cut_count_expr()) {
            problem.objective_.add(ObjectiveTerm::Cuts, t.column, t.coefficient / problem.k_max_);
        }
    }
    problem.objective_.apply(*problem.model_);

    std::ostringstream oss;
    oss << "Built joint model for " << problem.graph_.vertex_count() << " vertices, " << C
        << " partitions and " << problem.backends_.size() << " backends (capacity "
        << problem.capacity_ << (problem.has_makespan() ? ", with makespan)" : ", cuts only)");
    logger.debug("joint", oss.str());
    return problem;
}

Result<void> JointProblem::resolve_capacity() {
    const size_t Q = backends_.size();
    allowed_.assign(Q, false);
    int64_t largest_allowed = -1;
    int64_t largest_any = -1;
    for (size_t q = 0; q < Q; ++q) {
        allowed_[q] = admitted(backends_[q], options_.predicates);
        largest_any = std::max(largest_any, backends_[q].capacity());
        if (allowed_[q]) largest_allowed = std::max(largest_allowed, backends_[q].capacity());
    }
    if (largest_allowed < 0) {
        return infeasible("Every backend is excluded by a predicate", "predicate");
    }
    capacity_ = largest_allowed;
    if (options_.max_partition_qubits > 0) capacity_ = std::min(capacity_, options_.max_partition_qubits);

    if (graph_.max_weight() > capacity_) {
        bool excluded_would_fit = graph_.max_weight() <= largest_any && options_.max_partition_qubits == 0;
        return infeasible("A vertex of weight " + std::to_string(graph_.max_weight())
                          + " exceeds every eligible backend capacity",
                          excluded_would_fit ? "predicate" : "capacity");
    }
    return {};
}

void JointProblem::add_shots() {
    const size_t Q = backends_.size();
    const uint32_t C = options_.max_partitions;
    const auto budget = static_cast<double>(options_.shots_per_partition);
    const double big_m = static_cast<double>(graph_.total_weight() + static_cast<int64_t>(graph_.edge_count()));
    auto& model = *model_;

    used_.resize(C);
    shots_.assign(C, std::vector<ColumnId>(Q));
    enable_.assign(C, std::vector<ColumnId>(Q));
    for (uint32_t c = 0; c < C; ++c) {
        auto tag = "_" + std::to_string(c);
        used_[c] = model.add_binary("u" + tag);
        model.add_le("active" + tag, {{vars_.d[c], 1.0}, {used_[c], -big_m}}, 0.0);

        LinearExpr nonempty{{used_[c], 1.0}};
        for (size_t v = 0; v < vars_.y.size(); ++v) {
            nonempty.push_back({vars_.y[v][c], -1.0});
            model.add_le("owns" + suffix(v, c), {{vars_.y[v][c], 1.0}, {used_[c], -1.0}}, 0.0);
        }
        model.add_le("nonempty" + tag, nonempty, 0.0);

        LinearExpr total{{used_[c], -budget}};
        for (size_t q = 0; q < Q; ++q) {
            shots_[c][q] = model.add_integer("shots" + suffix(c, q), 0.0, budget);
            enable_[c][q] = model.add_binary("enable" + suffix(c, q));
            if (!allowed_[q]) {
                model.set_upper_bound(shots_[c][q], 0.0);
                model.set_upper_bound(enable_[c][q], 0.0);
            }
            total.push_back({shots_[c][q], 1.0});

            model.add_le("fits" + suffix(c, q), {{vars_.d[c], 1.0}, {enable_[c][q], big_m}},
                         static_cast<double>(backends_[q].capacity()) + big_m);
            model.add_le("enabled_shots" + suffix(c, q),
                         {{shots_[c][q], 1.0}, {enable_[c][q], -budget}}, 0.0);
        }
        model.add_eq("shots_total" + tag, total, 0.0);
    }
}

void JointProblem::add_latency() {
    const size_t Q = backends_.size();
    const uint32_t C = options_.max_partitions;
    const auto budget = static_cast<double>(options_.shots_per_partition);
    auto& model = *model_;

    makespan_ = model.add_continuous("makespan", 0.0, kInfinity);
    use_.resize(Q);
    for (size_t q = 0; q < Q; ++q) {
        auto tag = "_" + std::to_string(q);
        use_[q] = model.add_binary("use" + tag);
        if (!allowed_[q]) model.set_upper_bound(use_[q], 0.0);

        LinearExpr load{{use_[q], -static_cast<double>(C) * budget}};
        LinearExpr epigraph{{*makespan_, 1.0}, {use_[q], -backends_[q].queue_time()}};
        for (uint32_t c = 0; c < C; ++c) {
            load.push_back({shots_[c][q], 1.0});
            epigraph.push_back({shots_[c][q], -backends_[q].execution_time() / budget});
        }
        model.add_le("use_link" + tag, load, 0.0);
        model.add_ge("epigraph" + tag, epigraph, 0.0);
    }
    if (t_max_ > 0.0) {
        objective_.add(ObjectiveTerm::Latency, *makespan_, 1.0 / t_max_);
    }
}

void JointProblem::add_qos() {
    const uint32_t C = options_.max_partitions;
    const auto budget = static_cast<double>(options_.shots_per_partition);
    auto penalties = qos_penalties(backends_, options_.qos);
    for (uint32_t c = 0; c < C; ++c) {
        for (size_t q = 0; q < backends_.size(); ++q) {
            if (penalties[q] == 0.0 || !allowed_[q]) continue;
            objective_.add(ObjectiveTerm::Qos, shots_[c][q],
                           penalties[q] / (budget * static_cast<double>(C)));
        }
    }
}

Result<JointResult> JointProblem::solve(Logger& logger) const {
    const size_t Q = backends_.size();
    const uint32_t C = options_.max_partitions;
    const auto budget = static_cast<double>(options_.shots_per_partition);

    auto solution = model_->solve(options_.solver, logger);
    if (!solution) {
        auto error = solution.error();
        if (error.code == ErrorCode::Infeasible) error.likely_cause = "capacity";
        logger.warn("joint", "Joint optimization failed: " + error.message);
        return error;
    }

    auto partition = read_partition(graph_, vars_, *solution);
    if (!partition) return partition.error();
    partition->objective = solution->objective;

    JointResult result;
    result.status = solution->status;
    result.objective = solution->objective;
    result.normalized_cuts = k_max_ > 0.0 ? static_cast<double>(partition->cut_count) / k_max_ : 0.0;

    auto& allocation = result.allocation;
    allocation.mode = ObjectiveMode::JointNonUniform;
    allocation.uniform_split = false;
    allocation.status = solution->status;
    allocation.objective = solution->objective;
    allocation.backend_load.assign(Q, 0.0);

    auto penalties = qos_penalties(backends_, options_.qos);
    std::vector<bool> backend_used(Q, false);
    double qos_total = 0.0;
    for (uint32_t c = 0; c < C; ++c) {
        if (partition->vertices[c].empty()) continue;
        std::vector<ShotAssignment> assigned;
        for (size_t q = 0; q < Q; ++q) {
            auto s = solution->rounded(shots_[c][q]);
            if (s <= 0) continue;
            assigned.push_back({static_cast<BackendIndex>(q), backends_[q].id(), s});
            double share = static_cast<double>(s) / budget;
            allocation.backend_load[q] += backends_[q].execution_time() * share;
            qos_total += penalties[q] * share;
            backend_used[q] = true;
        }
        allocation.partitions.push_back(std::move(assigned));
    }
    for (size_t q = 0; q < Q; ++q) {
        if (!backend_used[q]) continue;
        allocation.backend_load[q] += backends_[q].queue_time();
        allocation.makespan = std::max(allocation.makespan, allocation.backend_load[q]);
    }
    if (options_.qos.enabled() && !allocation.partitions.empty()) {
        allocation.qos_penalty = qos_total / static_cast<double>(C);
    }
    result.normalized_makespan = t_max_ > 0.0 ? allocation.makespan / t_max_ : 0.0;
    result.partition = std::move(*partition);

    std::ostringstream oss;
    oss << "Joint solution " << to_string(result.status) << ": " << result.partition.cut_count
        << " cuts, " << allocation.partitions.size() << " scheduled partitions, makespan "
        << allocation.makespan << ", objective " << result.objective;
    logger.info("joint", oss.str());
    return result;
}

JointOptimizer::JointOptimizer(Logger& logger) : logger_(logger) {}

Result<JointResult> JointOptimizer::optimize(const WorkloadGraph& graph,
                                             const std::vector<Backend>& backends,
                                             const JointOptions& options) const {
    auto problem = JointProblem::build(graph, backends, options, logger_);
    if (!problem) return problem.error();
    return problem->solve(logger_);
}

}  // namespace cut_shoot
