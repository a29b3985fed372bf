/**
 * @file sweep.cpp
 * @brief Cut cost models, SolutionPool and PartitionSweep.
 */

#include "optimizer/sweep.hpp"

#include <cmath>
#include <sstream>

namespace cut_shoot {

// ─────────────────────────────────────────────
// Cost models
// ─────────────────────────────────────────────

double ExponentialCutCost::cost(const PartitionResult& result) const {
    return scale * std::pow(base, static_cast<double>(result.cut_count));
}

double KroneckerReconstructionCost::cost(const PartitionResult& result) const {
    double outputs = 0.0;
    for (size_t c = 0; c < result.aggregates.size(); ++c) {
        if (result.vertices[c].empty()) continue;
        outputs += std::pow(2.0, static_cast<double>(result.aggregates[c].f));
    }
    return std::pow(4.0, static_cast<double>(result.cut_count)) * outputs;
}

Result<CutCostModel> make_cut_cost_model(std::string_view name, double base) {
    if (name == ExponentialCutCost::name()) {
        if (!std::isfinite(base) || base <= 0.0) {
            return invalid_input("Exponential cost base must be positive");
        }
        return CutCostModel{ExponentialCutCost{.scale = 1.0, .base = base}};
    }
    if (name == KroneckerReconstructionCost::name()) {
        return CutCostModel{KroneckerReconstructionCost{}};
    }
    return invalid_input("Unknown cost model: " + std::string(name));
}

// ─────────────────────────────────────────────
// SolutionPool
// ─────────────────────────────────────────────

void SolutionPool::add(uint32_t max_partitions, PartitionResult result) {
    entries_.push_back({max_partitions, std::move(result)});
}

void SolutionPool::record_failure(uint32_t max_partitions, Error error) {
    failures_.push_back({max_partitions, std::move(error)});
}

std::vector<RankedSolution> SolutionPool::ranked(const CutCostModel& model) const {
    return std::visit([this](const auto& m) { return ranked(m); }, model);
}

Result<RankedSolution> SolutionPool::best(const CutCostModel& model) const {
    auto order = ranked(model);
    if (order.empty()) {
        return invalid_input("Solution pool is empty");
    }
    return order.front();
}

// ─────────────────────────────────────────────
// PartitionSweep
// ─────────────────────────────────────────────

PartitionSweep::PartitionSweep(ThreadPool& pool, SolveOptions solver, Logger& logger)
    : pool_(pool), solver_(solver), logger_(logger) {}

Result<SolutionPool> PartitionSweep::run(const WorkloadGraph& graph,
                                         int64_t capacity,
                                         std::vector<uint32_t> candidate_counts) const {
    if (auto valid = graph.validate(); !valid) {
        return valid.error();
    }
    if (candidate_counts.empty()) {
        return invalid_input("Sweep needs at least one candidate partition count");
    }
    std::sort(candidate_counts.begin(), candidate_counts.end());
    candidate_counts.erase(std::unique(candidate_counts.begin(), candidate_counts.end()),
                           candidate_counts.end());
    if (candidate_counts.front() < 1) {
        return invalid_input("Candidate partition counts must be >= 1");
    }

    auto results = pool_.map(candidate_counts, [&graph, capacity, this](uint32_t count) {
        GraphPartitioner partitioner(solver_, logger_);
        return partitioner.partition(graph, PartitionOptions{.capacity = capacity, .max_partitions = count});
    });

    SolutionPool pool;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i]) {
            pool.add(candidate_counts[i], std::move(*results[i]));
        } else {
            logger_.info("sweep", "Candidate " + std::to_string(candidate_counts[i])
                                  + " failed: " + results[i].error().message);
            pool.record_failure(candidate_counts[i], results[i].error());
        }
    }

    std::ostringstream oss;
    oss << "Sweep over " << candidate_counts.size() << " candidates: " << pool.size()
        << " feasible, " << pool.failures().size() << " failed";
    logger_.info("sweep", oss.str());

    if (pool.empty()) {
        return pool.failures().back().error;
    }
    return pool;
}

}  // namespace cut_shoot
