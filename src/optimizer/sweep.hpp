/**
 * @file sweep.hpp
 * @brief Partition-count sweep and post-hoc ranking of partitions.
 *
 * Reconstruction cost grows exponentially with the number of cuts, which a
 * linear objective cannot express. The sweep solves the partition model for
 * several partition counts concurrently and the SolutionPool ranks the
 * feasible results with a non-linear cut cost model afterwards.
 */

#pragma once

#include "core/logger.hpp"
#include "executor/thread_pool.hpp"
#include "partition/partitioner.hpp"

#include <algorithm>
#include <concepts>
#include <string_view>
#include <variant>
#include <vector>

namespace cut_shoot {

// ─────────────────────────────────────────────
// CutCostModelLike
// ─────────────────────────────────────────────

/**
 * @concept CutCostModelLike
 * @brief Constrains types that price a partition's reconstruction work.
 */
template <typename T>
concept CutCostModelLike = requires(const T model, const PartitionResult& result) {
    { model.cost(result) } -> std::convertible_to<double>;
    { T::name() } -> std::convertible_to<std::string_view>;
};

/// scale · base^K; base 4 counts the measurement/preparation variants per cut.
struct ExponentialCutCost {
    double scale = 1.0;
    double base = 4.0;

    [[nodiscard]] double cost(const PartitionResult& result) const;
    static constexpr std::string_view name() noexcept { return "exponential"; }
};

/// 4^K · Σ_c 2^{f_c}: Kronecker products over every partition's output space.
struct KroneckerReconstructionCost {
    [[nodiscard]] double cost(const PartitionResult& result) const;
    static constexpr std::string_view name() noexcept { return "kronecker"; }
};

static_assert(CutCostModelLike<ExponentialCutCost>);
static_assert(CutCostModelLike<KroneckerReconstructionCost>);

/// Runtime-selected cost model (from configuration).
using CutCostModel = std::variant<ExponentialCutCost, KroneckerReconstructionCost>;

Result<CutCostModel> make_cut_cost_model(std::string_view name, double base);

// ─────────────────────────────────────────────
// SolutionPool
// ─────────────────────────────────────────────

struct SweepEntry {
    uint32_t max_partitions{0};
    PartitionResult result;
};

struct SweepFailure {
    uint32_t max_partitions{0};
    Error error;
};

/// Points into the pool it came from.
struct RankedSolution {
    uint32_t max_partitions{0};
    double cost{0.0};
    const PartitionResult* result{nullptr};
};

class SolutionPool {
public:
    void add(uint32_t max_partitions, PartitionResult result);
    void record_failure(uint32_t max_partitions, Error error);

    [[nodiscard]] const std::vector<SweepEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::vector<SweepFailure>& failures() const noexcept { return failures_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

    /// Cheapest first; ties broken by fewer cuts, then fewer partitions.
    template <CutCostModelLike M>
    [[nodiscard]] std::vector<RankedSolution> ranked(const M& model) const;

    [[nodiscard]] std::vector<RankedSolution> ranked(const CutCostModel& model) const;

    /// InvalidInput when the pool is empty.
    [[nodiscard]] Result<RankedSolution> best(const CutCostModel& model) const;

private:
    std::vector<SweepEntry> entries_;
    std::vector<SweepFailure> failures_;
};

template <CutCostModelLike M>
std::vector<RankedSolution> SolutionPool::ranked(const M& model) const {
    std::vector<RankedSolution> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back({entry.max_partitions, static_cast<double>(model.cost(entry.result)), &entry.result});
    }
    std::stable_sort(out.begin(), out.end(), [](const RankedSolution& a, const RankedSolution& b) {
        if (a.cost != b.cost) return a.cost < b.cost;
        if (a.result->cut_count != b.result->cut_count) return a.result->cut_count < b.result->cut_count;
        return a.max_partitions < b.max_partitions;
    });
    return out;
}

// ─────────────────────────────────────────────
// PartitionSweep
// ─────────────────────────────────────────────

class PartitionSweep {
public:
    PartitionSweep(ThreadPool& pool, SolveOptions solver, Logger& logger = null_logger());

    /**
     * @brief Solve every candidate partition count concurrently.
     *
     * Failed candidates are recorded in the pool. When no candidate
     * succeeds, the error of the largest failed candidate is returned.
     */
    Result<SolutionPool> run(const WorkloadGraph& graph,
                             int64_t capacity,
                             std::vector<uint32_t> candidate_counts) const;

private:
    ThreadPool& pool_;
    SolveOptions solver_;
    Logger& logger_;
};

}  // namespace cut_shoot
