/**
 * @file allocator.hpp
 * @brief Backend selection and shot allocation across partitions.
 *
 * Every partition (scheduling unit) carries a shot budget and a qubit demand.
 * The allocator selects the backends that run each partition and divides its
 * budget among them, minimizing the makespan over shared backends plus an
 * optional QoS penalty and post-processing estimate.
 *
 * Uniform splits use a reciprocal lookup table: w[c,k] picks the number of
 * selected backends and h[c,q,k] = sel[c,q] AND w[c,k] carries 1/k into the
 * latency and QoS terms, which keeps the model linear.
 */

#pragma once

#include "allocation/backend.hpp"
#include "core/logger.hpp"
#include "milp/milp_model.hpp"
#include "optimizer/objective.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace cut_shoot {

struct AllocationOptions {
    ObjectiveMode mode = ObjectiveMode::JointNonUniform;
    QosWeights qos;
    std::vector<PredicateRule> predicates;
    bool uniform_split = true;           ///< Only consulted by joint_qos
    double postprocessing_time = 0.0;
    TermWeights weights{.cuts = 0.0, .latency = 1.0, .qos = 1.0, .postprocessing = 1.0};
    SolveOptions solver;

    /// joint_uniform always splits evenly, joint_nonuniform never does,
    /// joint_qos follows uniform_split. single_select has nothing to split.
    [[nodiscard]] bool uses_uniform_split() const noexcept;

    /// QoS only enters joint_qos and joint_nonuniform, and only with a positive weight.
    [[nodiscard]] bool uses_qos() const noexcept;
};

struct ShotAssignment {
    BackendIndex backend{0};
    BackendId backend_id;
    ShotCount shots{0};

    bool operator==(const ShotAssignment&) const = default;
};

struct AllocationResult {
    ObjectiveMode mode{ObjectiveMode::JointNonUniform};
    bool uniform_split{false};
    std::vector<std::vector<ShotAssignment>> partitions;  ///< selected backends only, backend order
    std::vector<double> backend_load;                     ///< queue + share-scaled execution, 0 if unused
    double makespan{0.0};
    double qos_penalty{0.0};
    double postprocessing_time{0.0};
    double objective{0.0};
    SolveStatus status{SolveStatus::Optimal};

    [[nodiscard]] ShotCount shots(PartitionId partition, const BackendId& backend) const;
    [[nodiscard]] ShotCount total_shots(PartitionId partition) const;
    [[nodiscard]] std::vector<BackendIndex> used_backends() const;
};

/**
 * @brief QoS penalty per backend: price_weight * price / max_price +
 *        reliability_weight * (1 - reliability).
 */
std::vector<double> qos_penalties(const std::vector<Backend>& backends, const QosWeights& weights);

/**
 * @brief Budget / k shots each, the remainder one by one to the first backends.
 */
std::vector<ShotCount> uniform_shares(ShotCount budget, size_t count);

/**
 * @brief A built allocation model, ready to solve.
 */
class AllocationProblem {
public:
    /**
     * @brief Validate inputs, check eligibility and build the model.
     *
     * Infeasible with cause "predicate" when every backend large enough for
     * some partition is excluded by a predicate, or "capacity" when no
     * backend is large enough at all.
     */
    static Result<AllocationProblem> build(std::vector<Backend> backends,
                                           std::vector<PartitionDemand> demands,
                                           AllocationOptions options,
                                           Logger& logger = null_logger());

    Result<AllocationResult> solve(Logger& logger = null_logger()) const;

    [[nodiscard]] const MilpModel& model() const noexcept { return *model_; }
    [[nodiscard]] bool eligible(PartitionId c, BackendIndex q) const { return eligible_.at(c).at(q); }
    [[nodiscard]] const ObjectiveComposer& objective() const noexcept { return objective_; }

private:
    AllocationProblem(std::vector<Backend> backends,
                      std::vector<PartitionDemand> demands,
                      AllocationOptions options);

    Result<void> check_eligibility();
    void add_selection();
    void add_latency();
    void add_qos();

    [[nodiscard]] LinearExpr share_expr(size_t c, size_t q) const;

    std::vector<Backend> backends_;
    std::vector<PartitionDemand> demands_;
    AllocationOptions options_;
    bool uniform_{false};

    std::unique_ptr<MilpModel> model_;
    ObjectiveComposer objective_;

    std::vector<std::vector<bool>> eligible_;                ///< [c][q]
    std::vector<std::vector<ColumnId>> sel_;                 ///< [c][q]
    std::vector<std::vector<ColumnId>> shots_;               ///< [c][q], non-uniform split
    std::vector<std::vector<ColumnId>> w_;                   ///< [c][k-1], uniform split
    std::vector<std::vector<std::vector<ColumnId>>> h_;      ///< [c][q][k-1], uniform split
    std::vector<ColumnId> use_;                              ///< [q]
    std::optional<ColumnId> makespan_;
};

class ShotAllocator {
public:
    explicit ShotAllocator(Logger& logger = null_logger());

    Result<AllocationResult> allocate(const std::vector<Backend>& backends,
                                      const std::vector<PartitionDemand>& demands,
                                      const AllocationOptions& options) const;

private:
    Logger& logger_;
};

}  // namespace cut_shoot
