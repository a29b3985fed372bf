/**
 * @file objective.hpp
 * @brief Weighted multi-term objective assembled on top of a MilpModel.
 *
 * Model builders contribute linear terms tagged with the objective term they
 * belong to; the composer scales each term by its weight when it is applied.
 * A term with weight 0 is disabled and builders skip the variables and rows
 * that only serve it.
 */

#pragma once

#include "core/result.hpp"
#include "milp/milp_model.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace cut_shoot {

enum class ObjectiveTerm : uint8_t {
    Cuts,
    Latency,
    Qos,
    Postprocessing
};

inline constexpr size_t kObjectiveTermCount = 4;

[[nodiscard]] constexpr std::string_view to_string(ObjectiveTerm term) noexcept {
    switch (term) {
        case ObjectiveTerm::Cuts:           return "cuts";
        case ObjectiveTerm::Latency:        return "latency";
        case ObjectiveTerm::Qos:            return "qos";
        case ObjectiveTerm::Postprocessing: return "postprocessing";
    }
    return "unknown";
}

struct TermWeights {
    double cuts = 1.0;
    double latency = 1.0;
    double qos = 1.0;
    double postprocessing = 1.0;

    [[nodiscard]] double of(ObjectiveTerm term) const noexcept;
};

class ObjectiveComposer {
public:
    explicit ObjectiveComposer(TermWeights weights = {});

    /// Weights must be finite and non-negative.
    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] bool enabled(ObjectiveTerm term) const noexcept { return weights_.of(term) > 0.0; }
    [[nodiscard]] double weight(ObjectiveTerm term) const noexcept { return weights_.of(term); }
    [[nodiscard]] const TermWeights& weights() const noexcept { return weights_; }

    // Contributions to disabled terms are dropped.
    void add(ObjectiveTerm term, ColumnId column, double coefficient);
    void add(ObjectiveTerm term, const LinearExpr& expr);
    void add_constant(ObjectiveTerm term, double value);

    /// Write the weighted objective into the model (coefficients and offset).
    void apply(MilpModel& model) const;

    /// Unweighted value of one term under a solution.
    [[nodiscard]] double evaluate(ObjectiveTerm term, const MilpSolution& solution) const;

    /// Weighted total; matches the solver objective for the applied model.
    [[nodiscard]] double evaluate(const MilpSolution& solution) const;

    [[nodiscard]] size_t term_size(ObjectiveTerm term) const noexcept {
        return terms_[static_cast<size_t>(term)].size();
    }

private:
    TermWeights weights_;
    std::array<LinearExpr, kObjectiveTermCount> terms_;
    std::array<double, kObjectiveTermCount> constants_{};
};

}  // namespace cut_shoot
