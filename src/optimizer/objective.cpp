/**
 * @file objective.cpp
 * @brief ObjectiveComposer implementation.
 */

#include "optimizer/objective.hpp"

#include <cmath>

namespace cut_shoot {

double TermWeights::of(ObjectiveTerm term) const noexcept {
    switch (term) {
        case ObjectiveTerm::Cuts:           return cuts;
        case ObjectiveTerm::Latency:        return latency;
        case ObjectiveTerm::Qos:            return qos;
        case ObjectiveTerm::Postprocessing: return postprocessing;
    }
    return 0.0;
}

ObjectiveComposer::ObjectiveComposer(TermWeights weights) : weights_(weights) {}

Result<void> ObjectiveComposer::validate() const {
    for (size_t i = 0; i < kObjectiveTermCount; ++i) {
        auto term = static_cast<ObjectiveTerm>(i);
        double w = weights_.of(term);
        if (!std::isfinite(w) || w < 0.0) {
            return invalid_input("Objective weight for " + std::string(to_string(term))
                                 + " must be finite and non-negative");
        }
    }
    return {};
}

void ObjectiveComposer::add(ObjectiveTerm term, ColumnId column, double coefficient) {
    if (!enabled(term)) return;
    terms_[static_cast<size_t>(term)].push_back({column, coefficient});
}

void ObjectiveComposer::add(ObjectiveTerm term, const LinearExpr& expr) {
    if (!enabled(term)) return;
    auto& dst = terms_[static_cast<size_t>(term)];
    dst.insert(dst.end(), expr.begin(), expr.end());
}

void ObjectiveComposer::add_constant(ObjectiveTerm term, double value) {
    if (!enabled(term)) return;
    constants_[static_cast<size_t>(term)] += value;
}

void ObjectiveComposer::apply(MilpModel& model) const {
    for (size_t i = 0; i < kObjectiveTermCount; ++i) {
        double w = weights_.of(static_cast<ObjectiveTerm>(i));
        if (w <= 0.0) continue;
        for (const auto& t : terms_[i]) {
            model.add_objective(t.column, w * t.coefficient);
        }
        model.add_objective_offset(w * constants_[i]);
    }
}

double ObjectiveComposer::evaluate(ObjectiveTerm term, const MilpSolution& solution) const {
    auto i = static_cast<size_t>(term);
    double total = constants_[i];
    for (const auto& t : terms_[i]) {
        total += t.coefficient * solution.value(t.column);
    }
    return total;
}

double ObjectiveComposer::evaluate(const MilpSolution& solution) const {
    double total = 0.0;
    for (size_t i = 0; i < kObjectiveTermCount; ++i) {
        auto term = static_cast<ObjectiveTerm>(i);
        if (!enabled(term)) continue;
        total += weights_.of(term) * evaluate(term, solution);
    }
    return total;
}

}  // namespace cut_shoot
