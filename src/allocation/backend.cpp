/**
 * @file backend.cpp
 * @brief Backend validation and predicate evaluation.
 */

#include "allocation/backend.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace cut_shoot {

Backend::Backend(BackendId id,
                 double execution_time,
                 double queue_time,
                 int64_t capacity,
                 std::optional<double> price_per_shot,
                 std::optional<double> reliability,
                 std::optional<std::string> region)
    : id_(std::move(id)),
      execution_time_(execution_time),
      queue_time_(queue_time),
      capacity_(capacity),
      price_per_shot_(price_per_shot),
      reliability_(reliability),
      region_(std::move(region)) {}

Backend Backend::with_metrics(double execution_time, double queue_time) const {
    Backend copy = *this;
    copy.execution_time_ = execution_time;
    copy.queue_time_ = queue_time;
    return copy;
}

Result<void> Backend::validate() const {
    if (id_.empty()) {
        return invalid_input("Backend id must not be empty");
    }
    if (!std::isfinite(execution_time_) || execution_time_ < 0.0) {
        return invalid_input("Backend " + id_ + " has negative or non-finite execution time");
    }
    if (!std::isfinite(queue_time_) || queue_time_ < 0.0) {
        return invalid_input("Backend " + id_ + " has negative or non-finite queue time");
    }
    if (capacity_ < 0) {
        return invalid_input("Backend " + id_ + " has negative capacity");
    }
    if (price_per_shot_ && (!std::isfinite(*price_per_shot_) || *price_per_shot_ < 0.0)) {
        return invalid_input("Backend " + id_ + " has negative price per shot");
    }
    if (reliability_ && !(*reliability_ >= 0.0 && *reliability_ <= 1.0)) {
        return invalid_input("Backend " + id_ + " has reliability outside [0, 1]");
    }
    return {};
}

Result<void> validate_backends(const std::vector<Backend>& backends) {
    if (backends.empty()) {
        return invalid_input("At least one backend is required");
    }
    std::unordered_set<BackendId> seen;
    for (const auto& b : backends) {
        if (auto valid = b.validate(); !valid) {
            return valid.error();
        }
        if (!seen.insert(b.id()).second) {
            return invalid_input("Duplicate backend id: " + b.id());
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// Predicates
// ─────────────────────────────────────────────

Result<void> validate_predicates(const std::vector<PredicateRule>& rules) {
    for (const auto& rule : rules) {
        switch (rule.kind) {
            case PredicateKind::AllowedRegions:
            case PredicateKind::ExcludeIds:
                if (rule.values.empty()) {
                    return invalid_input(std::string(to_string(rule.kind)) + " predicate needs values");
                }
                break;
            case PredicateKind::MinReliability:
                if (!(rule.threshold >= 0.0 && rule.threshold <= 1.0)) {
                    return invalid_input("min_reliability threshold must lie in [0, 1]");
                }
                break;
            case PredicateKind::MaxPrice:
                if (!std::isfinite(rule.threshold) || rule.threshold < 0.0) {
                    return invalid_input("max_price threshold must be finite and >= 0");
                }
                break;
        }
    }
    return {};
}

bool satisfies(const Backend& backend, const PredicateRule& rule) {
    auto listed = [&](const std::string& s) {
        return std::find(rule.values.begin(), rule.values.end(), s) != rule.values.end();
    };

    switch (rule.kind) {
        case PredicateKind::AllowedRegions:
            return backend.region() && listed(*backend.region());
        case PredicateKind::ExcludeIds:
            return !listed(backend.id());
        case PredicateKind::MinReliability:
            return backend.effective_reliability() >= rule.threshold;
        case PredicateKind::MaxPrice:
            return backend.effective_price() <= rule.threshold;
    }
    return false;
}

bool admitted(const Backend& backend, const std::vector<PredicateRule>& rules) {
    return std::all_of(rules.begin(), rules.end(),
                       [&](const PredicateRule& rule) { return satisfies(backend, rule); });
}

}  // namespace cut_shoot
