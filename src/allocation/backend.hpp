/**
 * @file backend.hpp
 * @brief Immutable execution backend descriptors and hard predicates.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cut_shoot {

/**
 * @brief An execution backend (QPU).
 *
 * execution_time is the time to run one partition's full shot budget;
 * queue_time is paid once when the backend is used at all. Descriptors never
 * change after construction: overriding metrics yields a new descriptor.
 */
class Backend {
public:
    Backend(BackendId id,
            double execution_time,
            double queue_time,
            int64_t capacity,
            std::optional<double> price_per_shot = std::nullopt,
            std::optional<double> reliability = std::nullopt,
            std::optional<std::string> region = std::nullopt);

    [[nodiscard]] const BackendId& id() const noexcept { return id_; }
    [[nodiscard]] double execution_time() const noexcept { return execution_time_; }
    [[nodiscard]] double queue_time() const noexcept { return queue_time_; }
    [[nodiscard]] int64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] const std::optional<double>& price_per_shot() const noexcept { return price_per_shot_; }
    [[nodiscard]] const std::optional<double>& reliability() const noexcept { return reliability_; }
    [[nodiscard]] const std::optional<std::string>& region() const noexcept { return region_; }

    /// Missing price counts as free, missing reliability as perfect.
    [[nodiscard]] double effective_price() const noexcept { return price_per_shot_.value_or(0.0); }
    [[nodiscard]] double effective_reliability() const noexcept { return reliability_.value_or(1.0); }

    /// Copy with refreshed time estimates.
    [[nodiscard]] Backend with_metrics(double execution_time, double queue_time) const;

    [[nodiscard]] Result<void> validate() const;

private:
    BackendId id_;
    double execution_time_;
    double queue_time_;
    int64_t capacity_;
    std::optional<double> price_per_shot_;
    std::optional<double> reliability_;
    std::optional<std::string> region_;
};

/**
 * @brief InvalidInput on an empty list, duplicate ids or bad metrics.
 */
Result<void> validate_backends(const std::vector<Backend>& backends);

/**
 * @brief InvalidInput on rules that cannot be evaluated
 *        (empty value lists, reliability outside [0,1], negative price).
 */
Result<void> validate_predicates(const std::vector<PredicateRule>& rules);

[[nodiscard]] bool satisfies(const Backend& backend, const PredicateRule& rule);

/// True when the backend passes every rule.
[[nodiscard]] bool admitted(const Backend& backend, const std::vector<PredicateRule>& rules);

}  // namespace cut_shoot
