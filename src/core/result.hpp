/**
 * @file result.hpp
 * @brief Monadic error handling type for the cut-and-shoot optimizer.
 *
 * Every fallible operation returns Result<T>. Errors carry a taxonomy code so
 * callers can tell bad input apart from a proven-infeasible model or a
 * misbehaving solver, plus an optional hint naming the constraint family that
 * most likely caused an infeasibility.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cut_shoot {

/**
 * @brief Error taxonomy.
 */
enum class ErrorCode : uint8_t {
    InvalidInput,        ///< Rejected before any model is built
    Infeasible,          ///< No partition/allocation satisfies the constraints
    SolverLimitReached,  ///< Time limit hit without any incumbent
    SolverFailure        ///< Unbounded, abandoned or unrecognized solver status
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidInput:       return "invalid_input";
        case ErrorCode::Infeasible:         return "infeasible";
        case ErrorCode::SolverLimitReached: return "solver_limit_reached";
        case ErrorCode::SolverFailure:      return "solver_failure";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and, for
 *        infeasibility, the likely cause ("capacity", "predicate", ...).
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidInput;
    std::string message;
    std::string likely_cause;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string cause = {})
        : code(c), message(std::move(msg)), likely_cause(std::move(cause)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/// Shorthands for the four error families.
[[nodiscard]] inline Error invalid_input(std::string msg) {
    return Error{ErrorCode::InvalidInput, std::move(msg)};
}

[[nodiscard]] inline Error infeasible(std::string msg, std::string cause = "unknown") {
    return Error{ErrorCode::Infeasible, std::move(msg), std::move(cause)};
}

[[nodiscard]] inline Error solver_limit(std::string msg) {
    return Error{ErrorCode::SolverLimitReached, std::move(msg)};
}

[[nodiscard]] inline Error solver_failure(std::string msg) {
    return Error{ErrorCode::SolverFailure, std::move(msg)};
}

/**
 * @brief Result<T, E> holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations with no success payload.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

}  // namespace cut_shoot
