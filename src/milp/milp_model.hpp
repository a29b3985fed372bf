/**
 * @file milp_model.hpp
 * @brief Solver-independent MILP builder with a COIN-OR CBC back end.
 *
 * Columns and rows are registered into dense arrays owned by one MilpModel;
 * ColumnId is the index into those arrays. Nothing outlives the model, so
 * independent optimization runs never share variable registries.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace cut_shoot {

using ColumnId = int;

inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

enum class ColumnKind : uint8_t {
    Continuous,
    Integer,
    Binary
};

struct LinearTerm {
    ColumnId column;
    double coefficient;
};

using LinearExpr = std::vector<LinearTerm>;

/**
 * @brief Solver knobs for a single solve.
 */
struct SolveOptions {
    double time_limit_seconds = 0.0;  ///< 0 = unlimited
    int random_seed = 42;
    bool log_output = false;
};

/**
 * @brief Primal solution of a successful solve.
 */
struct MilpSolution {
    SolveStatus status = SolveStatus::Optimal;
    double objective = 0.0;
    double best_bound = 0.0;
    std::vector<double> values;
    Seconds wall_time{0.0};

    [[nodiscard]] double value(ColumnId col) const { return values.at(static_cast<size_t>(col)); }
    [[nodiscard]] int64_t rounded(ColumnId col) const;
    [[nodiscard]] bool is_one(ColumnId col) const { return value(col) > 0.5; }
};

/**
 * @brief Terminal flags read back from the MIP solver after branch-and-bound.
 */
struct SolverOutcome {
    bool proven_infeasible = false;
    bool unbounded = false;
    bool abandoned = false;
    bool proven_optimal = false;
    bool limit_reached = false;       ///< time or node limit
    bool has_incumbent = false;
    int status = 0;                   ///< raw solver status, for diagnostics
    int secondary_status = 0;
};

/**
 * @brief Map solver flags to a solve status or an error.
 *
 * Infeasibility wins over every other flag; an unbounded or abandoned run
 * is a SolverFailure. A limit with an incumbent yields TimeLimit, without
 * one SolverLimitReached. Anything unrecognized is a SolverFailure that
 * carries the raw status codes.
 */
[[nodiscard]] Result<SolveStatus> classify_outcome(const SolverOutcome& outcome,
                                                   const std::string& model_name);

/**
 * @brief Mixed-integer linear program, minimization sense.
 */
class MilpModel {
public:
    explicit MilpModel(std::string name);

    // ── Columns ───────────────────────────────
    ColumnId add_binary(std::string name);
    ColumnId add_integer(std::string name, double lower, double upper);
    ColumnId add_continuous(std::string name, double lower, double upper);

    /// Tighten a bound after creation (predicate exclusion uses upper = 0).
    void set_upper_bound(ColumnId col, double upper);
    void set_lower_bound(ColumnId col, double lower);

    // ── Rows ──────────────────────────────────
    void add_row(std::string name, const LinearExpr& expr, double lower, double upper);
    void add_le(std::string name, const LinearExpr& expr, double rhs) { add_row(std::move(name), expr, -kInfinity, rhs); }
    void add_ge(std::string name, const LinearExpr& expr, double rhs) { add_row(std::move(name), expr, rhs, kInfinity); }
    void add_eq(std::string name, const LinearExpr& expr, double rhs) { add_row(std::move(name), expr, rhs, rhs); }

    /**
     * @brief Constrain binary z to equal x AND y.
     *
     *   z <= x,  z <= y,  z >= x + y - 1,  z >= 0
     */
    void add_and_linearization(const std::string& name, ColumnId z, ColumnId x, ColumnId y);

    // ── Objective ─────────────────────────────
    void add_objective(ColumnId col, double coefficient);
    void add_objective_offset(double offset) { objective_offset_ += offset; }

    // ── Introspection ─────────────────────────
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] size_t column_count() const noexcept { return col_lower_.size(); }
    [[nodiscard]] size_t row_count() const noexcept { return row_lower_.size(); }
    [[nodiscard]] size_t integer_count() const noexcept;
    [[nodiscard]] size_t nonzero_count() const noexcept;
    [[nodiscard]] const std::string& column_name(ColumnId col) const { return col_names_.at(static_cast<size_t>(col)); }
    [[nodiscard]] double upper_bound(ColumnId col) const { return col_upper_.at(static_cast<size_t>(col)); }
    [[nodiscard]] double objective_coefficient(ColumnId col) const { return objective_.at(static_cast<size_t>(col)); }
    [[nodiscard]] double objective_offset() const noexcept { return objective_offset_; }

    /**
     * @brief Solve with CBC and block until a terminal status.
     *
     * Returns the incumbent tagged Optimal or TimeLimit; Infeasible,
     * SolverLimitReached (limit without incumbent) or SolverFailure otherwise.
     */
    Result<MilpSolution> solve(const SolveOptions& options, Logger& logger = null_logger()) const;

private:
    ColumnId add_column(std::string name, ColumnKind kind, double lower, double upper);

    std::string name_;

    std::vector<std::string> col_names_;
    std::vector<ColumnKind> col_kinds_;
    std::vector<double> col_lower_;
    std::vector<double> col_upper_;
    std::vector<double> objective_;
    double objective_offset_{0.0};

    struct Row {
        std::vector<int> indices;
        std::vector<double> coefficients;
    };
    std::vector<std::string> row_names_;
    std::vector<Row> rows_;
    std::vector<double> row_lower_;
    std::vector<double> row_upper_;
};

}  // namespace cut_shoot
