/**
 * @file milp_model.cpp
 * @brief MilpModel: row-major assembly and CBC branch-and-bound.
 */

#include "milp/milp_model.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>

#include <coin/CbcModel.hpp>
#include <coin/CoinFinite.hpp>
#include <coin/CoinPackedMatrix.hpp>
#include <coin/CoinPackedVector.hpp>
#include <coin/OsiClpSolverInterface.hpp>

namespace cut_shoot {

namespace {

double to_coin(double bound) {
    if (bound == kInfinity) return COIN_DBL_MAX;
    if (bound == -kInfinity) return -COIN_DBL_MAX;
    return bound;
}

}  // anonymous namespace

Result<SolveStatus> classify_outcome(const SolverOutcome& outcome, const std::string& model_name) {
    if (outcome.proven_infeasible) {
        return infeasible(model_name + " has no feasible solution");
    }
    if (outcome.unbounded) {
        return solver_failure(model_name + " is unbounded");
    }
    if (outcome.abandoned) {
        return solver_failure("CBC abandoned " + model_name + " (numerical difficulties)");
    }
    if (outcome.proven_optimal && outcome.has_incumbent) {
        return SolveStatus::Optimal;
    }
    if (outcome.limit_reached) {
        if (!outcome.has_incumbent) {
            return solver_limit(model_name + " reached the solver limit before finding any solution");
        }
        return SolveStatus::TimeLimit;
    }
    std::ostringstream oss;
    oss << "Unrecognized CBC status " << outcome.status
        << " (secondary " << outcome.secondary_status << ") for " << model_name;
    return solver_failure(oss.str());
}

int64_t MilpSolution::rounded(ColumnId col) const {
    return static_cast<int64_t>(std::llround(value(col)));
}

MilpModel::MilpModel(std::string name) : name_(std::move(name)) {}

// ─────────────────────────────────────────────
// Columns
// ─────────────────────────────────────────────

ColumnId MilpModel::add_column(std::string name, ColumnKind kind, double lower, double upper) {
    if (lower > upper) {
        throw std::invalid_argument("Column " + name + " has lower bound above upper bound");
    }
    auto id = static_cast<ColumnId>(col_lower_.size());
    col_names_.push_back(std::move(name));
    col_kinds_.push_back(kind);
    col_lower_.push_back(lower);
    col_upper_.push_back(upper);
    objective_.push_back(0.0);
    return id;
}

ColumnId MilpModel::add_binary(std::string name) {
    return add_column(std::move(name), ColumnKind::Binary, 0.0, 1.0);
}

ColumnId MilpModel::add_integer(std::string name, double lower, double upper) {
    return add_column(std::move(name), ColumnKind::Integer, lower, upper);
}

ColumnId MilpModel::add_continuous(std::string name, double lower, double upper) {
    return add_column(std::move(name), ColumnKind::Continuous, lower, upper);
}

void MilpModel::set_upper_bound(ColumnId col, double upper) {
    auto i = static_cast<size_t>(col);
    col_upper_.at(i) = upper;
    // Exclusion (upper = 0) also pulls the lower bound down.
    if (col_lower_[i] > upper) col_lower_[i] = upper;
}

void MilpModel::set_lower_bound(ColumnId col, double lower) {
    col_lower_.at(static_cast<size_t>(col)) = lower;
}

size_t MilpModel::integer_count() const noexcept {
    return static_cast<size_t>(std::count_if(col_kinds_.begin(), col_kinds_.end(),
        [](ColumnKind k) { return k != ColumnKind::Continuous; }));
}

size_t MilpModel::nonzero_count() const noexcept {
    size_t nnz = 0;
    for (const auto& row : rows_) nnz += row.indices.size();
    return nnz;
}

// ─────────────────────────────────────────────
// Rows
// ─────────────────────────────────────────────

void MilpModel::add_row(std::string name, const LinearExpr& expr, double lower, double upper) {
    // Merge repeated columns; CoinPackedVector rejects duplicate indices.
    std::map<int, double> merged;
    for (const auto& term : expr) {
        if (term.column < 0 || static_cast<size_t>(term.column) >= col_lower_.size()) {
            throw std::out_of_range("Row " + name + " references unknown column");
        }
        merged[term.column] += term.coefficient;
    }

    Row row;
    row.indices.reserve(merged.size());
    row.coefficients.reserve(merged.size());
    for (const auto& [col, coef] : merged) {
        if (coef == 0.0) continue;
        row.indices.push_back(col);
        row.coefficients.push_back(coef);
    }

    row_names_.push_back(std::move(name));
    rows_.push_back(std::move(row));
    row_lower_.push_back(lower);
    row_upper_.push_back(upper);
}

void MilpModel::add_and_linearization(const std::string& name, ColumnId z, ColumnId x, ColumnId y) {
    add_le(name + "_le_x", {{z, 1.0}, {x, -1.0}}, 0.0);
    add_le(name + "_le_y", {{z, 1.0}, {y, -1.0}}, 0.0);
    add_ge(name + "_ge_xy", {{z, 1.0}, {x, -1.0}, {y, -1.0}}, -1.0);
    set_lower_bound(z, 0.0);
}

void MilpModel::add_objective(ColumnId col, double coefficient) {
    objective_.at(static_cast<size_t>(col)) += coefficient;
}

// ─────────────────────────────────────────────
// Solve (CBC)
// ─────────────────────────────────────────────

Result<MilpSolution> MilpModel::solve(const SolveOptions& options, Logger& logger) const {
    const int ncols = static_cast<int>(col_lower_.size());
    const int nrows = static_cast<int>(rows_.size());

    {
        std::ostringstream oss;
        oss << "Solving " << name_ << ": " << ncols << " columns (" << integer_count()
            << " integer), " << nrows << " rows, " << nonzero_count() << " nonzeros";
        logger.info("milp", oss.str());
    }

    // Row-major matrix
    CoinPackedMatrix matrix(false, 0.0, 0.0);
    for (const auto& row : rows_) {
        CoinPackedVector vec(static_cast<int>(row.indices.size()),
                             row.indices.data(), row.coefficients.data());
        matrix.appendRow(vec);
    }
    matrix.setDimensions(nrows, ncols);

    std::vector<double> col_lower(ncols), col_upper(ncols);
    for (int i = 0; i < ncols; ++i) {
        col_lower[i] = to_coin(col_lower_[i]);
        col_upper[i] = to_coin(col_upper_[i]);
    }
    std::vector<double> row_lower(nrows), row_upper(nrows);
    for (int i = 0; i < nrows; ++i) {
        row_lower[i] = to_coin(row_lower_[i]);
        row_upper[i] = to_coin(row_upper_[i]);
    }

    OsiClpSolverInterface si;
    si.messageHandler()->setLogLevel(options.log_output ? 1 : 0);
    si.loadProblem(matrix, col_lower.data(), col_upper.data(),
                   objective_.data(), row_lower.data(), row_upper.data());
    si.setObjSense(1.0);  // minimize

    std::vector<int> int_idx;
    for (int i = 0; i < ncols; ++i) {
        if (col_kinds_[i] != ColumnKind::Continuous) int_idx.push_back(i);
    }
    if (!int_idx.empty()) si.setInteger(int_idx.data(), static_cast<int>(int_idx.size()));

    CbcModel model(si);
    model.setLogLevel(options.log_output ? 1 : 0);
    model.setRandomSeed(options.random_seed);
    model.setIntegerTolerance(1e-6);
    if (options.time_limit_seconds > 0.0) model.setMaximumSeconds(options.time_limit_seconds);

    auto started = WallClock::now();
    model.branchAndBound();
    Seconds elapsed = WallClock::now() - started;

    const double* best = model.bestSolution();
    SolverOutcome outcome{
        .proven_infeasible = model.isProvenInfeasible() || model.isInitialSolveProvenPrimalInfeasible(),
        .unbounded = model.isContinuousUnbounded() || model.isInitialSolveProvenDualInfeasible(),
        .abandoned = model.isAbandoned(),
        .proven_optimal = model.isProvenOptimal(),
        .limit_reached = model.isSecondsLimitReached() || model.status() == 1,
        .has_incumbent = best != nullptr,
        .status = model.status(),
        .secondary_status = model.secondaryStatus(),
    };
    auto classified = classify_outcome(outcome, name_);
    if (!classified) {
        const auto& error = classified.error();
        switch (error.code) {
            case ErrorCode::Infeasible:         logger.info("milp", error.message); break;
            case ErrorCode::SolverLimitReached: logger.warn("milp", error.message); break;
            default:                            logger.error("milp", error.message); break;
        }
        return error;
    }
    const SolveStatus status = *classified;

    MilpSolution solution;
    solution.status = status;
    solution.objective = model.getObjValue() + objective_offset_;
    solution.best_bound = model.getBestPossibleObjValue() + objective_offset_;
    solution.values.assign(best, best + ncols);
    solution.wall_time = elapsed;
    for (int i = 0; i < ncols; ++i) {
        if (col_kinds_[i] != ColumnKind::Continuous) {
            solution.values[i] = std::round(solution.values[i]);
        }
    }

    std::ostringstream oss;
    oss << name_ << " " << to_string(status) << ", objective " << solution.objective
        << ", bound " << solution.best_bound << ", " << elapsed.count() << "s";
    logger.info("milp", oss.str());
    return solution;
}

}  // namespace cut_shoot
