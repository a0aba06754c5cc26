#include "skyhop/lp_solver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace skyhop {

namespace {

constexpr double epsilon = 1e-9;

} // namespace

LinearProgram::LinearProgram(std::size_t variables) : objective_(variables, 0.0) {
    if (variables == 0) {
        throw std::invalid_argument("linear program needs at least one variable");
    }
}

void LinearProgram::set_objective(std::size_t variable, double coefficient) {
    objective_.at(variable) = coefficient;
}

void LinearProgram::add_constraint(std::vector<double> coefficients, double bound) {
    if (coefficients.size() != objective_.size()) {
        throw std::invalid_argument("constraint width does not match variable count");
    }
    if (bound < 0) {
        throw std::invalid_argument("constraint bound must be >= 0");
    }
    rows_.push_back(std::move(coefficients));
    bounds_.push_back(bound);
}

LinearProgram::Solution LinearProgram::solve(std::size_t max_iterations) const {
    const std::size_t n = objective_.size();
    const std::size_t m = rows_.size();
    const std::size_t width = n + m + 1;
    if (max_iterations == 0) {
        max_iterations = 64 * (n + m + 1);
    }

    // Row i < m holds constraint i with its slack; row m is the objective row.
    std::vector<std::vector<double>> tableau(m + 1, std::vector<double>(width, 0.0));
    std::vector<std::size_t> basis(m);
    for (std::size_t i = 0; i < m; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            tableau[i][j] = rows_[i][j];
        }
        tableau[i][n + i] = 1.0;
        tableau[i][width - 1] = bounds_[i];
        basis[i] = n + i;
    }
    for (std::size_t j = 0; j < n; ++j) {
        tableau[m][j] = -objective_[j];
    }

    Solution solution{Status::IterationLimit, 0.0, std::vector<double>(n, 0.0)};
    std::size_t iteration = 0;
    for (; iteration < max_iterations; ++iteration) {
        std::size_t entering = width;
        for (std::size_t j = 0; j + 1 < width; ++j) {
            if (tableau[m][j] < -epsilon) {
                entering = j;
                break;
            }
        }
        if (entering == width) {
            solution.status = Status::Optimal;
            break;
        }

        std::size_t leaving = m;
        double best_ratio = std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < m; ++i) {
            double a = tableau[i][entering];
            if (a <= epsilon) {
                continue;
            }
            double ratio = tableau[i][width - 1] / a;
            if (ratio < best_ratio - epsilon ||
                (std::fabs(ratio - best_ratio) <= epsilon && leaving < m && basis[i] < basis[leaving])) {
                best_ratio = ratio;
                leaving = i;
            }
        }
        if (leaving == m) {
            solution.status = Status::Unbounded;
            return solution;
        }

        auto &pivot_row = tableau[leaving];
        double pivot = pivot_row[entering];
        for (auto &value : pivot_row) {
            value /= pivot;
        }
        for (std::size_t i = 0; i <= m; ++i) {
            if (i == leaving) {
                continue;
            }
            double factor = tableau[i][entering];
            if (std::fabs(factor) <= epsilon) {
                continue;
            }
            for (std::size_t j = 0; j < width; ++j) {
                tableau[i][j] -= factor * pivot_row[j];
            }
        }
        basis[leaving] = entering;
    }

    for (std::size_t i = 0; i < m; ++i) {
        if (basis[i] < n) {
            solution.values[basis[i]] = std::max(0.0, tableau[i][width - 1]);
        }
    }
    solution.objective = tableau[m][width - 1];
    return solution;
}

} // namespace skyhop
