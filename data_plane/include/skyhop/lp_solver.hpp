#pragma once

#include <cstddef>
#include <vector>

namespace skyhop {

// maximise c.x  subject to  A x <= b,  x >= 0,  with every b >= 0 so the
// origin is feasible. Dense tableau simplex with Bland's rule, which keeps the
// result independent of floating point ties and cannot cycle on the
// degenerate rows the planner produces.
class LinearProgram {
  public:
    enum class Status { Optimal, Unbounded, IterationLimit };

    struct Solution {
        Status status;
        double objective;
        std::vector<double> values;
    };

    explicit LinearProgram(std::size_t variables);

    std::size_t variables() const noexcept { return objective_.size(); }

    std::size_t constraints() const noexcept { return rows_.size(); }

    void set_objective(std::size_t variable, double coefficient);

    // Adds sum(coefficients[i] * x[i]) <= bound; coefficients has one entry per variable.
    void add_constraint(std::vector<double> coefficients, double bound);

    Solution solve(std::size_t max_iterations = 0) const;

  private:
    std::vector<double> objective_;
    std::vector<std::vector<double>> rows_;
    std::vector<double> bounds_;
};

} // namespace skyhop
