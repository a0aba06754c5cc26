#include "skyhop/lp_solver.hpp"

#include <cassert>
#include <cmath>
#include <stdexcept>

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-7; }

} // namespace

int main() {
    using skyhop::LinearProgram;

    // maximise 3x + 5y  s.t.  x <= 4, 2y <= 12, 3x + 2y <= 18
    LinearProgram lp(2);
    lp.set_objective(0, 3);
    lp.set_objective(1, 5);
    lp.add_constraint({1, 0}, 4);
    lp.add_constraint({0, 2}, 12);
    lp.add_constraint({3, 2}, 18);
    auto solution = lp.solve();
    assert(solution.status == LinearProgram::Status::Optimal);
    assert(near(solution.objective, 36));
    assert(near(solution.values[0], 2));
    assert(near(solution.values[1], 6));

    // Only a lower bound on y through -y <= 0: unbounded.
    LinearProgram open(2);
    open.set_objective(1, 1);
    open.add_constraint({1, 0}, 1);
    open.add_constraint({0, -1}, 0);
    assert(open.solve().status == LinearProgram::Status::Unbounded);

    // Degenerate rows with zero bounds stay at the origin.
    LinearProgram degenerate(2);
    degenerate.set_objective(0, 1);
    degenerate.set_objective(1, 1);
    degenerate.add_constraint({1, -1}, 0);
    degenerate.add_constraint({-1, 1}, 0);
    degenerate.add_constraint({1, 1}, 0);
    auto flat = degenerate.solve();
    assert(flat.status == LinearProgram::Status::Optimal);
    assert(near(flat.objective, 0));

    LinearProgram limited(2);
    limited.set_objective(0, 3);
    limited.set_objective(1, 5);
    limited.add_constraint({1, 0}, 4);
    limited.add_constraint({0, 2}, 12);
    limited.add_constraint({3, 2}, 18);
    assert(limited.solve(1).status == LinearProgram::Status::IterationLimit);

    bool rejected = false;
    try {
        lp.add_constraint({1}, 1);
    } catch (const std::invalid_argument &) {
        rejected = true;
    }
    assert(rejected);
    return 0;
}
