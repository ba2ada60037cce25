#pragma once
/*
===============================================================================
LP SOLVER — Backend seam between the formulation and a simplex implementation
===============================================================================

OVERVIEW
--------
An LpSolver loads a LinearProgram (continuous columns with bounds and
objective weights, linear rows), maximizes it and reports one of:

    Optimal     values[] holds one value per column
    Infeasible  no point satisfies every row and bound
    Unbounded   the objective grows without limit on the feasible region
    Other       anything else the backend stopped with (time limit, numeric
                trouble, interruption); statusText names it

The planner ships GurobiSolver (gurobi_solver.h). Tests substitute scripted
solvers to exercise extraction and error mapping without a licence.

===============================================================================
*/

#include <string>
#include <vector>

#include "formulation.h"

namespace planner {

    enum class LpStatus { Optimal, Infeasible, Unbounded, Other };

    struct LpOutcome {
        LpStatus status = LpStatus::Other;
        std::vector<double> values;           ///< per column, Optimal only
        double objective = 0.0;
        std::string statusText;               ///< backend status name
        std::vector<std::string> conflicts;   ///< IIS row names, Infeasible only
    };

    /**
     * @class LpSolver
     * @brief Maximizes a LinearProgram
     *
     * @note Implementations must not retain the program beyond solve(); one
     *       instance may be reused for successive, independent programs.
     */
    class LpSolver {
    public:
        virtual ~LpSolver() = default;

        virtual LpOutcome solve(const LinearProgram& program) = 0;
    };

} // namespace planner
