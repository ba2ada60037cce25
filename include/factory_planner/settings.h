#pragma once
/*
===============================================================================
SETTINGS — Solver configuration for the Gurobi backend
===============================================================================

OVERVIEW
--------
SolverSettings collects the knobs a caller may set on a solve. Unset optional
fields leave Gurobi's defaults in place. Logging is Gurobi's own: `verbose`
turns console output on, `logFile` additionally writes the solver log to a
file.

    SolverSettings s = SolverSettings::preset(SolverSettings::Preset::Fast);
    s.logFile = "planner.log";
    GurobiSolver solver(s);

===============================================================================
*/

#include <optional>
#include <string>

namespace planner {

    struct SolverSettings {
        /// @brief Predefined configurations
        enum class Preset {
            Default,    ///< Gurobi defaults, quiet
            Fast,       ///< 10s limit, automatic thread count
            Accurate,   ///< tight feasibility and optimality tolerances
            Quiet,      ///< no output at all
            Debug       ///< verbose output, presolve off
        };

        std::optional<double> timeLimit;          ///< seconds
        std::optional<int> threads;               ///< 0 = automatic
        std::optional<int> presolve;              ///< -1 auto, 0 off, 1 conservative, 2 aggressive
        std::optional<double> feasibilityTol;
        std::optional<double> optimalityTol;
        bool verbose = false;
        std::string logFile;

        /// @brief Compute an IIS when the program is infeasible
        bool explainInfeasible = true;

        static SolverSettings preset(Preset p)
        {
            SolverSettings s;
            switch (p) {
            case Preset::Default:
                break;
            case Preset::Fast:
                s.timeLimit = 10.0;
                s.threads = 0;
                break;
            case Preset::Accurate:
                s.feasibilityTol = 1e-9;
                s.optimalityTol = 1e-9;
                break;
            case Preset::Quiet:
                s.verbose = false;
                s.explainInfeasible = false;
                break;
            case Preset::Debug:
                s.verbose = true;
                s.presolve = 0;
                break;
            }
            return s;
        }
    };

} // namespace planner
