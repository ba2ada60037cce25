#pragma once
/*
===============================================================================
PROBLEM — One planning request and its solve
===============================================================================

OVERVIEW
--------
A Problem pairs the caller's rules with an objective. solve() formulates the
linear program (formulation.h), hands it to an LpSolver and extracts the
Factory:

    Problem problem;
    problem.rules.push_back({ ore, Constraint::greater(-60) });
    problem.optimizations.push_back({ ingot, 1.0 });

    Factory factory = problem.solve(catalog);        // Gurobi, default settings
    Factory again   = problem.solve(catalog, mySolver);

EXTRACTION
----------
Each recipe throughput is rounded to 6 decimal places; a rounded value below
machine epsilon in magnitude is treated as zero and left out. Entries keep
catalog order.

ERRORS
------
SolveError with what() == "Infeasible" or "Unbounded"; SolverFailure for any
other backend status.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "errors.h"
#include "factory.h"
#include "formulation.h"
#include "gurobi_solver.h"
#include "lp_solver.h"
#include "rules.h"

namespace planner {

    /// @brief Solutions are rounded to 1 / SOLUTION_ROUND_PRECISION
    inline constexpr double SOLUTION_ROUND_PRECISION = 1'000'000.0;

    /// @brief round(value * 1e6) / 1e6
    inline double roundSolution(double value)
    {
        return std::round(value * SOLUTION_ROUND_PRECISION) / SOLUTION_ROUND_PRECISION;
    }

    struct Problem {
        std::vector<Rule> rules;
        std::vector<Optimization> optimizations;

        /// @brief Concatenate rule lists, in order
        static Problem fromRuleLists(const std::vector<RuleList>& lists,
            std::vector<Optimization> optimizations = {})
        {
            Problem problem;
            for (const auto& list : lists)
                problem.rules.insert(problem.rules.end(), list.rules.begin(), list.rules.end());
            problem.optimizations = std::move(optimizations);
            return problem;
        }

        LinearProgram formulate(const Catalog& catalog) const
        {
            return planner::formulate(catalog, rules, optimizations);
        }

        /**
         * @brief Solve with the given backend
         * @throws SolveError if the program has no optimum
         * @throws std::out_of_range if a rule or optimization uses a foreign id
         */
        Factory solve(const Catalog& catalog, LpSolver& solver) const
        {
            const LinearProgram program = formulate(catalog);
            const LpOutcome outcome = solver.solve(program);

            switch (outcome.status) {
            case LpStatus::Optimal:
                break;
            case LpStatus::Infeasible:
                throw SolveError(SolveError::Kind::Infeasible, outcome.statusText, outcome.conflicts);
            case LpStatus::Unbounded:
                throw SolveError(SolveError::Kind::Unbounded, outcome.statusText);
            case LpStatus::Other:
                throw SolveError(SolveError::Kind::SolverFailure, outcome.statusText);
            }

            if (outcome.values.size() != program.columns().size()) {
                throw SolveError(SolveError::Kind::SolverFailure,
                    "solver returned " + std::to_string(outcome.values.size())
                    + " values for " + std::to_string(program.columns().size()) + " columns");
            }

            Factory factory;
            for (std::size_t c = 0; c < catalog.recipeCount(); ++c) {
                const RecipeId id{ c };
                const double rate = roundSolution(outcome.values[program.column(id)]);

                if (std::abs(rate) < std::numeric_limits<double>::epsilon())
                    continue;

                factory.recipes.emplace_back(id, rate);
            }

            return factory;
        }

        /// @brief Solve with Gurobi and default settings
        Factory solve(const Catalog& catalog) const
        {
            GurobiSolver solver;
            return solve(catalog, solver);
        }
    };

} // namespace planner
