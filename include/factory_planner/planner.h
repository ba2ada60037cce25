#pragma once
/*
===============================================================================
FACTORY PLANNER — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the factory planner: catalog model, request model,
formulation, Gurobi backend, solution model and text reports.

WHAT'S INCLUDED
---------------
• catalog.h       — Resources, recipes, ids and name lookups
• rules.h         — Constraint, Rule, RuleList and the name-based boundary
• formulation.h   — LinearProgram and formulate()
• lp_solver.h     — LpSolver backend interface
• gurobi_solver.h — Default backend (Gurobi C++ API)
• problem.h       — Problem::solve()
• factory.h       — Factory, NetResources and the name-based boundary
• report.h        — Plain-text rendering
• errors.h        — CatalogError, LookupError, SolveError

QUICK START
-----------
    #include <factory_planner/planner.h>

    using namespace planner;

    int main() {
        Catalog catalog = Catalog::load({
            { "Ore", "Ingot" },
            { { "Smelt", {}, 30.0, { { "Ore", -1.0 }, { "Ingot", 1.0 } } } }
        });

        ResourceId ore = *catalog.resourceIdOf("Ore");
        ResourceId ingot = *catalog.resourceIdOf("Ingot");

        Problem problem;
        problem.rules.push_back({ ore, Constraint::greater(-60) });
        problem.rules.push_back({ ingot, Constraint::unconstrained() });
        problem.optimizations.push_back({ ingot, 1.0 });

        Factory factory = problem.solve(catalog);
        std::cout << formatFactory(catalog, factory);
        std::cout << formatNetResources(catalog, factory.netResources(catalog));
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with C++ API

NAMESPACE
---------
Everything lives in `planner::`, except `make_name::` and `force_name::`.

CONFIGURATION
-------------
• PLANNER_DEBUG or _DEBUG: Gurobi variables and constraints carry the
  LinearProgram names ("Resource Ore", "conserve[Ore]")
• Otherwise Gurobi receives no names; the LinearProgram keeps them

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

// Errors (no dependencies)
#include "errors.h"

// Catalog model (depends on errors)
#include "catalog.h"

// Request model (depends on catalog)
#include "rules.h"

// Solver-independent program (depends on catalog, rules, naming)
#include "formulation.h"

// Solution model and reports (depends on catalog)
#include "factory.h"
#include "report.h"

// ============================================================================
// SOLVE
// ============================================================================

// Backend seam
#include "lp_solver.h"

// Gurobi backend (depends on model_builder, diagnostics, settings)
#include "gurobi_solver.h"

// Problem::solve (depends on all of the above)
#include "problem.h"
