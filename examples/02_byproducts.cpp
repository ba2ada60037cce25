/*
================================================================================
EXAMPLE 02: BYPRODUCTS - Default balance, alternates and infeasibility
================================================================================
DIFFICULTY: Intermediate

PROBLEM DESCRIPTION
-------------------
Refining crude oil yields plastic together with heavy oil residue. Residue
may not pile up, so it must be processed into fuel or packaged. The caller
edits rules by name (as a rule-list editor would), tries the plan with and
without alternate recipes, and then asks for an impossible output to see
which rows conflict.

RULES
-----
    Crude Oil   >= -300     consume at most 300 / min
    Plastic     free        output
    Fuel        free        output
    Packaged Residue free   output
    maximize    Plastic + 0.1 Fuel

FEATURES DEMONSTRATED
---------------------
- NamedRule / resolveRuleList()   Name-based rules
- Catalog::filterRecipes()        Solving without "alternate" recipes
- GurobiSolver + SolverSettings   Explicit backend and presets
- lastStore()                     Parameters and statistics of the last solve
- SolveError::conflicts()         IIS rows of an infeasible request
- describeFactory()               Name-based factory for persistence

================================================================================
*/

#include <iostream>
#include <string>
#include <vector>
#include <factory_planner/planner.h>

using namespace planner;

namespace {

    void printPlan(const std::string& title, const Catalog& catalog, const Factory& factory)
    {
        std::cout << title << "\n";
        std::cout << std::string(title.size(), '-') << "\n";
        std::cout << formatFactory(catalog, factory);
        std::cout << formatNetResources(catalog, factory.netResources(catalog));
        std::cout << "\n";
    }

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Byproducts\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // CATALOG
        // ====================================================================
        Catalog catalog = Catalog::load({
            { "Crude Oil", "Plastic", "Heavy Oil Residue", "Fuel", "Packaged Residue" },
            {
                { "Plastic", {"refinery"}, 10.0,
                    { {"Crude Oil", -3.0}, {"Plastic", 2.0}, {"Heavy Oil Residue", 1.0} } },
                { "Residual Fuel", {"refinery"}, 10.0,
                    { {"Heavy Oil Residue", -6.0}, {"Fuel", 4.0} } },
                { "Packaged Residue", {"packager", "alternate"}, 30.0,
                    { {"Heavy Oil Residue", -2.0}, {"Packaged Residue", 2.0} } },
            }
        });

        std::cout << "Tags:";
        for (const auto& tag : catalog.tags())
            std::cout << " " << tag;
        std::cout << "\n\n";

        // ====================================================================
        // REQUEST (name-based, as stored by a rule-list editor)
        // ====================================================================
        std::vector<NamedRule> named{
            { VariableKind::Resource, "Crude Oil", Constraint::greater(-300) },
            { VariableKind::Resource, "Plastic", Constraint::unconstrained() },
            { VariableKind::Resource, "Fuel", Constraint::unconstrained() },
            { VariableKind::Resource, "Packaged Residue", Constraint::unconstrained() },
        };

        RuleList rules = resolveRuleList(catalog, named);
        Problem problem = Problem::fromRuleLists({ rules }, {
            { *catalog.resourceIdOf("Plastic"), 1.0 },
            { *catalog.resourceIdOf("Fuel"), 0.1 },
        });

        // ====================================================================
        // SOLVE WITH AND WITHOUT ALTERNATES
        // ====================================================================
        GurobiSolver solver(SolverSettings::preset(SolverSettings::Preset::Fast));

        Factory full = problem.solve(catalog, solver);
        printPlan("ALL RECIPES", catalog, full);
        std::cout << "Solve: " << solver.lastStore().at("stat:Summary").get<std::string>()
                  << ", " << solver.lastStore().at("stat:Status").get<std::string>() << "\n\n";

        Catalog standard = catalog.filterRecipes([](const Recipe& recipe) {
            return !recipe.tags.contains("alternate");
        });
        Factory basic = problem.solve(standard, solver);
        printPlan("WITHOUT ALTERNATES", standard, basic);

        std::cout << "Saved plan:\n";
        for (const auto& [recipe, rate] : describeFactory(catalog, full))
            std::cout << "  " << recipe << " = " << rate << "\n";
        std::cout << "\n";

        // ====================================================================
        // INFEASIBLE REQUEST
        // ====================================================================
        named.push_back({ VariableKind::Resource, "Plastic", Constraint::equal(1000) });
        Problem impossible = Problem::fromRuleLists({ resolveRuleList(catalog, named) });

        try {
            impossible.solve(catalog, solver);
        } catch (const SolveError& e) {
            std::cout << "Plastic = 1000: " << e.what() << "\n";
            for (const auto& row : e.conflicts())
                std::cout << "  conflicting: " << row << "\n";
        }

    } catch (const SolveError& e) {
        std::cerr << "No plan: " << e.what() << "\n";
        return 1;
    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
