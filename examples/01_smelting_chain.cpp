/*
================================================================================
EXAMPLE 01: SMELTING CHAIN - Maximize plates from a fixed ore supply
================================================================================
DIFFICULTY: Beginner

PROBLEM DESCRIPTION
-------------------
A mine delivers 120 Iron Ore per minute. Smelters turn ore into ingots and
constructors press ingots into plates. How many machines of each kind should
run to make as many plates as possible?

Every intermediate resource (Iron Ingot) is balanced by default: the plan
may not stockpile ingots or need more than it makes. Only the resources with
a rule may flow in or out of the factory.

RULES
-----
    Iron Ore    >= -120     consume at most 120 / min
    Iron Plate  free        output
    maximize    Iron Plate

FEATURES DEMONSTRATED
---------------------
- Catalog::load()                 Name-based catalog with per-minute scaling
- Problem / Rule / Constraint     Request model
- Problem::solve()                Gurobi with default settings
- Factory::netResources()         Net flows and per-recipe contributions
- formatFactory(), formatNetResources()

================================================================================
*/

#include <iostream>
#include <factory_planner/planner.h>

using namespace planner;

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Smelting Chain\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // CATALOG
        // ====================================================================
        // rates are per craft; perMinute is crafts per minute
        Catalog catalog = Catalog::load({
            { "Iron Ore", "Iron Ingot", "Iron Plate" },
            {
                { "Iron Ingot", {"smelter"}, 30.0, { {"Iron Ore", -1.0}, {"Iron Ingot", 1.0} } },
                { "Iron Plate", {"constructor"}, 10.0, { {"Iron Ingot", -3.0}, {"Iron Plate", 2.0} } },
            }
        });

        std::cout << "CATALOG\n";
        std::cout << "-------\n";
        for (const auto& recipe : catalog.recipes()) {
            std::cout << "  " << recipe.name << ":";
            for (const auto& [resource, rate] : recipe.rates)
                std::cout << " " << catalog.nameOf(resource) << " " << rate;
            std::cout << " per minute\n";
        }
        std::cout << "\n";

        // ====================================================================
        // REQUEST
        // ====================================================================
        const ResourceId ore = *catalog.resourceIdOf("Iron Ore");
        const ResourceId plate = *catalog.resourceIdOf("Iron Plate");

        Problem problem;
        problem.rules.push_back({ ore, Constraint::greater(-120) });
        problem.rules.push_back({ plate, Constraint::unconstrained() });
        problem.optimizations.push_back({ plate, 1.0 });

        // ====================================================================
        // SOLVE AND REPORT
        // ====================================================================
        std::cout << "SOLVING...\n";
        std::cout << "----------\n";

        Factory factory = problem.solve(catalog);

        std::cout << "\nMACHINES\n";
        std::cout << "--------\n";
        std::cout << formatFactory(catalog, factory);

        std::cout << "\nNET RESOURCES\n";
        std::cout << "-------------\n";
        std::cout << formatNetResources(catalog, factory.netResources(catalog));

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
