#pragma once
/*
===============================================================================
FACTORY — Solved recipe throughputs and the net resource flows they imply
===============================================================================

OVERVIEW
--------
A Factory lists the recipes a solve decided to run, in catalog order, each
with its throughput (machines or batches per minute, never negative).

netResources() derives, for every resource of the catalog, the net flow and
the contribution of each recipe:

    Factory{ { {smelt, 2.0} } }.netResources(catalog)
        Ore   : net -60   [ (Smelt, -60) ]
        Ingot : net +60   [ (Smelt, +60) ]

Resources no recipe touches keep net 0 and no contributions. Hiding them is a
presentation concern (see report.h).

describeFactory() / resolveFactory() translate to and from (recipe name,
rate) pairs for factory persistence.

===============================================================================
*/

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "errors.h"

namespace planner {

    /// @brief Net flow of one resource and the recipes that make it up
    struct ResourceFlow {
        double netRate = 0.0;
        std::vector<std::pair<RecipeId, double>> contributions;

        bool operator==(const ResourceFlow&) const = default;
    };

    struct NetResources {
        std::vector<ResourceFlow> resources;   ///< indexed by ResourceId

        const ResourceFlow& operator[](ResourceId id) const { return resources.at(id.index); }

        bool operator==(const NetResources&) const = default;
    };

    struct Factory {
        std::vector<std::pair<RecipeId, double>> recipes;

        /// @brief Throughput of a recipe, 0 if the factory does not run it
        double rateOf(RecipeId id) const
        {
            for (const auto& [recipe, rate] : recipes) {
                if (recipe == id)
                    return rate;
            }
            return 0.0;
        }

        /**
         * @brief Per-resource net flow and per-recipe contributions
         * @throws std::out_of_range if the factory references a recipe foreign
         *         to catalog
         */
        NetResources netResources(const Catalog& catalog) const
        {
            NetResources net;
            net.resources.resize(catalog.resourceCount());

            for (const auto& [recipeId, throughput] : recipes) {
                for (const auto& [resourceId, rate] : catalog.recipe(recipeId).rates) {
                    const double flow = throughput * rate;

                    auto& entry = net.resources[resourceId.index];
                    entry.netRate += flow;
                    entry.contributions.emplace_back(recipeId, flow);
                }
            }

            return net;
        }

        bool operator==(const Factory&) const = default;
    };

    // ============================================================================
    // NAME-BASED BOUNDARY
    // ============================================================================

    using FactoryEntry = std::pair<std::string, double>;

    inline std::vector<FactoryEntry> describeFactory(const Catalog& catalog, const Factory& factory)
    {
        std::vector<FactoryEntry> entries;
        entries.reserve(factory.recipes.size());
        for (const auto& [recipe, rate] : factory.recipes)
            entries.emplace_back(catalog.nameOf(recipe), rate);
        return entries;
    }

    /**
     * @brief Rebuild a Factory from (recipe name, rate) pairs
     * @throws LookupError UnknownRecipe for a name not in catalog, InvalidRate
     *         for a negative or non-finite rate
     */
    inline Factory resolveFactory(const Catalog& catalog, const std::vector<FactoryEntry>& entries)
    {
        Factory factory;
        factory.recipes.reserve(entries.size());

        for (const auto& [name, rate] : entries) {
            auto id = catalog.recipeIdOf(name);
            if (!id) {
                throw LookupError(LookupError::Kind::UnknownRecipe, name);
            }
            if (!std::isfinite(rate) || rate < 0.0) {
                throw LookupError(LookupError::Kind::InvalidRate, name);
            }
            factory.recipes.emplace_back(*id, rate);
        }

        return factory;
    }

} // namespace planner
