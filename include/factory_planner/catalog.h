#pragma once
/*
===============================================================================
CATALOG — Immutable set of resources and recipes for one planning session
===============================================================================

OVERVIEW
--------
A Catalog lists the resources of an economy and the recipes that transform
them. Each recipe carries signed per-unit rates: positive for what one unit of
throughput produces per minute, negative for what it consumes.

Resources and recipes are identified by dense, zero-based ids (ResourceId,
RecipeId) handed out by the Catalog itself. A VariableId is either of the two
and names one decision variable of the production problem.

KEY COMPONENTS
--------------
• ResourceId, RecipeId, VariableId — typed identities
• Resource, Recipe                  — catalog entries
• Catalog::build()                  — validate id-based entries
• Catalog::load()                   — resolve a name-based CatalogDefinition
                                      and scale rates to per-minute values
• Lookups                           — id <-> name for resources, recipes and
                                      variables
• Recipe selection                  — tags(), recipesWithTag(), filterRecipes()

INVARIANTS
----------
• every rate references a resource of the same catalog
• resource names are unique, recipe names are unique
• ids never change for the lifetime of a Catalog

THREAD SAFETY
-------------
A Catalog is never mutated after construction; any number of threads may read
it concurrently.

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <compare>
#include <format>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "errors.h"

namespace planner {

    // ============================================================================
    // IDENTITIES
    // ============================================================================

    /// @brief Index of a resource within its Catalog
    struct ResourceId {
        std::size_t index = 0;

        auto operator<=>(const ResourceId&) const = default;
    };

    /// @brief Index of a recipe within its Catalog
    struct RecipeId {
        std::size_t index = 0;

        auto operator<=>(const RecipeId&) const = default;
    };

    /**
     * @brief Either a resource net-flow variable or a recipe throughput variable
     *
     * @note Dispatch with std::visit and an overload set so that every variable
     *       kind must be handled at each call site.
     */
    using VariableId = std::variant<ResourceId, RecipeId>;

    /// @brief Overload set for std::visit
    template<typename... Fs>
    struct overloaded : Fs... {
        using Fs::operator()...;
    };

    template<typename... Fs>
    overloaded(Fs...) -> overloaded<Fs...>;

    // ============================================================================
    // ENTRIES
    // ============================================================================

    struct Resource {
        std::string name;
    };

    struct Recipe {
        std::string name;
        std::set<std::string> tags;
        std::vector<std::pair<ResourceId, double>> rates;  ///< per unit of throughput per minute
    };

    // ----------------------------------------------------------------------------
    // Name-based definitions, as supplied by a catalog loader
    // ----------------------------------------------------------------------------

    struct RecipeDefinition {
        std::string name;
        std::set<std::string> tags;
        double perMinute = 1.0;                                 ///< multiplier applied to every raw rate
        std::vector<std::pair<std::string, double>> rates;      ///< (resource name, raw rate)
    };

    struct CatalogDefinition {
        std::vector<std::string> resources;
        std::vector<RecipeDefinition> recipes;
    };

    // ============================================================================
    // CATALOG
    // ============================================================================

    /**
     * @class Catalog
     * @brief Validated, read-only resources and recipes
     *
     * @example
     *     auto catalog = Catalog::build(
     *         { {"Ore"}, {"Ingot"} },
     *         { {"Smelt", {}, { {ResourceId{0}, -30.0}, {ResourceId{1}, 30.0} }} });
     *
     *     RecipeId smelt = *catalog.recipeIdOf("Smelt");
     *     catalog.nameOf(VariableId{ smelt });   // "Recipe Smelt"
     */
    class Catalog {
    public:
        /// @brief Empty catalog
        Catalog() = default;

        /**
         * @brief Build a catalog from id-based entries
         * @throws CatalogError DuplicateResource, DuplicateRecipe or InvalidResourceId
         */
        static Catalog build(std::vector<Resource> resources, std::vector<Recipe> recipes)
        {
            Catalog catalog;
            catalog.resources_ = std::move(resources);
            catalog.recipes_ = std::move(recipes);

            for (std::size_t i = 0; i < catalog.resources_.size(); ++i) {
                const auto& name = catalog.resources_[i].name;
                if (!catalog.resourceIndex_.emplace(name, i).second) {
                    throw CatalogError(CatalogError::Kind::DuplicateResource, {}, name);
                }
            }

            for (std::size_t i = 0; i < catalog.recipes_.size(); ++i) {
                const auto& recipe = catalog.recipes_[i];
                if (!catalog.recipeIndex_.emplace(recipe.name, i).second) {
                    throw CatalogError(CatalogError::Kind::DuplicateRecipe, recipe.name, {});
                }

                for (const auto& [resource, rate] : recipe.rates) {
                    if (resource.index >= catalog.resources_.size()) {
                        throw CatalogError(CatalogError::Kind::InvalidResourceId,
                            recipe.name, std::to_string(resource.index));
                    }
                }
            }

            return catalog;
        }

        /**
         * @brief Build a catalog from a name-based definition
         *
         * @details Resource names in recipe rates are resolved against the
         *          definition's resource list, and every raw rate is multiplied
         *          by the recipe's perMinute factor.
         *
         * @throws CatalogError UnknownResource naming the recipe and the
         *         unresolved resource, or any error of build()
         */
        static Catalog load(const CatalogDefinition& definition)
        {
            std::vector<Resource> resources;
            resources.reserve(definition.resources.size());

            std::unordered_map<std::string, std::size_t> names;
            for (const auto& name : definition.resources) {
                names.emplace(name, resources.size());
                resources.push_back(Resource{ name });
            }

            std::vector<Recipe> recipes;
            recipes.reserve(definition.recipes.size());

            for (const auto& def : definition.recipes) {
                Recipe recipe{ def.name, def.tags, {} };
                recipe.rates.reserve(def.rates.size());

                for (const auto& [resourceName, rawRate] : def.rates) {
                    auto it = names.find(resourceName);
                    if (it == names.end()) {
                        throw CatalogError(CatalogError::Kind::UnknownResource,
                            def.name, resourceName);
                    }
                    recipe.rates.emplace_back(ResourceId{ it->second }, rawRate * def.perMinute);
                }

                recipes.push_back(std::move(recipe));
            }

            return build(std::move(resources), std::move(recipes));
        }

        // -------------------------------------------------------------------------
        // Entries
        // -------------------------------------------------------------------------

        const std::vector<Resource>& resources() const noexcept { return resources_; }
        const std::vector<Recipe>& recipes() const noexcept { return recipes_; }

        std::size_t resourceCount() const noexcept { return resources_.size(); }
        std::size_t recipeCount() const noexcept { return recipes_.size(); }

        /// @throws std::out_of_range if id was not produced by this catalog
        const Resource& resource(ResourceId id) const
        {
            if (id.index >= resources_.size()) {
                throw std::out_of_range(
                    std::format("Catalog::resource: id {} >= {}", id.index, resources_.size()));
            }
            return resources_[id.index];
        }

        /// @throws std::out_of_range if id was not produced by this catalog
        const Recipe& recipe(RecipeId id) const
        {
            if (id.index >= recipes_.size()) {
                throw std::out_of_range(
                    std::format("Catalog::recipe: id {} >= {}", id.index, recipes_.size()));
            }
            return recipes_[id.index];
        }

        // -------------------------------------------------------------------------
        // Lookups
        // -------------------------------------------------------------------------

        std::optional<ResourceId> resourceIdOf(const std::string& name) const
        {
            auto it = resourceIndex_.find(name);
            if (it == resourceIndex_.end())
                return std::nullopt;
            return ResourceId{ it->second };
        }

        std::optional<RecipeId> recipeIdOf(const std::string& name) const
        {
            auto it = recipeIndex_.find(name);
            if (it == recipeIndex_.end())
                return std::nullopt;
            return RecipeId{ it->second };
        }

        const std::string& nameOf(ResourceId id) const { return resource(id).name; }
        const std::string& nameOf(RecipeId id) const { return recipe(id).name; }

        /// @brief "Resource <name>" or "Recipe <name>"
        std::string nameOf(const VariableId& variable) const
        {
            return std::visit(overloaded{
                [&](ResourceId id) { return "Resource " + nameOf(id); },
                [&](RecipeId id) { return "Recipe " + nameOf(id); }
                }, variable);
        }

        // -------------------------------------------------------------------------
        // Recipe selection
        // -------------------------------------------------------------------------

        /**
         * @brief Every tag used by at least one recipe, once each
         *
         * @note Tags are listed in order of first appearance, walking the
         *       recipes in catalog order (a recipe's own tags in set order).
         */
        std::vector<std::string> tags() const
        {
            std::vector<std::string> result;
            for (const auto& recipe : recipes_) {
                for (const auto& tag : recipe.tags) {
                    if (std::find(result.begin(), result.end(), tag) == result.end())
                        result.push_back(tag);
                }
            }
            return result;
        }

        std::vector<RecipeId> recipesWithTag(const std::string& tag) const
        {
            std::vector<RecipeId> result;
            for (std::size_t i = 0; i < recipes_.size(); ++i) {
                if (recipes_[i].tags.contains(tag)) {
                    result.push_back(RecipeId{ i });
                }
            }
            return result;
        }

        /**
         * @brief Catalog with the same resources and only the recipes accepted by pred
         *
         * @note RecipeIds of the result are renumbered densely in the original
         *       order; ResourceIds are unchanged.
         *
         * @example
         *     auto noAlternates = catalog.filterRecipes([](const Recipe& r) {
         *         return !r.tags.contains("alternate");
         *     });
         */
        template<typename Pred>
        Catalog filterRecipes(Pred&& pred) const
        {
            std::vector<Recipe> kept;
            for (const auto& recipe : recipes_) {
                if (pred(recipe)) {
                    kept.push_back(recipe);
                }
            }
            return build(resources_, std::move(kept));
        }

    private:
        std::vector<Resource> resources_;
        std::vector<Recipe> recipes_;

        std::unordered_map<std::string, std::size_t> resourceIndex_;
        std::unordered_map<std::string, std::size_t> recipeIndex_;
    };

} // namespace planner
