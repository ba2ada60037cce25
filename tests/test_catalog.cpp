/*
===============================================================================
TEST CATALOG — Tests for catalog.h
===============================================================================

OVERVIEW
--------
Validates catalog construction from id-based entries and from name-based
definitions, the id <-> name lookups and recipe selection by tag.

TEST ORGANIZATION
-----------------
• Section A: Catalog::build validation
• Section B: Catalog::load name resolution and per-minute scaling
• Section C: Lookups and variable names
• Section D: Tags and recipe filtering

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• catalog.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <factory_planner/catalog.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace planner;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    /// Ore -> Ingot -> Plate, with an alternate ingot recipe
    Catalog makeSmeltingCatalog()
    {
        return Catalog::build(
            { {"Ore"}, {"Ingot"}, {"Plate"} },
            {
                { "Smelt", {"smelter"}, { {ResourceId{0}, -30.0}, {ResourceId{1}, 30.0} } },
                { "Press", {"constructor"}, { {ResourceId{1}, -30.0}, {ResourceId{2}, 20.0} } },
                { "Pure Smelt", {"smelter", "alternate"}, { {ResourceId{0}, -20.0}, {ResourceId{1}, 25.0} } },
            });
    }

} // namespace

// ============================================================================
// SECTION A: CATALOG::BUILD VALIDATION
// ============================================================================

/**
 * @test Build::ValidCatalog
 * @brief Entries are kept in order and counted
 */
TEST_CASE("A1: Build::ValidCatalog", "[catalog][build]")
{
    Catalog catalog = makeSmeltingCatalog();

    REQUIRE(catalog.resourceCount() == 3);
    REQUIRE(catalog.recipeCount() == 3);
    REQUIRE(catalog.resources()[2].name == "Plate");
    REQUIRE(catalog.recipes()[1].name == "Press");
    REQUIRE(catalog.recipe(RecipeId{ 0 }).rates.size() == 2);
}

/**
 * @test Build::EmptyCatalog
 * @brief Default and empty catalogs have no entries
 */
TEST_CASE("A2: Build::EmptyCatalog", "[catalog][build]")
{
    Catalog empty;
    REQUIRE(empty.resourceCount() == 0);
    REQUIRE(empty.recipeCount() == 0);

    Catalog built = Catalog::build({}, {});
    REQUIRE(built.resourceCount() == 0);
    REQUIRE(built.tags().empty());
}

/**
 * @test Build::RejectsInvalidResourceId
 * @brief A rate pointing past the resource list names the recipe
 */
TEST_CASE("A3: Build::RejectsInvalidResourceId", "[catalog][build][error]")
{
    try {
        Catalog::build({ {"Ore"} }, { { "Broken", {}, { {ResourceId{3}, 1.0} } } });
        FAIL("expected CatalogError");
    }
    catch (const CatalogError& e) {
        REQUIRE(e.kind() == CatalogError::Kind::InvalidResourceId);
        REQUIRE(e.recipeName() == "Broken");
        REQUIRE(e.resourceName() == "3");
    }
}

/**
 * @test Build::RejectsDuplicateNames
 * @brief Duplicate resource or recipe names are errors, not first-match
 */
TEST_CASE("A4: Build::RejectsDuplicateNames", "[catalog][build][error]")
{
    SECTION("Duplicate resource")
    {
        try {
            Catalog::build({ {"Ore"}, {"Ore"} }, {});
            FAIL("expected CatalogError");
        }
        catch (const CatalogError& e) {
            REQUIRE(e.kind() == CatalogError::Kind::DuplicateResource);
            REQUIRE(e.resourceName() == "Ore");
            REQUIRE(e.recipeName().empty());
        }
    }

    SECTION("Duplicate recipe")
    {
        try {
            Catalog::build({ {"Ore"} },
                { { "Mine", {}, { {ResourceId{0}, 1.0} } },
                  { "Mine", {}, { {ResourceId{0}, 2.0} } } });
            FAIL("expected CatalogError");
        }
        catch (const CatalogError& e) {
            REQUIRE(e.kind() == CatalogError::Kind::DuplicateRecipe);
            REQUIRE(e.recipeName() == "Mine");
        }
    }

    SECTION("CatalogError is an invalid_argument")
    {
        std::vector<Resource> twice{ {"A"}, {"A"} };
        REQUIRE_THROWS_AS(Catalog::build(twice, {}), std::invalid_argument);
    }
}

// ============================================================================
// SECTION B: CATALOG::LOAD
// ============================================================================

/**
 * @test Load::ResolvesNamesAndScalesRates
 * @brief Raw rates are multiplied by perMinute and names become ids
 */
TEST_CASE("B1: Load::ResolvesNamesAndScalesRates", "[catalog][load]")
{
    CatalogDefinition definition{
        { "Ore", "Ingot" },
        { { "Smelt", {"smelter"}, 30.0, { {"Ore", -1.0}, {"Ingot", 1.0} } } }
    };

    Catalog catalog = Catalog::load(definition);

    REQUIRE(catalog.resourceCount() == 2);
    REQUIRE(catalog.recipeCount() == 1);

    const auto& rates = catalog.recipe(RecipeId{ 0 }).rates;
    REQUIRE(rates.size() == 2);
    REQUIRE(rates[0].first == ResourceId{ 0 });
    REQUIRE(rates[0].second == Catch::Approx(-30.0));
    REQUIRE(rates[1].first == ResourceId{ 1 });
    REQUIRE(rates[1].second == Catch::Approx(30.0));
    REQUIRE(catalog.recipe(RecipeId{ 0 }).tags.contains("smelter"));
}

/**
 * @test Load::FractionalPerMinute
 * @brief A recipe taking 4 seconds per batch runs 15 batches per minute
 */
TEST_CASE("B2: Load::FractionalPerMinute", "[catalog][load]")
{
    CatalogDefinition definition{
        { "Ingot", "Screw" },
        { { "Screws", {}, 60.0 / 4.0, { {"Ingot", -1.0}, {"Screw", 4.0} } } }
    };

    Catalog catalog = Catalog::load(definition);
    const auto& rates = catalog.recipe(RecipeId{ 0 }).rates;

    REQUIRE(rates[0].second == Catch::Approx(-15.0));
    REQUIRE(rates[1].second == Catch::Approx(60.0));
}

/**
 * @test Load::UnknownResource
 * @brief An unresolved resource name identifies recipe and resource
 */
TEST_CASE("B3: Load::UnknownResource", "[catalog][load][error]")
{
    CatalogDefinition definition{
        { "Ore" },
        { { "Smelt", {}, 1.0, { {"Ore", -1.0}, {"Ingot", 1.0} } } }
    };

    try {
        Catalog::load(definition);
        FAIL("expected CatalogError");
    }
    catch (const CatalogError& e) {
        REQUIRE(e.kind() == CatalogError::Kind::UnknownResource);
        REQUIRE(e.recipeName() == "Smelt");
        REQUIRE(e.resourceName() == "Ingot");
        REQUIRE(std::string(e.what()).find("Ingot") != std::string::npos);
    }
}

/**
 * @test Load::DuplicateResourceInDefinition
 * @brief Duplicates in a definition are rejected like in build()
 */
TEST_CASE("B4: Load::DuplicateResourceInDefinition", "[catalog][load][error]")
{
    CatalogDefinition definition{ { "Ore", "Ore" }, {} };

    REQUIRE_THROWS_AS(Catalog::load(definition), CatalogError);
}

// ============================================================================
// SECTION C: LOOKUPS
// ============================================================================

/**
 * @test Lookup::NameToId
 * @brief Name lookups return ids, or nullopt for unknown names
 */
TEST_CASE("C1: Lookup::NameToId", "[catalog][lookup]")
{
    Catalog catalog = makeSmeltingCatalog();

    REQUIRE(catalog.resourceIdOf("Ingot") == ResourceId{ 1 });
    REQUIRE(catalog.recipeIdOf("Pure Smelt") == RecipeId{ 2 });

    REQUIRE_FALSE(catalog.resourceIdOf("Smelt").has_value());
    REQUIRE_FALSE(catalog.recipeIdOf("Ore").has_value());
    REQUIRE_FALSE(catalog.resourceIdOf("").has_value());
}

/**
 * @test Lookup::VariableNames
 * @brief VariableId names carry the variable kind
 */
TEST_CASE("C2: Lookup::VariableNames", "[catalog][lookup]")
{
    Catalog catalog = makeSmeltingCatalog();

    REQUIRE(catalog.nameOf(ResourceId{ 0 }) == "Ore");
    REQUIRE(catalog.nameOf(RecipeId{ 1 }) == "Press");
    REQUIRE(catalog.nameOf(VariableId{ ResourceId{ 2 } }) == "Resource Plate");
    REQUIRE(catalog.nameOf(VariableId{ RecipeId{ 0 } }) == "Recipe Smelt");
}

/**
 * @test Lookup::ForeignIds
 * @brief Ids outside the catalog are programming errors
 */
TEST_CASE("C3: Lookup::ForeignIds", "[catalog][lookup][error]")
{
    Catalog catalog = makeSmeltingCatalog();

    REQUIRE_THROWS_AS(catalog.resource(ResourceId{ 3 }), std::out_of_range);
    REQUIRE_THROWS_AS(catalog.recipe(RecipeId{ 99 }), std::out_of_range);
    REQUIRE_THROWS_AS(catalog.nameOf(VariableId{ RecipeId{ 3 } }), std::out_of_range);
}

// ============================================================================
// SECTION D: TAGS AND FILTERING
// ============================================================================

/**
 * @test Tags::CollectAndSelect
 * @brief tags() lists each tag once in first-appearance order; recipesWithTag keeps order
 */
TEST_CASE("D1: Tags::CollectAndSelect", "[catalog][tags]")
{
    Catalog catalog = makeSmeltingCatalog();

    // first appearance: Smelt, Press, then Pure Smelt's "alternate"
    const std::vector<std::string> expected{ "smelter", "constructor", "alternate" };
    REQUIRE(catalog.tags() == expected);

    auto smelters = catalog.recipesWithTag("smelter");
    REQUIRE(smelters.size() == 2);
    REQUIRE(smelters[0] == RecipeId{ 0 });
    REQUIRE(smelters[1] == RecipeId{ 2 });

    REQUIRE(catalog.recipesWithTag("refinery").empty());
}

/**
 * @test Tags::FilterRecipes
 * @brief Filtering keeps resources and renumbers recipes densely
 */
TEST_CASE("D2: Tags::FilterRecipes", "[catalog][tags]")
{
    Catalog catalog = makeSmeltingCatalog();

    Catalog standard = catalog.filterRecipes([](const Recipe& recipe) {
        return !recipe.tags.contains("alternate");
    });

    REQUIRE(standard.resourceCount() == 3);
    REQUIRE(standard.recipeCount() == 2);
    REQUIRE(standard.recipeIdOf("Press") == RecipeId{ 1 });
    REQUIRE_FALSE(standard.recipeIdOf("Pure Smelt").has_value());

    SECTION("Filtering on an alternate-only predicate")
    {
        Catalog alternates = catalog.filterRecipes([](const Recipe& recipe) {
            return recipe.tags.contains("alternate");
        });

        REQUIRE(alternates.recipeCount() == 1);
        REQUIRE(alternates.recipeIdOf("Pure Smelt") == RecipeId{ 0 });
        REQUIRE(alternates.resourceIdOf("Plate") == ResourceId{ 2 });
    }
}
