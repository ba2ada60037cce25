/*
===============================================================================
TEST FORMULATION — Tests for formulation.h
===============================================================================

OVERVIEW
--------
Inspects the LinearProgram built by formulate() without any solver: column
layout and bounds, objective weights, row order, row names, coefficients and
the default-balance exemption.

TEST ORGANIZATION
-----------------
• Section A: Columns and objective
• Section B: Conservation and non-negativity rows
• Section C: Rule rows
• Section D: Default balance
• Section E: Errors

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• formulation.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <factory_planner/formulation.h>

#include <stdexcept>
#include <vector>

using namespace planner;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    /// Ore, Ingot, Slag; Smelt makes Ingot and Slag, Dump destroys Slag
    Catalog makeCatalog()
    {
        return Catalog::build(
            { {"Ore"}, {"Ingot"}, {"Slag"} },
            {
                { "Smelt", {}, { {ResourceId{0}, -30.0}, {ResourceId{1}, 30.0}, {ResourceId{2}, 10.0} } },
                { "Dump", {}, { {ResourceId{2}, -20.0} } },
            });
    }

    const ResourceId ore{ 0 };
    const ResourceId ingot{ 1 };
    const ResourceId slag{ 2 };
    const RecipeId smelt{ 0 };
    const RecipeId dump{ 1 };

} // namespace

// ============================================================================
// SECTION A: COLUMNS AND OBJECTIVE
// ============================================================================

/**
 * @test Columns::LayoutAndBounds
 * @brief Resource columns are free, recipe columns start at 0
 */
TEST_CASE("A1: Columns::LayoutAndBounds", "[formulation][columns]")
{
    Catalog catalog = makeCatalog();
    LinearProgram lp = formulate(catalog, {}, {});

    REQUIRE(lp.resourceCount() == 3);
    REQUIRE(lp.recipeCount() == 2);
    REQUIRE(lp.columns().size() == 5);

    REQUIRE(lp.column(ore) == 0);
    REQUIRE(lp.column(slag) == 2);
    REQUIRE(lp.column(smelt) == 3);
    REQUIRE(lp.column(VariableId{ dump }) == 4);

    SECTION("Resource columns")
    {
        const auto& c = lp.columns()[lp.column(ingot)];
        REQUIRE(c.name == "Resource Ingot");
        REQUIRE(c.block == ColumnBlock::ResourceFlow);
        REQUIRE(c.lower == -kInfinity);
        REQUIRE(c.upper == kInfinity);
    }

    SECTION("Recipe columns")
    {
        const auto& c = lp.columns()[lp.column(dump)];
        REQUIRE(c.name == "Recipe Dump");
        REQUIRE(c.block == ColumnBlock::RecipeRate);
        REQUIRE(c.lower == 0.0);
        REQUIRE(c.upper == kInfinity);
    }
}

/**
 * @test Columns::SparseObjective
 * @brief Only listed variables get weights; a repeated variable keeps the last
 */
TEST_CASE("A2: Columns::SparseObjective", "[formulation][objective]")
{
    Catalog catalog = makeCatalog();

    SECTION("Listed variables only")
    {
        LinearProgram lp = formulate(catalog, {}, { { ingot, 1.0 }, { dump, -0.5 } });

        REQUIRE(lp.columns()[lp.column(ingot)].objective == 1.0);
        REQUIRE(lp.columns()[lp.column(dump)].objective == -0.5);
        REQUIRE(lp.columns()[lp.column(ore)].objective == 0.0);
        REQUIRE(lp.columns()[lp.column(smelt)].objective == 0.0);
    }

    SECTION("Last weight wins")
    {
        LinearProgram lp = formulate(catalog, {}, { { ingot, 1.0 }, { ingot, 3.0 } });
        REQUIRE(lp.columns()[lp.column(ingot)].objective == 3.0);
    }

    SECTION("No optimizations")
    {
        LinearProgram lp = formulate(catalog, {}, {});
        for (const auto& column : lp.columns())
            REQUIRE(column.objective == 0.0);
    }
}

// ============================================================================
// SECTION B: CONSERVATION AND NON-NEGATIVITY
// ============================================================================

/**
 * @test Rows::ConservationCoefficients
 * @brief sum(rate * recipe) - resource = 0, recipes in catalog order
 */
TEST_CASE("B1: Rows::ConservationCoefficients", "[formulation][rows]")
{
    Catalog catalog = makeCatalog();
    LinearProgram lp = formulate(catalog, {}, {});

    auto conservation = lp.rowsIn(RowGroup::Conservation);
    REQUIRE(conservation.size() == 3);

    SECTION("Ore: consumed by Smelt")
    {
        const LpRow& row = *conservation[0];
        REQUIRE(row.name == "conserve[Ore]");
        REQUIRE(row.sense == Sense::Equal);
        REQUIRE(row.rhs == 0.0);
        REQUIRE(row.terms.size() == 2);
        REQUIRE(row.terms[0].column == lp.column(smelt));
        REQUIRE(row.terms[0].coefficient == Catch::Approx(-30.0));
        REQUIRE(row.terms[1].column == lp.column(ore));
        REQUIRE(row.terms[1].coefficient == -1.0);
    }

    SECTION("Slag: produced by Smelt, consumed by Dump")
    {
        const LpRow& row = *conservation[2];
        REQUIRE(row.name == "conserve[Slag]");
        REQUIRE(row.terms.size() == 3);
        REQUIRE(row.terms[0].column == lp.column(smelt));
        REQUIRE(row.terms[0].coefficient == Catch::Approx(10.0));
        REQUIRE(row.terms[1].column == lp.column(dump));
        REQUIRE(row.terms[1].coefficient == Catch::Approx(-20.0));
        REQUIRE(row.terms[2].column == lp.column(slag));
    }
}

/**
 * @test Rows::UntouchedResource
 * @brief A resource no recipe mentions still gets a conservation row
 */
TEST_CASE("B2: Rows::UntouchedResource", "[formulation][rows]")
{
    Catalog catalog = Catalog::build({ {"Ore"}, {"Unused"} },
        { { "Mine", {}, { {ResourceId{0}, 60.0} } } });
    LinearProgram lp = formulate(catalog, {}, {});

    auto conservation = lp.rowsIn(RowGroup::Conservation);
    REQUIRE(conservation.size() == 2);
    REQUIRE(conservation[1]->terms.size() == 1);
    REQUIRE(conservation[1]->terms[0].column == 1);
    REQUIRE(conservation[1]->terms[0].coefficient == -1.0);
}

/**
 * @test Rows::NonNegativity
 * @brief One x[c] >= 0 row per recipe
 */
TEST_CASE("B3: Rows::NonNegativity", "[formulation][rows]")
{
    Catalog catalog = makeCatalog();
    LinearProgram lp = formulate(catalog, {}, {});

    auto nonneg = lp.rowsIn(RowGroup::NonNegativity);
    REQUIRE(nonneg.size() == 2);
    REQUIRE(nonneg[0]->name == "nonneg[Smelt]");
    REQUIRE(nonneg[1]->name == "nonneg[Dump]");
    REQUIRE(nonneg[1]->sense == Sense::GreaterEqual);
    REQUIRE(nonneg[1]->rhs == 0.0);
    REQUIRE(nonneg[1]->terms.size() == 1);
    REQUIRE(nonneg[1]->terms[0].column == lp.column(dump));
    REQUIRE(nonneg[1]->terms[0].coefficient == 1.0);
}

// ============================================================================
// SECTION C: RULE ROWS
// ============================================================================

/**
 * @test Rules::SensesAndThresholds
 * @brief Less, Equal and Greater map to <=, = and >=
 */
TEST_CASE("C1: Rules::SensesAndThresholds", "[formulation][rules]")
{
    Catalog catalog = makeCatalog();
    std::vector<Rule> rules{
        { ore, Constraint::greater(-60) },
        { smelt, Constraint::less(4) },
        { ingot, Constraint::equal(30) },
    };

    LinearProgram lp = formulate(catalog, rules, {});
    auto rows = lp.rowsIn(RowGroup::Rule);
    REQUIRE(rows.size() == 3);

    REQUIRE(rows[0]->name == "rule[0]");
    REQUIRE(rows[0]->sense == Sense::GreaterEqual);
    REQUIRE(rows[0]->rhs == -60.0);
    REQUIRE(rows[0]->terms[0].column == lp.column(ore));

    REQUIRE(rows[1]->sense == Sense::LessEqual);
    REQUIRE(rows[1]->rhs == 4.0);
    REQUIRE(rows[1]->terms[0].column == lp.column(smelt));

    REQUIRE(rows[2]->name == "rule[2]");
    REQUIRE(rows[2]->sense == Sense::Equal);
    REQUIRE(rows[2]->rhs == 30.0);
}

/**
 * @test Rules::UnconstrainedEmitsNoRow
 * @brief Unconstrained rules are skipped but keep their index in row names
 */
TEST_CASE("C2: Rules::UnconstrainedEmitsNoRow", "[formulation][rules]")
{
    Catalog catalog = makeCatalog();
    std::vector<Rule> rules{
        { ingot, Constraint::unconstrained() },
        { ore, Constraint::greater(-60) },
    };

    LinearProgram lp = formulate(catalog, rules, {});
    auto rows = lp.rowsIn(RowGroup::Rule);

    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0]->name == "rule[1]");
}

// ============================================================================
// SECTION D: DEFAULT BALANCE
// ============================================================================

/**
 * @test Balance::UnruledResourcesOnly
 * @brief Any rule on a resource, even Unconstrained, removes its balance row
 */
TEST_CASE("D1: Balance::UnruledResourcesOnly", "[formulation][balance]")
{
    Catalog catalog = makeCatalog();

    SECTION("No rules: every resource balanced")
    {
        LinearProgram lp = formulate(catalog, {}, {});
        auto rows = lp.rowsIn(RowGroup::DefaultBalance);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0]->name == "balance[Ore]");
        REQUIRE(rows[2]->name == "balance[Slag]");
        REQUIRE(rows[2]->sense == Sense::Equal);
        REQUIRE(rows[2]->rhs == 0.0);
        REQUIRE(rows[2]->terms[0].column == lp.column(slag));
    }

    SECTION("Ruled resources are exempt")
    {
        LinearProgram lp = formulate(catalog,
            { { ingot, Constraint::unconstrained() }, { ore, Constraint::less(0) } }, {});
        auto rows = lp.rowsIn(RowGroup::DefaultBalance);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0]->name == "balance[Slag]");
    }

    SECTION("Recipe rules do not exempt resources")
    {
        LinearProgram lp = formulate(catalog, { { smelt, Constraint::less(1) } }, {});
        REQUIRE(lp.rowsIn(RowGroup::DefaultBalance).size() == 3);
    }
}

/**
 * @test Balance::RowOrder
 * @brief Conservation, non-negativity, rules, then balance
 */
TEST_CASE("D2: Balance::RowOrder", "[formulation][order]")
{
    Catalog catalog = makeCatalog();
    LinearProgram lp = formulate(catalog,
        { { ore, Constraint::greater(-60) }, { dump, Constraint::less(5) } }, {});

    // 3 conserve + 2 nonneg + 2 rule + 2 balance
    REQUIRE(lp.rows().size() == 9);

    std::vector<RowGroup> groups;
    for (const auto& row : lp.rows())
        groups.push_back(row.group);

    const std::vector<RowGroup> expected{
        RowGroup::Conservation, RowGroup::Conservation, RowGroup::Conservation,
        RowGroup::NonNegativity, RowGroup::NonNegativity,
        RowGroup::Rule, RowGroup::Rule,
        RowGroup::DefaultBalance, RowGroup::DefaultBalance };
    REQUIRE(groups == expected);

    REQUIRE(lp.rows()[7].name == "balance[Ingot]");
    REQUIRE(lp.rows()[8].name == "balance[Slag]");
}

/**
 * @test Balance::Deterministic
 * @brief Formulating twice yields identical programs
 */
TEST_CASE("D3: Balance::Deterministic", "[formulation][order]")
{
    Catalog catalog = makeCatalog();
    std::vector<Rule> rules{ { ore, Constraint::greater(-60) } };
    std::vector<Optimization> objective{ { ingot, 1.0 } };

    LinearProgram a = formulate(catalog, rules, objective);
    LinearProgram b = formulate(catalog, rules, objective);

    REQUIRE(a.rows().size() == b.rows().size());
    for (std::size_t i = 0; i < a.rows().size(); ++i) {
        REQUIRE(a.rows()[i].name == b.rows()[i].name);
        REQUIRE(a.rows()[i].terms.size() == b.rows()[i].terms.size());
    }
}

// ============================================================================
// SECTION E: ERRORS
// ============================================================================

/**
 * @test Errors::ForeignIds
 * @brief Rules or optimizations on ids outside the catalog throw out_of_range
 */
TEST_CASE("E1: Errors::ForeignIds", "[formulation][error]")
{
    Catalog catalog = makeCatalog();

    std::vector<Rule> foreignResource{ { ResourceId{ 3 }, Constraint::less(0) } };
    std::vector<Rule> foreignRecipe{ { RecipeId{ 2 }, Constraint::unconstrained() } };
    std::vector<Optimization> foreignObjective{ { RecipeId{ 7 }, 1.0 } };

    REQUIRE_THROWS_AS(formulate(catalog, foreignResource, {}), std::out_of_range);
    REQUIRE_THROWS_AS(formulate(catalog, foreignRecipe, {}), std::out_of_range);
    REQUIRE_THROWS_AS(formulate(catalog, {}, foreignObjective), std::out_of_range);
}
