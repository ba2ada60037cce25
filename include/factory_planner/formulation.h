#pragma once
/*
===============================================================================
FORMULATION — Translate a catalog and a request into a linear program
===============================================================================

OVERVIEW
--------
formulate() produces a solver-independent LinearProgram. Any LpSolver can
load it; the formulation never talks to a solver directly.

MATHEMATICAL MODEL
------------------
Sets:
    R                   Resources of the catalog
    C                   Recipes of the catalog

Parameters:
    rate[c,r]           Per-minute rate of resource r for one unit of recipe c
    w[v]                Objective weight of variable v (0 if not listed)

Variables:
    net[r]  free        Net flow of resource r
    x[c]   >= 0         Throughput of recipe c

Objective:
    max  sum_v w[v] * v

Rows, in this order:
    conserve[r]:  sum_c rate[c,r] * x[c] - net[r] = 0     for r in R
    nonneg[c]:    x[c] >= 0                               for c in C
    rule[k]:      v_k (<=|=|>=) t_k                       for each binding rule k
    balance[r]:   net[r] = 0                              for r in R not ruled

Column layout: net[r] occupies column r, x[c] occupies column |R| + c.

The row order is fixed so that solver tie-breaking is reproducible when the
objective leaves the optimum under-determined.

===============================================================================
*/

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "catalog.h"
#include "enum_utils.h"
#include "naming.h"
#include "rules.h"

namespace planner {

    PLANNER_DECLARE_ENUM_WITH_COUNT(ColumnBlock, ResourceFlow, RecipeRate);
    PLANNER_DECLARE_ENUM_WITH_COUNT(RowGroup, Conservation, NonNegativity, Rule, DefaultBalance);

    enum class Sense { LessEqual, Equal, GreaterEqual };

    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    // ============================================================================
    // PROGRAM DESCRIPTION
    // ============================================================================

    struct LpColumn {
        std::string name;
        ColumnBlock block = ColumnBlock::ResourceFlow;
        double lower = -kInfinity;
        double upper = kInfinity;
        double objective = 0.0;
    };

    struct LpTerm {
        std::size_t column = 0;
        double coefficient = 0.0;
    };

    struct LpRow {
        std::string name;
        RowGroup group = RowGroup::Conservation;
        std::vector<LpTerm> terms;
        Sense sense = Sense::Equal;
        double rhs = 0.0;
    };

    /**
     * @class LinearProgram
     * @brief Columns, rows and a maximization objective
     */
    class LinearProgram {
    public:
        LinearProgram() = default;

        LinearProgram(std::size_t resourceCount, std::size_t recipeCount)
            : resourceCount_(resourceCount), recipeCount_(recipeCount)
        {
        }

        std::vector<LpColumn>& columns() noexcept { return columns_; }
        const std::vector<LpColumn>& columns() const noexcept { return columns_; }

        std::vector<LpRow>& rows() noexcept { return rows_; }
        const std::vector<LpRow>& rows() const noexcept { return rows_; }

        std::size_t resourceCount() const noexcept { return resourceCount_; }
        std::size_t recipeCount() const noexcept { return recipeCount_; }

        std::size_t column(ResourceId id) const noexcept { return id.index; }
        std::size_t column(RecipeId id) const noexcept { return resourceCount_ + id.index; }

        std::size_t column(const VariableId& variable) const noexcept
        {
            return std::visit([this](auto id) { return column(id); }, variable);
        }

        /// @brief Rows of one group, in program order
        std::vector<const LpRow*> rowsIn(RowGroup group) const
        {
            std::vector<const LpRow*> result;
            for (const auto& row : rows_) {
                if (row.group == group)
                    result.push_back(&row);
            }
            return result;
        }

    private:
        std::size_t resourceCount_ = 0;
        std::size_t recipeCount_ = 0;

        std::vector<LpColumn> columns_;
        std::vector<LpRow> rows_;
    };

    // ============================================================================
    // FORMULATION
    // ============================================================================

    namespace formulation_detail {

        inline Sense senseOf(Constraint::Kind kind)
        {
            switch (kind) {
            case Constraint::Kind::Less:    return Sense::LessEqual;
            case Constraint::Kind::Equal:   return Sense::Equal;
            case Constraint::Kind::Greater: return Sense::GreaterEqual;
            case Constraint::Kind::Unconstrained:
                break;
            }
            throw std::logic_error("formulate: unconstrained rule has no sense");
        }

        /// @throws std::out_of_range if the id is foreign to catalog
        inline void checkVariable(const Catalog& catalog, const VariableId& variable)
        {
            std::visit(overloaded{
                [&](ResourceId id) { (void)catalog.resource(id); },
                [&](RecipeId id) { (void)catalog.recipe(id); }
                }, variable);
        }

    } // namespace formulation_detail

    /**
     * @brief Build the production-planning linear program
     *
     * @param catalog       Resources and recipes
     * @param rules         Caller rules, applied in order
     * @param optimizations Objective weights; a repeated variable keeps its
     *                      last weight
     *
     * @throws std::out_of_range if a rule or optimization uses an id that
     *         does not belong to catalog
     */
    inline LinearProgram formulate(const Catalog& catalog,
        const std::vector<Rule>& rules,
        const std::vector<Optimization>& optimizations)
    {
        const std::size_t nResources = catalog.resourceCount();
        const std::size_t nRecipes = catalog.recipeCount();

        LinearProgram lp(nResources, nRecipes);
        auto& columns = lp.columns();
        auto& rows = lp.rows();

        // Columns
        columns.reserve(nResources + nRecipes);
        for (std::size_t r = 0; r < nResources; ++r) {
            columns.push_back(LpColumn{
                catalog.nameOf(VariableId{ ResourceId{ r } }),
                ColumnBlock::ResourceFlow, -kInfinity, kInfinity, 0.0 });
        }
        for (std::size_t c = 0; c < nRecipes; ++c) {
            columns.push_back(LpColumn{
                catalog.nameOf(VariableId{ RecipeId{ c } }),
                ColumnBlock::RecipeRate, 0.0, kInfinity, 0.0 });
        }

        for (const auto& [variable, coefficient] : optimizations) {
            formulation_detail::checkVariable(catalog, variable);
            columns[lp.column(variable)].objective = coefficient;
        }

        // Conservation: recipes contributing to each resource, in catalog order
        std::vector<std::vector<LpTerm>> contributions(nResources);
        for (std::size_t c = 0; c < nRecipes; ++c) {
            for (const auto& [resource, rate] : catalog.recipes()[c].rates) {
                contributions[resource.index].push_back(
                    LpTerm{ lp.column(RecipeId{ c }), rate });
            }
        }

        for (std::size_t r = 0; r < nResources; ++r) {
            auto terms = std::move(contributions[r]);
            terms.push_back(LpTerm{ lp.column(ResourceId{ r }), -1.0 });

            rows.push_back(LpRow{
                force_name::math("conserve", catalog.resources()[r].name),
                RowGroup::Conservation, std::move(terms), Sense::Equal, 0.0 });
        }

        // Non-negativity of recipe throughput
        for (std::size_t c = 0; c < nRecipes; ++c) {
            rows.push_back(LpRow{
                force_name::math("nonneg", catalog.recipes()[c].name),
                RowGroup::NonNegativity,
                { LpTerm{ lp.column(RecipeId{ c }), 1.0 } },
                Sense::GreaterEqual, 0.0 });
        }

        // Caller rules
        std::vector<bool> ruled(nResources, false);

        for (std::size_t k = 0; k < rules.size(); ++k) {
            const auto& rule = rules[k];

            formulation_detail::checkVariable(catalog, rule.variable);
            if (const auto* resource = std::get_if<ResourceId>(&rule.variable)) {
                ruled[resource->index] = true;
            }

            if (!rule.constraint.isBinding())
                continue;

            rows.push_back(LpRow{
                force_name::math("rule", k),
                RowGroup::Rule,
                { LpTerm{ lp.column(rule.variable), 1.0 } },
                formulation_detail::senseOf(rule.constraint.kind()),
                rule.constraint.threshold() });
        }

        // Default balance for every resource no rule mentions
        for (std::size_t r = 0; r < nResources; ++r) {
            if (ruled[r])
                continue;

            rows.push_back(LpRow{
                force_name::math("balance", catalog.resources()[r].name),
                RowGroup::DefaultBalance,
                { LpTerm{ lp.column(ResourceId{ r }), 1.0 } },
                Sense::Equal, 0.0 });
        }

        return lp;
    }

} // namespace planner
