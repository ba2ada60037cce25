#pragma once
/*
===============================================================================
RULES — Per-variable bounds requested by the caller
===============================================================================

OVERVIEW
--------
A Rule bounds the solved value of one variable:

    Rule{ ResourceId{ore}, Constraint::greater(-60) }   // use at most 60 Ore/min
    Rule{ RecipeId{smelt}, Constraint::less(4) }        // at most 4 smelters

A rule on a resource, of any kind, exempts that resource from the default
balance (net flow = 0). Constraint::unconstrained() therefore lets a resource
flow freely without emitting a bound.

Rules are grouped into RuleLists that callers edit and persist as a unit.
NamedRule is the name-based form exchanged with rule-list persistence;
resolveRuleList() and describeRuleList() translate at that boundary.

===============================================================================
*/

#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "errors.h"

namespace planner {

    // ============================================================================
    // CONSTRAINT
    // ============================================================================

    /**
     * @class Constraint
     * @brief A single scalar comparison: <= t, = t, >= t, or none
     */
    class Constraint {
    public:
        enum class Kind { Less, Equal, Greater, Unconstrained };

        constexpr Constraint() = default;

        static constexpr Constraint less(double threshold) { return { Kind::Less, threshold }; }
        static constexpr Constraint equal(double threshold) { return { Kind::Equal, threshold }; }
        static constexpr Constraint greater(double threshold) { return { Kind::Greater, threshold }; }
        static constexpr Constraint unconstrained() { return { Kind::Unconstrained, 0.0 }; }

        constexpr Kind kind() const noexcept { return kind_; }

        /// @brief Bound value; 0 for Unconstrained
        constexpr double threshold() const noexcept { return threshold_; }

        constexpr bool isBinding() const noexcept { return kind_ != Kind::Unconstrained; }

        constexpr bool operator==(const Constraint&) const = default;

    private:
        constexpr Constraint(Kind kind, double threshold)
            : kind_(kind), threshold_(threshold)
        {
        }

        Kind kind_ = Kind::Unconstrained;
        double threshold_ = 0.0;
    };

    /// @brief "Less", "Equal", "Greater" or "Unconstrained"
    inline std::string constraintName(const Constraint& constraint)
    {
        switch (constraint.kind()) {
        case Constraint::Kind::Less:          return "Less";
        case Constraint::Kind::Equal:         return "Equal";
        case Constraint::Kind::Greater:       return "Greater";
        case Constraint::Kind::Unconstrained: return "Unconstrained";
        }
        return "Unconstrained";
    }

    // ============================================================================
    // RULES
    // ============================================================================

    struct Rule {
        VariableId variable;
        Constraint constraint;
    };

    struct RuleList {
        std::vector<Rule> rules;
    };

    /// @brief Objective weight of one variable
    using Optimization = std::pair<VariableId, double>;

    // ============================================================================
    // NAME-BASED BOUNDARY
    // ============================================================================

    enum class VariableKind { Resource, Recipe };

    struct NamedRule {
        VariableKind kind = VariableKind::Resource;
        std::string name;
        Constraint constraint;

        bool operator==(const NamedRule&) const = default;
    };

    /**
     * @brief Translate name-based rules into a RuleList for this catalog
     * @throws LookupError UnknownResource or UnknownRecipe on the first
     *         name that does not resolve
     */
    inline RuleList resolveRuleList(const Catalog& catalog, const std::vector<NamedRule>& named)
    {
        RuleList list;
        list.rules.reserve(named.size());

        for (const auto& rule : named) {
            switch (rule.kind) {
            case VariableKind::Resource: {
                auto id = catalog.resourceIdOf(rule.name);
                if (!id) {
                    throw LookupError(LookupError::Kind::UnknownResource, rule.name);
                }
                list.rules.push_back(Rule{ *id, rule.constraint });
                break;
            }
            case VariableKind::Recipe: {
                auto id = catalog.recipeIdOf(rule.name);
                if (!id) {
                    throw LookupError(LookupError::Kind::UnknownRecipe, rule.name);
                }
                list.rules.push_back(Rule{ *id, rule.constraint });
                break;
            }
            }
        }

        return list;
    }

    /// @brief Name-based form of a RuleList, in rule order
    inline std::vector<NamedRule> describeRuleList(const Catalog& catalog, const RuleList& list)
    {
        std::vector<NamedRule> named;
        named.reserve(list.rules.size());

        for (const auto& rule : list.rules) {
            named.push_back(std::visit(overloaded{
                [&](ResourceId id) {
                    return NamedRule{ VariableKind::Resource, catalog.nameOf(id), rule.constraint };
                },
                [&](RecipeId id) {
                    return NamedRule{ VariableKind::Recipe, catalog.nameOf(id), rule.constraint };
                }
                }, rule.variable));
        }

        return named;
    }

} // namespace planner
