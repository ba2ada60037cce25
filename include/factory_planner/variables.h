#pragma once
/*
===============================================================================
VARIABLES — Gurobi column blocks for planner programs
===============================================================================

OVERVIEW
--------
A planner program has two blocks of continuous columns: resource net flows
and recipe throughputs. Each block is created as one VariableGroup and filed
in an enum-keyed VariableTable:

    VariableTable<ColumnBlock> vars;
    vars.set(ColumnBlock::RecipeRate,
             VariableFactory::add(model, recipeColumns));

    GRBVar& x = vars(ColumnBlock::RecipeRate)(3);
    double rate = value(x);

Names are passed to Gurobi only in debug builds (see naming.h).

===============================================================================
*/

#include <array>
#include <cmath>
#include <cstddef>
#include <format>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "formulation.h"
#include "naming.h"

namespace planner {

    // ============================================================================
    // VARIABLE GROUP
    // ============================================================================

    /**
     * @class VariableGroup
     * @brief Contiguous block of Gurobi variables addressed by local index
     */
    class VariableGroup {
    public:
        VariableGroup() = default;

        explicit VariableGroup(std::vector<GRBVar> vars)
            : vars_(std::move(vars))
        {
        }

        std::size_t size() const noexcept { return vars_.size(); }
        bool empty() const noexcept { return vars_.empty(); }

        /// @throws std::out_of_range if i >= size()
        GRBVar& operator()(std::size_t i)
        {
            check(i);
            return vars_[i];
        }

        const GRBVar& operator()(std::size_t i) const
        {
            check(i);
            return vars_[i];
        }

        auto begin() noexcept { return vars_.begin(); }
        auto end() noexcept { return vars_.end(); }
        auto begin() const noexcept { return vars_.begin(); }
        auto end() const noexcept { return vars_.end(); }

    private:
        void check(std::size_t i) const
        {
            if (i >= vars_.size()) {
                throw std::out_of_range(
                    std::format("VariableGroup: index {} >= {}", i, vars_.size()));
            }
        }

        std::vector<GRBVar> vars_;
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================

    namespace variable_detail {

        /// @brief Map +-infinity onto Gurobi's infinite bound
        inline double toGurobiBound(double bound)
        {
            if (std::isinf(bound))
                return bound > 0 ? GRB_INFINITY : -GRB_INFINITY;
            return bound;
        }

    } // namespace variable_detail

    class VariableFactory {
    public:
        /**
         * @brief Add one continuous Gurobi variable per column description
         *
         * @note Objective weights are not set here; the builder installs the
         *       objective as an expression.
         */
        static VariableGroup add(GRBModel& model, std::span<const LpColumn> columns)
        {
            std::vector<GRBVar> vars;
            vars.reserve(columns.size());

            for (const auto& column : columns) {
                vars.push_back(model.addVar(
                    variable_detail::toGurobiBound(column.lower),
                    variable_detail::toGurobiBound(column.upper),
                    0.0,
                    GRB_CONTINUOUS,
                    make_name::passthrough(column.name)));
            }

            return VariableGroup(std::move(vars));
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================

    /**
     * @class VariableTable
     * @brief Fixed-size registry of VariableGroups keyed by an enum with COUNT
     */
    template<
        typename EnumT,
        std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class VariableTable {
    public:
        /// @throws std::out_of_range if key >= MAX
        void set(EnumT key, VariableGroup&& group)
        {
            table_[index(key)] = std::move(group);
        }

        VariableGroup& get(EnumT key) { return table_[index(key)]; }
        const VariableGroup& get(EnumT key) const { return table_[index(key)]; }

        VariableGroup& operator()(EnumT key) { return get(key); }
        const VariableGroup& operator()(EnumT key) const { return get(key); }

        /// @brief Total number of variables across all groups
        std::size_t totalSize() const noexcept
        {
            std::size_t n = 0;
            for (const auto& group : table_)
                n += group.size();
            return n;
        }

    private:
        static std::size_t index(EnumT key)
        {
            std::size_t idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("VariableTable: key {} >= {}", idx, MAX));
            }
            return idx;
        }

        std::array<VariableGroup, MAX> table_;
    };

    // ============================================================================
    // SOLUTION ACCESS
    // ============================================================================

    /// @throws GRBException if the model has no solution
    inline double value(const GRBVar& v)
    {
        return v.get(GRB_DoubleAttr_X);
    }

    /// @brief Solution values of a group, in index order
    inline std::vector<double> values(const VariableGroup& group)
    {
        std::vector<double> result;
        result.reserve(group.size());
        for (const auto& v : group)
            result.push_back(value(v));
        return result;
    }

} // namespace planner
