#pragma once
/*
===============================================================================
CONSTRAINTS — Gurobi rows grouped by their role in the planner program
===============================================================================

OVERVIEW
--------
Rows are added one at a time from LpRow descriptions and filed under their
RowGroup (conservation, non-negativity, rule, default balance), so that the
builder and diagnostics can address, say, every default-balance row at once:

    ConstraintTable<RowGroup> cons;
    cons.append(RowGroup::Rule, ConstraintFactory::add(model, expr, Sense::LessEqual, 4.0, "rule[0]"));

    for (auto& c : cons(RowGroup::DefaultBalance)) { ... }

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

#include "gurobi_c++.h"
#include "formulation.h"
#include "naming.h"

namespace planner {

    namespace constraint_detail {

        inline char toGurobiSense(Sense sense)
        {
            switch (sense) {
            case Sense::LessEqual:    return GRB_LESS_EQUAL;
            case Sense::Equal:        return GRB_EQUAL;
            case Sense::GreaterEqual: return GRB_GREATER_EQUAL;
            }
            return GRB_EQUAL;
        }

    } // namespace constraint_detail

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================

    class ConstraintFactory {
    public:
        /**
         * @brief Add `expr (sense) rhs` to the model
         * @param name Row name; forwarded to Gurobi in debug builds only
         */
        static GRBConstr add(GRBModel& model,
            const GRBLinExpr& expr,
            Sense sense,
            double rhs,
            const std::string& name)
        {
            return model.addConstr(expr, constraint_detail::toGurobiSense(sense), rhs,
                make_name::passthrough(name));
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================

    /**
     * @class ConstraintTable
     * @brief Fixed-size registry of row lists keyed by an enum with COUNT
     *
     * @note Mirrors VariableTable.
     */
    template<
        typename EnumT,
        std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class ConstraintTable {
    public:
        using Group = std::vector<GRBConstr>;

        /// @throws std::out_of_range if key >= MAX
        void append(EnumT key, GRBConstr constr)
        {
            table_[index(key)].push_back(std::move(constr));
        }

        Group& get(EnumT key) { return table_[index(key)]; }
        const Group& get(EnumT key) const { return table_[index(key)]; }

        Group& operator()(EnumT key) { return get(key); }
        const Group& operator()(EnumT key) const { return get(key); }

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
                    std::format("ConstraintTable: key {} >= {}", idx, MAX));
            }
            return idx;
        }

        std::array<Group, MAX> table_;
    };

} // namespace planner
