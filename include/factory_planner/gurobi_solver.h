#pragma once
/*
===============================================================================
GUROBI SOLVER — LpSolver backed by the Gurobi C++ API
===============================================================================

Overview
--------
GurobiSolver loads a LinearProgram into a fresh GRBModel through a
ModelBuilder<ColumnBlock, RowGroup>, maximizes it and translates the Gurobi
status into an LpOutcome.

    * Columns become continuous variables in two blocks (resource flows,
      recipe throughputs), rows become linear constraints filed by group.
    * GRB_INF_OR_UNBD (presolve could not tell which) triggers a second
      optimize() with DualReductions = 0.
    * GRB_UNBOUNDED is confirmed by re-optimizing with a zero objective;
      a program whose rows have no solution is reported INFEASIBLE even
      when an improving ray exists.
    * For INFEASIBLE programs an IIS is computed (unless disabled in
      SolverSettings) and reported as row names, plus
      "<column> lower bound" / "<column> upper bound" entries.

After each solve, lastStore() holds the applied parameters and the
statistics recorded by the builder (see data_store.h).

Thread safety
-------------
A GurobiSolver may be used by one thread at a time. Independent solvers may
run in parallel; each solve owns its own environment unless one was shared
through the constructor.

===============================================================================
*/

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "data_store.h"
#include "diagnostics.h"
#include "formulation.h"
#include "lp_solver.h"
#include "model_builder.h"
#include "settings.h"

namespace planner {

    namespace gurobi_detail {

        /**
         * @class ProgramBuilder
         * @brief Loads one LinearProgram into Gurobi
         */
        class ProgramBuilder : public ModelBuilder<ColumnBlock, RowGroup> {
        public:
            using Base = ModelBuilder<ColumnBlock, RowGroup>;

            ProgramBuilder(const LinearProgram& program, const SolverSettings& settings)
                : program_(program), settings_(settings)
            {
            }

            ProgramBuilder(const LinearProgram& program, const SolverSettings& settings, GRBEnv& env)
                : Base(env), program_(program), settings_(settings)
            {
            }

            /// @brief Gurobi variable of a program column
            GRBVar& column(std::size_t index)
            {
                const std::size_t nResources = program_.resourceCount();
                if (index < nResources)
                    return variables()(ColumnBlock::ResourceFlow)(index);
                return variables()(ColumnBlock::RecipeRate)(index - nResources);
            }

            void configureEnvironment(GRBEnv& env) override
            {
                // silence the banner unless asked for output
                env.set(GRB_IntParam_OutputFlag, settings_.verbose ? 1 : 0);
                if (!settings_.logFile.empty())
                    env.set(GRB_StringParam_LogFile, settings_.logFile);
            }

            void addVariables() override
            {
                std::span<const LpColumn> all(program_.columns());
                const std::size_t nResources = program_.resourceCount();

                variables().set(ColumnBlock::ResourceFlow,
                    VariableFactory::add(model(), all.first(nResources)));
                variables().set(ColumnBlock::RecipeRate,
                    VariableFactory::add(model(), all.subspan(nResources)));
            }

            void addConstraints() override
            {
                for (const auto& row : program_.rows()) {
                    GRBLinExpr expr = 0;
                    for (const auto& term : row.terms)
                        expr += term.coefficient * column(term.column);

                    constraints().append(row.group,
                        ConstraintFactory::add(model(), expr, row.sense, row.rhs, row.name));
                }
            }

            void addParameters() override
            {
                apply(settings_);
            }

            void addObjective() override
            {
                GRBLinExpr objective = 0;
                const auto& columns = program_.columns();
                for (std::size_t i = 0; i < columns.size(); ++i) {
                    if (columns[i].objective != 0.0)
                        objective += columns[i].objective * column(i);
                }
                maximize(objective);
            }

            void afterOptimize() override
            {
                if (status() == GRB_INF_OR_UNBD) {
                    dualReductions(0);
                    model().optimize();
                }

                outcome_ = status();
                if (outcome_ == GRB_UNBOUNDED)
                    outcome_ = checkFeasibility();

                store_["stat:Status"] = statusString(outcome_);
                store_["stat:Runtime"] = runtime();
                store_["stat:IterCount"] = iterCount();
                store_["stat:Summary"] = modelSummary(model());
            }

            /**
             * @brief Status reported to callers
             *
             * Equal to status() except after an UNBOUNDED solve: then it is
             * INFEASIBLE when the rows admit no point at all.
             */
            int outcomeStatus() const noexcept { return outcome_; }

        private:
            /**
             * @brief Resolve an UNBOUNDED status into UNBOUNDED or INFEASIBLE
             *
             * An unbounded ray does not prove feasibility. Re-optimizing with
             * a zero objective answers it; the model keeps that objective.
             */
            int checkFeasibility()
            {
                model().setObjective(GRBLinExpr(0.0), GRB_MAXIMIZE);
                model().optimize();

                const int check = status();
                store_["stat:FeasibilityCheck"] = statusString(check);

                switch (check) {
                case GRB_OPTIMAL:
                    return GRB_UNBOUNDED;
                case GRB_INFEASIBLE:
                case GRB_INF_OR_UNBD:   // a zero objective cannot be unbounded
                    return GRB_INFEASIBLE;
                default:
                    return check;
                }
            }

            const LinearProgram& program_;
            const SolverSettings& settings_;
            int outcome_ = GRB_LOADED;
        };

    } // namespace gurobi_detail

    /**
     * @class GurobiSolver
     * @brief Default LpSolver of the planner
     *
     * @example
     *     GurobiSolver solver(SolverSettings::preset(SolverSettings::Preset::Fast));
     *     Factory factory = problem.solve(catalog, solver);
     *     std::cout << solver.lastStore().at("stat:Summary").get<std::string>() << "\n";
     */
    class GurobiSolver : public LpSolver {
    public:
        GurobiSolver() = default;

        explicit GurobiSolver(SolverSettings settings)
            : settings_(std::move(settings))
        {
        }

        /// @brief Reuse a started environment for every solve
        GurobiSolver(SolverSettings settings, GRBEnv& sharedEnv)
            : settings_(std::move(settings)), sharedEnv_(&sharedEnv)
        {
        }

        const SolverSettings& settings() const noexcept { return settings_; }

        /// @brief Parameters and statistics recorded by the most recent solve
        const DataStore& lastStore() const noexcept { return lastStore_; }

        /// @throws GRBException on Gurobi errors (licence, invalid data)
        LpOutcome solve(const LinearProgram& program) override
        {
            using gurobi_detail::ProgramBuilder;

            std::unique_ptr<ProgramBuilder> builder = sharedEnv_
                ? std::make_unique<ProgramBuilder>(program, settings_, *sharedEnv_)
                : std::make_unique<ProgramBuilder>(program, settings_);

            builder->optimize();

            LpOutcome outcome;
            const int status = builder->outcomeStatus();
            outcome.statusText = statusString(status);

            switch (status) {
            case GRB_OPTIMAL:
                outcome.status = LpStatus::Optimal;
                outcome.objective = builder->objVal();
                outcome.values.reserve(program.columns().size());
                for (std::size_t i = 0; i < program.columns().size(); ++i)
                    outcome.values.push_back(value(builder->column(i)));
                break;

            case GRB_INFEASIBLE:
                outcome.status = LpStatus::Infeasible;
                if (settings_.explainInfeasible)
                    outcome.conflicts = explain(builder->model(), program);
                break;

            case GRB_UNBOUNDED:
                outcome.status = LpStatus::Unbounded;
                break;

            default:
                outcome.status = LpStatus::Other;
                break;
            }

            lastStore_ = builder->store();
            return outcome;
        }

    private:
        static std::vector<std::string> explain(GRBModel& model, const LinearProgram& program)
        {
            IISResult iis = computeIIS(model);

            std::vector<std::string> names;
            names.reserve(iis.size());

            for (int row : iis.constraints)
                names.push_back(program.rows()[static_cast<std::size_t>(row)].name);
            for (int col : iis.lowerBounds)
                names.push_back(program.columns()[static_cast<std::size_t>(col)].name + " lower bound");
            for (int col : iis.upperBounds)
                names.push_back(program.columns()[static_cast<std::size_t>(col)].name + " upper bound");

            return names;
        }

        SolverSettings settings_;
        GRBEnv* sharedEnv_ = nullptr;
        DataStore lastStore_;
    };

} // namespace planner
