#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration of a Gurobi solve
===============================================================================

Overview
--------
ModelBuilder owns the Gurobi environment and model of one solve and runs the
build steps in a fixed order:

    optimize() {
        initialize();          // GRBEnv (deferred start) + GRBModel
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Derived builders override the hooks. Columns and rows are filed in
enum-keyed tables (VariableTable<VarEnum>, ConstraintTable<ConEnum>), and
every parameter set through the named setters is recorded in store() under
"param:<Name>".

Environment sharing
-------------------
By default each builder creates, starts and releases its own GRBEnv. A caller
that runs many solves may pass a started GRBEnv instead; the builder then only
owns its GRBModel. A shared environment must not be used by two builders at
the same time.

Typical Usage
-------------
    class MyBuilder : public planner::ModelBuilder<ColumnBlock, RowGroup> {
        void addVariables() override   { ... variables().set(...); }
        void addConstraints() override { ... constraints().append(...); }
        void addObjective() override   { maximize(expr); }
    };

    MyBuilder b;
    b.optimize();
    if (b.isOptimal()) { ... }

===============================================================================
*/

#include <memory>
#include <string>
#include <utility>

#include "gurobi_c++.h"

#include "constraints.h"
#include "data_store.h"
#include "settings.h"
#include "variables.h"

namespace planner {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        GRBEnv* shared_env_ = nullptr;
        std::unique_ptr<GRBModel> model_;

        bool initialized_ = false;

    protected:
        VarTable vars_;
        ConTable cons_;
        DataStore store_;

    public:
        // -------------------------------------------------------------------------
        // Constructors
        // -------------------------------------------------------------------------

        /// @brief No environment or model is created until initialize()
        ModelBuilder() = default;

        /**
         * @brief Build the model in a caller-owned, already started environment
         * @note configureEnvironment() is not called in this mode
         */
        explicit ModelBuilder(GRBEnv& sharedEnv)
            : shared_env_(&sharedEnv)
        {
        }

        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------

        /**
         * @brief Create environment (if owned) and model; runs once
         * @throws GRBException if the environment cannot start (e.g. no licence)
         */
        void initialize()
        {
            if (initialized_)
                return;

            if (shared_env_) {
                model_ = std::make_unique<GRBModel>(*shared_env_);
            }
            else {
                env_ = std::make_unique<GRBEnv>(true);  // defer licence check
                configureEnvironment(*env_);
                env_->start();
                model_ = std::make_unique<GRBModel>(*env_);
            }

            initialized_ = true;
        }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------

        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        const GRBModel& model() const
        {
            return *model_;
        }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameters
        // -------------------------------------------------------------------------

        template <typename Param, typename Val>
        void setParam(Param p, Val&& value)
        {
            model().set(p, std::forward<Val>(value));
        }

        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds);
            store_["param:TimeLimit"] = seconds;
        }

        void threads(int n) {
            setParam(GRB_IntParam_Threads, n);
            store_["param:Threads"] = n;
        }

        void presolve(int level) {
            setParam(GRB_IntParam_Presolve, level);
            store_["param:Presolve"] = level;
        }

        void feasibilityTol(double tol) {
            setParam(GRB_DoubleParam_FeasibilityTol, tol);
            store_["param:FeasibilityTol"] = tol;
        }

        void optimalityTol(double tol) {
            setParam(GRB_DoubleParam_OptimalityTol, tol);
            store_["param:OptimalityTol"] = tol;
        }

        /// @brief 0 lets presolve distinguish infeasible from unbounded
        void dualReductions(int flag) {
            setParam(GRB_IntParam_DualReductions, flag);
            store_["param:DualReductions"] = flag;
        }

        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0);
            store_["param:OutputFlag"] = 0;
        }

        void verbose() {
            setParam(GRB_IntParam_OutputFlag, 1);
            store_["param:OutputFlag"] = 1;
        }

        void logFile(const std::string& path) {
            setParam(GRB_StringParam_LogFile, path);
            store_["param:LogFile"] = path;
        }

        /// @brief Apply every field of settings that is set
        void apply(const SolverSettings& settings)
        {
            if (settings.verbose)
                verbose();
            else
                quiet();

            if (!settings.logFile.empty())
                logFile(settings.logFile);
            if (settings.timeLimit)
                timeLimit(*settings.timeLimit);
            if (settings.threads)
                threads(*settings.threads);
            if (settings.presolve)
                presolve(*settings.presolve);
            if (settings.feasibilityTol)
                feasibilityTol(*settings.feasibilityTol);
            if (settings.optimalityTol)
                optimalityTol(*settings.optimalityTol);
        }

        // -------------------------------------------------------------------------
        // Objective
        // -------------------------------------------------------------------------

        void maximize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MAXIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution diagnostics (after optimize())
        // -------------------------------------------------------------------------

        int status() const {
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const { return status() == GRB_OPTIMAL; }
        bool isInfeasible() const { return status() == GRB_INFEASIBLE; }
        bool isUnbounded() const { return status() == GRB_UNBOUNDED; }

        /// @throws GRBException if no solution is available
        double objVal() const {
            return model().get(GRB_DoubleAttr_ObjVal);
        }

        double runtime() const {
            return model().get(GRB_DoubleAttr_Runtime);
        }

        double iterCount() const {
            return model().get(GRB_DoubleAttr_IterCount);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks
        // -------------------------------------------------------------------------

        /// @brief Configure an owned environment before it starts
        virtual void configureEnvironment(GRBEnv& env) {}

        virtual void addParameters() {}
        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}
        virtual void beforeOptimize() {}
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace planner
