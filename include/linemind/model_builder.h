#pragma once
/*
===============================================================================
MODEL BUILDER - Lifecycle of one exact planning model
===============================================================================

Overview
--------
ModelBuilder owns the solver environment and model of a single exact
planning run (production mix or shift schedule) and drives it through a
fixed sequence:

    initialize() {
        env = GRBEnv(deferred); configureEnvironment(env); env.start();
        model = GRBModel(env);
    }
    optimize() {
        addVariables();
        addConstraints();
        addParameters();
        addObjective();             // state: Built
        beforeOptimize();
        model.optimize();           // state: Solving
        afterOptimize();            // state: classifyStatus(status, solCount)
    }

Derived builders (MixModelBuilder, ShiftModelBuilder) override the hooks and
never touch GRBEnv directly.

Key Features
------------
1. Lazy initialization: the constructor does no solver work, so building a
   strategy object never requires a license. The first model() call or
   optimize() creates the environment. A missing library or license
   surfaces there as GRBException, which the strategies map to
   SolverUnavailableError.

2. Per-run ownership: environment and model are owned through unique_ptr
   and released with the builder. Builders are not shared across runs.

3. Tracked parameters: timeLimit(), threads(), seed(), mipGapLimit() and
   quiet() record what was applied in store() ("param:TimeLimit", ...), which
   is what tests and diagnostics read back.

4. Solution accessors: status(), solutionCount(), objVal(), mipGap(),
   runtime(), hasSolution().

5. Solve state: state() follows Built → Solving → terminal state. It is
   empty until the model is built, and afterOptimize() already sees the
   terminal state.

Typical Usage
-------------
    LINEMIND_ENUM_WITH_COUNT(MixVars, Quantity, Assign, Changeover);
    LINEMIND_ENUM_WITH_COUNT(MixCons, OneProduct, Capacity, Demand, Changeover);

    class MixModelBuilder : public ModelBuilder<MixVars, MixCons> {
        void addVariables() override { ... }
        void addConstraints() override { ... }
        void addObjective() override { minimize(...); }
    };

    MixModelBuilder b(input);
    b.optimize();
    auto state = classifyStatus(b.status(), b.solutionCount());

===============================================================================
*/

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "gurobi_c++.h"

#include "constraints.h"
#include "data_store.h"
#include "diagnostics.h"
#include "variables.h"

namespace linemind {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;
        bool initialized_ = false;
        std::optional<SolveState> state_;

    protected:
        VarTable vars_;
        ConTable cons_;
        DataStore store_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------
        /**
         * @brief Creates and starts the environment, then the model
         * @throws GRBException when the environment cannot start (license,
         *         missing shared library, size limits)
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);  // defer license check
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        [[nodiscard]] bool initialized() const noexcept { return initialized_; }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------
        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        const GRBModel& model() const { return *model_; }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameters
        // -------------------------------------------------------------------------

        /// @brief Sets a Gurobi parameter and records it as store()["param:<name>"]
        template <typename Param, typename Val>
        void setParam(Param p, Val value, const std::string& name)
        {
            model().set(p, value);
            store_[std::string("param:") + name] = value;
        }

        /// @brief Wall-clock limit in seconds
        void timeLimit(double seconds) { setParam(GRB_DoubleParam_TimeLimit, seconds, "TimeLimit"); }

        /// @brief Relative MIP gap at which the solve stops (fraction, 0.01 = 1%)
        void mipGapLimit(double gap) { setParam(GRB_DoubleParam_MIPGap, gap, "MIPGap"); }

        /// @brief Thread count; 1 makes runs reproducible
        void threads(int n) { setParam(GRB_IntParam_Threads, n, "Threads"); }

        /// @brief Random seed of the solver's internal heuristics
        void seed(int s) { setParam(GRB_IntParam_Seed, s, "Seed"); }

        void quiet() { setParam(GRB_IntParam_OutputFlag, 0, "OutputFlag"); }

        // -------------------------------------------------------------------------
        // Objective
        // -------------------------------------------------------------------------
        void minimize(const GRBLinExpr& expr) { model().setObjective(expr, GRB_MINIMIZE); }

        // -------------------------------------------------------------------------
        // Solution diagnostics (valid after optimize())
        // -------------------------------------------------------------------------
        int status() const { return model().get(GRB_IntAttr_Status); }

        int solutionCount() const { return model().get(GRB_IntAttr_SolCount); }

        bool isOptimal() const { return status() == GRB_OPTIMAL; }

        bool hasSolution() const { return solutionCount() > 0; }

        /// @throws GRBException if no solution is available
        double objVal() const { return model().get(GRB_DoubleAttr_ObjVal); }

        /// @note Meaningful for MIP models with an incumbent
        double mipGap() const { return model().get(GRB_DoubleAttr_MIPGap); }

        double runtime() const { return model().get(GRB_DoubleAttr_Runtime); }

        /// @brief Lifecycle state; empty before optimize() has built the model
        std::optional<SolveState> state() const noexcept { return state_; }

        // -------------------------------------------------------------------------
        // Template-method hooks
        // -------------------------------------------------------------------------

        /// @brief Environment parameters applied before start()
        virtual void configureEnvironment(GRBEnv& env) { env.set(GRB_IntParam_OutputFlag, 0); }

        virtual void addParameters() {}
        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}

        /// @brief Last hook before optimize (callbacks, warm starts)
        virtual void beforeOptimize() {}

        /// @brief First hook after optimize (status logging)
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Orchestration
        // -------------------------------------------------------------------------
        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();
            state_ = SolveState::Built;

            beforeOptimize();
            state_ = SolveState::Solving;
            model().optimize();
            state_ = classifyStatus(status(), solutionCount());
            afterOptimize();

            return model();
        }
    };

} // namespace linemind
