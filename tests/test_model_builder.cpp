/*
===============================================================================
TEST MODEL BUILDER - Variables, constraint families, sums and the builder
===============================================================================

OVERVIEW
--------
Exercises the modeling layer the two exact planners are written in:
dense and sparse variable families, named constraint families with
optional generators, the sum helpers, parameter bookkeeping and the
cancellation callback.

TEST ORGANIZATION
-----------------
• Section A: Variables (dense and sparse)
• Section B: Constraint families
• Section C: Builder lifecycle and parameters
• Section D: Cancellation

TEST STRATEGY
-------------
Every case builds a small Gurobi model and SKIPs when no environment can
start; the CancellationToken case needs no solver.

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <linemind/callbacks.h>
#include <linemind/constraints.h>
#include <linemind/diagnostics.h>
#include <linemind/expressions.h>
#include <linemind/indexing.h>
#include <linemind/model_builder.h>
#include <linemind/variables.h>

#include "test_support.h"

using namespace linemind;
using Catch::Approx;

// ============================================================================
// TEST UTILITIES
// ============================================================================

LINEMIND_ENUM_WITH_COUNT(PickVars, Take, Pair);
LINEMIND_ENUM_WITH_COUNT(PickCons, Budget, PairLink);

/**
 * @brief Pick at most `budget` of four items; a pair bonus variable exists
 *        only for (i, j) with i < j and is linked to both picks
 */
class PickBuilder : public ModelBuilder<PickVars, PickCons> {
    IndexList I_ = range(0, 4);
    std::unique_ptr<CancellationCallback> callback_;

public:
    int budget = 2;
    std::optional<CancellationToken> token;
    GRBCallback* observer = nullptr;
    std::optional<SolveState> stateBeforeOptimize;
    std::optional<SolveState> stateAfterOptimize;

    void addVariables() override {
        variables().set(PickVars::Take, VariableFactory::add(model(), GRB_BINARY, 0.0, 1.0, "take", I_.size()));
        variables().set(PickVars::Pair, VariableFactory::addIndexed(model(), GRB_BINARY, 0.0, 1.0, "pair",
            (I_ * I_) | filter([](int i, int j) { return i < j; })));
        store()["items"] = I_.size();
    }

    void addConstraints() override {
        auto& take = variables()(PickVars::Take);
        auto& pair = variables()(PickVars::Pair).asIndexed();

        constraints().set(PickCons::Budget,
            ConstraintFactory::addIndexed(model(), "budget", range(0, 1), [&](int) {
                return sum(I_, [&](int i) { return take(i); }) <= budget;
            }));
        constraints().set(PickCons::PairLink,
            ConstraintFactory::addIndexed(model(), "link", I_ * I_, [&](int i, int j) -> std::optional<GRBTempConstr> {
                const GRBVar* p = pair.try_get(i, j);
                if (!p)
                    return std::nullopt;
                return 2.0 * *p <= take(i) + take(j);
            }));
    }

    void addParameters() override {
        quiet();
        threads(1);
        timeLimit(10.0);
    }

    void addObjective() override {
        auto& take = variables()(PickVars::Take).asGroup();
        const auto& pair = variables()(PickVars::Pair).asIndexed();
        GRBLinExpr value = sum(I_, [&](int i) { return (i + 1.0) * take(i); });
        value += 0.5 * sum(pair);
        minimize(-1.0 * value);
    }

    const CancellationCallback* callback() const { return callback_.get(); }

    void beforeOptimize() override {
        stateBeforeOptimize = state();
        if (token) {
            callback_ = std::make_unique<CancellationCallback>(*token);
            model().setCallback(callback_.get());
        }
        else if (observer) {
            model().setCallback(observer);
        }
    }

    void afterOptimize() override { stateAfterOptimize = state(); }
};

/// @brief Records the builder's state on the first solver callback
class StateObserver : public GRBCallback {
    const PickBuilder& builder_;

public:
    std::optional<SolveState> seen;

    explicit StateObserver(const PickBuilder& builder) : builder_(builder) {}

protected:
    void callback() override {
        if (!seen)
            seen = builder_.state();
    }
};

// ============================================================================
// SECTION A: VARIABLES
// ============================================================================

TEST_CASE("A1: VariableFactory::DenseShapeAndBounds", "[modeling][variables][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    b.initialize();
    auto group = VariableFactory::add(b.model(), GRB_CONTINUOUS, 0.0, 5.0, "q", 2, 3);
    b.model().update();

    CHECK(group.dimension() == 2u);
    CHECK(group.size(0) == 2);
    CHECK(group.size(1) == 3);
    CHECK(group.total() == 6u);
    CHECK(group(1, 2).get(GRB_DoubleAttr_UB) == Approx(5.0));
    CHECK_THROWS_AS(group.at(2, 0), std::out_of_range);
    CHECK_THROWS_AS(group.at(0), std::out_of_range);
}

TEST_CASE("A2: VariableFactory::SparseFromFilter", "[modeling][variables][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    b.initialize();
    auto set = VariableFactory::addIndexed(b.model(), GRB_BINARY, 0.0, 1.0, "z",
        (range(0, 3) * range(0, 3)) | filter([](int i, int j) { return i != j; }));

    CHECK(set.size() == 6u);
    CHECK(set.contains(0, 1));
    CHECK_FALSE(set.contains(1, 1));
    CHECK(set.try_get(2, 2) == nullptr);
    CHECK_THROWS_AS(set.at(2, 2), std::out_of_range);
}

TEST_CASE("A3: VariableContainer::DenseOrSparse", "[modeling][variables][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    b.optimize();

    CHECK(b.variables()(PickVars::Take).isDense());
    CHECK(b.variables()(PickVars::Pair).isSparse());
    CHECK_THROWS(b.variables()(PickVars::Take).asIndexed());
    CHECK(valueAt(b.variables()(PickVars::Pair), 3, 0) == 0.0);
}

// ============================================================================
// SECTION B: CONSTRAINT FAMILIES
// ============================================================================

TEST_CASE("B1: ConstraintFactory::NamesAndSkippedEntries", "[modeling][constraints][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    b.optimize();

    const auto& link = b.constraints()(PickCons::PairLink);
    CHECK(link.size() == 6u);
    CHECK(link.contains(0, 3));
    CHECK_FALSE(link.contains(3, 0));
    CHECK(b.constraints()(PickCons::Budget).begin()->name == "budget[0]");
    CHECK(b.constraints().total() == 7u);
}

// ============================================================================
// SECTION C: BUILDER LIFECYCLE
// ============================================================================

TEST_CASE("C1: ModelBuilder::SolvesAndRecordsParameters", "[modeling][builder][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    b.optimize();
    REQUIRE(b.isOptimal());

    // items 3 and 4 (values 3 + 4) plus their pair bonus
    CHECK(b.objVal() == Approx(-7.5));
    CHECK(value(b.variables()(PickVars::Take)(3)) == Approx(1.0));
    CHECK(valueAt(b.variables()(PickVars::Pair), 2, 3) == Approx(1.0));

    CHECK(b.store().at("param:Threads").get<int>() == 1);
    CHECK(b.store().at("param:TimeLimit").get<double>() == Approx(10.0));
    CHECK(b.store().at("items").get<int>() == 4);
}

TEST_CASE("C2: ModelBuilder::InitializeIsIdempotent", "[modeling][builder][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    CHECK_FALSE(b.initialized());
    b.initialize();
    b.initialize();
    CHECK(b.initialized());
}

TEST_CASE("C3: ModelBuilder::TracksSolveState", "[modeling][builder][state][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    StateObserver observer(b);
    b.observer = &observer;

    CHECK_FALSE(b.state().has_value());
    b.optimize();

    CHECK(b.stateBeforeOptimize == SolveState::Built);
    if (observer.seen)
        CHECK(*observer.seen == SolveState::Solving);
    CHECK(b.stateAfterOptimize == SolveState::Optimal);
    CHECK(b.state() == SolveState::Optimal);
}

// ============================================================================
// SECTION D: CANCELLATION
// ============================================================================

TEST_CASE("D1: CancellationToken::CopiesShareState", "[modeling][callbacks]")
{
    CancellationToken a;
    CancellationToken b = a;
    CHECK_FALSE(b.cancelled());
    a.cancel();
    CHECK(b.cancelled());
    b.reset();
    CHECK_FALSE(a.cancelled());
}

TEST_CASE("D2: CancellationCallback::StopsWithoutPlanOrFinishes", "[modeling][callbacks][gurobi]")
{
    REQUIRE_GUROBI();

    PickBuilder b;
    b.token = CancellationToken{};
    b.token->cancel();
    b.optimize();

    // presolve may solve a model this small before the first callback
    const SolveState state = classifyStatus(b.status(), b.solutionCount());
    REQUIRE(b.callback() != nullptr);
    if (b.status() == GRB_INTERRUPTED) {
        CHECK(b.callback()->aborted());
        CHECK((state == SolveState::Timeout || state == SolveState::Feasible));
    }
    else
        CHECK(state == SolveState::Optimal);
}
