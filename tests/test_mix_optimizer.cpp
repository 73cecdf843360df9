/*
===============================================================================
TEST MIX OPTIMIZER - Heuristic split and exact MILP assignment
===============================================================================

TEST ORGANIZATION
-----------------
• Section A: HeuristicMixStrategy
• Section B: ExactMixStrategy without a solver run (input handling)
• Section C: ExactMixStrategy with Gurobi
• Section D: runMixOptimization() envelopes

TEST STRATEGY
-------------
Section C needs a working Gurobi environment and SKIPs otherwise. Its
scenarios are built so that the optimal plan is unique, or unique after the
line-rank tie-break, so exact entries can be asserted.

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <linemind/mix_optimizer.h>
#include <linemind/planner.h>

#include "test_support.h"

using namespace linemind;
using namespace linemind::test;
using Catch::Approx;

namespace {

    const MixPlanEntry* findEntry(const MixPlan& plan, int period, const std::string& line) {
        for (const auto& e : plan.entries) {
            if (e.period == period && e.lineId == line)
                return &e;
        }
        return nullptr;
    }

    /// @brief A on days [0, 7), B on days [7, 14)
    DemandSeries alternatingDemand(double perDay) {
        auto a = flatSeries("A", kStart, 14, perDay);
        auto b = flatSeries("B", kStart, 14, perDay);
        for (int d = 0; d < 14; ++d) {
            auto& off = d < 7 ? b[static_cast<std::size_t>(d)] : a[static_cast<std::size_t>(d)];
            off.forecastUnits = 0.0;
        }
        return DemandSeries{ { "A", a }, { "B", b } };
    }

    ChangeoverTable abChangeovers() {
        return ChangeoverTable({ { "A", "B", 4.0, 500.0 }, { "B", "A", 3.0, 400.0 } });
    }

} // namespace

// ============================================================================
// SECTION A: HEURISTIC
// ============================================================================

TEST_CASE("A1: HeuristicMix::EvenSplitAcrossEligibleLines", "[mix][heuristic]")
{
    std::vector<Line> lines{ makeLine("L2", "A", 150.0), makeLine("L1", "A", 150.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };
    demand["A"][0].forecastUnits = 101.0;

    const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
    REQUIRE(r.ok());

    const auto& entries = r.payload().entries;
    REQUIRE(entries.size() == 2u);
    CHECK(entries[0].lineId == "L1");
    CHECK(entries[0].plannedUnits == 351);
    CHECK(entries[1].lineId == "L2");
    CHECK(entries[1].plannedUnits == 350);
    CHECK(entries[0].period == 1);
    CHECK(entries[0].utilization == Approx(351.0 / 1050.0));

    const auto& kpi = r.kpis();
    CHECK(kpi.totalDemand == 701);
    CHECK(kpi.totalPlanned == 701);
    CHECK(kpi.fulfillmentRate == Approx(100.0));
    CHECK(kpi.productionCost == Approx(701.0 * 1000.0));
    CHECK(kpi.strategy == Strategy::Heuristic);
}

TEST_CASE("A2: HeuristicMix::ClampsAtCapacity", "[mix][heuristic]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 10.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };

    const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
    REQUIRE(r.ok());
    REQUIRE(r.payload().entries.size() == 1u);
    CHECK(r.payload().entries[0].plannedUnits == 70);
    CHECK(r.payload().entries[0].utilization == Approx(1.0));
    CHECK(r.kpis().fulfillmentRate == Approx(10.0));
}

TEST_CASE("A3: HeuristicMix::RemainingCapacityIsShared", "[mix][heuristic]")
{
    std::vector<Line> lines{ makeLine("L1", "A,B", 100.0) };
    DemandSeries demand{
        { "A", flatSeries("A", kStart, 7, 500.0 / 7.0) },
        { "B", flatSeries("B", kStart, 7, 500.0 / 7.0) },
    };

    const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
    REQUIRE(r.ok());
    REQUIRE(r.payload().entries.size() == 2u);
    CHECK(r.payload().entries[0].product == "A");
    CHECK(r.payload().entries[0].plannedUnits == 500);
    CHECK(r.payload().entries[1].product == "B");
    CHECK(r.payload().entries[1].plannedUnits == 200);
    CHECK(r.kpis().totalPlanned == 700);
    CHECK(r.kpis().totalDemand == 1000);
}

TEST_CASE("A4: HeuristicMix::UnassignedProducts", "[mix][heuristic]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 100.0) };
    DemandSeries demand{
        { "A", flatSeries("A", kStart, 7, 10.0) },
        { "C", flatSeries("C", kStart, 7, 10.0) },
    };

    const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
    REQUIRE(r.ok());
    CHECK(r.payload().entries.size() == 1u);
    CHECK(r.kpis().unassignedProducts == 1);
    CHECK(r.kpis().fulfillmentRate == Approx(50.0));
}

TEST_CASE("A5: HeuristicMix::OnlyFirstWeekIsPlanned", "[mix][heuristic]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 1000.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 30, 10.0) } };

    const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
    REQUIRE(r.ok());
    CHECK(r.kpis().totalDemand == 70);
    for (const auto& e : r.payload().entries)
        CHECK(e.period == 1);
}

TEST_CASE("A6: HeuristicMix::EmptyDemand", "[mix][heuristic]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 100.0) };
    const auto r = HeuristicMixStrategy{}.solve(DemandSeries{}, lines, PlanningConfig{});
    REQUIRE(r.ok());
    CHECK(r.payload().entries.empty());
    CHECK(r.kpis().fulfillmentRate == Approx(100.0));
}

TEST_CASE("A7: HeuristicMix::FractionalCapacityIsFloored", "[mix][heuristic]")
{
    // 100.5 units/day is 703 whole units per week, as in the exact model
    std::vector<Line> lines{ makeLine("L1", "A", 100.5) };

    SECTION("below capacity") {
        DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };
        const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
        REQUIRE(r.ok());
        REQUIRE(r.payload().entries.size() == 1u);
        CHECK(r.payload().entries[0].plannedUnits == 700);
        CHECK(r.payload().entries[0].utilization == Approx(700.0 / 703.0));
    }
    SECTION("clamped") {
        DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 110.0) } };
        const auto r = HeuristicMixStrategy{}.solve(demand, lines, PlanningConfig{});
        REQUIRE(r.ok());
        REQUIRE(r.payload().entries.size() == 1u);
        CHECK(r.payload().entries[0].plannedUnits == 703);
        CHECK(r.payload().entries[0].utilization == Approx(1.0));
    }
}

// ============================================================================
// SECTION B: EXACT, INPUT HANDLING
// ============================================================================

TEST_CASE("B1: MixModelInput::WeeksAndDemandMatrix", "[mix][exact][input]")
{
    std::vector<Line> lines{ makeLine("L2", "B", 100.0), makeLine("L1", "A,B", 100.0) };
    const auto input = MixModelInput::from(alternatingDemand(10.0), lines, abChangeovers(), PlanningConfig{});

    CHECK(input.weeks == 2);
    REQUIRE(input.lines.size() == 2u);
    CHECK(input.lines[0].lineId == "L1");
    CHECK(input.products == std::vector<std::string>{ "A", "B" });
    CHECK(input.demand[0] == std::vector<int>{ 70, 0 });
    CHECK(input.demand[1] == std::vector<int>{ 0, 70 });
    CHECK(input.weeklyCapacity[0] == 700);
    CHECK(input.changeoverCost[0][1] == Approx(500.0));
    CHECK(input.changeoverCost[1][0] == Approx(400.0));
    CHECK(input.eligible(0, 1));
    CHECK_FALSE(input.eligible(1, 0));
    CHECK(input.legend() == "lines: 0=L1, 1=L2; products: 0=A, 1=B");
}

TEST_CASE("B2: MixModelInput::ShortHorizonIsOneWeek", "[mix][exact][input]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 100.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 3, 10.0) } };
    const auto input = MixModelInput::from(demand, lines, ChangeoverTable{}, PlanningConfig{});
    CHECK(input.weeks == 1);
    CHECK(input.demand[0][0] == 30);
}

TEST_CASE("B3: ExactMix::MissingChangeoverPairIsDataShapeError", "[mix][exact][error]")
{
    std::vector<Line> lines{ makeLine("L1", "A,B", 100.0) };
    ChangeoverTable partial({ { "A", "B", 1.0, 10.0 } });

    try {
        (void)ExactMixStrategy{}.solve(alternatingDemand(10.0), lines, partial, PlanningConfig{});
        FAIL("expected DataShapeError");
    }
    catch (const DataShapeError& e) {
        REQUIRE(e.details().size() == 1u);
        CHECK(e.details().front() == "B -> A");
    }
}

TEST_CASE("B4: ExactMix::NoDemandIsEmptyPlan", "[mix][exact]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 100.0) };
    const auto r = ExactMixStrategy{}.solve(DemandSeries{}, lines, ChangeoverTable{}, PlanningConfig{});
    REQUIRE(r.ok());
    CHECK(r.payload().entries.empty());
    CHECK(r.kpis().strategy == Strategy::Exact);
}

// ============================================================================
// SECTION C: EXACT WITH GUROBI
// ============================================================================

TEST_CASE("C1: ExactMix::EligibilityForcesAssignment", "[mix][exact][gurobi]")
{
    REQUIRE_GUROBI();

    std::vector<Line> lines{ makeLine("L1", "A,B", 100.0), makeLine("L2", "B", 100.0) };
    DemandSeries demand{
        { "A", flatSeries("A", kStart, 14, 70.0) },
        { "B", flatSeries("B", kStart, 14, 50.0) },
    };

    const auto r = ExactMixStrategy{}.solve(demand, lines, abChangeovers(), PlanningConfig{});
    REQUIRE(r.ok());

    const auto& plan = r.payload();
    REQUIRE(plan.entries.size() == 4u);
    for (int period : { 1, 2 }) {
        const auto* l1 = findEntry(plan, period, "L1");
        const auto* l2 = findEntry(plan, period, "L2");
        REQUIRE(l1);
        REQUIRE(l2);
        CHECK(l1->product == "A");
        CHECK(l1->plannedUnits == 490);
        CHECK(l1->utilization == Approx(0.7));
        CHECK(l2->product == "B");
        CHECK(l2->plannedUnits == 350);
    }

    const auto& kpi = r.kpis();
    CHECK(kpi.strategy == Strategy::Exact);
    CHECK(kpi.provenOptimal);
    CHECK(kpi.changeovers == 0);
    CHECK(kpi.fulfillmentRate == Approx(100.0));
    CHECK(kpi.totalCost == Approx(1680.0 * 1000.0));
}

TEST_CASE("C2: ExactMix::ChangeoverIsCounted", "[mix][exact][gurobi]")
{
    REQUIRE_GUROBI();

    std::vector<Line> lines{ makeLine("L1", "A,B", 200.0) };
    const auto r = ExactMixStrategy{}.solve(alternatingDemand(100.0), lines, abChangeovers(), PlanningConfig{});
    REQUIRE(r.ok());

    const auto& plan = r.payload();
    REQUIRE(plan.entries.size() == 2u);
    CHECK(plan.entries[0].period == 1);
    CHECK(plan.entries[0].product == "A");
    CHECK(plan.entries[0].plannedUnits == 700);
    CHECK(plan.entries[1].period == 2);
    CHECK(plan.entries[1].product == "B");

    const auto& kpi = r.kpis();
    CHECK(kpi.changeovers == 1);
    CHECK(kpi.changeoverCost == Approx(500.0));
    CHECK(kpi.changeoverHours == Approx(4.0));
    CHECK(kpi.totalCost == Approx(1400.0 * 1000.0 + 500.0));
}

TEST_CASE("C3: ExactMix::TiesGoToLowerLineId", "[mix][exact][gurobi]")
{
    REQUIRE_GUROBI();

    // with free production only the rank term separates L1 from L2
    std::vector<Line> lines{ makeLine("L2", "A", 200.0), makeLine("L1", "A", 200.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };
    PlanningConfig config;
    config.unitCost = 0.0;

    const auto r = ExactMixStrategy{}.solve(demand, lines, ChangeoverTable{}, config);
    REQUIRE(r.ok());
    REQUIRE(r.payload().entries.size() == 1u);
    CHECK(r.payload().entries[0].lineId == "L1");
    CHECK(r.payload().entries[0].plannedUnits >= 700);
}

TEST_CASE("C4: ExactMix::PlanRespectsCapacityAndOneProduct", "[mix][exact][gurobi]")
{
    REQUIRE_GUROBI();

    std::vector<Line> lines{
        makeLine("L1", "A,B,C", 120.0),
        makeLine("L2", "A,B", 90.0),
        makeLine("L3", "C", 60.0),
    };
    DemandSeries demand{
        { "A", flatSeries("A", kStart, 21, 60.0) },
        { "B", flatSeries("B", kStart, 21, 40.0) },
        { "C", flatSeries("C", kStart, 21, 30.0) },
    };
    ChangeoverTable changeovers;
    for (const char* m : { "A", "B", "C" })
        for (const char* n : { "A", "B", "C" })
            if (std::string(m) != n)
                changeovers.add({ m, n, 2.0, 250.0 });

    const auto r = ExactMixStrategy{}.solve(demand, lines, changeovers, PlanningConfig{});
    REQUIRE(r.ok());

    std::map<std::pair<int, std::string>, int> perLineWeek;
    std::map<std::pair<std::string, int>, int> perProductWeek;
    for (const auto& e : r.payload().entries) {
        const auto line = std::find_if(lines.begin(), lines.end(),
            [&](const Line& l) { return l.lineId == e.lineId; });
        REQUIRE(line != lines.end());
        CHECK(line->canRun(e.product));
        CHECK(e.plannedUnits <= static_cast<int>(line->weeklyCapacity()));
        ++perLineWeek[{ e.period, e.lineId }];
        perProductWeek[{ e.product, e.period }] += e.plannedUnits;
    }
    for (const auto& [key, count] : perLineWeek)
        CHECK(count == 1);
    for (int w = 1; w <= 3; ++w) {
        CHECK(perProductWeek[{ "A", w }] >= 420);
        CHECK(perProductWeek[{ "B", w }] >= 280);
        CHECK(perProductWeek[{ "C", w }] >= 210);
    }
    CHECK(r.kpis().fulfillmentRate >= 100.0);
}

TEST_CASE("C5: ExactMix::DemandAboveCapacityIsInfeasible", "[mix][exact][gurobi][error]")
{
    REQUIRE_GUROBI();

    std::vector<Line> lines{ makeLine("L1", "A", 100.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 300.0) } };

    try {
        (void)ExactMixStrategy{}.solve(demand, lines, ChangeoverTable{}, PlanningConfig{});
        FAIL("expected InfeasibleModelError");
    }
    catch (const InfeasibleModelError& e) {
        CHECK(e.suggestion() == "relax capacity or eligibility constraints");
        REQUIRE_FALSE(e.details().empty());
        CHECK(e.details().back() == "lines: 0=L1; products: 0=A");
    }
}

// ============================================================================
// SECTION D: ENVELOPES
// ============================================================================

TEST_CASE("D1: RunMixOptimization::HeuristicByDefault", "[mix][planner]")
{
    std::vector<Line> lines{ makeLine("L1", "A", 150.0), makeLine("L2", "A", 150.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };

    const auto r = runMixOptimization(demand, lines, ChangeoverTable{});
    REQUIRE(r.ok());
    CHECK(r.kpis().strategy == Strategy::Heuristic);
    CHECK(r.payload().totalPlanned() == 700);
}

TEST_CASE("D2: RunMixOptimization::NoLinesIsDataShapeFailure", "[mix][planner][error]")
{
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };
    for (Strategy s : { Strategy::Heuristic, Strategy::Exact }) {
        PlanningConfig config;
        config.mixStrategy = s;
        const auto r = runMixOptimization(demand, std::vector<Line>{}, ChangeoverTable{}, config);
        REQUIRE_FALSE(r.ok());
        CHECK(r.failure().code == ErrorCode::DataShapeError);
    }
}

TEST_CASE("D3: RunMixOptimization::InfeasibleEnvelope", "[mix][planner][gurobi][error]")
{
    REQUIRE_GUROBI();

    std::vector<Line> lines{ makeLine("L1", "A", 100.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 300.0) } };
    PlanningConfig config;
    config.mixStrategy = Strategy::Exact;

    const auto r = runMixOptimization(demand, lines, ChangeoverTable{}, config);
    REQUIRE_FALSE(r.ok());
    CHECK(r.outcome() == Outcome::Failure);
    CHECK(r.failure().code == ErrorCode::InfeasibleModelError);
    CHECK_FALSE(r.failure().suggestion.empty());
    CHECK_FALSE(r.failure().details.empty());
}

TEST_CASE("D4: RunMixOptimization::CancelledBeforeStart", "[mix][planner][gurobi]")
{
    REQUIRE_GUROBI();

    std::vector<Line> lines{ makeLine("L1", "A", 150.0), makeLine("L2", "A", 150.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 28, 100.0) } };
    PlanningConfig config;
    config.mixStrategy = Strategy::Exact;
    config.cancellation.cancel();

    // the solver may finish in presolve before the first callback; when it
    // does stop early without a plan, the failure is a timeout
    const auto r = runMixOptimization(demand, lines, ChangeoverTable{}, config);
    CHECK((r.ok() || r.failure().code == ErrorCode::SolverTimeoutError));
    if (r.ok()) {
        CHECK(r.kpis().strategy == Strategy::Exact);
        CHECK(r.kpis().fulfillmentRate >= Approx(100.0));
    }
    else {
        CHECK_FALSE(r.failure().suggestion.empty());
    }
}

TEST_CASE("D5: RunMixOptimization::FallbackWhenSolverMissing", "[mix][planner][fallback]")
{
    if (gurobiAvailable())
        SKIP("only meaningful when Gurobi cannot start");

    std::vector<Line> lines{ makeLine("L1", "A", 150.0) };
    DemandSeries demand{ { "A", flatSeries("A", kStart, 7, 100.0) } };
    PlanningConfig config;
    config.mixStrategy = Strategy::Exact;

    const auto strict = runMixOptimization(demand, lines, ChangeoverTable{}, config);
    REQUIRE_FALSE(strict.ok());
    CHECK(strict.failure().code == ErrorCode::SolverUnavailableError);

    config.fallbackToHeuristic = true;
    const auto relaxed = runMixOptimization(demand, lines, ChangeoverTable{}, config);
    REQUIRE(relaxed.ok());
    CHECK(relaxed.kpis().strategy == Strategy::Heuristic);
}
