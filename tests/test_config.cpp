/*
===============================================================================
TEST CONFIG - Settings parsing, error codes and result envelopes
===============================================================================

TEST ORGANIZATION
-----------------
• Section A: Value / DataStore access
• Section B: PlanningConfig defaults and fromStore()
• Section C: Strategy names
• Section D: Dates and shifts
• Section E: PlanningError and Result

TEST STRATEGY
-------------
Pure value tests. Malformed settings must surface as DataShapeError before
anything else runs.

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <any>
#include <stdexcept>
#include <string>

#include <linemind/config.h>
#include <linemind/data_store.h>
#include <linemind/errors.h>
#include <linemind/result.h>
#include <linemind/types.h>

using namespace linemind;
using Catch::Approx;

// ============================================================================
// SECTION A: VALUE / DATA STORE
// ============================================================================

TEST_CASE("A1: Value::TypedAccess", "[config][store]")
{
    Value v = 5;
    CHECK(v.is<int>());
    CHECK(v.get<int>() == 5);
    CHECK(v.get_or(1.5) == Approx(1.5));
    CHECK(v.as_number() == 5.0);
    CHECK_THROWS_AS(v.get<double>(), std::bad_any_cast);
}

TEST_CASE("A2: Value::TryGetNeverThrows", "[config][store]")
{
    Value v = std::string("exact");
    auto s = v.try_get<std::string>();
    REQUIRE(s.has_value());
    CHECK(s->get() == "exact");
    CHECK_FALSE(v.try_get<int>().has_value());
    CHECK_FALSE(v.as_number().has_value());
}

TEST_CASE("A3: DataStore::FindValueDoesNotInsert", "[config][store]")
{
    DataStore store;
    store["a"] = 1;
    CHECK(find_value(store, "a") != nullptr);
    CHECK(find_value(store, "b") == nullptr);
    CHECK(store.size() == 1u);
}

// ============================================================================
// SECTION B: PLANNING CONFIG
// ============================================================================

TEST_CASE("B1: PlanningConfig::Defaults", "[config]")
{
    PlanningConfig c;
    CHECK(c.mixStrategy == Strategy::Heuristic);
    CHECK(c.scheduleStrategy == Strategy::Heuristic);
    CHECK(c.unitCost == Approx(1000.0));
    CHECK(c.hoursPerShift == 8);
    CHECK(c.unitsPerWorkerShift == 100);
    CHECK(c.overtimeThresholdHours == 40);
    CHECK(c.nightPenalty == Approx(50.0));
    CHECK(c.overtimePenalty == Approx(20.0));
    CHECK(c.forecastHorizon == 30);
    CHECK_FALSE(c.forecastSeed.has_value());
    CHECK_FALSE(c.fallbackToHeuristic);
}

TEST_CASE("B2: PlanningConfig::EmptyStoreKeepsDefaults", "[config]")
{
    const PlanningConfig c = PlanningConfig::fromStore({});
    CHECK(c.mixStrategy == Strategy::Heuristic);
    CHECK(c.mixTimeLimitSeconds == Approx(30.0));
    CHECK(c.solverThreads == 1);
}

TEST_CASE("B3: PlanningConfig::ReadsEveryKey", "[config]")
{
    DataStore s;
    s["mix.strategy"] = "exact";
    s["schedule.strategy"] = std::string("cpsat_schedule");
    s["mix.time_limit"] = 5;
    s["schedule.time_limit"] = 7.5;
    s["solver.threads"] = 2;
    s["cost.unit"] = 10.0;
    s["shift.hours"] = 12;
    s["shift.units_per_worker"] = 50;
    s["overtime.threshold"] = 48;
    s["penalty.night"] = 0;
    s["penalty.overtime"] = 35.0;
    s["forecast.horizon"] = 14;
    s["forecast.seed"] = 42;
    s["start_date"] = "2025-03-03";
    s["fallback_to_heuristic"] = true;

    const PlanningConfig c = PlanningConfig::fromStore(s);
    CHECK(c.mixStrategy == Strategy::Exact);
    CHECK(c.scheduleStrategy == Strategy::Exact);
    CHECK(c.mixTimeLimitSeconds == Approx(5.0));
    CHECK(c.scheduleTimeLimitSeconds == Approx(7.5));
    CHECK(c.solverThreads == 2);
    CHECK(c.unitCost == Approx(10.0));
    CHECK(c.hoursPerShift == 12);
    CHECK(c.unitsPerWorkerShift == 50);
    CHECK(c.overtimeThresholdHours == 48);
    CHECK(c.nightPenalty == Approx(0.0));
    CHECK(c.overtimePenalty == Approx(35.0));
    CHECK(c.forecastHorizon == 14);
    REQUIRE(c.forecastSeed.has_value());
    CHECK(*c.forecastSeed == 42u);
    REQUIRE(c.startDate.has_value());
    CHECK(*c.startDate == makeDate(2025, 3, 3));
    CHECK(c.effectiveStartDate() == makeDate(2025, 3, 3));
    CHECK(c.fallbackToHeuristic);
}

TEST_CASE("B4: PlanningConfig::UnknownStrategyIsDataShapeError", "[config][error]")
{
    DataStore s;
    s["mix.strategy"] = "annealing";
    try {
        (void)PlanningConfig::fromStore(s);
        FAIL("expected DataShapeError");
    }
    catch (const DataShapeError& e) {
        CHECK(e.code() == ErrorCode::DataShapeError);
        CHECK_FALSE(e.suggestion().empty());
        CHECK_FALSE(e.details().empty());
    }
}

TEST_CASE("B5: PlanningConfig::WrongTypes", "[config][error]")
{
    SECTION("integer key given a double") {
        DataStore s;
        s["solver.threads"] = 1.5;
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
    SECTION("number key given a string") {
        DataStore s;
        s["cost.unit"] = "cheap";
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
    SECTION("bool key given an int") {
        DataStore s;
        s["fallback_to_heuristic"] = 1;
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
}

TEST_CASE("B6: PlanningConfig::OutOfRange", "[config][error]")
{
    SECTION("zero time limit") {
        DataStore s;
        s["mix.time_limit"] = 0;
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
    SECTION("non-positive horizon") {
        DataStore s;
        s["forecast.horizon"] = -3;
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
    SECTION("negative seed") {
        DataStore s;
        s["forecast.seed"] = -1;
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
    SECTION("impossible start date") {
        DataStore s;
        s["start_date"] = "2025-02-30";
        CHECK_THROWS_AS(PlanningConfig::fromStore(s), DataShapeError);
    }
}

TEST_CASE("B7: ValidateConfig::DirectlyFilledConfig", "[config][error]")
{
    PlanningConfig c;
    CHECK_NOTHROW(validateConfig(c));

    SECTION("zero units per worker shift") {
        c.unitsPerWorkerShift = 0;
        CHECK_THROWS_AS(validateConfig(c), DataShapeError);
    }
    SECTION("zero shift hours") {
        c.hoursPerShift = 0.0;
        CHECK_THROWS_AS(validateConfig(c), DataShapeError);
    }
    SECTION("negative penalty") {
        c.nightPenalty = -0.5;
        CHECK_THROWS_AS(validateConfig(c), DataShapeError);
    }
    SECTION("negative threads") {
        c.solverThreads = -2;
        CHECK_THROWS_AS(validateConfig(c), DataShapeError);
    }
}

// ============================================================================
// SECTION C: STRATEGY NAMES
// ============================================================================

TEST_CASE("C1: Strategy::NamesAndAliases", "[config][strategy]")
{
    CHECK(toString(Strategy::Heuristic) == "heuristic");
    CHECK(toString(Strategy::Exact) == "exact");
    CHECK(strategyFromString("exact") == Strategy::Exact);
    CHECK(strategyFromString("simple_assignment") == Strategy::Heuristic);
    CHECK(strategyFromString("greedy_seniority") == Strategy::Heuristic);
    CHECK(strategyFromString("milp_assignment") == Strategy::Exact);
    CHECK_FALSE(strategyFromString("Exact").has_value());
}

// ============================================================================
// SECTION D: DATES AND SHIFTS
// ============================================================================

TEST_CASE("D1: Dates::FormatAndParse", "[types][date]")
{
    const Date d = makeDate(2024, 2, 29);
    CHECK(formatDate(d) == "2024-02-29");
    CHECK(parseDate("2024-02-29") == d);
    CHECK_FALSE(parseDate("2023-02-29").has_value());
    CHECK_FALSE(parseDate("2024-2-29").has_value());
    CHECK_FALSE(parseDate("2024/02/29").has_value());
    CHECK_FALSE(parseDate("").has_value());
}

TEST_CASE("D2: Shift::Names", "[types][shift]")
{
    CHECK(toString(Shift::Day) == "Day");
    CHECK(toString(Shift::Night) == "Night");
    CHECK(shiftFromString("Night") == Shift::Night);
    CHECK_FALSE(shiftFromString("Evening").has_value());
}

TEST_CASE("D3: Line::EligibleProductsParsing", "[types][line]")
{
    const auto products = parseEligibleProducts(" ModelA, ModelB ,,ModelC ");
    CHECK(products.size() == 3u);
    CHECK(products.count("ModelB") == 1u);

    const Line l{ "L1", products, 100.0 };
    CHECK(l.canRun("ModelC"));
    CHECK_FALSE(l.canRun("ModelD"));
    CHECK(l.weeklyCapacity() == Approx(700.0));
}

TEST_CASE("D4: ChangeoverTable::DirectedPairs", "[types][changeover]")
{
    ChangeoverTable t({ { "A", "B", 2.0, 300.0 } });
    CHECK(t.contains("A", "B"));
    CHECK_FALSE(t.contains("B", "A"));

    t.add({ "A", "B", 3.0, 450.0 });
    REQUIRE(t.size() == 1u);
    CHECK(t.find("A", "B")->cost == Approx(450.0));
}

// ============================================================================
// SECTION E: ERRORS AND RESULTS
// ============================================================================

TEST_CASE("E1: ErrorCode::StableNames", "[errors]")
{
    CHECK(toString(ErrorCode::DataShapeError) == "DataShapeError");
    CHECK(toString(ErrorCode::InfeasibleModelError) == "InfeasibleModelError");
    CHECK(toString(ErrorCode::SolverTimeoutError) == "SolverTimeoutError");
    CHECK(toString(ErrorCode::SolverUnavailableError) == "SolverUnavailableError");
}

TEST_CASE("E2: PlanningError::SubclassesCarryCodes", "[errors]")
{
    const InfeasibleModelError inf("no plan", "relax capacity", { "capacity[0,0]" });
    CHECK(inf.code() == ErrorCode::InfeasibleModelError);
    CHECK(inf.suggestion() == "relax capacity");
    REQUIRE(inf.details().size() == 1u);

    const SolverTimeoutError timeout("out of time");
    CHECK(timeout.code() == ErrorCode::SolverTimeoutError);
    CHECK_FALSE(timeout.suggestion().empty());
}

TEST_CASE("E3: Result::SuccessAndFailureAccess", "[result]")
{
    using R = Result<int, double>;

    const R ok = R::success(7, 0.5);
    CHECK(ok.ok());
    CHECK(ok.outcome() == Outcome::Success);
    CHECK(ok.payload() == 7);
    CHECK(ok.kpis() == Approx(0.5));
    CHECK_THROWS_AS(ok.failure(), std::logic_error);

    const R bad = R::failure(DataShapeError("bad rows", { "row 3" }));
    CHECK_FALSE(bad.ok());
    CHECK(bad.outcome() == Outcome::Failure);
    CHECK(bad.failure().code == ErrorCode::DataShapeError);
    CHECK(bad.failure().message == "bad rows");
    CHECK(bad.failure().details == std::vector<std::string>{ "row 3" });
    CHECK_THROWS_AS(bad.payload(), std::logic_error);
    CHECK_THROWS_AS(bad.kpis(), std::logic_error);
}
