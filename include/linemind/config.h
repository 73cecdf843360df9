#pragma once
/*
===============================================================================
CONFIG - Strategy toggles and planning constants
===============================================================================

OVERVIEW
--------
PlanningConfig is the only behavior switch the planning core accepts from
outside: which strategy each stage uses, plus the numeric constants that the
models are built from. Defaults reproduce the standard plant setup.

It can be filled directly or parsed from a DataStore of string keys, which
is how the outer API layer hands settings over:

    key                         type          default
    ------------------------------------------------------------
    mix.strategy                string        "heuristic"
    schedule.strategy           string        "heuristic"
    mix.time_limit              number (s)    30
    schedule.time_limit         number (s)    30
    solver.threads              int           1
    cost.unit                   number        1000
    shift.hours                 int           8
    shift.units_per_worker      int           100
    overtime.threshold          int (h)       40
    penalty.night               number        50
    penalty.overtime            number (/h)   20
    forecast.horizon            int (days)    30
    forecast.seed               int           unset (random)
    start_date                  "YYYY-MM-DD"  unset (today)
    fallback_to_heuristic       bool          false

Strategy names: "heuristic" | "exact". The stage-specific aliases
"simple_assignment" / "milp_assignment" (mix) and "greedy_seniority" /
"cpsat_schedule" (schedule) are accepted as well.

EXCEPTION SAFETY
----------------
• fromStore() throws DataShapeError for unknown strategy names, values of
  the wrong type and out-of-range numbers
• validateConfig() runs the same range checks on a config filled directly;
  every planner operation calls it first

===============================================================================
*/

#include <array>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "callbacks.h"
#include "data_store.h"
#include "enum_utils.h"
#include "errors.h"
#include "types.h"

namespace linemind {

    LINEMIND_ENUM_WITH_COUNT(Strategy, Heuristic, Exact);

    inline constexpr std::array<std::string_view, Strategy_COUNT> kStrategyNames{ "heuristic", "exact" };

    inline std::string_view toString(Strategy s) noexcept { return enum_name(s, kStrategyNames); }

    /// @brief "heuristic"/"exact" or a stage alias; std::nullopt if unknown
    inline std::optional<Strategy> strategyFromString(std::string_view text) noexcept {
        if (text == "simple_assignment" || text == "greedy_seniority")
            return Strategy::Heuristic;
        if (text == "milp_assignment" || text == "cpsat_schedule")
            return Strategy::Exact;
        return enum_from_name<Strategy>(text, kStrategyNames);
    }

    struct PlanningConfig {
        Strategy mixStrategy = Strategy::Heuristic;
        Strategy scheduleStrategy = Strategy::Heuristic;

        double mixTimeLimitSeconds = 30.0;
        double scheduleTimeLimitSeconds = 30.0;
        int solverThreads = 1;

        double unitCost = 1000.0;
        int hoursPerShift = 8;
        int unitsPerWorkerShift = 100;
        int overtimeThresholdHours = 40;
        double nightPenalty = 50.0;
        double overtimePenalty = 20.0;

        int forecastHorizon = 30;
        std::optional<std::uint32_t> forecastSeed;
        std::optional<Date> startDate;

        bool fallbackToHeuristic = false;
        CancellationToken cancellation;

        /// @brief startDate, or today when unset
        Date effectiveStartDate() const { return startDate.value_or(today()); }

        static PlanningConfig fromStore(const DataStore& store);
    };

    namespace config_detail {

        inline double number(const DataStore& store, const std::string& key, double fallback) {
            const Value* v = find_value(store, key);
            if (!v || !v->has_value())
                return fallback;
            if (auto n = v->as_number())
                return *n;
            throw DataShapeError(std::format("config: '{}' must be a number", key));
        }

        inline int integer(const DataStore& store, const std::string& key, int fallback) {
            const Value* v = find_value(store, key);
            if (!v || !v->has_value())
                return fallback;
            if (v->is<int>())
                return v->get<int>();
            throw DataShapeError(std::format("config: '{}' must be an integer", key));
        }

        inline std::optional<std::string> text(const DataStore& store, const std::string& key) {
            const Value* v = find_value(store, key);
            if (!v || !v->has_value())
                return std::nullopt;
            if (v->is<std::string>())
                return v->get<std::string>();
            if (v->is<const char*>())
                return std::string(v->get<const char*>());
            throw DataShapeError(std::format("config: '{}' must be a string", key));
        }

        inline Strategy strategy(const DataStore& store, const std::string& key, Strategy fallback) {
            auto name = text(store, key);
            if (!name)
                return fallback;
            auto s = strategyFromString(*name);
            if (!s) {
                throw DataShapeError(std::format("config: unknown strategy '{}' for '{}'", *name, key),
                    { "expected one of: heuristic, exact" });
            }
            return *s;
        }

        inline void requirePositive(double value, const char* key) {
            if (!(value > 0.0))
                throw DataShapeError(std::format("config: '{}' must be positive, got {}", key, value));
        }

        inline void requireNonNegative(double value, const char* key) {
            if (value < 0.0)
                throw DataShapeError(std::format("config: '{}' must not be negative, got {}", key, value));
        }

    } // namespace config_detail

    /**
     * @brief Range checks on the numeric settings
     * @throws DataShapeError naming the first offending key
     */
    inline void validateConfig(const PlanningConfig& c) {
        using namespace config_detail;
        requirePositive(c.mixTimeLimitSeconds, "mix.time_limit");
        requirePositive(c.scheduleTimeLimitSeconds, "schedule.time_limit");
        requireNonNegative(c.solverThreads, "solver.threads");
        requireNonNegative(c.unitCost, "cost.unit");
        requirePositive(c.hoursPerShift, "shift.hours");
        requirePositive(c.unitsPerWorkerShift, "shift.units_per_worker");
        requireNonNegative(c.overtimeThresholdHours, "overtime.threshold");
        requireNonNegative(c.nightPenalty, "penalty.night");
        requireNonNegative(c.overtimePenalty, "penalty.overtime");
        requirePositive(c.forecastHorizon, "forecast.horizon");
    }

    inline PlanningConfig PlanningConfig::fromStore(const DataStore& store) {
        using namespace config_detail;

        PlanningConfig c;
        c.mixStrategy = strategy(store, "mix.strategy", c.mixStrategy);
        c.scheduleStrategy = strategy(store, "schedule.strategy", c.scheduleStrategy);

        c.mixTimeLimitSeconds = number(store, "mix.time_limit", c.mixTimeLimitSeconds);
        c.scheduleTimeLimitSeconds = number(store, "schedule.time_limit", c.scheduleTimeLimitSeconds);
        c.solverThreads = integer(store, "solver.threads", c.solverThreads);

        c.unitCost = number(store, "cost.unit", c.unitCost);
        c.hoursPerShift = integer(store, "shift.hours", c.hoursPerShift);
        c.unitsPerWorkerShift = integer(store, "shift.units_per_worker", c.unitsPerWorkerShift);
        c.overtimeThresholdHours = integer(store, "overtime.threshold", c.overtimeThresholdHours);
        c.nightPenalty = number(store, "penalty.night", c.nightPenalty);
        c.overtimePenalty = number(store, "penalty.overtime", c.overtimePenalty);
        c.forecastHorizon = integer(store, "forecast.horizon", c.forecastHorizon);

        if (const Value* v = find_value(store, "forecast.seed"); v && v->has_value()) {
            const int seed = integer(store, "forecast.seed", 0);
            requireNonNegative(seed, "forecast.seed");
            c.forecastSeed = static_cast<std::uint32_t>(seed);
        }

        if (auto date = text(store, "start_date")) {
            c.startDate = parseDate(*date);
            if (!c.startDate)
                throw DataShapeError(std::format("config: 'start_date' is not YYYY-MM-DD: '{}'", *date));
        }

        if (const Value* v = find_value(store, "fallback_to_heuristic"); v && v->has_value()) {
            if (!v->is<bool>())
                throw DataShapeError("config: 'fallback_to_heuristic' must be a bool");
            c.fallbackToHeuristic = v->get<bool>();
        }

        validateConfig(c);
        return c;
    }

} // namespace linemind
