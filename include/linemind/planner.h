#pragma once
/*
===============================================================================
PLANNER - The three outward-facing planning operations
===============================================================================

    runForecast(history, products, config)              → ForecastResult
    runMixOptimization(demand, lines, changeovers, cfg) → PlanResult
    runSchedule(mixPlan, workers, config)               → ScheduleResult

Each operation picks its strategy from the configuration, runs it and turns
every PlanningError into a Failure envelope. Nothing is thrown to the
caller and nothing is retried.

When an exact strategy reports SolverUnavailableError and
config.fallbackToHeuristic is set, the operation logs a warning and returns
the heuristic plan instead; the KPIs then carry Strategy::Heuristic.

The configuration is range-checked first (validateConfig). A GRBException
or any other std::exception that escapes a strategy is reported as
SolverError.

===============================================================================
*/

#include <exception>
#include <span>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "config.h"
#include "errors.h"
#include "forecaster.h"
#include "mix_optimizer.h"
#include "result.h"
#include "types.h"
#include "validation.h"
#include "workforce_scheduler.h"

namespace linemind {

    using ForecastResult = Result<DemandSeries, ForecastKpi>;

    namespace planner_detail {

        /**
         * @brief Runs body() and converts planning and solver exceptions into
         *        a failed ResultT
         */
        template<typename ResultT, typename Body>
        ResultT guarded(const char* stage, Body&& body) {
            try {
                return body();
            }
            catch (const PlanningError& e) {
                LOG(WARNING) << stage << " failed: " << toString(e.code()) << ": " << e.what();
                return ResultT::failure(e);
            }
            catch (const GRBException& e) {
                LOG(ERROR) << stage << " solver exception " << e.getErrorCode() << ": " << e.getMessage();
                return ResultT::failure(SolverError(e.getMessage()));
            }
            catch (const std::exception& e) {
                LOG(ERROR) << stage << " unexpected exception: " << e.what();
                return ResultT::failure(SolverError(e.what()));
            }
        }

    } // namespace planner_detail

    /**
     * @brief Demand forecast for the given products (all history products
     *        when products is empty)
     */
    inline ForecastResult runForecast(std::span<const HistoryRecord> history,
        const std::vector<std::string>& products,
        const PlanningConfig& config = {})
    {
        return planner_detail::guarded<ForecastResult>("forecast", [&] {
            validateConfig(config);
            validateHorizon(config.forecastHorizon);
            validateHistory(history);

            Forecaster forecaster(config.forecastSeed, config.effectiveStartDate());
            DemandSeries series = forecaster.runAll(history, products, config.forecastHorizon);

            ForecastKpi kpi;
            kpi.horizon = config.forecastHorizon;
            kpi.productsForecast = static_cast<int>(series.size());
            for (const auto& [product, points] : series) {
                if (Forecaster::dailyTotals(product, history).empty())
                    ++kpi.baselineProducts;
                for (const auto& p : points)
                    kpi.totalForecastUnits += p.forecastUnits;
            }

            LOG(INFO) << "forecast: " << kpi.productsForecast << " product(s) over " << kpi.horizon
                      << " day(s), " << kpi.baselineProducts << " on the default baseline";
            return ForecastResult::success(std::move(series), kpi);
        });
    }

    inline PlanResult runMixOptimization(const DemandSeries& demand,
        std::span<const Line> lines,
        const ChangeoverTable& changeovers,
        const PlanningConfig& config = {})
    {
        return planner_detail::guarded<PlanResult>("mix", [&]() -> PlanResult {
            validateConfig(config);
            switch (config.mixStrategy) {
                case Strategy::Exact:
                    try {
                        return ExactMixStrategy{}.solve(demand, lines, changeovers, config);
                    }
                    catch (const SolverUnavailableError& e) {
                        if (!config.fallbackToHeuristic)
                            throw;
                        LOG(WARNING) << "mix: " << e.what() << "; falling back to the heuristic";
                        return HeuristicMixStrategy{}.solve(demand, lines, config);
                    }
                case Strategy::Heuristic:
                default:
                    return HeuristicMixStrategy{}.solve(demand, lines, config);
            }
        });
    }

    inline ScheduleResult runSchedule(const MixPlan& mixPlan,
        std::span<const Worker> workers,
        const PlanningConfig& config = {})
    {
        return planner_detail::guarded<ScheduleResult>("schedule", [&]() -> ScheduleResult {
            validateConfig(config);
            switch (config.scheduleStrategy) {
                case Strategy::Exact:
                    try {
                        return ExactScheduleStrategy{}.solve(mixPlan, workers, config);
                    }
                    catch (const SolverUnavailableError& e) {
                        if (!config.fallbackToHeuristic)
                            throw;
                        LOG(WARNING) << "schedule: " << e.what() << "; falling back to the heuristic";
                        return HeuristicScheduleStrategy{}.solve(mixPlan, workers, config);
                    }
                case Strategy::Heuristic:
                default:
                    return HeuristicScheduleStrategy{}.solve(mixPlan, workers, config);
            }
        });
    }

} // namespace linemind
