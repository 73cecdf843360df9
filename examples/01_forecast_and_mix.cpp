/*
================================================================================
EXAMPLE 01: FORECAST AND MIX - Heuristic planning from production history
================================================================================
DIFFICULTY: Beginner
STRATEGIES: Forecaster, HeuristicMixStrategy

PROBLEM DESCRIPTION
-------------------
A plant with three lines makes three products. Four weeks of shift-level
production history are turned into a 14-day demand forecast per product,
and the first forecast week is split over the lines that can run each
product.

Settings arrive as key/value pairs and are parsed with
PlanningConfig::fromStore(), the way an outer service layer hands them
over.

FEATURES DEMONSTRATED
---------------------
- PlanningConfig::fromStore()    Settings from a DataStore
- runForecast()                  Moving average with a seeded noise band
- runMixOptimization()           Even split clamped at weekly capacity
- Result<Payload, Kpi>           Success and failure envelopes

================================================================================
*/

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "absl/log/globals.h"
#include "absl/log/initialize.h"

#include <linemind/linemind.h>

using namespace linemind;

// ============================================================================
// PROBLEM DATA
// ============================================================================
namespace {

    std::vector<HistoryRecord> makeHistory(Date first) {
        struct Run { const char* line; const char* product; double day; double night; };
        const std::vector<Run> runs = {
            { "L1", "Widget",   120.0, 90.0 },
            { "L2", "Widget",    80.0, 60.0 },
            { "L2", "Gadget",    40.0,  0.0 },
            { "L3", "Sprocket",  55.0, 45.0 },
        };

        std::vector<HistoryRecord> history;
        for (int d = 0; d < 28; ++d) {
            const Date date = first + std::chrono::days{ d };
            const double weekday = (d % 7 < 5) ? 1.0 : 0.6;
            for (const auto& r : runs) {
                history.push_back({ date, r.line, r.product, Shift::Day, r.day * weekday, r.day });
                if (r.night > 0.0)
                    history.push_back({ date, r.line, r.product, Shift::Night, r.night * weekday, r.night });
            }
        }
        return history;
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    absl::InitializeLog();
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);

    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Forecast and Heuristic Mix\n";
    std::cout << "================================================================\n\n";

    try {
        DataStore settings;
        settings["forecast.horizon"] = 14;
        settings["forecast.seed"] = 7;
        settings["start_date"] = std::string("2025-02-03");
        settings["mix.strategy"] = std::string("simple_assignment");
        settings["cost.unit"] = 12.5;

        const PlanningConfig config = PlanningConfig::fromStore(settings);

        const auto history = makeHistory(makeDate(2025, 1, 6));
        const std::vector<Line> lines = {
            { "L1", parseEligibleProducts("Widget"), 300.0 },
            { "L2", parseEligibleProducts("Widget, Gadget"), 250.0 },
            { "L3", parseEligibleProducts("Sprocket"), 90.0 },
        };

        std::cout << "PLANT\n";
        std::cout << "-----\n";
        std::cout << std::setw(6) << "Line" << std::setw(12) << "Cap/day" << "  Products\n";
        for (const auto& l : lines) {
            std::cout << std::setw(6) << l.lineId << std::setw(12) << l.dailyCapacity << "  ";
            for (const auto& p : l.eligibleProducts)
                std::cout << p << " ";
            std::cout << "\n";
        }
        std::cout << "History rows: " << history.size() << "\n\n";

        // ====================================================================
        // FORECAST
        // ====================================================================
        const auto forecast = runForecast(history, {}, config);
        if (!forecast.ok()) {
            std::cerr << "Forecast failed: " << forecast.failure().message << "\n";
            return 1;
        }

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "FORECAST (" << forecast.kpis().horizon << " days)\n";
        std::cout << "--------\n";
        std::cout << std::setw(10) << "Product" << std::setw(12) << "Week 1" << std::setw(12) << "Day 1"
                  << std::setw(20) << "Day 1 band\n";
        for (const auto& [product, points] : forecast.payload()) {
            double week = 0.0;
            for (std::size_t i = 0; i < 7 && i < points.size(); ++i)
                week += points[i].forecastUnits;
            const auto& first = points.front();
            std::cout << std::setw(10) << product << std::setw(12) << week
                      << std::setw(12) << first.forecastUnits
                      << "   [" << first.confidenceLow << ", " << first.confidenceHigh << "]\n";
        }
        std::cout << "First forecast date: " << formatDate(forecast.payload().begin()->second.front().date) << "\n\n";

        // ====================================================================
        // MIX
        // ====================================================================
        const auto mix = runMixOptimization(forecast.payload(), lines, ChangeoverTable{}, config);
        if (!mix.ok()) {
            std::cerr << "Mix failed: " << mix.failure().message << "\n";
            return 1;
        }

        std::cout << "MIX PLAN (" << toString(mix.kpis().strategy) << ")\n";
        std::cout << "--------\n";
        std::cout << std::setw(6) << "Week" << std::setw(6) << "Line" << std::setw(12) << "Product"
                  << std::setw(10) << "Units" << std::setw(10) << "Util\n";
        for (const auto& e : mix.payload().entries) {
            std::cout << std::setw(6) << e.period << std::setw(6) << e.lineId << std::setw(12) << e.product
                      << std::setw(10) << e.plannedUnits << std::setw(9) << e.utilization * 100.0 << "%\n";
        }

        const auto& k = mix.kpis();
        std::cout << "\nPlanned " << k.totalPlanned << " / " << k.totalDemand << " units ("
                  << k.fulfillmentRate << "%)\n";
        std::cout << "Production cost: " << k.productionCost << "\n";
        std::cout << "Average utilization: " << k.averageUtilization * 100.0 << "%\n";
        if (k.unassignedProducts > 0)
            std::cout << "Products without a line: " << k.unassignedProducts << "\n";

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
