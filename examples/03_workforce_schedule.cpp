/*
================================================================================
EXAMPLE 03: WORKFORCE SCHEDULE - Staffing a weekly mix plan
================================================================================
DIFFICULTY: Intermediate
STRATEGIES: HeuristicScheduleStrategy, ExactScheduleStrategy

PROBLEM DESCRIPTION
-------------------
A one-week mix plan is turned into a crew requirement per line and shift:
ceil(weekly units / units per worker shift) workers on every Day and Night
shift of the week. Twelve workers with different wages and night
preferences are then assigned.

The heuristic rotates through workers by seniority and only avoids double
booking. The exact strategy also honors weekly hour limits, at most three
nights in any four days and no Day shift right after a Night shift, while
minimizing wage, night and overtime cost.

FEATURES DEMONSTRATED
---------------------
- requiredSlots()                Crew requirements from a mix plan
- runSchedule()                  Heuristic and exact strategies
- ScheduleKpi                    Cost, overtime, night bias, fulfillment
- fallbackToHeuristic            Heuristic roster when no license is available

================================================================================
*/

#include <chrono>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/globals.h"
#include "absl/log/initialize.h"

#include <linemind/linemind.h>

using namespace linemind;

namespace {

    void printKpis(const ScheduleKpi& k) {
        std::cout << "  Strategy:        " << toString(k.strategy) << (k.provenOptimal ? " (optimal)" : "") << "\n";
        std::cout << "  Shifts filled:   " << k.totalShifts << " / " << k.requiredShifts
                  << " (" << k.fulfillmentRate << "%)\n";
        std::cout << "  Understaffed:    " << k.understaffedSlots << " slot(s)\n";
        std::cout << "  Workers used:    " << k.workersUsed << "\n";
        std::cout << "  Wage cost:       " << k.totalCost << "\n";
        std::cout << "  Penalty cost:    " << k.penaltyCost << "\n";
        std::cout << "  Overtime hours:  " << k.totalOvertimeHours << "\n";
        std::cout << "  Night bias:      " << k.nightBiasIndex << "\n";
    }

    /// @brief One row per worker, one column per day: D/N plus line, or '.'
    void printRoster(const Schedule& s, const std::vector<Worker>& workers, Date start) {
        std::map<std::string, std::vector<std::string>> grid;
        for (const auto& w : workers)
            grid[w.workerId].assign(7, ".");
        for (const auto& e : s.entries) {
            const int d = static_cast<int>((e.date - start).count());
            if (d >= 0 && d < 7)
                grid[e.workerId][static_cast<std::size_t>(d)] = (e.shift == Shift::Day ? "D" : "N") + e.lineId;
        }

        std::cout << std::setw(8) << "Worker";
        for (int d = 0; d < 7; ++d)
            std::cout << std::setw(6) << formatDate(start + std::chrono::days{ d }).substr(5);
        std::cout << "\n";
        for (const auto& w : workers) {
            std::cout << std::setw(8) << w.workerId;
            for (const auto& cell : grid[w.workerId])
                std::cout << std::setw(6) << cell;
            std::cout << "\n";
        }
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    absl::InitializeLog();
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);

    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: Workforce Schedule\n";
    std::cout << "================================================================\n\n";

    try {
        const Date start = makeDate(2025, 4, 7);

        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        MixPlan plan;
        plan.entries = {
            { 1, "L1", "A", 190, 0.27 },
            { 1, "L2", "B", 95, 0.23 },
        };

        std::vector<Worker> workers;
        const std::vector<std::pair<double, bool>> profile = {
            { 12.0, false }, { 9.5, false }, { 8.0, true }, { 7.0, false },
            { 6.0, true }, { 5.0, false }, { 4.0, false }, { 3.5, true },
            { 3.0, false }, { 2.0, false }, { 1.0, true }, { 0.5, false },
        };
        for (std::size_t i = 0; i < profile.size(); ++i) {
            const auto& [seniority, nights] = profile[i];
            workers.push_back(Worker{ "W" + std::to_string(i + 1), "Worker " + std::to_string(i + 1),
                seniority, 18.0 + seniority, 40.0, nights });
        }

        PlanningConfig config;
        config.startDate = start;
        config.unitsPerWorkerShift = 100;
        config.scheduleTimeLimitSeconds = 20.0;
        config.fallbackToHeuristic = true;

        std::cout << "REQUIREMENTS\n";
        std::cout << "------------\n";
        for (const auto& e : plan.entries) {
            std::cout << "  " << e.lineId << ": " << e.plannedUnits << " units -> "
                      << (e.plannedUnits + config.unitsPerWorkerShift - 1) / config.unitsPerWorkerShift
                      << " worker(s) per shift\n";
        }
        std::cout << "  Slots: " << requiredSlots(plan, start, config.unitsPerWorkerShift).size() << "\n\n";

        std::cout << std::fixed << std::setprecision(2);

        // ====================================================================
        // HEURISTIC
        // ====================================================================
        std::cout << "HEURISTIC\n";
        std::cout << "---------\n";
        config.scheduleStrategy = Strategy::Heuristic;
        const auto greedy = runSchedule(plan, workers, config);
        if (!greedy.ok()) {
            std::cerr << "Schedule failed: " << greedy.failure().message << "\n";
            return 1;
        }
        printKpis(greedy.kpis());
        std::cout << "\n";
        printRoster(greedy.payload(), workers, start);

        // ====================================================================
        // EXACT
        // ====================================================================
        std::cout << "\nEXACT\n";
        std::cout << "-----\n";
        config.scheduleStrategy = Strategy::Exact;
        const auto exact = runSchedule(plan, workers, config);
        if (!exact.ok()) {
            const auto& f = exact.failure();
            std::cout << "FAILED: " << toString(f.code) << ": " << f.message << "\n";
            std::cout << "  Suggestion: " << f.suggestion << "\n";
            for (const auto& d : f.details)
                std::cout << "    - " << d << "\n";
        } else {
            printKpis(exact.kpis());
            std::cout << "\n";
            printRoster(exact.payload(), workers, start);
        }

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
