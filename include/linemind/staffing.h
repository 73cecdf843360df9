#pragma once
/*
===============================================================================
STAFFING - Seat requirements derived from a mix plan, and schedule KPIs
===============================================================================

Requirements
------------
Entries of the mix plan are summed per (period, line). Every day of that
period needs, on each of the Day and Night shifts,

    required = ceil(Σ plannedUnits / unitsPerWorkerShift)

workers on that line. Slots are listed in chronological order: by date,
then line id, then Day before Night. Day d (1..7) of period p falls on

    start + 7·(p - 1) + (d - 1)

KPIs
----
Both scheduling strategies report the same ScheduleKpi, computed from the
produced entries against the requirements:

    totalCost           Σ wagePerHour · hoursPerShift
    penaltyCost         nightPenalty per Night shift of a worker who does
                        not prefer nights + overtimePenalty per overtime hour
    totalOvertimeHours  Σ over (worker, week) of max(0, hours - threshold)
    nightBiasIndex      nightShifts / totalShifts (0 for an empty schedule)
    fulfillmentRate     Σ min(assigned, required) / Σ required · 100

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "config.h"
#include "types.h"

namespace linemind {

    struct StaffingSlot {
        Date date;
        int period = 1;
        int day = 1;          ///< 1..7 within the period
        int dayIndex = 0;     ///< days since the schedule start
        std::string lineId;
        Shift shift = Shift::Day;
        int required = 0;
    };

    /// @brief Day offset of (period, day) from the schedule start
    [[nodiscard]] inline int dayIndexOf(int period, int day) noexcept {
        return (period - 1) * 7 + (day - 1);
    }

    /**
     * @brief Chronological list of slots with a positive requirement
     * @param unitsPerWorkerShift units one worker covers in one shift (> 0)
     */
    inline std::vector<StaffingSlot> requiredSlots(const MixPlan& plan, Date start, int unitsPerWorkerShift) {
        std::map<std::pair<int, std::string>, long long> units;
        for (const auto& e : plan.entries)
            units[{ e.period, e.lineId }] += e.plannedUnits;

        std::vector<StaffingSlot> slots;
        for (const auto& [key, total] : units) {
            const auto& [period, lineId] = key;
            const int required = static_cast<int>((total + unitsPerWorkerShift - 1) / unitsPerWorkerShift);
            if (required <= 0)
                continue;
            for (int day = 1; day <= 7; ++day) {
                const int idx = dayIndexOf(period, day);
                for (Shift s : { Shift::Day, Shift::Night }) {
                    slots.push_back(StaffingSlot{
                        start + std::chrono::days{ idx }, period, day, idx, lineId, s, required });
                }
            }
        }

        std::sort(slots.begin(), slots.end(), [](const StaffingSlot& a, const StaffingSlot& b) {
            return std::tie(a.dayIndex, a.lineId, a.shift) < std::tie(b.dayIndex, b.lineId, b.shift);
        });
        return slots;
    }

    /// @brief Workers by seniority (descending), ties by id (ascending)
    inline std::vector<Worker> bySeniority(std::span<const Worker> workers) {
        std::vector<Worker> out(workers.begin(), workers.end());
        std::sort(out.begin(), out.end(), [](const Worker& a, const Worker& b) {
            if (a.seniorityYears != b.seniorityYears)
                return a.seniorityYears > b.seniorityYears;
            return a.workerId < b.workerId;
        });
        return out;
    }

    /// @brief Entries by date, line, shift; stable for equal keys
    inline void sortScheduleEntries(std::vector<ScheduleEntry>& entries) {
        std::stable_sort(entries.begin(), entries.end(), [](const ScheduleEntry& a, const ScheduleEntry& b) {
            return std::tie(a.date, a.lineId, a.shift) < std::tie(b.date, b.lineId, b.shift);
        });
    }

    struct ScheduleKpi {
        double totalCost = 0.0;
        double penaltyCost = 0.0;
        double totalOvertimeHours = 0.0;
        double nightBiasIndex = 0.0;
        double fulfillmentRate = 100.0;
        int totalShifts = 0;
        int nightShifts = 0;
        int requiredShifts = 0;
        int understaffedSlots = 0;
        int workersUsed = 0;
        bool provenOptimal = false;
        double mipGap = 0.0;
        double runtimeSeconds = 0.0;
        Strategy strategy = Strategy::Heuristic;
    };

    inline ScheduleKpi computeScheduleKpi(const std::vector<ScheduleEntry>& entries,
        const std::vector<StaffingSlot>& slots,
        std::span<const Worker> workers,
        const PlanningConfig& config)
    {
        ScheduleKpi kpi;

        std::map<std::string, const Worker*> byId;
        for (const auto& w : workers)
            byId.emplace(w.workerId, &w);

        std::map<std::tuple<int, std::string, Shift>, int> filled;
        std::map<std::pair<std::string, int>, int> weeklyShifts;
        std::set<std::string> used;

        for (const auto& e : entries) {
            ++kpi.totalShifts;
            const auto it = byId.find(e.workerId);
            const Worker* w = it == byId.end() ? nullptr : it->second;

            if (e.shift == Shift::Night) {
                ++kpi.nightShifts;
                if (w && !w->prefersNight)
                    kpi.penaltyCost += config.nightPenalty;
            }
            if (w)
                kpi.totalCost += w->wagePerHour * config.hoursPerShift;

            ++filled[{ dayIndexOf(e.period, e.day), e.lineId, e.shift }];
            ++weeklyShifts[{ e.workerId, e.period }];
            used.insert(e.workerId);
        }

        for (const auto& [key, shifts] : weeklyShifts) {
            const double hours = static_cast<double>(shifts) * config.hoursPerShift;
            kpi.totalOvertimeHours += std::max(0.0, hours - config.overtimeThresholdHours);
        }
        kpi.penaltyCost += config.overtimePenalty * kpi.totalOvertimeHours;

        int covered = 0;
        for (const auto& s : slots) {
            kpi.requiredShifts += s.required;
            const auto it = filled.find({ s.dayIndex, s.lineId, s.shift });
            const int got = it == filled.end() ? 0 : it->second;
            covered += std::min(got, s.required);
            if (got < s.required)
                ++kpi.understaffedSlots;
        }

        kpi.fulfillmentRate = kpi.requiredShifts > 0 ? 100.0 * covered / kpi.requiredShifts : 100.0;
        kpi.nightBiasIndex = kpi.totalShifts > 0 ? static_cast<double>(kpi.nightShifts) / kpi.totalShifts : 0.0;
        kpi.workersUsed = static_cast<int>(used.size());
        return kpi;
    }

} // namespace linemind
