#pragma once
/*
===============================================================================
VALIDATION - Input shape checks run before any model is built
===============================================================================

Each check throws DataShapeError on the first problem it finds. The
message names the offending record; details list every offender when more
than one record fails the same rule.

    validateHistory      negative produced/target units, empty product id
    validateHorizon      horizon <= 0
    validateDemand       empty product id, negative forecast units
    validateLines        empty or duplicate line ids, capacity <= 0
    validateChangeovers  every ordered pair of distinct products sharing an
                         eligible line has a row; no negative cost or hours
    validateMixPlan      period < 1, negative units, utilization outside
                         [0,1], unknown line or ineligible product
    validateWorkers      empty or duplicate ids, max hours <= 0, negative
                         wage or seniority

===============================================================================
*/

#include <format>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "errors.h"
#include "types.h"

namespace linemind {

    inline void validateHorizon(int horizon) {
        if (horizon <= 0)
            throw DataShapeError(std::format("forecast horizon must be positive, got {}", horizon));
    }

    inline void validateHistory(std::span<const HistoryRecord> history) {
        std::vector<std::string> bad;
        for (const auto& r : history) {
            if (r.product.empty())
                bad.push_back(std::format("{} line '{}': empty product", formatDate(r.date), r.lineId));
            else if (r.producedUnits < 0.0 || r.targetUnits < 0.0)
                bad.push_back(std::format("{} line '{}' product '{}': negative units", formatDate(r.date), r.lineId, r.product));
        }
        if (!bad.empty())
            throw DataShapeError(std::format("history has {} malformed record(s): {}", bad.size(), bad.front()), bad);
    }

    inline void validateDemand(const DemandSeries& demand) {
        for (const auto& [product, series] : demand) {
            if (product.empty())
                throw DataShapeError("demand series with an empty product id");
            for (const auto& p : series) {
                if (p.forecastUnits < 0.0) {
                    throw DataShapeError(std::format("demand for '{}' on {} is negative ({})",
                        product, formatDate(p.date), p.forecastUnits));
                }
            }
        }
    }

    inline void validateLines(std::span<const Line> lines) {
        if (lines.empty())
            throw DataShapeError("no production lines given");

        std::set<std::string> seen;
        for (const auto& l : lines) {
            if (l.lineId.empty())
                throw DataShapeError("line with an empty id");
            if (!seen.insert(l.lineId).second)
                throw DataShapeError(std::format("duplicate line id '{}'", l.lineId));
            if (!(l.dailyCapacity > 0.0))
                throw DataShapeError(std::format("line '{}' has non-positive daily capacity {}", l.lineId, l.dailyCapacity));
        }
    }

    /**
     * @brief Every ordered pair (m, n), m != n, of demanded products that are
     *        both eligible on some line must have a changeover row
     */
    inline void validateChangeovers(std::span<const Line> lines,
        const std::set<std::string>& products,
        const ChangeoverTable& changeovers)
    {
        for (const auto& [key, row] : changeovers) {
            if (row.cost < 0.0 || row.hours < 0.0) {
                throw DataShapeError(std::format("changeover {} -> {} has negative cost or hours",
                    row.fromProduct, row.toProduct));
            }
        }

        std::set<std::string> missing;
        for (const auto& l : lines) {
            for (const auto& m : l.eligibleProducts) {
                if (!products.count(m))
                    continue;
                for (const auto& n : l.eligibleProducts) {
                    if (m == n || !products.count(n))
                        continue;
                    if (!changeovers.contains(m, n))
                        missing.insert(m + " -> " + n);
                }
            }
        }
        if (!missing.empty()) {
            throw DataShapeError(std::format("changeover table is missing {} product pair(s), first: {}",
                missing.size(), *missing.begin()),
                std::vector<std::string>(missing.begin(), missing.end()));
        }
    }

    /// @param lines when non-empty, entries must name a known line eligible for the product
    inline void validateMixPlan(const MixPlan& plan, std::span<const Line> lines = {}) {
        for (const auto& e : plan.entries) {
            if (e.lineId.empty() || e.product.empty())
                throw DataShapeError("mix plan entry with an empty line or product id");
            if (e.period < 1)
                throw DataShapeError(std::format("mix plan entry {}/{} has period {} < 1", e.lineId, e.product, e.period));
            if (e.plannedUnits < 0)
                throw DataShapeError(std::format("mix plan entry {}/{} has negative units", e.lineId, e.product));
            if (e.utilization < 0.0 || e.utilization > 1.0) {
                throw DataShapeError(std::format("mix plan entry {}/{} has utilization {} outside [0,1]",
                    e.lineId, e.product, e.utilization));
            }
            if (lines.empty())
                continue;

            const Line* line = nullptr;
            for (const auto& l : lines) {
                if (l.lineId == e.lineId) {
                    line = &l;
                    break;
                }
            }
            if (!line)
                throw DataShapeError(std::format("mix plan references unknown line '{}'", e.lineId));
            if (!line->canRun(e.product))
                throw DataShapeError(std::format("line '{}' is not eligible for '{}'", e.lineId, e.product));
        }
    }

    inline void validateWorkers(std::span<const Worker> workers) {
        std::set<std::string> seen;
        for (const auto& w : workers) {
            if (w.workerId.empty())
                throw DataShapeError("worker with an empty id");
            if (!seen.insert(w.workerId).second)
                throw DataShapeError(std::format("duplicate worker id '{}'", w.workerId));
            if (!(w.maxHoursPerWeek > 0.0))
                throw DataShapeError(std::format("worker '{}' has non-positive max hours {}", w.workerId, w.maxHoursPerWeek));
            if (w.wagePerHour < 0.0 || w.seniorityYears < 0.0)
                throw DataShapeError(std::format("worker '{}' has negative wage or seniority", w.workerId));
        }
    }

} // namespace linemind
