#pragma once
/*
===============================================================================
TYPES - Value types exchanged between the planning stages
===============================================================================

OVERVIEW
--------
    HistoryRecord  ─┐
                    ├─ Forecaster ──► DemandSeries (product → DemandPoint[])
                    │
    Line ───────────┼─ MixOptimizer ─► MixPlan (MixPlanEntry[])
    ChangeoverTable ┘                      │
                                           ▼
    Worker ───────────────────────── WorkforceScheduler ─► Schedule

All types are plain aggregates produced fresh by each call. Calendar dates
are std::chrono::sys_days and print as YYYY-MM-DD.

===============================================================================
*/

#include <array>
#include <charconv>
#include <chrono>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "enum_utils.h"

namespace linemind {

    // ============================================================================
    // DATES
    // ============================================================================

    using Date = std::chrono::sys_days;

    inline Date makeDate(int year, unsigned month, unsigned day) {
        return Date{ std::chrono::year{ year } / std::chrono::month{ month } / std::chrono::day{ day } };
    }

    inline std::string formatDate(Date date) {
        const std::chrono::year_month_day ymd{ date };
        return std::format("{:04}-{:02}-{:02}",
            static_cast<int>(ymd.year()),
            static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()));
    }

    /// @brief Parses "YYYY-MM-DD"; std::nullopt on malformed or impossible dates
    inline std::optional<Date> parseDate(std::string_view text) {
        if (text.size() != 10 || text[4] != '-' || text[7] != '-')
            return std::nullopt;

        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        auto field = [&](std::size_t pos, std::size_t len, auto& out) {
            const char* first = text.data() + pos;
            auto [ptr, ec] = std::from_chars(first, first + len, out);
            return ec == std::errc{} && ptr == first + len;
        };
        if (!field(0, 4, y) || !field(5, 2, m) || !field(8, 2, d))
            return std::nullopt;

        const std::chrono::year_month_day ymd{ std::chrono::year{ y }, std::chrono::month{ m }, std::chrono::day{ d } };
        if (!ymd.ok())
            return std::nullopt;
        return Date{ ymd };
    }

    inline Date today() {
        return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    }

    // ============================================================================
    // SHIFTS
    // ============================================================================

    LINEMIND_ENUM_WITH_COUNT(Shift, Day, Night);

    inline constexpr std::array<std::string_view, Shift_COUNT> kShiftNames{ "Day", "Night" };

    inline std::string_view toString(Shift s) noexcept { return enum_name(s, kShiftNames); }

    inline std::optional<Shift> shiftFromString(std::string_view text) noexcept {
        return enum_from_name<Shift>(text, kShiftNames);
    }

    // ============================================================================
    // FORECASTING
    // ============================================================================

    /// @brief One production log row: units a line made for a product in a shift
    struct HistoryRecord {
        Date date;
        std::string lineId;
        std::string product;
        Shift shift = Shift::Day;
        double producedUnits = 0.0;
        double targetUnits = 0.0;
    };

    struct DemandPoint {
        Date date;
        std::string product;
        double forecastUnits = 0.0;
        double confidenceLow = 0.0;
        double confidenceHigh = 0.0;
    };

    /// @brief product → daily forecast, ordered by product id
    using DemandSeries = std::map<std::string, std::vector<DemandPoint>>;

    // ============================================================================
    // PRODUCTION MIX
    // ============================================================================

    struct Line {
        std::string lineId;
        std::set<std::string> eligibleProducts;
        double dailyCapacity = 0.0;

        [[nodiscard]] bool canRun(const std::string& product) const {
            return eligibleProducts.count(product) > 0;
        }

        [[nodiscard]] double weeklyCapacity() const noexcept { return dailyCapacity * 7.0; }
    };

    /// @brief Splits "ModelA, ModelB ,ModelC" into {ModelA, ModelB, ModelC}
    inline std::set<std::string> parseEligibleProducts(std::string_view text) {
        std::set<std::string> out;
        std::size_t pos = 0;
        while (pos <= text.size()) {
            std::size_t comma = text.find(',', pos);
            if (comma == std::string_view::npos)
                comma = text.size();
            std::string_view item = text.substr(pos, comma - pos);
            const auto first = item.find_first_not_of(" \t\r\n");
            if (first != std::string_view::npos) {
                const auto last = item.find_last_not_of(" \t\r\n");
                out.emplace(item.substr(first, last - first + 1));
            }
            pos = comma + 1;
        }
        return out;
    }

    struct MixPlanEntry {
        int period = 1;              ///< 1-based week
        std::string lineId;
        std::string product;
        int plannedUnits = 0;
        double utilization = 0.0;    ///< plannedUnits / weekly capacity, in [0,1]
    };

    struct MixPlan {
        std::vector<MixPlanEntry> entries;

        [[nodiscard]] int totalPlanned() const noexcept {
            int total = 0;
            for (const auto& e : entries)
                total += e.plannedUnits;
            return total;
        }
    };

    struct ChangeoverCost {
        std::string fromProduct;
        std::string toProduct;
        double hours = 0.0;
        double cost = 0.0;
    };

    /**
     * @class ChangeoverTable
     * @brief Flat (from, to) → ChangeoverCost map; pairs may be asymmetric
     */
    class ChangeoverTable {
        std::map<std::pair<std::string, std::string>, ChangeoverCost> pairs_;

    public:
        ChangeoverTable() = default;

        explicit ChangeoverTable(const std::vector<ChangeoverCost>& rows) {
            for (const auto& r : rows)
                add(r);
        }

        /// @brief Inserts or replaces the (from, to) entry
        void add(ChangeoverCost row) {
            auto key = std::make_pair(row.fromProduct, row.toProduct);
            pairs_.insert_or_assign(std::move(key), std::move(row));
        }

        const ChangeoverCost* find(const std::string& from, const std::string& to) const {
            auto it = pairs_.find({ from, to });
            return it == pairs_.end() ? nullptr : &it->second;
        }

        [[nodiscard]] bool contains(const std::string& from, const std::string& to) const {
            return find(from, to) != nullptr;
        }

        [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }
        [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }

        auto begin() const noexcept { return pairs_.begin(); }
        auto end() const noexcept { return pairs_.end(); }
    };

    // ============================================================================
    // WORKFORCE
    // ============================================================================

    struct Worker {
        std::string workerId;
        std::string name;
        double seniorityYears = 0.0;
        double wagePerHour = 0.0;
        double maxHoursPerWeek = 40.0;
        bool prefersNight = false;
    };

    struct ScheduleEntry {
        Date date;
        int period = 1;      ///< 1-based week
        int day = 1;         ///< 1..7 within the week
        std::string lineId;
        Shift shift = Shift::Day;
        std::string workerId;
        std::string workerName;
    };

    struct Schedule {
        std::vector<ScheduleEntry> entries;
    };

} // namespace linemind
