#pragma once
/*
===============================================================================
FORECASTER - Daily demand per product from production history
===============================================================================

Method
------
For a product with history:

    daily[t]  = Σ producedUnits over all lines and shifts on date t
    baseline  = mean of the last min(7, #days) daily totals
    units[h]  = round(max(0, baseline + N(0, (0.10 · baseline)²)))
    band[h]   = [0.8 · units[h], 1.2 · units[h]]

for h = 1..horizon, dated from the day after the last history date.

A product without history gets a flat 100 units/day with an 80/120 band,
dated from the configured start date.

Randomness comes from a std::mt19937 owned by the Forecaster. A fixed seed
makes runs reproducible; otherwise the engine is seeded from
std::random_device.

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "types.h"

namespace linemind {

    inline constexpr double kBaselineUnits = 100.0;
    inline constexpr int kMovingAverageWindow = 7;
    inline constexpr double kNoiseFraction = 0.10;
    inline constexpr double kConfidenceLow = 0.8;
    inline constexpr double kConfidenceHigh = 1.2;

    struct ForecastKpi {
        int productsForecast = 0;
        int baselineProducts = 0;    ///< products without history
        int horizon = 0;
        double totalForecastUnits = 0.0;
    };

    class Forecaster {
        std::mt19937 rng_;
        Date fallbackStart_;

        static std::mt19937 makeEngine(std::optional<std::uint32_t> seed) {
            if (seed)
                return std::mt19937(*seed);
            std::random_device rd;
            return std::mt19937(rd());
        }

        static DemandPoint point(Date date, const std::string& product, double units) {
            return DemandPoint{ date, product, units, units * kConfidenceLow, units * kConfidenceHigh };
        }

    public:
        /**
         * @param seed          engine seed; std::nullopt for a random seed
         * @param fallbackStart first date of baseline series for products
         *                      without history
         */
        explicit Forecaster(std::optional<std::uint32_t> seed = std::nullopt, Date fallbackStart = today())
            : rng_(makeEngine(seed)), fallbackStart_(fallbackStart)
        {
        }

        /**
         * @brief Daily totals of one product, keyed by date
         */
        static std::map<Date, double> dailyTotals(const std::string& product, std::span<const HistoryRecord> history) {
            std::map<Date, double> totals;
            for (const auto& r : history) {
                if (r.product == product)
                    totals[r.date] += r.producedUnits;
            }
            return totals;
        }

        /**
         * @brief Exactly horizon points for productId
         * @note horizon <= 0 yields an empty series; the planner rejects it earlier
         */
        std::vector<DemandPoint> forecast(const std::string& productId,
            std::span<const HistoryRecord> history,
            int horizon = 30)
        {
            std::vector<DemandPoint> out;
            if (horizon <= 0)
                return out;
            out.reserve(static_cast<std::size_t>(horizon));

            const auto totals = dailyTotals(productId, history);
            if (totals.empty()) {
                for (int h = 0; h < horizon; ++h)
                    out.push_back(point(fallbackStart_ + std::chrono::days{ h }, productId, kBaselineUnits));
                return out;
            }

            const int window = std::min<int>(kMovingAverageWindow, static_cast<int>(totals.size()));
            double trailing = 0.0;
            auto it = totals.rbegin();
            for (int k = 0; k < window; ++k, ++it)
                trailing += it->second;
            const double baseline = trailing / window;

            // stddev must be positive; an all-zero history draws no noise
            std::normal_distribution<double> noise(0.0, baseline > 0.0 ? kNoiseFraction * baseline : 1.0);
            const Date last = totals.rbegin()->first;
            for (int h = 1; h <= horizon; ++h) {
                const double jitter = baseline > 0.0 ? noise(rng_) : 0.0;
                const double units = std::round(std::max(0.0, baseline + jitter));
                out.push_back(point(last + std::chrono::days{ h }, productId, units));
            }

            VLOG(1) << "forecast " << productId << ": baseline " << baseline << " over "
                    << window << " day(s), last history " << formatDate(last);
            return out;
        }

        /**
         * @brief Forecasts every product in products, or every product seen in
         *        history when products is empty
         */
        DemandSeries runAll(std::span<const HistoryRecord> history,
            const std::vector<std::string>& products,
            int horizon = 30)
        {
            std::set<std::string> wanted(products.begin(), products.end());
            if (wanted.empty()) {
                for (const auto& r : history)
                    wanted.insert(r.product);
            }

            DemandSeries series;
            for (const auto& p : wanted)
                series.emplace(p, forecast(p, history, horizon));
            return series;
        }
    };

} // namespace linemind
