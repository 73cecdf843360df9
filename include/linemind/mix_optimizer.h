#pragma once
/*
===============================================================================
MIX OPTIMIZER - Assigning forecast demand to production lines
===============================================================================

Strategies
----------
HeuristicMixStrategy ("simple_assignment")
    First-week demand of each product is split evenly over the lines that
    can run it (line-id order, remainder to the first lines), clamped at
    each line's remaining weekly capacity. Never fails; shortfalls show up
    as fulfillmentRate < 100 and unassignedProducts.

ExactMixStrategy ("milp_assignment")
    One MILP per call, over weeks w = 0..W-1 with W = max(1, horizon / 7):

        Q[l,p,w] ∈ Z+      units of p made on l in week w
        Y[l,p,w] ∈ {0,1}   l runs p in week w
        Z[l,m,n,w] ∈ {0,1} l switches m → n at the start of week w (w ≥ 1)

        (a) Σ_p Y[l,p,w] ≤ 1                          oneProduct[l,w]
        (b) Q[l,p,w] ≤ cap[l] · Y[l,p,w]             capacity[l,p,w]
        (c) Σ_l Q[l,p,w] ≥ demand[p,w]               demand[p,w]
        (d) Y[l,p,w] = 0 if p not eligible on l      eligibility[l,p,w]
        (e) Z[l,m,n,w] ≥ Y[l,m,w-1] + Y[l,n,w] - 1   changeover[l,m,n,w]

        min Σ unitCost·Q + Σ changeoverCost[m,n]·Z + ε Σ (l+1)·Y

    The ε term prefers lower line ids among equal-cost plans. Indices in
    constraint names are positions in the sorted line and product lists;
    infeasibility details carry the legend.

KPIs are recomputed from the extracted plan, not from the objective value.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "callbacks.h"
#include "config.h"
#include "constraints.h"
#include "diagnostics.h"
#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"
#include "indexing.h"
#include "model_builder.h"
#include "result.h"
#include "types.h"
#include "validation.h"
#include "variables.h"

namespace linemind {

    struct MixKpi {
        int totalDemand = 0;
        int totalPlanned = 0;
        double fulfillmentRate = 100.0;     ///< percent; 100 when nothing is demanded
        double productionCost = 0.0;        ///< totalPlanned · unitCost
        double changeoverCost = 0.0;
        double totalCost = 0.0;             ///< production + changeover; the heuristic's estimate
        int changeovers = 0;
        double changeoverHours = 0.0;
        double averageUtilization = 0.0;    ///< mean over plan entries
        int unassignedProducts = 0;         ///< demanded products no line can run
        bool provenOptimal = false;
        double mipGap = 0.0;
        double runtimeSeconds = 0.0;
        Strategy strategy = Strategy::Heuristic;
    };

    using PlanResult = Result<MixPlan, MixKpi>;

    namespace mix_detail {

        inline std::vector<Line> sortedLines(std::span<const Line> lines) {
            std::vector<Line> out(lines.begin(), lines.end());
            std::sort(out.begin(), out.end(),
                [](const Line& a, const Line& b) { return a.lineId < b.lineId; });
            return out;
        }

        /// @brief Whole weekly units a line can make (7 · daily, floored)
        inline int weeklyCapacity(const Line& l) {
            return static_cast<int>(std::floor(l.weeklyCapacity() + 1e-9));
        }

        /// @brief Rounded sum of forecast days [7·week, 7·week + 7)
        inline int weekDemand(const std::vector<DemandPoint>& series, int week) {
            double total = 0.0;
            const std::size_t first = static_cast<std::size_t>(week) * 7;
            for (std::size_t i = first; i < first + 7 && i < series.size(); ++i)
                total += series[i].forecastUnits;
            return static_cast<int>(std::lround(total));
        }

        inline double fulfillment(int planned, int demanded) {
            return demanded > 0 ? 100.0 * planned / demanded : 100.0;
        }

        inline void sortEntries(std::vector<MixPlanEntry>& entries) {
            std::sort(entries.begin(), entries.end(), [](const MixPlanEntry& a, const MixPlanEntry& b) {
                if (a.period != b.period)
                    return a.period < b.period;
                if (a.lineId != b.lineId)
                    return a.lineId < b.lineId;
                return a.product < b.product;
            });
        }

        inline double averageUtilization(const std::vector<MixPlanEntry>& entries) {
            if (entries.empty())
                return 0.0;
            double total = 0.0;
            for (const auto& e : entries)
                total += e.utilization;
            return total / static_cast<double>(entries.size());
        }

    } // namespace mix_detail

    // ============================================================================
    // HEURISTIC
    // ============================================================================

    class HeuristicMixStrategy {
    public:
        PlanResult solve(const DemandSeries& demand, std::span<const Line> lines, const PlanningConfig& config) const
        {
            validateDemand(demand);
            validateLines(lines);

            const auto sorted = mix_detail::sortedLines(lines);
            std::vector<int> remaining;
            for (const auto& l : sorted)
                remaining.push_back(mix_detail::weeklyCapacity(l));

            MixPlan plan;
            MixKpi kpi;
            kpi.strategy = Strategy::Heuristic;

            for (const auto& [product, series] : demand) {
                const int weekly = mix_detail::weekDemand(series, 0);
                kpi.totalDemand += weekly;

                std::vector<std::size_t> eligible;
                for (std::size_t i = 0; i < sorted.size(); ++i) {
                    if (sorted[i].canRun(product))
                        eligible.push_back(i);
                }
                if (eligible.empty()) {
                    if (weekly > 0)
                        ++kpi.unassignedProducts;
                    continue;
                }

                const int n = static_cast<int>(eligible.size());
                const int base = weekly / n;
                const int extra = weekly % n;
                for (int k = 0; k < n; ++k) {
                    const std::size_t i = eligible[static_cast<std::size_t>(k)];
                    const int share = std::min(base + (k < extra ? 1 : 0), remaining[i]);
                    if (share <= 0)
                        continue;
                    remaining[i] -= share;

                    const double cap = mix_detail::weeklyCapacity(sorted[i]);
                    plan.entries.push_back(MixPlanEntry{
                        1, sorted[i].lineId, product, share, std::min(1.0, share / cap) });
                    kpi.totalPlanned += share;
                }
            }

            mix_detail::sortEntries(plan.entries);
            kpi.fulfillmentRate = mix_detail::fulfillment(kpi.totalPlanned, kpi.totalDemand);
            kpi.productionCost = kpi.totalPlanned * config.unitCost;
            kpi.totalCost = kpi.productionCost;
            kpi.averageUtilization = mix_detail::averageUtilization(plan.entries);

            LOG(INFO) << "mix[heuristic]: " << demand.size() << " product(s), " << sorted.size()
                      << " line(s), planned " << kpi.totalPlanned << "/" << kpi.totalDemand
                      << " (" << kpi.fulfillmentRate << "%)";
            if (kpi.fulfillmentRate < 100.0 || kpi.unassignedProducts > 0) {
                LOG(WARNING) << "mix[heuristic]: partial fulfillment, " << kpi.unassignedProducts
                             << " product(s) without an eligible line";
            }

            return PlanResult::success(std::move(plan), kpi);
        }
    };

    // ============================================================================
    // EXACT: MODEL
    // ============================================================================

    LINEMIND_ENUM_WITH_COUNT(MixVars, Quantity, Assign, Changeover);
    LINEMIND_ENUM_WITH_COUNT(MixCons, OneProduct, Capacity, Demand, Eligibility, Changeover);

    /// @brief Dense, index-based view of one mix problem
    struct MixModelInput {
        std::vector<Line> lines;                  ///< sorted by id
        std::vector<std::string> products;        ///< sorted
        std::vector<int> weeklyCapacity;          ///< [l]
        std::vector<std::vector<int>> demand;     ///< [p][w]
        std::vector<std::vector<double>> changeoverCost;  ///< [m][n]
        int weeks = 1;
        double unitCost = 1000.0;

        bool eligible(int l, int p) const {
            return lines[static_cast<std::size_t>(l)].canRun(products[static_cast<std::size_t>(p)]);
        }

        /**
         * @throws DataShapeError for invalid lines/demand or missing
         *         changeover pairs
         */
        static MixModelInput from(const DemandSeries& demand,
            std::span<const Line> lines,
            const ChangeoverTable& changeovers,
            const PlanningConfig& config)
        {
            validateDemand(demand);
            validateLines(lines);

            MixModelInput in;
            in.lines = mix_detail::sortedLines(lines);
            in.unitCost = config.unitCost;

            std::set<std::string> productSet;
            std::size_t horizon = 0;
            for (const auto& [product, series] : demand) {
                productSet.insert(product);
                horizon = std::max(horizon, series.size());
            }
            validateChangeovers(in.lines, productSet, changeovers);

            in.products.assign(productSet.begin(), productSet.end());
            in.weeks = std::max(1, static_cast<int>(horizon / 7));

            for (const auto& l : in.lines)
                in.weeklyCapacity.push_back(mix_detail::weeklyCapacity(l));

            for (const auto& p : in.products) {
                std::vector<int> row;
                for (int w = 0; w < in.weeks; ++w)
                    row.push_back(mix_detail::weekDemand(demand.at(p), w));
                in.demand.push_back(std::move(row));
            }

            in.changeoverCost.assign(in.products.size(), std::vector<double>(in.products.size(), 0.0));
            for (std::size_t m = 0; m < in.products.size(); ++m) {
                for (std::size_t n = 0; n < in.products.size(); ++n) {
                    if (const auto* row = changeovers.find(in.products[m], in.products[n]))
                        in.changeoverCost[m][n] = row->cost;
                }
            }
            return in;
        }

        /// @brief "lines: 0=L1, 1=L2; products: 0=A, 1=B"
        std::string legend() const {
            std::string out = "lines:";
            for (std::size_t i = 0; i < lines.size(); ++i)
                out += std::format("{} {}={}", i == 0 ? "" : ",", i, lines[i].lineId);
            out += "; products:";
            for (std::size_t i = 0; i < products.size(); ++i)
                out += std::format("{} {}={}", i == 0 ? "" : ",", i, products[i]);
            return out;
        }
    };

    /// @brief Lexicographic tie-break weight; small against any unit or changeover cost
    inline constexpr double kLineRankEpsilon = 1e-3;

    class MixModelBuilder : public ModelBuilder<MixVars, MixCons> {
        const MixModelInput& in_;
        const PlanningConfig& config_;
        std::unique_ptr<CancellationCallback> callback_;

        IndexList L_, P_, W_;

    public:
        MixModelBuilder(const MixModelInput& in, const PlanningConfig& config)
            : in_(in), config_(config),
            L_(range(0, static_cast<int>(in.lines.size()))),
            P_(range(0, static_cast<int>(in.products.size()))),
            W_(range(0, in.weeks))
        {
        }

        void addVariables() override {
            auto& m = model();
            const int nL = L_.size();
            const int nP = P_.size();
            const int nW = W_.size();

            variables().set(MixVars::Quantity,
                VariableFactory::add(m, GRB_INTEGER, 0.0, GRB_INFINITY, "Q", nL, nP, nW));
            variables().set(MixVars::Assign,
                VariableFactory::add(m, GRB_BINARY, 0.0, 1.0, "Y", nL, nP, nW));

            auto switches = (L_ * P_ * P_ * W_)
                | filter([&](int l, int a, int b, int w) {
                    return w >= 1 && a != b && in_.eligible(l, a) && in_.eligible(l, b);
                });
            variables().set(MixVars::Changeover,
                VariableFactory::addIndexed(m, GRB_BINARY, 0.0, 1.0, "Z", switches));
        }

        void addConstraints() override {
            auto& m = model();
            auto& Q = variables()(MixVars::Quantity);
            auto& Y = variables()(MixVars::Assign);
            auto& Z = variables()(MixVars::Changeover).asIndexed();

            constraints().set(MixCons::OneProduct,
                ConstraintFactory::addIndexed(m, "oneProduct", L_ * W_, [&](int l, int w) {
                    return sum(P_, [&](int p) { return Y(l, p, w); }) <= 1;
                }));

            constraints().set(MixCons::Capacity,
                ConstraintFactory::addIndexed(m, "capacity", L_ * P_ * W_, [&](int l, int p, int w) {
                    return Q(l, p, w) <= in_.weeklyCapacity[static_cast<std::size_t>(l)] * Y(l, p, w);
                }));

            constraints().set(MixCons::Demand,
                ConstraintFactory::addIndexed(m, "demand", P_ * W_, [&](int p, int w) {
                    return sum(L_, [&](int l) { return Q(l, p, w); })
                        >= in_.demand[static_cast<std::size_t>(p)][static_cast<std::size_t>(w)];
                }));

            constraints().set(MixCons::Eligibility,
                ConstraintFactory::addIndexed(m, "eligibility",
                    (L_ * P_ * W_) | filter([&](int l, int p, int) { return !in_.eligible(l, p); }),
                    [&](int l, int p, int w) { return Y(l, p, w) == 0.0; }));

            std::vector<std::tuple<int, int, int, int>> switchIdx;
            for (const auto& e : Z)
                switchIdx.emplace_back(e.index[0], e.index[1], e.index[2], e.index[3]);
            constraints().set(MixCons::Changeover,
                ConstraintFactory::addIndexed(m, "changeover", switchIdx, [&](int l, int a, int b, int w) {
                    return Z(l, a, b, w) >= Y(l, a, w - 1) + Y(l, b, w) - 1;
                }));
        }

        void addParameters() override {
            quiet();
            timeLimit(config_.mixTimeLimitSeconds);
            threads(config_.solverThreads);
            seed(0);
            mipGapLimit(1e-6);
        }

        void addObjective() override {
            auto& Q = variables()(MixVars::Quantity);
            auto& Y = variables()(MixVars::Assign);
            const auto& Z = variables()(MixVars::Changeover).asIndexed();

            GRBLinExpr obj = sum(L_ * P_ * W_, [&](int l, int p, int w) {
                return in_.unitCost * Q(l, p, w) + kLineRankEpsilon * (l + 1) * Y(l, p, w);
            });
            for (const auto& e : Z) {
                const double cost = in_.changeoverCost[static_cast<std::size_t>(e.index[1])]
                                                      [static_cast<std::size_t>(e.index[2])];
                obj += cost * e.var;
            }
            minimize(obj);
        }

        void beforeOptimize() override {
            callback_ = std::make_unique<CancellationCallback>(config_.cancellation);
            model().setCallback(callback_.get());
            model().update();
            VLOG(1) << "mix model: " << modelSummary(model());
        }

        void afterOptimize() override {
            VLOG(1) << "mix model: status " << statusString(status()) << " after " << runtime() << "s, "
                    << callback_->incumbents() << " incumbent(s)";
            if (callback_->aborted())
                LOG(WARNING) << "mix model: solve stopped by cancellation";
        }

        /// @brief Product index run on line l in week w, or -1
        int assigned(int l, int w) const {
            const auto& Y = variables()(MixVars::Assign);
            for (int p : P_) {
                if (value(Y(l, p, w)) > 0.5)
                    return p;
            }
            return -1;
        }

        int quantity(int l, int p, int w) const {
            return static_cast<int>(std::lround(value(variables()(MixVars::Quantity)(l, p, w))));
        }
    };

    // ============================================================================
    // EXACT: STRATEGY
    // ============================================================================

    class ExactMixStrategy {
    public:
        /**
         * @throws DataShapeError, InfeasibleModelError, SolverTimeoutError,
         *         SolverUnavailableError, UnboundedModelError, SolverError
         */
        PlanResult solve(const DemandSeries& demand,
            std::span<const Line> lines,
            const ChangeoverTable& changeovers,
            const PlanningConfig& config) const
        {
            const MixModelInput in = MixModelInput::from(demand, lines, changeovers, config);
            if (in.products.empty()) {
                MixKpi kpi;
                kpi.strategy = Strategy::Exact;
                kpi.provenOptimal = true;
                LOG(INFO) << "mix[exact]: no demand, empty plan";
                return PlanResult::success(MixPlan{}, kpi);
            }

            MixModelBuilder builder(in, config);
            const SolveState state = solveAndClassify(builder, "mix");

            switch (state) {
                case SolveState::Optimal:
                case SolveState::Feasible:
                    break;
                case SolveState::Infeasible: {
                    std::vector<std::string> details = conflicts(builder);
                    details.push_back(in.legend());
                    LOG(INFO) << "mix[exact]: infeasible, " << details.size() - 1 << " IIS member(s)";
                    throw InfeasibleModelError("no feasible assignment",
                        "relax capacity or eligibility constraints", std::move(details));
                }
                case SolveState::Timeout:
                    LOG(WARNING) << "mix[exact]: no incumbent within " << config.mixTimeLimitSeconds << "s";
                    throw SolverTimeoutError(std::format("mix: no assignment found within {}s",
                        config.mixTimeLimitSeconds));
                case SolveState::Unbounded:
                    throw UnboundedModelError("mix: objective is unbounded");
                default:
                    throw SolverError(std::format("mix: solver ended with status {}",
                        statusString(builder.status())));
            }

            if (state == SolveState::Feasible) {
                LOG(WARNING) << "mix[exact]: stopped with an incumbent (status "
                             << statusString(builder.status()) << ", gap " << builder.mipGap() << ")";
            }
            return extract(builder, in, changeovers, state);
        }

    private:
        static std::vector<std::string> conflicts(MixModelBuilder& builder) {
            try {
                return computeIIS(builder.model());
            }
            catch (const GRBException& e) {
                LOG(WARNING) << "mix[exact]: IIS computation failed: " << e.getMessage();
                return {};
            }
        }

        static PlanResult extract(const MixModelBuilder& builder,
            const MixModelInput& in,
            const ChangeoverTable& changeovers,
            SolveState state)
        {
            MixPlan plan;
            MixKpi kpi;
            kpi.strategy = Strategy::Exact;

            const int nL = static_cast<int>(in.lines.size());
            const int nP = static_cast<int>(in.products.size());

            for (int l = 0; l < nL; ++l) {
                const auto& line = in.lines[static_cast<std::size_t>(l)];
                int previous = -1;
                for (int w = 0; w < in.weeks; ++w) {
                    const int p = builder.assigned(l, w);
                    if (p >= 0) {
                        const int units = builder.quantity(l, p, w);
                        if (units > 0) {
                            const double cap = in.weeklyCapacity[static_cast<std::size_t>(l)];
                            plan.entries.push_back(MixPlanEntry{ w + 1, line.lineId,
                                in.products[static_cast<std::size_t>(p)], units,
                                cap > 0 ? std::min(1.0, units / cap) : 0.0 });
                            kpi.totalPlanned += units;
                        }
                        if (previous >= 0 && previous != p) {
                            const auto* row = changeovers.find(in.products[static_cast<std::size_t>(previous)],
                                in.products[static_cast<std::size_t>(p)]);
                            ++kpi.changeovers;
                            if (row) {
                                kpi.changeoverCost += row->cost;
                                kpi.changeoverHours += row->hours;
                            }
                        }
                    }
                    previous = p;
                }
            }

            for (int p = 0; p < nP; ++p) {
                bool runnable = false;
                for (int l = 0; l < nL && !runnable; ++l)
                    runnable = in.eligible(l, p);
                int demanded = 0;
                for (int d : in.demand[static_cast<std::size_t>(p)])
                    demanded += d;
                kpi.totalDemand += demanded;
                if (!runnable && demanded > 0)
                    ++kpi.unassignedProducts;
            }

            mix_detail::sortEntries(plan.entries);
            kpi.fulfillmentRate = mix_detail::fulfillment(kpi.totalPlanned, kpi.totalDemand);
            kpi.productionCost = kpi.totalPlanned * in.unitCost;
            kpi.totalCost = kpi.productionCost + kpi.changeoverCost;
            kpi.averageUtilization = mix_detail::averageUtilization(plan.entries);
            kpi.provenOptimal = state == SolveState::Optimal;
            kpi.mipGap = builder.mipGap();
            kpi.runtimeSeconds = builder.runtime();

            LOG(INFO) << "mix[exact]: " << toString(state) << ", " << plan.entries.size() << " entries over "
                      << in.weeks << " week(s), cost " << kpi.totalCost << ", " << kpi.changeovers
                      << " changeover(s)";

            return PlanResult::success(std::move(plan), kpi);
        }
    };

} // namespace linemind
