#pragma once
/*
===============================================================================
WORKFORCE SCHEDULER - Assigning workers to line shifts
===============================================================================

Strategies
----------
HeuristicScheduleStrategy ("greedy_seniority")
    Workers are ordered by seniority. Slots are filled in chronological
    order from a rotating cursor over that list: each seat takes the next
    worker not yet booked on that date. A seat stays empty once everyone is
    booked. No-double-booking is the only rule it guarantees; it never
    fails and reports shortfalls through the KPIs.

ExactScheduleStrategy ("cpsat_schedule", solved as a binary program)
    w = worker, d = day offset, s ∈ {Day, Night}, l = line, k = week:

        x[w,d,s,l] ∈ {0,1}  only for slots with required[d,s,l] > 0
        OT[w,k] ≥ 0         overtime hours

        (a) Σ_{s,l} x[w,d,s,l] ≤ 1                        oneShift[w,d]
        (b) H · Σ_{d∈k,s,l} x[w,d,s,l] ≤ maxHours[w]      weeklyHours[w,k]
        (c) Σ_{d'=d..d+3, l} x[w,d',Night,l] ≤ 3          nightWindow[w,d]
        (d) Σ_l x[w,d,Night,l] + Σ_l x[w,d+1,Day,l] ≤ 1   rest[w,d]
        (e) Σ_w x[w,d,s,l] ≥ required[d,s,l]              staffing[d,s,l]
        (f) OT[w,k] ≥ H · Σ_{d∈k,s,l} x[w,d,s,l] - T      overtime[w,k]

        min Σ wage[w]·H·x + nightPenalty · Σ_{¬prefersNight} x[·,·,Night,·]
            + overtimePenalty · Σ OT + ε Σ rank(w)·x

    H = hours per shift, T = overtime threshold, rank = position in the
    seniority order, so senior workers win ties.

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <optional>
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
#include "staffing.h"
#include "types.h"
#include "validation.h"
#include "variables.h"

namespace linemind {

    using ScheduleResult = Result<Schedule, ScheduleKpi>;

    inline constexpr int kMaxNightsPerWindow = 3;
    inline constexpr int kNightWindowDays = 4;

    // ============================================================================
    // HEURISTIC
    // ============================================================================

    class HeuristicScheduleStrategy {
    public:
        ScheduleResult solve(const MixPlan& plan, std::span<const Worker> workers, const PlanningConfig& config) const
        {
            validateMixPlan(plan);
            validateWorkers(workers);

            const auto slots = requiredSlots(plan, config.effectiveStartDate(), config.unitsPerWorkerShift);
            const auto order = bySeniority(workers);
            const std::size_t n = order.size();

            std::map<int, std::vector<bool>> booked;
            std::size_t cursor = 0;
            Schedule schedule;

            for (const auto& slot : slots) {
                auto& onDate = booked[slot.dayIndex];
                if (onDate.empty())
                    onDate.assign(n, false);

                for (int seat = 0; seat < slot.required; ++seat) {
                    std::optional<std::size_t> pick;
                    for (std::size_t k = 0; k < n; ++k) {
                        const std::size_t i = (cursor + k) % n;
                        if (!onDate[i]) {
                            pick = i;
                            break;
                        }
                    }
                    if (!pick)
                        break;

                    onDate[*pick] = true;
                    cursor = (*pick + 1) % n;
                    const Worker& w = order[*pick];
                    schedule.entries.push_back(ScheduleEntry{
                        slot.date, slot.period, slot.day, slot.lineId, slot.shift, w.workerId, w.name });
                }
            }

            auto kpi = computeScheduleKpi(schedule.entries, slots, workers, config);
            kpi.strategy = Strategy::Heuristic;

            LOG(INFO) << "schedule[heuristic]: " << slots.size() << " slot(s), " << n << " worker(s), "
                      << kpi.totalShifts << "/" << kpi.requiredShifts << " shifts filled";
            if (kpi.understaffedSlots > 0) {
                LOG(WARNING) << "schedule[heuristic]: " << kpi.understaffedSlots << " understaffed slot(s), fulfillment "
                             << kpi.fulfillmentRate << "%";
            }

            return ScheduleResult::success(std::move(schedule), kpi);
        }
    };

    // ============================================================================
    // EXACT: MODEL
    // ============================================================================

    LINEMIND_ENUM_WITH_COUNT(ShiftVars, Assign, Overtime);
    LINEMIND_ENUM_WITH_COUNT(ShiftCons, OneShift, WeeklyHours, NightWindow, Rest, Staffing, Overtime);

    /// @brief Dense, index-based view of one scheduling problem
    struct ShiftModelInput {
        std::vector<Worker> workers;            ///< seniority order
        std::vector<std::string> lineIds;       ///< sorted
        std::vector<StaffingSlot> slots;
        std::vector<std::vector<std::vector<int>>> required;  ///< [d][s][l]
        int days = 0;
        int weeks = 0;
        Date start;

        int requiredAt(int d, int s, int l) const {
            return required[static_cast<std::size_t>(d)][static_cast<std::size_t>(s)][static_cast<std::size_t>(l)];
        }

        static ShiftModelInput from(const MixPlan& plan, std::span<const Worker> workers, const PlanningConfig& config) {
            ShiftModelInput in;
            in.start = config.effectiveStartDate();
            in.workers = bySeniority(workers);
            in.slots = requiredSlots(plan, in.start, config.unitsPerWorkerShift);

            for (const auto& s : in.slots) {
                if (std::find(in.lineIds.begin(), in.lineIds.end(), s.lineId) == in.lineIds.end())
                    in.lineIds.push_back(s.lineId);
                in.days = std::max(in.days, s.dayIndex + 1);
            }
            std::sort(in.lineIds.begin(), in.lineIds.end());
            in.weeks = (in.days + 6) / 7;

            in.required.assign(static_cast<std::size_t>(in.days),
                std::vector<std::vector<int>>(Shift_COUNT, std::vector<int>(in.lineIds.size(), 0)));
            for (const auto& s : in.slots) {
                const auto l = static_cast<std::size_t>(
                    std::lower_bound(in.lineIds.begin(), in.lineIds.end(), s.lineId) - in.lineIds.begin());
                in.required[static_cast<std::size_t>(s.dayIndex)][enum_index(s.shift)][l] = s.required;
            }
            return in;
        }

        /// @brief "workers: 0=W01, ...; lines: 0=L1, ...; day 0=2025-01-06"
        std::string legend() const {
            std::string out = "workers:";
            for (std::size_t i = 0; i < workers.size(); ++i)
                out += std::format("{} {}={}", i == 0 ? "" : ",", i, workers[i].workerId);
            out += "; lines:";
            for (std::size_t i = 0; i < lineIds.size(); ++i)
                out += std::format("{} {}={}", i == 0 ? "" : ",", i, lineIds[i]);
            out += "; day 0=" + formatDate(start);
            return out;
        }
    };

    /// @brief Seniority tie-break weight; small against wages and penalties
    inline constexpr double kSeniorityEpsilon = 1e-3;

    class ShiftModelBuilder : public ModelBuilder<ShiftVars, ShiftCons> {
        const ShiftModelInput& in_;
        const PlanningConfig& config_;
        std::unique_ptr<CancellationCallback> callback_;

        IndexList W_, D_, S_, L_, K_;

        static constexpr int kDay = static_cast<int>(Shift::Day);
        static constexpr int kNight = static_cast<int>(Shift::Night);

        IndexedVariableSet& x() { return variables()(ShiftVars::Assign).asIndexed(); }

        /// @brief Σ_l x[w,d,s,l] over the existing variables, with the term count
        GRBLinExpr shiftLoad(int w, int d, int s, int& terms) {
            GRBLinExpr expr = 0.0;
            if (d < 0 || d >= in_.days)
                return expr;
            for (int l : L_) {
                if (GRBVar* v = x().try_get(w, d, s, l)) {
                    expr += *v;
                    ++terms;
                }
            }
            return expr;
        }

        /// @brief Σ_{d∈week k, s, l} x[w,d,s,l]
        GRBLinExpr weekLoad(int w, int k, int& terms) {
            GRBLinExpr expr = 0.0;
            for (int d = 7 * k; d < 7 * k + 7; ++d) {
                for (int s : S_)
                    expr += shiftLoad(w, d, s, terms);
            }
            return expr;
        }

    public:
        ShiftModelBuilder(const ShiftModelInput& in, const PlanningConfig& config)
            : in_(in), config_(config),
            W_(range(0, static_cast<int>(in.workers.size()))),
            D_(range(0, in.days)),
            S_(range(0, static_cast<int>(Shift_COUNT))),
            L_(range(0, static_cast<int>(in.lineIds.size()))),
            K_(range(0, in.weeks))
        {
        }

        void addVariables() override {
            auto& m = model();

            auto staffed = (W_ * D_ * S_ * L_)
                | filter([&](int, int d, int s, int l) { return in_.requiredAt(d, s, l) > 0; });
            variables().set(ShiftVars::Assign,
                VariableFactory::addIndexed(m, GRB_BINARY, 0.0, 1.0, "x", staffed));
            variables().set(ShiftVars::Overtime,
                VariableFactory::add(m, GRB_CONTINUOUS, 0.0, GRB_INFINITY, "OT", W_.size(), K_.size()));
        }

        void addConstraints() override {
            auto& m = model();
            auto& OT = variables()(ShiftVars::Overtime);
            const double H = config_.hoursPerShift;

            constraints().set(ShiftCons::OneShift,
                ConstraintFactory::addIndexed(m, "oneShift", W_ * D_, [&](int w, int d) -> std::optional<GRBTempConstr> {
                    int terms = 0;
                    GRBLinExpr lhs = shiftLoad(w, d, kDay, terms) + shiftLoad(w, d, kNight, terms);
                    if (terms <= 1)
                        return std::nullopt;
                    return lhs <= 1;
                }));

            constraints().set(ShiftCons::WeeklyHours,
                ConstraintFactory::addIndexed(m, "weeklyHours", W_ * K_, [&](int w, int k) -> std::optional<GRBTempConstr> {
                    int terms = 0;
                    GRBLinExpr shifts = weekLoad(w, k, terms);
                    if (terms == 0)
                        return std::nullopt;
                    return H * shifts <= in_.workers[static_cast<std::size_t>(w)].maxHoursPerWeek;
                }));

            constraints().set(ShiftCons::NightWindow,
                ConstraintFactory::addIndexed(m, "nightWindow", W_ * D_, [&](int w, int d) -> std::optional<GRBTempConstr> {
                    if (d + kNightWindowDays > in_.days)
                        return std::nullopt;
                    int terms = 0;
                    GRBLinExpr nights = 0.0;
                    for (int j = d; j < d + kNightWindowDays; ++j)
                        nights += shiftLoad(w, j, kNight, terms);
                    if (terms <= kMaxNightsPerWindow)
                        return std::nullopt;
                    return nights <= kMaxNightsPerWindow;
                }));

            constraints().set(ShiftCons::Rest,
                ConstraintFactory::addIndexed(m, "rest", W_ * D_, [&](int w, int d) -> std::optional<GRBTempConstr> {
                    int nightTerms = 0;
                    int dayTerms = 0;
                    GRBLinExpr night = shiftLoad(w, d, kNight, nightTerms);
                    GRBLinExpr next = shiftLoad(w, d + 1, kDay, dayTerms);
                    if (nightTerms == 0 || dayTerms == 0)
                        return std::nullopt;
                    return night + next <= 1;
                }));

            constraints().set(ShiftCons::Staffing,
                ConstraintFactory::addIndexed(m, "staffing",
                    (D_ * S_ * L_) | filter([&](int d, int s, int l) { return in_.requiredAt(d, s, l) > 0; }),
                    [&](int d, int s, int l) {
                        GRBLinExpr crew = sumExisting(W_ * IndexList{ d } * IndexList{ s } * IndexList{ l }, x());
                        return crew >= in_.requiredAt(d, s, l);
                    }));

            constraints().set(ShiftCons::Overtime,
                ConstraintFactory::addIndexed(m, "overtime", W_ * K_, [&](int w, int k) -> std::optional<GRBTempConstr> {
                    int terms = 0;
                    GRBLinExpr shifts = weekLoad(w, k, terms);
                    if (terms == 0)
                        return std::nullopt;
                    return OT(w, k) >= H * shifts - config_.overtimeThresholdHours;
                }));
        }

        void addParameters() override {
            quiet();
            timeLimit(config_.scheduleTimeLimitSeconds);
            threads(config_.solverThreads);
            seed(0);
            mipGapLimit(1e-6);
        }

        void addObjective() override {
            auto& OT = variables()(ShiftVars::Overtime).asGroup();
            const double H = config_.hoursPerShift;

            GRBLinExpr obj = 0.0;
            for (const auto& e : x()) {
                const auto w = static_cast<std::size_t>(e.index[0]);
                const Worker& worker = in_.workers[w];
                double coeff = worker.wagePerHour * H + kSeniorityEpsilon * static_cast<double>(w + 1);
                if (e.index[2] == kNight && !worker.prefersNight)
                    coeff += config_.nightPenalty;
                obj += coeff * e.var;
            }
            obj += config_.overtimePenalty * sum(OT);
            minimize(obj);
        }

        void beforeOptimize() override {
            callback_ = std::make_unique<CancellationCallback>(config_.cancellation);
            model().setCallback(callback_.get());
            model().update();
            VLOG(1) << "schedule model: " << modelSummary(model());
        }

        void afterOptimize() override {
            VLOG(1) << "schedule model: status " << statusString(status()) << " after " << runtime() << "s, "
                    << callback_->incumbents() << " incumbent(s)";
            if (callback_->aborted())
                LOG(WARNING) << "schedule model: solve stopped by cancellation";
        }

        /// @brief Chosen (worker, day, shift, line) tuples of the incumbent
        std::vector<std::vector<int>> chosen() const {
            std::vector<std::vector<int>> out;
            for (const auto& e : variables()(ShiftVars::Assign).asIndexed()) {
                if (value(e.var) > 0.5)
                    out.push_back(e.index);
            }
            return out;
        }
    };

    // ============================================================================
    // EXACT: STRATEGY
    // ============================================================================

    class ExactScheduleStrategy {
    public:
        /**
         * @throws DataShapeError, InfeasibleModelError, SolverTimeoutError,
         *         SolverUnavailableError, UnboundedModelError, SolverError
         */
        ScheduleResult solve(const MixPlan& plan, std::span<const Worker> workers, const PlanningConfig& config) const
        {
            validateMixPlan(plan);
            validateWorkers(workers);

            const ShiftModelInput in = ShiftModelInput::from(plan, workers, config);
            if (in.slots.empty()) {
                ScheduleKpi kpi;
                kpi.strategy = Strategy::Exact;
                kpi.provenOptimal = true;
                LOG(INFO) << "schedule[exact]: nothing to staff";
                return ScheduleResult::success(Schedule{}, kpi);
            }

            ShiftModelBuilder builder(in, config);
            const SolveState state = solveAndClassify(builder, "schedule");

            switch (state) {
                case SolveState::Optimal:
                case SolveState::Feasible:
                    break;
                case SolveState::Infeasible: {
                    std::vector<std::string> details = conflicts(builder);
                    details.push_back(in.legend());
                    LOG(INFO) << "schedule[exact]: infeasible, " << details.size() - 1 << " IIS member(s)";
                    throw InfeasibleModelError("no feasible schedule",
                        "relax weekly hour or rest constraints, or add workers", std::move(details));
                }
                case SolveState::Timeout:
                    LOG(WARNING) << "schedule[exact]: no incumbent within " << config.scheduleTimeLimitSeconds << "s";
                    throw SolverTimeoutError(std::format("schedule: no schedule found within {}s",
                        config.scheduleTimeLimitSeconds));
                case SolveState::Unbounded:
                    throw UnboundedModelError("schedule: objective is unbounded");
                default:
                    throw SolverError(std::format("schedule: solver ended with status {}",
                        statusString(builder.status())));
            }

            if (state == SolveState::Feasible) {
                LOG(WARNING) << "schedule[exact]: stopped with an incumbent (status "
                             << statusString(builder.status()) << ", gap " << builder.mipGap() << ")";
            }

            Schedule schedule;
            for (const auto& idx : builder.chosen()) {
                const Worker& w = in.workers[static_cast<std::size_t>(idx[0])];
                const int d = idx[1];
                schedule.entries.push_back(ScheduleEntry{
                    in.start + std::chrono::days{ d }, d / 7 + 1, d % 7 + 1,
                    in.lineIds[static_cast<std::size_t>(idx[3])], static_cast<Shift>(idx[2]),
                    w.workerId, w.name });
            }
            sortScheduleEntries(schedule.entries);

            auto kpi = computeScheduleKpi(schedule.entries, in.slots, workers, config);
            kpi.strategy = Strategy::Exact;
            kpi.provenOptimal = state == SolveState::Optimal;
            kpi.mipGap = builder.mipGap();
            kpi.runtimeSeconds = builder.runtime();

            LOG(INFO) << "schedule[exact]: " << toString(state) << ", " << kpi.totalShifts << " shift(s), "
                      << kpi.workersUsed << " worker(s), cost " << kpi.totalCost << ", overtime "
                      << kpi.totalOvertimeHours << "h";
            return ScheduleResult::success(std::move(schedule), kpi);
        }

    private:
        static std::vector<std::string> conflicts(ShiftModelBuilder& builder) {
            try {
                return computeIIS(builder.model());
            }
            catch (const GRBException& e) {
                LOG(WARNING) << "schedule[exact]: IIS computation failed: " << e.getMessage();
                return {};
            }
        }
    };

} // namespace linemind
