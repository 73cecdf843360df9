#pragma once
/*
===============================================================================
RESULT - Success/Failure envelope returned by every planning operation
===============================================================================

    Success: { outcome: Success, payload, kpis }
    Failure: { outcome: Failure, message, suggestion, code, details[] }

USAGE
-----
    PlanResult r = runMixOptimization(demand, lines, changeovers, config);
    if (r.ok()) {
        for (const auto& e : r.payload().entries) { ... }
        double rate = r.kpis().fulfillmentRate;
    }
    else {
        LOG(WARNING) << toString(r.failure().code) << ": " << r.failure().message;
    }

Accessing payload()/kpis() of a Failure, or failure() of a Success, throws
std::logic_error.

===============================================================================
*/

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"

namespace linemind {

    enum class Outcome { Success, Failure };

    struct Failure {
        std::string message;
        std::string suggestion;
        ErrorCode code = ErrorCode::SolverError;
        std::vector<std::string> details;

        static Failure from(const PlanningError& e) {
            return Failure{ e.what(), e.suggestion(), e.code(), e.details() };
        }
    };

    template<typename Payload, typename Kpi>
    class Result {
        std::optional<Payload> payload_;
        std::optional<Kpi> kpis_;
        std::optional<Failure> failure_;

        Result() = default;

    public:
        static Result success(Payload payload, Kpi kpis) {
            Result r;
            r.payload_ = std::move(payload);
            r.kpis_ = std::move(kpis);
            return r;
        }

        static Result failure(Failure f) {
            Result r;
            r.failure_ = std::move(f);
            return r;
        }

        static Result failure(const PlanningError& e) { return failure(Failure::from(e)); }

        [[nodiscard]] bool ok() const noexcept { return !failure_.has_value(); }

        [[nodiscard]] Outcome outcome() const noexcept { return ok() ? Outcome::Success : Outcome::Failure; }

        const Payload& payload() const {
            if (!payload_)
                throw std::logic_error("Result::payload: result is a failure");
            return *payload_;
        }

        const Kpi& kpis() const {
            if (!kpis_)
                throw std::logic_error("Result::kpis: result is a failure");
            return *kpis_;
        }

        const Failure& failure() const {
            if (!failure_)
                throw std::logic_error("Result::failure: result is a success");
            return *failure_;
        }
    };

} // namespace linemind
