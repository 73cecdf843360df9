#pragma once
/*
===============================================================================
ERRORS - Planning failures and their stable diagnostic codes
===============================================================================

OVERVIEW
--------
Planning stages signal failure by throwing a PlanningError subclass. The
planner facade catches them and turns them into a Failure envelope
(result.h), so callers only ever see values.

    DataShapeError          malformed input, raised before any model is built
    InfeasibleModelError    the constraints admit no plan (IIS in details)
    SolverTimeoutError      time limit or cancellation, no incumbent
    SolverUnavailableError  the Gurobi environment cannot start
    UnboundedModelError     unbounded objective
    SolverError             numeric trouble or unexpected solver exception

Every code has a stable string form (toString) used in logs and by the
outer API layer.

===============================================================================
*/

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "enum_utils.h"

namespace linemind {

    LINEMIND_ENUM_WITH_COUNT(ErrorCode,
        DataShapeError,
        InfeasibleModelError,
        SolverTimeoutError,
        SolverUnavailableError,
        UnboundedModelError,
        SolverError);

    inline constexpr std::array<std::string_view, ErrorCode_COUNT> kErrorCodeNames{
        "DataShapeError",
        "InfeasibleModelError",
        "SolverTimeoutError",
        "SolverUnavailableError",
        "UnboundedModelError",
        "SolverError"
    };

    inline std::string_view toString(ErrorCode code) noexcept { return enum_name(code, kErrorCodeNames); }

    /**
     * @class PlanningError
     * @brief Base of all planning failures; carries code, suggestion and details
     */
    class PlanningError : public std::runtime_error {
        ErrorCode code_;
        std::string suggestion_;
        std::vector<std::string> details_;

    public:
        PlanningError(ErrorCode code,
            const std::string& message,
            std::string suggestion = {},
            std::vector<std::string> details = {})
            : std::runtime_error(message),
            code_(code),
            suggestion_(std::move(suggestion)),
            details_(std::move(details))
        {
        }

        ErrorCode code() const noexcept { return code_; }
        const std::string& suggestion() const noexcept { return suggestion_; }
        const std::vector<std::string>& details() const noexcept { return details_; }
    };

    class DataShapeError : public PlanningError {
    public:
        explicit DataShapeError(const std::string& message, std::vector<std::string> details = {})
            : PlanningError(ErrorCode::DataShapeError, message, "check the input data", std::move(details))
        {
        }
    };

    class InfeasibleModelError : public PlanningError {
    public:
        InfeasibleModelError(const std::string& message, std::string suggestion, std::vector<std::string> details = {})
            : PlanningError(ErrorCode::InfeasibleModelError, message, std::move(suggestion), std::move(details))
        {
        }
    };

    class SolverTimeoutError : public PlanningError {
    public:
        explicit SolverTimeoutError(const std::string& message,
            std::string suggestion = "reduce problem size or increase the time limit")
            : PlanningError(ErrorCode::SolverTimeoutError, message, std::move(suggestion))
        {
        }
    };

    class SolverUnavailableError : public PlanningError {
    public:
        explicit SolverUnavailableError(const std::string& message)
            : PlanningError(ErrorCode::SolverUnavailableError, message,
                "check the Gurobi installation and license, or use the heuristic strategy")
        {
        }
    };

    class UnboundedModelError : public PlanningError {
    public:
        explicit UnboundedModelError(const std::string& message)
            : PlanningError(ErrorCode::UnboundedModelError, message, "check cost parameters for negative values")
        {
        }
    };

    class SolverError : public PlanningError {
    public:
        explicit SolverError(const std::string& message, std::vector<std::string> details = {})
            : PlanningError(ErrorCode::SolverError, message, "retry with the heuristic strategy", std::move(details))
        {
        }
    };

} // namespace linemind
