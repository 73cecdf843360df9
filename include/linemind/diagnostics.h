#pragma once
/*
===============================================================================
DIAGNOSTICS - Solver outcome classification and model analysis
===============================================================================

Overview
--------
Free functions over GRBModel used by both exact planners after optimize():

    * statusString()       Gurobi status code → "OPTIMAL", "TIME_LIMIT", ...
    * classifyStatus()     Gurobi status + incumbent count → SolveState
    * computeStatistics()  variable/constraint counts by type
    * modelSummary()       one-line summary for VLOG(1)
    * computeIIS()         names of the constraints in an IIS
    * solveAndClassify()   optimize() with GRBException → PlanningError
                           translation, then classifyStatus()

Solve lifecycle
---------------
Every exact run moves through

    Built → Solving → { Optimal, Feasible, Infeasible, Unbounded, Timeout,
                        SolverUnavailable, SolverError }

ModelBuilder::state() records the first two while optimize() runs. Only
Optimal and Feasible carry a plan. classifyStatus() is the single
place where Gurobi's status codes are folded into these states:

    OPTIMAL                                   → Optimal
    SUBOPTIMAL                                → Feasible
    TIME_LIMIT, INTERRUPTED, NODE_LIMIT,
    ITERATION_LIMIT, SOLUTION_LIMIT,
    USER_OBJ_LIMIT      with an incumbent     → Feasible
                        without an incumbent  → Timeout
    INFEASIBLE, INF_OR_UNBD                   → Infeasible
    UNBOUNDED                                 → Unbounded
    NUMERIC, CUTOFF, anything else            → SolverError

INF_OR_UNBD maps to Infeasible because every planning objective has
non-negative coefficients over non-negative variables.

Typical Usage
-------------
    builder.optimize();
    auto state = classifyStatus(builder.status(), builder.solutionCount());
    VLOG(1) << modelSummary(builder.model());

    if (state == SolveState::Infeasible) {
        for (const auto& name : computeIIS(builder.model()))
            details.push_back(name);
    }

===============================================================================
*/

#include <array>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gurobi_c++.h"
#include "enum_utils.h"
#include "errors.h"

namespace linemind {

// =============================================================================
// SOLVE STATE
// =============================================================================

LINEMIND_ENUM_WITH_COUNT(SolveState,
    Built, Solving, Optimal, Feasible, Infeasible, Unbounded, Timeout,
    SolverUnavailable, SolverError);

inline constexpr std::array<std::string_view, SolveState_COUNT> kSolveStateNames{
    "Built", "Solving", "Optimal", "Feasible", "Infeasible", "Unbounded", "Timeout",
    "SolverUnavailable", "SolverError"
};

inline std::string_view toString(SolveState s) noexcept {
    return enum_name(s, kSolveStateNames);
}

/// @brief True for the two states that carry an extractable solution
[[nodiscard]] inline bool hasPlan(SolveState s) noexcept {
    return s == SolveState::Optimal || s == SolveState::Feasible;
}

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

// =============================================================================
// STATUS CLASSIFICATION
// =============================================================================

/**
 * @brief Folds a terminal Gurobi status into the planning solve state
 * @param status        GRB_IntAttr_Status after optimize()
 * @param solutionCount GRB_IntAttr_SolCount after optimize()
 */
[[nodiscard]] inline SolveState classifyStatus(int status, int solutionCount) noexcept {
    switch (status) {
        case GRB_OPTIMAL:
            return SolveState::Optimal;
        case GRB_SUBOPTIMAL:
            return SolveState::Feasible;
        case GRB_TIME_LIMIT:
        case GRB_INTERRUPTED:
        case GRB_NODE_LIMIT:
        case GRB_ITERATION_LIMIT:
        case GRB_SOLUTION_LIMIT:
        case GRB_USER_OBJ_LIMIT:
            return solutionCount > 0 ? SolveState::Feasible : SolveState::Timeout;
        case GRB_INFEASIBLE:
        case GRB_INF_OR_UNBD:
            return SolveState::Infeasible;
        case GRB_UNBOUNDED:
            return SolveState::Unbounded;
        default:
            return SolveState::SolverError;
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numBinary = 0;
    int numInteger = 0;     ///< general integers, binaries excluded
    int numContinuous = 0;
    int numNonZeros = 0;
};

inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;

    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
    // NumIntVars includes binaries
    stats.numInteger = model.get(GRB_IntAttr_NumIntVars) - stats.numBinary;
    stats.numNonZeros = static_cast<int>(model.get(GRB_DoubleAttr_DNumNZs));
    stats.numContinuous = stats.numVars - stats.numBinary - stats.numInteger;

    return stats;
}

/**
 * @brief One-line summary, e.g. "240 vars (120 bin, 120 int), 310 constrs, 900 nz"
 */
inline std::string modelSummary(const GRBModel& model) {
    auto stats = computeStatistics(model);

    std::string result = std::to_string(stats.numVars) + " vars";

    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::to_string(stats.numBinary) + " bin";
            if (stats.numInteger > 0) result += ", ";
        }
        if (stats.numInteger > 0) {
            result += std::to_string(stats.numInteger) + " int";
        }
        result += ")";
    }

    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    result += ", " + std::to_string(stats.numNonZeros) + " nz";
    return result;
}

// =============================================================================
// IIS (IRREDUCIBLE INCONSISTENT SUBSYSTEM)
// =============================================================================

/**
 * @brief Computes an IIS and returns the names of its constraints
 *
 * Bound-only members of the IIS are reported as "lb(<var>)" / "ub(<var>)"
 * when the variable carries a name.
 *
 * @note Only valid on an INFEASIBLE model; may be expensive
 * @throws GRBException when Gurobi cannot compute the IIS
 */
inline std::vector<std::string> computeIIS(GRBModel& model) {
    std::vector<std::string> names;

    model.computeIIS();

    const int numConstrs = model.get(GRB_IntAttr_NumConstrs);
    std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
    for (int i = 0; i < numConstrs; ++i) {
        if (constrs[i].get(GRB_IntAttr_IISConstr) > 0)
            names.push_back(constrs[i].get(GRB_StringAttr_ConstrName));
    }

    const int numVars = model.get(GRB_IntAttr_NumVars);
    std::unique_ptr<GRBVar[]> vars(model.getVars());  // getVars() hands over ownership
    for (int i = 0; i < numVars; ++i) {
        std::string name = vars[i].get(GRB_StringAttr_VarName);
        if (name.empty())
            continue;
        if (vars[i].get(GRB_IntAttr_IISLB) > 0)
            names.push_back("lb(" + name + ")");
        if (vars[i].get(GRB_IntAttr_IISUB) > 0)
            names.push_back("ub(" + name + ")");
    }

    return names;
}

// =============================================================================
// SOLVE WITH ERROR TRANSLATION
// =============================================================================

/// @brief License-class failures: no license, or model above the license size limit
[[nodiscard]] inline bool isLicenseError(int errorCode) noexcept {
    return errorCode == GRB_ERROR_NO_LICENSE || errorCode == GRB_ERROR_SIZE_LIMIT_EXCEEDED;
}

/**
 * @brief Runs builder.optimize() and classifies the outcome
 *
 * @param stage prefix for error messages ("mix", "schedule")
 * @throws SolverUnavailableError when the environment cannot start or on a
 *         license-class GRBException
 * @throws SolverError on any other GRBException
 */
template<typename Builder>
SolveState solveAndClassify(Builder& builder, std::string_view stage) {
    try {
        builder.initialize();
    }
    catch (const GRBException& e) {
        throw SolverUnavailableError(std::format("{}: Gurobi environment could not start: {} (code {})",
            stage, e.getMessage(), e.getErrorCode()));
    }

    try {
        builder.optimize();
    }
    catch (const GRBException& e) {
        if (isLicenseError(e.getErrorCode())) {
            throw SolverUnavailableError(std::format("{}: Gurobi license does not cover this model: {} (code {})",
                stage, e.getMessage(), e.getErrorCode()));
        }
        throw SolverError(std::format("{}: solver failed: {} (code {})", stage, e.getMessage(), e.getErrorCode()));
    }

    return classifyStatus(builder.status(), builder.solutionCount());
}

} // namespace linemind
