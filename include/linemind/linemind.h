#pragma once
/*
===============================================================================
LINEMIND - Planning core, single include
===============================================================================

OVERVIEW
--------
Forecast demand, assign it to production lines, and staff the lines:

    history ─► runForecast ─► DemandSeries
                              │
    lines, changeovers ──────►runMixOptimization ─► MixPlan
                                                    │
    workers ─────────────────────────────────────► runSchedule ─► Schedule

Each stage has a heuristic strategy that never fails and an exact strategy
backed by a Gurobi model. Results come back as Result<Payload, Kpi>
envelopes; failures carry a stable ErrorCode and a suggestion.

QUICK START
-----------
    #include <linemind/linemind.h>

    linemind::PlanningConfig config;
    config.mixStrategy = linemind::Strategy::Exact;
    config.startDate = linemind::makeDate(2025, 1, 6);

    auto forecast = linemind::runForecast(history, {}, config);
    auto mix = linemind::runMixOptimization(forecast.payload(), lines, changeovers, config);
    if (!mix.ok()) {
        std::cerr << mix.failure().message << " (" << mix.failure().suggestion << ")\n";
        return 1;
    }
    auto schedule = linemind::runSchedule(mix.payload(), workers, config);

REQUIREMENTS
------------
• C++20 compiler (GCC 12+, Clang 15+, MSVC 19.30+)
• Gurobi Optimizer 10.0+ with the C++ API
• Abseil (log)

CONFIGURATION
-------------
• LINEMIND_DEBUG (or _DEBUG): Gurobi variables get readable names
• Constraint names are always attached; they appear in IIS details

===============================================================================
*/

// ============================================================================
// MODELING LAYER
// ============================================================================

#include "naming.h"
#include "enum_utils.h"
#include "data_store.h"
#include "indexing.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "model_builder.h"
#include "callbacks.h"
#include "diagnostics.h"

// ============================================================================
// PLANNING
// ============================================================================

#include "types.h"
#include "errors.h"
#include "result.h"
#include "config.h"
#include "validation.h"
#include "forecaster.h"
#include "mix_optimizer.h"
#include "staffing.h"
#include "workforce_scheduler.h"
#include "planner.h"
