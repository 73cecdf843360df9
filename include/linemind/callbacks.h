#pragma once
/*
===============================================================================
CALLBACKS - Cooperative cancellation and progress for exact planning runs
===============================================================================

Overview
--------
An exact planning run may be cancelled from another thread (a caller closing
a request, an operator pressing "stop"). The caller keeps a CancellationToken
and passes a copy in PlanningConfig; the exact strategy installs a
CancellationCallback on its model. Once cancel() is called, the next Gurobi
callback invocation aborts the solve and optimize() returns with status
INTERRUPTED, which classifyStatus() treats like a time limit: Feasible with
an incumbent, Timeout without.

Key Components
--------------
• CancellationToken     shared flag; copies observe the same state
• Progress              MIP progress snapshot (runtime, bounds, gap)
• CancellationCallback  GRBCallback that aborts on cancel, counts
                        incumbents and logs progress at VLOG(2)

Typical Usage
-------------
    CancellationToken token;
    config.cancellation = token;

    std::thread worker([&] { result = runMixOptimization(..., config); });
    token.cancel();     // from any thread
    worker.join();      // result.failure().code == ErrorCode::SolverTimeoutError

Thread Safety
-------------
• cancel() / cancelled() are lock-free and safe from any thread
• Gurobi invokes callback() on its own thread; the callback only reads the
  token and its own counters

===============================================================================
*/

#include <atomic>
#include <cmath>
#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "gurobi_c++.h"

namespace linemind {

// =============================================================================
// CANCELLATION TOKEN
// =============================================================================

class CancellationToken {
    std::shared_ptr<std::atomic<bool>> flag_ = std::make_shared<std::atomic<bool>>(false);

public:
    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    /// @brief Re-arms the token for a new run (shared with all copies)
    void reset() noexcept { flag_->store(false, std::memory_order_release); }
};

// =============================================================================
// PROGRESS
// =============================================================================

struct Progress {
    double runtime = 0.0;
    double bestObj = GRB_INFINITY;
    double bestBound = -GRB_INFINITY;
    double gap = GRB_INFINITY;      ///< relative; 0.0 once proven optimal
    int solutionCount = 0;

    [[nodiscard]] bool hasSolution() const noexcept { return solutionCount > 0; }
};

// =============================================================================
// CANCELLATION CALLBACK
// =============================================================================

/// @brief Aborts optimization once the token is cancelled
class CancellationCallback : public GRBCallback {
    CancellationToken token_;
    int incumbents_ = 0;
    bool aborted_ = false;

public:
    explicit CancellationCallback(CancellationToken token)
        : token_(std::move(token))
    {
    }

    virtual ~CancellationCallback() = default;

    /// @brief Number of improving incumbents seen during the solve
    [[nodiscard]] int incumbents() const noexcept { return incumbents_; }

    /// @brief True if this callback requested the abort
    [[nodiscard]] bool aborted() const noexcept { return aborted_; }

protected:
    void callback() override {
        if (!aborted_ && token_.cancelled()) {
            aborted_ = true;
            LOG(INFO) << "solve cancelled by caller";
            abort();
            return;
        }

        switch (where) {
            case GRB_CB_MIP: {
                Progress p;
                p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
                p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
                p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
                p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
                if (p.solutionCount > 0 && std::abs(p.bestObj) > 1e-10)
                    p.gap = std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
                VLOG(2) << "MIP progress: t=" << p.runtime << "s incumbents=" << p.solutionCount
                        << " gap=" << p.gap;
                break;
            }
            case GRB_CB_MIPSOL:
                ++incumbents_;
                VLOG(2) << "new incumbent objective=" << getDoubleInfo(GRB_CB_MIPSOL_OBJ);
                break;
            default:
                break;
        }
    }
};

} // namespace linemind
