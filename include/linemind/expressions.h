#pragma once
/*
===============================================================================
EXPRESSIONS - Linear summation over index domains
===============================================================================

OVERVIEW
--------
    Σ_{i ∈ I} f(i)               →  sum(I, f)
    Σ_{(l,p) ∈ L×P} f(l,p)       →  sum(L * P, f)
    Σ_{(l,p) ∈ L×P | eligible}   →  sum((L * P) | filter(eligible), f)
    Σ over every stored variable →  sum(XV)

The callable receives one int per domain dimension and returns anything
GRBLinExpr::operator+= accepts (GRBVar, GRBLinExpr, a scaled variable, a
double). sum() never creates variables; it only accumulates terms.

===============================================================================
*/

#include <utility>

#include "gurobi_c++.h"
#include "indexing.h"
#include "variables.h"

namespace linemind {

    /// @brief Σ func(idx...) over every element of rng
    template<typename Range, typename Func>
    GRBLinExpr sum(const Range& rng, Func&& func)
    {
        GRBLinExpr expr = 0.0;
        for (auto&& idx : rng) {
            expr += detail::invoke_on_index(func, idx);
        }
        return expr;
    }

    /// @brief Σ of every variable in a sparse set
    inline GRBLinExpr sum(const IndexedVariableSet& vars)
    {
        GRBLinExpr expr = 0.0;
        for (const auto& entry : vars)
            expr += entry.var;
        return expr;
    }

    /// @brief Σ of every variable in a dense group
    inline GRBLinExpr sum(const VariableGroup& vars)
    {
        GRBLinExpr expr = 0.0;
        for (const auto& v : vars)
            expr += v;
        return expr;
    }

    /**
     * @brief Σ over the entries of rng that exist in a sparse set
     *
     * Indices missing from the set contribute nothing, so a full product
     * domain can be summed against a filtered variable set.
     */
    template<typename Range>
    GRBLinExpr sumExisting(const Range& rng, const IndexedVariableSet& vars)
    {
        GRBLinExpr expr = 0.0;
        for (auto&& idx : rng) {
            const GRBVar* v = detail::invoke_on_index(
                [&](auto... i) { return vars.try_get(i...); }, idx);
            if (v)
                expr += *v;
        }
        return expr;
    }

} // namespace linemind
