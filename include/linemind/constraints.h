#pragma once
/*
===============================================================================
CONSTRAINTS - Named constraint families for the planning models
===============================================================================

OVERVIEW
--------
Each business rule of a planning model (capacity, demand coverage, weekly
hour cap, night window, ...) becomes one constraint family: a set of
GRBConstr indexed by the tuples of a domain.

• IndexedConstraintSet   constraints of one family, keyed by index tuple
• ConstraintFactory      creates a family from a domain and a generator
• ConstraintTable<E>     enum-keyed registry of families used by ModelBuilder

Constraint names are always attached (force_name::math), because
computeIIS() reports the conflicting rules by name and those names are
returned to callers in infeasibility diagnostics:

    "capacity[0,1,2]"  →  line 0, product 1, week 2

USAGE
-----
    auto cover = ConstraintFactory::addIndexed(model(), "demand", P * W,
        [&](int p, int w) {
            return sum(L, [&](int l) { return Q.at(l, p, w); }) >= demand[p][w];
        });
    constraints().set(MixCons::Demand, std::move(cover));

    GRBConstr& c = constraints()(MixCons::Demand).at(1, 0);

Generators receive one int per domain dimension and return GRBTempConstr.
A generator may return std::nullopt (std::optional<GRBTempConstr>) to skip
an index where the rule is vacuous.

EXCEPTION SAFETY
----------------
• at(): std::out_of_range for an unknown index tuple
• ConstraintTable: std::out_of_range for a key >= COUNT

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "indexing.h"
#include "naming.h"

namespace linemind {

    // ============================================================================
    // INDEXED CONSTRAINT SET
    // ============================================================================
    /**
     * @class IndexedConstraintSet
     * @brief One constraint family, entries in creation order
     */
    class IndexedConstraintSet {
    public:
        struct Entry {
            GRBConstr constr;
            std::vector<int> index;
            std::string name;
        };

    private:
        std::vector<Entry> entries_;
        std::map<std::vector<int>, std::size_t> lookup_;

        friend class ConstraintFactory;

        void addEntry(GRBConstr c, std::vector<int> idx, std::string name) {
            lookup_.emplace(idx, entries_.size());
            entries_.push_back(Entry{ std::move(c), std::move(idx), std::move(name) });
        }

    public:
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        auto begin() noexcept { return entries_.begin(); }
        auto end() noexcept { return entries_.end(); }
        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

        template<typename... I>
        [[nodiscard]] bool contains(I... idx) const {
            return lookup_.count(std::vector<int>{ static_cast<int>(idx)... }) > 0;
        }

        template<typename... I>
        GRBConstr& at(I... idx) {
            std::vector<int> key{ static_cast<int>(idx)... };
            auto it = lookup_.find(key);
            if (it == lookup_.end())
                throw std::out_of_range(force_name::math("IndexedConstraintSet::at: missing index ", key));
            return entries_[it->second].constr;
        }

        template<typename... I>
        const GRBConstr& at(I... idx) const {
            return const_cast<IndexedConstraintSet*>(this)->at(idx...);
        }

        template<typename... I>
        GRBConstr& operator()(I... idx) { return at(idx...); }
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    class ConstraintFactory {
        template<typename T>
        struct is_optional : std::false_type {};

        template<typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

    public:
        /**
         * @brief Adds one named constraint per element of domain
         *
         * @param baseName family name, used for every constraint ("cap" → "cap[0,2]")
         * @param domain   IndexList, Cartesian or Filtered domain
         * @param gen      (int...) → GRBTempConstr or std::optional<GRBTempConstr>
         */
        template<typename Domain, typename Gen>
        static IndexedConstraintSet addIndexed(GRBModel& model,
            const std::string& baseName,
            const Domain& domain,
            Gen&& gen)
        {
            IndexedConstraintSet result;
            for (auto&& rawIdx : domain) {
                auto built = detail::invoke_on_index(gen, rawIdx);
                auto idx = detail::index_to_vector(rawIdx);

                if constexpr (is_optional<std::remove_cvref_t<decltype(built)>>::value) {
                    if (!built)
                        continue;
                    std::string name = force_name::math(baseName, idx);
                    GRBConstr c = model.addConstr(*built, name);
                    result.addEntry(std::move(c), std::move(idx), std::move(name));
                }
                else {
                    std::string name = force_name::math(baseName, idx);
                    GRBConstr c = model.addConstr(built, name);
                    result.addEntry(std::move(c), std::move(idx), std::move(name));
                }
            }
            return result;
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    /**
     * @class ConstraintTable
     * @brief Fixed-size registry of constraint families keyed by an enum with
     *        a COUNT sentinel
     */
    template<typename EnumT, std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class ConstraintTable {
        std::array<IndexedConstraintSet, MAX> table_;

        static std::size_t checked(EnumT key) {
            const auto idx = static_cast<std::size_t>(key);
            if (idx >= MAX)
                throw std::out_of_range(std::format("ConstraintTable: key {} >= {}", idx, MAX));
            return idx;
        }

    public:
        void set(EnumT key, IndexedConstraintSet family) { table_[checked(key)] = std::move(family); }

        IndexedConstraintSet& get(EnumT key) { return table_[checked(key)]; }
        const IndexedConstraintSet& get(EnumT key) const { return table_[checked(key)]; }

        IndexedConstraintSet& operator()(EnumT key) { return get(key); }
        const IndexedConstraintSet& operator()(EnumT key) const { return get(key); }

        /// @brief Total number of constraints over all families
        [[nodiscard]] std::size_t total() const noexcept {
            std::size_t n = 0;
            for (const auto& family : table_)
                n += family.size();
            return n;
        }
    };

} // namespace linemind
