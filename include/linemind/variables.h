#pragma once
/*
===============================================================================
VARIABLES - Decision-variable containers for the planning models
===============================================================================

OVERVIEW
--------
• VariableGroup       dense N-D block of GRBVar (e.g. Q[line][product][week])
• IndexedVariableSet  sparse variables over an arbitrary domain, e.g.
                      x[worker,day,shift,line] only for staffed slots
• VariableContainer   either of the above, so one registry can mix them
• VariableFactory     creates groups/sets and names them (naming.h)
• VariableTable<E>    enum-keyed registry used by ModelBuilder
• value(), valueAt()  solution extraction after optimize()

USAGE
-----
    auto Q = VariableFactory::add(model(), GRB_INTEGER, 0.0, GRB_INFINITY, "Q",
                                  nLines, nProducts, nWeeks);
    auto X = VariableFactory::addIndexed(model(), GRB_BINARY, 0.0, 1.0, "x",
                                         (W * D * S * L) | filter(staffed));

    variables().set(MixVars::Quantity, std::move(Q));
    GRBVar& q = variables()(MixVars::Quantity).at(l, p, w);

    double units = value(q);                     // after optimize()
    bool booked = valueAt(X, w, d, s, l) > 0.5;  // sparse lookup

EXCEPTION SAFETY
----------------
• at(): std::out_of_range for bad indices or missing sparse keys
• Container access in the wrong mode: std::runtime_error
• value(): GRBException when the model has no solution

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "gurobi_c++.h"
#include "indexing.h"
#include "naming.h"

namespace linemind {

    // ============================================================================
    // VARIABLE GROUP
    // ============================================================================
    /**
     * @class VariableGroup
     * @brief Dense row-major N-D array of GRBVar
     */
    class VariableGroup {
        std::vector<int> shape_;
        std::vector<GRBVar> vars_;

        template<typename... I>
        std::size_t offset(I... idx) const {
            static_assert((std::is_integral_v<I> && ...), "VariableGroup: indices must be integral");
            if (sizeof...(idx) != shape_.size()) {
                throw std::out_of_range(std::format(
                    "VariableGroup::at: expected {} indices, got {}", shape_.size(), sizeof...(idx)));
            }
            std::size_t flat = 0;
            std::size_t d = 0;
            bool ok = true;
            ((ok = ok && idx >= 0 && static_cast<int>(idx) < shape_[d],
              flat = flat * static_cast<std::size_t>(shape_[d]) + static_cast<std::size_t>(idx),
              ++d), ...);
            if (!ok) {
                throw std::out_of_range("VariableGroup::at: index out of range");
            }
            return flat;
        }

    public:
        VariableGroup() = default;

        VariableGroup(std::vector<int> shape, std::vector<GRBVar> vars)
            : shape_(std::move(shape)), vars_(std::move(vars))
        {
        }

        [[nodiscard]] std::size_t dimension() const noexcept { return shape_.size(); }
        [[nodiscard]] int size(std::size_t dim) const { return shape_.at(dim); }
        [[nodiscard]] std::size_t total() const noexcept { return vars_.size(); }
        const std::vector<int>& shape() const noexcept { return shape_; }

        template<typename... I>
        GRBVar& at(I... idx) { return vars_[offset(idx...)]; }

        template<typename... I>
        const GRBVar& at(I... idx) const { return vars_[offset(idx...)]; }

        template<typename... I>
        GRBVar& operator()(I... idx) { return at(idx...); }

        template<typename... I>
        const GRBVar& operator()(I... idx) const { return at(idx...); }

        auto begin() noexcept { return vars_.begin(); }
        auto end() noexcept { return vars_.end(); }
        auto begin() const noexcept { return vars_.begin(); }
        auto end() const noexcept { return vars_.end(); }
    };

    // ============================================================================
    // INDEXED VARIABLE SET
    // ============================================================================
    /**
     * @class IndexedVariableSet
     * @brief Variables keyed by index tuples of a (possibly filtered) domain
     *
     * Entries keep creation order; lookup goes through an ordered map so the
     * set behaves identically across platforms.
     */
    class IndexedVariableSet {
    public:
        struct Entry {
            GRBVar var;
            std::vector<int> index;
        };

    private:
        std::vector<Entry> entries_;
        std::map<std::vector<int>, std::size_t> lookup_;

        friend class VariableFactory;

        void addEntry(GRBVar v, std::vector<int> idx) {
            lookup_.emplace(idx, entries_.size());
            entries_.push_back(Entry{ std::move(v), std::move(idx) });
        }

    public:
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        auto begin() noexcept { return entries_.begin(); }
        auto end() noexcept { return entries_.end(); }
        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

        template<typename... I>
        GRBVar* try_get(I... idx) noexcept {
            auto it = lookup_.find(std::vector<int>{ static_cast<int>(idx)... });
            return it == lookup_.end() ? nullptr : &entries_[it->second].var;
        }

        template<typename... I>
        const GRBVar* try_get(I... idx) const noexcept {
            return const_cast<IndexedVariableSet*>(this)->try_get(idx...);
        }

        template<typename... I>
        [[nodiscard]] bool contains(I... idx) const noexcept { return try_get(idx...) != nullptr; }

        template<typename... I>
        GRBVar& at(I... idx) {
            if (GRBVar* v = try_get(idx...))
                return *v;
            throw std::out_of_range(
                force_name::math("IndexedVariableSet::at: missing index ", std::vector<int>{ static_cast<int>(idx)... }));
        }

        template<typename... I>
        const GRBVar& at(I... idx) const {
            return const_cast<IndexedVariableSet*>(this)->at(idx...);
        }

        template<typename... I>
        GRBVar& operator()(I... idx) { return at(idx...); }

        template<typename... I>
        const GRBVar& operator()(I... idx) const { return at(idx...); }
    };

    // ============================================================================
    // VARIABLE CONTAINER
    // ============================================================================
    class VariableContainer {
        std::variant<std::monostate, VariableGroup, IndexedVariableSet> storage_;

    public:
        VariableContainer() = default;
        VariableContainer(VariableGroup group) : storage_(std::move(group)) {}
        VariableContainer(IndexedVariableSet set) : storage_(std::move(set)) {}

        [[nodiscard]] bool isEmpty() const noexcept { return std::holds_alternative<std::monostate>(storage_); }
        [[nodiscard]] bool isDense() const noexcept { return std::holds_alternative<VariableGroup>(storage_); }
        [[nodiscard]] bool isSparse() const noexcept { return std::holds_alternative<IndexedVariableSet>(storage_); }

        VariableGroup& asGroup() {
            if (!isDense())
                throw std::runtime_error("VariableContainer::asGroup: not in dense mode");
            return std::get<VariableGroup>(storage_);
        }

        const VariableGroup& asGroup() const {
            return const_cast<VariableContainer*>(this)->asGroup();
        }

        IndexedVariableSet& asIndexed() {
            if (!isSparse())
                throw std::runtime_error("VariableContainer::asIndexed: not in sparse mode");
            return std::get<IndexedVariableSet>(storage_);
        }

        const IndexedVariableSet& asIndexed() const {
            return const_cast<VariableContainer*>(this)->asIndexed();
        }

        template<typename... I>
        GRBVar& at(I... idx) {
            if (isDense())
                return std::get<VariableGroup>(storage_).at(idx...);
            if (isSparse())
                return std::get<IndexedVariableSet>(storage_).at(idx...);
            throw std::runtime_error("VariableContainer::at: container is empty");
        }

        template<typename... I>
        const GRBVar& at(I... idx) const {
            return const_cast<VariableContainer*>(this)->at(idx...);
        }

        template<typename... I>
        GRBVar& operator()(I... idx) { return at(idx...); }

        template<typename... I>
        const GRBVar& operator()(I... idx) const { return at(idx...); }
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    class VariableFactory {
    public:
        /**
         * @brief Rectangular N-D group with shape (sizes...)
         * @throws std::invalid_argument on a negative size
         */
        template<typename... Sizes>
        static VariableGroup add(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            Sizes... sizes)
        {
            static_assert(sizeof...(sizes) > 0, "VariableFactory::add: at least one dimension");
            static_assert((std::is_integral_v<Sizes> && ...), "VariableFactory::add: sizes must be integral");

            std::vector<int> shape{ static_cast<int>(sizes)... };
            std::size_t total = 1;
            for (int s : shape) {
                if (s < 0)
                    throw std::invalid_argument(std::format("VariableFactory::add: negative size {}", s));
                total *= static_cast<std::size_t>(s);
            }

            std::vector<GRBVar> vars;
            vars.reserve(total);
            std::vector<int> idx(shape.size(), 0);
            for (std::size_t k = 0; k < total; ++k) {
                vars.push_back(model.addVar(lb, ub, 0.0, vtype, make_name::math(baseName, idx)));
                for (std::size_t d = shape.size(); d-- > 0;) {
                    if (++idx[d] < shape[d])
                        break;
                    idx[d] = 0;
                }
            }
            return VariableGroup(std::move(shape), std::move(vars));
        }

        /// @brief One variable per element of domain (IndexList, Cartesian, Filtered)
        template<typename Domain>
        static IndexedVariableSet addIndexed(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            const Domain& domain)
        {
            IndexedVariableSet result;
            for (auto&& rawIdx : domain) {
                auto idx = detail::index_to_vector(rawIdx);
                GRBVar v = model.addVar(lb, ub, 0.0, vtype, make_name::math(baseName, idx));
                result.addEntry(std::move(v), std::move(idx));
            }
            return result;
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Fixed-size registry of VariableContainers keyed by an enum with a
     *        COUNT sentinel (see LINEMIND_ENUM_WITH_COUNT)
     */
    template<typename EnumT, std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class VariableTable {
        std::array<VariableContainer, MAX> table_;

        static std::size_t checked(EnumT key) {
            const auto idx = static_cast<std::size_t>(key);
            if (idx >= MAX)
                throw std::out_of_range(std::format("VariableTable: key {} >= {}", idx, MAX));
            return idx;
        }

    public:
        void set(EnumT key, VariableContainer container) { table_[checked(key)] = std::move(container); }

        VariableContainer& get(EnumT key) { return table_[checked(key)]; }
        const VariableContainer& get(EnumT key) const { return table_[checked(key)]; }

        VariableContainer& operator()(EnumT key) { return get(key); }
        const VariableContainer& operator()(EnumT key) const { return get(key); }

        [[nodiscard]] bool isEmpty(EnumT key) const { return get(key).isEmpty(); }
    };

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /// @brief Solution value of one variable (GRB_DoubleAttr_X)
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /// @brief Solution value of a sparse entry; 0.0 when the index was never created
    template<typename... I>
    double valueAt(const IndexedVariableSet& set, I... idx) {
        const GRBVar* v = set.try_get(idx...);
        return v ? value(*v) : 0.0;
    }

    /// @brief Solution value of a container entry; sparse misses read as 0.0
    template<typename... I>
    double valueAt(const VariableContainer& vc, I... idx) {
        if (vc.isSparse())
            return valueAt(vc.asIndexed(), idx...);
        return value(vc.at(idx...));
    }

} // namespace linemind
