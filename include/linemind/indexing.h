#pragma once
/*
===============================================================================
INDEXING - Integer index domains for the planning models
===============================================================================

OVERVIEW
--------
Planning data is keyed by ids (line "L1", product "ModelA", worker "W03"),
but the models index decision variables by dense positions into sorted id
lists. This header provides the domains those positions range over:

• IndexList            ordered list of ints (insertion order kept)
• range(b, e)          materialized half-open range [b, e)
• A * B * C            lazy Cartesian product, lexicographic order
• D | filter(p, ...)   lazy filtered view, predicates ANDed

Domains iterate as int (1-D) or std::tuple<int, ...> (N-D), so they plug
directly into sum(), VariableFactory::addIndexed() and
ConstraintFactory::addIndexed().

USAGE
-----
    auto L = range(0, nLines);
    auto P = range(0, nProducts);
    auto W = range(0, nWeeks);

    // eligible (line, product, week) triples only
    auto eligible = (L * P * W)
        | filter([&](int l, int p, int) { return canRun[l][p]; });

    for (auto [l, p, w] : eligible) { ... }

NOTES
-----
• Products hold their factor sets by value, so temporaries are safe:
  range(0, 3) * range(0, 2) does not dangle.
• Iteration order is stable and reproducible; the models rely on it for
  deterministic variable order.

===============================================================================
*/

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <ostream>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace linemind {

    // ============================================================================
    // INDEX LIST
    // ============================================================================
    /**
     * @class IndexList
     * @brief Finite ordered collection of integer indices
     */
    class IndexList {
        std::vector<int> data_;

    public:
        IndexList() = default;

        IndexList(std::initializer_list<int> init)
            : data_(init)
        {
        }

        explicit IndexList(std::vector<int> v)
            : data_(std::move(v))
        {
        }

        void push_back(int v) { data_.push_back(v); }

        auto begin() const noexcept { return data_.begin(); }
        auto end() const noexcept { return data_.end(); }

        [[nodiscard]] int size() const noexcept { return static_cast<int>(data_.size()); }
        [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

        int operator[](int i) const { return data_[static_cast<std::size_t>(i)]; }

        [[nodiscard]] bool contains(int v) const {
            return std::find(data_.begin(), data_.end(), v) != data_.end();
        }

        const std::vector<int>& values() const noexcept { return data_; }
    };

    /// @brief Materialized [begin, end); empty when end <= begin
    inline IndexList range(int begin, int end)
    {
        std::vector<int> v;
        if (end > begin) {
            v.reserve(static_cast<std::size_t>(end - begin));
            for (int i = begin; i < end; ++i)
                v.push_back(i);
        }
        return IndexList(std::move(v));
    }

    inline std::ostream& operator<<(std::ostream& os, const IndexList& I)
    {
        os << '{';
        for (int k = 0; k < I.size(); ++k) {
            if (k > 0)
                os << ", ";
            os << I[k];
        }
        return os << '}';
    }

    namespace detail {

        template<typename T, typename = void>
        struct is_tuple_like : std::false_type {};

        template<typename T>
        struct is_tuple_like<T, std::void_t<decltype(std::tuple_size<T>::value)>>
            : std::true_type {};

        template<typename T>
        inline constexpr bool is_tuple_like_v = is_tuple_like<T>::value;

        /// @brief Calls f(i) for scalar indices or f(i, j, ...) for tuples
        template<typename Func, typename Idx>
        decltype(auto) invoke_on_index(Func&& f, const Idx& idx)
        {
            if constexpr (is_tuple_like_v<std::remove_cvref_t<Idx>>) {
                return std::apply(std::forward<Func>(f), idx);
            }
            else {
                return std::forward<Func>(f)(idx);
            }
        }

        /// @brief Flattens an index (int or tuple<int...>) into a vector
        template<typename Idx>
        std::vector<int> index_to_vector(const Idx& idx)
        {
            using Raw = std::remove_cvref_t<Idx>;
            if constexpr (is_tuple_like_v<Raw>) {
                std::vector<int> v;
                v.reserve(std::tuple_size_v<Raw>);
                std::apply([&](auto... parts) { (v.push_back(static_cast<int>(parts)), ...); }, idx);
                return v;
            }
            else {
                static_assert(std::is_integral_v<Raw>, "index must be int or tuple of ints");
                return std::vector<int>{ static_cast<int>(idx) };
            }
        }

        /// @brief AND of several predicates sharing one argument list
        template<typename... Preds>
        struct PredAll {
            std::tuple<Preds...> preds;

            template<typename... Args>
            bool operator()(const Args&... args) const {
                return std::apply([&](const auto&... p) { return (p(args...) && ...); }, preds);
            }
        };

    } // namespace detail

    // ============================================================================
    // CARTESIAN PRODUCT
    // ============================================================================
    /**
     * @class Cartesian
     * @brief Lazy product of N IndexLists, iterated as std::tuple<int, ...>
     *        in lexicographic ("odometer") order
     */
    template<std::size_t N>
    class Cartesian {
        std::array<IndexList, N> sets_;

        template<std::size_t... Is>
        auto tuple_at(const std::array<int, N>& pos, std::index_sequence<Is...>) const {
            return std::make_tuple(sets_[Is][pos[Is]]...);
        }

    public:
        class iterator {
            const Cartesian* owner_ = nullptr;
            std::array<int, N> pos_{};
            bool done_ = true;

        public:
            using iterator_category = std::forward_iterator_tag;
            using difference_type = std::ptrdiff_t;

            iterator() = default;

            iterator(const Cartesian* owner, bool atEnd)
                : owner_(owner), done_(atEnd || owner->empty())
            {
                pos_.fill(0);
            }

            auto operator*() const {
                return owner_->tuple_at(pos_, std::make_index_sequence<N>{});
            }

            iterator& operator++() {
                for (std::size_t d = N; d-- > 0;) {
                    if (++pos_[d] < owner_->sets_[d].size())
                        return *this;
                    pos_[d] = 0;
                }
                done_ = true;
                return *this;
            }

            bool operator==(const iterator& other) const noexcept {
                if (done_ || other.done_)
                    return done_ == other.done_;
                return pos_ == other.pos_;
            }
            bool operator!=(const iterator& other) const noexcept { return !(*this == other); }
        };

        explicit Cartesian(std::array<IndexList, N> sets)
            : sets_(std::move(sets))
        {
        }

        iterator begin() const { return iterator(this, false); }
        iterator end() const { return iterator(this, true); }

        [[nodiscard]] std::size_t size() const {
            std::size_t total = 1;
            for (const auto& s : sets_)
                total *= static_cast<std::size_t>(s.size());
            return total;
        }

        [[nodiscard]] bool empty() const { return size() == 0; }

        const std::array<IndexList, N>& factors() const noexcept { return sets_; }
    };

    inline Cartesian<2> operator*(const IndexList& A, const IndexList& B)
    {
        return Cartesian<2>({ A, B });
    }

    template<std::size_t N>
    Cartesian<N + 1> operator*(const Cartesian<N>& P, const IndexList& S)
    {
        std::array<IndexList, N + 1> sets;
        std::copy(P.factors().begin(), P.factors().end(), sets.begin());
        sets[N] = S;
        return Cartesian<N + 1>(std::move(sets));
    }

    // ============================================================================
    // FILTERED VIEW
    // ============================================================================
    /**
     * @class Filtered
     * @brief Lazy view over a domain that skips elements failing the predicate
     */
    template<typename Domain, typename Pred>
    class Filtered {
        Domain domain_;
        Pred pred_;

        using UnderIter = decltype(std::declval<const Domain&>().begin());

        static bool accept(const Pred& pred, const auto& idx) {
            return static_cast<bool>(detail::invoke_on_index(pred, idx));
        }

    public:
        class iterator {
            UnderIter it_;
            UnderIter end_;
            const Pred* pred_ = nullptr;

            void skip() {
                while (it_ != end_ && !accept(*pred_, *it_))
                    ++it_;
            }

        public:
            using iterator_category = std::forward_iterator_tag;
            using difference_type = std::ptrdiff_t;

            iterator() = default;

            iterator(UnderIter it, UnderIter end, const Pred* pred)
                : it_(it), end_(end), pred_(pred)
            {
                skip();
            }

            auto operator*() const { return *it_; }

            iterator& operator++() {
                ++it_;
                skip();
                return *this;
            }

            bool operator==(const iterator& other) const noexcept { return it_ == other.it_; }
            bool operator!=(const iterator& other) const noexcept { return it_ != other.it_; }
        };

        Filtered(Domain domain, Pred pred)
            : domain_(std::move(domain)), pred_(std::move(pred))
        {
        }

        iterator begin() const { return iterator(domain_.begin(), domain_.end(), &pred_); }
        iterator end() const { return iterator(domain_.end(), domain_.end(), &pred_); }

        /// @brief Counts accepted elements (linear)
        [[nodiscard]] std::size_t size() const {
            std::size_t n = 0;
            for (auto it = begin(); it != end(); ++it)
                ++n;
            return n;
        }
    };

    template<typename PredAllT>
    struct filter_adaptor {
        PredAllT pred_all;
    };

    /// @brief Builds a pipe adaptor; all predicates must hold (logical AND)
    template<typename... Preds>
    auto filter(Preds&&... preds)
    {
        using Combined = detail::PredAll<std::decay_t<Preds>...>;
        return filter_adaptor<Combined>{ Combined{ std::make_tuple(std::forward<Preds>(preds)...) } };
    }

    template<typename Domain, typename PredAllT>
    auto operator|(const Domain& domain, const filter_adaptor<PredAllT>& adaptor)
    {
        return Filtered<Domain, PredAllT>(domain, adaptor.pred_all);
    }

} // namespace linemind
