#pragma once
/*
===============================================================================
NAMING - Symbolic names for planning-model variables and constraints
===============================================================================

OVERVIEW
--------
Names of model elements are built from a base name and the labels of the
index tuple, e.g. "capacity[L1,ModelA,2]" or "Q_L1_ModelA_2". Labels may be
integers (week, day) or strings (line id, product, worker id).

Two families:

• make_name:: debug-aware; returns "" unless LINEMIND_DEBUG or _DEBUG is
  defined. Used for variable names, which are never read back in release.
• force_name:: always produces the name. Used for constraint names, because
  infeasibility diagnostics (computeIIS) report conflicting constraints by
  name and those names end up in Failure details.

STYLES
------
• index style:  base_l1_l2        (make_name::index / force_name::index)
• math style:   base[l1,l2]       (make_name::math  / force_name::math)

EXCEPTION SAFETY
----------------
• Empty base with labels throws std::invalid_argument
• Otherwise strong guarantee (only std::string allocation)

===============================================================================
*/

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#if defined(LINEMIND_DEBUG) || defined(_DEBUG)
inline constexpr bool LINEMIND_DEBUG_NAMES = true;
#else
inline constexpr bool LINEMIND_DEBUG_NAMES = false;
#endif

namespace linemind {

    /// @brief True when variable names are attached to the Gurobi model
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return LINEMIND_DEBUG_NAMES;
    }

    namespace naming_detail {

        /// @brief Index labels: integers or anything convertible to string_view
        template<typename T>
        concept Label =
            std::is_integral_v<std::remove_cvref_t<T>> ||
            std::convertible_to<const T&, std::string_view>;

        template<Label T>
        void append_label(std::string& out, const T& label) {
            if constexpr (std::is_integral_v<std::remove_cvref_t<T>>) {
                out.append(std::to_string(static_cast<long long>(label)));
            }
            else {
                out.append(std::string_view(label));
            }
        }

        inline void check_base(std::string_view base, bool has_labels) {
            if (has_labels && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when labels are present");
            }
        }

        template<Label... Labels>
        std::string index_impl(std::string_view base, const Labels&... labels) {
            check_base(base, sizeof...(labels) > 0);
            std::string out(base);
            ((out.push_back('_'), append_label(out, labels)), ...);
            return out;
        }

        template<Label... Labels>
        std::string math_impl(std::string_view base, const Labels&... labels) {
            check_base(base, sizeof...(labels) > 0);
            std::string out(base);
            if constexpr (sizeof...(labels) > 0) {
                out.push_back('[');
                bool first = true;
                ((out.append(first ? (first = false, "") : ","), append_label(out, labels)), ...);
                out.push_back(']');
            }
            return out;
        }

        inline std::string math_impl(std::string_view base, const std::vector<int>& idx) {
            check_base(base, !idx.empty());
            std::string out(base);
            if (idx.empty())
                return out;
            out.push_back('[');
            for (std::size_t k = 0; k < idx.size(); ++k) {
                if (k > 0)
                    out.push_back(',');
                out.append(std::to_string(idx[k]));
            }
            out.push_back(']');
            return out;
        }

    } // namespace naming_detail

    namespace make_name {

        template<naming_detail::Label... Labels>
        std::string index(std::string_view base, const Labels&... labels) {
            if constexpr (!naming_enabled()) {
                return {};
            }
            else {
                return naming_detail::index_impl(base, labels...);
            }
        }

        template<naming_detail::Label... Labels>
        std::string math(std::string_view base, const Labels&... labels) {
            if constexpr (!naming_enabled()) {
                return {};
            }
            else {
                return naming_detail::math_impl(base, labels...);
            }
        }

        inline std::string math(std::string_view base, const std::vector<int>& idx) {
            if constexpr (!naming_enabled()) {
                return {};
            }
            else {
                return naming_detail::math_impl(base, idx);
            }
        }

    } // namespace make_name

    namespace force_name {

        template<naming_detail::Label... Labels>
        std::string index(std::string_view base, const Labels&... labels) {
            return naming_detail::index_impl(base, labels...);
        }

        template<naming_detail::Label... Labels>
        std::string math(std::string_view base, const Labels&... labels) {
            return naming_detail::math_impl(base, labels...);
        }

        inline std::string math(std::string_view base, const std::vector<int>& idx) {
            return naming_detail::math_impl(base, idx);
        }

    } // namespace force_name

} // namespace linemind
