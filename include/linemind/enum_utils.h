#pragma once
/*
===============================================================================
ENUM UTILS - Enum keys for variable/constraint registries and domain enums
===============================================================================

OVERVIEW
--------
Planning models register their decision variables and constraint families in
fixed-size tables keyed by enum values (see variables.h / constraints.h). The
macro in this header declares such an enum together with a trailing COUNT
sentinel, so the table size follows the enumerator list automatically.

The same header provides the small name-table helpers used by the domain enums
(Shift, Strategy, ErrorCode, SolveState) for stable string conversion.

USAGE
-----
    LINEMIND_ENUM_WITH_COUNT(MixVars, Quantity, Assign, Changeover);

    std::array<int, MixVars_COUNT> sizes{};
    sizes[enum_index(MixVars::Assign)] = 12;

    constexpr std::array<std::string_view, 2> kShiftNames{ "Day", "Night" };
    std::string_view s = enum_name(Shift::Night, kShiftNames);   // "Night"

NOTES
-----
• COUNT is always appended as the last enumerator; do not declare it yourself
• Values are sequential from 0, which is what the registries rely on
• All helpers are constexpr/noexcept and carry no state

===============================================================================
*/

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

/**
 * @macro LINEMIND_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel and a
 *        <Name>_COUNT size constant
 *
 * @example
 *     LINEMIND_ENUM_WITH_COUNT(ShiftVars, Assign, Overtime);
 *     // enum class ShiftVars { Assign, Overtime, COUNT };
 *     // static constexpr std::size_t ShiftVars_COUNT = 2;
 */
#define LINEMIND_ENUM_WITH_COUNT(Name, ...)                               \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace linemind {

    /// @brief Number of user enumerators of an enum declared with a COUNT sentinel
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief Zero-based position of an enumerator, for array indexing
    template<typename Enum>
    [[nodiscard]] constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /// @brief True if value is a user enumerator (not COUNT, not out of range)
    template<typename Enum>
    [[nodiscard]] constexpr bool is_valid_enum_value(Enum value) noexcept {
        return enum_index(value) < enum_size<Enum>::value;
    }

    /**
     * @brief Looks up the display name of an enumerator in a parallel name table
     * @return The name, or "?" for values outside the table
     */
    template<typename Enum, std::size_t N>
    [[nodiscard]] constexpr std::string_view enum_name(
        Enum value, const std::array<std::string_view, N>& names) noexcept
    {
        const auto i = enum_index(value);
        return i < N ? names[i] : std::string_view{ "?" };
    }

    /**
     * @brief Reverse lookup of enum_name(): returns the enumerator whose name
     *        equals text, or std::nullopt
     */
    template<typename Enum, std::size_t N>
    [[nodiscard]] constexpr std::optional<Enum> enum_from_name(
        std::string_view text, const std::array<std::string_view, N>& names) noexcept
    {
        for (std::size_t i = 0; i < N; ++i) {
            if (names[i] == text)
                return static_cast<Enum>(i);
        }
        return std::nullopt;
    }

} // namespace linemind
