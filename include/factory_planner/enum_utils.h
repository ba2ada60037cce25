#pragma once
/*
===============================================================================
ENUM UTILS — Enumerations with a compile-time COUNT for planner registries
===============================================================================

OVERVIEW
--------
The Gurobi adapter keeps its columns and rows in fixed-size tables keyed by a
scoped enum (one slot per resource/recipe column block, one slot per
constraint group). The macro below declares such an enum together with the
size constant the tables are dimensioned with.

USAGE
-----
    PLANNER_DECLARE_ENUM_WITH_COUNT(ColumnBlock, ResourceFlow, RecipeRate);

    // enum class ColumnBlock { ResourceFlow, RecipeRate, COUNT };
    // static constexpr std::size_t ColumnBlock_COUNT = 2;

    std::array<int, ColumnBlock_COUNT> sizes{};
    sizes[enum_index(ColumnBlock::RecipeRate)] = 12;

NOTES
-----
• COUNT is always the last enumerator and is not a domain value
• Enumerators are sequential from 0

===============================================================================
*/

#include <cstddef>

/**
 * @macro PLANNER_DECLARE_ENUM_WITH_COUNT
 * @brief Declares `enum class Name { ..., COUNT }` and `Name_COUNT`
 *
 * @param Name The name of the enumeration type
 * @param ...  Enumerator identifiers (at least one)
 */
#define PLANNER_DECLARE_ENUM_WITH_COUNT(Name, ...)                        \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace planner {

    /// @brief Number of enumerators, excluding the COUNT sentinel
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief Position of an enumerator, usable as an array index
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /**
     * @brief True if value names a real enumerator (not COUNT, not out of range)
     *
     * @example
     *     is_valid_enum_value(ColumnBlock::COUNT);   // false
     */
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return enum_index(value) < enum_size<Enum>::value;
    }

} // namespace planner
