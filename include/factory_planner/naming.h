#pragma once
/*
===============================================================================
NAMING — Row and column names for planner linear programs
===============================================================================

OVERVIEW
--------
Every column and row of a planner LinearProgram carries a readable name
("Resource Ore", "conserve[Ore]", "rule[3]"). The LinearProgram always keeps
them, since infeasibility diagnostics report rows by name. Whether they are
also handed to the solver is a build-time choice:

• force_name:: always produces the name
• make_name::  produces the name in debug builds (PLANNER_DEBUG or _DEBUG)
               and an empty string otherwise, so release models carry no
               symbolic names

CONVENTIONS
-----------
    force_name::math("conserve", "Ore")       -> "conserve[Ore]"
    force_name::math("rule", 3)               -> "rule[3]"
    force_name::concat("Recipe ", "Smelt")    -> "Recipe Smelt"

===============================================================================
*/

#include <string>
#include <string_view>
#include <sstream>
#include <stdexcept>
#include <concepts>
#include <utility>

#if defined(PLANNER_DEBUG) || defined(_DEBUG)
inline constexpr bool PLANNER_DEBUG_NAMES = true;
#else
inline constexpr bool PLANNER_DEBUG_NAMES = false;
#endif

namespace planner {

    /// @brief True when solver-side names are emitted (debug builds)
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return PLANNER_DEBUG_NAMES;
    }

    namespace naming_detail {

        template<typename T>
        concept Streamable = requires(std::ostream & os, const T & value) {
            { os << value } -> std::same_as<std::ostream&>;
        };

        template<Streamable... Args>
        inline std::string concat_impl(Args&&... parts) {
            std::ostringstream oss;
            ((oss << std::forward<Args>(parts)), ...);
            return oss.str();
        }

        template<Streamable... Keys>
        inline std::string math_impl(std::string_view base, Keys&&... keys) {
            constexpr std::size_t N = sizeof...(keys);

            if constexpr (N == 0) {
                return std::string(base);
            }
            else {
                if (base.empty()) {
                    throw std::invalid_argument(
                        "naming: base name cannot be empty when keys are present");
                }

                std::ostringstream oss;
                oss << base << "[";

                bool first = true;
                ((oss << (first ? (first = false, "") : ",") << std::forward<Keys>(keys)), ...);

                oss << "]";
                return oss.str();
            }
        }

    } // namespace naming_detail

} // namespace planner

namespace force_name {

    /// @brief Concatenate streamable parts into a single name
    template<typename... Args>
    inline std::string concat(Args&&... parts) {
        return planner::naming_detail::concat_impl(std::forward<Args>(parts)...);
    }

    /// @brief Subscript style name: base[k1,k2,...]
    /// @throws std::invalid_argument if base is empty and keys are given
    template<typename... Keys>
    inline std::string math(std::string_view base, Keys&&... keys) {
        return planner::naming_detail::math_impl(base, std::forward<Keys>(keys)...);
    }

} // namespace force_name

namespace make_name {

    template<typename... Args>
    inline std::string concat(Args&&... parts) {
        if constexpr (!planner::naming_enabled()) {
            return {};
        }
        else {
            return force_name::concat(std::forward<Args>(parts)...);
        }
    }

    template<typename... Keys>
    inline std::string math(std::string_view base, Keys&&... keys) {
        if constexpr (!planner::naming_enabled()) {
            return {};
        }
        else {
            return force_name::math(base, std::forward<Keys>(keys)...);
        }
    }

    /// @brief Pass an already-built name through only in debug builds
    inline std::string passthrough(const std::string& name) {
        if constexpr (!planner::naming_enabled()) {
            return {};
        }
        else {
            return name;
        }
    }

} // namespace make_name
