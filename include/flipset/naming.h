#pragma once
/*
===============================================================================
NAMING SYSTEM — Symbolic names for recourse MIP variables and constraints
===============================================================================

OVERVIEW
--------
Builds the names used for every variable and constraint of the recourse MIP.
Two families are provided:

• force_name:: Always produces a name. Used for the EncodingTable, whose
  names appear in diagnostics and advisories.
• make_name::  Debug-aware. Returns an empty string unless FLIPSET_DEBUG or
  _DEBUG is defined. Used when handing names to a solver, so release
  builds pay nothing for names the solver never needs.

Names use the bracketed "math" convention, one bracket per index:

    a[j]            action taken on feature j
    u[j][k]         selector for point k of feature j's cost curve
    c[j]            cost paid on feature j (max-cost objective only)
    max_cost        linearized max of the c[j]
    set_a[j], pick_a[j], def_cost[j], set_max_cost[j], exclude[t]

EXCEPTION SAFETY
----------------
• force_name::math throws std::invalid_argument when the base name is empty
  but indices are present
• make_name::pass never throws except on allocation failure

===============================================================================
*/

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================
#if defined(FLIPSET_DEBUG) || defined(_DEBUG)
inline constexpr bool FLIPSET_DEBUG_NAMES = true;
#else
inline constexpr bool FLIPSET_DEBUG_NAMES = false;
#endif

namespace flipset {

    /// @brief True in debug builds (FLIPSET_DEBUG or _DEBUG defined)
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return FLIPSET_DEBUG_NAMES;
    }

    namespace naming_detail {

        template<typename T>
        concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

        inline void check_base_name(std::string_view base, bool has_indices) {
            if (has_indices && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when indices are present");
            }
        }

        template<Integral... Indices>
        inline std::string math_impl(std::string_view base, Indices... idx) {
            constexpr std::size_t N = sizeof...(idx);
            check_base_name(base, N > 0);

            std::string result;
            result.reserve(base.size() + N * 6);
            result.append(base);
            ((result.append("[")
                .append(std::to_string(static_cast<long long>(idx)))
                .append("]")), ...);
            return result;
        }

    } // namespace naming_detail

    // ========================================================================
    // force_name: always-on naming
    // ========================================================================
    namespace force_name {

        /**
         * @brief Bracketed name: math("u", 3, 1) -> "u[3][1]"
         * @throws std::invalid_argument if base is empty and indices are given
         */
        template<naming_detail::Integral... Indices>
        inline std::string math(std::string_view base, Indices... idx) {
            return naming_detail::math_impl(base, idx...);
        }

    } // namespace force_name

    // ========================================================================
    // make_name: debug-only naming
    // ========================================================================
    namespace make_name {

        /// @brief Passes an already built name through in debug builds only
        inline std::string pass(std::string_view name) {
            if constexpr (!FLIPSET_DEBUG_NAMES) {
                (void)name;
                return {};
            } else {
                return std::string(name);
            }
        }

    } // namespace make_name

} // namespace flipset
