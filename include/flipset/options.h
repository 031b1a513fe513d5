#pragma once
/*
===============================================================================
OPTIONS — Immutable configuration for building and solving the recourse MIP
===============================================================================

OVERVIEW
--------
All tunables are plain structs passed by value when the MIP is configured or
solved. Nothing here is global or shared; two builders never see each other's
settings.

    SolverParameters   numeric solver settings applied when the MIP is built
    MipOptions         cost type, item limits, validation and logging flags
    SolveLimits        time/node limits and solver display for one solve

String-valued options ("max", "distinct_subsets") coming from configuration files
are accepted through parseCostType() and parseEnumerationPolicy().

DEFAULTS
--------
    cost type             Max
    min / max items       0 / number of actionable features
    check flag            on  (advisories are computed for each record)
    print flag            off (nothing is written to the log sink)
    time / node limit     unlimited
    display               off

===============================================================================
*/

#include <cstddef>
#include <iostream>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "enum_utils.h"

namespace flipset {

    // ========================================================================
    // ENUMERATIONS
    // ========================================================================

    /**
     * @brief Aggregation of per-feature costs into the objective
     *
     * Total: sum of percentile-shift costs
     * Local: sum of log-odds costs ln((1-p0)/(1-p))
     * Max:   maximum percentile-shift cost, ties broken by the total
     */
    DECLARE_ENUM_WITH_COUNT(CostType, Total, Local, Max);

    /**
     * @brief How previously found solutions are excluded while enumerating
     *
     * MutuallyExclusive: features changed once stay untouched afterwards
     * DistinctSubsets:   the exact on/off pattern of a found solution is cut
     */
    DECLARE_ENUM_WITH_COUNT(EnumerationPolicy, MutuallyExclusive, DistinctSubsets);

    inline constexpr EnumNames<CostType> kCostTypeNames{{"total", "local", "max"}};

    inline constexpr EnumNames<EnumerationPolicy> kEnumerationPolicyNames{
        {"mutually_exclusive", "distinct_subsets"}};

    inline std::string toString(CostType t) { return kCostTypeNames.name(t); }

    inline std::string toString(EnumerationPolicy p) { return kEnumerationPolicyNames.name(p); }

    /// @throws std::invalid_argument for names other than total/local/max
    inline CostType parseCostType(std::string_view text) {
        return kCostTypeNames.parse(text);
    }

    /// @throws std::invalid_argument for names other than mutually_exclusive/distinct_subsets
    inline EnumerationPolicy parseEnumerationPolicy(std::string_view text) {
        return kEnumerationPolicyNames.parse(text);
    }

    // ========================================================================
    // SOLVER PARAMETERS
    // ========================================================================

    /**
     * @brief Numeric settings applied to the backend when the MIP is built
     *
     * @details Tight tolerances are the default because the score constraint
     *          is compared against zero and costs may differ by small steps.
     *          A single thread and a fixed seed make repeated solves of the
     *          same model return the same solution.
     */
    struct SolverParameters {
        int randomSeed = 0;
        int threads = 1;                          ///< 0 = solver decides
        double mipGap = 0.0;                      ///< relative gap
        double absMipGap = 0.0;                   ///< absolute gap
        double integralityTolerance = 1e-9;
        double feasibilityTolerance = 1e-9;
        bool presolve = true;
    };

    // ========================================================================
    // MIP OPTIONS
    // ========================================================================

    struct MipOptions {
        CostType costType = CostType::Max;
        int minItems = 0;
        std::optional<int> maxItems;              ///< empty = number of actionable features
        bool checkFlag = true;                    ///< attach validation advisories to records
        bool printFlag = false;                   ///< write progress messages to log
        std::ostream* log = &std::clog;
        SolverParameters solver;
    };

    // ========================================================================
    // SOLVE LIMITS
    // ========================================================================

    inline constexpr double kNoLimit = std::numeric_limits<double>::infinity();

    struct SolveLimits {
        double timeLimit = kNoLimit;              ///< seconds, > 0
        double nodeLimit = kNoLimit;              ///< explored nodes, > 0
        bool display = false;                     ///< solver console output
    };

    /// @brief total_items value requesting enumeration until infeasible
    inline constexpr std::size_t kUnlimited = std::numeric_limits<std::size_t>::max();

} // namespace flipset
