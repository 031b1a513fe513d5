#pragma once
/*
===============================================================================
ERRORS — Exception taxonomy for the flipset recourse engine
===============================================================================

OVERVIEW
--------
flipset reports failures through a small set of exception types. Each type
names a failure category, so callers can branch on the category without
parsing messages.

    ConfigurationError    invalid shapes, item limits, limits, stale state
    CurveValidationError  a feasible-cost curve breaks its invariants
    NotSupported          the active solver backend lacks a capability

Solver errors (GRBException for Gurobi, std::runtime_error for HiGHS status
failures) are never wrapped; they reach the caller unchanged.

Validation of solved records is NOT reported through exceptions. Numerical
drift near the decision boundary is expected, so those findings are stored
as advisories on the SolutionRecord (see solution.h).

MESSAGE STYLE
-------------
Messages follow the "Component::operation: detail" layout used across the
library, built with std::format:

    throw ConfigurationError(std::format(
        "RecourseBuilder::configure: x has {} entries, expected {}", n, d));

===============================================================================
*/

#include <stdexcept>
#include <string>

namespace flipset {

    /**
     * @brief Invalid configuration supplied by the caller
     *
     * @details Raised for shape mismatches (coefficients vs. action set,
     *          input point length), invalid item limits, non-positive solve
     *          limits, non-finite data, solving before configure(), and use
     *          of an enumerator after the builder was rebuilt.
     *          Never retried internally.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& what)
            : std::invalid_argument(what) {}
    };

    /**
     * @brief A feature's feasible-cost curve violates its invariants
     *
     * @details Indicates malformed upstream data (degenerate grid,
     *          duplicated deltas or costs, wrong-signed actions), not a
     *          defect of the formulation itself.
     */
    class CurveValidationError : public std::runtime_error {
    public:
        explicit CurveValidationError(const std::string& what)
            : std::runtime_error(what) {}
    };

    /**
     * @brief Operation unavailable on the active solver backend
     *
     * @details Raised when the requested operation needs a backend capability
     *          (incremental constraints, bound or rhs mutation) that the
     *          backend does not declare. The caller must switch backend or
     *          enumeration policy.
     */
    class NotSupported : public std::logic_error {
    public:
        explicit NotSupported(const std::string& what)
            : std::logic_error(what) {}
    };

} // namespace flipset
