#pragma once
/*
===============================================================================
SOLVER BACKEND — Abstract MIP solver used by the recourse builder
===============================================================================

Overview
--------
RecourseBuilder never talks to a solver library directly. It builds and
solves its MIP through SolverBackend, which offers the small set of
operations the recourse formulation needs:

    * continuous and binary variables (name, bounds, objective coefficient)
    * named linear constraints with a sense and a right-hand side
    * replacement of the linear objective (always minimized)
    * time limit, node limit, display toggle
    * a synchronous solve() returning a SolveReport
    * solution values per variable

Capabilities
------------
Backends differ in what they allow after the model is built. Each backend
declares an EnumSet<Capability>:

    IncrementalConstraints  addConstraint() after a solve
    BoundMutation           setLowerBound() after a solve
    RhsMutation             setRhs() after a solve
    SpecialOrderedSets      addSos1()

Callers branch on supports(...), never on the backend's name. A backend
throws NotSupported when asked for an operation it does not declare.

Selection
---------
A builder receives a BackendFactory and calls it once per MIP build, so every
rebuild starts from an empty model:

    flipset::RecourseBuilder builder(flipset::gurobiFactory());

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "enum_utils.h"
#include "options.h"

namespace flipset {

    DECLARE_ENUM_WITH_COUNT(Capability,
        IncrementalConstraints,
        BoundMutation,
        RhsMutation,
        SpecialOrderedSets);

    using Capabilities = EnumSet<Capability>;

    inline constexpr EnumNames<Capability> kCapabilityNames{{
        "incremental constraints", "bound mutation", "rhs mutation", "special ordered sets"}};

    /// @brief Handle of a variable, valid for the backend that created it
    using VarId = std::size_t;

    /// @brief Handle of a linear constraint, valid for the backend that created it
    using ConId = std::size_t;

    enum class Sense { LessEqual, GreaterEqual, Equal };

    struct Term {
        VarId var;
        double coef;
    };

    using LinearTerms = std::vector<Term>;

    /**
     * @brief Outcome and statistics of one solve
     *
     * @details Fields a backend cannot provide keep their defaults.
     *          objective, bestBound and gap are +inf unless a primal
     *          feasible solution exists. nodesRemaining is NaN when the
     *          solver does not report open nodes after the solve, which is
     *          the case for both Gurobi and HiGHS.
     */
    struct SolveReport {
        std::string status = "not solved";
        bool primalFeasible = false;
        double objective = std::numeric_limits<double>::infinity();
        double bestBound = std::numeric_limits<double>::infinity();
        double gap = std::numeric_limits<double>::infinity();
        double iterations = 0.0;
        double nodesProcessed = 0.0;
        double nodesRemaining = std::numeric_limits<double>::quiet_NaN();
        double runtime = 0.0;
    };

    class SolverBackend {
    public:
        virtual ~SolverBackend() = default;

        /// @brief Short identifier used in log messages
        [[nodiscard]] virtual std::string name() const = 0;

        [[nodiscard]] virtual Capabilities capabilities() const = 0;

        [[nodiscard]] bool supports(Capability c) const { return capabilities().contains(c); }

        // ---------------------------------------------------------------------
        // Model construction
        // ---------------------------------------------------------------------

        /// @brief Apply numeric settings (seed, threads, gaps, tolerances)
        virtual void applyParameters(const SolverParameters& params) = 0;

        /// @brief Add a continuous variable; bounds may be +/- infinity
        virtual VarId addContinuous(const std::string& name, double lb, double ub, double obj = 0.0) = 0;

        /// @brief Add a binary variable
        virtual VarId addBinary(const std::string& name, double obj = 0.0) = 0;

        /**
         * @brief Add a named linear constraint  sum(terms) <sense> rhs
         * @throws NotSupported after a solve without IncrementalConstraints
         */
        virtual ConId addConstraint(const std::string& name, const LinearTerms& terms,
                                    Sense sense, double rhs) = 0;

        /**
         * @brief Declare vars as an SOS type-1 set ordered by weights
         * @throws NotSupported without SpecialOrderedSets
         */
        virtual void addSos1(const std::string& name, const std::vector<VarId>& vars,
                             const std::vector<double>& weights) = 0;

        /// @brief Replace the objective with sum(terms), minimized
        virtual void setObjective(const LinearTerms& terms) = 0;

        // ---------------------------------------------------------------------
        // Mutation
        // ---------------------------------------------------------------------

        /// @throws NotSupported after a solve without RhsMutation
        virtual void setRhs(ConId con, double rhs) = 0;

        [[nodiscard]] virtual double rhs(ConId con) const = 0;

        /// @throws NotSupported after a solve without BoundMutation
        virtual void setLowerBound(VarId var, double lb) = 0;

        [[nodiscard]] virtual double lowerBound(VarId var) const = 0;

        // ---------------------------------------------------------------------
        // Limits and display
        // ---------------------------------------------------------------------

        /// @param seconds wall-clock limit; kNoLimit removes the limit
        virtual void setTimeLimit(double seconds) = 0;

        /// @param nodes explored-node limit; kNoLimit removes the limit
        virtual void setNodeLimit(double nodes) = 0;

        virtual void setDisplay(bool on) = 0;

        // ---------------------------------------------------------------------
        // Solving
        // ---------------------------------------------------------------------

        /// @brief Solve to completion or to the configured limits
        virtual SolveReport solve() = 0;

        /// @brief Value of var in the last solution (requires primalFeasible)
        [[nodiscard]] virtual double value(VarId var) const = 0;

        [[nodiscard]] std::vector<double> values(const std::vector<VarId>& vars) const {
            std::vector<double> out;
            out.reserve(vars.size());
            for (VarId v : vars) out.push_back(value(v));
            return out;
        }

        [[nodiscard]] virtual std::size_t numVariables() const = 0;

        [[nodiscard]] virtual std::size_t numConstraints() const = 0;
    };

    /// @brief Creates an empty backend; called once per MIP build
    using BackendFactory = std::function<std::unique_ptr<SolverBackend>()>;

} // namespace flipset
