#pragma once
/*
===============================================================================
GUROBI BACKEND — SolverBackend on the Gurobi C++ API
===============================================================================

Overview
--------
GurobiBackend owns (or borrows) a GRBEnv and owns one GRBModel. It declares
every Capability: constraints may be added, bounds and right-hand sides
changed, and SOS1 sets declared at any time, including between solves.

    auto factory = flipset::gurobiFactory();
    flipset::RecourseBuilder builder(factory);

Environment
-----------
An owned environment is created with deferred start so OutputFlag can be
cleared before the license banner is printed:

    env = GRBEnv(true);  env.set(OutputFlag, 0);  env.start();

Pass an external GRBEnv to share one license token between many backends.
It must outlive every backend created from it.

Names
-----
Variable and constraint names reach Gurobi only in debug builds
(make_name::pass in naming.h). SOS sets are unnamed in the Gurobi API.

Errors
------
GRBException propagates unchanged.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "gurobi_c++.h"

#include "backend.h"
#include "errors.h"
#include "naming.h"
#include "options.h"

namespace flipset {

    /**
     * @brief Convert a Gurobi status code to a human-readable string
     * @param status GRB_OPTIMAL, GRB_INFEASIBLE, ...
     */
    inline std::string statusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return std::format("UNKNOWN({})", status);
        }
    }

    class GurobiBackend : public SolverBackend {
    private:
        std::unique_ptr<GRBEnv> env_;      // null when the env is external
        std::unique_ptr<GRBModel> model_;

        std::vector<GRBVar> vars_;
        std::vector<GRBConstr> cons_;
        mutable bool pending_ = false;     // modifications not yet update()d

    public:
        /// @brief Own a quiet environment and an empty model
        GurobiBackend()
            : env_(std::make_unique<GRBEnv>(true))  // defer license check and load
        {
            env_->set(GRB_IntParam_OutputFlag, 0);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);
        }

        /// @brief Build the model in an external, already started environment
        explicit GurobiBackend(GRBEnv& env)
            : model_(std::make_unique<GRBModel>(env))
        {
            model_->set(GRB_IntParam_OutputFlag, 0);
        }

        GurobiBackend(const GurobiBackend&) = delete;
        GurobiBackend& operator=(const GurobiBackend&) = delete;

        // Model must be destroyed before its environment
        ~GurobiBackend() override {
            model_.reset();
            env_.reset();
        }

        [[nodiscard]] std::string name() const override { return "gurobi"; }

        [[nodiscard]] Capabilities capabilities() const override {
            return Capabilities::full();
        }

        /// @brief Direct access for diagnostics (IIS, model export)
        [[nodiscard]] GRBModel& model() { return *model_; }

        // ---------------------------------------------------------------------
        // Model construction
        // ---------------------------------------------------------------------

        void applyParameters(const SolverParameters& params) override {
            model_->set(GRB_IntParam_Seed, params.randomSeed);
            model_->set(GRB_IntParam_Threads, params.threads);
            model_->set(GRB_DoubleParam_MIPGap, params.mipGap);
            model_->set(GRB_DoubleParam_MIPGapAbs, params.absMipGap);
            model_->set(GRB_DoubleParam_IntFeasTol, params.integralityTolerance);
            model_->set(GRB_DoubleParam_FeasibilityTol, params.feasibilityTolerance);
            model_->set(GRB_IntParam_Presolve, params.presolve ? -1 : 0);
        }

        VarId addContinuous(const std::string& name, double lb, double ub, double obj = 0.0) override {
            vars_.push_back(model_->addVar(toGurobi(lb), toGurobi(ub), obj, GRB_CONTINUOUS,
                                           make_name::pass(name)));
            pending_ = true;
            return vars_.size() - 1;
        }

        VarId addBinary(const std::string& name, double obj = 0.0) override {
            vars_.push_back(model_->addVar(0.0, 1.0, obj, GRB_BINARY, make_name::pass(name)));
            pending_ = true;
            return vars_.size() - 1;
        }

        ConId addConstraint(const std::string& name, const LinearTerms& terms,
                            Sense sense, double rhs) override
        {
            cons_.push_back(model_->addConstr(expression(terms), toGurobi(sense), rhs,
                                              make_name::pass(name)));
            pending_ = true;
            return cons_.size() - 1;
        }

        void addSos1(const std::string& /*name*/, const std::vector<VarId>& vars,
                     const std::vector<double>& weights) override
        {
            if (vars.size() != weights.size()) {
                throw ConfigurationError(std::format(
                    "GurobiBackend::addSos1: {} variables but {} weights", vars.size(), weights.size()));
            }
            std::vector<GRBVar> members;
            members.reserve(vars.size());
            for (VarId v : vars) members.push_back(var(v));
            std::vector<double> w = weights;
            model_->addSOS(members.data(), w.data(), static_cast<int>(members.size()), GRB_SOS_TYPE1);
            pending_ = true;
        }

        void setObjective(const LinearTerms& terms) override {
            model_->setObjective(expression(terms), GRB_MINIMIZE);
            pending_ = true;
        }

        // ---------------------------------------------------------------------
        // Mutation
        // ---------------------------------------------------------------------

        void setRhs(ConId con, double rhs) override {
            constr(con).set(GRB_DoubleAttr_RHS, rhs);
            pending_ = true;
        }

        [[nodiscard]] double rhs(ConId con) const override {
            sync();
            return constr(con).get(GRB_DoubleAttr_RHS);
        }

        void setLowerBound(VarId v, double lb) override {
            var(v).set(GRB_DoubleAttr_LB, toGurobi(lb));
            pending_ = true;
        }

        [[nodiscard]] double lowerBound(VarId v) const override {
            sync();
            return fromGurobi(var(v).get(GRB_DoubleAttr_LB));
        }

        // ---------------------------------------------------------------------
        // Limits and display
        // ---------------------------------------------------------------------

        void setTimeLimit(double seconds) override {
            model_->set(GRB_DoubleParam_TimeLimit, toGurobi(seconds));
        }

        void setNodeLimit(double nodes) override {
            model_->set(GRB_DoubleParam_NodeLimit, toGurobi(nodes));
        }

        void setDisplay(bool on) override {
            model_->set(GRB_IntParam_OutputFlag, on ? 1 : 0);
        }

        // ---------------------------------------------------------------------
        // Solving
        // ---------------------------------------------------------------------

        SolveReport solve() override {
            model_->optimize();
            pending_ = false;

            SolveReport r;
            r.status = statusString(model_->get(GRB_IntAttr_Status));
            r.primalFeasible = model_->get(GRB_IntAttr_SolCount) > 0;
            r.iterations = model_->get(GRB_DoubleAttr_IterCount);
            r.runtime = model_->get(GRB_DoubleAttr_Runtime);

            const bool is_mip = model_->get(GRB_IntAttr_IsMIP) != 0;
            if (is_mip) {
                r.nodesProcessed = model_->get(GRB_DoubleAttr_NodeCount);
            }
            if (r.primalFeasible) {
                r.objective = model_->get(GRB_DoubleAttr_ObjVal);
                if (is_mip) {
                    r.bestBound = model_->get(GRB_DoubleAttr_ObjBound);
                    r.gap = model_->get(GRB_DoubleAttr_MIPGap);
                } else {
                    r.bestBound = r.objective;
                    r.gap = 0.0;
                }
            }
            return r;
        }

        [[nodiscard]] double value(VarId v) const override {
            return var(v).get(GRB_DoubleAttr_X);
        }

        [[nodiscard]] std::size_t numVariables() const override { return vars_.size(); }

        [[nodiscard]] std::size_t numConstraints() const override { return cons_.size(); }

    private:
        static double toGurobi(double v) noexcept {
            if (std::isinf(v)) return v > 0 ? GRB_INFINITY : -GRB_INFINITY;
            return v;
        }

        static double fromGurobi(double v) noexcept {
            if (v >= GRB_INFINITY) return std::numeric_limits<double>::infinity();
            if (v <= -GRB_INFINITY) return -std::numeric_limits<double>::infinity();
            return v;
        }

        static char toGurobi(Sense s) noexcept {
            switch (s) {
                case Sense::LessEqual:    return GRB_LESS_EQUAL;
                case Sense::GreaterEqual: return GRB_GREATER_EQUAL;
                case Sense::Equal:        return GRB_EQUAL;
            }
            return GRB_EQUAL;
        }

        GRBVar var(VarId v) const {
            if (v >= vars_.size()) {
                throw std::out_of_range(std::format(
                    "GurobiBackend: variable id {} out of range [0, {})", v, vars_.size()));
            }
            return vars_[v];
        }

        GRBConstr constr(ConId c) const {
            if (c >= cons_.size()) {
                throw std::out_of_range(std::format(
                    "GurobiBackend: constraint id {} out of range [0, {})", c, cons_.size()));
            }
            return cons_[c];
        }

        GRBLinExpr expression(const LinearTerms& terms) const {
            GRBLinExpr expr;
            for (const auto& t : terms) {
                expr += t.coef * var(t.var);
            }
            return expr;
        }

        // Attribute queries see pending changes only after update()
        void sync() const {
            if (pending_) {
                model_->update();
                pending_ = false;
            }
        }
    };

    /// @brief Factory creating one GurobiBackend with its own environment per build
    inline BackendFactory gurobiFactory() {
        return [] { return std::make_unique<GurobiBackend>(); };
    }

    /// @brief Factory sharing one external environment between builds
    inline BackendFactory gurobiFactory(GRBEnv& env) {
        return [&env] { return std::make_unique<GurobiBackend>(env); };
    }

} // namespace flipset
