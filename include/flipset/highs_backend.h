#pragma once
/*
===============================================================================
HIGHS BACKEND — Reduced SolverBackend on the open-source HiGHS solver
===============================================================================

Overview
--------
HighsBackend stages columns, rows and the objective in memory and hands the
whole model to HiGHS as one HighsLp on every solve(). It declares no
Capability:

    * constraints, right-hand sides and bounds can be changed until the
      first solve; afterwards these calls throw NotSupported
    * SOS1 sets are never supported (the selectors' pick_a rows already
      make them redundant)

A single solveOnce() works; enumeration with more than one record does not,
and RecourseBuilder::enumerate() reports NotSupported up front.

    flipset::RecourseBuilder builder(flipset::highsFactory());

Limits and display remain settable between solves.

Errors
------
HiGHS reports failures by HighsStatus. kError from passModel() or run() is
raised as std::runtime_error carrying the model status; kWarning is not an
error (time and node limits end with a warning).

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "Highs.h"

#include "backend.h"
#include "errors.h"
#include "naming.h"
#include "options.h"

namespace flipset {

    class HighsBackend : public SolverBackend {
    private:
        struct Row {
            std::string name;
            LinearTerms terms;
            double lower;
            double upper;
        };

        Highs highs_;

        // staged model
        std::vector<std::string> colNames_;
        std::vector<double> colLower_;
        std::vector<double> colUpper_;
        std::vector<double> colCost_;
        std::vector<HighsVarType> integrality_;
        std::vector<Row> rows_;

        bool solved_ = false;

    public:
        HighsBackend() {
            setOption("output_flag", false);
        }

        HighsBackend(const HighsBackend&) = delete;
        HighsBackend& operator=(const HighsBackend&) = delete;

        [[nodiscard]] std::string name() const override { return "highs"; }

        [[nodiscard]] Capabilities capabilities() const override { return {}; }

        // ---------------------------------------------------------------------
        // Model construction
        // ---------------------------------------------------------------------

        void applyParameters(const SolverParameters& params) override {
            setOption("random_seed", static_cast<HighsInt>(params.randomSeed));
            setOption("threads", static_cast<HighsInt>(params.threads));
            setOption("mip_rel_gap", params.mipGap);
            setOption("mip_abs_gap", params.absMipGap);
            setOption("mip_feasibility_tolerance", params.integralityTolerance);
            setOption("primal_feasibility_tolerance", params.feasibilityTolerance);
            setOption("presolve", std::string(params.presolve ? "on" : "off"));
        }

        VarId addContinuous(const std::string& name, double lb, double ub, double obj = 0.0) override {
            return addColumn(name, lb, ub, obj, HighsVarType::kContinuous);
        }

        VarId addBinary(const std::string& name, double obj = 0.0) override {
            return addColumn(name, 0.0, 1.0, obj, HighsVarType::kInteger);
        }

        ConId addConstraint(const std::string& name, const LinearTerms& terms,
                            Sense sense, double rhs) override
        {
            requireUnsolved("addConstraint", Capability::IncrementalConstraints);
            for (const auto& t : terms) checkVar(t.var);

            Row row{name, terms, -kHighsInf, kHighsInf};
            setRowBounds(row, sense, rhs);
            rows_.push_back(std::move(row));
            return rows_.size() - 1;
        }

        void addSos1(const std::string& name, const std::vector<VarId>&,
                     const std::vector<double>&) override
        {
            throw NotSupported(std::format(
                "HighsBackend::addSos1: special ordered sets are not supported ('{}')", name));
        }

        void setObjective(const LinearTerms& terms) override {
            std::fill(colCost_.begin(), colCost_.end(), 0.0);
            for (const auto& t : terms) {
                checkVar(t.var);
                colCost_[t.var] += t.coef;
            }
        }

        // ---------------------------------------------------------------------
        // Mutation (staged model only)
        // ---------------------------------------------------------------------

        void setRhs(ConId con, double rhs) override {
            requireUnsolved("setRhs", Capability::RhsMutation);
            Row& row = rowAt(con);
            setRowBounds(row, senseOf(row), rhs);
        }

        [[nodiscard]] double rhs(ConId con) const override {
            const Row& row = rowAt(con);
            return std::isfinite(row.lower) ? row.lower : row.upper;
        }

        void setLowerBound(VarId v, double lb) override {
            requireUnsolved("setLowerBound", Capability::BoundMutation);
            checkVar(v);
            colLower_[v] = lb;
        }

        [[nodiscard]] double lowerBound(VarId v) const override {
            checkVar(v);
            return colLower_[v];
        }

        // ---------------------------------------------------------------------
        // Limits and display
        // ---------------------------------------------------------------------

        void setTimeLimit(double seconds) override {
            setOption("time_limit", std::isinf(seconds) ? kHighsInf : seconds);
        }

        void setNodeLimit(double nodes) override {
            HighsInt limit = kHighsIInf;
            if (nodes < static_cast<double>(kHighsIInf)) {
                limit = static_cast<HighsInt>(std::ceil(nodes));
            }
            setOption("mip_max_nodes", limit);
        }

        void setDisplay(bool on) override {
            setOption("output_flag", on);
        }

        // ---------------------------------------------------------------------
        // Solving
        // ---------------------------------------------------------------------

        SolveReport solve() override {
            HighsStatus status = highs_.passModel(stagedModel());
            check(status, "passModel");
            status = highs_.run();
            check(status, "run");
            solved_ = true;

            const HighsInfo& info = highs_.getInfo();
            SolveReport r;
            r.status = highs_.modelStatusToString(highs_.getModelStatus());
            r.primalFeasible = info.primal_solution_status == kSolutionStatusFeasible;
            r.iterations = static_cast<double>(info.simplex_iteration_count);
            r.nodesProcessed = static_cast<double>(std::max<int64_t>(info.mip_node_count, 0));
            r.runtime = highs_.getRunTime();

            if (r.primalFeasible) {
                r.objective = info.objective_function_value;
                r.bestBound = info.mip_dual_bound;
                r.gap = info.mip_gap;
            }
            return r;
        }

        [[nodiscard]] double value(VarId v) const override {
            checkVar(v);
            const auto& col_value = highs_.getSolution().col_value;
            if (v >= col_value.size()) {
                throw std::logic_error("HighsBackend::value: no solution available");
            }
            return col_value[v];
        }

        [[nodiscard]] std::size_t numVariables() const override { return colCost_.size(); }

        [[nodiscard]] std::size_t numConstraints() const override { return rows_.size(); }

    private:
        VarId addColumn(const std::string& name, double lb, double ub, double obj, HighsVarType type) {
            requireUnsolved("addVariable", Capability::IncrementalConstraints);
            colNames_.push_back(name);
            colLower_.push_back(lb);
            colUpper_.push_back(ub);
            colCost_.push_back(obj);
            integrality_.push_back(type);
            return colCost_.size() - 1;
        }

        static void setRowBounds(Row& row, Sense sense, double rhs) {
            switch (sense) {
                case Sense::LessEqual:    row.lower = -kHighsInf; row.upper = rhs; break;
                case Sense::GreaterEqual: row.lower = rhs; row.upper = kHighsInf; break;
                case Sense::Equal:        row.lower = rhs; row.upper = rhs; break;
            }
        }

        static Sense senseOf(const Row& row) {
            if (row.lower == row.upper) return Sense::Equal;
            return std::isfinite(row.lower) ? Sense::GreaterEqual : Sense::LessEqual;
        }

        HighsLp stagedModel() const {
            HighsLp lp;
            lp.num_col_ = static_cast<HighsInt>(colCost_.size());
            lp.num_row_ = static_cast<HighsInt>(rows_.size());
            lp.sense_ = ObjSense::kMinimize;
            lp.col_cost_ = colCost_;
            lp.col_lower_ = colLower_;
            lp.col_upper_ = colUpper_;
            lp.integrality_ = integrality_;

            lp.a_matrix_.format_ = MatrixFormat::kRowwise;
            lp.a_matrix_.num_col_ = lp.num_col_;
            lp.a_matrix_.num_row_ = lp.num_row_;
            lp.a_matrix_.start_.assign(1, 0);
            for (const Row& row : rows_) {
                lp.row_lower_.push_back(row.lower);
                lp.row_upper_.push_back(row.upper);
                for (const auto& t : row.terms) {
                    lp.a_matrix_.index_.push_back(static_cast<HighsInt>(t.var));
                    lp.a_matrix_.value_.push_back(t.coef);
                }
                lp.a_matrix_.start_.push_back(static_cast<HighsInt>(lp.a_matrix_.index_.size()));
            }

            if (naming_enabled()) {
                lp.col_names_ = colNames_;
                for (const Row& row : rows_) lp.row_names_.push_back(row.name);
            }
            return lp;
        }

        template <typename T>
        void setOption(const std::string& option, const T& value) {
            check(highs_.setOptionValue(option, value), std::format("setOptionValue({})", option));
        }

        void check(HighsStatus status, std::string_view call) const {
            if (status == HighsStatus::kError) {
                throw std::runtime_error(std::format(
                    "HighsBackend: {} failed (model status '{}')",
                    call, highs_.modelStatusToString(highs_.getModelStatus())));
            }
        }

        void requireUnsolved(std::string_view call, Capability needed) const {
            if (solved_) {
                throw NotSupported(std::format(
                    "HighsBackend::{}: the model is passed to HiGHS in one shot; "
                    "{} after a solve is not supported", call, kCapabilityNames.name(needed)));
            }
        }

        void checkVar(VarId v) const {
            if (v >= colCost_.size()) {
                throw std::out_of_range(std::format(
                    "HighsBackend: variable id {} out of range [0, {})", v, colCost_.size()));
            }
        }

        Row& rowAt(ConId c) {
            if (c >= rows_.size()) {
                throw std::out_of_range(std::format(
                    "HighsBackend: constraint id {} out of range [0, {})", c, rows_.size()));
            }
            return rows_[c];
        }

        const Row& rowAt(ConId c) const {
            if (c >= rows_.size()) {
                throw std::out_of_range(std::format(
                    "HighsBackend: constraint id {} out of range [0, {})", c, rows_.size()));
            }
            return rows_[c];
        }
    };

    /// @brief Factory creating one HighsBackend per build
    inline BackendFactory highsFactory() {
        return [] { return std::make_unique<HighsBackend>(); };
    }

} // namespace flipset
