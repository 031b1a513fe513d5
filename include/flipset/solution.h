#pragma once
/*
===============================================================================
SOLUTION — Solution records, extraction and advisory validation
===============================================================================

Overview
--------
A SolutionRecord is the caller-facing result of one solve. It is built from
the backend's SolveReport plus the raw values of the action and cost
variables, scattered back to full feature length.

    extractSolution()   report + raw values  ->  SolutionRecord
    validateSolution()  SolutionRecord       ->  std::vector<Advisory>

Infeasible solves
-----------------
When no primal feasible solution exists the record is a sentinel:

    feasible = false, cost = upperBound = lowerBound = gap = +inf,
    actions = costs = all zeros, status and counters copied from the report

Advisories
----------
Validation never throws. Small numerical drift near the decision boundary
is expected, so each failed check becomes an Advisory on the record:

    ItemCount            number of changed features outside the item limits
    NonActionableChange  a changed feature is not actionable
    NoFlip               the action does not flip the prediction
    NearZeroScore        no flip, but |score(x + a)| <= 1e-4
    UntouchedCost        an unchanged feature carries a non-zero cost
    ChangedCost          a changed feature carries no positive cost
    AggregateCost        cost disagrees with max/sum of costs (rtol 1e-4)

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <limits>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

#include "backend.h"
#include "classifier.h"
#include "cost_curve.h"
#include "encoding.h"
#include "enum_utils.h"
#include "options.h"

namespace flipset {

    /// @brief |score(x + a)| at or below this counts as sitting on the boundary
    inline constexpr double kBoundaryTolerance = 1e-4;

    /// @brief Relative tolerance of the aggregate cost check
    inline constexpr double kCostRelTolerance = 1e-4;

    /// @brief |cost| at or below this counts as zero
    inline constexpr double kCostTolerance = 1e-8;

    DECLARE_ENUM_WITH_COUNT(AdvisoryKind,
        ItemCount,
        NonActionableChange,
        NoFlip,
        NearZeroScore,
        UntouchedCost,
        ChangedCost,
        AggregateCost);

    struct Advisory {
        AdvisoryKind kind;
        std::string message;
    };

    struct SolutionRecord {
        bool feasible = false;
        std::string status = "not solved";

        std::vector<double> actions;   ///< one entry per feature, 0 if untouched
        std::vector<double> costs;     ///< one entry per feature, 0 if untouched
        double cost = std::numeric_limits<double>::infinity();

        double upperBound = std::numeric_limits<double>::infinity();
        double lowerBound = std::numeric_limits<double>::infinity();
        double gap = std::numeric_limits<double>::infinity();

        double iterations = 0.0;
        double nodesProcessed = 0.0;
        double nodesRemaining = std::numeric_limits<double>::quiet_NaN();   ///< NaN if unknown
        double runtime = 0.0;          ///< seconds

        std::vector<Advisory> advisories;

        /// @brief Indices j with |actions[j]| above the action tolerance
        [[nodiscard]] std::vector<std::size_t> changedFeatures() const {
            std::vector<std::size_t> out;
            for (std::size_t j = 0; j < actions.size(); ++j) {
                if (std::abs(actions[j]) > kActionTolerance) out.push_back(j);
            }
            return out;
        }

        [[nodiscard]] std::size_t itemCount() const { return changedFeatures().size(); }

        [[nodiscard]] bool hasAdvisory(AdvisoryKind kind) const {
            return std::any_of(advisories.begin(), advisories.end(),
                               [kind](const Advisory& a) { return a.kind == kind; });
        }
    };

    /**
     * @brief Solver values needed to rebuild a record
     *
     * actionValues[i] and costValues[i] follow the position order of the
     * EncodingTable. maxCost is set for CostType::Max only.
     */
    struct RawSolution {
        std::vector<double> actionValues;
        std::vector<double> costValues;
        std::optional<double> maxCost;
    };

    /**
     * @brief Build the record of one solve
     *
     * @param report     backend outcome
     * @param encoding   table used to build the MIP
     * @param nFeatures  full feature count
     * @param raw        values read from the backend (ignored if infeasible)
     */
    inline SolutionRecord extractSolution(const SolveReport& report,
                                          const EncodingTable& encoding,
                                          std::size_t nFeatures,
                                          const RawSolution& raw)
    {
        SolutionRecord rec;
        rec.actions.assign(nFeatures, 0.0);
        rec.costs.assign(nFeatures, 0.0);
        rec.iterations = report.iterations;
        rec.nodesProcessed = report.nodesProcessed;
        rec.nodesRemaining = report.nodesRemaining;
        rec.runtime = report.runtime;
        rec.status = report.status;

        if (!report.primalFeasible) {
            return rec;
        }

        for (std::size_t i = 0; i < encoding.size(); ++i) {
            const std::size_t j = encoding.featureIndices[i];
            rec.actions[j] = raw.actionValues.at(i);
            rec.costs[j] = raw.costValues.at(i);
        }

        rec.feasible = true;
        rec.upperBound = report.objective;
        rec.lowerBound = report.bestBound;
        rec.gap = report.gap;
        rec.cost = raw.maxCost ? *raw.maxCost : report.objective;
        return rec;
    }

    /// @brief Inputs of validateSolution() besides the record itself
    struct ValidationContext {
        const LinearClassifier* classifier = nullptr;
        const std::vector<double>* x = nullptr;
        std::vector<std::size_t> actionableIndices;
        int minItems = 1;
        int maxItems = 0;
        CostType costType = CostType::Max;
    };

    /**
     * @brief Check a feasible record against the recourse invariants
     * @return One Advisory per failed check; empty for infeasible records
     */
    inline std::vector<Advisory> validateSolution(const SolutionRecord& rec,
                                                  const ValidationContext& ctx)
    {
        std::vector<Advisory> out;
        if (!rec.feasible) return out;

        const auto changed = rec.changedFeatures();
        const int n_items = static_cast<int>(changed.size());

        if (n_items < ctx.minItems || n_items > ctx.maxItems) {
            out.push_back({AdvisoryKind::ItemCount, std::format(
                "{} feature(s) changed, limits are [{}, {}]",
                n_items, ctx.minItems, ctx.maxItems)});
        }

        for (std::size_t j : changed) {
            if (!std::binary_search(ctx.actionableIndices.begin(),
                                    ctx.actionableIndices.end(), j)) {
                out.push_back({AdvisoryKind::NonActionableChange, std::format(
                    "feature {} changed by {} but is not actionable", j, rec.actions[j])});
            }
        }

        const auto& x = *ctx.x;
        std::vector<double> moved(x.size());
        for (std::size_t j = 0; j < x.size(); ++j) moved[j] = x[j] + rec.actions[j];

        if (ctx.classifier->prediction(x) == ctx.classifier->prediction(moved)) {
            double s = ctx.classifier->score(moved);
            if (std::abs(s) <= kBoundaryTolerance) {
                out.push_back({AdvisoryKind::NearZeroScore, std::format(
                    "numerical issue: near-zero score(x + a) = {:.8f}", s)});
            } else {
                out.push_back({AdvisoryKind::NoFlip, std::format(
                    "prediction does not flip: score(x) = {}, score(x + a) = {}",
                    ctx.classifier->score(x), s)});
            }
        }

        for (std::size_t j = 0; j < rec.costs.size(); ++j) {
            bool is_changed = std::abs(rec.actions[j]) > kActionTolerance;
            if (is_changed && !(rec.costs[j] > 0.0)) {
                out.push_back({AdvisoryKind::ChangedCost, std::format(
                    "feature {} changed by {} at cost {}", j, rec.actions[j], rec.costs[j])});
            }
            if (!is_changed && std::abs(rec.costs[j]) > kCostTolerance) {
                out.push_back({AdvisoryKind::UntouchedCost, std::format(
                    "feature {} is unchanged but costs {}", j, rec.costs[j])});
            }
        }

        double expected = 0.0;
        if (ctx.costType == CostType::Max) {
            expected = rec.costs.empty() ? 0.0 : *std::max_element(rec.costs.begin(), rec.costs.end());
        } else {
            expected = std::accumulate(rec.costs.begin(), rec.costs.end(), 0.0);
        }
        if (std::abs(rec.cost - expected) > kCostTolerance + kCostRelTolerance * std::abs(expected)) {
            out.push_back({AdvisoryKind::AggregateCost, std::format(
                "numerical issue: cost is {} but the {} of cost[j] is {}",
                rec.cost, ctx.costType == CostType::Max ? "maximum" : "sum", expected)});
        }

        return out;
    }

} // namespace flipset
