#pragma once
/*
===============================================================================
ENCODING — Flattened index tables for the recourse MIP
===============================================================================

OVERVIEW
--------
Collects the cost curves of all movable features and lays them out the way
the MIP builder consumes them: one FeatureEncoding per curve (names plus
curve data) and flat, aligned lists across features.

For a movable feature j whose curve has K points:

    a[j]                continuous action, bounds [min actions, max actions]
    u[j][0] .. u[j][K-1] binary selectors; u[j][0] is the no-op selector
    c[j]                continuous cost (max-cost objective only)

Flat lists are aligned by position i = 0 .. n-1 over movable features:

    featureIndices[i]     original feature index j
    coefficients[i]       w[j]
    offSelectorNames[i]   "u[j][0]"
    actionVarNames[i]     "a[j]"
    costVarNames[i]       "c[j]"
    actionLB/UB[i]        bounds of a[j]
    costUB[i]             largest cost on the curve
    costStep[i]           smallest cost increment on the curve

selectorNames lists every u[j][k], feature by feature.

TIE-BREAK WEIGHT
----------------
epsilon() is the weight of the total-cost term in the max-cost objective

    max_cost + epsilon * sum_j c[j]

With delta = smallest gap between any two distinct costs over all curves
(0 included; gaps below kCostGapTolerance are ignored) and S = sum of
per-feature max costs:

    epsilon = delta / (2 S)

Any two attainable max_cost values differ by at least delta, while the
total-cost term is at most epsilon * S = delta / 2, so it only orders
solutions that tie on max_cost.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "action_set.h"
#include "classifier.h"
#include "cost_curve.h"
#include "errors.h"
#include "naming.h"
#include "options.h"

namespace flipset {

    /// @brief Cost gaps at or below this are rounding noise, not distinct levels
    inline constexpr double kCostGapTolerance = 1e-9;

    /// @brief One movable feature: its curve and the names of its variables
    struct FeatureEncoding {
        CostCurve curve;
        std::string actionVarName;
        std::string costVarName;
        std::vector<std::string> selectorNames;

        /// @brief Smallest increment between consecutive costs
        [[nodiscard]] double minCostStep() const {
            double step = std::numeric_limits<double>::infinity();
            for (std::size_t k = 1; k < curve.costs.size(); ++k) {
                step = std::min(step, curve.costs[k] - curve.costs[k - 1]);
            }
            return step;
        }
    };

    struct EncodingTable {
        std::vector<FeatureEncoding> features;

        std::vector<std::size_t> featureIndices;
        std::vector<double> coefficients;
        std::vector<std::string> offSelectorNames;
        std::vector<std::string> selectorNames;
        std::vector<std::string> actionVarNames;
        std::vector<std::string> costVarNames;
        std::vector<double> actionLB;
        std::vector<double> actionUB;
        std::vector<double> costUB;
        std::vector<double> costStep;

        double minCostIncrement = 0.0;   ///< delta, over the union of all costs
        double totalMaxCost = 0.0;       ///< S, sum of costUB

        /// @brief Number of movable features (features in the MIP)
        [[nodiscard]] std::size_t size() const noexcept { return features.size(); }

        [[nodiscard]] bool empty() const noexcept { return features.empty(); }

        /// @brief Total number of selector variables
        [[nodiscard]] std::size_t selectorCount() const noexcept { return selectorNames.size(); }

        /// @brief Position of feature j among movable features, if it is one
        [[nodiscard]] std::optional<std::size_t> position(std::size_t j) const {
            auto it = std::find(featureIndices.begin(), featureIndices.end(), j);
            if (it == featureIndices.end()) return std::nullopt;
            return static_cast<std::size_t>(it - featureIndices.begin());
        }

        /// @brief Tie-break weight of the max-cost objective (0 if empty)
        [[nodiscard]] double epsilon() const noexcept {
            if (empty() || !(totalMaxCost > 0.0)) return 0.0;
            return minCostIncrement / (2.0 * totalMaxCost);
        }

        /// @brief Add a curve and extend all flat lists
        void append(CostCurve curve) {
            const std::size_t j = curve.featureIndex;

            FeatureEncoding fe;
            fe.actionVarName = force_name::math("a", j);
            fe.costVarName = force_name::math("c", j);
            for (std::size_t k = 0; k < curve.size(); ++k) {
                fe.selectorNames.push_back(force_name::math("u", j, k));
            }
            fe.curve = std::move(curve);

            featureIndices.push_back(j);
            coefficients.push_back(fe.curve.coefficient);
            offSelectorNames.push_back(fe.selectorNames.front());
            selectorNames.insert(selectorNames.end(),
                                 fe.selectorNames.begin(), fe.selectorNames.end());
            actionVarNames.push_back(fe.actionVarName);
            costVarNames.push_back(fe.costVarName);
            actionLB.push_back(fe.curve.minAction());
            actionUB.push_back(fe.curve.maxAction());
            costUB.push_back(fe.curve.maxCost());
            costStep.push_back(fe.minCostStep());

            features.push_back(std::move(fe));
            refreshCostScale();
        }

    private:
        void refreshCostScale() {
            std::vector<double> all{0.0};
            totalMaxCost = 0.0;
            for (const auto& fe : features) {
                all.insert(all.end(), fe.curve.costs.begin(), fe.curve.costs.end());
                totalMaxCost += fe.curve.maxCost();
            }
            std::sort(all.begin(), all.end());
            all.erase(std::unique(all.begin(), all.end()), all.end());

            minCostIncrement = std::numeric_limits<double>::infinity();
            for (std::size_t k = 1; k < all.size(); ++k) {
                const double gap = all[k] - all[k - 1];
                if (gap > kCostGapTolerance) {
                    minCostIncrement = std::min(minCostIncrement, gap);
                }
            }
            if (std::isinf(minCostIncrement)) minCostIncrement = 0.0;
        }
    };

    /**
     * @brief Build the encoding table of all movable features
     *
     * @param actions     feature descriptors and grids
     * @param classifier  coefficients aligned with actions
     * @param x           current point, one value per feature
     * @param type        cost transform selector
     *
     * @throws ConfigurationError on length mismatches, non-finite x, or a grid
     *         whose values and percentiles differ in length
     * @throws CurveValidationError if a feature's grid yields a bad curve
     */
    inline EncodingTable assembleEncoding(const ActionSet& actions,
                                          const LinearClassifier& classifier,
                                          const std::vector<double>& x,
                                          CostType type)
    {
        if (classifier.size() != actions.size()) {
            throw ConfigurationError(std::format(
                "assembleEncoding: classifier has {} coefficients, action set has {} features",
                classifier.size(), actions.size()));
        }
        if (x.size() != actions.size()) {
            throw ConfigurationError(std::format(
                "assembleEncoding: x has {} entries, expected {}", x.size(), actions.size()));
        }

        EncodingTable table;
        for (std::size_t j = 0; j < actions.size(); ++j) {
            if (!std::isfinite(x[j])) {
                throw ConfigurationError(std::format(
                    "assembleEncoding: x[{}] is not finite ({})", j, x[j]));
            }
            if (!actions.actionable(j))
                continue;

            const FeasibleGrid& grid = actions.grid(j);
            if (grid.values.size() != grid.percentiles.size()) {
                throw ConfigurationError(std::format(
                    "assembleEncoding: feature {} ('{}') has {} grid values but {} percentiles",
                    j, actions.name(j), grid.values.size(), grid.percentiles.size()));
            }

            auto curve = buildCostCurve(j, grid, x[j], classifier.coefficient(j), type);
            if (curve)
                table.append(std::move(*curve));
        }
        return table;
    }

} // namespace flipset
