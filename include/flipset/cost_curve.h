#pragma once
/*
===============================================================================
COST CURVES — Feasible (action, cost) curves of actionable features
===============================================================================

OVERVIEW
--------
Turns the feasible grid of one actionable feature into the piecewise curve
the MIP selects from:

    actions:  0 = d_0 < |d_1| < |d_2| < ...     deltas from the current value
    costs:    0 = c_0 <  c_1  <  c_2  < ...     cost of moving by d_k

Only deltas in the direction that raises the score (the sign of the
feature's coefficient) are kept, so every point of the curve helps flip a
negative prediction. The anchor (0, 0) is always the first point and
represents "feature unchanged".

COST TRANSFORMS
---------------
With p the percentile of a grid value and p0 the percentile of the current
value (linear interpolation over the grid):

                    moving up (w > 0)            moving down (w < 0)
    percentile      p - p0                       p0 - p
    log-odds        ln((1 - p0) / (1 - p))       ln((1 - p) / (1 - p0))

CostType::Total and CostType::Max use the percentile transform;
CostType::Local uses the log-odds transform.

CLEANUP
-------
Points other than the anchor are dropped when their cost is not strictly
positive or not finite (log-odds at p = 1). A run of points with identical
cost collapses to the farthest one: it buys more score for the same cost.

A feature produces no curve (std::nullopt) when its coefficient is ~0 or
when nothing is left after cleanup. Such a feature stays at its current
value and takes no part in the MIP.

EXCEPTION SAFETY
----------------
• validateCurve(): throws CurveValidationError describing the first
  violated invariant
• buildCostCurve(): propagates CurveValidationError; never returns an
  invalid curve

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <optional>
#include <utility>
#include <vector>

#include "action_set.h"
#include "errors.h"
#include "options.h"

namespace flipset {

    /// @brief |w| at or below this is treated as a zero coefficient
    inline constexpr double kCoefficientTolerance = 1e-8;

    /// @brief |delta| at or below this is treated as no change
    inline constexpr double kActionTolerance = 1e-8;

    /**
     * @brief Feasible (action, cost) curve of one feature
     *
     * @invariant actions.size() == costs.size() >= 2
     * @invariant actions[0] == 0 and costs[0] == 0 exactly
     * @invariant sign(actions[k]) == sign(coefficient) for k >= 1
     * @invariant |actions| and costs strictly increase along the curve
     */
    struct CostCurve {
        std::size_t featureIndex = 0;
        double coefficient = 0.0;
        std::vector<double> actions;
        std::vector<double> costs;

        [[nodiscard]] std::size_t size() const noexcept { return actions.size(); }

        [[nodiscard]] double minAction() const {
            return *std::min_element(actions.begin(), actions.end());
        }

        [[nodiscard]] double maxAction() const {
            return *std::max_element(actions.begin(), actions.end());
        }

        [[nodiscard]] double maxCost() const { return costs.back(); }
    };

    /**
     * @brief Percentile of value by linear interpolation over the grid
     *
     * @details Values outside the grid take the percentile of the nearest
     *          end point. A value equal to a grid value returns its
     *          percentile exactly.
     */
    inline double percentileAt(const FeasibleGrid& grid, double value) {
        const auto& v = grid.values;
        const auto& p = grid.percentiles;
        if (value <= v.front()) return p.front();
        if (value >= v.back()) return p.back();

        auto it = std::upper_bound(v.begin(), v.end(), value);
        std::size_t hi = static_cast<std::size_t>(it - v.begin());
        std::size_t lo = hi - 1;
        if (v[lo] == value) return p[lo];
        double t = (value - v[lo]) / (v[hi] - v[lo]);
        return p[lo] + t * (p[hi] - p[lo]);
    }

    /**
     * @brief Cost of moving from percentile p0 to percentile p
     * @param up true when the improving direction increases the feature
     */
    inline double percentileCost(double p0, double p, bool up, CostType type) {
        if (type == CostType::Local) {
            return up ? std::log((1.0 - p0) / (1.0 - p))
                      : std::log((1.0 - p) / (1.0 - p0));
        }
        return up ? p - p0 : p0 - p;
    }

    /**
     * @brief Check every CostCurve invariant
     * @throws CurveValidationError naming the feature and the violation
     */
    inline void validateCurve(const CostCurve& curve) {
        const std::size_t j = curve.featureIndex;
        const auto& a = curve.actions;
        const auto& c = curve.costs;

        if (!(std::abs(curve.coefficient) > kCoefficientTolerance)) {
            throw CurveValidationError(std::format(
                "validateCurve: feature {} has coefficient ~0 ({})", j, curve.coefficient));
        }
        if (a.size() != c.size()) {
            throw CurveValidationError(std::format(
                "validateCurve: feature {} has {} actions but {} costs", j, a.size(), c.size()));
        }
        if (a.size() < 2) {
            throw CurveValidationError(std::format(
                "validateCurve: feature {} has {} point(s), need at least 2", j, a.size()));
        }
        if (a[0] != 0.0 || c[0] != 0.0) {
            throw CurveValidationError(std::format(
                "validateCurve: feature {} starts at ({}, {}), expected (0, 0)", j, a[0], c[0]));
        }

        const double dir = curve.coefficient > 0.0 ? 1.0 : -1.0;
        for (std::size_t k = 1; k < a.size(); ++k) {
            if (!(dir * a[k] > 0.0)) {
                throw CurveValidationError(std::format(
                    "validateCurve: feature {} action {} = {} does not share the sign of w = {}",
                    j, k, a[k], curve.coefficient));
            }
        }

        auto sorted_a = a;
        std::sort(sorted_a.begin(), sorted_a.end());
        if (std::adjacent_find(sorted_a.begin(), sorted_a.end()) != sorted_a.end()) {
            throw CurveValidationError(std::format(
                "validateCurve: feature {} has duplicate actions", j));
        }
        auto sorted_c = c;
        std::sort(sorted_c.begin(), sorted_c.end());
        if (std::adjacent_find(sorted_c.begin(), sorted_c.end()) != sorted_c.end()) {
            throw CurveValidationError(std::format(
                "validateCurve: feature {} has duplicate costs", j));
        }

        for (std::size_t k = 1; k < a.size(); ++k) {
            if (!(dir * a[k] > dir * a[k - 1]) || !(c[k] > c[k - 1])) {
                throw CurveValidationError(std::format(
                    "validateCurve: feature {} is not ordered at point {}: "
                    "(a, c) = ({}, {}) after ({}, {})",
                    j, k, a[k], c[k], a[k - 1], c[k - 1]));
            }
        }
    }

    /**
     * @brief Build and validate the cost curve of feature j
     *
     * @param j            feature index (kept on the curve for diagnostics)
     * @param grid         feasible grid of the feature
     * @param current      current value x[j]
     * @param coefficient  classifier coefficient w[j]
     * @param type         cost transform selector
     *
     * @return The curve, or std::nullopt when the feature cannot move in the
     *         score-raising direction
     *
     * @throws CurveValidationError if the cleaned curve breaks an invariant
     *         (e.g. percentiles that decrease along the grid)
     */
    inline std::optional<CostCurve> buildCostCurve(std::size_t j,
                                                   const FeasibleGrid& grid,
                                                   double current,
                                                   double coefficient,
                                                   CostType type)
    {
        if (std::abs(coefficient) <= kCoefficientTolerance || grid.values.empty())
            return std::nullopt;

        const bool up = coefficient > 0.0;
        const double dir = up ? 1.0 : -1.0;
        const double p0 = percentileAt(grid, current);

        // (delta, percentile) in the improving direction, nearest first
        std::vector<std::pair<double, double>> points;
        for (std::size_t k = 0; k < grid.values.size(); ++k) {
            double d = grid.values[k] - current;
            if (dir * d > kActionTolerance) {
                points.emplace_back(d, grid.percentiles[k]);
            }
        }
        if (!up) std::reverse(points.begin(), points.end());

        CostCurve curve;
        curve.featureIndex = j;
        curve.coefficient = coefficient;
        curve.actions.push_back(0.0);
        curve.costs.push_back(0.0);

        for (const auto& [d, p] : points) {
            double c = percentileCost(p0, p, up, type);
            if (!std::isfinite(c) || c <= 0.0)
                continue;
            if (curve.size() > 1 && c == curve.costs.back()) {
                curve.actions.back() = d;
                continue;
            }
            curve.actions.push_back(d);
            curve.costs.push_back(c);
        }

        if (curve.size() < 2)
            return std::nullopt;

        validateCurve(curve);
        return curve;
    }

} // namespace flipset
