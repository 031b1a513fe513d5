#pragma once
/*
===============================================================================
ACTION SET — Features and their feasible value grids
===============================================================================

OVERVIEW
--------
The recourse MIP consumes, for every feature, its name, whether it may be
changed, and (for actionable features) a feasible grid: candidate absolute
values in ascending order with the empirical percentile of each value.

Building those grids from data is outside this library. ActionSet is the
interface the MIP builder reads from; GridActionSet is a plain in-memory
implementation holding grids supplied by the caller.

Grid order must match the classifier's coefficient order.

USAGE
-----
    flipset::GridActionSet actions;
    actions.addFeature("income", {20, 40, 60, 80}, {0.1, 0.4, 0.7, 0.9});
    actions.addImmutable("age");

EXCEPTION SAFETY
----------------
• GridActionSet::addFeature: ConfigurationError on malformed grids; the set
  is unchanged on failure
• Accessors: std::out_of_range for bad indices

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"

namespace flipset {

    /**
     * @brief Candidate values of one feature with their percentiles
     *
     * @details values are ascending and unique; percentiles[k] is the
     *          empirical percentile of values[k], in [0, 1] and
     *          non-decreasing.
     */
    struct FeasibleGrid {
        std::vector<double> values;
        std::vector<double> percentiles;
    };

    /**
     * @class ActionSet
     * @brief Read-only view of features consumed by the recourse MIP
     */
    class ActionSet {
    public:
        virtual ~ActionSet() = default;

        /// @brief Number of features (actionable or not)
        [[nodiscard]] virtual std::size_t size() const = 0;

        [[nodiscard]] virtual const std::string& name(std::size_t j) const = 0;

        [[nodiscard]] virtual bool actionable(std::size_t j) const = 0;

        /**
         * @brief Feasible grid of an actionable feature
         * @throws std::invalid_argument if feature j is not actionable
         */
        [[nodiscard]] virtual const FeasibleGrid& grid(std::size_t j) const = 0;

        /// @brief Names of all features in order
        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> out;
            out.reserve(size());
            for (std::size_t j = 0; j < size(); ++j) out.push_back(name(j));
            return out;
        }

        /// @brief Indices of actionable features in order
        [[nodiscard]] std::vector<std::size_t> actionableIndices() const {
            std::vector<std::size_t> out;
            for (std::size_t j = 0; j < size(); ++j) {
                if (actionable(j)) out.push_back(j);
            }
            return out;
        }
    };

    /**
     * @class GridActionSet
     * @brief In-memory ActionSet built from explicit grids
     */
    class GridActionSet : public ActionSet {
    private:
        struct Feature {
            std::string name;
            bool actionable = false;
            FeasibleGrid grid;
        };

        std::vector<Feature> features_;

        static void checkGrid(const std::string& name, const FeasibleGrid& g) {
            if (g.values.empty()) {
                throw ConfigurationError(std::format(
                    "GridActionSet::addFeature: grid of '{}' is empty", name));
            }
            if (g.values.size() != g.percentiles.size()) {
                throw ConfigurationError(std::format(
                    "GridActionSet::addFeature: '{}' has {} values but {} percentiles",
                    name, g.values.size(), g.percentiles.size()));
            }
            for (std::size_t k = 0; k < g.values.size(); ++k) {
                const double v = g.values[k];
                const double p = g.percentiles[k];
                if (!std::isfinite(v) || !std::isfinite(p)) {
                    throw ConfigurationError(std::format(
                        "GridActionSet::addFeature: '{}' has a non-finite entry at {}",
                        name, k));
                }
                if (p < 0.0 || p > 1.0) {
                    throw ConfigurationError(std::format(
                        "GridActionSet::addFeature: '{}' percentile {} outside [0, 1]",
                        name, p));
                }
                if (k > 0 && !(v > g.values[k - 1])) {
                    throw ConfigurationError(std::format(
                        "GridActionSet::addFeature: values of '{}' must be strictly ascending",
                        name));
                }
                if (k > 0 && p < g.percentiles[k - 1]) {
                    throw ConfigurationError(std::format(
                        "GridActionSet::addFeature: percentiles of '{}' must be non-decreasing",
                        name));
                }
            }
        }

    public:
        /**
         * @brief Append an actionable feature with its feasible grid
         * @return Index of the new feature
         */
        std::size_t addFeature(std::string name,
                               std::vector<double> values,
                               std::vector<double> percentiles)
        {
            FeasibleGrid g{std::move(values), std::move(percentiles)};
            checkGrid(name, g);
            features_.push_back(Feature{std::move(name), true, std::move(g)});
            return features_.size() - 1;
        }

        /// @brief Append a feature the MIP may not change
        std::size_t addImmutable(std::string name) {
            features_.push_back(Feature{std::move(name), false, {}});
            return features_.size() - 1;
        }

        [[nodiscard]] std::size_t size() const override { return features_.size(); }

        [[nodiscard]] const std::string& name(std::size_t j) const override {
            return features_.at(j).name;
        }

        [[nodiscard]] bool actionable(std::size_t j) const override {
            return features_.at(j).actionable;
        }

        [[nodiscard]] const FeasibleGrid& grid(std::size_t j) const override {
            const Feature& f = features_.at(j);
            if (!f.actionable) {
                throw std::invalid_argument(std::format(
                    "GridActionSet::grid: feature '{}' is not actionable", f.name));
            }
            return f.grid;
        }
    };

} // namespace flipset
