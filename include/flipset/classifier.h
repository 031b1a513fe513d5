#pragma once
/*
===============================================================================
LINEAR CLASSIFIER — Score function whose prediction recourse must flip
===============================================================================

OVERVIEW
--------
Holds the validated coefficients and intercept of a linear classifier

    score(x)      = w · x + b
    prediction(x) = sign(score(x))      in {-1, 0, +1}

The object is immutable after construction. Parsing arbitrary classifier
objects is left to callers; this type only checks that the data is finite
and non-empty. Length agreement with the action set is checked by the
RecourseBuilder, which sees both.

EXCEPTION SAFETY
----------------
• Constructor: throws ConfigurationError on empty or non-finite data
• score() / prediction(): throw ConfigurationError on length mismatch

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <utility>
#include <vector>

#include "errors.h"

namespace flipset {

    class LinearClassifier {
    private:
        std::vector<double> coefficients_;
        double intercept_ = 0.0;

    public:
        /**
         * @brief Construct from coefficients and intercept
         * @throws ConfigurationError if coefficients is empty or any value
         *         (including the intercept) is not finite
         */
        LinearClassifier(std::vector<double> coefficients, double intercept)
            : coefficients_(std::move(coefficients)), intercept_(intercept)
        {
            if (coefficients_.empty()) {
                throw ConfigurationError(
                    "LinearClassifier: coefficient vector is empty");
            }
            for (std::size_t j = 0; j < coefficients_.size(); ++j) {
                if (!std::isfinite(coefficients_[j])) {
                    throw ConfigurationError(std::format(
                        "LinearClassifier: coefficient {} is not finite ({})",
                        j, coefficients_[j]));
                }
            }
            if (!std::isfinite(intercept_)) {
                throw ConfigurationError(std::format(
                    "LinearClassifier: intercept is not finite ({})", intercept_));
            }
        }

        [[nodiscard]] const std::vector<double>& coefficients() const noexcept {
            return coefficients_;
        }

        [[nodiscard]] double coefficient(std::size_t j) const {
            return coefficients_.at(j);
        }

        [[nodiscard]] double intercept() const noexcept { return intercept_; }

        [[nodiscard]] std::size_t size() const noexcept { return coefficients_.size(); }

        /// @brief w · x + b
        [[nodiscard]] double score(const std::vector<double>& x) const {
            if (x.size() != coefficients_.size()) {
                throw ConfigurationError(std::format(
                    "LinearClassifier::score: x has {} entries, expected {}",
                    x.size(), coefficients_.size()));
            }
            double s = intercept_;
            for (std::size_t j = 0; j < x.size(); ++j) {
                s += coefficients_[j] * x[j];
            }
            return s;
        }

        /// @brief sign(score(x)) as -1, 0 or +1
        [[nodiscard]] int prediction(const std::vector<double>& x) const {
            double s = score(x);
            return (s > 0.0) - (s < 0.0);
        }
    };

} // namespace flipset
