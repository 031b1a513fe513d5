#pragma once
/*
===============================================================================
ENUMERATOR — Lazy enumeration of distinct minimum-cost recourse actions
===============================================================================

Overview
--------
An Enumerator repeatedly solves the builder's MIP and, after every recorded
solution, cuts that solution out of the MIP according to an
EnumerationPolicy. Records are produced one at a time by next():

    auto e = builder.enumerate(5, flipset::EnumerationPolicy::DistinctSubsets);
    while (auto rec = e.next()) {
        use(*rec);
    }

State machine
-------------
    Ready -> Solving -> Recorded -> Solving -> ... -> Exhausted | Finished

    Exhausted  a solve returned no feasible solution
    Finished   totalItems records were produced

The exclusion for a record is added before next() returns it, except for the
last requested record, so the MIP is left exactly as the caller would
expect after populate().

Validity
--------
The Enumerator keeps a reference to its builder. A rebuild of that builder
(configure() or rebuild()) makes the enumerator stale; next() then throws
ConfigurationError. The builder must outlive the enumerator.

===============================================================================
*/

#include <chrono>
#include <cstddef>
#include <format>
#include <optional>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "options.h"
#include "recourse_builder.h"
#include "solution.h"

namespace flipset {

    DECLARE_ENUM_WITH_COUNT(EnumerationState, Ready, Solving, Recorded, Exhausted, Finished);

    inline constexpr EnumNames<EnumerationState> kEnumerationStateNames{{
        "ready", "solving", "recorded", "exhausted", "finished"}};

    class Enumerator {
    private:
        RecourseBuilder* builder_;
        std::size_t generation_;
        std::size_t totalItems_;
        EnumerationPolicy policy_;
        SolveLimits limits_;

        EnumerationState state_ = EnumerationState::Ready;
        std::size_t produced_ = 0;
        std::vector<Exclusion> trail_;

    public:
        /**
         * @brief Bind to a built builder
         * @note Prefer RecourseBuilder::enumerate(), which checks arguments
         */
        Enumerator(RecourseBuilder& builder,
                   std::size_t totalItems,
                   EnumerationPolicy policy,
                   SolveLimits limits)
            : builder_(&builder)
            , generation_(builder.generation())
            , totalItems_(totalItems)
            , policy_(policy)
            , limits_(limits)
        {}

        /**
         * @brief Solve for the next record
         *
         * @return The record, or std::nullopt once the enumeration is done
         *
         * @throws ConfigurationError if the builder was rebuilt since enumerate()
         * @throws NotSupported if the backend cannot add the exclusion
         */
        std::optional<SolutionRecord> next() {
            if (done()) return std::nullopt;

            if (builder_->generation() != generation_) {
                throw ConfigurationError(std::format(
                    "Enumerator::next: builder was rebuilt (generation {} -> {}); "
                    "start a new enumeration", generation_, builder_->generation()));
            }

            state_ = EnumerationState::Solving;
            SolutionRecord rec = builder_->solveOnce(limits_);

            if (!rec.feasible) {
                state_ = EnumerationState::Exhausted;
                return std::nullopt;
            }

            ++produced_;
            if (produced_ < totalItems_) {
                trail_.push_back(builder_->excludeLastSolution(policy_));
                state_ = EnumerationState::Recorded;
            } else {
                state_ = EnumerationState::Finished;
            }
            return rec;
        }

        [[nodiscard]] bool done() const noexcept {
            return state_ == EnumerationState::Exhausted || state_ == EnumerationState::Finished;
        }

        [[nodiscard]] EnumerationState state() const noexcept { return state_; }

        [[nodiscard]] std::size_t produced() const noexcept { return produced_; }

        [[nodiscard]] std::size_t totalItems() const noexcept { return totalItems_; }

        [[nodiscard]] EnumerationPolicy policy() const noexcept { return policy_; }

        /// @brief Exclusions added so far, in order
        [[nodiscard]] const std::vector<Exclusion>& trail() const noexcept { return trail_; }
    };

    // =========================================================================
    // RecourseBuilder enumeration entry points
    // =========================================================================

    inline Enumerator RecourseBuilder::enumerate(std::size_t totalItems,
                                                 EnumerationPolicy policy,
                                                 const SolveLimits& limits)
    {
        requireBuilt("RecourseBuilder::enumerate");
        if (totalItems == 0) {
            throw ConfigurationError("RecourseBuilder::enumerate: total_items must be positive");
        }
        if (!(limits.timeLimit > 0.0) || !(limits.nodeLimit > 0.0)) {
            throw ConfigurationError(std::format(
                "RecourseBuilder::enumerate: limits must be positive (time {}, nodes {})",
                limits.timeLimit, limits.nodeLimit));
        }
        if (totalItems > 1) {
            requireCapability(requiredCapability(policy), "RecourseBuilder::enumerate");
        }
        if (totalItems == kUnlimited) {
            warn(std::format("enumerating with policy '{}' until the MIP is infeasible; "
                             "this may take a long time", toString(policy)));
        }
        return Enumerator(*this, totalItems, policy, limits);
    }

    inline std::vector<SolutionRecord> RecourseBuilder::populate(std::size_t totalItems,
                                                                 EnumerationPolicy policy,
                                                                 const SolveLimits& limits)
    {
        auto start = std::chrono::steady_clock::now();
        Enumerator e = enumerate(totalItems, policy, limits);

        std::vector<SolutionRecord> items;
        while (auto rec = e.next()) {
            items.push_back(std::move(*rec));
        }

        if (e.state() == EnumerationState::Exhausted) {
            info("recovered all minimum-cost items");
        }
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        info(std::format("obtained {} items in {:.1f} seconds", items.size(), elapsed.count()));
        return items;
    }

} // namespace flipset
