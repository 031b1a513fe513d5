/*
===============================================================================
TEST ENUMERATOR — Tests for enumerator.h
===============================================================================

OVERVIEW
--------
Validates the enumeration state machine, the exclusions added between
records, and RecourseBuilder::enumerate / populate, using the scripted
backend so records are fully controlled.

TEST ORGANIZATION
-----------------
• Section A: State machine
• Section B: Exclusion trail
• Section C: Error conditions
• Section D: populate and logging

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <flipset/enumerator.h>

#include "scripted_backend.h"

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace flipset;
using namespace flipset::testing;

namespace {

    GridActionSet fixtureActions() {
        GridActionSet a;
        a.addFeature("income", {-1.0, 0.0, 1.0, 2.0}, {0.1, 0.5, 0.6, 0.9});
        a.addFeature("debt", {0.0, 1.0, 2.0}, {0.2, 0.45, 0.7});
        a.addImmutable("age");
        return a;
    }

    /// @brief Builder with the scripted backend; score(x) = -5
    struct Fixture {
        std::shared_ptr<Script> script = std::make_shared<Script>();
        GridActionSet actions = fixtureActions();
        std::ostringstream log;
        RecourseBuilder builder{scriptedFactory(script)};

        explicit Fixture(bool printFlag = false) {
            MipOptions opts;
            opts.log = &log;
            opts.printFlag = printFlag;
            builder.configure(actions, LinearClassifier({1.0, -2.0, 0.1}, -1.0), {-1.0, 2.0, 10.0}, opts);
        }

        void queue(const std::map<std::size_t, std::size_t>& picks) {
            script->solves.push_back(pickPoints(builder.encoding(), picks));
        }
    };

} // namespace

// ============================================================================
// SECTION A: STATE MACHINE
// ============================================================================

/**
 * @test EnumeratorStates::FinishedAfterTotalItems
 * @brief Ready -> Recorded -> Finished; next() is inert once done
 */
TEST_CASE("A1: EnumeratorStates::FinishedAfterTotalItems", "[enumerator][state]")
{
    Fixture f;
    f.queue({{0, 3}, {1, 1}});
    f.queue({{1, 2}});

    Enumerator e = f.builder.enumerate(2);
    REQUIRE(e.state() == EnumerationState::Ready);
    REQUIRE(e.totalItems() == 2);
    REQUIRE(e.policy() == EnumerationPolicy::DistinctSubsets);
    REQUIRE_FALSE(e.done());

    auto first = e.next();
    REQUIRE(first.has_value());
    REQUIRE(first->feasible);
    REQUIRE(e.state() == EnumerationState::Recorded);
    REQUIRE(e.produced() == 1);

    auto second = e.next();
    REQUIRE(second.has_value());
    REQUIRE(second->actions == std::vector<double>{0.0, -2.0, 0.0});
    REQUIRE(e.state() == EnumerationState::Finished);
    REQUIRE(e.done());

    const auto solves = f.script->solveCount;
    REQUIRE_FALSE(e.next().has_value());
    REQUIRE(f.script->solveCount == solves);
    REQUIRE(kEnumerationStateNames.name(e.state()) == "finished");
}

TEST_CASE("A2: EnumeratorStates::ExhaustedOnInfeasible", "[enumerator][state]")
{
    Fixture f;
    f.queue({{0, 3}, {1, 1}});

    Enumerator e = f.builder.enumerate(5);
    REQUIRE(e.next().has_value());
    REQUIRE_FALSE(e.next().has_value());

    REQUIRE(e.state() == EnumerationState::Exhausted);
    REQUIRE(e.produced() == 1);
    REQUIRE(e.done());
}

TEST_CASE("A3: EnumeratorStates::InfeasibleFirstSolve", "[enumerator][state][edge]")
{
    Fixture f;
    f.script->solves.push_back(infeasible());

    Enumerator e = f.builder.enumerate(3);
    REQUIRE_FALSE(e.next().has_value());
    REQUIRE(e.state() == EnumerationState::Exhausted);
    REQUIRE(e.produced() == 0);
    REQUIRE(e.trail().empty());
}

// ============================================================================
// SECTION B: EXCLUSION TRAIL
// ============================================================================

/**
 * @test ExclusionTrail::NoCutAfterLastRecord
 * @brief One exclusion per record except the last requested one
 */
TEST_CASE("B1: ExclusionTrail::NoCutAfterLastRecord", "[enumerator][exclusion]")
{
    Fixture f;
    f.queue({{0, 3}, {1, 1}});
    f.queue({{1, 2}});
    const auto rows = f.builder.backend().numConstraints();

    auto items = f.builder.populate(2, EnumerationPolicy::DistinctSubsets);

    REQUIRE(items.size() == 2);
    REQUIRE(f.builder.backend().numConstraints() == rows + 1);

    const auto& b = scripted(f.builder.backend());
    REQUIRE(b.findConstraint("exclude[0]") != nullptr);
    REQUIRE(b.findConstraint("exclude[1]") == nullptr);
}

TEST_CASE("B2: ExclusionTrail::DistinctSubsets", "[enumerator][exclusion]")
{
    Fixture f;
    f.queue({{0, 3}, {1, 1}});
    f.queue({{1, 2}});
    f.queue({{0, 1}, {1, 2}});

    Enumerator e = f.builder.enumerate(3, EnumerationPolicy::DistinctSubsets);
    while (e.next()) {}

    REQUIRE(e.trail().size() == 2);
    REQUIRE(e.trail()[0].changedFeatures == std::vector<std::size_t>{0, 1});
    REQUIRE(e.trail()[0].constraint.has_value());
    REQUIRE(e.trail()[1].changedFeatures == std::vector<std::size_t>{1});
    REQUIRE(f.builder.backend().numConstraints() >= 2);
}

TEST_CASE("B3: ExclusionTrail::MutuallyExclusive", "[enumerator][exclusion]")
{
    Fixture f;
    f.queue({{1, 2}});
    f.queue({{0, 3}});

    Enumerator e = f.builder.enumerate(3, EnumerationPolicy::MutuallyExclusive);
    while (e.next()) {}

    REQUIRE(e.state() == EnumerationState::Exhausted);
    REQUIRE(e.trail().size() == 2);
    REQUIRE_FALSE(e.trail()[0].constraint.has_value());

    const auto& b = scripted(f.builder.backend());
    REQUIRE(b.findVariable("u[1][0]")->lb == 1.0);
    REQUIRE(b.findVariable("u[0][0]")->lb == 1.0);
    REQUIRE(b.countConstraints("exclude[") == 0);
}

// ============================================================================
// SECTION C: ERROR CONDITIONS
// ============================================================================

TEST_CASE("C1: EnumeratorErrors::StaleAfterRebuild", "[enumerator][errors]")
{
    Fixture f;
    f.queue({{0, 3}, {1, 1}});

    Enumerator e = f.builder.enumerate(3);
    REQUIRE(e.next().has_value());

    f.builder.rebuild();
    REQUIRE_THROWS_AS(e.next(), ConfigurationError);
}

TEST_CASE("C2: EnumeratorErrors::Arguments", "[enumerator][errors]")
{
    Fixture f;

    REQUIRE_THROWS_AS(f.builder.enumerate(0), ConfigurationError);
    REQUIRE_THROWS_AS(f.builder.enumerate(2, EnumerationPolicy::DistinctSubsets, SolveLimits{-1.0, kNoLimit, false}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(f.builder.populate(0), ConfigurationError);
    REQUIRE(f.script->solveCount == 0);

    auto script = std::make_shared<Script>();
    RecourseBuilder unconfigured(scriptedFactory(script));
    REQUIRE_THROWS_AS(unconfigured.enumerate(1), ConfigurationError);
}

/**
 * @test EnumeratorErrors::CapabilityChecked
 * @brief Enumerating more than one record needs the policy's capability;
 *        a single record needs none
 */
TEST_CASE("C3: EnumeratorErrors::CapabilityChecked", "[enumerator][errors][capabilities]")
{
    auto script = std::make_shared<Script>();
    script->capabilities = {Capability::RhsMutation};
    RecourseBuilder builder(scriptedFactory(script));
    auto actions = fixtureActions();
    MipOptions opts;
    opts.log = nullptr;
    builder.configure(actions, LinearClassifier({1.0, -2.0, 0.1}, -1.0), {-1.0, 2.0, 10.0}, opts);

    REQUIRE_THROWS_AS(builder.enumerate(2, EnumerationPolicy::DistinctSubsets), NotSupported);
    REQUIRE_THROWS_AS(builder.enumerate(2, EnumerationPolicy::MutuallyExclusive), NotSupported);

    script->solves.push_back(pickPoints(builder.encoding(), {{0, 3}, {1, 1}}));
    auto items = builder.populate(1);
    REQUIRE(items.size() == 1);
    REQUIRE(items[0].feasible);
}

// ============================================================================
// SECTION D: POPULATE AND LOGGING
// ============================================================================

/**
 * @test Populate::UnlimitedDrainsUntilInfeasible
 * @brief kUnlimited warns once and stops at the first infeasible solve
 */
TEST_CASE("D1: Populate::UnlimitedDrainsUntilInfeasible", "[enumerator][populate]")
{
    Fixture f;
    f.queue({{0, 3}, {1, 1}});
    f.queue({{1, 2}});
    f.queue({{0, 1}, {1, 2}});

    auto items = f.builder.populate(kUnlimited, EnumerationPolicy::DistinctSubsets);

    REQUIRE(items.size() == 3);
    REQUIRE(f.script->solveCount == 4);
    REQUIRE(f.log.str().find("[flipset] warning: enumerating with policy 'distinct_subsets'")
            != std::string::npos);
}

TEST_CASE("D2: Populate::ProgressMessages", "[enumerator][populate][logging]")
{
    SECTION("Exhausted")
    {
        Fixture f(true);
        f.queue({{0, 3}, {1, 1}});

        auto items = f.builder.populate(4);
        REQUIRE(items.size() == 1);
        REQUIRE(f.log.str().find("[flipset] recovered all minimum-cost items") != std::string::npos);
        REQUIRE(f.log.str().find("[flipset] obtained 1 items in") != std::string::npos);
    }

    SECTION("Finished")
    {
        Fixture f(true);
        f.queue({{0, 3}, {1, 1}});
        f.queue({{1, 2}});

        auto items = f.builder.populate(2);
        REQUIRE(items.size() == 2);
        REQUIRE(f.log.str().find("recovered all") == std::string::npos);
        REQUIRE(f.log.str().find("[flipset] obtained 2 items in") != std::string::npos);
    }

    SECTION("Silent without printFlag")
    {
        Fixture f;
        f.queue({{0, 3}, {1, 1}});
        (void)f.builder.populate(1);
        REQUIRE(f.log.str().empty());
    }
}
