/*
===============================================================================
TEST GUROBI BACKEND — End-to-end recourse solves with Gurobi
===============================================================================

OVERVIEW
--------
Builds and solves real recourse MIPs through GurobiBackend. Every optimum
below is unique, so actions and costs are asserted directly.

TEST ORGANIZATION
-----------------
• Section A: GurobiBackend primitives
• Section B: Single-feature recourse
• Section C: Two-feature recourse and cost types
• Section D: Item limits
• Section E: Enumeration

FIXTURES
--------
Single feature (score = x, x = -1):
    income  grid {-1, 0, 1, 2}  percentiles {.1, .5, .6, .9}
            curve actions {0, 1, 2, 3}, costs {0, .4, .5, .8}

Two features (score = income + hours - 1, x = (-1, 0), score(x) = -2):
    income  grid {-1, 0, 1, 2}  percentiles {.1, .5, .65, .9}
            costs {0, .4, .55, .8}
    hours   grid {0, 1, 2, 3}   percentiles {.2, .3, .8, .95}
            costs {0, .1, .6, .75}

    max cost optimum      income +1, hours +1   cost .4
    total cost optimum    income +1, hours +1   cost .5
    single item optimum   income +2             cost .55

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• gurobi_backend.h - System under test
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <flipset/flipset.h>
#include <flipset/gurobi_backend.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <vector>

using namespace flipset;
using Catch::Approx;

namespace {

    MipOptions quiet(CostType type = CostType::Max) {
        MipOptions opts;
        opts.costType = type;
        opts.log = nullptr;
        return opts;
    }

    GridActionSet singleFeature() {
        GridActionSet a;
        a.addFeature("income", {-1.0, 0.0, 1.0, 2.0}, {0.1, 0.5, 0.6, 0.9});
        return a;
    }

    GridActionSet twoFeatures() {
        GridActionSet a;
        a.addFeature("income", {-1.0, 0.0, 1.0, 2.0}, {0.1, 0.5, 0.65, 0.9});
        a.addFeature("hours", {0.0, 1.0, 2.0, 3.0}, {0.2, 0.3, 0.8, 0.95});
        return a;
    }

    LinearClassifier twoFeatureClassifier() { return LinearClassifier({1.0, 1.0}, -1.0); }

    const std::vector<double> kTwoFeaturePoint{-1.0, 0.0};

    double scoreAfter(const LinearClassifier& clf, const std::vector<double>& x, const SolutionRecord& rec) {
        std::vector<double> moved(x.size());
        for (std::size_t j = 0; j < x.size(); ++j) moved[j] = x[j] + rec.actions[j];
        return clf.score(moved);
    }

} // namespace

// ============================================================================
// SECTION A: GurobiBackend PRIMITIVES
// ============================================================================

TEST_CASE("A1: GurobiPrimitives::StatusAndCapabilities", "[gurobi][backend]")
{
    REQUIRE(statusString(GRB_OPTIMAL) == "OPTIMAL");
    REQUIRE(statusString(GRB_INFEASIBLE) == "INFEASIBLE");
    REQUIRE(statusString(GRB_TIME_LIMIT) == "TIME_LIMIT");
    REQUIRE(statusString(-42) == "UNKNOWN(-42)");

    GurobiBackend backend;
    REQUIRE(backend.name() == "gurobi");
    REQUIRE(backend.capabilities() == Capabilities::full());
}

/**
 * @test GurobiPrimitives::BuildMutateSolve
 * @brief Constraints, bounds and rhs can be changed between solves
 *
 * @given min x + y  s.t.  x + y >= 1, x, y binary
 */
TEST_CASE("A2: GurobiPrimitives::BuildMutateSolve", "[gurobi][backend]")
{
    GurobiBackend b;
    VarId x = b.addBinary("x", 1.0);
    VarId y = b.addBinary("y", 2.0);
    ConId cover = b.addConstraint("cover", {{x, 1.0}, {y, 1.0}}, Sense::GreaterEqual, 1.0);

    REQUIRE(b.numVariables() == 2);
    REQUIRE(b.numConstraints() == 1);

    SolveReport r = b.solve();
    REQUIRE(r.primalFeasible);
    REQUIRE(r.status == "OPTIMAL");
    REQUIRE(r.objective == Approx(1.0));
    REQUIRE(b.value(x) == Approx(1.0));

    b.setLowerBound(y, 1.0);
    REQUIRE(b.lowerBound(y) == 1.0);
    r = b.solve();
    REQUIRE(r.objective == Approx(2.0));
    REQUIRE(b.value(x) == Approx(0.0).margin(1e-9));

    b.setRhs(cover, 2.0);
    REQUIRE(b.rhs(cover) == 2.0);
    r = b.solve();
    REQUIRE(r.objective == Approx(3.0));

    b.addConstraint("cut", {{x, 1.0}}, Sense::LessEqual, 0.0);
    r = b.solve();
    REQUIRE_FALSE(r.primalFeasible);
    REQUIRE(std::isinf(r.objective));

    REQUIRE_THROWS_AS(b.value(17), std::out_of_range);
}

TEST_CASE("A3: GurobiPrimitives::ExternalEnvironment", "[gurobi][backend][environment]")
{
    GRBEnv env(true);
    env.set(GRB_IntParam_OutputFlag, 0);
    env.start();

    auto actions = singleFeature();
    RecourseBuilder builder(gurobiFactory(env));
    builder.configure(actions, LinearClassifier({1.0}, 0.0), {-1.0}, quiet());
    builder.rebuild();

    SolutionRecord rec = builder.solveOnce();
    REQUIRE(rec.feasible);
    REQUIRE(rec.actions[0] == Approx(1.0));
}

// ============================================================================
// SECTION B: SINGLE-FEATURE RECOURSE
// ============================================================================

/**
 * @test SingleFeature::CheapestFlip
 * @brief The smallest improving step that reaches score 0 is chosen
 *
 * @then action +1, new score 0, cost 0.4, no advisories
 */
TEST_CASE("B1: SingleFeature::CheapestFlip", "[gurobi][recourse]")
{
    auto actions = singleFeature();
    LinearClassifier clf({1.0}, 0.0);
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, clf, {-1.0}, quiet());

    REQUIRE(builder.encoding().features[0].curve.actions == std::vector<double>{0.0, 1.0, 2.0, 3.0});

    SolutionRecord rec = builder.solveOnce();

    REQUIRE(rec.feasible);
    REQUIRE(rec.status == "OPTIMAL");
    REQUIRE(rec.actions[0] == Approx(1.0));
    REQUIRE(rec.costs[0] == Approx(0.4));
    REQUIRE(rec.cost == Approx(0.4));
    REQUIRE(scoreAfter(clf, {-1.0}, rec) >= -1e-4);
    REQUIRE(rec.advisories.empty());
    REQUIRE(rec.runtime >= 0.0);
    REQUIRE(std::isnan(rec.nodesRemaining));
}

TEST_CASE("B2: SingleFeature::SolveOnceIsRepeatable", "[gurobi][recourse]")
{
    auto actions = singleFeature();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, LinearClassifier({1.0}, 0.0), {-1.0}, quiet());

    SolutionRecord first = builder.solveOnce();
    SolutionRecord second = builder.solveOnce();

    REQUIRE(first.actions == second.actions);
    REQUIRE(first.cost == Approx(second.cost));
    REQUIRE(builder.generation() == 1);
}

/**
 * @test SingleFeature::MinItemsUnsatisfiable
 * @brief min_items = 2 with a single movable feature is infeasible
 *
 * @given income movable; savings actionable but with a zero coefficient
 */
TEST_CASE("B3: SingleFeature::MinItemsUnsatisfiable", "[gurobi][recourse][items]")
{
    GridActionSet actions = singleFeature();
    actions.addFeature("savings", {0.0, 1.0}, {0.3, 0.7});

    MipOptions opts = quiet();
    opts.minItems = 2;
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, LinearClassifier({1.0, 0.0}, 0.0), {-1.0, 0.0}, opts);
    REQUIRE(builder.encoding().size() == 1);

    SolutionRecord rec = builder.solveOnce();

    REQUIRE_FALSE(rec.feasible);
    REQUIRE(std::isinf(rec.cost));
    REQUIRE(rec.actions == std::vector<double>{0.0, 0.0});
}

TEST_CASE("B4: SingleFeature::UnlimitedMutuallyExclusive", "[gurobi][enumeration]")
{
    auto actions = singleFeature();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, LinearClassifier({1.0}, 0.0), {-1.0}, quiet());

    Enumerator e = builder.enumerate(kUnlimited, EnumerationPolicy::MutuallyExclusive);
    auto first = e.next();
    REQUIRE(first.has_value());
    REQUIRE(first->actions[0] == Approx(1.0));

    REQUIRE_FALSE(e.next().has_value());
    REQUIRE(e.state() == EnumerationState::Exhausted);
    REQUIRE(e.produced() == 1);
}

// ============================================================================
// SECTION C: TWO-FEATURE RECOURSE AND COST TYPES
// ============================================================================

TEST_CASE("C1: CostTypes::MaxCost", "[gurobi][recourse][max]")
{
    auto actions = twoFeatures();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, quiet(CostType::Max));

    SolutionRecord rec = builder.solveOnce();

    REQUIRE(rec.feasible);
    REQUIRE(rec.actions[0] == Approx(1.0));
    REQUIRE(rec.actions[1] == Approx(1.0));
    REQUIRE(rec.costs[0] == Approx(0.4));
    REQUIRE(rec.costs[1] == Approx(0.1));
    REQUIRE(rec.cost == Approx(*std::max_element(rec.costs.begin(), rec.costs.end())));
    REQUIRE(rec.cost == Approx(0.4));
    REQUIRE(rec.advisories.empty());
}

TEST_CASE("C2: CostTypes::TotalCost", "[gurobi][recourse][total]")
{
    auto actions = twoFeatures();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, quiet(CostType::Total));

    SolutionRecord rec = builder.solveOnce();

    REQUIRE(rec.feasible);
    REQUIRE(rec.actions[0] == Approx(1.0));
    REQUIRE(rec.actions[1] == Approx(1.0));
    REQUIRE(rec.cost == Approx(0.5));
    REQUIRE(rec.advisories.empty());
}

/**
 * @test CostTypes::LocalCost
 * @brief Log-odds costs ln((1 - p0) / (1 - p)) summed over features
 */
TEST_CASE("C3: CostTypes::LocalCost", "[gurobi][recourse][local]")
{
    auto actions = twoFeatures();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, quiet(CostType::Local));

    SolutionRecord rec = builder.solveOnce();

    REQUIRE(rec.feasible);
    REQUIRE(rec.actions[0] == Approx(1.0));
    REQUIRE(rec.actions[1] == Approx(1.0));
    REQUIRE(rec.costs[0] == Approx(std::log(0.9 / 0.5)));
    REQUIRE(rec.costs[1] == Approx(std::log(0.8 / 0.7)));
    REQUIRE(rec.cost == Approx(std::log(0.9 / 0.5) + std::log(0.8 / 0.7)));
}

// ============================================================================
// SECTION D: ITEM LIMITS
// ============================================================================

TEST_CASE("D1: ItemLimits::MaxItemsAtConfigure", "[gurobi][items]")
{
    auto actions = twoFeatures();
    MipOptions opts = quiet();
    opts.maxItems = 1;
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, opts);

    SolutionRecord rec = builder.solveOnce();

    REQUIRE(rec.feasible);
    REQUIRE(rec.itemCount() == 1);
    REQUIRE(rec.actions[0] == Approx(2.0));
    REQUIRE(rec.cost == Approx(0.55));
}

/**
 * @test ItemLimits::SetInPlaceBetweenSolves
 * @brief setItemLimits changes the next solve without a rebuild
 */
TEST_CASE("D2: ItemLimits::SetInPlaceBetweenSolves", "[gurobi][items]")
{
    auto actions = twoFeatures();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, quiet());

    REQUIRE(builder.solveOnce().itemCount() == 2);

    builder.setItemLimits(1, 1);
    SolutionRecord single = builder.solveOnce();
    REQUIRE(single.itemCount() == 1);
    REQUIRE(single.cost == Approx(0.55));
    REQUIRE(builder.generation() == 1);

    builder.setItemLimits(2, 2);
    SolutionRecord both = builder.solveOnce();
    REQUIRE(both.itemCount() == 2);
    REQUIRE(both.cost == Approx(0.4));
}

// ============================================================================
// SECTION E: ENUMERATION
// ============================================================================

/**
 * @test Enumeration::DistinctSubsets
 * @brief Every changed-feature set appears once, costs never decrease
 *
 * @then {income, hours} .4, {income} .55, {hours} .6, then exhausted
 */
TEST_CASE("E1: Enumeration::DistinctSubsets", "[gurobi][enumeration]")
{
    auto actions = twoFeatures();
    auto clf = twoFeatureClassifier();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, clf, kTwoFeaturePoint, quiet());

    auto items = builder.populate(kUnlimited, EnumerationPolicy::DistinctSubsets);

    REQUIRE(items.size() == 3);
    REQUIRE(items[0].cost == Approx(0.4));
    REQUIRE(items[1].cost == Approx(0.55));
    REQUIRE(items[2].cost == Approx(0.6));

    std::set<std::vector<std::size_t>> subsets;
    for (const auto& rec : items) {
        REQUIRE(rec.feasible);
        REQUIRE(rec.advisories.empty());
        REQUIRE(scoreAfter(clf, kTwoFeaturePoint, rec) >= -1e-4);
        subsets.insert(rec.changedFeatures());
    }
    REQUIRE(subsets.size() == items.size());
}

TEST_CASE("E2: Enumeration::MutuallyExclusive", "[gurobi][enumeration]")
{
    auto actions = twoFeatures();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, quiet());

    auto items = builder.populate(5, EnumerationPolicy::MutuallyExclusive);

    // the first record uses both features, leaving nothing to change
    REQUIRE(items.size() == 1);
    REQUIRE(items[0].changedFeatures() == std::vector<std::size_t>{0, 1});
}

TEST_CASE("E3: Enumeration::RebuildRestoresFullModel", "[gurobi][enumeration][lifecycle]")
{
    auto actions = twoFeatures();
    RecourseBuilder builder(gurobiFactory());
    builder.configure(actions, twoFeatureClassifier(), kTwoFeaturePoint, quiet());

    (void)builder.populate(2, EnumerationPolicy::DistinctSubsets);
    REQUIRE(builder.solveOnce().cost == Approx(0.55));

    builder.rebuild();
    REQUIRE(builder.solveOnce().cost == Approx(0.4));
}
