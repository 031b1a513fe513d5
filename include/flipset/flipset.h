#pragma once
/*
===============================================================================
FLIPSET — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for the solver-independent part of flipset: building,
solving and enumerating minimum-cost recourse actions for a linear
classifier. Solver backends are included separately, since each one pulls in
its solver's headers:

    #include <flipset/flipset.h>
    #include <flipset/gurobi_backend.h>    // links flipset::gurobi
    #include <flipset/highs_backend.h>     // links flipset::highs

WHAT'S INCLUDED
---------------
• errors.h           : ConfigurationError, CurveValidationError, NotSupported
• enum_utils.h       : DECLARE_ENUM_WITH_COUNT, EnumSet, EnumNames
• naming.h           : Debug/release variable naming utilities
• options.h          : CostType, EnumerationPolicy, MipOptions, SolveLimits
• classifier.h       : LinearClassifier
• action_set.h       : ActionSet, GridActionSet, FeasibleGrid
• cost_curve.h       : Feasible (action, cost) curves
• encoding.h         : Index tables and the max-cost tie-break weight
• backend.h          : SolverBackend interface and capabilities
• solution.h         : SolutionRecord, extraction, advisories
• recourse_builder.h : The recourse MIP
• enumerator.h       : Lazy enumeration and populate()

QUICK START
-----------
    flipset::GridActionSet actions;
    actions.addFeature("income", {20, 30, 40, 50}, {0.2, 0.45, 0.7, 0.9});
    actions.addImmutable("age");

    flipset::LinearClassifier clf({0.1, -0.02}, -3.5);

    flipset::RecourseBuilder builder(flipset::gurobiFactory());
    builder.configure(actions, clf, {25.0, 40.0});

    for (const auto& rec : builder.populate(3)) {
        std::cout << std::format("cost {:.3f}\n", rec.cost);
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with C++ API, and/or HiGHS 1.5+

NAMESPACE
---------
Everything is in `flipset::`. DECLARE_ENUM_WITH_COUNT is a macro.

CONFIGURATION
-------------
• Debug builds (FLIPSET_DEBUG or _DEBUG defined): solver variables and
  constraints carry readable names such as u[3][1] or set_a[3]
• Release builds: no symbolic names are passed to the solver

===============================================================================
*/

#include "errors.h"
#include "enum_utils.h"
#include "naming.h"
#include "options.h"
#include "classifier.h"
#include "action_set.h"
#include "cost_curve.h"
#include "encoding.h"
#include "backend.h"
#include "solution.h"
#include "recourse_builder.h"
#include "enumerator.h"
