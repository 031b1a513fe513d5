/*
================================================================================
EXAMPLE 01: CREDIT RECOURSE - Cheapest Ways to Get a Loan Approved
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Mixed-Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A linear credit model rejects an applicant. We look for the cheapest changes
the applicant can make to their own features (income, savings, debt,
open credit lines) so that the model approves them. Age is immutable.

The cost of moving a feature is the shift of its percentile in the
population: raising income from the 30th to the 60th percentile costs 0.3.
With the max cost type the hardest single change is minimized.

MATHEMATICAL MODEL
------------------
Sets:
    J              Movable features
    K_j            Points of feature j's cost curve, k = 0 is "no change"

Parameters:
    w[j]           Classifier coefficient
    d[j][k]        Action of curve point k
    cost[j][k]     Percentile-shift cost of curve point k

Variables:
    a[j]           Action on feature j
    u[j][k]        1 if curve point k is selected
    c[j]           Cost of feature j
    max_cost       Largest c[j]

Objective:
    min  max_cost + epsilon * sum_j c[j]

Constraints:
    Flip:        sum_j w[j] a[j] >= -score(x)
    Action:      a[j] = sum_k d[j][k] u[j][k],  sum_k u[j][k] = 1
    Cost:        c[j] = sum_k cost[j][k] u[j][k],  max_cost >= c[j]
    Items:       |{j : u[j][0] = 0}| <= max_items

FEATURES DEMONSTRATED
---------------------
- GridActionSet                   Feasible values and percentiles per feature
- RecourseBuilder::configure()    Explicit MIP build
- solveOnce()                     Single minimum-cost record
- setItemLimits()                 In-place change of the cardinality limits
- populate(DistinctSubsets)       Several records with different feature sets
- Advisories                      Validation attached to records

================================================================================
*/

#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <flipset/flipset.h>
#include <flipset/gurobi_backend.h>

namespace {

    void printRecord(const flipset::RecourseBuilder& builder,
                     const flipset::SolutionRecord& rec)
    {
        if (!rec.feasible) {
            std::cout << "  no recourse (" << rec.status << ")\n";
            return;
        }

        const auto names = builder.variableNames();
        for (std::size_t j : rec.changedFeatures()) {
            std::cout << "  " << std::left << std::setw(14) << names[j] << std::right
                      << std::setw(10) << std::showpos << rec.actions[j] << std::noshowpos
                      << "   cost " << std::fixed << std::setprecision(3) << rec.costs[j] << "\n";
            std::cout.unsetf(std::ios::fixed);
        }
        std::cout << "  total " << std::fixed << std::setprecision(3) << rec.cost
                  << " (" << rec.status << ", " << std::setprecision(2) << rec.runtime << " s)\n";
        std::cout.unsetf(std::ios::fixed);

        for (const auto& a : rec.advisories) {
            std::cout << "  advisory: " << a.message << "\n";
        }
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Credit Recourse\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        flipset::GridActionSet actions;
        actions.addImmutable("age");
        actions.addFeature("income_k",
            {20, 30, 40, 50, 60, 70, 80},
            {0.10, 0.25, 0.40, 0.55, 0.70, 0.85, 0.95});
        actions.addFeature("savings_k",
            {0, 5, 10, 20, 40},
            {0.20, 0.45, 0.65, 0.85, 0.97});
        actions.addFeature("debt_k",
            {0, 5, 10, 15, 20, 30},
            {0.15, 0.35, 0.55, 0.70, 0.85, 0.98});
        actions.addFeature("credit_lines",
            {0, 1, 2, 3, 4, 5, 6},
            {0.05, 0.20, 0.40, 0.60, 0.75, 0.90, 0.97});

        // approve when score >= 0
        flipset::LinearClassifier clf(
            {0.02, 0.05, 0.08, -0.10, -0.30}, -2.0);

        std::vector<double> applicant = {35, 30, 5, 20, 4};

        // ====================================================================
        // PRINT PROBLEM DESCRIPTION
        // ====================================================================
        std::cout << "APPLICANT\n";
        std::cout << "---------\n";
        const auto names = actions.names();
        for (std::size_t j = 0; j < names.size(); ++j) {
            std::cout << "  " << std::left << std::setw(14) << names[j] << std::right
                      << std::setw(8) << applicant[j] << "  w = " << std::setw(6) << clf.coefficient(j)
                      << (actions.actionable(j) ? "" : "  (immutable)") << "\n";
        }
        std::cout << "  score = " << clf.score(applicant)
                  << ", prediction = " << clf.prediction(applicant) << "\n\n";

        // ====================================================================
        // BUILD AND SOLVE
        // ====================================================================
        flipset::MipOptions options;
        options.costType = flipset::CostType::Max;
        options.printFlag = true;
        options.log = &std::cout;

        flipset::RecourseBuilder builder(flipset::gurobiFactory());
        builder.configure(actions, clf, applicant, options);

        std::cout << "\nCHEAPEST RECOURSE\n";
        std::cout << "-----------------\n";
        printRecord(builder, builder.solveOnce());

        // ====================================================================
        // ONE CHANGE ONLY
        // ====================================================================
        std::cout << "\nCHEAPEST SINGLE-FEATURE RECOURSE\n";
        std::cout << "--------------------------------\n";
        builder.setItemLimits(1, 1);
        printRecord(builder, builder.solveOnce());

        // ====================================================================
        // ALTERNATIVES
        // ====================================================================
        std::cout << "\nALTERNATIVE RECOURSE SETS\n";
        std::cout << "-------------------------\n";
        builder.setItemLimits(0, builder.nActionable());

        flipset::SolveLimits limits;
        limits.timeLimit = 30.0;
        auto items = builder.populate(5, flipset::EnumerationPolicy::DistinctSubsets, limits);

        for (std::size_t i = 0; i < items.size(); ++i) {
            std::cout << "#" << i + 1 << "\n";
            printRecord(builder, items[i]);
        }

    } catch (GRBException& e) {
        std::cerr << "Gurobi error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
