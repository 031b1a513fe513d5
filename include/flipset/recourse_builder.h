#pragma once
/*
===============================================================================
RECOURSE BUILDER — Minimum-cost recourse MIP for a linear classifier
===============================================================================

Overview
--------
RecourseBuilder owns the MIP that finds the cheapest change a to the
actionable features of x such that the classifier's prediction flips:

    minimize    Cost(a)
    subject to  sum_j w[j] a[j]            >= -score(x)           score
                a[j] = sum_k u[j][k] d[j][k]                     set_a[j]
                sum_k u[j][k]               = 1                  pick_a[j]
                sum_j u[j][0]              >= n - max_items      max_items
                sum_j u[j][0]              <= n - max(min_items, 1)  min_items
                u[j][k] in {0, 1}

where (d[j][k], cost[j][k]) is feature j's cost curve (cost_curve.h) and
u[j][0] is its no-op selector. Item limits are expressed through the no-op
selectors, so no counting variables are needed.

Cost(a) depends on MipOptions::costType:

    Total, Local   sum_jk cost[j][k] u[j][k]
    Max            max_cost + epsilon * sum_j c[j]
                   c[j] = sum_k cost[j][k] u[j][k]               def_cost[j]
                   max_cost >= c[j]                              set_max_cost[j]

epsilon is derived in encoding.h so the total-cost term only breaks ties.

Lifecycle
---------
It follows the template-method layout of a model builder:

    configure(actions, classifier, x, options)   validate + rebuild()
    rebuild() {
        backend = factory();
        addParameters();
        addVariables();
        addConstraints();
        addObjective();
    }
    solveOnce(limits)                            one solve, one record

Rebuilding is always explicit. Changing the input point means calling
configure() again; nothing rebuilds behind the caller's back. Every rebuild
increments generation(), which invalidates running enumerations.

configure() assembles the encoding and creates the backend before it touches
any member, so a failed configure() leaves the previous MIP and its inputs in
place.

setItemLimits() changes the rhs of the two item-limit rows in place when the
backend supports RhsMutation.

Ownership
---------
The builder owns its backend (std::unique_ptr) and therefore the MIP. The
ActionSet is NOT owned: it must outlive the builder or the next configure().
A builder is single-threaded; use one builder per thread.

Logging
-------
Progress lines go to MipOptions::log when MipOptions::printFlag is set.
Warnings (advisories, unlimited enumeration) go to MipOptions::log whenever
it is non-null.

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "action_set.h"
#include "backend.h"
#include "classifier.h"
#include "encoding.h"
#include "errors.h"
#include "naming.h"
#include "options.h"
#include "solution.h"

namespace flipset {

    class Enumerator;

    /// @brief One exclusion added to the MIP after an enumerated solution
    struct Exclusion {
        EnumerationPolicy policy = EnumerationPolicy::DistinctSubsets;
        std::vector<std::size_t> changedFeatures;  ///< feature indices j
        std::optional<ConId> constraint;           ///< DistinctSubsets only
    };

    class RecourseBuilder {
    private:
        BackendFactory factory_;
        std::unique_ptr<SolverBackend> backend_;

        // Configuration (set by configure)
        const ActionSet* actions_ = nullptr;
        std::optional<LinearClassifier> classifier_;
        std::vector<double> x_;
        MipOptions options_;
        int minItems_ = 0;
        int maxItems_ = 0;

        // MIP layout (set by rebuild)
        EncodingTable encoding_;
        std::vector<VarId> actionVars_;
        std::vector<VarId> costVars_;
        std::vector<VarId> offSelectors_;
        std::vector<std::vector<VarId>> selectors_;
        std::optional<VarId> maxCostVar_;
        ConId scoreCon_ = 0;
        ConId maxItemsCon_ = 0;
        ConId minItemsCon_ = 0;
        std::size_t exclusionCount_ = 0;
        std::size_t generation_ = 0;

    public:
        /**
         * @brief Create an unconfigured builder
         * @param factory creates an empty backend on every rebuild
         */
        explicit RecourseBuilder(BackendFactory factory)
            : factory_(std::move(factory))
        {
            if (!factory_) {
                throw ConfigurationError("RecourseBuilder: backend factory is empty");
            }
        }

        RecourseBuilder(const RecourseBuilder&) = delete;
        RecourseBuilder& operator=(const RecourseBuilder&) = delete;
        RecourseBuilder(RecourseBuilder&&) = default;
        RecourseBuilder& operator=(RecourseBuilder&&) = default;
        virtual ~RecourseBuilder() = default;

        // ---------------------------------------------------------------------
        // Configuration
        // ---------------------------------------------------------------------

        /**
         * @brief Attach the problem data and build the MIP
         *
         * @param actions     feature descriptors and grids (not owned)
         * @param classifier  coefficients aligned with actions
         * @param x           current point
         * @param options     cost type, item limits, flags, solver settings
         *
         * @throws ConfigurationError on shape mismatches, non-finite x, or
         *         item limits outside 0 <= min <= max <= n_actionable
         * @throws CurveValidationError if a feature's curve is malformed
         */
        void configure(const ActionSet& actions,
                       LinearClassifier classifier,
                       std::vector<double> x,
                       MipOptions options = {})
        {
            if (classifier.size() != actions.size()) {
                throw ConfigurationError(std::format(
                    "RecourseBuilder::configure: classifier has {} coefficients, "
                    "action set has {} features", classifier.size(), actions.size()));
            }
            if (x.size() != actions.size()) {
                throw ConfigurationError(std::format(
                    "RecourseBuilder::configure: x has {} entries, expected {}",
                    x.size(), actions.size()));
            }

            const int n_actionable = static_cast<int>(actions.actionableIndices().size());
            const int min_items = options.minItems;
            const int max_items = options.maxItems.value_or(n_actionable);
            checkItemLimits("RecourseBuilder::configure", min_items, max_items, n_actionable);

            // nothing is assigned until the encoding and the backend exist
            EncodingTable encoding = assembleEncoding(actions, classifier, x, options.costType);
            std::unique_ptr<SolverBackend> backend = makeBackend("RecourseBuilder::configure");

            actions_ = &actions;
            classifier_.emplace(std::move(classifier));
            x_ = std::move(x);
            options_ = std::move(options);
            minItems_ = min_items;
            maxItems_ = max_items;

            install(std::move(encoding), std::move(backend));
        }

        /**
         * @brief Discard the current MIP and build it again from scratch
         *
         * @details Exclusions added by enumerations are dropped and running
         *          enumerators become stale. If the encoding or the backend
         *          cannot be created the current MIP is kept.
         * @throws ConfigurationError if configure() was never called
         */
        void rebuild() {
            requireConfigured("RecourseBuilder::rebuild");

            EncodingTable encoding = assembleEncoding(*actions_, *classifier_, x_, options_.costType);
            install(std::move(encoding), makeBackend("RecourseBuilder::rebuild"));
        }

        /**
         * @brief Change the item limits without rebuilding
         *
         * @throws ConfigurationError for limits outside 0 <= min <= max <= n_actionable
         * @throws NotSupported if the backend lacks RhsMutation
         */
        void setItemLimits(int minItems, int maxItems) {
            requireBuilt("RecourseBuilder::setItemLimits");
            checkItemLimits("RecourseBuilder::setItemLimits", minItems, maxItems, nActionable());
            requireCapability(Capability::RhsMutation, "RecourseBuilder::setItemLimits");

            const double n = static_cast<double>(encoding_.size());
            backend_->setRhs(minItemsCon_, n - static_cast<double>(std::max(minItems, 1)));
            backend_->setRhs(maxItemsCon_, n - static_cast<double>(maxItems));
            minItems_ = minItems;
            maxItems_ = maxItems;
        }

        // ---------------------------------------------------------------------
        // Solving
        // ---------------------------------------------------------------------

        /**
         * @brief Solve the MIP once under the given limits
         *
         * @return Fresh record; infeasible solves return the sentinel record.
         *         Advisories are attached when MipOptions::checkFlag is set.
         *
         * @throws ConfigurationError before configure() or on non-positive limits
         * @throws Backend errors (e.g. GRBException) unchanged
         */
        SolutionRecord solveOnce(const SolveLimits& limits = {}) {
            requireBuilt("RecourseBuilder::solveOnce");
            applyLimits(limits);

            auto start = std::chrono::steady_clock::now();
            SolveReport report = backend_->solve();
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

            RawSolution raw;
            if (report.primalFeasible) {
                raw = readSolution();
            }

            SolutionRecord rec = extractSolution(report, encoding_, nVariables(), raw);
            rec.runtime = elapsed.count();

            if (options_.checkFlag) {
                rec.advisories = validateSolution(rec, validationContext());
                for (const auto& a : rec.advisories) {
                    warn(a.message);
                }
            }
            return rec;
        }

        /**
         * @brief Start a lazy enumeration of distinct minimum-cost records
         *
         * @param totalItems  number of records to produce, or kUnlimited
         * @param policy      how found solutions are excluded
         * @param limits      limits applied to every solve
         *
         * @throws ConfigurationError if totalItems is 0 or limits are invalid
         * @throws NotSupported if the backend lacks the policy's capability
         *
         * @note Defined in enumerator.h
         */
        Enumerator enumerate(std::size_t totalItems,
                             EnumerationPolicy policy = EnumerationPolicy::DistinctSubsets,
                             const SolveLimits& limits = {});

        /**
         * @brief Drain enumerate() into a vector
         * @note Defined in enumerator.h
         */
        std::vector<SolutionRecord> populate(std::size_t totalItems = 10,
                                             EnumerationPolicy policy = EnumerationPolicy::DistinctSubsets,
                                             const SolveLimits& limits = {});

        /**
         * @brief Cut the last solved on/off pattern out of the MIP
         *
         * @details Reads the no-op selectors of the most recent solve.
         *          MutuallyExclusive fixes u[j][0] >= 1 for every changed
         *          feature; DistinctSubsets adds
         *
         *              sum_{j unchanged} u[j][0] - sum_{j changed} u[j][0]
         *                  <= n - 1 - |changed|
         *
         * @throws NotSupported if the backend lacks the policy's capability
         */
        Exclusion excludeLastSolution(EnumerationPolicy policy) {
            requireBuilt("RecourseBuilder::excludeLastSolution");
            requireCapability(requiredCapability(policy), "RecourseBuilder::excludeLastSolution");

            const std::vector<double> off = backend_->values(offSelectors_);

            Exclusion ex;
            ex.policy = policy;
            std::vector<bool> is_changed(off.size());
            for (std::size_t i = 0; i < off.size(); ++i) {
                is_changed[i] = std::abs(off[i]) <= 0.5;
                if (is_changed[i]) ex.changedFeatures.push_back(encoding_.featureIndices[i]);
            }

            if (policy == EnumerationPolicy::MutuallyExclusive) {
                for (std::size_t i = 0; i < off.size(); ++i) {
                    if (is_changed[i]) backend_->setLowerBound(offSelectors_[i], 1.0);
                }
                return ex;
            }

            LinearTerms terms;
            terms.reserve(off.size());
            for (std::size_t i = 0; i < off.size(); ++i) {
                terms.push_back({offSelectors_[i], is_changed[i] ? -1.0 : 1.0});
            }
            const double rhs = static_cast<double>(off.size()) - 1.0
                             - static_cast<double>(ex.changedFeatures.size());
            ex.constraint = backend_->addConstraint(
                force_name::math("exclude", exclusionCount_), terms, Sense::LessEqual, rhs);
            ++exclusionCount_;
            return ex;
        }

        /// @brief Capability an enumeration policy needs from the backend
        static Capability requiredCapability(EnumerationPolicy policy) noexcept {
            return policy == EnumerationPolicy::MutuallyExclusive
                ? Capability::BoundMutation
                : Capability::IncrementalConstraints;
        }

        // ---------------------------------------------------------------------
        // Accessors
        // ---------------------------------------------------------------------

        [[nodiscard]] bool isConfigured() const noexcept { return actions_ != nullptr; }

        [[nodiscard]] bool isBuilt() const noexcept { return backend_ != nullptr; }

        /// @brief Incremented on every rebuild
        [[nodiscard]] std::size_t generation() const noexcept { return generation_; }

        [[nodiscard]] const SolverBackend& backend() const {
            requireBuilt("RecourseBuilder::backend");
            return *backend_;
        }

        [[nodiscard]] bool supports(Capability c) const {
            return isBuilt() && backend_->supports(c);
        }

        [[nodiscard]] const ActionSet& actionSet() const {
            requireConfigured("RecourseBuilder::actionSet");
            return *actions_;
        }

        [[nodiscard]] const LinearClassifier& classifier() const {
            requireConfigured("RecourseBuilder::classifier");
            return *classifier_;
        }

        [[nodiscard]] const std::vector<double>& x() const noexcept { return x_; }

        [[nodiscard]] const MipOptions& options() const noexcept { return options_; }

        [[nodiscard]] CostType costType() const noexcept { return options_.costType; }

        [[nodiscard]] const EncodingTable& encoding() const noexcept { return encoding_; }

        [[nodiscard]] int minItems() const noexcept { return minItems_; }

        [[nodiscard]] int maxItems() const noexcept { return maxItems_; }

        /// @brief Number of features (actionable or not)
        [[nodiscard]] std::size_t nVariables() const noexcept {
            return actions_ ? actions_->size() : 0;
        }

        [[nodiscard]] std::vector<std::string> variableNames() const {
            return actions_ ? actions_->names() : std::vector<std::string>{};
        }

        [[nodiscard]] std::vector<std::size_t> actionableIndices() const {
            return actions_ ? actions_->actionableIndices() : std::vector<std::size_t>{};
        }

        [[nodiscard]] int nActionable() const {
            return static_cast<int>(actionableIndices().size());
        }

        /// @brief score(x) of the configured point
        [[nodiscard]] double score() const { return classifier().score(x_); }

        [[nodiscard]] int prediction() const { return classifier().prediction(x_); }

        // ---------------------------------------------------------------------
        // Logging
        // ---------------------------------------------------------------------

        /// @brief Progress message; written only when printFlag is set
        void info(std::string_view message) const {
            if (options_.printFlag && options_.log) {
                *options_.log << "[flipset] " << message << '\n';
            }
        }

        /// @brief Warning; written whenever a log sink is set
        void warn(std::string_view message) const {
            if (options_.log) {
                *options_.log << "[flipset] warning: " << message << '\n';
            }
        }

    protected:

        // ---------------------------------------------------------------------
        // Building
        // ---------------------------------------------------------------------

        std::unique_ptr<SolverBackend> makeBackend(const char* where) const {
            std::unique_ptr<SolverBackend> backend = factory_();
            if (!backend) {
                throw ConfigurationError(std::format("{}: backend factory returned null", where));
            }
            return backend;
        }

        /// Swap in a fresh backend and write the MIP into it. A failure while
        /// writing leaves the builder unbuilt rather than half-built.
        void install(EncodingTable encoding, std::unique_ptr<SolverBackend> backend) {
            backend_ = std::move(backend);
            encoding_ = std::move(encoding);
            resetLayout();
            ++generation_;

            try {
                addParameters();
                addVariables();
                addConstraints();
                addObjective();
            } catch (...) {
                backend_.reset();
                throw;
            }

            info(std::format("built recourse MIP on {}: {} movable of {} features, "
                             "{} variables, {} constraints, cost type '{}'",
                             backend_->name(), encoding_.size(), nVariables(),
                             backend_->numVariables(), backend_->numConstraints(),
                             toString(options_.costType)));
        }

        // ---------------------------------------------------------------------
        // Template-method hooks (called by rebuild in this order)
        // ---------------------------------------------------------------------

        /// @brief Apply SolverParameters to the fresh backend
        virtual void addParameters() {
            backend_->applyParameters(options_.solver);
        }

        /// @brief a[j], u[j][k], and for Max also c[j] and max_cost
        virtual void addVariables() {
            const std::size_t n = encoding_.size();
            actionVars_.reserve(n);
            offSelectors_.reserve(n);
            selectors_.reserve(n);

            for (std::size_t i = 0; i < n; ++i) {
                const auto& fe = encoding_.features[i];
                actionVars_.push_back(backend_->addContinuous(
                    fe.actionVarName, encoding_.actionLB[i], encoding_.actionUB[i]));

                std::vector<VarId> u;
                u.reserve(fe.selectorNames.size());
                for (const auto& name : fe.selectorNames) {
                    u.push_back(backend_->addBinary(name));
                }
                offSelectors_.push_back(u.front());
                selectors_.push_back(std::move(u));
            }

            if (options_.costType == CostType::Max) {
                maxCostVar_ = backend_->addContinuous("max_cost", 0.0, kNoLimit);
                costVars_.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    costVars_.push_back(backend_->addContinuous(
                        encoding_.costVarNames[i], 0.0, kNoLimit));
                }
            }
        }

        /// @brief score, set_a, pick_a, item limits, and the Max cost rows
        virtual void addConstraints() {
            const std::size_t n = encoding_.size();

            LinearTerms score_terms;
            for (std::size_t i = 0; i < n; ++i) {
                score_terms.push_back({actionVars_[i], encoding_.coefficients[i]});
            }
            scoreCon_ = backend_->addConstraint("score", score_terms, Sense::GreaterEqual, -score());

            const bool use_sos = backend_->supports(Capability::SpecialOrderedSets);
            for (std::size_t i = 0; i < n; ++i) {
                const auto& fe = encoding_.features[i];
                const std::size_t j = fe.curve.featureIndex;

                LinearTerms set_a{{actionVars_[i], -1.0}};
                LinearTerms pick_a;
                for (std::size_t k = 0; k < fe.curve.size(); ++k) {
                    set_a.push_back({selectors_[i][k], fe.curve.actions[k]});
                    pick_a.push_back({selectors_[i][k], 1.0});
                }
                backend_->addConstraint(force_name::math("set_a", j), set_a, Sense::Equal, 0.0);
                backend_->addConstraint(force_name::math("pick_a", j), pick_a, Sense::Equal, 1.0);

                if (use_sos) {
                    backend_->addSos1(force_name::math("sos_u", j), selectors_[i], fe.curve.actions);
                }
            }

            // n - max_items <= sum_j u[j][0] <= n - max(min_items, 1)
            LinearTerms size_terms;
            for (VarId u0 : offSelectors_) size_terms.push_back({u0, 1.0});
            const double nd = static_cast<double>(n);
            maxItemsCon_ = backend_->addConstraint(
                "max_items", size_terms, Sense::GreaterEqual, nd - static_cast<double>(maxItems_));
            minItemsCon_ = backend_->addConstraint(
                "min_items", size_terms, Sense::LessEqual, nd - static_cast<double>(std::max(minItems_, 1)));

            if (options_.costType == CostType::Max) {
                for (std::size_t i = 0; i < n; ++i) {
                    const auto& fe = encoding_.features[i];
                    const std::size_t j = fe.curve.featureIndex;

                    LinearTerms def_cost{{costVars_[i], -1.0}};
                    for (std::size_t k = 0; k < fe.curve.size(); ++k) {
                        def_cost.push_back({selectors_[i][k], fe.curve.costs[k]});
                    }
                    backend_->addConstraint(force_name::math("def_cost", j), def_cost, Sense::Equal, 0.0);
                    backend_->addConstraint(force_name::math("set_max_cost", j),
                        LinearTerms{{*maxCostVar_, 1.0}, {costVars_[i], -1.0}},
                        Sense::GreaterEqual, 0.0);
                }
            }
        }

        /// @brief Linear cost objective, or max_cost + epsilon * sum c[j]
        virtual void addObjective() {
            LinearTerms obj;
            if (options_.costType == CostType::Max) {
                obj.push_back({*maxCostVar_, 1.0});
                const double eps = encoding_.epsilon();
                for (VarId c : costVars_) obj.push_back({c, eps});
            } else {
                for (std::size_t i = 0; i < encoding_.size(); ++i) {
                    const auto& curve = encoding_.features[i].curve;
                    for (std::size_t k = 0; k < curve.size(); ++k) {
                        obj.push_back({selectors_[i][k], curve.costs[k]});
                    }
                }
            }
            backend_->setObjective(obj);
        }

    private:
        static void checkItemLimits(std::string_view where, int minItems, int maxItems, int nActionable) {
            if (minItems < 0 || maxItems < 0 || minItems > nActionable || maxItems > nActionable) {
                throw ConfigurationError(std::format(
                    "{}: item limits [{}, {}] must lie in [0, {}]",
                    where, minItems, maxItems, nActionable));
            }
            if (minItems > maxItems) {
                throw ConfigurationError(std::format(
                    "{}: min_items ({}) exceeds max_items ({})", where, minItems, maxItems));
            }
        }

        void requireConfigured(std::string_view where) const {
            if (!isConfigured()) {
                throw ConfigurationError(std::format("{}: call configure() first", where));
            }
        }

        void requireBuilt(std::string_view where) const {
            if (!isBuilt()) {
                throw ConfigurationError(std::format("{}: MIP is not built; call configure() first", where));
            }
        }

        void requireCapability(Capability c, std::string_view where) const {
            if (!backend_->supports(c)) {
                throw NotSupported(std::format(
                    "{}: backend '{}' does not support {}",
                    where, backend_->name(), kCapabilityNames.name(c)));
            }
        }

        void resetLayout() {
            actionVars_.clear();
            costVars_.clear();
            offSelectors_.clear();
            selectors_.clear();
            maxCostVar_.reset();
            scoreCon_ = maxItemsCon_ = minItemsCon_ = 0;
            exclusionCount_ = 0;
        }

        void applyLimits(const SolveLimits& limits) {
            if (!(limits.timeLimit > 0.0)) {
                throw ConfigurationError(std::format(
                    "RecourseBuilder: time limit must be positive or unlimited, got {}", limits.timeLimit));
            }
            if (!(limits.nodeLimit > 0.0)) {
                throw ConfigurationError(std::format(
                    "RecourseBuilder: node limit must be positive or unlimited, got {}", limits.nodeLimit));
            }
            backend_->setDisplay(limits.display);
            backend_->setTimeLimit(limits.timeLimit);
            backend_->setNodeLimit(limits.nodeLimit);
        }

        RawSolution readSolution() const {
            RawSolution raw;
            raw.actionValues = backend_->values(actionVars_);
            if (options_.costType == CostType::Max) {
                raw.costValues = backend_->values(costVars_);
                raw.maxCost = backend_->value(*maxCostVar_);
            } else {
                raw.costValues.assign(encoding_.size(), 0.0);
            }

            for (std::size_t i = 0; i < encoding_.size(); ++i) {
                const auto& costs = encoding_.features[i].curve.costs;
                const std::vector<double> u = backend_->values(selectors_[i]);

                // an active no-op selector means exactly "unchanged"
                if (u.front() > 0.5) {
                    raw.actionValues[i] = 0.0;
                    raw.costValues[i] = 0.0;
                    continue;
                }
                if (options_.costType != CostType::Max) {
                    for (std::size_t k = 1; k < u.size(); ++k) {
                        if (u[k] > 0.5) raw.costValues[i] = costs[k];
                    }
                }
            }
            return raw;
        }

        ValidationContext validationContext() const {
            ValidationContext ctx;
            ctx.classifier = &*classifier_;
            ctx.x = &x_;
            ctx.actionableIndices = actionableIndices();
            ctx.minItems = std::max(minItems_, 1);
            ctx.maxItems = maxItems_;
            ctx.costType = options_.costType;
            return ctx;
        }
    };

} // namespace flipset
