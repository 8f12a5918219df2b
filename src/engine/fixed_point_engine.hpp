// File: src/engine/fixed_point_engine.hpp
#pragma once

#include "core/interval.hpp"
#include "core/types.hpp"
#include "engine/derivation_log.hpp"
#include "engine/interpretation.hpp"
#include "graph/fact_store.hpp"
#include "graph/typed_graph.hpp"
#include "rules/rule.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lexreason {

// UpdateMode: How a winning proposal combines with the current interval
enum class UpdateMode : uint8_t {
    INTERSECT = 0,   // Intersect proposal with the current interval; disjoint proposals are rejected
    STRICT = 1,      // Proposal must already lie within the current interval
};

const char* ToString(UpdateMode mode);

/// @throws ConfigError for an unknown name
UpdateMode ParseUpdateMode(const std::string& str);

/// StepSummary: What one evaluation step changed
struct StepSummary {
    Timestep timestep{0};          // Timestep written by the step
    size_t changed{0};             // Facts whose interval changed
    double max_bound_delta{0.0};   // Largest bound movement; a new fact moves from [0, 1]
};

/// RunResult: Outcome of one engine run
struct RunResult {
    /// Final interpretation (timestep == steps)
    Interpretation interpretation;

    ConvergenceStatus status{ConvergenceStatus::EXHAUSTED};

    /// Number of completed evaluation steps
    Timestep steps{0};

    /// Interpretation per timestep 0..steps when snapshots are retained
    std::vector<Interpretation> snapshots;

    /// One entry per completed step
    std::vector<StepSummary> history;

    std::shared_ptr<const DerivationLog> log;

    bool Converged() const { return status == ConvergenceStatus::CONVERGED; }

    /// "Why" query against the final interpretation
    std::vector<DerivationRecord> Explain(const FactKey& key) const {
        return interpretation.Explain(key);
    }
};

/// FixedPointEngine: Evaluates rules over a typed graph until a fixed point
///
/// State machine: Init -> Stepping(t) -> Stepping(t+1) | Converged | Exhausted
///
/// - Init validates graph, initial facts and rules (ConfigError).
/// - Stepping(t) evaluates every rule against the frozen interpretation at t
///   and schedules each proposal for t + 1 + rule delay. Proposals due at
///   t+1 that target static facts are skipped, and in intersect mode those
///   disjoint from the current interval are rejected with a FiringFailure.
///   The rest are reduced per fact to the most conservative one, and the
///   interpretation at t+1 gets a derivation record for every changed fact.
/// - Converged when a step changes nothing and no scheduled proposal would
///   change anything, or when the configured change-count or bound-delta
///   threshold is met. Exhausted when t+1 reaches tmax.
///
/// The reduction is a minimum over a total order (interval conservativeness,
/// then rule id), so the result does not depend on rule order or on how rules
/// are spread across worker threads. Each run owns its own FactStore.
class FixedPointEngine {
public:
    struct Config {
        /// Step budget
        Timestep tmax{100};

        UpdateMode update_mode{UpdateMode::INTERSECT};

        /// Worker threads evaluating rules within a timestep
        size_t num_threads{1};

        /// Keep the interpretation of every timestep in RunResult::snapshots
        bool retain_snapshots{false};

        /// Record a TraceEvent for every rule firing
        bool record_trace{false};

        /// Legal time of timestep t is time_origin + t * time_step
        double time_origin{0.0};
        double time_step{1.0};

        /// Converge once a step changes at most this many facts
        std::optional<size_t> convergence_threshold;

        /// Converge once no bound moves by more than this; takes precedence
        /// over convergence_threshold
        std::optional<double> convergence_bound_threshold;

        bool debug_logging{false};

        bool IsValid() const { return GetValidationErrors().empty(); }
        std::vector<std::string> GetValidationErrors() const;
    };

    FixedPointEngine();

    /// @throws ConfigError if config is invalid
    explicit FixedPointEngine(const Config& config);

    // ========================================================================
    // Run Invocation
    // ========================================================================

    /// Run with the configured tmax
    /// @throws ConfigError for invalid inputs (before any evaluation)
    /// @throws InvariantViolation if an update breaks the monotonicity policy
    RunResult Run(std::shared_ptr<const TypedGraph> graph,
                  const std::vector<InitialFact>& initial_facts,
                  const std::vector<Rule>& rules) const;

    /// Run with an explicit step budget
    RunResult Run(std::shared_ptr<const TypedGraph> graph,
                  const std::vector<InitialFact>& initial_facts,
                  const std::vector<Rule>& rules,
                  Timestep tmax) const;

    /// Validate inputs without running
    /// @throws ConfigError listing every problem found
    static void ValidateInputs(const TypedGraph& graph,
                               const std::vector<InitialFact>& initial_facts,
                               const std::vector<Rule>& rules);

    /// Legal time context of a timestep
    double LegalTime(Timestep t) const {
        return config_.time_origin + static_cast<double>(t) * config_.time_step;
    }

    const Config& GetConfig() const { return config_; }

    /// @throws ConfigError if config is invalid
    void SetConfig(const Config& config);

private:
    /// A rule's proposal for one head fact
    struct Proposal {
        FactKey head;
        Interval interval;
        std::string rule_id;
        std::vector<PremiseRef> premises;
        Timestep read_at{0};     // Timestep the rule evaluated
        Timestep delay{0};
        bool supersede{false};
        bool set_static{false};
    };

    /// Facts changed by one Apply
    struct ApplyOutcome {
        std::set<FactKey> changed;
        double max_bound_delta{0.0};
    };

    /// Output of evaluating a slice of the rules at one timestep
    struct StepOutput {
        std::vector<Proposal> proposals;
        std::vector<FiringFailure> failures;
    };

    Config config_;

    /// Evaluate rules[i] for i = offset, offset + stride, ...
    StepOutput EvaluateRules(const FactStore& store,
                             const std::vector<const Rule*>& rules,
                             size_t offset, size_t stride,
                             Timestep t) const;

    /// Evaluate every rule, possibly across worker threads, and merge the
    /// outputs in canonical order
    StepOutput EvaluateStep(const FactStore& store,
                            const std::vector<const Rule*>& rules,
                            Timestep t) const;

    /// Drop due proposals for static facts and reject, with a diagnostic,
    /// intersect-mode proposals disjoint from the fact at t
    std::vector<const Proposal*> Admit(const FactStore& store, DerivationLog& log,
                                       const std::set<FactKey>& static_keys,
                                       const std::vector<Proposal>& due,
                                       Timestep t) const;

    /// Reduce proposals to one winner per head fact
    static std::map<FactKey, const Proposal*> Resolve(const std::vector<const Proposal*>& proposals);

    /// Apply winners at timestep t + 1; winners of set_static rules freeze their fact
    ApplyOutcome Apply(FactStore& store, DerivationLog& log,
                       std::set<FactKey>& static_keys,
                       const std::map<FactKey, const Proposal*>& winners,
                       Timestep t) const;

    /// True if applying the proposal to the fact at t would change it
    /// (or fail the strict-mode check)
    bool WouldChange(const FactStore& store, const std::set<FactKey>& static_keys,
                     const Proposal& proposal, Timestep t) const;

    /// Convergence test after the step that wrote timestep t
    bool IsConverged(const ApplyOutcome& outcome, const FactStore& store,
                     const std::set<FactKey>& static_keys,
                     const std::map<Timestep, std::vector<Proposal>>& pending,
                     Timestep t) const;

    void LogDebug(const std::string& message) const;
};

} // namespace lexreason
