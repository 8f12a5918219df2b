// File: src/engine/fixed_point_engine.cpp
#include "engine/fixed_point_engine.hpp"
#include "core/errors.hpp"
#include "rules/aggregation.hpp"
#include "rules/clause_matcher.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <iterator>
#include <set>
#include <thread>

namespace lexreason {

// ============================================================================
// UpdateMode
// ============================================================================

const char* ToString(UpdateMode mode) {
    switch (mode) {
        case UpdateMode::INTERSECT: return "intersect";
        case UpdateMode::STRICT: return "strict";
        default: return "unknown";
    }
}

UpdateMode ParseUpdateMode(const std::string& str) {
    if (str == "intersect") return UpdateMode::INTERSECT;
    if (str == "strict") return UpdateMode::STRICT;
    throw ConfigError("unknown update_mode '" + str + "' (expected intersect or strict)");
}

// ============================================================================
// Configuration
// ============================================================================

std::vector<std::string> FixedPointEngine::Config::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (tmax < 1) {
        errors.push_back("tmax must be at least 1");
    }
    if (num_threads == 0) {
        errors.push_back("num_threads must be greater than 0");
    }
    if (!std::isfinite(time_origin)) {
        errors.push_back("time_origin must be finite");
    }
    if (!std::isfinite(time_step) || time_step <= 0.0) {
        errors.push_back("time_step must be greater than 0");
    }
    if (convergence_bound_threshold &&
        (!std::isfinite(*convergence_bound_threshold) || *convergence_bound_threshold < 0.0)) {
        errors.push_back("convergence_bound_threshold must be a non-negative number");
    }

    return errors;
}

FixedPointEngine::FixedPointEngine()
    : FixedPointEngine(Config{}) {}

FixedPointEngine::FixedPointEngine(const Config& config)
    : config_(config) {
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors);
    }
}

void FixedPointEngine::SetConfig(const Config& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors);
    }
    config_ = config;
}

// ============================================================================
// Init
// ============================================================================

void FixedPointEngine::ValidateInputs(const TypedGraph& graph,
                                      const std::vector<InitialFact>& initial_facts,
                                      const std::vector<Rule>& rules) {
    std::vector<std::string> errors;

    std::set<FactKey> seen_facts;
    for (const auto& fact : initial_facts) {
        if (!graph.HasEntity(fact.key.entity)) {
            errors.push_back("initial fact " + fact.key.ToString() + " refers to unknown " +
                             fact.key.entity.ToString());
        }
        if (fact.key.label.empty()) {
            errors.push_back("initial fact on " + fact.key.entity.ToString() + " has an empty label");
        }
        if (!seen_facts.insert(fact.key).second) {
            errors.push_back("duplicate initial fact " + fact.key.ToString());
        }
    }

    std::set<std::string> seen_rules;
    for (const auto& rule : rules) {
        auto rule_errors = rule.GetValidationErrors();
        errors.insert(errors.end(), rule_errors.begin(), rule_errors.end());
        if (!rule.id.empty() && !seen_rules.insert(rule.id).second) {
            errors.push_back("duplicate rule id '" + rule.id + "'");
        }
    }

    if (!errors.empty()) {
        throw ConfigError(errors);
    }
}

// ============================================================================
// Run Invocation
// ============================================================================

RunResult FixedPointEngine::Run(std::shared_ptr<const TypedGraph> graph,
                                const std::vector<InitialFact>& initial_facts,
                                const std::vector<Rule>& rules) const {
    return Run(std::move(graph), initial_facts, rules, config_.tmax);
}

RunResult FixedPointEngine::Run(std::shared_ptr<const TypedGraph> graph,
                                const std::vector<InitialFact>& initial_facts,
                                const std::vector<Rule>& rules,
                                Timestep tmax) const {
    if (tmax < 1) {
        throw ConfigError("tmax must be at least 1");
    }
    if (!graph) {
        throw ConfigError("graph must not be null");
    }
    ValidateInputs(*graph, initial_facts, rules);

    auto log = std::make_shared<DerivationLog>();
    FactStore store(graph);

    // Initial facts in key order, so record ids do not depend on input order
    std::vector<const InitialFact*> ordered;
    ordered.reserve(initial_facts.size());
    for (const auto& fact : initial_facts) {
        ordered.push_back(&fact);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const InitialFact* a, const InitialFact* b) { return a->key < b->key; });

    std::set<FactKey> static_keys;
    for (const InitialFact* fact : ordered) {
        store.SetFact(fact->key, 0, fact->interval);
        if (fact->is_static) {
            static_keys.insert(fact->key);
        }
        DerivationRecord record;
        record.head = fact->key;
        record.timestep = 0;
        record.interval = fact->interval;
        log->Append(std::move(record));
    }

    std::vector<const Rule*> rule_ptrs;
    rule_ptrs.reserve(rules.size());
    for (const auto& rule : rules) {
        rule_ptrs.push_back(&rule);
    }

    LogDebug("Run started: " + graph->ToString() + ", " + std::to_string(initial_facts.size()) +
             " initial facts, " + std::to_string(rules.size()) + " rules, tmax=" +
             std::to_string(tmax));

    RunResult result;
    result.log = log;
    if (config_.retain_snapshots) {
        result.snapshots.emplace_back(0, store.Snapshot(0), log);
    }

    // Proposals by the timestep they take effect at
    std::map<Timestep, std::vector<Proposal>> pending;

    Timestep t = 0;
    while (t < tmax) {
        StepOutput output = EvaluateStep(store, rule_ptrs, t);
        for (auto& failure : output.failures) {
            log->RecordFailure(std::move(failure));
        }

        // An effect past tmax can never apply
        for (auto& proposal : output.proposals) {
            uint64_t effect = static_cast<uint64_t>(t) + 1 + proposal.delay;
            if (effect <= tmax) {
                pending[static_cast<Timestep>(effect)].push_back(std::move(proposal));
            }
        }

        std::vector<Proposal> due;
        auto due_it = pending.find(t + 1);
        if (due_it != pending.end()) {
            due = std::move(due_it->second);
            pending.erase(due_it);
        }
        std::sort(due.begin(), due.end(), [](const Proposal& a, const Proposal& b) {
            if (a.head != b.head) return a.head < b.head;
            if (a.rule_id != b.rule_id) return a.rule_id < b.rule_id;
            return a.read_at < b.read_at;
        });

        auto admitted = Admit(store, *log, static_keys, due, t);
        auto winners = Resolve(admitted);
        ApplyOutcome outcome = Apply(store, *log, static_keys, winners, t);

        if (config_.record_trace) {
            for (const auto& proposal : due) {
                auto winner = winners.find(proposal.head);
                bool applied = winner != winners.end() && winner->second == &proposal &&
                               outcome.changed.count(proposal.head) > 0;
                log->RecordTrace(TraceEvent{proposal.read_at, proposal.rule_id, proposal.head,
                                            proposal.interval, applied});
            }
        }

        LogDebug("Step t=" + std::to_string(t) + ": " + std::to_string(due.size()) +
                 " proposals due, " + std::to_string(winners.size()) + " heads, " +
                 std::to_string(outcome.changed.size()) + " changed, max delta " +
                 std::to_string(outcome.max_bound_delta));

        ++t;
        if (config_.retain_snapshots) {
            result.snapshots.emplace_back(t, store.Snapshot(t), log);
        }
        result.history.push_back(StepSummary{t, outcome.changed.size(), outcome.max_bound_delta});

        if (IsConverged(outcome, store, static_keys, pending, t)) {
            result.status = ConvergenceStatus::CONVERGED;
            break;
        }
    }

    result.steps = t;
    result.interpretation = Interpretation(t, store.Snapshot(t), log);

    LogDebug(std::string("Run finished: ") + ToString(result.status) + " after " +
             std::to_string(result.steps) + " steps, " +
             std::to_string(result.interpretation.size()) + " facts, " +
             std::to_string(log->size()) + " derivation records");

    return result;
}

// ============================================================================
// Stepping
// ============================================================================

FixedPointEngine::StepOutput FixedPointEngine::EvaluateRules(const FactStore& store,
                                                             const std::vector<const Rule*>& rules,
                                                             size_t offset, size_t stride,
                                                             Timestep t) const {
    StepOutput output;
    ClauseMatcher matcher(store);
    double legal_time = LegalTime(t);

    for (size_t i = offset; i < rules.size(); i += stride) {
        const Rule& rule = *rules[i];
        if (rule.valid_time && !rule.valid_time->Contains(legal_time)) {
            continue;
        }

        for (const auto& target : matcher.CandidateTargets(rule)) {
            auto binding = matcher.Match(rule, target, t);
            if (!binding) {
                continue;
            }

            if (binding->premises.empty()) {
                // Only quantifiers that accept zero premises matched
                continue;
            }

            std::optional<Interval> derived;
            try {
                derived = Aggregate(rule.aggregation, binding->premises);
            } catch (const AggregationInputError& e) {
                output.failures.push_back(FiringFailure{rule.id, target, t, e.reason()});
                continue;
            }
            if (!derived) {
                continue;
            }

            Proposal proposal;
            proposal.head = FactKey{target, rule.head.label};
            proposal.interval = ApplyRuleWeight(rule.aggregation, *derived, rule.weight);
            proposal.rule_id = rule.id;
            proposal.read_at = t;
            proposal.delay = rule.delay;
            proposal.supersede = rule.supersede;
            proposal.set_static = rule.set_static;
            for (const auto& match : binding->matches) {
                proposal.premises.push_back(PremiseRef{match.key, match.version});
            }
            output.proposals.push_back(std::move(proposal));
        }
    }

    return output;
}

FixedPointEngine::StepOutput FixedPointEngine::EvaluateStep(const FactStore& store,
                                                            const std::vector<const Rule*>& rules,
                                                            Timestep t) const {
    size_t workers = std::min(config_.num_threads, rules.size());
    StepOutput merged;

    if (workers <= 1) {
        merged = EvaluateRules(store, rules, 0, 1, t);
    } else {
        // Workers only read the store; nothing is written until all have joined
        std::vector<StepOutput> outputs(workers);
        std::vector<std::exception_ptr> errors(workers);
        std::vector<std::thread> threads;
        threads.reserve(workers);

        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back([this, &store, &rules, &outputs, &errors, w, workers, t]() {
                try {
                    outputs[w] = EvaluateRules(store, rules, w, workers, t);
                } catch (const std::exception&) {
                    errors[w] = std::current_exception();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }

        for (auto& output : outputs) {
            std::move(output.proposals.begin(), output.proposals.end(),
                      std::back_inserter(merged.proposals));
            std::move(output.failures.begin(), output.failures.end(),
                      std::back_inserter(merged.failures));
        }
    }

    // Canonical order: (head, rule id); a rule proposes at most once per head
    std::sort(merged.proposals.begin(), merged.proposals.end(),
              [](const Proposal& a, const Proposal& b) {
                  if (a.head != b.head) return a.head < b.head;
                  return a.rule_id < b.rule_id;
              });
    std::sort(merged.failures.begin(), merged.failures.end(),
              [](const FiringFailure& a, const FiringFailure& b) {
                  if (a.rule_id != b.rule_id) return a.rule_id < b.rule_id;
                  return a.target < b.target;
              });

    return merged;
}

std::vector<const FixedPointEngine::Proposal*> FixedPointEngine::Admit(
    const FactStore& store, DerivationLog& log, const std::set<FactKey>& static_keys,
    const std::vector<Proposal>& due, Timestep t) const {

    std::vector<const Proposal*> admitted;
    admitted.reserve(due.size());

    for (const auto& proposal : due) {
        if (static_keys.count(proposal.head) > 0) {
            continue;
        }

        if (config_.update_mode == UpdateMode::INTERSECT && !proposal.supersede) {
            auto current = store.GetFact(proposal.head, t);
            if (current && !current->Intersect(proposal.interval)) {
                std::string reason = "proposal " + proposal.interval.ToString() + " for '" +
                                     proposal.head.label + "' is disjoint from " +
                                     current->ToString();
                LogDebug("Rejected rule '" + proposal.rule_id + "' on " +
                         proposal.head.ToString() + ": " + reason);
                log.RecordFailure(FiringFailure{proposal.rule_id, proposal.head.entity,
                                                proposal.read_at, reason});
                continue;
            }
        }

        admitted.push_back(&proposal);
    }

    return admitted;
}

std::map<FactKey, const FixedPointEngine::Proposal*> FixedPointEngine::Resolve(
    const std::vector<const Proposal*>& proposals) {

    std::map<FactKey, const Proposal*> winners;
    for (const Proposal* proposal : proposals) {
        auto it = winners.find(proposal->head);
        if (it == winners.end()) {
            winners.emplace(proposal->head, proposal);
            continue;
        }

        const Proposal* best = it->second;
        bool better = proposal->interval.MoreConservativeThan(best->interval) ||
                      (proposal->interval == best->interval && proposal->rule_id < best->rule_id);
        if (better) {
            it->second = proposal;
        }
    }
    return winners;
}

FixedPointEngine::ApplyOutcome FixedPointEngine::Apply(
    FactStore& store, DerivationLog& log, std::set<FactKey>& static_keys,
    const std::map<FactKey, const Proposal*>& winners, Timestep t) const {

    ApplyOutcome outcome;
    const Timestep next_t = t + 1;

    for (const auto& [key, proposal] : winners) {
        auto current = store.GetFact(key, t);
        Interval next = proposal->interval;

        if (current && !proposal->supersede) {
            if (config_.update_mode == UpdateMode::INTERSECT) {
                // Admit already rejected disjoint proposals
                next = current->Intersect(proposal->interval).value_or(*current);
            } else if (!current->Contains(proposal->interval)) {
                throw InvariantViolation(key, next_t, "rule '" + proposal->rule_id +
                                         "' proposes " + proposal->interval.ToString() +
                                         ", not within " + current->ToString());
            }
        }

        if (proposal->set_static) {
            static_keys.insert(key);
        }
        if (current && *current == next) {
            continue;
        }

        store.SetFact(key, next_t, next, proposal->supersede);

        DerivationRecord record;
        record.rule_id = proposal->rule_id;
        record.head = key;
        record.timestep = next_t;
        record.interval = next;
        record.prior = current;
        record.prior_record = log.FindVisible(key, t);
        record.premises = proposal->premises;
        record.supersede = proposal->supersede;
        log.Append(std::move(record));

        Interval before = current.value_or(Interval::Unknown());
        double delta = std::max(std::fabs(before.lower() - next.lower()),
                                std::fabs(before.upper() - next.upper()));
        outcome.max_bound_delta = std::max(outcome.max_bound_delta, delta);
        outcome.changed.insert(key);
    }

    return outcome;
}

bool FixedPointEngine::WouldChange(const FactStore& store, const std::set<FactKey>& static_keys,
                                   const Proposal& proposal, Timestep t) const {
    if (static_keys.count(proposal.head) > 0) {
        return false;
    }

    auto current = store.GetFact(proposal.head, t);
    if (!current) {
        return true;
    }
    if (!proposal.supersede && config_.update_mode == UpdateMode::INTERSECT) {
        auto narrowed = current->Intersect(proposal.interval);
        return narrowed && *narrowed != *current;
    }
    // Strict mode: a change, or a violation still to be raised
    return proposal.interval != *current;
}

bool FixedPointEngine::IsConverged(const ApplyOutcome& outcome, const FactStore& store,
                                   const std::set<FactKey>& static_keys,
                                   const std::map<Timestep, std::vector<Proposal>>& pending,
                                   Timestep t) const {
    if (config_.convergence_bound_threshold) {
        return outcome.max_bound_delta <= *config_.convergence_bound_threshold;
    }
    if (config_.convergence_threshold) {
        return outcome.changed.size() <= *config_.convergence_threshold;
    }
    if (!outcome.changed.empty()) {
        return false;
    }

    // The interpretation is unchanged, so rules will keep proposing what is
    // already scheduled; it is a fixed point once none of that would apply
    for (const auto& [effect, proposals] : pending) {
        for (const auto& proposal : proposals) {
            if (WouldChange(store, static_keys, proposal, t)) {
                return false;
            }
        }
    }
    return true;
}

void FixedPointEngine::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[FixedPointEngine] " << message << std::endl;
    }
}

} // namespace lexreason
