// File: src/engine/derivation_log.hpp
#pragma once

#include "core/interval.hpp"
#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexreason {

/// Index of a record inside a DerivationLog
using RecordId = size_t;

/// PremiseRef: A premise fact version used by a derivation
struct PremiseRef {
    FactKey key;
    Timestep version{0};   // Timestep at which the premise interval was written
};

/// DerivationRecord: Provenance of one fact version
///
/// Initial facts have an empty rule_id and no premises. A derived fact links
/// to the rule that produced it, the premise versions it read, and the record
/// of the interval it narrowed or replaced.
struct DerivationRecord {
    RecordId id{0};
    std::string rule_id;
    FactKey head;
    Timestep timestep{0};
    Interval interval;
    std::optional<Interval> prior;
    std::optional<RecordId> prior_record;
    std::vector<PremiseRef> premises;
    bool supersede{false};

    bool IsInitial() const { return rule_id.empty(); }
};

/// FiringFailure: A rule that could not fire because its aggregation input was invalid
struct FiringFailure {
    std::string rule_id;
    EntityRef target;
    Timestep timestep{0};
    std::string reason;
};

/// TraceEvent: One rule firing, whether or not it changed the head
struct TraceEvent {
    Timestep timestep{0};     // Timestep the rule read
    std::string rule_id;
    FactKey head;
    Interval proposed;
    bool applied{false};      // Won conflict resolution and changed the fact
};

/// DerivationLog: Append-only arena of derivation records
///
/// Records reference each other by RecordId and are indexed by
/// (fact key, timestep), so cyclic support between facts never forms
/// pointer cycles. Nothing is overwritten: a narrowing layers a new record
/// on top of the one it narrowed.
class DerivationLog {
public:
    DerivationLog() = default;

    // ========================================================================
    // Appending
    // ========================================================================

    /// Append a record, assigning its id
    /// @throws std::invalid_argument if the record's timestep precedes the
    ///         latest record of the same fact
    RecordId Append(DerivationRecord record);

    void RecordFailure(FiringFailure failure);

    void RecordTrace(TraceEvent event);

    // ========================================================================
    // Queries
    // ========================================================================

    const std::vector<DerivationRecord>& GetRecords() const { return records_; }
    const std::vector<FiringFailure>& GetFailures() const { return failures_; }
    const std::vector<TraceEvent>& GetTrace() const { return trace_; }

    const DerivationRecord& Get(RecordId id) const { return records_.at(id); }

    /// Record of the fact version visible at timestep t
    std::optional<RecordId> FindVisible(const FactKey& key, Timestep t) const;

    /// All records of one fact, oldest first
    std::vector<RecordId> GetRecordsFor(const FactKey& key) const;

    /// "Why" query: every record reachable from the fact version visible at t
    /// through premises and prior records, ordered by id. Cycle-safe.
    std::vector<DerivationRecord> Explain(const FactKey& key, Timestep t) const;

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<DerivationRecord> records_;
    std::map<FactKey, std::vector<RecordId>> by_key_;
    std::vector<FiringFailure> failures_;
    std::vector<TraceEvent> trace_;
};

} // namespace lexreason
