// File: src/storage/interpretation_archive.hpp
#pragma once

#include "engine/derivation_log.hpp"
#include "engine/fixed_point_engine.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace lexreason {

/// ArchivedRun: Summary row of one archived engine run
struct ArchivedRun {
    int64_t run_id{0};
    std::string name;
    ConvergenceStatus status{ConvergenceStatus::EXHAUSTED};
    Timestep steps{0};
    size_t fact_count{0};
    size_t record_count{0};
};

/// Audit archive for finished runs using SQLite
///
/// Stores the final facts and the derivation records of a run so that "why"
/// answers can be reproduced after the process exits. Each StoreRun call
/// writes inside one transaction; a failure leaves no partial run behind.
///
/// Schema:
/// - runs:        id, name, status, steps
/// - facts:       run_id, entity columns, label, lower, upper
/// - derivations: run_id, record_id, rule_id, head, timestep, interval,
///                prior, prior_record, supersede
/// - premises:    run_id, record_id, ordinal, premise key, version
class InterpretationArchive {
public:
    /// Configuration for InterpretationArchive
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private database)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Open (and create if needed) the archive
    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit InterpretationArchive(const Config& config);

    ~InterpretationArchive();

    // Prevent copying (SQLite connection is not copyable)
    InterpretationArchive(const InterpretationArchive&) = delete;
    InterpretationArchive& operator=(const InterpretationArchive&) = delete;

    // ========================================================================
    // Writing
    // ========================================================================

    /// Archive a finished run
    /// @return Row id of the new run
    /// @throws std::runtime_error on any SQLite failure (the transaction is rolled back)
    int64_t StoreRun(const RunResult& result, const std::string& name);

    /// Remove a run and everything stored with it
    /// @return true if the run existed
    bool DeleteRun(int64_t run_id);

    // ========================================================================
    // Reading
    // ========================================================================

    std::optional<ArchivedRun> GetRunSummary(int64_t run_id) const;

    /// All runs, oldest first
    std::vector<ArchivedRun> ListRuns() const;

    /// Final facts of a run (empty for an unknown run)
    std::map<FactKey, Interval> LoadFacts(int64_t run_id) const;

    /// Derivation records of a run ordered by record id
    std::vector<DerivationRecord> LoadDerivations(int64_t run_id) const;

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();
    void CreateIndices();

    bool ExecuteSQL(const std::string& sql);

    /// Throw std::runtime_error carrying the current SQLite error message
    [[noreturn]] void ThrowError(const std::string& context) const;

    size_t CountRows(const char* sql, int64_t run_id) const;
    ArchivedRun ReadRunRow(sqlite3_stmt* stmt) const;

    void RollbackTransaction();
};

} // namespace lexreason
