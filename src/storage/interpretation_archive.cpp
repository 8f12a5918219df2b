// File: src/storage/interpretation_archive.cpp
#include "storage/interpretation_archive.hpp"
#include <stdexcept>

namespace lexreason {

namespace {

/// Finalizes a prepared statement when it goes out of scope
struct StatementGuard {
    sqlite3_stmt* stmt{nullptr};
    ~StatementGuard() {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

// Entities occupy five consecutive columns: kind, node id, source, target, edge type
void BindEntity(sqlite3_stmt* stmt, int first, const EntityRef& entity) {
    sqlite3_bind_text(stmt, first, ToString(entity.kind()), -1, SQLITE_TRANSIENT);
    if (entity.IsNode()) {
        sqlite3_bind_text(stmt, first + 1, entity.AsNode().id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, first + 2, "", -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, first + 3, "", -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, first + 4, "", -1, SQLITE_STATIC);
    } else {
        const EdgeRef& edge = entity.AsEdge();
        sqlite3_bind_text(stmt, first + 1, "", -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, first + 2, edge.source.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, first + 3, edge.target.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, first + 4, edge.type.c_str(), -1, SQLITE_TRANSIENT);
    }
}

EntityRef ReadEntity(sqlite3_stmt* stmt, int first) {
    if (ParseTargetKind(ColumnText(stmt, first)) == TargetKind::NODE) {
        return EntityRef::Node(ColumnText(stmt, first + 1));
    }
    return EntityRef::Edge(ColumnText(stmt, first + 2),
                           ColumnText(stmt, first + 3),
                           ColumnText(stmt, first + 4));
}

const char* kEntityColumns =
    "entity_kind TEXT NOT NULL, node_id TEXT NOT NULL, edge_source TEXT NOT NULL, "
    "edge_target TEXT NOT NULL, edge_type TEXT NOT NULL";

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

InterpretationArchive::InterpretationArchive(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

InterpretationArchive::~InterpretationArchive() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void InterpretationArchive::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA foreign_keys=ON;");

    CreateTables();
    CreateIndices();
}

void InterpretationArchive::CreateTables() {
    const std::string entity_columns = kEntityColumns;

    const std::string runs = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            status TEXT NOT NULL,
            steps INTEGER NOT NULL
        );
    )";

    const std::string facts =
        "CREATE TABLE IF NOT EXISTS facts ("
        " run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE, " +
        entity_columns + ","
        " label TEXT NOT NULL,"
        " lower REAL NOT NULL,"
        " upper REAL NOT NULL);";

    const std::string derivations =
        "CREATE TABLE IF NOT EXISTS derivations ("
        " run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,"
        " record_id INTEGER NOT NULL,"
        " rule_id TEXT NOT NULL, " +
        entity_columns + ","
        " label TEXT NOT NULL,"
        " timestep INTEGER NOT NULL,"
        " lower REAL NOT NULL,"
        " upper REAL NOT NULL,"
        " prior_lower REAL,"
        " prior_upper REAL,"
        " prior_record INTEGER,"
        " supersede INTEGER NOT NULL,"
        " PRIMARY KEY (run_id, record_id));";

    const std::string premises =
        "CREATE TABLE IF NOT EXISTS premises ("
        " run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,"
        " record_id INTEGER NOT NULL,"
        " ordinal INTEGER NOT NULL, " +
        entity_columns + ","
        " label TEXT NOT NULL,"
        " version INTEGER NOT NULL,"
        " PRIMARY KEY (run_id, record_id, ordinal));";

    if (!ExecuteSQL(runs) || !ExecuteSQL(facts) ||
        !ExecuteSQL(derivations) || !ExecuteSQL(premises)) {
        ThrowError("Failed to create archive tables");
    }
}

void InterpretationArchive::CreateIndices() {
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_facts_run ON facts(run_id);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_premises_record ON premises(run_id, record_id);");
}

bool InterpretationArchive::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void InterpretationArchive::ThrowError(const std::string& context) const {
    throw std::runtime_error(context + ": " + sqlite3_errmsg(db_));
}

// ============================================================================
// Writing
// ============================================================================

int64_t InterpretationArchive::StoreRun(const RunResult& result, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        ThrowError("Failed to begin transaction");
    }

    try {
        StatementGuard run_stmt;
        if (sqlite3_prepare_v2(db_, "INSERT INTO runs (name, status, steps) VALUES (?, ?, ?);",
                               -1, &run_stmt.stmt, nullptr) != SQLITE_OK) {
            ThrowError("Failed to prepare run insert");
        }
        sqlite3_bind_text(run_stmt.stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(run_stmt.stmt, 2, ToString(result.status), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(run_stmt.stmt, 3, result.steps);
        if (sqlite3_step(run_stmt.stmt) != SQLITE_DONE) {
            ThrowError("Failed to insert run");
        }
        const int64_t run_id = sqlite3_last_insert_rowid(db_);

        // Final facts
        StatementGuard fact_stmt;
        if (sqlite3_prepare_v2(db_,
                "INSERT INTO facts (run_id, entity_kind, node_id, edge_source, edge_target, "
                "edge_type, label, lower, upper) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);",
                -1, &fact_stmt.stmt, nullptr) != SQLITE_OK) {
            ThrowError("Failed to prepare fact insert");
        }
        for (const auto& [key, interval] : result.interpretation.facts()) {
            sqlite3_bind_int64(fact_stmt.stmt, 1, run_id);
            BindEntity(fact_stmt.stmt, 2, key.entity);
            sqlite3_bind_text(fact_stmt.stmt, 7, key.label.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(fact_stmt.stmt, 8, interval.lower());
            sqlite3_bind_double(fact_stmt.stmt, 9, interval.upper());
            if (sqlite3_step(fact_stmt.stmt) != SQLITE_DONE) {
                ThrowError("Failed to insert fact " + key.ToString());
            }
            sqlite3_reset(fact_stmt.stmt);
        }

        // Derivation records and their premises
        if (result.log) {
            StatementGuard record_stmt;
            if (sqlite3_prepare_v2(db_,
                    "INSERT INTO derivations (run_id, record_id, rule_id, entity_kind, node_id, "
                    "edge_source, edge_target, edge_type, label, timestep, lower, upper, "
                    "prior_lower, prior_upper, prior_record, supersede) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
                    -1, &record_stmt.stmt, nullptr) != SQLITE_OK) {
                ThrowError("Failed to prepare derivation insert");
            }

            StatementGuard premise_stmt;
            if (sqlite3_prepare_v2(db_,
                    "INSERT INTO premises (run_id, record_id, ordinal, entity_kind, node_id, "
                    "edge_source, edge_target, edge_type, label, version) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
                    -1, &premise_stmt.stmt, nullptr) != SQLITE_OK) {
                ThrowError("Failed to prepare premise insert");
            }

            for (const auto& record : result.log->GetRecords()) {
                sqlite3_stmt* stmt = record_stmt.stmt;
                sqlite3_bind_int64(stmt, 1, run_id);
                sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(record.id));
                sqlite3_bind_text(stmt, 3, record.rule_id.c_str(), -1, SQLITE_TRANSIENT);
                BindEntity(stmt, 4, record.head.entity);
                sqlite3_bind_text(stmt, 9, record.head.label.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 10, record.timestep);
                sqlite3_bind_double(stmt, 11, record.interval.lower());
                sqlite3_bind_double(stmt, 12, record.interval.upper());
                if (record.prior) {
                    sqlite3_bind_double(stmt, 13, record.prior->lower());
                    sqlite3_bind_double(stmt, 14, record.prior->upper());
                } else {
                    sqlite3_bind_null(stmt, 13);
                    sqlite3_bind_null(stmt, 14);
                }
                if (record.prior_record) {
                    sqlite3_bind_int64(stmt, 15, static_cast<sqlite3_int64>(*record.prior_record));
                } else {
                    sqlite3_bind_null(stmt, 15);
                }
                sqlite3_bind_int(stmt, 16, record.supersede ? 1 : 0);
                if (sqlite3_step(stmt) != SQLITE_DONE) {
                    ThrowError("Failed to insert derivation " + std::to_string(record.id));
                }
                sqlite3_reset(stmt);

                for (size_t i = 0; i < record.premises.size(); ++i) {
                    const PremiseRef& premise = record.premises[i];
                    sqlite3_stmt* pstmt = premise_stmt.stmt;
                    sqlite3_bind_int64(pstmt, 1, run_id);
                    sqlite3_bind_int64(pstmt, 2, static_cast<sqlite3_int64>(record.id));
                    sqlite3_bind_int64(pstmt, 3, static_cast<sqlite3_int64>(i));
                    BindEntity(pstmt, 4, premise.key.entity);
                    sqlite3_bind_text(pstmt, 9, premise.key.label.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_int64(pstmt, 10, premise.version);
                    if (sqlite3_step(pstmt) != SQLITE_DONE) {
                        ThrowError("Failed to insert premise of derivation " +
                                   std::to_string(record.id));
                    }
                    sqlite3_reset(pstmt);
                }
            }
        }

        if (!ExecuteSQL("COMMIT;")) {
            ThrowError("Failed to commit run");
        }
        return run_id;
    } catch (const std::exception&) {
        RollbackTransaction();
        throw;
    }
}

bool InterpretationArchive::DeleteRun(int64_t run_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, "DELETE FROM runs WHERE id = ?;", -1, &guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare run delete");
    }
    sqlite3_bind_int64(guard.stmt, 1, run_id);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        ThrowError("Failed to delete run");
    }
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Reading
// ============================================================================

size_t InterpretationArchive::CountRows(const char* sql, int64_t run_id) const {
    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare count");
    }
    sqlite3_bind_int64(guard.stmt, 1, run_id);
    if (sqlite3_step(guard.stmt) != SQLITE_ROW) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(guard.stmt, 0));
}

ArchivedRun InterpretationArchive::ReadRunRow(sqlite3_stmt* stmt) const {
    ArchivedRun run;
    run.run_id = sqlite3_column_int64(stmt, 0);
    run.name = ColumnText(stmt, 1);
    run.status = ParseConvergenceStatus(ColumnText(stmt, 2));
    run.steps = static_cast<Timestep>(sqlite3_column_int64(stmt, 3));
    run.fact_count = CountRows("SELECT COUNT(*) FROM facts WHERE run_id = ?;", run.run_id);
    run.record_count = CountRows("SELECT COUNT(*) FROM derivations WHERE run_id = ?;", run.run_id);
    return run;
}

std::optional<ArchivedRun> InterpretationArchive::GetRunSummary(int64_t run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, "SELECT id, name, status, steps FROM runs WHERE id = ?;",
                           -1, &guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare run query");
    }
    sqlite3_bind_int64(guard.stmt, 1, run_id);

    if (sqlite3_step(guard.stmt) != SQLITE_ROW) {
        return std::nullopt;
    }
    return ReadRunRow(guard.stmt);
}

std::vector<ArchivedRun> InterpretationArchive::ListRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, "SELECT id, name, status, steps FROM runs ORDER BY id;",
                           -1, &guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare run listing");
    }

    std::vector<ArchivedRun> runs;
    while (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        runs.push_back(ReadRunRow(guard.stmt));
    }
    return runs;
}

std::map<FactKey, Interval> InterpretationArchive::LoadFacts(int64_t run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_,
            "SELECT entity_kind, node_id, edge_source, edge_target, edge_type, label, lower, upper "
            "FROM facts WHERE run_id = ?;",
            -1, &guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare fact query");
    }
    sqlite3_bind_int64(guard.stmt, 1, run_id);

    std::map<FactKey, Interval> facts;
    while (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        FactKey key{ReadEntity(guard.stmt, 0), ColumnText(guard.stmt, 5)};
        facts[key] = Interval(sqlite3_column_double(guard.stmt, 6),
                              sqlite3_column_double(guard.stmt, 7));
    }
    return facts;
}

std::vector<DerivationRecord> InterpretationArchive::LoadDerivations(int64_t run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_,
            "SELECT record_id, rule_id, entity_kind, node_id, edge_source, edge_target, edge_type, "
            "label, timestep, lower, upper, prior_lower, prior_upper, prior_record, supersede "
            "FROM derivations WHERE run_id = ? ORDER BY record_id;",
            -1, &guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare derivation query");
    }
    sqlite3_bind_int64(guard.stmt, 1, run_id);

    std::vector<DerivationRecord> records;
    while (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        sqlite3_stmt* stmt = guard.stmt;
        DerivationRecord record;
        record.id = static_cast<RecordId>(sqlite3_column_int64(stmt, 0));
        record.rule_id = ColumnText(stmt, 1);
        record.head = FactKey{ReadEntity(stmt, 2), ColumnText(stmt, 7)};
        record.timestep = static_cast<Timestep>(sqlite3_column_int64(stmt, 8));
        record.interval = Interval(sqlite3_column_double(stmt, 9), sqlite3_column_double(stmt, 10));
        if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) {
            record.prior = Interval(sqlite3_column_double(stmt, 11), sqlite3_column_double(stmt, 12));
        }
        if (sqlite3_column_type(stmt, 13) != SQLITE_NULL) {
            record.prior_record = static_cast<RecordId>(sqlite3_column_int64(stmt, 13));
        }
        record.supersede = sqlite3_column_int(stmt, 14) != 0;
        records.push_back(std::move(record));
    }

    StatementGuard premise_guard;
    if (sqlite3_prepare_v2(db_,
            "SELECT entity_kind, node_id, edge_source, edge_target, edge_type, label, version "
            "FROM premises WHERE run_id = ? AND record_id = ? ORDER BY ordinal;",
            -1, &premise_guard.stmt, nullptr) != SQLITE_OK) {
        ThrowError("Failed to prepare premise query");
    }
    for (auto& record : records) {
        sqlite3_bind_int64(premise_guard.stmt, 1, run_id);
        sqlite3_bind_int64(premise_guard.stmt, 2, static_cast<sqlite3_int64>(record.id));
        while (sqlite3_step(premise_guard.stmt) == SQLITE_ROW) {
            PremiseRef premise;
            premise.key = FactKey{ReadEntity(premise_guard.stmt, 0), ColumnText(premise_guard.stmt, 5)};
            premise.version = static_cast<Timestep>(sqlite3_column_int64(premise_guard.stmt, 6));
            record.premises.push_back(std::move(premise));
        }
        sqlite3_reset(premise_guard.stmt);
    }

    return records;
}

// ============================================================================
// Transaction Helpers
// ============================================================================

void InterpretationArchive::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

} // namespace lexreason
