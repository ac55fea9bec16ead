/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pg_store.cpp
 * ============================================================================
 * * STORAGE NOTES:
 * - Timestamps are stored as fixed-width UTC ISO-8601 text, so ordering and
 *   "<=" comparisons on the column are chronological.
 * - Journal lines are stored as a JSON array with integer micro amounts.
 * - Every libpqxx exception is rethrown as StoreError.
 * ============================================================================
 */

#include "pg_store.hpp"
#include <pqxx/pqxx>
#include "errors.hpp"
#include "logger.hpp"

namespace lgate {

namespace {

    const char* LOCK_COLUMNS =
        "lock_id, organization_id, period, status, locked_by, locked_at, lock_reason, "
        "unlocked_by, unlocked_at, unlock_reason, unlock_expires_at, unlock_extension_count, "
        "created_at, updated_at";

    const char* ENTRY_COLUMNS =
        "entry_id, reference_number, organization_id, entry_date, entry_type, description, lines, "
        "source_document_type, source_document_id, created_by, reversal_of, created_at, entry_hash";

    std::string quote_opt(pqxx::work& W, const std::optional<std::string>& v) {
        return v ? W.quote(*v) : std::string("NULL");
    }

    std::string quote_opt_time(pqxx::work& W, const std::optional<Timestamp>& v) {
        return v ? W.quote(to_iso8601(*v)) : std::string("NULL");
    }

    Timestamp read_time(const pqxx::field& f, const char* column) {
        auto ts = parse_iso8601(f.as<std::string>());
        if (!ts) throw StoreError(std::string("Unreadable timestamp in column ") + column);
        return *ts;
    }

    std::optional<std::string> read_opt(const pqxx::field& f) {
        if (f.is_null()) return std::nullopt;
        return f.as<std::string>();
    }

    std::optional<Timestamp> read_opt_time(const pqxx::field& f, const char* column) {
        if (f.is_null()) return std::nullopt;
        return read_time(f, column);
    }

    PeriodLock lock_from_row(const pqxx::row& row) {
        PeriodLock lock;
        lock.lock_id = row["lock_id"].as<std::string>();
        lock.organization_id = row["organization_id"].as<std::string>();
        lock.period = row["period"].as<std::string>();
        auto status = lock_status_from_string(row["status"].as<std::string>());
        if (!status) throw StoreError("Unknown lock status for period " + lock.period);
        lock.status = *status;
        lock.locked_by = row["locked_by"].as<std::string>();
        lock.locked_at = read_time(row["locked_at"], "locked_at");
        lock.lock_reason = row["lock_reason"].as<std::string>();
        lock.unlocked_by = read_opt(row["unlocked_by"]);
        lock.unlocked_at = read_opt_time(row["unlocked_at"], "unlocked_at");
        lock.unlock_reason = read_opt(row["unlock_reason"]);
        lock.unlock_expires_at = read_opt_time(row["unlock_expires_at"], "unlock_expires_at");
        lock.unlock_extension_count = row["unlock_extension_count"].as<int>();
        lock.created_at = read_time(row["created_at"], "created_at");
        lock.updated_at = read_time(row["updated_at"], "updated_at");
        return lock;
    }

    JournalEntry entry_from_row(const pqxx::row& row) {
        JournalEntry entry;
        entry.entry_id = row["entry_id"].as<std::string>();
        entry.reference_number = row["reference_number"].as<std::string>();
        entry.organization_id = row["organization_id"].as<std::string>();
        auto date = parse_iso_date(row["entry_date"].as<std::string>());
        if (!date) throw StoreError("Unreadable entry_date on " + entry.entry_id);
        entry.entry_date = *date;
        auto type = entry_type_from_string(row["entry_type"].as<std::string>());
        if (!type) throw StoreError("Unknown entry_type on " + entry.entry_id);
        entry.entry_type = *type;
        entry.description = row["description"].as<std::string>();
        try {
            entry.lines = lines_from_storage_json(json::parse(row["lines"].as<std::string>()));
        } catch (const json::exception& e) {
            throw StoreError("Corrupt line data on " + entry.entry_id + ": " + e.what());
        }
        entry.source_document_type = row["source_document_type"].as<std::string>();
        entry.source_document_id = row["source_document_id"].as<std::string>();
        entry.created_by = row["created_by"].as<std::string>();
        entry.reversal_of = row["reversal_of"].is_null() ? "" : row["reversal_of"].as<std::string>();
        entry.created_at = read_time(row["created_at"], "created_at");
        entry.entry_hash = row["entry_hash"].as<std::string>();
        return entry;
    }

    json read_snapshot(const pqxx::field& f) {
        if (f.is_null()) return json(nullptr);
        return json::parse(f.as<std::string>(), nullptr, false);
    }

    std::string snapshot_sql(pqxx::work& W, const json& snapshot) {
        return snapshot.is_null() ? std::string("NULL") : W.quote(snapshot.dump());
    }
}

PgStore::PgStore(const std::string& conn_str) : conn_str_(conn_str) {}

void PgStore::ensure_schema() {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        W.exec("CREATE TABLE IF NOT EXISTS period_locks ("
               "lock_id TEXT NOT NULL UNIQUE, "
               "organization_id TEXT NOT NULL, "
               "period CHAR(7) NOT NULL, "
               "status TEXT NOT NULL CHECK (status IN ('locked', 'unlocked_amendment')), "
               "locked_by TEXT NOT NULL, "
               "locked_at TEXT NOT NULL, "
               "lock_reason TEXT NOT NULL DEFAULT '', "
               "unlocked_by TEXT, "
               "unlocked_at TEXT, "
               "unlock_reason TEXT, "
               "unlock_expires_at TEXT, "
               "unlock_extension_count INTEGER NOT NULL DEFAULT 0, "
               "created_at TEXT NOT NULL, "
               "updated_at TEXT NOT NULL, "
               "PRIMARY KEY (organization_id, period))");
        W.exec("CREATE INDEX IF NOT EXISTS period_locks_expiry_idx "
               "ON period_locks (status, unlock_expires_at)");

        W.exec("CREATE TABLE IF NOT EXISTS journal_entries ("
               "entry_id TEXT PRIMARY KEY, "
               "organization_id TEXT NOT NULL, "
               "entry_date TEXT NOT NULL, "
               "entry_type TEXT NOT NULL, "
               "description TEXT NOT NULL DEFAULT '', "
               "lines TEXT NOT NULL, "
               "total_debit_micros BIGINT NOT NULL, "
               "total_credit_micros BIGINT NOT NULL, "
               "source_document_type TEXT NOT NULL, "
               "source_document_id TEXT NOT NULL, "
               "created_by TEXT NOT NULL, "
               "reversal_of TEXT, "
               "created_at TEXT NOT NULL, "
               "entry_hash CHAR(64) NOT NULL, "
               "CHECK (total_debit_micros = total_credit_micros), "
               "UNIQUE (organization_id, source_document_type, source_document_id))");
        W.exec("ALTER TABLE journal_entries ADD COLUMN IF NOT EXISTS reference_number TEXT NOT NULL DEFAULT ''");
        W.exec("CREATE UNIQUE INDEX IF NOT EXISTS journal_entries_reference_idx "
               "ON journal_entries (organization_id, reference_number) WHERE reference_number <> ''");

        W.exec("CREATE TABLE IF NOT EXISTS entry_sequences ("
               "organization_id TEXT NOT NULL, "
               "series TEXT NOT NULL, "
               "last_value BIGINT NOT NULL, "
               "PRIMARY KEY (organization_id, series))");

        W.exec("CREATE TABLE IF NOT EXISTS audit_logs ("
               "id BIGSERIAL PRIMARY KEY, "
               "organization_id TEXT NOT NULL, "
               "user_id TEXT NOT NULL, "
               "user_role TEXT NOT NULL DEFAULT '', "
               "action TEXT NOT NULL, "
               "resource_type TEXT NOT NULL, "
               "resource_id TEXT NOT NULL, "
               "timestamp TEXT NOT NULL, "
               "ip_address TEXT NOT NULL DEFAULT '', "
               "before_snapshot TEXT, "
               "after_snapshot TEXT)");
        W.exec("CREATE INDEX IF NOT EXISTS audit_logs_resource_idx "
               "ON audit_logs (organization_id, resource_type, resource_id)");

        W.commit();
        lgate_log("INFO", "Database schema verified.");
    } catch (const std::exception& e) {
        throw StoreError(std::string("Schema initialisation failed: ") + e.what());
    }
}

// --- Period locks -----------------------------------------------------------

std::optional<PeriodLock> PgStore::find_lock(const std::string& organization_id, const std::string& period) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec(std::string("SELECT ") + LOCK_COLUMNS + " FROM period_locks WHERE organization_id = " +
                                W.quote(organization_id) + " AND period = " + W.quote(period));
        W.commit();
        if (R.empty()) return std::nullopt;
        return lock_from_row(R[0]);
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("find_lock failed: ") + e.what());
    }
}

std::vector<PeriodLock> PgStore::list_locks(const std::string& organization_id, const std::string& year) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        std::string query = std::string("SELECT ") + LOCK_COLUMNS + " FROM period_locks WHERE organization_id = " +
                            W.quote(organization_id);
        if (!year.empty()) query += " AND period LIKE " + W.quote(year + "-%");
        query += " ORDER BY period DESC";

        pqxx::result R = W.exec(query);
        W.commit();

        std::vector<PeriodLock> locks;
        for (auto row : R) locks.push_back(lock_from_row(row));
        return locks;
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("list_locks failed: ") + e.what());
    }
}

bool PgStore::insert_lock(const PeriodLock& lock) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec(std::string("INSERT INTO period_locks (") + LOCK_COLUMNS + ") VALUES (" +
                                W.quote(lock.lock_id) + ", " +
                                W.quote(lock.organization_id) + ", " +
                                W.quote(lock.period) + ", " +
                                W.quote(std::string(lock_status_name(lock.status))) + ", " +
                                W.quote(lock.locked_by) + ", " +
                                W.quote(to_iso8601(lock.locked_at)) + ", " +
                                W.quote(lock.lock_reason) + ", " +
                                quote_opt(W, lock.unlocked_by) + ", " +
                                quote_opt_time(W, lock.unlocked_at) + ", " +
                                quote_opt(W, lock.unlock_reason) + ", " +
                                quote_opt_time(W, lock.unlock_expires_at) + ", " +
                                std::to_string(lock.unlock_extension_count) + ", " +
                                W.quote(to_iso8601(lock.created_at)) + ", " +
                                W.quote(to_iso8601(lock.updated_at)) +
                                ") ON CONFLICT (organization_id, period) DO NOTHING");
        W.commit();
        return R.affected_rows() == 1;
    } catch (const std::exception& e) {
        throw StoreError(std::string("insert_lock failed: ") + e.what());
    }
}

bool PgStore::update_lock_if(const PeriodLock& updated, LockStatus expected_status, int expected_extension_count) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec("UPDATE period_locks SET "
                                "status = " + W.quote(std::string(lock_status_name(updated.status))) +
                                ", locked_by = " + W.quote(updated.locked_by) +
                                ", locked_at = " + W.quote(to_iso8601(updated.locked_at)) +
                                ", lock_reason = " + W.quote(updated.lock_reason) +
                                ", unlocked_by = " + quote_opt(W, updated.unlocked_by) +
                                ", unlocked_at = " + quote_opt_time(W, updated.unlocked_at) +
                                ", unlock_reason = " + quote_opt(W, updated.unlock_reason) +
                                ", unlock_expires_at = " + quote_opt_time(W, updated.unlock_expires_at) +
                                ", unlock_extension_count = " + std::to_string(updated.unlock_extension_count) +
                                ", updated_at = " + W.quote(to_iso8601(updated.updated_at)) +
                                " WHERE organization_id = " + W.quote(updated.organization_id) +
                                " AND period = " + W.quote(updated.period) +
                                " AND status = " + W.quote(std::string(lock_status_name(expected_status))) +
                                " AND unlock_extension_count = " + std::to_string(expected_extension_count));
        W.commit();
        return R.affected_rows() == 1;
    } catch (const std::exception& e) {
        throw StoreError(std::string("update_lock_if failed: ") + e.what());
    }
}

std::vector<PeriodLock> PgStore::find_expired_amendments(Timestamp now) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec(std::string("SELECT ") + LOCK_COLUMNS +
                                " FROM period_locks WHERE status = 'unlocked_amendment'"
                                " AND unlock_expires_at IS NOT NULL AND unlock_expires_at <= " +
                                W.quote(to_iso8601(now)) + " ORDER BY organization_id, period");
        W.commit();

        std::vector<PeriodLock> locks;
        for (auto row : R) locks.push_back(lock_from_row(row));
        return locks;
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("find_expired_amendments failed: ") + e.what());
    }
}

// --- Journal entries --------------------------------------------------------

bool PgStore::insert_entry(const JournalEntry& entry) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec(std::string("INSERT INTO journal_entries (") + ENTRY_COLUMNS +
                                ", total_debit_micros, total_credit_micros) VALUES (" +
                                W.quote(entry.entry_id) + ", " +
                                W.quote(entry.reference_number) + ", " +
                                W.quote(entry.organization_id) + ", " +
                                W.quote(format_date(entry.entry_date)) + ", " +
                                W.quote(std::string(entry_type_name(entry.entry_type))) + ", " +
                                W.quote(entry.description) + ", " +
                                W.quote(lines_to_storage_json(entry.lines).dump()) + ", " +
                                W.quote(entry.source_document_type) + ", " +
                                W.quote(entry.source_document_id) + ", " +
                                W.quote(entry.created_by) + ", " +
                                (entry.reversal_of.empty() ? std::string("NULL") : W.quote(entry.reversal_of)) + ", " +
                                W.quote(to_iso8601(entry.created_at)) + ", " +
                                W.quote(entry.entry_hash) + ", " +
                                std::to_string(entry.total_debit()) + ", " +
                                std::to_string(entry.total_credit()) +
                                ") ON CONFLICT (organization_id, source_document_type, source_document_id) DO NOTHING");
        W.commit();
        return R.affected_rows() == 1;
    } catch (const std::exception& e) {
        throw StoreError(std::string("insert_entry failed: ") + e.what());
    }
}

std::optional<JournalEntry> PgStore::find_entry(const std::string& organization_id, const std::string& entry_id) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec(std::string("SELECT ") + ENTRY_COLUMNS + " FROM journal_entries WHERE organization_id = " +
                                W.quote(organization_id) + " AND entry_id = " + W.quote(entry_id));
        W.commit();
        if (R.empty()) return std::nullopt;
        return entry_from_row(R[0]);
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("find_entry failed: ") + e.what());
    }
}

std::optional<JournalEntry> PgStore::find_entry_by_source(const std::string& organization_id,
                                                          const std::string& source_document_type,
                                                          const std::string& source_document_id) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec(std::string("SELECT ") + ENTRY_COLUMNS + " FROM journal_entries WHERE organization_id = " +
                                W.quote(organization_id) +
                                " AND source_document_type = " + W.quote(source_document_type) +
                                " AND source_document_id = " + W.quote(source_document_id));
        W.commit();
        if (R.empty()) return std::nullopt;
        return entry_from_row(R[0]);
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("find_entry_by_source failed: ") + e.what());
    }
}

// The upsert takes a row lock, so concurrent callers are serialized.
int64_t PgStore::next_sequence(const std::string& organization_id, const std::string& series) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec("INSERT INTO entry_sequences (organization_id, series, last_value) VALUES (" +
                                W.quote(organization_id) + ", " + W.quote(series) + ", 1) "
                                "ON CONFLICT (organization_id, series) "
                                "DO UPDATE SET last_value = entry_sequences.last_value + 1 "
                                "RETURNING last_value");
        W.commit();
        return R[0][0].as<int64_t>();
    } catch (const std::exception& e) {
        throw StoreError(std::string("next_sequence failed: ") + e.what());
    }
}

// --- Audit log --------------------------------------------------------------

void PgStore::append_audit(const AuditLogEntry& entry) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("INSERT INTO audit_logs (organization_id, user_id, user_role, action, resource_type, resource_id, "
               "timestamp, ip_address, before_snapshot, after_snapshot) VALUES (" +
               W.quote(entry.organization_id) + ", " +
               W.quote(entry.user_id) + ", " +
               W.quote(entry.user_role) + ", " +
               W.quote(entry.action) + ", " +
               W.quote(entry.resource_type) + ", " +
               W.quote(entry.resource_id) + ", " +
               W.quote(to_iso8601(entry.timestamp)) + ", " +
               W.quote(entry.ip) + ", " +
               snapshot_sql(W, entry.before_snapshot) + ", " +
               snapshot_sql(W, entry.after_snapshot) + ")");
        W.commit();
    } catch (const std::exception& e) {
        throw StoreError(std::string("append_audit failed: ") + e.what());
    }
}

std::vector<AuditLogEntry> PgStore::list_audit(const std::string& organization_id,
                                               const std::string& resource_type,
                                               const std::string& resource_id) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        std::string query = "SELECT organization_id, user_id, user_role, action, resource_type, resource_id, "
                            "timestamp, ip_address, before_snapshot, after_snapshot FROM audit_logs "
                            "WHERE organization_id = " + W.quote(organization_id);
        if (!resource_type.empty()) query += " AND resource_type = " + W.quote(resource_type);
        if (!resource_id.empty()) query += " AND resource_id = " + W.quote(resource_id);
        query += " ORDER BY id ASC";

        pqxx::result R = W.exec(query);
        W.commit();

        std::vector<AuditLogEntry> entries;
        for (auto row : R) {
            AuditLogEntry entry;
            entry.organization_id = row["organization_id"].as<std::string>();
            entry.user_id = row["user_id"].as<std::string>();
            entry.user_role = row["user_role"].as<std::string>();
            entry.action = row["action"].as<std::string>();
            entry.resource_type = row["resource_type"].as<std::string>();
            entry.resource_id = row["resource_id"].as<std::string>();
            entry.timestamp = read_time(row["timestamp"], "timestamp");
            entry.ip = row["ip_address"].as<std::string>();
            entry.before_snapshot = read_snapshot(row["before_snapshot"]);
            entry.after_snapshot = read_snapshot(row["after_snapshot"]);
            entries.push_back(entry);
        }
        return entries;
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("list_audit failed: ") + e.what());
    }
}

} // namespace lgate
