/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pg_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL Store over libpqxx. Each call opens its own connection and
 * transaction, so the store can be shared by every request thread.
 * Uniqueness and compare-and-swap are enforced by the database itself
 * (primary key / unique constraint, conditional UPDATE + affected_rows).
 * ============================================================================
 */

#ifndef LGATE_PG_STORE_HPP
#define LGATE_PG_STORE_HPP

#include <string>
#include "store.hpp"

namespace lgate {

class PgStore : public Store {
public:
    explicit PgStore(const std::string& conn_str);

    /**
     * @brief Creates the period_locks, journal_entries, entry_sequences and
     * audit_logs tables and their indexes if they do not exist.
     */
    void ensure_schema();

    std::optional<PeriodLock> find_lock(const std::string& organization_id, const std::string& period) override;
    std::vector<PeriodLock> list_locks(const std::string& organization_id, const std::string& year) override;
    bool insert_lock(const PeriodLock& lock) override;
    bool update_lock_if(const PeriodLock& updated, LockStatus expected_status, int expected_extension_count) override;
    std::vector<PeriodLock> find_expired_amendments(Timestamp now) override;

    bool insert_entry(const JournalEntry& entry) override;
    std::optional<JournalEntry> find_entry(const std::string& organization_id, const std::string& entry_id) override;
    std::optional<JournalEntry> find_entry_by_source(const std::string& organization_id,
                                                     const std::string& source_document_type,
                                                     const std::string& source_document_id) override;
    int64_t next_sequence(const std::string& organization_id, const std::string& series) override;

    void append_audit(const AuditLogEntry& entry) override;
    std::vector<AuditLogEntry> list_audit(const std::string& organization_id,
                                          const std::string& resource_type,
                                          const std::string& resource_id) override;

private:
    std::string conn_str_;
};

} // namespace lgate

#endif // LGATE_PG_STORE_HPP
