/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * memory_store.hpp - Process-local Store
 * Used by the test suite and by the server when no database is configured.
 * One mutex guards every collection, which makes every method atomic.
 */

#ifndef LGATE_MEMORY_STORE_HPP
#define LGATE_MEMORY_STORE_HPP

#include <map>
#include <mutex>
#include <tuple>
#include "store.hpp"

namespace lgate {

class MemoryStore : public Store {
public:
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

    size_t entry_count() const;

private:
    typedef std::pair<std::string, std::string> LockKey;                       // org, period
    typedef std::tuple<std::string, std::string, std::string> SourceKey;       // org, type, id

    mutable std::mutex mutex_;
    std::map<LockKey, PeriodLock> locks_;
    std::vector<JournalEntry> entries_;
    std::map<SourceKey, size_t> entries_by_source_;
    std::map<std::pair<std::string, std::string>, int64_t> sequences_;     // org, series
    std::vector<AuditLogEntry> audit_;
};

} // namespace lgate

#endif // LGATE_MEMORY_STORE_HPP
