/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The persistence contract. Each service receives a Store at construction;
 * there is no global database handle.
 *
 * * CONTRACT:
 * - Every lock transition goes through update_lock_if(), a single conditional
 *   write on (status, unlock_extension_count). A false return means another
 *   writer got there first.
 * - (organization_id, period) is unique for locks, and
 *   (organization_id, source_document_type, source_document_id) is unique for
 *   journal entries. The insert methods report a collision instead of
 *   throwing.
 * - Journal entries and audit entries are never updated or deleted.
 * - Infrastructure failures throw StoreError.
 * ============================================================================
 */

#ifndef LGATE_STORE_HPP
#define LGATE_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"

namespace lgate {

    class Store {
    public:
        virtual ~Store() {}

        // --- Period locks ---------------------------------------------------

        virtual std::optional<PeriodLock> find_lock(const std::string& organization_id,
                                                    const std::string& period) = 0;

        /**
         * @brief Locks of one organization, newest period first.
         * @param year "2025" to restrict to one calendar year, empty for all.
         */
        virtual std::vector<PeriodLock> list_locks(const std::string& organization_id,
                                                   const std::string& year) = 0;

        // false if a record for (organization_id, period) already exists
        virtual bool insert_lock(const PeriodLock& lock) = 0;

        /**
         * @brief Compare-and-swap on a lock record.
         * Replaces the stored record for (updated.organization_id,
         * updated.period) only if its status and extension count still equal
         * the expected values.
         * @return true if the write happened.
         */
        virtual bool update_lock_if(const PeriodLock& updated,
                                    LockStatus expected_status,
                                    int expected_extension_count) = 0;

        // unlocked_amendment records, across all organizations, whose expiry <= now
        virtual std::vector<PeriodLock> find_expired_amendments(Timestamp now) = 0;

        // --- Journal entries ------------------------------------------------

        // false if the source document already has an entry
        virtual bool insert_entry(const JournalEntry& entry) = 0;

        virtual std::optional<JournalEntry> find_entry(const std::string& organization_id,
                                                       const std::string& entry_id) = 0;

        virtual std::optional<JournalEntry> find_entry_by_source(const std::string& organization_id,
                                                                 const std::string& source_document_type,
                                                                 const std::string& source_document_id) = 0;

        /**
         * @brief Next value of a per-organization counter, starting at 1.
         * Concurrent callers never receive the same value. A value taken by
         * a post that then loses its insert is not handed out again.
         */
        virtual int64_t next_sequence(const std::string& organization_id, const std::string& series) = 0;

        // --- Audit log ------------------------------------------------------

        virtual void append_audit(const AuditLogEntry& entry) = 0;

        // Oldest first. An empty resource_type or resource_id matches everything.
        virtual std::vector<AuditLogEntry> list_audit(const std::string& organization_id,
                                                      const std::string& resource_type,
                                                      const std::string& resource_id) = 0;
    };

} // namespace lgate

#endif // LGATE_STORE_HPP
