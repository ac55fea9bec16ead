/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: audit.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Append-only audit trail for lock transitions and postings.
 * A failed audit write is logged and counted, and never propagates: the
 * operation that triggered it has already happened and stays authoritative.
 * ============================================================================
 */

#ifndef LGATE_AUDIT_HPP
#define LGATE_AUDIT_HPP

#include <atomic>
#include <string>
#include <vector>
#include "models.hpp"
#include "store.hpp"
#include "time_util.hpp"

namespace lgate {

    // Audit action names
    constexpr const char* ACTION_LOCK_PERIOD = "LOCK_PERIOD";
    constexpr const char* ACTION_UNLOCK_PERIOD = "UNLOCK_PERIOD";
    constexpr const char* ACTION_EXTEND_UNLOCK = "EXTEND_UNLOCK";
    constexpr const char* ACTION_AUTO_RELOCK_PERIOD = "AUTO_RELOCK_PERIOD";
    constexpr const char* ACTION_POST_JOURNAL_ENTRY = "POST_JOURNAL_ENTRY";
    constexpr const char* ACTION_REVERSE_JOURNAL_ENTRY = "REVERSE_JOURNAL_ENTRY";

    // Resource types
    constexpr const char* RESOURCE_PERIOD_LOCK = "period_lock";
    constexpr const char* RESOURCE_JOURNAL_ENTRY = "journal_entry";

    /**
     * @brief Who is acting. Supplied by the gateway headers on HTTP requests,
     * or built by the caller for in-process use.
     */
    struct Actor {
        std::string user_id;
        std::string role;
        std::string ip;
    };

    class AuditWriter {
    public:
        AuditWriter(Store& store, Clock clock);

        /**
         * @brief Writes one immutable record stamped with the current time.
         * @return false if the store rejected the write (already logged).
         */
        bool append(const std::string& organization_id,
                    const std::string& user_id,
                    const std::string& user_role,
                    const std::string& action,
                    const std::string& resource_type,
                    const std::string& resource_id,
                    const json& before_snapshot,
                    const json& after_snapshot,
                    const std::string& ip);

        bool append(const std::string& organization_id, const Actor& actor,
                    const std::string& action, const std::string& resource_type, const std::string& resource_id,
                    const json& before_snapshot, const json& after_snapshot);

        // Trail of one resource, oldest first. Store failures propagate.
        std::vector<AuditLogEntry> history(const std::string& organization_id,
                                           const std::string& resource_type,
                                           const std::string& resource_id);

        size_t failed_appends() const { return failed_appends_.load(); }

    private:
        Store& store_;
        Clock clock_;
        std::atomic<size_t> failed_appends_;
    };

} // namespace lgate

#endif // LGATE_AUDIT_HPP
