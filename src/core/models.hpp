/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: models.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The three persisted record types: period locks, journal entries and audit
 * log entries. Journal entries and audit entries are immutable once written.
 * ============================================================================
 */

#ifndef LGATE_MODELS_HPP
#define LGATE_MODELS_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "money.hpp"
#include "time_util.hpp"

using json = nlohmann::json;

namespace lgate {

    // ------------------------------------------------------------------------
    // Period locks
    // ------------------------------------------------------------------------

    enum class LockStatus {
        locked,
        unlocked_amendment
    };

    const char* lock_status_name(LockStatus status);
    std::optional<LockStatus> lock_status_from_string(const std::string& s);

    /**
     * @brief Lock state of one (organization, month).
     * Exactly one record exists per (organization_id, period). While the
     * status is unlocked_amendment the unlock_* fields are set.
     */
    struct PeriodLock {
        std::string lock_id;
        std::string organization_id;
        std::string period;                 // "YYYY-MM"
        LockStatus status = LockStatus::locked;
        std::string locked_by;
        Timestamp locked_at;
        std::string lock_reason;
        std::optional<std::string> unlocked_by;
        std::optional<Timestamp> unlocked_at;
        std::optional<std::string> unlock_reason;
        std::optional<Timestamp> unlock_expires_at;
        int unlock_extension_count = 0;
        Timestamp created_at;
        Timestamp updated_at;
    };

    void to_json(json& j, const PeriodLock& lock);

    // ------------------------------------------------------------------------
    // Journal entries
    // ------------------------------------------------------------------------

    enum class EntryType {
        sales,
        receipt,
        purchase,
        payment,
        expense,
        payroll,
        reversal
    };

    const char* entry_type_name(EntryType type);
    // "JE-SLS", "JE-RCP", ... the leading part of a reference number.
    const char* entry_reference_prefix(EntryType type);
    std::optional<EntryType> entry_type_from_string(const std::string& s);

    /**
     * @brief Represents a single line in a journal entry.
     * Exactly one of debit/credit is non-zero.
     */
    struct LedgerLine {
        std::string account_code;
        std::string account_name;
        money_micro debit = 0;
        money_micro credit = 0;
        std::string description;
    };

    struct JournalEntry {
        std::string entry_id;
        std::string reference_number;       // JE-SLS-202507-00001, sequential per org, prefix and month
        std::string organization_id;
        CivilDate entry_date;
        EntryType entry_type = EntryType::sales;
        std::string description;
        std::vector<LedgerLine> lines;
        std::string source_document_type;
        std::string source_document_id;
        std::string created_by;
        std::string reversal_of;            // empty unless this is a reversal
        Timestamp created_at;
        std::string entry_hash;             // SHA-256 seal, see CoreLedger::seal

        money_micro total_debit() const;
        money_micro total_credit() const;
    };

    // API view: amounts as "1234.50" strings, plus totals.
    void to_json(json& j, const LedgerLine& line);
    void to_json(json& j, const JournalEntry& entry);

    // Storage form of the line list: amounts as integer micros.
    json lines_to_storage_json(const std::vector<LedgerLine>& lines);
    std::vector<LedgerLine> lines_from_storage_json(const json& j);

    // ------------------------------------------------------------------------
    // Audit log
    // ------------------------------------------------------------------------

    struct AuditLogEntry {
        std::string organization_id;
        std::string user_id;
        std::string user_role;
        std::string action;                 // LOCK_PERIOD, POST_JOURNAL_ENTRY, ...
        std::string resource_type;          // period_lock, journal_entry
        std::string resource_id;
        Timestamp timestamp;
        std::string ip;
        json before_snapshot;               // null when there was no prior state
        json after_snapshot;
    };

    void to_json(json& j, const AuditLogEntry& entry);

} // namespace lgate

#endif // LGATE_MODELS_HPP
