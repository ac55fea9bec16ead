/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: period_lock.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Financial period locking. A period is one calendar month of one
 * organization. Once locked, no journal entry may be dated inside it until
 * an owner or admin opens a bounded amendment window.
 *
 * * STATE MACHINE:
 *   (no record) --lock--> locked --unlock--> unlocked_amendment
 *   unlocked_amendment --lock / auto_relock--> locked
 *   unlocked_amendment --extend--> unlocked_amendment  (at most twice)
 *
 * Every transition is one Store::update_lock_if() call; losing a race
 * surfaces as CONFLICT.
 * ============================================================================
 */

#ifndef LGATE_PERIOD_LOCK_HPP
#define LGATE_PERIOD_LOCK_HPP

#include <optional>
#include <string>
#include <vector>
#include "audit.hpp"
#include "config.hpp"
#include "models.hpp"
#include "store.hpp"
#include "time_util.hpp"

namespace lgate {

    constexpr int MAX_UNLOCK_EXTENSIONS = 2;
    constexpr int MAX_TOTAL_UNLOCK_DAYS = 7;
    constexpr int MAX_UNLOCK_WINDOW_HOURS = 168;
    constexpr size_t MIN_UNLOCK_REASON_LENGTH = 10;
    constexpr const char* SYSTEM_ACTOR = "system";

    // admin, owner, accountant
    bool can_lock_periods(const std::string& role);
    // admin, owner
    bool can_unlock_periods(const std::string& role);

    struct FiscalYearLockResult {
        std::string period;
        std::string status;     // "locked" or "skipped"
        std::string reason;     // why it was skipped
    };

    void to_json(json& j, const FiscalYearLockResult& result);

    class PeriodLockService {
    public:
        PeriodLockService(Store& store, AuditWriter& audit, const EngineConfig& config, Clock clock);

        /**
         * @brief Throws PeriodLockedError if the month of effective_date is
         * locked for the organization. An amendment window, or no record at
         * all, lets the write through.
         *
         * A missing organization or date throws VALIDATION, unless
         * allow_missing_context_bypass is set, in which case the check is
         * skipped with a WARN. An unreadable date is always VALIDATION.
         */
        void check(const std::string& organization_id, const std::string& effective_date);
        void check(const std::string& organization_id, const CivilDate& effective_date);

        PeriodLock lock(const std::string& organization_id, const std::string& period,
                        const Actor& actor, const std::string& reason);

        // window_hours defaults to default_unlock_window_hours.
        PeriodLock unlock(const std::string& organization_id, const std::string& period,
                          const Actor& actor, const std::string& reason,
                          std::optional<int> window_hours = std::nullopt);

        PeriodLock extend(const std::string& organization_id, const std::string& period,
                          const Actor& actor, int additional_hours);

        /**
         * @brief Relocks every amendment window that has expired, across all
         * organizations. Safe to run concurrently from several instances:
         * a record that another sweeper (or an extend) touched first is left
         * alone.
         * @return The number of periods this call relocked.
         */
        int auto_relock();

        /**
         * @brief Locks the twelve months of the fiscal year starting in
         * `year` at the organization's fiscal start month. Each month is
         * attempted independently.
         */
        std::vector<FiscalYearLockResult> lock_fiscal_year(const std::string& organization_id, int year,
                                                           const Actor& actor);

        std::optional<PeriodLock> get(const std::string& organization_id, const std::string& period);
        std::vector<PeriodLock> list(const std::string& organization_id, std::optional<int> year = std::nullopt);
        std::vector<AuditLogEntry> history(const std::string& organization_id, const std::string& period);

    private:
        PeriodLock require_record(const std::string& organization_id, const std::string& period);

        Store& store_;
        AuditWriter& audit_;
        const EngineConfig& config_;
        Clock clock_;
    };

} // namespace lgate

#endif // LGATE_PERIOD_LOCK_HPP
