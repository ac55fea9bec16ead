/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: period_lock.cpp
 * ============================================================================
 */

#include "period_lock.hpp"
#include <utility>
#include "crypto.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace lgate {

namespace {

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    std::string concurrent_change(const std::string& period) {
        return "Period " + period + " was changed by another request. Reload and try again.";
    }

    void clear_amendment(PeriodLock& record) {
        record.unlocked_by.reset();
        record.unlocked_at.reset();
        record.unlock_reason.reset();
        record.unlock_expires_at.reset();
        record.unlock_extension_count = 0;
    }
}

bool can_lock_periods(const std::string& role) {
    return role == "admin" || role == "owner" || role == "accountant";
}

bool can_unlock_periods(const std::string& role) {
    return role == "admin" || role == "owner";
}

void to_json(json& j, const FiscalYearLockResult& result) {
    j = json{{"period", result.period}, {"status", result.status}};
    if (!result.reason.empty()) j["reason"] = result.reason;
}

PeriodLockService::PeriodLockService(Store& store, AuditWriter& audit, const EngineConfig& config, Clock clock)
    : store_(store), audit_(audit), config_(config), clock_(std::move(clock)) {}

// ----------------------------------------------------------------------------
// Posting guard
// ----------------------------------------------------------------------------

void PeriodLockService::check(const std::string& organization_id, const std::string& effective_date) {
    std::string date_text = trim(effective_date);
    if (organization_id.empty() || date_text.empty()) {
        if (config_.allow_missing_context_bypass) {
            lgate_log("WARN", "Period lock check bypassed: missing organization or effective date (org='" +
                              organization_id + "', date='" + date_text + "').");
            return;
        }
        throw LedgerError(ErrorCode::validation, "Organization and effective date are required to post a financial transaction");
    }

    std::optional<CivilDate> date = parse_effective_date(date_text);
    if (!date) {
        throw LedgerError(ErrorCode::validation, "Unreadable effective date '" + date_text + "'. Use YYYY-MM-DD.");
    }
    check(organization_id, *date);
}

void PeriodLockService::check(const std::string& organization_id, const CivilDate& effective_date) {
    if (organization_id.empty()) {
        if (config_.allow_missing_context_bypass) {
            lgate_log("WARN", "Period lock check bypassed: missing organization for " + format_date(effective_date));
            return;
        }
        throw LedgerError(ErrorCode::validation, "Organization is required to post a financial transaction");
    }

    std::string period = period_of(effective_date);
    std::optional<PeriodLock> record = store_.find_lock(organization_id, period);
    if (record && record->status == LockStatus::locked) {
        throw PeriodLockedError(period, record->locked_by, to_iso8601(record->locked_at));
    }
}

// ----------------------------------------------------------------------------
// Transitions
// ----------------------------------------------------------------------------

PeriodLock PeriodLockService::lock(const std::string& organization_id, const std::string& period,
                                   const Actor& actor, const std::string& reason) {
    if (!can_lock_periods(actor.role)) {
        throw LedgerError(ErrorCode::forbidden, "Only admin, owner, or accountant can lock periods");
    }
    if (!is_valid_period(period)) {
        throw LedgerError(ErrorCode::validation, "Invalid period format. Use YYYY-MM.");
    }

    Timestamp now = clock_();
    std::optional<PeriodLock> existing = store_.find_lock(organization_id, period);

    if (existing && existing->status == LockStatus::locked) {
        throw LedgerError(ErrorCode::conflict, "Period " + period + " is already locked");
    }

    PeriodLock record;
    if (existing) {
        record = *existing;
        record.status = LockStatus::locked;
        record.locked_by = actor.user_id;
        record.locked_at = now;
        record.lock_reason = reason;
        clear_amendment(record);
        record.updated_at = now;

        if (!store_.update_lock_if(record, LockStatus::unlocked_amendment, existing->unlock_extension_count)) {
            throw LedgerError(ErrorCode::conflict, concurrent_change(period));
        }
        audit_.append(organization_id, actor, ACTION_LOCK_PERIOD, RESOURCE_PERIOD_LOCK, period, json(*existing), json(record));
        lgate_log("INFO", "Period " + period + " re-locked for org " + organization_id + " by " + actor.user_id);
    } else {
        record.lock_id = LedgerCrypto::generate_id("lock");
        record.organization_id = organization_id;
        record.period = period;
        record.status = LockStatus::locked;
        record.locked_by = actor.user_id;
        record.locked_at = now;
        record.lock_reason = reason;
        record.created_at = now;
        record.updated_at = now;

        if (!store_.insert_lock(record)) {
            throw LedgerError(ErrorCode::conflict, concurrent_change(period));
        }
        audit_.append(organization_id, actor, ACTION_LOCK_PERIOD, RESOURCE_PERIOD_LOCK, period, json(nullptr), json(record));
        lgate_log("INFO", "Period " + period + " locked for org " + organization_id + " by " + actor.user_id);
    }
    return record;
}

PeriodLock PeriodLockService::unlock(const std::string& organization_id, const std::string& period,
                                     const Actor& actor, const std::string& reason,
                                     std::optional<int> window_hours) {
    if (!can_unlock_periods(actor.role)) {
        throw LedgerError(ErrorCode::forbidden, "Only admin or owner can unlock periods");
    }
    std::string trimmed_reason = trim(reason);
    if (trimmed_reason.size() < MIN_UNLOCK_REASON_LENGTH) {
        throw LedgerError(ErrorCode::validation, "Unlock reason must be at least 10 characters");
    }
    int hours = window_hours ? *window_hours : config_.default_unlock_window_hours;
    if (hours < 1 || hours > MAX_UNLOCK_WINDOW_HOURS) {
        throw LedgerError(ErrorCode::validation, "Unlock window must be between 1 and 168 hours");
    }
    if (!is_valid_period(period)) {
        throw LedgerError(ErrorCode::validation, "Invalid period format. Use YYYY-MM.");
    }

    PeriodLock existing = require_record(organization_id, period);
    if (existing.status != LockStatus::locked) {
        throw LedgerError(ErrorCode::conflict, "Period " + period + " is not currently locked (status: " +
                                               lock_status_name(existing.status) + ")");
    }

    Timestamp now = clock_();
    PeriodLock record = existing;
    record.status = LockStatus::unlocked_amendment;
    record.unlocked_by = actor.user_id;
    record.unlocked_at = now;
    record.unlock_reason = trimmed_reason;
    record.unlock_expires_at = now + std::chrono::hours(hours);
    record.unlock_extension_count = 0;
    record.updated_at = now;

    if (!store_.update_lock_if(record, LockStatus::locked, existing.unlock_extension_count)) {
        throw LedgerError(ErrorCode::conflict, concurrent_change(period));
    }
    audit_.append(organization_id, actor, ACTION_UNLOCK_PERIOD, RESOURCE_PERIOD_LOCK, period, json(existing), json(record));
    lgate_log("WARN", "Period " + period + " opened for amendment in org " + organization_id + " by " + actor.user_id +
                      " until " + to_iso8601(*record.unlock_expires_at) + ": " + trimmed_reason);
    return record;
}

PeriodLock PeriodLockService::extend(const std::string& organization_id, const std::string& period,
                                     const Actor& actor, int additional_hours) {
    if (!can_unlock_periods(actor.role)) {
        throw LedgerError(ErrorCode::forbidden, "Only admin or owner can extend unlock windows");
    }
    if (additional_hours <= 0) {
        throw LedgerError(ErrorCode::validation, "Extension must be a positive number of hours");
    }
    if (!is_valid_period(period)) {
        throw LedgerError(ErrorCode::validation, "Invalid period format. Use YYYY-MM.");
    }

    PeriodLock existing = require_record(organization_id, period);
    if (existing.status != LockStatus::unlocked_amendment) {
        throw LedgerError(ErrorCode::conflict, "Period " + period + " is not in amendment window (status: " +
                                               lock_status_name(existing.status) + ")");
    }
    if (existing.unlock_extension_count >= MAX_UNLOCK_EXTENSIONS) {
        throw LedgerError(ErrorCode::conflict, "Maximum extensions (" + std::to_string(MAX_UNLOCK_EXTENSIONS) +
                                               ") reached for period " + period);
    }

    Timestamp now = clock_();
    Timestamp current_expiry = existing.unlock_expires_at ? *existing.unlock_expires_at : now;
    Timestamp new_expiry = current_expiry + std::chrono::hours(additional_hours);

    // Total window never exceeds seven days from the original unlock.
    if (existing.unlocked_at) {
        Timestamp ceiling = *existing.unlocked_at + std::chrono::hours(24 * MAX_TOTAL_UNLOCK_DAYS);
        if (new_expiry > ceiling) new_expiry = ceiling;
    }

    PeriodLock record = existing;
    record.unlock_expires_at = new_expiry;
    record.unlock_extension_count = existing.unlock_extension_count + 1;
    record.updated_at = now;

    if (!store_.update_lock_if(record, LockStatus::unlocked_amendment, existing.unlock_extension_count)) {
        throw LedgerError(ErrorCode::conflict, concurrent_change(period));
    }
    audit_.append(organization_id, actor, ACTION_EXTEND_UNLOCK, RESOURCE_PERIOD_LOCK, period, json(existing), json(record));
    lgate_log("INFO", "Amendment window for " + period + " in org " + organization_id + " extended to " +
                      to_iso8601(new_expiry) + " (extension " + std::to_string(record.unlock_extension_count) + ")");
    return record;
}

int PeriodLockService::auto_relock() {
    Timestamp now = clock_();
    int relocked = 0;

    for (const PeriodLock& expired : store_.find_expired_amendments(now)) {
        PeriodLock record = expired;
        record.status = LockStatus::locked;
        record.locked_by = SYSTEM_ACTOR;
        record.locked_at = now;
        record.lock_reason = "Auto-relocked after amendment window expired";
        record.updated_at = now;

        if (!store_.update_lock_if(record, LockStatus::unlocked_amendment, expired.unlock_extension_count)) {
            continue;
        }
        audit_.append(record.organization_id, SYSTEM_ACTOR, SYSTEM_ACTOR, ACTION_AUTO_RELOCK_PERIOD,
                      RESOURCE_PERIOD_LOCK, record.period, json(expired), json(record), "");
        ++relocked;
    }

    if (relocked > 0) {
        lgate_log("INFO", "Auto-relocked " + std::to_string(relocked) + " expired amendment windows");
    }
    return relocked;
}

std::vector<FiscalYearLockResult> PeriodLockService::lock_fiscal_year(const std::string& organization_id, int year,
                                                                      const Actor& actor) {
    if (!can_lock_periods(actor.role)) {
        throw LedgerError(ErrorCode::forbidden, "Only admin, owner, or accountant can lock periods");
    }
    if (year < 2000 || year > 2099) {
        throw LedgerError(ErrorCode::validation, "Fiscal year must be between 2000 and 2099");
    }

    int start_month = config_.fiscal_year_start_for(organization_id);
    std::string reason = "Fiscal year " + std::to_string(year) + "-" + std::to_string(year + 1) + " close";

    std::vector<FiscalYearLockResult> results;
    for (int i = 0; i < 12; ++i) {
        int month = start_month + i;
        int y = month <= 12 ? year : year + 1;
        int m = month <= 12 ? month : month - 12;

        FiscalYearLockResult result;
        result.period = make_period(y, m);
        try {
            lock(organization_id, result.period, actor, reason);
            result.status = "locked";
        } catch (const LedgerError& e) {
            result.status = "skipped";
            result.reason = e.what();
        }
        results.push_back(result);
    }
    return results;
}

// ----------------------------------------------------------------------------
// Reads
// ----------------------------------------------------------------------------

std::optional<PeriodLock> PeriodLockService::get(const std::string& organization_id, const std::string& period) {
    if (!is_valid_period(period)) {
        throw LedgerError(ErrorCode::validation, "Invalid period format. Use YYYY-MM.");
    }
    return store_.find_lock(organization_id, period);
}

std::vector<PeriodLock> PeriodLockService::list(const std::string& organization_id, std::optional<int> year) {
    if (year && (*year < 1000 || *year > 9999)) {
        throw LedgerError(ErrorCode::validation, "Year must have four digits");
    }
    return store_.list_locks(organization_id, year ? std::to_string(*year) : std::string());
}

std::vector<AuditLogEntry> PeriodLockService::history(const std::string& organization_id, const std::string& period) {
    if (!is_valid_period(period)) {
        throw LedgerError(ErrorCode::validation, "Invalid period format. Use YYYY-MM.");
    }
    return audit_.history(organization_id, RESOURCE_PERIOD_LOCK, period);
}

PeriodLock PeriodLockService::require_record(const std::string& organization_id, const std::string& period) {
    std::optional<PeriodLock> record = store_.find_lock(organization_id, period);
    if (!record) {
        throw LedgerError(ErrorCode::not_found, "No lock record found for period " + period);
    }
    return *record;
}

} // namespace lgate
