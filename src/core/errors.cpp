/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.cpp
 * ============================================================================
 */

#include "errors.hpp"

namespace lgate {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::validation: return "VALIDATION";
        case ErrorCode::forbidden: return "FORBIDDEN";
        case ErrorCode::not_found: return "NOT_FOUND";
        case ErrorCode::conflict: return "CONFLICT";
        case ErrorCode::period_locked: return "PERIOD_LOCKED";
        case ErrorCode::invariant_violation: return "INTERNAL_INVARIANT_VIOLATION";
        case ErrorCode::posting_failed: return "POSTING_FAILED";
    }
    return "UNKNOWN";
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::validation: return 400;
        case ErrorCode::forbidden: return 403;
        case ErrorCode::not_found: return 404;
        case ErrorCode::conflict: return 409;
        case ErrorCode::period_locked: return 409;
        case ErrorCode::invariant_violation: return 500;
        case ErrorCode::posting_failed: return 500;
    }
    return 500;
}

LedgerError::LedgerError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

json LedgerError::to_json() const {
    return {
        {"error", what()},
        {"code", error_code_name(code_)}
    };
}

PeriodLockedError::PeriodLockedError(const std::string& period, const std::string& locked_by, const std::string& locked_at)
    : LedgerError(ErrorCode::period_locked,
                  "Period " + period + " is locked for this organization. Unlock the period or use a date in an open period."),
      period_(period), locked_by_(locked_by), locked_at_(locked_at) {}

json PeriodLockedError::to_json() const {
    json body = LedgerError::to_json();
    body["locked_period"] = period_;
    body["locked_by"] = locked_by_;
    body["locked_at"] = locked_at_;
    return body;
}

InvariantViolation::InvariantViolation(const std::string& message)
    : LedgerError(ErrorCode::invariant_violation, message) {}

json InvariantViolation::to_json() const {
    return {
        {"error", "Internal ledger error. The incident has been logged."},
        {"code", "INTERNAL_ERROR"}
    };
}

StoreError::StoreError(const std::string& message)
    : LedgerError(ErrorCode::posting_failed, message) {}

json StoreError::to_json() const {
    return {
        {"error", "The ledger store could not complete the request. The incident has been logged."},
        {"code", error_code_name(code())}
    };
}

} // namespace lgate
