/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The error taxonomy shared by the lock store, the poster and the HTTP layer.
 * Every failure the engine reports on purpose is a LedgerError; the HTTP
 * handlers turn it into a status code and a JSON body.
 * ============================================================================
 */

#ifndef LGATE_ERRORS_HPP
#define LGATE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lgate {

    enum class ErrorCode {
        validation,          // malformed period, reason, payload
        forbidden,           // role lacks permission
        not_found,           // no lock record / no journal entry
        conflict,            // already locked, wrong state, extension cap
        period_locked,       // write blocked by a closed period
        invariant_violation, // unbalanced entry, always a bug
        posting_failed       // persistence error
    };

    // "VALIDATION", "PERIOD_LOCKED", ...
    const char* error_code_name(ErrorCode code);

    int http_status_for(ErrorCode code);

    class LedgerError : public std::runtime_error {
    public:
        LedgerError(ErrorCode code, const std::string& message);
        virtual ~LedgerError() {}

        ErrorCode code() const { return code_; }
        int http_status() const { return http_status_for(code_); }

        /**
         * @brief The body returned to API callers.
         */
        virtual json to_json() const;

    private:
        ErrorCode code_;
    };

    /**
     * @brief Raised by the lock check. Carries enough detail for the caller
     * to offer "unlock the period or choose another date".
     */
    class PeriodLockedError : public LedgerError {
    public:
        PeriodLockedError(const std::string& period, const std::string& locked_by, const std::string& locked_at);

        const std::string& period() const { return period_; }
        const std::string& locked_by() const { return locked_by_; }
        const std::string& locked_at() const { return locked_at_; }

        json to_json() const override;

    private:
        std::string period_;
        std::string locked_by_;
        std::string locked_at_;
    };

    /**
     * @brief An entry failed the double-entry invariant.
     * what() holds the diagnostic for the log; to_json() never exposes it.
     */
    class InvariantViolation : public LedgerError {
    public:
        explicit InvariantViolation(const std::string& message);

        json to_json() const override;
    };

    /**
     * @brief The persistence layer failed to complete an operation.
     * As with InvariantViolation, the driver message stays in the log.
     */
    class StoreError : public LedgerError {
    public:
        explicit StoreError(const std::string& message);

        json to_json() const override;
    };

} // namespace lgate

#endif // LGATE_ERRORS_HPP
