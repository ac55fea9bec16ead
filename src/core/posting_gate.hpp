/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: posting_gate.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The single entry point business operations call after they commit a
 * financial document. It checks the period lock, posts the journal entry
 * and writes the audit record.
 *
 * * OUTCOMES:
 * - PeriodLockedError and VALIDATION / NOT_FOUND errors propagate; the
 *   business operation must not go ahead.
 * - An invariant violation is a bug: logged at CRITICAL, reported as
 *   { ok: false, failure: invariant_violation }.
 * - A persistence failure is logged at ERROR with the source document for
 *   manual reconciliation and reported as { ok: false, failure: posting_failed };
 *   the business document stands.
 * ============================================================================
 */

#ifndef LGATE_POSTING_GATE_HPP
#define LGATE_POSTING_GATE_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "audit.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "period_lock.hpp"
#include "postings.hpp"
#include "store.hpp"

using json = nlohmann::json;

namespace lgate {

    struct PostingResult {
        bool ok = false;
        bool created = false;                   // false when an existing entry was returned
        std::string message;
        std::optional<JournalEntry> entry;
        std::optional<ErrorCode> failure;
    };

    void to_json(json& j, const PostingResult& result);

    class PostingGate {
    public:
        PostingGate(PeriodLockService& locks, Store& store, AuditWriter& audit, const EngineConfig& config, Clock clock);

        PostingResult post(const PostingEvent& event, const Actor& actor);

        PostingResult post_invoice(const InvoicePosting& invoice, const Actor& actor);
        PostingResult post_payment_received(const PaymentPosting& payment, const Actor& actor);
        PostingResult post_bill(const BillPosting& bill, const Actor& actor);
        PostingResult post_bill_payment(const BillPaymentPosting& payment, const Actor& actor);
        PostingResult post_expense(const ExpensePosting& expense, const Actor& actor);
        PostingResult post_payroll_run(const PayrollRunPosting& run, const Actor& actor);

        // Each entry is reversible once; a repeat returns the existing reversal.
        PostingResult reverse(const std::string& organization_id, const std::string& entry_id,
                              const std::string& date, const std::string& reason, const Actor& actor);

        std::optional<JournalEntry> find_entry(const std::string& organization_id, const std::string& entry_id);
        std::optional<JournalEntry> find_entry_by_source(const std::string& organization_id,
                                                         const std::string& source_document_type,
                                                         const std::string& source_document_id);

    private:
        // Effective date of the entry, after the lock check has passed.
        CivilDate checked_entry_date(const PostingEvent& event);

        PeriodLockService& locks_;
        Store& store_;
        AuditWriter& audit_;
        JournalPoster poster_;
        Clock clock_;
    };

} // namespace lgate

#endif // LGATE_POSTING_GATE_HPP
