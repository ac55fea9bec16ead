/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: posting_gate.cpp
 * ============================================================================
 */

#include "posting_gate.hpp"
#include <utility>
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
}

void to_json(json& j, const PostingResult& result) {
    j = json{
        {"ok", result.ok},
        {"created", result.created},
        {"message", result.message},
        {"entry", result.entry ? entry_view(*result.entry) : json(nullptr)}
    };
    if (result.failure) j["failure"] = error_code_name(*result.failure);
}

PostingGate::PostingGate(PeriodLockService& locks, Store& store, AuditWriter& audit, const EngineConfig& config, Clock clock)
    : locks_(locks), store_(store), audit_(audit), poster_(store, config, clock), clock_(std::move(clock)) {}

CivilDate PostingGate::checked_entry_date(const PostingEvent& event) {
    std::string organization_id = event_organization(event);
    std::string date_text = trim(event_date(event));

    if (date_text.empty()) {
        // Throws VALIDATION unless the missing-context bypass is on.
        locks_.check(organization_id, date_text);
        CivilDate today = utc_date(clock_());
        lgate_log("WARN", posting_kind(event) + " " + event_source_id(event) + " has no effective date; posting on " +
                          format_date(today));
        // The substituted date is still subject to the lock.
        locks_.check(organization_id, today);
        return today;
    }

    std::optional<CivilDate> date = parse_effective_date(date_text);
    if (!date) {
        throw LedgerError(ErrorCode::validation, "Unreadable effective date '" + date_text + "'. Use YYYY-MM-DD.");
    }
    locks_.check(organization_id, *date);
    return *date;
}

PostingResult PostingGate::post(const PostingEvent& event, const Actor& actor) {
    std::string kind = posting_kind(event);
    std::string source_id = event_source_id(event);
    std::string organization_id = event_organization(event);

    // Lock check failures (including an unreachable store) propagate.
    CivilDate entry_date = checked_entry_date(event);

    PostingResult result;
    try {
        PostOutcome outcome = poster_.post(event, entry_date, actor.user_id);
        result.ok = true;
        result.created = outcome.created;
        result.entry = outcome.entry;

        if (outcome.created) {
            const char* action = kind == SOURCE_REVERSAL ? ACTION_REVERSE_JOURNAL_ENTRY : ACTION_POST_JOURNAL_ENTRY;
            audit_.append(organization_id, actor, action, RESOURCE_JOURNAL_ENTRY, outcome.entry.entry_id,
                          json(nullptr), entry_view(outcome.entry));
            result.message = "Journal entry " + outcome.entry.entry_id + " posted for " + kind + " " + source_id;
            lgate_log("INFO", result.message + " (org " + organization_id + ", " +
                              format_amount(outcome.entry.total_debit()) + ")");
        } else {
            result.message = "Journal entry " + outcome.entry.entry_id + " already exists for " + kind + " " + source_id;
            lgate_log("DEBUG", result.message);
        }
    } catch (const InvariantViolation& e) {
        lgate_log("CRITICAL", "Ledger invariant violated posting " + kind + " " + source_id +
                              " (org " + organization_id + "): " + e.what());
        result.ok = false;
        result.message = "Internal ledger error";
        result.failure = ErrorCode::invariant_violation;
    } catch (const StoreError& e) {
        lgate_log("ERROR", "Posting failed for " + kind + " " + source_id + " (org " + organization_id +
                           "), reconcile manually: " + e.what());
        result.ok = false;
        result.message = "Journal entry could not be saved. The document is recorded; the ledger needs reconciliation.";
        result.failure = ErrorCode::posting_failed;
    }
    return result;
}

PostingResult PostingGate::post_invoice(const InvoicePosting& invoice, const Actor& actor) {
    return post(PostingEvent(invoice), actor);
}

PostingResult PostingGate::post_payment_received(const PaymentPosting& payment, const Actor& actor) {
    return post(PostingEvent(payment), actor);
}

PostingResult PostingGate::post_bill(const BillPosting& bill, const Actor& actor) {
    return post(PostingEvent(bill), actor);
}

PostingResult PostingGate::post_bill_payment(const BillPaymentPosting& payment, const Actor& actor) {
    return post(PostingEvent(payment), actor);
}

PostingResult PostingGate::post_expense(const ExpensePosting& expense, const Actor& actor) {
    return post(PostingEvent(expense), actor);
}

PostingResult PostingGate::post_payroll_run(const PayrollRunPosting& run, const Actor& actor) {
    return post(PostingEvent(run), actor);
}

PostingResult PostingGate::reverse(const std::string& organization_id, const std::string& entry_id,
                                   const std::string& date, const std::string& reason, const Actor& actor) {
    if (entry_id.empty()) {
        throw LedgerError(ErrorCode::validation, "entry_id is required");
    }
    ReversalPosting reversal;
    reversal.organization_id = organization_id;
    reversal.entry_id = entry_id;
    reversal.date = date;
    reversal.reason = reason;
    return post(PostingEvent(reversal), actor);
}

std::optional<JournalEntry> PostingGate::find_entry(const std::string& organization_id, const std::string& entry_id) {
    return store_.find_entry(organization_id, entry_id);
}

std::optional<JournalEntry> PostingGate::find_entry_by_source(const std::string& organization_id,
                                                              const std::string& source_document_type,
                                                              const std::string& source_document_id) {
    return store_.find_entry_by_source(organization_id, source_document_type, source_document_id);
}

} // namespace lgate
