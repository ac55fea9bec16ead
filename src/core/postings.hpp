/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: postings.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The business events that move money. Each kind is its own struct and the
 * set is closed: PostingEvent is a std::variant over all of them, and every
 * consumer visits it exhaustively.
 *
 * Every event carries the organization, the effective date exactly as the
 * caller supplied it (parsed later by the lock check), and the id of the
 * source document, which makes posting idempotent.
 * ============================================================================
 */

#ifndef LGATE_POSTINGS_HPP
#define LGATE_POSTINGS_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "money.hpp"
#include "tax_calculator.hpp"

using json = nlohmann::json;

namespace lgate {

    // Source document types (journal_entries.source_document_type)
    constexpr const char* SOURCE_INVOICE = "invoice";
    constexpr const char* SOURCE_PAYMENT_RECEIVED = "payment_received";
    constexpr const char* SOURCE_BILL = "bill";
    constexpr const char* SOURCE_BILL_PAYMENT = "bill_payment";
    constexpr const char* SOURCE_EXPENSE = "expense";
    constexpr const char* SOURCE_PAYROLL_RUN = "payroll_run";
    constexpr const char* SOURCE_REVERSAL = "reversal";

    /**
     * @brief Tax-bearing document amounts, shared by invoices and bills.
     * Resolution order when the poster builds the entry:
     *   1. line_items present: computed by the tax calculator, IGST when the
     *      place of supply differs from the organization's state;
     *   2. any of cgst/sgst/igst non-zero: used as given;
     *   3. otherwise tax_total is split CGST/SGST.
     * A supplied total must equal sub_total + taxes.
     */
    struct DocumentAmounts {
        money_micro sub_total = 0;
        money_micro cgst = 0;
        money_micro sgst = 0;
        money_micro igst = 0;
        money_micro tax_total = 0;
        std::optional<money_micro> total;
        std::vector<LineItemInput> line_items;
        std::string place_of_supply;        // state code or counterparty GSTIN
        bool is_inclusive = false;
    };

    struct InvoicePosting {
        std::string organization_id;
        std::string invoice_id;
        std::string invoice_number;
        std::string customer_name;
        std::string date;
        DocumentAmounts amounts;
    };

    struct PaymentPosting {
        std::string organization_id;
        std::string payment_id;
        std::string invoice_id;
        std::string invoice_number;
        std::string customer_name;
        std::string reference_number;
        std::string date;
        money_micro amount = 0;
        std::string payment_mode = "bank";
    };

    struct BillPosting {
        std::string organization_id;
        std::string bill_id;
        std::string bill_number;
        std::string vendor_name;
        std::string date;
        std::string expense_account;        // chart code or name; empty = COGS
        DocumentAmounts amounts;
    };

    struct BillPaymentPosting {
        std::string organization_id;
        std::string payment_id;
        std::string bill_id;
        std::string bill_number;
        std::string vendor_name;
        std::string reference_number;
        std::string date;
        money_micro amount = 0;
        std::string payment_mode = "bank";
    };

    struct ExpensePosting {
        std::string organization_id;
        std::string expense_id;
        std::string date;
        money_micro amount = 0;
        std::string expense_account;        // chart code or name; empty = Miscellaneous
        std::string paid_through = "bank";
        std::string description;
        std::string reference_number;
    };

    // One employee's payslip. gross == net + tds + pf_employee + esi_employee + professional_tax
    struct PayrollRecord {
        std::string employee_id;
        money_micro gross = 0;
        money_micro net = 0;
        money_micro tds = 0;
        money_micro pf_employee = 0;
        money_micro pf_employer = 0;
        money_micro esi_employee = 0;
        money_micro esi_employer = 0;
        money_micro professional_tax = 0;
    };

    struct PayrollRunPosting {
        std::string organization_id;
        std::string payroll_run_id;
        std::string pay_date;
        std::string month;
        std::string year;
        std::vector<PayrollRecord> records;
    };

    struct ReversalPosting {
        std::string organization_id;
        std::string entry_id;               // the entry being reversed
        std::string date;
        std::string reason;
    };

    typedef std::variant<InvoicePosting,
                         PaymentPosting,
                         BillPosting,
                         BillPaymentPosting,
                         ExpensePosting,
                         PayrollRunPosting,
                         ReversalPosting> PostingEvent;

    // "invoice", "payment_received", ... (also the source document type)
    std::string posting_kind(const PostingEvent& event);
    std::string event_organization(const PostingEvent& event);
    std::string event_date(const PostingEvent& event);
    std::string event_source_id(const PostingEvent& event);

    /**
     * @brief Builds an event from an API payload. The organization comes
     * from the caller's tenant context, never from the payload.
     * Unknown kinds, missing source ids and malformed fields throw
     * LedgerError (VALIDATION).
     */
    PostingEvent posting_from_json(const std::string& kind, const std::string& organization_id, const json& payload);

} // namespace lgate

#endif // LGATE_POSTINGS_HPP
