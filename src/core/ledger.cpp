/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger.cpp
 * ============================================================================
 * Focus: Double-entry validation, entry sealing, and the fixed debit/credit
 * mapping per posting kind.
 */

#include "ledger.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "accounts.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "tax_calculator.hpp"

namespace lgate {

// ----------------------------------------------------------------------------
// CoreLedger
// ----------------------------------------------------------------------------

void CoreLedger::enforce_balance(const JournalEntry& entry) {
    // A single-sided entry is logically invalid
    if (entry.lines.size() < 2) {
        throw InvariantViolation("Journal entry " + entry.entry_id + " has " + std::to_string(entry.lines.size()) +
                                 " line(s); at least two are required");
    }

    money_micro total_balance = 0;
    for (size_t i = 0; i < entry.lines.size(); ++i) {
        const LedgerLine& line = entry.lines[i];
        if (line.debit < 0 || line.credit < 0) {
            throw InvariantViolation("Journal entry " + entry.entry_id + " line " + std::to_string(i + 1) +
                                     " (" + line.account_code + ") has a negative amount");
        }
        if ((line.debit > 0) == (line.credit > 0)) {
            throw InvariantViolation("Journal entry " + entry.entry_id + " line " + std::to_string(i + 1) +
                                     " (" + line.account_code + ") must carry exactly one of debit or credit");
        }
        total_balance += line.debit;
        total_balance -= line.credit;
    }

    // If the total isn't exactly zero, the entry is rejected.
    if (total_balance != 0) {
        throw InvariantViolation("Journal entry " + entry.entry_id + " unbalanced: debit " +
                                 format_amount(entry.total_debit()) + ", credit " +
                                 format_amount(entry.total_credit()) + ", deviation " +
                                 std::to_string(total_balance) + " micros");
    }
}

std::string CoreLedger::canonical_form(const JournalEntry& entry) {
    std::ostringstream ss;
    ss << entry.entry_id << '|'
       << entry.reference_number << '|'
       << entry.organization_id << '|'
       << format_date(entry.entry_date) << '|'
       << entry_type_name(entry.entry_type) << '|'
       << entry.source_document_type << '|'
       << entry.source_document_id << '|'
       << entry.reversal_of;
    for (const auto& line : entry.lines) {
        ss << '|' << line.account_code << ':' << line.debit << ':' << line.credit;
    }
    return ss.str();
}

std::string CoreLedger::seal(const JournalEntry& entry) {
    return LedgerCrypto::generate_sha256(canonical_form(entry));
}

bool CoreLedger::verify_seal(const JournalEntry& entry) {
    return !entry.entry_hash.empty() && entry.entry_hash == seal(entry);
}

std::string reference_series(EntryType type, const CivilDate& entry_date) {
    std::string period = period_of(entry_date);
    return std::string(entry_reference_prefix(type)) + "-" + period.substr(0, 4) + period.substr(5, 2);
}

std::string format_reference_number(const std::string& series, int64_t sequence) {
    std::string digits = std::to_string(sequence);
    if (digits.size() < 5) digits.insert(0, 5 - digits.size(), '0');
    return series + "-" + digits;
}

json entry_view(const JournalEntry& entry) {
    json j = entry;
    j["seal_valid"] = CoreLedger::verify_seal(entry);
    return j;
}

// ----------------------------------------------------------------------------
// Entry builders
// ----------------------------------------------------------------------------

namespace {

    void require_non_negative(money_micro amount, const char* what) {
        if (amount < 0) throw LedgerError(ErrorCode::validation, std::string(what) + " cannot be negative");
    }

    void require_positive(money_micro amount, const char* what) {
        if (amount <= 0) throw LedgerError(ErrorCode::validation, std::string(what) + " must be greater than zero");
    }

    money_micro checked_total(std::initializer_list<money_micro> parts, const std::string& what) {
        money_micro total = 0;
        try {
            for (money_micro part : parts) total = add_amounts(total, part);
        } catch (const std::invalid_argument&) {
            throw LedgerError(ErrorCode::validation, what + " is out of range");
        }
        return total;
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string join_nonempty(const std::string& a, const std::string& sep, const std::string& b) {
        if (a.empty()) return b;
        if (b.empty()) return a;
        return a + sep + b;
    }

    // Zero amounts produce no line.
    void debit(std::vector<LedgerLine>& lines, const Account& account, money_micro amount, const std::string& description) {
        if (amount == 0) return;
        LedgerLine line;
        line.account_code = account.code;
        line.account_name = account.name;
        line.debit = amount;
        line.description = description;
        lines.push_back(line);
    }

    void credit(std::vector<LedgerLine>& lines, const Account& account, money_micro amount, const std::string& description) {
        if (amount == 0) return;
        LedgerLine line;
        line.account_code = account.code;
        line.account_name = account.name;
        line.credit = amount;
        line.description = description;
        lines.push_back(line);
    }

    void debit(std::vector<LedgerLine>& lines, const char* code, money_micro amount, const std::string& description) {
        debit(lines, require_account(code), amount, description);
    }

    void credit(std::vector<LedgerLine>& lines, const char* code, money_micro amount, const std::string& description) {
        credit(lines, require_account(code), amount, description);
    }

    const char* cash_or_bank(const std::string& mode) {
        return lower(mode) == "cash" ? account_codes::CASH : account_codes::BANK;
    }

    // Named account if it resolves, otherwise the fallback (logged).
    const Account& account_or(const std::string& code_or_name, const char* fallback, const std::string& context) {
        if (!code_or_name.empty()) {
            const Account* account = resolve_account(code_or_name);
            if (account) return *account;
            lgate_log("WARN", "Account '" + code_or_name + "' on " + context + " is not in the chart; using " + fallback);
        }
        return require_account(fallback);
    }

    struct ResolvedAmounts {
        money_micro sub_total = 0;
        money_micro cgst = 0;
        money_micro sgst = 0;
        money_micro igst = 0;
        money_micro total = 0;
    };

    ResolvedAmounts resolve_amounts(const DocumentAmounts& a, const std::string& organization_state) {
        ResolvedAmounts r;
        if (!a.line_items.empty()) {
            bool igst = is_inter_state(organization_state, a.place_of_supply);
            std::vector<LineItemResult> items;
            for (const auto& input : a.line_items) {
                items.push_back(line_item(input, igst, a.is_inclusive));
            }
            InvoiceTotals totals = invoice_totals(items, InvoiceAdjustments());
            r.sub_total = totals.taxable_total;
            r.cgst = totals.cgst_total;
            r.sgst = totals.sgst_total;
            r.igst = totals.igst_total;
        } else {
            require_non_negative(a.sub_total, "Subtotal");
            require_non_negative(a.cgst, "CGST");
            require_non_negative(a.sgst, "SGST");
            require_non_negative(a.igst, "IGST");
            require_non_negative(a.tax_total, "Tax total");
            r.sub_total = a.sub_total;
            if (a.cgst != 0 || a.sgst != 0 || a.igst != 0) {
                r.cgst = a.cgst;
                r.sgst = a.sgst;
                r.igst = a.igst;
            } else if (a.tax_total != 0) {
                r.cgst = round_currency_ratio(a.tax_total, 1, 2);
                r.sgst = a.tax_total - r.cgst;
            }
        }

        r.total = checked_total({r.sub_total, r.cgst, r.sgst, r.igst}, "Document total");
        if (a.total && *a.total != r.total) {
            throw LedgerError(ErrorCode::validation, "Total " + format_amount(*a.total) +
                                                     " does not equal subtotal plus taxes (" + format_amount(r.total) + ")");
        }
        require_positive(r.total, "Document total");
        return r;
    }

    /**
     * EntryBuilder
     * Visits a PostingEvent and fills in the type, description, source and
     * lines of the entry under construction.
     */
    struct EntryBuilder {
        Store& store;
        const EngineConfig& config;
        JournalEntry& entry;

        void operator()(const InvoicePosting& e) const {
            ResolvedAmounts amounts = resolve_amounts(e.amounts, config.state_code_for(e.organization_id));
            std::string doc = join_nonempty("Invoice " + (e.invoice_number.empty() ? e.invoice_id : e.invoice_number),
                                            " - ", e.customer_name);

            entry.entry_type = EntryType::sales;
            entry.description = doc;
            entry.source_document_type = SOURCE_INVOICE;
            entry.source_document_id = e.invoice_id;

            debit(entry.lines, account_codes::ACCOUNTS_RECEIVABLE, amounts.total, doc);
            credit(entry.lines, account_codes::SALES_REVENUE, amounts.sub_total, doc);
            credit(entry.lines, account_codes::GST_PAYABLE_CGST, amounts.cgst, "CGST on " + doc);
            credit(entry.lines, account_codes::GST_PAYABLE_SGST, amounts.sgst, "SGST on " + doc);
            credit(entry.lines, account_codes::GST_PAYABLE_IGST, amounts.igst, "IGST on " + doc);
        }

        void operator()(const PaymentPosting& e) const {
            require_positive(e.amount, "Payment amount");
            std::string doc = join_nonempty("Payment received", " from ", e.customer_name);
            if (!e.invoice_number.empty()) doc += " for " + e.invoice_number;
            if (!e.reference_number.empty()) doc += " (ref " + e.reference_number + ")";

            entry.entry_type = EntryType::receipt;
            entry.description = doc;
            entry.source_document_type = SOURCE_PAYMENT_RECEIVED;
            entry.source_document_id = e.payment_id;

            debit(entry.lines, cash_or_bank(e.payment_mode), e.amount, doc);
            credit(entry.lines, account_codes::ACCOUNTS_RECEIVABLE, e.amount, doc);
        }

        void operator()(const BillPosting& e) const {
            ResolvedAmounts amounts = resolve_amounts(e.amounts, config.state_code_for(e.organization_id));
            std::string doc = join_nonempty("Bill " + (e.bill_number.empty() ? e.bill_id : e.bill_number),
                                            " - ", e.vendor_name);
            const Account& expense = account_or(e.expense_account, account_codes::COST_OF_GOODS_SOLD, "bill " + e.bill_id);

            entry.entry_type = EntryType::purchase;
            entry.description = doc;
            entry.source_document_type = SOURCE_BILL;
            entry.source_document_id = e.bill_id;

            debit(entry.lines, expense, amounts.sub_total, doc);
            debit(entry.lines, account_codes::GST_INPUT_CGST, amounts.cgst, "CGST input on " + doc);
            debit(entry.lines, account_codes::GST_INPUT_SGST, amounts.sgst, "SGST input on " + doc);
            debit(entry.lines, account_codes::GST_INPUT_IGST, amounts.igst, "IGST input on " + doc);
            credit(entry.lines, account_codes::ACCOUNTS_PAYABLE, amounts.total, doc);
        }

        void operator()(const BillPaymentPosting& e) const {
            require_positive(e.amount, "Payment amount");
            std::string doc = join_nonempty("Bill payment", " to ", e.vendor_name);
            if (!e.bill_number.empty()) doc += " for " + e.bill_number;
            if (!e.reference_number.empty()) doc += " (ref " + e.reference_number + ")";

            entry.entry_type = EntryType::payment;
            entry.description = doc;
            entry.source_document_type = SOURCE_BILL_PAYMENT;
            entry.source_document_id = e.payment_id;

            debit(entry.lines, account_codes::ACCOUNTS_PAYABLE, e.amount, doc);
            credit(entry.lines, cash_or_bank(e.payment_mode), e.amount, doc);
        }

        void operator()(const ExpensePosting& e) const {
            require_positive(e.amount, "Expense amount");
            std::string doc = e.description.empty() ? "Expense " + e.expense_id : e.description;
            if (!e.reference_number.empty()) doc += " (ref " + e.reference_number + ")";
            const Account& expense = account_or(e.expense_account, account_codes::MISC_EXPENSE, "expense " + e.expense_id);

            std::string paid_through = lower(e.paid_through);
            const char* source_account = account_codes::BANK;
            if (paid_through == "cash") {
                source_account = account_codes::CASH;
            } else if (paid_through == "accounts payable" || paid_through == "payable" || paid_through == "credit") {
                source_account = account_codes::ACCOUNTS_PAYABLE;
            }

            entry.entry_type = EntryType::expense;
            entry.description = doc;
            entry.source_document_type = SOURCE_EXPENSE;
            entry.source_document_id = e.expense_id;

            debit(entry.lines, expense, e.amount, doc);
            credit(entry.lines, source_account, e.amount, doc);
        }

        void operator()(const PayrollRunPosting& e) const {
            if (e.records.empty()) {
                throw LedgerError(ErrorCode::validation, "Payroll run " + e.payroll_run_id + " has no records");
            }

            PayrollRecord sum;
            for (const auto& r : e.records) {
                require_non_negative(r.gross, "Gross salary");
                require_non_negative(r.net, "Net salary");
                require_non_negative(r.tds, "TDS");
                require_non_negative(r.pf_employee, "Employee PF");
                require_non_negative(r.pf_employer, "Employer PF");
                require_non_negative(r.esi_employee, "Employee ESI");
                require_non_negative(r.esi_employer, "Employer ESI");
                require_non_negative(r.professional_tax, "Professional tax");

                money_micro deductions = checked_total({r.net, r.tds, r.pf_employee, r.esi_employee, r.professional_tax},
                                                       "Payroll deductions for employee '" + r.employee_id + "'");
                if (r.gross != deductions) {
                    throw LedgerError(ErrorCode::validation,
                                      "Payroll record for employee '" + r.employee_id + "': gross " + format_amount(r.gross) +
                                      " does not equal net plus deductions (" + format_amount(deductions) + ")");
                }
                sum.gross = checked_total({sum.gross, r.gross}, "Payroll gross");
                sum.net = checked_total({sum.net, r.net}, "Payroll net");
                sum.tds = checked_total({sum.tds, r.tds}, "Payroll TDS");
                sum.pf_employee = checked_total({sum.pf_employee, r.pf_employee}, "Payroll employee PF");
                sum.pf_employer = checked_total({sum.pf_employer, r.pf_employer}, "Payroll employer PF");
                sum.esi_employee = checked_total({sum.esi_employee, r.esi_employee}, "Payroll employee ESI");
                sum.esi_employer = checked_total({sum.esi_employer, r.esi_employer}, "Payroll employer ESI");
                sum.professional_tax = checked_total({sum.professional_tax, r.professional_tax}, "Payroll professional tax");
            }
            require_positive(sum.gross, "Payroll gross");
            // Debits: gross, employer PF and employer ESI.
            checked_total({sum.gross, sum.pf_employer, sum.esi_employer}, "Payroll total");
            money_micro esi_total = checked_total({sum.esi_employee, sum.esi_employer}, "Payroll ESI");

            std::string period = join_nonempty(e.month, " ", e.year);
            std::string doc = "Payroll " + (period.empty() ? e.payroll_run_id : period);

            entry.entry_type = EntryType::payroll;
            entry.description = doc;
            entry.source_document_type = SOURCE_PAYROLL_RUN;
            entry.source_document_id = e.payroll_run_id;

            debit(entry.lines, account_codes::SALARY_EXPENSE, sum.gross, "Gross salaries - " + doc);
            debit(entry.lines, account_codes::EMPLOYER_PF_EXPENSE, sum.pf_employer, "Employer PF - " + doc);
            debit(entry.lines, account_codes::EMPLOYER_ESI_EXPENSE, sum.esi_employer, "Employer ESI - " + doc);
            credit(entry.lines, account_codes::SALARY_PAYABLE, sum.net, "Net salaries - " + doc);
            credit(entry.lines, account_codes::TDS_PAYABLE, sum.tds, "TDS - " + doc);
            credit(entry.lines, account_codes::PF_EMPLOYEE_PAYABLE, sum.pf_employee, "Employee PF - " + doc);
            credit(entry.lines, account_codes::PF_EMPLOYER_PAYABLE, sum.pf_employer, "Employer PF - " + doc);
            credit(entry.lines, account_codes::ESI_PAYABLE, esi_total, "ESI - " + doc);
            credit(entry.lines, account_codes::PROFESSIONAL_TAX_PAYABLE, sum.professional_tax, "Professional tax - " + doc);
        }

        void operator()(const ReversalPosting& e) const {
            std::optional<JournalEntry> original = store.find_entry(e.organization_id, e.entry_id);
            if (!original) {
                throw LedgerError(ErrorCode::not_found, "Journal entry " + e.entry_id + " not found");
            }

            std::string original_ref = original->reference_number.empty() ? e.entry_id : original->reference_number;
            std::string doc = join_nonempty("Reversal of " + original_ref, ": ", e.reason);

            entry.entry_type = EntryType::reversal;
            entry.description = doc;
            entry.source_document_type = SOURCE_REVERSAL;
            entry.source_document_id = e.entry_id;
            entry.reversal_of = e.entry_id;

            for (const auto& line : original->lines) {
                LedgerLine swapped = line;
                swapped.debit = line.credit;
                swapped.credit = line.debit;
                swapped.description = "Reversal: " + line.description;
                entry.lines.push_back(swapped);
            }
        }
    };
}

// ----------------------------------------------------------------------------
// JournalPoster
// ----------------------------------------------------------------------------

JournalPoster::JournalPoster(Store& store, const EngineConfig& config, Clock clock)
    : store_(store), config_(config), clock_(std::move(clock)) {}

JournalEntry JournalPoster::build(const PostingEvent& event, const CivilDate& entry_date, const std::string& created_by) {
    JournalEntry entry;
    entry.entry_id = LedgerCrypto::generate_id("je");
    entry.organization_id = event_organization(event);
    entry.entry_date = entry_date;
    entry.created_by = created_by;
    entry.created_at = clock_();

    std::visit(EntryBuilder{store_, config_, entry}, event);

    CoreLedger::enforce_balance(entry);
    std::string series = reference_series(entry.entry_type, entry.entry_date);
    entry.reference_number = format_reference_number(series, store_.next_sequence(entry.organization_id, series));
    entry.entry_hash = CoreLedger::seal(entry);
    return entry;
}

PostOutcome JournalPoster::post(const PostingEvent& event, const CivilDate& entry_date, const std::string& created_by) {
    PostOutcome outcome;
    std::string organization_id = event_organization(event);
    std::string kind = posting_kind(event);
    std::string source_id = event_source_id(event);

    std::optional<JournalEntry> existing = store_.find_entry_by_source(organization_id, kind, source_id);
    if (existing) {
        outcome.entry = *existing;
        return outcome;
    }

    JournalEntry entry = build(event, entry_date, created_by);
    if (store_.insert_entry(entry)) {
        outcome.entry = entry;
        outcome.created = true;
        return outcome;
    }

    // Lost the race to a concurrent post of the same document.
    existing = store_.find_entry_by_source(organization_id, kind, source_id);
    if (!existing) {
        throw StoreError("Entry for " + kind + " " + source_id + " was rejected as a duplicate but cannot be read back");
    }
    outcome.entry = *existing;
    return outcome;
}

} // namespace lgate
