/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: postings.cpp
 * ============================================================================
 */

#include "postings.hpp"
#include <initializer_list>
#include <stdexcept>
#include "errors.hpp"

namespace lgate {

namespace {

    // First present, non-null field among the alternatives. Numeric ids are
    // accepted and rendered as text.
    std::string text_field(const json& p, std::initializer_list<const char*> keys, const std::string& fallback = "") {
        for (const char* key : keys) {
            if (!p.contains(key) || p.at(key).is_null()) continue;
            const json& v = p.at(key);
            if (v.is_string()) return v.get<std::string>();
            if (v.is_number()) return v.dump();
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be a string");
        }
        return fallback;
    }

    money_micro amount_field(const json& p, std::initializer_list<const char*> keys, money_micro fallback = 0) {
        for (const char* key : keys) {
            if (!p.contains(key) || p.at(key).is_null()) continue;
            try {
                return amount_from_json(p, key, fallback);
            } catch (const std::invalid_argument&) {
                throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' is not a valid amount");
            }
        }
        return fallback;
    }

    bool bool_field(const json& p, const char* key) {
        if (!p.contains(key) || p.at(key).is_null()) return false;
        if (!p.at(key).is_boolean()) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be true or false");
        }
        return p.at(key).get<bool>();
    }

    std::string require_id(const json& p, std::initializer_list<const char*> keys, const std::string& kind) {
        std::string id = text_field(p, keys);
        if (id.empty()) {
            throw LedgerError(ErrorCode::validation, "A " + kind + " posting needs '" + *keys.begin() + "'");
        }
        return id;
    }

    const json& array_field(const json& p, const char* key) {
        static const json empty = json::array();
        if (!p.contains(key) || p.at(key).is_null()) return empty;
        if (!p.at(key).is_array()) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be an array");
        }
        return p.at(key);
    }

    DocumentAmounts document_amounts(const json& p) {
        DocumentAmounts a;
        a.sub_total = amount_field(p, {"sub_total", "subtotal"});
        a.cgst = amount_field(p, {"cgst_amount", "cgst"});
        a.sgst = amount_field(p, {"sgst_amount", "sgst"});
        a.igst = amount_field(p, {"igst_amount", "igst"});
        a.tax_total = amount_field(p, {"tax_total"});
        if (p.contains("total") && !p.at("total").is_null()) {
            a.total = amount_field(p, {"total"});
        }
        a.place_of_supply = text_field(p, {"place_of_supply"});
        a.is_inclusive = bool_field(p, "is_inclusive_tax");

        for (const auto& item : array_field(p, "line_items")) {
            if (!item.is_object()) throw LedgerError(ErrorCode::validation, "Each line item must be an object");
            LineItemInput li;
            li.name = text_field(item, {"name"});
            li.quantity = amount_field(item, {"quantity"}, MICROS_PER_UNIT);
            li.rate = amount_field(item, {"rate"});
            li.tax_rate = amount_field(item, {"tax_rate", "tax_percentage"}, 18 * MICROS_PER_UNIT);
            li.discount_percent = amount_field(item, {"discount_percent", "discount_percentage"});
            li.discount_amount = amount_field(item, {"discount_amount"});
            a.line_items.push_back(li);
        }
        return a;
    }

    // Flat field, or the same field inside a nested payslip section.
    money_micro payslip_amount(const json& rec, const char* section, std::initializer_list<const char*> keys) {
        if (rec.contains(section) && rec.at(section).is_object()) {
            money_micro nested = amount_field(rec.at(section), keys);
            if (nested != 0) return nested;
        }
        return amount_field(rec, keys);
    }

    PayrollRecord payroll_record(const json& rec) {
        if (!rec.is_object()) throw LedgerError(ErrorCode::validation, "Each payroll record must be an object");
        PayrollRecord r;
        r.employee_id = text_field(rec, {"employee_id"});
        r.gross = payslip_amount(rec, "earnings", {"gross", "gross_salary"});
        r.net = amount_field(rec, {"net_salary", "net"});
        r.tds = payslip_amount(rec, "deductions", {"tds"});
        r.pf_employee = payslip_amount(rec, "deductions", {"pf_employee"});
        r.esi_employee = payslip_amount(rec, "deductions", {"esi_employee"});
        r.professional_tax = payslip_amount(rec, "deductions", {"professional_tax"});
        r.pf_employer = payslip_amount(rec, "employer_contributions", {"pf_employer"});
        r.esi_employer = payslip_amount(rec, "employer_contributions", {"esi_employer"});
        return r;
    }

    struct DateOf {
        std::string operator()(const InvoicePosting& e) const { return e.date; }
        std::string operator()(const PaymentPosting& e) const { return e.date; }
        std::string operator()(const BillPosting& e) const { return e.date; }
        std::string operator()(const BillPaymentPosting& e) const { return e.date; }
        std::string operator()(const ExpensePosting& e) const { return e.date; }
        std::string operator()(const PayrollRunPosting& e) const { return e.pay_date; }
        std::string operator()(const ReversalPosting& e) const { return e.date; }
    };

    struct SourceOf {
        std::string operator()(const InvoicePosting& e) const { return e.invoice_id; }
        std::string operator()(const PaymentPosting& e) const { return e.payment_id; }
        std::string operator()(const BillPosting& e) const { return e.bill_id; }
        std::string operator()(const BillPaymentPosting& e) const { return e.payment_id; }
        std::string operator()(const ExpensePosting& e) const { return e.expense_id; }
        std::string operator()(const PayrollRunPosting& e) const { return e.payroll_run_id; }
        std::string operator()(const ReversalPosting& e) const { return e.entry_id; }
    };

    struct KindOf {
        std::string operator()(const InvoicePosting&) const { return SOURCE_INVOICE; }
        std::string operator()(const PaymentPosting&) const { return SOURCE_PAYMENT_RECEIVED; }
        std::string operator()(const BillPosting&) const { return SOURCE_BILL; }
        std::string operator()(const BillPaymentPosting&) const { return SOURCE_BILL_PAYMENT; }
        std::string operator()(const ExpensePosting&) const { return SOURCE_EXPENSE; }
        std::string operator()(const PayrollRunPosting&) const { return SOURCE_PAYROLL_RUN; }
        std::string operator()(const ReversalPosting&) const { return SOURCE_REVERSAL; }
    };
}

std::string posting_kind(const PostingEvent& event) {
    return std::visit(KindOf(), event);
}

std::string event_organization(const PostingEvent& event) {
    return std::visit([](const auto& e) { return e.organization_id; }, event);
}

std::string event_date(const PostingEvent& event) {
    return std::visit(DateOf(), event);
}

std::string event_source_id(const PostingEvent& event) {
    return std::visit(SourceOf(), event);
}

PostingEvent posting_from_json(const std::string& kind, const std::string& organization_id, const json& p) {
    if (!p.is_object()) throw LedgerError(ErrorCode::validation, "Posting payload must be a JSON object");

    try {
        if (kind == SOURCE_INVOICE) {
            InvoicePosting e;
            e.organization_id = organization_id;
            e.invoice_id = require_id(p, {"invoice_id"}, kind);
            e.invoice_number = text_field(p, {"invoice_number"});
            e.customer_name = text_field(p, {"customer_name"});
            e.date = text_field(p, {"invoice_date", "date"});
            e.amounts = document_amounts(p);
            return e;
        }
        if (kind == SOURCE_PAYMENT_RECEIVED) {
            PaymentPosting e;
            e.organization_id = organization_id;
            e.payment_id = require_id(p, {"payment_id"}, kind);
            e.invoice_id = text_field(p, {"invoice_id"});
            e.invoice_number = text_field(p, {"invoice_number"});
            e.customer_name = text_field(p, {"customer_name"});
            e.reference_number = text_field(p, {"reference_number"});
            e.date = text_field(p, {"payment_date", "date"});
            e.amount = amount_field(p, {"amount"});
            e.payment_mode = text_field(p, {"payment_mode"}, "bank");
            return e;
        }
        if (kind == SOURCE_BILL) {
            BillPosting e;
            e.organization_id = organization_id;
            e.bill_id = require_id(p, {"bill_id"}, kind);
            e.bill_number = text_field(p, {"bill_number"});
            e.vendor_name = text_field(p, {"vendor_name"});
            e.date = text_field(p, {"bill_date", "date"});
            e.expense_account = text_field(p, {"expense_account"});
            e.amounts = document_amounts(p);
            return e;
        }
        if (kind == SOURCE_BILL_PAYMENT) {
            BillPaymentPosting e;
            e.organization_id = organization_id;
            e.payment_id = require_id(p, {"payment_id"}, kind);
            e.bill_id = text_field(p, {"bill_id"});
            e.bill_number = text_field(p, {"bill_number"});
            e.vendor_name = text_field(p, {"vendor_name"});
            e.reference_number = text_field(p, {"reference_number"});
            e.date = text_field(p, {"payment_date", "date"});
            e.amount = amount_field(p, {"amount"});
            e.payment_mode = text_field(p, {"payment_mode"}, "bank");
            return e;
        }
        if (kind == SOURCE_EXPENSE) {
            ExpensePosting e;
            e.organization_id = organization_id;
            e.expense_id = require_id(p, {"expense_id"}, kind);
            e.date = text_field(p, {"expense_date", "date"});
            e.amount = amount_field(p, {"amount"});
            e.expense_account = text_field(p, {"expense_account"});
            e.paid_through = text_field(p, {"paid_through"}, "bank");
            e.description = text_field(p, {"description"});
            e.reference_number = text_field(p, {"reference_number"});
            return e;
        }
        if (kind == SOURCE_PAYROLL_RUN) {
            PayrollRunPosting e;
            e.organization_id = organization_id;
            e.payroll_run_id = require_id(p, {"payroll_run_id", "payroll_id"}, kind);
            e.pay_date = text_field(p, {"pay_date", "date"});
            e.month = text_field(p, {"month"});
            e.year = text_field(p, {"year"});
            for (const auto& rec : array_field(p, "records")) {
                e.records.push_back(payroll_record(rec));
            }
            return e;
        }
        if (kind == SOURCE_REVERSAL) {
            ReversalPosting e;
            e.organization_id = organization_id;
            e.entry_id = require_id(p, {"entry_id"}, kind);
            e.date = text_field(p, {"date", "reversal_date"});
            e.reason = text_field(p, {"reason"});
            return e;
        }
    } catch (const json::exception& ex) {
        throw LedgerError(ErrorCode::validation, std::string("Malformed ") + kind + " payload: " + ex.what());
    }

    throw LedgerError(ErrorCode::validation, "Unknown posting kind '" + kind + "'");
}

} // namespace lgate
