/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gst_plugin.cpp
 * ============================================================================
 */

#include "gst_plugin.hpp"
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <utility>
#include "../../core/errors.hpp"
#include "../../core/gstin.hpp"
#include "../../core/money.hpp"
#include "../../core/tax_calculator.hpp"

namespace lgate {
namespace plugins {

namespace {

    money_micro amount(const json& p, std::initializer_list<const char*> keys, money_micro fallback = 0) {
        for (const char* key : keys) {
            if (!p.contains(key) || p.at(key).is_null()) continue;
            try {
                return amount_from_json(p, key, fallback);
            } catch (const std::invalid_argument&) {
                throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' is not a valid number");
            }
        }
        return fallback;
    }

    std::string text(const json& p, const char* key, const std::string& fallback = "") {
        if (!p.contains(key) || p.at(key).is_null()) return fallback;
        if (p.at(key).is_string()) return p.at(key).get<std::string>();
        if (p.at(key).is_number()) return p.at(key).dump();
        throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be a string");
    }

    bool flag(const json& p, const char* key) {
        if (!p.contains(key) || p.at(key).is_null()) return false;
        if (!p.at(key).is_boolean()) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be true or false");
        }
        return p.at(key).get<bool>();
    }

    const json& list(const json& p, const char* key) {
        if (!p.contains(key) || !p.at(key).is_array()) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be an array");
        }
        return p.at(key);
    }

    CivilDate date(const json& p, const char* key) {
        std::string value = text(p, key);
        std::optional<CivilDate> parsed = parse_effective_date(value);
        if (!parsed) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be a date (YYYY-MM-DD)");
        }
        return *parsed;
    }

    // Explicit is_igst wins; otherwise decided from the two state codes.
    bool igst_for(const json& p) {
        if (p.contains("is_igst") && !p.at("is_igst").is_null()) return flag(p, "is_igst");
        return is_inter_state(text(p, "organization_state"), text(p, "place_of_supply"));
    }

    LineItemInput line_input(const json& p) {
        if (!p.is_object()) throw LedgerError(ErrorCode::validation, "Each line item must be an object");
        LineItemInput input;
        input.name = text(p, "name");
        input.quantity = amount(p, {"quantity"}, MICROS_PER_UNIT);
        input.rate = amount(p, {"rate"});
        input.tax_rate = amount(p, {"tax_rate", "tax_percentage"}, 18 * MICROS_PER_UNIT);
        input.discount_percent = amount(p, {"discount_percent", "discount_percentage"});
        input.discount_amount = amount(p, {"discount_amount"});
        return input;
    }

    json line_json(const LineItemResult& r) {
        return {
            {"name", r.name},
            {"quantity", format_amount(r.quantity)},
            {"rate", format_amount(r.rate)},
            {"amount", format_amount(r.amount)},
            {"discount_amount", format_amount(r.discount_amount)},
            {"taxable_amount", format_amount(r.taxable_amount)},
            {"tax_rate", format_amount(r.tax_rate)},
            {"tax_amount", format_amount(r.tax_amount)},
            {"cgst_amount", format_amount(r.cgst_amount)},
            {"sgst_amount", format_amount(r.sgst_amount)},
            {"igst_amount", format_amount(r.igst_amount)},
            {"item_total", format_amount(r.item_total)}
        };
    }
}

GstPlugin::GstPlugin(Clock clock) : clock_(std::move(clock)) {}

std::string GstPlugin::get_plugin_name() {
    return "India GST Calculator";
}

std::vector<std::string> GstPlugin::get_commands() {
    return {"calculate_line_item", "calculate_invoice_totals", "tax_breakdown", "validate_gstin", "list_states",
            "aging_bucket", "aging_summary", "allocate_payment", "unapply_payment"};
}

json GstPlugin::execute(const std::string& command, const json& payload) {
    if (!payload.is_object()) {
        throw LedgerError(ErrorCode::validation, "Plugin payload must be a JSON object");
    }

    try {
        if (command == "calculate_line_item") return calculate_line_item(payload);
        if (command == "calculate_invoice_totals") return calculate_invoice_totals(payload);
        if (command == "tax_breakdown") return tax_breakdown(payload);
        if (command == "validate_gstin") return validate_gstin(payload);
        if (command == "list_states") return list_states();
        if (command == "aging_bucket") return aging_bucket(payload);
        if (command == "aging_summary") return aging_summary(payload);
        if (command == "allocate_payment") return allocate_payment(payload);
        if (command == "unapply_payment") return unapply_payment(payload);
    } catch (const json::exception& e) {
        throw LedgerError(ErrorCode::validation, "Malformed payload for " + command + ": " + e.what());
    }

    throw LedgerError(ErrorCode::validation, "Unknown command '" + command + "' for plugin " + GST_PLUGIN_ID);
}

json GstPlugin::calculate_line_item(const json& payload) {
    LineItemResult r = line_item(line_input(payload), igst_for(payload), flag(payload, "is_inclusive"));
    return line_json(r);
}

json GstPlugin::calculate_invoice_totals(const json& payload) {
    bool is_igst = igst_for(payload);
    bool is_inclusive = flag(payload, "is_inclusive");

    std::vector<LineItemResult> items;
    json lines = json::array();
    for (const auto& item : list(payload, "line_items")) {
        items.push_back(line_item(line_input(item), is_igst, is_inclusive));
        lines.push_back(line_json(items.back()));
    }

    InvoiceAdjustments adj;
    std::string discount_type = text(payload, "discount_type", "percentage");
    if (discount_type == "percentage") {
        adj.discount_type = DiscountType::percentage;
    } else if (discount_type == "amount") {
        adj.discount_type = DiscountType::amount;
    } else {
        throw LedgerError(ErrorCode::validation, "discount_type must be 'percentage' or 'amount'");
    }
    adj.discount_value = amount(payload, {"discount_value"});
    adj.shipping_charge = amount(payload, {"shipping_charge"});
    adj.adjustment = amount(payload, {"adjustment"});
    adj.amount_paid = amount(payload, {"amount_paid"});
    adj.round_off = flag(payload, "round_off");

    InvoiceTotals t = invoice_totals(items, adj);
    return {
        {"line_items", lines},
        {"is_igst", is_igst},
        {"sub_total", format_amount(t.sub_total)},
        {"invoice_discount", format_amount(t.invoice_discount)},
        {"discount_total", format_amount(t.discount_total)},
        {"taxable_total", format_amount(t.taxable_total)},
        {"tax_total", format_amount(t.tax_total)},
        {"cgst_total", format_amount(t.cgst_total)},
        {"sgst_total", format_amount(t.sgst_total)},
        {"igst_total", format_amount(t.igst_total)},
        {"shipping_charge", format_amount(t.shipping_charge)},
        {"adjustment", format_amount(t.adjustment)},
        {"grand_total", format_amount(t.grand_total)},
        {"amount_paid", format_amount(t.amount_paid)},
        {"balance_due", format_amount(t.balance_due)}
    };
}

json GstPlugin::tax_breakdown(const json& payload) {
    TaxBreakdown b = lgate::tax_breakdown(amount(payload, {"taxable_amount"}),
                                          amount(payload, {"tax_rate", "tax_percentage"}, 18 * MICROS_PER_UNIT),
                                          igst_for(payload));
    return {
        {"cgst_rate", format_amount(b.cgst_rate)},
        {"cgst_amount", format_amount(b.cgst_amount)},
        {"sgst_rate", format_amount(b.sgst_rate)},
        {"sgst_amount", format_amount(b.sgst_amount)},
        {"igst_rate", format_amount(b.igst_rate)},
        {"igst_amount", format_amount(b.igst_amount)},
        {"total_tax", format_amount(b.total_tax)}
    };
}

json GstPlugin::validate_gstin(const json& payload) {
    GstinValidation v = lgate::validate_gstin(text(payload, "gstin"));
    json result = {{"valid", v.valid}, {"gstin", v.gstin}};
    if (v.valid) {
        result["state_code"] = v.state_code;
        result["state_name"] = v.state_name;
        result["pan"] = v.pan;
        result["entity_code"] = v.entity_code;
    } else {
        result["error"] = v.error;
    }
    return result;
}

json GstPlugin::list_states() {
    json states = json::array();
    for (const auto& state : gst_states()) {
        states.push_back({{"code", state.code}, {"name", state.name}});
    }
    return states;
}

CivilDate GstPlugin::as_of_date(const json& payload) {
    if (payload.contains("as_of") && !payload.at("as_of").is_null()) return date(payload, "as_of");
    return utc_date(clock_());
}

json GstPlugin::aging_bucket(const json& payload) {
    CivilDate due = date(payload, "due_date");
    CivilDate as_of = as_of_date(payload);
    return {
        {"bucket", lgate::aging_bucket(due, as_of)},
        {"days_overdue", days_between(due, as_of)},
        {"as_of", format_date(as_of)}
    };
}

json GstPlugin::aging_summary(const json& payload) {
    std::vector<AgingInvoice> invoices;
    for (const auto& item : list(payload, "invoices")) {
        AgingInvoice invoice;
        invoice.invoice_id = text(item, "invoice_id");
        invoice.due_date = date(item, "due_date");
        invoice.balance_due = amount(item, {"balance_due"});
        invoices.push_back(invoice);
    }

    CivilDate as_of = as_of_date(payload);
    json buckets = json::array();
    money_micro total = 0;
    for (const auto& bucket : lgate::aging_summary(invoices, as_of)) {
        buckets.push_back({{"bucket", bucket.bucket}, {"count", bucket.count}, {"amount", format_amount(bucket.amount)}});
        total = add_amounts(total, bucket.amount);
    }
    return {{"as_of", format_date(as_of)}, {"buckets", buckets}, {"total_outstanding", format_amount(total)}};
}

json GstPlugin::allocate_payment(const json& payload) {
    std::vector<OpenInvoice> invoices;
    for (const auto& item : list(payload, "invoices")) {
        OpenInvoice invoice;
        invoice.invoice_id = text(item, "invoice_id");
        invoice.invoice_number = text(item, "invoice_number");
        invoice.invoice_date = date(item, "invoice_date");
        invoice.balance_due = amount(item, {"balance_due"});
        invoices.push_back(invoice);
    }

    money_micro payment = amount(payload, {"amount"});
    AllocationStrategy strategy = allocation_strategy_from_string(text(payload, "strategy", "oldest_first"));
    std::vector<PaymentAllocation> allocations = lgate::allocate_payment(payment, invoices, strategy);

    json rows = json::array();
    money_micro allocated = 0;
    for (const auto& a : allocations) {
        rows.push_back({
            {"invoice_id", a.invoice_id},
            {"invoice_number", a.invoice_number},
            {"allocated_amount", format_amount(a.allocated_amount)},
            {"balance_before", format_amount(a.balance_before)},
            {"balance_after", format_amount(a.balance_after)}
        });
        allocated += a.allocated_amount;
    }
    return {
        {"allocations", rows},
        {"total_allocated", format_amount(allocated)},
        {"unallocated", format_amount(round_currency(payment) - allocated)}
    };
}

json GstPlugin::unapply_payment(const json& payload) {
    std::vector<PaymentAllocation> allocations;
    for (const auto& item : list(payload, "allocations")) {
        PaymentAllocation a;
        a.invoice_id = text(item, "invoice_id");
        a.allocated_amount = amount(item, {"allocated_amount", "amount"});
        allocations.push_back(a);
    }

    json rows = json::array();
    for (const auto& r : lgate::unapply_payment(text(payload, "payment_id"), allocations)) {
        rows.push_back({
            {"invoice_id", r.invoice_id},
            {"amount_to_restore", format_amount(r.amount_to_restore)},
            {"payment_id", r.payment_id}
        });
    }
    return {{"restorations", rows}};
}

} // namespace plugins
} // namespace lgate
