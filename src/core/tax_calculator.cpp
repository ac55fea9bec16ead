/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: tax_calculator.cpp
 * ============================================================================
 */

#include "tax_calculator.hpp"
#include <algorithm>
#include <initializer_list>
#include <numeric>
#include <stdexcept>
#include "errors.hpp"

namespace lgate {

namespace {

    void require(bool condition, const std::string& message) {
        if (!condition) throw LedgerError(ErrorCode::validation, message);
    }

    void require_rate(money_micro rate, const char* what) {
        require(rate >= 0 && rate <= PERCENT_BASE, std::string(what) + " must be between 0 and 100");
    }

    money_micro checked_total(std::initializer_list<money_micro> parts, const char* what) {
        money_micro total = 0;
        try {
            for (money_micro part : parts) total = add_amounts(total, part);
        } catch (const std::invalid_argument&) {
            throw LedgerError(ErrorCode::validation, std::string(what) + " is out of range");
        }
        return total;
    }

    // Half-up to a whole currency unit.
    money_micro round_to_unit(money_micro amount) {
        return round_currency_ratio(amount, 1, 100) * 100;
    }

    std::string state_part(const std::string& code_or_gstin) {
        return code_or_gstin.size() >= 2 ? code_or_gstin.substr(0, 2) : code_or_gstin;
    }
}

// ----------------------------------------------------------------------------
// Line items
// ----------------------------------------------------------------------------

LineItemResult line_item(const LineItemInput& input, bool is_igst, bool is_inclusive) {
    require(input.quantity >= 0, "Quantity cannot be negative");
    require(input.rate >= 0, "Rate cannot be negative");
    require_rate(input.tax_rate, "Tax rate");
    require_rate(input.discount_percent, "Discount percentage");
    require(input.discount_amount >= 0, "Discount cannot be negative");

    LineItemResult r;
    r.name = input.name;
    r.quantity = input.quantity;
    r.rate = input.rate;
    r.tax_rate = input.tax_rate;
    try {
        r.amount = round_currency_ratio(input.quantity, input.rate, MICROS_PER_UNIT);
    } catch (const std::invalid_argument&) {
        throw LedgerError(ErrorCode::validation, "Line amount (quantity x rate) is out of range");
    }

    if (input.discount_percent > 0) {
        r.discount_amount = round_currency_ratio(r.amount, input.discount_percent, PERCENT_BASE);
    } else if (input.discount_amount > 0) {
        r.discount_amount = round_currency(input.discount_amount);
    }
    require(r.discount_amount <= r.amount, "Discount exceeds the line amount");

    money_micro net = r.amount - r.discount_amount;

    if (is_inclusive) {
        // net already contains the tax: back out the taxable part. When the
        // tax has an odd cent the equal halves round it up, and item_total
        // ends one cent above net.
        r.taxable_amount = round_currency_ratio(net, PERCENT_BASE, PERCENT_BASE + input.tax_rate);
        money_micro tax = net - r.taxable_amount;
        if (is_igst) {
            r.igst_amount = tax;
        } else {
            money_micro half = round_currency_ratio(tax, 1, 2);
            r.cgst_amount = half;
            r.sgst_amount = half;
            tax = 2 * half;
        }
        r.tax_amount = tax;
        r.item_total = checked_total({r.taxable_amount, tax}, "Line total");
    } else {
        if (is_igst) {
            r.igst_amount = round_currency_ratio(net, input.tax_rate, PERCENT_BASE);
        } else {
            r.cgst_amount = round_currency_ratio(net, input.tax_rate, 2 * PERCENT_BASE);
            r.sgst_amount = r.cgst_amount;
        }
        r.tax_amount = r.cgst_amount + r.sgst_amount + r.igst_amount;
        r.taxable_amount = net;
        r.item_total = checked_total({net, r.tax_amount}, "Line total");
    }
    return r;
}

LineItemResult line_item(money_micro quantity, money_micro rate, money_micro tax_rate,
                         money_micro discount_percent, bool is_igst, bool is_inclusive) {
    LineItemInput input;
    input.quantity = quantity;
    input.rate = rate;
    input.tax_rate = tax_rate;
    input.discount_percent = discount_percent;
    return line_item(input, is_igst, is_inclusive);
}

InvoiceTotals invoice_totals(const std::vector<LineItemResult>& items, const InvoiceAdjustments& adj) {
    require(adj.discount_value >= 0, "Invoice discount cannot be negative");
    require(adj.shipping_charge >= 0, "Shipping charge cannot be negative");
    require(adj.amount_paid >= 0, "Amount paid cannot be negative");

    InvoiceTotals t;
    money_micro line_discounts = 0;
    for (const auto& item : items) {
        t.sub_total = checked_total({t.sub_total, item.taxable_amount}, "Subtotal");
        line_discounts = checked_total({line_discounts, item.discount_amount}, "Discount total");
        t.tax_total = checked_total({t.tax_total, item.tax_amount}, "Tax total");
        t.cgst_total = checked_total({t.cgst_total, item.cgst_amount}, "CGST total");
        t.sgst_total = checked_total({t.sgst_total, item.sgst_amount}, "SGST total");
        t.igst_total = checked_total({t.igst_total, item.igst_amount}, "IGST total");
    }

    if (adj.discount_value > 0) {
        if (adj.discount_type == DiscountType::percentage) {
            require_rate(adj.discount_value, "Invoice discount percentage");
            t.invoice_discount = round_currency_ratio(t.sub_total, adj.discount_value, PERCENT_BASE);
        } else {
            t.invoice_discount = round_currency(adj.discount_value);
        }
    }
    require(t.invoice_discount <= t.sub_total, "Invoice discount exceeds the subtotal");

    t.discount_total = checked_total({line_discounts, t.invoice_discount}, "Discount total");
    t.taxable_total = t.sub_total - t.invoice_discount;
    t.shipping_charge = round_currency(adj.shipping_charge);
    t.adjustment = round_currency(adj.adjustment);
    t.grand_total = checked_total({t.taxable_total, t.tax_total, t.shipping_charge, t.adjustment}, "Grand total");

    if (adj.round_off) {
        money_micro rounded = round_to_unit(t.grand_total);
        t.adjustment += rounded - t.grand_total;
        t.grand_total = rounded;
    }

    t.amount_paid = round_currency(adj.amount_paid);
    t.balance_due = checked_total({t.grand_total, -t.amount_paid}, "Balance due");
    return t;
}

TaxBreakdown tax_breakdown(money_micro taxable_amount, money_micro tax_rate, bool is_igst) {
    require_rate(tax_rate, "Tax rate");

    TaxBreakdown b;
    if (is_igst) {
        b.igst_rate = tax_rate;
        b.igst_amount = round_currency_ratio(taxable_amount, tax_rate, PERCENT_BASE);
        b.total_tax = b.igst_amount;
    } else {
        b.cgst_rate = tax_rate / 2;
        b.sgst_rate = tax_rate / 2;
        b.cgst_amount = round_currency_ratio(taxable_amount, tax_rate, 2 * PERCENT_BASE);
        b.sgst_amount = b.cgst_amount;
        b.total_tax = b.cgst_amount + b.sgst_amount;
    }
    return b;
}

bool is_inter_state(const std::string& organization_state, const std::string& place_of_supply) {
    std::string from = state_part(organization_state);
    std::string to = state_part(place_of_supply);
    if (from.empty() || to.empty()) return false;
    return from != to;
}

// ----------------------------------------------------------------------------
// Aging
// ----------------------------------------------------------------------------

std::string aging_bucket(const CivilDate& due_date, const CivilDate& as_of) {
    int64_t days_overdue = days_between(due_date, as_of);
    if (days_overdue <= 0) return "current";
    if (days_overdue <= 30) return "1-30";
    if (days_overdue <= 60) return "31-60";
    if (days_overdue <= 90) return "61-90";
    return "90+";
}

std::vector<AgingBucketTotal> aging_summary(const std::vector<AgingInvoice>& invoices, const CivilDate& as_of) {
    std::vector<AgingBucketTotal> buckets;
    for (const char* name : {"current", "1-30", "31-60", "61-90", "90+"}) {
        AgingBucketTotal bucket;
        bucket.bucket = name;
        buckets.push_back(bucket);
    }

    for (const auto& invoice : invoices) {
        if (invoice.balance_due <= 0) continue;
        std::string name = aging_bucket(invoice.due_date, as_of);
        for (auto& bucket : buckets) {
            if (bucket.bucket == name) {
                bucket.count += 1;
                bucket.amount = checked_total({bucket.amount, invoice.balance_due}, "Aging bucket total");
                break;
            }
        }
    }
    return buckets;
}

// ----------------------------------------------------------------------------
// Payment allocation
// ----------------------------------------------------------------------------

AllocationStrategy allocation_strategy_from_string(const std::string& s) {
    if (s == "oldest_first") return AllocationStrategy::oldest_first;
    if (s == "proportional") return AllocationStrategy::proportional;
    throw LedgerError(ErrorCode::validation, "Unknown allocation strategy '" + s + "'. Use oldest_first or proportional.");
}

std::vector<PaymentAllocation> allocate_payment(money_micro amount, const std::vector<OpenInvoice>& invoices,
                                                AllocationStrategy strategy) {
    require(amount >= 0, "Payment amount cannot be negative");
    money_micro payment = round_currency(amount);

    std::vector<PaymentAllocation> allocations;
    std::vector<money_micro> open;
    for (const auto& invoice : invoices) {
        PaymentAllocation a;
        a.invoice_id = invoice.invoice_id;
        a.invoice_number = invoice.invoice_number;
        a.balance_before = invoice.balance_due;
        allocations.push_back(a);
        open.push_back(std::max<money_micro>(invoice.balance_due, 0));
    }

    std::vector<size_t> order(invoices.size());
    std::iota(order.begin(), order.end(), 0);

    if (strategy == AllocationStrategy::oldest_first) {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return invoices[a].invoice_date < invoices[b].invoice_date;
        });
        money_micro remaining = payment;
        for (size_t i : order) {
            money_micro take = std::min(remaining, open[i]);
            allocations[i].allocated_amount = take;
            remaining -= take;
        }
    } else {
        money_micro total_open = 0;
        for (money_micro balance : open) total_open = checked_total({total_open, balance}, "Outstanding total");
        if (total_open > 0) {
            money_micro target = std::min(payment, total_open);
            money_micro allocated = 0;
            for (size_t i = 0; i < open.size(); ++i) {
                money_micro share = std::min(round_currency_ratio(payment, open[i], total_open), open[i]);
                allocations[i].allocated_amount = share;
                allocated += share;
            }

            // Rounding remainder goes to the largest allocations first.
            money_micro remainder = target - allocated;
            std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                return allocations[a].allocated_amount > allocations[b].allocated_amount;
            });
            for (size_t i : order) {
                if (remainder == 0) break;
                if (remainder > 0) {
                    money_micro add = std::min(remainder, open[i] - allocations[i].allocated_amount);
                    allocations[i].allocated_amount += add;
                    remainder -= add;
                } else {
                    money_micro take = std::min(-remainder, allocations[i].allocated_amount);
                    allocations[i].allocated_amount -= take;
                    remainder += take;
                }
            }
        }
    }

    for (auto& a : allocations) {
        a.balance_after = a.balance_before - a.allocated_amount;
    }
    return allocations;
}

std::vector<BalanceRestoration> unapply_payment(const std::string& payment_id,
                                                const std::vector<PaymentAllocation>& allocations) {
    std::vector<BalanceRestoration> restorations;
    for (const auto& a : allocations) {
        if (a.allocated_amount == 0) continue;
        BalanceRestoration r;
        r.invoice_id = a.invoice_id;
        r.amount_to_restore = a.allocated_amount;
        r.payment_id = payment_id;
        restorations.push_back(r);
    }
    return restorations;
}

} // namespace lgate
