/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: tax_calculator.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Stateless GST and receivables arithmetic: line items, invoice totals,
 * aging, and payment allocation. Inputs and outputs are money_micro; rates
 * and percentages use the same micro scale (18% = 18,000,000).
 *
 * * TAX SPLIT:
 * Intra-state tax is charged as CGST + SGST, each computed from half the
 * rate, so the two components are always equal. Inter-state tax is charged
 * at the full rate as IGST.
 *
 * Invalid inputs (negative quantities, discounts above the line amount,
 * rates outside 0..100%) throw LedgerError (VALIDATION).
 * ============================================================================
 */

#ifndef LGATE_TAX_CALCULATOR_HPP
#define LGATE_TAX_CALCULATOR_HPP

#include <string>
#include <vector>
#include "money.hpp"
#include "time_util.hpp"

namespace lgate {

    // ------------------------------------------------------------------------
    // Line items & invoice totals
    // ------------------------------------------------------------------------

    struct LineItemInput {
        std::string name;
        money_micro quantity = MICROS_PER_UNIT;
        money_micro rate = 0;
        money_micro tax_rate = 18 * MICROS_PER_UNIT;
        money_micro discount_percent = 0;
        money_micro discount_amount = 0;    // used when discount_percent is 0
    };

    struct LineItemResult {
        std::string name;
        money_micro quantity = 0;
        money_micro rate = 0;
        money_micro amount = 0;             // quantity * rate
        money_micro discount_amount = 0;
        money_micro taxable_amount = 0;
        money_micro tax_rate = 0;
        money_micro tax_amount = 0;
        money_micro cgst_amount = 0;
        money_micro sgst_amount = 0;
        money_micro igst_amount = 0;
        money_micro item_total = 0;
    };

    LineItemResult line_item(const LineItemInput& input, bool is_igst, bool is_inclusive);

    LineItemResult line_item(money_micro quantity, money_micro rate, money_micro tax_rate,
                             money_micro discount_percent, bool is_igst, bool is_inclusive);

    enum class DiscountType {
        percentage,
        amount
    };

    struct InvoiceAdjustments {
        DiscountType discount_type = DiscountType::percentage;
        money_micro discount_value = 0;
        money_micro shipping_charge = 0;
        money_micro adjustment = 0;
        money_micro amount_paid = 0;
        bool round_off = false;             // to the nearest whole unit
    };

    struct InvoiceTotals {
        money_micro sub_total = 0;          // sum of line taxable amounts
        money_micro discount_total = 0;     // line discounts + invoice discount
        money_micro invoice_discount = 0;
        money_micro taxable_total = 0;
        money_micro tax_total = 0;
        money_micro cgst_total = 0;
        money_micro sgst_total = 0;
        money_micro igst_total = 0;
        money_micro shipping_charge = 0;
        money_micro adjustment = 0;         // includes the round-off difference
        money_micro grand_total = 0;
        money_micro amount_paid = 0;
        money_micro balance_due = 0;
    };

    // grand_total = sub_total - invoice_discount + tax_total + shipping + adjustment
    InvoiceTotals invoice_totals(const std::vector<LineItemResult>& items, const InvoiceAdjustments& adjustments);

    struct TaxBreakdown {
        money_micro cgst_rate = 0;
        money_micro cgst_amount = 0;
        money_micro sgst_rate = 0;
        money_micro sgst_amount = 0;
        money_micro igst_rate = 0;
        money_micro igst_amount = 0;
        money_micro total_tax = 0;
    };

    TaxBreakdown tax_breakdown(money_micro taxable_amount, money_micro tax_rate, bool is_igst);

    /**
     * @brief Place of supply. Accepts two-digit state codes or full GSTINs.
     * Unknown (empty) state on either side is treated as intra-state.
     */
    bool is_inter_state(const std::string& organization_state, const std::string& place_of_supply);

    // ------------------------------------------------------------------------
    // Aging
    // ------------------------------------------------------------------------

    // "current", "1-30", "31-60", "61-90", "90+"
    std::string aging_bucket(const CivilDate& due_date, const CivilDate& as_of);

    struct AgingInvoice {
        std::string invoice_id;
        CivilDate due_date;
        money_micro balance_due = 0;
    };

    struct AgingBucketTotal {
        std::string bucket;
        int count = 0;
        money_micro amount = 0;
    };

    // All five buckets, in order. Invoices without a positive balance are ignored.
    std::vector<AgingBucketTotal> aging_summary(const std::vector<AgingInvoice>& invoices, const CivilDate& as_of);

    // ------------------------------------------------------------------------
    // Payment allocation
    // ------------------------------------------------------------------------

    enum class AllocationStrategy {
        oldest_first,
        proportional
    };

    // Throws VALIDATION for anything but "oldest_first" / "proportional".
    AllocationStrategy allocation_strategy_from_string(const std::string& s);

    struct OpenInvoice {
        std::string invoice_id;
        std::string invoice_number;
        CivilDate invoice_date;
        money_micro balance_due = 0;
    };

    struct PaymentAllocation {
        std::string invoice_id;
        std::string invoice_number;
        money_micro allocated_amount = 0;
        money_micro balance_before = 0;
        money_micro balance_after = 0;
    };

    /**
     * @brief Spreads a payment over open invoices.
     * One allocation is returned per input invoice, in input order; an
     * invoice that receives nothing gets a zero allocation. The allocated
     * sum never exceeds the payment or any invoice's balance.
     */
    std::vector<PaymentAllocation> allocate_payment(money_micro amount, const std::vector<OpenInvoice>& invoices,
                                                    AllocationStrategy strategy);

    struct BalanceRestoration {
        std::string invoice_id;
        money_micro amount_to_restore = 0;
        std::string payment_id;
    };

    // Undo of allocate_payment(): what to add back to each invoice balance.
    std::vector<BalanceRestoration> unapply_payment(const std::string& payment_id,
                                                    const std::vector<PaymentAllocation>& allocations);

} // namespace lgate

#endif // LGATE_TAX_CALCULATOR_HPP
