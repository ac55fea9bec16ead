/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * t_tax_calculator.cpp - GST line items, totals, aging, payment allocation
 */

#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "tax_calculator.hpp"
#include "test_support.hpp"

using namespace lgate;
using lgate_test::code_is;

namespace {
  LineItemInput item(money_micro quantity, money_micro rate, money_micro tax_rate = 18 * MICROS_PER_UNIT) {
    LineItemInput input;
    input.quantity = quantity;
    input.rate = rate;
    input.tax_rate = tax_rate;
    return input;
  }

  OpenInvoice open_invoice(const std::string& id, const CivilDate& date, money_micro balance) {
    OpenInvoice invoice;
    invoice.invoice_id = id;
    invoice.invoice_number = "INV-" + id;
    invoice.invoice_date = date;
    invoice.balance_due = balance;
    return invoice;
  }

  const CivilDate today{2025, 7, 10};
}

BOOST_AUTO_TEST_SUITE(tax_calculator_tests)

// ---------------------------------------------------------------------------
// Line items
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testIntraStateSplitsEvenly)
{
  LineItemResult r = line_item(item(from_units(2), from_units(500)), false, false);

  BOOST_CHECK_EQUAL(from_units(1000), r.amount);
  BOOST_CHECK_EQUAL(from_units(1000), r.taxable_amount);
  BOOST_CHECK_EQUAL(from_units(90), r.cgst_amount);
  BOOST_CHECK_EQUAL(from_units(90), r.sgst_amount);
  BOOST_CHECK_EQUAL(0, r.igst_amount);
  BOOST_CHECK_EQUAL(from_units(180), r.tax_amount);
  BOOST_CHECK_EQUAL(from_units(1180), r.item_total);
}

BOOST_AUTO_TEST_CASE(testInterStateUsesIgstOnly)
{
  LineItemResult r = line_item(item(from_units(2), from_units(500)), true, false);

  BOOST_CHECK_EQUAL(0, r.cgst_amount);
  BOOST_CHECK_EQUAL(0, r.sgst_amount);
  BOOST_CHECK_EQUAL(from_units(180), r.igst_amount);
  BOOST_CHECK_EQUAL(from_units(1180), r.item_total);
}

BOOST_AUTO_TEST_CASE(testPercentageDiscountBeforeTax)
{
  LineItemResult r = line_item(from_units(1), from_units(1000), 18 * MICROS_PER_UNIT, 10 * MICROS_PER_UNIT,
                               false, false);

  BOOST_CHECK_EQUAL(from_units(100), r.discount_amount);
  BOOST_CHECK_EQUAL(from_units(900), r.taxable_amount);
  BOOST_CHECK_EQUAL(from_units(81), r.cgst_amount);
  BOOST_CHECK_EQUAL(from_units(81), r.sgst_amount);
}

BOOST_AUTO_TEST_CASE(testInclusiveBacksOutTax)
{
  LineItemResult r = line_item(item(from_units(1), from_units(1180)), false, true);

  BOOST_CHECK_EQUAL(from_units(1000), r.taxable_amount);
  BOOST_CHECK_EQUAL(from_units(90), r.cgst_amount);
  BOOST_CHECK_EQUAL(from_units(90), r.sgst_amount);
  BOOST_CHECK_EQUAL(from_units(1180), r.item_total);
}

BOOST_AUTO_TEST_CASE(testInclusiveOddCentKeepsHalvesEqual)
{
  // 100.00 / 1.18 = 84.7457..., tax 15.25 does not split evenly
  LineItemResult r = line_item(item(from_units(1), from_units(100)), false, true);

  BOOST_CHECK_EQUAL(from_cents(8475), r.taxable_amount);
  BOOST_CHECK_EQUAL(r.cgst_amount, r.sgst_amount);
  BOOST_CHECK_EQUAL(from_cents(763), r.cgst_amount);
  BOOST_CHECK_EQUAL(from_cents(1526), r.tax_amount);
  BOOST_CHECK_EQUAL(from_cents(10001), r.item_total);
  BOOST_CHECK_EQUAL(r.taxable_amount + r.tax_amount, r.item_total);

  // IGST takes the whole remainder, so the total stays at the price
  LineItemResult igst = line_item(item(from_units(1), from_units(100)), true, true);
  BOOST_CHECK_EQUAL(from_cents(8475), igst.taxable_amount);
  BOOST_CHECK_EQUAL(from_cents(1525), igst.igst_amount);
  BOOST_CHECK_EQUAL(from_units(100), igst.item_total);
}

BOOST_AUTO_TEST_CASE(testLineItemRejectsOutOfRangeAmounts)
{
  // 10^7 x 10^7 is far beyond the largest representable amount
  BOOST_CHECK_EXCEPTION(line_item(item(from_units(10000000), from_units(10000000)), false, false),
                        LedgerError, code_is(ErrorCode::validation));

  LineItemResult big = line_item(item(from_units(1), MAX_AMOUNT, 0), false, false);
  BOOST_CHECK_EQUAL(MAX_AMOUNT, big.item_total);

  std::vector<LineItemResult> items;
  items.push_back(big);
  items.push_back(big);
  BOOST_CHECK_EXCEPTION(invoice_totals(items, InvoiceAdjustments()), LedgerError, code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_CASE(testLineItemRejectsBadInput)
{
  BOOST_CHECK_EXCEPTION(line_item(item(from_units(-1), from_units(10)), false, false),
                        LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(line_item(item(from_units(1), from_units(10), 150 * MICROS_PER_UNIT), false, false),
                        LedgerError, code_is(ErrorCode::validation));

  LineItemInput too_much = item(from_units(1), from_units(10));
  too_much.discount_amount = from_units(11);
  BOOST_CHECK_EXCEPTION(line_item(too_much, false, false), LedgerError, code_is(ErrorCode::validation));
}

// ---------------------------------------------------------------------------
// Invoice totals
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testInvoiceTotalsWithDiscountAndShipping)
{
  std::vector<LineItemResult> items;
  items.push_back(line_item(item(from_units(1), from_units(1000)), false, false));
  items.push_back(line_item(item(from_units(1), from_units(500)), false, false));

  InvoiceAdjustments adj;
  adj.discount_type = DiscountType::percentage;
  adj.discount_value = 10 * MICROS_PER_UNIT;
  adj.shipping_charge = from_units(50);
  adj.amount_paid = from_units(670);

  InvoiceTotals t = invoice_totals(items, adj);
  BOOST_CHECK_EQUAL(from_units(1500), t.sub_total);
  BOOST_CHECK_EQUAL(from_units(150), t.invoice_discount);
  BOOST_CHECK_EQUAL(from_units(1350), t.taxable_total);
  BOOST_CHECK_EQUAL(from_units(270), t.tax_total);
  BOOST_CHECK_EQUAL(from_units(135), t.cgst_total);
  BOOST_CHECK_EQUAL(from_units(1670), t.grand_total);
  BOOST_CHECK_EQUAL(from_units(1000), t.balance_due);
}

BOOST_AUTO_TEST_CASE(testRoundOffMovesDifferenceIntoAdjustment)
{
  std::vector<LineItemResult> items;
  items.push_back(line_item(item(from_units(1), from_cents(9999)), false, false));

  InvoiceAdjustments adj;
  InvoiceTotals exact = invoice_totals(items, adj);
  BOOST_CHECK_EQUAL(from_cents(11799), exact.grand_total);

  adj.round_off = true;
  InvoiceTotals rounded = invoice_totals(items, adj);
  BOOST_CHECK_EQUAL(from_units(118), rounded.grand_total);
  BOOST_CHECK_EQUAL(from_cents(1), rounded.adjustment);
}

BOOST_AUTO_TEST_CASE(testAmountDiscountCannotExceedSubtotal)
{
  std::vector<LineItemResult> items;
  items.push_back(line_item(item(from_units(1), from_units(100)), false, false));

  InvoiceAdjustments adj;
  adj.discount_type = DiscountType::amount;
  adj.discount_value = from_units(101);
  BOOST_CHECK_EXCEPTION(invoice_totals(items, adj), LedgerError, code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_CASE(testTaxBreakdown)
{
  TaxBreakdown intra = tax_breakdown(from_units(1000), 18 * MICROS_PER_UNIT, false);
  BOOST_CHECK_EQUAL(9 * MICROS_PER_UNIT, intra.cgst_rate);
  BOOST_CHECK_EQUAL(from_units(90), intra.cgst_amount);
  BOOST_CHECK_EQUAL(from_units(90), intra.sgst_amount);
  BOOST_CHECK_EQUAL(from_units(180), intra.total_tax);

  TaxBreakdown inter = tax_breakdown(from_units(1000), 18 * MICROS_PER_UNIT, true);
  BOOST_CHECK_EQUAL(0, inter.cgst_amount);
  BOOST_CHECK_EQUAL(from_units(180), inter.igst_amount);
}

BOOST_AUTO_TEST_CASE(testPlaceOfSupply)
{
  BOOST_CHECK(is_inter_state("27", "29"));
  BOOST_CHECK(!is_inter_state("27", "27AABCU9603R1ZN"));
  BOOST_CHECK(is_inter_state("27AABCU9603R1ZN", "29AAGCB7383J1Z4"));
  BOOST_CHECK(!is_inter_state("", "29"));
  BOOST_CHECK(!is_inter_state("27", ""));
}

// ---------------------------------------------------------------------------
// Aging
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testAgingBuckets)
{
  BOOST_CHECK_EQUAL(std::string("1-30"), aging_bucket(add_days(today, -20), today));
  BOOST_CHECK_EQUAL(std::string("90+"), aging_bucket(add_days(today, -95), today));
  BOOST_CHECK_EQUAL(std::string("current"), aging_bucket(add_days(today, 5), today));
  BOOST_CHECK_EQUAL(std::string("current"), aging_bucket(today, today));
}

BOOST_AUTO_TEST_CASE(testAgingBucketBoundaries)
{
  BOOST_CHECK_EQUAL(std::string("1-30"), aging_bucket(add_days(today, -1), today));
  BOOST_CHECK_EQUAL(std::string("1-30"), aging_bucket(add_days(today, -30), today));
  BOOST_CHECK_EQUAL(std::string("31-60"), aging_bucket(add_days(today, -31), today));
  BOOST_CHECK_EQUAL(std::string("31-60"), aging_bucket(add_days(today, -60), today));
  BOOST_CHECK_EQUAL(std::string("61-90"), aging_bucket(add_days(today, -90), today));
  BOOST_CHECK_EQUAL(std::string("90+"), aging_bucket(add_days(today, -91), today));
}

BOOST_AUTO_TEST_CASE(testAgingSummary)
{
  std::vector<AgingInvoice> invoices(4);
  invoices[0].invoice_id = "a"; invoices[0].due_date = add_days(today, -20); invoices[0].balance_due = from_units(100);
  invoices[1].invoice_id = "b"; invoices[1].due_date = add_days(today, -95); invoices[1].balance_due = from_units(50);
  invoices[2].invoice_id = "c"; invoices[2].due_date = add_days(today, 5);   invoices[2].balance_due = from_units(25);
  invoices[3].invoice_id = "d"; invoices[3].due_date = add_days(today, -10); invoices[3].balance_due = 0;

  std::vector<AgingBucketTotal> buckets = aging_summary(invoices, today);
  BOOST_REQUIRE_EQUAL(5u, buckets.size());

  BOOST_CHECK_EQUAL(std::string("current"), buckets[0].bucket);
  BOOST_CHECK_EQUAL(1, buckets[0].count);
  BOOST_CHECK_EQUAL(from_units(25), buckets[0].amount);
  BOOST_CHECK_EQUAL(1, buckets[1].count);
  BOOST_CHECK_EQUAL(from_units(100), buckets[1].amount);
  BOOST_CHECK_EQUAL(0, buckets[2].count);
  BOOST_CHECK_EQUAL(0, buckets[3].count);
  BOOST_CHECK_EQUAL(std::string("90+"), buckets[4].bucket);
  BOOST_CHECK_EQUAL(from_units(50), buckets[4].amount);
}

// ---------------------------------------------------------------------------
// Payment allocation
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testOldestFirstFillsEarliestInvoice)
{
  std::vector<OpenInvoice> invoices;
  invoices.push_back(open_invoice("a", CivilDate{2025, 1, 1}, from_units(1000)));
  invoices.push_back(open_invoice("b", CivilDate{2025, 2, 1}, from_units(1000)));

  std::vector<PaymentAllocation> out = allocate_payment(from_units(1000), invoices, AllocationStrategy::oldest_first);
  BOOST_REQUIRE_EQUAL(2u, out.size());
  BOOST_CHECK_EQUAL(from_units(1000), out[0].allocated_amount);
  BOOST_CHECK_EQUAL(0, out[1].allocated_amount);
  BOOST_CHECK_EQUAL(0, out[0].balance_after);
  BOOST_CHECK_EQUAL(from_units(1000), out[1].balance_after);
}

BOOST_AUTO_TEST_CASE(testOldestFirstKeepsInputOrder)
{
  std::vector<OpenInvoice> invoices;
  invoices.push_back(open_invoice("newer", CivilDate{2025, 2, 1}, from_units(1000)));
  invoices.push_back(open_invoice("older", CivilDate{2025, 1, 1}, from_units(1000)));

  std::vector<PaymentAllocation> out = allocate_payment(from_units(1000), invoices, AllocationStrategy::oldest_first);
  BOOST_CHECK_EQUAL(std::string("newer"), out[0].invoice_id);
  BOOST_CHECK_EQUAL(0, out[0].allocated_amount);
  BOOST_CHECK_EQUAL(from_units(1000), out[1].allocated_amount);
}

BOOST_AUTO_TEST_CASE(testProportionalSplitsByBalance)
{
  std::vector<OpenInvoice> invoices;
  invoices.push_back(open_invoice("a", CivilDate{2025, 1, 1}, from_units(1000)));
  invoices.push_back(open_invoice("b", CivilDate{2025, 2, 1}, from_units(1000)));

  std::vector<PaymentAllocation> out = allocate_payment(from_units(1000), invoices, AllocationStrategy::proportional);
  BOOST_CHECK_EQUAL(from_units(500), out[0].allocated_amount);
  BOOST_CHECK_EQUAL(from_units(500), out[1].allocated_amount);
}

BOOST_AUTO_TEST_CASE(testProportionalRemainderGoesToLargest)
{
  std::vector<OpenInvoice> invoices;
  invoices.push_back(open_invoice("a", CivilDate{2025, 1, 1}, from_units(100)));
  invoices.push_back(open_invoice("b", CivilDate{2025, 1, 2}, from_units(100)));
  invoices.push_back(open_invoice("c", CivilDate{2025, 1, 3}, from_units(100)));

  std::vector<PaymentAllocation> out = allocate_payment(from_units(100), invoices, AllocationStrategy::proportional);
  BOOST_CHECK_EQUAL(from_cents(3334), out[0].allocated_amount);
  BOOST_CHECK_EQUAL(from_cents(3333), out[1].allocated_amount);
  BOOST_CHECK_EQUAL(from_cents(3333), out[2].allocated_amount);
  BOOST_CHECK_EQUAL(from_units(100), out[0].allocated_amount + out[1].allocated_amount + out[2].allocated_amount);
}

BOOST_AUTO_TEST_CASE(testOverpaymentNeverExceedsBalances)
{
  std::vector<OpenInvoice> invoices;
  invoices.push_back(open_invoice("a", CivilDate{2025, 1, 1}, from_units(1000)));
  invoices.push_back(open_invoice("b", CivilDate{2025, 2, 1}, from_units(1000)));

  for (AllocationStrategy s : {AllocationStrategy::oldest_first, AllocationStrategy::proportional}) {
    std::vector<PaymentAllocation> out = allocate_payment(from_units(3000), invoices, s);
    BOOST_CHECK_EQUAL(from_units(1000), out[0].allocated_amount);
    BOOST_CHECK_EQUAL(from_units(1000), out[1].allocated_amount);
    BOOST_CHECK_EQUAL(0, out[1].balance_after);
  }
}

BOOST_AUTO_TEST_CASE(testUnapplySkipsEmptyAllocations)
{
  std::vector<OpenInvoice> invoices;
  invoices.push_back(open_invoice("a", CivilDate{2025, 1, 1}, from_units(1000)));
  invoices.push_back(open_invoice("b", CivilDate{2025, 2, 1}, from_units(1000)));
  std::vector<PaymentAllocation> out = allocate_payment(from_units(1000), invoices, AllocationStrategy::oldest_first);

  std::vector<BalanceRestoration> back = unapply_payment("pay_1", out);
  BOOST_REQUIRE_EQUAL(1u, back.size());
  BOOST_CHECK_EQUAL(std::string("a"), back[0].invoice_id);
  BOOST_CHECK_EQUAL(from_units(1000), back[0].amount_to_restore);
  BOOST_CHECK_EQUAL(std::string("pay_1"), back[0].payment_id);
}

BOOST_AUTO_TEST_CASE(testUnknownStrategy)
{
  BOOST_CHECK(allocation_strategy_from_string("proportional") == AllocationStrategy::proportional);
  BOOST_CHECK_EXCEPTION(allocation_strategy_from_string("newest_first"), LedgerError, code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_SUITE_END()
