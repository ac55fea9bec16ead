/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * t_plugins.cpp - Plugin registry and the India GST calculator commands
 */

#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <memory>
#include "plugins/gst/gst_plugin.hpp"
#include "plugins/interface/PluginManager.hpp"
#include "test_support.hpp"

using namespace lgate;
using namespace lgate::plugins;
using lgate_test::code_is;

namespace {
  class echo_plugin : public IPlugin {
  public:
    std::string get_plugin_name() override { return "Echo"; }
    std::vector<std::string> get_commands() override { return {"echo"}; }
    json execute(const std::string& command, const json& payload) override {
      if (command != "echo") throw LedgerError(ErrorCode::validation, "unknown command");
      return payload;
    }
  };

  PluginDefinition definition(const std::string& id) {
    PluginDefinition def;
    def.id = id;
    def.version = "0.1.0";
    return def;
  }

  struct gst_fixture {
    lgate_test::manual_clock clock;
    GstPlugin plugin;

    gst_fixture() : clock(lgate_test::utc(2025, 7, 10, 9)), plugin(clock.source()) {}
  };
}

BOOST_AUTO_TEST_SUITE(plugin_manager_tests)

BOOST_AUTO_TEST_CASE(testRegisterAndExecute)
{
  PluginManager manager;
  BOOST_CHECK(manager.RegisterPlugin(definition("test.echo"), std::unique_ptr<IPlugin>(new echo_plugin())));

  json response = manager.ExecutePluginCommand("test.echo", "echo", json{{"x", 1}});
  BOOST_CHECK_EQUAL(std::string("SUCCESS"), response["status"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("test.echo"), response["plugin"].get<std::string>());
  BOOST_CHECK_EQUAL(1, response["result"]["x"].get<int>());
}

BOOST_AUTO_TEST_CASE(testRejectsBadRegistrations)
{
  PluginManager manager;
  BOOST_CHECK(manager.RegisterPlugin(definition("test.echo"), std::unique_ptr<IPlugin>(new echo_plugin())));
  BOOST_CHECK(!manager.RegisterPlugin(definition("test.echo"), std::unique_ptr<IPlugin>(new echo_plugin())));
  BOOST_CHECK(!manager.RegisterPlugin(definition(""), std::unique_ptr<IPlugin>(new echo_plugin())));
  BOOST_CHECK(!manager.RegisterPlugin(definition("test.null"), std::unique_ptr<IPlugin>()));
  BOOST_CHECK_EQUAL(1u, manager.ListPlugins(false).size());
}

BOOST_AUTO_TEST_CASE(testUnknownAndInactivePlugins)
{
  PluginManager manager;
  manager.RegisterPlugin(definition("test.echo"), std::unique_ptr<IPlugin>(new echo_plugin()));

  BOOST_CHECK_EXCEPTION(manager.ExecutePluginCommand("test.missing", "echo", json::object()), LedgerError,
                        code_is(ErrorCode::not_found));

  BOOST_CHECK(manager.SetActive("test.echo", false));
  BOOST_CHECK(!manager.SetActive("test.missing", false));
  BOOST_CHECK_EXCEPTION(manager.ExecutePluginCommand("test.echo", "echo", json::object()), LedgerError,
                        code_is(ErrorCode::conflict));

  BOOST_CHECK(manager.ListPlugins(true).empty());
  json all = manager.ListPlugins(false);
  BOOST_REQUIRE_EQUAL(1u, all.size());
  BOOST_CHECK_EQUAL(std::string("Echo"), all[0]["name"].get<std::string>());
  BOOST_CHECK(!all[0]["is_active"].get<bool>());
  BOOST_CHECK_EQUAL(std::string("echo"), all[0]["commands"][0].get<std::string>());

  manager.SetActive("test.echo", true);
  BOOST_CHECK_NO_THROW(manager.ExecutePluginCommand("test.echo", "echo", json::object()));
}

BOOST_AUTO_TEST_CASE(testPluginErrorsPropagate)
{
  PluginManager manager;
  manager.RegisterPlugin(definition("test.echo"), std::unique_ptr<IPlugin>(new echo_plugin()));
  BOOST_CHECK_EXCEPTION(manager.ExecutePluginCommand("test.echo", "shout", json::object()), LedgerError,
                        code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(gst_plugin_tests, gst_fixture)

BOOST_AUTO_TEST_CASE(testCalculateLineItem)
{
  json r = plugin.execute("calculate_line_item", json::parse(R"({
    "quantity": 2, "rate": "500", "tax_rate": 18,
    "organization_state": "27", "place_of_supply": "27"
  })"));

  BOOST_CHECK_EQUAL(std::string("1000.00"), r["taxable_amount"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("90.00"), r["cgst_amount"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("0.00"), r["igst_amount"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("1180.00"), r["item_total"].get<std::string>());

  json inter = plugin.execute("calculate_line_item", json::parse(R"({
    "quantity": 2, "rate": 500, "organization_state": "27", "place_of_supply": "29AAGCB7383J1Z4"
  })"));
  BOOST_CHECK_EQUAL(std::string("180.00"), inter["igst_amount"].get<std::string>());
}

BOOST_AUTO_TEST_CASE(testCalculateInvoiceTotals)
{
  json r = plugin.execute("calculate_invoice_totals", json::parse(R"({
    "line_items": [{"quantity": 1, "rate": 1000}, {"quantity": 1, "rate": 500}],
    "discount_type": "percentage", "discount_value": 10,
    "shipping_charge": 50, "amount_paid": 670
  })"));

  BOOST_CHECK_EQUAL(2u, r["line_items"].size());
  BOOST_CHECK(!r["is_igst"].get<bool>());
  BOOST_CHECK_EQUAL(std::string("1670.00"), r["grand_total"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("1000.00"), r["balance_due"].get<std::string>());

  BOOST_CHECK_EXCEPTION(plugin.execute("calculate_invoice_totals", json{{"line_items", json::array()},
                                                                         {"discount_type", "bogus"}}),
                        LedgerError, code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_CASE(testTaxBreakdownCommand)
{
  json r = plugin.execute("tax_breakdown", json{{"taxable_amount", 1000}, {"tax_rate", 18}, {"is_igst", true}});
  BOOST_CHECK_EQUAL(std::string("18.00"), r["igst_rate"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("180.00"), r["total_tax"].get<std::string>());
}

BOOST_AUTO_TEST_CASE(testValidateGstinCommand)
{
  json ok = plugin.execute("validate_gstin", json{{"gstin", "27AABCU9603R1ZN"}});
  BOOST_CHECK(ok["valid"].get<bool>());
  BOOST_CHECK_EQUAL(std::string("Maharashtra"), ok["state_name"].get<std::string>());

  json bad = plugin.execute("validate_gstin", json{{"gstin", "27AABCU9603R1ZM"}});
  BOOST_CHECK(!bad["valid"].get<bool>());
  BOOST_CHECK(bad.contains("error"));

  json states = plugin.execute("list_states", json::object());
  BOOST_CHECK(states.is_array());
  BOOST_CHECK_EQUAL(std::string("01"), states[0]["code"].get<std::string>());
}

BOOST_AUTO_TEST_CASE(testAgingDefaultsToToday)
{
  json r = plugin.execute("aging_bucket", json{{"due_date", "2025-06-10"}});
  BOOST_CHECK_EQUAL(std::string("1-30"), r["bucket"].get<std::string>());
  BOOST_CHECK_EQUAL(30, r["days_overdue"].get<int>());
  BOOST_CHECK_EQUAL(std::string("2025-07-10"), r["as_of"].get<std::string>());

  json later = plugin.execute("aging_bucket", json{{"due_date", "2025-06-10"}, {"as_of", "2025-08-20"}});
  BOOST_CHECK_EQUAL(std::string("61-90"), later["bucket"].get<std::string>());

  BOOST_CHECK_EXCEPTION(plugin.execute("aging_bucket", json{{"due_date", "soon"}}), LedgerError,
                        code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_CASE(testAgingSummaryCommand)
{
  json r = plugin.execute("aging_summary", json::parse(R"({
    "invoices": [
      {"invoice_id": "a", "due_date": "2025-06-20", "balance_due": 100},
      {"invoice_id": "b", "due_date": "2025-04-01", "balance_due": "50.50"}
    ]
  })"));

  BOOST_REQUIRE_EQUAL(5u, r["buckets"].size());
  BOOST_CHECK_EQUAL(1, r["buckets"][1]["count"].get<int>());
  BOOST_CHECK_EQUAL(std::string("50.50"), r["buckets"][4]["amount"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("150.50"), r["total_outstanding"].get<std::string>());
}

BOOST_AUTO_TEST_CASE(testAllocateAndUnapply)
{
  json r = plugin.execute("allocate_payment", json::parse(R"({
    "amount": 1500,
    "invoices": [
      {"invoice_id": "new", "invoice_date": "2025-02-01", "balance_due": 1000},
      {"invoice_id": "old", "invoice_date": "2025-01-01", "balance_due": 1000}
    ]
  })"));

  BOOST_CHECK_EQUAL(std::string("500.00"), r["allocations"][0]["allocated_amount"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("1000.00"), r["allocations"][1]["allocated_amount"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("1500.00"), r["total_allocated"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("0.00"), r["unallocated"].get<std::string>());

  json undo = plugin.execute("unapply_payment", json::parse(R"({
    "payment_id": "pay_9",
    "allocations": [
      {"invoice_id": "new", "allocated_amount": "500.00"},
      {"invoice_id": "idle", "amount": 0}
    ]
  })"));
  BOOST_REQUIRE_EQUAL(1u, undo["restorations"].size());
  BOOST_CHECK_EQUAL(std::string("500.00"), undo["restorations"][0]["amount_to_restore"].get<std::string>());

  BOOST_CHECK_EXCEPTION(plugin.execute("allocate_payment", json{{"amount", 10}, {"invoices", json::array()},
                                                                 {"strategy", "newest_first"}}),
                        LedgerError, code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_CASE(testUnknownCommand)
{
  BOOST_CHECK_EXCEPTION(plugin.execute("file_return", json::object()), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(plugin.execute("list_states", json::array()), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EQUAL(std::string("India GST Calculator"), plugin.get_plugin_name());
  BOOST_CHECK_EQUAL(9u, plugin.get_commands().size());
}

BOOST_AUTO_TEST_SUITE_END()
