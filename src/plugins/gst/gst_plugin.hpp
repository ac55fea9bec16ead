/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gst_plugin.hpp
 * ============================================================================
 * * DESCRIPTION:
 * India GST calculator exposed through the plugin gateway as "in.gov.gst".
 * Amounts in payloads may be JSON numbers or numeric strings; results carry
 * amounts as "1234.50" strings.
 *
 * * COMMANDS:
 * calculate_line_item, calculate_invoice_totals, tax_breakdown,
 * validate_gstin, list_states, aging_bucket, aging_summary,
 * allocate_payment, unapply_payment
 * ============================================================================
 */

#ifndef LGATE_GST_PLUGIN_HPP
#define LGATE_GST_PLUGIN_HPP

#include <string>
#include <vector>
#include "../interface/plugin.hpp"
#include "../../core/time_util.hpp"

namespace lgate {
namespace plugins {

    constexpr const char* GST_PLUGIN_ID = "in.gov.gst";
    constexpr const char* GST_PLUGIN_VERSION = "1.0.0";

    class GstPlugin : public IPlugin {
    public:
        // clock supplies "today" when an aging payload has no as_of date
        explicit GstPlugin(Clock clock);

        std::string get_plugin_name() override;
        std::vector<std::string> get_commands() override;
        json execute(const std::string& command, const json& payload) override;

    private:
        json calculate_line_item(const json& payload);
        json calculate_invoice_totals(const json& payload);
        json tax_breakdown(const json& payload);
        json validate_gstin(const json& payload);
        json list_states();
        json aging_bucket(const json& payload);
        json aging_summary(const json& payload);
        json allocate_payment(const json& payload);
        json unapply_payment(const json& payload);

        CivilDate as_of_date(const json& payload);

        Clock clock_;
    };

} // namespace plugins
} // namespace lgate

#endif // LGATE_GST_PLUGIN_HPP
