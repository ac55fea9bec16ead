/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: plugin.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The SDK header for LedgerGate plugins. A jurisdiction-specific calculator
 * (Indian GST, Australian GST, ...) inherits from IPlugin and implements the
 * virtual methods. Plugins compute; they never write to the ledger.
 * ============================================================================
 */

#ifndef LGATE_PLUGIN_HPP
#define LGATE_PLUGIN_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lgate {
namespace plugins {

    class IPlugin {
    public:
        virtual ~IPlugin() {}

        /**
         * @return The display name of the plugin (e.g., "India GST Calculator")
         */
        virtual std::string get_plugin_name() = 0;

        // Commands accepted by execute(), for the registry listing.
        virtual std::vector<std::string> get_commands() = 0;

        /**
         * @brief Execute Action
         * The primary entry point for the Plugin Gateway.
         * @param command The specific task (e.g., "calculate_line_item")
         * @param payload JSON data from the caller
         * @return JSON result. Bad input throws LedgerError (VALIDATION).
         */
        virtual json execute(const std::string& command, const json& payload) = 0;
    };

} // namespace plugins
} // namespace lgate

#endif // LGATE_PLUGIN_HPP
