/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gstin.hpp
 * ============================================================================
 * * DESCRIPTION:
 * GST identification numbers. Layout of the 15 characters:
 *   [0,2)   state code            "27"
 *   [2,12)  PAN of the holder     "AABCU9603R"
 *   [12]    entity number         "1"
 *   [13]    always 'Z'
 *   [14]    mod-36 check character
 * ============================================================================
 */

#ifndef LGATE_GSTIN_HPP
#define LGATE_GSTIN_HPP

#include <optional>
#include <string>
#include <vector>

namespace lgate {

    struct GstState {
        std::string code;
        std::string name;
    };

    // 01..38 and 97, in code order.
    const std::vector<GstState>& gst_states();

    // nullptr for a code outside the table.
    const GstState* find_gst_state(const std::string& code);

    /**
     * @brief Check character for the first 14 characters of a GSTIN.
     * @return nullopt if a character falls outside 0-9A-Z.
     */
    std::optional<char> gstin_check_character(const std::string& first14);

    struct GstinValidation {
        bool valid = false;
        std::string gstin;          // trimmed, upper-cased input
        std::string state_code;
        std::string state_name;
        std::string pan;
        std::string entity_code;
        std::string error;          // set when !valid
    };

    GstinValidation validate_gstin(const std::string& gstin);

} // namespace lgate

#endif // LGATE_GSTIN_HPP
