/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gstin.cpp
 * ============================================================================
 */

#include "gstin.hpp"
#include <algorithm>
#include <cctype>

namespace lgate {

namespace {

    const std::string GSTIN_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    bool is_digit(char c) { return c >= '0' && c <= '9'; }
    bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

    // [0-9]{2}[A-Z]{5}[0-9]{4}[A-Z][1-9A-Z]Z[0-9A-Z]
    bool matches_layout(const std::string& g) {
        for (int i = 0; i < 2; ++i) if (!is_digit(g[i])) return false;
        for (int i = 2; i < 7; ++i) if (!is_upper(g[i])) return false;
        for (int i = 7; i < 11; ++i) if (!is_digit(g[i])) return false;
        if (!is_upper(g[11])) return false;
        if (!(is_upper(g[12]) || (g[12] >= '1' && g[12] <= '9'))) return false;
        if (g[13] != 'Z') return false;
        return is_upper(g[14]) || is_digit(g[14]);
    }
}

const std::vector<GstState>& gst_states() {
    static const std::vector<GstState> states = {
        {"01", "Jammu and Kashmir"},
        {"02", "Himachal Pradesh"},
        {"03", "Punjab"},
        {"04", "Chandigarh"},
        {"05", "Uttarakhand"},
        {"06", "Haryana"},
        {"07", "Delhi"},
        {"08", "Rajasthan"},
        {"09", "Uttar Pradesh"},
        {"10", "Bihar"},
        {"11", "Sikkim"},
        {"12", "Arunachal Pradesh"},
        {"13", "Nagaland"},
        {"14", "Manipur"},
        {"15", "Mizoram"},
        {"16", "Tripura"},
        {"17", "Meghalaya"},
        {"18", "Assam"},
        {"19", "West Bengal"},
        {"20", "Jharkhand"},
        {"21", "Odisha"},
        {"22", "Chhattisgarh"},
        {"23", "Madhya Pradesh"},
        {"24", "Gujarat"},
        {"25", "Daman and Diu"},
        {"26", "Dadra and Nagar Haveli"},
        {"27", "Maharashtra"},
        {"28", "Andhra Pradesh"},
        {"29", "Karnataka"},
        {"30", "Goa"},
        {"31", "Lakshadweep"},
        {"32", "Kerala"},
        {"33", "Tamil Nadu"},
        {"34", "Puducherry"},
        {"35", "Andaman and Nicobar Islands"},
        {"36", "Telangana"},
        {"37", "Andhra Pradesh (New)"},
        {"38", "Ladakh"},
        {"97", "Other Territory"}
    };
    return states;
}

const GstState* find_gst_state(const std::string& code) {
    for (const auto& state : gst_states()) {
        if (state.code == code) return &state;
    }
    return nullptr;
}

std::optional<char> gstin_check_character(const std::string& first14) {
    int factor = 1;
    int total = 0;
    for (char c : first14) {
        size_t digit = GSTIN_ALPHABET.find(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        if (digit == std::string::npos) return std::nullopt;
        int product = factor * static_cast<int>(digit);
        total += product / 36 + product % 36;
        factor = factor == 1 ? 2 : 1;
    }
    return GSTIN_ALPHABET[(36 - total % 36) % 36];
}

GstinValidation validate_gstin(const std::string& input) {
    GstinValidation result;

    size_t start = input.find_first_not_of(" \t\r\n");
    size_t end = input.find_last_not_of(" \t\r\n");
    std::string gstin = start == std::string::npos ? "" : input.substr(start, end - start + 1);
    std::transform(gstin.begin(), gstin.end(), gstin.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    result.gstin = gstin;

    if (gstin.empty()) {
        result.error = "GSTIN is empty";
        return result;
    }
    if (gstin.size() != 15) {
        result.error = "GSTIN must be 15 characters";
        return result;
    }
    if (!matches_layout(gstin)) {
        result.error = "Invalid GSTIN format";
        return result;
    }

    const GstState* state = find_gst_state(gstin.substr(0, 2));
    if (!state) {
        result.error = "Invalid state code: " + gstin.substr(0, 2);
        return result;
    }

    std::optional<char> expected = gstin_check_character(gstin.substr(0, 14));
    if (!expected || gstin[14] != *expected) {
        result.error = std::string("Invalid GSTIN checksum. Expected ") + (expected ? std::string(1, *expected) : "?") +
                       " at position 15.";
        return result;
    }

    result.valid = true;
    result.state_code = state->code;
    result.state_name = state->name;
    result.pan = gstin.substr(2, 10);
    result.entity_code = gstin.substr(12, 1);
    return result;
}

} // namespace lgate
