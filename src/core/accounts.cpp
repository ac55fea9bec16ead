/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: accounts.cpp
 * ============================================================================
 */

#include "accounts.hpp"
#include <algorithm>
#include <cctype>
#include "errors.hpp"

namespace lgate {

namespace {

    std::string normalise_name(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t");
        std::string out = s.substr(start, end - start + 1);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

const char* account_type_name(AccountType type) {
    switch (type) {
        case AccountType::asset: return "asset";
        case AccountType::liability: return "liability";
        case AccountType::equity: return "equity";
        case AccountType::income: return "income";
        case AccountType::expense: return "expense";
    }
    return "asset";
}

const std::vector<Account>& chart_of_accounts() {
    static const std::vector<Account> chart = {
        // Assets
        {"1100", "Accounts Receivable", AccountType::asset},
        {"1200", "Bank Account", AccountType::asset},
        {"1210", "Cash in Hand", AccountType::asset},
        {"1300", "Inventory", AccountType::asset},
        {"1410", "GST Input Credit - CGST", AccountType::asset},
        {"1420", "GST Input Credit - SGST", AccountType::asset},
        {"1430", "GST Input Credit - IGST", AccountType::asset},
        // Liabilities
        {"2100", "Accounts Payable", AccountType::liability},
        {"2210", "GST Payable - CGST", AccountType::liability},
        {"2220", "GST Payable - SGST", AccountType::liability},
        {"2230", "GST Payable - IGST", AccountType::liability},
        {"2310", "Salary Payable", AccountType::liability},
        {"2320", "TDS Payable", AccountType::liability},
        {"2330", "Employee PF Payable", AccountType::liability},
        {"2331", "Employer PF Payable", AccountType::liability},
        {"2340", "ESI Payable", AccountType::liability},
        {"2350", "Professional Tax Payable", AccountType::liability},
        // Equity
        {"3100", "Retained Earnings", AccountType::equity},
        {"3200", "Owner's Equity", AccountType::equity},
        {"3300", "Opening Balance Equity", AccountType::equity},
        // Income
        {"4100", "Sales Revenue", AccountType::income},
        {"4200", "Service Revenue", AccountType::income},
        {"4900", "Other Income", AccountType::income},
        // Expenses
        {"5000", "Purchases", AccountType::expense},
        {"5100", "Cost of Goods Sold", AccountType::expense},
        {"6100", "Salary Expense", AccountType::expense},
        {"6110", "Employer PF Contribution", AccountType::expense},
        {"6120", "Employer ESI Contribution", AccountType::expense},
        {"6200", "Rent Expense", AccountType::expense},
        {"6300", "Utilities Expense", AccountType::expense},
        {"6400", "Office Supplies", AccountType::expense},
        {"6500", "Professional Fees", AccountType::expense},
        {"6600", "Depreciation Expense", AccountType::expense},
        {"6710", "Travel & Conveyance", AccountType::expense},
        {"6720", "Repairs & Maintenance", AccountType::expense},
        {"6730", "Advertising & Marketing", AccountType::expense},
        {"6740", "Staff Welfare", AccountType::expense},
        {"6750", "Communication Expense", AccountType::expense},
        {"6900", "Miscellaneous Expense", AccountType::expense}
    };
    return chart;
}

const Account* find_account_by_code(const std::string& code) {
    for (const auto& account : chart_of_accounts()) {
        if (account.code == code) return &account;
    }
    return nullptr;
}

const Account* find_account_by_name(const std::string& name) {
    std::string wanted = normalise_name(name);
    if (wanted.empty()) return nullptr;
    for (const auto& account : chart_of_accounts()) {
        if (normalise_name(account.name) == wanted) return &account;
    }
    return nullptr;
}

const Account* resolve_account(const std::string& code_or_name) {
    const Account* account = find_account_by_code(code_or_name);
    return account ? account : find_account_by_name(code_or_name);
}

const Account& require_account(const std::string& code) {
    const Account* account = find_account_by_code(code);
    if (!account) throw InvariantViolation("Account " + code + " is not in the chart of accounts");
    return *account;
}

} // namespace lgate
