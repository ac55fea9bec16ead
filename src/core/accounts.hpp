/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: accounts.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The system chart of accounts. Every journal line references one of these
 * codes; the poster never invents accounts.
 * ============================================================================
 */

#ifndef LGATE_ACCOUNTS_HPP
#define LGATE_ACCOUNTS_HPP

#include <string>
#include <vector>

namespace lgate {

    enum class AccountType {
        asset,
        liability,
        equity,
        income,
        expense
    };

    const char* account_type_name(AccountType type);

    struct Account {
        std::string code;
        std::string name;
        AccountType type;
    };

    namespace account_codes {
        constexpr const char* ACCOUNTS_RECEIVABLE = "1100";
        constexpr const char* BANK = "1200";
        constexpr const char* CASH = "1210";
        constexpr const char* INVENTORY = "1300";
        constexpr const char* GST_INPUT_CGST = "1410";
        constexpr const char* GST_INPUT_SGST = "1420";
        constexpr const char* GST_INPUT_IGST = "1430";
        constexpr const char* ACCOUNTS_PAYABLE = "2100";
        constexpr const char* GST_PAYABLE_CGST = "2210";
        constexpr const char* GST_PAYABLE_SGST = "2220";
        constexpr const char* GST_PAYABLE_IGST = "2230";
        constexpr const char* SALARY_PAYABLE = "2310";
        constexpr const char* TDS_PAYABLE = "2320";
        constexpr const char* PF_EMPLOYEE_PAYABLE = "2330";
        constexpr const char* PF_EMPLOYER_PAYABLE = "2331";
        constexpr const char* ESI_PAYABLE = "2340";
        constexpr const char* PROFESSIONAL_TAX_PAYABLE = "2350";
        constexpr const char* RETAINED_EARNINGS = "3100";
        constexpr const char* OWNER_EQUITY = "3200";
        constexpr const char* OPENING_BALANCE_EQUITY = "3300";
        constexpr const char* SALES_REVENUE = "4100";
        constexpr const char* SERVICE_REVENUE = "4200";
        constexpr const char* OTHER_INCOME = "4900";
        constexpr const char* PURCHASES = "5000";
        constexpr const char* COST_OF_GOODS_SOLD = "5100";
        constexpr const char* SALARY_EXPENSE = "6100";
        constexpr const char* EMPLOYER_PF_EXPENSE = "6110";
        constexpr const char* EMPLOYER_ESI_EXPENSE = "6120";
        constexpr const char* MISC_EXPENSE = "6900";
    }

    const std::vector<Account>& chart_of_accounts();

    // nullptr when the code is not in the chart.
    const Account* find_account_by_code(const std::string& code);

    // Case-insensitive, surrounding whitespace ignored.
    const Account* find_account_by_name(const std::string& name);

    /**
     * @brief Resolves a payload's account reference: a chart code ("6200")
     * or a chart name ("Rent Expense").
     */
    const Account* resolve_account(const std::string& code_or_name);

    // Throws InvariantViolation for a code outside the chart.
    const Account& require_account(const std::string& code);

} // namespace lgate

#endif // LGATE_ACCOUNTS_HPP
