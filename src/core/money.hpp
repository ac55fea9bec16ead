/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Fixed-point money. Every amount in the engine is a money_micro, and every
 * rounding to currency precision goes through round_currency_ratio() so the
 * results are identical on every platform.
 * ============================================================================
 */

#ifndef LGATE_MONEY_HPP
#define LGATE_MONEY_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lgate {

    // money_micro: 1.00 = 1,000,000.
    // We use int64_t to prevent floating-point rounding errors in accounting.
    typedef int64_t money_micro;

    constexpr money_micro MICROS_PER_UNIT = 1000000;
    constexpr money_micro MICROS_PER_CENT = 10000;

    // Percentages use the same scale: 18% is 18 * MICROS_PER_UNIT.
    constexpr money_micro PERCENT_BASE = 100 * MICROS_PER_UNIT;

    // Largest magnitude any amount may carry, in whole units and in micros.
    constexpr money_micro MAX_AMOUNT_UNITS = INT64_MAX / MICROS_PER_UNIT;
    constexpr money_micro MAX_AMOUNT = MAX_AMOUNT_UNITS * MICROS_PER_UNIT;

    /**
     * @brief The shared rounding primitive.
     * Computes a * b / d and rounds the result half-up (away from zero) to
     * two decimals. The product is formed in 128 bits, so no precision is
     * lost before the single rounding step.
     * @throws std::invalid_argument if d is zero or the result is beyond
     * MAX_AMOUNT.
     */
    money_micro round_currency_ratio(money_micro a, money_micro b, money_micro d);

    /**
     * @brief Round a micro amount to two decimals, half-up.
     */
    money_micro round_currency(money_micro amount);

    /**
     * @brief Convert a whole-number-of-cents amount, e.g. 1050 -> 10.50.
     */
    constexpr money_micro from_cents(int64_t cents) { return cents * MICROS_PER_CENT; }

    // @throws std::invalid_argument beyond MAX_AMOUNT_UNITS.
    money_micro from_units(int64_t units);

    // a + b. @throws std::invalid_argument if the sum is beyond MAX_AMOUNT.
    money_micro add_amounts(money_micro a, money_micro b);

    // Renders "1234.50" / "-3.10". Input is rounded to cents first.
    std::string format_amount(money_micro amount);

    /**
     * @brief Parses "1234.5", "1234.50", "-7", "1,180.00".
     * Digits beyond the sixth decimal place are rejected.
     * @throws std::invalid_argument on malformed text or a value beyond
     * MAX_AMOUNT.
     */
    money_micro parse_amount(const std::string& text);

    /**
     * @brief Reads an amount from a JSON payload field.
     * Accepts numbers and numeric strings; a missing or null field yields
     * the fallback.
     * @throws std::invalid_argument if the field has another type or the
     * value is beyond MAX_AMOUNT.
     */
    money_micro amount_from_json(const json& obj, const std::string& key, money_micro fallback = 0);

} // namespace lgate

#endif // LGATE_MONEY_HPP
