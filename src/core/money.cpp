/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include <cmath>
#include <stdexcept>

namespace lgate {

namespace {
    typedef __int128 wide_micro;

    money_micro checked(wide_micro value) {
        if (value > MAX_AMOUNT || value < -MAX_AMOUNT) {
            throw std::invalid_argument("Amount out of range");
        }
        return static_cast<money_micro>(value);
    }
}

money_micro from_units(int64_t units) {
    return checked(static_cast<wide_micro>(units) * MICROS_PER_UNIT);
}

money_micro add_amounts(money_micro a, money_micro b) {
    return checked(static_cast<wide_micro>(a) + b);
}

money_micro round_currency_ratio(money_micro a, money_micro b, money_micro d) {
    if (d == 0) {
        throw std::invalid_argument("round_currency_ratio: zero denominator");
    }

    wide_micro num = static_cast<wide_micro>(a) * b;
    wide_micro den = d;
    if (den < 0) {
        num = -num;
        den = -den;
    }

    bool negative = num < 0;
    if (negative) num = -num;

    // step is even (den * 10,000), so step / 2 is the exact half-cent
    wide_micro step = den * MICROS_PER_CENT;
    wide_micro cents = (num + step / 2) / step;

    wide_micro result = cents * MICROS_PER_CENT;
    return checked(negative ? -result : result);
}

money_micro round_currency(money_micro amount) {
    return round_currency_ratio(amount, 1, 1);
}

std::string format_amount(money_micro amount) {
    money_micro rounded = round_currency(amount);
    bool negative = rounded < 0;
    money_micro abs_val = negative ? -rounded : rounded;

    long long units = abs_val / MICROS_PER_UNIT;
    long long cents = (abs_val % MICROS_PER_UNIT) / MICROS_PER_CENT;
    return std::string(negative ? "-" : "") + std::to_string(units) + "." + (cents < 10 ? "0" : "") + std::to_string(cents);
}

money_micro parse_amount(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (c == ',' || c == ' ') continue;
        s += c;
    }
    if (s.empty()) throw std::invalid_argument("Empty amount");

    size_t pos = 0;
    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        pos = 1;
    }

    money_micro units = 0;
    money_micro fraction = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool in_fraction = false;

    for (; pos < s.size(); ++pos) {
        char c = s[pos];
        if (c == '.') {
            if (in_fraction) throw std::invalid_argument("Malformed amount: " + text);
            in_fraction = true;
            continue;
        }
        if (c < '0' || c > '9') throw std::invalid_argument("Malformed amount: " + text);
        seen_digit = true;
        if (in_fraction) {
            if (++fraction_digits > 6) throw std::invalid_argument("Amount exceeds micro precision: " + text);
            fraction = fraction * 10 + (c - '0');
        } else {
            if (units > MAX_AMOUNT_UNITS / 10) throw std::invalid_argument("Amount out of range: " + text);
            units = units * 10 + (c - '0');
        }
    }
    if (!seen_digit) throw std::invalid_argument("Malformed amount: " + text);

    if (units > MAX_AMOUNT_UNITS || (units == MAX_AMOUNT_UNITS && fraction != 0)) {
        throw std::invalid_argument("Amount out of range: " + text);
    }
    for (int i = fraction_digits; i < 6; ++i) fraction *= 10;

    money_micro value = units * MICROS_PER_UNIT + fraction;
    return negative ? -value : value;
}

money_micro amount_from_json(const json& obj, const std::string& key, money_micro fallback) {
    if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
        return fallback;
    }

    const json& v = obj.at(key);
    if (v.is_number_unsigned()) {
        uint64_t units = v.get<uint64_t>();
        if (units > static_cast<uint64_t>(MAX_AMOUNT_UNITS)) {
            throw std::invalid_argument("Field '" + key + "' is out of range");
        }
        return from_units(static_cast<int64_t>(units));
    }
    if (v.is_number_integer()) {
        return from_units(v.get<int64_t>());
    }
    if (v.is_number_float()) {
        double units = v.get<double>();
        if (!std::isfinite(units) || std::fabs(units) > static_cast<double>(MAX_AMOUNT_UNITS)) {
            throw std::invalid_argument("Field '" + key + "' is out of range");
        }
        return checked(std::llround(units * static_cast<double>(MICROS_PER_UNIT)));
    }
    if (v.is_string()) {
        return parse_amount(v.get<std::string>());
    }
    throw std::invalid_argument("Field '" + key + "' is not a number");
}

} // namespace lgate
