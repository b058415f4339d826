#pragma once

#include <cstdint>
#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace ShapeFusion {

// Exact base-10 number: sign * coefficient * 10^exponent.
// The coefficient keeps the digits as written ("12.30" stays "1230", -2),
// equality compares the normalized number ("12.30" == "12.3").
class Decimal {
    bool m_negative = false;
    std::string m_digits = "0";
    std::int32_t m_exponent = 0;

    static constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }

public:
    // Largest magnitude accepted for the exponent of a parsed number.
    static constexpr std::int64_t MaxExponent = 999999999;

    Decimal() = default;

    explicit Decimal(std::int64_t v) {
        m_negative = v < 0;
        // avoid overflow on INT64_MIN
        std::uint64_t mag = m_negative ? std::uint64_t(0) - static_cast<std::uint64_t>(v)
                                       : static_cast<std::uint64_t>(v);
        m_digits = std::to_string(mag);
    }

    // Accepts [+-]digits[.digits][(e|E)[+-]digits] with optional surrounding spaces.
    static std::optional<Decimal> FromString(std::string_view s) {
        while(!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while(!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        if(s.empty()) return std::nullopt;

        Decimal d;
        std::size_t i = 0;
        if(s[i] == '+' || s[i] == '-') {
            d.m_negative = s[i] == '-';
            i ++;
        }
        std::string digits;
        std::int64_t exponent = 0;
        bool seenDigit = false;
        for(; i < s.size() && is_digit(s[i]); i ++) {
            digits.push_back(s[i]);
            seenDigit = true;
        }
        if(i < s.size() && s[i] == '.') {
            i ++;
            for(; i < s.size() && is_digit(s[i]); i ++) {
                digits.push_back(s[i]);
                exponent --;
                seenDigit = true;
            }
        }
        if(!seenDigit) return std::nullopt;
        if(i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            i ++;
            std::int64_t e = 0;
            const char * first = s.data() + i;
            if(i < s.size() && s[i] == '+') first ++;
            auto [ptr, ec] = std::from_chars(first, s.data() + s.size(), e);
            if(ec != std::errc() || ptr == first) return std::nullopt;
            i = static_cast<std::size_t>(ptr - s.data());
            exponent += e;
        }
        if(i != s.size()) return std::nullopt;
        if(exponent > MaxExponent || exponent < -MaxExponent) return std::nullopt;

        std::size_t nz = digits.find_first_not_of('0');
        d.m_digits = nz == std::string::npos ? std::string("0") : digits.substr(nz);
        d.m_exponent = static_cast<std::int32_t>(exponent);
        return d;
    }

    bool isNegative() const { return m_negative && !isZero(); }
    bool isZero() const { return m_digits == "0"; }
    std::int32_t exponent() const { return m_exponent; }
    const std::string & coefficient() const { return m_digits; }

    // Integral value when the number has no fractional part and fits int64.
    std::optional<std::int64_t> toInteger() const {
        std::string digits = m_digits;
        std::int32_t e = m_exponent;
        while(e < 0 && digits.size() > 1 && digits.back() == '0') {
            digits.pop_back();
            e ++;
        }
        if(e < 0) {
            if(!isZero()) return std::nullopt;
            return 0;
        }
        if(e > 18) return std::nullopt;
        digits.append(static_cast<std::size_t>(e), '0');
        std::uint64_t mag = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), mag);
        if(ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;
        if(m_negative) {
            if(mag > std::uint64_t(1) << 63) return std::nullopt;
            return static_cast<std::int64_t>(std::uint64_t(0) - mag);
        }
        if(mag > std::uint64_t(INT64_MAX)) return std::nullopt;
        return static_cast<std::int64_t>(mag);
    }

    double toDouble() const {
        std::string s = m_digits + "e" + std::to_string(m_exponent);
        double out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if(ec == std::errc::result_out_of_range) {
            const std::int64_t magnitude = std::int64_t(m_exponent) + std::int64_t(m_digits.size());
            out = magnitude > 0 ? std::numeric_limits<double>::infinity() : 0.0;
        }
        return m_negative ? -out : out;
    }

    // Plain notation for exponent <= 0 with adjusted exponent >= -6,
    // scientific otherwise: "12.30", "0.000123", "1.5E+7", "1E-9".
    std::string toString() const {
        std::string out;
        if(m_negative) out.push_back('-');
        const std::int64_t adjusted = std::int64_t(m_exponent) + std::int64_t(m_digits.size()) - 1;
        if(m_exponent > 0 || adjusted < -6) {
            out.push_back(m_digits[0]);
            if(m_digits.size() > 1) {
                out.push_back('.');
                out.append(m_digits, 1, std::string::npos);
            }
            out += adjusted < 0 ? "E-" : "E+";
            out += std::to_string(adjusted < 0 ? -adjusted : adjusted);
            return out;
        }
        if(m_exponent == 0) {
            out += m_digits;
            return out;
        }
        std::size_t frac = static_cast<std::size_t>(-m_exponent);
        if(m_digits.size() > frac) {
            out += m_digits.substr(0, m_digits.size() - frac);
            out.push_back('.');
            out += m_digits.substr(m_digits.size() - frac);
        } else {
            out += "0.";
            out.append(frac - m_digits.size(), '0');
            out += m_digits;
        }
        return out;
    }

    friend bool operator==(const Decimal & a, const Decimal & b) {
        if(a.isZero() && b.isZero()) return true;
        if(a.m_negative != b.m_negative) return false;
        auto strip = [](const Decimal & d, std::string & digits, std::int64_t & e) {
            digits = d.m_digits;
            e = d.m_exponent;
            while(digits.size() > 1 && digits.back() == '0') {
                digits.pop_back();
                e ++;
            }
        };
        std::string da, db;
        std::int64_t ea = 0, eb = 0;
        strip(a, da, ea);
        strip(b, db, eb);
        return da == db && ea == eb;
    }
};

} // namespace ShapeFusion
