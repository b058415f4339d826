#pragma once

#include <array>
#include <charconv>
#include <cmath>
#include <complex>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ShapeFusion {

// Leaf converter: one raw value in, one converted value (or errors) out.
// Failures are reported through the returned Result; a converter that throws
// a std::exception is reported as a CONVERSION error at its location.
using Converter = std::function<Result(const Value &)>;


struct DateTime {
    int year = 1900;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;

    static DateTime FromTm(const std::tm & t) {
        return DateTime{t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour, t.tm_min, t.tm_sec};
    }

    std::string toString() const {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour, minute, second);
        return buf;
    }

    friend bool operator==(const DateTime &, const DateTime &) = default;
};


namespace converters_detail {

inline std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    std::size_t b = s.find_first_not_of(ws);
    if(b == std::string_view::npos) return {};
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

inline std::optional<std::int64_t> parse_int(std::string_view s) {
    s = trim(s);
    if(!s.empty() && s.front() == '+') s.remove_prefix(1);
    if(s.empty()) return std::nullopt;
    std::int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if(ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return out;
}

inline std::optional<double> parse_double(std::string_view s) {
    s = trim(s);
    if(!s.empty() && s.front() == '+') s.remove_prefix(1);
    if(s.empty()) return std::nullopt;
    double out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if(ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return out;
}

// "a", "bj", "a+bj", "a-bj", optionally parenthesized
inline std::optional<std::complex<double>> parse_complex(std::string_view s) {
    s = trim(s);
    if(s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        s = trim(s.substr(1, s.size() - 2));
    }
    if(s.empty()) return std::nullopt;
    if(s.back() != 'j' && s.back() != 'J') {
        if(auto re = parse_double(s)) return std::complex<double>(*re, 0.0);
        return std::nullopt;
    }
    s.remove_suffix(1);
    std::size_t split = std::string_view::npos;
    for(std::size_t i = s.size(); i-- > 1;) {
        if((s[i] == '+' || s[i] == '-') && s[i - 1] != 'e' && s[i - 1] != 'E') {
            split = i;
            break;
        }
    }
    auto imagOf = [](std::string_view part) -> std::optional<double> {
        if(part.empty() || part == "+") return 1.0;
        if(part == "-") return -1.0;
        return parse_double(part);
    };
    if(split == std::string_view::npos) {
        auto im = imagOf(s);
        if(!im) return std::nullopt;
        return std::complex<double>(0.0, *im);
    }
    auto re = parse_double(s.substr(0, split));
    auto im = imagOf(s.substr(split));
    if(!re || !im) return std::nullopt;
    return std::complex<double>(*re, *im);
}

inline std::string expected_got(std::string_view what, const Value & v) {
    return "expected " + std::string(what) + ", got " + Repr(v) + " instead";
}

inline constexpr std::array<std::string_view, 5> TruthValues = {"true", "t", "yes", "y", "1"};
inline constexpr std::array<std::string_view, 5> FalseValues = {"false", "f", "no", "n", "0"};

inline std::string list_to_string(const std::array<std::string_view, 5> & values) {
    std::string out = "[";
    for(std::size_t i = 0; i < values.size(); i ++) {
        if(i) out += ", ";
        out += "'" + std::string(values[i]) + "'";
    }
    return out + "]";
}

inline bool truthiness(const Value & v) {
    switch(v.kind()) {
    case ValueKind::Null: return false;
    case ValueKind::Bool: return v.as_bool();
    case ValueKind::Int: return v.as_int() != 0;
    case ValueKind::Float: return v.as_float() != 0.0;
    case ValueKind::Complex: return v.as_complex() != std::complex<double>(0.0, 0.0);
    case ValueKind::Decimal: return !v.as_decimal().isZero();
    case ValueKind::String: return !v.as_string().empty();
    case ValueKind::Array: return !v.as_array().empty();
    case ValueKind::Object: return !v.as_object().empty();
    case ValueKind::Opaque: return true;
    }
    return false;
}

} // namespace converters_detail


// ============================================================================
// Stock leaf converters
// ============================================================================

// Scalars rendered as text; strings pass through.
inline Converter String() {
    return [](const Value & v) -> Result {
        switch(v.kind()) {
        case ValueKind::String: return Ok(v);
        case ValueKind::Bool: return Ok(v.as_bool() ? "true" : "false");
        case ValueKind::Int: return Ok(std::to_string(v.as_int()));
        case ValueKind::Float: return Ok(value_detail::format_double(v.as_float()));
        case ValueKind::Decimal: return Ok(v.as_decimal().toString());
        case ValueKind::Complex: return Ok(Repr(v));
        default:
            return Fail(ErrorKind::TYPE_MISMATCH, converters_detail::expected_got("a string", v));
        }
    };
}

inline Converter Integer() {
    return [](const Value & v) -> Result {
        switch(v.kind()) {
        case ValueKind::Int: return Ok(v);
        case ValueKind::Bool: return Ok(std::int64_t(v.as_bool() ? 1 : 0));
        case ValueKind::Float: {
            double d = std::trunc(v.as_float());
            if(!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                return Fail("cannot convert " + Repr(v) + " to an integer");
            }
            return Ok(static_cast<std::int64_t>(d));
        }
        case ValueKind::Decimal: {
            if(auto i = v.as_decimal().toInteger()) return Ok(*i);
            double d = std::trunc(v.as_decimal().toDouble());
            if(!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                return Fail("cannot convert " + Repr(v) + " to an integer");
            }
            return Ok(static_cast<std::int64_t>(d));
        }
        case ValueKind::String:
            if(auto i = converters_detail::parse_int(v.as_string())) return Ok(*i);
            return Fail("invalid literal for an integer: " + Repr(v));
        default:
            return Fail(ErrorKind::TYPE_MISMATCH, converters_detail::expected_got("an integer", v));
        }
    };
}

inline Converter Float() {
    return [](const Value & v) -> Result {
        switch(v.kind()) {
        case ValueKind::Float: return Ok(v);
        case ValueKind::Int: return Ok(static_cast<double>(v.as_int()));
        case ValueKind::Bool: return Ok(v.as_bool() ? 1.0 : 0.0);
        case ValueKind::Decimal: return Ok(v.as_decimal().toDouble());
        case ValueKind::String:
            if(auto d = converters_detail::parse_double(v.as_string())) return Ok(*d);
            return Fail("could not convert string to float: " + Repr(v));
        default:
            return Fail(ErrorKind::TYPE_MISMATCH, converters_detail::expected_got("a float", v));
        }
    };
}

// strict: only the textual forms in TruthValues/FalseValues are accepted.
// Otherwise any value converts by its truthiness.
inline Converter Boolean(bool strict = true) {
    return [strict](const Value & v) -> Result {
        if(v.is_bool()) return Ok(v);
        if(v.is_int() && (v.as_int() == 0 || v.as_int() == 1)) return Ok(v.as_int() == 1);
        if(!strict) return Ok(converters_detail::truthiness(v));

        std::string text;
        if(v.is_string()) {
            text = v.as_string();
        } else if(v.is_scalar()) {
            Result r = String()(v);
            if(r) text = r.value().as_string();
        }
        for(std::string_view t : converters_detail::TruthValues) {
            if(text == t) return Ok(true);
        }
        for(std::string_view f : converters_detail::FalseValues) {
            if(text == f) return Ok(false);
        }
        return Fail(ErrorKind::TYPE_MISMATCH,
                    "a strict boolean should be either one of "
                    + converters_detail::list_to_string(converters_detail::TruthValues)
                    + " or one of "
                    + converters_detail::list_to_string(converters_detail::FalseValues));
    };
}

inline Converter ParseDecimal() {
    return [](const Value & v) -> Result {
        switch(v.kind()) {
        case ValueKind::Decimal: return Ok(v);
        case ValueKind::Int: return Ok(Decimal(v.as_int()));
        case ValueKind::String:
            if(auto d = Decimal::FromString(v.as_string())) return Ok(*d);
            return Fail("bad decimal number " + Repr(v));
        default:
            return Fail(ErrorKind::TYPE_MISMATCH,
                        "value for a decimal can be only a string or an int, got " + Repr(v) + " instead");
        }
    };
}

inline Converter ComplexNumber() {
    return [](const Value & v) -> Result {
        switch(v.kind()) {
        case ValueKind::Complex: return Ok(v);
        case ValueKind::Int: return Ok(std::complex<double>(static_cast<double>(v.as_int()), 0.0));
        case ValueKind::Float: return Ok(std::complex<double>(v.as_float(), 0.0));
        case ValueKind::Decimal: return Ok(std::complex<double>(v.as_decimal().toDouble(), 0.0));
        case ValueKind::String:
            if(auto c = converters_detail::parse_complex(v.as_string())) return Ok(*c);
            return Fail("complex() arg is a malformed string: " + Repr(v));
        default:
            return Fail(ErrorKind::TYPE_MISMATCH, converters_detail::expected_got("a complex number", v));
        }
    };
}

// Parses strings with a strftime-style format into an opaque DateTime.
// An unusable format is rejected here, when the schema is being built.
inline Converter ParseDateTime(std::string format = "%Y-%m-%d %H:%M.%S") {
    {
        std::tm sample{};
        sample.tm_year = 115;
        sample.tm_mon = 11;
        sample.tm_mday = 13;
        sample.tm_hour = 15;
        sample.tm_min = 36;
        sample.tm_sec = 21;
        std::ostringstream out;
        out << std::put_time(&sample, format.c_str());
        std::istringstream in(out.str());
        std::tm parsed{};
        in >> std::get_time(&parsed, format.c_str());
        if(format.empty() || out.fail() || in.fail()) {
            throw SchemaDefinitionError("bad datetime format '" + format + "'");
        }
    }
    return [format = std::move(format)](const Value & v) -> Result {
        if(!v.is_string()) {
            return Fail(ErrorKind::TYPE_MISMATCH, converters_detail::expected_got("a datetime string", v));
        }
        std::istringstream in(v.as_string());
        std::tm parsed{};
        in >> std::get_time(&parsed, format.c_str());
        if(in.fail() || in.peek() != std::char_traits<char>::eof()) {
            return Fail("bad datetime " + Repr(v) + " for format '" + format + "'");
        }
        return Ok(Value::MakeOpaque(DateTime::FromTm(parsed)));
    };
}

} // namespace ShapeFusion
