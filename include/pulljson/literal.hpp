#pragma once

/// @file literal.hpp
/// @author Aleksandr Loshkarev
/// @brief Coercion of unquoted tokens into typed values.
///
/// string_to_value() is a pure function of the token text:
///   - "true" / "false"          -> Bool
///   - "null" (any letter case)  -> Null
///   - numbers                   -> Integer, Float or BigNumber
///   - anything else             -> String (the token itself)
///
/// Numbers take the narrowest representation that holds them exactly:
/// int64_t for integers, double for decimals with at most 15 significant
/// digits inside the double range, and BigNumber (exact text) otherwise.
/// Hexadecimal integers (0x1F, -0X1f) are accepted when they fit int64_t.

#include "config.hpp"
#include "value.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace pulljson {
namespace detail {

/// Maximum significant decimal digits that always survive a trip through double.
inline constexpr int kExactDoubleDigits = 15;

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline bool is_decimal_notation(std::string_view s) noexcept {
    return s.find_first_of(".eE") != std::string_view::npos || s == "-0";
}

/// @brief Shape of a decimal-notation number: -?D*(.D*)?([eE][+-]?D+)?
struct DecimalShape {
    bool negative = false;
    bool all_zero = true;      ///< every mantissa digit is '0'
    int significant = 0;       ///< mantissa digits without leading/trailing zeros
};

inline std::optional<DecimalShape> scan_decimal(std::string_view s) noexcept {
    DecimalShape shape;
    size_t i = 0;
    if (i < s.size() && s[i] == '-') {
        shape.negative = true;
        ++i;
    }

    // Collect mantissa digits, skipping the decimal point.
    size_t digits = 0;
    size_t first_nonzero = std::string_view::npos;
    size_t last_nonzero = 0;
    bool seen_point = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (is_digit(c)) {
            if (c != '0') {
                if (first_nonzero == std::string_view::npos) first_nonzero = digits;
                last_nonzero = digits;
                shape.all_zero = false;
            }
            ++digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }
    if (digits == 0) return std::nullopt;

    if (i < s.size()) {
        if (s[i] != 'e' && s[i] != 'E') return std::nullopt;
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        if (i >= s.size()) return std::nullopt;
        for (; i < s.size(); ++i) {
            if (!is_digit(s[i])) return std::nullopt;
        }
    }

    if (!shape.all_zero) {
        shape.significant = static_cast<int>(last_nonzero - first_nonzero + 1);
    }
    return shape;
}

inline std::optional<double> to_double(std::string_view s) noexcept {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    double d = 0.0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [p, ec] = std::from_chars(first, last, d);
    if (ec != std::errc{} || p != last) return std::nullopt;
    return d;
#else
    std::string buf(s);
    char* end_ptr = nullptr;
    errno = 0;
    double d = std::strtod(buf.c_str(), &end_ptr);
    if (end_ptr != buf.c_str() + buf.size() || errno == ERANGE) return std::nullopt;
    return d;
#endif
}

inline JsonValue decimal_to_value(std::string_view s) {
    auto shape = scan_decimal(s);
    if (!shape) return JsonValue(s);

    if (shape->all_zero) {
        return JsonValue(shape->negative ? -0.0 : 0.0);
    }
    if (shape->significant <= kExactDoubleDigits) {
        auto d = to_double(s);
        if (d && std::isfinite(*d) && *d != 0.0) return JsonValue(*d);
    }
    return JsonValue::big_number(std::string(s));
}

inline JsonValue hex_to_value(std::string_view s, bool negative) {
    std::string_view digits = s.substr(negative ? 3 : 2);
    uint64_t magnitude = 0;
    auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                   magnitude, 16);
    if (digits.empty() || ec != std::errc{} || p != digits.data() + digits.size()) {
        return JsonValue(s);
    }
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (!negative) {
        if (magnitude > kMax) return JsonValue(s);
        return JsonValue(static_cast<int64_t>(magnitude));
    }
    if (magnitude > kMax + 1) return JsonValue(s);
    return JsonValue(static_cast<int64_t>(0 - magnitude));
}

inline JsonValue integer_to_value(std::string_view s) {
    const bool negative = s[0] == '-';
    const std::string_view digits = s.substr(negative ? 1 : 0);
    if (digits.empty()) return JsonValue(s);
    for (char c : digits) {
        if (!is_digit(c)) return JsonValue(s);
    }
    // 00, 01, -01 ... are not numbers
    if (digits.size() > 1 && digits[0] == '0') return JsonValue(s);

    int64_t value = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec == std::errc{} && p == s.data() + s.size()) return JsonValue(value);
    return JsonValue::big_number(std::string(s));
}

inline bool has_hex_prefix(std::string_view s, bool negative) noexcept {
    const size_t at = negative ? 1 : 0;
    return s.size() > at + 1 && s[at] == '0' && (s[at + 1] == 'x' || s[at + 1] == 'X');
}

} // namespace detail

/// @brief Convert an unquoted, trimmed token to its typed value.
[[nodiscard]] inline JsonValue string_to_value(std::string_view token) {
    if (token.empty()) return JsonValue(token);
    if (token == "true") return JsonValue(true);
    if (token == "false") return JsonValue(false);
    if (detail::iequals(token, "null")) return JsonValue(nullptr);

    const char initial = token[0];
    if (!detail::is_digit(initial) && initial != '-') return JsonValue(token);

    const bool negative = initial == '-';
    if (detail::has_hex_prefix(token, negative)) return detail::hex_to_value(token, negative);
    if (detail::is_decimal_notation(token)) return detail::decimal_to_value(token);
    return detail::integer_to_value(token);
}

} // namespace pulljson
