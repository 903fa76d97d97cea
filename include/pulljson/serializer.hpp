#pragma once

/// @file serializer.hpp
/// @author Aleksandr Loshkarev
/// @brief Writes a JsonValue back out as standard JSON text.
///
/// Output uses double-quoted strings and keys, ',' separators and no
/// trailing separators, so anything the tokenizer produced in lenient
/// mode comes back as plain JSON. Non-ASCII text is written as UTF-8.
///
///   - Integer     -> decimal digits
///   - Float       -> shortest round-trip form, always with '.' or an exponent
///   - BigNumber   -> its stored text, unchanged
///   - NaN / inf   -> null

#include "config.hpp"
#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>

namespace pulljson {
namespace detail {

class JsonWriter {
public:
    /// `indent` < 0 writes everything on one line.
    JsonWriter(std::string& out, int indent) noexcept : out_(out), indent_(indent) {}

    void write(const JsonValue& v, int level = 0) {
        switch (v.type()) {
            case Type::Null:      out_ += "null"; return;
            case Type::Bool:      out_ += v.as_bool() ? "true" : "false"; return;
            case Type::Integer:   append_integer(v.as_integer()); return;
            case Type::Float:     append_double(v.as_float()); return;
            case Type::BigNumber: out_ += v.as_number_string(); return;
            case Type::String:    append_quoted(v.as_string_view()); return;
            case Type::Array:     append_array(v.as_array(), level); return;
            case Type::Object:    append_object(v.as_object(), level); return;
        }
    }

private:
    std::string& out_;
    int indent_;

    void break_line(int level) {
        if (indent_ < 0) return;
        out_ += '\n';
        out_.append(static_cast<size_t>(indent_) * static_cast<size_t>(level), ' ');
    }

    void append_integer(int64_t n) {
        char digits[24];
        const auto res = std::to_chars(digits, digits + sizeof(digits), n);
        out_.append(digits, res.ptr);
    }

    void append_double(double d) {
        if (!std::isfinite(d)) {
            out_ += "null";
            return;
        }
        char digits[40];
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
        const auto res = std::to_chars(digits, digits + sizeof(digits), d);
        std::string_view text(digits, static_cast<size_t>(res.ptr - digits));
#else
        const int n = std::snprintf(digits, sizeof(digits), "%.17g", d);
        std::string_view text(digits, static_cast<size_t>(n));
#endif
        out_ += text;
        // 1.0 stays a Float when read back, 1 would not
        if (text.find_first_of(".e") == std::string_view::npos) out_ += ".0";
    }

    void append_quoted(std::string_view s) {
        out_ += '"';
        for (char ch : s) {
            switch (ch) {
                case '"':  out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\b': out_ += "\\b"; break;
                case '\f': out_ += "\\f"; break;
                case '\n': out_ += "\\n"; break;
                case '\r': out_ += "\\r"; break;
                case '\t': out_ += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(ch) < 0x20) {
                        char esc[7];
                        std::snprintf(esc, sizeof(esc), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(ch)));
                        out_.append(esc, 6);
                    } else {
                        out_ += ch;
                    }
            }
        }
        out_ += '"';
    }

    void append_array(const Array& arr, int level) {
        out_ += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i != 0) out_ += ',';
            break_line(level + 1);
            write(arr[i], level + 1);
        }
        if (!arr.empty()) break_line(level);
        out_ += ']';
    }

    void append_object(const Object& obj, int level) {
        out_ += '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) out_ += ',';
            first = false;
            break_line(level + 1);
            append_quoted(key);
            out_ += indent_ < 0 ? ":" : ": ";
            write(member, level + 1);
        }
        if (!obj.empty()) break_line(level);
        out_ += '}';
    }
};

} // namespace detail

/// @brief JSON text for `value`; indent < 0 gives compact output.
[[nodiscard]] inline std::string serialize(const JsonValue& value, int indent = -1) {
    std::string out;
    detail::JsonWriter(out, indent).write(value);
    return out;
}

inline std::string JsonValue::dump(int indent) const {
    return serialize(*this, indent);
}

inline void serialize(std::ostream& os, const JsonValue& value, int indent = -1) {
    os << serialize(value, indent);
}

/// Compact form.
inline std::ostream& operator<<(std::ostream& os, const JsonValue& value) {
    serialize(os, value);
    return os;
}

} // namespace pulljson
