#pragma once

/// @file error.hpp
/// @author Aleksandr Loshkarev
/// @brief Error types for pulljson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError (default)
///   - Via error_code: pulljson::errc enum + json_category() (exception-free)
///
/// Use try_parse(input) for exception-free parsing.

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace pulljson {

// =====================================================================
// Source position
// =====================================================================

/// @brief Position of the tokenizer in the source text.
///
/// Counts are in characters (Unicode code points), not bytes.
struct SourceLocation {
    size_t offset = 0;  ///< Characters consumed so far
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Character position on the current line
};

/// @brief Format a location as " at <offset> [character <column> line <line>]".
inline std::string describe(const SourceLocation& loc) {
    return " at " + std::to_string(loc.offset) +
           " [character " + std::to_string(loc.column) +
           " line " + std::to_string(loc.line) + "]";
}

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief JSON error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Syntax errors (1-49)
    syntax_error            = 1,
    unterminated_string     = 2,
    invalid_escape          = 3,
    missing_value           = 4,
    unexpected_character    = 5,
    duplicate_key           = 6,
    not_quoted              = 7,
    trailing_content        = 8,

    // Reader state errors (50-79)
    io_error                = 50,
    max_depth_exceeded      = 51,
    invalid_pushback        = 52,

    // Value access errors (80-99)
    type_mismatch           = 80,
    out_of_range            = 81,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class json_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "pulljson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                   return "success";
            case errc::syntax_error:         return "syntax error";
            case errc::unterminated_string:  return "unterminated string";
            case errc::invalid_escape:       return "illegal escape sequence";
            case errc::missing_value:        return "missing value";
            case errc::unexpected_character: return "unexpected character";
            case errc::duplicate_key:        return "duplicate key";
            case errc::not_quoted:           return "value is not surrounded by quotes";
            case errc::trailing_content:     return "trailing content after JSON";
            case errc::io_error:             return "I/O error reading the source";
            case errc::max_depth_exceeded:   return "maximum nesting depth exceeded";
            case errc::invalid_pushback:     return "invalid pushback";
            case errc::type_mismatch:        return "type mismatch";
            case errc::out_of_range:         return "index out of range";
            default:                         return "unknown json error";
        }
    }
};

} // namespace detail

/// @brief Get the json error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::json_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from pulljson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief True for every code that reports malformed input text.
inline bool is_syntax_error(const std::error_code& ec) noexcept {
    return ec.category() == json_category() && ec.value() >= 1 && ec.value() < 50;
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Tokenizer error: message, source position and optional cause.
///
/// what() is the message followed by the position descriptor, e.g.
/// "Unterminated string at 5 [character 6 line 1]".
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::syntax_error,
               std::exception_ptr cause = nullptr)
        : std::system_error(make_error_code(code), message)
        , what_(message + describe(loc))
        , location_(loc)
        , cause_(std::move(cause)) {}

    /// Message and position descriptor, without the category text.
    [[nodiscard]] const char* what() const noexcept override {
        return what_.c_str();
    }

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief Underlying exception (e.g. a stream failure), or null.
    [[nodiscard]] const std::exception_ptr& cause() const noexcept {
        return cause_;
    }

private:
    std::string what_;
    SourceLocation location_;
    std::exception_ptr cause_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = pulljson::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace pulljson

// Register pulljson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<pulljson::errc> : true_type {};
} // namespace std
