#pragma once

/// @file tokenizer.hpp
/// @author Aleksandr Loshkarev
/// @brief Pull-based JSON tokenizer and value reader.
///
/// The caller asks for "the next value"; the tokenizer consumes exactly
/// the characters that belong to it and leaves the cursor right after.
///
/// Features:
///   - Input from std::string, UTF-8 std::istream, std::wistream or any Source
///   - Exact position tracking for diagnostics (offset, line, column)
///   - One-step pushback and transactional mark_and_skip_to()
///   - Strict and lenient parse modes (see ParseOptions)
///   - Explicit nesting depth limit instead of stack exhaustion
///
/// Usage:
/// @code
///   pulljson::Tokenizer tok(R"({"a": [1, 2, 3]} {"b": true})");
///   auto first  = tok.read_next_value();
///   auto second = tok.read_next_value();
/// @endcode

#include "config.hpp"
#include "cursor.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "literal.hpp"
#include "parse_options.hpp"
#include "source.hpp"
#include "value.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace pulljson {

class Tokenizer;

namespace detail {
JsonValue build_object(Tokenizer& tok, bool strict);
JsonValue build_array(Tokenizer& tok, bool strict);
} // namespace detail

class Tokenizer {
public:
    // ─── Construction ────────────────────────────────────────────────────

    explicit Tokenizer(std::string text, const ParseOptions& opts = {})
        : Tokenizer(std::make_unique<StringSource>(std::move(text)), opts) {}

    /// Reads UTF-8 bytes from `is`; the stream must outlive the tokenizer.
    explicit Tokenizer(std::istream& is, const ParseOptions& opts = {})
        : Tokenizer(std::make_unique<StreamSource>(is), opts) {}

    /// Reads decoded characters from `is`; the stream must outlive the tokenizer.
    explicit Tokenizer(std::wistream& is, const ParseOptions& opts = {})
        : Tokenizer(std::make_unique<WideStreamSource>(is), opts) {}

    explicit Tokenizer(std::unique_ptr<Source> source, const ParseOptions& opts = {})
        : cursor_(std::move(source), opts.effective_skip_limit())
        , opts_(opts)
        , max_depth_(opts.effective_max_depth()) {}

    Tokenizer(const Tokenizer&) = delete;
    Tokenizer& operator=(const Tokenizer&) = delete;

    ~Tokenizer() { close(); }

    // ─── Cursor ──────────────────────────────────────────────────────────

    /// @brief Next character, or U'\0' at the end of input.
    char32_t consume() { return cursor_.consume(); }

    /// @brief Step back one character. Only one step is supported.
    void pushback() { cursor_.pushback(); }

    [[nodiscard]] bool at_end() const noexcept { return cursor_.at_end(); }

    bool has_more() { return cursor_.has_more(); }

    /// @brief Skip to `target` and leave it as the next character.
    /// @return `target`, or U'\0' (position unchanged) if it never occurs.
    char32_t mark_and_skip_to(char32_t target) { return cursor_.mark_and_skip_to(target); }

    // ─── Lexical primitives ──────────────────────────────────────────────

    /// @brief Skip whitespace and control characters.
    /// @return The first character above ' ', or U'\0' at the end.
    char32_t next_clean() {
        for (;;) {
            char32_t c = cursor_.consume();
            if (c == 0 || c > ' ') return c;
        }
    }

    /// @brief Consume one character and require it to be `expected`.
    char32_t consume_expected(char32_t expected) {
        char32_t c = cursor_.consume();
        if (PULLJSON_UNLIKELY(c != expected)) {
            std::string msg = "Expected '" + detail::utf8::encode(expected) + "' and instead saw ";
            if (c == 0) {
                msg += "nothing";
            } else {
                msg += "'" + detail::utf8::encode(c) + "'";
            }
            error(msg, errc::unexpected_character);
        }
        return c;
    }

    /// @brief Consume exactly `n` characters, returned as UTF-8.
    std::string consume_exactly(size_t n) {
        std::string out;
        for (size_t i = 0; i < n; ++i) {
            char32_t c = cursor_.consume();
            if (cursor_.at_end()) error("Substring bounds error");
            detail::utf8::encode(c, out);
        }
        return out;
    }

    /// @brief Read a string body up to the closing `quote`, decoding escapes.
    ///
    /// The opening quote must already be consumed. Raw line breaks are not
    /// allowed inside a string. A \\u escape of a high surrogate followed
    /// by a \\u low surrogate yields one code point; lone surrogates become
    /// U+FFFD.
    std::string read_quoted_string(char32_t quote) {
        std::string out;
        char32_t pending_high = 0;
        auto flush = [&]() {
            if (pending_high != 0) {
                detail::utf8::encode(pending_high, out);
                pending_high = 0;
            }
        };

        for (;;) {
            char32_t c = cursor_.consume();
            switch (c) {
                case 0:
                case '\n':
                case '\r':
                    error("Unterminated string", errc::unterminated_string);
                case '\\': {
                    c = cursor_.consume();
                    if (c == 'u') {
                        char32_t unit = read_hex4();
                        if (detail::utf8::is_low_surrogate(unit) && pending_high != 0) {
                            detail::utf8::encode(
                                detail::utf8::combine_surrogates(pending_high, unit), out);
                            pending_high = 0;
                        } else {
                            flush();
                            if (detail::utf8::is_high_surrogate(unit)) {
                                pending_high = unit;
                            } else {
                                detail::utf8::encode(unit, out);
                            }
                        }
                        break;
                    }
                    flush();
                    switch (c) {
                        case 'b':  out.push_back('\b'); break;
                        case 't':  out.push_back('\t'); break;
                        case 'n':  out.push_back('\n'); break;
                        case 'f':  out.push_back('\f'); break;
                        case 'r':  out.push_back('\r'); break;
                        case '"':
                        case '\'':
                        case '\\':
                        case '/':  out.push_back(static_cast<char>(c)); break;
                        default:
                            error("Illegal escape.", errc::invalid_escape);
                    }
                    break;
                }
                default:
                    flush();
                    if (c == quote) return out;
                    detail::utf8::encode(c, out);
                    break;
            }
        }
    }

    /// @brief Text up to `delimiter` or the end of the line, trimmed.
    ///
    /// The delimiter (or line break) is left as the next character.
    std::string read_until(char32_t delimiter) {
        return read_until_impl([delimiter](char32_t c) { return c == delimiter; });
    }

    /// @brief Text up to any of the `delimiters` or the end of the line, trimmed.
    std::string read_until(std::u32string_view delimiters) {
        return read_until_impl([delimiters](char32_t c) {
            return delimiters.find(c) != std::u32string_view::npos;
        });
    }

    /// @brief Read an unquoted token starting with the already consumed `first`.
    ///
    /// Stops at whitespace or any of , : ] } / \\ " [ { ; = # and leaves the
    /// stopper as the next character.
    /// @throws ParseError (errc::missing_value) if the token is empty.
    std::string read_unquoted_literal(char32_t first) {
        std::string out;
        char32_t c = first;
        while (c > ' ' && !is_reserved(c)) {
            detail::utf8::encode(c, out);
            c = cursor_.consume();
        }
        if (!cursor_.at_end()) cursor_.pushback();

        trim(out);
        if (out.empty()) error("Missing value", errc::missing_value);
        return out;
    }

    // ─── Value reading ───────────────────────────────────────────────────

    /// @brief Read the next complete value in the configured mode.
    JsonValue read_next_value() { return read_next_value(opts_.strict); }

    /// @brief Read the next complete value: object, array or scalar.
    JsonValue read_next_value(bool strict) {
        char32_t c = next_clean();
        if (c == '{' || c == '[') {
            cursor_.pushback();
            DepthGuard guard(*this);
            return c == '{' ? detail::build_object(*this, strict)
                            : detail::build_array(*this, strict);
        }
        return read_scalar(c, strict);
    }

    /// @brief Read a scalar whose first character `c` is already consumed.
    ///
    /// Quoted strings are accepted in both modes. In strict mode an
    /// unquoted token is accepted only if it consists of ASCII digits.
    JsonValue read_scalar(char32_t c, bool strict) {
        if (c == '"' || c == '\'') {
            return JsonValue(read_quoted_string(c));
        }
        std::string token = read_unquoted_literal(c);
        if (strict && !all_digits(token)) {
            error("Value is not surrounded by quotes: " + token, errc::not_quoted);
        }
        return string_to_value(token);
    }

    // ─── Diagnostics ─────────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location() const noexcept { return cursor_.location(); }

    /// @brief " at <offset> [character <column> line <line>]"
    [[nodiscard]] std::string to_string() const { return cursor_.to_string(); }

    [[nodiscard]] const ParseOptions& options() const noexcept { return opts_; }

    [[nodiscard]] size_t depth() const noexcept { return depth_; }

    /// @brief Throw a ParseError at the current position.
    [[noreturn]] PULLJSON_NOINLINE void error(const std::string& msg,
                                              errc code = errc::syntax_error) const {
        throw ParseError(msg, cursor_.location(), code);
    }

    // ─── Lifetime ────────────────────────────────────────────────────────

    [[nodiscard]] bool is_open() const noexcept { return cursor_.is_open(); }

    /// @brief Release the source. Idempotent; later reads fail with errc::io_error.
    void close() noexcept { cursor_.close(); }

private:
    Cursor cursor_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;

    // ─── Depth tracking ──────────────────────────────────────────────────

    class DepthGuard {
    public:
        explicit DepthGuard(Tokenizer& tok) : tok_(tok) {
            if (PULLJSON_UNLIKELY(tok_.depth_ >= tok_.max_depth_)) {
                tok_.error("JSON Array or Object depth too large to process.",
                           errc::max_depth_exceeded);
            }
            ++tok_.depth_;
        }
        ~DepthGuard() { --tok_.depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Tokenizer& tok_;
    };

    // ─── Helpers ─────────────────────────────────────────────────────────

    static bool is_reserved(char32_t c) noexcept {
        switch (c) {
            case ',': case ':': case ']': case '}': case '/': case '\\':
            case '"': case '[': case '{': case ';': case '=': case '#':
                return true;
            default:
                return false;
        }
    }

    static bool all_digits(std::string_view s) noexcept {
        for (char c : s) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

    /// Strip bytes <= ' ' from both ends. UTF-8 continuation bytes are never affected.
    static void trim(std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && static_cast<unsigned char>(s[b]) <= ' ') ++b;
        while (e > b && static_cast<unsigned char>(s[e - 1]) <= ' ') --e;
        s = s.substr(b, e - b);
    }

    char32_t read_hex4() {
        std::string digits = consume_exactly(4);
        char32_t unit = 0;
        for (char d : digits) {
            unit <<= 4;
            if (d >= '0' && d <= '9') {
                unit |= static_cast<char32_t>(d - '0');
            } else if (d >= 'a' && d <= 'f') {
                unit |= static_cast<char32_t>(d - 'a' + 10);
            } else if (d >= 'A' && d <= 'F') {
                unit |= static_cast<char32_t>(d - 'A' + 10);
            } else {
                error("Illegal escape.", errc::invalid_escape);
            }
        }
        return unit;
    }

    template <typename Stop>
    std::string read_until_impl(Stop stop) {
        std::string out;
        for (;;) {
            char32_t c = cursor_.consume();
            if (c == 0 || c == '\n' || c == '\r' || stop(c)) {
                if (c != 0) cursor_.pushback();
                trim(out);
                return out;
            }
            detail::utf8::encode(c, out);
        }
    }
};

/// @brief Writes the tokenizer's position descriptor.
inline std::ostream& operator<<(std::ostream& os, const Tokenizer& tok) {
    return os << tok.to_string();
}

} // namespace pulljson

#include "builder.hpp"
