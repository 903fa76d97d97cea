#pragma once

/// @file pulljson.hpp
/// @author Aleksandr Loshkarev
/// @brief Main header file for the pulljson library.
///
/// One-shot helpers on top of Tokenizer. For reading several values from
/// the same input, or for mixing value reads with character-level access,
/// use a Tokenizer directly.

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "value.hpp"
#include "literal.hpp"
#include "source.hpp"
#include "cursor.hpp"
#include "tokenizer.hpp"
#include "builder.hpp"
#include "serializer.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace pulljson {

namespace detail {

/// Read one value; in strict mode nothing but whitespace may follow it.
inline JsonValue parse_document(Tokenizer& tok) {
    JsonValue value = tok.read_next_value();
    if (tok.options().strict && tok.next_clean() != 0) {
        tok.error("Unparsed characters found at end of input text", errc::trailing_content);
    }
    return value;
}

template <typename Input>
result<JsonValue> try_parse_document(Input&& input, const ParseOptions& opts) {
    try {
        Tokenizer tok(std::forward<Input>(input), opts);
        return {parse_document(tok), {}};
    } catch (const std::system_error& e) {
        return {JsonValue{}, e.code()};
    }
}

} // namespace detail

/// @brief Parse one JSON value from text.
/// @throws ParseError on malformed input.
[[nodiscard]] inline JsonValue parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
    Tokenizer tok(std::string(input), opts);
    return detail::parse_document(tok);
}

/// @brief Parse one JSON value from a UTF-8 byte stream.
[[nodiscard]] inline JsonValue parse(std::istream& is,
                                     const ParseOptions& opts = {}) {
    Tokenizer tok(is, opts);
    return detail::parse_document(tok);
}

/// @brief Parse one JSON value from a wide character stream.
[[nodiscard]] inline JsonValue parse(std::wistream& is,
                                     const ParseOptions& opts = {}) {
    Tokenizer tok(is, opts);
    return detail::parse_document(tok);
}

/// @brief Parse JSON text (no exceptions for malformed input, error_code).
[[nodiscard]] inline result<JsonValue> try_parse(std::string_view input,
                                                  const ParseOptions& opts = {}) {
    return detail::try_parse_document(std::string(input), opts);
}

/// @brief Parse JSON from a stream (no exceptions for malformed input).
[[nodiscard]] inline result<JsonValue> try_parse(std::istream& is,
                                                  const ParseOptions& opts = {}) {
    return detail::try_parse_document(is, opts);
}

[[nodiscard]] inline result<JsonValue> try_parse(std::wistream& is,
                                                  const ParseOptions& opts = {}) {
    return detail::try_parse_document(is, opts);
}

/// @brief Read one value (lenient mode) via operator>>.
///
/// Characters after the value are left in the stream, except a single
/// delimiter that an unquoted scalar had to look at to find its end.
inline std::istream& operator>>(std::istream& is, JsonValue& value) {
    value = parse(is);
    return is;
}

} // namespace pulljson
