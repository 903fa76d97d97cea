#pragma once

/// @file builder.hpp
/// @author Aleksandr Loshkarev
/// @brief Object and array construction on top of a Tokenizer.
///
/// Both builders pull tokens from the caller's tokenizer and leave it
/// positioned right after the closing bracket. Lenient mode additionally
/// accepts:
///   - unquoted object keys (kept as raw text)
///   - ';' between object members
///   - a trailing separator before '}' or ']'
///   - elided array elements, read as null: [1,,2]

#include "tokenizer.hpp"

#include <string>

namespace pulljson {
namespace detail {

inline std::string read_object_key(Tokenizer& tok, char32_t c, bool strict) {
    if (c == '"' || c == '\'') return tok.read_quoted_string(c);
    std::string key = tok.read_unquoted_literal(c);
    if (strict) tok.error("Value is not surrounded by quotes: " + key, errc::not_quoted);
    return key;
}

inline JsonValue build_object(Tokenizer& tok, bool strict) {
    if (tok.next_clean() != '{') {
        tok.error("A JSONObject text must begin with '{'", errc::unexpected_character);
    }

    JsonValue result = JsonValue::object();
    Object& obj = result.as_object();

    char32_t c = tok.next_clean();
    if (c == '}') return result;

    for (;;) {
        if (c == 0) tok.error("A JSONObject text must end with '}'");

        std::string key = read_object_key(tok, c, strict);
        if (tok.next_clean() != ':') {
            tok.error("Expected a ':' after a key", errc::unexpected_character);
        }
        if (obj.contains(key)) {
            tok.error("Duplicate key \"" + key + "\"", errc::duplicate_key);
        }
        obj.insert(std::move(key), tok.read_next_value(strict));

        c = tok.next_clean();
        if (c == '}') return result;
        if (c != ',' && (strict || c != ';')) {
            tok.error("Expected a ',' or '}'", errc::unexpected_character);
        }

        c = tok.next_clean();
        if (c == '}' && !strict) return result;
    }
}

inline JsonValue build_array(Tokenizer& tok, bool strict) {
    if (tok.next_clean() != '[') {
        tok.error("A JSONArray text must start with '['", errc::unexpected_character);
    }

    JsonValue result = JsonValue::array();
    Array& arr = result.as_array();

    char32_t c = tok.next_clean();
    if (c == 0) tok.error("Expected a ',' or ']'", errc::unexpected_character);
    if (c == ']') return result;
    tok.pushback();

    for (;;) {
        c = tok.next_clean();
        tok.pushback();
        if (c == ',' && !strict) {
            arr.emplace_back(nullptr);
        } else {
            arr.push_back(tok.read_next_value(strict));
        }

        c = tok.next_clean();
        if (c == ']') return result;
        if (c != ',') tok.error("Expected a ',' or ']'", errc::unexpected_character);

        c = tok.next_clean();
        if (c == 0) tok.error("Expected a ',' or ']'", errc::unexpected_character);
        if (c == ']' && !strict) return result;
        tok.pushback();
    }
}

} // namespace detail
} // namespace pulljson
