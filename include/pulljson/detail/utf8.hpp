#pragma once

/// @file utf8.hpp
/// @author Aleksandr Loshkarev
/// @brief UTF-8 encoding/decoding utilities.
///
///   - Encoding a code point to UTF-8 (1-4 bytes)
///   - Decoding UTF-8 to a code point, from a buffer or byte-by-byte
///   - UTF-16 surrogate helpers for \uXXXX escapes
///
/// Malformed input never throws: it decodes to U+FFFD.

#include <cstdint>
#include <string>

namespace pulljson::detail::utf8 {

inline constexpr char32_t kReplacement = 0xFFFD;

// ─── Code point encoding → UTF-8 ─────────────────────────────────────

/// @brief Encodes a Unicode code point as UTF-8 and appends to the string.
/// Surrogates and values past U+10FFFF are written as U+FFFD.
inline void encode(char32_t cp, std::string& out) {
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) cp = kReplacement;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string encode(char32_t cp) {
    std::string out;
    encode(cp, out);
    return out;
}

// ─── UTF-16 surrogates ──────────────────────────────────────────────

inline bool is_high_surrogate(char32_t u) noexcept { return u >= 0xD800 && u <= 0xDBFF; }
inline bool is_low_surrogate(char32_t u) noexcept  { return u >= 0xDC00 && u <= 0xDFFF; }

inline char32_t combine_surrogates(char32_t high, char32_t low) noexcept {
    return 0x10000u + ((high - 0xD800u) << 10) + (low - 0xDC00u);
}

// ─── UTF-8 decoding → code point ───────────────────────────────────

/// @brief Determines the UTF-8 sequence length from the leading byte.
/// @return 1-4 for a valid byte, 0 for an invalid one.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

inline bool is_continuation(unsigned char byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

/// @brief Reject overlong forms, surrogates and out-of-range values.
inline char32_t validate(char32_t cp, unsigned len) noexcept {
    if ((len == 2 && cp < 0x80) ||
        (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000)) {
        return kReplacement;
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) return kReplacement;
    if (cp > 0x10FFFF) return kReplacement;
    return cp;
}

/// @brief Decodes a single UTF-8 sequence.
/// @param ptr  Pointer to the start of the sequence (advanced on return).
/// @param end  Pointer past the end of the buffer.
/// @return Unicode code point, or U+FFFD on error.
inline char32_t decode(const char*& ptr, const char* end) noexcept {
    auto lead = static_cast<unsigned char>(*ptr);
    unsigned len = sequence_length(lead);

    if (len == 0) {
        ++ptr;
        return kReplacement;
    }
    if (len == 1) {
        ++ptr;
        return lead;
    }

    char32_t cp = lead & (0x7F >> len);
    ++ptr;
    for (unsigned i = 1; i < len; ++i) {
        if (ptr >= end || !is_continuation(static_cast<unsigned char>(*ptr))) {
            return kReplacement;
        }
        cp = (cp << 6) | (static_cast<unsigned char>(*ptr) & 0x3F);
        ++ptr;
    }
    return validate(cp, len);
}

/// @brief Decodes a single UTF-8 sequence from a byte stream.
///
/// @param lead  The already consumed leading byte.
/// @param peek  Callable returning the next byte without consuming it,
///              or a negative value at the end of the stream.
/// @param take  Callable consuming the byte last returned by peek.
///
/// A continuation byte is only consumed after it has been seen to be
/// one, so a truncated sequence never swallows the following character.
template <typename Peek, typename Take>
char32_t decode_stream(unsigned char lead, Peek&& peek, Take&& take) {
    unsigned len = sequence_length(lead);
    if (len == 0) return kReplacement;
    if (len == 1) return lead;

    char32_t cp = lead & (0x7F >> len);
    for (unsigned i = 1; i < len; ++i) {
        int next = peek();
        if (next < 0 || !is_continuation(static_cast<unsigned char>(next))) {
            return kReplacement;
        }
        take();
        cp = (cp << 6) | (static_cast<unsigned char>(next) & 0x3F);
    }
    return validate(cp, len);
}

} // namespace pulljson::detail::utf8
