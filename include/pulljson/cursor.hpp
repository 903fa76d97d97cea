#pragma once

/// @file cursor.hpp
/// @author Aleksandr Loshkarev
/// @brief Character cursor with position tracking and one-step pushback.
///
/// The cursor is the only owner of the position state. Every consume()
/// updates offset/line/column, pushback() reverses exactly one consume,
/// and mark_and_skip_to() scans forward transactionally: when the target
/// is never found, both the source and the position are rolled back.
///
/// Line accounting: "\r", "\n" and "\r\n" each count as one line break.

#include "config.hpp"
#include "error.hpp"
#include "source.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace pulljson {

/// @brief Complete mutable state of a Cursor.
struct CursorState {
    size_t offset = 0;                  ///< Characters consumed
    size_t line = 1;
    size_t column = 1;                  ///< Position on the current line
    size_t column_at_previous_line = 0; ///< Column before the last line break
    char32_t last_char = 0;             ///< Most recently consumed character
    char32_t char_before_last = 0;      ///< Character consumed before last_char
    bool pushback_active = false;       ///< last_char is pending redelivery
    bool at_end = false;                ///< End of input was reached
};

class Cursor {
public:
    Cursor(std::unique_ptr<Source> source, size_t skip_limit) noexcept
        : source_(std::move(source)), skip_limit_(skip_limit) {}

    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    /// @brief Next character, or U'\0' at the end of input.
    char32_t consume() {
        if (state_.pushback_active) {
            state_.pushback_active = false;
            advance();
            return state_.last_char;
        }
        int32_t c = read_source("Unable to read the next character from the source");
        if (c <= 0) {
            state_.at_end = true;
            return 0;
        }
        state_.char_before_last = state_.last_char;
        state_.last_char = static_cast<char32_t>(c);
        advance();
        return state_.last_char;
    }

    /// @brief Step back one character so the next consume() returns it again.
    /// @throws ParseError (errc::invalid_pushback) if a pushback is already
    ///         pending or nothing has been consumed yet.
    void pushback() {
        if (state_.pushback_active || state_.offset == 0) {
            throw ParseError("Stepping back two steps is not supported",
                             location(), errc::invalid_pushback);
        }
        retreat();
        state_.pushback_active = true;
        state_.at_end = false;
    }

    /// @brief True once the end of input was read and nothing is pending.
    [[nodiscard]] bool at_end() const noexcept {
        return state_.at_end && !state_.pushback_active;
    }

    /// @brief Probe for another character without consuming it.
    bool has_more() {
        if (state_.pushback_active) return true;
        source_.mark(1);
        int32_t c = read_source("Unable to read the next character from the source");
        if (c <= 0) {
            state_.at_end = true;
            return false;
        }
        try {
            source_.reset();
        } catch (const std::exception& e) {
            throw io_error("Unable to preserve stream position", e);
        }
        source_.unmark();
        return true;
    }

    /// @brief Skip forward until `target`, leaving it as the next character.
    ///
    /// @return `target`, or U'\0' if it was not found; in that case the
    ///         cursor is restored to where it was before the call.
    /// @throws ParseError (errc::io_error) if the scan outgrew the rollback
    ///         window and cannot be undone.
    char32_t mark_and_skip_to(char32_t target) {
        const CursorState saved = state_;
        source_.mark(skip_limit_);
        char32_t c;
        do {
            c = consume();
            if (c == 0) {
                try {
                    source_.reset();
                } catch (const std::exception& e) {
                    throw io_error("Unable to restore stream position", e);
                }
                source_.unmark();
                state_ = saved;
                return 0;
            }
        } while (c != target);
        source_.unmark();
        pushback();
        return c;
    }

    [[nodiscard]] SourceLocation location() const noexcept {
        return {state_.offset, state_.line, state_.column};
    }

    /// @brief " at <offset> [character <column> line <line>]"
    [[nodiscard]] std::string to_string() const {
        return describe(location());
    }

    [[nodiscard]] const CursorState& state() const noexcept { return state_; }

    [[nodiscard]] bool is_open() const noexcept { return source_.is_open(); }

    void close() noexcept { source_.close(); }

private:
    MarkableSource source_;
    CursorState state_;
    size_t skip_limit_;

    int32_t read_source(const char* what) {
        try {
            return source_.read();
        } catch (const ParseError&) {
            throw;
        } catch (const std::exception& e) {
            throw io_error(what, e);
        }
    }

    ParseError io_error(const char* what, const std::exception& e) const {
        return ParseError(std::string(what) + ": " + e.what(), location(),
                          errc::io_error, std::current_exception());
    }

    /// Position bookkeeping for last_char.
    void advance() noexcept {
        ++state_.offset;
        const char32_t c = state_.last_char;
        if (c == '\r') {
            ++state_.line;
            state_.column_at_previous_line = state_.column;
            state_.column = 0;
        } else if (c == '\n') {
            if (state_.char_before_last != '\r') {
                ++state_.line;
                state_.column_at_previous_line = state_.column;
            }
            state_.column = 0;
        } else {
            ++state_.column;
        }
    }

    /// Exact inverse of advance().
    void retreat() noexcept {
        --state_.offset;
        if (state_.last_char == '\n' && state_.char_before_last == '\r') {
            state_.column = 0;
        } else if (state_.last_char == '\r' || state_.last_char == '\n') {
            --state_.line;
            state_.column = state_.column_at_previous_line;
        } else if (state_.column > 0) {
            --state_.column;
        }
    }
};

} // namespace pulljson
