#pragma once

/// @file source.hpp
/// @author Aleksandr Loshkarev
/// @brief Character sources for the tokenizer.
///
/// A Source delivers Unicode code points one at a time. Three concrete
/// sources cover the usual inputs:
///   - StringSource:     in-memory UTF-8 text (owned copy)
///   - StreamSource:     std::istream of UTF-8 bytes, decoded on the fly
///   - WideStreamSource: std::wistream of already decoded characters
///
/// MarkableSource decorates any of them with a bounded mark/reset window,
/// which the cursor uses for non-destructive probing and rollback.

#include "detail/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <ios>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pulljson {

/// @brief Abstract sequence of Unicode code points.
class Source {
public:
    /// Returned by read() once the input is exhausted.
    static constexpr int32_t kEnd = -1;

    virtual ~Source() = default;

    /// @brief Next code point, or kEnd. May block; may throw on I/O failure.
    virtual int32_t read() = 0;

    /// @brief Release whatever the source holds. Idempotent.
    virtual void close() noexcept {}
};

// ─── In-memory UTF-8 text ───────────────────────────────────────────────

class StringSource final : public Source {
public:
    explicit StringSource(std::string text) noexcept
        : text_(std::move(text)) {}

    int32_t read() override {
        if (pos_ >= text_.size()) return kEnd;
        const char* p = text_.data() + pos_;
        const char* end = text_.data() + text_.size();
        char32_t cp = detail::utf8::decode(p, end);
        pos_ = static_cast<size_t>(p - text_.data());
        return static_cast<int32_t>(cp);
    }

    void close() noexcept override {
        text_.clear();
        text_.shrink_to_fit();
        pos_ = 0;
    }

private:
    std::string text_;
    size_t pos_ = 0;
};

// ─── UTF-8 byte stream ──────────────────────────────────────────────────

/// @brief Decodes UTF-8 from a caller-owned std::istream.
///
/// close() detaches from the stream; closing the stream itself is left
/// to its owner.
class StreamSource final : public Source {
public:
    explicit StreamSource(std::istream& is) noexcept : is_(&is) {}

    int32_t read() override {
        if (!is_) throw std::ios_base::failure("stream source is closed");
        auto lead = is_->get();
        if (lead == std::istream::traits_type::eof()) {
            check_stream();
            return kEnd;
        }
        char32_t cp = detail::utf8::decode_stream(
            static_cast<unsigned char>(lead),
            [this]() -> int {
                auto next = is_->peek();
                if (next == std::istream::traits_type::eof()) return -1;
                return static_cast<unsigned char>(next);
            },
            [this]() { is_->get(); });
        check_stream();
        return static_cast<int32_t>(cp);
    }

    void close() noexcept override { is_ = nullptr; }

private:
    std::istream* is_;

    void check_stream() const {
        if (is_->bad()) throw std::ios_base::failure("error reading from stream");
    }
};

// ─── Already decoded characters ─────────────────────────────────────────

/// @brief Reads characters from a caller-owned std::wistream.
///
/// Each wchar_t is one unit. Where wchar_t is 16 bits wide, surrogate
/// pairs are joined into a single code point.
class WideStreamSource final : public Source {
public:
    explicit WideStreamSource(std::wistream& is) noexcept : is_(&is) {}

    int32_t read() override {
        if (!is_) throw std::ios_base::failure("stream source is closed");
        auto c = is_->get();
        if (c == std::wistream::traits_type::eof()) {
            if (is_->bad()) throw std::ios_base::failure("error reading from stream");
            return kEnd;
        }
        auto unit = static_cast<char32_t>(c);
        if (detail::utf8::is_high_surrogate(unit)) {
            auto next = is_->peek();
            if (next != std::wistream::traits_type::eof() &&
                detail::utf8::is_low_surrogate(static_cast<char32_t>(next))) {
                is_->get();
                return static_cast<int32_t>(
                    detail::utf8::combine_surrogates(unit, static_cast<char32_t>(next)));
            }
        }
        return static_cast<int32_t>(unit);
    }

    void close() noexcept override { is_ = nullptr; }

private:
    std::wistream* is_;
};

// ─── Bounded mark/reset ─────────────────────────────────────────────────

/// @brief Adds mark()/reset() over at most `limit` characters to a Source.
///
/// While a mark is set, every delivered character is recorded. reset()
/// queues the recorded characters for replay. Reading past the limit
/// invalidates the mark, after which reset() throws.
class MarkableSource {
public:
    explicit MarkableSource(std::unique_ptr<Source> source) noexcept
        : source_(std::move(source)) {}

    int32_t read() {
        if (!source_) throw std::ios_base::failure("source is closed");
        int32_t c;
        if (!replay_.empty()) {
            c = replay_.front();
            replay_.pop_front();
        } else {
            c = source_->read();
        }
        if (marked_ && c >= 0) {
            if (recorded_.size() >= limit_) {
                marked_ = false;
                recorded_.clear();
            } else {
                recorded_.push_back(c);
            }
        }
        return c;
    }

    void mark(size_t limit) {
        marked_ = true;
        limit_ = limit;
        recorded_.clear();
    }

    void reset() {
        if (!marked_) throw std::ios_base::failure("resetting to invalid mark");
        replay_.insert(replay_.begin(), recorded_.begin(), recorded_.end());
        recorded_.clear();
    }

    void unmark() noexcept {
        marked_ = false;
        recorded_.clear();
    }

    [[nodiscard]] bool is_open() const noexcept { return source_ != nullptr; }

    void close() noexcept {
        if (!source_) return;
        source_->close();
        source_.reset();
        replay_.clear();
        recorded_.clear();
        marked_ = false;
    }

private:
    std::unique_ptr<Source> source_;
    std::deque<int32_t> replay_;
    std::vector<int32_t> recorded_;
    size_t limit_ = 0;
    bool marked_ = false;
};

} // namespace pulljson
