/// @file test_tokenizer.cpp
/// @brief Unit tests for the Tokenizer's lexical primitives.

#include <pulljson/pulljson.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace pulljson;

// ═══════════════════════════════════════════════════════════════════════════════
// next_clean / consume_expected / consume_exactly
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, NextCleanSkipsWhitespaceAndControls) {
    Tokenizer tok(" \t\r\n\x01x");
    EXPECT_EQ(tok.next_clean(), U'x');
    EXPECT_EQ(tok.next_clean(), U'\0');
    EXPECT_TRUE(tok.at_end());
}

TEST(Tokenizer, ConsumeExpectedMatch) {
    Tokenizer tok("ab");
    EXPECT_EQ(tok.consume_expected(U'a'), U'a');
    EXPECT_EQ(tok.consume(), U'b');
}

TEST(Tokenizer, ConsumeExpectedMismatch) {
    Tokenizer tok("ab");
    try {
        tok.consume_expected(U'x');
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(std::string(e.what()), "Expected 'x' and instead saw 'a' at 1 [character 2 line 1]");
        EXPECT_TRUE(is_syntax_error(e.code()));
    }
}

TEST(Tokenizer, ConsumeExpectedAtEnd) {
    Tokenizer tok("");
    try {
        tok.consume_expected(U'x');
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("Expected 'x' and instead saw nothing"),
                  std::string::npos);
    }
}

TEST(Tokenizer, ConsumeExactly) {
    Tokenizer tok("h\xC3\xA9llo world");
    EXPECT_EQ(tok.consume_exactly(0), "");
    EXPECT_EQ(tok.consume_exactly(5), "h\xC3\xA9llo");
    EXPECT_EQ(tok.location().offset, 5u);
    EXPECT_EQ(tok.consume(), U' ');
}

TEST(Tokenizer, ConsumeExactlyPastEndFails) {
    Tokenizer tok("abc");
    try {
        (void)tok.consume_exactly(4);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("Substring bounds error"), std::string::npos);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// read_quoted_string
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, QuotedStringPlain) {
    Tokenizer tok("\"hello\" rest");
    EXPECT_EQ(tok.consume(), U'"');
    EXPECT_EQ(tok.read_quoted_string(U'"'), "hello");
    EXPECT_EQ(tok.next_clean(), U'r');
}

TEST(Tokenizer, QuotedStringUnicodeEscape) {
    Tokenizer tok(R"("a\u0041b")");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'"'), "aAb");
}

TEST(Tokenizer, QuotedStringSimpleEscapes) {
    Tokenizer tok(R"("\b\t\n\f\r\"\'\\\/")");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'"'), "\b\t\n\f\r\"'\\/");
}

TEST(Tokenizer, QuotedStringSingleQuotes) {
    Tokenizer tok(R"('it\'s "fine"')");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'\''), "it's \"fine\"");
}

TEST(Tokenizer, QuotedStringSurrogatePair) {
    Tokenizer tok(R"("\uD83D\uDE00")");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'"'), "\xF0\x9F\x98\x80");
}

TEST(Tokenizer, QuotedStringLoneSurrogates) {
    Tokenizer tok(R"("\uD83Dx\uDE00")");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'"'), "\xEF\xBF\xBDx\xEF\xBF\xBD");
}

TEST(Tokenizer, QuotedStringHighSurrogateAtClose) {
    Tokenizer tok(R"("\uD83D")");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'"'), "\xEF\xBF\xBD");
}

TEST(Tokenizer, QuotedStringKeepsRawUtf8) {
    Tokenizer tok("\"\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82\"");
    tok.consume();
    EXPECT_EQ(tok.read_quoted_string(U'"'), "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82");
}

TEST(Tokenizer, QuotedStringRawNewlineFails) {
    Tokenizer tok("\"ab\ncd\"");
    tok.consume();
    try {
        (void)tok.read_quoted_string(U'"');
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::unterminated_string);
        EXPECT_TRUE(is_syntax_error(e.code()));
    }
}

TEST(Tokenizer, QuotedStringUnterminatedAtEnd) {
    Tokenizer tok("\"abc");
    tok.consume();
    EXPECT_THROW((void)tok.read_quoted_string(U'"'), ParseError);
}

TEST(Tokenizer, QuotedStringIllegalEscape) {
    Tokenizer tok(R"("a\qb")");
    tok.consume();
    try {
        (void)tok.read_quoted_string(U'"');
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::invalid_escape);
        EXPECT_NE(std::string(e.what()).find("Illegal escape."), std::string::npos);
    }
}

TEST(Tokenizer, QuotedStringBadHexEscape) {
    Tokenizer tok(R"("\u12G4")");
    tok.consume();
    try {
        (void)tok.read_quoted_string(U'"');
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::invalid_escape);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// read_until
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, ReadUntilDelimiterIsPushedBack) {
    Tokenizer tok("  key  : value");
    EXPECT_EQ(tok.read_until(U':'), "key");
    EXPECT_EQ(tok.consume(), U':');
}

TEST(Tokenizer, ReadUntilStopsAtLineEnd) {
    Tokenizer tok("first line\nsecond");
    EXPECT_EQ(tok.read_until(U':'), "first line");
    EXPECT_EQ(tok.consume(), U'\n');
}

TEST(Tokenizer, ReadUntilEndOfInput) {
    Tokenizer tok("tail  ");
    EXPECT_EQ(tok.read_until(U':'), "tail");
    EXPECT_TRUE(tok.at_end());
}

TEST(Tokenizer, ReadUntilAnyOfSet) {
    Tokenizer tok("abc;def,ghi");
    EXPECT_EQ(tok.read_until(U",;"), "abc");
    EXPECT_EQ(tok.consume(), U';');
    EXPECT_EQ(tok.read_until(U",;"), "def");
    EXPECT_EQ(tok.consume(), U',');
}

TEST(Tokenizer, ReadUntilNonAsciiDelimiter) {
    Tokenizer tok("price → 10€");
    EXPECT_EQ(tok.read_until(U"→€"), "price");
    EXPECT_EQ(tok.consume(), U'→');
    EXPECT_EQ(tok.read_until(U"€"), "10");
    EXPECT_EQ(tok.consume(), U'€');
    EXPECT_EQ(tok.consume(), U'\0');
}

// ═══════════════════════════════════════════════════════════════════════════════
// read_unquoted_literal
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, UnquotedLiteralStopsAtReservedCharacter) {
    Tokenizer tok("bc,d");
    EXPECT_EQ(tok.read_unquoted_literal(U'a'), "abc");
    EXPECT_EQ(tok.consume(), U',');
}

TEST(Tokenizer, UnquotedLiteralStopsAtWhitespace) {
    Tokenizer tok("rue next");
    EXPECT_EQ(tok.read_unquoted_literal(U't'), "true");
    EXPECT_EQ(tok.consume(), U' ');
}

TEST(Tokenizer, UnquotedLiteralAtEndOfInput) {
    Tokenizer tok("23");
    EXPECT_EQ(tok.read_unquoted_literal(U'1'), "123");
    EXPECT_TRUE(tok.at_end());
}

TEST(Tokenizer, UnquotedLiteralEmptyIsMissingValue) {
    Tokenizer tok(",x");
    char32_t first = tok.consume();
    try {
        (void)tok.read_unquoted_literal(first);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::missing_value);
        EXPECT_NE(std::string(e.what()).find("Missing value"), std::string::npos);
    }
    EXPECT_EQ(tok.consume(), U',');
}

// ═══════════════════════════════════════════════════════════════════════════════
// Diagnostics and lifetime
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, PositionDescriptorStreamable) {
    Tokenizer tok("ab\ncd");
    for (int i = 0; i < 4; ++i) tok.consume();
    std::ostringstream os;
    os << tok;
    EXPECT_EQ(os.str(), " at 4 [character 1 line 2]");
    EXPECT_EQ(tok.to_string(), os.str());
}

TEST(Tokenizer, ReadsFromUtf8Stream) {
    std::istringstream is("  \"gr\xC3\xBC\xC3\x9F\" ");
    Tokenizer tok(is);
    EXPECT_EQ(tok.next_clean(), U'"');
    EXPECT_EQ(tok.read_quoted_string(U'"'), "gr\xC3\xBC\xC3\x9F");
}

TEST(Tokenizer, ReadsFromWideStream) {
    std::wistringstream is(L"[\"ü\"]");
    Tokenizer tok(is);
    auto v = tok.read_next_value();
    ASSERT_TRUE(v.is_array());
    EXPECT_EQ(v[0].as_string(), "\xC3\xBC");
}

TEST(Tokenizer, CloseIsIdempotent) {
    Tokenizer tok("[1, 2]");
    EXPECT_TRUE(tok.is_open());
    tok.close();
    tok.close();
    EXPECT_FALSE(tok.is_open());
    try {
        (void)tok.read_next_value();
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::io_error);
        EXPECT_FALSE(is_syntax_error(e.code()));
    }
}

TEST(Tokenizer, StreamFailureSurfacesAsIoError) {
    std::istringstream is("[1, 2");
    Tokenizer tok(is);
    EXPECT_EQ(tok.consume(), U'[');
    is.setstate(std::ios_base::badbit);
    try {
        (void)tok.consume();
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::io_error);
        ASSERT_TRUE(e.cause() != nullptr);
        EXPECT_THROW(std::rethrow_exception(e.cause()), std::ios_base::failure);
    }
}

TEST(Tokenizer, MarkAndSkipToPassThrough) {
    Tokenizer tok("  : value");
    EXPECT_EQ(tok.mark_and_skip_to(U':'), U':');
    EXPECT_EQ(tok.consume(), U':');

    Tokenizer none("abc");
    EXPECT_EQ(none.mark_and_skip_to(U':'), U'\0');
    EXPECT_EQ(none.location().offset, 0u);
    EXPECT_EQ(none.consume(), U'a');
}
