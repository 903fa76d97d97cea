/// @file bench_tokenizer.cpp
/// @brief Performance benchmarks for the pulljson tokenizer.
///
/// Measured operations:
///   - Parsing from a string (small, medium, large documents)
///   - Parsing from a UTF-8 stream
///   - Strict vs lenient mode
///   - Reading a sequence of values from one tokenizer
///   - Delimiter skipping with rollback
///   - Serialization of the parsed tree

#include <pulljson/pulljson.hpp>

#include <benchmark/benchmark.h>

#include <sstream>
#include <string>

using namespace pulljson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":"yes","score":"95.5"})";
}

/// Strict-mode friendly: only quoted strings and digit-only numbers.
static std::string generate_medium_json() {
    std::string s = R"({"users": [)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","score":)" + std::to_string(50 + i * 2) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

static std::string generate_lenient_json() {
    std::string s = "{";
    for (int i = 0; i < 200; ++i) {
        s += "key" + std::to_string(i) + ": [" + std::to_string(i) + ",, 'v" +
             std::to_string(i) + "', bare" + std::to_string(i) + "];";
    }
    s += "}";
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseSmall(benchmark::State& state) {
    const auto json = generate_small_json();
    for (auto _ : state) {
        auto v = parse(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}
BENCHMARK(BM_ParseSmall);

static void BM_ParseMedium(benchmark::State& state) {
    const auto json = generate_medium_json();
    for (auto _ : state) {
        auto v = parse(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}
BENCHMARK(BM_ParseMedium);

static void BM_ParseMediumStrict(benchmark::State& state) {
    const auto json = generate_medium_json();
    const auto opts = ParseOptions::strict_mode();
    for (auto _ : state) {
        auto v = parse(json, opts);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}
BENCHMARK(BM_ParseMediumStrict);

static void BM_ParseLarge(benchmark::State& state) {
    const auto json = generate_large_json();
    for (auto _ : state) {
        auto v = parse(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}
BENCHMARK(BM_ParseLarge);

static void BM_ParseLargeFromStream(benchmark::State& state) {
    const auto json = generate_large_json();
    for (auto _ : state) {
        std::istringstream is(json);
        auto v = parse(is);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}
BENCHMARK(BM_ParseLargeFromStream);

static void BM_ParseLenientSyntax(benchmark::State& state) {
    const auto json = generate_lenient_json();
    for (auto _ : state) {
        auto v = parse(json);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}
BENCHMARK(BM_ParseLenientSyntax);

// ═══════════════════════════════════════════════════════════════════════════════
// Pull reading
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ReadValueSequence(benchmark::State& state) {
    std::string stream;
    for (int i = 0; i < 1000; ++i) {
        stream += R"({"seq":)" + std::to_string(i) + R"(,"ok":true} )";
    }
    for (auto _ : state) {
        Tokenizer tok(stream);
        int count = 0;
        while (tok.next_clean() != 0) {
            tok.pushback();
            auto v = tok.read_next_value();
            benchmark::DoNotOptimize(v);
            ++count;
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * stream.size()));
}
BENCHMARK(BM_ReadValueSequence);

static void BM_SkipToMissingDelimiter(benchmark::State& state) {
    const std::string text(static_cast<size_t>(state.range(0)), 'x');
    for (auto _ : state) {
        Tokenizer tok(text);
        benchmark::DoNotOptimize(tok.mark_and_skip_to(U':'));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SkipToMissingDelimiter)->Arg(64)->Arg(4096)->Arg(65536);

static void BM_QuotedStringEscapes(benchmark::State& state) {
    std::string text = "\"";
    for (int i = 0; i < 500; ++i) text += R"(abc\n\té😀)";
    text += "\"";
    for (auto _ : state) {
        auto v = parse(text);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * text.size()));
}
BENCHMARK(BM_QuotedStringEscapes);

// ═══════════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SerializeLarge(benchmark::State& state) {
    const auto doc = parse(generate_large_json());
    for (auto _ : state) {
        auto s = doc.dump();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeLarge);

static void BM_SerializeLargePretty(benchmark::State& state) {
    const auto doc = parse(generate_large_json());
    for (auto _ : state) {
        auto s = doc.dump(2);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeLargePretty);
