#pragma once

/// @file parse_options.hpp
/// @author Aleksandr Loshkarev
/// @brief Parsing policy and limits.
///
/// Lenient mode (the default) accepts the relaxed syntax the tokenizer
/// has always tolerated:
///   - Unquoted barewords as string values: [abc]
///   - Single-quoted strings: 'hello'
///   - Unquoted object keys: {key: "value"}
///   - ';' as an object separator, trailing separators, elided array slots
///
/// Strict mode rejects all of the above and additionally requires that
/// nothing but whitespace follows the top-level value.

#include "config.hpp"

#include <cstddef>

namespace pulljson {

/// @brief Parser configuration.
struct ParseOptions {
    /// Require quote-delimited scalars and standard separators.
    bool strict = false;

    // ─── Limits ──────────────────────────────────────────────────────────

    /// Maximum nesting depth (0 = use PULLJSON_MAX_DEPTH)
    size_t max_depth = 0;

    /// Rollback window for delimiter skipping (0 = use PULLJSON_SKIP_LIMIT)
    size_t skip_limit = 0;

    size_t effective_max_depth() const noexcept {
        return max_depth > 0 ? max_depth : PULLJSON_MAX_DEPTH;
    }

    size_t effective_skip_limit() const noexcept {
        return skip_limit > 0 ? skip_limit : PULLJSON_SKIP_LIMIT;
    }

    // ─── Factory methods ─────────────────────────────────────────────────

    static constexpr ParseOptions strict_mode() noexcept {
        ParseOptions opts;
        opts.strict = true;
        return opts;
    }

    static constexpr ParseOptions lenient() noexcept {
        return {};
    }
};

} // namespace pulljson
