#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace core {

// Auto is a resolution request, never a registered strategy.
// HashSha256 only ever appears in results produced by the large-output guard.
enum class ComparisonMode : std::uint8_t {
    Auto,
    Strict,
    TrimEol,
    NormaliseWhitespace,
    CanonicalLiteral,
    FloatEps,
    TokenSet,
    HashSha256
};

inline constexpr std::size_t comparison_mode_count = 8;

const char* mode_name(ComparisonMode mode) noexcept;

// Exact (already uppercased) name lookup. Also accepts the legacy
// CANONICAL_PY_LITERAL spelling still present in stored test-case rows.
std::optional<ComparisonMode> mode_from_string(std::string_view name) noexcept;

// Fixed priorities of the built-in strategies; lower runs and wins first.
[[nodiscard]] constexpr int builtin_priority(ComparisonMode mode) noexcept {
    switch (mode) {
    case ComparisonMode::Strict: return 0;
    case ComparisonMode::TrimEol: return 10;
    case ComparisonMode::NormaliseWhitespace: return 20;
    case ComparisonMode::CanonicalLiteral: return 30;
    case ComparisonMode::FloatEps: return 40;
    case ComparisonMode::TokenSet: return 50;
    case ComparisonMode::Auto:
    case ComparisonMode::HashSha256:
        break;
    }
    return -1;
}

[[nodiscard]] constexpr bool is_strategy_mode(ComparisonMode mode) noexcept {
    return mode != ComparisonMode::Auto && mode != ComparisonMode::HashSha256;
}

[[nodiscard]] constexpr std::size_t mode_index(ComparisonMode mode) noexcept {
    return static_cast<std::size_t>(mode);
}

} // namespace core
