#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace core {

enum class UnicodeForm : std::uint8_t { NFC, NFD, NFKC, NFKD };

inline constexpr double default_float_eps = 1e-6;
inline constexpr std::size_t default_large_output_threshold = 2u * 1024u * 1024u;
inline constexpr std::size_t default_token_set_size_limit = 512;

// Comparison settings for a single compare() call. Treated as an immutable
// snapshot once the call starts; per-call overrides produce a derived copy.
struct CompareConfig {
    // Absolute tolerance, and relative tolerance once |expected| > 1.
    double float_eps{default_float_eps};

    UnicodeForm unicode_form{UnicodeForm::NFC};

    // Length in code points at or above which either side is judged by SHA-256 only (0 = disabled).
    std::size_t large_output_threshold{default_large_output_threshold};

    // TOKEN_SET abstains when either side is longer than this many code points (0 = no limit).
    std::size_t token_set_size_limit{default_token_set_size_limit};
};

static_assert(std::is_trivially_copyable_v<CompareConfig>, "CompareConfig must be trivially copyable");

[[nodiscard]] inline constexpr CompareConfig default_compare_config() noexcept {
    return CompareConfig{};
}

// Per-call overrides, typically read from a stored test-case row.
// An absent field falls back to the base CompareConfig.
struct CompareOverrides {
    std::optional<double> float_eps{};
    // Nested "float.eps": tolerance for the FLOAT_EPS strategy only, used
    // when float_eps is absent. Never copied into CompareConfig.
    std::optional<double> strategy_float_eps{};
    std::optional<UnicodeForm> unicode_form{};
    std::optional<std::size_t> large_output_threshold{};
    std::optional<std::size_t> token_set_limit{};

    bool empty() const noexcept {
        return !float_eps && !strategy_float_eps && !unicode_form && !large_output_threshold && !token_set_limit;
    }
};

// Clone-then-mutate: base is never modified.
[[nodiscard]] CompareConfig apply_overrides(const CompareConfig& base, const CompareOverrides& overrides) noexcept;

const char* unicode_form_name(UnicodeForm form) noexcept;

// Case-insensitive, surrounding whitespace ignored.
std::optional<UnicodeForm> parse_unicode_form(std::string_view s) noexcept;

} // namespace core
