#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

enum class LiteralKind : std::uint8_t { None, Bool, Int, Float, Str, Bytes, List, Tuple, Dict, Set };

// Parsed form of a printed literal value. Language-agnostic tree; the
// concrete syntax accepted is the common "repr" style of containers
// (quotes either way, True/False/None, [..], (..), {k: v}, {a, b}).
struct LiteralValue {
    LiteralKind kind{LiteralKind::None};
    bool boolean{false};

    // Float value, or the (possibly rounded) value of an Int.
    double number{0.0};

    // Str/Bytes payload. For Int, the exact canonical decimal form ("-12", "0").
    std::string text{};

    // List/Tuple/Set elements or Dict keys. Set elements and Dict keys are
    // sorted by literal_compare() and unique.
    std::vector<LiteralValue> items{};

    // Dict values, parallel to items.
    std::vector<LiteralValue> values{};

    bool is_numeric() const noexcept { return kind == LiteralKind::Int || kind == LiteralKind::Float; }
};

inline constexpr std::size_t default_literal_max_depth = 256;

// Longer integer literals are rejected rather than converted.
inline constexpr std::size_t max_int_literal_digits = 4300;

// Safe literal parser: never evaluates anything, never throws on malformed
// input. Returns nullopt for anything outside the literal grammar, for
// unhashable set elements or dict keys, and for nesting deeper than max_depth.
std::optional<LiteralValue> parse_literal(std::string_view src,
                                          std::size_t max_depth = default_literal_max_depth);

// Total order over values; numbers (bool, int, float) order by exact value,
// NaN last, and sort before None, strings, bytes and containers.
int literal_compare(const LiteralValue& a, const LiteralValue& b) noexcept;

// Exact value equality: numerically equal bool/int/float coincide.
// Used for set membership and dict key identity.
inline bool literal_value_equal(const LiteralValue& a, const LiteralValue& b) noexcept {
    return literal_compare(a, b) == 0;
}

// Tolerant equality of two Int/Float leaves. Ints with the same exact text
// are equal; an Int too large for a finite double equals nothing else.
bool literal_number_equal(const LiteralValue& a, const LiteralValue& b, double eps) noexcept;

// Structural equality. Corresponding nodes must have the same kind;
// numeric leaves use literal_number_equal() with eps, sequences are
// order-sensitive, dicts ignore key order, sets use exact membership.
bool literal_deep_equal(const LiteralValue& a, const LiteralValue& b, double eps) noexcept;

const char* literal_kind_name(LiteralKind kind) noexcept;

} // namespace core
