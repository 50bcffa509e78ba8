#include "core/compare_mode.hpp"

namespace core {

const char* mode_name(ComparisonMode mode) noexcept {
    switch (mode) {
    case ComparisonMode::Auto: return "AUTO";
    case ComparisonMode::Strict: return "STRICT";
    case ComparisonMode::TrimEol: return "TRIM_EOL";
    case ComparisonMode::NormaliseWhitespace: return "NORMALISE_WHITESPACE";
    case ComparisonMode::CanonicalLiteral: return "CANONICAL_LITERAL";
    case ComparisonMode::FloatEps: return "FLOAT_EPS";
    case ComparisonMode::TokenSet: return "TOKEN_SET";
    case ComparisonMode::HashSha256: return "HASH_SHA256";
    }
    return "UNKNOWN";
}

std::optional<ComparisonMode> mode_from_string(std::string_view name) noexcept {
    if (name == "AUTO") return ComparisonMode::Auto;
    if (name == "STRICT") return ComparisonMode::Strict;
    if (name == "TRIM_EOL") return ComparisonMode::TrimEol;
    if (name == "NORMALISE_WHITESPACE") return ComparisonMode::NormaliseWhitespace;
    if (name == "CANONICAL_LITERAL" || name == "CANONICAL_PY_LITERAL") return ComparisonMode::CanonicalLiteral;
    if (name == "FLOAT_EPS") return ComparisonMode::FloatEps;
    if (name == "TOKEN_SET") return ComparisonMode::TokenSet;
    if (name == "HASH_SHA256") return ComparisonMode::HashSha256;
    return std::nullopt;
}

} // namespace core
