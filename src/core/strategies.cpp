#include "core/strategies.hpp"

#include <array>
#include <charconv>

#include "core/literal.hpp"
#include "core/text_ops.hpp"

namespace core {

double resolve_float_eps(const CompareConfig& cfg, const CompareOverrides& overrides) noexcept {
    if (overrides.float_eps) {
        return *overrides.float_eps;
    }
    return overrides.strategy_float_eps ? *overrides.strategy_float_eps : cfg.float_eps;
}

std::size_t resolve_token_limit(const CompareConfig& cfg, const CompareOverrides& overrides) noexcept {
    return overrides.token_set_limit ? *overrides.token_set_limit : cfg.token_set_size_limit;
}

std::string format_eps(double eps) {
    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), eps);
    if (res.ec != std::errc()) {
        return std::to_string(eps);
    }
    return std::string(buf.data(), res.ptr);
}

StrategyOutcome compare_strict(std::string_view expected, std::string_view actual,
                               const CompareConfig&, const CompareOverrides&) {
    StrategyOutcome out;
    out.passed = expected == actual;
    if (!*out.passed) {
        out.reason = "Mismatch under STRICT";
    }
    return out;
}

StrategyOutcome compare_trim_eol(std::string_view expected, std::string_view actual,
                                 const CompareConfig&, const CompareOverrides&) {
    StrategyOutcome out;
    out.normalisations.push_back("trim_eol");
    if (strip_trailing_eol(expected) == strip_trailing_eol(actual)) {
        out.passed = true;
    }
    return out;
}

StrategyOutcome compare_normalise_whitespace(std::string_view expected, std::string_view actual,
                                             const CompareConfig&, const CompareOverrides&) {
    StrategyOutcome out;
    if (collapse_whitespace(expected) == collapse_whitespace(actual)) {
        out.passed = true;
        out.normalisations.push_back("ws_conservative");
        return out;
    }
    if (remove_all_whitespace(expected) == remove_all_whitespace(actual)) {
        out.passed = true;
        out.normalisations.push_back("ws_aggressive");
        return out;
    }
    out.normalisations.push_back("ws_checked");
    return out;
}

StrategyOutcome compare_canonical_literal(std::string_view expected, std::string_view actual,
                                          const CompareConfig& cfg, const CompareOverrides&) {
    StrategyOutcome out;
    out.normalisations.push_back("literal");
    // A bare None counts as "no literal", so the strategy abstains.
    const auto lhs = parse_literal(expected);
    if (!lhs || lhs->kind == LiteralKind::None) {
        return out;
    }
    const auto rhs = parse_literal(actual);
    if (!rhs || rhs->kind == LiteralKind::None) {
        return out;
    }
    if (literal_deep_equal(*lhs, *rhs, cfg.float_eps)) {
        out.passed = true;
    } else {
        out.passed = false;
        out.reason = "Literal structures differ";
    }
    return out;
}

StrategyOutcome compare_float_eps(std::string_view expected, std::string_view actual,
                                  const CompareConfig& cfg, const CompareOverrides& overrides) {
    StrategyOutcome out;
    const auto lhs = parse_literal(expected);
    if (!lhs || !lhs->is_numeric()) {
        return out;
    }
    const auto rhs = parse_literal(actual);
    if (!rhs || !rhs->is_numeric()) {
        return out;
    }
    const double eps = resolve_float_eps(cfg, overrides);
    const std::string eps_text = format_eps(eps);
    out.normalisations.push_back("float_eps=" + eps_text);
    if (literal_number_equal(*lhs, *rhs, eps)) {
        out.passed = true;
    } else {
        out.passed = false;
        out.reason = "Numeric mismatch over eps " + eps_text;
    }
    return out;
}

StrategyOutcome compare_token_set(std::string_view expected, std::string_view actual,
                                  const CompareConfig& cfg, const CompareOverrides& overrides) {
    StrategyOutcome out;
    const std::size_t limit = resolve_token_limit(cfg, overrides);
    if (limit > 0 && (codepoint_length(expected) > limit || codepoint_length(actual) > limit)) {
        out.normalisations.push_back("token_limit=" + std::to_string(limit));
        return out;
    }
    out.normalisations.push_back("token_set");
    if (token_set(expected) == token_set(actual)) {
        out.passed = true;
    } else {
        out.passed = false;
        out.reason = "Token sets differ";
    }
    return out;
}

} // namespace core
