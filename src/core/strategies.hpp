#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "core/compare_config.hpp"
#include "core/compare_result.hpp"

namespace core {

// Built-in comparison strategies. Each is a pure function of its inputs;
// none of them mutates shared state, so they may run concurrently.

StrategyOutcome compare_strict(std::string_view expected, std::string_view actual,
                               const CompareConfig& cfg, const CompareOverrides& overrides);

StrategyOutcome compare_trim_eol(std::string_view expected, std::string_view actual,
                                 const CompareConfig& cfg, const CompareOverrides& overrides);

// Collapsed intra-line whitespace first ("ws_conservative"), then all
// whitespace removed ("ws_aggressive"); abstains when neither matches.
StrategyOutcome compare_normalise_whitespace(std::string_view expected, std::string_view actual,
                                             const CompareConfig& cfg, const CompareOverrides& overrides);

// Abstains unless both sides parse as literals other than a bare None.
StrategyOutcome compare_canonical_literal(std::string_view expected, std::string_view actual,
                                          const CompareConfig& cfg, const CompareOverrides& overrides);

StrategyOutcome compare_float_eps(std::string_view expected, std::string_view actual,
                                  const CompareConfig& cfg, const CompareOverrides& overrides);

StrategyOutcome compare_token_set(std::string_view expected, std::string_view actual,
                                  const CompareConfig& cfg, const CompareOverrides& overrides);

// Per-call override first, then the config value. FLOAT_EPS also honours
// the strategy-only nested override between the two.
double resolve_float_eps(const CompareConfig& cfg, const CompareOverrides& overrides) noexcept;
std::size_t resolve_token_limit(const CompareConfig& cfg, const CompareOverrides& overrides) noexcept;

// Shortest round-trip text of an epsilon, e.g. "1e-06", "0.001".
std::string format_eps(double eps);

} // namespace core
