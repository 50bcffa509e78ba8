#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/compare_config.hpp"
#include "core/compare_mode.hpp"
#include "core/compare_result.hpp"
#include "core/strategy_registry.hpp"

namespace core {

// Judges actual program output against the expected output.
//
// Pipeline: overrides -> unicode + line-ending normalization -> large-output
// guard -> exact fast path -> strategies for the requested mode (nullopt or
// Auto runs all of them) -> verdict selection.
//
// Never throws; every failure is reported through CompareResult::reason.
CompareResult compare(std::string_view expected, std::string_view actual, const CompareConfig& base_cfg,
                      std::optional<ComparisonMode> mode = std::nullopt,
                      const CompareOverrides& overrides = {}) noexcept;

CompareResult compare(const StrategyRegistry& registry, std::string_view expected, std::string_view actual,
                      const CompareConfig& base_cfg, std::optional<ComparisonMode> mode = std::nullopt,
                      const CompareOverrides& overrides = {}) noexcept;

// Mode names for configuration UIs: "AUTO" first when requested, then the
// registered modes in priority order.
std::vector<std::string> supported_modes(bool include_auto = true);

// Trimmed and case-insensitive; blank, absent or unknown input yields Auto.
ComparisonMode resolve_mode(std::optional<std::string_view> raw) noexcept;

} // namespace core
