#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/compare_config.hpp"
#include "core/compare_result.hpp"
#include "core/strategy_registry.hpp"

namespace core {

// Runs one strategy and times it. A strategy that throws is recorded as
// inconclusive (no verdict, no labels, no reason) and logged at Warn.
CompareAttempt run_strategy(const Strategy& strategy, std::string_view expected, std::string_view actual,
                            const CompareConfig& cfg, const CompareOverrides& overrides) noexcept;

// Runs every strategy concurrently, one thread each, over the same
// immutable inputs. Attempts come back sorted by (priority, mode name).
// Falls back to running a strategy inline when a thread cannot be started.
std::vector<CompareAttempt> evaluate_strategies(const std::vector<Strategy>& strategies, std::string_view expected,
                                                std::string_view actual, const CompareConfig& cfg,
                                                const CompareOverrides& overrides);

// Picks the verdict from sorted attempts: first pass wins, else first
// explicit fail, else "No comparator matched". Labels are the base labels
// followed by the chosen attempt's labels.
CompareResult select_result(std::vector<CompareAttempt> attempts, const std::vector<std::string>& base_normalisations);

} // namespace core
