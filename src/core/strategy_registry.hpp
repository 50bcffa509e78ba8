#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/compare_config.hpp"
#include "core/compare_mode.hpp"
#include "core/compare_result.hpp"

namespace core {

using StrategyHandler = StrategyOutcome (*)(std::string_view expected, std::string_view actual,
                                            const CompareConfig& cfg, const CompareOverrides& overrides);

struct Strategy {
    ComparisonMode mode{ComparisonMode::Strict};
    StrategyHandler handler{nullptr};
    int priority{0};
    bool include_in_auto{true};
};

// Mode -> strategy table. One slot per mode; registering a mode twice
// replaces the earlier entry. Built once and then only read, so concurrent
// lookups need no locking.
class StrategyRegistry {
public:
    // Throws std::invalid_argument for Auto, HashSha256 or a null handler.
    void register_strategy(const Strategy& strategy);

    // Strategies to run for a requested mode, ordered by (priority, name).
    // nullopt or Auto selects every include_in_auto strategy; a specific mode
    // selects that one strategy, or nothing when it is not registered.
    [[nodiscard]] std::vector<Strategy> for_mode(std::optional<ComparisonMode> mode) const;

    [[nodiscard]] std::optional<Strategy> strategy(ComparisonMode mode) const noexcept;

    // All registered modes ordered by (priority, name).
    [[nodiscard]] std::vector<ComparisonMode> list_modes() const;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::array<std::optional<Strategy>, comparison_mode_count> slots_{};
};

// Registry holding the six built-in strategies.
StrategyRegistry make_builtin_registry();

// Process-wide built-in registry, constructed on first use.
const StrategyRegistry& default_registry();

} // namespace core
