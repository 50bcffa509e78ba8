#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/compare_mode.hpp"

namespace core {

// What a single strategy decided. passed == nullopt means the strategy
// abstains (input not applicable, or parse failure).
struct StrategyOutcome {
    std::optional<bool> passed{};
    std::vector<std::string> normalisations{};
    std::optional<std::string> reason{};
};

// One strategy's outcome within one compare() call.
struct CompareAttempt {
    ComparisonMode mode{ComparisonMode::Strict};
    std::optional<bool> passed{};
    std::vector<std::string> normalisations{};
    std::optional<std::string> reason{};
    std::chrono::nanoseconds duration{0};
    int priority{0};
};

// Final verdict plus the full attempt trail. mode_applied is empty only
// when no strategy could decide.
struct CompareResult {
    bool passed{false};
    std::optional<ComparisonMode> mode_applied{};
    std::vector<std::string> normalisations_applied{};
    std::optional<std::string> reason{};
    std::vector<CompareAttempt> attempts{};
};

} // namespace core
