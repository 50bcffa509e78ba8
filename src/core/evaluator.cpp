#include "core/evaluator.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include "util/log.hpp"

namespace core {
namespace {

bool attempt_before(const CompareAttempt& a, const CompareAttempt& b) noexcept {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return std::strcmp(mode_name(a.mode), mode_name(b.mode)) < 0;
}

const char* verdict_name(const std::optional<bool>& passed) noexcept {
    if (!passed) {
        return "none";
    }
    return *passed ? "pass" : "fail";
}

} // namespace

CompareAttempt run_strategy(const Strategy& strategy, std::string_view expected, std::string_view actual,
                            const CompareConfig& cfg, const CompareOverrides& overrides) noexcept {
    CompareAttempt attempt;
    attempt.mode = strategy.mode;
    attempt.priority = strategy.priority;

    const auto start = std::chrono::steady_clock::now();
    try {
        StrategyOutcome outcome = strategy.handler(expected, actual, cfg, overrides);
        attempt.passed = outcome.passed;
        attempt.normalisations = std::move(outcome.normalisations);
        attempt.reason = std::move(outcome.reason);
    } catch (const std::exception& e) {
        attempt.passed.reset();
        attempt.normalisations.clear();
        attempt.reason.reset();
        LOG_SLOW_WARN("strategy %s raised: %s", mode_name(strategy.mode), e.what());
    } catch (...) {
        attempt.passed.reset();
        attempt.normalisations.clear();
        attempt.reason.reset();
        LOG_SLOW_WARN("strategy %s raised a non-standard exception", mode_name(strategy.mode));
    }
    attempt.duration =
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);

    LOG_SLOW_DEBUG("attempt %s priority=%d verdict=%s duration_ns=%lld", mode_name(attempt.mode), attempt.priority,
                   verdict_name(attempt.passed), static_cast<long long>(attempt.duration.count()));
    return attempt;
}

std::vector<CompareAttempt> evaluate_strategies(const std::vector<Strategy>& strategies, std::string_view expected,
                                                std::string_view actual, const CompareConfig& cfg,
                                                const CompareOverrides& overrides) {
    std::vector<CompareAttempt> attempts(strategies.size());
    std::vector<std::thread> workers;
    workers.reserve(strategies.size());

    // Each worker owns exactly one slot of attempts.
    for (std::size_t i = 0; i < strategies.size(); ++i) {
        const Strategy& strategy = strategies[i];
        CompareAttempt* slot = &attempts[i];
        try {
            workers.emplace_back([&strategy, slot, expected, actual, &cfg, &overrides] {
                *slot = run_strategy(strategy, expected, actual, cfg, overrides);
            });
        } catch (const std::system_error& e) {
            LOG_SLOW_WARN("could not start worker for %s (%s); running inline", mode_name(strategy.mode), e.what());
            *slot = run_strategy(strategy, expected, actual, cfg, overrides);
        }
    }
    for (auto& t : workers) {
        t.join();
    }

    std::stable_sort(attempts.begin(), attempts.end(), attempt_before);
    return attempts;
}

CompareResult select_result(std::vector<CompareAttempt> attempts, const std::vector<std::string>& base_normalisations) {
    CompareResult result;
    result.normalisations_applied = base_normalisations;

    const auto chosen = [&]() -> const CompareAttempt* {
        for (const auto& a : attempts) {
            if (a.passed && *a.passed) {
                return &a;
            }
        }
        for (const auto& a : attempts) {
            if (a.passed && !*a.passed) {
                return &a;
            }
        }
        return nullptr;
    }();

    if (chosen == nullptr) {
        result.passed = false;
        result.reason = "No comparator matched";
    } else {
        result.passed = *chosen->passed;
        result.mode_applied = chosen->mode;
        result.normalisations_applied.insert(result.normalisations_applied.end(), chosen->normalisations.begin(),
                                             chosen->normalisations.end());
        if (!result.passed) {
            result.reason = chosen->reason ? *chosen->reason : std::string("Mismatch under ") + mode_name(chosen->mode);
        }
    }

    result.attempts = std::move(attempts);
    return result;
}

} // namespace core
