#include "core/comparator.hpp"

#include <cctype>
#include <exception>
#include <new>
#include <utility>

#include "core/evaluator.hpp"
#include "core/large_output_guard.hpp"
#include "core/normalizer.hpp"
#include "util/log.hpp"

namespace core {
namespace {

void log_verdict(const CompareResult& r) {
    if (!util::log_enabled(util::LogLevel::Debug)) {
        return;
    }
    LOG_SLOW_DEBUG("compare verdict=%s mode=%s attempts=%zu reason=%s", r.passed ? "pass" : "fail",
                   r.mode_applied ? mode_name(*r.mode_applied) : "none", r.attempts.size(),
                   r.reason ? r.reason->c_str() : "-");
}

CompareResult failed_result(const char* reason) noexcept {
    CompareResult r;
    r.passed = false;
    try {
        r.reason = reason;
    } catch (const std::bad_alloc&) {
        // Leave reason empty; the verdict is still a failure.
    }
    return r;
}

CompareResult compare_impl(const StrategyRegistry& registry, std::string_view expected, std::string_view actual,
                           const CompareConfig& base_cfg, std::optional<ComparisonMode> mode,
                           const CompareOverrides& overrides) {
    const CompareConfig cfg = apply_overrides(base_cfg, overrides);

    // Strategies only ever see this pair; it outlives every worker.
    const NormalizedPair normalized = normalize_pair(expected, actual, cfg);

    if (auto guarded = apply_large_output_guard(normalized, cfg)) {
        return std::move(*guarded);
    }

    if (normalized.expected == normalized.actual) {
        CompareResult r;
        r.passed = true;
        r.mode_applied = ComparisonMode::Strict;
        r.normalisations_applied = normalized.base_normalisations;
        return r;
    }

    const std::vector<Strategy> strategies = registry.for_mode(mode);
    if (strategies.empty()) {
        CompareResult r;
        r.passed = false;
        r.normalisations_applied = normalized.base_normalisations;
        r.reason = "No comparator strategies available";
        return r;
    }

    std::vector<CompareAttempt> attempts =
        evaluate_strategies(strategies, normalized.expected, normalized.actual, cfg, overrides);
    return select_result(std::move(attempts), normalized.base_normalisations);
}

} // namespace

CompareResult compare(const StrategyRegistry& registry, std::string_view expected, std::string_view actual,
                      const CompareConfig& base_cfg, std::optional<ComparisonMode> mode,
                      const CompareOverrides& overrides) noexcept {
    try {
        CompareResult r = compare_impl(registry, expected, actual, base_cfg, mode, overrides);
        log_verdict(r);
        return r;
    } catch (const std::exception& e) {
        LOG_SLOW_ERROR("compare failed: %s", e.what());
        return failed_result("Comparison failed: internal error");
    }
}

CompareResult compare(std::string_view expected, std::string_view actual, const CompareConfig& base_cfg,
                      std::optional<ComparisonMode> mode, const CompareOverrides& overrides) noexcept {
    return compare(default_registry(), expected, actual, base_cfg, mode, overrides);
}

std::vector<std::string> supported_modes(bool include_auto) {
    std::vector<std::string> out;
    if (include_auto) {
        out.emplace_back(mode_name(ComparisonMode::Auto));
    }
    for (const ComparisonMode m : default_registry().list_modes()) {
        out.emplace_back(mode_name(m));
    }
    return out;
}

ComparisonMode resolve_mode(std::optional<std::string_view> raw) noexcept {
    if (!raw) {
        return ComparisonMode::Auto;
    }
    std::string_view s = *raw;
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    // Longest mode name is well under this.
    char buf[32]{};
    if (s.empty() || s.size() >= sizeof(buf)) {
        return ComparisonMode::Auto;
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        buf[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i])));
    }
    const auto mode = mode_from_string(std::string_view(buf, s.size()));
    if (!mode) {
        return ComparisonMode::Auto;
    }
    if (*mode == ComparisonMode::Auto) {
        return *mode;
    }
    // Only names the registry can actually run are accepted.
    return default_registry().strategy(*mode) ? *mode : ComparisonMode::Auto;
}

} // namespace core
