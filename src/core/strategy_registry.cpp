#include "core/strategy_registry.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include "core/strategies.hpp"

namespace core {
namespace {

bool strategy_before(const Strategy& a, const Strategy& b) noexcept {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return std::strcmp(mode_name(a.mode), mode_name(b.mode)) < 0;
}

} // namespace

void StrategyRegistry::register_strategy(const Strategy& strategy) {
    if (!is_strategy_mode(strategy.mode)) {
        throw std::invalid_argument(std::string("cannot register strategy for mode ") + mode_name(strategy.mode));
    }
    if (strategy.handler == nullptr) {
        throw std::invalid_argument(std::string("null handler for mode ") + mode_name(strategy.mode));
    }
    slots_[mode_index(strategy.mode)] = strategy;
}

std::vector<Strategy> StrategyRegistry::for_mode(std::optional<ComparisonMode> mode) const {
    std::vector<Strategy> out;
    if (mode && *mode != ComparisonMode::Auto) {
        const auto& slot = slots_[mode_index(*mode)];
        if (slot) {
            out.push_back(*slot);
        }
        return out;
    }
    for (const auto& slot : slots_) {
        if (slot && slot->include_in_auto) {
            out.push_back(*slot);
        }
    }
    std::sort(out.begin(), out.end(), strategy_before);
    return out;
}

std::optional<Strategy> StrategyRegistry::strategy(ComparisonMode mode) const noexcept {
    return slots_[mode_index(mode)];
}

std::vector<ComparisonMode> StrategyRegistry::list_modes() const {
    std::vector<Strategy> all;
    for (const auto& slot : slots_) {
        if (slot) {
            all.push_back(*slot);
        }
    }
    std::sort(all.begin(), all.end(), strategy_before);
    std::vector<ComparisonMode> out;
    out.reserve(all.size());
    for (const auto& s : all) {
        out.push_back(s.mode);
    }
    return out;
}

std::size_t StrategyRegistry::size() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const auto& slot) { return slot.has_value(); }));
}

StrategyRegistry make_builtin_registry() {
    StrategyRegistry reg;
    const auto add = [&reg](ComparisonMode mode, StrategyHandler handler) {
        reg.register_strategy(Strategy{mode, handler, builtin_priority(mode), true});
    };
    add(ComparisonMode::Strict, &compare_strict);
    add(ComparisonMode::TrimEol, &compare_trim_eol);
    add(ComparisonMode::NormaliseWhitespace, &compare_normalise_whitespace);
    add(ComparisonMode::CanonicalLiteral, &compare_canonical_literal);
    add(ComparisonMode::FloatEps, &compare_float_eps);
    add(ComparisonMode::TokenSet, &compare_token_set);
    return reg;
}

const StrategyRegistry& default_registry() {
    static const StrategyRegistry registry = make_builtin_registry();
    return registry;
}

} // namespace core
