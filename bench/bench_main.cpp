#include <chrono>
#include <iostream>
#include <string>

#include "core/comparator.hpp"
#include "core/literal.hpp"

int main() {
    const auto cfg = core::default_compare_config();

    // Fails every strategy except FLOAT_EPS; exercises the full AUTO pipeline.
    const std::string expected = "3.1415926\n";
    const std::string actual = "3.141593";
    const std::string lit_a = "{'b': [1, 2.5, (3, 'x')], 'a': {1, 2, 3}}";
    const std::string lit_b = "{'a': {3, 2, 1}, 'b': [1, 2.5, (3, 'x')]}";

    constexpr std::size_t iterations = 20000;
    std::size_t passed = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        passed += core::compare(expected, actual, cfg).passed ? 1u : 0u;
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "compare AUTO " << iterations << " iterations took " << ns << " ns (" << (ns / iterations)
              << " ns/iter, passed=" << passed << ")\n";

    passed = 0;
    start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const auto a = core::parse_literal(lit_a);
        const auto b = core::parse_literal(lit_b);
        passed += (a && b && core::literal_deep_equal(*a, *b, cfg.float_eps)) ? 1u : 0u;
    }
    end = std::chrono::steady_clock::now();
    ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "literal parse+equal " << iterations << " iterations took " << ns << " ns (" << (ns / iterations)
              << " ns/iter, passed=" << passed << ")\n";
    return 0;
}
