#pragma once

#include <cmath>

namespace core {

// Absolute tolerance first, then relative tolerance once |a| > 1.
// NaN and infinities compare by IEEE equality only, so NaN never matches.
inline bool float_equal(double a, double b, double eps) noexcept {
    if (std::isinf(a) || std::isinf(b) || std::isnan(a) || std::isnan(b)) {
        return a == b;
    }
    const double diff = std::fabs(a - b);
    if (diff <= eps) {
        return true;
    }
    if (std::fabs(a) > 1.0) {
        return diff / std::fabs(a) <= eps;
    }
    return false;
}

} // namespace core
