#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/compare_config.hpp"

namespace core {

struct NormalizedPair {
    std::string expected;
    std::string actual;
    std::vector<std::string> base_normalisations;
};

// Unicode normalization of UTF-8 text. Fail-open: input that is not valid
// UTF-8, or a normalizer that cannot be loaded, yields the input unchanged.
std::string unicode_normalize(std::string_view text, UnicodeForm form);

// Replaces every "\r\n" with "\n". A lone '\r' is left as is.
std::string unify_line_endings(std::string_view text);

// Label recorded for the unicode step, e.g. "unicode_nfc".
std::string unicode_label(UnicodeForm form);

// Applied to both sides before the guard and before any strategy runs.
NormalizedPair normalize_pair(std::string_view expected, std::string_view actual, const CompareConfig& cfg);

} // namespace core
