#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "core/compare_config.hpp"

namespace persist {

// Per-test-case comparison settings, stored as a JSON object such as
//   {"float_eps": 1e-3, "token": {"limit": 64}, "unicode_nf": "NFKC"}
//
// Recognised keys: float_eps, float.eps, token_set_limit, token.limit,
// unicode_nf (alias unicode_form), large_output_threshold. Numbers may also be
// given as numeric strings. Unknown keys and malformed values are skipped and
// leave the corresponding field of out untouched; only structurally invalid
// JSON is an error. Empty text means no overrides. float.eps fills
// strategy_float_eps, which only the FLOAT_EPS strategy reads.
bool parse_compare_overrides(std::string_view json,
                             core::CompareOverrides& out,
                             std::string& error) noexcept;

bool load_compare_overrides(const std::filesystem::path& path,
                            core::CompareOverrides& out,
                            std::string& error) noexcept;

} // namespace persist
