#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/compare_config.hpp"
#include "core/compare_result.hpp"
#include "core/normalizer.hpp"

namespace core {

// Lowercase hex SHA-256 of the bytes of text. Empty on digest failure.
std::optional<std::string> sha256_hex(std::string_view text);

// Digest to store in place of an expected output that is at least
// default_large_output_threshold code points long; nullopt for smaller outputs.
std::optional<std::string> maybe_hash_large(std::string_view expected);

// Terminal verdict when either normalized side reaches the configured
// threshold, measured in code points (the digest still covers the bytes);
// nullopt means the caller continues with the strategies.
std::optional<CompareResult> apply_large_output_guard(const NormalizedPair& normalized, const CompareConfig& cfg);

} // namespace core
