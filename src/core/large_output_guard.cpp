#include "core/large_output_guard.hpp"

#include <array>

#include <openssl/evp.h>

#include "core/text_ops.hpp"
#include "util/log.hpp"

namespace core {

namespace {

// Code points never outnumber bytes, so the count is skipped for short inputs.
bool reaches_threshold(std::string_view text, std::size_t threshold) noexcept {
    return text.size() >= threshold && codepoint_length(text) >= threshold;
}

} // namespace

std::optional<std::string> sha256_hex(std::string_view text) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(text.data(), text.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(digest_len) * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0Fu]);
    }
    return out;
}

std::optional<std::string> maybe_hash_large(std::string_view expected) {
    if (!reaches_threshold(expected, default_large_output_threshold)) {
        return std::nullopt;
    }
    return sha256_hex(expected);
}

std::optional<CompareResult> apply_large_output_guard(const NormalizedPair& normalized, const CompareConfig& cfg) {
    const std::size_t threshold = cfg.large_output_threshold;
    if (threshold == 0) {
        return std::nullopt;
    }
    if (!reaches_threshold(normalized.expected, threshold) && !reaches_threshold(normalized.actual, threshold)) {
        return std::nullopt;
    }

    bool same = false;
    const auto exp_hash = sha256_hex(normalized.expected);
    const auto act_hash = sha256_hex(normalized.actual);
    if (exp_hash && act_hash) {
        same = *exp_hash == *act_hash;
    } else {
        // Byte identity is what the digest stands for.
        LOG_SLOW_WARN("large-output guard: SHA-256 unavailable, comparing %zu/%zu bytes directly",
                      normalized.expected.size(), normalized.actual.size());
        same = normalized.expected == normalized.actual;
    }

    CompareResult result;
    result.passed = same;
    result.mode_applied = ComparisonMode::HashSha256;
    result.normalisations_applied = normalized.base_normalisations;
    result.normalisations_applied.push_back("hash_threshold=" + std::to_string(threshold));
    if (!same) {
        result.reason = "Hash mismatch for large output";
    }
    LOG_SLOW_DEBUG("large-output guard fired at threshold=%zu (expected=%zu actual=%zu bytes) passed=%d",
                   threshold, normalized.expected.size(), normalized.actual.size(), same ? 1 : 0);
    return result;
}

} // namespace core
