#include "core/normalizer.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

#include <unicode/bytestream.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/utf8.h>

#include "util/log.hpp"

namespace core {
namespace {

const icu::Normalizer2* normalizer_for(UnicodeForm form, UErrorCode& status) {
    switch (form) {
    case UnicodeForm::NFC: return icu::Normalizer2::getNFCInstance(status);
    case UnicodeForm::NFD: return icu::Normalizer2::getNFDInstance(status);
    case UnicodeForm::NFKC: return icu::Normalizer2::getNFKCInstance(status);
    case UnicodeForm::NFKD: return icu::Normalizer2::getNFKDInstance(status);
    }
    return nullptr;
}

bool is_valid_utf8(std::string_view text) noexcept {
    const auto* s = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto length = static_cast<std::int32_t>(text.size());
    std::int32_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            return false;
        }
    }
    return true;
}

bool is_ascii(std::string_view text) noexcept {
    for (const char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80u) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string unicode_normalize(std::string_view text, UnicodeForm form) {
    // NFC/NFD/NFKC/NFKD all leave pure ASCII untouched.
    if (text.empty() || is_ascii(text)) {
        return std::string(text);
    }
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        LOG_SLOW_DEBUG("unicode_normalize: input of %zu bytes exceeds ICU limits, left as is", text.size());
        return std::string(text);
    }
    if (!is_valid_utf8(text)) {
        LOG_SLOW_DEBUG("unicode_normalize: input is not valid UTF-8, left as is");
        return std::string(text);
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* norm = normalizer_for(form, status);
    if (U_FAILURE(status) || norm == nullptr) {
        LOG_SLOW_WARN("unicode_normalize: %s normalizer unavailable (%s), falling back to identity",
                      unicode_form_name(form), u_errorName(status));
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());
    icu::StringByteSink<std::string> sink(&out);
    norm->normalizeUTF8(0, icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())), sink, nullptr,
                        status);
    if (U_FAILURE(status)) {
        LOG_SLOW_WARN("unicode_normalize: %s normalization failed (%s), falling back to identity",
                      unicode_form_name(form), u_errorName(status));
        return std::string(text);
    }
    return out;
}

std::string unify_line_endings(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string unicode_label(UnicodeForm form) {
    std::string label = "unicode_";
    for (const char* p = unicode_form_name(form); *p != '\0'; ++p) {
        label.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
    }
    return label;
}

NormalizedPair normalize_pair(std::string_view expected, std::string_view actual, const CompareConfig& cfg) {
    NormalizedPair out;
    out.expected = unify_line_endings(unicode_normalize(expected, cfg.unicode_form));
    out.actual = unify_line_endings(unicode_normalize(actual, cfg.unicode_form));
    out.base_normalisations.push_back(unicode_label(cfg.unicode_form));
    return out;
}

} // namespace core
