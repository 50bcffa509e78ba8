#include "core/compare_config.hpp"

#include <cctype>

namespace core {

CompareConfig apply_overrides(const CompareConfig& base, const CompareOverrides& overrides) noexcept {
    CompareConfig cfg = base;
    if (overrides.float_eps) {
        cfg.float_eps = *overrides.float_eps;
    }
    if (overrides.unicode_form) {
        cfg.unicode_form = *overrides.unicode_form;
    }
    if (overrides.large_output_threshold) {
        cfg.large_output_threshold = *overrides.large_output_threshold;
    }
    if (overrides.token_set_limit) {
        cfg.token_set_size_limit = *overrides.token_set_limit;
    }
    return cfg;
}

const char* unicode_form_name(UnicodeForm form) noexcept {
    switch (form) {
    case UnicodeForm::NFC: return "NFC";
    case UnicodeForm::NFD: return "NFD";
    case UnicodeForm::NFKC: return "NFKC";
    case UnicodeForm::NFKD: return "NFKD";
    }
    return "NFC";
}

std::optional<UnicodeForm> parse_unicode_form(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    if (s.size() < 3 || s.size() > 4) {
        return std::nullopt;
    }
    char buf[4]{};
    for (std::size_t i = 0; i < s.size(); ++i) {
        buf[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i])));
    }
    const std::string_view up(buf, s.size());
    if (up == "NFC") return UnicodeForm::NFC;
    if (up == "NFD") return UnicodeForm::NFD;
    if (up == "NFKC") return UnicodeForm::NFKC;
    if (up == "NFKD") return UnicodeForm::NFKD;
    return std::nullopt;
}

} // namespace core
