#include "core/text_ops.hpp"

#include <cstdint>
#include <algorithm>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace core {
namespace {

// One decoded unit of the input: [begin, end) bytes, and whether it is whitespace.
struct Unit {
    std::size_t begin;
    std::size_t end;
    bool space;
};

// Walks text one code point at a time; ill-formed bytes become single
// non-space units so the original bytes survive untouched.
template <typename Fn>
void for_each_unit(std::string_view text, Fn&& fn) {
    const auto* s = reinterpret_cast<const std::uint8_t*>(text.data());
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const std::uint8_t b = s[i];
        if (b < 0x80u) {
            fn(Unit{i, i + 1, is_space_codepoint(static_cast<char32_t>(b))});
            ++i;
            continue;
        }
        // U8_NEXT works on int32 offsets; decode a bounded window.
        const std::int32_t window = static_cast<std::int32_t>(std::min<std::size_t>(n - i, 4));
        std::int32_t off = 0;
        UChar32 c = 0;
        U8_NEXT(s + i, off, window, c);
        if (c < 0) {
            fn(Unit{i, i + 1, false});
            ++i;
            continue;
        }
        const std::size_t len = static_cast<std::size_t>(off);
        fn(Unit{i, i + len, is_space_codepoint(static_cast<char32_t>(c))});
        i += len;
    }
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> out;
    std::size_t token_begin = 0;
    bool in_token = false;
    for_each_unit(text, [&](const Unit& u) {
        if (u.space) {
            if (in_token) {
                out.push_back(text.substr(token_begin, u.begin - token_begin));
                in_token = false;
            }
        } else if (!in_token) {
            token_begin = u.begin;
            in_token = true;
        }
    });
    if (in_token) {
        out.push_back(text.substr(token_begin));
    }
    return out;
}

} // namespace

bool is_space_codepoint(char32_t cp) noexcept {
    if (cp >= 0x1Cu && cp <= 0x1Fu) {
        return true;
    }
    return u_isUWhiteSpace(static_cast<UChar32>(cp)) != 0;
}

std::string_view strip_trailing_eol(std::string_view text) noexcept {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t line_begin = 0;
    while (true) {
        const std::size_t nl = text.find('\n', line_begin);
        const std::string_view line =
            text.substr(line_begin, nl == std::string_view::npos ? std::string_view::npos : nl - line_begin);
        bool first = true;
        for (const std::string_view tok : split_whitespace(line)) {
            if (!first) {
                out.push_back(' ');
            }
            out.append(tok);
            first = false;
        }
        if (nl == std::string_view::npos) {
            break;
        }
        out.push_back('\n');
        line_begin = nl + 1;
    }
    return out;
}

std::string remove_all_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for_each_unit(text, [&](const Unit& u) {
        if (!u.space) {
            out.append(text.substr(u.begin, u.end - u.begin));
        }
    });
    return out;
}

std::set<std::string> token_set(std::string_view text) {
    std::set<std::string> out;
    for (const std::string_view tok : split_whitespace(text)) {
        out.emplace(tok);
    }
    return out;
}

std::size_t codepoint_length(std::string_view text) noexcept {
    std::size_t count = 0;
    for_each_unit(text, [&](const Unit&) { ++count; });
    return count;
}

} // namespace core
