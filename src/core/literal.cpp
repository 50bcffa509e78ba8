#include "core/literal.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

#include "core/float_equal.hpp"

namespace core {
namespace {

bool is_ident_start(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80u;
}

bool is_ident_char(char c) noexcept {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

int digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return 99;
}

bool is_radix_digit(char c, int radix) noexcept {
    return digit_value(c) < radix;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80u) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800u) {
        out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000u) {
        out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
}

// Converts a digit string in radix 2/8/16 to canonical decimal.
std::string radix_to_decimal(const std::string& digits, int radix) {
    // Little-endian limbs of 10^9.
    constexpr std::uint64_t limb_base = 1'000'000'000ULL;
    std::vector<std::uint64_t> limbs{0};
    for (const char c : digits) {
        std::uint64_t carry = static_cast<std::uint64_t>(digit_value(c));
        for (auto& limb : limbs) {
            const std::uint64_t v = limb * static_cast<std::uint64_t>(radix) + carry;
            limb = v % limb_base;
            carry = v / limb_base;
        }
        while (carry > 0) {
            limbs.push_back(carry % limb_base);
            carry /= limb_base;
        }
    }
    std::string out = std::to_string(limbs.back());
    for (std::size_t i = limbs.size() - 1; i-- > 0;) {
        const std::string part = std::to_string(limbs[i]);
        out.append(9 - part.size(), '0');
        out += part;
    }
    return out;
}

bool is_hashable(const LiteralValue& v) noexcept {
    switch (v.kind) {
    case LiteralKind::List:
    case LiteralKind::Dict:
    case LiteralKind::Set:
        return false;
    case LiteralKind::Tuple:
        return std::all_of(v.items.begin(), v.items.end(), [](const LiteralValue& item) { return is_hashable(item); });
    default:
        return true;
    }
}

int rank(LiteralKind kind) noexcept {
    switch (kind) {
    case LiteralKind::Bool:
    case LiteralKind::Int:
    case LiteralKind::Float:
        return 0;
    case LiteralKind::None: return 1;
    case LiteralKind::Str: return 2;
    case LiteralKind::Bytes: return 3;
    case LiteralKind::Tuple: return 4;
    case LiteralKind::List: return 5;
    case LiteralKind::Dict: return 6;
    case LiteralKind::Set: return 7;
    }
    return 8;
}

bool is_integral(const LiteralValue& v) noexcept {
    return v.kind == LiteralKind::Int || v.kind == LiteralKind::Bool;
}

std::string_view integral_text(const LiteralValue& v) noexcept {
    if (v.kind == LiteralKind::Bool) {
        return v.boolean ? "1" : "0";
    }
    return v.text;
}

int compare_decimal(std::string_view a, std::string_view b) noexcept {
    const bool neg_a = !a.empty() && a.front() == '-';
    const bool neg_b = !b.empty() && b.front() == '-';
    if (neg_a != neg_b) {
        return neg_a ? -1 : 1;
    }
    if (neg_a) {
        a.remove_prefix(1);
        b.remove_prefix(1);
    }
    int mag = 0;
    if (a.size() != b.size()) {
        mag = a.size() < b.size() ? -1 : 1;
    } else {
        const int c = a.compare(b);
        mag = (c > 0) - (c < 0);
    }
    return neg_a ? -mag : mag;
}

// Exact order of a canonical decimal integer against a non-NaN double.
int compare_int_double(std::string_view int_text, double y) noexcept {
    if (std::isinf(y)) {
        return y > 0 ? -1 : 1;
    }
    double whole = std::floor(y);
    const bool has_fraction = whole != y;
    if (whole == 0.0) {
        whole = 0.0; // no "-0"
    }
    // A finite double has at most 309 integral digits, printed exactly.
    std::array<char, 400> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), whole, std::chars_format::fixed, 0);
    if (res.ec != std::errc()) {
        double x = 0.0;
        const auto parsed = std::from_chars(int_text.data(), int_text.data() + int_text.size(), x);
        if (parsed.ec == std::errc::result_out_of_range) {
            x = (!int_text.empty() && int_text.front() == '-') ? -HUGE_VAL : HUGE_VAL;
        }
        return (x > y) - (x < y);
    }
    const std::string_view whole_text(buf.data(), static_cast<std::size_t>(res.ptr - buf.data()));
    const int c = compare_decimal(int_text, whole_text);
    if (c != 0) {
        return c;
    }
    return has_fraction ? -1 : 0;
}

int compare_numbers(const LiteralValue& a, const LiteralValue& b) noexcept {
    const bool int_a = is_integral(a);
    const bool int_b = is_integral(b);
    if (int_a && int_b) {
        return compare_decimal(integral_text(a), integral_text(b));
    }
    // NaN sorts after every other number.
    if (int_a) {
        return std::isnan(b.number) ? -1 : compare_int_double(integral_text(a), b.number);
    }
    if (int_b) {
        return std::isnan(a.number) ? 1 : -compare_int_double(integral_text(b), a.number);
    }
    const double x = a.number;
    const double y = b.number;
    const bool nan_x = std::isnan(x);
    const bool nan_y = std::isnan(y);
    if (nan_x || nan_y) {
        return static_cast<int>(nan_x) - static_cast<int>(nan_y);
    }
    return (x > y) - (x < y);
}

int compare_items(const std::vector<LiteralValue>& a, const std::vector<LiteralValue>& b) noexcept {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int c = literal_compare(a[i], b[i]);
        if (c != 0) {
            return c;
        }
    }
    return (a.size() > b.size()) - (a.size() < b.size());
}

class LiteralParser {
public:
    LiteralParser(std::string_view src, std::size_t max_depth) : src_(src), max_depth_(max_depth) {}

    std::optional<LiteralValue> parse() {
        skip_blank_lines();
        LiteralValue first;
        if (!parse_expr(first)) {
            return std::nullopt;
        }
        skip_ws();
        if (peek() == ',') {
            // Bare top-level tuple: "1, 2" or "1,".
            LiteralValue tuple;
            tuple.kind = LiteralKind::Tuple;
            tuple.items.push_back(std::move(first));
            while (consume(',')) {
                skip_ws();
                if (at_logical_end()) {
                    break;
                }
                LiteralValue item;
                if (!parse_expr(item)) {
                    return std::nullopt;
                }
                tuple.items.push_back(std::move(item));
                skip_ws();
            }
            first = std::move(tuple);
        }
        if (!at_logical_end()) {
            return std::nullopt;
        }
        return first;
    }

private:
    struct DepthGuard {
        explicit DepthGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
        ~DepthGuard() { --depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        std::size_t& depth_;
    };

    char peek(std::size_t off = 0) const noexcept {
        return pos_ + off < src_.size() ? src_[pos_ + off] : '\0';
    }

    bool at_end() const noexcept { return pos_ >= src_.size(); }

    bool consume(char c) noexcept {
        if (!at_end() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_comment() noexcept {
        while (!at_end() && src_[pos_] != '\n') {
            ++pos_;
        }
    }

    // Inside brackets newlines are insignificant; at top level they end the
    // expression, so only blanks, comments and line continuations are skipped.
    void skip_ws() noexcept {
        while (!at_end()) {
            const char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\f') {
                ++pos_;
            } else if ((c == '\n' || c == '\r') && depth_ > 0) {
                ++pos_;
            } else if (c == '#') {
                skip_comment();
            } else if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
                pos_ += peek(1) == '\r' ? 3 : 2;
            } else {
                break;
            }
        }
    }

    void skip_blank_lines() noexcept {
        while (!at_end()) {
            const char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\f' || c == '\n' || c == '\r' || c == '\v') {
                ++pos_;
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    bool at_logical_end() noexcept {
        const std::size_t saved = pos_;
        skip_blank_lines();
        const bool end = at_end();
        pos_ = saved;
        if (end) {
            pos_ = src_.size();
        }
        return end;
    }

    bool parse_expr(LiteralValue& out) {
        skip_ws();
        const char c = peek();
        if (c == '+' || c == '-') {
            ++pos_;
            skip_ws();
            const char d = peek();
            if (!(std::isdigit(static_cast<unsigned char>(d)) ||
                  (d == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))))) {
                return false;
            }
            return parse_number(out, c == '-');
        }
        return parse_atom(out);
    }

    bool parse_atom(LiteralValue& out) {
        const char c = peek();
        if (c == '[') {
            return parse_list(out);
        }
        if (c == '(') {
            return parse_paren(out);
        }
        if (c == '{') {
            return parse_brace(out);
        }
        if (string_prefix_length() != npos) {
            return parse_strings(out);
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            return parse_number(out, false);
        }
        if (is_ident_start(c)) {
            return parse_name(out);
        }
        return false;
    }

    bool parse_items(char close, std::vector<LiteralValue>& items) {
        while (true) {
            skip_ws();
            if (consume(close)) {
                return true;
            }
            LiteralValue v;
            if (!parse_expr(v)) {
                return false;
            }
            items.push_back(std::move(v));
            skip_ws();
            if (consume(close)) {
                return true;
            }
            if (!consume(',')) {
                return false;
            }
        }
    }

    bool parse_list(LiteralValue& out) {
        DepthGuard guard(depth_);
        if (depth_ > max_depth_) {
            return false;
        }
        ++pos_; // '['
        out.kind = LiteralKind::List;
        return parse_items(']', out.items);
    }

    bool parse_paren(LiteralValue& out) {
        DepthGuard guard(depth_);
        if (depth_ > max_depth_) {
            return false;
        }
        ++pos_; // '('
        skip_ws();
        if (consume(')')) {
            out.kind = LiteralKind::Tuple;
            return true;
        }
        LiteralValue first;
        if (!parse_expr(first)) {
            return false;
        }
        skip_ws();
        if (consume(')')) {
            out = std::move(first);
            return true;
        }
        if (!consume(',')) {
            return false;
        }
        out.kind = LiteralKind::Tuple;
        out.items.push_back(std::move(first));
        return parse_items(')', out.items);
    }

    bool parse_brace(LiteralValue& out) {
        DepthGuard guard(depth_);
        if (depth_ > max_depth_) {
            return false;
        }
        ++pos_; // '{'
        skip_ws();
        if (consume('}')) {
            out.kind = LiteralKind::Dict;
            return true;
        }
        LiteralValue first;
        if (!parse_expr(first)) {
            return false;
        }
        skip_ws();
        if (consume(':')) {
            return parse_dict_rest(std::move(first), out);
        }
        out.kind = LiteralKind::Set;
        out.items.push_back(std::move(first));
        skip_ws();
        if (!consume('}')) {
            if (!consume(',') || !parse_items('}', out.items)) {
                return false;
            }
        }
        return finish_set(out);
    }

    bool parse_dict_rest(LiteralValue first_key, LiteralValue& out) {
        std::vector<std::pair<LiteralValue, LiteralValue>> entries;
        LiteralValue key = std::move(first_key);
        while (true) {
            LiteralValue value;
            if (!parse_expr(value)) {
                return false;
            }
            if (!is_hashable(key)) {
                return false;
            }
            entries.emplace_back(std::move(key), std::move(value));
            skip_ws();
            if (consume('}')) {
                break;
            }
            if (!consume(',')) {
                return false;
            }
            skip_ws();
            if (consume('}')) {
                break;
            }
            key = LiteralValue{};
            if (!parse_expr(key)) {
                return false;
            }
            skip_ws();
            if (!consume(':')) {
                return false;
            }
        }

        std::stable_sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
            return literal_compare(lhs.first, rhs.first) < 0;
        });
        // Equal keys: the first key object stays, the last value wins.
        out.kind = LiteralKind::Dict;
        for (auto& entry : entries) {
            if (!out.items.empty() && literal_value_equal(out.items.back(), entry.first)) {
                out.values.back() = std::move(entry.second);
                continue;
            }
            out.items.push_back(std::move(entry.first));
            out.values.push_back(std::move(entry.second));
        }
        return true;
    }

    static bool finish_set(LiteralValue& out) {
        for (const auto& item : out.items) {
            if (!is_hashable(item)) {
                return false;
            }
        }
        std::stable_sort(out.items.begin(), out.items.end(), [](const LiteralValue& lhs, const LiteralValue& rhs) {
            return literal_compare(lhs, rhs) < 0;
        });
        out.items.erase(std::unique(out.items.begin(), out.items.end(),
                                    [](const LiteralValue& lhs, const LiteralValue& rhs) {
                                        return literal_value_equal(lhs, rhs);
                                    }),
                        out.items.end());
        return true;
    }

    bool parse_name(LiteralValue& out) {
        const std::size_t start = pos_;
        while (!at_end() && is_ident_char(src_[pos_])) {
            ++pos_;
        }
        const std::string_view name = src_.substr(start, pos_ - start);
        if (name == "True" || name == "False") {
            out.kind = LiteralKind::Bool;
            out.boolean = name == "True";
            return true;
        }
        if (name == "None") {
            out.kind = LiteralKind::None;
            return true;
        }
        if (name == "set") {
            skip_ws();
            if (!consume('(')) {
                return false;
            }
            DepthGuard guard(depth_);
            skip_ws();
            if (!consume(')')) {
                return false;
            }
            out.kind = LiteralKind::Set;
            return true;
        }
        return false;
    }

    // Reads digits of the given radix with single '_' separators between digits.
    void read_digits(int radix, std::string& digits, bool allow_leading_underscore = false) {
        bool prev_digit = allow_leading_underscore;
        while (!at_end()) {
            const char c = src_[pos_];
            if (is_radix_digit(c, radix)) {
                digits.push_back(c);
                prev_digit = true;
                ++pos_;
            } else if (c == '_' && prev_digit && is_radix_digit(peek(1), radix)) {
                prev_digit = false;
                ++pos_;
            } else {
                break;
            }
        }
    }

    bool parse_number(LiteralValue& out, bool negative) {
        std::string int_digits;
        bool is_float = false;
        const char c0 = peek();
        const char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
        if (c0 == '0' && (c1 == 'x' || c1 == 'o' || c1 == 'b')) {
            const int radix = c1 == 'x' ? 16 : (c1 == 'o' ? 8 : 2);
            pos_ += 2;
            read_digits(radix, int_digits, true);
            if (int_digits.empty()) {
                return false;
            }
            if (!at_end() && is_ident_char(src_[pos_])) {
                return false;
            }
            const auto first_nonzero = int_digits.find_first_not_of('0');
            int_digits = first_nonzero == std::string::npos ? std::string("0")
                                                            : int_digits.substr(first_nonzero);
            if (int_digits.size() > max_int_literal_digits) {
                return false;
            }
            return make_int(radix_to_decimal(int_digits, radix), negative, out);
        }

        read_digits(10, int_digits);
        std::string frac_digits;
        std::string exp_text;
        if (peek() == '.') {
            is_float = true;
            ++pos_;
            read_digits(10, frac_digits);
        }
        if (peek() == 'e' || peek() == 'E') {
            const std::size_t saved = pos_;
            ++pos_;
            std::string exp_digits;
            std::string sign;
            if (peek() == '+' || peek() == '-') {
                sign.push_back(peek());
                ++pos_;
            }
            read_digits(10, exp_digits);
            if (exp_digits.empty()) {
                pos_ = saved;
                return false;
            }
            is_float = true;
            exp_text = "e" + sign + exp_digits;
        }
        if (int_digits.empty() && frac_digits.empty()) {
            return false;
        }
        // Imaginary suffixes and glued names ("1j", "2abc") are not literals here.
        if (!at_end() && (is_ident_char(src_[pos_]) || src_[pos_] == '.')) {
            return false;
        }

        if (!is_float) {
            const auto first_nonzero = int_digits.find_first_not_of('0');
            if (first_nonzero == std::string::npos) {
                return make_int("0", negative, out);
            }
            if (first_nonzero != 0) {
                return false; // "012" is not a valid integer literal
            }
            if (int_digits.size() > max_int_literal_digits) {
                return false;
            }
            return make_int(int_digits, negative, out);
        }

        std::string text = (int_digits.empty() ? std::string("0") : int_digits) + "." +
                           (frac_digits.empty() ? std::string("0") : frac_digits) + exp_text;
        const double value = std::strtod(text.c_str(), nullptr);
        out.kind = LiteralKind::Float;
        out.number = negative ? -value : value;
        return true;
    }

    static bool make_int(std::string digits, bool negative, LiteralValue& out) {
        out.kind = LiteralKind::Int;
        const double magnitude = std::strtod(digits.c_str(), nullptr);
        const bool zero = digits == "0";
        out.number = negative && !zero ? -magnitude : magnitude;
        out.text = (negative && !zero) ? "-" + digits : std::move(digits);
        return true;
    }

    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    // Length of a string prefix (r, u, b, br, rb in any case) when followed
    // by a quote; npos if the cursor is not at a string literal.
    std::size_t string_prefix_length() const noexcept {
        std::size_t n = 0;
        bool raw = false;
        bool bytes = false;
        bool unicode = false;
        while (n < 3) {
            const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(n))));
            if (c == '\'' || c == '"') {
                return n;
            }
            if (c == 'r' && !raw && !unicode) {
                raw = true;
            } else if (c == 'b' && !bytes && !unicode) {
                bytes = true;
            } else if (c == 'u' && n == 0) {
                unicode = true;
            } else {
                return npos;
            }
            ++n;
        }
        return npos;
    }

    bool parse_strings(LiteralValue& out) {
        bool first_bytes = false;
        std::string text;
        if (!parse_one_string(text, first_bytes)) {
            return false;
        }
        // Adjacent literals concatenate: 'a' "b" == 'ab'.
        while (true) {
            const std::size_t saved = pos_;
            skip_ws();
            if (string_prefix_length() == npos) {
                pos_ = saved;
                break;
            }
            bool next_bytes = false;
            if (!parse_one_string(text, next_bytes) || next_bytes != first_bytes) {
                return false;
            }
        }
        out.kind = first_bytes ? LiteralKind::Bytes : LiteralKind::Str;
        out.text = std::move(text);
        return true;
    }

    bool read_hex(std::size_t count, std::uint32_t& value) noexcept {
        value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            const int d = digit_value(peek());
            if (d >= 16) {
                return false;
            }
            value = value * 16u + static_cast<std::uint32_t>(d);
            ++pos_;
        }
        return true;
    }

    bool parse_one_string(std::string& out, bool& is_bytes) {
        bool raw = false;
        is_bytes = false;
        const std::size_t prefix = string_prefix_length();
        for (std::size_t i = 0; i < prefix; ++i) {
            const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(src_[pos_ + i])));
            raw = raw || c == 'r';
            is_bytes = is_bytes || c == 'b';
        }
        pos_ += prefix;
        const char quote = src_[pos_];
        const bool triple = peek(1) == quote && peek(2) == quote;
        pos_ += triple ? 3 : 1;

        while (true) {
            if (at_end()) {
                return false;
            }
            const char c = src_[pos_];
            if (c == quote) {
                if (!triple) {
                    ++pos_;
                    return true;
                }
                if (peek(1) == quote && peek(2) == quote) {
                    pos_ += 3;
                    return true;
                }
            }
            if (!triple && (c == '\n' || c == '\r')) {
                return false;
            }
            if (c == '\\') {
                if (pos_ + 1 >= src_.size()) {
                    return false;
                }
                if (raw) {
                    out.push_back('\\');
                    out.push_back(src_[pos_ + 1]);
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                if (!parse_escape(out, is_bytes)) {
                    return false;
                }
                continue;
            }
            if (is_bytes && static_cast<unsigned char>(c) >= 0x80u) {
                return false;
            }
            out.push_back(c);
            ++pos_;
        }
    }

    // Cursor is just past the backslash.
    bool parse_escape(std::string& out, bool is_bytes) {
        const char e = src_[pos_++];
        switch (e) {
        case '\n': return true;
        case '\\': out.push_back('\\'); return true;
        case '\'': out.push_back('\''); return true;
        case '"': out.push_back('"'); return true;
        case 'a': out.push_back('\a'); return true;
        case 'b': out.push_back('\b'); return true;
        case 'f': out.push_back('\f'); return true;
        case 'n': out.push_back('\n'); return true;
        case 'r': out.push_back('\r'); return true;
        case 't': out.push_back('\t'); return true;
        case 'v': out.push_back('\v'); return true;
        default:
            break;
        }
        if (e >= '0' && e <= '7') {
            std::uint32_t value = static_cast<std::uint32_t>(e - '0');
            for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; ++i) {
                value = value * 8u + static_cast<std::uint32_t>(peek() - '0');
                ++pos_;
            }
            return emit_code(out, value, is_bytes);
        }
        if (e == 'x') {
            std::uint32_t value = 0;
            if (!read_hex(2, value)) {
                return false;
            }
            return emit_code(out, value, is_bytes);
        }
        if (!is_bytes && (e == 'u' || e == 'U')) {
            std::uint32_t value = 0;
            if (!read_hex(e == 'u' ? 4 : 8, value)) {
                return false;
            }
            if (value > 0x10FFFFu || (value >= 0xD800u && value <= 0xDFFFu)) {
                return false;
            }
            append_utf8(out, value);
            return true;
        }
        if (!is_bytes && e == 'N') {
            return false; // named escapes need a character database
        }
        // Unknown escapes keep the backslash.
        out.push_back('\\');
        out.push_back(e);
        return true;
    }

    static bool emit_code(std::string& out, std::uint32_t value, bool is_bytes) {
        if (is_bytes) {
            if (value > 0xFFu) {
                return false;
            }
            out.push_back(static_cast<char>(value));
        } else {
            append_utf8(out, value);
        }
        return true;
    }

    std::string_view src_;
    std::size_t pos_{0};
    std::size_t depth_{0};
    std::size_t max_depth_;
};

} // namespace

std::optional<LiteralValue> parse_literal(std::string_view src, std::size_t max_depth) {
    LiteralParser parser(src, max_depth);
    return parser.parse();
}

int literal_compare(const LiteralValue& a, const LiteralValue& b) noexcept {
    const int ra = rank(a.kind);
    const int rb = rank(b.kind);
    if (ra != rb) {
        return ra < rb ? -1 : 1;
    }
    switch (a.kind) {
    case LiteralKind::Bool:
    case LiteralKind::Int:
    case LiteralKind::Float:
        return compare_numbers(a, b);
    case LiteralKind::None:
        return 0;
    case LiteralKind::Str:
    case LiteralKind::Bytes: {
        const int c = a.text.compare(b.text);
        return (c > 0) - (c < 0);
    }
    case LiteralKind::Tuple:
    case LiteralKind::List:
    case LiteralKind::Set:
        return compare_items(a.items, b.items);
    case LiteralKind::Dict: {
        const int c = compare_items(a.items, b.items);
        return c != 0 ? c : compare_items(a.values, b.values);
    }
    }
    return 0;
}

bool literal_number_equal(const LiteralValue& a, const LiteralValue& b, double eps) noexcept {
    if (a.kind == LiteralKind::Int && b.kind == LiteralKind::Int && a.text == b.text) {
        return true;
    }
    // An Int past the double range has no finite value to measure a tolerance against.
    if ((a.kind == LiteralKind::Int && !std::isfinite(a.number)) ||
        (b.kind == LiteralKind::Int && !std::isfinite(b.number))) {
        return false;
    }
    return float_equal(a.number, b.number, eps);
}

bool literal_deep_equal(const LiteralValue& a, const LiteralValue& b, double eps) noexcept {
    if (a.kind != b.kind) {
        return false;
    }
    switch (a.kind) {
    case LiteralKind::None:
        return true;
    case LiteralKind::Bool:
        return a.boolean == b.boolean;
    case LiteralKind::Int:
    case LiteralKind::Float:
        return literal_number_equal(a, b, eps);
    case LiteralKind::Str:
    case LiteralKind::Bytes:
        return a.text == b.text;
    case LiteralKind::List:
    case LiteralKind::Tuple:
        if (a.items.size() != b.items.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.items.size(); ++i) {
            if (!literal_deep_equal(a.items[i], b.items[i], eps)) {
                return false;
            }
        }
        return true;
    case LiteralKind::Dict:
        // Keys are sorted and unique, so equal key sets line up index by index.
        if (a.items.size() != b.items.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.items.size(); ++i) {
            if (!literal_value_equal(a.items[i], b.items[i])) {
                return false;
            }
        }
        for (std::size_t i = 0; i < a.values.size(); ++i) {
            if (!literal_deep_equal(a.values[i], b.values[i], eps)) {
                return false;
            }
        }
        return true;
    case LiteralKind::Set:
        if (a.items.size() != b.items.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.items.size(); ++i) {
            if (!literal_value_equal(a.items[i], b.items[i])) {
                return false;
            }
        }
        return true;
    }
    return false;
}

const char* literal_kind_name(LiteralKind kind) noexcept {
    switch (kind) {
    case LiteralKind::None: return "none";
    case LiteralKind::Bool: return "bool";
    case LiteralKind::Int: return "int";
    case LiteralKind::Float: return "float";
    case LiteralKind::Str: return "str";
    case LiteralKind::Bytes: return "bytes";
    case LiteralKind::List: return "list";
    case LiteralKind::Tuple: return "tuple";
    case LiteralKind::Dict: return "dict";
    case LiteralKind::Set: return "set";
    }
    return "unknown";
}

} // namespace core
