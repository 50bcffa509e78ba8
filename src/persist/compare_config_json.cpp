#include "persist/compare_config_json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>

namespace persist {
namespace {

constexpr int max_json_depth = 64;

// A scalar as read from the bag; objects and arrays are skipped.
struct JsonScalar {
    enum class Kind { Null, Bool, Number, String } kind{Kind::Null};
    double number{0.0};
    std::string text;
};

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    char peek() const noexcept {
        skip_ws();
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    std::optional<std::string> parse_string(std::string& err) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= src_.size()) {
                err = "Invalid escape";
                return std::nullopt;
            }
            const char esc = src_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    std::uint32_t cp = 0;
                    if (!parse_hex4(cp)) {
                        err = "Invalid \\u escape";
                        return std::nullopt;
                    }
                    if (cp >= 0xD800u && cp <= 0xDBFFu) {
                        std::uint32_t lo = 0;
                        if (pos_ + 1 < src_.size() && src_[pos_] == '\\' && src_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            if (!parse_hex4(lo) || lo < 0xDC00u || lo > 0xDFFFu) {
                                err = "Invalid surrogate pair";
                                return std::nullopt;
                            }
                            cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
                        } else {
                            err = "Unpaired surrogate";
                            return std::nullopt;
                        }
                    } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
                        err = "Unpaired surrogate";
                        return std::nullopt;
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    err = "Unsupported escape sequence";
                    return std::nullopt;
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    std::optional<double> parse_number(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        if (pos_ < src_.size() && src_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' || c == '+' ||
                c == '-') {
                ++pos_;
            } else {
                break;
            }
        }
        double value = 0.0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (start == pos_ || conv.ec != std::errc() || conv.ptr != src_.data() + pos_) {
            err = "Invalid number";
            return std::nullopt;
        }
        return value;
    }

    bool parse_literal(std::string_view literal, std::string& err) noexcept {
        skip_ws();
        if (src_.substr(pos_).compare(0, literal.size(), literal) == 0) {
            pos_ += literal.size();
            return true;
        }
        err = "Expected literal";
        return false;
    }

    // Reads any scalar; nested objects and arrays are consumed and reported
    // as Null so callers can ignore them.
    std::optional<JsonScalar> parse_value(std::string& err, int depth) noexcept {
        if (depth > max_json_depth) {
            err = "Nesting too deep";
            return std::nullopt;
        }
        JsonScalar v;
        const char c = peek();
        if (c == '"') {
            auto s = parse_string(err);
            if (!s) return std::nullopt;
            v.kind = JsonScalar::Kind::String;
            v.text = std::move(*s);
        } else if (c == '{' || c == '[') {
            if (!skip_container(err, depth)) return std::nullopt;
        } else if (c == 't') {
            if (!parse_literal("true", err)) return std::nullopt;
            v.kind = JsonScalar::Kind::Bool;
            v.number = 1.0;
        } else if (c == 'f') {
            if (!parse_literal("false", err)) return std::nullopt;
            v.kind = JsonScalar::Kind::Bool;
        } else if (c == 'n') {
            if (!parse_literal("null", err)) return std::nullopt;
        } else {
            auto n = parse_number(err);
            if (!n) return std::nullopt;
            v.kind = JsonScalar::Kind::Number;
            v.number = *n;
        }
        return v;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

private:
    bool parse_hex4(std::uint32_t& out) noexcept {
        if (pos_ + 4 > src_.size()) {
            return false;
        }
        const auto conv = std::from_chars(src_.data() + pos_, src_.data() + pos_ + 4, out, 16);
        if (conv.ec != std::errc() || conv.ptr != src_.data() + pos_ + 4) {
            return false;
        }
        pos_ += 4;
        return true;
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
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

    bool skip_container(std::string& err, int depth) noexcept {
        const bool is_object = consume('{');
        if (!is_object && !consume('[')) {
            err = "Expected object or array";
            return false;
        }
        const char close = is_object ? '}' : ']';
        if (consume(close)) {
            return true;
        }
        while (true) {
            if (is_object) {
                if (!parse_string(err)) return false;
                if (!consume(':')) { err = "Expected ':'"; return false; }
            }
            if (!parse_value(err, depth + 1)) return false;
            if (consume(close)) return true;
            if (!consume(',')) { err = "Expected ','"; return false; }
        }
    }

    mutable std::size_t pos_{0};
    std::string_view src_;
};

std::optional<double> scalar_to_double(const JsonScalar& v) noexcept {
    double d = 0.0;
    if (v.kind == JsonScalar::Kind::Number) {
        d = v.number;
    } else if (v.kind == JsonScalar::Kind::String) {
        std::string_view s = v.text;
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        if (!s.empty() && s.front() == '+') s.remove_prefix(1);
        const auto conv = std::from_chars(s.data(), s.data() + s.size(), d);
        if (s.empty() || conv.ec != std::errc() || conv.ptr != s.data() + s.size()) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(d)) {
        return std::nullopt;
    }
    return d < 0.0 ? 0.0 : d;
}

std::optional<std::size_t> scalar_to_size(const JsonScalar& v) noexcept {
    const auto d = scalar_to_double(v);
    if (!d) {
        return std::nullopt;
    }
    const double t = std::trunc(*d);
    if (t >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(t);
}

// Values gathered from one object; top-level and nested spellings are kept
// apart until the end so the top-level one wins regardless of key order.
struct RawOverrides {
    std::optional<double> float_eps;
    std::optional<double> nested_float_eps;
    std::optional<std::size_t> token_limit;
    std::optional<std::size_t> nested_token_limit;
    std::optional<core::UnicodeForm> unicode_form;
    std::optional<std::size_t> large_output_threshold;
};

// Reads {"<field>": value, ...} and applies fn(key, value) to each member.
template <typename Fn>
bool parse_object(JsonCursor& cur, std::string& error, int depth, Fn&& fn) noexcept {
    if (!cur.consume('{')) { error = "Expected object"; return false; }
    if (cur.consume('}')) { return true; }
    while (true) {
        auto key = cur.parse_string(error);
        if (!key) { return false; }
        if (!cur.consume(':')) { error = "Expected ':'"; return false; }
        if (!fn(*key, depth)) { return false; }
        if (cur.consume('}')) { return true; }
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
}

bool parse_nested_member(JsonCursor& cur, std::string& error, int depth, std::string_view field,
                         std::optional<double>& eps_out, std::optional<std::size_t>& limit_out) noexcept {
    return parse_object(cur, error, depth + 1, [&](const std::string& key, int d) {
        auto v = cur.parse_value(error, d + 1);
        if (!v) {
            return false;
        }
        if (field == "eps" && key == "eps") {
            if (auto x = scalar_to_double(*v)) eps_out = *x;
        } else if (field == "limit" && key == "limit") {
            if (auto x = scalar_to_size(*v)) limit_out = *x;
        }
        return true;
    });
}

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace

bool parse_compare_overrides(std::string_view json,
                             core::CompareOverrides& out,
                             std::string& error) noexcept {
    JsonCursor cur(json);
    if (cur.eof()) {
        return true;
    }

    RawOverrides raw;
    const bool ok = parse_object(cur, error, 0, [&](const std::string& key, int depth) {
        if ((key == "float" || key == "token") && cur.peek() == '{') {
            return key == "float"
                       ? parse_nested_member(cur, error, depth, "eps", raw.nested_float_eps, raw.nested_token_limit)
                       : parse_nested_member(cur, error, depth, "limit", raw.nested_float_eps, raw.nested_token_limit);
        }
        auto v = cur.parse_value(error, depth + 1);
        if (!v) {
            return false;
        }
        if (key == "float_eps") {
            if (auto x = scalar_to_double(*v)) raw.float_eps = *x;
        } else if (key == "token_set_limit") {
            if (auto x = scalar_to_size(*v)) raw.token_limit = *x;
        } else if (key == "large_output_threshold") {
            if (auto x = scalar_to_size(*v)) raw.large_output_threshold = *x;
        } else if (key == "unicode_nf" || key == "unicode_form") {
            if (v->kind == JsonScalar::Kind::String) {
                if (auto f = core::parse_unicode_form(v->text)) raw.unicode_form = *f;
            }
        }
        return true;
    });
    if (!ok) {
        return false;
    }
    if (!cur.eof()) {
        error = "Trailing characters after object";
        return false;
    }

    if (raw.float_eps) {
        out.float_eps = raw.float_eps;
    }
    if (raw.nested_float_eps) {
        out.strategy_float_eps = raw.nested_float_eps;
    }
    if (raw.token_limit) {
        out.token_set_limit = raw.token_limit;
    } else if (raw.nested_token_limit) {
        out.token_set_limit = raw.nested_token_limit;
    }
    if (raw.unicode_form) {
        out.unicode_form = raw.unicode_form;
    }
    if (raw.large_output_threshold) {
        out.large_output_threshold = raw.large_output_threshold;
    }
    return true;
}

bool load_compare_overrides(const std::filesystem::path& path,
                            core::CompareOverrides& out,
                            std::string& error) noexcept {
    std::string contents;
    if (!load_file(path, contents, error)) {
        return false;
    }
    return parse_compare_overrides(contents, out, error);
}

} // namespace persist
