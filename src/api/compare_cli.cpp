#include "api/compare_cli.hpp"

#include <fstream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/comparator.hpp"
#include "core/compare_config.hpp"
#include "persist/compare_config_json.hpp"
#include "util/log.hpp"

namespace api {

namespace {

bool read_file(const std::filesystem::path& p, std::string& out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        LOG_SLOW_ERROR("cannot open %s", p.string().c_str());
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        LOG_SLOW_ERROR("read error on %s", p.string().c_str());
        return false;
    }
    return true;
}

std::string join(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "-";
    }
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out += s;
    }
    return out;
}

const char* outcome_name(const std::optional<bool>& passed) noexcept {
    if (!passed) {
        return "none";
    }
    return *passed ? "pass" : "fail";
}

bool collect_overrides(const CliConfig& cfg, core::CompareOverrides& overrides) {
    std::string error;
    if (!cfg.config_path.empty() && !persist::load_compare_overrides(cfg.config_path, overrides, error)) {
        LOG_SLOW_ERROR("invalid config %s: %s", cfg.config_path.string().c_str(), error.c_str());
        return false;
    }
    if (cfg.config_json && !persist::parse_compare_overrides(*cfg.config_json, overrides, error)) {
        LOG_SLOW_ERROR("invalid --config-json: %s", error.c_str());
        return false;
    }
    if (cfg.float_eps) {
        overrides.float_eps = *cfg.float_eps < 0.0 ? 0.0 : *cfg.float_eps;
    }
    if (cfg.large_output_threshold) {
        overrides.large_output_threshold = cfg.large_output_threshold;
    }
    if (cfg.token_set_limit) {
        overrides.token_set_limit = cfg.token_set_limit;
    }
    if (cfg.unicode_form) {
        const auto form = core::parse_unicode_form(*cfg.unicode_form);
        if (!form) {
            LOG_SLOW_ERROR("unknown unicode form '%s' (expected NFC, NFD, NFKC or NFKD)", cfg.unicode_form->c_str());
            return false;
        }
        overrides.unicode_form = form;
    }
    return true;
}

} // namespace

void write_report(const core::CompareResult& result, std::ostream& out) {
    out << "verdict: " << (result.passed ? "PASS" : "FAIL") << '\n';
    out << "mode: " << (result.mode_applied ? core::mode_name(*result.mode_applied) : "-") << '\n';
    out << "normalisations: " << join(result.normalisations_applied) << '\n';
    out << "reason: " << (result.reason ? *result.reason : std::string("-")) << '\n';
    for (const auto& a : result.attempts) {
        out << "attempt " << core::mode_name(a.mode) << " priority=" << a.priority
            << " outcome=" << outcome_name(a.passed) << " duration_ns=" << a.duration.count()
            << " labels=" << join(a.normalisations) << " reason=" << (a.reason ? *a.reason : std::string("-"))
            << '\n';
    }
}

int run_compare_cli(const CliConfig& cfg, std::ostream& out) {
    if (cfg.list_modes) {
        for (const auto& name : core::supported_modes(true)) {
            out << name << '\n';
        }
        return exit_pass;
    }

    if (cfg.expected_path.empty() || cfg.actual_path.empty()) {
        LOG_SLOW_ERROR("both --expected and --actual are required");
        return exit_error;
    }

    core::CompareOverrides overrides;
    if (!collect_overrides(cfg, overrides)) {
        return exit_error;
    }

    std::string expected;
    std::string actual;
    if (!read_file(cfg.expected_path, expected) || !read_file(cfg.actual_path, actual)) {
        return exit_error;
    }

    std::optional<core::ComparisonMode> mode;
    if (cfg.mode) {
        mode = core::resolve_mode(*cfg.mode);
        if (*mode == core::ComparisonMode::Auto) {
            LOG_SLOW_INFO("mode '%s' resolved to AUTO", cfg.mode->c_str());
        }
    }

    const core::CompareResult result =
        core::compare(expected, actual, core::default_compare_config(), mode, overrides);
    if (!cfg.quiet) {
        write_report(result, out);
    }
    return result.passed ? exit_pass : exit_fail;
}

} // namespace api
