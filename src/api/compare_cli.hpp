#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "core/compare_result.hpp"

namespace api {

struct CliConfig {
    std::filesystem::path expected_path{};
    std::filesystem::path actual_path{};
    std::optional<std::string> mode{};

    // Override sources, applied in order: file, inline JSON, then flags.
    std::filesystem::path config_path{};
    std::optional<std::string> config_json{};
    std::optional<double> float_eps{};
    std::optional<std::size_t> large_output_threshold{};
    std::optional<std::size_t> token_set_limit{};
    std::optional<std::string> unicode_form{};

    bool list_modes{false};
    bool quiet{false};
};

inline constexpr int exit_pass = 0;
inline constexpr int exit_fail = 1;
inline constexpr int exit_error = 2;

// Compares the two files and writes a report to out. Returns exit_pass,
// exit_fail, or exit_error on unreadable input or invalid configuration.
int run_compare_cli(const CliConfig& cfg, std::ostream& out);

// Human-readable report of one result, one attempt per line.
void write_report(const core::CompareResult& result, std::ostream& out);

} // namespace api
