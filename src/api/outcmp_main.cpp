#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>

#include "api/compare_cli.hpp"
#include "util/log.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --expected <file> --actual <file> [options]\n"
              << "       " << prog << " --list-modes\n"
              << "Options:\n"
              << "  --mode <name>           Comparison mode (default AUTO)\n"
              << "  --config <file>         JSON override bag\n"
              << "  --config-json <text>    Inline JSON override bag\n"
              << "  --float-eps <double>    Float tolerance\n"
              << "  --threshold <n>         Large-output hash threshold in code points (0 disables)\n"
              << "  --token-limit <n>       TOKEN_SET size limit in code points (0 = none)\n"
              << "  --unicode <form>        NFC, NFD, NFKC or NFKD\n"
              << "  --log-level <level>     trace, debug, info, warn, error\n"
              << "  --list-modes            Print supported modes and exit\n"
              << "  --quiet                 Only set the exit code\n";
}

bool parse_size(const char* s, std::size_t& out) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0 || s[0] == '-') {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    api::CliConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--expected" && i + 1 < argc) {
            cfg.expected_path = argv[++i];
        } else if (arg == "--actual" && i + 1 < argc) {
            cfg.actual_path = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            cfg.mode = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            cfg.config_path = argv[++i];
        } else if (arg == "--config-json" && i + 1 < argc) {
            cfg.config_json = argv[++i];
        } else if (arg == "--float-eps" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            const double eps = std::strtod(val, &end);
            if (end == val || *end != '\0') {
                print_usage(argv[0]);
                return api::exit_error;
            }
            cfg.float_eps = eps;
        } else if ((arg == "--threshold" || arg == "--token-limit") && i + 1 < argc) {
            std::size_t v = 0;
            if (!parse_size(argv[++i], v)) {
                print_usage(argv[0]);
                return api::exit_error;
            }
            if (arg == "--threshold") {
                cfg.large_output_threshold = v;
            } else {
                cfg.token_set_limit = v;
            }
        } else if (arg == "--unicode" && i + 1 < argc) {
            cfg.unicode_form = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            const auto lvl = util::parse_log_level(argv[++i]);
            if (!lvl) {
                print_usage(argv[0]);
                return api::exit_error;
            }
            util::set_log_level(*lvl);
        } else if (arg == "--list-modes") {
            cfg.list_modes = true;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else {
            print_usage(argv[0]);
            return api::exit_error;
        }
    }

    if (!cfg.list_modes && (cfg.expected_path.empty() || cfg.actual_path.empty())) {
        print_usage(argv[0]);
        return api::exit_error;
    }

    return api::run_compare_cli(cfg, std::cout);
}
