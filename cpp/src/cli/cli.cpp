// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: формат help/errors как у clap v4
//
// ==============================================================================

#include "collector/cli.hpp"

#include "collector/platform.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

namespace collector::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// "-v", "-vv", "-vvv"...
bool is_verbose_cluster(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
    }
    return true;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: collect-files [OPTIONS] <INPUT>...\n\n"
                       "For more information, try '--help'.\n";
}

std::string render_value_error(const std::string& error_msg) {
    return error_msg + "\n\nFor more information, try '--help'.\n";
}

/// Опция со значением: "--name VALUE" или "--name=VALUE"
///
/// @return 1 - значение взято, 0 - это не эта опция, -1 - значение отсутствует
int take_value(int argc, char** argv, int& i, const char* name, const char*& value) {
    const char* arg = argv[i];
    if (str_eq(arg, name)) {
        if (i + 1 >= argc) {
            return -1;
        }
        ++i;
        value = argv[i];
        return 1;
    }
    const std::size_t len = std::strlen(name);
    if (name[1] == '-' && starts_with(arg, name) && arg[len] == '=') {
        value = arg + len + 1;
        return 1;
    }
    return 0;
}

bool parse_int(const char* text, long min_value, int& out) {
    if (*text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || v < min_value || v > INT_MAX) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool parse_megabytes(const char* text, double& out) {
    if (*text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v) || v < 0.0) {
        return false;
    }
    out = v;
    return true;
}

}  // anonymous namespace

std::optional<std::uint64_t> max_size_from_mb(double mb) {
    if (!(mb > 0.0)) {
        return std::nullopt;
    }
    const double bytes = mb * 1024.0 * 1024.0;
    // 2^64 и больше не представимы в uint64_t: насыщение
    if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return static_cast<std::uint64_t>(bytes);
}

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: collect-files [OPTIONS] <INPUT>...\n"
           "\n"
           "Arguments:\n"
           "  <INPUT>...  Input file(s) and/or directory(ies)\n"
           "\n"
           "Options:\n"
           "  -o, --output <OUTPUT>    Output file path. If a directory is given, a default file\n"
           "                           will be created inside it\n"
           "      --scale <N>          How many directory levels to go into [alias: --depth]\n"
           "                           (default: unlimited)\n"
           "      --include-hidden     Include hidden files and directories\n"
           "      --follow-symlinks    Follow symbolic links\n"
           "      --max-size <MB>      Maximum file size (in MB) to read, 0 disables the limit\n"
           "                           [default: 200]\n"
           "      --append             Append to output file if it exists\n"
           "      --encoding-report    Print encoding used for each file (best-effort)\n"
           "      --workers <N>        Reserved for parallelism (1 = sequential) [default: 1]\n"
           "      --debug-discovery    Print discovery decisions and the files that would be\n"
           "                           processed, then exit\n"
           "      --json               Print the run summary as JSON\n"
           "      --config <FILE>      Load default option values from a YAML file\n"
           "  -v, --verbose...         Print verbose output\n"
           "  -q, --quiet              Suppress informational output\n"
           "  -h, --help               Print help\n"
           "  -V, --version            Print version\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов - stderr=help, exit code=2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    CollectCommand collect;
    CollectOptions& opt = collect.options;
    ExplicitFlags& flags = collect.explicit_flags;
    bool positional_only = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (positional_only || arg[0] != '-' || str_eq(arg, "-")) {
            opt.roots.push_back(platform::path_from_utf8(arg));
            continue;
        }
        if (str_eq(arg, "--")) {
            positional_only = true;
            continue;
        }

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }

        if (is_verbose_cluster(arg)) {
            result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
            flags.verbose = true;
            continue;
        }
        if (str_eq(arg, "--verbose")) {
            result.global.verbose++;
            flags.verbose = true;
            continue;
        }
        if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
            continue;
        }
        if (str_eq(arg, "--include-hidden")) {
            opt.include_hidden = true;
            flags.include_hidden = true;
            continue;
        }
        if (str_eq(arg, "--follow-symlinks")) {
            opt.follow_symlinks = true;
            flags.follow_symlinks = true;
            continue;
        }
        if (str_eq(arg, "--append")) {
            opt.append = true;
            flags.append = true;
            continue;
        }
        if (str_eq(arg, "--encoding-report")) {
            opt.encoding_report = true;
            flags.encoding_report = true;
            continue;
        }
        if (str_eq(arg, "--debug-discovery")) {
            opt.debug_discovery = true;
            continue;
        }
        if (str_eq(arg, "--json")) {
            opt.json = true;
            continue;
        }

        // Опции со значением
        const char* value = nullptr;
        int taken = 0;
        std::string shown_name;

        if ((taken = take_value(argc, argv, i, "-o", value)) != 0 ||
            (taken = take_value(argc, argv, i, "--output", value)) != 0 ||
            (taken = take_value(argc, argv, i, "--outputs", value)) != 0) {
            shown_name = "--output <OUTPUT>";
            if (taken > 0) {
                opt.output = platform::path_from_utf8(value);
                flags.output = true;
                continue;
            }
        } else if ((taken = take_value(argc, argv, i, "--scale", value)) != 0 ||
                   (taken = take_value(argc, argv, i, "--depth", value)) != 0) {
            shown_name = "--scale <N>";
            if (taken > 0) {
                int depth = 0;
                if (!parse_int(value, 0, depth)) {
                    result.diagnostic.stderr_message = render_value_error(
                        std::string("error: invalid value '") + value +
                        "' for '--scale <N>': expected a non-negative integer");
                    return result;
                }
                opt.max_depth = depth;
                flags.depth = true;
                continue;
            }
        } else if ((taken = take_value(argc, argv, i, "--max-size", value)) != 0) {
            shown_name = "--max-size <MB>";
            if (taken > 0) {
                double mb = 0.0;
                if (!parse_megabytes(value, mb)) {
                    result.diagnostic.stderr_message = render_value_error(
                        std::string("error: invalid value '") + value +
                        "' for '--max-size <MB>': expected a non-negative number");
                    return result;
                }
                opt.max_size_bytes = max_size_from_mb(mb);
                flags.max_size = true;
                continue;
            }
        } else if ((taken = take_value(argc, argv, i, "--workers", value)) != 0) {
            shown_name = "--workers <N>";
            if (taken > 0) {
                int workers = 0;
                if (!parse_int(value, 1, workers)) {
                    result.diagnostic.stderr_message = render_value_error(
                        std::string("error: invalid value '") + value +
                        "' for '--workers <N>': expected a positive integer");
                    return result;
                }
                opt.workers = workers;
                flags.workers = true;
                continue;
            }
        } else if ((taken = take_value(argc, argv, i, "--config", value)) != 0) {
            shown_name = "--config <FILE>";
            if (taken > 0) {
                collect.config = platform::path_from_utf8(value);
                continue;
            }
        }

        if (taken < 0) {
            result.diagnostic.stderr_message = render_value_error(
                "error: a value is required for '" + shown_name + "' but none was supplied");
            return result;
        }

        // Неизвестная опция - exit code 2
        result.diagnostic.stderr_message =
            render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
        return result;
    }

    if (opt.roots.empty()) {
        result.diagnostic.stderr_message =
            render_usage_error("error: the following required arguments were not provided:\n"
                               "  <INPUT>...");
        return result;
    }

    result.ok = true;
    result.command = std::move(collect);
    return result;
}

}  // namespace collector::cli
