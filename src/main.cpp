// SPDX-License-Identifier: MIT
// Program entry point.
// Copyright (C) 2020 Artem Senichev <artemsen@gmail.com>

#include "application.hpp"
#include "buildconf.hpp"
#include "config.hpp"

#include <getopt.h>
#include <sysexits.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <string>
#include <tuple>
#include <vector>

/** Command line arguments. */
struct cmdarg {
    const char short_opt; ///< Short option character
    const char* long_opt; ///< Long option name
    const char* format;   ///< Format description
    const char* help;     ///< Help string
};
static constexpr std::array arguments = std::to_array<cmdarg>({
    { 's', "source",    "DIR",   "path to the directory being monitored"            },
    { 't', "target",    "DIR",   "path to the target directory for compressed files" },
    { 'l', "log-dir",   "DIR",   "path to the directory for log files"              },
    { 'L', "log-level", "LEVEL", "minimum log level for the events being logged"    },
    { 'v', "version",   nullptr, "print version info and exit"                      },
    { 'h', "help",      nullptr, "print this help and exit"                         },
});

/**
 * Get short and long options in getopt format.
 * @return short and long options in getopt format.
 */
static std::tuple<std::string, std::vector<option>> get_opts()
{
    std::string short_opts;
    short_opts.reserve(arguments.size() * 2);
    std::vector<option> long_opts;
    long_opts.reserve(arguments.size() + 1);

    // fill options
    for (auto& it : arguments) {
        short_opts += it.short_opt;
        if (it.format) {
            short_opts += ':';
        }
        long_opts.push_back({
            it.long_opt,
            it.format ? required_argument : no_argument,
            nullptr,
            it.short_opt,
        });
    }
    long_opts.push_back({});

    return std::make_tuple(short_opts, long_opts);
}

/**
 * Print usage info.
 */
static void print_help()
{
    puts("Usage: " APP_NAME " [OPTION]...");
    puts("Monitor files in a directory and send them to another directory "
         "compressed.\n");
    puts("Mandatory arguments to long options are mandatory for short options "
         "too.");

    for (auto& it : arguments) {
        std::string lopt;
        if (it.format) {
            lopt = std::format("{}={}", it.long_opt, it.format);
        } else {
            lopt = it.long_opt;
        }
        printf("  -%c, --%-16s %s\n", it.short_opt, lopt.c_str(), it.help);
    }

    puts("\nOptions not set in command line are read from environment:");
    printf("  %s, %s, %s, %s\n", ENV_SOURCE_DIR, ENV_TARGET_DIR, ENV_LOG_DIR,
           ENV_LOG_LEVEL);
}

/**
 * Print version info.
 */
static void print_version()
{
    puts(APP_NAME " version " APP_VERSION ".");
}

/**
 * Application entry point.
 */
int main(int argc, char* argv[])
{
    StartupParams params;

    // parse options
    int opt;
    const auto [short_opts, long_opts] = get_opts();
    while ((opt = getopt_long(argc, argv, short_opts.c_str(), long_opts.data(),
                              nullptr)) != -1) {
        switch (opt) {
            case 's':
                params.source = optarg;
                break;
            case 't':
                params.target = optarg;
                break;
            case 'l':
                params.log_dir = optarg;
                break;
            case 'L':
                params.log_level = optarg;
                break;
            case 'v':
                print_version();
                return EXIT_SUCCESS;
            case 'h':
                print_help();
                return EXIT_SUCCESS;
            default:
                return EX_USAGE;
        }
    }
    if (optind < argc) {
        fprintf(stderr, "Error: unexpected argument '%s'\n", argv[optind]);
        return EX_USAGE;
    }

    // environment is used for options not set in command line
    params.load_env();

    Application app;
    return app.run(params);
}
