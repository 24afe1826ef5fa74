// SPDX-License-Identifier: MIT
// Daemon configuration.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "config.hpp"

#include "mirror.hpp"

#include <sysexits.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

/**
 * Set value from environment variable if it is empty.
 * @param value value to fill
 * @param name name of the environment variable
 */
static void from_env(std::string& value, const char* name)
{
    if (value.empty()) {
        const char* env = std::getenv(name);
        if (env) {
            value = env;
        }
    }
}

/**
 * Convert filesystem exception to configuration error.
 * @param e filesystem exception
 * @return configuration error
 */
static ConfigError io_error(const std::filesystem::filesystem_error& e)
{
    if (e.code().value() == ELOOP) {
        return ConfigError(EX_IOERR, "Unable to resolve the paths, check "
                                     "paths for infinite loops.");
    }
    return ConfigError(EX_IOERR,
                       std::format("Unable to access directory \"{}\": {}",
                                   e.path1().string(),
                                   std::strerror(e.code().value())));
}

void StartupParams::load_env()
{
    from_env(source, ENV_SOURCE_DIR);
    from_env(target, ENV_TARGET_DIR);
    from_env(log_dir, ENV_LOG_DIR);
    from_env(log_level, ENV_LOG_LEVEL);
}

WatchConfig WatchConfig::resolve(const StartupParams& params)
{
    if (params.source.empty() || params.target.empty()) {
        throw ConfigError(EX_USAGE, "the following arguments are required: "
                                    "--source, --target");
    }

    WatchConfig cfg;

    if (!params.log_level.empty()) {
        // unknown names fall back to the default level
        cfg.log_level =
            Log::parse_level(params.log_level).value_or(Log::Level::Info);
    }

    try {
        // source directory must exist and be accessible
        cfg.source = std::filesystem::canonical(params.source);
        if (!std::filesystem::is_directory(cfg.source)) {
            throw std::filesystem::filesystem_error(
                "not a directory", cfg.source,
                std::make_error_code(std::errc::not_a_directory));
        }

        cfg.target = std::filesystem::weakly_canonical(
            std::filesystem::absolute(params.target));
        cfg.log_dir = std::filesystem::weakly_canonical(
            std::filesystem::absolute(params.log_dir.empty() ? DEFAULT_LOG_DIR
                                                             : params.log_dir));
    } catch (const std::filesystem::filesystem_error& e) {
        throw io_error(e);
    }

    // output must never be observed by the watcher
    if (is_within(cfg.target, cfg.source) ||
        is_within(cfg.log_dir, cfg.source)) {
        throw ConfigError(EX_USAGE, "target or log directory can not be a "
                                    "subdirectory of the directory being "
                                    "watched");
    }

    try {
        std::filesystem::create_directories(cfg.target);
    } catch (const std::filesystem::filesystem_error& e) {
        throw io_error(e);
    }

    return cfg;
}
