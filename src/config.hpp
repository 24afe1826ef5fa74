// SPDX-License-Identifier: MIT
// Daemon configuration.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "log.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

/** Environment variables used as defaults for startup parameters. */
constexpr const char* ENV_SOURCE_DIR = "FILES2GZ_SOURCE_DIR";
constexpr const char* ENV_TARGET_DIR = "FILES2GZ_TARGET_DIR";
constexpr const char* ENV_LOG_DIR = "FILES2GZ_LOG_DIR";
constexpr const char* ENV_LOG_LEVEL = "FILES2GZ_LOG_LEVEL";

/** Default log directory, relative to the working directory. */
constexpr const char* DEFAULT_LOG_DIR = "./logs";

/** Raw startup parameters: command line options and environment. */
struct StartupParams {
    std::string source;    ///< Directory to watch
    std::string target;    ///< Directory for compressed files
    std::string log_dir;   ///< Directory for log files
    std::string log_level; ///< Minimal log level name

    /**
     * Fill parameters that are not set from environment variables.
     */
    void load_env();
};

/** Configuration error: startup is impossible. */
class ConfigError : public std::runtime_error {
public:
    /**
     * Constructor.
     * @param code process exit code
     * @param msg error description
     */
    ConfigError(const int code, const std::string& msg)
        : std::runtime_error(msg)
        , exit_code(code)
    {
    }

    /** Get process exit code. */
    int code() const { return exit_code; }

private:
    int exit_code;
};

/** Validated configuration of the daemon, immutable after startup. */
struct WatchConfig {
    std::filesystem::path source;  ///< Canonical path to the watched directory
    std::filesystem::path target;  ///< Absolute path to the target directory
    std::filesystem::path log_dir; ///< Absolute path to the log directory
    Log::Level log_level = Log::Level::Info; ///< Minimal log level

    /**
     * Resolve and validate startup parameters, create target directory.
     * @param params startup parameters
     * @return validated configuration
     * @throw ConfigError if parameters are invalid
     */
    static WatchConfig resolve(const StartupParams& params);
};
