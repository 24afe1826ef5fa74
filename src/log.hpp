// SPDX-License-Identifier: MIT
// Logging.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

/** Logger: writes formatted lines to the console and to a log file. */
class Log {
public:
    /** Log levels, in ascending order of severity. */
    enum class Level : uint8_t {
        Debug,
        Info,
        Warning,
        Error,
        Critical,
    };

    /**
     * Constructor.
     * @param console stream used as console sink
     */
    Log(std::ostream& console = std::cerr);

    ~Log();

    /**
     * Parse log level name (case-insensitive).
     * @param name level name: debug, info, warning/warn, error, critical/fatal
     * @return log level or nullopt if name is unknown
     */
    static std::optional<Level> parse_level(std::string_view name);

    /**
     * Get level name as it is printed in the log.
     * @param level log level
     * @return level name
     */
    static const char* level_name(const Level level);

    /**
     * Set minimal level of messages being logged.
     * @param level minimal log level
     */
    void set_level(const Level level) { min_level = level; }

    /**
     * Get minimal level of messages being logged.
     * @return minimal log level
     */
    Level level() const { return min_level; }

    /**
     * Open file sink: creates a new log file inside the directory.
     * @param dir path to the log directory, created if not exists
     * @return true if file sink was opened
     */
    bool open(const std::filesystem::path& dir);

    /**
     * Flush and close all sinks.
     */
    void close();

    /**
     * Get path to the currently opened log file.
     * @return path to the log file, empty if file sink is not opened
     */
    const std::filesystem::path& file() const { return file_path; }

    /**
     * Print debug message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    void debug(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Debug)) {
            write(Level::Debug,
                  std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    /**
     * Print informational message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    void info(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Info)) {
            write(Level::Info,
                  std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    /**
     * Print warning message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    void warning(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Warning)) {
            write(Level::Warning,
                  std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    /**
     * Print error message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    void error(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Error)) {
            write(Level::Error,
                  std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    /**
     * Print error message.
     * @param code system error code
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    void error(int code, const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Error)) {
            write(Level::Error,
                  with_code(code, std::vformat(fmt.get(),
                                               std::make_format_args(args...))));
        }
    }

    /**
     * Print critical error message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    void critical(const std::format_string<Args...> fmt, Args&&... args)
    {
        write(Level::Critical,
              std::vformat(fmt.get(), std::make_format_args(args...)));
    }

private:
    /**
     * Check if messages of specified level are logged.
     * @param level message level
     * @return true if message should be written
     */
    bool enabled(const Level level) const { return level >= min_level; }

    /**
     * Append system error description to the message.
     * @param code system error code
     * @param msg message text
     * @return message with error description
     */
    static std::string with_code(int code, std::string msg);

    /**
     * Write message to all sinks.
     * @param level message level
     * @param msg message text
     */
    void write(const Level level, const std::string& msg);

private:
    Level min_level = Level::Info; ///< Minimal level of logged messages
    std::ostream& console;         ///< Console sink
    std::ofstream file_sink;       ///< File sink
    std::filesystem::path file_path; ///< Path to the log file
    std::mutex mutex;              ///< Sinks access mutex
};
