// SPDX-License-Identifier: MIT
// Logging.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <utility>

/** Level names as they are used in configuration. */
static constexpr std::pair<std::string_view, Log::Level> level_names[] = {
    { "debug",    Log::Level::Debug    },
    { "info",     Log::Level::Info     },
    { "warning",  Log::Level::Warning  },
    { "warn",     Log::Level::Warning  },
    { "error",    Log::Level::Error    },
    { "critical", Log::Level::Critical },
    { "fatal",    Log::Level::Critical },
};

/**
 * Format current UTC time.
 * @param fmt strftime format
 * @return formatted time and milliseconds of the current second
 */
static std::pair<std::string, unsigned> utc_now(const char* fmt)
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t tt = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count() %
        1000;

    std::tm tm;
    gmtime_r(&tt, &tm);

    char buf[64];
    const size_t len = std::strftime(buf, sizeof(buf), fmt, &tm);

    return { std::string(buf, len), static_cast<unsigned>(ms) };
}

Log::Log(std::ostream& console)
    : console(console)
{
}

Log::~Log()
{
    close();
}

std::optional<Log::Level> Log::parse_level(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    for (const auto& [key, level] : level_names) {
        if (key == lower) {
            return level;
        }
    }
    return std::nullopt;
}

const char* Log::level_name(const Level level)
{
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
        case Level::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

bool Log::open(const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        error(ec.value(), "Unable to open a log directory \"{}\"",
              dir.string());
        return false;
    }

    const std::filesystem::path path =
        dir / std::format("log_{}.txt", utc_now("%Y%m%d_%H%M%S").first);

    std::unique_lock lock(mutex);
    file_sink.open(path, std::ios::out | std::ios::app);
    if (!file_sink.is_open()) {
        const int code = errno;
        lock.unlock();
        error(code, "Unable to open a log file \"{}\"", path.string());
        return false;
    }
    file_path = path;

    return true;
}

void Log::close()
{
    std::lock_guard lock(mutex);
    console.flush();
    if (file_sink.is_open()) {
        file_sink.flush();
        file_sink.close();
    }
}

std::string Log::with_code(int code, std::string msg)
{
    if (code) {
        msg += std::format(", error code [{}] {}", code, std::strerror(code));
    }
    return msg;
}

void Log::write(const Level level, const std::string& msg)
{
    const auto [stamp, ms] = utc_now("%Y-%m-%d %H:%M:%S");
    const std::string line =
        std::format("{},{:03} | {:<8} | {}\n", stamp, ms, level_name(level), msg);

    std::lock_guard lock(mutex);
    console << line;
    if (file_sink.is_open()) {
        file_sink << line;
        file_sink.flush();
    }
}
