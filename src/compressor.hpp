// SPDX-License-Identifier: MIT
// File event handler: mirrors created files as gzip archives.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "config.hpp"
#include "fsmonitor.hpp"
#include "log.hpp"

/** Handler of file creation events. Safe to call from multiple threads. */
class Compressor {
public:
    /**
     * Constructor.
     * @param config daemon configuration
     * @param log logger instance
     */
    Compressor(const WatchConfig& config, Log& log);

    /**
     * Compress created file into the target tree.
     * Errors are logged and never propagated.
     * @param event file creation event
     * @return true if compressed file was created
     */
    bool handle(const FileEvent& event) const;

private:
    const WatchConfig& config;
    Log& log;
};
