// SPDX-License-Identifier: MIT
// Watch loop: dispatching of file events to the worker pool.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "fsmonitor.hpp"
#include "log.hpp"
#include "threadpool.hpp"

/** Watch loop: passes file creation events to handlers in worker threads. */
class WatchLoop {
public:
    /**
     * Constructor.
     * @param monitor source of file events
     * @param handler file event handler, called from worker threads
     * @param log logger instance
     * @param threads number of worker threads, 0 to use number of CPUs
     */
    WatchLoop(FsMonitor& monitor, const FsMonitor::Callback& handler, Log& log,
              const size_t threads = 0);

    ~WatchLoop();

    /**
     * Start watching directory tree.
     * @param root path to the root directory
     * @return true if watching started
     */
    bool start(const std::filesystem::path& root);

    /**
     * Stop watching and wait for all dispatched handlers to complete.
     */
    void stop();

private:
    FsMonitor& monitor;            ///< Event source
    FsMonitor::Callback handler;   ///< Event handler
    Log& log;                      ///< Logger
    ThreadPool workers;            ///< Worker pool for handlers
    bool active = false;           ///< Subscription state
};
