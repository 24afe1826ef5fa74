// SPDX-License-Identifier: MIT
// Watch loop: dispatching of file events to the worker pool.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "watchloop.hpp"

WatchLoop::WatchLoop(FsMonitor& monitor, const FsMonitor::Callback& handler,
                     Log& log, const size_t threads)
    : monitor(monitor)
    , handler(handler)
    , log(log)
    , workers(threads)
{
}

WatchLoop::~WatchLoop()
{
    stop();
}

bool WatchLoop::start(const std::filesystem::path& root)
{
    active = monitor.subscribe(root, [this](const FileEvent& event) {
        workers.add(handler, event);
    });
    if (active) {
        log.debug("Watch loop started with {} workers", workers.size());
    }
    return active;
}

void WatchLoop::stop()
{
    if (active) {
        monitor.unsubscribe();
        active = false;
        workers.drain();
        log.debug("Watch loop stopped");
    }
}
