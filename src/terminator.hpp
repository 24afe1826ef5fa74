// SPDX-License-Identifier: MIT
// Termination signals handler.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "fdevent.hpp"

#include <atomic>
#include <chrono>

/**
 * Termination request: set by SIGINT/SIGTERM handlers, polled by main thread.
 * Only one instance can exist at a time.
 */
class Terminator {
public:
    Terminator();

    /** Destructor: restores default signal handlers. */
    ~Terminator();

    /**
     * Install SIGINT and SIGTERM handlers.
     * @return false if handlers can not be installed (errno is set)
     */
    bool install();

    /**
     * Block until termination is requested.
     * @param interval maximum time between flag checks
     * @return number of the signal that requested termination
     */
    int wait(const std::chrono::milliseconds interval);

    /**
     * Request termination, same as receiving a signal.
     * @param signum signal number
     */
    void request(const int signum);

    /**
     * Get termination request state.
     * @return signal number or 0 if termination was not requested
     */
    int requested() const { return received; }

    /**
     * Get signal name.
     * @param signum signal number
     * @return signal name, like SIGTERM
     */
    static const char* signal_name(const int signum);

private:
    /**
     * Signal handler.
     * @param signum signal number
     */
    static void on_signal(int signum);

private:
    FdEvent wakeup;         ///< Notification for the waiting thread
    bool installed = false; ///< Signal handlers state

    /** Number of the first received signal. */
    static std::atomic<int> received;
    /** Descriptor of the wakeup event available for signal handler. */
    static std::atomic<int> wakeup_fd;
};
