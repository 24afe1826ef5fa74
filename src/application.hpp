// SPDX-License-Identifier: MIT
// Daemon application: startup validation, main loop and shutdown.
// Copyright (C) 2024 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "config.hpp"
#include "log.hpp"
#include "terminator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>

class Application {
public:
    /** Application lifecycle states. */
    enum class State : uint8_t {
        Validating, ///< Checking configuration
        Running,    ///< Watching for new files
        Draining,   ///< Waiting for in-flight files
        Stopped,    ///< Terminated
    };

    /** Interval of termination flag checks. */
    static constexpr std::chrono::milliseconds POLL_INTERVAL =
        std::chrono::seconds(1);

    /**
     * Constructor.
     * @param console stream for log messages
     * @param errors stream for startup error messages
     */
    Application(std::ostream& console = std::cerr,
                std::ostream& errors = std::cerr);

    /**
     * Run the application: blocks until termination signal.
     * @param params startup parameters
     * @return exit code
     */
    int run(const StartupParams& params);

    /**
     * Exit from application, same as receiving a termination signal.
     * @param signum signal number
     */
    void exit(const int signum);

    /**
     * Get current lifecycle state.
     * @return application state
     */
    State state() const { return current; }

private:
    Log log;                  ///< Logger
    std::ostream& errors;     ///< Startup errors output
    Terminator terminator;    ///< Termination signals handler
    std::atomic<State> current = State::Validating; ///< Lifecycle state
};
