// SPDX-License-Identifier: MIT
// Daemon application: startup validation, main loop and shutdown.
// Copyright (C) 2024 Artem Senichev <artemsen@gmail.com>

#include "application.hpp"

#include "compressor.hpp"
#include "fsmonitor.hpp"
#include "watchloop.hpp"

#include <sysexits.h>

#include <cerrno>
#include <cstdlib>

Application::Application(std::ostream& console, std::ostream& errors)
    : log(console)
    , errors(errors)
{
}

int Application::run(const StartupParams& params)
{
    current = State::Validating;

    WatchConfig config;
    try {
        config = WatchConfig::resolve(params);
    } catch (const ConfigError& e) {
        errors << "Error: " << e.what() << '\n';
        current = State::Stopped;
        return e.code();
    }

    log.set_level(config.log_level);
    if (!log.open(config.log_dir)) {
        log.warning("Log file is not available, logging to console only");
    }

    if (!terminator.install()) {
        log.critical("Unable to install signal handlers, error code [{}]",
                     errno);
        log.close();
        current = State::Stopped;
        return EX_OSERR;
    }

    Compressor compressor(config, log);
    InotifyMonitor monitor(log);
    WatchLoop loop(
        monitor,
        [&compressor](const FileEvent& event) {
            compressor.handle(event);
        },
        log);

    // start the watcher thread
    if (!loop.start(config.source)) {
        log.critical("Unable to watch directory \"{}\"",
                     config.source.string());
        log.close();
        current = State::Stopped;
        return EX_IOERR;
    }
    current = State::Running;
    log.info("File watching started in \"{}\"", config.source.string());

    // keep running until receiving signal to terminate
    const int signum = terminator.wait(POLL_INTERVAL);
    current = State::Draining;
    log.info("Received {}", Terminator::signal_name(signum));

    // no new events, wait for files being compressed
    loop.stop();

    current = State::Stopped;
    log.info("Shutting down");
    log.close();

    return EXIT_SUCCESS;
}

void Application::exit(const int signum)
{
    terminator.request(signum);
}
