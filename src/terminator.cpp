// SPDX-License-Identifier: MIT
// Termination signals handler.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "terminator.hpp"

#include <poll.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <csignal>
#include <cstdint>

// Signals used to terminate the process
static constexpr int TERM_SIGNALS[] = { SIGINT, SIGTERM };

std::atomic<int> Terminator::received = 0;
std::atomic<int> Terminator::wakeup_fd = -1;

static_assert(std::atomic<int>::is_always_lock_free);

Terminator::Terminator()
{
    assert(wakeup_fd == -1);
    received = 0;
    wakeup_fd = wakeup;
}

Terminator::~Terminator()
{
    if (installed) {
        for (const int signum : TERM_SIGNALS) {
            std::signal(signum, SIG_DFL);
        }
    }
    wakeup_fd = -1;
}

bool Terminator::install()
{
    struct sigaction sa = {};
    sa.sa_handler = &Terminator::on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (const int signum : TERM_SIGNALS) {
        if (sigaction(signum, &sa, nullptr) == -1) {
            return false;
        }
    }
    installed = true;

    return true;
}

int Terminator::wait(const std::chrono::milliseconds interval)
{
    pollfd pfd = { .fd = wakeup, .events = POLLIN, .revents = 0 };

    while (received == 0) {
        if (poll(&pfd, 1, static_cast<int>(interval.count())) > 0) {
            wakeup.reset();
        }
    }

    return received;
}

void Terminator::request(const int signum)
{
    on_signal(signum);
}

const char* Terminator::signal_name(const int signum)
{
    switch (signum) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
    }
    return "unknown signal";
}

void Terminator::on_signal(int signum)
{
    const int saved_errno = errno;

    // only the first signal is recorded
    int expected = 0;
    received.compare_exchange_strong(expected, signum);

    const int fd = wakeup_fd;
    if (fd != -1) {
        const uint64_t value = 1;
        [[maybe_unused]] const ssize_t len = write(fd, &value, sizeof(value));
    }

    errno = saved_errno;
}
