// SPDX-License-Identifier: MIT
// Events based on file descriptor.
// Copyright (C) 2025 Artem Senichev <artemsen@gmail.com>

#include "fdevent.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>

Fd::~Fd()
{
    if (fd != -1) {
        close(fd);
    }
}

FdEvent::FdEvent()
{
    fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
}

void FdEvent::set()
{
    const uint64_t value = 1;
    ssize_t len;
    do {
        len = write(fd, &value, sizeof(value));
    } while (len == -1 && errno == EINTR);
}

void FdEvent::reset()
{
    uint64_t value;
    ssize_t len;
    do {
        len = read(fd, &value, sizeof(value));
    } while (len == -1 && errno == EINTR);
}
