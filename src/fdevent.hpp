// SPDX-License-Identifier: MIT
// Events based on file descriptor.
// Copyright (C) 2025 Artem Senichev <artemsen@gmail.com>

#pragma once

/** Base class for file descriptors: closes descriptor on destruction. */
class Fd {
public:
    Fd() = default;
    Fd(int d)
        : fd(d) { };

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    /** Destructor. */
    virtual ~Fd();

    /** Cast to native file descriptor. */
    operator int() const { return fd; }

    /** Check if descriptor is open. */
    bool valid() const { return fd != -1; }

    int fd = -1; ///< File descriptor
};

/** eventfd wrapper, safe to set from signal handler. */
class FdEvent : public Fd {
public:
    /** Constructor: create eventfd file descriptor. */
    FdEvent();

    /** Set event. */
    void set();

    /** Reset event. */
    void reset();
};
