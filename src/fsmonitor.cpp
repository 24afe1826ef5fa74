// SPDX-License-Identifier: MIT
// File system monitor.
// Copyright (C) 2025 Artem Senichev <artemsen@gmail.com>

#include "fsmonitor.hpp"

#include "mirror.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <ranges>

/**
 * Check if path is a regular file, symbolic links are not followed.
 * @param path path to check
 * @return true if path is a regular file
 */
static bool is_regular(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::symlink_status(path, ec).type() ==
        std::filesystem::file_type::regular;
}

/**
 * Get number of hard links to the file.
 * @param path path to the file
 * @return number of links, 0 on errors
 */
static uintmax_t link_count(const std::filesystem::path& path)
{
    std::error_code ec;
    const uintmax_t count = std::filesystem::hard_link_count(path, ec);
    return ec ? 0 : count;
}

// Events of interest for watched directories
constexpr uint32_t WATCH_MASK = IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO |
    IN_MOVED_FROM | IN_DELETE | IN_ONLYDIR | IN_EXCL_UNLINK;

InotifyMonitor::InotifyMonitor(Log& log)
    : log(log)
{
}

InotifyMonitor::~InotifyMonitor()
{
    unsubscribe();
}

bool InotifyMonitor::subscribe(const std::filesystem::path& root,
                               const Callback& cb)
{
    assert(fd == -1);
    assert(root.is_absolute());

    if (!stop.valid()) {
        log.error(errno, "Unable to create stop event");
        return false;
    }

    fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd == -1) {
        log.error(errno, "Unable to initialize FS monitor");
        return false;
    }

    handler = cb;
    if (!add_tree(root, false)) {
        unsubscribe();
        return false;
    }

    thread = std::thread(&InotifyMonitor::run, this);

    return true;
}

void InotifyMonitor::unsubscribe()
{
    if (thread.joinable()) {
        stop.set();
        thread.join();
        stop.reset();
    }

    if (fd != -1) {
        for (const auto& wd : std::views::keys(watch)) {
            inotify_rm_watch(fd, wd);
        }
        close(fd);
        fd = -1;
    }

    watch.clear();
    pending.clear();
    handler = nullptr;
}

void InotifyMonitor::run()
{
    pollfd fds[] = {
        { .fd = stop, .events = POLLIN, .revents = 0 },
        { .fd = fd,   .events = POLLIN, .revents = 0 },
    };

    while (true) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            log.error(errno, "Failed to poll FS events");
            break;
        }
        if (fds[0].revents & POLLIN) {
            break; // unsubscribed
        }
        if ((fds[1].revents & POLLIN) && !read_events()) {
            break;
        }
    }
}

bool InotifyMonitor::read_events()
{
    while (true) {
        alignas(inotify_event) uint8_t buffer[sizeof(inotify_event) +
                                              NAME_MAX + 1];
        const ssize_t len = read(fd, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN) {
                return true; // queue is empty
            }
            log.error(errno, "Unable to read FS events");
            return false;
        }
        ssize_t pos = 0;
        while (pos + sizeof(inotify_event) <= static_cast<size_t>(len)) {
            const inotify_event* event =
                reinterpret_cast<const inotify_event*>(&buffer[pos]);
            handle_event(event);
            pos += sizeof(inotify_event) + event->len;
        }
    }
}

void InotifyMonitor::handle_event(const inotify_event* event)
{
    if (event->mask & IN_Q_OVERFLOW) {
        log.warning("FS monitor queue overflow, some events are lost");
        return;
    }
    if (event->mask & IN_IGNORED) {
        // remove from the watch list
        watch.erase(event->wd);
        return;
    }

    const auto it = watch.find(event->wd);
    if (it == watch.end()) {
        return;
    }

    // compose full path
    std::filesystem::path path = it->second;
    if (event->len) {
        path /= event->name;
    }

    if (event->mask & IN_ISDIR) {
        if (event->mask & IN_CREATE) {
            log.debug("FSMON: Create directory {}", path.string());
            add_tree(path, true);
        } else if (event->mask & IN_MOVED_TO) {
            log.debug("FSMON: Move directory {}", path.string());
            add_tree(path, true);
        } else if (event->mask & IN_MOVED_FROM) {
            log.debug("FSMON: Move out directory {}", path.string());
            remove_tree(path);
        }
        return;
    }

    if (event->mask & IN_CREATE) {
        if (!is_regular(path)) {
            log.debug("FSMON: Skip special file {}", path.string());
        } else if (link_count(path) > 1) {
            // hard link to an existing file, nobody writes it
            log.debug("FSMON: Link {}", path.string());
            dispatch(path);
        } else {
            // wait until the writer closes the file
            log.debug("FSMON: Create {}", path.string());
            pending.insert(path);
        }
    } else if (event->mask & IN_CLOSE_WRITE) {
        if (pending.erase(path)) {
            dispatch(path);
        }
    } else if (event->mask & IN_MOVED_TO) {
        pending.erase(path);
        if (is_regular(path)) {
            log.debug("FSMON: Move {}", path.string());
            dispatch(path);
        } else {
            log.debug("FSMON: Skip special file {}", path.string());
        }
    } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
        pending.erase(path);
    }
}

bool InotifyMonitor::add_tree(const std::filesystem::path& dir,
                              const bool dispatch)
{
    // watch first, then scan: files created in between are not lost
    if (!add_watch(dir)) {
        return false;
    }

    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    for (const auto end = std::filesystem::recursive_directory_iterator();
         !ec && it != end; it.increment(ec)) {
        const std::filesystem::file_status st = it->symlink_status(ec);
        if (ec) {
            break;
        }
        if (st.type() == std::filesystem::file_type::directory) {
            add_watch(it->path());
        } else if (dispatch &&
                   st.type() == std::filesystem::file_type::regular) {
            // the file may still be open, report it again on close
            pending.insert(it->path());
            this->dispatch(it->path());
        }
    }
    if (ec) {
        log.error(ec.value(), "Unable to scan directory {}", dir.string());
    }

    return true;
}

void InotifyMonitor::remove_tree(const std::filesystem::path& dir)
{
    for (auto it = watch.begin(); it != watch.end();) {
        if (is_within(it->second, dir)) {
            inotify_rm_watch(fd, it->first);
            it = watch.erase(it);
        } else {
            ++it;
        }
    }
    std::erase_if(pending, [&dir](const std::filesystem::path& path) {
        return is_within(path, dir);
    });
}

bool InotifyMonitor::add_watch(const std::filesystem::path& dir)
{
    const int wd = inotify_add_watch(fd, dir.c_str(), WATCH_MASK);
    if (wd == -1) {
        log.error(errno, "Unable to add monitoring path {}", dir.string());
        return false;
    }

    watch.insert_or_assign(wd, dir);
    log.debug("FSMON: Watch {}", dir.string());

    return true;
}

void InotifyMonitor::dispatch(const std::filesystem::path& path)
{
    log.debug("FSMON: New file {}", path.string());
    handler(FileEvent { path });
}
