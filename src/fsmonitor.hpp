// SPDX-License-Identifier: MIT
// File system monitor.
// Copyright (C) 2025 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "fdevent.hpp"
#include "log.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <thread>

struct inotify_event;

/** File creation event. */
struct FileEvent {
    std::filesystem::path path; ///< Absolute path to the created file
};

/** File system monitor: source of file creation events. */
class FsMonitor {
public:
    using Callback = std::function<void(const FileEvent&)>;

    virtual ~FsMonitor() = default;

    /**
     * Start watching directory tree recursively.
     * Callback is called for each created file, never for directories.
     * @param root path to the root directory
     * @param cb event handler
     * @return true if monitoring started
     */
    virtual bool subscribe(const std::filesystem::path& root,
                           const Callback& cb) = 0;

    /**
     * Stop watching, no events are delivered after return.
     */
    virtual void unsubscribe() = 0;
};

/** File system monitor based on inotify. */
class InotifyMonitor : public FsMonitor {
public:
    /**
     * Constructor.
     * @param log logger instance
     */
    InotifyMonitor(Log& log);

    ~InotifyMonitor() override;

    bool subscribe(const std::filesystem::path& root,
                   const Callback& cb) override;
    void unsubscribe() override;

private:
    /**
     * Event loop: read inotify events until stop.
     */
    void run();

    /**
     * Read and handle all pending inotify events.
     * @return false on fatal errors
     */
    bool read_events();

    /**
     * Handle inotify event.
     * @param event inotify event
     */
    void handle_event(const inotify_event* event);

    /**
     * Register directory and all its subdirectories in monitor.
     * @param dir path to the directory
     * @param dispatch true to report files already present in the tree
     * @return false if the directory can not be watched
     */
    bool add_tree(const std::filesystem::path& dir, const bool dispatch);

    /**
     * Unregister directory and all its subdirectories.
     * @param dir path to the directory moved out of the tree
     */
    void remove_tree(const std::filesystem::path& dir);

    /**
     * Register single directory in monitor.
     * @param dir path to the directory
     * @return false if the directory can not be watched
     */
    bool add_watch(const std::filesystem::path& dir);

    /**
     * Pass file event to the handler.
     * @param path path to the created file
     */
    void dispatch(const std::filesystem::path& path);

private:
    Log& log;         ///< Logger
    int fd = -1;      ///< inotify file descriptor
    Callback handler; ///< Event handler
    FdEvent stop;     ///< Stop event
    std::thread thread; ///< Event loop thread

    /** Watch descriptors linked to path. */
    std::map<int, std::filesystem::path> watch;

    /** Created files that are still open for writing. */
    std::set<std::filesystem::path> pending;
};
