// SPDX-License-Identifier: MIT
// Thread pool.
// Copyright (C) 2025 Artem Senichev <artemsen@gmail.com>

#include "threadpool.hpp"

#include <algorithm>

// Thread pool limits
constexpr size_t MIN_THREADS = 1;
constexpr size_t MAX_THREADS = 8;

ThreadPool::ThreadPool(const size_t threads)
{
    num_threads = threads;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        num_threads = std::max(MIN_THREADS, num_threads);
        num_threads = std::min(MAX_THREADS, num_threads);
    }
    workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::run, this);
    }
}

ThreadPool::~ThreadPool()
{
    drain();

    mutex.lock();
    stop = true;
    mutex.unlock();

    tnotify.notify_all();
    for (auto& it : workers) {
        it.join();
    }
}

void ThreadPool::wait(const size_t tid)
{
    auto completed = [this, tid]() {
        auto it =
            std::find_if(tasks.begin(), tasks.end(), [&tid](const Task& task) {
                return task.id == tid;
            });
        return it == tasks.end() && !current.contains(tid);
    };

    std::unique_lock lock(mutex);
    complete.wait(lock, completed);
}

void ThreadPool::drain()
{
    std::unique_lock lock(mutex);
    complete.wait(lock, [this]() {
        return tasks.empty() && current.empty();
    });
}

void ThreadPool::run()
{
    while (true) {
        std::unique_lock lock(mutex);
        tnotify.wait(lock, [this]() {
            return !tasks.empty() || stop;
        });
        if (tasks.empty()) {
            break; // stopped and nothing left to do
        }

        Task task = std::move(tasks.front());
        tasks.pop_front();
        current.insert(task.id);
        lock.unlock();

        task.executor();

        lock.lock();
        current.erase(task.id);
        lock.unlock();

        complete.notify_all();
    }
}
