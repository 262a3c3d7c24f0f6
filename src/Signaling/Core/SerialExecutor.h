/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file SerialExecutor.h
 * @brief FIFO task queue that runs at most one task at a time
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace EntropyEngine::Core::Concurrency {
class WorkContractGroup;
}

namespace PeerRelay::Signaling {

/**
 * @brief Serialized execution context on top of a WorkContractGroup
 *
 * Tasks posted to one executor run strictly one after another in posting
 * order; different executors drain concurrently on the WorkService threads.
 * This is what gives each actor its single-threaded mailbox loop and each
 * engine its call-async queue.
 *
 * Without a group the queue is drained inline on the thread that posts into an
 * idle executor. Tasks posted from inside a running task are appended and run
 * by the same drain loop, never recursively.
 *
 * @code
 * WorkContractGroup group(1024, "Actors");
 * SerialExecutor exec(&group, "webrtc_7");
 * exec.post([] { ... });
 * @endcode
 */
class SerialExecutor {
public:
    using Task = std::function<void()>;

    explicit SerialExecutor(EntropyEngine::Core::Concurrency::WorkContractGroup* group = nullptr,
                            std::string name = "");
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * @brief Appends a task
     * @return false if the executor has been shut down (the task is dropped)
     */
    bool post(Task task);

    /**
     * @brief Refuses new tasks, drops queued ones and waits for the running task
     *
     * Safe to call from inside a task of this executor; in that case it does
     * not wait for itself.
     */
    void shutdown();

    size_t pending() const;
    bool isShutdown() const;

    /// True when called from a task currently running on this executor
    bool isCurrentThread() const;

    const std::string& name() const { return _state->name; }

private:
    // Shared with in-flight drain contracts so the executor may be destroyed
    // from inside one of its own tasks
    struct State {
        EntropyEngine::Core::Concurrency::WorkContractGroup* group = nullptr;
        std::string name;

        std::mutex mutex;
        std::condition_variable idleCv;
        std::deque<Task> queue;
        bool draining = false;
        bool shutdown = false;
        std::thread::id drainThread;
    };

    static void drain(const std::shared_ptr<State>& state);

    std::shared_ptr<State> _state;
};

} // namespace PeerRelay::Signaling
