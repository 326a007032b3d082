#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

// Relays callbacks from any thread to the thread that owns a window.
// Enqueue() may be called from any thread. Drain() runs only on the owning
// thread, in response to the wake signal.
class DispatchQueue {
public:
    using Task   = std::function<void()>;
    using WakeFn = std::function<void()>;

    // `wake` is called after every Enqueue() to tell the owning thread
    // that work is pending (e.g. posts a thread message).
    explicit DispatchQueue(WakeFn wake = nullptr);

    void Enqueue(Task task);

    // Run every task queued before this call, in order. Tasks queued by a
    // running task wait for the next drain. Returns the number of tasks run.
    size_t Drain();

    // Drop all pending tasks without running them. Returns the number dropped.
    size_t Discard();

    size_t Pending() const;

private:
    WakeFn             m_wake;
    mutable std::mutex m_mutex;
    std::vector<Task>  m_tasks;

    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;
};
