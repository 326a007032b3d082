#include "dispatch_queue.h"

#include <utility>

DispatchQueue::DispatchQueue(WakeFn wake)
    : m_wake(std::move(wake)) {
}

void DispatchQueue::Enqueue(Task task) {
    if (!task) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push_back(std::move(task));
    }

    if (m_wake) {
        m_wake();
    }
}

size_t DispatchQueue::Drain() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.swap(m_tasks);
    }

    // Run outside the lock so a task can enqueue more work
    for (auto& task : tasks) {
        task();
    }
    return tasks.size();
}

size_t DispatchQueue::Discard() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.swap(m_tasks);
    }
    return tasks.size();
}

size_t DispatchQueue::Pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}
