#include "window_registry.h"

#include <mutex>

void WindowRegistry::Register(WindowHandle handle, WindowController* window) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_windows[handle] = window;
}

WindowController* WindowRegistry::Lookup(WindowHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_windows.find(handle);
    return it != m_windows.end() ? it->second : nullptr;
}

bool WindowRegistry::Remove(WindowHandle handle) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_windows.erase(handle) > 0;
}

size_t WindowRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_windows.size();
}
