#pragma once

#include "window_types.h"

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

class WindowController;

// Maps native window handles to the controller that owns them, so the
// shared window procedure can route OS events to the right window.
// Owned by whoever creates windows; lookups are safe from any thread.
class WindowRegistry {
public:
    WindowRegistry() = default;

    // Associate `handle` with `window`, replacing any previous entry.
    void Register(WindowHandle handle, WindowController* window);

    // Returns nullptr when the handle is unknown.
    WindowController* Lookup(WindowHandle handle) const;

    // Returns true if an entry was removed.
    bool Remove(WindowHandle handle);

    size_t Size() const;

private:
    mutable std::shared_mutex                            m_mutex;
    std::unordered_map<WindowHandle, WindowController*> m_windows;

    WindowRegistry(const WindowRegistry&) = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;
};
