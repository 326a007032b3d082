#pragma once

#include "window_types.h"

class Browser;
class DispatchQueue;
class WindowRegistry;

// OS window events the controller routes. The platform window procedure
// translates native messages into these.
enum class WindowEvent {
    Move,
    Moving,
    NcLeftButtonDown,
    Size,
    Activate,
    Close,
    Destroy,
    GetMinMaxInfo,
    Other,
};

// Size constraints filled in for a GetMinMaxInfo query.
struct MinMaxInfo {
    Point maxSize;
    Point maxTrackSize;
    Point minTrackSize;
};

// Operations the controller performs on its native window.
class WindowOps {
public:
    virtual ~WindowOps() = default;

    virtual void FocusWindow() = 0;
    virtual void DestroyWindow() = 0;
    virtual void PostQuit() = 0;
    virtual void SetResizable(bool resizable) = 0;
    virtual void SetClientSize(int width, int height) = 0;
};

// Routes OS events for one window to default handling, the embedded browser,
// or teardown, and holds the window's size hints.
class WindowController {
public:
    WindowController(WindowHandle handle,
                     Browser& browser,
                     WindowOps& ops,
                     DispatchQueue& queue,
                     WindowRegistry& registry,
                     bool autoFocus);

    // Returns true if the event was consumed. False means the caller must
    // pass it on to default OS processing.
    // `deactivating` is only read for Activate, `minMax` only for GetMinMaxInfo.
    bool HandleEvent(WindowEvent event, bool deactivating = false, MinMaxInfo* minMax = nullptr);

    void SetSize(int width, int height, SizeHint hint);

    WindowHandle GetHandle() const { return m_handle; }
    Point GetMinSize() const { return m_minSize; }
    Point GetMaxSize() const { return m_maxSize; }
    bool IsDestroyed() const { return m_destroyed; }

private:
    void ApplyMinMax(MinMaxInfo& info) const;
    void OnDestroyed();

    WindowHandle    m_handle;
    Browser&        m_browser;
    WindowOps&      m_ops;
    DispatchQueue&  m_queue;
    WindowRegistry& m_registry;
    bool            m_autoFocus;
    bool            m_destroyed = false;
    Point           m_minSize;
    Point           m_maxSize;
};
