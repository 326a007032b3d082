#include "window_controller.h"
#include "browser.h"
#include "dispatch_queue.h"
#include "window_registry.h"
#include "shared/log.h"
#include "shared/version.h"

WindowController::WindowController(WindowHandle handle,
                                   Browser& browser,
                                   WindowOps& ops,
                                   DispatchQueue& queue,
                                   WindowRegistry& registry,
                                   bool autoFocus)
    : m_handle(handle)
    , m_browser(browser)
    , m_ops(ops)
    , m_queue(queue)
    , m_registry(registry)
    , m_autoFocus(autoFocus) {
}

bool WindowController::HandleEvent(WindowEvent event, bool deactivating, MinMaxInfo* minMax) {
    switch (event) {
        case WindowEvent::Move:
        case WindowEvent::Moving:
            m_browser.NotifyParentWindowPositionChanged();
            return true;

        case WindowEvent::NcLeftButtonDown:
            // Take focus back from the browser, then let the OS start the drag
            m_ops.FocusWindow();
            return false;

        case WindowEvent::Size:
            m_browser.Resize();
            return true;

        case WindowEvent::Activate:
            if (!deactivating && m_autoFocus) {
                m_browser.Focus();
            }
            return true;

        case WindowEvent::Close:
            m_ops.DestroyWindow();
            return true;

        case WindowEvent::Destroy:
            OnDestroyed();
            return true;

        case WindowEvent::GetMinMaxInfo:
            if (minMax) {
                ApplyMinMax(*minMax);
            }
            return true;

        case WindowEvent::Other:
            break;
    }
    return false;
}

void WindowController::SetSize(int width, int height, SizeHint hint) {
    m_ops.SetResizable(hint != SizeHint::Fixed);

    switch (hint) {
        case SizeHint::Max:
            m_maxSize.x = width;
            m_maxSize.y = height;
            break;
        case SizeHint::Min:
            m_minSize.x = width;
            m_minSize.y = height;
            break;
        case SizeHint::None:
        case SizeHint::Fixed:
            m_ops.SetClientSize(width, height);
            m_browser.Resize();
            break;
    }
}

void WindowController::ApplyMinMax(MinMaxInfo& info) const {
    if (m_maxSize.x > 0 && m_maxSize.y > 0) {
        info.maxSize = m_maxSize;
        info.maxTrackSize = m_maxSize;
    }
    if (m_minSize.x > 0 && m_minSize.y > 0) {
        info.minTrackSize = m_minSize;
    }
}

void WindowController::OnDestroyed() {
    if (m_destroyed) return;
    m_destroyed = true;

    m_registry.Remove(m_handle);

    // Callbacks still queued for this window will never run
    size_t dropped = m_queue.Discard();
    if (dropped > 0) {
        Log::Writef(Log::LOGL_DEBUG, WEBVIEW_NAME,
            "Window destroyed with %zu pending dispatch callback(s); dropped.", dropped);
    }

    m_ops.PostQuit();
}
