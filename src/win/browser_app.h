#pragma once

#include "include/cef_app.h"

// CefApp implementation for the browser process and the helper processes
// CEF launches from the same executable.
class BrowserApp : public CefApp,
                   public CefBrowserProcessHandler {
public:
    explicit BrowserApp(bool debug = false) : m_debug(debug) {}

    // CefApp
    CefRefPtr<CefBrowserProcessHandler> GetBrowserProcessHandler() override {
        return this;
    }

    void OnBeforeCommandLineProcessing(
        const CefString& process_type,
        CefRefPtr<CefCommandLine> command_line) override;

    // CefBrowserProcessHandler
    void OnContextInitialized() override;

private:
    bool m_debug;

    IMPLEMENT_REFCOUNTING(BrowserApp);
    DISALLOW_COPY_AND_ASSIGN(BrowserApp);
};
