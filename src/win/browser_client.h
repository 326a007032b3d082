#pragma once

#include "core/message_relay.h"

#include "include/cef_client.h"
#include "include/cef_context_menu_handler.h"
#include "include/cef_display_handler.h"
#include "include/cef_keyboard_handler.h"
#include "include/cef_life_span_handler.h"
#include "include/cef_load_handler.h"

#include <windows.h>

#include <functional>
#include <mutex>
#include <string>
#include <vector>

// CefClient for one embedded (windowed child) browser.
//
// Calls from the window's thread (Navigate, ExecuteJavaScript, ...) made
// before CEF reports the browser as created are held and replayed from
// OnAfterCreated. Page messages arrive on the CEF UI thread through
// OnConsoleMessage and stop once Detach() returns.
class BrowserClient : public CefClient,
                      public CefContextMenuHandler,
                      public CefDisplayHandler,
                      public CefKeyboardHandler,
                      public CefLifeSpanHandler,
                      public CefLoadHandler {
public:
    using MessageCallback = MessageRelay::Receiver;

    BrowserClient(bool debug, MessageCallback onMessage);
    ~BrowserClient() override;

    // Window the browser is embedded in. Set before the browser is created.
    void SetParentWindow(HWND parent) { m_parent = parent; }

    void Navigate(const std::string& url);
    void AddInitScript(const std::string& script);
    void ExecuteJavaScript(const std::string& code);
    void Focus();

    // Fit the browser window to the parent's client area.
    void FitToParent();

    // Returns false if the browser isn't created yet.
    bool NotifyMoveOrResizeStarted();

    // Stop forwarding page messages. Waits for a delivery in progress.
    void Detach();

    // Close the browser (forced), or the browser still being created once
    // it arrives. Safe to call more than once.
    void CloseBrowser();

    // Wait for OnBeforeClose, pumping this thread's messages meanwhile.
    // Returns false on timeout.
    bool WaitForClose(DWORD timeoutMs);

    CefRefPtr<CefBrowser> GetBrowser() const;

    // CefClient
    CefRefPtr<CefContextMenuHandler> GetContextMenuHandler() override { return this; }
    CefRefPtr<CefDisplayHandler> GetDisplayHandler() override { return this; }
    CefRefPtr<CefKeyboardHandler> GetKeyboardHandler() override { return this; }
    CefRefPtr<CefLifeSpanHandler> GetLifeSpanHandler() override { return this; }
    CefRefPtr<CefLoadHandler> GetLoadHandler() override { return this; }

    // CefContextMenuHandler
    void OnBeforeContextMenu(CefRefPtr<CefBrowser> browser,
                             CefRefPtr<CefFrame> frame,
                             CefRefPtr<CefContextMenuParams> params,
                             CefRefPtr<CefMenuModel> model) override;

    // CefDisplayHandler
    bool OnConsoleMessage(CefRefPtr<CefBrowser> browser,
                          cef_log_severity_t level,
                          const CefString& message,
                          const CefString& source,
                          int line) override;

    // CefKeyboardHandler
    bool OnPreKeyEvent(CefRefPtr<CefBrowser> browser,
                       const CefKeyEvent& event,
                       CefEventHandle os_event,
                       bool* is_keyboard_shortcut) override;

    // CefLifeSpanHandler
    void OnAfterCreated(CefRefPtr<CefBrowser> browser) override;
    void OnBeforeClose(CefRefPtr<CefBrowser> browser) override;

    // CefLoadHandler
    void OnLoadStart(CefRefPtr<CefBrowser> browser,
                     CefRefPtr<CefFrame> frame,
                     TransitionType transition_type) override;

private:
    void ShowDevTools(CefRefPtr<CefBrowser> browser);

    HWND            m_parent = nullptr;
    bool            m_debug;
    MessageRelay    m_relay;
    HANDLE          m_closedEvent = nullptr;

    mutable std::mutex        m_mutex;
    CefRefPtr<CefBrowser>     m_browser;
    bool                      m_closing = false;
    std::vector<std::string>  m_initScripts;

    // Requests made before OnAfterCreated
    std::string               m_pendingUrl;
    std::vector<std::string>  m_pendingScripts;
    bool                      m_pendingFocus = false;

    IMPLEMENT_REFCOUNTING(BrowserClient);
    DISALLOW_COPY_AND_ASSIGN(BrowserClient);
};
