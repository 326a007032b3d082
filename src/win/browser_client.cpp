#include "browser_client.h"
#include "shared/log.h"
#include "shared/version.h"

#include "include/cef_browser.h"

#include <utility>

// Prefix used by the channel script to send messages via console.log
static const char* MESSAGE_PREFIX = "__webview2__:";
static const size_t MESSAGE_PREFIX_LEN = 13;

// Gives pages the window.chrome.webview.postMessage() entry point that
// WebView2API.send() expects. Runs before any other init script.
static const std::string s_channelScript = R"JS(
(function() {
    'use strict';
    window.chrome = window.chrome || {};
    if (window.chrome.webview) return;
    window.chrome.webview = {
        postMessage: function(message) {
            if (typeof message !== 'string') message = JSON.stringify(message);
            console.log('__webview2__:' + message);
        }
    };
})();
)JS";

BrowserClient::BrowserClient(bool debug, MessageCallback onMessage)
    : m_debug(debug)
    , m_relay(std::move(onMessage)) {
    m_initScripts.push_back(s_channelScript);
    m_closedEvent = CreateEventW(nullptr, TRUE, FALSE, nullptr);
}

BrowserClient::~BrowserClient() {
    if (m_closedEvent) {
        CloseHandle(m_closedEvent);
    }
}

void BrowserClient::Detach() {
    m_relay.Detach();
}

void BrowserClient::Navigate(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_browser) {
        m_pendingUrl = url;
        return;
    }
    m_browser->GetMainFrame()->LoadURL(url);
}

void BrowserClient::AddInitScript(const std::string& script) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_initScripts.push_back(script);
}

void BrowserClient::ExecuteJavaScript(const std::string& code) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_browser) {
        m_pendingScripts.push_back(code);
        return;
    }
    CefRefPtr<CefFrame> frame = m_browser->GetMainFrame();
    if (frame) {
        frame->ExecuteJavaScript(code, frame->GetURL(), 0);
    }
}

void BrowserClient::Focus() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_browser) {
        m_pendingFocus = true;
        return;
    }
    m_browser->GetHost()->SetFocus(true);
}

void BrowserClient::FitToParent() {
    CefRefPtr<CefBrowser> browser = GetBrowser();
    if (!browser) return;

    HWND child = browser->GetHost()->GetWindowHandle();
    if (!child || !m_parent) return;

    RECT bounds = {};
    GetClientRect(m_parent, &bounds);
    SetWindowPos(child, nullptr, bounds.left, bounds.top,
                 bounds.right - bounds.left, bounds.bottom - bounds.top,
                 SWP_NOZORDER | SWP_NOACTIVATE);
}

bool BrowserClient::NotifyMoveOrResizeStarted() {
    CefRefPtr<CefBrowser> browser = GetBrowser();
    if (!browser) return false;
    browser->GetHost()->NotifyMoveOrResizeStarted();
    return true;
}

void BrowserClient::CloseBrowser() {
    CefRefPtr<CefBrowser> browser;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closing) return;
        m_closing = true;
        // Still being created: OnAfterCreated closes it
        if (!m_browser) return;
        browser = m_browser;
    }
    browser->GetHost()->CloseBrowser(true);
}

bool BrowserClient::WaitForClose(DWORD timeoutMs) {
    if (!m_closedEvent) return false;

    // CEF's UI thread may send messages to the parent window while the
    // child browser window is torn down, so keep this thread's queue moving
    ULONGLONG deadline = GetTickCount64() + timeoutMs;
    bool quitSeen = false;
    int quitCode = 0;
    bool closed = false;
    for (;;) {
        ULONGLONG now = GetTickCount64();
        if (now >= deadline) break;

        DWORD wait = MsgWaitForMultipleObjects(1, &m_closedEvent, FALSE,
            static_cast<DWORD>(deadline - now), QS_ALLINPUT);
        if (wait == WAIT_OBJECT_0) {
            closed = true;
            break;
        }
        if (wait != WAIT_OBJECT_0 + 1) break;

        MSG msg;
        while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE)) {
            if (msg.message == WM_QUIT) {
                quitSeen = true;
                quitCode = static_cast<int>(msg.wParam);
                continue;
            }
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
    }

    // Leave a quit request for the caller's own loop
    if (quitSeen) {
        PostQuitMessage(quitCode);
    }

    if (!closed) {
        Log::Writef(Log::LOGL_WARNING, WEBVIEW_NAME,
            "Browser did not close within %lu ms.", timeoutMs);
    }
    return closed;
}

CefRefPtr<CefBrowser> BrowserClient::GetBrowser() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_browser;
}

// ---- CefContextMenuHandler ----

void BrowserClient::OnBeforeContextMenu(CefRefPtr<CefBrowser> /*browser*/,
                                        CefRefPtr<CefFrame> /*frame*/,
                                        CefRefPtr<CefContextMenuParams> /*params*/,
                                        CefRefPtr<CefMenuModel> model) {
    if (!m_debug) {
        model->Clear();
    }
}

// ---- CefDisplayHandler ----

bool BrowserClient::OnConsoleMessage(CefRefPtr<CefBrowser> /*browser*/,
                                     cef_log_severity_t /*level*/,
                                     const CefString& message,
                                     const CefString& /*source*/,
                                     int /*line*/) {
    std::string msg = message.ToString();

    // Check for channel prefix
    if (msg.size() >= MESSAGE_PREFIX_LEN &&
        msg.compare(0, MESSAGE_PREFIX_LEN, MESSAGE_PREFIX) == 0) {
        if (!m_relay.Deliver(msg.substr(MESSAGE_PREFIX_LEN))) {
            Log::Write(Log::LOGL_DEBUG, WEBVIEW_NAME, "Page message after detach dropped.");
        }
        return true; // Suppress from CEF console output
    }

    // Normal console.log, let it pass through
    return false;
}

// ---- CefKeyboardHandler ----

bool BrowserClient::OnPreKeyEvent(CefRefPtr<CefBrowser> browser,
                                  const CefKeyEvent& event,
                                  CefEventHandle /*os_event*/,
                                  bool* /*is_keyboard_shortcut*/) {
    if (m_debug && event.type == KEYEVENT_RAWKEYDOWN && event.windows_key_code == VK_F12) {
        ShowDevTools(browser);
        return true;
    }
    return false;
}

void BrowserClient::ShowDevTools(CefRefPtr<CefBrowser> browser) {
    CefWindowInfo windowInfo;
    windowInfo.SetAsPopup(nullptr, "DevTools");

    CefBrowserSettings settings;
    browser->GetHost()->ShowDevTools(windowInfo, nullptr, settings, CefPoint());
}

// ---- CefLifeSpanHandler ----

void BrowserClient::OnAfterCreated(CefRefPtr<CefBrowser> browser) {
    std::string url;
    std::vector<std::string> scripts;
    bool focus = false;
    bool closeNow = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Popups opened by the page share this client; only the first browser is ours
        if (m_browser) return;
        m_browser = browser;
        closeNow = m_closing;
        url.swap(m_pendingUrl);
        scripts.swap(m_pendingScripts);
        focus = m_pendingFocus;
        m_pendingFocus = false;
    }

    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME,
        "Browser created (id=%d).", browser->GetIdentifier());

    if (closeNow) {
        browser->GetHost()->CloseBrowser(true);
        return;
    }

    FitToParent();

    CefRefPtr<CefFrame> frame = browser->GetMainFrame();
    if (!url.empty()) {
        frame->LoadURL(url);
    }
    for (const auto& code : scripts) {
        frame->ExecuteJavaScript(code, frame->GetURL(), 0);
    }
    if (focus) {
        browser->GetHost()->SetFocus(true);
    }
}

void BrowserClient::OnBeforeClose(CefRefPtr<CefBrowser> browser) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_browser && m_browser->IsSame(browser)) {
        m_browser = nullptr;
        Log::Write(Log::LOGL_INFO, WEBVIEW_NAME, "Browser closed.");
        if (m_closedEvent) {
            SetEvent(m_closedEvent);
        }
    }
}

// ---- CefLoadHandler ----

void BrowserClient::OnLoadStart(CefRefPtr<CefBrowser> /*browser*/,
                                CefRefPtr<CefFrame> frame,
                                TransitionType /*transition_type*/) {
    if (!frame->IsMain()) return;

    std::vector<std::string> scripts;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        scripts = m_initScripts;
    }

    for (const auto& script : scripts) {
        frame->ExecuteJavaScript(script, frame->GetURL(), 0);
    }

    Log::Writef(Log::LOGL_DEBUG, WEBVIEW_NAME,
        "Injected %zu init script(s).", scripts.size());
}
