#include "chromium_browser.h"
#include "shared/log.h"
#include "shared/version.h"

#include "include/cef_browser.h"

#include <utility>

// CefShutdown() requires every browser to have reached OnBeforeClose
static const DWORD CLOSE_TIMEOUT_MS = 5000;

ChromiumBrowser::ChromiumBrowser(bool debug, const std::string& dataPath, MessageCallback onMessage)
    : m_dataPath(dataPath)
    , m_client(new BrowserClient(debug, std::move(onMessage))) {
}

ChromiumBrowser::~ChromiumBrowser() {
    Close();
}

bool ChromiumBrowser::Embed(WindowHandle parent) {
    HWND hwnd = reinterpret_cast<HWND>(parent);
    m_client->SetParentWindow(hwnd);

    RECT bounds = {};
    GetClientRect(hwnd, &bounds);

    CefWindowInfo windowInfo;
    windowInfo.SetAsChild(hwnd, CefRect(0, 0,
        bounds.right - bounds.left, bounds.bottom - bounds.top));

    CefBrowserSettings settings;

    // Created asynchronously on the CEF UI thread. Requests made until
    // OnAfterCreated are held by the client.
    bool result = CefBrowserHost::CreateBrowser(
        windowInfo, m_client, "about:blank", settings, nullptr, CreateRequestContext());

    if (!result) {
        Log::Write(Log::LOGL_CRITICAL, WEBVIEW_NAME,
            "CreateBrowser failed. Is the CEF runtime initialized?");
        return false;
    }

    m_embedded = true;
    Log::Write(Log::LOGL_DEBUG, WEBVIEW_NAME,
        "Browser creation requested (async). Waiting for OnAfterCreated...");
    return true;
}

void ChromiumBrowser::Resize() {
    m_client->FitToParent();
}

void ChromiumBrowser::Navigate(const std::string& url) {
    m_client->Navigate(url);
}

void ChromiumBrowser::Init(const std::string& script) {
    m_client->AddInitScript(script);
}

void ChromiumBrowser::Eval(const std::string& script) {
    m_client->ExecuteJavaScript(script);
}

bool ChromiumBrowser::NotifyParentWindowPositionChanged() {
    return m_client->NotifyMoveOrResizeStarted();
}

void ChromiumBrowser::Focus() {
    m_client->Focus();
}

void ChromiumBrowser::Close() {
    // No page message may reach the owner once this returns
    m_client->Detach();

    if (!m_embedded) return;
    m_embedded = false;

    m_client->CloseBrowser();
    m_client->WaitForClose(CLOSE_TIMEOUT_MS);
}

CefRefPtr<CefRequestContext> ChromiumBrowser::CreateRequestContext() const {
    // Empty data path shares the global context (root cache path)
    if (m_dataPath.empty()) return nullptr;

    CefRequestContextSettings settings;
    CefString(&settings.cache_path).FromString(m_dataPath);
    return CefRequestContext::CreateContext(settings, nullptr);
}
