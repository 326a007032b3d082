#pragma once

#include "core/browser.h"
#include "browser_client.h"

#include "include/cef_request_context.h"

#include <string>

// Browser implementation backed by a windowed (child) CEF browser.
class ChromiumBrowser : public Browser {
public:
    using MessageCallback = BrowserClient::MessageCallback;

    // `onMessage` receives every string page content posts through
    // window.chrome.webview.postMessage(). Called on the CEF UI thread.
    ChromiumBrowser(bool debug, const std::string& dataPath, MessageCallback onMessage);
    ~ChromiumBrowser() override;

    // Browser
    bool Embed(WindowHandle parent) override;
    void Resize() override;
    void Navigate(const std::string& url) override;
    void Init(const std::string& script) override;
    void Eval(const std::string& script) override;
    bool NotifyParentWindowPositionChanged() override;
    void Focus() override;

    // Stop page messages, close the CEF browser and wait for it to be gone.
    // Called on the window's thread before the parent window goes away.
    void Close();

private:
    CefRefPtr<CefRequestContext> CreateRequestContext() const;

    std::string              m_dataPath;
    bool                     m_embedded = false;
    CefRefPtr<BrowserClient> m_client;
};
