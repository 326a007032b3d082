#pragma once

#include "core/dispatch_queue.h"
#include "core/rpc_bridge.h"
#include "core/webview_options.h"
#include "core/window_controller.h"
#include "core/window_registry.h"

#include <windows.h>

#include <memory>
#include <string>

class ChromiumBrowser;

// A native window hosting one CEF browser.
//
// Must be created, run and destroyed on the same thread (the UI thread).
// Dispatch() and PostWebMessage() may be called from any thread.
class Webview : private WindowOps {
public:
    // Create the window and embed the browser. Returns nullptr on failure.
    // `registry` must outlive the webview.
    static std::unique_ptr<Webview> New(WindowRegistry& registry, const WebviewOptions& options);

    ~Webview() override;

    // Run the message loop until the window is destroyed or Terminate() is called.
    void Run();

    // Stop Run(). UI thread only; use Dispatch() from other threads.
    void Terminate();

    // Native window handle (HWND).
    void* Window() const { return m_hwnd; }

    void Navigate(const std::string& url);
    void SetTitle(const std::string& title);
    void SetSize(int width, int height, SizeHint hint);

    // Script run on every page load before the page's own scripts.
    void Init(const std::string& js);

    // Evaluate script in the current page. UI thread only.
    void Eval(const std::string& js);

    // Schedule `task` on the UI thread.
    void Dispatch(DispatchQueue::Task task);

    // Deliver `message` to the page as a window "message" event.
    bool PostWebMessage(const std::string& message);

private:
    Webview(WindowRegistry& registry, const WebviewOptions& options);

    bool Create();
    bool CreateNativeWindow();
    void Wake();

    static LRESULT CALLBACK WndProc(HWND hwnd, UINT msg, WPARAM wp, LPARAM lp);

    // WindowOps
    void FocusWindow() override;
    void DestroyWindow() override;
    void PostQuit() override;
    void SetResizable(bool resizable) override;
    void SetClientSize(int width, int height) override;

    WebviewOptions                    m_options;
    WindowRegistry&                   m_registry;
    DWORD                             m_mainThread;
    HWND                              m_hwnd = nullptr;
    DispatchQueue                     m_queue;
    std::unique_ptr<ChromiumBrowser>  m_browser;
    std::unique_ptr<RpcBridge>        m_bridge;
    std::unique_ptr<WindowController> m_controller;

    Webview(const Webview&) = delete;
    Webview& operator=(const Webview&) = delete;
};
