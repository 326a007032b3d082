#include "webview.h"
#include "chromium_browser.h"
#include "core/bridge_script.h"
#include "shared/log.h"
#include "shared/version.h"

#include <utility>

// Posted to the UI thread when the dispatch queue has work
static const UINT WM_WEBVIEW_DISPATCH = WM_APP;

static WindowHandle ToHandle(HWND hwnd) {
    return reinterpret_cast<WindowHandle>(hwnd);
}

// Convert UTF-8 to UTF-16 (Windows MultiByteToWideChar)
static std::wstring Utf8ToWide(const std::string& str) {
    if (str.empty()) return L"";
    int size = MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()), nullptr, 0);
    if (size <= 0) return L"";
    std::wstring result(size, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()), &result[0], size);
    return result;
}

static Point ToPoint(const POINT& pt) {
    Point p;
    p.x = static_cast<int32_t>(pt.x);
    p.y = static_cast<int32_t>(pt.y);
    return p;
}

static WindowEvent ToWindowEvent(UINT msg) {
    switch (msg) {
        case WM_MOVE:          return WindowEvent::Move;
        case WM_MOVING:        return WindowEvent::Moving;
        case WM_NCLBUTTONDOWN: return WindowEvent::NcLeftButtonDown;
        case WM_SIZE:          return WindowEvent::Size;
        case WM_ACTIVATE:      return WindowEvent::Activate;
        case WM_CLOSE:         return WindowEvent::Close;
        case WM_DESTROY:       return WindowEvent::Destroy;
        case WM_GETMINMAXINFO: return WindowEvent::GetMinMaxInfo;
        default:               return WindowEvent::Other;
    }
}

std::unique_ptr<Webview> Webview::New(WindowRegistry& registry, const WebviewOptions& options) {
    std::unique_ptr<Webview> view(new Webview(registry, options));
    if (!view->Create()) {
        return nullptr;
    }
    return view;
}

Webview::Webview(WindowRegistry& registry, const WebviewOptions& options)
    : m_options(options)
    , m_registry(registry)
    , m_mainThread(GetCurrentThreadId())
    , m_queue([this]() { Wake(); }) {
}

Webview::~Webview() {
    if (m_browser) {
        m_browser->Close();
    }

    // Unregister first so teardown doesn't route through the controller
    if (m_hwnd) {
        m_registry.Remove(ToHandle(m_hwnd));
        if (IsWindow(m_hwnd)) {
            ::DestroyWindow(m_hwnd);
        }
        m_hwnd = nullptr;
    }
    m_queue.Discard();
}

bool Webview::Create() {
    // Make sure this thread has a message queue before anyone posts to it
    MSG msg;
    PeekMessageW(&msg, nullptr, 0, 0, PM_NOREMOVE);

    m_browser.reset(new ChromiumBrowser(m_options.debug, m_options.dataPath,
        [this](const std::string& message) { m_bridge->OnMessage(message); }));

    m_bridge.reset(new RpcBridge(m_queue, *m_browser));
    if (m_options.apiHandler) {
        m_bridge->SetHandler(m_options.apiHandler);
        m_browser->Init(BridgeScript::GetApiScript());
    }

    if (!CreateNativeWindow()) {
        return false;
    }

    if (!m_browser->Embed(ToHandle(m_hwnd))) {
        return false;
    }
    m_browser->Resize();
    return true;
}

bool Webview::CreateNativeWindow() {
    HINSTANCE hinstance = GetModuleHandleW(nullptr);

    int iconWidth = GetSystemMetrics(SM_CXICON);
    int iconHeight = GetSystemMetrics(SM_CYICON);
    HICON icon = static_cast<HICON>(LoadImageW(hinstance, MAKEINTRESOURCEW(32512),
        IMAGE_ICON, iconWidth, iconHeight, 0));
    if (!icon) {
        icon = LoadIconW(nullptr, IDI_APPLICATION);
    }

    WNDCLASSEXW wc = {};
    wc.cbSize        = sizeof(WNDCLASSEXW);
    wc.hInstance     = hinstance;
    wc.lpszClassName = WEBVIEW_WINDOW_CLASS;
    wc.hIcon         = icon;
    wc.hIconSm       = icon;
    wc.hCursor       = LoadCursorW(nullptr, IDC_ARROW);
    wc.lpfnWndProc   = WndProc;

    // Every webview shares the class; only the first registration succeeds
    if (!RegisterClassExW(&wc) && GetLastError() != ERROR_CLASS_ALREADY_EXISTS) {
        Log::Writef(Log::LOGL_CRITICAL, WEBVIEW_NAME,
            "RegisterClassExW failed (error %lu).", GetLastError());
        return false;
    }

    std::wstring title = Utf8ToWide(m_options.window.title);
    m_hwnd = CreateWindowExW(
        0,
        WEBVIEW_WINDOW_CLASS,
        title.c_str(),
        WS_OVERLAPPEDWINDOW,
        CW_USEDEFAULT,
        CW_USEDEFAULT,
        m_options.window.width,
        m_options.window.height,
        nullptr,
        nullptr,
        hinstance,
        &m_registry);   // Stored by WndProc on WM_NCCREATE

    if (!m_hwnd) {
        Log::Writef(Log::LOGL_CRITICAL, WEBVIEW_NAME,
            "CreateWindowExW failed (error %lu).", GetLastError());
        return false;
    }

    m_controller.reset(new WindowController(ToHandle(m_hwnd), *m_browser, *this,
        m_queue, m_registry, m_options.autoFocus));
    m_registry.Register(ToHandle(m_hwnd), m_controller.get());

    ShowWindow(m_hwnd, SW_SHOW);
    UpdateWindow(m_hwnd);
    SetFocus(m_hwnd);
    return true;
}

void Webview::Wake() {
    if (!PostThreadMessageW(m_mainThread, WM_WEBVIEW_DISPATCH, 0, 0)) {
        Log::Writef(Log::LOGL_WARNING, WEBVIEW_NAME,
            "Could not wake UI thread %lu (error %lu).", m_mainThread, GetLastError());
    }
}

LRESULT CALLBACK Webview::WndProc(HWND hwnd, UINT msg, WPARAM wp, LPARAM lp) {
    if (msg == WM_NCCREATE) {
        auto* cs = reinterpret_cast<CREATESTRUCTW*>(lp);
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(cs->lpCreateParams));
    }

    auto* registry = reinterpret_cast<WindowRegistry*>(GetWindowLongPtrW(hwnd, GWLP_USERDATA));
    WindowController* controller = registry ? registry->Lookup(ToHandle(hwnd)) : nullptr;
    if (!controller) {
        return DefWindowProcW(hwnd, msg, wp, lp);
    }

    WindowEvent event = ToWindowEvent(msg);
    bool handled = false;

    if (event == WindowEvent::GetMinMaxInfo) {
        auto* lpmmi = reinterpret_cast<MINMAXINFO*>(lp);
        MinMaxInfo info;
        info.maxSize      = ToPoint(lpmmi->ptMaxSize);
        info.maxTrackSize = ToPoint(lpmmi->ptMaxTrackSize);
        info.minTrackSize = ToPoint(lpmmi->ptMinTrackSize);

        handled = controller->HandleEvent(event, false, &info);

        lpmmi->ptMaxSize      = { info.maxSize.x, info.maxSize.y };
        lpmmi->ptMaxTrackSize = { info.maxTrackSize.x, info.maxTrackSize.y };
        lpmmi->ptMinTrackSize = { info.minTrackSize.x, info.minTrackSize.y };
    } else {
        bool deactivating = (event == WindowEvent::Activate && LOWORD(wp) == WA_INACTIVE);
        handled = controller->HandleEvent(event, deactivating);
    }

    return handled ? 0 : DefWindowProcW(hwnd, msg, wp, lp);
}

void Webview::Run() {
    MSG msg;
    for (;;) {
        BOOL result = GetMessageW(&msg, nullptr, 0, 0);
        if (result == 0) {
            return; // WM_QUIT
        }
        if (result == -1) {
            Log::Writef(Log::LOGL_CRITICAL, WEBVIEW_NAME,
                "GetMessageW failed (error %lu).", GetLastError());
            return;
        }

        if (msg.hwnd == nullptr && msg.message == WM_WEBVIEW_DISPATCH) {
            m_queue.Drain();
            continue;
        }

        HWND root = GetAncestor(msg.hwnd, GA_ROOT);
        if (root && IsDialogMessageW(root, &msg)) {
            continue;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }
}

void Webview::Terminate() {
    PostQuitMessage(0);
}

void Webview::Navigate(const std::string& url) {
    m_browser->Navigate(url);
}

void Webview::SetTitle(const std::string& title) {
    std::wstring wide = Utf8ToWide(title);
    SetWindowTextW(m_hwnd, wide.c_str());
}

void Webview::SetSize(int width, int height, SizeHint hint) {
    m_controller->SetSize(width, height, hint);
}

void Webview::Init(const std::string& js) {
    m_browser->Init(js);
}

void Webview::Eval(const std::string& js) {
    m_browser->Eval(js);
}

void Webview::Dispatch(DispatchQueue::Task task) {
    m_queue.Enqueue(std::move(task));
}

bool Webview::PostWebMessage(const std::string& message) {
    return m_bridge->Post(message);
}

// ---- WindowOps ----

void Webview::FocusWindow() {
    SetFocus(m_hwnd);
}

void Webview::DestroyWindow() {
    ::DestroyWindow(m_hwnd);
}

void Webview::PostQuit() {
    PostQuitMessage(0);
}

void Webview::SetResizable(bool resizable) {
    LONG_PTR style = GetWindowLongPtrW(m_hwnd, GWL_STYLE);
    if (resizable) {
        style |= (WS_THICKFRAME | WS_MAXIMIZEBOX);
    } else {
        style &= ~static_cast<LONG_PTR>(WS_THICKFRAME | WS_MAXIMIZEBOX);
    }
    SetWindowLongPtrW(m_hwnd, GWL_STYLE, style);
}

void Webview::SetClientSize(int width, int height) {
    RECT r = { 0, 0, width, height };
    AdjustWindowRect(&r, WS_OVERLAPPEDWINDOW, FALSE);
    SetWindowPos(m_hwnd, nullptr, r.left, r.top, r.right - r.left, r.bottom - r.top,
                 SWP_NOZORDER | SWP_NOACTIVATE | SWP_NOMOVE | SWP_FRAMECHANGED);
}
