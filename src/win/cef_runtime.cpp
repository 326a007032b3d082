#include "cef_runtime.h"
#include "browser_app.h"
#include "shared/log.h"
#include "shared/version.h"

#include "include/cef_app.h"
#include "include/cef_version.h"

namespace CefRuntime {

static CefRefPtr<BrowserApp> s_app;
static bool                  s_initialized = false;

static std::string DefaultCachePath() {
    char tempPath[MAX_PATH] = {};
    GetTempPathA(MAX_PATH, tempPath);
    return std::string(tempPath) + "webview_cef_cache";
}

int ExecuteSubprocess(HINSTANCE instance) {
    CefMainArgs mainArgs(instance);
    CefRefPtr<BrowserApp> app = new BrowserApp();
    return CefExecuteProcess(mainArgs, app, nullptr);
}

bool Initialize(HINSTANCE instance, const RuntimeSettings& runtimeSettings) {
    if (s_initialized) return true;

    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME, "CEF version: %s (Chromium %d)",
        CEF_VERSION, CHROME_VERSION_MAJOR);

    s_app = new BrowserApp(runtimeSettings.debug);

    std::string rootCachePath = runtimeSettings.rootCachePath.empty()
        ? DefaultCachePath() : runtimeSettings.rootCachePath;

    CefSettings settings;
    settings.no_sandbox = true;
    settings.multi_threaded_message_loop = true;
    settings.log_severity = runtimeSettings.debug ? LOGSEVERITY_VERBOSE : LOGSEVERITY_WARNING;
    CefString(&settings.root_cache_path).FromString(rootCachePath);
    // Per-webview profiles (WebviewOptions::dataPath) must live under the root
    CefString(&settings.cache_path).FromString(rootCachePath + "\\default");

    if (!runtimeSettings.subprocessPath.empty()) {
        CefString(&settings.browser_subprocess_path).FromString(runtimeSettings.subprocessPath);
    }

    CefMainArgs mainArgs(instance);
    if (!CefInitialize(mainArgs, settings, s_app, nullptr)) {
        Log::Writef(Log::LOGL_CRITICAL, WEBVIEW_NAME,
            "CefInitialize failed! (GetLastError=%lu)", GetLastError());
        s_app = nullptr;
        return false;
    }

    Log::Write(Log::LOGL_INFO, WEBVIEW_NAME,
        "CEF initialized (cache: " + rootCachePath + ").");
    s_initialized = true;
    return true;
}

bool IsInitialized() {
    return s_initialized;
}

void Shutdown() {
    if (!s_initialized) return;

    CefShutdown();
    s_app = nullptr;
    s_initialized = false;

    Log::Write(Log::LOGL_INFO, WEBVIEW_NAME, "CEF shut down.");
}

} // namespace CefRuntime
