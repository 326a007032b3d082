#include <windows.h>
#include <cstdio>
#include <memory>
#include <string>

#include "core/command_line.h"
#include "core/window_registry.h"
#include "shared/log.h"
#include "shared/version.h"
#include "win/cef_runtime.h"
#include "win/webview.h"

static const char* DEFAULT_URL = "about:blank";

// Demo handler: answers every WebView2API.send() with the value it was sent.
static nlohmann::json EchoHandler(const std::string& param) {
    Log::Write(Log::LOGL_DEBUG, WEBVIEW_NAME, "API call: " + param);
    return nlohmann::json::parse(param);
}

int WINAPI WinMain(HINSTANCE hInstance, HINSTANCE, LPSTR, int) {
    std::string fullCmdLine = GetCommandLineA();

    // Chromium relaunches this executable for its helper processes
    // (--type=renderer/gpu/utility/...); hand those straight to CEF.
    if (fullCmdLine.find("--type=") != std::string::npos) {
        return CefRuntime::ExecuteSubprocess(hInstance);
    }

    std::string logFile = CommandLine::GetArg("log-file", fullCmdLine);
    if (!logFile.empty()) {
        // Append so relaunches don't clobber earlier output
        if (!freopen(logFile.c_str(), "a", stderr)) {
            return 1;
        }
    }

    bool debug = CommandLine::HasFlag("debug", fullCmdLine);
    if (debug) {
        Log::SetMinLevel(Log::LOGL_DEBUG);
    }

    fprintf(stderr, "\n[%s] ==================================================\n", WEBVIEW_NAME);
    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME, "%s v%d.%d.%d (PID %lu)",
        WEBVIEW_NAME, WEBVIEW_VERSION_MAJOR, WEBVIEW_VERSION_MINOR, WEBVIEW_VERSION_BUILD,
        GetCurrentProcessId());
    Log::Write(Log::LOGL_DEBUG, WEBVIEW_NAME, "Command line: " + fullCmdLine);

    std::string url = CommandLine::GetArg("url", fullCmdLine);
    if (url.empty()) url = DEFAULT_URL;

    std::string dataPath = CommandLine::GetArg("data-path", fullCmdLine);

    RuntimeSettings runtimeSettings;
    runtimeSettings.debug = debug;
    runtimeSettings.rootCachePath = dataPath;
    if (!CefRuntime::Initialize(hInstance, runtimeSettings)) {
        Log::Write(Log::LOGL_CRITICAL, WEBVIEW_NAME, "Could not initialize CEF. Exiting.");
        return 1;
    }

    WebviewOptions options;
    options.debug = debug;
    options.autoFocus = CommandLine::HasFlag("auto-focus", fullCmdLine);
    options.apiHandler = EchoHandler;
    if (!dataPath.empty()) {
        options.dataPath = dataPath + "\\profile";
    }
    options.window.title = CommandLine::GetArg("title", fullCmdLine);
    if (options.window.title.empty()) options.window.title = WEBVIEW_NAME;
    options.window.width = CommandLine::GetIntArg("width", fullCmdLine, options.window.width);
    options.window.height = CommandLine::GetIntArg("height", fullCmdLine, options.window.height);

    Log::Write(Log::LOGL_INFO, WEBVIEW_NAME, "Starting with:");
    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME, "  url:       %s", url.c_str());
    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME, "  size:      %dx%d",
        options.window.width, options.window.height);
    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME, "  data-path: %s",
        dataPath.empty() ? "(default)" : dataPath.c_str());

    int exitCode = 0;
    {
        WindowRegistry registry;
        std::unique_ptr<Webview> view = Webview::New(registry, options);
        if (!view) {
            Log::Write(Log::LOGL_CRITICAL, WEBVIEW_NAME, "Could not create the webview window.");
            exitCode = 1;
        } else {
            view->Navigate(url);
            view->Run();
        }
    }

    CefRuntime::Shutdown();
    Log::Writef(Log::LOGL_INFO, WEBVIEW_NAME, "Exiting with code %d.", exitCode);
    return exitCode;
}
