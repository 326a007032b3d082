#include "browser_app.h"
#include "shared/log.h"
#include "shared/version.h"

#include "include/cef_command_line.h"

void BrowserApp::OnBeforeCommandLineProcessing(
    const CefString& process_type,
    CefRefPtr<CefCommandLine> command_line) {
    // Only the browser process; helpers inherit what they need from it
    if (!process_type.empty()) return;

    if (m_debug) {
        command_line->AppendSwitch("enable-logging");
        command_line->AppendSwitchWithValue("log-severity", "verbose");
    }

    command_line->AppendSwitch("disable-extensions");
    command_line->AppendSwitch("disable-component-update");

    Log::Write(Log::LOGL_DEBUG, WEBVIEW_NAME,
        "Full CEF command line: " + command_line->GetCommandLineString().ToString());
}

void BrowserApp::OnContextInitialized() {
    Log::Write(Log::LOGL_INFO, WEBVIEW_NAME, "Browser process context initialized.");
}
