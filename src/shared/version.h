#pragma once

#define WEBVIEW_NAME          "Webview"
#define WEBVIEW_DESCRIPTION   "Native window hosting a CEF browser with a JSON request/response bridge."

#define WEBVIEW_VERSION_MAJOR 0
#define WEBVIEW_VERSION_MINOR 1
#define WEBVIEW_VERSION_BUILD 0

// Window class registered for every webview window
#define WEBVIEW_WINDOW_CLASS  L"webview"
