#pragma once

#include "rpc_bridge.h"

#include <string>

struct WindowOptions {
    std::string title;
    int         width  = 640;
    int         height = 480;
};

struct WebviewOptions {
    // Enables DevTools (F12) and the default context menu. Log verbosity is
    // process-wide and left to the host (Log::SetMinLevel).
    bool debug = false;

    // Provides a WebView2API class to page script when set.
    ApiHandler apiHandler;

    // Browser profile directory. Empty uses the runtime's default profile.
    std::string dataPath;

    // Keep the browser focused whenever the window is activated.
    bool autoFocus = false;

    // Customizes the window created to embed the browser.
    WindowOptions window;
};
