#pragma once

#include <string>

// Script sources injected into page content.
//
// Native->JS: window.postMessage(<JSON string>) evaluated in the main frame;
//   the WebView2API class parses it as {id, payload} and settles the promise.
// JS->Native: window.chrome.webview.postMessage(JSON.stringify({id, method,
//   params})) from WebView2API.send().
namespace BridgeScript {

// Defines window.WebView2API. Installed only when an API handler is set.
const std::string& GetApiScript();

} // namespace BridgeScript
