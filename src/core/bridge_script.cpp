#include "bridge_script.h"

namespace BridgeScript {

// Every page gets one WebView2API class; pages create instances as needed.
// Request ids are per instance and start at 0. A request the host drops
// (malformed or unknown method) leaves its promise pending.
static const std::string s_apiScript = R"JS(class WebView2API extends EventTarget {
  #handlers = {};
  #id = 0;
  constructor() {
    super();

    window.addEventListener("message", (event) => {
      const data = JSON.parse(event.data)
      const handler = this.#handlers[data.id];
      this.dispatchEvent(new CustomEvent("message", { detail: event }));

      if (handler) {
        handler.resolve(data.payload);
      }

      delete this.#handlers[data.id];
    });
  }

  async send(payload) {
    return new Promise((resolve, reject) => {
      if ("chrome" in window && "webview" in window.chrome) {
        window.chrome.webview.postMessage(
          JSON.stringify({ id: this.#id, method: "__webview2_api__", params: [payload] })
        );
        this.#handlers[this.#id] = { resolve, reject };
        this.#id++;
      } else {
        console.error("There is no webview context");
      }
    });
  }
}

window.WebView2API = WebView2API;
)JS";

const std::string& GetApiScript() {
    return s_apiScript;
}

} // namespace BridgeScript
