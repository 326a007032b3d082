#include "rpc_bridge.h"
#include "browser.h"
#include "dispatch_queue.h"
#include "shared/log.h"
#include "shared/rpc_protocol.h"
#include "shared/version.h"

#include <exception>
#include <utility>

using json = nlohmann::json;

RpcBridge::RpcBridge(DispatchQueue& queue, Browser& browser)
    : m_queue(queue)
    , m_browser(browser) {
}

void RpcBridge::SetHandler(ApiHandler handler) {
    m_handler = std::move(handler);
}

void RpcBridge::OnMessage(const std::string& raw) {
    RpcProtocol::RpcRequest request;
    std::string error;
    if (!RpcProtocol::DecodeRequest(raw, request, error)) {
        Log::Write(Log::LOGL_WARNING, WEBVIEW_NAME, "invalid RPC message: " + error);
        return;
    }

    if (request.method != RpcProtocol::API_METHOD) {
        Log::Write(Log::LOGL_WARNING, WEBVIEW_NAME, "unknown opcode: " + request.method);
        return;
    }

    if (!m_handler) {
        Log::Writef(Log::LOGL_WARNING, WEBVIEW_NAME,
            "RPC request %lld dropped: no API handler installed",
            static_cast<long long>(request.id));
        return;
    }

    // WebView2API.send() always passes exactly one parameter
    std::string param = request.params.empty() ? "null" : request.params[0].dump();

    RpcProtocol::RpcResponse response;
    response.id = request.id;
    response.payload = Invoke(param);

    std::string encoded;
    if (!RpcProtocol::EncodeResponse(response, encoded, error)) {
        Log::Write(Log::LOGL_WARNING, WEBVIEW_NAME, "invalid RPC response: " + error);
        return;
    }

    Post(encoded);
}

bool RpcBridge::Post(const std::string& message) {
    std::string quoted;
    std::string error;
    if (!RpcProtocol::QuoteString(message, quoted, error)) {
        Log::Write(Log::LOGL_WARNING, WEBVIEW_NAME, "could not encode message: " + error);
        return false;
    }

    std::string script = "window.postMessage(" + quoted + ")";
    Browser* browser = &m_browser;
    m_queue.Enqueue([browser, script]() {
        browser->Eval(script);
    });
    return true;
}

json RpcBridge::Invoke(const std::string& param) const {
    // A failing handler still settles the page's promise, with an error payload
    try {
        return m_handler(param);
    } catch (const std::exception& e) {
        Log::Write(Log::LOGL_WARNING, WEBVIEW_NAME,
            std::string("API handler failed: ") + e.what());
        json j;
        j["error"] = e.what();
        return j;
    }
}
