#pragma once

#include "nlohmann/json.hpp"

#include <functional>
#include <string>

class Browser;
class DispatchQueue;

// Host handler for WebView2API.send(). Receives the JSON text of the first
// request parameter; the returned value becomes the response payload.
using ApiHandler = std::function<nlohmann::json(const std::string& param)>;

// Decodes request envelopes posted by page content, runs the API handler and
// delivers the response back to the page through the dispatch queue.
//
// OnMessage() and Post() may be called from any thread; the script that
// delivers a response is always evaluated by the queue's owning thread.
class RpcBridge {
public:
    RpcBridge(DispatchQueue& queue, Browser& browser);

    void SetHandler(ApiHandler handler);
    bool HasHandler() const { return static_cast<bool>(m_handler); }

    // Entry point for every raw message posted by page content. Malformed
    // requests and unknown methods are logged and dropped.
    void OnMessage(const std::string& raw);

    // Deliver `message` to the page as the data of a window "message" event.
    // Returns false if the text can't be encoded.
    bool Post(const std::string& message);

private:
    nlohmann::json Invoke(const std::string& param) const;

    DispatchQueue& m_queue;
    Browser&       m_browser;
    ApiHandler     m_handler;
};
