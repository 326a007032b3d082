#pragma once

#include "nlohmann/json.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ============================================================================
// JSON envelopes exchanged between page content and the host.
//   request:  {"id": <int>, "method": <string>, "params": [<json>, ...]}
//   response: {"id": <int>, "payload": <json>}
// ============================================================================

namespace RpcProtocol {

// Method name used by the injected WebView2API class.
constexpr const char* API_METHOD = "__webview2_api__";

// Deepest array/object nesting accepted in a request.
constexpr size_t MAX_NESTING_DEPTH = 10000;

struct RpcRequest {
    int64_t                     id = 0;
    std::string                 method;
    std::vector<nlohmann::json> params;
};

struct RpcResponse {
    int64_t        id = 0;
    nlohmann::json payload;
};

// Parse a request envelope. Fields that are missing or null keep their
// defaults. Returns false with `error` set on malformed JSON or fields of
// the wrong type, an id outside the int64 range, or nesting deeper than
// MAX_NESTING_DEPTH.
bool DecodeRequest(const std::string& raw, RpcRequest& request, std::string& error);

// Serialize a response envelope. Returns false with `error` set when the
// payload can't be written as JSON (e.g. a string holding invalid UTF-8).
bool EncodeResponse(const RpcResponse& response, std::string& encoded, std::string& error);

// Quote text as a JSON string literal, usable verbatim inside page script.
bool QuoteString(const std::string& text, std::string& quoted, std::string& error);

} // namespace RpcProtocol
