#include "rpc_protocol.h"

#include <cstdint>
#include <limits>
#include <utility>

using json = nlohmann::json;

namespace RpcProtocol {

// True if arrays/objects in `raw` nest deeper than `limit`. Brackets inside
// string literals are skipped.
static bool ExceedsDepth(const std::string& raw, size_t limit) {
    size_t depth = 0;
    bool inString = false;
    bool escaped = false;
    for (char c : raw) {
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                inString = true;
                break;
            case '[':
            case '{':
                if (++depth > limit) return true;
                break;
            case ']':
            case '}':
                if (depth > 0) --depth;
                break;
            default:
                break;
        }
    }
    return false;
}

bool DecodeRequest(const std::string& raw, RpcRequest& request, std::string& error) {
    // The parser recurses per nesting level; refuse before it runs out of stack
    if (ExceedsDepth(raw, MAX_NESTING_DEPTH)) {
        error = "exceeded max nesting depth of " + std::to_string(MAX_NESTING_DEPTH);
        return false;
    }

    json msg;
    try {
        msg = json::parse(raw);
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }

    if (!msg.is_object()) {
        error = std::string("expected an object, got ") + msg.type_name();
        return false;
    }

    RpcRequest decoded;

    auto id = msg.find("id");
    if (id != msg.end() && !id->is_null()) {
        if (!id->is_number_integer()) {
            error = std::string("field 'id' must be an integer, got ") + id->type_name();
            return false;
        }
        if (id->is_number_unsigned() &&
            id->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            error = "field 'id' out of range: " + id->dump();
            return false;
        }
        decoded.id = id->get<int64_t>();
    }

    auto method = msg.find("method");
    if (method != msg.end() && !method->is_null()) {
        if (!method->is_string()) {
            error = std::string("field 'method' must be a string, got ") + method->type_name();
            return false;
        }
        decoded.method = method->get<std::string>();
    }

    auto params = msg.find("params");
    if (params != msg.end() && !params->is_null()) {
        if (!params->is_array()) {
            error = std::string("field 'params' must be an array, got ") + params->type_name();
            return false;
        }
        decoded.params.assign(params->begin(), params->end());
    }

    request = std::move(decoded);
    return true;
}

bool EncodeResponse(const RpcResponse& response, std::string& encoded, std::string& error) {
    json j;
    j["id"] = response.id;
    j["payload"] = response.payload;

    try {
        encoded = j.dump();
    } catch (const json::type_error& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool QuoteString(const std::string& text, std::string& quoted, std::string& error) {
    try {
        quoted = json(text).dump();
    } catch (const json::type_error& e) {
        error = e.what();
        return false;
    }
    return true;
}

} // namespace RpcProtocol
