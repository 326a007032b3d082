#include <catch2/catch.hpp>

#include "fakes.h"
#include "core/dispatch_queue.h"
#include "core/rpc_bridge.h"

#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace {

// Value a test handler returns: the parameter, echoed back.
json EchoHandler(const std::string& param) {
    return json::parse(param);
}

struct BridgeFixture {
    FakeBrowser   browser;
    DispatchQueue queue;
    RpcBridge     bridge{queue, browser};
    LogCapture    log;
};

} // namespace

TEST_CASE_METHOD(BridgeFixture, "An API request is answered through the dispatch queue", "[bridge]") {
    bridge.SetHandler(EchoHandler);
    bridge.OnMessage(R"({"id":1,"method":"__webview2_api__","params":["ping"]})");

    // Nothing reaches the page until the UI thread drains the queue
    CHECK(browser.Evals().empty());
    REQUIRE(queue.Pending() == 1);

    queue.Drain();
    REQUIRE(browser.Evals().size() == 1);
    CHECK(browser.Evals()[0] == R"(window.postMessage("{\"id\":1,\"payload\":\"ping\"}"))");
}

TEST_CASE_METHOD(BridgeFixture, "The handler receives the first parameter as JSON text", "[bridge]") {
    std::string received;
    bridge.SetHandler([&](const std::string& param) {
        received = param;
        return json{{"sum", 3}};
    });

    bridge.OnMessage(R"({"id":42,"method":"__webview2_api__","params":[{"a":1,"b":2},"ignored"]})");
    CHECK(json::parse(received) == json{{"a", 1}, {"b", 2}});

    queue.Drain();
    REQUIRE(browser.Evals().size() == 1);
    CHECK(browser.Evals()[0] == R"(window.postMessage("{\"id\":42,\"payload\":{\"sum\":3}}"))");
}

TEST_CASE_METHOD(BridgeFixture, "An empty params array passes null to the handler", "[bridge]") {
    std::string received;
    bridge.SetHandler([&](const std::string& param) {
        received = param;
        return json();
    });

    SECTION("empty array") {
        bridge.OnMessage(R"({"id":5,"method":"__webview2_api__","params":[]})");
    }
    SECTION("missing params") {
        bridge.OnMessage(R"({"id":5,"method":"__webview2_api__"})");
    }

    CHECK(received == "null");
    queue.Drain();
    REQUIRE(browser.Evals().size() == 1);
    CHECK(browser.Evals()[0] == R"(window.postMessage("{\"id\":5,\"payload\":null}"))");
}

TEST_CASE_METHOD(BridgeFixture, "Malformed messages are logged and dropped", "[bridge]") {
    int calls = 0;
    bridge.SetHandler([&](const std::string&) {
        ++calls;
        return json();
    });

    bridge.OnMessage("not json");

    CHECK(calls == 0);
    CHECK(queue.Pending() == 0);
    CHECK(log.Contains("invalid RPC message"));
}

TEST_CASE_METHOD(BridgeFixture, "Deeply nested requests are dropped", "[bridge]") {
    int calls = 0;
    bridge.SetHandler([&](const std::string&) {
        ++calls;
        return json();
    });

    const size_t depth = 100000;
    bridge.OnMessage(R"({"id":1,"method":"__webview2_api__","params":[)" +
                     std::string(depth, '[') + std::string(depth, ']') + "]}");

    CHECK(calls == 0);
    CHECK(queue.Pending() == 0);
    CHECK(log.Contains("invalid RPC message"));
}

TEST_CASE_METHOD(BridgeFixture, "Requests with an unrepresentable id are dropped", "[bridge]") {
    bridge.SetHandler(EchoHandler);
    bridge.OnMessage(R"({"id":18446744073709551615,"method":"__webview2_api__","params":[1]})");

    CHECK(queue.Pending() == 0);
    CHECK(browser.Evals().empty());
    CHECK(log.Contains("invalid RPC message"));
}

TEST_CASE_METHOD(BridgeFixture, "Unknown methods are logged and dropped", "[bridge]") {
    int calls = 0;
    bridge.SetHandler([&](const std::string&) {
        ++calls;
        return json();
    });

    bridge.OnMessage(R"({"id":1,"method":"foo","params":[]})");

    CHECK(calls == 0);
    CHECK(queue.Pending() == 0);
    CHECK(log.Contains("unknown opcode: foo"));
}

TEST_CASE_METHOD(BridgeFixture, "The bridge keeps working after a bad message", "[bridge]") {
    bridge.SetHandler(EchoHandler);

    bridge.OnMessage("{");
    bridge.OnMessage(R"({"id":1,"method":"foo"})");
    bridge.OnMessage(R"({"id":2,"method":"__webview2_api__","params":[true]})");

    queue.Drain();
    REQUIRE(browser.Evals().size() == 1);
    CHECK(browser.Evals()[0] == R"(window.postMessage("{\"id\":2,\"payload\":true}"))");
}

TEST_CASE_METHOD(BridgeFixture, "Requests without a handler are dropped", "[bridge]") {
    CHECK_FALSE(bridge.HasHandler());
    bridge.OnMessage(R"({"id":9,"method":"__webview2_api__","params":["x"]})");

    CHECK(queue.Pending() == 0);
    CHECK(log.Contains("no API handler installed"));
}

TEST_CASE_METHOD(BridgeFixture, "A throwing handler answers with an error payload", "[bridge]") {
    bridge.SetHandler([](const std::string&) -> json {
        throw std::runtime_error("boom");
    });

    bridge.OnMessage(R"({"id":3,"method":"__webview2_api__","params":["x"]})");
    CHECK(log.Contains("API handler failed: boom"));

    queue.Drain();
    REQUIRE(browser.Evals().size() == 1);
    CHECK(browser.Evals()[0] == R"(window.postMessage("{\"id\":3,\"payload\":{\"error\":\"boom\"}}"))");
}

TEST_CASE_METHOD(BridgeFixture, "A payload that can't be encoded schedules nothing", "[bridge]") {
    bridge.SetHandler([](const std::string&) {
        return json(std::string("\xff"));
    });

    bridge.OnMessage(R"({"id":4,"method":"__webview2_api__","params":["x"]})");

    CHECK(queue.Pending() == 0);
    CHECK(log.Contains("invalid RPC response"));
}

TEST_CASE_METHOD(BridgeFixture, "Each accepted request yields one response", "[bridge]") {
    bridge.SetHandler(EchoHandler);
    for (int i = 0; i < 5; ++i) {
        bridge.OnMessage(json{{"id", i}, {"method", "__webview2_api__"}, {"params", json::array({i * 10})}}.dump());
    }

    CHECK(queue.Drain() == 5);
    auto evals = browser.Evals();
    REQUIRE(evals.size() == 5);
    for (int i = 0; i < 5; ++i) {
        std::string expected = "window.postMessage(\"{\\\"id\\\":" + std::to_string(i) +
                               ",\\\"payload\\\":" + std::to_string(i * 10) + "}\")";
        CHECK(evals[i] == expected);
    }
}

TEST_CASE_METHOD(BridgeFixture, "Messages may arrive on another thread", "[bridge][threads]") {
    std::thread::id handlerThread;
    bridge.SetHandler([&](const std::string& param) {
        handlerThread = std::this_thread::get_id();
        return json::parse(param);
    });

    std::thread content([&]() {
        bridge.OnMessage(R"({"id":1,"method":"__webview2_api__","params":["ping"]})");
    });
    std::thread::id contentThread = content.get_id();
    content.join();

    // The handler runs where the message arrived; delivery waits for the drain
    CHECK(handlerThread == contentThread);
    CHECK(browser.Evals().empty());
    CHECK(queue.Drain() == 1);
    CHECK(browser.Evals().size() == 1);
}

TEST_CASE_METHOD(BridgeFixture, "Post delivers arbitrary text as a quoted literal", "[bridge]") {
    REQUIRE(bridge.Post("he said \"hi\"\n"));
    CHECK(browser.Evals().empty());

    queue.Drain();
    REQUIRE(browser.Evals().size() == 1);
    CHECK(browser.Evals()[0] == R"(window.postMessage("he said \"hi\"\n"))");
}

TEST_CASE_METHOD(BridgeFixture, "Post rejects text that isn't valid UTF-8", "[bridge]") {
    CHECK_FALSE(bridge.Post("\xc3\x28"));
    CHECK(queue.Pending() == 0);
    CHECK(log.Contains("could not encode message"));
}
