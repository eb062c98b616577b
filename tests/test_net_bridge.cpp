// Network bridge tests: WebSocket queueing and HTTP polling

#include <catch2/catch_test_macros.hpp>
#include "fake_guest.h"
#include "hostbridge/bridge/host_values.h"
#include "hostbridge/net/net_bridge.h"
#include <string>
#include <vector>

using namespace hostbridge;
using namespace hostbridge::test;
using bridge::HostValue;
using bridge::HostValueTable;

namespace {

struct PendingRequest {
    std::string method;
    std::string url;
    std::vector<uint8_t> body;
    http::HttpOptions options;
    http::AsyncHttpCallback callback;
};

class FakeTransport : public http::HttpTransport {
public:
    void request(const std::string& method,
                 const std::string& url,
                 const std::vector<uint8_t>& body,
                 http::AsyncHttpCallback callback,
                 const http::HttpOptions& options) override {
        pending.push_back(PendingRequest{method, url, body, options, std::move(callback)});
    }

    void respond(size_t index, bool ok, const std::string& payload, int status = 200) {
        http::HttpResponse response;
        response.ok = ok;
        response.status = status;
        response.url = pending[index].url;
        response.data.assign(payload.begin(), payload.end());
        if (!ok) response.error = "connection refused";
        pending[index].callback(std::move(response));
    }

    std::vector<PendingRequest> pending;
};

struct SentFrame {
    bool isText;
    std::string data;
};

class FakeSocket : public net::Socket {
public:
    FakeSocket(net::SocketEvents events, std::vector<SentFrame>& sent, int& closes)
        : events_(std::move(events)), sent_(sent), closes_(closes) {}

    bool isOpen() const override { return open_; }

    bool send(const uint8_t* data, size_t size, bool isText) override {
        if (!open_) return false;
        sent_.push_back(SentFrame{isText, std::string(data, data + size)});
        return true;
    }

    void close() override {
        open_ = false;
        closes_++;
    }

    void open() {
        open_ = true;
        events_.onOpen();
    }

    void receive(bool isText, const std::string& data) {
        events_.onMessage(isText, std::vector<uint8_t>(data.begin(), data.end()));
    }

    void drop(const std::string& reason) {
        open_ = false;
        events_.onClose(reason);
    }

private:
    net::SocketEvents events_;
    std::vector<SentFrame>& sent_;
    int& closes_;
    bool open_ = false;
};

struct NetFixture {
    HostValueTable values;
    FakeTransport transport;
    std::vector<SentFrame> sent;
    std::vector<std::string> urls;
    std::vector<FakeSocket*> sockets;
    int closes = 0;
    net::NetBridge net;

    NetFixture()
        : net(values, transport, [this](const std::string& url, net::SocketEvents events) {
              urls.push_back(url);
              auto socket = std::make_unique<FakeSocket>(std::move(events), sent, closes);
              sockets.push_back(socket.get());
              return std::unique_ptr<net::Socket>(std::move(socket));
          }) {}

    FakeSocket& connect(const std::string& url = "ws://localhost:9000") {
        net.wsConnect(url);
        sockets.back()->open();
        return *sockets.back();
    }
};

std::string bytesOf(const HostValue* value) {
    return std::string(value->bytes.begin(), value->bytes.end());
}

}  // namespace

TEST_CASE("A socket counts as connected once it opens", "[net]") {
    NetFixture f;
    f.net.wsConnect("ws://example.test/socket");
    REQUIRE(f.urls.size() == 1);
    REQUIRE(f.urls[0] == "ws://example.test/socket");
    REQUIRE_FALSE(f.net.wsIsConnected());

    f.sockets[0]->open();
    REQUIRE(f.net.wsIsConnected());

    f.sockets[0]->drop("server went away");
    REQUIRE_FALSE(f.net.wsIsConnected());
}

TEST_CASE("Messages are handed out one per poll in arrival order", "[net]") {
    NetFixture f;
    FakeSocket& socket = f.connect();

    REQUIRE(f.net.wsTryRecv() == net::NetBridge::kNothing);
    socket.receive(true, "hello");
    socket.receive(false, std::string("\x01\x02\x03", 3));
    REQUIRE(f.net.queuedMessageCount() == 2);

    int32_t first = f.net.wsTryRecv();
    HostValue* text = f.values.get(first);
    REQUIRE(text != nullptr);
    REQUIRE(text->field("text")->number == 1);
    REQUIRE(text->field("data")->kind == HostValue::Kind::String);
    REQUIRE(text->field("data")->utf8() == "hello");

    int32_t second = f.net.wsTryRecv();
    HostValue* binary = f.values.get(second);
    REQUIRE(binary->field("text")->number == 0);
    REQUIRE(binary->field("data")->kind == HostValue::Kind::Bytes);
    REQUIRE(binary->field("data")->bytes == std::vector<uint8_t>{1, 2, 3});

    REQUIRE(f.net.wsTryRecv() == net::NetBridge::kNothing);
}

TEST_CASE("Sending picks the frame type from the value kind", "[net]") {
    NetFixture f;
    f.connect();

    REQUIRE(f.net.wsSend(HostValue::fromUtf8("ping")));
    REQUIRE(f.net.wsSend(HostValue::fromBytes({9, 8})));
    REQUIRE_FALSE(f.net.wsSend(HostValue::fromNumber(3.0)));

    REQUIRE(f.sent.size() == 2);
    REQUIRE(f.sent[0].isText);
    REQUIRE(f.sent[0].data == "ping");
    REQUIRE_FALSE(f.sent[1].isText);
    REQUIRE(f.sent[1].data == std::string("\x09\x08", 2));
}

TEST_CASE("Sending without a connection drops the message", "[net]") {
    NetFixture f;
    REQUIRE_FALSE(f.net.wsSend(HostValue::fromUtf8("lost")));

    f.net.wsConnect("ws://localhost:1");
    REQUIRE_FALSE(f.net.wsSend(HostValue::fromUtf8("still connecting")));
    REQUIRE(f.sent.empty());
}

TEST_CASE("Reconnecting closes the old socket and ignores its events", "[net]") {
    NetFixture f;
    FakeSocket& old = f.connect("ws://first");
    old.receive(true, "stale");

    f.net.wsConnect("ws://second");
    REQUIRE(f.closes == 1);
    REQUIRE(f.net.queuedMessageCount() == 0);
    REQUIRE_FALSE(f.net.wsIsConnected());

    f.sockets[1]->open();
    REQUIRE(f.net.wsIsConnected());
}

TEST_CASE("Closing keeps queued messages readable", "[net]") {
    NetFixture f;
    FakeSocket& socket = f.connect();
    socket.receive(true, "last words");

    f.net.wsClose();
    REQUIRE_FALSE(f.net.wsIsConnected());
    REQUIRE(f.closes == 1);
    REQUIRE(f.net.wsTryRecv() >= 0);
}

TEST_CASE("HTTP request ids count up from zero", "[net]") {
    NetFixture f;
    REQUIRE(f.net.httpMakeRequest(2, "http://a", {}, {}) == 0);
    REQUIRE(f.net.httpMakeRequest(0, "http://b", {1}, {}) == 1);
    REQUIRE(f.transport.pending.size() == 2);
    REQUIRE(f.transport.pending[0].method == "GET");
    REQUIRE(f.transport.pending[1].method == "POST");
    REQUIRE(f.transport.pending[1].body == std::vector<uint8_t>{1});
}

TEST_CASE("A response is returned once by polling", "[net]") {
    NetFixture f;
    int32_t id = f.net.httpMakeRequest(2, "http://example.test/data", {}, {});
    REQUIRE(f.net.httpTryRecv(id) == net::NetBridge::kNothing);
    REQUIRE(f.net.pendingRequestCount() == 1);

    f.transport.respond(0, true, "payload");
    REQUIRE(f.net.pendingRequestCount() == 0);

    int32_t handle = f.net.httpTryRecv(id);
    REQUIRE(handle >= 0);
    REQUIRE(bytesOf(f.values.get(handle)) == "payload");
    REQUIRE(f.net.httpTryRecv(id) == net::NetBridge::kNothing);
}

TEST_CASE("Failed requests resolve to an empty body", "[net]") {
    NetFixture f;
    for (int i = 0; i < 8; i++) {
        f.net.httpMakeRequest(2, "http://example.test/" + std::to_string(i), {}, {});
    }
    f.transport.respond(7, false, "", 0);

    int32_t handle = f.net.httpTryRecv(7);
    REQUIRE(handle >= 0);
    REQUIRE(f.values.get(handle)->kind == HostValue::Kind::Bytes);
    REQUIRE(f.values.get(handle)->bytes.empty());
    REQUIRE(f.net.httpTryRecv(6) == net::NetBridge::kNothing);
}

TEST_CASE("Unknown methods resolve without touching the network", "[net]") {
    NetFixture f;
    int32_t id = f.net.httpMakeRequest(9, "http://example.test", {}, {});
    REQUIRE(f.transport.pending.empty());
    int32_t handle = f.net.httpTryRecv(id);
    REQUIRE(handle >= 0);
    REQUIRE(f.values.get(handle)->bytes.empty());
}

TEST_CASE("Responses arriving after destruction are ignored", "[net]") {
    HostValueTable values;
    FakeTransport transport;
    {
        net::NetBridge net(values, transport, nullptr);
        net.httpMakeRequest(2, "http://example.test", {}, {});
    }
    transport.respond(0, true, "late");
    REQUIRE(values.liveCount() == 0);
}

TEST_CASE("The call table consumes url, body and header values", "[net]") {
    NetFixture f;
    bridge::CallTable table;
    f.net.registerFunctions(table);

    int32_t url = f.values.add(HostValue::fromUtf8("http://example.test/upload"));
    int32_t body = f.values.add(HostValue::fromUtf8("{\"a\":1}"));
    HostValue headers = HostValue::record();
    headers.setField("Content-Type", HostValue::fromUtf8("application/json"));
    headers.setField("X-Retry", HostValue::fromNumber(3));
    int32_t headerHandle = f.values.add(std::move(headers));

    int32_t id = table.call("http_make_request", {i32(1), i32(url), i32(body), i32(headerHandle)}).asI32();
    REQUIRE(id == 0);
    REQUIRE(f.values.liveCount() == 0);

    const PendingRequest& request = f.transport.pending.at(0);
    REQUIRE(request.method == "PUT");
    REQUIRE(request.url == "http://example.test/upload");
    REQUIRE(std::string(request.body.begin(), request.body.end()) == "{\"a\":1}");
    REQUIRE(request.options.headers.at("Content-Type") == "application/json");
    REQUIRE(request.options.headers.at("X-Retry") == "3");

    f.transport.respond(0, true, "done");
    int32_t handle = table.call("http_try_recv", {i32(id)}).asI32();
    REQUIRE(bytesOf(f.values.get(handle)) == "done");
}

TEST_CASE("WebSocket functions through the call table", "[net]") {
    NetFixture f;
    bridge::CallTable table;
    f.net.registerFunctions(table);

    int32_t url = f.values.add(HostValue::fromUtf8("ws://example.test"));
    table.call("ws_connect", {i32(url)});
    REQUIRE(f.urls.at(0) == "ws://example.test");
    REQUIRE_FALSE(table.call("ws_is_connected").asBool());

    f.sockets[0]->open();
    REQUIRE(table.call("ws_is_connected").asBool());

    int32_t message = f.values.add(HostValue::fromUtf8("hi"));
    table.call("ws_send", {i32(message)});
    REQUIRE(f.sent.size() == 1);
    REQUIRE(f.values.liveCount() == 0);

    REQUIRE(table.call("ws_try_recv").asI32() == net::NetBridge::kNothing);
}
