#include "hostbridge/net/net_bridge.h"
#include "hostbridge/bridge/host_values.h"
#include <iostream>
#include <sstream>

namespace hostbridge {
namespace net {

using bridge::Args;
using bridge::HostValue;
using guest::Value;

namespace {

std::vector<uint8_t> valueBytes(const HostValue& value) {
    switch (value.kind) {
        case HostValue::Kind::Bytes:
            return value.bytes;
        case HostValue::Kind::String: {
            std::string text = value.utf8();
            return std::vector<uint8_t>(text.begin(), text.end());
        }
        default:
            return std::vector<uint8_t>();
    }
}

std::string fieldText(const HostValue& value) {
    if (value.kind == HostValue::Kind::String) return value.utf8();
    if (value.kind == HostValue::Kind::Number) {
        std::ostringstream out;
        out << value.number;
        return out.str();
    }
    return std::string();
}

}  // namespace

NetBridge::NetBridge(bridge::HostValueTable& values, http::HttpTransport& http, SocketFactory sockets)
    : values_(values)
    , http_(http)
    , sockets_(std::move(sockets))
    , alive_(std::make_shared<bool>(true)) {}

NetBridge::~NetBridge() {
    *alive_ = false;
    wsClose();
}

// ============================================================================
// WebSocket
// ============================================================================

void NetBridge::wsClose() {
    // Invalidate event handlers of the old socket
    socketGeneration_++;
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
    connected_ = false;
}

void NetBridge::wsConnect(const std::string& url) {
    wsClose();
    received_.clear();

    uint64_t generation = ++socketGeneration_;
    std::weak_ptr<bool> alive = alive_;
    auto current = [this, alive, generation]() {
        auto token = alive.lock();
        return token && *token && generation == socketGeneration_;
    };

    SocketEvents events;
    events.onOpen = [this, current]() {
        if (!current()) return;
        connected_ = true;
        std::cout << "[Net] WebSocket connected" << std::endl;
    };
    events.onMessage = [this, current](bool isText, std::vector<uint8_t> data) {
        if (!current()) return;
        received_.push_back(Message{isText, std::move(data)});
    };
    events.onClose = [this, current](const std::string& reason) {
        if (!current()) return;
        connected_ = false;
        std::cerr << "[Net] WebSocket closed: " << reason << std::endl;
    };

    if (!sockets_) {
        std::cerr << "[Net] No WebSocket transport available for " << url << std::endl;
        return;
    }
    socket_ = sockets_(url, std::move(events));
    if (!socket_) {
        std::cerr << "[Net] Failed to start WebSocket connection to " << url << std::endl;
    }
}

bool NetBridge::wsSend(const HostValue& value) {
    if (!socket_ || !connected_) {
        std::cerr << "[Net] ws_send while not connected, message dropped" << std::endl;
        return false;
    }
    std::vector<uint8_t> payload = valueBytes(value);
    bool isText = value.kind == HostValue::Kind::String;
    if (!isText && value.kind != HostValue::Kind::Bytes) {
        std::cerr << "[Net] ws_send expects a string or buffer value" << std::endl;
        return false;
    }
    return socket_->send(payload.data(), payload.size(), isText);
}

int32_t NetBridge::wsTryRecv() {
    if (received_.empty()) return kNothing;

    Message message = std::move(received_.front());
    received_.pop_front();

    HostValue record = HostValue::record();
    record.setField("text", HostValue::fromNumber(message.isText ? 1 : 0));
    if (message.isText) {
        record.setField("data", HostValue::fromUtf8(std::string(message.data.begin(), message.data.end())));
    } else {
        record.setField("data", HostValue::fromBytes(std::move(message.data)));
    }
    return values_.add(std::move(record));
}

// ============================================================================
// HTTP
// ============================================================================

int32_t NetBridge::httpMakeRequest(int32_t method, const std::string& url, std::vector<uint8_t> body,
                                   const std::map<std::string, std::string>& headers) {
    int32_t id = nextRequestId_++;
    requests_[id] = std::nullopt;

    const char* name = http::methodName(method);
    if (!name) {
        std::cerr << "[Net] Request " << id << ": unknown method " << method << std::endl;
        resolve(id, std::vector<uint8_t>());
        return id;
    }

    http::HttpOptions options;
    options.headers = headers;

    std::weak_ptr<bool> alive = alive_;
    http_.request(name, url, body, [this, alive, id](http::HttpResponse response) {
        auto token = alive.lock();
        if (!token || !*token) return;

        if (!response.ok) {
            std::cerr << "[Net] Request " << id << " to " << response.url << " failed: "
                      << (response.error.empty() ? "status " + std::to_string(response.status) : response.error)
                      << std::endl;
            resolve(id, std::vector<uint8_t>());
            return;
        }
        resolve(id, std::move(response.data));
    }, options);

    return id;
}

void NetBridge::resolve(int32_t id, std::vector<uint8_t> body) {
    auto it = requests_.find(id);
    if (it == requests_.end()) return;
    it->second = std::move(body);
}

int32_t NetBridge::httpTryRecv(int32_t id) {
    auto it = requests_.find(id);
    if (it == requests_.end() || !it->second) return kNothing;

    std::vector<uint8_t> body = std::move(*it->second);
    requests_.erase(it);
    return values_.add(HostValue::fromBytes(std::move(body)));
}

size_t NetBridge::pendingRequestCount() const {
    size_t count = 0;
    for (const auto& entry : requests_) {
        if (!entry.second) count++;
    }
    return count;
}

// ============================================================================
// Call table
// ============================================================================

void NetBridge::registerFunctions(bridge::CallTable& table) {
    table.set("ws_connect", [this](const Args& args) {
        auto url = values_.consume(bridge::arg(args, 0).asI32(), "ws_connect");
        if (!url || url->kind != HostValue::Kind::String) {
            std::cerr << "[Net] ws_connect expects a string url" << std::endl;
            return Value::none();
        }
        wsConnect(url->utf8());
        return Value::none();
    });
    table.set("ws_is_connected", [this](const Args&) {
        return Value::fromBool(wsIsConnected());
    });
    table.set("ws_send", [this](const Args& args) {
        auto value = values_.consume(bridge::arg(args, 0).asI32(), "ws_send");
        if (value) {
            wsSend(*value);
        }
        return Value::none();
    });
    table.set("ws_try_recv", [this](const Args&) {
        return Value::fromI32(wsTryRecv());
    });
    table.set("http_make_request", [this](const Args& args) {
        int32_t method = bridge::arg(args, 0).asI32();
        auto url = values_.consume(bridge::arg(args, 1).asI32(), "http_make_request");
        auto body = values_.consume(bridge::arg(args, 2).asI32(), "http_make_request");
        auto headers = values_.consume(bridge::arg(args, 3).asI32(), "http_make_request");

        std::map<std::string, std::string> headerMap;
        if (headers && headers->isRecord()) {
            for (const auto& field : *headers->fields) {
                headerMap[field.first] = fieldText(field.second);
            }
        }

        return Value::fromI32(httpMakeRequest(method, url ? url->utf8() : std::string(),
                                              body ? valueBytes(*body) : std::vector<uint8_t>(),
                                              headerMap));
    });
    table.set("http_try_recv", [this](const Args& args) {
        return Value::fromI32(httpTryRecv(bridge::arg(args, 0).asI32()));
    });
}

}  // namespace net
}  // namespace hostbridge
