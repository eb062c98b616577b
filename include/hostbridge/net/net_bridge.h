#pragma once

/**
 * Network Bridge
 *
 * The "net" call-table group: one persistent WebSocket plus any number of
 * HTTP requests, both observed by polling.
 *
 * WebSocket messages are queued as they arrive and handed out one per
 * ws_try_recv() as a host-value record {text: 0|1, data: string|bytes}.
 * HTTP requests get ids from their own counter starting at 0; the response
 * body is stored until the first http_try_recv() for that id returns it as
 * a bytes value. Failed requests resolve to an empty bytes value. Every
 * poll returns -1 while nothing is ready.
 *
 * URLs, bodies and headers arrive as host values and are consumed.
 */

#include "hostbridge/bridge/call_table.h"
#include "hostbridge/http/http_client.h"
#include "hostbridge/net/websocket.h"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostbridge {
namespace bridge {
class HostValueTable;
struct HostValue;
}

namespace net {

class NetBridge {
public:
    static constexpr uint32_t kVersion = 1;
    static constexpr int32_t kNothing = -1;

    NetBridge(bridge::HostValueTable& values, http::HttpTransport& http, SocketFactory sockets);
    ~NetBridge();

    void registerFunctions(bridge::CallTable& table);

    /**
     * Open the WebSocket, replacing (and closing) any previous one.
     */
    void wsConnect(const std::string& url);
    bool wsIsConnected() const { return connected_; }

    /**
     * Drop the current connection, if any. Queued messages stay readable.
     */
    void wsClose();

    /**
     * Send a string value as a text frame or a bytes value as binary.
     */
    bool wsSend(const bridge::HostValue& value);

    /**
     * Next received message as a record handle, or kNothing.
     */
    int32_t wsTryRecv();

    /**
     * Start a request. Returns its id; unknown methods resolve as failed.
     */
    int32_t httpMakeRequest(int32_t method, const std::string& url, std::vector<uint8_t> body,
                            const std::map<std::string, std::string>& headers);

    /**
     * Response body as a bytes handle the first time after it resolved,
     * kNothing before and after.
     */
    int32_t httpTryRecv(int32_t id);

    size_t pendingRequestCount() const;
    size_t queuedMessageCount() const { return received_.size(); }

    NetBridge(const NetBridge&) = delete;
    NetBridge& operator=(const NetBridge&) = delete;

private:
    struct Message {
        bool isText;
        std::vector<uint8_t> data;
    };

    void resolve(int32_t id, std::vector<uint8_t> body);

    bridge::HostValueTable& values_;
    http::HttpTransport& http_;
    SocketFactory sockets_;

    std::unique_ptr<Socket> socket_;
    uint64_t socketGeneration_ = 0;
    bool connected_ = false;
    std::deque<Message> received_;

    int32_t nextRequestId_ = 0;
    // nullopt while in flight; erased once handed to the guest
    std::map<int32_t, std::optional<std::vector<uint8_t>>> requests_;

    std::shared_ptr<bool> alive_;
};

}  // namespace net
}  // namespace hostbridge
