#pragma once

/**
 * WebSocket transport
 *
 * Socket is the seam the network bridge talks to; CurlWebSocket is the
 * libcurl implementation. All events are delivered on the main thread from
 * inside EventLoop::runOnce() / AsyncHttpClient::processCompletedRequests().
 */

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

typedef void CURL;
typedef struct uv_poll_s uv_poll_t;

namespace hostbridge {
namespace http {
class AsyncHttpClient;
}

namespace net {

struct SocketEvents {
    std::function<void()> onOpen;
    std::function<void(bool isText, std::vector<uint8_t> data)> onMessage;
    std::function<void(const std::string& reason)> onClose;
};

class Socket {
public:
    virtual ~Socket() = default;

    virtual bool isOpen() const = 0;

    /**
     * Queue one frame. Returns false if the socket is not open.
     */
    virtual bool send(const uint8_t* data, size_t size, bool isText) = 0;

    virtual void close() = 0;
};

/**
 * Creates a connecting socket for a URL. Returns nullptr if the connection
 * could not even be started.
 */
using SocketFactory = std::function<std::unique_ptr<Socket>(const std::string& url, SocketEvents events)>;

/**
 * WebSocket over libcurl's connect-only mode.
 *
 * The upgrade handshake runs on the AsyncHttpClient multi handle; after that
 * the socket is watched with its own uv_poll handle and frames are read
 * with curl_ws_recv until it reports CURLE_AGAIN.
 */
class CurlWebSocket : public Socket {
public:
    CurlWebSocket(http::AsyncHttpClient& client, SocketEvents events);
    ~CurlWebSocket() override;

    /**
     * Start the handshake.
     */
    void open(const std::string& url);

    bool isOpen() const override { return open_; }
    bool send(const uint8_t* data, size_t size, bool isText) override;
    void close() override;

    CurlWebSocket(const CurlWebSocket&) = delete;
    CurlWebSocket& operator=(const CurlWebSocket&) = delete;

private:
    struct Frame {
        bool isText;
        std::vector<uint8_t> data;
        size_t offset = 0;
    };

    void onConnected(CURL* easy, const std::string& error);
    void onReadable();
    void flushOutgoing();
    void updatePoll();
    void fail(const std::string& reason);

    static void onPoll(uv_poll_t* handle, int status, int events);

    http::AsyncHttpClient& client_;
    SocketEvents events_;
    CURL* easy_ = nullptr;
    uv_poll_t* poll_ = nullptr;
    bool open_ = false;
    bool closed_ = false;

    std::vector<uint8_t> partial_;  // fragments of the current message
    bool partialIsText_ = false;
    std::deque<Frame> outgoing_;

    // Guards the connect callback against this object being destroyed first
    std::shared_ptr<bool> alive_;
};

/**
 * Factory producing CurlWebSockets on the given client.
 */
SocketFactory curlSocketFactory(http::AsyncHttpClient& client);

} // namespace net
} // namespace hostbridge
