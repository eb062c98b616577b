#include "hostbridge/net/websocket.h"
#include "hostbridge/async/event_loop.h"
#include "hostbridge/http/async_http_client.h"
#include <curl/curl.h>
#include <uv.h>
#include <iostream>

namespace hostbridge {
namespace net {

namespace {

void onPollClosed(uv_handle_t* handle) {
    delete reinterpret_cast<uv_poll_t*>(handle);
}

}  // namespace

CurlWebSocket::CurlWebSocket(http::AsyncHttpClient& client, SocketEvents events)
    : client_(client), events_(std::move(events)), alive_(std::make_shared<bool>(true)) {}

CurlWebSocket::~CurlWebSocket() {
    close();
}

void CurlWebSocket::open(const std::string& url) {
    std::weak_ptr<bool> alive = alive_;
    client_.connect(url, [this, alive](CURL* easy, const std::string& error) {
        if (alive.expired()) {
            if (easy) curl_easy_cleanup(easy);
            return;
        }
        onConnected(easy, error);
    });
}

void CurlWebSocket::onConnected(CURL* easy, const std::string& error) {
    if (closed_) {
        if (easy) curl_easy_cleanup(easy);
        return;
    }
    if (!easy) {
        fail(error.empty() ? "connection failed" : error);
        return;
    }

    easy_ = easy;

    curl_socket_t sockfd = CURL_SOCKET_BAD;
    CURLcode rc = curl_easy_getinfo(easy_, CURLINFO_ACTIVESOCKET, &sockfd);
    uv_loop_t* loop = client_.loop().handle();
    if (rc != CURLE_OK || sockfd == CURL_SOCKET_BAD || !loop) {
        fail("no active socket after upgrade");
        return;
    }

    poll_ = new uv_poll_t;
    int uvrc = uv_poll_init_socket(loop, poll_, sockfd);
    if (uvrc != 0) {
        delete poll_;
        poll_ = nullptr;
        fail(uv_strerror(uvrc));
        return;
    }
    poll_->data = this;

    open_ = true;
    updatePoll();
    std::cout << "[Net] WebSocket connected" << std::endl;
    if (events_.onOpen) events_.onOpen();

    // Frames may have arrived together with the upgrade response
    onReadable();
}

void CurlWebSocket::updatePoll() {
    if (!poll_) return;
    int events = UV_READABLE;
    if (!outgoing_.empty()) events |= UV_WRITABLE;
    uv_poll_start(poll_, events, &CurlWebSocket::onPoll);
}

void CurlWebSocket::onPoll(uv_poll_t* handle, int status, int events) {
    auto* self = static_cast<CurlWebSocket*>(handle->data);
    if (!self) return;

    if (status < 0) {
        self->fail(uv_strerror(status));
        return;
    }
    if (events & UV_WRITABLE) {
        self->flushOutgoing();
    }
    if ((events & UV_READABLE) && self->open_) {
        self->onReadable();
    }
}

void CurlWebSocket::onReadable() {
    uint8_t buffer[16384];

    while (open_) {
        size_t received = 0;
        struct curl_ws_frame* meta = nullptr;
        CURLcode rc = curl_ws_recv(easy_, buffer, sizeof(buffer), &received, &meta);
        if (rc == CURLE_AGAIN) {
            return;
        }
        if (rc != CURLE_OK || !meta) {
            fail(curl_easy_strerror(rc));
            return;
        }

        if (meta->flags & CURLWS_CLOSE) {
            fail("closed by peer");
            return;
        }
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
            continue;
        }

        if (partial_.empty() && meta->offset == 0) {
            partialIsText_ = (meta->flags & CURLWS_TEXT) != 0;
        }
        partial_.insert(partial_.end(), buffer, buffer + received);

        bool lastFragment = !(meta->flags & CURLWS_CONT);
        if (meta->bytesleft == 0 && lastFragment) {
            std::vector<uint8_t> message;
            message.swap(partial_);
            if (events_.onMessage) events_.onMessage(partialIsText_, std::move(message));
        }
    }
}

bool CurlWebSocket::send(const uint8_t* data, size_t size, bool isText) {
    if (!open_) {
        std::cerr << "[Net] send on a WebSocket that is not open" << std::endl;
        return false;
    }
    Frame frame;
    frame.isText = isText;
    frame.data.assign(data, data + size);
    outgoing_.push_back(std::move(frame));
    flushOutgoing();
    return true;
}

void CurlWebSocket::flushOutgoing() {
    while (open_ && !outgoing_.empty()) {
        Frame& frame = outgoing_.front();
        size_t sent = 0;
        const uint8_t* remaining = frame.data.data() + frame.offset;
        size_t remainingSize = frame.data.size() - frame.offset;

        CURLcode rc = curl_ws_send(easy_, remaining, remainingSize, &sent, 0,
                                   frame.isText ? CURLWS_TEXT : CURLWS_BINARY);
        if (rc == CURLE_AGAIN) {
            frame.offset += sent;
            break;
        }
        if (rc != CURLE_OK) {
            fail(curl_easy_strerror(rc));
            return;
        }
        frame.offset += sent;
        if (frame.offset >= frame.data.size()) {
            outgoing_.pop_front();
        }
    }
    updatePoll();
}

void CurlWebSocket::fail(const std::string& reason) {
    bool wasOpen = open_;
    std::cerr << "[Net] WebSocket " << (wasOpen ? "closed: " : "connect failed: ") << reason << std::endl;
    close();
    if (events_.onClose) events_.onClose(reason);
}

void CurlWebSocket::close() {
    if (closed_) return;
    closed_ = true;
    open_ = false;

    if (poll_) {
        uv_poll_stop(poll_);
        poll_->data = nullptr;
        uv_close(reinterpret_cast<uv_handle_t*>(poll_), onPollClosed);
        poll_ = nullptr;
    }
    if (easy_) {
        size_t sent = 0;
        curl_ws_send(easy_, "", 0, &sent, 0, CURLWS_CLOSE);
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
    outgoing_.clear();
    partial_.clear();
}

SocketFactory curlSocketFactory(http::AsyncHttpClient& client) {
    return [&client](const std::string& url, SocketEvents events) -> std::unique_ptr<Socket> {
        auto socket = std::make_unique<CurlWebSocket>(client, std::move(events));
        socket->open(url);
        return socket;
    };
}

} // namespace net
} // namespace hostbridge
