#pragma once

/**
 * Async HTTP Client using curl_multi + libuv
 *
 * Non-blocking HTTP requests integrated with the libuv event loop.
 * Requests are started immediately and callbacks are invoked when
 * responses arrive, without blocking the main thread.
 *
 * Usage:
 *   http::AsyncHttpClient client(loop);
 *   client.init();
 *   client.request("GET", "https://example.com/data.bin", {}, [](HttpResponse response) {
 *       if (response.ok) {
 *           // Process response.data
 *       }
 *   });
 *
 * Callbacks run on the main thread during processCompletedRequests().
 *
 * The same multi handle also drives connect-only transfers (WebSocket
 * upgrades): connect() hands the upgraded easy handle to the caller.
 */

#include "hostbridge/http/http_client.h"
#include <memory>
#include <string>

// Forward declare CURL types to avoid including curl.h in header
typedef void CURL;
typedef void CURLM;
struct curl_slist;

namespace hostbridge {
namespace async {
class EventLoop;
}

namespace http {

/**
 * Callback for connect-only transfers. On success `easy` is a connected
 * handle now owned by the callee (curl_easy_cleanup it when done) and
 * `error` is empty. On failure `easy` is nullptr.
 */
using ConnectCallback = std::function<void(CURL* easy, const std::string& error)>;

class AsyncHttpClient : public HttpTransport {
public:
    explicit AsyncHttpClient(async::EventLoop& loop);
    ~AsyncHttpClient() override;

    /**
     * Initialize the client.
     * Must be called after EventLoop::init().
     * Safe to call multiple times (idempotent).
     */
    bool init();

    /**
     * Fail all pending requests and release curl/libuv resources.
     */
    void shutdown();

    bool isReady() const;

    void request(const std::string& method,
                 const std::string& url,
                 const std::vector<uint8_t>& body,
                 AsyncHttpCallback callback,
                 const HttpOptions& options = {}) override;

    /**
     * Start a connect-only transfer (CURLOPT_CONNECT_ONLY = 2): performs the
     * HTTP upgrade handshake for ws:// and wss:// URLs and stops there.
     */
    void connect(const std::string& url,
                 ConnectCallback callback,
                 const HttpOptions& options = {});

    /**
     * Number of in-flight transfers.
     */
    int activeRequestCount() const;

    async::EventLoop& loop() { return loop_; }

    /**
     * Process completed transfers, invoking their callbacks.
     * Call this from the main loop after EventLoop::runOnce().
     * Returns true if any callbacks were invoked.
     */
    bool processCompletedRequests();

    AsyncHttpClient(const AsyncHttpClient&) = delete;
    AsyncHttpClient& operator=(const AsyncHttpClient&) = delete;

private:
    // Internal implementation (pimpl pattern to hide curl/libuv details)
    struct Impl;
    std::unique_ptr<Impl> impl_;
    async::EventLoop& loop_;
};

} // namespace http
} // namespace hostbridge
