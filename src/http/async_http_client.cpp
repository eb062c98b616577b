/**
 * Async HTTP Client Implementation
 *
 * Uses curl_multi API with libuv for non-blocking HTTP requests.
 * Socket events are monitored via uv_poll_t, timeouts via uv_timer_t.
 *
 * IMPORTANT: Callbacks are queued and processed separately via processCompletedRequests()
 * to ensure they run on the main thread at a known point of the frame, not from
 * within libuv callbacks.
 */

#include "hostbridge/http/async_http_client.h"
#include "hostbridge/async/event_loop.h"
#include <curl/curl.h>
#include <uv.h>
#include <cctype>
#include <cstring>
#include <iostream>
#include <queue>
#include <unordered_map>

namespace hostbridge {
namespace http {

struct AsyncHttpClientImpl;

/**
 * Context for each transfer
 */
struct RequestContext {
    CURL* easy = nullptr;
    bool connectOnly = false;
    AsyncHttpCallback callback;
    ConnectCallback connectCallback;
    HttpResponse response;
    struct curl_slist* headerList = nullptr;
    std::vector<uint8_t> postData;  // Keep POST data alive

    ~RequestContext() {
        if (headerList) {
            curl_slist_free_all(headerList);
        }
        // Note: easy handle ownership is resolved by checkCompletedTransfers
    }
};

/**
 * Context for each socket being monitored
 */
struct SocketContext {
    uv_poll_t poll;
    curl_socket_t sockfd;
    AsyncHttpClientImpl* impl;

    SocketContext() {
        memset(&poll, 0, sizeof(poll));
    }
};

struct AsyncHttpClientImpl {
    uv_loop_t* loop = nullptr;
    CURLM* multiHandle = nullptr;
    uv_timer_t timeoutTimer;
    bool initialized = false;
    int activeRequests = 0;

    std::unordered_map<curl_socket_t, std::unique_ptr<SocketContext>> sockets;
    std::unordered_map<CURL*, std::unique_ptr<RequestContext>> requests;

    // Completions waiting for processCompletedRequests()
    std::queue<std::function<void()>> completedQueue;

    AsyncHttpClientImpl() {
        memset(&timeoutTimer, 0, sizeof(timeoutTimer));
    }

    void queueCompletion(RequestContext& ctx, CURLcode result) {
        CURL* easy = ctx.easy;

        if (ctx.connectOnly) {
            auto cb = std::move(ctx.connectCallback);
            curl_multi_remove_handle(multiHandle, easy);
            if (result == CURLE_OK) {
                // The connection stays attached to the easy handle
                completedQueue.push([cb, easy]() {
                    if (cb) {
                        cb(easy, std::string());
                    } else {
                        curl_easy_cleanup(easy);
                    }
                });
            } else {
                std::string error = curl_easy_strerror(result);
                curl_easy_cleanup(easy);
                completedQueue.push([cb, error]() {
                    if (cb) cb(nullptr, error);
                });
            }
            return;
        }

        if (result == CURLE_OK) {
            long httpCode = 0;
            curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &httpCode);
            ctx.response.status = static_cast<int>(httpCode);
            ctx.response.ok = (httpCode >= 200 && httpCode < 300);
            if (!ctx.response.ok) {
                ctx.response.error = "HTTP status " + std::to_string(httpCode);
            }

            char* finalUrl = nullptr;
            curl_easy_getinfo(easy, CURLINFO_EFFECTIVE_URL, &finalUrl);
            if (finalUrl) {
                ctx.response.url = finalUrl;
            }
        } else {
            ctx.response.ok = false;
            ctx.response.error = curl_easy_strerror(result);
        }

        auto cb = std::make_shared<AsyncHttpCallback>(std::move(ctx.callback));
        auto response = std::make_shared<HttpResponse>(std::move(ctx.response));
        completedQueue.push([cb, response]() {
            if (*cb) (*cb)(std::move(*response));
        });

        curl_multi_remove_handle(multiHandle, easy);
        curl_easy_cleanup(easy);
    }

    // Check for completed transfers and queue them
    void checkCompletedTransfers() {
        if (!multiHandle) return;

        CURLMsg* msg;
        int msgsLeft;
        while ((msg = curl_multi_info_read(multiHandle, &msgsLeft))) {
            if (msg->msg != CURLMSG_DONE) continue;

            auto it = requests.find(msg->easy_handle);
            if (it == requests.end()) continue;

            queueCompletion(*it->second, msg->data.result);
            requests.erase(it);
            activeRequests--;
        }
    }
};

struct AsyncHttpClient::Impl : public AsyncHttpClientImpl {};

// ============================================================================
// CURL Callbacks
// ============================================================================

static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realSize = size * nmemb;
    auto* ctx = static_cast<RequestContext*>(userp);

    const uint8_t* data = static_cast<const uint8_t*>(contents);
    ctx->response.data.insert(ctx->response.data.end(), data, data + realSize);

    return realSize;
}

static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t realSize = size * nitems;
    auto* ctx = static_cast<RequestContext*>(userdata);

    std::string line(buffer, realSize);

    size_t colonPos = line.find(':');
    if (colonPos != std::string::npos) {
        std::string key = line.substr(0, colonPos);
        std::string value = line.substr(colonPos + 1);

        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) value.pop_back();

        for (char& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        ctx->response.headers[key] = value;
    }

    return realSize;
}

// ============================================================================
// libuv Callbacks
// ============================================================================

static void onPollCallback(uv_poll_t* handle, int status, int events) {
    auto* sockCtx = static_cast<SocketContext*>(handle->data);
    if (!sockCtx || !sockCtx->impl) return;

    auto* impl = sockCtx->impl;

    int flags = 0;
    if (events & UV_READABLE) flags |= CURL_CSELECT_IN;
    if (events & UV_WRITABLE) flags |= CURL_CSELECT_OUT;
    if (status < 0) flags |= CURL_CSELECT_ERR;

    int runningHandles = 0;
    curl_multi_socket_action(impl->multiHandle, sockCtx->sockfd, flags, &runningHandles);

    impl->checkCompletedTransfers();
}

static void onTimeoutCallback(uv_timer_t* handle) {
    auto* impl = static_cast<AsyncHttpClientImpl*>(handle->data);
    if (!impl || !impl->multiHandle) return;

    int runningHandles = 0;
    curl_multi_socket_action(impl->multiHandle, CURL_SOCKET_TIMEOUT, 0, &runningHandles);

    impl->checkCompletedTransfers();
}

/**
 * uv_close is async, so the socket context is freed only here
 */
static void onPollCloseCallback(uv_handle_t* handle) {
    auto* sockCtx = static_cast<SocketContext*>(handle->data);
    delete sockCtx;
}

static int socketCallback(CURL* easy, curl_socket_t s, int what, void* userp, void* socketp) {
    (void)easy;
    (void)socketp;
    auto* impl = static_cast<AsyncHttpClientImpl*>(userp);
    if (!impl || !impl->loop) return 0;

    if (what == CURL_POLL_REMOVE) {
        auto it = impl->sockets.find(s);
        if (it != impl->sockets.end()) {
            uv_poll_stop(&it->second->poll);
            SocketContext* sockCtx = it->second.release();
            impl->sockets.erase(it);
            uv_close(reinterpret_cast<uv_handle_t*>(&sockCtx->poll), onPollCloseCallback);
        }
    } else {
        int events = 0;
        if (what & CURL_POLL_IN) events |= UV_READABLE;
        if (what & CURL_POLL_OUT) events |= UV_WRITABLE;

        auto it = impl->sockets.find(s);
        if (it == impl->sockets.end()) {
            auto sockCtx = std::make_unique<SocketContext>();
            sockCtx->sockfd = s;
            sockCtx->impl = impl;
            sockCtx->poll.data = sockCtx.get();

            int rc = uv_poll_init_socket(impl->loop, &sockCtx->poll, s);
            if (rc != 0) {
                std::cerr << "[AsyncHttp] uv_poll_init_socket failed: " << uv_strerror(rc) << std::endl;
                return -1;
            }
            uv_poll_start(&sockCtx->poll, events, onPollCallback);

            curl_multi_assign(impl->multiHandle, s, sockCtx.get());
            impl->sockets[s] = std::move(sockCtx);
        } else {
            uv_poll_start(&it->second->poll, events, onPollCallback);
        }
    }

    return 0;
}

static int timerCallback(CURLM* multi, long timeout_ms, void* userp) {
    (void)multi;
    auto* impl = static_cast<AsyncHttpClientImpl*>(userp);
    if (!impl) return 0;

    if (timeout_ms < 0) {
        uv_timer_stop(&impl->timeoutTimer);
    } else {
        // A timeout of 0 means call curl immediately
        uv_timer_start(&impl->timeoutTimer, onTimeoutCallback,
                       timeout_ms == 0 ? 1 : timeout_ms, 0);
    }

    return 0;
}

static void applyCommonOptions(CURL* easy, const HttpOptions& options, curl_slist** headerList) {
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, options.verifySSL ? 1L : 0L);
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, options.verifySSL ? 2L : 0L);

    for (const auto& [key, value] : options.headers) {
        std::string header = key + ": " + value;
        *headerList = curl_slist_append(*headerList, header.c_str());
    }
    if (*headerList) {
        curl_easy_setopt(easy, CURLOPT_HTTPHEADER, *headerList);
    }

    curl_easy_setopt(easy, CURLOPT_USERAGENT, "hostbridge/0.1 (async)");
}

// ============================================================================
// AsyncHttpClient Implementation
// ============================================================================

AsyncHttpClient::AsyncHttpClient(async::EventLoop& loop)
    : impl_(std::make_unique<Impl>()), loop_(loop) {}

AsyncHttpClient::~AsyncHttpClient() {
    shutdown();
}

bool AsyncHttpClient::init() {
    if (impl_->initialized) return true;

    uv_loop_t* loop = loop_.handle();
    if (!loop) {
        std::cerr << "[AsyncHttp] Cannot initialize: EventLoop not available" << std::endl;
        return false;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    impl_->multiHandle = curl_multi_init();
    if (!impl_->multiHandle) {
        std::cerr << "[AsyncHttp] Failed to create curl multi handle" << std::endl;
        curl_global_cleanup();
        return false;
    }

    impl_->loop = loop;

    curl_multi_setopt(impl_->multiHandle, CURLMOPT_SOCKETFUNCTION, socketCallback);
    curl_multi_setopt(impl_->multiHandle, CURLMOPT_SOCKETDATA, impl_.get());
    curl_multi_setopt(impl_->multiHandle, CURLMOPT_TIMERFUNCTION, timerCallback);
    curl_multi_setopt(impl_->multiHandle, CURLMOPT_TIMERDATA, impl_.get());

    uv_timer_init(loop, &impl_->timeoutTimer);
    impl_->timeoutTimer.data = impl_.get();

    impl_->initialized = true;
    std::cout << "[AsyncHttp] Initialized with curl_multi + libuv" << std::endl;
    return true;
}

void AsyncHttpClient::shutdown() {
    if (!impl_->initialized) return;

    for (auto& [easy, ctx] : impl_->requests) {
        if (ctx->connectOnly) {
            if (ctx->connectCallback) {
                auto cb = std::move(ctx->connectCallback);
                impl_->completedQueue.push([cb]() { cb(nullptr, "Request cancelled: shutdown"); });
            }
        } else if (ctx->callback) {
            ctx->response.ok = false;
            ctx->response.error = "Request cancelled: shutdown";
            auto cb = std::make_shared<AsyncHttpCallback>(std::move(ctx->callback));
            auto response = std::make_shared<HttpResponse>(std::move(ctx->response));
            impl_->completedQueue.push([cb, response]() { (*cb)(std::move(*response)); });
        }
        curl_multi_remove_handle(impl_->multiHandle, easy);
        curl_easy_cleanup(easy);
    }
    impl_->requests.clear();

    while (!impl_->completedQueue.empty()) {
        auto completed = std::move(impl_->completedQueue.front());
        impl_->completedQueue.pop();
        completed();
    }

    for (auto& [fd, sockCtx] : impl_->sockets) {
        uv_poll_stop(&sockCtx->poll);
        SocketContext* released = sockCtx.release();
        uv_close(reinterpret_cast<uv_handle_t*>(&released->poll), onPollCloseCallback);
    }
    impl_->sockets.clear();

    uv_timer_stop(&impl_->timeoutTimer);
    uv_close(reinterpret_cast<uv_handle_t*>(&impl_->timeoutTimer), nullptr);

    // Let the loop finish the closes while impl_ is still alive
    if (impl_->loop) {
        uv_run(impl_->loop, UV_RUN_NOWAIT);
    }

    if (impl_->multiHandle) {
        curl_multi_cleanup(impl_->multiHandle);
        impl_->multiHandle = nullptr;
    }

    curl_global_cleanup();

    impl_->initialized = false;
    impl_->activeRequests = 0;
    impl_->loop = nullptr;
    std::cout << "[AsyncHttp] Shutdown complete" << std::endl;
}

bool AsyncHttpClient::isReady() const {
    return impl_->initialized;
}

void AsyncHttpClient::request(const std::string& method,
                              const std::string& url,
                              const std::vector<uint8_t>& body,
                              AsyncHttpCallback callback,
                              const HttpOptions& options) {
    if (!impl_->initialized) {
        init();
    }

    if (!impl_->initialized || !impl_->multiHandle) {
        HttpResponse response;
        response.ok = false;
        response.error = "AsyncHttpClient not initialized";
        if (callback) callback(std::move(response));
        return;
    }

    CURL* easy = curl_easy_init();
    if (!easy) {
        HttpResponse response;
        response.ok = false;
        response.error = "Failed to create CURL handle";
        if (callback) callback(std::move(response));
        return;
    }

    auto ctx = std::make_unique<RequestContext>();
    ctx->easy = easy;
    ctx->callback = std::move(callback);
    ctx->response.url = url;

    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());

    if (method == "POST") {
        curl_easy_setopt(easy, CURLOPT_POST, 1L);
        ctx->postData = body;  // Keep data alive
        curl_easy_setopt(easy, CURLOPT_POSTFIELDS, ctx->postData.data());
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(ctx->postData.size()));
    } else if (method == "PUT") {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, "PUT");
        if (!body.empty()) {
            ctx->postData = body;
            curl_easy_setopt(easy, CURLOPT_POSTFIELDS, ctx->postData.data());
            curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(ctx->postData.size()));
        }
    } else if (method == "DELETE") {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, ctx.get());
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, ctx.get());
    curl_easy_setopt(easy, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(easy, CURLOPT_TIMEOUT, options.timeout > 0 ? options.timeout : 30L);
    applyCommonOptions(easy, options, &ctx->headerList);

    impl_->requests[easy] = std::move(ctx);
    impl_->activeRequests++;

    curl_multi_add_handle(impl_->multiHandle, easy);

    int runningHandles = 0;
    curl_multi_socket_action(impl_->multiHandle, CURL_SOCKET_TIMEOUT, 0, &runningHandles);
}

void AsyncHttpClient::connect(const std::string& url,
                              ConnectCallback callback,
                              const HttpOptions& options) {
    if (!impl_->initialized) {
        init();
    }

    CURL* easy = impl_->initialized ? curl_easy_init() : nullptr;
    if (!easy) {
        if (callback) callback(nullptr, "AsyncHttpClient not initialized");
        return;
    }

    auto ctx = std::make_unique<RequestContext>();
    ctx->easy = easy;
    ctx->connectOnly = true;
    ctx->connectCallback = std::move(callback);

    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    // 2 = do the WebSocket upgrade, then stop and keep the connection
    curl_easy_setopt(easy, CURLOPT_CONNECT_ONLY, 2L);
    applyCommonOptions(easy, options, &ctx->headerList);

    impl_->requests[easy] = std::move(ctx);
    impl_->activeRequests++;

    curl_multi_add_handle(impl_->multiHandle, easy);

    int runningHandles = 0;
    curl_multi_socket_action(impl_->multiHandle, CURL_SOCKET_TIMEOUT, 0, &runningHandles);
}

int AsyncHttpClient::activeRequestCount() const {
    return impl_->activeRequests;
}

bool AsyncHttpClient::processCompletedRequests() {
    if (!impl_->initialized) return false;

    bool hadCallbacks = !impl_->completedQueue.empty();

    while (!impl_->completedQueue.empty()) {
        auto completed = std::move(impl_->completedQueue.front());
        impl_->completedQueue.pop();
        completed();
    }

    return hadCallbacks;
}

} // namespace http
} // namespace hostbridge
