#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hostbridge {
namespace http {

/**
 * HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    long timeout = 30;  // seconds
    bool verifySSL = true;
};

/**
 * HTTP response
 */
struct HttpResponse {
    bool ok = false;
    int status = 0;
    std::string url;
    std::string error;
    std::vector<uint8_t> data;
    std::map<std::string, std::string> headers;
};

/**
 * Request method codes used by the guest (http_make_request).
 */
enum class HttpMethod : int32_t {
    Post = 0,
    Put = 1,
    Get = 2,
    Delete = 3
};

/**
 * Method name for a guest method code, or nullptr for unknown codes.
 */
inline const char* methodName(int32_t code) {
    switch (static_cast<HttpMethod>(code)) {
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Get: return "GET";
        case HttpMethod::Delete: return "DELETE";
    }
    return nullptr;
}

/**
 * Callback type for async HTTP responses.
 * Called on the main thread when the request completes (success or failure).
 */
using AsyncHttpCallback = std::function<void(HttpResponse)>;

/**
 * Anything that can run an HTTP request asynchronously.
 * AsyncHttpClient is the real implementation; the network and file
 * bridges only depend on this interface.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Start a request. Returns immediately; the callback is invoked exactly
     * once, on the main thread, on success and on failure alike.
     */
    virtual void request(const std::string& method,
                         const std::string& url,
                         const std::vector<uint8_t>& body,
                         AsyncHttpCallback callback,
                         const HttpOptions& options = {}) = 0;
};

} // namespace http
} // namespace hostbridge
