#pragma once

/**
 * EventLoop
 *
 * The libuv loop behind every asynchronous bridge: audio decode work, HTTP
 * and WebSocket socket polling, and file reads. BridgeContext owns one and
 * pumps it once per host frame; tests create their own.
 */

#include <uv.h>

namespace hostbridge {
namespace async {

class EventLoop {
public:
    EventLoop() = default;
    ~EventLoop();

    /** Returns false if libuv could not create the loop. Repeat calls are no-ops. */
    bool init();

    /**
     * Dispatch whatever is ready without waiting. Returns true while handles
     * or requests remain active.
     */
    bool runOnce();

    /**
     * Run until the given predicate holds or the loop runs out of work.
     * Blocks. Only meant for shutdown draining and tests.
     */
    template <typename Pred>
    bool runUntil(Pred done) {
        if (!initialized_) return done();
        while (!done()) {
            if (uv_run(&loop_, UV_RUN_ONCE) == 0 && !done()) {
                return false;
            }
        }
        return true;
    }

    /** Close any handle still open, drain close callbacks and close the loop. */
    void shutdown();

    /** nullptr until init() succeeds. */
    uv_loop_t* handle();

    bool isAvailable() const { return initialized_; }

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

private:
    uv_loop_t loop_;
    bool initialized_ = false;
};

}  // namespace async
}  // namespace hostbridge
