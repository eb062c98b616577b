#include "hostbridge/async/event_loop.h"
#include <iostream>

namespace hostbridge {
namespace async {

EventLoop::~EventLoop() {
    shutdown();
}

bool EventLoop::init() {
    if (initialized_) return true;

    int status = uv_loop_init(&loop_);
    if (status != 0) {
        std::cerr << "[EventLoop] uv_loop_init failed: " << uv_strerror(status) << std::endl;
        return false;
    }

    initialized_ = true;
    std::cout << "[EventLoop] Using libuv " << uv_version_string() << std::endl;
    return true;
}

bool EventLoop::runOnce() {
    if (!initialized_) return false;
    // Called once per host frame, so it must never wait
    return uv_run(&loop_, UV_RUN_NOWAIT) != 0;
}

void EventLoop::shutdown() {
    if (!initialized_) return;

    // The curl poll handles and the file reader close theirs before this;
    // a handle still open here belongs to a bridge that was never shut down.
    int leftover = 0;
    uv_walk(&loop_, [](uv_handle_t* handle, void* arg) {
        if (uv_is_closing(handle)) return;
        ++*static_cast<int*>(arg);
        uv_close(handle, nullptr);
    }, &leftover);
    if (leftover > 0) {
        std::cerr << "[EventLoop] Closed " << leftover << " handle(s) still open at shutdown" << std::endl;
    }

    while (uv_run(&loop_, UV_RUN_ONCE) != 0) {
    }

    int status = uv_loop_close(&loop_);
    if (status != 0) {
        std::cerr << "[EventLoop] uv_loop_close: " << uv_strerror(status) << std::endl;
    }
    initialized_ = false;
}

uv_loop_t* EventLoop::handle() {
    return initialized_ ? &loop_ : nullptr;
}

}  // namespace async
}  // namespace hostbridge
