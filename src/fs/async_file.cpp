/**
 * Async File I/O Implementation
 *
 * Uses libuv's uv_queue_work to perform file reads on a thread pool,
 * keeping the main thread free for rendering.
 *
 * IMPORTANT: Callbacks are queued and processed separately via processCompletedReads()
 * so they run at a known point of the frame, not from within libuv callbacks.
 */

#include "hostbridge/fs/async_file.h"
#include "hostbridge/async/event_loop.h"
#include <uv.h>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>

namespace hostbridge {
namespace fs {

/**
 * Completed read waiting for callback invocation
 */
struct CompletedRead {
    AsyncFileCallback callback;
    std::vector<uint8_t> data;
    std::string error;
};

/**
 * Shared with in-flight work so completions arriving after shutdown
 * still have somewhere to go.
 */
struct AsyncFileReader::Impl {
    bool initialized = false;
    int pending = 0;
    std::queue<CompletedRead> completedQueue;
    std::mutex queueMutex;

    void queueCompleted(AsyncFileCallback callback, std::vector<uint8_t> data, std::string error) {
        std::lock_guard<std::mutex> lock(queueMutex);
        completedQueue.push({std::move(callback), std::move(data), std::move(error)});
    }
};

/**
 * Context for a single pool operation
 */
struct ReadContext {
    uv_work_t work;
    PoolTask task;
    AsyncFileCallback callback;
    std::vector<uint8_t> data;
    std::string error;
    std::shared_ptr<AsyncFileReader::Impl> owner;
};

bool readFileSync(const std::string& path, std::vector<uint8_t>& data, std::string& error) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        error = "Failed to open file: " + path;
        return false;
    }

    std::streamoff size = file.tellg();
    if (size < 0) {
        error = "Failed to read file: " + path;
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        error = "Failed to read file: " + path;
        data.clear();
        return false;
    }
    return true;
}

/**
 * Worker function - runs on thread pool
 */
static void taskWorker(uv_work_t* req) {
    auto* ctx = static_cast<ReadContext*>(req->data);
    ctx->task(ctx->data, ctx->error);
    if (!ctx->error.empty()) {
        ctx->data.clear();
    }
}

/**
 * After work callback - runs on the loop thread
 */
static void taskAfterWork(uv_work_t* req, int status) {
    auto* ctx = static_cast<ReadContext*>(req->data);

    if (status == UV_ECANCELED) {
        ctx->error = "File read cancelled";
        ctx->data.clear();
    }

    ctx->owner->pending--;
    ctx->owner->queueCompleted(std::move(ctx->callback), std::move(ctx->data), std::move(ctx->error));

    delete ctx;
}

// ============================================================================
// AsyncFileReader Implementation
// ============================================================================

AsyncFileReader::AsyncFileReader(async::EventLoop& loop)
    : impl_(std::make_shared<Impl>()), loop_(loop) {}

AsyncFileReader::~AsyncFileReader() {
    shutdown();
}

bool AsyncFileReader::init() {
    if (impl_->initialized) return true;

    if (!loop_.isAvailable()) {
        std::cerr << "[AsyncFile] Cannot initialize: EventLoop not available" << std::endl;
        return false;
    }

    impl_->initialized = true;
    std::cout << "[AsyncFile] Initialized with libuv thread pool" << std::endl;
    return true;
}

void AsyncFileReader::shutdown() {
    impl_->initialized = false;
}

bool AsyncFileReader::isReady() const {
    return impl_->initialized;
}

void AsyncFileReader::readFile(const std::string& path, AsyncFileCallback callback) {
    runTask([path](std::vector<uint8_t>& data, std::string& error) {
        readFileSync(path, data, error);
    }, std::move(callback));
}

void AsyncFileReader::runTask(PoolTask task, AsyncFileCallback callback) {
    uv_loop_t* loop = impl_->initialized ? loop_.handle() : nullptr;
    if (!loop) {
        // No pool: run inline but still deliver through the completion queue
        std::vector<uint8_t> data;
        std::string error;
        task(data, error);
        if (!error.empty()) data.clear();
        impl_->queueCompleted(std::move(callback), std::move(data), std::move(error));
        return;
    }

    auto* ctx = new ReadContext();
    ctx->work.data = ctx;
    ctx->task = std::move(task);
    ctx->callback = std::move(callback);
    ctx->owner = impl_;

    int result = uv_queue_work(loop, &ctx->work, taskWorker, taskAfterWork);
    if (result != 0) {
        std::cerr << "[AsyncFile] Failed to queue work: " << uv_strerror(result) << std::endl;
        impl_->queueCompleted(std::move(ctx->callback), {}, "Failed to queue file read");
        delete ctx;
        return;
    }
    impl_->pending++;
}

int AsyncFileReader::pendingCount() const {
    return impl_->pending;
}

bool AsyncFileReader::processCompletedReads() {
    std::queue<CompletedRead> toProcess;
    {
        std::lock_guard<std::mutex> lock(impl_->queueMutex);
        std::swap(toProcess, impl_->completedQueue);
    }

    bool hadCallbacks = !toProcess.empty();

    while (!toProcess.empty()) {
        auto completed = std::move(toProcess.front());
        toProcess.pop();

        if (completed.callback) {
            completed.callback(std::move(completed.data), std::move(completed.error));
        }
    }

    return hadCallbacks;
}

} // namespace fs
} // namespace hostbridge
