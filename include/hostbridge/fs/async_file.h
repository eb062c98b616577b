#pragma once

/**
 * Async File I/O using libuv thread pool
 *
 * Non-blocking file reading that integrates with the libuv event loop.
 * File reads happen on a thread pool and callbacks are invoked when the
 * data is ready, without blocking the main thread.
 *
 * Usage:
 *   fs::AsyncFileReader reader(loop);
 *   reader.init();
 *   reader.readFile("./assets/level.bin", [](std::vector<uint8_t> data, std::string error) {
 *       if (error.empty()) {
 *           // Process data
 *       }
 *   });
 *
 * Callbacks run on the main thread during processCompletedReads().
 */

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hostbridge {
namespace async {
class EventLoop;
}

namespace fs {

/**
 * Callback type for async file reads.
 * If error is non-empty, data will be empty.
 */
using AsyncFileCallback = std::function<void(std::vector<uint8_t> data, std::string error)>;

/**
 * Work run on the thread pool. Fills data or error.
 */
using PoolTask = std::function<void(std::vector<uint8_t>& data, std::string& error)>;

class AsyncFileReader {
public:
    explicit AsyncFileReader(async::EventLoop& loop);
    ~AsyncFileReader();

    /**
     * Must be called after EventLoop::init().
     */
    bool init();

    void shutdown();

    bool isReady() const;

    /**
     * Read a whole file asynchronously.
     */
    void readFile(const std::string& path, AsyncFileCallback callback);

    /**
     * Run an arbitrary byte-producing task on the thread pool and deliver
     * its result the same way as a file read (used for audio decoding).
     */
    void runTask(PoolTask task, AsyncFileCallback callback);

    /**
     * Number of reads/tasks queued or running on the pool.
     */
    int pendingCount() const;

    /**
     * Process completed reads, invoking their callbacks.
     * Call this from the main loop after EventLoop::runOnce().
     * Returns true if any callbacks were invoked.
     */
    bool processCompletedReads();

    AsyncFileReader(const AsyncFileReader&) = delete;
    AsyncFileReader& operator=(const AsyncFileReader&) = delete;

private:
    friend struct ReadContext;
    struct Impl;
    std::shared_ptr<Impl> impl_;
    async::EventLoop& loop_;
};

/**
 * Blocking whole-file read. Returns false and fills error on failure.
 */
bool readFileSync(const std::string& path, std::vector<uint8_t>& data, std::string& error);

} // namespace fs
} // namespace hostbridge
