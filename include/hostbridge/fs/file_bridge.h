#pragma once

/**
 * File Bridge
 *
 * The "fs" call-table group. fs_load_file() starts a fetch and returns an
 * id right away; when the fetch finishes (successfully or not) the guest's
 * file_loaded(id) export is called once. The guest then sizes the result
 * with fs_get_buffer_size() and copies it out with fs_take_buffer(), which
 * releases the host copy.
 */

#include "hostbridge/bridge/call_table.h"
#include "hostbridge/fs/async_file.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostbridge {
namespace bridge {
class GuestMemory;
}
namespace http {
class HttpTransport;
}

namespace fs {

/**
 * Fetches a whole file. The callback runs exactly once on the main thread.
 */
using Fetcher = std::function<void(const std::string& path, AsyncFileCallback callback)>;

/**
 * Local paths go through the thread-pool reader, http:// and https://
 * URLs through the HTTP transport.
 */
Fetcher makeFetcher(AsyncFileReader& reader, http::HttpTransport& http);

bool isUrl(const std::string& path);

class FileBridge {
public:
    static constexpr uint32_t kVersion = 1;

    FileBridge(bridge::GuestMemory& memory, Fetcher fetcher);
    ~FileBridge();

    void registerFunctions(bridge::CallTable& table);

    int32_t loadFile(const std::string& path);

    /**
     * Size of a loaded file, or -1 while pending, after a failure, or once
     * taken.
     */
    int32_t bufferSize(int32_t id) const;

    /**
     * Copy a loaded file into guest memory and release it. A destination
     * smaller than the file is refused (logged) and the file is kept.
     */
    bool takeBuffer(int32_t id, uint32_t ptr, size_t length);

    size_t pendingCount() const { return pending_; }

    /** Loaded files not yet taken. Failed loads are never stored. */
    size_t storedCount() const { return files_.size(); }

    FileBridge(const FileBridge&) = delete;
    FileBridge& operator=(const FileBridge&) = delete;

private:
    void complete(int32_t id, std::optional<std::vector<uint8_t>> data);

    bridge::GuestMemory& memory_;
    Fetcher fetcher_;
    int32_t nextId_ = 0;
    size_t pending_ = 0;
    std::map<int32_t, std::vector<uint8_t>> files_;
    std::shared_ptr<bool> alive_;
};

}  // namespace fs
}  // namespace hostbridge
