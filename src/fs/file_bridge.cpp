#include "hostbridge/fs/file_bridge.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/http/http_client.h"
#include <iostream>

namespace hostbridge {
namespace fs {

using bridge::Args;
using guest::Value;

bool isUrl(const std::string& path) {
    return path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0;
}

Fetcher makeFetcher(AsyncFileReader& reader, http::HttpTransport& http) {
    return [&reader, &http](const std::string& path, AsyncFileCallback callback) {
        if (!isUrl(path)) {
            reader.readFile(path, std::move(callback));
            return;
        }
        http.request("GET", path, {}, [callback](http::HttpResponse response) {
            if (!response.ok) {
                callback({}, response.error.empty() ? "HTTP status " + std::to_string(response.status)
                                                    : response.error);
                return;
            }
            callback(std::move(response.data), std::string());
        });
    };
}

FileBridge::FileBridge(bridge::GuestMemory& memory, Fetcher fetcher)
    : memory_(memory)
    , fetcher_(std::move(fetcher))
    , alive_(std::make_shared<bool>(true)) {}

FileBridge::~FileBridge() {
    *alive_ = false;
}

int32_t FileBridge::loadFile(const std::string& path) {
    int32_t id = nextId_++;
    pending_++;

    std::weak_ptr<bool> alive = alive_;
    fetcher_(path, [this, alive, id, path](std::vector<uint8_t> data, std::string error) {
        auto token = alive.lock();
        if (!token || !*token) return;

        if (!error.empty()) {
            std::cerr << "[FS] Failed to load " << path << ": " << error << std::endl;
            complete(id, std::nullopt);
            return;
        }
        complete(id, std::move(data));
    });
    return id;
}

void FileBridge::complete(int32_t id, std::optional<std::vector<uint8_t>> data) {
    if (pending_ > 0) pending_--;
    if (data) {
        files_[id] = std::move(*data);
    }

    guest::Instance* instance = memory_.instance();
    if (!instance) {
        std::cerr << "[FS] File " << id << " loaded with no guest attached" << std::endl;
        return;
    }
    if (!instance->hasExport("file_loaded")) return;
    instance->call("file_loaded", {Value::fromI32(id)});
}

int32_t FileBridge::bufferSize(int32_t id) const {
    auto it = files_.find(id);
    if (it == files_.end()) return -1;
    return static_cast<int32_t>(it->second.size());
}

bool FileBridge::takeBuffer(int32_t id, uint32_t ptr, size_t length) {
    auto it = files_.find(id);
    if (it == files_.end()) {
        std::cerr << "[FS] fs_take_buffer: file " << id << " has no data" << std::endl;
        return false;
    }

    const std::vector<uint8_t>& data = it->second;
    if (data.size() > length) {
        std::cerr << "[FS] fs_take_buffer: destination of " << length << " bytes is too small for file "
                  << id << " (" << data.size() << " bytes)" << std::endl;
        return false;
    }
    if (!memory_.write(ptr, data.data(), data.size(), "fs_take_buffer")) {
        return false;
    }
    files_.erase(it);
    return true;
}

void FileBridge::registerFunctions(bridge::CallTable& table) {
    table.set("fs_load_file", [this](const Args& args) {
        std::string path = memory_.readUtf8(bridge::arg(args, 0).asU32(), bridge::arg(args, 1).asU32(),
                                            "fs_load_file");
        return Value::fromI32(loadFile(path));
    });
    table.set("fs_get_buffer_size", [this](const Args& args) {
        return Value::fromI32(bufferSize(bridge::arg(args, 0).asI32()));
    });
    table.set("fs_take_buffer", [this](const Args& args) {
        takeBuffer(bridge::arg(args, 0).asI32(), bridge::arg(args, 1).asU32(), bridge::arg(args, 2).asU32());
        return Value::none();
    });
}

}  // namespace fs
}  // namespace hostbridge
