// File bridge tests: load callbacks, sizing and taking buffers

#include <catch2/catch_test_macros.hpp>
#include "fake_guest.h"
#include "hostbridge/async/event_loop.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/fs/async_file.h"
#include "hostbridge/fs/file_bridge.h"
#include "hostbridge/http/http_client.h"
#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace hostbridge;
using namespace hostbridge::test;

namespace {

// Holds callbacks until the test completes them
struct FakeFetcher {
    std::vector<std::string> paths;
    std::vector<fs::AsyncFileCallback> callbacks;

    fs::Fetcher fetcher() {
        return [this](const std::string& path, fs::AsyncFileCallback callback) {
            paths.push_back(path);
            callbacks.push_back(std::move(callback));
        };
    }

    void succeed(size_t index, const std::string& text) {
        callbacks[index](std::vector<uint8_t>(text.begin(), text.end()), std::string());
    }

    void fail(size_t index) {
        callbacks[index]({}, "no such file");
    }
};

class FakeTransport : public http::HttpTransport {
public:
    void request(const std::string& method,
                 const std::string& url,
                 const std::vector<uint8_t>&,
                 http::AsyncHttpCallback callback,
                 const http::HttpOptions&) override {
        methods.push_back(method);
        urls.push_back(url);
        http::HttpResponse response;
        response.url = url;
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            response.status = 404;
        } else {
            response.ok = true;
            response.status = 200;
            response.data.assign(it->second.begin(), it->second.end());
        }
        callback(std::move(response));
    }

    std::map<std::string, std::string> bodies;
    std::vector<std::string> methods;
    std::vector<std::string> urls;
};

struct FileFixture {
    FakeGuest guest;
    bridge::GuestMemory memory{&guest};
    FakeFetcher fetcher;
    fs::FileBridge files{memory, fetcher.fetcher()};

    FileFixture() { guest.recordExport("file_loaded"); }
};

}  // namespace

TEST_CASE("URLs are told apart from local paths", "[fs]") {
    REQUIRE(fs::isUrl("http://example.test/a.bin"));
    REQUIRE(fs::isUrl("https://example.test/a.bin"));
    REQUIRE_FALSE(fs::isUrl("assets/http://odd"));
    REQUIRE_FALSE(fs::isUrl("./level.bin"));
}

TEST_CASE("Loading returns ids immediately and notifies the guest once", "[fs]") {
    FileFixture f;
    int32_t first = f.files.loadFile("a.bin");
    int32_t second = f.files.loadFile("b.bin");
    REQUIRE(first == 0);
    REQUIRE(second == 1);
    REQUIRE(f.files.pendingCount() == 2);
    REQUIRE(f.guest.callsTo("file_loaded").empty());
    REQUIRE(f.files.bufferSize(first) == -1);

    f.fetcher.succeed(1, "bee");
    auto calls = f.guest.callsTo("file_loaded");
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].args[0].asI32() == second);
    REQUIRE(f.files.bufferSize(second) == 3);
    REQUIRE(f.files.pendingCount() == 1);
}

TEST_CASE("Failed loads still notify and report no size", "[fs]") {
    FileFixture f;
    int32_t id = f.files.loadFile("missing.bin");
    f.fetcher.fail(0);

    REQUIRE(f.guest.callsTo("file_loaded").size() == 1);
    REQUIRE(f.files.bufferSize(id) == -1);
    REQUIRE_FALSE(f.files.takeBuffer(id, 100, 64));
}

TEST_CASE("Failed loads leave nothing behind", "[fs]") {
    FileFixture f;
    for (int i = 0; i < 8; i++) {
        f.files.loadFile("missing.bin");
        f.fetcher.fail(static_cast<size_t>(i));
    }
    REQUIRE(f.files.storedCount() == 0);
    REQUIRE(f.files.pendingCount() == 0);

    int32_t id = f.files.loadFile("present.bin");
    f.fetcher.succeed(8, "ok");
    REQUIRE(f.files.storedCount() == 1);
    REQUIRE(f.files.takeBuffer(id, 100, 2));
    REQUIRE(f.files.storedCount() == 0);
}

TEST_CASE("Taking a buffer copies it out and releases it", "[fs]") {
    FileFixture f;
    int32_t id = f.files.loadFile("data.txt");
    f.fetcher.succeed(0, "contents");

    REQUIRE(f.files.takeBuffer(id, 400, 8));
    REQUIRE(f.guest.getString(400, 8) == "contents");
    REQUIRE(f.files.bufferSize(id) == -1);
    REQUIRE_FALSE(f.files.takeBuffer(id, 400, 8));
}

TEST_CASE("A destination that is too small keeps the file", "[fs]") {
    FileFixture f;
    int32_t id = f.files.loadFile("data.txt");
    f.fetcher.succeed(0, "contents");

    REQUIRE_FALSE(f.files.takeBuffer(id, 400, 4));
    REQUIRE(f.guest.getBytes(400, 4) == std::vector<uint8_t>{0, 0, 0, 0});
    REQUIRE(f.files.bufferSize(id) == 8);
    REQUIRE(f.files.takeBuffer(id, 400, 16));
}

TEST_CASE("Completions after destruction are dropped", "[fs]") {
    FakeGuest guest;
    guest.recordExport("file_loaded");
    bridge::GuestMemory memory(&guest);
    FakeFetcher fetcher;
    {
        fs::FileBridge files(memory, fetcher.fetcher());
        files.loadFile("late.bin");
    }
    fetcher.succeed(0, "late");
    REQUIRE(guest.callsTo("file_loaded").empty());
}

TEST_CASE("File functions through the call table", "[fs]") {
    FileFixture f;
    bridge::CallTable table;
    f.files.registerFunctions(table);

    f.guest.putString(50, "assets/map.json");
    int32_t id = table.call("fs_load_file", {u32(50), u32(15)}).asI32();
    REQUIRE(f.fetcher.paths.at(0) == "assets/map.json");
    REQUIRE(table.call("fs_get_buffer_size", {i32(id)}).asI32() == -1);

    f.fetcher.succeed(0, "{}");
    REQUIRE(table.call("fs_get_buffer_size", {i32(id)}).asI32() == 2);
    table.call("fs_take_buffer", {i32(id), u32(600), u32(2)});
    REQUIRE(f.guest.getString(600, 2) == "{}");
}

TEST_CASE("The fetcher routes URLs to HTTP and paths to the reader", "[fs]") {
    std::string path = "hostbridge_test_fetch.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "local";
    }

    async::EventLoop loop;
    fs::AsyncFileReader reader(loop);
    FakeTransport transport;
    transport.bodies["https://example.test/remote.bin"] = "remote";
    fs::Fetcher fetcher = fs::makeFetcher(reader, transport);

    std::map<std::string, std::string> results;
    std::map<std::string, std::string> errors;
    auto capture = [&results, &errors](const std::string& key) {
        return [&results, &errors, key](std::vector<uint8_t> data, std::string error) {
            results[key] = std::string(data.begin(), data.end());
            errors[key] = error;
        };
    };

    fetcher("https://example.test/remote.bin", capture("remote"));
    fetcher("https://example.test/gone.bin", capture("gone"));
    fetcher(path, capture("local"));
    reader.processCompletedReads();

    REQUIRE(transport.methods.size() == 2);
    REQUIRE(transport.methods[0] == "GET");
    REQUIRE(results.at("remote") == "remote");
    REQUIRE(errors.at("remote").empty());
    REQUIRE(errors.at("gone") == "HTTP status 404");
    REQUIRE(results.at("local") == "local");
    REQUIRE(errors.at("local").empty());

    std::remove(path.c_str());
}
