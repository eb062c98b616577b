// Event driver tests: SDL events in, guest export calls out

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fake_guest.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/platform/event_driver.h"
#include "hostbridge/platform/input.h"
#include <SDL3/SDL.h>

using namespace hostbridge;
using namespace hostbridge::test;
using Catch::Matchers::WithinAbs;
using platform::EventDriver;

namespace {

SDL_Event makeEvent(Uint32 type) {
    SDL_Event event;
    SDL_zero(event);
    event.type = type;
    return event;
}

SDL_Event keyDown(SDL_Scancode scancode, SDL_Keymod mod = SDL_KMOD_NONE, bool repeat = false) {
    SDL_Event event = makeEvent(SDL_EVENT_KEY_DOWN);
    event.key.scancode = scancode;
    event.key.mod = mod;
    event.key.repeat = repeat;
    event.key.down = true;
    return event;
}

SDL_Event keyUp(SDL_Scancode scancode, SDL_Keymod mod = SDL_KMOD_NONE) {
    SDL_Event event = makeEvent(SDL_EVENT_KEY_UP);
    event.key.scancode = scancode;
    event.key.mod = mod;
    return event;
}

SDL_Event textInput(const char* text) {
    SDL_Event event = makeEvent(SDL_EVENT_TEXT_INPUT);
    event.text.text = text;
    return event;
}

struct DriverFixture {
    FakeGuest guest;
    bridge::GuestMemory memory{&guest};
    EventDriver driver{memory};

    DriverFixture() {
        for (const char* name : {"frame", "resize", "focus", "key_down", "key_up", "key_press", "mouse_move",
                                 "raw_mouse_move", "mouse_down", "mouse_up", "mouse_wheel", "touch",
                                 "on_clipboard_paste", "on_files_dropped_start", "on_file_dropped",
                                 "on_files_dropped_finish"}) {
            guest.recordExport(name);
        }
    }
};

}  // namespace

TEST_CASE("No frames run before the loop starts", "[events]") {
    DriverFixture f;
    REQUIRE_FALSE(f.driver.runFrame());
    REQUIRE(f.guest.callsTo("frame").empty());
}

TEST_CASE("Continuous mode runs a frame every tick", "[events]") {
    DriverFixture f;
    f.driver.start(false);
    REQUIRE(f.driver.runFrame());
    REQUIRE(f.driver.runFrame());
    REQUIRE(f.driver.runFrame());
    REQUIRE(f.guest.callsTo("frame").size() == 3);
}

TEST_CASE("Blocking mode runs only the first and scheduled frames", "[events]") {
    DriverFixture f;
    f.driver.start(true);
    REQUIRE(f.driver.blocking());
    REQUIRE(f.driver.runFrame());
    REQUIRE_FALSE(f.driver.runFrame());

    f.driver.scheduleUpdate();
    f.driver.scheduleUpdate();
    REQUIRE(f.driver.runFrame());
    REQUIRE_FALSE(f.driver.runFrame());
    REQUIRE(f.guest.callsTo("frame").size() == 2);
}

TEST_CASE("Resize is forwarded only when the size changes", "[events]") {
    DriverFixture f;
    f.driver.setCanvasSize(800, 600);
    f.driver.resize(800, 600);
    REQUIRE(f.guest.callsTo("resize").empty());

    // Size events are measured by the owner, not the driver
    SDL_Event event = makeEvent(SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED);
    event.window.data1 = 1024;
    event.window.data2 = 768;
    f.driver.handleEvent(event);
    REQUIRE(f.guest.callsTo("resize").empty());

    f.driver.resize(1024, 768);
    auto calls = f.guest.callsTo("resize");
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].args[0].asI32() == 1024);
    REQUIRE(calls[0].args[1].asI32() == 768);
    REQUIRE(f.driver.canvasWidth() == 1024);
}

TEST_CASE("Focus is reported on transitions only", "[events]") {
    DriverFixture f;
    f.driver.handleEvent(makeEvent(SDL_EVENT_WINDOW_FOCUS_GAINED));
    REQUIRE(f.guest.callsTo("focus").empty());

    f.driver.handleEvent(makeEvent(SDL_EVENT_WINDOW_FOCUS_LOST));
    f.driver.handleEvent(makeEvent(SDL_EVENT_WINDOW_MINIMIZED));
    f.driver.handleEvent(makeEvent(SDL_EVENT_WINDOW_FOCUS_GAINED));

    auto calls = f.guest.callsTo("focus");
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].args[0].asI32() == 0);
    REQUIRE(calls[1].args[0].asI32() == 1);
}

TEST_CASE("Keys are delivered with key code, modifiers and repeat", "[events]") {
    DriverFixture f;
    f.driver.handleEvent(keyDown(SDL_SCANCODE_W, SDL_KMOD_LSHIFT));
    f.driver.handleEvent(keyDown(SDL_SCANCODE_W, SDL_KMOD_LSHIFT, true));
    f.driver.handleEvent(keyUp(SDL_SCANCODE_W));

    auto downs = f.guest.callsTo("key_down");
    REQUIRE(downs.size() == 2);
    REQUIRE(downs[0].args[0].asI32() == 'W');
    REQUIRE(downs[0].args[1].asU32() == platform::Modifier::Shift);
    REQUIRE(downs[0].args[2].asI32() == 0);
    REQUIRE(downs[1].args[2].asI32() == 1);

    auto ups = f.guest.callsTo("key_up");
    REQUIRE(ups.size() == 1);
    REQUIRE(ups[0].args[1].asU32() == 0);
}

TEST_CASE("Unmapped keys are not forwarded", "[events]") {
    DriverFixture f;
    f.driver.handleEvent(keyDown(SDL_SCANCODE_VOLUMEUP));
    REQUIRE(f.guest.callsTo("key_down").empty());
}

TEST_CASE("Text input becomes one key_press per code point", "[events]") {
    DriverFixture f;
    f.driver.handleEvent(textInput("a\xC3\xA9\xF0\x9F\x98\x80"));

    auto presses = f.guest.callsTo("key_press");
    REQUIRE(presses.size() == 3);
    REQUIRE(presses[0].args[0].asI32() == 'a');
    REQUIRE(presses[1].args[0].asI32() == 0xE9);
    REQUIRE(presses[2].args[0].asI32() == 0x1F600);
}

TEST_CASE("Ctrl+V pastes the clipboard instead of typing", "[events]") {
    DriverFixture f;
    f.driver.setClipboardReader([]() { return std::string("clip text"); });

    f.driver.handleEvent(keyDown(SDL_SCANCODE_V, SDL_KMOD_LCTRL));
    f.driver.handleEvent(textInput("v"));

    auto pastes = f.guest.callsTo("on_clipboard_paste");
    REQUIRE(pastes.size() == 1);
    uint32_t ptr = pastes[0].args[0].asU32();
    REQUIRE(ptr >= FakeGuest::kHeapStart);
    REQUIRE(pastes[0].args[1].asI32() == 9);
    REQUIRE(f.guest.getString(ptr, 9) == "clip text");
    REQUIRE(f.guest.callsTo("key_press").empty());

    // Releasing ctrl lets text through again
    f.driver.handleEvent(keyUp(SDL_SCANCODE_LCTRL));
    f.driver.handleEvent(textInput("v"));
    REQUIRE(f.guest.callsTo("key_press").size() == 1);
}

TEST_CASE("An empty clipboard sends nothing", "[events]") {
    DriverFixture f;
    f.driver.setClipboardReader([]() { return std::string(); });
    f.driver.handleEvent(keyDown(SDL_SCANCODE_V, SDL_KMOD_LGUI));
    REQUIRE(f.guest.callsTo("on_clipboard_paste").empty());
}

TEST_CASE("Mouse positions are scaled to drawable pixels", "[events]") {
    DriverFixture f;
    f.driver.setDpiScale(2.0f);

    SDL_Event motion = makeEvent(SDL_EVENT_MOUSE_MOTION);
    motion.motion.x = 10.6f;
    motion.motion.y = 20.0f;
    motion.motion.xrel = 3.0f;
    motion.motion.yrel = -2.0f;
    f.driver.handleEvent(motion);

    auto moves = f.guest.callsTo("mouse_move");
    REQUIRE(moves.size() == 1);
    REQUIRE(moves[0].args[0].asI32() == 21);
    REQUIRE(moves[0].args[1].asI32() == 40);

    auto raw = f.guest.callsTo("raw_mouse_move");
    REQUIRE(raw.size() == 1);
    REQUIRE(raw[0].args[0].asI32() == 3);
    REQUIRE(raw[0].args[1].asI32() == -2);

    SDL_Event press = makeEvent(SDL_EVENT_MOUSE_BUTTON_DOWN);
    press.button.button = SDL_BUTTON_RIGHT;
    press.button.x = 5.0f;
    press.button.y = 7.5f;
    f.driver.handleEvent(press);

    auto downs = f.guest.callsTo("mouse_down");
    REQUIRE(downs.size() == 1);
    REQUIRE_THAT(downs[0].args[0].asF64(), WithinAbs(10.0, 1e-6));
    REQUIRE_THAT(downs[0].args[1].asF64(), WithinAbs(15.0, 1e-6));
    REQUIRE(downs[0].args[2].asI32() == platform::MouseButton::Right);
}

TEST_CASE("Extra mouse buttons are ignored", "[events]") {
    DriverFixture f;
    SDL_Event press = makeEvent(SDL_EVENT_MOUSE_BUTTON_UP);
    press.button.button = SDL_BUTTON_X2;
    f.driver.handleEvent(press);
    REQUIRE(f.guest.callsTo("mouse_up").empty());
}

TEST_CASE("Wheel notches become pixel deltas", "[events]") {
    DriverFixture f;
    SDL_Event wheel = makeEvent(SDL_EVENT_MOUSE_WHEEL);
    wheel.wheel.x = 1.0f;
    wheel.wheel.y = -0.5f;
    wheel.wheel.direction = SDL_MOUSEWHEEL_NORMAL;
    f.driver.handleEvent(wheel);

    wheel.wheel.direction = SDL_MOUSEWHEEL_FLIPPED;
    f.driver.handleEvent(wheel);

    auto calls = f.guest.callsTo("mouse_wheel");
    REQUIRE(calls.size() == 2);
    REQUIRE_THAT(calls[0].args[0].asF64(), WithinAbs(-120.0, 1e-6));
    REQUIRE_THAT(calls[0].args[1].asF64(), WithinAbs(-60.0, 1e-6));
    REQUIRE_THAT(calls[1].args[0].asF64(), WithinAbs(120.0, 1e-6));
    REQUIRE_THAT(calls[1].args[1].asF64(), WithinAbs(60.0, 1e-6));
}

TEST_CASE("Touches are scaled by the canvas size", "[events]") {
    DriverFixture f;
    f.driver.setCanvasSize(800, 600);

    SDL_Event down = makeEvent(SDL_EVENT_FINGER_DOWN);
    down.tfinger.fingerID = 4;
    down.tfinger.x = 0.5f;
    down.tfinger.y = 0.25f;
    f.driver.handleEvent(down);

    SDL_Event cancel = makeEvent(SDL_EVENT_FINGER_CANCELED);
    cancel.tfinger.fingerID = 4;
    f.driver.handleEvent(cancel);

    auto calls = f.guest.callsTo("touch");
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].args[0].asI32() == platform::TouchPhase::Began);
    REQUIRE(calls[0].args[1].asI32() == 4);
    REQUIRE_THAT(calls[0].args[2].asF64(), WithinAbs(400.0, 1e-4));
    REQUIRE_THAT(calls[0].args[3].asF64(), WithinAbs(150.0, 1e-4));
    REQUIRE(calls[1].args[0].asI32() == platform::TouchPhase::Cancelled);
}

TEST_CASE("Dropped files arrive between start and finish", "[events]") {
    DriverFixture f;
    f.driver.setDropReader([](const std::string& path, std::vector<uint8_t>& data) {
        if (path.find("missing") != std::string::npos) return false;
        data = {'d', 'a', 't', 'a'};
        return true;
    });

    f.driver.handleEvent(makeEvent(SDL_EVENT_DROP_BEGIN));

    SDL_Event file = makeEvent(SDL_EVENT_DROP_FILE);
    file.drop.data = "/home/user/levels/one.map";
    f.driver.handleEvent(file);
    file.drop.data = "/home/user/missing.map";
    f.driver.handleEvent(file);

    f.driver.handleEvent(makeEvent(SDL_EVENT_DROP_COMPLETE));
    f.driver.handleEvent(makeEvent(SDL_EVENT_DROP_COMPLETE));

    REQUIRE(f.guest.callsTo("on_files_dropped_start").size() == 1);
    REQUIRE(f.guest.callsTo("on_files_dropped_finish").size() == 1);

    auto drops = f.guest.callsTo("on_file_dropped");
    REQUIRE(drops.size() == 1);
    REQUIRE(f.guest.getString(drops[0].args[0].asU32(), drops[0].args[1].asU32()) == "one.map");
    REQUIRE(f.guest.getString(drops[0].args[2].asU32(), drops[0].args[3].asU32()) == "data");
}

TEST_CASE("Missing exports are skipped", "[events]") {
    FakeGuest guest;
    bridge::GuestMemory memory(&guest);
    EventDriver driver(memory);

    driver.handleEvent(keyDown(SDL_SCANCODE_A));
    driver.start(false);
    REQUIRE(driver.runFrame());
    REQUIRE(guest.calls().empty());
}

TEST_CASE("Quit and close requests stop the loop", "[events]") {
    DriverFixture f;
    REQUIRE(f.driver.handleEvent(makeEvent(SDL_EVENT_MOUSE_MOTION)));
    REQUIRE_FALSE(f.driver.handleEvent(makeEvent(SDL_EVENT_WINDOW_CLOSE_REQUESTED)));
    REQUIRE(f.driver.quitRequested());
}
