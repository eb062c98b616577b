/**
 * Event Driver Implementation
 */

#include "hostbridge/platform/event_driver.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/platform/input.h"
#include <SDL3/SDL.h>
#include <cmath>
#include <iostream>

namespace hostbridge {
namespace platform {

using guest::Value;

namespace {

// SDL reports wheel notches; guests expect browser-like pixel deltas
constexpr float kWheelPixelsPerNotch = 120.0f;

/**
 * Decode UTF-8 into code points, skipping malformed bytes.
 */
std::vector<uint32_t> codePoints(const char* text) {
    std::vector<uint32_t> result;
    const unsigned char* p = reinterpret_cast<const unsigned char*>(text);
    while (p && *p) {
        uint32_t c = *p;
        int extra = 0;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0) {
            c &= 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            c &= 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            c &= 0x07;
            extra = 3;
        } else {
            p++;
            continue;
        }
        p++;
        bool valid = true;
        for (int i = 0; i < extra; i++) {
            if ((*p & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            c = (c << 6) | (*p & 0x3F);
            p++;
        }
        if (valid) result.push_back(c);
    }
    return result;
}

}  // namespace

EventDriver::EventDriver(bridge::GuestMemory& memory)
    : memory_(memory) {}

bool EventDriver::dispatch(const char* name, const std::vector<Value>& args) {
    guest::Instance* instance = memory_.instance();
    if (!instance || !instance->hasExport(name)) return false;
    return instance->call(name, args).has_value();
}

uint32_t EventDriver::copyToGuest(const uint8_t* data, size_t size, const char* caller) {
    guest::Instance* instance = memory_.instance();
    if (!instance || !instance->hasExport("allocate_vec_u8")) {
        std::cerr << "[Input] " << caller << ": guest does not export allocate_vec_u8" << std::endl;
        return 0;
    }
    auto result = instance->call("allocate_vec_u8", {Value::fromI32(static_cast<int32_t>(size))});
    if (!result) return 0;

    uint32_t ptr = result->asU32();
    if (size > 0 && !memory_.write(ptr, data, size, caller)) return 0;
    return ptr;
}

// ============================================================================
// Canvas and frame pacing
// ============================================================================

void EventDriver::setCanvasSize(int width, int height) {
    canvasWidth_ = width;
    canvasHeight_ = height;
}

void EventDriver::resize(int width, int height) {
    if (width == canvasWidth_ && height == canvasHeight_) return;
    setCanvasSize(width, height);
    std::cout << "[Input] Canvas resized to " << width << "x" << height << std::endl;
    dispatch("resize", {Value::fromI32(width), Value::fromI32(height)});
}

void EventDriver::start(bool blocking) {
    started_ = true;
    blocking_ = blocking;
    firstFrame_ = true;
    updateScheduled_ = false;
}

bool EventDriver::takeFrameRequest() {
    if (!started_) return false;
    if (!blocking_ || firstFrame_ || updateScheduled_) {
        firstFrame_ = false;
        updateScheduled_ = false;
        return true;
    }
    return false;
}

bool EventDriver::runFrame() {
    if (!takeFrameRequest()) return false;
    dispatch("frame", {});
    return true;
}

// ============================================================================
// Focus, clipboard, drops
// ============================================================================

void EventDriver::setFocus(bool focused) {
    if (focused == focused_) return;
    focused_ = focused;
    dispatch("focus", {Value::fromBool(focused)});
}

void EventDriver::paste(const std::string& text) {
    if (text.empty()) return;
    guest::Instance* instance = memory_.instance();
    if (!instance || !instance->hasExport("on_clipboard_paste")) return;

    uint32_t ptr = copyToGuest(reinterpret_cast<const uint8_t*>(text.data()), text.size(), "on_clipboard_paste");
    if (!ptr) return;
    dispatch("on_clipboard_paste", {Value::fromI32(static_cast<int32_t>(ptr)),
                                    Value::fromI32(static_cast<int32_t>(text.size()))});
}

void EventDriver::dropBegin() {
    dropping_ = true;
    dispatch("on_files_dropped_start", {});
}

void EventDriver::dropFile(const std::string& path) {
    if (!dropping_) dropBegin();

    std::vector<uint8_t> data;
    if (!dropReader_ || !dropReader_(path, data)) {
        std::cerr << "[Input] Could not read dropped file " << path << std::endl;
        return;
    }

    // Guests get the bare file name, as a browser would report it
    std::string name = path;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) name = name.substr(slash + 1);

    uint32_t namePtr = copyToGuest(reinterpret_cast<const uint8_t*>(name.data()), name.size(), "on_file_dropped");
    if (!namePtr) return;
    uint32_t dataPtr = copyToGuest(data.data(), data.size(), "on_file_dropped");
    if (!dataPtr) return;

    dispatch("on_file_dropped", {Value::fromI32(static_cast<int32_t>(namePtr)),
                                 Value::fromI32(static_cast<int32_t>(name.size())),
                                 Value::fromI32(static_cast<int32_t>(dataPtr)),
                                 Value::fromI32(static_cast<int32_t>(data.size()))});
}

void EventDriver::dropComplete() {
    if (!dropping_) return;
    dropping_ = false;
    dispatch("on_files_dropped_finish", {});
}

// ============================================================================
// Keyboard
// ============================================================================

void EventDriver::keyEvent(uint32_t scancode, uint16_t mods, bool down, bool repeat) {
    uint32_t mask = modifierMask(mods);
    ctrlHeld_ = (mask & Modifier::Ctrl) != 0;

    int32_t key = keyCodeFromScancode(scancode);
    if (key == KeyCode::Invalid) return;

    if (!down) {
        dispatch("key_up", {Value::fromI32(key), Value::fromI32(static_cast<int32_t>(mask))});
        return;
    }

    dispatch("key_down", {Value::fromI32(key), Value::fromI32(static_cast<int32_t>(mask)), Value::fromBool(repeat)});

    // Ctrl+V / Cmd+V pastes, like a browser paste event
    bool pasteChord = (mask & (Modifier::Ctrl | Modifier::Super)) != 0 && key == 'V';
    if (pasteChord && !repeat && clipboard_) {
        paste(clipboard_());
    }
}

void EventDriver::textInput(const char* text) {
    if (ctrlHeld_) return;
    for (uint32_t c : codePoints(text)) {
        dispatch("key_press", {Value::fromI32(static_cast<int32_t>(c))});
    }
}

// ============================================================================
// SDL event dispatch
// ============================================================================

bool EventDriver::handleEvent(const SDL_Event& event) {
    switch (event.type) {
        case SDL_EVENT_QUIT:
        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            std::cout << "[Input] Quit event received" << std::endl;
            quit_ = true;
            break;

        case SDL_EVENT_WINDOW_FOCUS_GAINED:
            setFocus(true);
            break;

        case SDL_EVENT_WINDOW_FOCUS_LOST:
        case SDL_EVENT_WINDOW_HIDDEN:
        case SDL_EVENT_WINDOW_MINIMIZED:
            setFocus(false);
            break;

        case SDL_EVENT_KEY_DOWN:
            keyEvent(event.key.scancode, event.key.mod, true, event.key.repeat);
            break;

        case SDL_EVENT_KEY_UP:
            keyEvent(event.key.scancode, event.key.mod, false, false);
            break;

        case SDL_EVENT_TEXT_INPUT:
            textInput(event.text.text);
            break;

        case SDL_EVENT_MOUSE_MOTION: {
            float x = event.motion.x * dpiScale_;
            float y = event.motion.y * dpiScale_;
            dispatch("mouse_move", {Value::fromI32(static_cast<int32_t>(std::floor(x))),
                                    Value::fromI32(static_cast<int32_t>(std::floor(y)))});
            if (event.motion.xrel != 0.0f || event.motion.yrel != 0.0f) {
                dispatch("raw_mouse_move", {Value::fromI32(static_cast<int32_t>(std::floor(event.motion.xrel))),
                                            Value::fromI32(static_cast<int32_t>(std::floor(event.motion.yrel)))});
            }
            break;
        }

        case SDL_EVENT_MOUSE_BUTTON_DOWN:
        case SDL_EVENT_MOUSE_BUTTON_UP: {
            int32_t button = mouseButtonFromSdl(event.button.button);
            if (button < 0) break;
            const char* name = event.type == SDL_EVENT_MOUSE_BUTTON_DOWN ? "mouse_down" : "mouse_up";
            dispatch(name, {Value::fromF32(event.button.x * dpiScale_), Value::fromF32(event.button.y * dpiScale_),
                            Value::fromI32(button)});
            break;
        }

        case SDL_EVENT_MOUSE_WHEEL: {
            float dx = event.wheel.x * kWheelPixelsPerNotch;
            float dy = event.wheel.y * kWheelPixelsPerNotch;
            if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) {
                dx = -dx;
                dy = -dy;
            }
            // SDL's y axis points up; x is negated to match the browser's
            // -deltaX convention
            dispatch("mouse_wheel", {Value::fromF32(-dx), Value::fromF32(dy)});
            break;
        }

        case SDL_EVENT_FINGER_DOWN:
        case SDL_EVENT_FINGER_MOTION:
        case SDL_EVENT_FINGER_UP:
        case SDL_EVENT_FINGER_CANCELED: {
            int32_t phase = TouchPhase::Began;
            if (event.type == SDL_EVENT_FINGER_MOTION) phase = TouchPhase::Moved;
            if (event.type == SDL_EVENT_FINGER_UP) phase = TouchPhase::Ended;
            if (event.type == SDL_EVENT_FINGER_CANCELED) phase = TouchPhase::Cancelled;
            dispatch("touch", {Value::fromI32(phase),
                               Value::fromI32(static_cast<int32_t>(event.tfinger.fingerID)),
                               Value::fromF32(event.tfinger.x * canvasWidth_),
                               Value::fromF32(event.tfinger.y * canvasHeight_)});
            break;
        }

        case SDL_EVENT_DROP_BEGIN:
            dropBegin();
            break;

        case SDL_EVENT_DROP_FILE:
            if (event.drop.data) dropFile(event.drop.data);
            break;

        case SDL_EVENT_DROP_COMPLETE:
            dropComplete();
            break;

        default:
            break;
    }

    return !quit_;
}

}  // namespace platform
}  // namespace hostbridge
