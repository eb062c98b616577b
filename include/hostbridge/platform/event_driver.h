#pragma once

/**
 * Event Driver
 *
 * Turns SDL events into calls on the guest's input exports and decides when
 * the guest's frame export runs.
 *
 * Pointer and touch coordinates are reported in drawable pixels (logical
 * coordinates times the DPI scale). Every dispatch is skipped when the guest
 * does not export the target function.
 *
 * Frame pacing: after run_animation_loop(false) a frame runs every tick. In
 * blocking mode a frame runs once at start and afterwards only when
 * sapp_schedule_update() has been called since the previous frame.
 */

#include "hostbridge/guest/value.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

union SDL_Event;

namespace hostbridge {
namespace bridge {
class GuestMemory;
}

namespace platform {

class EventDriver {
public:
    /**
     * Reads the host clipboard when the guest is sent a paste.
     */
    using ClipboardReader = std::function<std::string()>;

    /**
     * Reads a dropped file's contents. Returns false on failure.
     */
    using DropReader = std::function<bool(const std::string& path, std::vector<uint8_t>& data)>;

    explicit EventDriver(bridge::GuestMemory& memory);

    void setClipboardReader(ClipboardReader reader) { clipboard_ = std::move(reader); }
    void setDropReader(DropReader reader) { dropReader_ = std::move(reader); }

    void setDpiScale(float scale) { dpiScale_ = scale > 0.0f ? scale : 1.0f; }
    float dpiScale() const { return dpiScale_; }

    /**
     * Current canvas size in pixels. Touch positions arrive normalized and
     * are scaled by this.
     */
    void setCanvasSize(int width, int height);
    int canvasWidth() const { return canvasWidth_; }
    int canvasHeight() const { return canvasHeight_; }

    /**
     * Canvas changed size: record it and call the guest's resize export if
     * the size actually differs.
     */
    void resize(int width, int height);

    /**
     * run_animation_loop(blocking): begin driving frames.
     */
    void start(bool blocking);
    bool started() const { return started_; }
    bool blocking() const { return blocking_; }

    /**
     * sapp_schedule_update(): request one frame in blocking mode.
     */
    void scheduleUpdate() { updateScheduled_ = true; }

    /**
     * Whether a frame should run this tick. Consumes a pending update request.
     */
    bool takeFrameRequest();

    /**
     * Invoke the guest frame export if a frame is due.
     * Returns true if frame ran.
     */
    bool runFrame();

    /**
     * Dispatch one SDL event. Returns false once a quit was requested.
     * Window size events are left to the owner, which measures the canvas
     * and calls resize().
     */
    bool handleEvent(const SDL_Event& event);

    bool quitRequested() const { return quit_; }
    void requestQuit() { quit_ = true; }

    bool focused() const { return focused_; }

    /**
     * Window focus or visibility changed; forwarded only on transitions.
     */
    void setFocus(bool focused);

    /**
     * Deliver pasted text to on_clipboard_paste. Empty text is ignored.
     */
    void paste(const std::string& text);

    /**
     * Deliver one dropped file between begin/finish notifications.
     */
    void dropBegin();
    void dropFile(const std::string& path);
    void dropComplete();

    EventDriver(const EventDriver&) = delete;
    EventDriver& operator=(const EventDriver&) = delete;

private:
    bool dispatch(const char* name, const std::vector<guest::Value>& args);

    /**
     * Copy bytes into a guest buffer from allocate_vec_u8. Returns the
     * guest pointer, or 0 when the guest cannot allocate.
     */
    uint32_t copyToGuest(const uint8_t* data, size_t size, const char* caller);

    void keyEvent(uint32_t scancode, uint16_t mods, bool down, bool repeat);
    void textInput(const char* text);

    bridge::GuestMemory& memory_;
    ClipboardReader clipboard_;
    DropReader dropReader_;

    float dpiScale_ = 1.0f;
    int canvasWidth_ = 0;
    int canvasHeight_ = 0;

    bool started_ = false;
    bool blocking_ = false;
    bool updateScheduled_ = false;
    bool firstFrame_ = true;

    bool focused_ = true;
    bool ctrlHeld_ = false;
    bool dropping_ = false;
    bool quit_ = false;
};

}  // namespace platform
}  // namespace hostbridge
