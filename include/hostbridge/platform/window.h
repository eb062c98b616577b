#pragma once

#include <string>

// Forward declare SDL types
struct SDL_Window;
struct SDL_Cursor;
typedef struct SDL_GLContextState* SDL_GLContext;

namespace hostbridge {
namespace platform {

struct WindowOptions {
    std::string title = "hostbridge";
    int width = 800;
    int height = 600;
    bool fullscreen = false;
    bool resizable = true;
    bool hidden = false;   // headless: context exists, window never shown
    bool highDpi = false;
    int glMajor = 2;       // 2 -> OpenGL ES 2.0, 3 -> OpenGL ES 3.0
    bool vsync = true;
};

/**
 * SDL3 window with an OpenGL ES context.
 *
 * Every method is safe on a window that was never created (or failed to
 * create): queries return neutral values and setters do nothing. The app
 * bridge relies on this so it can run without a display.
 */
class Window {
public:
    Window() = default;
    ~Window();

    /**
     * Initialize SDL video, create the window and make a GLES context
     * current. Falls back from GLES 3 to GLES 2 when a 3.0 context is not
     * available. Returns false (logged) on failure.
     */
    bool create(const WindowOptions& options);

    void destroy();

    bool isCreated() const { return window_ != nullptr; }

    /**
     * Major version of the context actually created (0 without one).
     */
    int contextMajor() const { return contextMajor_; }

    /**
     * Logical window size in screen coordinates.
     */
    void getSize(int* width, int* height) const;

    /**
     * Drawable size in pixels (equals getSize without high-DPI).
     */
    void getDrawableSize(int* width, int* height) const;

    /**
     * Pixels per logical unit; 1.0 without a window.
     */
    float pixelDensity() const;

    void setFullscreen(bool fullscreen);
    bool isFullscreen() const;

    void setSize(int width, int height);
    void setTitle(const char* title);

    void swap();

    /**
     * Set the cursor from a CSS cursor name ("default", "pointer", "text",
     * "none", ...). Unknown names fall back to the default arrow.
     */
    void setCursor(const std::string& cssName);

    /**
     * Relative mouse mode: hides the cursor and reports raw motion.
     */
    void setCursorGrab(bool grab);

    void setClipboardText(const std::string& text);
    std::string clipboardText() const;

    /**
     * Resolve a GL entry point of the current context.
     */
    static void* getProcAddress(const char* name);
    static bool extensionSupported(const char* name);

    /**
     * Show a blocking error dialog. Also printed to stderr, which is all
     * that happens when no display is available.
     */
    static void showMessageBox(const std::string& title, const std::string& message);

    SDL_Window* handle() const { return window_; }

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

private:
    SDL_Window* window_ = nullptr;
    SDL_GLContext context_ = nullptr;
    SDL_Cursor* cursor_ = nullptr;
    int contextMajor_ = 0;
    bool ownsVideo_ = false;
};

}  // namespace platform
}  // namespace hostbridge
