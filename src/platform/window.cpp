/**
 * Window Management (SDL3)
 *
 * Window creation, the OpenGL ES context, and the small window services the
 * guest reaches through the app bridge (cursor, clipboard, fullscreen).
 */

#include "hostbridge/platform/window.h"
#include <cstdlib>
#include <iostream>
#include <SDL3/SDL.h>

namespace hostbridge {
namespace platform {

namespace {

bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    return value && (value[0] == '1' || value[0] == 't' || value[0] == 'T');
}

void setContextAttributes(int major) {
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, major);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);
}

SDL_SystemCursor cursorFromCss(const std::string& name) {
    if (name == "pointer") return SDL_SYSTEM_CURSOR_POINTER;
    if (name == "text") return SDL_SYSTEM_CURSOR_TEXT;
    if (name == "crosshair") return SDL_SYSTEM_CURSOR_CROSSHAIR;
    if (name == "wait") return SDL_SYSTEM_CURSOR_WAIT;
    if (name == "progress") return SDL_SYSTEM_CURSOR_PROGRESS;
    if (name == "move" || name == "all-scroll") return SDL_SYSTEM_CURSOR_MOVE;
    if (name == "not-allowed" || name == "no-drop") return SDL_SYSTEM_CURSOR_NOT_ALLOWED;
    if (name == "ew-resize" || name == "col-resize") return SDL_SYSTEM_CURSOR_EW_RESIZE;
    if (name == "ns-resize" || name == "row-resize") return SDL_SYSTEM_CURSOR_NS_RESIZE;
    if (name == "nwse-resize") return SDL_SYSTEM_CURSOR_NWSE_RESIZE;
    if (name == "nesw-resize") return SDL_SYSTEM_CURSOR_NESW_RESIZE;
    return SDL_SYSTEM_CURSOR_DEFAULT;
}

}  // namespace

Window::~Window() {
    destroy();
}

bool Window::create(const WindowOptions& options) {
    std::cout << "[Window] Creating window: " << options.title << " (" << options.width << "x"
              << options.height << ")" << std::endl;

    if (!SDL_InitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        std::cerr << "[Window] SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    ownsVideo_ = true;

    SDL_WindowFlags flags = SDL_WINDOW_OPENGL;
    if (options.resizable) flags |= SDL_WINDOW_RESIZABLE;
    if (options.fullscreen) flags |= SDL_WINDOW_FULLSCREEN;
    if (options.highDpi) flags |= SDL_WINDOW_HIGH_PIXEL_DENSITY;

    bool hidden = options.hidden || envFlag("HOSTBRIDGE_HEADLESS");
    if (hidden) {
        flags |= SDL_WINDOW_HIDDEN;
        std::cout << "[Window] Running in hidden mode" << std::endl;
    }

    int major = options.glMajor >= 3 ? 3 : 2;
    setContextAttributes(major);

    window_ = SDL_CreateWindow(options.title.c_str(), options.width, options.height, flags);
    if (!window_) {
        std::cerr << "[Window] SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
        destroy();
        return false;
    }

    context_ = SDL_GL_CreateContext(window_);
    if (!context_ && major == 3) {
        std::cerr << "[Window] OpenGL ES 3.0 context unavailable (" << SDL_GetError()
                  << "), falling back to OpenGL ES 2.0" << std::endl;
        major = 2;
        setContextAttributes(major);
        context_ = SDL_GL_CreateContext(window_);
    }
    if (!context_) {
        std::cerr << "[Window] SDL_GL_CreateContext failed: " << SDL_GetError() << std::endl;
        destroy();
        return false;
    }
    contextMajor_ = major;

    if (!SDL_GL_MakeCurrent(window_, context_)) {
        std::cerr << "[Window] SDL_GL_MakeCurrent failed: " << SDL_GetError() << std::endl;
        destroy();
        return false;
    }
    if (!SDL_GL_SetSwapInterval(options.vsync ? 1 : 0)) {
        std::cerr << "[Window] Could not set swap interval: " << SDL_GetError() << std::endl;
    }

    // key_press is fed from text input events
    if (!SDL_StartTextInput(window_)) {
        std::cerr << "[Window] SDL_StartTextInput failed: " << SDL_GetError() << std::endl;
    }

    int width = 0, height = 0;
    getDrawableSize(&width, &height);
    std::cout << "[Window] OpenGL ES " << contextMajor_ << ".0 context, drawable " << width << "x" << height
              << std::endl;
    return true;
}

void Window::destroy() {
    if (cursor_) {
        SDL_DestroyCursor(cursor_);
        cursor_ = nullptr;
    }
    if (context_) {
        SDL_GL_DestroyContext(context_);
        context_ = nullptr;
    }
    if (window_) {
        std::cout << "[Window] Destroying window..." << std::endl;
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    contextMajor_ = 0;

    // Audio keeps its own subsystem reference; only release video here
    if (ownsVideo_) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS);
        ownsVideo_ = false;
    }
}

void Window::getSize(int* width, int* height) const {
    int w = 0, h = 0;
    if (window_) SDL_GetWindowSize(window_, &w, &h);
    if (width) *width = w;
    if (height) *height = h;
}

void Window::getDrawableSize(int* width, int* height) const {
    int w = 0, h = 0;
    if (window_) SDL_GetWindowSizeInPixels(window_, &w, &h);
    if (width) *width = w;
    if (height) *height = h;
}

float Window::pixelDensity() const {
    if (!window_) return 1.0f;
    float density = SDL_GetWindowPixelDensity(window_);
    return density > 0.0f ? density : 1.0f;
}

void Window::setFullscreen(bool fullscreen) {
    if (!window_) return;
    if (!SDL_SetWindowFullscreen(window_, fullscreen)) {
        std::cerr << "[Window] SDL_SetWindowFullscreen failed: " << SDL_GetError() << std::endl;
    }
}

bool Window::isFullscreen() const {
    if (!window_) return false;
    return (SDL_GetWindowFlags(window_) & SDL_WINDOW_FULLSCREEN) != 0;
}

void Window::setSize(int width, int height) {
    if (!window_) return;
    SDL_SetWindowSize(window_, width, height);
}

void Window::setTitle(const char* title) {
    if (!window_) return;
    SDL_SetWindowTitle(window_, title);
}

void Window::swap() {
    if (!window_) return;
    SDL_GL_SwapWindow(window_);
}

void Window::setCursor(const std::string& cssName) {
    if (!window_) return;

    if (cssName == "none") {
        SDL_HideCursor();
        return;
    }

    SDL_Cursor* cursor = SDL_CreateSystemCursor(cursorFromCss(cssName));
    if (!cursor) {
        std::cerr << "[Window] Could not create cursor '" << cssName << "': " << SDL_GetError() << std::endl;
        return;
    }
    SDL_SetCursor(cursor);
    SDL_ShowCursor();
    if (cursor_) SDL_DestroyCursor(cursor_);
    cursor_ = cursor;
}

void Window::setCursorGrab(bool grab) {
    if (!window_) return;
    if (!SDL_SetWindowRelativeMouseMode(window_, grab)) {
        std::cerr << "[Window] Could not change mouse grab: " << SDL_GetError() << std::endl;
    }
}

void Window::setClipboardText(const std::string& text) {
    if (!window_) return;
    if (!SDL_SetClipboardText(text.c_str())) {
        std::cerr << "[Window] SDL_SetClipboardText failed: " << SDL_GetError() << std::endl;
    }
}

std::string Window::clipboardText() const {
    if (!window_) return std::string();
    char* text = SDL_GetClipboardText();
    if (!text) return std::string();
    std::string result(text);
    SDL_free(text);
    return result;
}

void* Window::getProcAddress(const char* name) {
    return reinterpret_cast<void*>(SDL_GL_GetProcAddress(name));
}

bool Window::extensionSupported(const char* name) {
    return SDL_GL_ExtensionSupported(name);
}

void Window::showMessageBox(const std::string& title, const std::string& message) {
    std::cerr << "[Window] " << title << ": " << message << std::endl;
    if (!SDL_WasInit(SDL_INIT_VIDEO)) return;
    if (!SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, title.c_str(), message.c_str(), nullptr)) {
        std::cerr << "[Window] Could not show message box: " << SDL_GetError() << std::endl;
    }
}

}  // namespace platform
}  // namespace hostbridge
