/**
 * Input Mapping Implementation
 *
 * Scancodes are used rather than keycodes so key positions stay the same
 * across keyboard layouts; text comes separately from SDL_EVENT_TEXT_INPUT.
 */

#include "hostbridge/platform/input.h"
#include <SDL3/SDL.h>

namespace hostbridge {
namespace platform {

int32_t keyCodeFromScancode(uint32_t scancode) {
    SDL_Scancode code = static_cast<SDL_Scancode>(scancode);

    // Contiguous ranges first
    if (code >= SDL_SCANCODE_A && code <= SDL_SCANCODE_Z) {
        return KeyCode::A + (code - SDL_SCANCODE_A);
    }
    if (code >= SDL_SCANCODE_1 && code <= SDL_SCANCODE_9) {
        return KeyCode::Num0 + 1 + (code - SDL_SCANCODE_1);
    }
    if (code >= SDL_SCANCODE_F1 && code <= SDL_SCANCODE_F12) {
        return KeyCode::F1 + (code - SDL_SCANCODE_F1);
    }
    if (code >= SDL_SCANCODE_F13 && code <= SDL_SCANCODE_F24) {
        return KeyCode::F1 + 12 + (code - SDL_SCANCODE_F13);
    }
    if (code >= SDL_SCANCODE_KP_1 && code <= SDL_SCANCODE_KP_9) {
        return KeyCode::Kp0 + 1 + (code - SDL_SCANCODE_KP_1);
    }

    switch (code) {
        case SDL_SCANCODE_0: return KeyCode::Num0;
        case SDL_SCANCODE_SPACE: return KeyCode::Space;
        case SDL_SCANCODE_APOSTROPHE: return KeyCode::Apostrophe;
        case SDL_SCANCODE_COMMA: return KeyCode::Comma;
        case SDL_SCANCODE_MINUS: return KeyCode::Minus;
        case SDL_SCANCODE_PERIOD: return KeyCode::Period;
        case SDL_SCANCODE_SLASH: return KeyCode::Slash;
        case SDL_SCANCODE_SEMICOLON: return KeyCode::Semicolon;
        case SDL_SCANCODE_EQUALS: return KeyCode::Equal;
        case SDL_SCANCODE_LEFTBRACKET: return KeyCode::LeftBracket;
        case SDL_SCANCODE_BACKSLASH: return KeyCode::Backslash;
        case SDL_SCANCODE_RIGHTBRACKET: return KeyCode::RightBracket;
        case SDL_SCANCODE_GRAVE: return KeyCode::GraveAccent;
        case SDL_SCANCODE_NONUSBACKSLASH: return KeyCode::World1;

        // Navigation / editing
        case SDL_SCANCODE_ESCAPE: return KeyCode::Escape;
        case SDL_SCANCODE_RETURN: return KeyCode::Enter;
        case SDL_SCANCODE_TAB: return KeyCode::Tab;
        case SDL_SCANCODE_BACKSPACE: return KeyCode::Backspace;
        case SDL_SCANCODE_INSERT: return KeyCode::Insert;
        case SDL_SCANCODE_DELETE: return KeyCode::Delete;
        case SDL_SCANCODE_RIGHT: return KeyCode::Right;
        case SDL_SCANCODE_LEFT: return KeyCode::Left;
        case SDL_SCANCODE_DOWN: return KeyCode::Down;
        case SDL_SCANCODE_UP: return KeyCode::Up;
        case SDL_SCANCODE_PAGEUP: return KeyCode::PageUp;
        case SDL_SCANCODE_PAGEDOWN: return KeyCode::PageDown;
        case SDL_SCANCODE_HOME: return KeyCode::Home;
        case SDL_SCANCODE_END: return KeyCode::End;
        case SDL_SCANCODE_CAPSLOCK: return KeyCode::CapsLock;
        case SDL_SCANCODE_SCROLLLOCK: return KeyCode::ScrollLock;
        case SDL_SCANCODE_NUMLOCKCLEAR: return KeyCode::NumLock;
        case SDL_SCANCODE_PRINTSCREEN: return KeyCode::PrintScreen;
        case SDL_SCANCODE_PAUSE: return KeyCode::Pause;

        // Keypad
        case SDL_SCANCODE_KP_0: return KeyCode::Kp0;
        case SDL_SCANCODE_KP_PERIOD: return KeyCode::KpDecimal;
        case SDL_SCANCODE_KP_DIVIDE: return KeyCode::KpDivide;
        case SDL_SCANCODE_KP_MULTIPLY: return KeyCode::KpMultiply;
        case SDL_SCANCODE_KP_MINUS: return KeyCode::KpSubtract;
        case SDL_SCANCODE_KP_PLUS: return KeyCode::KpAdd;
        case SDL_SCANCODE_KP_ENTER: return KeyCode::KpEnter;
        case SDL_SCANCODE_KP_EQUALS: return KeyCode::KpEqual;

        // Modifiers
        case SDL_SCANCODE_LSHIFT: return KeyCode::LeftShift;
        case SDL_SCANCODE_LCTRL: return KeyCode::LeftControl;
        case SDL_SCANCODE_LALT: return KeyCode::LeftAlt;
        case SDL_SCANCODE_LGUI: return KeyCode::LeftSuper;
        case SDL_SCANCODE_RSHIFT: return KeyCode::RightShift;
        case SDL_SCANCODE_RCTRL: return KeyCode::RightControl;
        case SDL_SCANCODE_RALT: return KeyCode::RightAlt;
        case SDL_SCANCODE_RGUI: return KeyCode::RightSuper;
        case SDL_SCANCODE_APPLICATION:
        case SDL_SCANCODE_MENU:
            return KeyCode::Menu;

        default: return KeyCode::Invalid;
    }
}

uint32_t modifierMask(uint16_t sdlMods) {
    uint32_t mask = 0;
    if (sdlMods & SDL_KMOD_SHIFT) mask |= Modifier::Shift;
    if (sdlMods & SDL_KMOD_CTRL) mask |= Modifier::Ctrl;
    if (sdlMods & SDL_KMOD_ALT) mask |= Modifier::Alt;
    if (sdlMods & SDL_KMOD_GUI) mask |= Modifier::Super;
    return mask;
}

int32_t mouseButtonFromSdl(uint8_t sdlButton) {
    switch (sdlButton) {
        case SDL_BUTTON_LEFT: return MouseButton::Left;
        case SDL_BUTTON_RIGHT: return MouseButton::Right;
        case SDL_BUTTON_MIDDLE: return MouseButton::Middle;
        default: return -1;
    }
}

}  // namespace platform
}  // namespace hostbridge
