// Input code mapping tests

#include <catch2/catch_test_macros.hpp>
#include "hostbridge/platform/input.h"
#include <SDL3/SDL.h>

using namespace hostbridge::platform;

TEST_CASE("Letters and digits map to their ASCII codes", "[input]") {
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_A) == 'A');
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_V) == 'V');
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_Z) == 'Z');
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_0) == '0');
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_1) == '1');
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_9) == '9');
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_SPACE) == ' ');
}

TEST_CASE("Function and keypad keys keep their offsets", "[input]") {
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_F1) == KeyCode::F1);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_F12) == KeyCode::F1 + 11);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_F13) == KeyCode::F1 + 12);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_F24) == KeyCode::F24);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_KP_0) == KeyCode::Kp0);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_KP_5) == KeyCode::Kp0 + 5);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_KP_ENTER) == KeyCode::KpEnter);
}

TEST_CASE("Navigation and modifier keys", "[input]") {
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_ESCAPE) == KeyCode::Escape);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_RETURN) == KeyCode::Enter);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_LEFT) == KeyCode::Left);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_LSHIFT) == KeyCode::LeftShift);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_RGUI) == KeyCode::RightSuper);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_APPLICATION) == KeyCode::Menu);
}

TEST_CASE("Keys without a guest equivalent are invalid", "[input]") {
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_UNKNOWN) == KeyCode::Invalid);
    REQUIRE(keyCodeFromScancode(SDL_SCANCODE_VOLUMEUP) == KeyCode::Invalid);
}

TEST_CASE("Modifier masks merge left and right keys", "[input]") {
    REQUIRE(modifierMask(0) == 0);
    REQUIRE(modifierMask(SDL_KMOD_LSHIFT) == Modifier::Shift);
    REQUIRE(modifierMask(SDL_KMOD_RCTRL) == Modifier::Ctrl);
    REQUIRE(modifierMask(SDL_KMOD_LSHIFT | SDL_KMOD_RALT) == (Modifier::Shift | Modifier::Alt));
    REQUIRE(modifierMask(SDL_KMOD_LGUI) == Modifier::Super);
    REQUIRE(modifierMask(SDL_KMOD_NUM | SDL_KMOD_CAPS) == 0);
}

TEST_CASE("Mouse buttons use the guest ordering", "[input]") {
    REQUIRE(mouseButtonFromSdl(SDL_BUTTON_LEFT) == MouseButton::Left);
    REQUIRE(mouseButtonFromSdl(SDL_BUTTON_RIGHT) == MouseButton::Right);
    REQUIRE(mouseButtonFromSdl(SDL_BUTTON_MIDDLE) == MouseButton::Middle);
    REQUIRE(mouseButtonFromSdl(SDL_BUTTON_X1) == -1);
}
