/**
 * Input Mapping
 *
 * Translates SDL input codes into the sapp-style codes guest modules
 * expect. Kept free of SDL types so the tables can be used (and tested)
 * without SDL headers.
 */

#pragma once

#include <cstdint>

namespace hostbridge {
namespace platform {

/**
 * Key codes delivered to key_down / key_up
 */
namespace KeyCode {
constexpr int32_t Invalid = 0;
constexpr int32_t Space = 32;
constexpr int32_t Apostrophe = 39;
constexpr int32_t Comma = 44;
constexpr int32_t Minus = 45;
constexpr int32_t Period = 46;
constexpr int32_t Slash = 47;
constexpr int32_t Num0 = 48;
constexpr int32_t Semicolon = 59;
constexpr int32_t Equal = 61;
constexpr int32_t A = 65;
constexpr int32_t Z = 90;
constexpr int32_t LeftBracket = 91;
constexpr int32_t Backslash = 92;
constexpr int32_t RightBracket = 93;
constexpr int32_t GraveAccent = 96;
constexpr int32_t World1 = 161;
constexpr int32_t Escape = 256;
constexpr int32_t Enter = 257;
constexpr int32_t Tab = 258;
constexpr int32_t Backspace = 259;
constexpr int32_t Insert = 260;
constexpr int32_t Delete = 261;
constexpr int32_t Right = 262;
constexpr int32_t Left = 263;
constexpr int32_t Down = 264;
constexpr int32_t Up = 265;
constexpr int32_t PageUp = 266;
constexpr int32_t PageDown = 267;
constexpr int32_t Home = 268;
constexpr int32_t End = 269;
constexpr int32_t CapsLock = 280;
constexpr int32_t ScrollLock = 281;
constexpr int32_t NumLock = 282;
constexpr int32_t PrintScreen = 283;
constexpr int32_t Pause = 284;
constexpr int32_t F1 = 290;
constexpr int32_t F24 = 313;
constexpr int32_t Kp0 = 320;
constexpr int32_t KpDecimal = 330;
constexpr int32_t KpDivide = 331;
constexpr int32_t KpMultiply = 332;
constexpr int32_t KpSubtract = 333;
constexpr int32_t KpAdd = 334;
constexpr int32_t KpEnter = 335;
constexpr int32_t KpEqual = 336;
constexpr int32_t LeftShift = 340;
constexpr int32_t LeftControl = 341;
constexpr int32_t LeftAlt = 342;
constexpr int32_t LeftSuper = 343;
constexpr int32_t RightShift = 344;
constexpr int32_t RightControl = 345;
constexpr int32_t RightAlt = 346;
constexpr int32_t RightSuper = 347;
constexpr int32_t Menu = 348;
}  // namespace KeyCode

namespace Modifier {
constexpr uint32_t Shift = 1;
constexpr uint32_t Ctrl = 2;
constexpr uint32_t Alt = 4;
constexpr uint32_t Super = 8;
}  // namespace Modifier

namespace MouseButton {
constexpr int32_t Left = 0;
constexpr int32_t Right = 1;
constexpr int32_t Middle = 2;
}  // namespace MouseButton

namespace TouchPhase {
constexpr int32_t Began = 10;
constexpr int32_t Moved = 11;
constexpr int32_t Ended = 12;
constexpr int32_t Cancelled = 13;
}  // namespace TouchPhase

/**
 * Convert an SDL scancode (physical key) to a guest key code.
 * Returns KeyCode::Invalid for keys with no guest equivalent.
 */
int32_t keyCodeFromScancode(uint32_t scancode);

/**
 * Convert an SDL_Keymod bitmask to the guest modifier mask.
 */
uint32_t modifierMask(uint16_t sdlMods);

/**
 * Convert an SDL mouse button index to a guest button.
 * Returns -1 for buttons beyond the first three.
 */
int32_t mouseButtonFromSdl(uint8_t sdlButton);

}  // namespace platform
}  // namespace hostbridge
