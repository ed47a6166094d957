#include "key_mapper.h"
#include <linux/input-event-codes.h>
#include <unordered_map>

namespace textexpander {

namespace {

enum ChordBit : uint8_t {
    kLeftCtrl = 1 << 0,
    kRightCtrl = 1 << 1,
    kLeftAlt = 1 << 2,
    kRightAlt = 1 << 3,
    kLeftMeta = 1 << 4,
    kRightMeta = 1 << 5
};

struct KeyChars {
    char normal;
    char shifted;
};

// US QWERTY main block
const std::unordered_map<uint16_t, KeyChars>& keyTable() {
    static const std::unordered_map<uint16_t, KeyChars> table = {
        {KEY_A, {'a', 'A'}}, {KEY_B, {'b', 'B'}}, {KEY_C, {'c', 'C'}}, {KEY_D, {'d', 'D'}},
        {KEY_E, {'e', 'E'}}, {KEY_F, {'f', 'F'}}, {KEY_G, {'g', 'G'}}, {KEY_H, {'h', 'H'}},
        {KEY_I, {'i', 'I'}}, {KEY_J, {'j', 'J'}}, {KEY_K, {'k', 'K'}}, {KEY_L, {'l', 'L'}},
        {KEY_M, {'m', 'M'}}, {KEY_N, {'n', 'N'}}, {KEY_O, {'o', 'O'}}, {KEY_P, {'p', 'P'}},
        {KEY_Q, {'q', 'Q'}}, {KEY_R, {'r', 'R'}}, {KEY_S, {'s', 'S'}}, {KEY_T, {'t', 'T'}},
        {KEY_U, {'u', 'U'}}, {KEY_V, {'v', 'V'}}, {KEY_W, {'w', 'W'}}, {KEY_X, {'x', 'X'}},
        {KEY_Y, {'y', 'Y'}}, {KEY_Z, {'z', 'Z'}},

        {KEY_1, {'1', '!'}}, {KEY_2, {'2', '@'}}, {KEY_3, {'3', '#'}}, {KEY_4, {'4', '$'}},
        {KEY_5, {'5', '%'}}, {KEY_6, {'6', '^'}}, {KEY_7, {'7', '&'}}, {KEY_8, {'8', '*'}},
        {KEY_9, {'9', '('}}, {KEY_0, {'0', ')'}},

        {KEY_MINUS, {'-', '_'}},
        {KEY_EQUAL, {'=', '+'}},
        {KEY_LEFTBRACE, {'[', '{'}},
        {KEY_RIGHTBRACE, {']', '}'}},
        {KEY_SEMICOLON, {';', ':'}},
        {KEY_APOSTROPHE, {'\'', '"'}},
        {KEY_GRAVE, {'`', '~'}},
        {KEY_BACKSLASH, {'\\', '|'}},
        {KEY_COMMA, {',', '<'}},
        {KEY_DOT, {'.', '>'}},
        {KEY_SLASH, {'/', '?'}},
        {KEY_SPACE, {' ', ' '}},
    };
    return table;
}

bool isLetterChar(char ch) {
    return ch >= 'a' && ch <= 'z';
}

uint8_t chordBit(uint16_t code) {
    switch (code) {
        case KEY_LEFTCTRL: return kLeftCtrl;
        case KEY_RIGHTCTRL: return kRightCtrl;
        case KEY_LEFTALT: return kLeftAlt;
        case KEY_RIGHTALT: return kRightAlt;
        case KEY_LEFTMETA: return kLeftMeta;
        case KEY_RIGHTMETA: return kRightMeta;
        default: return 0;
    }
}

} // namespace

KeyMapper::KeyMapper()
    : leftShift_(false)
    , rightShift_(false)
    , capsLock_(false)
    , chordMask_(0) {
}

char32_t KeyMapper::toCharacter(uint16_t code, bool shift, bool capsLock) {
    const auto& table = keyTable();
    auto it = table.find(code);
    if (it == table.end()) {
        return 0;
    }

    // CapsLock only inverts the case of letters
    bool upper = shift;
    if (isLetterChar(it->second.normal) && capsLock) {
        upper = !upper;
    }
    return static_cast<char32_t>(upper ? it->second.shifted : it->second.normal);
}

bool KeyMapper::isResetKey(uint16_t code) {
    switch (code) {
        case KEY_ENTER:
        case KEY_KPENTER:
        case KEY_TAB:
        case KEY_ESC:
        case KEY_UP:
        case KEY_DOWN:
        case KEY_LEFT:
        case KEY_RIGHT:
        case KEY_HOME:
        case KEY_END:
        case KEY_PAGEUP:
        case KEY_PAGEDOWN:
        case KEY_DELETE:
        case KEY_INSERT:
            return true;
        default:
            return false;
    }
}

char32_t KeyMapper::typedBy(uint16_t code, bool shift) {
    switch (code) {
        case KEY_ENTER:
        case KEY_KPENTER:
            return U'\n';
        case KEY_TAB:
            // Shift+Tab moves focus backwards
            return shift ? 0 : U'\t';
        default:
            return 0;
    }
}

bool KeyMapper::isModifierKey(uint16_t code) {
    return code == KEY_LEFTSHIFT || code == KEY_RIGHTSHIFT || code == KEY_CAPSLOCK ||
           chordBit(code) != 0;
}

void KeyMapper::trackModifiers(uint16_t code, int32_t value) {
    const bool down = value != static_cast<int32_t>(KeyState::Released);

    if (code == KEY_LEFTSHIFT) {
        leftShift_ = down;
    } else if (code == KEY_RIGHTSHIFT) {
        rightShift_ = down;
    } else if (code == KEY_CAPSLOCK) {
        if (value == static_cast<int32_t>(KeyState::Pressed)) {
            capsLock_ = !capsLock_;
        }
    } else if (uint8_t bit = chordBit(code)) {
        if (down) {
            chordMask_ |= bit;
        } else {
            chordMask_ &= static_cast<uint8_t>(~bit);
        }
    }
}

void KeyMapper::clearModifiers() {
    leftShift_ = false;
    rightShift_ = false;
    chordMask_ = 0;
}

std::optional<InputEvent> KeyMapper::translate(uint16_t code, int32_t value) {
    if (isModifierKey(code)) {
        trackModifiers(code, value);
        return std::nullopt;
    }

    if (value == static_cast<int32_t>(KeyState::Released)) {
        return std::nullopt;
    }

    if (code == KEY_BACKSPACE) {
        // Ctrl+Backspace removes a whole word
        return chordActive() ? InputEvent::Reset() : InputEvent::Backspace();
    }

    if (isResetKey(code)) {
        return InputEvent::Reset(chordActive() ? 0 : typedBy(code, shiftActive()));
    }

    char32_t ch = toCharacter(code, shiftActive(), capsLock_);
    if (ch == 0) {
        return std::nullopt;
    }

    // Shortcuts such as Ctrl+V edit text the engine cannot see
    if (chordActive()) {
        return InputEvent::Reset();
    }

    return InputEvent::Character(ch);
}

const char* KeyMapper::keyName(uint16_t code) {
    switch (code) {
        case KEY_BACKSPACE: return "Backspace";
        case KEY_TAB: return "Tab";
        case KEY_ENTER: return "Enter";
        case KEY_KPENTER: return "KeypadEnter";
        case KEY_ESC: return "Esc";
        case KEY_SPACE: return "Space";
        case KEY_LEFTSHIFT: return "LeftShift";
        case KEY_RIGHTSHIFT: return "RightShift";
        case KEY_LEFTCTRL: return "LeftCtrl";
        case KEY_RIGHTCTRL: return "RightCtrl";
        case KEY_LEFTALT: return "LeftAlt";
        case KEY_RIGHTALT: return "RightAlt";
        case KEY_LEFTMETA: return "LeftMeta";
        case KEY_RIGHTMETA: return "RightMeta";
        case KEY_CAPSLOCK: return "CapsLock";
        case KEY_UP: return "Up";
        case KEY_DOWN: return "Down";
        case KEY_LEFT: return "Left";
        case KEY_RIGHT: return "Right";
        case KEY_HOME: return "Home";
        case KEY_END: return "End";
        case KEY_PAGEUP: return "PageUp";
        case KEY_PAGEDOWN: return "PageDown";
        case KEY_INSERT: return "Insert";
        case KEY_DELETE: return "Delete";
        default: return "Unknown";
    }
}

} // namespace textexpander
