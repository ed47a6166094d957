#ifndef TEXTEXPANDER_KEY_MAPPER_H
#define TEXTEXPANDER_KEY_MAPPER_H

#include <textexpander/types.h>
#include <cstdint>
#include <optional>

namespace textexpander {

// evdev key event values
enum class KeyState : int32_t {
    Released = 0,
    Pressed = 1,
    Repeated = 2
};

/**
 * Translates raw evdev key codes into engine input events.
 *
 * Tracks Shift, CapsLock and the chord modifiers (Ctrl, Alt, Meta) across
 * events. Layout is fixed to US QWERTY.
 */
class KeyMapper {
public:
    KeyMapper();

    // Returns nothing for key releases, modifiers and keys that do not affect typed text
    std::optional<InputEvent> translate(uint16_t code, int32_t value);

    // Only updates modifier state; used while draining injected events
    void trackModifiers(uint16_t code, int32_t value);

    void clearModifiers();

    bool shiftActive() const { return leftShift_ || rightShift_; }
    bool capsLockActive() const { return capsLock_; }
    bool chordActive() const { return chordMask_ != 0; }

    // Printable character for a key, 0 when the key types nothing
    static char32_t toCharacter(uint16_t code, bool shift, bool capsLock);

    // Keys that move the cursor or commit text
    static bool isResetKey(uint16_t code);
    // Character a reset key leaves in the document, 0 for none
    static char32_t typedBy(uint16_t code, bool shift);

    static bool isModifierKey(uint16_t code);

    static const char* keyName(uint16_t code);

private:
    bool leftShift_;
    bool rightShift_;
    bool capsLock_;
    uint8_t chordMask_;   // One bit per held Ctrl, Alt or Meta key
};

} // namespace textexpander

#endif // TEXTEXPANDER_KEY_MAPPER_H
