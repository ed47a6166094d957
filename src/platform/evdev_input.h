#ifndef TEXTEXPANDER_EVDEV_INPUT_H
#define TEXTEXPANDER_EVDEV_INPUT_H

#include <textexpander/types.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace textexpander {

struct KeyEvent {
    uint16_t code;
    int32_t value;
};

// An open /dev/input/event* node; the descriptor is closed on destruction
class InputDevice {
public:
    ~InputDevice();

    InputDevice(const InputDevice&) = delete;
    InputDevice& operator=(const InputDevice&) = delete;

    // nullptr when the node cannot be opened
    static std::unique_ptr<InputDevice> open(const std::string& path);

    // Reports EV_KEY with both KEY_A and KEY_Z
    bool isKeyboard() const;

    // Appends pending EV_KEY events without blocking.
    // ErrorDeviceAccess when the device is gone.
    Result readEvents(std::vector<KeyEvent>& out);

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
    const std::string& name() const { return name_; }

private:
    InputDevice(int fd, const std::string& path, const std::string& name);

    int fd_;
    std::string path_;
    std::string name_;
};

class DeviceScanner {
public:
    static constexpr const char* kInputDirectory = "/dev/input";

    // Opens the keyboards to listen on, sorted by path
    static std::vector<std::unique_ptr<InputDevice>> findKeyboards(const std::string& dir = kInputDirectory);

    // Given keyboard names, the indices to listen on. A keyboard whose name
    // contains "virtual" (any case) replaces all others; the last one wins.
    static std::vector<size_t> selectKeyboards(const std::vector<std::string>& names);
};

} // namespace textexpander

#endif // TEXTEXPANDER_EVDEV_INPUT_H
