#include "evdev_input.h"
#include "../utils/log.h"
#include <linux/input.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace textexpander {

namespace fs = std::filesystem;

namespace {

constexpr size_t kBitsPerLong = sizeof(unsigned long) * 8;
constexpr size_t kEventBatch = 64;
constexpr size_t kNameLength = 256;

constexpr size_t longsFor(size_t bits) {
    return (bits + kBitsPerLong - 1) / kBitsPerLong;
}

bool testBit(const unsigned long* bits, size_t bit) {
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

InputDevice::InputDevice(int fd, const std::string& path, const std::string& name)
    : fd_(fd)
    , path_(path)
    , name_(name) {
}

InputDevice::~InputDevice() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

std::unique_ptr<InputDevice> InputDevice::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        utils::debugLog("Cannot open " + path + ": " + std::strerror(errno));
        return nullptr;
    }

    std::array<char, kNameLength> name{};
    if (::ioctl(fd, EVIOCGNAME(name.size() - 1), name.data()) < 0) {
        name[0] = '\0';
    }

    return std::unique_ptr<InputDevice>(new InputDevice(fd, path, name.data()));
}

bool InputDevice::isKeyboard() const {
    std::array<unsigned long, longsFor(EV_MAX + 1)> eventBits{};
    if (::ioctl(fd_, EVIOCGBIT(0, sizeof(eventBits)), eventBits.data()) < 0) {
        return false;
    }
    if (!testBit(eventBits.data(), EV_KEY)) {
        return false;
    }

    std::array<unsigned long, longsFor(KEY_MAX + 1)> keyBits{};
    if (::ioctl(fd_, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits.data()) < 0) {
        return false;
    }
    return testBit(keyBits.data(), KEY_A) && testBit(keyBits.data(), KEY_Z);
}

Result InputDevice::readEvents(std::vector<KeyEvent>& out) {
    std::array<struct input_event, kEventBatch> events;

    while (true) {
        ssize_t bytesRead = ::read(fd_, events.data(), sizeof(events));
        if (bytesRead < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            utils::errorLog("Read from " + path_ + " failed: " + std::strerror(errno));
            return Result::ErrorDeviceAccess;
        }
        if (bytesRead == 0) {
            return Result::ErrorDeviceAccess;
        }

        size_t count = static_cast<size_t>(bytesRead) / sizeof(struct input_event);
        for (size_t i = 0; i < count; ++i) {
            if (events[i].type == EV_KEY) {
                out.push_back(KeyEvent{events[i].code, events[i].value});
            }
        }

        if (count < events.size()) {
            break;
        }
    }

    return Result::Success;
}

std::vector<size_t> DeviceScanner::selectKeyboards(const std::vector<std::string>& names) {
    std::vector<size_t> selected;
    bool haveVirtual = false;
    size_t virtualIndex = 0;

    for (size_t i = 0; i < names.size(); ++i) {
        if (lowercase(names[i]).find("virtual") != std::string::npos) {
            haveVirtual = true;
            virtualIndex = i;
        }
    }

    if (haveVirtual) {
        selected.push_back(virtualIndex);
        return selected;
    }

    for (size_t i = 0; i < names.size(); ++i) {
        selected.push_back(i);
    }
    return selected;
}

std::vector<std::unique_ptr<InputDevice>> DeviceScanner::findKeyboards(const std::string& dir) {
    std::vector<fs::path> nodes;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->path().filename().string().rfind("event", 0) == 0) {
            nodes.push_back(it->path());
        }
    }
    if (ec) {
        utils::errorLog("Cannot list " + dir + ": " + ec.message());
    }
    std::sort(nodes.begin(), nodes.end());

    std::vector<std::unique_ptr<InputDevice>> keyboards;
    std::vector<std::string> names;
    for (const auto& node : nodes) {
        auto device = InputDevice::open(node.string());
        if (!device || !device->isKeyboard()) {
            continue;
        }
        utils::debugLog("Keyboard candidate " + device->path() + " (" + device->name() + ")");
        names.push_back(device->name());
        keyboards.push_back(std::move(device));
    }

    std::vector<std::unique_ptr<InputDevice>> chosen;
    for (size_t index : selectKeyboards(names)) {
        utils::infoLog("Listening on " + keyboards[index]->path() + " (" + keyboards[index]->name() + ")");
        chosen.push_back(std::move(keyboards[index]));
    }
    return chosen;
}

} // namespace textexpander
