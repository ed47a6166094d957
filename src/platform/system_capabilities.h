#ifndef TEXTEXPANDER_SYSTEM_CAPABILITIES_H
#define TEXTEXPANDER_SYSTEM_CAPABILITIES_H

#include <textexpander/capabilities.h>
#include <chrono>
#include <string>

namespace textexpander {

// Real clock, /bin/sh and the Wayland clipboard
class SystemCapabilities : public Capabilities {
public:
    static constexpr std::chrono::milliseconds kClipboardTimeout{1000};

    explicit SystemCapabilities(const std::string& clipboardCommand = "wl-paste -n",
                                std::chrono::milliseconds clipboardTimeout = kClipboardTimeout);

    Timestamp currentTime() override;
    CommandResult runCommand(const std::string& cmd, std::chrono::milliseconds timeout) override;
    ClipboardResult readClipboard() override;

    const std::string& clipboardCommand() const { return clipboardCommand_; }

private:
    std::string clipboardCommand_;
    std::chrono::milliseconds clipboardTimeout_;
};

} // namespace textexpander

#endif // TEXTEXPANDER_SYSTEM_CAPABILITIES_H
