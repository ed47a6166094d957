#ifndef TEXTEXPANDER_OUTPUT_SINK_H
#define TEXTEXPANDER_OUTPUT_SINK_H

#include <textexpander/types.h>
#include <chrono>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace textexpander {

// Applies edit instructions to whatever has keyboard focus
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual Result apply(const Instruction& instruction) = 0;
};

// The user session to type into when running as root through sudo
struct SessionEnvironment {
    std::string sudoUser;
    std::string sudoUid;
    std::string runtimeDir;
    std::string waylandDisplay;

    static SessionEnvironment fromEnvironment();

    bool underSudo() const { return !sudoUser.empty(); }

    // XDG_RUNTIME_DIR, WAYLAND_DISPLAY and USER for the session
    std::vector<std::pair<std::string, std::string>> sessionVariables() const;
};

class WtypeSink : public OutputSink {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

    explicit WtypeSink(const SessionEnvironment& session = SessionEnvironment::fromEnvironment(),
                       std::chrono::milliseconds timeout = kDefaultTimeout);

    Result apply(const Instruction& instruction) override;

    // Empty when the instruction changes nothing
    static std::vector<std::string> buildCommand(const Instruction& instruction,
                                                 const SessionEnvironment& session);

private:
    SessionEnvironment session_;
    std::chrono::milliseconds timeout_;
};

// Prints EDIT <count> "<text>" lines, for --stdin mode
class StdoutSink : public OutputSink {
public:
    explicit StdoutSink(std::ostream& stream);

    Result apply(const Instruction& instruction) override;

    static std::string format(const Instruction& instruction);

private:
    std::ostream& stream_;
};

} // namespace textexpander

#endif // TEXTEXPANDER_OUTPUT_SINK_H
