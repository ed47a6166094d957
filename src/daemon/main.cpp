#include <textexpander/textexpander.h>
#include "../platform/evdev_input.h"
#include "../platform/key_mapper.h"
#include "../platform/lifecycle.h"
#include "../platform/output_sink.h"
#include "../platform/stream_input.h"
#include "../platform/system_capabilities.h"
#include "../utils/log.h"
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

using namespace textexpander;

namespace {

// Lets the focused window catch up before typing into it
constexpr std::chrono::milliseconds kInjectDelay{10};
// Our own injected keystrokes arrive on the device; they are discarded
constexpr std::chrono::milliseconds kDrainDelay{50};

std::shared_ptr<const RuleSet> loadRules(const std::string& dir) {
    LoadedConfig config;
    Result result = ConfigLoader::loadDirectory(dir, config);
    if (result != Result::Success) {
        return nullptr;
    }

    auto rules = ConfigLoader::buildRuleSet(config);
    utils::infoLog("Loaded " + std::to_string(rules->triggerCount()) + " triggers from " +
                   std::to_string(config.files.size()) + " files");
    if (!config.failures.empty()) {
        utils::warnLog(std::to_string(config.failures.size()) + " config files failed to load");
    }
    return rules;
}

void reloadRules(RuleSetHandle& handle, const std::string& dir) {
    utils::infoLog("Reloading rules from " + dir);
    auto rules = loadRules(dir);
    if (!rules || rules->empty()) {
        utils::warnLog("Reload produced no triggers, keeping the current rules");
        return;
    }
    handle.store(rules);
}

void drainDevices(std::vector<std::unique_ptr<InputDevice>>& devices, KeyMapper& mapper) {
    std::this_thread::sleep_for(kDrainDelay);

    std::vector<KeyEvent> events;
    for (auto& device : devices) {
        events.clear();
        if (device->readEvents(events) != Result::Success) {
            continue;  // Reported by the main loop on its next read
        }
        for (const auto& event : events) {
            mapper.trackModifiers(event.code, event.value);
        }
    }
}

int runDevices(ExpansionEngine& engine, RuleSetHandle& handle, const std::string& configDir,
               std::vector<std::unique_ptr<InputDevice>> devices) {
    KeyMapper mapper;
    WtypeSink sink;
    std::vector<KeyEvent> events;

    utils::infoLog("Ready. Listening on " + std::to_string(devices.size()) + " device(s)");

    while (!lifecycle::stopRequested()) {
        if (lifecycle::consumeReloadRequest()) {
            reloadRules(handle, configDir);
        }

        std::vector<struct pollfd> fds;
        for (const auto& device : devices) {
            fds.push_back(pollfd{device->fd(), POLLIN, 0});
        }

        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            utils::errorLog(std::string("poll failed: ") + std::strerror(errno));
            return 1;
        }

        bool injected = false;
        for (size_t i = 0; i < devices.size(); ++i) {
            if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                utils::warnLog("Device " + devices[i]->path() + " went away");
                devices[i].reset();
                continue;
            }
            if (!(fds[i].revents & POLLIN)) {
                continue;
            }

            events.clear();
            if (devices[i]->readEvents(events) != Result::Success) {
                utils::warnLog("Device " + devices[i]->path() + " went away");
                devices[i].reset();
                continue;
            }

            for (const auto& event : events) {
                std::optional<InputEvent> input = mapper.translate(event.code, event.value);
                if (!input) {
                    continue;
                }

                Instruction instruction = engine.onEvent(*input);
                if (!instruction.isEdit()) {
                    continue;
                }

                std::this_thread::sleep_for(kInjectDelay);
                if (sink.apply(instruction) != Result::Success) {
                    utils::warnLog("Expansion could not be typed");
                }
                injected = true;
            }
        }

        devices.erase(std::remove(devices.begin(), devices.end(), nullptr), devices.end());
        if (devices.empty()) {
            utils::errorLog("No keyboard devices left");
            return 1;
        }

        if (injected) {
            drainDevices(devices, mapper);
        }
    }

    utils::infoLog("Shutting down");
    return 0;
}

int runStdin(ExpansionEngine& engine, RuleSetHandle& handle, const std::string& configDir) {
    StdoutSink sink(std::cout);
    StreamInput input(engine, sink);
    input.setLineHook([&handle, &configDir]() {
        if (lifecycle::consumeReloadRequest()) {
            reloadRules(handle, configDir);
        }
        return !lifecycle::stopRequested();
    });

    return input.run(std::cin) == Result::Success ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    DaemonOptions options;
    std::string error;
    const std::string program = argc > 0 ? argv[0] : "textexpanderd";

    if (OptionParser::parse(argc, argv, options, error) != Result::Success) {
        std::cerr << program << ": " << error << "\n\n" << OptionParser::usage(program);
        return 2;
    }
    if (options.showHelp) {
        std::cout << OptionParser::usage(program);
        return 0;
    }
    if (options.showVersion) {
        std::cout << "textexpanderd " << getVersion() << std::endl;
        return 0;
    }

    utils::setLogLevel(options.verbose ? utils::LogLevel::Debug : utils::LogLevel::Info);
    utils::infoLog("textexpanderd " + getVersion() + " starting");

    const std::string configDir = options.configDir.empty()
        ? ConfigLoader::defaultConfigDirectory()
        : options.configDir;

    auto rules = loadRules(configDir);
    if (!rules || rules->empty()) {
        utils::errorLog("No triggers loaded. Create YAML match files in " + configDir);
        return 1;
    }

    if (lifecycle::installSignalHandlers() != Result::Success) {
        return 1;
    }

    auto handle = std::make_shared<RuleSetHandle>(rules);
    SystemCapabilities capabilities(options.clipboardCommand);

    EngineOptions engineOptions;
    engineOptions.policy = options.policy;
    engineOptions.commandTimeout = options.commandTimeout;
    ExpansionEngine engine(handle, capabilities, engineOptions);
    utils::debugLog("Overlap policy: " + matchPolicyToString(options.policy));

    if (options.readStdin) {
        return runStdin(engine, *handle, configDir);
    }

    auto devices = DeviceScanner::findKeyboards();
    if (devices.empty()) {
        utils::errorLog("No keyboard found. Are you in the 'input' group or running with sudo?");
        return 1;
    }

    if (options.daemonize && lifecycle::daemonize() != Result::Success) {
        return 1;
    }

    return runDevices(engine, *handle, configDir, std::move(devices));
}
