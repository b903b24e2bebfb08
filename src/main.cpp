#include "core/Errors.hpp"
#include "core/MacroConfig.hpp"
#include "core/automation/MacroPlayer.hpp"
#include "core/io/Device.hpp"
#include "core/io/EvdevSource.hpp"
#include "core/io/MacroListener.hpp"
#include "core/io/UinputSink.hpp"
#include "core/util/SignalWatcher.hpp"
#include "utils/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

using namespace hotmacro;

namespace {

void printUsage() {
    std::cout << "Usage: hotmacro [config.json] [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --config, -c FILE  Macro configuration (default: macros.json next to the executable)\n";
    std::cout << "  --debug, -d        Enable debug logging\n";
    std::cout << "  --list-devices     Print input devices and exit\n";
    std::cout << "  --help, -h         Show this help\n";
    std::cout << "\nPress the trigger hotkey to start, pause and resume the macro.\n";
}

std::string defaultConfigPath() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "macros.json";
    }
    return (exe.parent_path() / "macros.json").string();
}

int listDevices() {
    auto devices = Device::getAllDevices();
    if (devices.empty()) {
        std::cout << "No input devices found\n";
        return 0;
    }
    for (const auto& device : devices) {
        std::cout << device.toString() << "\n";
    }
    return 0;
}

void applyLogSettings(const MacroConfig& config, bool debugMode) {
    auto& logger = Logger::getInstance();
    if (!config.logFile.empty()) {
        logger.setLogFile(config.logFile);
    }
    if (debugMode || config.logLevel.empty()) {
        return;
    }
    Logger::Level level;
    if (Logger::parseLevel(config.logLevel, level)) {
        logger.setLogLevel(level);
    } else {
        warning("Unknown log_level '{}' ignored", config.logLevel);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Must happen before any thread exists so every thread inherits the mask
    try {
        util::blockShutdownSignals();
    } catch (const std::system_error& e) {
        error("Critical: {}", e.what());
        return 1;
    }

    std::string configPath;
    bool debugMode = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
            Logger::getInstance().setLogLevel(Logger::LOG_DEBUG);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--list-devices") {
            return listDevices();
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                error("{} requires a file argument", arg);
                return 1;
            }
            configPath = argv[++i];
        } else if (arg.starts_with("-")) {
            error("Unknown option: {}", arg);
            printUsage();
            return 1;
        } else {
            if (!configPath.empty()) {
                error("Error: Only one config file can be provided. Got {} and {}", configPath, arg);
                return 1;
            }
            configPath = arg;
        }
    }
    if (configPath.empty()) {
        configPath = defaultConfigPath();
    }

    MacroConfig config;
    try {
        config = LoadConfigFile(configPath);
    } catch (const ConfigError& e) {
        error("Invalid configuration: {}", e.what());
        return 1;
    }
    applyLogSettings(config, debugMode);
    info("Config path: {}", configPath);

    std::string devicePath = config.inputDevice;
    try {
        if (devicePath.empty()) {
            Device keyboard = Device::findKeyboard();
            info("Using keyboard: {} ({})", keyboard.name, keyboard.eventPath);
            devicePath = keyboard.eventPath;
        }
    } catch (const DeviceError& e) {
        error("{}", e.what());
        return 1;
    }

    std::shared_ptr<UinputSink> sink;
    std::unique_ptr<EvdevSource> source;
    try {
        sink = std::make_shared<UinputSink>(
            config.outputName.empty() ? UinputSink::kDefaultName : config.outputName);
        source = std::make_unique<EvdevSource>(devicePath);
    } catch (const DeviceError& e) {
        error("{}", e.what());
        return 1;
    }
    info("Listening on {} ({}), output device '{}'", devicePath, source->Name(), sink->Name());

    automation::MacroPlayer player("macro", config.macro, config.loop, sink);
    MacroListener listener(config, player);

    info("Trigger hotkey: {} ({})", config.trigger.spec, toString(config.triggerMode));
    if (config.quit) {
        info("Quit hotkey: {}", config.quit->spec);
    }
    info("Macro: {} step(s){}", config.macro.size(), config.loop ? ", looping" : "");

    util::SignalWatcher signals;
    signals.setShutdownCallback([&source](int) { source->Interrupt(); });
    signals.start();

    ListenResult result = listener.Run(*source);

    player.stop();
    if (!player.waitForIdle(std::chrono::seconds(2))) {
        warning("Macro worker did not stop in time");
    }
    signals.stop();

    if (result == ListenResult::Quit) {
        info("Quit requested, exiting");
        return 0;
    }
    if (signals.shutdownRequested()) {
        info("Shutting down on signal {}", signals.lastSignal());
        return 0;
    }
    error("Input device {} stopped delivering events", devicePath);
    return 1;
}
