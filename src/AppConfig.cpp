// AppConfig.cpp
#include "AppConfig.hpp"

#include <cstdlib>
#include <iostream>

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void readInt(const char* name, int& target, int minValue) {
    const char* v = env(name);
    if (!v) return;
    try {
        int parsed = std::stoi(v);
        if (parsed < minValue) {
            std::cerr << "[Config] " << name << "=" << v << " is below " << minValue << "; ignored" << std::endl;
            return;
        }
        target = parsed;
    } catch (const std::exception&) {
        std::cerr << "[Config] " << name << "=" << v << " is not a number; ignored" << std::endl;
    }
}

void readDouble(const char* name, double& target) {
    const char* v = env(name);
    if (!v) return;
    try {
        target = std::stod(v);
    } catch (const std::exception&) {
        std::cerr << "[Config] " << name << "=" << v << " is not a number; ignored" << std::endl;
    }
}

} // namespace

AppConfig AppConfig::fromEnvironment() {
    AppConfig c;

    // Anything but the literal "true" keeps the simulated receiver.
    if (const char* v = env("ENABLE_AVR_CONNECTION")) c.avr.enableRealConnection = (std::string(v) == "true");
    if (const char* v = env("DENON_AVR_IP")) c.avr.ip = v;
    readInt("DENON_AVR_PORT", c.avr.port, 1);
    if (const char* v = env("DENON_AVR_DEVICE_NAME")) c.avr.deviceName = v;
    readInt("AVR_CONNECTION_TIMEOUT_MS", c.avr.connectionTimeoutMs, 1);
    readInt("AVR_COMMAND_TIMEOUT_MS", c.avr.commandTimeoutMs, 1);

    readInt("AVLINK_VALIDATION_TIMEOUT_MS", c.validation.timeoutMs, 1);
    readInt("VIZIO_PORT", c.validation.tvPort, 1);
    c.validation.avrPort = c.avr.port;
    if (const char* v = env("VIZIO_AUTH_TOKEN")) c.validation.tvAuthToken = v;

    readDouble("AVLINK_AVR_THRESHOLD", c.scoring.avrThreshold);
    readDouble("AVLINK_TV_THRESHOLD", c.scoring.tvThreshold);

    if (const char* v = env("AVLINK_CONFIG_DIR")) c.settingsDir = v;
    c.verbose = verboseLogging();
    return c;
}
