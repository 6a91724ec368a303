// main.cpp
#include "AppConfig.hpp"
#include "AvrClient.hpp"
#include "DeviceSettingsStore.hpp"
#include "NetworkDiscovery.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>

namespace {

void printUsage() {
    std::cout << "Usage: avlink <action> [options]\n"
              << "Actions:\n"
              << "  --scan-avr              Rank ARP entries as AVR candidates\n"
              << "  --scan-tv               Rank ARP entries as TV candidates\n"
              << "  --discover-avr          Scan and confirm AVRs with a telnet handshake\n"
              << "  --discover-tv           Scan and confirm TVs with a SmartCast handshake\n"
              << "  --status                Query power, volume, mute, input and sound mode\n"
              << "  --command=NAME          Send a logical command (see avlink_commands)\n"
              << "  --diagnostics           Check the AVR connection and report issues\n"
              << "Options:\n"
              << "  --value=V               Value for SET_VOLUME, INPUT_CHANGE, SOUND_MODE\n"
              << "  --ip=ADDR --port=N      Override the AVR endpoint\n"
              << "  --save                  Persist the best validated endpoint\n"
              << "  --real                  Same as ENABLE_AVR_CONNECTION=true\n";
}

void printCandidates(const std::vector<Candidate>& candidates) {
    if (candidates.empty()) {
        std::cout << "No candidates found." << std::endl;
        return;
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        std::cout << "  [" << i << "] " << std::left << std::setw(16) << c.ip
                  << std::setw(24) << c.hostname.value_or("?")
                  << std::fixed << std::setprecision(2) << c.confidence
                  << (c.brand ? "  brand=" + *c.brand : std::string())
                  << "  (" << c.reason << ")" << std::endl;
    }
}

void printEndpoints(const std::vector<ValidatedEndpoint>& endpoints) {
    if (endpoints.empty()) {
        std::cout << "No device confirmed." << std::endl;
        return;
    }
    for (size_t i = 0; i < endpoints.size(); ++i) {
        const auto& e = endpoints[i];
        std::cout << "  [" << i << "] " << e.ip << ":" << e.port << "  " << e.responseTimeMs << " ms";
        if (e.deviceInfo && e.deviceInfo->name) std::cout << "  name=\"" << *e.deviceInfo->name << "\"";
        if (e.deviceInfo && e.deviceInfo->brand) std::cout << "  brand=" << *e.deviceInfo->brand;
        if (e.authRequired) std::cout << "  (pairing required)";
        std::cout << std::endl;
    }
}

std::string findMac(const std::vector<Candidate>& candidates, const std::string& ip) {
    for (const auto& c : candidates) {
        if (c.ip == ip && c.macAddress) return *c.macAddress;
    }
    return {};
}

int discover(NetworkDiscovery& discovery, DeviceClass cls, bool save, DeviceSettingsStore& store) {
    auto candidates = discovery.scanForCandidates(cls);
    auto handshake = makeHandshake(cls, discovery.validationConfig());
    auto endpoints = candidates.empty() ? std::vector<ValidatedEndpoint>{} : validateCandidates(candidates, *handshake);
    printEndpoints(endpoints);
    if (endpoints.empty()) return 2;

    if (save) {
        const auto& best = endpoints.front();
        std::string kind = cls == DeviceClass::Avr ? "avr" : "tv";
        if (!store.saveValidated(kind, best, DiscoveryMethod::Scan, findMac(candidates, best.ip))) {
            std::cerr << "[Settings] " << store.lastError() << std::endl;
            return 1;
        }
    }
    return 0;
}

// Resolves a future and prints the value, or the typed failure.
template <typename T>
bool report(const char* label, std::future<T> f) {
    try {
        std::cout << "  " << std::left << std::setw(12) << label << f.get() << std::endl;
        return true;
    } catch (const AvrClientError& e) {
        std::cerr << "  " << std::left << std::setw(12) << label << avrErrcName(e.code()) << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    AppConfig config = AppConfig::fromEnvironment();

    std::string action;
    std::string commandName, commandValue;
    bool save = false;
    bool ipOverridden = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const std::string cmdFlag = "--command=";
        const std::string valueFlag = "--value=";
        const std::string ipFlag = "--ip=";
        const std::string portFlag = "--port=";

        if (arg == "--scan-avr" || arg == "--scan-tv" || arg == "--discover-avr" || arg == "--discover-tv" ||
            arg == "--status" || arg == "--diagnostics") {
            action = arg;
        } else if (arg.rfind(cmdFlag, 0) == 0) {
            action = "--command";
            commandName = arg.substr(cmdFlag.size());
        } else if (arg.rfind(valueFlag, 0) == 0) {
            commandValue = arg.substr(valueFlag.size());
        } else if (arg.rfind(ipFlag, 0) == 0) {
            config.avr.ip = arg.substr(ipFlag.size());
            ipOverridden = true;
        } else if (arg.rfind(portFlag, 0) == 0) {
            try {
                config.avr.port = std::stoi(arg.substr(portFlag.size()));
                config.validation.avrPort = config.avr.port;
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << arg << std::endl;
                return 1;
            }
        } else if (arg == "--save") {
            save = true;
        } else if (arg == "--real") {
            config.avr.enableRealConnection = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    if (action.empty()) {
        printUsage();
        return 1;
    }

    DeviceSettingsStore store(config.settingsDir);
    NetworkDiscovery discovery(config.scoring, config.validation);

    if (action == "--scan-avr") {
        printCandidates(discovery.scanForAVRDevices());
        return 0;
    }
    if (action == "--scan-tv") {
        printCandidates(discovery.scanForTVDevices());
        return 0;
    }
    if (action == "--discover-avr") return discover(discovery, DeviceClass::Avr, save, store);
    if (action == "--discover-tv") return discover(discovery, DeviceClass::Tv, save, store);

    // Session actions: a saved AVR wins over the built-in default unless
    // DENON_AVR_IP or --ip says otherwise.
    bool usingStored = false;
    if (!ipOverridden && !std::getenv("DENON_AVR_IP")) {
        if (auto saved = store.load("avr")) {
            config.avr.ip = saved->ip;
            config.avr.port = saved->port;
            if (!saved->deviceName.empty()) config.avr.deviceName = saved->deviceName;
            usingStored = true;
            std::cout << "[main] Using saved AVR " << saved->ip << ":" << saved->port << std::endl;
        }
    }

    AvrClient avr(config.avr);
    if (config.avr.enableRealConnection && usingStored) {
        bool ok = avr.connect() && avr.connectionState() == ConnectionState::Connected;
        bool recorded = ok ? store.recordConnected("avr")
                           : store.recordFailedConnection("avr", "connect to " + config.avr.ip + " failed");
        if (!recorded) std::cerr << "[Settings] " << store.lastError() << std::endl;
    }

    if (action == "--diagnostics") {
        AvrDiagnostics d = avr.runDiagnostics();
        std::cout << "AVR diagnostics for " << d.target << " (" << d.connectionState << ")" << std::endl;
        if (d.powerOn) std::cout << "  power       " << (*d.powerOn ? "ON" : "STANDBY") << std::endl;
        if (d.volumePercent) std::cout << "  volume      " << *d.volumePercent << "%" << std::endl;
        if (d.muted) std::cout << "  muted       " << (*d.muted ? "yes" : "no") << std::endl;
        if (d.input) std::cout << "  input       " << *d.input << std::endl;
        if (d.soundMode) std::cout << "  sound mode  " << *d.soundMode << std::endl;
        for (const auto& issue : d.issues) std::cout << "  ! " << issue << std::endl;
        return d.connected || d.simulated ? 0 : 2;
    }

    if (action == "--status") {
        std::cout << config.avr.deviceName << " (" << connectionStateName(avr.connectionState()) << ")" << std::endl;
        std::cout << std::boolalpha;
        bool ok = report("power", avr.getPowerState());
        ok = report("volume", avr.getVolume()) && ok;
        ok = report("muted", avr.getMuteState()) && ok;
        ok = report("input", avr.getCurrentInput()) && ok;
        ok = report("soundMode", avr.getSoundMode()) && ok;
        return ok ? 0 : 2;
    }

    // --command
    std::transform(commandName.begin(), commandName.end(), commandName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    try {
        bool accepted = avr.sendCommand(commandName, commandValue).get();
        if (!accepted) {
            std::cerr << "Command rejected: " << commandName << std::endl;
            return 1;
        }
        std::cout << commandName << " OK" << std::endl;
        return 0;
    } catch (const AvrClientError& e) {
        std::cerr << commandName << " failed (" << avrErrcName(e.code()) << "): " << e.what() << std::endl;
        return 2;
    }
}
