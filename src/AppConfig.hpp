// AppConfig.hpp
// Process configuration gathered from the environment.
#pragma once

#include <string>

#include "AvrClient.hpp"
#include "CandidateScorer.hpp"
#include "CandidateValidator.hpp"
#include "Logging.hpp"

struct AppConfig {
    AvrClientConfig avr;
    ScoringConfig scoring;
    ValidationConfig validation;
    std::string settingsDir;   // empty: DeviceSettingsStore picks ~/.config/avlink
    bool verbose{false};

    // ENABLE_AVR_CONNECTION, DENON_AVR_IP, DENON_AVR_PORT, DENON_AVR_DEVICE_NAME,
    // AVR_CONNECTION_TIMEOUT_MS, AVR_COMMAND_TIMEOUT_MS,
    // AVLINK_VALIDATION_TIMEOUT_MS, VIZIO_AUTH_TOKEN, VIZIO_PORT,
    // AVLINK_AVR_THRESHOLD, AVLINK_TV_THRESHOLD, AVLINK_CONFIG_DIR, AVLINK_VERBOSE.
    // Unparseable numbers are reported and ignored.
    static AppConfig fromEnvironment();
};
