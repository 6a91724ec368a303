// NetworkDiscovery.cpp
#include "NetworkDiscovery.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

#include "Logging.hpp"

NetworkDiscovery::NetworkDiscovery(ScoringConfig scoring, ValidationConfig validation, DeviceLister lister)
    : m_scoring(std::move(scoring)), m_validation(std::move(validation)), m_lister(std::move(lister)) {}

std::vector<Candidate> NetworkDiscovery::scanForCandidates(DeviceClass cls) {
    const char* label = deviceClassName(cls);
    std::vector<NetworkDevice> devices;
    try {
        devices = m_lister ? m_lister() : std::vector<NetworkDevice>{};
    } catch (const std::exception& e) {
        std::cerr << "[Discovery] " << label << " scan failed: " << e.what() << std::endl;
        return {};
    }

    std::cout << "[Discovery] Scanning " << devices.size() << " known devices for " << label << " candidates" << std::endl;

    auto scorer = CandidateScorer::forClass(cls, m_scoring);
    auto candidates = scorer.rank(devices);

    size_t shown = verboseLogging() ? candidates.size() : std::min<size_t>(candidates.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        const auto& c = candidates[i];
        std::cout << "[Discovery]   " << c.ip << " (" << c.hostname.value_or("?") << ") "
                  << std::fixed << std::setprecision(2) << c.confidence << ": " << c.reason << std::endl;
    }
    if (candidates.empty()) {
        std::cout << "[Discovery] No " << label << " candidates above " << scorer.threshold() << std::endl;
    }
    return candidates;
}

std::vector<ValidatedEndpoint> NetworkDiscovery::discoverAndValidate(DeviceClass cls, const Handshake& handshake) {
    auto candidates = scanForCandidates(cls);
    if (candidates.empty()) return {};

    std::cout << "[Discovery] Validating " << candidates.size() << " " << deviceClassName(cls)
              << " candidates" << std::endl;
    auto endpoints = validateCandidates(candidates, handshake);
    std::cout << "[Discovery] " << endpoints.size() << " of " << candidates.size() << " confirmed" << std::endl;
    return endpoints;
}

std::vector<ValidatedEndpoint> NetworkDiscovery::discoverAndValidateTVs() {
    auto handshake = makeHandshake(DeviceClass::Tv, m_validation);
    return discoverAndValidate(DeviceClass::Tv, *handshake);
}

std::vector<ValidatedEndpoint> NetworkDiscovery::discoverAndValidateAVRs() {
    auto handshake = makeHandshake(DeviceClass::Avr, m_validation);
    return discoverAndValidate(DeviceClass::Avr, *handshake);
}
