// NetworkDiscovery.hpp
// ARP enumeration -> scoring -> optional handshake validation.
// Never throws and never blocks on a device session.
#pragma once

#include <functional>
#include <vector>

#include "CandidateScorer.hpp"
#include "CandidateValidator.hpp"

using DeviceLister = std::function<std::vector<NetworkDevice>()>;

class NetworkDiscovery {
public:
    explicit NetworkDiscovery(ScoringConfig scoring = ScoringConfig{},
                              ValidationConfig validation = ValidationConfig{},
                              DeviceLister lister = listKnownDevices);

    std::vector<Candidate> scanForCandidates(DeviceClass cls);
    std::vector<Candidate> scanForAVRDevices() { return scanForCandidates(DeviceClass::Avr); }
    std::vector<Candidate> scanForTVDevices() { return scanForCandidates(DeviceClass::Tv); }

    std::vector<ValidatedEndpoint> discoverAndValidateTVs();
    std::vector<ValidatedEndpoint> discoverAndValidateAVRs();

    // Scan plus validation with a caller-supplied handshake.
    std::vector<ValidatedEndpoint> discoverAndValidate(DeviceClass cls, const Handshake& handshake);

    const ScoringConfig& scoringConfig() const { return m_scoring; }
    const ValidationConfig& validationConfig() const { return m_validation; }

private:
    ScoringConfig m_scoring;
    ValidationConfig m_validation;
    DeviceLister m_lister;
};
