// CandidateValidator.hpp
// Confirms scored candidates with a short protocol handshake.
#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CandidateScorer.hpp"

struct DeviceInfo {
    std::optional<std::string> name;
    std::optional<std::string> brand;
};

struct ValidatedEndpoint {
    std::string ip;
    int port{0};
    long responseTimeMs{0};
    bool authRequired{false};
    std::optional<DeviceInfo> deviceInfo;
};

struct ValidationConfig {
    int timeoutMs{1500};
    int avrPort{23};
    int tvPort{7345};
    std::string tvAuthToken; // sent as the AUTH header when non-empty
};

// One handshake against one candidate. Implementations must be safe to call
// from several threads at once and must not throw.
class Handshake {
public:
    virtual ~Handshake() = default;
    virtual std::optional<ValidatedEndpoint> probe(const Candidate& candidate) const = 0;
};

// Denon telnet: connect, send "PW?" and "NSFRN ?", accept the first line that
// looks like a Denon status reply.
class DenonHandshake : public Handshake {
public:
    explicit DenonHandshake(ValidationConfig config) : m_config(std::move(config)) {}
    std::optional<ValidatedEndpoint> probe(const Candidate& candidate) const override;

private:
    ValidationConfig m_config;
};

// Vizio SmartCast over HTTPS (self-signed certificate).
class VizioHandshake : public Handshake {
public:
    explicit VizioHandshake(ValidationConfig config);
    std::optional<ValidatedEndpoint> probe(const Candidate& candidate) const override;

    // Exposed for tests: pulls ITEMS[0].VALUE out of a settings response.
    static std::optional<std::string> parseDeviceName(const std::string& body);

private:
    struct HttpResult {
        bool transportOk{false};
        long status{0};
        std::string body;
    };
    HttpResult get(const std::string& url) const;

    ValidationConfig m_config;
};

std::unique_ptr<Handshake> makeHandshake(DeviceClass cls, const ValidationConfig& config);

// Runs the handshake for every candidate concurrently. Failed candidates are
// dropped; survivors keep their input order. A candidate whose task thread
// cannot be started is probed on the calling thread, as with
// policy == std::launch::deferred.
std::vector<ValidatedEndpoint> validateCandidates(const std::vector<Candidate>& candidates,
                                                  const Handshake& handshake,
                                                  std::launch policy = std::launch::async);
