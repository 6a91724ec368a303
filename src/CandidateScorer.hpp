// CandidateScorer.hpp
// Heuristic ranking of ARP entries as AVR or TV candidates.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "DeviceProbe.hpp"

enum class DeviceClass {
    Avr,
    Tv
};

const char* deviceClassName(DeviceClass cls);

struct Candidate : NetworkDevice {
    double confidence{0.0};
    std::string reason;               // comma-joined phrases of the rules that fired
    std::optional<std::string> brand; // set by TV rules only
};

// One independent heuristic. Rules sharing a non-empty group are exclusive:
// the first one that fires wins and the rest of the group is skipped.
struct ScoringRule {
    std::string group;
    double weight{0.0};
    std::string reason;
    std::optional<std::string> brand;
    std::function<bool(const NetworkDevice&)> matches;
};

// Tunables. The defaults were picked on one household network and are not
// expected to generalize; every value can be overridden from AppConfig.
struct ScoringConfig {
    double avrThreshold{0.2};
    double tvThreshold{0.3};

    // Exclusive last-octet bounds.
    int avrOctetLow{90};
    int avrOctetHigh{110};
    int tvOctetLow{100};
    int tvOctetHigh{130};

    std::vector<std::string> avrOuis{"0005cd", "001122"};
    std::vector<std::string> tvOuis{"2c641f", "58fd2b", "f8e903"};
};

class CandidateScorer {
public:
    CandidateScorer(std::vector<ScoringRule> rules, double threshold);

    static CandidateScorer forAvr(const ScoringConfig& config = ScoringConfig{});
    static CandidateScorer forTv(const ScoringConfig& config = ScoringConfig{});
    static CandidateScorer forClass(DeviceClass cls, const ScoringConfig& config = ScoringConfig{});

    // Runs every rule against the device, ignoring reachability and threshold.
    Candidate evaluate(const NetworkDevice& device) const;

    // Scores one device. Returns nullopt for unreachable devices and for scores
    // at or below the threshold.
    std::optional<Candidate> score(const NetworkDevice& device) const;

    // Scores every device and sorts the survivors by confidence, descending.
    // Equal scores keep their input order.
    std::vector<Candidate> rank(const std::vector<NetworkDevice>& devices) const;

    const std::vector<ScoringRule>& rules() const { return m_rules; }
    double threshold() const { return m_threshold; }

private:
    std::vector<ScoringRule> m_rules;
    double m_threshold;
};

// First three octets, each zero-padded, lower-case, no separators:
// "0:5:cd:7d:d8:a6" -> "0005cd". Empty string if the address is unusable.
std::string normalizeOui(const std::string& mac);

// Last octet of a dotted quad, or -1.
int lastOctet(const std::string& ip);

// Rule factories.
ScoringRule hostnameContains(const std::string& needle, double weight, const std::string& reason,
                             std::optional<std::string> brand = std::nullopt);
ScoringRule hostnameMatches(const std::string& pattern, double weight, const std::string& reason);
ScoringRule ouiInSet(std::vector<std::string> ouis, double weight, const std::string& reason,
                     std::optional<std::string> brand = std::nullopt);
ScoringRule lastOctetBetween(int low, int high, double weight, const std::string& reason);
