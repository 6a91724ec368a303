// CandidateScorer.cpp
#include "CandidateScorer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace {

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

const char* deviceClassName(DeviceClass cls) {
    return cls == DeviceClass::Avr ? "AVR" : "TV";
}

std::string normalizeOui(const std::string& mac) {
    std::string out;
    std::string octet;
    int taken = 0;
    auto flush = [&]() -> bool {
        if (octet.empty() || octet.size() > 2) return false;
        if (octet.size() == 1) out += '0';
        out += octet;
        octet.clear();
        ++taken;
        return true;
    };

    for (char c : mac) {
        if (taken == 3) break;
        if (c == ':' || c == '-') {
            if (!flush()) return {};
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) return {};
        octet += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (taken < 3 && !flush()) return {};
    return taken == 3 ? out : std::string{};
}

int lastOctet(const std::string& ip) {
    size_t dot = ip.rfind('.');
    if (dot == std::string::npos || dot + 1 >= ip.size()) return -1;
    const char* start = ip.c_str() + dot + 1;
    char* end = nullptr;
    long v = std::strtol(start, &end, 10);
    if (end == start || *end != '\0' || v < 0 || v > 255) return -1;
    return static_cast<int>(v);
}

ScoringRule hostnameContains(const std::string& needle, double weight, const std::string& reason,
                             std::optional<std::string> brand) {
    std::string lowered = toLower(needle);
    return ScoringRule{"hostname", weight, reason, std::move(brand),
                       [lowered](const NetworkDevice& d) {
                           return d.hostname && toLower(*d.hostname).find(lowered) != std::string::npos;
                       }};
}

ScoringRule hostnameMatches(const std::string& pattern, double weight, const std::string& reason) {
    std::regex re(pattern);
    return ScoringRule{"hostname", weight, reason, std::nullopt,
                       [re](const NetworkDevice& d) {
                           return d.hostname && std::regex_search(toLower(*d.hostname), re);
                       }};
}

ScoringRule ouiInSet(std::vector<std::string> ouis, double weight, const std::string& reason,
                     std::optional<std::string> brand) {
    for (auto& o : ouis) o = toLower(o);
    return ScoringRule{"mac", weight, reason, std::move(brand),
                       [ouis](const NetworkDevice& d) {
                           if (!d.macAddress) return false;
                           std::string oui = normalizeOui(*d.macAddress);
                           return !oui.empty() && std::find(ouis.begin(), ouis.end(), oui) != ouis.end();
                       }};
}

ScoringRule lastOctetBetween(int low, int high, double weight, const std::string& reason) {
    return ScoringRule{"ip", weight, reason, std::nullopt,
                       [low, high](const NetworkDevice& d) {
                           int octet = lastOctet(d.ip);
                           return octet > low && octet < high;
                       }};
}

CandidateScorer::CandidateScorer(std::vector<ScoringRule> rules, double threshold)
    : m_rules(std::move(rules)), m_threshold(threshold) {}

CandidateScorer CandidateScorer::forAvr(const ScoringConfig& config) {
    std::vector<ScoringRule> rules;
    rules.push_back(hostnameContains("avr", 0.8, "hostname contains \"avr\""));
    rules.push_back(hostnameContains("denon", 0.9, "hostname contains \"denon\""));
    rules.push_back(hostnameContains("marantz", 0.7, "hostname contains \"marantz\""));
    rules.push_back(hostnameMatches("^[a-zA-Z]{2,6}[0-9]{4,}", 0.3, "hostname matches model pattern"));
    rules.push_back(ouiInSet(config.avrOuis, 0.4, "MAC address matches known AVR vendor"));
    rules.push_back(lastOctetBetween(config.avrOctetLow, config.avrOctetHigh, 0.1, "IP in typical AVR range"));
    return CandidateScorer(std::move(rules), config.avrThreshold);
}

CandidateScorer CandidateScorer::forTv(const ScoringConfig& config) {
    std::vector<ScoringRule> rules;
    rules.push_back(hostnameContains("vizio", 0.9, "hostname contains \"vizio\"", std::string("vizio")));
    rules.push_back(hostnameContains("smartcast", 0.8, "hostname contains \"smartcast\"", std::string("vizio")));
    rules.push_back(hostnameContains("tv", 0.6, "hostname contains \"tv\""));
    for (const char* brand : {"samsung", "lg", "sony"}) {
        rules.push_back(hostnameContains(brand, 0.7, "hostname matches TV brand", std::string(brand)));
    }
    rules.push_back(ouiInSet(config.tvOuis, 0.5, "MAC address matches known TV vendor", std::string("vizio")));
    rules.push_back(lastOctetBetween(config.tvOctetLow, config.tvOctetHigh, 0.1, "IP in typical TV range"));
    return CandidateScorer(std::move(rules), config.tvThreshold);
}

CandidateScorer CandidateScorer::forClass(DeviceClass cls, const ScoringConfig& config) {
    return cls == DeviceClass::Avr ? forAvr(config) : forTv(config);
}

Candidate CandidateScorer::evaluate(const NetworkDevice& device) const {
    Candidate c;
    static_cast<NetworkDevice&>(c) = device;

    std::vector<std::string> firedGroups;
    std::ostringstream reasons;
    bool first = true;

    for (const auto& rule : m_rules) {
        if (!rule.group.empty() &&
            std::find(firedGroups.begin(), firedGroups.end(), rule.group) != firedGroups.end()) {
            continue;
        }
        if (!rule.matches || !rule.matches(device)) continue;

        c.confidence += rule.weight;
        if (!first) reasons << ", ";
        reasons << rule.reason;
        first = false;
        if (rule.brand && !c.brand) c.brand = rule.brand;
        if (!rule.group.empty()) firedGroups.push_back(rule.group);
    }

    c.reason = reasons.str();
    return c;
}

std::optional<Candidate> CandidateScorer::score(const NetworkDevice& device) const {
    if (!device.isReachable) return std::nullopt;
    Candidate c = evaluate(device);
    if (c.confidence <= m_threshold) return std::nullopt;
    return c;
}

std::vector<Candidate> CandidateScorer::rank(const std::vector<NetworkDevice>& devices) const {
    std::vector<Candidate> out;
    for (const auto& d : devices) {
        if (auto c = score(d)) out.push_back(std::move(*c));
    }
    std::stable_sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        return a.confidence > b.confidence;
    });
    return out;
}
