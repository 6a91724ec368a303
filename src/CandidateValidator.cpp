// CandidateValidator.cpp
#include "CandidateValidator.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <system_error>

#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <curl/curl.h>

#include "DenonProtocol.hpp"
#include "DeviceProbe.hpp"
#include "Logging.hpp"

using namespace std::chrono;

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t totalSize = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), totalSize);
    return totalSize;
}

long elapsedMs(steady_clock::time_point since) {
    return static_cast<long>(duration_cast<milliseconds>(steady_clock::now() - since).count());
}

std::once_flag g_curlInit;

constexpr int kNameGraceMs = 250;

} // namespace

std::optional<ValidatedEndpoint> DenonHandshake::probe(const Candidate& candidate) const {
    auto start = steady_clock::now();
    auto deadline = start + milliseconds(m_config.timeoutMs);

    int fd = openTcpConnection(candidate.ip, m_config.avrPort, m_config.timeoutMs);
    if (fd < 0) {
        if (verboseLogging()) {
            std::cout << "[Validator] " << candidate.ip << ":" << m_config.avrPort << " refused or timed out" << std::endl;
        }
        return std::nullopt;
    }

    if (!sendAll(fd, "PW?\r") || !sendAll(fd, "NSFRN ?\r")) {
        ::close(fd);
        return std::nullopt;
    }

    std::string buffer;
    bool confirmed = false;
    long responseTimeMs = 0;
    std::optional<std::string> friendlyName;

    while (steady_clock::now() < deadline) {
        int remaining = static_cast<int>(duration_cast<milliseconds>(deadline - steady_clock::now()).count());
        if (remaining <= 0) break;
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, remaining);
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) break;

        char chunk[512];
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) break;
        buffer.append(chunk, static_cast<size_t>(n));

        for (const auto& line : Denon::extractLines(buffer)) {
            if (line.rfind("NSFRN", 0) == 0 && line.size() > 6) {
                friendlyName = line.substr(6);
            } else if (Denon::looksLikeDenonReply(line) && !confirmed) {
                confirmed = true;
                responseTimeMs = elapsedMs(start);
                // Older receivers never answer NSFRN; give the name a short grace only.
                deadline = std::min(deadline, steady_clock::now() + milliseconds(kNameGraceMs));
            }
        }
        if (confirmed && friendlyName) break;
    }
    ::close(fd);

    if (!confirmed) return std::nullopt;

    ValidatedEndpoint ep;
    ep.ip = candidate.ip;
    ep.port = m_config.avrPort;
    ep.responseTimeMs = responseTimeMs;
    DeviceInfo info;
    info.name = friendlyName ? friendlyName : candidate.hostname;
    info.brand = std::string("denon");
    ep.deviceInfo = info;
    return ep;
}

VizioHandshake::VizioHandshake(ValidationConfig config) : m_config(std::move(config)) {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

VizioHandshake::HttpResult VizioHandshake::get(const std::string& url) const {
    HttpResult result;
    CURL* curl = curl_easy_init();
    if (!curl) return result;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "AvLink/1.0");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_config.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_config.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // SmartCast TVs serve a self-signed certificate.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);

    struct curl_slist* headers = nullptr;
    if (!m_config.tvAuthToken.empty()) {
        headers = curl_slist_append(headers, ("AUTH: " + m_config.tvAuthToken).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    result.transportOk = (res == CURLE_OK);
    if (!result.transportOk && verboseLogging()) {
        std::cout << "[Validator] " << url << ": " << curl_easy_strerror(res) << std::endl;
    }
    return result;
}

std::optional<std::string> VizioHandshake::parseDeviceName(const std::string& body) {
    size_t items = body.find("\"ITEMS\"");
    if (items == std::string::npos) return std::nullopt;

    std::string searchKey = "\"VALUE\"";
    size_t keyPos = body.find(searchKey, items);
    if (keyPos == std::string::npos) return std::nullopt;

    size_t colonPos = body.find(':', keyPos);
    if (colonPos == std::string::npos) return std::nullopt;

    size_t quoteStart = body.find('"', colonPos);
    if (quoteStart == std::string::npos) return std::nullopt;

    size_t quoteEnd = body.find('"', quoteStart + 1);
    if (quoteEnd == std::string::npos) return std::nullopt;

    std::string value = body.substr(quoteStart + 1, quoteEnd - quoteStart - 1);
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<ValidatedEndpoint> VizioHandshake::probe(const Candidate& candidate) const {
    auto start = steady_clock::now();
    std::string base = "https://" + candidate.ip + ":" + std::to_string(m_config.tvPort);

    ValidatedEndpoint ep;
    ep.ip = candidate.ip;
    ep.port = m_config.tvPort;

    auto nameReply = get(base + "/menu_native/dynamic/tv_settings/devices/name");
    if (nameReply.transportOk) {
        if (nameReply.status == 200) {
            ep.responseTimeMs = elapsedMs(start);
            DeviceInfo info;
            info.name = parseDeviceName(nameReply.body);
            if (!info.name) info.name = candidate.hostname;
            info.brand = candidate.brand ? candidate.brand : std::optional<std::string>("vizio");
            ep.deviceInfo = info;
            return ep;
        }
        if (nameReply.status == 401 || nameReply.status == 403) {
            ep.responseTimeMs = elapsedMs(start);
            ep.authRequired = true;
            DeviceInfo info;
            info.name = candidate.hostname;
            info.brand = candidate.brand;
            ep.deviceInfo = info;
            return ep;
        }
    }

    auto powerReply = get(base + "/state/device/power_mode");
    if (!powerReply.transportOk) return std::nullopt;
    if (powerReply.status < 200 || powerReply.status >= 500 ||
        (powerReply.status >= 300 && powerReply.status < 400)) {
        return std::nullopt;
    }

    ep.responseTimeMs = elapsedMs(start);
    ep.authRequired = (powerReply.status == 401 || powerReply.status == 403);
    DeviceInfo info;
    info.name = candidate.hostname;
    info.brand = candidate.brand;
    ep.deviceInfo = info;
    return ep;
}

std::unique_ptr<Handshake> makeHandshake(DeviceClass cls, const ValidationConfig& config) {
    if (cls == DeviceClass::Avr) return std::make_unique<DenonHandshake>(config);
    return std::make_unique<VizioHandshake>(config);
}

std::vector<ValidatedEndpoint> validateCandidates(const std::vector<Candidate>& candidates,
                                                  const Handshake& handshake, std::launch policy) {
    auto check = [&handshake](const Candidate& c) -> std::optional<ValidatedEndpoint> {
        try {
            return handshake.probe(c);
        } catch (const std::exception& e) {
            std::cerr << "[Validator] " << c.ip << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    };

    std::vector<std::future<std::optional<ValidatedEndpoint>>> tasks;
    tasks.reserve(candidates.size());
    for (const auto& c : candidates) {
        try {
            tasks.push_back(std::async(policy, check, std::cref(c)));
        } catch (const std::system_error& e) {
            std::cerr << "[Validator] No thread for " << c.ip << " (" << e.what() << "); probing inline" << std::endl;
            tasks.push_back(std::async(std::launch::deferred, check, std::cref(c)));
        }
    }

    std::vector<ValidatedEndpoint> out;
    for (size_t i = 0; i < tasks.size(); ++i) {
        auto result = tasks[i].get();
        if (result) {
            std::cout << "[Validator] Confirmed " << candidates[i].ip << ":" << result->port
                      << " in " << result->responseTimeMs << " ms"
                      << (result->authRequired ? " (auth required)" : "") << std::endl;
            out.push_back(std::move(*result));
        }
    }
    return out;
}
