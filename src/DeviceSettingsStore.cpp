// DeviceSettingsStore.cpp
#include "DeviceSettingsStore.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <errno.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/sha.h>

using namespace std::chrono;

namespace {

std::string sha256(const std::string& str) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(str.c_str()), str.length(), hash);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::int64_t nowSeconds() {
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// Values are stored one per line; history fields are '|'-separated.
std::string sanitize(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c == '\n' || c == '\r' || c == '|') c = ' ';
    }
    return out;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    std::istringstream in(s);
    while (std::getline(in, cur, sep)) parts.push_back(cur);
    if (!s.empty() && s.back() == sep) parts.emplace_back();
    return parts;
}

std::string defaultDirectory() {
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return std::string(home) + "/.config/avlink";
}

} // namespace

const char* discoveryMethodName(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::Stored: return "stored";
        case DiscoveryMethod::Scan: return "scan";
        case DiscoveryMethod::Manual: return "manual";
    }
    return "stored";
}

std::optional<DiscoveryMethod> parseDiscoveryMethod(const std::string& name) {
    if (name == "stored") return DiscoveryMethod::Stored;
    if (name == "scan") return DiscoveryMethod::Scan;
    if (name == "manual") return DiscoveryMethod::Manual;
    return std::nullopt;
}

DeviceSettingsStore::DeviceSettingsStore(std::string directory)
    : m_directory(directory.empty() ? defaultDirectory() : std::move(directory)) {}

bool DeviceSettingsStore::ensureDirectory() {
    // ~/.config may not exist on a fresh account.
    size_t slash = m_directory.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        std::string parent = m_directory.substr(0, slash);
        if (mkdir(parent.c_str(), 0700) != 0 && errno != EEXIST) {
            m_lastError = "Cannot create " + parent;
            return false;
        }
    }
    if (mkdir(m_directory.c_str(), 0700) != 0 && errno != EEXIST) {
        m_lastError = "Cannot create " + m_directory;
        return false;
    }
    return true;
}

std::string DeviceSettingsStore::pathFor(const DeviceSettings& settings) const {
    return m_directory + "/" + sha256(settings.kind + ":" + settings.ip + ":" + std::to_string(settings.port)) + ".conf";
}

std::string DeviceSettingsStore::activePointerPath(const std::string& kind) const {
    return m_directory + "/" + kind + ".active";
}

std::optional<DeviceSettings> DeviceSettingsStore::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_lastError = "Cannot open " + path;
        return std::nullopt;
    }

    DeviceSettings s;
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        try {
            if (key == "kind") s.kind = value;
            else if (key == "ip") s.ip = value;
            else if (key == "port") s.port = std::stoi(value);
            else if (key == "deviceName") s.deviceName = value;
            else if (key == "macAddress") s.macAddress = value;
            else if (key == "lastConnectedAt") s.lastConnectedAt = std::stoll(value);
            else if (key == "lastDiscoveryAt") s.lastDiscoveryAt = std::stoll(value);
            else if (key == "failedAttempts") s.failedAttempts = std::stoi(value);
            else if (key == "history") {
                auto f = split(value, '|');
                if (f.size() < 6) continue;
                DiscoveryHistoryEntry e;
                e.timestamp = std::stoll(f[0]);
                e.ip = f[1];
                e.method = parseDiscoveryMethod(f[2]).value_or(DiscoveryMethod::Stored);
                e.success = (f[3] == "1");
                e.responseTimeMs = std::stol(f[4]);
                e.error = f[5];
                s.history.push_back(std::move(e));
            }
        } catch (const std::exception&) {
            std::cerr << "[Settings] " << path << ":" << lineNo << ": bad value for " << key << std::endl;
        }
    }
    if (s.ip.empty()) {
        m_lastError = path + " has no ip";
        return std::nullopt;
    }
    return s;
}

std::optional<DeviceSettings> DeviceSettingsStore::load(const std::string& kind) {
    std::ifstream pointer(activePointerPath(kind));
    if (!pointer.is_open()) {
        m_lastError = "No saved " + kind;
        return std::nullopt;
    }
    std::string name;
    std::getline(pointer, name);
    if (name.empty()) {
        m_lastError = "Empty pointer for " + kind;
        return std::nullopt;
    }
    return readFile(m_directory + "/" + name);
}

bool DeviceSettingsStore::save(const DeviceSettings& settings) {
    if (!ensureDirectory()) return false;

    std::string filepath = pathFor(settings);
    std::ofstream file(filepath);
    if (!file.is_open()) {
        m_lastError = "Failed to save settings to " + filepath;
        return false;
    }

    file << "kind=" << sanitize(settings.kind) << "\n";
    file << "ip=" << sanitize(settings.ip) << "\n";
    file << "port=" << settings.port << "\n";
    file << "deviceName=" << sanitize(settings.deviceName) << "\n";
    file << "macAddress=" << sanitize(settings.macAddress) << "\n";
    file << "lastConnectedAt=" << settings.lastConnectedAt << "\n";
    file << "lastDiscoveryAt=" << settings.lastDiscoveryAt << "\n";
    file << "failedAttempts=" << settings.failedAttempts << "\n";

    size_t skip = settings.history.size() > kMaxHistory ? settings.history.size() - kMaxHistory : 0;
    for (size_t i = skip; i < settings.history.size(); ++i) {
        const auto& e = settings.history[i];
        file << "history=" << e.timestamp << "|" << sanitize(e.ip) << "|" << discoveryMethodName(e.method) << "|"
             << (e.success ? 1 : 0) << "|" << e.responseTimeMs << "|" << sanitize(e.error) << "\n";
    }
    file.close();
    if (!file) {
        m_lastError = "Write error on " + filepath;
        return false;
    }
    chmod(filepath.c_str(), 0600);

    std::string pointerPath = activePointerPath(settings.kind);
    std::ofstream pointer(pointerPath);
    if (!pointer.is_open()) {
        m_lastError = "Failed to write " + pointerPath;
        return false;
    }
    pointer << filepath.substr(m_directory.size() + 1) << "\n";
    pointer.close();
    chmod(pointerPath.c_str(), 0600);
    return true;
}

bool DeviceSettingsStore::recordConnected(const std::string& kind) {
    auto s = load(kind);
    if (!s) return false;
    s->lastConnectedAt = nowSeconds();
    s->failedAttempts = 0;
    return save(*s);
}

bool DeviceSettingsStore::recordFailedConnection(const std::string& kind, const std::string& error) {
    auto s = load(kind);
    if (!s) return false;
    s->failedAttempts++;
    DiscoveryHistoryEntry e;
    e.timestamp = nowSeconds();
    e.ip = s->ip;
    e.method = DiscoveryMethod::Stored;
    e.success = false;
    e.error = error;
    s->history.push_back(std::move(e));
    return save(*s);
}

bool DeviceSettingsStore::addDiscoveryHistory(const std::string& kind, DiscoveryHistoryEntry entry) {
    auto s = load(kind);
    if (!s) return false;
    if (entry.timestamp == 0) entry.timestamp = nowSeconds();
    if (entry.success) s->lastDiscoveryAt = entry.timestamp;
    s->history.push_back(std::move(entry));
    if (s->history.size() > kMaxHistory) {
        s->history.erase(s->history.begin(), s->history.end() - kMaxHistory);
    }
    return save(*s);
}

bool DeviceSettingsStore::saveValidated(const std::string& kind, const ValidatedEndpoint& endpoint,
                                        DiscoveryMethod method, const std::string& macAddress) {
    DeviceSettings s;
    if (auto previous = load(kind)) s = std::move(*previous);

    bool sameDevice = (s.ip == endpoint.ip && s.port == endpoint.port);
    s.kind = kind;
    s.ip = endpoint.ip;
    s.port = endpoint.port;
    if (endpoint.deviceInfo && endpoint.deviceInfo->name) s.deviceName = *endpoint.deviceInfo->name;
    if (!macAddress.empty()) s.macAddress = macAddress;
    else if (!sameDevice) s.macAddress.clear();
    if (!sameDevice) s.failedAttempts = 0;

    DiscoveryHistoryEntry e;
    e.timestamp = nowSeconds();
    e.ip = endpoint.ip;
    e.method = method;
    e.success = true;
    e.responseTimeMs = endpoint.responseTimeMs;
    s.lastDiscoveryAt = e.timestamp;
    s.history.push_back(std::move(e));
    if (s.history.size() > kMaxHistory) {
        s.history.erase(s.history.begin(), s.history.end() - kMaxHistory);
    }

    if (!save(s)) return false;
    std::cout << "[Settings] Saved " << kind << " " << s.ip << ":" << s.port << " to " << pathFor(s) << std::endl;
    return true;
}
