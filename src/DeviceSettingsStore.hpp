// DeviceSettingsStore.hpp
// Persisted device endpoints and discovery history, one file per device under
// ~/.config/avlink (or AVLINK_CONFIG_DIR).
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "CandidateValidator.hpp"

enum class DiscoveryMethod {
    Stored,
    Scan,
    Manual
};

const char* discoveryMethodName(DiscoveryMethod method);
std::optional<DiscoveryMethod> parseDiscoveryMethod(const std::string& name);

struct DiscoveryHistoryEntry {
    std::int64_t timestamp{0}; // Unix seconds
    std::string ip;
    DiscoveryMethod method{DiscoveryMethod::Stored};
    bool success{false};
    long responseTimeMs{0};
    std::string error;
};

struct DeviceSettings {
    std::string kind{"avr"}; // "avr" or "tv"
    std::string ip;
    int port{0};
    std::string deviceName;
    std::string macAddress;
    std::int64_t lastConnectedAt{0};
    std::int64_t lastDiscoveryAt{0};
    int failedAttempts{0};
    std::vector<DiscoveryHistoryEntry> history; // oldest first
};

class DeviceSettingsStore {
public:
    static constexpr size_t kMaxHistory = 50;

    // Empty directory selects ~/.config/avlink.
    explicit DeviceSettingsStore(std::string directory = {});

    // The active device of this kind, if one was saved.
    std::optional<DeviceSettings> load(const std::string& kind);

    // Writes the record and makes it the active device of its kind.
    bool save(const DeviceSettings& settings);

    bool recordConnected(const std::string& kind);
    bool recordFailedConnection(const std::string& kind, const std::string& error);
    bool addDiscoveryHistory(const std::string& kind, DiscoveryHistoryEntry entry);

    // Stores a validated endpoint as the active device, keeping the history of
    // the previous one.
    bool saveValidated(const std::string& kind, const ValidatedEndpoint& endpoint, DiscoveryMethod method,
                       const std::string& macAddress = {});

    const std::string& directory() const { return m_directory; }
    const std::string& lastError() const { return m_lastError; }

    // <sha256 of "kind:ip:port">.conf
    std::string pathFor(const DeviceSettings& settings) const;

private:
    std::string activePointerPath(const std::string& kind) const;
    std::optional<DeviceSettings> readFile(const std::string& path);
    bool ensureDirectory();

    std::string m_directory;
    std::string m_lastError;
};
