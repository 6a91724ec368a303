// AvrClient.hpp
// Stateful telnet session to one Denon/Marantz receiver.
//
// One worker thread owns the socket. Callers on any thread queue commands and
// get a std::future back; commands go out FIFO with at most one in flight, and
// every received status line is matched against the reply table so unsolicited
// chatter keeps the mirrored state current and can satisfy waiting queries.
//
// When the real connection is disabled (or the very first connection of the
// session cannot be established and fallback is enabled) the client answers
// from a locally simulated receiver with the same return shapes.
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "DenonProtocol.hpp"

enum class AvrErrc {
    ConnectionTimeout,
    ConnectionLost,
    CommandTimeout,
    MalformedReply
};

const char* avrErrcName(AvrErrc code);

class AvrClientError : public std::runtime_error {
public:
    AvrClientError(AvrErrc code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    AvrErrc code() const { return m_code; }

private:
    AvrErrc m_code;
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    SimulatedFallback
};

const char* connectionStateName(ConnectionState state);

struct AvrClientConfig {
    std::string ip{"192.168.50.98"};
    int port{Denon::kDefaultPort};
    std::string deviceName{"Denon AVR"};
    bool enableRealConnection{false};

    int connectionTimeoutMs{5000};
    int connectRetries{2};          // extra attempts per connection establishment
    int reconnectBaseMs{500};       // doubled per consecutive failure
    int reconnectMaxMs{30000};
    int commandTimeoutMs{3000};
    int commandGapMs{50};           // receivers drop back-to-back commands
    int cacheTtlMs{1000};
    bool fallbackOnConnectFailure{true};
};

struct AvrDiagnostics {
    std::string target;
    std::string connectionState;
    bool connected{false};
    bool simulated{false};
    std::optional<bool> powerOn;
    std::optional<int> volumePercent;
    std::optional<bool> muted;
    std::optional<std::string> input;
    std::optional<std::string> soundMode;
    std::vector<std::string> issues;
};

class AvrClient {
public:
    using StatusListener = std::function<void(const Denon::MirroredState&)>;

    explicit AvrClient(AvrClientConfig config);
    ~AvrClient();

    AvrClient(const AvrClient&) = delete;
    AvrClient& operator=(const AvrClient&) = delete;

    // Opens the session now instead of on the first command. Blocks until the
    // attempt settles. True when connected or simulating.
    bool connect();

    ConnectionState connectionState() const;
    Denon::MirroredState mirroredState() const;
    const AvrClientConfig& config() const { return m_config; }

    // Fired (on the worker thread, or the caller's thread when simulating) after
    // every change of the mirrored state.
    void setStatusListener(StatusListener listener);

    // Queries
    std::future<bool> getPowerState();
    std::future<int> getVolume();
    std::future<bool> getMuteState();
    std::future<std::string> getCurrentInput();
    std::future<std::string> getSoundMode();
    std::future<std::string> getEcoMode();
    std::future<int> getSleepTimer();
    std::future<bool> getZone2Power();

    // Sends a logical command from the Denon command table, or one of the
    // valued commands SET_VOLUME (percent), INPUT_CHANGE (input name),
    // SOUND_MODE (mode) and MUTE_TOGGLE. Resolves to false for unknown names
    // and invalid values.
    std::future<bool> sendCommand(const std::string& name, const std::string& value = {});

    std::future<bool> powerOn() { return sendCommand("POWER_ON"); }
    std::future<bool> powerOff() { return sendCommand("POWER_OFF"); }
    std::future<bool> setVolume(int percent) { return sendCommand("SET_VOLUME", std::to_string(percent)); }
    std::future<bool> volumeUp() { return sendCommand("VOLUME_UP"); }
    std::future<bool> volumeDown() { return sendCommand("VOLUME_DOWN"); }
    std::future<bool> setMute(bool muted) { return sendCommand(muted ? "MUTE_ON" : "MUTE_OFF"); }
    std::future<bool> toggleMute();
    std::future<bool> setInput(const std::string& input) { return sendCommand("INPUT_CHANGE", input); }
    std::future<bool> setSoundMode(const std::string& mode) { return sendCommand("SOUND_MODE", mode); }
    std::future<bool> navigate(const std::string& direction);      // UP, DOWN, ..., MENU, HOME
    std::future<bool> playbackControl(const std::string& action);  // PLAY, PAUSE, STOP, NEXT, ...
    std::future<bool> setEcoMode(const std::string& mode);         // AUTO, ON, OFF
    std::future<bool> setSleepTimer(int minutes);                  // 0, 30, 60, 90, 120
    std::future<bool> quickSelect(int preset);                     // 1..5
    std::future<bool> setZone2Power(bool on) { return sendCommand(on ? "ZONE2_POWER_ON" : "ZONE2_POWER_OFF"); }
    std::future<bool> setZone2Volume(int percent);
    std::future<bool> setZone2Mute(bool muted) { return sendCommand(muted ? "ZONE2_MUTE_ON" : "ZONE2_MUTE_OFF"); }

    // Connects if needed and runs the status queries once, collecting
    // everything that went wrong instead of throwing.
    AvrDiagnostics runDiagnostics();

private:
    using Completion = std::function<void(std::exception_ptr, const Denon::MirroredState&)>;

    struct PendingCommand {
        std::string name;
        std::string value;
        std::string wire;
        Denon::Field field{Denon::Field::None};
        bool query{false};
        bool sawMalformed{false};
        std::chrono::steady_clock::time_point deadline;
        std::vector<Completion> waiters;
    };

    // Work finished under the lock, delivered after it is released.
    struct Outbox {
        std::vector<std::pair<std::shared_ptr<PendingCommand>, std::exception_ptr>> finished;
        bool stateChanged{false};
        Denon::MirroredState snapshot;
        StatusListener listener;
    };

    template <typename T>
    std::future<T> submit(const std::string& name, const std::string& value, const std::string& wire,
                          std::function<T(const Denon::MirroredState&)> extract);
    void dispatch(const std::string& name, const std::string& value, const std::string& wire, Completion done);
    std::future<bool> rejected();

    void run();
    void establish(std::unique_lock<std::mutex>& lock, Outbox& out);
    void expireInFlight(std::chrono::steady_clock::time_point now, Outbox& out);
    bool writeNext(std::chrono::steady_clock::time_point now, Outbox& out);
    void processIncoming(const std::string& data, Outbox& out);
    void dropConnection(const std::string& reason, Outbox& out);
    void failAll(Outbox& out, AvrErrc code, const std::string& message);
    void serveBySimulation(Outbox& out);
    int nextWakeMs(std::chrono::steady_clock::time_point now) const;
    int backoffDelayMs(int failures) const;
    bool isFresh(Denon::Field field, std::chrono::steady_clock::time_point now) const;
    void seal(Outbox& out);
    static void deliver(Outbox& out);
    void wake();
    bool waitForStop(int ms);

    AvrClientConfig m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    ConnectionState m_state{ConnectionState::Disconnected};
    Denon::MirroredState m_mirror;
    std::map<Denon::Field, std::chrono::steady_clock::time_point> m_confirmedAt;
    std::deque<std::shared_ptr<PendingCommand>> m_queue;
    std::shared_ptr<PendingCommand> m_inFlight;
    StatusListener m_listener;

    bool m_stop{false};
    bool m_everConnected{false};
    bool m_connectRequested{false};
    bool m_reconnectScheduled{false};
    int m_connectFailures{0};
    std::chrono::steady_clock::time_point m_reconnectAt;
    std::chrono::steady_clock::time_point m_nextConnectAllowed;
    std::chrono::steady_clock::time_point m_lastWrite;

    // Worker-owned.
    int m_fd{-1};
    std::string m_rxBuffer;

    int m_wakePipe[2]{-1, -1};
    int m_stopPipe[2]{-1, -1};
    std::thread m_worker;
};
