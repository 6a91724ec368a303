#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "../src/AvrClient.hpp"
#include "../src/CandidateScorer.hpp"
#include "../src/CandidateValidator.hpp"
#include "../src/DenonProtocol.hpp"
#include "../src/DeviceProbe.hpp"
#include "../src/DeviceSettingsStore.hpp"
#include "../src/NetworkDiscovery.hpp"

using namespace std::chrono;

// Loopback stand-in for a receiver's telnet port. Each CR-terminated command is
// recorded and answered by the responder; kHangUp closes the connection instead.
class FakeAvr {
public:
    using Responder = std::function<std::string(const std::string& command, int connection)>;
    static constexpr const char* kHangUp = "<hangup>";

    explicit FakeAvr(Responder responder) : m_responder(std::move(responder)) {
        m_listen = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(m_listen, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(m_listen, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(m_listen, 4) != 0) {
            std::cerr << "[FakeAvr] bind/listen failed: " << std::strerror(errno) << "\n";
        }
        socklen_t len = sizeof(addr);
        getsockname(m_listen, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
        if (::pipe(m_stop) != 0) std::cerr << "[FakeAvr] pipe failed\n";
        m_thread = std::thread([this]() { serve(); });
    }

    ~FakeAvr() {
        char b = 1;
        if (::write(m_stop[1], &b, 1) < 0) std::cerr << "[FakeAvr] stop write failed\n";
        m_thread.join();
        if (m_client >= 0) ::close(m_client);
        ::close(m_listen);
        ::close(m_stop[0]);
        ::close(m_stop[1]);
    }

    int port() const { return m_port; }
    int accepts() const { return m_accepts.load(); }

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_received;
    }

    std::vector<steady_clock::time_point> receivedAt() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_receivedAt;
    }

    int count(const std::string& command) const {
        int n = 0;
        for (const auto& c : received()) n += (c == command);
        return n;
    }

    // Unsolicited status lines to the current client.
    void push(const std::string& data) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_client >= 0) ::send(m_client, data.data(), data.size(), MSG_NOSIGNAL);
    }

private:
    void serve() {
        std::string buffer;
        while (true) {
            pollfd fds[3];
            nfds_t n = 0;
            fds[n++] = pollfd{m_stop[0], POLLIN, 0};
            fds[n++] = pollfd{m_listen, POLLIN, 0};
            int client = m_client;
            if (client >= 0) fds[n++] = pollfd{client, POLLIN, 0};
            if (::poll(fds, n, -1) <= 0) continue;
            if (fds[0].revents & POLLIN) break;

            if (fds[1].revents & POLLIN) {
                int c = ::accept(m_listen, nullptr, nullptr);
                if (c >= 0) {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    if (m_client >= 0) ::close(m_client);
                    m_client = c;
                    buffer.clear();
                    m_accepts++;
                }
                continue;
            }

            if (client >= 0 && (fds[2].revents & (POLLIN | POLLHUP))) {
                char chunk[256];
                ssize_t got = ::recv(client, chunk, sizeof(chunk), 0);
                if (got <= 0) {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    ::close(m_client);
                    m_client = -1;
                    continue;
                }
                buffer.append(chunk, static_cast<size_t>(got));
                size_t cr;
                while ((cr = buffer.find('\r')) != std::string::npos) {
                    std::string command = buffer.substr(0, cr);
                    buffer.erase(0, cr + 1);
                    std::string reply;
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        m_received.push_back(command);
                        m_receivedAt.push_back(steady_clock::now());
                    }
                    reply = m_responder(command, m_accepts.load());
                    std::lock_guard<std::mutex> lock(m_mutex);
                    if (reply == kHangUp) {
                        ::close(m_client);
                        m_client = -1;
                        buffer.clear();
                        break;
                    }
                    if (!reply.empty() && m_client >= 0) {
                        ::send(m_client, reply.data(), reply.size(), MSG_NOSIGNAL);
                    }
                }
            }
        }
    }

    Responder m_responder;
    int m_listen{-1};
    int m_client{-1};
    int m_port{0};
    int m_stop[2]{-1, -1};
    std::atomic<int> m_accepts{0};
    mutable std::mutex m_mutex;
    std::vector<std::string> m_received;
    std::vector<steady_clock::time_point> m_receivedAt;
    std::thread m_thread;
};

// What a powered-on receiver tuned to TV/STEREO answers.
static std::string denonReplies(const std::string& cmd, int) {
    if (cmd == "PW?") return "PWON\r";
    if (cmd == "MV?") return "MV50\rMVMAX 98\r";
    if (cmd == "MU?") return "MUOFF\r";
    if (cmd == "SI?") return "SITV\r";
    if (cmd == "MS?") return "MSSTEREO\r";
    if (cmd == "NSFRN ?") return "NSFRN Living Room\r";
    if (cmd == "MVUP") return "MV51\r";
    if (cmd.rfind("PW", 0) == 0 || cmd.rfind("MU", 0) == 0 || cmd.rfind("SI", 0) == 0 ||
        cmd.rfind("MS", 0) == 0 || cmd.rfind("MV", 0) == 0) {
        return cmd + "\r";
    }
    return "";
}

// A port nothing listens on.
static int closedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

static AvrClientConfig loopbackConfig(int port) {
    AvrClientConfig c;
    c.ip = "127.0.0.1";
    c.port = port;
    c.deviceName = "Test AVR";
    c.enableRealConnection = true;
    c.connectionTimeoutMs = 500;
    c.connectRetries = 0;
    c.reconnectBaseMs = 200;
    c.commandTimeoutMs = 1000;
    c.commandGapMs = 5;
    c.fallbackOnConnectFailure = false;
    return c;
}

template <typename Pred>
static bool waitFor(Pred pred, int timeoutMs) {
    auto deadline = steady_clock::now() + milliseconds(timeoutMs);
    while (steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return pred();
}

template <typename T>
static bool failsWith(std::future<T> f, AvrErrc expected, std::string* message = nullptr) {
    try {
        f.get();
    } catch (const AvrClientError& e) {
        if (message) *message = e.what();
        return e.code() == expected;
    }
    return false;
}

static NetworkDevice device(const std::string& ip, const char* host, const char* mac, bool reachable = true) {
    NetworkDevice d;
    d.ip = ip;
    if (host) d.hostname = std::string(host);
    if (mac) d.macAddress = std::string(mac);
    d.isReachable = reachable;
    return d;
}

// Passes odd last octets, fails even ones; later candidates finish first.
class ScriptedHandshake : public Handshake {
public:
    std::optional<ValidatedEndpoint> probe(const Candidate& c) const override {
        int octet = lastOctet(c.ip);
        std::this_thread::sleep_for(milliseconds(std::max(0, 100 - octet * 15)));
        if (octet % 2 == 0) return std::nullopt;
        ValidatedEndpoint ep;
        ep.ip = c.ip;
        ep.port = 23;
        return ep;
    }
};

// Accepts everything and remembers which thread ran each probe.
class RecordingHandshake : public Handshake {
public:
    std::optional<ValidatedEndpoint> probe(const Candidate& c) const override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_threads.push_back(std::this_thread::get_id());
        }
        ValidatedEndpoint ep;
        ep.ip = c.ip;
        ep.port = 23;
        return ep;
    }

    std::vector<std::thread::id> threads() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_threads;
    }

private:
    mutable std::mutex m_mutex;
    mutable std::vector<std::thread::id> m_threads;
};

int main() {
    int failures = 0;

    // Test 1: arp -a line parses and scores as an AVR
    {
        auto devices = parseArpOutput("avr (192.168.50.99) at 0:5:cd:7d:d8:a6 on en0 ifscope [ethernet]\n");
        if (devices.size() != 1) {
            std::cerr << "[FAIL] Parsed " << devices.size() << " ARP entries, expected 1\n";
            ++failures;
        } else {
            const auto& d = devices[0];
            if (d.ip != "192.168.50.99" || d.hostname.value_or("") != "avr" ||
                d.macAddress.value_or("") != "0:5:cd:7d:d8:a6" || !d.isReachable) {
                std::cerr << "[FAIL] ARP entry mismatch: ip=" << d.ip << " host=" << d.hostname.value_or("-")
                          << " mac=" << d.macAddress.value_or("-") << "\n";
                ++failures;
            }
            auto c = CandidateScorer::forAvr().score(d);
            if (!c || c->confidence < 0.8) {
                std::cerr << "[FAIL] AVR score below 0.8\n";
                ++failures;
            } else {
                std::cout << "[TEST] avr scored " << c->confidence << " (" << c->reason << ")\n";
            }
            NetworkDiscovery discovery(ScoringConfig{}, ValidationConfig{}, [devices]() { return devices; });
            auto found = discovery.scanForAVRDevices();
            if (found.size() != 1 || found[0].ip != "192.168.50.99") {
                std::cerr << "[FAIL] scanForAVRDevices did not include the AVR\n";
                ++failures;
            }
        }
    }

    // Test 2: incomplete, anonymous and malformed ARP lines
    {
        std::string text =
            "? (192.168.50.7) at (incomplete) on en0 ifscope [ethernet]\n"
            "? (192.168.50.8) at 58:fd:2b:00:11:22 on en0 ifscope [ethernet]\n"
            "garbage line without address\n"
            "host (192.168.50.9) at not-a-mac on en0\n";
        auto devices = parseArpOutput(text);
        if (devices.size() != 2) {
            std::cerr << "[FAIL] Expected 2 ARP entries, got " << devices.size() << "\n";
            ++failures;
        } else {
            if (devices[0].isReachable || devices[0].macAddress || devices[0].hostname) {
                std::cerr << "[FAIL] Incomplete entry should be unreachable without MAC or hostname\n";
                ++failures;
            }
            if (!devices[1].isReachable || devices[1].hostname) {
                std::cerr << "[FAIL] '?' hostname should be absent and entry reachable\n";
                ++failures;
            }
        }

        std::string proc =
            "IP address       HW type     Flags       HW address            Mask     Device\n"
            "192.168.50.99    0x1         0x2         00:05:cd:7d:d8:a6     *        eth0\n"
            "192.168.50.7     0x1         0x0         00:00:00:00:00:00     *        eth0\n";
        auto kernel = parseProcNetArp(proc);
        if (kernel.size() != 2 || !kernel[0].isReachable || kernel[1].isReachable || kernel[1].macAddress ||
            kernel[0].macAddress.value_or("") != "00:05:cd:7d:d8:a6") {
            std::cerr << "[FAIL] /proc/net/arp parsing mismatch\n";
            ++failures;
        }
    }

    // Test 3: OUI normalisation
    {
        if (normalizeOui("0:5:cd:7d:d8:a6") != "0005cd" || normalizeOui("2C-64-1F-00-00-01") != "2c641f" ||
            !normalizeOui("zz:00:11:22:33:44").empty() || !normalizeOui("").empty()) {
            std::cerr << "[FAIL] normalizeOui mismatch\n";
            ++failures;
        }
    }

    // Test 4: ranking is descending, stable for ties, and threshold-exclusive
    {
        std::vector<NetworkDevice> devices = {
            device("10.0.0.5", "printer", nullptr),
            device("10.0.0.6", "denon-kitchen", nullptr),
            device("10.0.0.7", "avr-den", nullptr),
            device("10.0.0.8", "denon-living", nullptr),
            device("10.0.0.95", "laptop", nullptr),           // 0.1, at most the threshold
            device("10.0.0.9", "denon-offline", nullptr, false),
        };
        auto ranked = CandidateScorer::forAvr().rank(devices);
        if (ranked.size() != 3 || ranked[0].ip != "10.0.0.6" || ranked[1].ip != "10.0.0.8" || ranked[2].ip != "10.0.0.7") {
            std::cerr << "[FAIL] Ranking order mismatch:";
            for (const auto& c : ranked) std::cerr << " " << c.ip << "=" << c.confidence;
            std::cerr << "\n";
            ++failures;
        }
        for (size_t i = 1; i < ranked.size(); ++i) {
            if (ranked[i - 1].confidence < ranked[i].confidence) {
                std::cerr << "[FAIL] Ranking not descending\n";
                ++failures;
            }
        }

        ScoringConfig strict;
        strict.avrThreshold = 0.4;
        auto macOnly = CandidateScorer::forAvr(strict).score(device("10.0.0.20", nullptr, "00:05:cd:01:02:03"));
        if (macOnly) {
            std::cerr << "[FAIL] Score equal to the threshold must be excluded\n";
            ++failures;
        }
    }

    // Test 5: hostname rules are exclusive, groups add up, first brand wins
    {
        auto tv = CandidateScorer::forTv();
        auto lg = tv.score(device("10.0.0.50", "lg-oled", "2c:64:1f:aa:bb:cc"));
        if (!lg || lg->brand.value_or("") != "lg" || std::fabs(lg->confidence - 1.2) > 1e-9) {
            std::cerr << "[FAIL] lg-oled: brand=" << (lg ? lg->brand.value_or("-") : "none")
                      << " score=" << (lg ? lg->confidence : 0.0) << "\n";
            ++failures;
        }
        auto vizio = tv.score(device("10.0.0.110", "vizio-smartcast-tv", "2c:64:1f:aa:bb:cc"));
        if (!vizio || std::fabs(vizio->confidence - 1.5) > 1e-9 || vizio->brand.value_or("") != "vizio") {
            std::cerr << "[FAIL] Vizio TV should score 0.9 + 0.5 + 0.1 unclamped\n";
            ++failures;
        }
        auto avr = CandidateScorer::forAvr().score(device("10.0.0.2", "denon-avr-x3700h", nullptr));
        if (!avr || std::fabs(avr->confidence - 0.8) > 1e-9 || avr->reason != "hostname contains \"avr\"") {
            std::cerr << "[FAIL] Only the first hostname rule (avr) may fire: "
                      << (avr ? avr->reason : std::string("none")) << "\n";
            ++failures;
        }
        auto denon = CandidateScorer::forAvr().score(device("10.0.0.3", "denon-kitchen", nullptr));
        if (!denon || std::fabs(denon->confidence - 0.9) > 1e-9) {
            std::cerr << "[FAIL] denon hostname should score 0.9\n";
            ++failures;
        }
        auto ranged = CandidateScorer::forAvr().score(device("10.0.0.100", "AVRX3700H", nullptr));
        if (!ranged || ranged->reason.find("IP in typical AVR range") == std::string::npos) {
            std::cerr << "[FAIL] AVR hostname plus address range should both fire\n";
            ++failures;
        }
    }

    // Test 6: volume scale and reply table
    {
        struct Case { const char* digits; int percent; };
        for (const Case& c : {Case{"40", 40}, Case{"99", 100}, Case{"00", 0}, Case{"505", 51}, Case{"98", 99}}) {
            auto v = Denon::decodeVolume(c.digits);
            if (!v || *v != c.percent) {
                std::cerr << "[FAIL] decodeVolume(" << c.digits << ") = " << (v ? *v : -1) << " expected " << c.percent << "\n";
                ++failures;
            }
        }
        if (Denon::encodeVolume(40) != "395" || Denon::encodeVolume(100) != "99" || Denon::encodeVolume(0) != "00") {
            std::cerr << "[FAIL] encodeVolume mismatch: " << Denon::encodeVolume(40) << "\n";
            ++failures;
        }

        Denon::MirroredState state;
        state.volumePercent = 30;
        Denon::Field field;
        if (Denon::applyReplyLine("MVMAX 98", state, field) != Denon::LineMatch::Unrelated || state.volumePercent != 30) {
            std::cerr << "[FAIL] MVMAX must not be read as volume\n";
            ++failures;
        }
        if (Denon::applyReplyLine("MVXYZ", state, field) != Denon::LineMatch::Malformed || state.volumePercent != 30) {
            std::cerr << "[FAIL] Malformed volume must keep the previous value\n";
            ++failures;
        }
        if (Denon::applyReplyLine("SIDVD", state, field) != Denon::LineMatch::Updated || state.input != "DVD" ||
            field != Denon::Field::Input) {
            std::cerr << "[FAIL] SIDVD not applied\n";
            ++failures;
        }
        std::string buffer = "PWON\rMV4";
        auto lines = Denon::extractLines(buffer);
        if (lines.size() != 1 || lines[0] != "PWON" || buffer != "MV4") {
            std::cerr << "[FAIL] extractLines must keep the partial tail\n";
            ++failures;
        }
    }

    // Test 7: simulated session answers without a socket
    {
        AvrClientConfig cfg;
        cfg.enableRealConnection = false;
        AvrClient avr(cfg);
        int notifications = 0;
        avr.setStatusListener([&notifications](const Denon::MirroredState&) { ++notifications; });

        if (avr.connectionState() != ConnectionState::SimulatedFallback) {
            std::cerr << "[FAIL] Disabled connection should start in SimulatedFallback\n";
            ++failures;
        }
        bool sent = avr.sendCommand("POWER_STATUS").get();
        bool power = avr.getPowerState().get();
        if (!sent || power != avr.mirroredState().power || power) {
            std::cerr << "[FAIL] POWER_STATUS in simulation\n";
            ++failures;
        }
        avr.setVolume(40).get();
        if (avr.getVolume().get() != 0) {
            std::cerr << "[FAIL] Volume must not change while in standby\n";
            ++failures;
        }
        avr.powerOn().get();
        avr.setVolume(40).get();
        avr.volumeUp().get();
        avr.sendCommand("MUTE_TOGGLE").get();
        avr.setInput("bluray").get();
        if (!avr.getPowerState().get() || avr.getVolume().get() != 42 || !avr.getMuteState().get() ||
            avr.getCurrentInput().get() != "BD") {
            auto s = avr.mirroredState();
            std::cerr << "[FAIL] Simulated state: power=" << s.power << " volume=" << s.volumePercent
                      << " muted=" << s.muted << " input=" << s.input << "\n";
            ++failures;
        }
        if (avr.sendCommand("NOT_A_COMMAND").get() || avr.setSleepTimer(45).get()) {
            std::cerr << "[FAIL] Unknown commands must resolve to false\n";
            ++failures;
        }
        if (notifications < 4) {
            std::cerr << "[FAIL] Status listener fired " << notifications << " times\n";
            ++failures;
        }
        auto diag = avr.runDiagnostics();
        if (!diag.simulated || diag.issues.empty() || !diag.powerOn.value_or(false)) {
            std::cerr << "[FAIL] Simulated diagnostics\n";
            ++failures;
        }
    }

    // Test 8: query cache avoids a second round trip
    {
        FakeAvr fake(denonReplies);
        AvrClient avr(loopbackConfig(fake.port()));
        bool first = false, second = false;
        try {
            first = avr.getPowerState().get();
            second = avr.getPowerState().get();
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] getPowerState threw: " << e.what() << "\n";
            ++failures;
        }
        if (!first || !second || fake.count("PW?") != 1) {
            std::cerr << "[FAIL] Cached power query: first=" << first << " second=" << second
                      << " PW? sent " << fake.count("PW?") << " times\n";
            ++failures;
        }
        if (avr.connectionState() != ConnectionState::Connected) {
            std::cerr << "[FAIL] Expected Connected\n";
            ++failures;
        }
    }

    // Test 9: unsolicited lines are demultiplexed; last match wins
    {
        FakeAvr fake([](const std::string& cmd, int) -> std::string {
            if (cmd == "MV?") return "PWSTANDBY\rSIDVD\rMVMAX 98\rSSINFO\rMV45\r";
            if (cmd == "MU?") return "MUON\rMUOFF\r";
            return denonReplies(cmd, 0);
        });
        AvrClient avr(loopbackConfig(fake.port()));
        try {
            int volume = avr.getVolume().get();
            bool muted = avr.getMuteState().get();
            auto s = avr.mirroredState();
            if (volume != 45 || s.input != "DVD" || s.power || muted) {
                std::cerr << "[FAIL] Demux: volume=" << volume << " input=" << s.input << " power=" << s.power
                          << " muted=" << muted << "\n";
                ++failures;
            }
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] Demux threw: " << e.what() << "\n";
            ++failures;
        }

        fake.push("MSDOLBY DIGITAL\r");
        if (!waitFor([&avr]() { return avr.mirroredState().soundMode == "DOLBY DIGITAL"; }, 1000)) {
            std::cerr << "[FAIL] Unsolicited sound mode not mirrored\n";
            ++failures;
        }
        try {
            if (avr.getSoundMode().get() != "DOLBY DIGITAL" || fake.count("MS?") != 0) {
                std::cerr << "[FAIL] Fresh unsolicited value should answer the query\n";
                ++failures;
            }
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] getSoundMode threw: " << e.what() << "\n";
            ++failures;
        }
    }

    // Test 10: peer close mid-command, then a fresh connection
    {
        FakeAvr fake([](const std::string& cmd, int connection) -> std::string {
            if (connection == 1) return FakeAvr::kHangUp;
            return denonReplies(cmd, connection);
        });
        AvrClient avr(loopbackConfig(fake.port()));
        if (!failsWith(avr.getPowerState(), AvrErrc::ConnectionLost)) {
            std::cerr << "[FAIL] Expected ConnectionLost after peer close\n";
            ++failures;
        }
        try {
            if (!avr.getPowerState().get() || fake.accepts() != 2) {
                std::cerr << "[FAIL] Reconnect: accepts=" << fake.accepts() << "\n";
                ++failures;
            }
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] Command after reconnect threw: " << e.what() << "\n";
            ++failures;
        }
    }

    // Test 11: silent receiver times out the command
    {
        FakeAvr fake([](const std::string&, int) { return std::string(); });
        auto cfg = loopbackConfig(fake.port());
        cfg.commandTimeoutMs = 300;
        AvrClient avr(cfg);
        auto start = steady_clock::now();
        bool timedOut = failsWith(avr.getVolume(), AvrErrc::CommandTimeout);
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        if (!timedOut || elapsed < 250) {
            std::cerr << "[FAIL] Expected CommandTimeout after ~300 ms, got " << elapsed << " ms\n";
            ++failures;
        }
        // Commands without a status reply complete once written.
        try {
            bool written = avr.navigate("up").get();
            if (!written || !waitFor([&fake]() { return fake.count("MNCUP") == 1; }, 1000)) {
                std::cerr << "[FAIL] Navigation command not written\n";
                ++failures;
            }
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] navigate threw: " << e.what() << "\n";
            ++failures;
        }
    }

    // Test 12: refused connection backs off and fails fast
    {
        auto cfg = loopbackConfig(closedPort());
        cfg.reconnectBaseMs = 2000;
        AvrClient avr(cfg);
        if (!failsWith(avr.getPowerState(), AvrErrc::ConnectionTimeout)) {
            std::cerr << "[FAIL] Expected ConnectionTimeout on refused connection\n";
            ++failures;
        }
        auto start = steady_clock::now();
        std::string message;
        bool fastFail = failsWith(avr.getVolume(), AvrErrc::ConnectionTimeout, &message);
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        if (!fastFail || elapsed > 300 || message.find("backoff") == std::string::npos) {
            std::cerr << "[FAIL] Backoff fast-fail: " << message << " after " << elapsed << " ms\n";
            ++failures;
        }
        if (avr.connectionState() != ConnectionState::Disconnected) {
            std::cerr << "[FAIL] Expected Disconnected after failed attempts\n";
            ++failures;
        }
    }

    // Test 13: first connection failure falls back to simulation when allowed
    {
        auto cfg = loopbackConfig(closedPort());
        cfg.fallbackOnConnectFailure = true;
        AvrClient avr(cfg);
        try {
            bool power = avr.getPowerState().get();
            if (power || avr.connectionState() != ConnectionState::SimulatedFallback) {
                std::cerr << "[FAIL] Expected simulated answer after fallback\n";
                ++failures;
            }
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] Fallback threw: " << e.what() << "\n";
            ++failures;
        }
    }

    // Test 14: validation keeps input order and drops failures
    {
        std::vector<Candidate> candidates;
        for (int i = 1; i <= 5; ++i) {
            Candidate c;
            c.ip = "10.0.0." + std::to_string(i);
            c.isReachable = true;
            candidates.push_back(c);
        }
        auto endpoints = validateCandidates(candidates, ScriptedHandshake());
        if (endpoints.size() != 3 || endpoints[0].ip != "10.0.0.1" || endpoints[1].ip != "10.0.0.3" ||
            endpoints[2].ip != "10.0.0.5") {
            std::cerr << "[FAIL] Validation order/filtering mismatch\n";
            ++failures;
        }
    }

    // Test 15: Denon handshake against the loopback receiver
    {
        FakeAvr fake(denonReplies);
        ValidationConfig cfg;
        cfg.avrPort = fake.port();
        Candidate c;
        c.ip = "127.0.0.1";
        c.hostname = std::string("avr");
        c.isReachable = true;
        auto ep = DenonHandshake(cfg).probe(c);
        if (!ep || ep->port != fake.port() || !ep->deviceInfo ||
            ep->deviceInfo->name.value_or("") != "Living Room" || ep->deviceInfo->brand.value_or("") != "denon") {
            std::cerr << "[FAIL] Denon handshake against loopback receiver\n";
            ++failures;
        }

        ValidationConfig closed;
        closed.avrPort = closedPort();
        closed.timeoutMs = 300;
        if (DenonHandshake(closed).probe(c)) {
            std::cerr << "[FAIL] Handshake to a closed port must fail\n";
            ++failures;
        }

        auto name = VizioHandshake::parseDeviceName(
            R"JSON({"STATUS":{"RESULT":"SUCCESS"},"ITEMS":[{"HASHVAL":1,"NAME":"Name","VALUE":"Living Room TV"}]})JSON");
        if (name.value_or("") != "Living Room TV") {
            std::cerr << "[FAIL] SmartCast name parsing\n";
            ++failures;
        }
    }

    // Test 16: discovery degrades to an empty list
    {
        NetworkDiscovery discovery(ScoringConfig{}, ValidationConfig{},
                                   []() -> std::vector<NetworkDevice> { throw std::runtime_error("arp exploded"); });
        if (!discovery.scanForTVDevices().empty() || !discovery.discoverAndValidateAVRs().empty()) {
            std::cerr << "[FAIL] Failing lister should give empty results\n";
            ++failures;
        }
    }

    // Test 17: settings store persists endpoints and caps history
    {
        char tmpl[] = "/tmp/avlink-test-XXXXXX";
        const char* dir = mkdtemp(tmpl);
        if (!dir) {
            std::cerr << "[FAIL] mkdtemp failed\n";
            ++failures;
        } else {
            DeviceSettingsStore store(dir);
            ValidatedEndpoint ep;
            ep.ip = "192.168.50.99";
            ep.port = 23;
            ep.responseTimeMs = 12;
            ep.deviceInfo = DeviceInfo{std::string("Living Room"), std::string("denon")};
            if (!store.saveValidated("avr", ep, DiscoveryMethod::Scan, "0:5:cd:7d:d8:a6")) {
                std::cerr << "[FAIL] saveValidated: " << store.lastError() << "\n";
                ++failures;
            }
            for (int i = 0; i < 60; ++i) {
                DiscoveryHistoryEntry e;
                e.timestamp = 1000 + i;
                e.ip = ep.ip;
                e.method = DiscoveryMethod::Manual;
                e.success = (i % 2 == 0);
                e.error = e.success ? "" : "timeout | retry";
                store.addDiscoveryHistory("avr", e);
            }
            store.recordFailedConnection("avr", "refused");

            auto loaded = DeviceSettingsStore(dir).load("avr");
            if (!loaded || loaded->ip != "192.168.50.99" || loaded->deviceName != "Living Room" ||
                loaded->macAddress != "0:5:cd:7d:d8:a6" || loaded->failedAttempts != 1) {
                std::cerr << "[FAIL] Reloaded settings mismatch\n";
                ++failures;
            } else if (loaded->history.size() != DeviceSettingsStore::kMaxHistory ||
                       loaded->history.back().error != "refused" || loaded->history.front().timestamp != 1011) {
                std::cerr << "[FAIL] History size " << loaded->history.size() << " front="
                          << loaded->history.front().timestamp << "\n";
                ++failures;
            }
            std::string cleanup = std::string("rm -rf '") + dir + "'";
            if (std::system(cleanup.c_str()) != 0) std::cerr << "[WARN] could not remove " << dir << "\n";
        }
    }

    // Test 18: handshake latency is the first reply, not the wait for NSFRN
    {
        FakeAvr fake([](const std::string& cmd, int) -> std::string {
            return cmd == "PW?" ? "PWON\r" : "";
        });
        ValidationConfig cfg;
        cfg.avrPort = fake.port();
        cfg.timeoutMs = 1500;
        Candidate c;
        c.ip = "127.0.0.1";
        c.hostname = std::string("old-avr");
        c.isReachable = true;
        auto start = steady_clock::now();
        auto ep = DenonHandshake(cfg).probe(c);
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        if (!ep || ep->responseTimeMs > 300 || elapsed > 1000) {
            std::cerr << "[FAIL] Receiver without NSFRN: responseTimeMs=" << (ep ? ep->responseTimeMs : -1)
                      << " probe took " << elapsed << " ms\n";
            ++failures;
        } else if (!ep->deviceInfo || ep->deviceInfo->name.value_or("") != "old-avr") {
            std::cerr << "[FAIL] Name should fall back to the hostname\n";
            ++failures;
        }
    }

    // Test 19: concurrent callers are served one at a time in arrival order
    {
        FakeAvr fake([](const std::string& cmd, int) -> std::string {
            if (cmd == "MV?") return "";
            return denonReplies(cmd, 0);
        });
        auto cfg = loopbackConfig(fake.port());
        cfg.commandTimeoutMs = 400;
        AvrClient avr(cfg);

        auto volume = avr.getVolume();
        auto muteTask = std::async(std::launch::async, [&avr]() { return avr.getMuteState().get(); });
        auto powerTask = std::async(std::launch::async, [&avr]() { return avr.getPowerState().get(); });

        bool volumeTimedOut = failsWith(std::move(volume), AvrErrc::CommandTimeout);
        bool muted = true, power = false;
        try {
            muted = muteTask.get();
            power = powerTask.get();
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] Queued query threw: " << e.what() << "\n";
            ++failures;
        }
        auto order = fake.received();
        auto times = fake.receivedAt();
        bool fifo = order.size() == 3 && order[0] == "MV?" &&
                    ((order[1] == "MU?" && order[2] == "PW?") || (order[1] == "PW?" && order[2] == "MU?"));
        long gap = times.size() >= 2 ? static_cast<long>(duration_cast<milliseconds>(times[1] - times[0]).count()) : 0;
        if (!volumeTimedOut || muted || !power || !fifo || gap < 350) {
            std::cerr << "[FAIL] FIFO: timedOut=" << volumeTimedOut << " writes=" << order.size()
                      << " gap after MV?=" << gap << " ms\n";
            ++failures;
        }
    }

    // Test 20: peer close fails the queued commands too
    {
        FakeAvr fake([](const std::string& cmd, int connection) -> std::string {
            if (connection == 1 && cmd == "MV?") {
                std::this_thread::sleep_for(milliseconds(100));
                return FakeAvr::kHangUp;
            }
            return denonReplies(cmd, connection);
        });
        AvrClient avr(loopbackConfig(fake.port()));
        auto volume = avr.getVolume();
        auto muted = avr.getMuteState();
        auto power = avr.getPowerState();
        bool v = failsWith(std::move(volume), AvrErrc::ConnectionLost);
        bool m = failsWith(std::move(muted), AvrErrc::ConnectionLost);
        bool p = failsWith(std::move(power), AvrErrc::ConnectionLost);
        if (!v || !m || !p || fake.count("MU?") != 0 || fake.count("PW?") != 0) {
            std::cerr << "[FAIL] Drop with queue: volume=" << v << " mute=" << m << " power=" << p << "\n";
            ++failures;
        }
    }

    // Test 21: reachability check never throws and rejects bad addresses
    {
        try {
            auto start = steady_clock::now();
            bool bogus = checkReachable("not-an-ip", 300);
            bool overflow = checkReachable("999.1.1.1", 300);
            bool testNet = checkReachable("192.0.2.1", 300);
            auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
            if (bogus || overflow || testNet) {
                std::cerr << "[FAIL] Unreachable addresses reported reachable\n";
                ++failures;
            }
            if (elapsed > 3000) {
                std::cerr << "[FAIL] checkReachable ignored its timeout: " << elapsed << " ms\n";
                ++failures;
            }
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] checkReachable threw: " << e.what() << "\n";
            ++failures;
        }
    }

    // Test 22: raw evaluation and inline validation
    {
        auto scorer = CandidateScorer::forTv();
        auto offline = device("10.0.0.120", "vizio-den", nullptr, false);
        Candidate raw = scorer.evaluate(offline);
        if (scorer.score(offline) || std::fabs(raw.confidence - 1.0) > 1e-9 || raw.brand.value_or("") != "vizio") {
            std::cerr << "[FAIL] evaluate should score unreachable devices without a threshold\n";
            ++failures;
        }
        auto weak = device("10.0.0.5", nullptr, nullptr);
        if (scorer.evaluate(weak).confidence != 0.0 || scorer.score(weak)) {
            std::cerr << "[FAIL] No rule should fire for a bare address\n";
            ++failures;
        }

        std::vector<Candidate> candidates;
        for (int i = 1; i <= 3; ++i) {
            Candidate c;
            c.ip = "10.0.0." + std::to_string(i);
            c.isReachable = true;
            candidates.push_back(c);
        }
        RecordingHandshake handshake;
        auto endpoints = validateCandidates(candidates, handshake, std::launch::deferred);
        auto threads = handshake.threads();
        bool onCaller = threads.size() == 3 &&
                       std::all_of(threads.begin(), threads.end(),
                                   [](std::thread::id id) { return id == std::this_thread::get_id(); });
        if (endpoints.size() != 3 || endpoints[0].ip != "10.0.0.1" || endpoints[2].ip != "10.0.0.3" || !onCaller) {
            std::cerr << "[FAIL] Inline validation: " << endpoints.size() << " endpoints\n";
            ++failures;
        }
    }

    if (failures == 0) {
        std::cout << "ALL TESTS PASS" << std::endl;
        return 0;
    } else {
        std::cout << failures << " TEST(S) FAILED" << std::endl;
        return 1;
    }
}
