// AvrClient.cpp
#include "AvrClient.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <set>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "DeviceProbe.hpp"
#include "Logging.hpp"

using namespace std::chrono;
using Denon::Field;
using Denon::MirroredState;

namespace {

// A receiver never sends lines this long; anything bigger is line noise.
constexpr size_t kMaxPartialLine = 4096;

std::string toUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

void drainPipe(int fd) {
    char buf[64];
    while (::read(fd, buf, sizeof(buf)) > 0) {
    }
}

} // namespace

const char* avrErrcName(AvrErrc code) {
    switch (code) {
        case AvrErrc::ConnectionTimeout: return "ConnectionTimeout";
        case AvrErrc::ConnectionLost: return "ConnectionLost";
        case AvrErrc::CommandTimeout: return "CommandTimeout";
        case AvrErrc::MalformedReply: return "MalformedReply";
    }
    return "Unknown";
}

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::SimulatedFallback: return "SimulatedFallback";
    }
    return "Unknown";
}

AvrClient::AvrClient(AvrClientConfig config) : m_config(std::move(config)) {
    if (!m_config.enableRealConnection) {
        m_state = ConnectionState::SimulatedFallback;
        std::cout << "[AvrClient] Real AVR connection disabled; simulating "
                  << m_config.deviceName << std::endl;
        return;
    }

    if (::pipe2(m_wakePipe, O_NONBLOCK | O_CLOEXEC) != 0 || ::pipe2(m_stopPipe, O_NONBLOCK | O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("AvrClient: pipe2 failed: ") + std::strerror(errno));
    }

    std::cout << "[AvrClient] " << m_config.deviceName << " at " << m_config.ip << ":" << m_config.port << std::endl;
    m_worker = std::thread([this]() { run(); });
}

AvrClient::~AvrClient() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
    if (m_stopPipe[1] >= 0) {
        char b = 1;
        if (::write(m_stopPipe[1], &b, 1) < 0 && errno != EAGAIN) {
            std::cerr << "[AvrClient] Failed to signal worker: " << std::strerror(errno) << std::endl;
        }
    }
    if (m_worker.joinable()) m_worker.join();

    Outbox out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
        failAll(out, AvrErrc::ConnectionLost, "client shut down");
        seal(out);
    }
    deliver(out);

    for (int fd : {m_wakePipe[0], m_wakePipe[1], m_stopPipe[0], m_stopPipe[1]}) {
        if (fd >= 0) ::close(fd);
    }
}

bool AvrClient::connect() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_state == ConnectionState::SimulatedFallback || m_state == ConnectionState::Connected) return true;

    m_connectRequested = true;
    wake();
    m_cv.wait(lock, [this]() {
        return m_stop || !m_connectRequested || m_state == ConnectionState::Connected ||
               m_state == ConnectionState::SimulatedFallback;
    });
    return m_state == ConnectionState::Connected || m_state == ConnectionState::SimulatedFallback;
}

ConnectionState AvrClient::connectionState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

MirroredState AvrClient::mirroredState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mirror;
}

void AvrClient::setStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

// ============================================================================
// Command submission
// ============================================================================

template <typename T>
std::future<T> AvrClient::submit(const std::string& name, const std::string& value, const std::string& wire,
                                 std::function<T(const MirroredState&)> extract) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    dispatch(name, value, wire, [promise, extract](std::exception_ptr err, const MirroredState& state) {
        if (err) {
            promise->set_exception(err);
        } else {
            promise->set_value(extract(state));
        }
    });
    return future;
}

std::future<bool> AvrClient::rejected() {
    std::promise<bool> p;
    p.set_value(false);
    return p.get_future();
}

void AvrClient::dispatch(const std::string& name, const std::string& value, const std::string& wire,
                         Completion done) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_state == ConnectionState::SimulatedFallback) {
            MirroredState before = m_mirror;
            Denon::applySimulatedCommand(name, value, m_mirror);
            out.stateChanged = (before != m_mirror);
            auto cmd = std::make_shared<PendingCommand>();
            cmd->waiters.push_back(std::move(done));
            out.finished.emplace_back(cmd, nullptr);
            seal(out);
        } else {
            Field field = Denon::replyFieldFor(wire);
            bool query = Denon::isQuery(wire);
            auto now = steady_clock::now();

            if (query && isFresh(field, now)) {
                auto cmd = std::make_shared<PendingCommand>();
                cmd->waiters.push_back(std::move(done));
                out.finished.emplace_back(cmd, nullptr);
                seal(out);
            } else {
                std::shared_ptr<PendingCommand> existing;
                if (query) {
                    if (m_inFlight && m_inFlight->wire == wire) existing = m_inFlight;
                    for (const auto& q : m_queue) {
                        if (!existing && q->wire == wire) existing = q;
                    }
                }
                if (existing) {
                    existing->waiters.push_back(std::move(done));
                } else {
                    auto cmd = std::make_shared<PendingCommand>();
                    cmd->name = name;
                    cmd->value = value;
                    cmd->wire = wire;
                    cmd->field = field;
                    cmd->query = query;
                    cmd->waiters.push_back(std::move(done));
                    m_queue.push_back(std::move(cmd));
                }
                wake();
                return;
            }
        }
    }
    deliver(out);
}

std::future<bool> AvrClient::getPowerState() {
    return submit<bool>("POWER_STATUS", {}, "PW?", [](const MirroredState& s) { return s.power; });
}

std::future<int> AvrClient::getVolume() {
    return submit<int>("VOLUME_STATUS", {}, "MV?", [](const MirroredState& s) { return s.volumePercent; });
}

std::future<bool> AvrClient::getMuteState() {
    return submit<bool>("MUTE_STATUS", {}, "MU?", [](const MirroredState& s) { return s.muted; });
}

std::future<std::string> AvrClient::getCurrentInput() {
    return submit<std::string>("INPUT_STATUS", {}, "SI?", [](const MirroredState& s) { return s.input; });
}

std::future<std::string> AvrClient::getSoundMode() {
    return submit<std::string>("SOUND_MODE_STATUS", {}, "MS?", [](const MirroredState& s) { return s.soundMode; });
}

std::future<std::string> AvrClient::getEcoMode() {
    return submit<std::string>("ECO_STATUS", {}, "ECO?", [](const MirroredState& s) { return s.ecoMode; });
}

std::future<int> AvrClient::getSleepTimer() {
    return submit<int>("SLEEP_STATUS", {}, "SLP?", [](const MirroredState& s) { return s.sleepMinutes; });
}

std::future<bool> AvrClient::getZone2Power() {
    return submit<bool>("ZONE2_POWER_STATUS", {}, "Z2?", [](const MirroredState& s) { return s.zone2Power; });
}

std::future<bool> AvrClient::sendCommand(const std::string& name, const std::string& value) {
    auto ok = [](const MirroredState&) { return true; };

    if (name == "SET_VOLUME") {
        int percent = 0;
        try {
            percent = std::stoi(value);
        } catch (const std::exception&) {
            std::cerr << "[AvrClient] SET_VOLUME needs a number, got \"" << value << "\"" << std::endl;
            return rejected();
        }
        if (percent < 0 || percent > 100) return rejected();
        return submit<bool>(name, std::to_string(percent), "MV" + Denon::encodeVolume(percent), ok);
    }
    if (name == "INPUT_CHANGE") {
        if (value.empty()) return rejected();
        return submit<bool>(name, value, Denon::wireForInput(value), ok);
    }
    if (name == "SOUND_MODE") {
        if (value.empty()) return rejected();
        return submit<bool>(name, value, "MS" + toUpper(value), ok);
    }
    if (name == "MUTE_TOGGLE") {
        return toggleMute();
    }

    auto wire = Denon::wireForCommand(name);
    if (!wire) {
        std::cerr << "[AvrClient] Unknown command " << name << std::endl;
        return rejected();
    }
    return submit<bool>(name, value, *wire, ok);
}

std::future<bool> AvrClient::toggleMute() {
    // The receiver has no toggle; read the current state and send the opposite.
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    dispatch("MUTE_STATUS", {}, "MU?", [this, promise](std::exception_ptr err, const MirroredState& state) {
        if (err) {
            promise->set_exception(err);
            return;
        }
        bool mute = !state.muted;
        dispatch(mute ? "MUTE_ON" : "MUTE_OFF", {}, mute ? "MUON" : "MUOFF",
                 [promise](std::exception_ptr err2, const MirroredState&) {
                     if (err2) {
                         promise->set_exception(err2);
                     } else {
                         promise->set_value(true);
                     }
                 });
    });
    return future;
}

std::future<bool> AvrClient::navigate(const std::string& direction) {
    std::string name = toUpper(direction);
    auto wire = Denon::wireForCommand(name);
    if (!wire || wire->rfind("MN", 0) != 0) return rejected();
    return sendCommand(name);
}

std::future<bool> AvrClient::playbackControl(const std::string& action) {
    std::string name = toUpper(action);
    auto wire = Denon::wireForCommand(name);
    if (!wire || wire->rfind("NS9", 0) != 0) return rejected();
    return sendCommand(name);
}

std::future<bool> AvrClient::setEcoMode(const std::string& mode) {
    std::string name = "ECO_" + toUpper(mode);
    if (name == "ECO_STATUS" || !Denon::wireForCommand(name)) return rejected();
    return sendCommand(name);
}

std::future<bool> AvrClient::setSleepTimer(int minutes) {
    if (minutes == 0) return sendCommand("SLEEP_OFF");
    if (minutes == 30 || minutes == 60 || minutes == 90 || minutes == 120) {
        return sendCommand("SLEEP_" + std::to_string(minutes));
    }
    return rejected();
}

std::future<bool> AvrClient::quickSelect(int preset) {
    if (preset < 1 || preset > 5) return rejected();
    return sendCommand("QUICK_SELECT_" + std::to_string(preset));
}

std::future<bool> AvrClient::setZone2Volume(int percent) {
    if (percent < 0 || percent > 100) return rejected();
    return submit<bool>("ZONE2_VOLUME", std::to_string(percent), "Z2" + Denon::encodeVolume(percent),
                        [](const MirroredState&) { return true; });
}

AvrDiagnostics AvrClient::runDiagnostics() {
    AvrDiagnostics d;
    d.target = m_config.ip + ":" + std::to_string(m_config.port);

    if (connectionState() == ConnectionState::SimulatedFallback) {
        d.simulated = true;
        d.issues.push_back("Real AVR connection disabled or unreachable; answers come from the simulated receiver");
    } else if (!connect()) {
        d.connectionState = connectionStateName(connectionState());
        d.issues.push_back("Could not connect to " + d.target);
        if (checkReachable(m_config.ip, 1000)) {
            d.issues.push_back(m_config.ip + " answers ping; the telnet port is closed or busy");
        } else {
            d.issues.push_back(m_config.ip + " does not answer ping; check power and network");
        }
        return d;
    }
    ConnectionState state = connectionState();
    d.connectionState = connectionStateName(state);
    d.connected = (state == ConnectionState::Connected);
    d.simulated = (state == ConnectionState::SimulatedFallback);

    auto collect = [&d](const char* what, auto future, auto& slot) {
        try {
            slot = future.get();
        } catch (const AvrClientError& e) {
            d.issues.push_back(std::string(what) + " query failed (" + avrErrcName(e.code()) + "): " + e.what());
        }
    };
    collect("Power", getPowerState(), d.powerOn);
    collect("Volume", getVolume(), d.volumePercent);
    collect("Mute", getMuteState(), d.muted);
    collect("Input", getCurrentInput(), d.input);
    collect("Sound mode", getSoundMode(), d.soundMode);

    if (d.powerOn && !*d.powerOn) {
        d.issues.push_back("Receiver is in standby; most commands are ignored until it is powered on");
    }
    return d;
}

// ============================================================================
// Worker
// ============================================================================

void AvrClient::wake() {
    if (m_wakePipe[1] < 0) return;
    char b = 1;
    if (::write(m_wakePipe[1], &b, 1) < 0 && errno != EAGAIN) {
        std::cerr << "[AvrClient] Wake write failed: " << std::strerror(errno) << std::endl;
    }
}

bool AvrClient::waitForStop(int ms) {
    pollfd pfd{m_stopPipe[0], POLLIN, 0};
    return ::poll(&pfd, 1, ms) > 0;
}

int AvrClient::backoffDelayMs(int failures) const {
    long delay = m_config.reconnectBaseMs;
    for (int i = 0; i < failures && delay < m_config.reconnectMaxMs; ++i) delay *= 2;
    return static_cast<int>(std::min<long>(delay, m_config.reconnectMaxMs));
}

bool AvrClient::isFresh(Field field, steady_clock::time_point now) const {
    if (field == Field::None || m_state != ConnectionState::Connected) return false;
    auto it = m_confirmedAt.find(field);
    return it != m_confirmedAt.end() && now - it->second < milliseconds(m_config.cacheTtlMs);
}

void AvrClient::seal(Outbox& out) {
    out.snapshot = m_mirror;
    out.listener = m_listener;
}

void AvrClient::deliver(Outbox& out) {
    for (auto& entry : out.finished) {
        for (auto& waiter : entry.first->waiters) {
            waiter(entry.second, out.snapshot);
        }
    }
    if (out.stateChanged && out.listener) out.listener(out.snapshot);
    out.finished.clear();
    out.stateChanged = false;
}

void AvrClient::failAll(Outbox& out, AvrErrc code, const std::string& message) {
    auto err = std::make_exception_ptr(AvrClientError(code, message));
    if (m_inFlight) {
        out.finished.emplace_back(m_inFlight, err);
        m_inFlight.reset();
    }
    for (auto& cmd : m_queue) out.finished.emplace_back(cmd, err);
    m_queue.clear();
}

void AvrClient::serveBySimulation(Outbox& out) {
    MirroredState before = m_mirror;
    for (auto& cmd : m_queue) {
        Denon::applySimulatedCommand(cmd->name, cmd->value, m_mirror);
        out.finished.emplace_back(cmd, nullptr);
    }
    m_queue.clear();
    if (before != m_mirror) out.stateChanged = true;
}

void AvrClient::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    Outbox out;

    while (!m_stop && m_state != ConnectionState::SimulatedFallback) {
        int waitMs = -1;
        auto now = steady_clock::now();

        if (m_fd < 0) {
            bool reconnectDue = m_reconnectScheduled && now >= m_reconnectAt;
            bool wanted = !m_queue.empty() || m_connectRequested || reconnectDue;
            if (wanted && now < m_nextConnectAllowed) {
                auto left = duration_cast<milliseconds>(m_nextConnectAllowed - now).count();
                failAll(out, AvrErrc::ConnectionTimeout,
                        "reconnect backoff active for another " + std::to_string(left) + " ms");
                m_connectRequested = false;
                m_reconnectScheduled = false;
                wanted = false;
            }
            if (wanted) {
                m_reconnectScheduled = false;
                establish(lock, out);
                waitMs = 0;
            } else if (m_reconnectScheduled) {
                waitMs = static_cast<int>(std::max<long long>(
                    0, duration_cast<milliseconds>(m_reconnectAt - now).count()));
            }
        } else {
            expireInFlight(now, out);
            if (!writeNext(now, out)) {
                dropConnection("write failed", out);
                waitMs = 0;
            } else {
                waitMs = nextWakeMs(now);
            }
        }

        if (m_stop || m_state == ConnectionState::SimulatedFallback) break;

        seal(out);
        int fd = m_fd;
        m_cv.notify_all();
        lock.unlock();
        deliver(out);

        pollfd fds[3];
        nfds_t n = 0;
        fds[n++] = pollfd{m_wakePipe[0], POLLIN, 0};
        fds[n++] = pollfd{m_stopPipe[0], POLLIN, 0};
        if (fd >= 0) fds[n++] = pollfd{fd, POLLIN, 0};

        int rc = ::poll(fds, n, waitMs);
        if (rc < 0 && errno != EINTR) {
            std::cerr << "[AvrClient] poll failed: " << std::strerror(errno) << std::endl;
        }
        if (rc > 0 && (fds[0].revents & POLLIN)) drainPipe(m_wakePipe[0]);

        std::string received;
        bool closed = false;
        std::string closeReason;
        if (rc > 0 && fd >= 0 && (fds[2].revents & (POLLIN | POLLHUP | POLLERR))) {
            char chunk[1024];
            ssize_t got = ::recv(fd, chunk, sizeof(chunk), 0);
            if (got > 0) {
                received.assign(chunk, static_cast<size_t>(got));
            } else if (got == 0) {
                closed = true;
                closeReason = "peer closed the connection";
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                closed = true;
                closeReason = std::string("socket error: ") + std::strerror(errno);
            }
        }

        lock.lock();
        if (closed) {
            dropConnection(closeReason, out);
        } else if (!received.empty()) {
            processIncoming(received, out);
        }
    }

    seal(out);
    m_cv.notify_all();
    lock.unlock();
    deliver(out);
}

void AvrClient::establish(std::unique_lock<std::mutex>& lock, Outbox& out) {
    m_state = ConnectionState::Connecting;
    m_cv.notify_all();
    const std::string host = m_config.ip;
    const int port = m_config.port;
    const int attempts = 1 + std::max(0, m_config.connectRetries);

    lock.unlock();
    int fd = -1;
    for (int attempt = 0; attempt < attempts && fd < 0; ++attempt) {
        if (attempt > 0 && waitForStop(backoffDelayMs(attempt - 1))) break;
        std::cout << "[AvrClient] Connecting to " << host << ":" << port
                  << " (attempt " << (attempt + 1) << "/" << attempts << ")" << std::endl;
        fd = openTcpConnection(host, port, m_config.connectionTimeoutMs, m_stopPipe[0]);
    }
    lock.lock();

    if (m_stop) {
        if (fd >= 0) ::close(fd);
        m_state = ConnectionState::Disconnected;
        return;
    }

    if (fd >= 0) {
        m_fd = fd;
        m_rxBuffer.clear();
        m_state = ConnectionState::Connected;
        m_everConnected = true;
        m_connectFailures = 0;
        m_nextConnectAllowed = steady_clock::time_point{};
        m_connectRequested = false;
        m_lastWrite = steady_clock::time_point{};
        std::cout << "[AvrClient] Connected to " << m_config.deviceName << " at " << host << ":" << port << std::endl;
        return;
    }

    m_connectRequested = false;
    if (!m_everConnected && m_config.fallbackOnConnectFailure) {
        std::cerr << "[AvrClient] " << host << ":" << port << " unreachable; continuing with the simulated receiver"
                  << std::endl;
        m_state = ConnectionState::SimulatedFallback;
        serveBySimulation(out);
        return;
    }

    int delay = backoffDelayMs(m_connectFailures);
    ++m_connectFailures;
    m_nextConnectAllowed = steady_clock::now() + milliseconds(delay);
    m_state = ConnectionState::Disconnected;
    std::cerr << "[AvrClient] Could not connect to " << host << ":" << port << " after " << attempts
              << " attempts; next attempt allowed in " << delay << " ms" << std::endl;
    failAll(out, AvrErrc::ConnectionTimeout,
            "could not connect to " + host + ":" + std::to_string(port) + " within " +
                std::to_string(m_config.connectionTimeoutMs) + " ms");
}

void AvrClient::expireInFlight(steady_clock::time_point now, Outbox& out) {
    if (!m_inFlight || now < m_inFlight->deadline) return;

    AvrErrc code = m_inFlight->sawMalformed ? AvrErrc::MalformedReply : AvrErrc::CommandTimeout;
    std::string message = m_inFlight->sawMalformed
                              ? "only unparseable replies to " + m_inFlight->wire
                              : "no reply to " + m_inFlight->wire + " within " +
                                    std::to_string(m_config.commandTimeoutMs) + " ms";
    std::cerr << "[AvrClient] " << avrErrcName(code) << ": " << message << std::endl;
    out.finished.emplace_back(m_inFlight, std::make_exception_ptr(AvrClientError(code, message)));
    m_inFlight.reset();
}

bool AvrClient::writeNext(steady_clock::time_point now, Outbox& out) {
    if (m_inFlight || m_queue.empty()) return true;
    if (now < m_lastWrite + milliseconds(m_config.commandGapMs)) return true;

    auto cmd = m_queue.front();
    m_queue.pop_front();

    if (!sendAll(m_fd, cmd->wire + "\r")) {
        m_queue.push_front(cmd);
        return false;
    }
    m_lastWrite = now;
    if (verboseLogging()) std::cout << "[AvrClient] -> " << cmd->wire << std::endl;

    if (cmd->field == Field::None) {
        out.finished.emplace_back(cmd, nullptr);
    } else {
        cmd->deadline = now + milliseconds(m_config.commandTimeoutMs);
        m_inFlight = cmd;
    }
    return true;
}

int AvrClient::nextWakeMs(steady_clock::time_point now) const {
    steady_clock::time_point next = steady_clock::time_point::max();
    if (m_inFlight) {
        next = m_inFlight->deadline;
    } else if (!m_queue.empty()) {
        next = m_lastWrite + milliseconds(m_config.commandGapMs);
    }
    if (next == steady_clock::time_point::max()) return -1;
    auto ms = duration_cast<milliseconds>(next - now).count();
    return static_cast<int>(std::max<long long>(0, ms + 1));
}

void AvrClient::processIncoming(const std::string& data, Outbox& out) {
    auto now = steady_clock::now();
    m_rxBuffer += data;
    auto lines = Denon::extractLines(m_rxBuffer);
    if (m_rxBuffer.size() > kMaxPartialLine) {
        std::cerr << "[AvrClient] Discarding " << m_rxBuffer.size() << " bytes without a line terminator" << std::endl;
        m_rxBuffer.clear();
    }

    MirroredState next = m_mirror;
    std::set<Field> touched;
    for (const auto& line : lines) {
        if (verboseLogging()) std::cout << "[AvrClient] <- " << line << std::endl;
        Field field = Field::None;
        switch (Denon::applyReplyLine(line, next, field)) {
            case Denon::LineMatch::Updated:
                touched.insert(field);
                m_confirmedAt[field] = now;
                break;
            case Denon::LineMatch::Malformed:
                std::cerr << "[AvrClient] Malformed reply \"" << line << "\"; keeping the previous value" << std::endl;
                if (m_inFlight && Denon::replyFieldFor(line) == m_inFlight->field) m_inFlight->sawMalformed = true;
                break;
            case Denon::LineMatch::Unrelated:
                break;
        }
    }

    if (next != m_mirror) {
        m_mirror = next;
        out.stateChanged = true;
    }

    if (m_inFlight && touched.count(m_inFlight->field)) {
        out.finished.emplace_back(m_inFlight, nullptr);
        m_inFlight.reset();
    }
    for (auto it = m_queue.begin(); it != m_queue.end();) {
        if ((*it)->query && touched.count((*it)->field)) {
            out.finished.emplace_back(*it, nullptr);
            it = m_queue.erase(it);
        } else {
            ++it;
        }
    }
}

void AvrClient::dropConnection(const std::string& reason, Outbox& out) {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_rxBuffer.clear();
    m_state = ConnectionState::Disconnected;
    std::cerr << "[AvrClient] Connection lost: " << reason << "; reconnecting in "
              << m_config.reconnectBaseMs << " ms" << std::endl;
    failAll(out, AvrErrc::ConnectionLost, reason);
    m_reconnectScheduled = true;
    m_reconnectAt = steady_clock::now() + milliseconds(m_config.reconnectBaseMs);
}
