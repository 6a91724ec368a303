#include "DeviceProbe.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Logging.hpp"

namespace {

uint16_t icmpChecksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < len; i += 2) sum += (data[i] << 8) | data[i + 1];
    if (len & 1) sum += data[len - 1] << 8;
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return htons(static_cast<uint16_t>(~sum));
}

// One echo over an unprivileged ICMP datagram socket (net.ipv4.ping_group_range).
// Sets socketDenied when the kernel does not allow that socket type for us.
bool icmpEcho(const in_addr& target, int timeoutMs, bool& socketDenied) {
    socketDenied = false;
    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd < 0) {
        socketDenied = (errno == EACCES || errno == EPERM || errno == EPROTONOSUPPORT);
        return false;
    }

    uint8_t packet[sizeof(icmphdr) + 16]{};
    auto* hdr = reinterpret_cast<icmphdr*>(packet);
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = 0; // the kernel assigns the identifier on ping sockets
    hdr->un.echo.sequence = htons(1);
    std::memcpy(packet + sizeof(icmphdr), "avlink-reach-chk", 16);
    hdr->checksum = icmpChecksum(packet, sizeof(packet));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr = target;
    if (::sendto(fd, packet, sizeof(packet), 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    bool answered = false;
    while (!answered) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) break;

        uint8_t reply[256];
        ssize_t n = ::recv(fd, reply, sizeof(reply), 0);
        if (n < static_cast<ssize_t>(sizeof(icmphdr))) continue;
        auto* rh = reinterpret_cast<const icmphdr*>(reply);
        if (rh->type == ICMP_ECHOREPLY && rh->un.echo.sequence == htons(1)) answered = true;
    }
    ::close(fd);
    return answered;
}

// Run a shell command and capture stdout. Returns false if it could not run or
// exited non-zero.
bool captureCommand(const char* command, std::string& out) {
    FILE* pipe = ::popen(command, "r");
    if (!pipe) return false;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);
    int status = ::pclose(pipe);
    return status == 0;
}

bool looksLikeMac(const std::string& s) {
    static const std::regex mac(R"(^[0-9a-fA-F]{1,2}([:-][0-9a-fA-F]{1,2}){5}$)");
    return std::regex_match(s, mac);
}

} // anonymous namespace

bool checkReachable(const std::string& ip, int timeoutMs) {
    in_addr target{};
    if (::inet_pton(AF_INET, ip.c_str(), &target) != 1) {
        return false;
    }

    bool socketDenied = false;
    if (icmpEcho(target, timeoutMs, socketDenied)) return true;
    if (!socketDenied) return false;

    // No ping socket for this group; the setuid ping binary can still do it.
    // 'ip' passed inet_pton above, so it is a plain dotted quad.
    int seconds = std::max(1, (timeoutMs + 999) / 1000);
    std::string command = "ping -c 1 -W " + std::to_string(seconds) + " " + ip + " >/dev/null 2>&1";
    return std::system(command.c_str()) == 0;
}

std::vector<NetworkDevice> parseArpOutput(const std::string& text) {
    static const std::regex line(R"(^\s*(.+?)\s*\((\d{1,3}(?:\.\d{1,3}){3})\)\s+at\s+(\S+))");
    std::vector<NetworkDevice> out;
    std::istringstream in(text);
    std::string row;
    while (std::getline(in, row)) {
        std::smatch m;
        if (!std::regex_search(row, m, line)) continue;

        NetworkDevice d;
        d.ip = m[2].str();
        std::string host = m[1].str();
        if (!host.empty() && host != "?") d.hostname = host;

        std::string hw = m[3].str();
        bool incomplete = row.find("incomplete") != std::string::npos;
        if (looksLikeMac(hw)) {
            d.macAddress = hw;
        } else if (!incomplete) {
            continue;
        }
        d.isReachable = !incomplete;
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<NetworkDevice> parseProcNetArp(const std::string& text) {
    // IP address  HW type  Flags  HW address  Mask  Device
    std::vector<NetworkDevice> out;
    std::istringstream in(text);
    std::string row;
    std::getline(in, row); // header
    while (std::getline(in, row)) {
        std::istringstream fields(row);
        std::string ip, hwType, flags, mac, mask, dev;
        if (!(fields >> ip >> hwType >> flags >> mac)) continue;
        in_addr probe{};
        if (::inet_pton(AF_INET, ip.c_str(), &probe) != 1) continue;

        NetworkDevice d;
        d.ip = ip;
        unsigned long f = std::strtoul(flags.c_str(), nullptr, 16);
        d.isReachable = (f & 0x2) != 0; // ATF_COM
        if (looksLikeMac(mac) && mac != "00:00:00:00:00:00") d.macAddress = mac;
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<NetworkDevice> listKnownDevices() {
    std::string output;
    if (captureCommand("arp -a 2>/dev/null", output)) {
        auto devices = parseArpOutput(output);
        if (verboseLogging()) {
            std::cout << "[DeviceProbe] arp -a listed " << devices.size() << " devices" << std::endl;
        }
        return devices;
    }

    std::ifstream table("/proc/net/arp");
    if (!table.is_open()) {
        std::cerr << "[DeviceProbe] No ARP table available (arp missing, /proc/net/arp unreadable)" << std::endl;
        return {};
    }
    std::stringstream ss;
    ss << table.rdbuf();
    auto devices = parseProcNetArp(ss.str());
    if (verboseLogging()) {
        std::cout << "[DeviceProbe] /proc/net/arp listed " << devices.size() << " devices" << std::endl;
    }
    return devices;
}

int openTcpConnection(const std::string& host, int port, int timeoutMs, int abortFd) {
    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_family = AF_UNSPEC;
    addrinfo* res = nullptr;

    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0) {
        return -1;
    }

    int connected = -1;
    for (addrinfo* rp = res; rp && connected < 0; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int c = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (c == 0) {
            connected = fd;
            break;
        }

        if (errno == EINPROGRESS) {
            fd_set writefds, readfds;
            FD_ZERO(&writefds);
            FD_ZERO(&readfds);
            FD_SET(fd, &writefds);
            int maxFd = fd;
            if (abortFd >= 0) {
                FD_SET(abortFd, &readfds);
                maxFd = std::max(fd, abortFd);
            }

            struct timeval tv;
            tv.tv_sec = timeoutMs / 1000;
            tv.tv_usec = (timeoutMs % 1000) * 1000;

            int sel = select(maxFd + 1, &readfds, &writefds, nullptr, &tv);
            bool aborted = abortFd >= 0 && sel > 0 && FD_ISSET(abortFd, &readfds);
            if (!aborted && sel > 0 && FD_ISSET(fd, &writefds)) {
                int error = 0;
                socklen_t len = sizeof(error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error == 0) {
                    connected = fd;
                    break;
                }
            }
            if (aborted) {
                ::close(fd);
                break;
            }
        }

        ::close(fd);
    }

    if (res) freeaddrinfo(res);
    return connected;
}

bool sendAll(int fd, const std::string& data, int timeoutMs) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{fd, POLLOUT, 0};
                if (::poll(&pfd, 1, timeoutMs) <= 0) return false;
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}
