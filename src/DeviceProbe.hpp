// DeviceProbe.hpp
// Low-level LAN probes: ICMP reachability, ARP table enumeration and TCP connect.
// None of these throw; failures read as "unreachable" or an empty list.
#pragma once

#include <optional>
#include <string>
#include <vector>

// One entry of the host's neighbour table.
struct NetworkDevice {
    std::string ip;
    std::optional<std::string> hostname;
    std::optional<std::string> macAddress;
    bool isReachable{false};
};

// Send one ICMP echo request and wait up to timeoutMs for the reply.
bool checkReachable(const std::string& ip, int timeoutMs = 3000);

// Enumerate the local ARP table ("arp -a", falling back to /proc/net/arp).
std::vector<NetworkDevice> listKnownDevices();

// Exposed for tests: parse "arp -a" output, e.g.
//   avr (192.168.50.99) at 0:5:cd:7d:d8:a6 on en0 ifscope [ethernet]
//   ? (192.168.50.7) at (incomplete) on en0 ifscope [ethernet]
std::vector<NetworkDevice> parseArpOutput(const std::string& text);

// Exposed for tests: parse the kernel table format of /proc/net/arp.
std::vector<NetworkDevice> parseProcNetArp(const std::string& text);

// Non-blocking TCP connect bounded by timeoutMs. Returns a connected,
// non-blocking socket or -1. If abortFd is given, the wait ends early (and fails)
// once abortFd becomes readable.
int openTcpConnection(const std::string& host, int port, int timeoutMs, int abortFd = -1);

// Writes all of 'data' to a non-blocking socket, waiting up to timeoutMs for
// buffer space. Never raises SIGPIPE.
bool sendAll(int fd, const std::string& data, int timeoutMs = 200);
