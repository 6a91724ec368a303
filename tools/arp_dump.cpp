// Dumps the local ARP table with AVR and TV scores for every entry, including
// the ones below threshold. Handy when tuning AVLINK_*_THRESHOLD.
// Run: ./build/avlink_arp_dump [arp-output-file]

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "../src/CandidateScorer.hpp"
#include "../src/DeviceProbe.hpp"

int main(int argc, char* argv[]) {
    std::vector<NetworkDevice> devices;
    if (argc > 1) {
        std::ifstream in(argv[1]);
        if (!in.is_open()) {
            std::cerr << "Cannot open " << argv[1] << std::endl;
            return 1;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        devices = parseArpOutput(ss.str());
    } else {
        devices = listKnownDevices();
    }

    auto avr = CandidateScorer::forAvr();
    auto tv = CandidateScorer::forTv();

    std::cout << devices.size() << " entries" << std::endl;
    for (const auto& d : devices) {
        Candidate a = avr.evaluate(d);
        Candidate t = tv.evaluate(d);
        std::cout << std::left << std::setw(16) << d.ip << std::setw(24) << d.hostname.value_or("?")
                  << std::setw(19) << d.macAddress.value_or("-") << (d.isReachable ? "up  " : "down")
                  << std::fixed << std::setprecision(2) << "  avr=" << a.confidence << "  tv=" << t.confidence;
        if (t.brand) std::cout << "  brand=" << *t.brand;
        std::cout << std::endl;
        if (!a.reason.empty()) std::cout << "    avr: " << a.reason << std::endl;
        if (!t.reason.empty()) std::cout << "    tv:  " << t.reason << std::endl;
    }
    return 0;
}
