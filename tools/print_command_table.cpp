// Prints the logical command table with wire strings and the status field each
// command waits for.
// Run: ./build/avlink_commands [FILTER]

#include <iomanip>
#include <iostream>
#include <string>

#include "../src/DenonProtocol.hpp"

int main(int argc, char* argv[]) {
    std::string filter = argc > 1 ? argv[1] : "";

    std::cout << std::left << std::setw(22) << "COMMAND" << std::setw(16) << "WIRE" << "REPLY FIELD" << std::endl;
    for (const auto& c : Denon::commandTable()) {
        std::string name = c.name;
        if (!filter.empty() && name.find(filter) == std::string::npos) continue;
        Denon::Field field = Denon::replyFieldFor(c.wire);
        std::cout << std::setw(22) << name << std::setw(16) << c.wire
                  << (field == Denon::Field::None ? "-" : Denon::fieldName(field)) << std::endl;
    }

    std::cout << std::endl << "Valued commands: SET_VOLUME=<0..100>, INPUT_CHANGE=<input>, "
              << "SOUND_MODE=<mode>, MUTE_TOGGLE" << std::endl;
    std::cout << "Volume 40% goes out as MV" << Denon::encodeVolume(40) << std::endl;
    return 0;
}
