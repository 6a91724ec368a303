// DenonProtocol.cpp
#include "DenonProtocol.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace Denon {

namespace {

const std::vector<CommandSpec> kCommands = {
    // Power
    {"POWER_ON", "PWON"},
    {"POWER_OFF", "PWSTANDBY"},
    {"POWER_STATUS", "PW?"},

    // Volume (MV + 00..99 for absolute levels, see encodeVolume)
    {"VOLUME_UP", "MVUP"},
    {"VOLUME_DOWN", "MVDOWN"},
    {"VOLUME_STATUS", "MV?"},

    // Mute
    {"MUTE_ON", "MUON"},
    {"MUTE_OFF", "MUOFF"},
    {"MUTE_STATUS", "MU?"},

    // Input selection
    {"INPUT_STATUS", "SI?"},
    {"INPUT_CBL_SAT", "SICBL/SAT"},
    {"INPUT_DVD", "SIDVD"},
    {"INPUT_BD", "SIBD"},
    {"INPUT_BLURAY", "SIBD"},
    {"INPUT_GAME", "SIGAME"},
    {"INPUT_AUX1", "SIAUX1"},
    {"INPUT_MEDIA_PLAYER", "SIMPLAY"},
    {"INPUT_TV", "SITV"},
    {"INPUT_TUNER", "SITUNER"},
    {"INPUT_PHONO", "SIPHONO"},
    {"INPUT_CD", "SICD"},
    {"INPUT_BLUETOOTH", "SIBT"},
    {"INPUT_NETWORK", "SINET"},

    // Sound modes
    {"SOUND_MODE_STATUS", "MS?"},
    {"SOUND_MOVIE", "MSMOVIE"},
    {"SOUND_MUSIC", "MSMUSIC"},
    {"SOUND_GAME", "MSGAME"},
    {"SOUND_DIRECT", "MSDIRECT"},
    {"SOUND_STEREO", "MSSTEREO"},
    {"SOUND_AUTO", "MSAUTO"},
    {"SOUND_DOLBY", "MSDOLBY"},
    {"SOUND_DTS", "MSDTS"},
    {"SOUND_MULTI", "MSMULTI"},

    // Zone 2
    {"ZONE2_POWER_ON", "Z2ON"},
    {"ZONE2_POWER_OFF", "Z2OFF"},
    {"ZONE2_POWER_STATUS", "Z2?"},
    {"ZONE2_VOLUME_UP", "Z2UP"},
    {"ZONE2_VOLUME_DOWN", "Z2DOWN"},
    {"ZONE2_MUTE_ON", "Z2MUON"},
    {"ZONE2_MUTE_OFF", "Z2MUOFF"},
    {"ZONE2_MUTE_STATUS", "Z2MU?"},

    // Menu navigation
    {"MENU", "MNMEN"},
    {"UP", "MNCUP"},
    {"DOWN", "MNCDN"},
    {"LEFT", "MNCLT"},
    {"RIGHT", "MNCRT"},
    {"SELECT", "MNENT"},
    {"RETURN", "MNRTN"},
    {"HOME", "MN"},
    {"OPTION", "MNOPT"},
    {"INFO", "MNINF"},

    // Network audio playback
    {"PLAY", "NS9A"},
    {"PAUSE", "NS9B"},
    {"STOP", "NS9C"},
    {"NEXT", "NS9D"},
    {"PREVIOUS", "NS9E"},
    {"FORWARD", "NS9F"},
    {"REVERSE", "NS9G"},

    // ECO mode
    {"ECO_AUTO", "ECOAUTO"},
    {"ECO_ON", "ECOON"},
    {"ECO_OFF", "ECOOFF"},
    {"ECO_STATUS", "ECO?"},

    // Sleep timer
    {"SLEEP_OFF", "SLPOFF"},
    {"SLEEP_30", "SLP030"},
    {"SLEEP_60", "SLP060"},
    {"SLEEP_90", "SLP090"},
    {"SLEEP_120", "SLP120"},
    {"SLEEP_STATUS", "SLP?"},

    // Quick select presets
    {"QUICK_SELECT_1", "MSQUICK1"},
    {"QUICK_SELECT_2", "MSQUICK2"},
    {"QUICK_SELECT_3", "MSQUICK3"},
    {"QUICK_SELECT_4", "MSQUICK4"},
    {"QUICK_SELECT_5", "MSQUICK5"},

    // Audyssey
    {"AUDYSSEY_ON", "PSMULTEQ:ON"},
    {"AUDYSSEY_OFF", "PSMULTEQ:OFF"},
    {"AUDYSSEY_STATUS", "PSMULTEQ:?"},
    {"DYNAMIC_EQ_ON", "PSDYNEQ:ON"},
    {"DYNAMIC_EQ_OFF", "PSDYNEQ:OFF"},
    {"DYNAMIC_EQ_STATUS", "PSDYNEQ:?"},
    {"DYNAMIC_VOL_HEAVY", "PSDYNVOL:HEV"},
    {"DYNAMIC_VOL_MEDIUM", "PSDYNVOL:MED"},
    {"DYNAMIC_VOL_LIGHT", "PSDYNVOL:LIT"},
    {"DYNAMIC_VOL_OFF", "PSDYNVOL:OFF"},
    {"DYNAMIC_VOL_STATUS", "PSDYNVOL:?"},
};

// Reply table: status line prefix -> field setter. Scanned in order for every
// received line; the first matching prefix owns the line.
using Setter = LineMatch (*)(const std::string& payload, MirroredState& state);

struct ReplyPattern {
    const char* prefix;
    Field field;
    Setter apply;
};

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

LineMatch setPower(const std::string& p, MirroredState& s) {
    if (p == "ON") { s.power = true; return LineMatch::Updated; }
    if (p == "STANDBY" || p == "OFF") { s.power = false; return LineMatch::Updated; }
    return LineMatch::Malformed;
}

LineMatch setVolume(const std::string& p, MirroredState& s) {
    // "MVMAX 98" reports the volume limit, not the level.
    if (p.rfind("MAX", 0) == 0) return LineMatch::Unrelated;
    auto v = decodeVolume(p);
    if (!v) return LineMatch::Malformed;
    s.volumePercent = *v;
    return LineMatch::Updated;
}

LineMatch setMute(const std::string& p, MirroredState& s) {
    if (p == "ON") { s.muted = true; return LineMatch::Updated; }
    if (p == "OFF") { s.muted = false; return LineMatch::Updated; }
    return LineMatch::Malformed;
}

LineMatch setInput(const std::string& p, MirroredState& s) {
    if (p.empty() || p == "?") return LineMatch::Malformed;
    s.input = p;
    return LineMatch::Updated;
}

LineMatch setSoundMode(const std::string& p, MirroredState& s) {
    // Quick select acknowledgements share the MS prefix.
    if (p.rfind("QUICK", 0) == 0) return LineMatch::Unrelated;
    if (p.empty() || p == "?") return LineMatch::Malformed;
    s.soundMode = p;
    return LineMatch::Updated;
}

LineMatch setEcoMode(const std::string& p, MirroredState& s) {
    if (p == "AUTO" || p == "ON" || p == "OFF") { s.ecoMode = p; return LineMatch::Updated; }
    return LineMatch::Malformed;
}

LineMatch setSleepTimer(const std::string& p, MirroredState& s) {
    if (p == "OFF") { s.sleepMinutes = 0; return LineMatch::Updated; }
    if (allDigits(p) && p.size() <= 3) { s.sleepMinutes = std::stoi(p); return LineMatch::Updated; }
    return LineMatch::Malformed;
}

LineMatch setZone2Power(const std::string& p, MirroredState& s) {
    // Z2 also carries zone 2 volume, mute and source lines; only power is mirrored.
    if (p == "ON") { s.zone2Power = true; return LineMatch::Updated; }
    if (p == "OFF") { s.zone2Power = false; return LineMatch::Updated; }
    return LineMatch::Unrelated;
}

const ReplyPattern kReplyPatterns[] = {
    {"PW", Field::Power, setPower},
    {"MV", Field::Volume, setVolume},
    {"MU", Field::Mute, setMute},
    {"SI", Field::Input, setInput},
    {"MS", Field::SoundMode, setSoundMode},
    {"ECO", Field::EcoMode, setEcoMode},
    {"SLP", Field::SleepTimer, setSleepTimer},
    {"Z2", Field::Zone2Power, setZone2Power},
};

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string toUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

} // namespace

const char* fieldName(Field field) {
    switch (field) {
        case Field::None: return "none";
        case Field::Power: return "power";
        case Field::Volume: return "volume";
        case Field::Mute: return "mute";
        case Field::Input: return "input";
        case Field::SoundMode: return "soundMode";
        case Field::EcoMode: return "ecoMode";
        case Field::SleepTimer: return "sleepTimer";
        case Field::Zone2Power: return "zone2Power";
    }
    return "unknown";
}

bool operator==(const MirroredState& a, const MirroredState& b) {
    return a.power == b.power && a.volumePercent == b.volumePercent && a.muted == b.muted &&
           a.input == b.input && a.soundMode == b.soundMode && a.ecoMode == b.ecoMode &&
           a.sleepMinutes == b.sleepMinutes && a.zone2Power == b.zone2Power;
}

const std::vector<CommandSpec>& commandTable() {
    return kCommands;
}

std::optional<std::string> wireForCommand(const std::string& name) {
    for (const auto& c : kCommands) {
        if (name == c.name) return std::string(c.wire);
    }
    return std::nullopt;
}

std::string wireForInput(const std::string& input) {
    std::string upper = toUpper(trim(input));
    std::string slashed = upper;
    std::replace(slashed.begin(), slashed.end(), '_', '/');

    for (const auto& c : kCommands) {
        if (!startsWith(c.name, "INPUT_") || std::string(c.name) == "INPUT_STATUS") continue;
        std::string key = std::string(c.name).substr(6);
        std::string code = std::string(c.wire).substr(2);
        if (upper == key || upper == code || slashed == code) return c.wire;
    }
    return "SI" + slashed;
}

Field replyFieldFor(const std::string& wire) {
    if (startsWith(wire, "MSQUICK")) return Field::None;
    if (startsWith(wire, "Z2")) {
        return (wire == "Z2ON" || wire == "Z2OFF" || wire == "Z2?") ? Field::Zone2Power : Field::None;
    }
    for (const auto& p : kReplyPatterns) {
        if (startsWith(wire, p.prefix)) return p.field;
    }
    return Field::None;
}

LineMatch applyReplyLine(const std::string& line, MirroredState& state, Field& field) {
    field = Field::None;
    for (const auto& p : kReplyPatterns) {
        if (!startsWith(line, p.prefix)) continue;
        MirroredState next = state;
        LineMatch m = p.apply(line.substr(std::char_traits<char>::length(p.prefix)), next);
        if (m == LineMatch::Updated) {
            state = next;
            field = p.field;
        }
        return m;
    }
    return LineMatch::Unrelated;
}

std::vector<std::string> extractLines(std::string& buffer) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < buffer.size(); ++i) {
        if (buffer[i] != '\r' && buffer[i] != '\n') continue;
        std::string line = trim(buffer.substr(start, i - start));
        if (!line.empty()) lines.push_back(std::move(line));
        start = i + 1;
    }
    buffer.erase(0, start);
    return lines;
}

bool looksLikeDenonReply(const std::string& line) {
    if (startsWith(line, "PW") || startsWith(line, "SI") || startsWith(line, "MS")) return true;
    return startsWith(line, "MV") && line.size() > 2 && std::isdigit(static_cast<unsigned char>(line[2]));
}

std::optional<int> decodeVolume(const std::string& digits) {
    if (!allDigits(digits) || digits.size() < 2 || digits.size() > 3) return std::nullopt;
    double raw = std::stoi(digits.substr(0, 2));
    if (digits.size() == 3) raw += (digits[2] - '0') / 10.0;
    long percent = std::lround(raw / 99.0 * 100.0);
    return static_cast<int>(std::clamp(percent, 0L, 100L));
}

std::string encodeVolume(int percent) {
    percent = std::clamp(percent, 0, 100);
    long halfSteps = std::lround(percent * 99.0 / 100.0 * 2.0);
    char buf[8];
    if (halfSteps % 2) {
        std::snprintf(buf, sizeof(buf), "%02ld5", halfSteps / 2);
    } else {
        std::snprintf(buf, sizeof(buf), "%02ld", halfSteps / 2);
    }
    return buf;
}

void applySimulatedCommand(const std::string& name, const std::string& value, MirroredState& state) {
    std::string wire;
    if (name == "SET_VOLUME") {
        try {
            wire = "MV" + encodeVolume(std::stoi(value));
        } catch (const std::exception&) {
            return;
        }
    } else if (name == "INPUT_CHANGE") {
        if (value.empty()) return;
        wire = wireForInput(value);
    } else if (name == "SOUND_MODE") {
        if (value.empty()) return;
        wire = "MS" + toUpper(value);
    } else if (name == "MUTE_TOGGLE") {
        if (state.power) state.muted = !state.muted;
        return;
    } else if (auto w = wireForCommand(name)) {
        wire = *w;
    } else {
        return;
    }

    if (isQuery(wire)) return;

    // Zone 2 and the main power switch work from standby; everything else is
    // ignored by a receiver that is off.
    bool worksInStandby = startsWith(wire, "PW") || startsWith(wire, "Z2");
    if (!state.power && !worksInStandby) return;

    if (wire == "MVUP") {
        state.volumePercent = std::min(100, state.volumePercent + 2);
        return;
    }
    if (wire == "MVDOWN") {
        state.volumePercent = std::max(0, state.volumePercent - 2);
        return;
    }

    // Set commands are echoed by the receiver verbatim as status lines, so the
    // reply table doubles as the simulated state transition.
    Field field;
    applyReplyLine(wire, state, field);
}

} // namespace Denon
