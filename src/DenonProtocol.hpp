// DenonProtocol.hpp
// Denon/Marantz telnet control protocol: command table, reply patterns and the
// volume scale. Commands are ASCII terminated by CR; the receiver answers (and
// chatters) with CR-terminated status lines such as "PWON" or "MV505".

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Denon {

constexpr int kDefaultPort = 23;

// Receiver state fields a status line can update.
enum class Field : uint8_t {
    None,
    Power,
    Volume,
    Mute,
    Input,
    SoundMode,
    EcoMode,
    SleepTimer,
    Zone2Power
};

const char* fieldName(Field field);

// Last known receiver state as mirrored from status lines.
struct MirroredState {
    bool power{false};
    int volumePercent{0};      // 0..100, see decodeVolume()
    bool muted{false};
    std::string input;         // e.g. "TV", "CBL/SAT"
    std::string soundMode;     // e.g. "STEREO", "DOLBY DIGITAL"
    std::string ecoMode{"OFF"};
    int sleepMinutes{0};
    bool zone2Power{false};
};

bool operator==(const MirroredState& a, const MirroredState& b);
inline bool operator!=(const MirroredState& a, const MirroredState& b) { return !(a == b); }

// Logical command name (as used by the control API) to wire string.
struct CommandSpec {
    const char* name;
    const char* wire;
};

const std::vector<CommandSpec>& commandTable();

// Looks up a logical command name. Returns nullopt for unknown names and for
// the valued commands (SET_VOLUME, INPUT_CHANGE, SOUND_MODE, MUTE_TOGGLE),
// which have no fixed wire form.
std::optional<std::string> wireForCommand(const std::string& name);

// Wire form of an input selection. Accepts table names ("BLURAY", "CBL_SAT"),
// raw source codes ("BD", "CBL/SAT") or anything else, which is passed through
// upper-cased.
std::string wireForInput(const std::string& input);

// Field whose status line answers the given wire command, or Field::None for
// commands the receiver does not acknowledge (menu navigation, playback, ...).
Field replyFieldFor(const std::string& wire);

inline bool isQuery(const std::string& wire) {
    return !wire.empty() && wire.back() == '?';
}

enum class LineMatch {
    Unrelated,  // not a mirrored field (MVMAX, SSINFO, ...)
    Updated,    // parsed and applied
    Malformed   // known prefix, unparseable payload; state untouched
};

// Matches one status line against the reply table. On Updated, 'state' holds the
// new value and 'field' names what changed.
LineMatch applyReplyLine(const std::string& line, MirroredState& state, Field& field);

// Moves every complete CR/LF-terminated line out of 'buffer'. A trailing partial
// line stays in the buffer. Empty lines are dropped.
std::vector<std::string> extractLines(std::string& buffer);

// True for lines a Denon receiver produces in response to a status query.
bool looksLikeDenonReply(const std::string& line);

// "40" -> 40, "99" -> 100, "505" (50.5) -> 51. The receiver scale is 0..99
// with an optional half-step digit; the result is round(raw / 99 * 100)
// clamped to 0..100.
std::optional<int> decodeVolume(const std::string& digits);

// Inverse of decodeVolume(): percent to the nearest half step ("40" -> "395").
std::string encodeVolume(int percent);

// Applies a logical command to a locally held state, the way a receiver would
// react. Used by the simulated session. Non-power commands are ignored while the
// receiver is in standby.
void applySimulatedCommand(const std::string& name, const std::string& value, MirroredState& state);

} // namespace Denon
