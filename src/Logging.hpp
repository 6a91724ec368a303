// Logging.hpp
// Log lines are tagged ("[AvrClient] ...") and go to std::cout, errors to
// std::cerr. Per-line debug output is gated on AVLINK_VERBOSE.
#pragma once

#include <cstdlib>
#include <string>

// AVLINK_VERBOSE=1 (or true) enables per-line debug output.
inline bool verboseLogging() {
    const char* v = std::getenv("AVLINK_VERBOSE");
    return v && (std::string(v) == "1" || std::string(v) == "true");
}
