#pragma once

#include <string>

#include "PlaybackTypes.hpp"

// Session file (optional) + command line → PlaybackConfig.
//
// Session file keys (all optional):
//   { "a": "orig.wav", "b": "filtered.wav", "device": 2, "normalize": true,
//     "normalizeTarget": 0.95, "blockSize": 1024, "pollIntervalMs": 50 }
//
// Command-line flags win over the session file. All failures throw
// ConfigError with a message fit for the user.
class SessionConfig {
public:
    /// Merge a JSON session file into config.
    static void loadFile(const std::string &path, PlaybackConfig &config);

    /// Merge JSON text into config.
    static void loadString(const std::string &text, PlaybackConfig &config);

    /// Parse argv (session file first, then flags on top).
    static PlaybackConfig fromCommandLine(int argc, char *argv[]);

    /// Range checks plus "both inputs present" unless only listing devices.
    static void validate(const PlaybackConfig &config);
};
