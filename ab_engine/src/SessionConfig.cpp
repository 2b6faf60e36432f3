#include "SessionConfig.hpp"
#include <fstream>
#include <climits>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// get<int>() truncates floats and narrows large integers, so integer keys are
// checked by hand.
static int intValue(const json &j, const char *key) {
    const json &v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("Bad value in session config: '") + key
                          + "' must be an integer, got " + v.dump());
    }
    const bool inRange = v.is_number_unsigned()
        ? v.get<uint64_t>() <= static_cast<uint64_t>(INT_MAX)
        : (v.get<int64_t>() >= INT_MIN && v.get<int64_t>() <= INT_MAX);
    if (!inRange) {
        throw ConfigError(std::string("Bad value in session config: '") + key
                          + "' is out of range, got " + v.dump());
    }
    return static_cast<int>(v.get<int64_t>());
}

static void applyJson(const json &j, PlaybackConfig &config) {
    if (!j.is_object()) {
        throw ConfigError("Session config must be a JSON object");
    }

    try {
        if (j.contains("a"))               config.pathA           = j["a"].get<std::string>();
        if (j.contains("b"))               config.pathB           = j["b"].get<std::string>();
        if (j.contains("device"))          config.deviceIndex     = intValue(j, "device");
        if (j.contains("normalize"))       config.normalize       = j["normalize"].get<bool>();
        if (j.contains("normalizeTarget")) config.normalizeTarget = j["normalizeTarget"].get<float>();
        if (j.contains("blockSize"))       config.blockSize       = intValue(j, "blockSize");
        if (j.contains("pollIntervalMs"))  config.pollIntervalMs  = intValue(j, "pollIntervalMs");
    } catch (const json::type_error &e) {
        throw ConfigError(std::string("Bad value in session config: ") + e.what());
    }
}

void SessionConfig::loadString(const std::string &text, PlaybackConfig &config) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &e) {
        throw ConfigError(std::string("Session config is not valid JSON: ") + e.what());
    }
    applyJson(j, config);
}

void SessionConfig::loadFile(const std::string &path, PlaybackConfig &config) {
    std::ifstream f(path);
    if (!f.good()) throw ConfigError("Cannot open session config: " + path);

    std::stringstream ss;
    ss << f.rdbuf();
    loadString(ss.str(), config);

    std::cout << "[Config] Loaded session file " << path << "\n";
}

// ─────────────────────────────────────────────────────────────────────────────
// Command line
// ─────────────────────────────────────────────────────────────────────────────

static int toInt(const std::string &flag, const std::string &value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception &) {
        throw ConfigError("Expected an integer for " + flag + ", got '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigError("Expected an integer for " + flag + ", got '" + value + "'");
    }
    return v;
}

PlaybackConfig SessionConfig::fromCommandLine(int argc, char *argv[]) {
    PlaybackConfig config;

    // session file goes underneath everything else
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == "--config") {
            loadFile(argv[i + 1], config);
            break;
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto need = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--a") {
            config.pathA = need();
        } else if (arg == "--b") {
            config.pathB = need();
        } else if (arg == "--device") {
            config.deviceIndex = toInt(arg, need());
        } else if (arg == "--blocksize") {
            config.blockSize = toInt(arg, need());
        } else if (arg == "--normalize") {
            config.normalize = true;
        } else if (arg == "--list-devices") {
            config.listDevices = true;
        } else if (arg == "--config") {
            need();  // already merged above
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }

    return config;
}

void SessionConfig::validate(const PlaybackConfig &config) {
    if (config.blockSize <= 0) {
        throw ConfigError("blockSize must be positive, got " + std::to_string(config.blockSize));
    }
    if (config.pollIntervalMs <= 0) {
        throw ConfigError("pollIntervalMs must be positive, got " + std::to_string(config.pollIntervalMs));
    }
    if (config.deviceIndex < -1) {
        throw ConfigError("device must be -1 (system default) or a device index, got "
                          + std::to_string(config.deviceIndex));
    }
    if (!(config.normalizeTarget > 0.0f && config.normalizeTarget <= 1.0f)) {
        throw ConfigError("normalizeTarget must be in (0, 1], got " + std::to_string(config.normalizeTarget));
    }
    if (config.listDevices) return;

    if (config.pathA.empty()) throw ConfigError("--a is required");
    if (config.pathB.empty()) throw ConfigError("--b is required");
}
