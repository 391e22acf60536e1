#pragma once
#include <raylib.h>
#include <string>
#include "constant.hpp"

/**
 * @brief Application settings. Simulation constants stay in constant.hpp.
 */
struct AppConfig
{
    // Window
    int windowScale = 2; // Window size = logical surface size * windowScale
    int targetFps = TICK_RATE;
    bool showFps = false;

    // Logging
    int logLevel = LOG_INFO;
    std::string logFile = "pong.log";          // Truncated every run
    std::string longLogFile = "pong.long.log"; // Appended across runs

    // Assets
    std::string glyphSheet = "sprite_sheet.png";
    std::string musicFile = "pong.mp3";
    float musicVolume = 0.5f;

    // 0 seeds from the clock
    unsigned int randomSeed = 0;
};

/**
 * @brief Read `key=value` lines from `path` into `cfg`.
 *
 * Unknown keys are ignored. Malformed values are skipped with a warning and
 * numbers are clamped to their valid range. A missing file leaves the
 * defaults untouched.
 *
 * @return false when the file could not be opened.
 */
bool LoadConfig(const std::string &path, AppConfig &cfg);

// Write every setting of `cfg` to `path` in the format LoadConfig reads.
bool SaveConfig(const std::string &path, const AppConfig &cfg);

// "trace", "debug", "info", "warning", "error", "none" to raylib levels.
bool ParseLogLevel(const std::string &name, int &level);
const char *LogLevelName(int level);
