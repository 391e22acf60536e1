#include "testing.hpp"
#include "appConfig.hpp"
#include <cstdio>
#include <fstream>

bool test_load_config()
{
    const char *path = "pong_test_config.txt";
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "windowScale = 3\n";
        out << "targetFps=1000\n";
        out << "logLevel=warning\n";
        out << "musicVolume=loud\n";
        out << "glyphSheet=fonts/digits.png\n";
        out << "showFps=true\n";
        out << "randomSeed=42\n";
        out << "this line has no separator\n";
        out << "unknownKey=7\n";
    }

    AppConfig cfg;
    EXPECT(LoadConfig(path, cfg));
    EXPECT(cfg.windowScale == 3);
    EXPECT(cfg.targetFps == 240);
    EXPECT(cfg.logLevel == LOG_WARNING);
    EXPECT_NEAR(cfg.musicVolume, 0.5f);
    EXPECT(cfg.glyphSheet == "fonts/digits.png");
    EXPECT(cfg.showFps);
    EXPECT(cfg.randomSeed == 42u);
    EXPECT(cfg.logFile == "pong.log");

    // Saved settings read back the same.
    EXPECT(SaveConfig(path, cfg));
    AppConfig reread;
    EXPECT(LoadConfig(path, reread));
    EXPECT(reread.windowScale == cfg.windowScale);
    EXPECT(reread.logLevel == cfg.logLevel);
    EXPECT(reread.glyphSheet == cfg.glyphSheet);

    std::remove(path);
    return true;
}

bool test_missing_config_keeps_defaults()
{
    AppConfig cfg;
    EXPECT(!LoadConfig("no_such_config.txt", cfg));
    EXPECT(cfg.windowScale == 2);
    EXPECT(cfg.targetFps == TICK_RATE);
    EXPECT(cfg.randomSeed == 0u);

    int level = LOG_INFO;
    EXPECT(ParseLogLevel("error", level));
    EXPECT(level == LOG_ERROR);
    EXPECT(!ParseLogLevel("loud", level));
    EXPECT(level == LOG_ERROR);
    return true;
}
