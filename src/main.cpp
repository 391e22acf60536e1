#include "raylib.h"
#include <string>
#include "app.hpp"
#include "appConfig.hpp"
#include "logSink.hpp"

int main(int argc, char **argv)
{
    std::string configPath = (argc > 1) ? argv[1] : "pong_config.txt";

    AppConfig config{};
    // Log files come from the config, so loading reports to stderr only.
    bool loaded = LoadConfig(configPath, config);
    InitLogSink(config);
    if (!loaded)
        TraceLog(LOG_INFO, "CONFIG: running with defaults");

    int exitCode = 0;
    {
        App app(config);
        exitCode = app.run();
    }

    ShutdownLogSink();
    return exitCode;
}
