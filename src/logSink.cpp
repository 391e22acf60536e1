#include "logSink.hpp"
#include <raylib.h>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace
{
FILE *runLog = nullptr;
FILE *longLog = nullptr;

const char *LevelTag(int level)
{
    switch (level)
    {
    case LOG_TRACE: return "TRACE";
    case LOG_DEBUG: return "DEBUG";
    case LOG_INFO: return "INFO";
    case LOG_WARNING: return "WARNING";
    case LOG_ERROR: return "ERROR";
    case LOG_FATAL: return "FATAL";
    default: return "LOG";
    }
}

void WriteLine(FILE *out, const char *stamp, const char *tag, const char *text, va_list args)
{
    if (!out)
        return;
    fprintf(out, "%s %s: ", stamp, tag);
    vfprintf(out, text, args);
    fputc('\n', out);
}

void SinkCallback(int level, const char *text, va_list args)
{
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    const char *tag = LevelTag(level);

    // A va_list can be consumed once per copy.
    va_list copy;
    va_copy(copy, args);
    WriteLine(stderr, stamp, tag, text, copy);
    va_end(copy);

    va_copy(copy, args);
    WriteLine(runLog, stamp, tag, text, copy);
    va_end(copy);

    va_copy(copy, args);
    WriteLine(longLog, stamp, tag, text, copy);
    va_end(copy);

    if (level >= LOG_ERROR)
    {
        if (runLog) fflush(runLog);
        if (longLog) fflush(longLog);
    }
}
} // namespace

void InitLogSink(const AppConfig &cfg)
{
    ShutdownLogSink();

    if (!cfg.logFile.empty())
    {
        runLog = fopen(cfg.logFile.c_str(), "w");
        if (!runLog)
            fprintf(stderr, "WARNING: LOG: could not open %s\n", cfg.logFile.c_str());
    }
    if (!cfg.longLogFile.empty())
    {
        longLog = fopen(cfg.longLogFile.c_str(), "a");
        if (!longLog)
            fprintf(stderr, "WARNING: LOG: could not open %s\n", cfg.longLogFile.c_str());
    }

    SetTraceLogLevel(cfg.logLevel);
    SetTraceLogCallback(SinkCallback);
    TraceLog(LOG_INFO, "LOG: sink ready (level %s)", LogLevelName(cfg.logLevel));
}

void ShutdownLogSink()
{
    SetTraceLogCallback(nullptr);
    if (runLog)
    {
        fclose(runLog);
        runLog = nullptr;
    }
    if (longLog)
    {
        fclose(longLog);
        longLog = nullptr;
    }
}
