#include "appConfig.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace
{
struct ConfigParam
{
    enum class Kind
    {
        Int,
        Unsigned,
        Float,
        Bool,
        Text,
        Level,
    };

    std::string name;
    Kind kind;
    void *ptr;
    float minVal;
    float maxVal;
};

std::vector<ConfigParam> GetConfigParams(AppConfig &cfg)
{
    using K = ConfigParam::Kind;
    return {
        {"windowScale", K::Int, &cfg.windowScale, 1.0f, 8.0f},
        {"targetFps", K::Int, &cfg.targetFps, 1.0f, 240.0f},
        {"showFps", K::Bool, &cfg.showFps, 0.0f, 1.0f},
        {"logLevel", K::Level, &cfg.logLevel, 0.0f, 0.0f},
        {"logFile", K::Text, &cfg.logFile, 0.0f, 0.0f},
        {"longLogFile", K::Text, &cfg.longLogFile, 0.0f, 0.0f},
        {"glyphSheet", K::Text, &cfg.glyphSheet, 0.0f, 0.0f},
        {"musicFile", K::Text, &cfg.musicFile, 0.0f, 0.0f},
        {"musicVolume", K::Float, &cfg.musicVolume, 0.0f, 1.0f},
        {"randomSeed", K::Unsigned, &cfg.randomSeed, 0.0f, 2147483647.0f},
    };
}

std::string Trim(const std::string &s)
{
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool ParseNumber(const std::string &text, double &out)
{
    if (text.empty())
        return false;
    char *end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != nullptr && *end == '\0';
}

bool Assign(ConfigParam &p, const std::string &value)
{
    using K = ConfigParam::Kind;
    switch (p.kind)
    {
    case K::Text:
        *static_cast<std::string *>(p.ptr) = value;
        return true;
    case K::Level:
        return ParseLogLevel(value, *static_cast<int *>(p.ptr));
    case K::Bool:
        if (value == "true" || value == "1")
            *static_cast<bool *>(p.ptr) = true;
        else if (value == "false" || value == "0")
            *static_cast<bool *>(p.ptr) = false;
        else
            return false;
        return true;
    case K::Int:
    case K::Unsigned:
    case K::Float:
    {
        double v = 0.0;
        if (!ParseNumber(value, v))
            return false;
        double clamped = std::min(std::max(v, (double)p.minVal), (double)p.maxVal);
        if (clamped != v)
            TraceLog(LOG_WARNING, "CONFIG: %s=%s clamped to %g", p.name.c_str(), value.c_str(), clamped);
        if (p.kind == K::Float)
            *static_cast<float *>(p.ptr) = (float)clamped;
        else if (p.kind == K::Unsigned)
            *static_cast<unsigned int *>(p.ptr) = (unsigned int)clamped;
        else
            *static_cast<int *>(p.ptr) = (int)clamped;
        return true;
    }
    }
    return false;
}
} // namespace

bool ParseLogLevel(const std::string &name, int &level)
{
    if (name == "trace") level = LOG_TRACE;
    else if (name == "debug") level = LOG_DEBUG;
    else if (name == "info") level = LOG_INFO;
    else if (name == "warning") level = LOG_WARNING;
    else if (name == "error") level = LOG_ERROR;
    else if (name == "none") level = LOG_NONE;
    else return false;
    return true;
}

const char *LogLevelName(int level)
{
    switch (level)
    {
    case LOG_TRACE: return "trace";
    case LOG_DEBUG: return "debug";
    case LOG_INFO: return "info";
    case LOG_WARNING: return "warning";
    case LOG_ERROR: return "error";
    case LOG_FATAL: return "fatal";
    case LOG_NONE: return "none";
    default: return "all";
    }
}

bool LoadConfig(const std::string &path, AppConfig &cfg)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        TraceLog(LOG_WARNING, "CONFIG: %s not found, using defaults", path.c_str());
        return false;
    }

    auto params = GetConfigParams(cfg);
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line))
    {
        lineNo++;
        line = Trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
        {
            TraceLog(LOG_WARNING, "CONFIG: %s:%d has no '=', skipped", path.c_str(), lineNo);
            continue;
        }

        std::string key = Trim(line.substr(0, eq));
        std::string value = Trim(line.substr(eq + 1));
        for (auto &p : params)
        {
            if (p.name != key)
                continue;
            if (!Assign(p, value))
                TraceLog(LOG_WARNING, "CONFIG: %s:%d bad value '%s' for %s, skipped",
                         path.c_str(), lineNo, value.c_str(), key.c_str());
            break;
        }
    }
    TraceLog(LOG_INFO, "CONFIG: loaded %s", path.c_str());
    return true;
}

bool SaveConfig(const std::string &path, const AppConfig &cfg)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        TraceLog(LOG_WARNING, "CONFIG: could not write %s", path.c_str());
        return false;
    }

    file << "windowScale=" << cfg.windowScale << "\n";
    file << "targetFps=" << cfg.targetFps << "\n";
    file << "showFps=" << (cfg.showFps ? "true" : "false") << "\n";
    file << "logLevel=" << LogLevelName(cfg.logLevel) << "\n";
    file << "logFile=" << cfg.logFile << "\n";
    file << "longLogFile=" << cfg.longLogFile << "\n";
    file << "glyphSheet=" << cfg.glyphSheet << "\n";
    file << "musicFile=" << cfg.musicFile << "\n";
    file << "musicVolume=" << cfg.musicVolume << "\n";
    file << "randomSeed=" << cfg.randomSeed << "\n";
    TraceLog(LOG_INFO, "CONFIG: saved to %s", path.c_str());
    return true;
}
