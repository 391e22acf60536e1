#pragma once
#include "appConfig.hpp"

/**
 * @brief Route raylib's TraceLog to stderr and the two log files.
 *
 * The run log is truncated, the long log is appended to. Files that cannot
 * be opened are skipped with a warning on stderr.
 */
void InitLogSink(const AppConfig &cfg);

// Flush and close the log files and restore raylib's default output.
void ShutdownLogSink();
