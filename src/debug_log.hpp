#pragma once

#include <sstream>
#include <string>

namespace ordmap {

// Process-wide debug log. Off unless the ORDMAP_DEBUG_LOG environment
// variable names a file at first use, or setDebugLogPath() is called.
bool debugLogEnabled();

// Opens (truncating) path as the debug log. An empty path closes the log.
// Throws std::runtime_error if the file cannot be opened.
void setDebugLogPath(const std::string& path);

void closeDebugLog();

// Appends "[tag] message" as one line. No-op when the log is off.
void writeDebugLog(const char* tag, const std::string& message);

} // namespace ordmap

// Streams expr into the debug log under tag; expr is not evaluated when
// logging is off.
#define ORDMAP_DEBUG_LOG(tag, expr)                          \
    do {                                                     \
        if (::ordmap::debugLogEnabled()) {                   \
            std::ostringstream ordmap_log_stream_;           \
            ordmap_log_stream_ << expr;                      \
            ::ordmap::writeDebugLog(tag, ordmap_log_stream_.str()); \
        }                                                    \
    } while (0)
