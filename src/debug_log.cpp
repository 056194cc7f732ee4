#include "debug_log.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace ordmap {

// Debug logging to file
static std::ofstream debug_log;
static std::mutex debug_mutex;
static bool debug_initialized = false;
static bool debug_enabled = false;

static void openLocked(const std::string& path) {
    if (debug_log.is_open()) debug_log.close();
    debug_enabled = false;
    if (path.empty()) return;

    debug_log.open(path, std::ios::out | std::ios::trunc);
    if (!debug_log) {
        throw std::runtime_error("cannot open debug log " + path);
    }
    debug_enabled = true;
    debug_log << "=== ordmap debug log ===" << std::endl;
}

static void initLocked() {
    if (debug_initialized) return;
    debug_initialized = true;
    const char* path = std::getenv("ORDMAP_DEBUG_LOG");
    if (path && *path) {
        // A bad path in the environment leaves logging off rather than
        // failing the first map operation.
        debug_log.open(path, std::ios::out | std::ios::trunc);
        debug_enabled = static_cast<bool>(debug_log);
        if (debug_enabled) debug_log << "=== ordmap debug log ===" << std::endl;
    }
}

bool debugLogEnabled() {
    std::lock_guard<std::mutex> lock(debug_mutex);
    initLocked();
    return debug_enabled;
}

void setDebugLogPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    debug_initialized = true;
    openLocked(path);
}

void closeDebugLog() {
    std::lock_guard<std::mutex> lock(debug_mutex);
    debug_initialized = true;
    openLocked(std::string());
}

void writeDebugLog(const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    initLocked();
    if (!debug_enabled) return;
    debug_log << "[" << tag << "] " << message << std::endl;
}

} // namespace ordmap
