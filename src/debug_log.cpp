#include "debug_log.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>

static std::ofstream debug_log;
static std::mutex debug_mutex;
static bool debug_initialized = false;

// Opens the log on first use; the environment is read only once per process
static void init_debug_log() {
    if (debug_initialized) return;
    debug_initialized = true;

    const char* path = std::getenv(pcutils::DEBUG_LOG_ENV);
    if (path == nullptr || *path == '\0') return;

    debug_log.open(path, std::ios::out | std::ios::app);
    if (debug_log.is_open()) {
        debug_log << "=== pycollection debug log ===" << std::endl;
    }
}

namespace pcutils {

bool debugLogEnabled() {
    std::lock_guard<std::mutex> lock(debug_mutex);
    init_debug_log();
    return debug_log.is_open();
}

void debugLog(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    init_debug_log();
    if (!debug_log.is_open()) return;
    debug_log << "[" << tag << "] " << message << std::endl;
}

}  // namespace pcutils
