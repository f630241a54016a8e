#pragma once

#include <string>

// Trace log for collection internals.
// Disabled unless PYCOLLECTION_DEBUG_LOG names a file to append to.
namespace pcutils {
    constexpr const char* DEBUG_LOG_ENV = "PYCOLLECTION_DEBUG_LOG";

    bool debugLogEnabled();
    void debugLog(const std::string& tag, const std::string& message);
}
