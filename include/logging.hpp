#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <iostream>
#include <mutex>
#include <string>


///////////////////////////
///       LOGGING       ///
///////////////////////////
/**
 * @brief Process-wide mutex serializing console output.
 *
 * Worker threads of the multi-start optimizers log concurrently; every line
 * is written under this lock so lines never interleave.
 */
inline std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

/**
 * @brief Write one complete line to a stream under the log mutex.
 */
inline void logLine(std::ostream& os, const std::string& line) {
    std::lock_guard<std::mutex> lock(logMutex());
    os << line << "\n";
}
