#pragma once
// stderr logging for the command-line front end. The analysis library
// itself never logs.

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace nucleo {
namespace log_utils {

inline bool& verbose_flag() {
    static bool verbose = false;
    return verbose;
}

inline void set_verbose(bool verbose) { verbose_flag() = verbose; }
inline bool verbose() { return verbose_flag(); }

// Always printed
inline void info(const std::string& message) {
    std::cerr << message << "\n";
}

// Printed only with --verbose
inline void debug(const std::string& message) {
    if (verbose()) std::cerr << "  [DEBUG] " << message << "\n";
}

inline void warn(const std::string& message) {
    std::cerr << "Warning: " << message << "\n";
}

inline void error(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
}

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

}  // namespace log_utils
}  // namespace nucleo
