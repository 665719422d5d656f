#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <cstdio>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <fmt/format.h>

// Debug log file. Defaults to <tmp>/tether_debug.log; Config may redirect it.
inline std::string& tether_log_path_ref() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILE_NAME).string();
    return path;
}

inline std::string tether_log_path() {
    return tether_log_path_ref();
}

inline std::mutex& tether_log_mutex() {
    static std::mutex m;
    return m;
}

inline void set_tether_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(tether_log_mutex());
    tether_log_path_ref() = path;
}

// Background tasks log concurrently; one line per call, never interleaved.
inline void tether_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(tether_log_mutex());
    std::ofstream out(tether_log_path_ref(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}
