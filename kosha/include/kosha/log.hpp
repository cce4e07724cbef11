#pragma once
// Debug logging gated by --verbose / KOSHA_VERBOSE
//
// Regular diagnostics go straight to std::cerr with a "[component]" prefix.
// log_debug adds a wall-clock timestamp and is silent unless verbose.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

namespace kosha {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(std::memory_order_relaxed); }

// KOSHA_VERBOSE=1 (or any value other than "0") turns debug output on
inline void init_verbose_from_env() {
    const char* v = std::getenv("KOSHA_VERBOSE");
    if (v && *v && std::strcmp(v, "0") != 0) set_verbose(true);
}

__attribute__((format(printf, 2, 3)))
inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    // One line per call even with several worker threads logging
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::fprintf(stderr, "[%s.%03d][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), component);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace kosha
