#ifndef STEPGRAPH_DEBUG_LOG_HPP
#define STEPGRAPH_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace stepgraph {
namespace debug {

// Receives one formatted line, without a trailing newline
using DebugCallback = void (*)(const char* message);

// When null, trace lines go to stdout
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// printf-style formatting; long messages (task keys can be arbitrary strings) are not truncated
inline std::string format_message(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int needed = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (needed <= 0) {
        return std::string();
    }

    std::vector<char> buffer(static_cast<std::size_t>(needed) + 1);
    vsnprintf(buffer.data(), buffer.size(), fmt, args);
    return std::string(buffer.data(), static_cast<std::size_t>(needed));
}

inline void debug_output(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string message = format_message(fmt, args);
    va_end(args);

    std::ostringstream line;
    line << "[stepgraph T" << std::this_thread::get_id() << "] " << message;
    const std::string text = line.str();

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(text.c_str());
    } else {
        printf("%s\n", text.c_str());
        fflush(stdout);
    }
}

} // namespace debug
} // namespace stepgraph

// Scheduling trace; compiled out unless STEPGRAPH_ENABLE_DEBUG_OUTPUT is defined
#ifdef STEPGRAPH_ENABLE_DEBUG_OUTPUT
    #define STEPGRAPH_DEBUG_LOG(fmt, ...) ::stepgraph::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define STEPGRAPH_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // STEPGRAPH_DEBUG_LOG_HPP
