#ifndef COMBINATION_DEBUG_LOG_HPP
#define COMBINATION_DEBUG_LOG_HPP

#include "combination/types.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <limits>
#include <sstream>
#include <thread>

namespace combination {
namespace debug {

// Receives one formatted line (no trailing newline)
using DebugCallback = void (*)(const char* message);

// When null, COMBINATION_DEBUG_LOG writes to stdout.
// An embedding front end installs a callback to route lines into its own log view.
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// =============================================================================
// Worker tagging
// =============================================================================
// A search worker tags its pool thread for the duration of a shard, so its
// lines read [DEBUG][W3] instead of an opaque thread id.

constexpr WorkerId UNTAGGED_WORKER = std::numeric_limits<WorkerId>::max();

inline thread_local WorkerId t_worker_tag = UNTAGGED_WORKER;

class WorkerTag {
public:
    explicit WorkerTag(WorkerId worker) : previous_(t_worker_tag) { t_worker_tag = worker; }
    ~WorkerTag() { t_worker_tag = previous_; }

    WorkerTag(const WorkerTag&) = delete;
    WorkerTag& operator=(const WorkerTag&) = delete;

private:
    WorkerId previous_;
};

inline WorkerId current_worker_tag() { return t_worker_tag; }

inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char full_message[1100];
    if (t_worker_tag != UNTAGGED_WORKER) {
        snprintf(full_message, sizeof(full_message), "[DEBUG][W%u] %s", t_worker_tag, buffer);
    } else {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        snprintf(full_message, sizeof(full_message), "[DEBUG][T%s] %s", oss.str().c_str(), buffer);
    }

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

}  // namespace debug
}  // namespace combination

#ifdef COMBINATION_ENABLE_DEBUG_OUTPUT
    #define COMBINATION_DEBUG_LOG(fmt, ...) ::combination::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define COMBINATION_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif  // COMBINATION_DEBUG_LOG_HPP
