#include "debug_utils.h"
#include <chrono>

static bool g_debug_enabled = false;

long long t_ms() {
    using namespace std::chrono;
    static auto t0 = steady_clock::now();
    auto now = steady_clock::now();
    return duration_cast<milliseconds>(now - t0).count();
}

void set_debug_enabled(bool on) {
    g_debug_enabled = on;
    // pin t0 to program start rather than the first trace line
    t_ms();
}

bool debug_enabled() {
    return g_debug_enabled;
}
