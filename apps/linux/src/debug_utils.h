#pragma once
#include <iostream>

// Milliseconds since the first call; used to timestamp trace lines.
long long t_ms();

// Master debug switch, set from --verbose
void set_debug_enabled(bool on);
bool debug_enabled();

#define DPRINT(msg)                                                       \
    do {                                                                  \
        if (debug_enabled()) {                                            \
            std::cerr << "[T+" << t_ms() << "ms] " << msg << "\n";       \
        }                                                                 \
    } while (0)
