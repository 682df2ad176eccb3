// tests/test_globals.cpp
// Single definition of process globals for test binaries (main.cpp owns them in the real binary).

#include <atomic>

std::atomic<bool> g_terminate{false};
