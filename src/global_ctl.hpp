#pragma once
#include <atomic>

// Process-wide shutdown flag (defined in main.cpp, or test_globals.cpp for tests).
extern std::atomic<bool> g_terminate;
