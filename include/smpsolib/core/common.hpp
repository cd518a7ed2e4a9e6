#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // Evita conflitos com std::min/std::max no Windows
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <utility> // std::pair

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::iota, std::accumulate
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdint>

// Errors
#include <stdexcept>

// Randoms & Time
#include <random>
#include <chrono>

#include <memory> // std::shared_ptr, std::unique_ptr
