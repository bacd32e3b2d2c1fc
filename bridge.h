#pragma once

// ============================================================================
// harmony-bridge core header
// ============================================================================
// Include this in .cpp files to get access to:
// - Global system flags
// - Common logging facilities
// - Small helpers shared by the proxy and the channel pipeline
// ============================================================================

#include <string>
#include <iostream>
#include <vector>
#include <memory>
#include <chrono>
#include <cstdint>

#include "logger.h"
#include "debug.h"

#define BRIDGE_VERSION "2.2.0"

// ============================================================================
// Global System Flags
// ============================================================================
// Defined in main.cpp (and tests/test_stubs.cpp for the unit tests)

// Debug level (0=off, 1-9=increasing verbosity) - used by dout()
extern int g_debug_level;

// ============================================================================
// Common Utilities
// ============================================================================

namespace bridge {
    // Get current Unix timestamp in seconds
    inline int64_t get_current_timestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // Strip leading/trailing ASCII whitespace
    inline std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t\n\r");
        return s.substr(start, end - start + 1);
    }

    // Shorten a string for log output
    inline std::string preview(const std::string& s, size_t max_len = 80) {
        if (s.length() <= max_len) {
            return s;
        }
        return s.substr(0, max_len) + "...";
    }
}
