/*
 * Debug level support for harmony-bridge
 * Provides fine-grained debug output control with the dout() stream macro
 */

#ifndef __BRIDGE_DEBUG_H
#define __BRIDGE_DEBUG_H

#include <iostream>

// Global debug level variable (defined in main.cpp)
extern int g_debug_level;

// Usage: dout(2) << "lexer tail: " << tail << std::endl;
#define dout(level) \
	if (g_debug_level < (level)) {} else std::cerr << "[DEBUG] "

#endif /* __BRIDGE_DEBUG_H */
