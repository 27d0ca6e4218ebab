#pragma once

#include <iostream>
#include <string>

// Leveled console logging shared by the controllers, the simulation and the runner
namespace Debug {
    enum Level {
        NONE = 0,
        ERROR = 1,
        WARNING = 2,
        INFO = 3,
        VERBOSE = 4,
        ALL = 5
    };

    // Global level, set once by the runner from --verbose / --quiet / config
    extern Level currentLevel;

    inline void setLevel(Level level) {
        currentLevel = level;
    }

    inline bool shouldPrint(Level msgLevel) {
        return msgLevel <= currentLevel;
    }

    // Accepts "none", "error", "warning", "info", "verbose", "all" (any case).
    // Returns false and leaves level untouched for anything else.
    bool parseLevel(const std::string& name, Level& level);
    const char* levelName(Level level);

    inline void error(const std::string& msg) {
        if (shouldPrint(ERROR)) {
            std::cerr << "[ERROR] " << msg << std::endl;
        }
    }

    inline void warning(const std::string& msg) {
        if (shouldPrint(WARNING)) {
            std::cerr << "[WARNING] " << msg << std::endl;
        }
    }

    inline void info(const std::string& msg) {
        if (shouldPrint(INFO)) {
            std::cout << "[INFO] " << msg << std::endl;
        }
    }

    inline void verbose(const std::string& msg) {
        if (shouldPrint(VERBOSE)) {
            std::cout << "[DEBUG] " << msg << std::endl;
        }
    }

    // Contact and integration diagnostics, only at ALL
    inline void physics(const std::string& msg) {
        if (shouldPrint(ALL)) {
            std::cout << "[PHYSICS] " << msg << std::endl;
        }
    }
}

#define DEBUG_INFO(msg) Debug::info(msg)
#define DEBUG_VERBOSE(msg) Debug::verbose(msg)
#define DEBUG_PHYSICS(msg) Debug::physics(msg)
#define DEBUG_WARNING(msg) Debug::warning(msg)
#define DEBUG_ERROR(msg) Debug::error(msg)
