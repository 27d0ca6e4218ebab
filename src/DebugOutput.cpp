#include "DebugOutput.h"

#include <algorithm>
#include <cctype>

namespace Debug {

Level currentLevel = INFO;

bool parseLevel(const std::string& name, Level& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none") level = NONE;
    else if (lower == "error") level = ERROR;
    else if (lower == "warning") level = WARNING;
    else if (lower == "info") level = INFO;
    else if (lower == "verbose") level = VERBOSE;
    else if (lower == "all") level = ALL;
    else return false;
    return true;
}

const char* levelName(Level level) {
    switch (level) {
        case NONE: return "none";
        case ERROR: return "error";
        case WARNING: return "warning";
        case INFO: return "info";
        case VERBOSE: return "verbose";
        case ALL: return "all";
    }
    return "unknown";
}

} // namespace Debug
