#pragma once
#include <string>

namespace bloch {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Empty path logs to stderr. Returns false if the file cannot be opened,
    // in which case stderr is used.
    static bool init(Level min_level = Level::Info, const std::string& path = {});
    static void set_level(Level min_level);
    static Level level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}
