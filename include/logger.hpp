#pragma once

#include <ostream>
#include <string>

namespace qrplay {

class Logger {
public:
    enum class Level { DEBUG, INFO, WARN, ERROR };

    static void set_level(Level level);
    static Level level();

    // nullptr restores std::cerr
    static void set_output(std::ostream* stream);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}
