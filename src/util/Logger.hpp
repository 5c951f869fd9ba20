#pragma once

#include <ostream>
#include <string>

namespace githooker {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Error and warn lines go to the error stream, everything else to the output
 * stream. The initial level comes from GITHOOKER_LOG; GITHOOKER_DEBUG or the
 * --debug flag raise it to Debug.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Redirect output (tests capture through string streams)
    void setStreams(std::ostream& out, std::ostream& err);
    void resetStreams();

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void success(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
    std::ostream* out;
    std::ostream* err;
};

}
