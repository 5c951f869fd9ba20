#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace githooker {

static LogLevel parseEnvLogLevel() {
    const char* dbg = std::getenv("GITHOOKER_DEBUG");
    if (dbg) {
        std::string d(dbg);
        if (d == "1" || d == "true" || d == "yes") return LogLevel::Debug;
    }
    const char* env = std::getenv("GITHOOKER_LOG");
    if (!env) return LogLevel::Info;
    std::string v(env);
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()), out(&std::cout), err(&std::cerr) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setStreams(std::ostream& o, std::ostream& e) {
    out = &o;
    err = &e;
}

void Logger::resetStreams() {
    out = &std::cout;
    err = &std::cerr;
}

void Logger::error(const std::string& msg) const { if (currentLevel >= LogLevel::Error) *err << "[error] " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (currentLevel >= LogLevel::Warn) *err << "[warn ] " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (currentLevel >= LogLevel::Info) *out << "[info ] " << msg << "\n"; }
void Logger::success(const std::string& msg) const { if (currentLevel >= LogLevel::Info) *out << "[ ok  ] " << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (currentLevel >= LogLevel::Debug) *out << "[debug] " << msg << "\n"; }

}
