#pragma once
#include <string>
#include <mutex>

namespace lan_scan {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Process-wide stderr logger. Lines are written whole under a mutex so that
// probe workers never interleave output.
class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl) { level_ = lvl; }
    LogLevel level() const { return level_; }
    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }
private:
    Logger() = default;
    static const char* prefix(LogLevel lvl);
    LogLevel level_ = LogLevel::Info;
    std::mutex mutex_;
};

// Accepts error|warn|info|debug|trace (case-insensitive).
bool parse_log_level(const std::string& s, LogLevel& out);

}
