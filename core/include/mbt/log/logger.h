#pragma once
#include <mutex>
#include <string>

namespace mbt {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

LogLevel parse_log_level(const std::string& s);

class Logger {
public:
    static Logger& instance();

    // Empty path logs to std::clog.
    void init(const std::string& path, LogLevel level = LogLevel::Info);
    void set_level(LogLevel level);

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    Logger() = default;
    void write(LogLevel level, const char* tag, const std::string& msg);

    std::mutex mu_;
    std::string path_;
    LogLevel level_ = LogLevel::Info;
};

} // namespace mbt
